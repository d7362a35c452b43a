#ifndef MOREITER_ROUND_ROBIN_HPP_
#define MOREITER_ROUND_ROBIN_HPP_

#include "internal/iterator_wrapper.hpp"
#include "internal/iterbase.hpp"
#include "internal/validation.hpp"

#include <array>
#include <cstddef>
#include <deque>
#include <iterator>
#include <tuple>
#include <type_traits>
#include <utility>

namespace moreiter {
  namespace impl {
    template <typename TupType, std::size_t... Is>
    class RoundRobined;

    struct RoundRobinFn;

    namespace detail {
      template <typename... Ts>
      std::tuple<IteratorWrapper<Ts>...> iterator_tuple_type_helper(
          const std::tuple<Ts...>&);
    }

    // Given a tuple template argument, evaluates to a tuple of iterators
    // for the template argument's contained types.
    template <typename TupleType>
    using iterator_tuple_type =
        decltype(detail::iterator_tuple_type_helper(std::declval<TupleType>()));

    template <typename>
    struct AsTupleOfConstImpl;

    template <typename... Ts>
    struct AsTupleOfConstImpl<std::tuple<Ts...>>
        : type_is<std::tuple<AsConst<Ts>...>> {};

    template <typename T>
    using AsTupleOfConst = typename AsTupleOfConstImpl<T>::type;

    // What the interleaved sequence yields: the inputs' own dereference type
    // when they all agree, otherwise a value of their common type.  With no
    // inputs there are no elements, and the type is std::nullptr_t.
    template <typename... Containers>
    struct InterleavedDeref : type_is<std::nullptr_t> {};

    template <typename Container, typename... Rest>
    struct InterleavedDeref<Container, Rest...>
        : type_is<std::conditional_t<
              are_same<iterator_deref<Container>,
                  iterator_deref<Rest>...>::value,
              iterator_deref<Container>,
              std::common_type_t<iterator_value<Container>,
                  iterator_value<Rest>...>>> {};

    template <typename>
    struct InterleavedDerefOfTuple;

    template <typename... Ts>
    struct InterleavedDerefOfTuple<std::tuple<Ts...>>
        : InterleavedDeref<Ts...> {};

    struct RoundRobinFn : Checked<RoundRobinFn> {
     private:
      template <typename TupType, std::size_t... Is>
      static RoundRobined<TupType, Is...> make(
          TupType&& containers, std::index_sequence<Is...>) {
        return {std::move(containers)};
      }

     public:
      template <typename... Containers>
      static void check(const Containers&...) {
        (check_iterable<Containers>(), ...);
      }

      template <typename... Containers>
      static auto unchecked(Containers&&... containers) {
        return make(
            std::tuple<Containers...>{std::forward<Containers>(containers)...},
            std::index_sequence_for<Containers...>{});
      }
    };
  }

  // round_robin(seqs...) takes one element from each input in turn,
  // dropping inputs as they run out, until all are exhausted.
  constexpr impl::RoundRobinFn round_robin{};
}

template <typename TupType, std::size_t... Is>
class moreiter::impl::RoundRobined : public LazySequence {
 private:
  friend RoundRobinFn;

  template <typename TupTypeT>
  class IteratorData {
    IteratorData() = delete;
    static_assert(
        std::tuple_size<std::decay_t<TupTypeT>>::value == sizeof...(Is),
        "tuple size != sizeof Is");

   public:
    using IterTupType = iterator_tuple_type<TupTypeT>;
    using DerefType = typename InterleavedDerefOfTuple<TupTypeT>::type;

    template <std::size_t Idx>
    static DerefType get_and_deref(IterTupType& iters) {
      return *std::get<Idx>(iters);
    }

    template <std::size_t Idx>
    static void get_and_increment(IterTupType& iters) {
      ++std::get<Idx>(iters);
    }

    template <std::size_t Idx>
    static bool get_and_check_not_equal(
        const IterTupType& lhs, const IterTupType& rhs) {
      return std::get<Idx>(lhs) != std::get<Idx>(rhs);
    }

    using DerefFunc = DerefType (*)(IterTupType&);
    using IncFunc = void (*)(IterTupType&);
    using NeqFunc = bool (*)(const IterTupType&, const IterTupType&);

    constexpr static std::array<DerefFunc, sizeof...(Is)> derefers{
        {get_and_deref<Is>...}};

    constexpr static std::array<IncFunc, sizeof...(Is)> incrementers{
        {get_and_increment<Is>...}};

    constexpr static std::array<NeqFunc, sizeof...(Is)> neq_comparers{
        {get_and_check_not_equal<Is>...}};

    using TraitsValue = std::remove_reference_t<DerefType>;
  };

  RoundRobined(TupType&& t) : tup_(std::move(t)) {}
  TupType tup_;

 public:
  RoundRobined(RoundRobined&&) = default;

  // The front of active_ is the input the next element comes from.  An
  // input leaves the queue when it runs out and otherwise goes to the back
  // after contributing one element.
  template <typename TupTypeT>
  class Iterator {
   private:
    using IterData = IteratorData<TupTypeT>;
    typename IterData::IterTupType iters_;
    typename IterData::IterTupType ends_;
    std::deque<std::size_t> active_;

    bool done() const {
      return active_.empty();
    }

   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = typename IterData::TraitsValue;
    using difference_type = std::ptrdiff_t;
    using pointer = value_type*;
    using reference = value_type&;

    Iterator(typename IterData::IterTupType&& iters,
        typename IterData::IterTupType&& ends)
        : iters_(std::move(iters)), ends_(std::move(ends)) {
      for (std::size_t i = 0; i != sizeof...(Is); ++i) {
        if (IterData::neq_comparers[i](iters_, ends_)) {
          active_.push_back(i);
        }
      }
    }

    typename IterData::DerefType operator*() {
      return IterData::derefers[active_.front()](iters_);
    }

    Iterator& operator++() {
      const std::size_t index = active_.front();
      active_.pop_front();
      IterData::incrementers[index](iters_);
      if (IterData::neq_comparers[index](iters_, ends_)) {
        active_.push_back(index);
      }
      return *this;
    }

    Iterator operator++(int) {
      auto ret = *this;
      ++*this;
      return ret;
    }

    bool operator!=(const Iterator& other) const {
      return done() != other.done();
    }

    bool operator==(const Iterator& other) const {
      return !(*this != other);
    }
  };

  Iterator<TupType> begin() {
    return {{get_begin(std::get<Is>(tup_))...}, {get_end(std::get<Is>(tup_))...}};
  }

  Iterator<TupType> end() {
    return {{get_end(std::get<Is>(tup_))...}, {get_end(std::get<Is>(tup_))...}};
  }

  Iterator<AsTupleOfConst<TupType>> begin() const {
    return {{get_begin(std::as_const(std::get<Is>(tup_)))...},
        {get_end(std::as_const(std::get<Is>(tup_)))...}};
  }

  Iterator<AsTupleOfConst<TupType>> end() const {
    return {{get_end(std::as_const(std::get<Is>(tup_)))...},
        {get_end(std::as_const(std::get<Is>(tup_)))...}};
  }
};

#endif
