#ifndef MOREITER_PAIRWISE_HPP_
#define MOREITER_PAIRWISE_HPP_

#include "internal/iterator_wrapper.hpp"
#include "internal/iterbase.hpp"
#include "internal/validation.hpp"

#include <iterator>
#include <optional>
#include <utility>

namespace moreiter {
  namespace impl {
    template <typename Container>
    class Paired;

    struct PairwiseFn : Checked<PairwiseFn>, Pipeable<PairwiseFn> {
      template <typename Container>
      static void check(const Container&) {
        check_iterable<Container>();
      }

      template <typename Container>
      static Paired<Container> unchecked(Container&& container) {
        return {std::forward<Container>(container)};
      }
    };
  }

  // pairwise(seq) yields every pair of neighbouring elements:
  // (s0, s1), (s1, s2), ...
  constexpr impl::PairwiseFn pairwise{};
}

template <typename Container>
class moreiter::impl::Paired : public LazySequence {
 private:
  using Value = iterator_value<Container>;
  using Pair = std::pair<Value, Value>;

  Container container_;
  friend PairwiseFn;

  Paired(Container&& container)
      : container_(std::forward<Container>(container)) {}

 public:
  Paired(Paired&&) = default;

  template <typename ContainerT>
  class Iterator {
   private:
    template <typename>
    friend class Iterator;
    mutable IteratorWrapper<ContainerT> sub_iter_;
    IteratorWrapper<ContainerT> sub_end_;
    mutable std::optional<Pair> pair_;
    mutable bool started_ = false;

    // the first pair needs two elements, so nothing is pulled until the
    // iterator is used
    void init_if_first_use() const {
      if (started_) {
        return;
      }
      started_ = true;
      if (!(sub_iter_ != sub_end_)) {
        return;
      }
      Value first = *sub_iter_;
      ++sub_iter_;
      if (sub_iter_ != sub_end_) {
        pair_.emplace(std::move(first), *sub_iter_);
      }
    }

    bool done() const {
      init_if_first_use();
      return !pair_;
    }

   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Pair;
    using difference_type = std::ptrdiff_t;
    using pointer = value_type*;
    using reference = value_type&;

    Iterator(IteratorWrapper<ContainerT>&& sub_iter,
        IteratorWrapper<ContainerT>&& sub_end)
        : sub_iter_{std::move(sub_iter)}, sub_end_{std::move(sub_end)} {}

    Pair& operator*() {
      init_if_first_use();
      return *pair_;
    }

    Pair* operator->() {
      init_if_first_use();
      return &*pair_;
    }

    Iterator& operator++() {
      init_if_first_use();
      ++sub_iter_;
      if (sub_iter_ != sub_end_) {
        Value previous = std::move(pair_->second);
        pair_.emplace(std::move(previous), *sub_iter_);
      } else {
        pair_.reset();
      }
      return *this;
    }

    Iterator operator++(int) {
      auto ret = *this;
      ++*this;
      return ret;
    }

    template <typename T>
    bool operator!=(const Iterator<T>& other) const {
      return done() != other.done();
    }

    template <typename T>
    bool operator==(const Iterator<T>& other) const {
      return !(*this != other);
    }
  };

  Iterator<Container> begin() {
    return {get_begin(container_), get_end(container_)};
  }

  Iterator<Container> end() {
    return {get_end(container_), get_end(container_)};
  }

  Iterator<AsConst<Container>> begin() const {
    return {get_begin(std::as_const(container_)),
        get_end(std::as_const(container_))};
  }

  Iterator<AsConst<Container>> end() const {
    return {get_end(std::as_const(container_)),
        get_end(std::as_const(container_))};
  }
};

#endif
