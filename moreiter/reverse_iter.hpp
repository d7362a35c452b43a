#ifndef MOREITER_REVERSE_ITER_HPP_
#define MOREITER_REVERSE_ITER_HPP_

#include "capabilities.hpp"
#include "internal/iterator_wrapper.hpp"
#include "internal/iterbase.hpp"
#include "internal/validation.hpp"

#include <iterator>
#include <utility>
#include <vector>

namespace moreiter {
  namespace impl {
    template <typename Container>
    class Reverser;

    struct ReverseIterFn : Checked<ReverseIterFn>, Pipeable<ReverseIterFn> {
      template <typename Container>
      static void check(const Container&) {
        check_iterable<Container>();
      }

      // A sequence without reverse iterators is read into a buffer here, so
      // the result never depends on the input after the call.
      template <typename Container>
      static auto unchecked(Container&& container) {
        if constexpr (is_reversible_v<Container>) {
          return Reverser<Container>(std::forward<Container>(container));
        } else {
          using Buffer = std::vector<iterator_value<Container>>;
          return Reverser<Buffer>(materialize(container));
        }
      }
    };
  }

  // reverse_iter(seq) yields the elements of seq from last to first.
  constexpr impl::ReverseIterFn reverse_iter{};
}

template <typename Container>
class moreiter::impl::Reverser : public LazySequence {
 private:
  Container container_;
  friend ReverseIterFn;

  Reverser(Container&& container)
      : container_(std::forward<Container>(container)) {}

  template <typename T>
  using reverse_iterator_traits_deref =
      std::remove_reference_t<reverse_iterator_deref<T>>;

 public:
  Reverser(Reverser&&) = default;
  template <typename ContainerT>
  class Iterator {
   private:
    template <typename>
    friend class Iterator;
    reverse_iterator_type<ContainerT> sub_iter_;

   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = reverse_iterator_traits_deref<ContainerT>;
    using difference_type = std::ptrdiff_t;
    using pointer = value_type*;
    using reference = value_type&;

    Iterator(reverse_iterator_type<ContainerT>&& sub_iter)
        : sub_iter_{std::move(sub_iter)} {}

    reverse_iterator_deref<ContainerT> operator*() {
      return *sub_iter_;
    }

    decltype(auto) operator->() {
      return apply_arrow(sub_iter_);
    }

    Iterator& operator++() {
      ++sub_iter_;
      return *this;
    }

    Iterator operator++(int) {
      auto ret = *this;
      ++*this;
      return ret;
    }

    template <typename T>
    bool operator!=(const Iterator<T>& other) const {
      return sub_iter_ != other.sub_iter_;
    }

    template <typename T>
    bool operator==(const Iterator<T>& other) const {
      return !(*this != other);
    }
  };

  Iterator<Container> begin() {
    return {std::rbegin(container_)};
  }

  Iterator<Container> end() {
    return {std::rend(container_)};
  }

  Iterator<AsConst<Container>> begin() const {
    return {std::rbegin(std::as_const(container_))};
  }

  Iterator<AsConst<Container>> end() const {
    return {std::rend(std::as_const(container_))};
  }
};

#endif
