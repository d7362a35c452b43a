#ifndef MOREITER_FILTER_HPP_
#define MOREITER_FILTER_HPP_

#include "iterator_wrapper.hpp"

#include <functional>
#include <iterator>
#include <utility>

namespace moreiter {
  namespace impl {
    template <typename FilterFunc, typename Container>
    class Filtered;

    // Builds a Filtered view.  Only operations of this library use it.
    struct FilterFn {
      template <typename FilterFunc, typename Container>
      Filtered<FilterFunc, Container> operator()(
          FilterFunc filter_func, Container&& container) const {
        return {std::move(filter_func), std::forward<Container>(container)};
      }
    };

    template <typename FilterFunc>
    class PredicateFlipper {
     private:
      FilterFunc filter_func_;

     public:
      PredicateFlipper(FilterFunc filter_func)
          : filter_func_(std::move(filter_func)) {}

      template <typename T>
      bool operator()(const T& item) const {
        return !satisfies(filter_func_, item);
      }

      // a stateful FilterFunc needs a non-const call
      template <typename T>
      bool operator()(const T& item) {
        return !satisfies(filter_func_, item);
      }
    };
  }
}

// Yields the elements of container for which filter_func holds.  An absent
// filter_func tests the truth value of the element.  The filter is called
// exactly once per element, in order, so it may carry state.
template <typename FilterFunc, typename Container>
class moreiter::impl::Filtered : public LazySequence {
 private:
  Container container_;
  FilterFunc filter_func_;

  friend FilterFn;

  Filtered(FilterFunc filter_func, Container&& container)
      : container_(std::forward<Container>(container)),
        filter_func_(std::move(filter_func)) {}

 public:
  Filtered(Filtered&&) = default;

  template <typename ContainerT>
  class Iterator {
   private:
    template <typename>
    friend class Iterator;
    using Holder = DerefHolder<iterator_deref<ContainerT>>;
    mutable IteratorWrapper<ContainerT> sub_iter_;
    IteratorWrapper<ContainerT> sub_end_;
    mutable Holder item_;
    mutable bool seeking_ = true;
    FilterFunc* filter_func_;

    // Moves sub_iter_ to the next element passing the filter, starting with
    // the one it is on.  A fresh iterator pulls nothing before first use.
    void seek() const {
      if (!seeking_) {
        return;
      }
      seeking_ = false;
      for (; sub_iter_ != sub_end_; ++sub_iter_) {
        item_.reset(*sub_iter_);
        if (satisfies(*filter_func_, item_.get())) {
          return;
        }
      }
    }

    bool done() const {
      seek();
      return !(sub_iter_ != sub_end_);
    }

   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = iterator_traits_deref<ContainerT>;
    using difference_type = std::ptrdiff_t;
    using pointer = value_type*;
    using reference = value_type&;

    Iterator(IteratorWrapper<ContainerT>&& sub_iter,
        IteratorWrapper<ContainerT>&& sub_end, FilterFunc& filter_func)
        : sub_iter_{std::move(sub_iter)},
          sub_end_{std::move(sub_end)},
          filter_func_{&filter_func} {}

    typename Holder::reference operator*() {
      seek();
      return item_.get();
    }

    typename Holder::pointer operator->() {
      seek();
      return item_.get_ptr();
    }

    Iterator& operator++() {
      seek();
      ++sub_iter_;
      seeking_ = true;
      seek();
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
    return {get_begin(container_), get_end(container_), filter_func_};
  }

  Iterator<Container> end() {
    return {get_end(container_), get_end(container_), filter_func_};
  }
};

#endif
