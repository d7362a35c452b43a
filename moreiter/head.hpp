#ifndef MOREITER_HEAD_HPP_
#define MOREITER_HEAD_HPP_

#include "capabilities.hpp"
#include "internal/iterator_wrapper.hpp"
#include "internal/iterbase.hpp"
#include "internal/validation.hpp"

#include <cstddef>
#include <deque>
#include <iterator>
#include <memory>
#include <utility>

namespace moreiter {
  namespace impl {
    template <typename Container>
    class Truncated;

    struct HeadFn : CheckedBindSecond<HeadFn> {
      template <typename Container, typename Count>
      static void check(const Container&, const Count&) {
        check_iterable<Container>();
        check_integer<Count>();
      }

      template <typename Container, typename Count>
      static Truncated<Container> unchecked(Container&& container, Count n) {
        return {std::forward<Container>(container), to_difference(n)};
      }
    };

    struct TailFn : CheckedBindSecond<TailFn> {
      template <typename Container, typename Count>
      static void check(const Container& container, const Count& n) {
        HeadFn::check(container, n);
      }

      template <typename Container, typename Count>
      static Truncated<Container> unchecked(Container&& container, Count n) {
        return HeadFn::unchecked(
            std::forward<Container>(container), negated(to_difference(n)));
      }
    };
  }

  // head(seq, n) yields the first n elements of seq, or all of them when
  // there are fewer.  A negative n yields the last -n elements instead.
  constexpr impl::HeadFn head{};

  // tail(seq, n) is head(seq, -n).
  constexpr impl::TailFn tail{};
}

// A non-negative count_ is a leading window which stops pulling from the
// container as soon as count_ elements were yielded.  A negative count_ is a
// trailing window of -count_ elements, collected when begin() is called.
template <typename Container>
class moreiter::impl::Truncated : public LazySequence {
 private:
  using Value = iterator_value<Container>;
  using Window = std::deque<Value>;

  Container container_;
  std::ptrdiff_t count_;

  friend HeadFn;

  Truncated(Container&& container, std::ptrdiff_t count)
      : container_(std::forward<Container>(container)), count_{count} {}

  template <typename ContainerT>
  static std::shared_ptr<Window> last_elements(
      ContainerT& container, std::size_t n) {
    auto window = std::make_shared<Window>();
    if (n == 0) {
      return window;
    }
    if constexpr (is_reversible_v<ContainerT>) {
      auto end_it = std::rend(container);
      for (auto it = std::rbegin(container);
           it != end_it && window->size() < n; ++it) {
        window->push_front(*it);
      }
    } else {
      auto end_it = get_end(container);
      for (auto it = get_begin(container); it != end_it; ++it) {
        window->push_back(*it);
        if (window->size() > n) {
          window->pop_front();
        }
      }
    }
    return window;
  }

 public:
  Truncated(Truncated&&) = default;

  template <typename ContainerT>
  class Iterator {
   private:
    template <typename>
    friend class Iterator;
    using Holder = DerefHolder<iterator_deref<ContainerT>>;
    IteratorWrapper<ContainerT> sub_iter_;
    IteratorWrapper<ContainerT> sub_end_;
    std::ptrdiff_t remaining_;
    Holder item_;
    bool loaded_ = false;
    std::shared_ptr<Window> window_;
    std::size_t index_ = 0;

    bool done() const {
      if (window_) {
        return index_ >= window_->size();
      }
      return remaining_ <= 0 || !(sub_iter_ != sub_end_);
    }

   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Value;
    using difference_type = std::ptrdiff_t;
    using pointer = const value_type*;
    using reference = const value_type&;

    Iterator(IteratorWrapper<ContainerT>&& sub_iter,
        IteratorWrapper<ContainerT>&& sub_end, std::ptrdiff_t remaining,
        std::shared_ptr<Window> window)
        : sub_iter_{std::move(sub_iter)},
          sub_end_{std::move(sub_end)},
          remaining_{remaining},
          window_{std::move(window)} {}

    reference operator*() {
      if (window_) {
        return (*window_)[index_];
      }
      if (!loaded_) {
        item_.reset(*sub_iter_);
        loaded_ = true;
      }
      return item_.get();
    }

    pointer operator->() {
      return &**this;
    }

    Iterator& operator++() {
      if (window_) {
        ++index_;
        return *this;
      }
      loaded_ = false;
      --remaining_;
      // the element after the last one yielded is never pulled
      if (remaining_ > 0) {
        ++sub_iter_;
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
    if (count_ < 0) {
      return {get_end(container_), get_end(container_), 0,
          last_elements(
              container_, static_cast<std::size_t>(negated(count_)))};
    }
    return {get_begin(container_), get_end(container_), count_, nullptr};
  }

  Iterator<Container> end() {
    return {get_end(container_), get_end(container_), 0, nullptr};
  }

  Iterator<AsConst<Container>> begin() const {
    if (count_ < 0) {
      return {get_end(std::as_const(container_)),
          get_end(std::as_const(container_)), 0,
          last_elements(std::as_const(container_),
              static_cast<std::size_t>(negated(count_)))};
    }
    return {get_begin(std::as_const(container_)),
        get_end(std::as_const(container_)), count_, nullptr};
  }

  Iterator<AsConst<Container>> end() const {
    return {get_end(std::as_const(container_)),
        get_end(std::as_const(container_)), 0, nullptr};
  }
};

#endif
