#ifndef MOREITER_PREPEND_HPP_
#define MOREITER_PREPEND_HPP_

#include "internal/iterator_wrapper.hpp"
#include "internal/iterbase.hpp"
#include "internal/validation.hpp"

#include <iterator>
#include <type_traits>
#include <utility>

namespace moreiter {
  namespace impl {
    template <typename Container>
    class Affixed;

    template <typename Container, typename T>
    constexpr void check_affix() {
      check_iterable<Container>();
      static_assert(std::is_convertible_v<const T&, iterator_value<Container>>,
          "value must be convertible to the element type");
    }

    struct PrependFn : Checked<PrependFn> {
      template <typename T, typename Container>
      static void check(const T&, const Container&) {
        check_affix<Container, T>();
      }

      template <typename T, typename Container>
      static Affixed<Container> unchecked(T&& value, Container&& container) {
        return {std::forward<Container>(container),
            iterator_value<Container>(std::forward<T>(value)), true};
      }
    };

    struct AppendFn : Checked<AppendFn> {
      template <typename Container, typename T>
      static void check(const Container&, const T&) {
        check_affix<Container, T>();
      }

      template <typename Container, typename T>
      static Affixed<Container> unchecked(Container&& container, T&& value) {
        return {std::forward<Container>(container),
            iterator_value<Container>(std::forward<T>(value)), false};
      }
    };
  }

  // prepend(value, seq) yields value and then the elements of seq.
  constexpr impl::PrependFn prepend{};

  // append(seq, value) yields the elements of seq and then value.
  constexpr impl::AppendFn append{};
}

// The elements of container with one extra value in front of or behind them.
template <typename Container>
class moreiter::impl::Affixed : public LazySequence {
 private:
  using Value = iterator_value<Container>;

  Container container_;
  Value value_;
  bool leading_;

  friend PrependFn;
  friend AppendFn;

  Affixed(Container&& container, Value value, bool leading)
      : container_(std::forward<Container>(container)),
        value_(std::move(value)),
        leading_{leading} {}

  enum class Position { Front, Body, Back, Done };

 public:
  Affixed(Affixed&&) = default;

  template <typename ContainerT>
  class Iterator {
   private:
    template <typename>
    friend class Iterator;
    IteratorWrapper<ContainerT> sub_iter_;
    IteratorWrapper<ContainerT> sub_end_;
    const Value* value_;
    bool leading_;
    Position position_;

    // moves into the body, or past it when the container is exhausted
    void enter_body() {
      if (sub_iter_ != sub_end_) {
        position_ = Position::Body;
      } else {
        position_ = leading_ ? Position::Done : Position::Back;
      }
    }

   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Value;
    using difference_type = std::ptrdiff_t;
    using pointer = value_type*;
    using reference = value_type;

    Iterator(IteratorWrapper<ContainerT>&& sub_iter,
        IteratorWrapper<ContainerT>&& sub_end, const Value& value,
        bool leading, bool is_end)
        : sub_iter_{std::move(sub_iter)},
          sub_end_{std::move(sub_end)},
          value_{&value},
          leading_{leading},
          position_{Position::Done} {
      if (is_end) {
        return;
      }
      if (leading_) {
        position_ = Position::Front;
      } else {
        enter_body();
      }
    }

    Value operator*() {
      if (position_ == Position::Body) {
        return *sub_iter_;
      }
      return *value_;
    }

    Iterator& operator++() {
      switch (position_) {
        case Position::Front:
          enter_body();
          break;
        case Position::Body:
          ++sub_iter_;
          enter_body();
          break;
        case Position::Back:
        case Position::Done:
          position_ = Position::Done;
          break;
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
      return position_ != other.position_
             || (position_ == Position::Body && sub_iter_ != other.sub_iter_);
    }

    template <typename T>
    bool operator==(const Iterator<T>& other) const {
      return !(*this != other);
    }
  };

  Iterator<Container> begin() {
    return {get_begin(container_), get_end(container_), value_, leading_,
        false};
  }

  Iterator<Container> end() {
    return {get_end(container_), get_end(container_), value_, leading_, true};
  }

  Iterator<AsConst<Container>> begin() const {
    return {get_begin(std::as_const(container_)),
        get_end(std::as_const(container_)), value_, leading_, false};
  }

  Iterator<AsConst<Container>> end() const {
    return {get_end(std::as_const(container_)),
        get_end(std::as_const(container_)), value_, leading_, true};
  }
};

#endif
