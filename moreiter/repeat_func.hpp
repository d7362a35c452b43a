#ifndef MOREITER_REPEAT_FUNC_HPP_
#define MOREITER_REPEAT_FUNC_HPP_

#include "internal/iterbase.hpp"
#include "internal/validation.hpp"

#include <cstddef>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>

namespace moreiter {
  namespace impl {
    template <typename Func, typename... Args>
    class FuncRepeater;

    // Number of calls: a count, or std::nullopt for no limit.
    template <typename Count>
    std::optional<std::size_t> to_call_count(const Count& n) {
      const auto count = to_difference(n);
      return static_cast<std::size_t>(count < 0 ? 0 : count);
    }

    template <typename Count>
    std::optional<std::size_t> to_call_count(const std::optional<Count>& n) {
      if (n) {
        return to_call_count(*n);
      }
      return std::nullopt;
    }

    inline std::optional<std::size_t> to_call_count(const std::nullopt_t&) {
      return std::nullopt;
    }

    struct RepeatFuncFn : Checked<RepeatFuncFn> {
      template <typename Func, typename Count, typename... Args>
      static void check(const Func& func, const Count& n, const Args&...) {
        check_callable<Func, std::decay_t<Args>...>(func, "f");
        check_quantity(n, "n");
      }

      template <typename Func, typename Count, typename... Args>
      static FuncRepeater<Func, std::decay_t<Args>...> unchecked(
          Func func, const Count& n, Args&&... args) {
        return {std::move(func), to_call_count(n),
            std::forward_as_tuple(std::forward<Args>(args)...)};
      }
    };
  }

  // repeat_func(f, n, args...) yields f(args...) n times, calling f once for
  // every element pulled.  With n == std::nullopt it never ends.
  constexpr impl::RepeatFuncFn repeat_func{};
}

// The function and its arguments live in a shared State, so iterators stay
// valid when the view is moved.
template <typename Func, typename... Args>
class moreiter::impl::FuncRepeater : public LazySequence {
 private:
  using Result = std::decay_t<std::invoke_result_t<Func&, Args&...>>;
  static_assert(!std::is_void_v<Result>, "function must return a value");

  struct State {
    Func func_;
    std::tuple<Args...> args_;

    Result call() {
      return std::apply(func_, args_);
    }
  };

  std::shared_ptr<State> state_;
  std::optional<std::size_t> count_;

  friend RepeatFuncFn;

  template <typename... Ts>
  FuncRepeater(Func func, std::optional<std::size_t> count,
      std::tuple<Ts...>&& args)
      : state_{std::make_shared<State>(
            State{std::move(func), std::tuple<Args...>(std::move(args))})},
        count_{count} {}

 public:
  FuncRepeater(FuncRepeater&&) = default;

  class Iterator {
   private:
    std::shared_ptr<State> state_;
    std::optional<std::size_t> remaining_;
    std::optional<Result> result_;

    bool done() const {
      return remaining_ && *remaining_ == 0;
    }

   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Result;
    using difference_type = std::ptrdiff_t;
    using pointer = value_type*;
    using reference = value_type&;

    Iterator(std::shared_ptr<State> state, std::optional<std::size_t> remaining)
        : state_{std::move(state)}, remaining_{remaining} {}

    Result& operator*() {
      if (!result_) {
        result_.emplace(state_->call());
      }
      return *result_;
    }

    Result* operator->() {
      return &**this;
    }

    // an element skipped without being read still costs one call
    Iterator& operator++() {
      if (!result_) {
        state_->call();
      }
      result_.reset();
      if (remaining_) {
        --*remaining_;
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

  Iterator begin() {
    return {state_, count_};
  }

  Iterator end() {
    return {state_, std::size_t{0}};
  }
};

#endif
