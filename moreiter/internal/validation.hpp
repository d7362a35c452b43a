#ifndef MOREITER_VALIDATION_HPP_
#define MOREITER_VALIDATION_HPP_

#include "iterbase.hpp"
#include "../errors.hpp"

#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace moreiter {
  namespace impl {
    // Every public operation is an object of a type deriving from
    // Checked<Op>.  A call runs Op::check on const views of the arguments and
    // then Op::unchecked.  Check functions never touch the elements of a
    // sequence; shape errors the type system can decide are static_asserts,
    // value errors throw ContractViolation.
    //
    // Operations calling each other internally use Op::unchecked so every
    // argument is validated once per public call.
    template <typename Op>
    struct Checked {
      template <typename... Ts>
      decltype(auto) operator()(Ts&&... ts) const {
        Op::check(std::as_const(ts)...);
        return Op::unchecked(std::forward<Ts>(ts)...);
      }
    };

    // Checked operation whose second argument can be bound first, giving
    // a pipeable partial: seq | op(arg) is the same as op(seq, arg).
    template <typename Op>
    struct CheckedBindSecond : Checked<Op> {
     private:
      // T is whatever is being held for later use
      template <typename T>
      struct FnPartial : Pipeable<FnPartial<T>> {
        T stored_arg;
        constexpr FnPartial(T in_t) : stored_arg(std::move(in_t)) {}

        template <typename Container>
        decltype(auto) operator()(Container&& container) const {
          return Op{}(std::forward<Container>(container), stored_arg);
        }
      };

     public:
      using Checked<Op>::operator();

      template <typename T, typename = std::enable_if_t<!is_iterable<T>>>
      FnPartial<std::decay_t<T>> operator()(T&& t) const {
        return FnPartial<std::decay_t<T>>(std::forward<T>(t));
      }
    };

    template <typename Container>
    constexpr void check_iterable() {
      static_assert(is_iterable<std::remove_reference_t<Container>>,
          "argument must be a sequence (begin() and end() must be found)");
    }

    template <typename Value, typename... Defaults>
    constexpr void check_defaults() {
      static_assert(
          sizeof...(Defaults) <= 1, "at most one default value may be supplied");
      static_assert((std::is_convertible_v<const Defaults&, Value> && ...),
          "default value must be convertible to the element type");
    }

    template <typename Integer>
    constexpr void check_integer() {
      static_assert(std::is_integral_v<Integer>
                        && !std::is_same_v<std::remove_cv_t<Integer>, bool>,
          "count must be an integer");
    }

    template <typename Integer>
    void check_quantity(Integer n, const char* name) {
      check_integer<Integer>();
      if constexpr (std::is_signed_v<Integer>) {
        if (n < 0) {
          throw ContractViolation(std::string(name)
                                  + " must be a non-negative integer, got "
                                  + std::to_string(n));
        }
      }
    }

    template <typename Integer>
    void check_quantity(const std::optional<Integer>& n, const char* name) {
      if (n) {
        check_quantity(*n, name);
      } else {
        check_integer<Integer>();
      }
    }

    inline void check_quantity(const std::nullopt_t&, const char*) {}

    // A predicate or key: callable with an element, or absent.
    template <typename Elem, typename Pred>
    constexpr void check_predicate() {
      static_assert(std::is_null_pointer_v<Pred>
                        || std::is_invocable_v<Pred&, Elem>,
          "predicate must be callable with an element, or nullptr");
    }

    // A function which is required.  An empty function object is rejected.
    template <typename F, typename... Args>
    void check_callable(const F& f, const char* name) {
      static_assert(std::is_invocable_v<F&, Args&...>,
          "function must be callable with the supplied arguments");
      if (is_absent(f)) {
        throw ContractViolation(std::string(name) + " must be callable");
      }
    }

    // Returns the single supplied default, or throws Error when there is
    // none.
    template <typename Value, typename Error>
    Value or_default(const char* message) {
      throw Error(message);
    }

    template <typename Value, typename Error, typename Default>
    Value or_default(const char*, Default&& dflt) {
      return Value(std::forward<Default>(dflt));
    }
  }
}

#endif
