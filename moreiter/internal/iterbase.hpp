#ifndef MOREITER_ITERBASE_HPP_
#define MOREITER_ITERBASE_HPP_

// This file consists of utilities used for the generic nature of the
// sequence operations and their lazy views.  As such, the contents of this
// file should be considered UNDOCUMENTED and is subject to change without
// warning.  No user code should include this file directly.

#include <cassert>
#include <cstddef>
#include <functional>
#include <iterator>
#include <limits>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace moreiter {
  namespace impl {
    namespace get_iters {
      // begin() for C arrays
      template <typename T, std::size_t N>
      T* get_begin_impl(T (&array)[N], int) {
        return array;
      }

      // Prefer member begin().
      template <typename T, typename I = decltype(std::declval<T&>().begin())>
      I get_begin_impl(T& r, int) {
        return r.begin();
      }

      // Use ADL otherwise.
      template <typename T, typename I = decltype(begin(std::declval<T&>()))>
      I get_begin_impl(T& r, long) {
        return begin(r);
      }

      template <typename T>
      auto get_begin(T& t) -> decltype(get_begin_impl(std::declval<T&>(), 42)) {
        return get_begin_impl(t, 42);
      }

      // end() for C arrays
      template <typename T, std::size_t N>
      T* get_end_impl(T (&array)[N], int) {
        return array + N;
      }

      // Prefer member end().
      template <typename T, typename I = decltype(std::declval<T&>().end())>
      I get_end_impl(T& r, int) {
        return r.end();
      }

      // Use ADL otherwise.
      template <typename T, typename I = decltype(end(std::declval<T&>()))>
      I get_end_impl(T& r, long) {
        return end(r);
      }

      template <typename T>
      auto get_end(T& t) -> decltype(get_end_impl(std::declval<T&>(), 42)) {
        return get_end_impl(t, 42);
      }
    }
    using get_iters::get_begin;
    using get_iters::get_end;

    template <typename T>
    struct type_is {
      using type = T;
    };

    template <typename T>
    using AsConst = decltype(std::as_const(std::declval<T&>()));

    template <typename...>
    constexpr bool always_false = false;

    // iterator_type<C> is the type of C's iterator
    template <typename T>
    using iterator_type = decltype(get_begin(std::declval<T&>()));

    // iterator_deref<C> is the type obtained by dereferencing an iterator
    // to an object of type C
    template <typename Container>
    using iterator_deref = decltype(*std::declval<iterator_type<Container>&>());

    template <typename Container>
    using iterator_traits_deref =
        std::remove_reference_t<iterator_deref<Container>>;

    // iterator_value<C> is what a scalar result or a buffer holds for one
    // element of C
    template <typename Container>
    using iterator_value = std::decay_t<iterator_deref<Container>>;

    template <typename T, typename = void>
    struct IsIterable : std::false_type {};

    // Assuming that if a type works with begin, it is an iterable.
    template <typename T>
    struct IsIterable<T, std::void_t<iterator_type<T>>> : std::true_type {};

    template <typename T>
    constexpr bool is_iterable = IsIterable<T>::value;

    namespace detail {
      template <typename T, typename = void>
      struct ArrowHelper {
        using type = void;
        void operator()(T&) const noexcept {}
      };

      template <typename T>
      struct ArrowHelper<T*, void> {
        using type = T*;
        constexpr type operator()(T* t) const noexcept {
          return t;
        }
      };

      template <typename T>
      struct ArrowHelper<T,
          std::void_t<decltype(std::declval<T&>().operator->())>> {
        using type = decltype(std::declval<T&>().operator->());
        type operator()(T& t) const {
          return t.operator->();
        }
      };

      template <typename T>
      using arrow = typename detail::ArrowHelper<T>::type;
    }

    // applys the -> operator to an object, if the object is a pointer,
    // it returns the pointer
    template <typename T>
    detail::arrow<T> apply_arrow(T& t) {
      return detail::ArrowHelper<T>{}(t);
    }

    template <typename T, typename Tag, typename = void>
    struct HasIteratorCategory : std::false_type {};

    template <typename T, typename Tag>
    struct HasIteratorCategory<T, Tag,
        std::void_t<typename std::iterator_traits<T>::iterator_category>>
        : std::is_base_of<Tag,
              typename std::iterator_traits<T>::iterator_category> {};

    template <typename T>
    using is_random_access_iter =
        HasIteratorCategory<T, std::random_access_iterator_tag>;

    template <typename T>
    using is_forward_iter = HasIteratorCategory<T, std::forward_iterator_tag>;

    // because std::advance assumes a lot and is actually smart, I need a dumb
    // version that will work with most things
    template <typename InputIt, typename Distance = std::size_t>
    void dumb_advance_unsafe(InputIt& iter, Distance distance) {
      for (Distance i(0); i < distance; ++i) {
        ++iter;
      }
    }

    // iter will not be incremented past end
    template <typename Iter, typename EndIter, typename Distance = std::size_t>
    void dumb_advance(Iter& iter, const EndIter& end, Distance distance) {
      for (Distance i(0); i < distance && iter != end; ++i) {
        ++iter;
      }
    }

    template <typename... Ts>
    struct are_same : std::true_type {};

    template <typename T, typename U, typename... Ts>
    struct are_same<T, U, Ts...>
        : std::integral_constant<bool,
              std::is_same<T, U>::value && are_same<T, Ts...>::value> {};

    // Counts are carried as std::ptrdiff_t internally.  Unsigned values that
    // do not fit saturate, which keeps them out of range of any sequence.
    template <typename Integer>
    constexpr std::ptrdiff_t to_difference(Integer n) noexcept {
      if constexpr (std::is_unsigned_v<Integer>) {
        constexpr auto max = std::numeric_limits<std::ptrdiff_t>::max();
        return n > static_cast<std::make_unsigned_t<std::ptrdiff_t>>(max)
                   ? max
                   : static_cast<std::ptrdiff_t>(n);
      } else {
        return static_cast<std::ptrdiff_t>(n);
      }
    }

    // -n, except that the most negative value maps to the largest one
    constexpr std::ptrdiff_t negated(std::ptrdiff_t n) noexcept {
      return n == std::numeric_limits<std::ptrdiff_t>::min()
                 ? std::numeric_limits<std::ptrdiff_t>::max()
                 : -n;
    }

    // DerefHolder holds the value gotten from an iterator dereference
    // if the iterate dereferences to an lvalue references, a pointer to the
    //     element is stored
    // if it does not, a value is stored instead
    // get() returns a reference to the held item
    // get_ptr() returns a pointer to the held item
    // reset() replaces the currently held item
    template <typename T>
    class DerefHolder {
     private:
      static_assert(!std::is_lvalue_reference<T>::value,
          "Non-lvalue-ref specialization used for lvalue ref type");
      // it could still be an rvalue reference
      using TPlain = std::remove_reference_t<T>;

      std::optional<TPlain> item_p_;

     public:
      using reference = TPlain&;
      using pointer = TPlain*;

      DerefHolder() = default;

      reference get() {
        assert(item_p_.has_value());
        return *item_p_;
      }

      pointer get_ptr() {
        assert(item_p_.has_value());
        return &item_p_.value();
      }

      void reset(T&& item) {
        item_p_.emplace(std::move(item));
      }

      explicit operator bool() const {
        return static_cast<bool>(item_p_);
      }
    };

    // Specialization for when T is an lvalue ref
    template <typename T>
    class DerefHolder<T&> {
     public:
      using reference = T&;
      using pointer = T*;

     private:
      pointer item_p_{};

     public:
      DerefHolder() = default;

      reference get() {
        assert(item_p_);
        return *item_p_;
      }

      pointer get_ptr() {
        assert(item_p_);
        return item_p_;
      }

      void reset(reference item) {
        item_p_ = &item;
      }

      explicit operator bool() const {
        return item_p_ != nullptr;
      }
    };

    template <typename T, typename = void>
    struct HasEmpty : std::false_type {};

    template <typename T>
    struct HasEmpty<T, std::void_t<decltype(std::declval<const T&>().empty())>>
        : std::true_type {};

    // The truth value of an element: an explicit bool conversion when the
    // type has one, otherwise non-emptiness.
    template <typename T>
    constexpr bool truthy(const T& item) {
      if constexpr (std::is_constructible_v<bool, const T&>) {
        return static_cast<bool>(item);
      } else if constexpr (HasEmpty<T>::value) {
        return !item.empty();
      } else {
        static_assert(always_false<T>,
            "element type has no truth value, supply a predicate");
        return false;
      }
    }

    template <typename T>
    struct IsStdFunction : std::false_type {};

    template <typename Sig>
    struct IsStdFunction<std::function<Sig>> : std::true_type {};

    // Callables which may be empty.  An empty one stands for "no function".
    template <typename F>
    constexpr bool is_nullable_callable =
        std::is_pointer_v<F> || std::is_member_pointer_v<F>
        || IsStdFunction<F>::value;

    template <typename F>
    constexpr bool is_absent(const F& f) {
      if constexpr (std::is_null_pointer_v<F>) {
        return true;
      } else if constexpr (is_nullable_callable<F>) {
        return !f;
      } else {
        return false;
      }
    }

    // Evaluates pred on item.  An absent predicate tests the item itself.
    template <typename Pred, typename T>
    bool satisfies(Pred& pred, T&& item) {
      if constexpr (std::is_null_pointer_v<std::remove_cv_t<Pred>>) {
        return truthy(item);
      } else {
        if constexpr (is_nullable_callable<std::remove_cv_t<Pred>>) {
          if (!pred) {
            return truthy(item);
          }
        }
        return truthy(std::invoke(pred, std::forward<T>(item)));
      }
    }

    // Applies key to item.  An absent key yields a copy of the item.
    template <typename Key, typename T>
    decltype(auto) apply_key(Key& key, const T& item) {
      if constexpr (std::is_null_pointer_v<std::remove_cv_t<Key>>) {
        return T(item);
      } else {
        return std::invoke(key, item);
      }
    }

    template <typename Key, typename T>
    using key_value =
        std::decay_t<decltype(apply_key(std::declval<Key&>(), std::declval<const T&>()))>;

    // reads every element of container into a vector, in order
    template <typename Container>
    std::vector<iterator_value<Container>> materialize(Container&& container) {
      std::vector<iterator_value<Container>> buffer;
      auto end_it = get_end(container);
      for (auto it = get_begin(container); it != end_it; ++it) {
        buffer.emplace_back(*it);
      }
      return buffer;
    }

    // allows f(x) to be 'called' as x | f
    template <typename ItTool>
    struct Pipeable {
      template <typename T>
      friend decltype(auto) operator|(T&& x, const Pipeable& p) {
        return static_cast<const ItTool&>(p)(std::forward<T>(x));
      }
    };

    // Every lazy sequence returned by this library derives from this tag.
    struct LazySequence {};
  }
}

#endif
