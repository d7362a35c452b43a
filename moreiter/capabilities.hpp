#ifndef MOREITER_CAPABILITIES_HPP_
#define MOREITER_CAPABILITIES_HPP_

#include "internal/iterator_wrapper.hpp"

#include <iterator>
#include <type_traits>

namespace moreiter {
  namespace impl {
    template <typename T, typename = void>
    struct HasLength : std::false_type {};

    template <typename T>
    struct HasLength<T, std::void_t<decltype(std::size(std::declval<T&>()))>>
        : std::true_type {};

    template <typename T, typename = void>
    struct IsReversible : std::false_type {};

    template <typename T>
    struct IsReversible<T,
        std::void_t<reverse_iterator_type<T>, reverse_iterator_end_type<T>>>
        : std::is_same<reverse_iterator_type<T>, reverse_iterator_end_type<T>> {
    };

    template <typename T, typename = void>
    struct IsIndexable : std::false_type {};

    template <typename T>
    struct IsIndexable<T, std::void_t<iterator_type<T>>>
        : is_random_access_iter<iterator_type<T>> {};

    template <typename T, typename = void>
    struct IsReusable : std::false_type {};

    template <typename T>
    struct IsReusable<T, std::void_t<iterator_type<T>>>
        : is_forward_iter<iterator_type<T>> {};
  }

  // A cheap, non-traversing element count is available.
  template <typename T>
  constexpr bool has_length_v = impl::HasLength<std::remove_reference_t<T>>::value;

  // The sequence can be walked from its last element without buffering.
  template <typename T>
  constexpr bool is_reversible_v =
      impl::IsReversible<std::remove_reference_t<T>>::value;

  // Element k can be reached without stepping over its predecessors.
  template <typename T>
  constexpr bool is_indexable_v =
      impl::IsIndexable<std::remove_reference_t<T>>::value;

  // A second traversal yields the same elements again.  Only used to pick
  // between re-traversing and buffering.
  template <typename T>
  constexpr bool is_reusable_v =
      impl::IsReusable<std::remove_reference_t<T>>::value;

  // Every view produced by this library.
  template <typename T>
  constexpr bool is_lazy_sequence_v =
      std::is_base_of_v<impl::LazySequence, std::decay_t<T>>;

  struct Capabilities {
    bool has_length;
    bool is_reversible;
    bool is_indexable;
    bool is_reusable;
  };

  template <typename T>
  constexpr Capabilities capabilities_of() {
    return {has_length_v<T>, is_reversible_v<T>, is_indexable_v<T>,
        is_reusable_v<T>};
  }

  template <typename T>
  constexpr bool has_length(const T&) {
    return has_length_v<T>;
  }

  template <typename T>
  constexpr bool is_reversible(const T&) {
    return is_reversible_v<T>;
  }

  template <typename T>
  constexpr bool is_indexable(const T&) {
    return is_indexable_v<T>;
  }

  template <typename T>
  constexpr bool is_lazy_sequence(const T&) {
    return is_lazy_sequence_v<T>;
  }
}

#endif
