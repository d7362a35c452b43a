#ifndef MOREITER_FIRST_HPP_
#define MOREITER_FIRST_HPP_

#include "internal/iterbase.hpp"
#include "internal/validation.hpp"

#include <utility>

namespace moreiter {
  namespace impl {
    struct FirstFn : Checked<FirstFn>, Pipeable<FirstFn> {
      template <typename Container, typename... Default>
      static void check(const Container&, const Default&...) {
        check_iterable<Container>();
        check_defaults<iterator_value<Container>, Default...>();
      }

      template <typename Container, typename... Default>
      static iterator_value<Container> unchecked(
          Container&& container, Default&&... dflt) {
        auto it = get_begin(container);
        if (it != get_end(container)) {
          return *it;
        }
        return or_default<iterator_value<Container>, EmptySequence>(
            "sequence is empty", std::forward<Default>(dflt)...);
      }
    };
  }

  // first(seq) is the first element of seq.  first(seq, dflt) returns dflt
  // instead of throwing EmptySequence when seq is empty.
  constexpr impl::FirstFn first{};
}

#endif
