#ifndef MOREITER_NTH_HPP_
#define MOREITER_NTH_HPP_

#include "capabilities.hpp"
#include "internal/iterbase.hpp"
#include "internal/validation.hpp"

#include <cstddef>
#include <iterator>
#include <utility>

namespace moreiter {
  namespace impl {
    struct NthFn : CheckedBindSecond<NthFn> {
      template <typename Container, typename Index, typename... Default>
      static void check(const Container&, const Index&, const Default&...) {
        check_iterable<Container>();
        check_integer<Index>();
        check_defaults<iterator_value<Container>, Default...>();
      }

      // A negative index counts from the end.  With a known length the index
      // is normalized first and the element is reached by indexing, or from
      // whichever end is closer when the sequence is reversible.  Without a
      // length a negative index has to buffer the whole sequence.
      template <typename Container, typename Index, typename... Default>
      static iterator_value<Container> unchecked(
          Container&& container, Index n, Default&&... dflt) {
        using Value = iterator_value<Container>;
        std::ptrdiff_t index = to_difference(n);

        if constexpr (has_length_v<Container>) {
          const auto size = static_cast<std::ptrdiff_t>(std::size(container));
          if (index < 0) {
            index += size;
          }
          if (0 <= index && index < size) {
            if constexpr (is_indexable_v<Container>) {
              return *std::next(get_begin(container), index);
            } else {
              if constexpr (is_reversible_v<Container>) {
                if (index >= size / 2) {
                  auto it = std::rbegin(container);
                  dumb_advance_unsafe(it, size - index - 1);
                  return *it;
                }
              }
              auto it = get_begin(container);
              dumb_advance_unsafe(it, index);
              return *it;
            }
          }
        } else {
          if (index < 0) {
            auto buffer = materialize(container);
            index += static_cast<std::ptrdiff_t>(buffer.size());
            if (index >= 0) {
              return std::move(buffer[static_cast<std::size_t>(index)]);
            }
          } else {
            auto it = get_begin(container);
            auto end_it = get_end(container);
            dumb_advance(it, end_it, index);
            if (it != end_it) {
              return *it;
            }
          }
        }
        return or_default<Value, IndexOutOfRange>(
            "index out of range", std::forward<Default>(dflt)...);
      }
    };
  }

  // nth(seq, n) is the element at position n; negative positions count from
  // the end.  nth(seq, n, dflt) returns dflt instead of throwing
  // IndexOutOfRange.
  constexpr impl::NthFn nth{};
}

#endif
