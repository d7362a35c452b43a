#ifndef MOREITER_LENGTH_HPP_
#define MOREITER_LENGTH_HPP_

#include "capabilities.hpp"
#include "internal/iterbase.hpp"
#include "internal/validation.hpp"

#include <cstddef>
#include <iterator>

namespace moreiter {
  namespace impl {
    struct LengthFn : Checked<LengthFn>, Pipeable<LengthFn> {
      template <typename Container>
      static void check(const Container&) {
        check_iterable<Container>();
      }

      template <typename Container>
      static std::size_t unchecked(Container&& container) {
        if constexpr (has_length_v<Container>) {
          return static_cast<std::size_t>(std::size(container));
        } else {
          std::size_t count = 0;
          auto end_it = get_end(container);
          for (auto it = get_begin(container); it != end_it; ++it) {
            ++count;
          }
          return count;
        }
      }
    };
  }

  // length(seq) is the number of elements in seq.  A sequence without a size
  // is counted, which consumes a single-pass sequence.
  constexpr impl::LengthFn length{};
}

#endif
