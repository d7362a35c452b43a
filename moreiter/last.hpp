#ifndef MOREITER_LAST_HPP_
#define MOREITER_LAST_HPP_

#include "capabilities.hpp"
#include "internal/iterbase.hpp"
#include "internal/validation.hpp"

#include <iterator>
#include <optional>
#include <utility>

namespace moreiter {
  namespace impl {
    struct LastFn : Checked<LastFn>, Pipeable<LastFn> {
      template <typename Container, typename... Default>
      static void check(const Container&, const Default&...) {
        check_iterable<Container>();
        check_defaults<iterator_value<Container>, Default...>();
      }

      template <typename Container, typename... Default>
      static iterator_value<Container> unchecked(
          Container&& container, Default&&... dflt) {
        using Value = iterator_value<Container>;
        if constexpr (is_reversible_v<Container>) {
          auto it = std::rbegin(container);
          if (it != std::rend(container)) {
            return *it;
          }
        } else {
          std::optional<Value> last_item;
          auto end_it = get_end(container);
          for (auto it = get_begin(container); it != end_it; ++it) {
            last_item.emplace(*it);
          }
          if (last_item) {
            return std::move(*last_item);
          }
        }
        return or_default<Value, EmptySequence>(
            "sequence is empty", std::forward<Default>(dflt)...);
      }
    };
  }

  // last(seq) is the last element of seq, read from the back when seq is
  // reversible.  last(seq, dflt) returns dflt when seq is empty.
  constexpr impl::LastFn last{};
}

#endif
