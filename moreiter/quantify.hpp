#ifndef MOREITER_QUANTIFY_HPP_
#define MOREITER_QUANTIFY_HPP_

#include "internal/iterbase.hpp"
#include "internal/validation.hpp"

#include <cstddef>
#include <utility>

namespace moreiter {
  namespace impl {
    struct QuantifyFn : Checked<QuantifyFn>, Pipeable<QuantifyFn> {
      template <typename Container>
      static void check(const Container& container) {
        check(container, nullptr);
      }

      template <typename Container, typename Pred>
      static void check(const Container&, const Pred&) {
        check_iterable<Container>();
        check_predicate<iterator_deref<Container>, Pred>();
      }

      template <typename Container>
      static std::size_t unchecked(Container&& container) {
        return unchecked(std::forward<Container>(container), nullptr);
      }

      template <typename Container, typename Pred>
      static std::size_t unchecked(Container&& container, Pred pred) {
        std::size_t count = 0;
        auto end_it = get_end(container);
        for (auto it = get_begin(container); it != end_it; ++it) {
          if (satisfies(pred, *it)) {
            ++count;
          }
        }
        return count;
      }
    };
  }

  // quantify(seq, [pred]) counts the elements for which pred holds, or the
  // elements which are themselves true.
  constexpr impl::QuantifyFn quantify{};
}

#endif
