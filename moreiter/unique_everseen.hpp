#ifndef MOREITER_UNIQUE_EVERSEEN_HPP_
#define MOREITER_UNIQUE_EVERSEEN_HPP_

#include "internal/filter.hpp"
#include "internal/iterbase.hpp"
#include "internal/key_set.hpp"
#include "internal/validation.hpp"

#include <cstddef>
#include <utility>

namespace moreiter {
  namespace impl {
    // Passes an element the first time its key is seen.
    template <typename KeyFunc, typename Value>
    class SeenFilter {
     private:
      KeyFunc key_func_;
      KeySet<key_value<KeyFunc, Value>> seen_;

     public:
      SeenFilter(KeyFunc key_func) : key_func_(std::move(key_func)) {}

      bool operator()(const Value& item) {
        return seen_.insert(apply_key(key_func_, item));
      }
    };

    template <typename KeyFunc>
    void check_key_func(const KeyFunc& key_func) {
      if constexpr (is_nullable_callable<KeyFunc>) {
        if (is_absent(key_func)) {
          throw ContractViolation("key must be callable, or nullptr");
        }
      }
    }

    struct UniqueEverseenFn : CheckedBindSecond<UniqueEverseenFn>,
                              Pipeable<UniqueEverseenFn> {
      template <typename Container>
      static void check(const Container& container) {
        check(container, nullptr);
      }

      template <typename Container, typename KeyFunc>
      static void check(const Container&, const KeyFunc& key_func) {
        check_iterable<Container>();
        check_predicate<const iterator_value<Container>&, KeyFunc>();
        check_key_func(key_func);
      }

      template <typename Container>
      static auto unchecked(Container&& container) {
        return unchecked(std::forward<Container>(container), nullptr);
      }

      template <typename Container, typename KeyFunc>
      static auto unchecked(Container&& container, KeyFunc key_func) {
        using Value = iterator_value<Container>;
        return FilterFn{}(SeenFilter<KeyFunc, Value>(std::move(key_func)),
            std::forward<Container>(container));
      }
    };
  }

  // unique_everseen(seq, [key]) yields each element whose key was not seen
  // before, in order.  Throws UnhashableKey, when the offending element is
  // reached, for a key which is not equal to itself.
  constexpr impl::UniqueEverseenFn unique_everseen{};
}

#endif
