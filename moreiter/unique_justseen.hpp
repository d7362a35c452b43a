#ifndef MOREITER_UNIQUE_JUSTSEEN_HPP_
#define MOREITER_UNIQUE_JUSTSEEN_HPP_

#include "unique_everseen.hpp"
#include "internal/filter.hpp"
#include "internal/iterbase.hpp"
#include "internal/key_set.hpp"
#include "internal/validation.hpp"

#include <optional>
#include <utility>

namespace moreiter {
  namespace impl {
    // Passes the first element of every run of elements with equal keys.
    template <typename KeyFunc, typename Value>
    class JustSeenFilter {
     private:
      using Key = key_value<KeyFunc, Value>;
      KeyFunc key_func_;
      std::optional<Key> current_key_;

     public:
      JustSeenFilter(KeyFunc key_func) : key_func_(std::move(key_func)) {}

      bool operator()(const Value& item) {
        Key key = apply_key(key_func_, item);
        check_key_usable(key);
        if (current_key_ && *current_key_ == key) {
          return false;
        }
        current_key_.emplace(std::move(key));
        return true;
      }
    };

    struct UniqueJustseenFn : CheckedBindSecond<UniqueJustseenFn>,
                              Pipeable<UniqueJustseenFn> {
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
        return FilterFn{}(JustSeenFilter<KeyFunc, Value>(std::move(key_func)),
            std::forward<Container>(container));
      }
    };
  }

  // unique_justseen(seq, [key]) yields one element per run of consecutive
  // elements with equal keys.
  constexpr impl::UniqueJustseenFn unique_justseen{};
}

#endif
