#ifndef MOREITER_KEY_SET_HPP_
#define MOREITER_KEY_SET_HPP_

#include "iterbase.hpp"
#include "../errors.hpp"

#include <algorithm>
#include <functional>
#include <set>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <vector>

namespace moreiter {
  namespace impl {
    template <typename T, typename = void>
    struct IsEqualityComparable : std::false_type {};

    template <typename T>
    struct IsEqualityComparable<T,
        std::void_t<decltype(
            bool(std::declval<const T&>() == std::declval<const T&>()))>>
        : std::true_type {};

    template <typename T, typename = void>
    struct IsHashable : std::false_type {};

    template <typename T>
    struct IsHashable<T,
        std::void_t<decltype(std::hash<T>{}(std::declval<const T&>()))>>
        : IsEqualityComparable<T> {};

    template <typename T, typename = void>
    struct IsOrdered : std::false_type {};

    template <typename T>
    struct IsOrdered<T,
        std::void_t<decltype(
            bool(std::declval<const T&>() < std::declval<const T&>()))>>
        : std::true_type {};

    // A key which is not equal to itself (a NaN, or anything containing one)
    // can never be found again once stored, so it can not be tracked.
    template <typename Key>
    void check_key_usable(const Key& key) {
      static_assert(IsEqualityComparable<Key>::value,
          "deduplication keys must be equality comparable");
      if (!(key == key)) {
        throw UnhashableKey("key is not equal to itself and can not be tracked");
      }
    }

    // The set of keys seen so far.  Storage is a hash set when the key is
    // hashable, a tree when it is ordered, and a list otherwise.
    template <typename Key>
    class KeySet {
     private:
      using Storage = std::conditional_t<IsHashable<Key>::value,
          std::unordered_set<Key>,
          std::conditional_t<IsOrdered<Key>::value, std::set<Key>,
              std::vector<Key>>>;

      Storage keys_;

     public:
      // Returns true if key was not in the set before.
      bool insert(const Key& key) {
        check_key_usable(key);
        if constexpr (std::is_same_v<Storage, std::vector<Key>>) {
          if (std::find(keys_.begin(), keys_.end(), key) != keys_.end()) {
            return false;
          }
          keys_.push_back(key);
          return true;
        } else {
          return keys_.insert(key).second;
        }
      }
    };
  }
}

#endif
