#ifndef MOREITER_FIRST_TRUE_HPP_
#define MOREITER_FIRST_TRUE_HPP_

#include "reverse_iter.hpp"
#include "internal/filter.hpp"
#include "internal/iterbase.hpp"
#include "internal/validation.hpp"

#include <cstddef>
#include <utility>

namespace moreiter {
  namespace impl {
    template <typename Container, typename Pred, typename... Default>
    iterator_value<Container> find_first(Container& container, Pred& pred,
        const char* message, Default&&... dflt) {
      auto end_it = get_end(container);
      for (auto it = get_begin(container); it != end_it; ++it) {
        decltype(auto) item = *it;
        if (satisfies(pred, item)) {
          return item;
        }
      }
      return or_default<iterator_value<Container>, EmptySequence>(
          message, std::forward<Default>(dflt)...);
    }

    // The shared shape of the four scanners: (seq), or (seq, pred, [dflt])
    // where a nullptr pred tests the element itself.
    template <typename Op>
    struct ScannerFn : Checked<Op>, Pipeable<Op> {
      template <typename Container>
      static void check(const Container& container) {
        Op::check(container, nullptr);
      }

      template <typename Container, typename Pred, typename... Default>
      static void check(const Container&, const Pred&, const Default&...) {
        check_iterable<Container>();
        check_predicate<iterator_deref<Container>, Pred>();
        check_defaults<iterator_value<Container>, Default...>();
      }

      template <typename Container>
      static decltype(auto) unchecked(Container&& container) {
        return Op::unchecked(std::forward<Container>(container), nullptr);
      }
    };

    struct FirstTrueFn : ScannerFn<FirstTrueFn> {
      using ScannerFn<FirstTrueFn>::check;
      using ScannerFn<FirstTrueFn>::unchecked;

      template <typename Container, typename Pred, typename... Default>
      static iterator_value<Container> unchecked(
          Container&& container, Pred pred, Default&&... dflt) {
        return find_first(container, pred, "no element satisfies the predicate",
            std::forward<Default>(dflt)...);
      }
    };

    struct FirstFalseFn : ScannerFn<FirstFalseFn> {
      using ScannerFn<FirstFalseFn>::check;
      using ScannerFn<FirstFalseFn>::unchecked;

      template <typename Container, typename Pred, typename... Default>
      static iterator_value<Container> unchecked(
          Container&& container, Pred pred, Default&&... dflt) {
        PredicateFlipper<Pred> flipped(std::move(pred));
        return find_first(container, flipped,
            "all elements satisfy the predicate", std::forward<Default>(dflt)...);
      }
    };

    struct LastTrueFn : ScannerFn<LastTrueFn> {
      using ScannerFn<LastTrueFn>::check;
      using ScannerFn<LastTrueFn>::unchecked;

      template <typename Container, typename Pred, typename... Default>
      static iterator_value<Container> unchecked(
          Container&& container, Pred pred, Default&&... dflt) {
        return FirstTrueFn::unchecked(
            ReverseIterFn::unchecked(std::forward<Container>(container)),
            std::move(pred), std::forward<Default>(dflt)...);
      }
    };

    struct LastFalseFn : ScannerFn<LastFalseFn> {
      using ScannerFn<LastFalseFn>::check;
      using ScannerFn<LastFalseFn>::unchecked;

      template <typename Container, typename Pred, typename... Default>
      static iterator_value<Container> unchecked(
          Container&& container, Pred pred, Default&&... dflt) {
        return FirstFalseFn::unchecked(
            ReverseIterFn::unchecked(std::forward<Container>(container)),
            std::move(pred), std::forward<Default>(dflt)...);
      }
    };
  }

  // first_true(seq, [pred, [dflt]]) is the first element for which pred
  // holds.  Without a predicate, or with nullptr, the element's own truth
  // value is tested.  Throws EmptySequence when nothing matches and no
  // default is given.
  constexpr impl::FirstTrueFn first_true{};

  // first_false(seq, [pred, [dflt]]) is the first element for which pred
  // does not hold.
  constexpr impl::FirstFalseFn first_false{};

  // last_true(seq, [pred, [dflt]]) is first_true of reverse_iter(seq).
  constexpr impl::LastTrueFn last_true{};

  // last_false(seq, [pred, [dflt]]) is first_false of reverse_iter(seq).
  constexpr impl::LastFalseFn last_false{};
}

#endif
