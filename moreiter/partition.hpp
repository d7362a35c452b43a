#ifndef MOREITER_PARTITION_HPP_
#define MOREITER_PARTITION_HPP_

#include "capabilities.hpp"
#include "internal/filter.hpp"
#include "internal/iterbase.hpp"
#include "internal/validation.hpp"

#include <memory>
#include <optional>
#include <utility>
#include <vector>

namespace moreiter {
  namespace impl {
    // One source read by several views.  A reusable container is traversed
    // again by every view; any other container is read into a buffer the
    // first time a view starts, and every view then reads the buffer.
    template <typename Container>
    class SharedSource {
     private:
      using Buffer = std::vector<iterator_value<Container>>;

      struct State {
        Container container_;
        std::optional<Buffer> buffer_;
      };

      std::shared_ptr<State> state_;

      Buffer& buffer() const {
        if (!state_->buffer_) {
          state_->buffer_.emplace(materialize(state_->container_));
        }
        return *state_->buffer_;
      }

     public:
      SharedSource(Container&& container)
          : state_(std::make_shared<State>(
                State{std::forward<Container>(container), std::nullopt})) {}

      auto begin() const {
        if constexpr (is_reusable_v<Container>) {
          return get_begin(state_->container_);
        } else {
          return buffer().begin();
        }
      }

      auto end() const {
        if constexpr (is_reusable_v<Container>) {
          return get_end(state_->container_);
        } else {
          return buffer().end();
        }
      }
    };

    struct PartitionFn : Checked<PartitionFn> {
      template <typename Pred, typename Container>
      static void check(const Pred&, const Container&) {
        check_iterable<Container>();
        check_predicate<iterator_deref<Container>, Pred>();
      }

      template <typename Pred, typename Container>
      static auto unchecked(Pred pred, Container&& container) {
        SharedSource<Container> source(std::forward<Container>(container));
        auto holds = FilterFn{}(pred, SharedSource<Container>(source));
        auto fails =
            FilterFn{}(PredicateFlipper<Pred>(std::move(pred)), std::move(source));
        return std::make_pair(std::move(holds), std::move(fails));
      }
    };
  }

  // partition(pred, seq) is a pair of views: the elements for which pred
  // holds, and the elements for which it does not.  Either view can be
  // traversed first.  A nullptr pred tests the element itself.
  constexpr impl::PartitionFn partition{};
}

#endif
