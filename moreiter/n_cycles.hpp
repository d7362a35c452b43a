#ifndef MOREITER_N_CYCLES_HPP_
#define MOREITER_N_CYCLES_HPP_

#include "capabilities.hpp"
#include "internal/iterator_wrapper.hpp"
#include "internal/iterbase.hpp"
#include "internal/validation.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace moreiter {
  namespace impl {
    template <typename Container>
    class Cycled;

    struct NCyclesFn : CheckedBindSecond<NCyclesFn> {
      template <typename Container, typename Count>
      static void check(const Container&, const Count& n) {
        check_iterable<Container>();
        check_quantity(n, "n");
      }

      template <typename Container, typename Count>
      static Cycled<Container> unchecked(Container&& container, Count n) {
        const auto cycles = to_difference(n);
        return {std::forward<Container>(container),
            cycles < 0 ? std::size_t{0} : static_cast<std::size_t>(cycles)};
      }
    };
  }

  // n_cycles(seq, n) yields the elements of seq n times over.
  constexpr impl::NCyclesFn n_cycles{};
}

// A reusable container is walked again for every cycle.  Any other container
// is recorded during the first cycle when more cycles follow, and the later
// cycles replay the recording.
template <typename Container>
class moreiter::impl::Cycled : public LazySequence {
 private:
  using Value = iterator_value<Container>;

  Container container_;
  std::size_t cycles_;

  friend NCyclesFn;

  Cycled(Container&& container, std::size_t cycles)
      : container_(std::forward<Container>(container)), cycles_{cycles} {}

  template <typename ContainerT>
  class CyclingIterator {
   private:
    template <typename>
    friend class CyclingIterator;
    IteratorWrapper<ContainerT> sub_iter_;
    IteratorWrapper<ContainerT> sub_begin_;
    IteratorWrapper<ContainerT> sub_end_;
    std::size_t remaining_;

    bool done() const {
      return remaining_ == 0;
    }

   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = iterator_traits_deref<ContainerT>;
    using difference_type = std::ptrdiff_t;
    using pointer = value_type*;
    using reference = value_type&;

    CyclingIterator(IteratorWrapper<ContainerT>&& sub_iter,
        IteratorWrapper<ContainerT>&& sub_end, std::size_t cycles)
        : sub_iter_{sub_iter},
          sub_begin_{sub_iter},
          sub_end_{std::move(sub_end)},
          remaining_{sub_iter_ != sub_end_ ? cycles : 0} {}

    iterator_deref<ContainerT> operator*() {
      return *sub_iter_;
    }

    decltype(auto) operator->() {
      return apply_arrow(sub_iter_);
    }

    CyclingIterator& operator++() {
      ++sub_iter_;
      // reset to beginning upon reaching the sub_end_
      if (!(sub_iter_ != sub_end_)) {
        --remaining_;
        sub_iter_ = sub_begin_;
      }
      return *this;
    }

    CyclingIterator operator++(int) {
      auto ret = *this;
      ++*this;
      return ret;
    }

    template <typename T>
    bool operator!=(const CyclingIterator<T>& other) const {
      return done() != other.done();
    }

    template <typename T>
    bool operator==(const CyclingIterator<T>& other) const {
      return !(*this != other);
    }
  };

  template <typename ContainerT>
  class RecordingIterator {
   private:
    template <typename>
    friend class RecordingIterator;
    using Holder = DerefHolder<iterator_deref<ContainerT>>;
    using Recording = std::vector<Value>;
    IteratorWrapper<ContainerT> sub_iter_;
    IteratorWrapper<ContainerT> sub_end_;
    std::size_t remaining_;
    Holder item_;
    bool loaded_ = false;
    std::shared_ptr<Recording> recording_;
    bool replaying_ = false;
    std::size_t index_ = 0;

    bool done() const {
      return remaining_ == 0;
    }

    void load() {
      if (!loaded_) {
        item_.reset(*sub_iter_);
        loaded_ = true;
      }
    }

   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Value;
    using difference_type = std::ptrdiff_t;
    using pointer = const value_type*;
    using reference = const value_type&;

    RecordingIterator(IteratorWrapper<ContainerT>&& sub_iter,
        IteratorWrapper<ContainerT>&& sub_end, std::size_t cycles)
        : sub_iter_{std::move(sub_iter)},
          sub_end_{std::move(sub_end)},
          remaining_{sub_iter_ != sub_end_ ? cycles : 0} {
      if (remaining_ > 1) {
        recording_ = std::make_shared<Recording>();
      }
    }

    reference operator*() {
      if (replaying_) {
        return (*recording_)[index_];
      }
      load();
      return item_.get();
    }

    pointer operator->() {
      return &**this;
    }

    RecordingIterator& operator++() {
      if (replaying_) {
        ++index_;
        if (index_ == recording_->size()) {
          --remaining_;
          index_ = 0;
        }
        return *this;
      }
      if (recording_) {
        load();
        recording_->push_back(item_.get());
      }
      loaded_ = false;
      ++sub_iter_;
      if (!(sub_iter_ != sub_end_)) {
        --remaining_;
        replaying_ = true;
      }
      return *this;
    }

    RecordingIterator operator++(int) {
      auto ret = *this;
      ++*this;
      return ret;
    }

    template <typename T>
    bool operator!=(const RecordingIterator<T>& other) const {
      return done() != other.done();
    }

    template <typename T>
    bool operator==(const RecordingIterator<T>& other) const {
      return !(*this != other);
    }
  };

 public:
  Cycled(Cycled&&) = default;

  template <typename ContainerT>
  using Iterator = std::conditional_t<is_reusable_v<ContainerT>,
      CyclingIterator<ContainerT>, RecordingIterator<ContainerT>>;

  Iterator<Container> begin() {
    return {get_begin(container_), get_end(container_), cycles_};
  }

  Iterator<Container> end() {
    return {get_end(container_), get_end(container_), 0};
  }

  Iterator<AsConst<Container>> begin() const {
    return {get_begin(std::as_const(container_)),
        get_end(std::as_const(container_)), cycles_};
  }

  Iterator<AsConst<Container>> end() const {
    return {get_end(std::as_const(container_)),
        get_end(std::as_const(container_)), 0};
  }
};

#endif
