#ifndef MOREITER_TEST_HELPERS_HPP_
#define MOREITER_TEST_HELPERS_HPP_

#include <cstddef>
#include <forward_list>
#include <initializer_list>
#include <iterator>
#include <list>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

namespace moreitertest {
  // Collects every element of a sequence into a vector.
  template <typename Seq>
  auto to_vector(Seq&& seq) {
    using Value = std::decay_t<decltype(*std::begin(seq))>;
    std::vector<Value> out;
    for (auto&& e : seq) {
      out.push_back(e);
    }
    return out;
  }

  // A single-pass sequence: every copy shares one cursor, begin() resumes
  // where the last traversal stopped, and elements are produced by value.
  // No size, no reverse iterators.
  template <typename T>
  class InputIterable {
   private:
    struct State {
      std::vector<T> data;
      std::size_t position = 0;
      std::size_t reads = 0;
    };
    std::shared_ptr<State> state_;

   public:
    InputIterable(std::initializer_list<T> il)
        : state_{std::make_shared<State>()} {
      state_->data.assign(il.begin(), il.end());
    }

    explicit InputIterable(std::vector<T> data)
        : state_{std::make_shared<State>()} {
      state_->data = std::move(data);
    }

    class Iterator {
     private:
      State* state_;
      bool is_end_;

      bool done() const {
        return is_end_ || state_->position >= state_->data.size();
      }

     public:
      using iterator_category = std::input_iterator_tag;
      using value_type = T;
      using difference_type = std::ptrdiff_t;
      using pointer = T*;
      using reference = T;

      Iterator(State* state, bool is_end) : state_{state}, is_end_{is_end} {}

      T operator*() const {
        ++state_->reads;
        return state_->data[state_->position];
      }

      Iterator& operator++() {
        ++state_->position;
        return *this;
      }

      Iterator operator++(int) {
        auto ret = *this;
        ++*this;
        return ret;
      }

      bool operator!=(const Iterator& other) const {
        return done() != other.done();
      }

      bool operator==(const Iterator& other) const {
        return !(*this != other);
      }
    };

    Iterator begin() const {
      return {state_.get(), false};
    }

    Iterator end() const {
      return {state_.get(), true};
    }

    // index of the element the cursor is on
    std::size_t position() const {
      return state_->position;
    }

    // number of dereferences so far
    std::size_t reads() const {
      return state_->reads;
    }
  };

  // Knows its size but can only be walked forward.
  template <typename T>
  class SizedForwardList {
   private:
    std::forward_list<T> items_;
    std::size_t size_;

   public:
    SizedForwardList(std::initializer_list<T> il)
        : items_(il), size_{il.size()} {}

    auto begin() {
      return items_.begin();
    }
    auto end() {
      return items_.end();
    }
    auto begin() const {
      return items_.begin();
    }
    auto end() const {
      return items_.end();
    }
    std::size_t size() const {
      return size_;
    }
  };

  // Has reverse iterators but no size.
  template <typename T>
  class ReversibleUnsized {
   private:
    std::list<T> items_;

   public:
    ReversibleUnsized(std::initializer_list<T> il) : items_(il) {}

    auto begin() {
      return items_.begin();
    }
    auto end() {
      return items_.end();
    }
    auto begin() const {
      return items_.begin();
    }
    auto end() const {
      return items_.end();
    }
    auto rbegin() {
      return items_.rbegin();
    }
    auto rend() {
      return items_.rend();
    }
    auto rbegin() const {
      return items_.rbegin();
    }
    auto rend() const {
      return items_.rend();
    }
  };

  // Forward iterator which counts how often it was advanced.
  template <typename It>
  class CountingIterator {
   private:
    It it_;
    std::size_t* steps_;

   public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = typename std::iterator_traits<It>::value_type;
    using difference_type = std::ptrdiff_t;
    using pointer = typename std::iterator_traits<It>::pointer;
    using reference = typename std::iterator_traits<It>::reference;

    CountingIterator() : it_{}, steps_{nullptr} {}
    CountingIterator(It it, std::size_t* steps) : it_{it}, steps_{steps} {}

    reference operator*() const {
      return *it_;
    }

    CountingIterator& operator++() {
      ++*steps_;
      ++it_;
      return *this;
    }

    CountingIterator operator++(int) {
      auto ret = *this;
      ++*this;
      return ret;
    }

    bool operator==(const CountingIterator& other) const {
      return it_ == other.it_;
    }

    bool operator!=(const CountingIterator& other) const {
      return it_ != other.it_;
    }
  };

  // Sized and reversible, not indexable.  Counts every iterator step in
  // either direction.
  template <typename T>
  class CountedList {
   private:
    std::list<T> items_;
    std::size_t steps_ = 0;

    using ForwardIt = CountingIterator<typename std::list<T>::iterator>;
    using ReverseIt =
        CountingIterator<typename std::list<T>::reverse_iterator>;

   public:
    CountedList(std::initializer_list<T> il) : items_(il) {}

    ForwardIt begin() {
      return {items_.begin(), &steps_};
    }
    ForwardIt end() {
      return {items_.end(), &steps_};
    }
    ReverseIt rbegin() {
      return {items_.rbegin(), &steps_};
    }
    ReverseIt rend() {
      return {items_.rend(), &steps_};
    }
    std::size_t size() const {
      return items_.size();
    }
    std::size_t steps() const {
      return steps_;
    }
  };
}

#endif
