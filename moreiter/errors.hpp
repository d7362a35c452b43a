#ifndef MOREITER_ERRORS_HPP_
#define MOREITER_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace moreiter {
  // An argument does not satisfy the shape an operation requires, such as a
  // negative count or an empty function object.
  class ContractViolation : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;
  };

  // A scalar result was requested from a sequence with no qualifying element
  // and no default was supplied.
  class EmptySequence : public std::runtime_error {
   public:
    using std::runtime_error::runtime_error;
  };

  // A positional lookup fell outside the sequence and no default was
  // supplied.
  class IndexOutOfRange : public std::out_of_range {
   public:
    using std::out_of_range::out_of_range;
  };

  // A deduplication key can not be tracked because it is not equal to itself.
  class UnhashableKey : public std::invalid_argument {
   public:
    using std::invalid_argument::invalid_argument;
  };
}

#endif
