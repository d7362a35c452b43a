#ifndef MOREITER_REGISTRY_HPP_
#define MOREITER_REGISTRY_HPP_

#include "errors.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace moreiter {
  enum class ResultKind { Scalar, LazySequence, LazySequencePair };

  enum class ParameterKind {
    Sequence,
    Sequences,  // any number of sequences
    Count,
    Index,
    Predicate,  // nullptr tests the element itself
    Key,        // nullptr keys an element by itself
    Function,
    Arguments,  // any number of values passed on to a function
    Value,
    Default,
  };

  struct Parameter {
    std::string name;
    ParameterKind kind;
    bool optional;
  };

  struct OperationInfo {
    std::string name;
    std::vector<Parameter> parameters;
    ResultKind result;
    // other operations of this registry called by this one
    std::vector<std::string> calls;
  };

  // Every public operation, in declaration order.
  inline const std::vector<OperationInfo>& operations() {
    using K = ParameterKind;
    using R = ResultKind;
    static const std::vector<OperationInfo> registry{
        {"first", {{"seq", K::Sequence, false}, {"default", K::Default, true}},
            R::Scalar, {}},
        {"last", {{"seq", K::Sequence, false}, {"default", K::Default, true}},
            R::Scalar, {}},
        {"nth",
            {{"seq", K::Sequence, false}, {"n", K::Index, false},
                {"default", K::Default, true}},
            R::Scalar, {}},
        {"head", {{"seq", K::Sequence, false}, {"n", K::Count, false}},
            R::LazySequence, {}},
        {"tail", {{"seq", K::Sequence, false}, {"n", K::Count, false}},
            R::LazySequence, {"head"}},
        {"reverse_iter", {{"seq", K::Sequence, false}}, R::LazySequence, {}},
        {"first_true",
            {{"seq", K::Sequence, false}, {"pred", K::Predicate, true},
                {"default", K::Default, true}},
            R::Scalar, {}},
        {"first_false",
            {{"seq", K::Sequence, false}, {"pred", K::Predicate, true},
                {"default", K::Default, true}},
            R::Scalar, {}},
        {"last_true",
            {{"seq", K::Sequence, false}, {"pred", K::Predicate, true},
                {"default", K::Default, true}},
            R::Scalar, {"first_true", "reverse_iter"}},
        {"last_false",
            {{"seq", K::Sequence, false}, {"pred", K::Predicate, true},
                {"default", K::Default, true}},
            R::Scalar, {"first_false", "reverse_iter"}},
        {"quantify",
            {{"seq", K::Sequence, false}, {"pred", K::Predicate, true}},
            R::Scalar, {}},
        {"partition",
            {{"pred", K::Predicate, false}, {"seq", K::Sequence, false}},
            R::LazySequencePair, {}},
        {"unique_everseen",
            {{"seq", K::Sequence, false}, {"key", K::Key, true}},
            R::LazySequence, {}},
        {"unique_justseen",
            {{"seq", K::Sequence, false}, {"key", K::Key, true}},
            R::LazySequence, {}},
        {"round_robin", {{"seqs", K::Sequences, true}}, R::LazySequence, {}},
        {"pairwise", {{"seq", K::Sequence, false}}, R::LazySequence, {}},
        {"n_cycles", {{"seq", K::Sequence, false}, {"n", K::Count, false}},
            R::LazySequence, {}},
        {"repeat_func",
            {{"f", K::Function, false}, {"n", K::Count, false},
                {"args", K::Arguments, true}},
            R::LazySequence, {}},
        {"prepend", {{"value", K::Value, false}, {"seq", K::Sequence, false}},
            R::LazySequence, {}},
        {"append", {{"seq", K::Sequence, false}, {"value", K::Value, false}},
            R::LazySequence, {}},
        {"length", {{"seq", K::Sequence, false}}, R::Scalar, {}},
    };
    return registry;
  }

  // Returns the operation called name, or nullptr.
  inline const OperationInfo* find_operation(std::string_view name) {
    const auto& ops = operations();
    auto it = std::find_if(ops.begin(), ops.end(),
        [name](const OperationInfo& op) { return op.name == name; });
    return it != ops.end() ? &*it : nullptr;
  }

  // The operations named, and every operation they call directly or
  // indirectly, in registry order.  Throws ContractViolation naming every
  // unknown name.
  inline std::vector<const OperationInfo*> dependency_closure(
      const std::vector<std::string>& names) {
    std::string unknown;
    for (const auto& name : names) {
      if (!find_operation(name)) {
        unknown += unknown.empty() ? name : ", " + name;
      }
    }
    if (!unknown.empty()) {
      throw ContractViolation("unknown operations: " + unknown);
    }

    std::set<std::string> selected;
    std::vector<std::string> pending(names.begin(), names.end());
    while (!pending.empty()) {
      std::string name = std::move(pending.back());
      pending.pop_back();
      if (!selected.insert(name).second) {
        continue;
      }
      const auto* op = find_operation(name);
      pending.insert(pending.end(), op->calls.begin(), op->calls.end());
    }

    std::vector<const OperationInfo*> closure;
    for (const auto& op : operations()) {
      if (selected.count(op.name)) {
        closure.push_back(&op);
      }
    }
    return closure;
  }
}

#endif
