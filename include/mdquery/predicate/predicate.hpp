#pragma once

#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "mdquery/attribute_catalog.hpp"
#include "mdquery/types/attribute_value.hpp"

namespace mdquery {

class PredicateError : public std::exception {
 public:
  explicit PredicateError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Default: case and diacritic insensitive, phrase based ("cd").
struct StringMatchOptions {
  bool case_sensitive = false;
  bool diacritic_sensitive = false;
  bool word_based = false;

  // Query syntax modifier appended after a quoted string, e.g. "cd".
  std::string modifier_suffix() const;

  bool operator==(const StringMatchOptions& other) const {
    return case_sensitive == other.case_sensitive &&
           diacritic_sensitive == other.diacritic_sensitive && word_based == other.word_based;
  }
};

enum class ComparisonOp {
  Equal,
  NotEqual,
  Less,
  LessOrEqual,
  Greater,
  GreaterOrEqual,
  Contains,
  BeginsWith,
  EndsWith,
  Exists
};

std::string to_string(ComparisonOp op);

struct PredicateNode;
using PredicateNodePtr = std::shared_ptr<const PredicateNode>;

struct Comparison {
  AttributeId attribute;
  ComparisonOp op = ComparisonOp::Equal;
  AttributeValue value;
  StringMatchOptions options;
};

// low <= attribute <= high, or low <= attribute < high for date buckets.
struct Between {
  AttributeId attribute;
  AttributeValue low;
  AttributeValue high;
  bool upper_inclusive = true;
};

struct And {
  std::vector<PredicateNodePtr> children;
};

struct Or {
  std::vector<PredicateNodePtr> children;
};

struct Not {
  PredicateNodePtr child;
};

struct PredicateNode {
  std::variant<Comparison, Between, And, Or, Not> node;
};

/**
 * @class Predicate
 * @brief Immutable boolean expression over item attributes.
 *
 * Nodes are shared, never mutated after construction, so copying a Predicate
 * is cheap. A default-constructed Predicate is empty and matches every item.
 */
class Predicate {
 public:
  Predicate() = default;
  explicit Predicate(PredicateNodePtr root) : root_(std::move(root)) {}

  static Predicate comparison(Comparison comparison);
  static Predicate between(Between between);

  Predicate and_(const Predicate& other) const;
  Predicate or_(const Predicate& other) const;
  Predicate not_() const;

  bool empty() const { return root_ == nullptr; }
  const PredicateNodePtr& root() const { return root_; }

  // Union of every attribute referenced by a leaf.
  std::set<AttributeId> referenced_attributes() const;

 private:
  PredicateNodePtr root_;
};

// Conjunction / disjunction of a list; empty members are skipped.
Predicate all_of(const std::vector<Predicate>& predicates);
Predicate any_of(const std::vector<Predicate>& predicates);

}  // namespace mdquery
