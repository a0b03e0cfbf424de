#pragma once

#include <string>
#include <vector>

#include "mdquery/attribute_catalog.hpp"

namespace mdquery {

class QueryConfigError : public std::exception {
 public:
  explicit QueryConfigError(const std::string& message) : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

/**
 * @class SortDescriptor
 * @brief Backend sort key for one attribute.
 *
 * Path-shaped attributes cannot be sorted by the backend; building a
 * descriptor for one throws QueryConfigError.
 */
class SortDescriptor {
 public:
  static SortDescriptor ascending(AttributeId attribute) { return SortDescriptor(attribute, true); }
  static SortDescriptor descending(AttributeId attribute) {
    return SortDescriptor(attribute, false);
  }

  AttributeId attribute() const { return attribute_; }
  bool is_ascending() const { return ascending_; }
  const std::string& backend_key() const;

  bool operator==(const SortDescriptor& other) const {
    return attribute_ == other.attribute_ && ascending_ == other.ascending_;
  }

 private:
  SortDescriptor(AttributeId attribute, bool ascending);

  AttributeId attribute_;
  bool ascending_;
};

bool is_sortable(AttributeId attribute);

// Order preserving, duplicates removed (outer group first).
std::vector<AttributeId> make_group_keys(const std::vector<AttributeId>& attributes);

}  // namespace mdquery
