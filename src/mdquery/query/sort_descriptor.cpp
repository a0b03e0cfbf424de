#include "mdquery/query/sort_descriptor.hpp"

#include <algorithm>

namespace mdquery {

bool is_sortable(AttributeId attribute) {
  return attribute != AttributeId::Path && attribute != AttributeId::AnyText;
}

SortDescriptor::SortDescriptor(AttributeId attribute, bool ascending)
    : attribute_(attribute), ascending_(ascending) {
  if (!is_sortable(attribute)) {
    throw QueryConfigError("Cannot sort results by attribute '" +
                           AttributeCatalog::get_instance().name(attribute) + "'");
  }
}

const std::string& SortDescriptor::backend_key() const {
  return AttributeCatalog::get_instance().primary_key(attribute_);
}

std::vector<AttributeId> make_group_keys(const std::vector<AttributeId>& attributes) {
  std::vector<AttributeId> keys;
  keys.reserve(attributes.size());
  for (auto attribute : attributes) {
    if (std::find(keys.begin(), keys.end(), attribute) == keys.end()) {
      keys.push_back(attribute);
    }
  }
  return keys;
}

}  // namespace mdquery
