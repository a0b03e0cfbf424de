#pragma once

#include <vector>

#include "mdquery/attribute_catalog.hpp"
#include "mdquery/query/metadata_item.hpp"

namespace mdquery {

// Items sharing one value of a grouping attribute. Subgroups split the same
// items by the next grouping attribute.
struct ResultGroup {
  AttributeId attribute;
  // std::monostate groups the items that have no value.
  AttributeValue value;
  std::vector<MetadataItemPtr> items;
  std::vector<ResultGroup> subgroups;
};

// Groups appear in order of first occurrence in `items`.
std::vector<ResultGroup> build_groups(const std::vector<MetadataItemPtr>& items,
                                      const std::vector<AttributeId>& attributes);

}  // namespace mdquery
