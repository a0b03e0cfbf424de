#include "mdquery/projection/result_group.hpp"

namespace mdquery {

namespace {

std::vector<ResultGroup> build_level(const std::vector<MetadataItemPtr>& items,
                                     const std::vector<AttributeId>& attributes, size_t level) {
  std::vector<ResultGroup> groups;
  if (level >= attributes.size()) {
    return groups;
  }
  const AttributeId attribute = attributes[level];

  for (const auto& item : items) {
    if (!item) continue;
    AttributeValue value = item->value(attribute);
    auto it = groups.begin();
    while (it != groups.end() && !(it->value == value)) ++it;
    if (it == groups.end()) {
      groups.push_back(ResultGroup{attribute, std::move(value), {}, {}});
      it = groups.end() - 1;
    }
    it->items.push_back(item);
  }

  for (auto& group : groups) {
    group.subgroups = build_level(group.items, attributes, level + 1);
  }
  return groups;
}

}  // namespace

std::vector<ResultGroup> build_groups(const std::vector<MetadataItemPtr>& items,
                                      const std::vector<AttributeId>& attributes) {
  return build_level(items, attributes, 0);
}

}  // namespace mdquery
