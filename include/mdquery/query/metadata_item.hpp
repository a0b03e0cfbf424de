#pragma once

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "mdquery/attribute_catalog.hpp"
#include "mdquery/types/attribute_value.hpp"

namespace mdquery {

// Attributes that differ between an item's previous and current values.
struct MetadataItemChanges {
  std::vector<AttributeId> changed_attributes;
  // Backend keys, including ones the catalog does not model.
  std::vector<std::string> changed_keys;

  bool did_change(AttributeId attribute) const;
  bool empty() const { return changed_keys.empty(); }
};

/**
 * @class MetadataItem
 * @brief One result record: identity, fetched values, previous values.
 *
 * Items are immutable. A refresh produces a new MetadataItem, so snapshots
 * handed to callers never change underneath them. previous_values is empty
 * after the initial fetch and holds the replaced values after an update.
 */
class MetadataItem {
 public:
  MetadataItem(ItemId id, AttributeValues values,
               std::optional<AttributeValues> previous_values = std::nullopt,
               std::optional<std::string> path = std::nullopt);

  ItemId id() const { return id_; }
  const AttributeValues& values() const { return values_; }
  const std::optional<AttributeValues>& previous_values() const { return previous_values_; }

  // kMDItemPath when fetched, else the prefetched path.
  std::optional<std::string> path() const;

  // nullptr when the key was not fetched.
  const AttributeValue* value(const std::string& backend_key) const;
  AttributeValue value(AttributeId attribute) const;

  std::optional<std::string> string_value(AttributeId attribute) const;
  std::optional<std::int64_t> int_value(AttributeId attribute) const;
  std::optional<double> double_value(AttributeId attribute) const;
  std::optional<bool> bool_value(AttributeId attribute) const;
  std::optional<TimePoint> date_value(AttributeId attribute) const;
  std::vector<std::string> list_value(AttributeId attribute) const;

  std::optional<std::string> file_name() const { return string_value(AttributeId::FileName); }
  std::optional<std::string> file_extension() const;
  std::optional<std::int64_t> file_size() const { return int_value(AttributeId::FileSize); }
  std::optional<std::string> content_type() const { return string_value(AttributeId::ContentType); }
  std::optional<TimePoint> creation_date() const { return date_value(AttributeId::CreationDate); }
  std::optional<TimePoint> modification_date() const {
    return date_value(AttributeId::ModificationDate);
  }
  std::vector<std::string> finder_tags() const { return list_value(AttributeId::FinderTags); }
  std::optional<double> duration() const { return double_value(AttributeId::Duration); }
  // (width, height) from the two pixel keys.
  std::optional<std::pair<std::int64_t, std::int64_t>> pixel_size() const;

  bool is_folder() const;

  MetadataItemChanges changes() const;

  std::shared_ptr<const MetadataItem> with_path(std::string path) const;

 private:
  ItemId id_;
  AttributeValues values_;
  std::optional<AttributeValues> previous_values_;
  std::optional<std::string> path_;
};

using MetadataItemPtr = std::shared_ptr<const MetadataItem>;

}  // namespace mdquery
