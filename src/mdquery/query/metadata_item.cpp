#include "mdquery/query/metadata_item.hpp"

#include <algorithm>
#include <set>

namespace mdquery {

bool MetadataItemChanges::did_change(AttributeId attribute) const {
  return std::find(changed_attributes.begin(), changed_attributes.end(), attribute) !=
         changed_attributes.end();
}

MetadataItem::MetadataItem(ItemId id, AttributeValues values,
                           std::optional<AttributeValues> previous_values,
                           std::optional<std::string> path)
    : id_(id),
      values_(std::move(values)),
      previous_values_(std::move(previous_values)),
      path_(std::move(path)) {}

std::optional<std::string> MetadataItem::path() const {
  if (const auto* v = value(keys::kPath)) {
    if (const auto* s = std::get_if<std::string>(v)) return *s;
  }
  return path_;
}

const AttributeValue* MetadataItem::value(const std::string& backend_key) const {
  auto it = values_.find(backend_key);
  if (it == values_.end() || is_null(it->second)) {
    return nullptr;
  }
  return &it->second;
}

AttributeValue MetadataItem::value(AttributeId attribute) const {
  const auto* v = value(AttributeCatalog::get_instance().primary_key(attribute));
  return v ? *v : AttributeValue{};
}

std::optional<std::string> MetadataItem::string_value(AttributeId attribute) const {
  AttributeValue v = value(attribute);
  if (auto* s = std::get_if<std::string>(&v)) return *s;
  return std::nullopt;
}

std::optional<std::int64_t> MetadataItem::int_value(AttributeId attribute) const {
  AttributeValue v = value(attribute);
  if (auto* i = std::get_if<std::int64_t>(&v)) return *i;
  if (auto* d = std::get_if<double>(&v)) return static_cast<std::int64_t>(*d);
  return std::nullopt;
}

std::optional<double> MetadataItem::double_value(AttributeId attribute) const {
  AttributeValue v = value(attribute);
  if (auto* d = std::get_if<double>(&v)) return *d;
  if (auto* i = std::get_if<std::int64_t>(&v)) return static_cast<double>(*i);
  return std::nullopt;
}

std::optional<bool> MetadataItem::bool_value(AttributeId attribute) const {
  AttributeValue v = value(attribute);
  if (auto* b = std::get_if<bool>(&v)) return *b;
  if (auto* i = std::get_if<std::int64_t>(&v)) return *i != 0;
  return std::nullopt;
}

std::optional<TimePoint> MetadataItem::date_value(AttributeId attribute) const {
  AttributeValue v = value(attribute);
  if (auto* t = std::get_if<TimePoint>(&v)) return *t;
  return std::nullopt;
}

std::vector<std::string> MetadataItem::list_value(AttributeId attribute) const {
  AttributeValue v = value(attribute);
  if (auto* list = std::get_if<std::vector<std::string>>(&v)) return *list;
  if (auto* s = std::get_if<std::string>(&v)) return {*s};
  return {};
}

std::optional<std::string> MetadataItem::file_extension() const {
  auto name = file_name();
  if (!name) return std::nullopt;
  auto dot = name->find_last_of('.');
  if (dot == std::string::npos || dot == 0 || dot + 1 == name->size()) {
    return std::nullopt;
  }
  return name->substr(dot + 1);
}

std::optional<std::pair<std::int64_t, std::int64_t>> MetadataItem::pixel_size() const {
  const auto& pixel_keys = AttributeCatalog::get_instance().resolve(AttributeId::PixelSize);
  const auto* width = value(pixel_keys.at(0));
  const auto* height = value(pixel_keys.at(1));
  if (!width || !height) return std::nullopt;
  const auto* w = std::get_if<std::int64_t>(width);
  const auto* h = std::get_if<std::int64_t>(height);
  if (!w || !h) return std::nullopt;
  return std::make_pair(*w, *h);
}

bool MetadataItem::is_folder() const {
  auto tree = list_value(AttributeId::ContentTypeTree);
  return std::find(tree.begin(), tree.end(), "public.folder") != tree.end();
}

MetadataItemChanges MetadataItem::changes() const {
  MetadataItemChanges changes;
  if (!previous_values_) {
    return changes;
  }
  std::set<std::string> all_keys;
  for (const auto& entry : values_) all_keys.insert(entry.first);
  for (const auto& entry : *previous_values_) all_keys.insert(entry.first);

  const auto& catalog = AttributeCatalog::get_instance();
  for (const auto& key : all_keys) {
    auto now_it = values_.find(key);
    auto prev_it = previous_values_->find(key);
    AttributeValue now_value = now_it == values_.end() ? AttributeValue{} : now_it->second;
    AttributeValue prev_value = prev_it == previous_values_->end() ? AttributeValue{} : prev_it->second;
    if (now_value == prev_value) continue;

    changes.changed_keys.push_back(key);
    if (auto attribute = catalog.resolve(key)) {
      if (!changes.did_change(*attribute)) changes.changed_attributes.push_back(*attribute);
    }
  }
  return changes;
}

std::shared_ptr<const MetadataItem> MetadataItem::with_path(std::string path) const {
  return std::make_shared<const MetadataItem>(id_, values_, previous_values_, std::move(path));
}

}  // namespace mdquery
