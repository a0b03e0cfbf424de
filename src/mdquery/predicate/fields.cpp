#include "mdquery/predicate/fields.hpp"

#include <cmath>

namespace mdquery {

namespace {

std::string strip_leading_dot(const std::string& extension) {
  if (!extension.empty() && extension.front() == '.') {
    return extension.substr(1);
  }
  return extension;
}

Predicate content_type_tree_equals(const std::string& uti) {
  return Predicate::comparison(
      Comparison{AttributeId::ContentTypeTree, ComparisonOp::Equal, uti, StringMatchOptions{}});
}

}  // namespace

// ---------- FieldBase ----------

Predicate FieldBase::exists() const {
  return Predicate::comparison(Comparison{attribute_, ComparisonOp::Exists, std::monostate{}, {}});
}

Predicate FieldBase::missing() const {
  return exists().not_();
}

Predicate FieldBase::compare(ComparisonOp op, AttributeValue value,
                             StringMatchOptions options) const {
  return Predicate::comparison(Comparison{attribute_, op, std::move(value), options});
}

// ---------- units ----------

std::int64_t bytes_per_unit(SizeUnit unit) {
  switch (unit) {
    case SizeUnit::Bytes:
      return 1;
    case SizeUnit::Kilobytes:
      return 1000LL;
    case SizeUnit::Megabytes:
      return 1000LL * 1000;
    case SizeUnit::Gigabytes:
      return 1000LL * 1000 * 1000;
    case SizeUnit::Terabytes:
      return 1000LL * 1000 * 1000 * 1000;
    case SizeUnit::Petabytes:
      return 1000LL * 1000 * 1000 * 1000 * 1000;
  }
  return 1;
}

AttributeValue SizeField::to_value(const double& amount) const {
  if (amount < 0) {
    throw PredicateError("File sizes cannot be negative");
  }
  return static_cast<std::int64_t>(std::llround(amount * static_cast<double>(bytes_per_unit(unit_))));
}

double seconds_per_unit(DurationUnit unit) {
  switch (unit) {
    case DurationUnit::Seconds:
      return 1.0;
    case DurationUnit::Minutes:
      return 60.0;
    case DurationUnit::Hours:
      return 3600.0;
    case DurationUnit::Days:
      return 86400.0;
    case DurationUnit::Weeks:
      return 604800.0;
  }
  return 1.0;
}

AttributeValue DurationField::to_value(const double& amount) const {
  return amount * seconds_per_unit(unit_);
}

// ---------- DateField ----------

Predicate DateField::is(const DateValue& value, TimePoint now) const {
  DateRange range = value.resolve(now);
  return Predicate::between(Between{attribute_, range.low, range.high, range.upper_inclusive});
}

Predicate DateField::is_any(const std::vector<DateValue>& values, TimePoint now) const {
  if (values.empty()) {
    throw PredicateError("is_any() requires at least one date value");
  }
  std::vector<Predicate> parts;
  for (const auto& v : values) parts.push_back(is(v, now));
  return any_of(parts);
}

// ---------- StringField ----------

StringField StringField::case_sensitive() const {
  StringMatchOptions options = options_;
  options.case_sensitive = true;
  return StringField(attribute_, options);
}

StringField StringField::diacritic_sensitive() const {
  StringMatchOptions options = options_;
  options.diacritic_sensitive = true;
  return StringField(attribute_, options);
}

StringField StringField::word_based() const {
  StringMatchOptions options = options_;
  options.word_based = true;
  return StringField(attribute_, options);
}

Predicate StringField::equals(const std::string& value) const {
  return compare(ComparisonOp::Equal, value, options_);
}

Predicate StringField::not_equals(const std::string& value) const {
  return compare(ComparisonOp::NotEqual, value, options_);
}

Predicate StringField::contains(const std::string& value) const {
  return compare(ComparisonOp::Contains, value, options_);
}

Predicate StringField::starts_with(const std::string& value) const {
  return compare(ComparisonOp::BeginsWith, value, options_);
}

Predicate StringField::ends_with(const std::string& value) const {
  return compare(ComparisonOp::EndsWith, value, options_);
}

Predicate StringField::any_of_op(ComparisonOp op, const std::vector<std::string>& values,
                                 const char* name) const {
  if (values.empty()) {
    throw PredicateError(std::string(name) + "() requires at least one value");
  }
  std::vector<Predicate> parts;
  parts.reserve(values.size());
  for (const auto& v : values) parts.push_back(compare(op, v, options_));
  return any_of(parts);
}

Predicate StringField::equals_any(const std::vector<std::string>& values) const {
  return any_of_op(ComparisonOp::Equal, values, "equals_any");
}

Predicate StringField::not_equals_any(const std::vector<std::string>& values) const {
  if (values.empty()) {
    throw PredicateError("not_equals_any() requires at least one value");
  }
  std::vector<Predicate> parts;
  for (const auto& v : values) parts.push_back(not_equals(v));
  return all_of(parts);
}

Predicate StringField::contains_any(const std::vector<std::string>& values) const {
  return any_of_op(ComparisonOp::Contains, values, "contains_any");
}

Predicate StringField::starts_with_any(const std::vector<std::string>& values) const {
  return any_of_op(ComparisonOp::BeginsWith, values, "starts_with_any");
}

Predicate StringField::ends_with_any(const std::vector<std::string>& values) const {
  return any_of_op(ComparisonOp::EndsWith, values, "ends_with_any");
}

// ---------- ExtensionField ----------

Predicate ExtensionField::equals(const std::string& extension) const {
  return compare(ComparisonOp::Equal, strip_leading_dot(extension));
}

Predicate ExtensionField::not_equals(const std::string& extension) const {
  return compare(ComparisonOp::NotEqual, strip_leading_dot(extension));
}

Predicate ExtensionField::equals_any(const std::vector<std::string>& extensions) const {
  if (extensions.empty()) {
    throw PredicateError("equals_any() requires at least one extension");
  }
  std::vector<Predicate> parts;
  for (const auto& e : extensions) parts.push_back(equals(e));
  return any_of(parts);
}

Predicate ExtensionField::not_equals_any(const std::vector<std::string>& extensions) const {
  if (extensions.empty()) {
    throw PredicateError("not_equals_any() requires at least one extension");
  }
  std::vector<Predicate> parts;
  for (const auto& e : extensions) parts.push_back(not_equals(e));
  return all_of(parts);
}

// ---------- ListField ----------

ListField ListField::case_sensitive() const {
  StringMatchOptions options = options_;
  options.case_sensitive = true;
  return ListField(attribute_, options);
}

Predicate ListField::contains(const std::string& element) const {
  return compare(ComparisonOp::Equal, element, options_);
}

Predicate ListField::contains_not(const std::string& element) const {
  return compare(ComparisonOp::NotEqual, element, options_);
}

Predicate ListField::contains_any(const std::vector<std::string>& elements) const {
  if (elements.empty()) {
    throw PredicateError("contains_any() requires at least one element");
  }
  std::vector<Predicate> parts;
  for (const auto& e : elements) parts.push_back(contains(e));
  return any_of(parts);
}

Predicate ListField::contains_none(const std::vector<std::string>& elements) const {
  if (elements.empty()) {
    throw PredicateError("contains_none() requires at least one element");
  }
  std::vector<Predicate> parts;
  for (const auto& e : elements) parts.push_back(contains_not(e));
  return all_of(parts);
}

// ---------- FileTypeField ----------

Predicate FileTypeField::equals(FileType type) const {
  return compare(ComparisonOp::Equal, to_uti(type));
}

Predicate FileTypeField::not_equals(FileType type) const {
  return compare(ComparisonOp::NotEqual, to_uti(type));
}

Predicate FileTypeField::equals_any(const std::vector<FileType>& types) const {
  if (types.empty()) {
    throw PredicateError("equals_any() requires at least one file type");
  }
  std::vector<Predicate> parts;
  for (auto t : types) parts.push_back(equals(t));
  return any_of(parts);
}

Predicate FileTypeField::conforms_to(const std::string& uti) const {
  return compare(ComparisonOp::Equal, uti);
}

Predicate FileTypeField::conforms_to_any(const std::vector<std::string>& utis) const {
  if (utis.empty()) {
    throw PredicateError("conforms_to_any() requires at least one type identifier");
  }
  std::vector<Predicate> parts;
  for (const auto& uti : utis) parts.push_back(conforms_to(uti));
  return any_of(parts);
}

// ---------- PredicateRoot ----------

Predicate PredicateRoot::is_item() const {
  return content_type_tree_equals("public.item");
}

Predicate PredicateRoot::is_file() const {
  return content_type_tree_equals("public.data");
}

Predicate PredicateRoot::is_folder() const {
  return content_type_tree_equals("public.folder");
}

Predicate PredicateRoot::is_volume() const {
  return content_type_tree_equals("public.volume");
}

Predicate PredicateRoot::is_alias() const {
  return content_type_tree_equals("com.apple.alias-file");
}

}  // namespace mdquery
