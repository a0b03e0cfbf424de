#pragma once

#include <string>
#include <utility>
#include <vector>

#include "mdquery/predicate/date_value.hpp"
#include "mdquery/predicate/predicate.hpp"
#include "mdquery/types/file_type.hpp"

namespace mdquery {

/**
 * Typed predicate fields.
 *
 * Each field class exposes only the operators that make sense for its value
 * kind, so `root.file_name().greater_than(3)` does not compile. Fields are
 * small value types handed out by PredicateRoot.
 */
class FieldBase {
 public:
  AttributeId attribute() const { return attribute_; }

  // The item has any value for the attribute.
  Predicate exists() const;
  Predicate missing() const;

 protected:
  explicit FieldBase(AttributeId attribute) : attribute_(attribute) {}

  Predicate compare(ComparisonOp op, AttributeValue value,
                    StringMatchOptions options = StringMatchOptions{}) const;

  AttributeId attribute_;
};

// Shared implementation for fields whose values are ordered.
template <typename Input>
class OrderedField : public FieldBase {
 public:
  Predicate equals(const Input& value) const { return compare(ComparisonOp::Equal, to_value(value)); }
  Predicate not_equals(const Input& value) const {
    return compare(ComparisonOp::NotEqual, to_value(value));
  }
  Predicate less_than(const Input& value) const { return compare(ComparisonOp::Less, to_value(value)); }
  Predicate less_or_equal(const Input& value) const {
    return compare(ComparisonOp::LessOrEqual, to_value(value));
  }
  Predicate greater_than(const Input& value) const {
    return compare(ComparisonOp::Greater, to_value(value));
  }
  Predicate greater_or_equal(const Input& value) const {
    return compare(ComparisonOp::GreaterOrEqual, to_value(value));
  }

  // (attribute >= low && attribute <= high)
  Predicate between(const Input& low, const Input& high) const {
    if (high < low) {
      throw PredicateError("between() requires low <= high");
    }
    return Predicate::between(Between{attribute_, to_value(low), to_value(high), true});
  }

  // Matches when the value falls in any of the ranges.
  Predicate between_any(const std::vector<std::pair<Input, Input>>& ranges) const {
    if (ranges.empty()) {
      throw PredicateError("between_any() requires at least one range");
    }
    std::vector<Predicate> parts;
    parts.reserve(ranges.size());
    for (const auto& range : ranges) parts.push_back(between(range.first, range.second));
    return any_of(parts);
  }

  Predicate equals_any(const std::vector<Input>& values) const {
    if (values.empty()) {
      throw PredicateError("equals_any() requires at least one value");
    }
    std::vector<Predicate> parts;
    for (const auto& v : values) parts.push_back(equals(v));
    return any_of(parts);
  }

  // Every value must individually fail to match.
  Predicate not_equals_any(const std::vector<Input>& values) const {
    if (values.empty()) {
      throw PredicateError("not_equals_any() requires at least one value");
    }
    std::vector<Predicate> parts;
    for (const auto& v : values) parts.push_back(not_equals(v));
    return all_of(parts);
  }

  virtual ~OrderedField() = default;

 protected:
  explicit OrderedField(AttributeId attribute) : FieldBase(attribute) {}

  virtual AttributeValue to_value(const Input& value) const = 0;
};

template <typename T>
class NumberField : public OrderedField<T> {
 public:
  explicit NumberField(AttributeId attribute) : OrderedField<T>(attribute) {}

 protected:
  AttributeValue to_value(const T& value) const override { return value; }
};

using IntField = NumberField<std::int64_t>;
using DoubleField = NumberField<double>;

enum class SizeUnit { Bytes, Kilobytes, Megabytes, Gigabytes, Terabytes, Petabytes };

// Decimal (power of 1000) scaling.
std::int64_t bytes_per_unit(SizeUnit unit);

// Comparisons are in the selected unit and stored as whole bytes.
class SizeField : public OrderedField<double> {
 public:
  explicit SizeField(AttributeId attribute, SizeUnit unit = SizeUnit::Bytes)
      : OrderedField<double>(attribute), unit_(unit) {}

  SizeField bytes() const { return SizeField(attribute_, SizeUnit::Bytes); }
  SizeField kilobytes() const { return SizeField(attribute_, SizeUnit::Kilobytes); }
  SizeField megabytes() const { return SizeField(attribute_, SizeUnit::Megabytes); }
  SizeField gigabytes() const { return SizeField(attribute_, SizeUnit::Gigabytes); }
  SizeField terabytes() const { return SizeField(attribute_, SizeUnit::Terabytes); }
  SizeField petabytes() const { return SizeField(attribute_, SizeUnit::Petabytes); }

  SizeUnit unit() const { return unit_; }

 protected:
  AttributeValue to_value(const double& amount) const override;

 private:
  SizeUnit unit_;
};

enum class DurationUnit { Seconds, Minutes, Hours, Days, Weeks };

double seconds_per_unit(DurationUnit unit);

class DurationField : public OrderedField<double> {
 public:
  explicit DurationField(AttributeId attribute, DurationUnit unit = DurationUnit::Seconds)
      : OrderedField<double>(attribute), unit_(unit) {}

  DurationField seconds() const { return DurationField(attribute_, DurationUnit::Seconds); }
  DurationField minutes() const { return DurationField(attribute_, DurationUnit::Minutes); }
  DurationField hours() const { return DurationField(attribute_, DurationUnit::Hours); }
  DurationField days() const { return DurationField(attribute_, DurationUnit::Days); }
  DurationField weeks() const { return DurationField(attribute_, DurationUnit::Weeks); }

  DurationUnit unit() const { return unit_; }

 protected:
  AttributeValue to_value(const double& amount) const override;

 private:
  DurationUnit unit_;
};

class DateField : public OrderedField<TimePoint> {
 public:
  explicit DateField(AttributeId attribute) : OrderedField<TimePoint>(attribute) {}

  Predicate before(TimePoint date) const { return less_than(date); }
  Predicate after(TimePoint date) const { return greater_than(date); }

  // Date bucket membership, resolved against `now`.
  Predicate is(const DateValue& value, TimePoint now = Clock::now()) const;
  Predicate is_any(const std::vector<DateValue>& values, TimePoint now = Clock::now()) const;

 protected:
  AttributeValue to_value(const TimePoint& value) const override { return value; }
};

class BoolField : public FieldBase {
 public:
  explicit BoolField(AttributeId attribute) : FieldBase(attribute) {}

  Predicate is_true() const { return equals(true); }
  Predicate is_false() const { return equals(false); }
  Predicate equals(bool value) const { return compare(ComparisonOp::Equal, value); }
};

class StringField : public FieldBase {
 public:
  explicit StringField(AttributeId attribute, StringMatchOptions options = StringMatchOptions{})
      : FieldBase(attribute), options_(options) {}

  StringField case_sensitive() const;
  StringField diacritic_sensitive() const;
  StringField word_based() const;
  StringField with_options(StringMatchOptions options) const {
    return StringField(attribute_, options);
  }

  Predicate equals(const std::string& value) const;
  Predicate not_equals(const std::string& value) const;
  Predicate contains(const std::string& value) const;
  Predicate starts_with(const std::string& value) const;
  Predicate ends_with(const std::string& value) const;

  Predicate equals_any(const std::vector<std::string>& values) const;
  Predicate not_equals_any(const std::vector<std::string>& values) const;
  Predicate contains_any(const std::vector<std::string>& values) const;
  Predicate starts_with_any(const std::vector<std::string>& values) const;
  Predicate ends_with_any(const std::vector<std::string>& values) const;

  const StringMatchOptions& options() const { return options_; }

 private:
  Predicate any_of_op(ComparisonOp op, const std::vector<std::string>& values,
                      const char* name) const;

  StringMatchOptions options_;
};

// Matched against the file name ("*.ext"); a leading dot is ignored.
class ExtensionField : public FieldBase {
 public:
  explicit ExtensionField(AttributeId attribute) : FieldBase(attribute) {}

  Predicate equals(const std::string& extension) const;
  Predicate not_equals(const std::string& extension) const;
  Predicate equals_any(const std::vector<std::string>& extensions) const;
  Predicate not_equals_any(const std::vector<std::string>& extensions) const;
};

// Multi-valued attributes (tags, authors, content type tree).
class ListField : public FieldBase {
 public:
  explicit ListField(AttributeId attribute, StringMatchOptions options = StringMatchOptions{})
      : FieldBase(attribute), options_(options) {}

  ListField case_sensitive() const;

  Predicate contains(const std::string& element) const;
  Predicate contains_not(const std::string& element) const;
  Predicate contains_any(const std::vector<std::string>& elements) const;
  Predicate contains_none(const std::vector<std::string>& elements) const;

 private:
  StringMatchOptions options_;
};

class FileTypeField : public FieldBase {
 public:
  explicit FileTypeField(AttributeId attribute) : FieldBase(attribute) {}

  Predicate equals(FileType type) const;
  Predicate not_equals(FileType type) const;
  Predicate equals_any(const std::vector<FileType>& types) const;
  // Any uniform type identifier, e.g. "public.jpeg".
  Predicate conforms_to(const std::string& uti) const;
  Predicate conforms_to_any(const std::vector<std::string>& utis) const;
};

/**
 * @class PredicateRoot
 * @brief Entry point of the predicate builder; one accessor per attribute.
 *
 * query.set_predicate([](const PredicateRoot& item) {
 *   return item.file_name().contains("report").and_(item.file_size().megabytes().greater_than(2));
 * });
 */
class PredicateRoot {
 public:
  StringField path() const { return StringField(AttributeId::Path); }
  StringField file_name() const { return StringField(AttributeId::FileName); }
  StringField display_name() const { return StringField(AttributeId::DisplayName); }
  ExtensionField file_extension() const { return ExtensionField(AttributeId::FileExtension); }
  SizeField file_size() const { return SizeField(AttributeId::FileSize); }
  BoolField file_is_invisible() const { return BoolField(AttributeId::FileIsInvisible); }
  FileTypeField file_type() const { return FileTypeField(AttributeId::FileType); }
  StringField content_type() const { return StringField(AttributeId::ContentType); }
  ListField content_type_tree() const { return ListField(AttributeId::ContentTypeTree); }

  DateField creation_date() const { return DateField(AttributeId::CreationDate); }
  DateField modification_date() const { return DateField(AttributeId::ModificationDate); }
  DateField content_creation_date() const { return DateField(AttributeId::ContentCreationDate); }
  DateField content_modification_date() const {
    return DateField(AttributeId::ContentModificationDate);
  }
  DateField metadata_modification_date() const {
    return DateField(AttributeId::MetadataModificationDate);
  }
  DateField last_used_date() const { return DateField(AttributeId::LastUsedDate); }
  DateField date_added() const { return DateField(AttributeId::DateAdded); }
  DateField downloaded_date() const { return DateField(AttributeId::DownloadedDate); }

  IntField directory_files_count() const { return IntField(AttributeId::DirectoryFilesCount); }
  StringField kind() const { return StringField(AttributeId::Kind); }
  ListField keywords() const { return ListField(AttributeId::Keywords); }
  StringField title() const { return StringField(AttributeId::Title); }
  ListField authors() const { return ListField(AttributeId::Authors); }
  StringField comment() const { return StringField(AttributeId::Comment); }
  StringField finder_comment() const { return StringField(AttributeId::FinderComment); }
  ListField finder_tags() const { return ListField(AttributeId::FinderTags); }
  DoubleField star_rating() const { return DoubleField(AttributeId::StarRating); }
  ListField where_froms() const { return ListField(AttributeId::WhereFroms); }
  IntField usage_count() const { return IntField(AttributeId::UsageCount); }
  StringField text_content() const { return StringField(AttributeId::TextContent); }
  StringField creator() const { return StringField(AttributeId::Creator); }
  IntField number_of_pages() const { return IntField(AttributeId::NumberOfPages); }
  DoubleField page_width() const { return DoubleField(AttributeId::PageWidth); }
  DoubleField page_height() const { return DoubleField(AttributeId::PageHeight); }
  IntField pixel_width() const { return IntField(AttributeId::PixelWidth); }
  IntField pixel_height() const { return IntField(AttributeId::PixelHeight); }
  DurationField duration() const { return DurationField(AttributeId::Duration); }
  ListField codecs() const { return ListField(AttributeId::Codecs); }
  DoubleField audio_bit_rate() const { return DoubleField(AttributeId::AudioBitRate); }
  DoubleField video_bit_rate() const { return DoubleField(AttributeId::VideoBitRate); }
  BoolField is_screen_capture() const { return BoolField(AttributeId::IsScreenCapture); }

  // Name, title or text content.
  StringField any_text() const { return StringField(AttributeId::AnyText); }

  // Content type tree membership shortcuts.
  Predicate is_item() const;
  Predicate is_file() const;
  Predicate is_folder() const;
  Predicate is_volume() const;
  Predicate is_alias() const;
};

}  // namespace mdquery
