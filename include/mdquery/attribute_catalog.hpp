#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mdquery {

// Logical attributes a query can filter, sort, group or fetch by.
enum class AttributeId {
  Path,
  FileName,
  DisplayName,
  FileExtension,
  FileSize,
  FileIsInvisible,
  FileType,
  ContentType,
  ContentTypeTree,
  CreationDate,
  ModificationDate,
  ContentCreationDate,
  ContentModificationDate,
  MetadataModificationDate,
  LastUsedDate,
  DateAdded,
  DownloadedDate,
  DirectoryFilesCount,
  Kind,
  Keywords,
  Title,
  Authors,
  Comment,
  FinderComment,
  FinderTags,
  StarRating,
  WhereFroms,
  UsageCount,
  TextContent,
  Creator,
  NumberOfPages,
  PageWidth,
  PageHeight,
  PixelWidth,
  PixelHeight,
  PixelSize,
  Duration,
  Codecs,
  AudioBitRate,
  VideoBitRate,
  IsScreenCapture,
  QueryContentRelevance,
  AnyText
};

enum class ValueKind { String, Int, Double, Bool, Date, Size, Duration, StringList, RawType };

std::string to_string(ValueKind kind);

struct AttributeDescriptor {
  AttributeId id;
  std::string name;
  // One or more backend keys. Composite attributes (pixel_size) span several.
  std::vector<std::string> backend_keys;
  ValueKind kind;
};

/**
 * @class AttributeCatalog
 * @brief Static two-way mapping between logical attributes and backend keys.
 *
 * Built once from a literal table. Several logical attributes may share a
 * backend key (file_type and content_type_tree both read the content type
 * tree); the reverse lookup returns the first one registered.
 */
class AttributeCatalog {
 public:
  static const AttributeCatalog& get_instance();

  const AttributeDescriptor& descriptor(AttributeId id) const;
  const std::vector<std::string>& resolve(AttributeId id) const;
  std::optional<AttributeId> resolve(const std::string& backend_key) const;
  ValueKind value_kind(AttributeId id) const;

  // First backend key; the one predicates and sort descriptors compile against.
  const std::string& primary_key(AttributeId id) const;

  const std::string& name(AttributeId id) const;
  std::optional<AttributeId> from_name(const std::string& name) const;

  const std::vector<AttributeDescriptor>& all() const { return descriptors_; }

  AttributeCatalog(const AttributeCatalog&) = delete;
  AttributeCatalog& operator=(const AttributeCatalog&) = delete;

 private:
  AttributeCatalog();

  std::vector<AttributeDescriptor> descriptors_;
  std::unordered_map<int, size_t> by_id_;
  std::unordered_map<std::string, AttributeId> by_key_;
  std::unordered_map<std::string, AttributeId> by_name_;
};

// Backend keys that are always fetched for every result item.
namespace keys {
inline constexpr const char* kPath = "kMDItemPath";
inline constexpr const char* kFileName = "kMDItemFSName";
inline constexpr const char* kContentTypeTree = "kMDItemContentTypeTree";
inline constexpr const char* kContentType = "kMDItemContentType";
inline constexpr const char* kAnyText = "*";
}  // namespace keys

}  // namespace mdquery
