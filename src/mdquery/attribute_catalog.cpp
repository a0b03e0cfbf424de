#include "mdquery/attribute_catalog.hpp"

#include <stdexcept>

namespace mdquery {

std::string to_string(ValueKind kind) {
  switch (kind) {
    case ValueKind::String:
      return "string";
    case ValueKind::Int:
      return "int";
    case ValueKind::Double:
      return "double";
    case ValueKind::Bool:
      return "bool";
    case ValueKind::Date:
      return "date";
    case ValueKind::Size:
      return "size";
    case ValueKind::Duration:
      return "duration";
    case ValueKind::StringList:
      return "string_list";
    case ValueKind::RawType:
      return "raw_type";
    default:
      return "unknown";
  }
}

const AttributeCatalog& AttributeCatalog::get_instance() {
  static AttributeCatalog instance;
  return instance;
}

AttributeCatalog::AttributeCatalog() {
  using A = AttributeId;
  using K = ValueKind;
  descriptors_ = {
      {A::Path, "path", {"kMDItemPath"}, K::String},
      {A::FileName, "file_name", {"kMDItemFSName"}, K::String},
      {A::DisplayName, "display_name", {"kMDItemDisplayName"}, K::String},
      // No extension key in the index; matched against the file name.
      {A::FileExtension, "file_extension", {"kMDItemFSName"}, K::String},
      {A::FileSize, "file_size", {"kMDItemFSSize"}, K::Size},
      {A::FileIsInvisible, "file_is_invisible", {"kMDItemFSInvisible"}, K::Bool},
      {A::FileType, "file_type", {"kMDItemContentTypeTree"}, K::RawType},
      {A::ContentType, "content_type", {"kMDItemContentType"}, K::String},
      {A::ContentTypeTree, "content_type_tree", {"kMDItemContentTypeTree"}, K::StringList},
      {A::CreationDate, "creation_date", {"kMDItemFSCreationDate"}, K::Date},
      {A::ModificationDate, "modification_date", {"kMDItemFSContentChangeDate"}, K::Date},
      {A::ContentCreationDate, "content_creation_date", {"kMDItemContentCreationDate"}, K::Date},
      {A::ContentModificationDate, "content_modification_date",
       {"kMDItemContentModificationDate"}, K::Date},
      {A::MetadataModificationDate, "metadata_modification_date",
       {"kMDItemAttributeChangeDate"}, K::Date},
      {A::LastUsedDate, "last_used_date", {"kMDItemLastUsedDate"}, K::Date},
      {A::DateAdded, "date_added", {"kMDItemDateAdded"}, K::Date},
      {A::DownloadedDate, "downloaded_date", {"kMDItemDownloadedDate"}, K::Date},
      {A::DirectoryFilesCount, "directory_files_count", {"kMDItemFSNodeCount"}, K::Int},
      {A::Kind, "kind", {"kMDItemKind"}, K::String},
      {A::Keywords, "keywords", {"kMDItemKeywords"}, K::StringList},
      {A::Title, "title", {"kMDItemTitle"}, K::String},
      {A::Authors, "authors", {"kMDItemAuthors"}, K::StringList},
      {A::Comment, "comment", {"kMDItemComment"}, K::String},
      {A::FinderComment, "finder_comment", {"kMDItemFinderComment"}, K::String},
      {A::FinderTags, "finder_tags", {"kMDItemUserTags"}, K::StringList},
      {A::StarRating, "star_rating", {"kMDItemStarRating"}, K::Double},
      {A::WhereFroms, "where_froms", {"kMDItemWhereFroms"}, K::StringList},
      {A::UsageCount, "usage_count", {"kMDItemUseCount"}, K::Int},
      {A::TextContent, "text_content", {"kMDItemTextContent"}, K::String},
      {A::Creator, "creator", {"kMDItemCreator"}, K::String},
      {A::NumberOfPages, "number_of_pages", {"kMDItemNumberOfPages"}, K::Int},
      {A::PageWidth, "page_width", {"kMDItemPageWidth"}, K::Double},
      {A::PageHeight, "page_height", {"kMDItemPageHeight"}, K::Double},
      {A::PixelWidth, "pixel_width", {"kMDItemPixelWidth"}, K::Int},
      {A::PixelHeight, "pixel_height", {"kMDItemPixelHeight"}, K::Int},
      {A::PixelSize, "pixel_size", {"kMDItemPixelWidth", "kMDItemPixelHeight"}, K::Int},
      {A::Duration, "duration", {"kMDItemDurationSeconds"}, K::Duration},
      {A::Codecs, "codecs", {"kMDItemCodecs"}, K::StringList},
      {A::AudioBitRate, "audio_bit_rate", {"kMDItemAudioBitRate"}, K::Double},
      {A::VideoBitRate, "video_bit_rate", {"kMDItemVideoBitRate"}, K::Double},
      {A::IsScreenCapture, "is_screen_capture", {"kMDItemIsScreenCapture"}, K::Bool},
      {A::QueryContentRelevance, "query_content_relevance",
       {"kMDQueryResultContentRelevance"}, K::Double},
      {A::AnyText, "any_text", {"*"}, K::String},
  };

  for (size_t i = 0; i < descriptors_.size(); ++i) {
    const auto& d = descriptors_[i];
    by_id_.emplace(static_cast<int>(d.id), i);
    by_name_.emplace(d.name, d.id);
    for (const auto& key : d.backend_keys) {
      // emplace keeps the first registration
      by_key_.emplace(key, d.id);
    }
  }
}

const AttributeDescriptor& AttributeCatalog::descriptor(AttributeId id) const {
  auto it = by_id_.find(static_cast<int>(id));
  if (it == by_id_.end()) {
    throw std::out_of_range("Attribute not registered in catalog: " +
                            std::to_string(static_cast<int>(id)));
  }
  return descriptors_[it->second];
}

const std::vector<std::string>& AttributeCatalog::resolve(AttributeId id) const {
  return descriptor(id).backend_keys;
}

std::optional<AttributeId> AttributeCatalog::resolve(const std::string& backend_key) const {
  auto it = by_key_.find(backend_key);
  if (it == by_key_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ValueKind AttributeCatalog::value_kind(AttributeId id) const {
  return descriptor(id).kind;
}

const std::string& AttributeCatalog::primary_key(AttributeId id) const {
  return descriptor(id).backend_keys.front();
}

const std::string& AttributeCatalog::name(AttributeId id) const {
  return descriptor(id).name;
}

std::optional<AttributeId> AttributeCatalog::from_name(const std::string& name) const {
  auto it = by_name_.find(name);
  if (it == by_name_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace mdquery
