#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "mdquery/index/sqlite_index_backend.hpp"

namespace mdquery {

struct IndexStats {
  size_t files_indexed = 0;
  size_t folders_indexed = 0;
  size_t errors = 0;
};

/**
 * @class FileSystemIndexer
 * @brief Walks a directory tree and stores basic file attributes in a
 * SqliteIndexBackend.
 *
 * Stored per item: name, display name, size, invisibility, creation and
 * modification dates, content type and content type tree (from the file
 * extension) and, for directories, the number of entries.
 */
class FileSystemIndexer {
 public:
  explicit FileSystemIndexer(SqliteIndexBackend& backend, bool verbose = false);

  // Indexes root itself and everything below it. Unreadable entries are
  // counted as errors and skipped.
  IndexStats index_directory(const std::filesystem::path& root, bool include_hidden = false);

  ItemId index_path(const std::filesystem::path& path);

  static AttributeValues read_attributes(const std::filesystem::path& path);

  // Uniform type identifier for a lower-case extension without the dot.
  static std::string content_type_for_extension(const std::string& extension);

  // The type followed by every type it conforms to, most specific first.
  static std::vector<std::string> content_type_tree(const std::string& content_type);

 private:
  SqliteIndexBackend& backend_;
  bool verbose_;
};

}  // namespace mdquery
