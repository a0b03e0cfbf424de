#pragma once

#include <optional>
#include <string>

namespace mdquery {

// Coarse file kinds a predicate can test against the content type tree.
enum class FileType {
  Executable,
  Folder,
  Image,
  Video,
  Audio,
  Pdf,
  Presentation,
  Application,
  Archive,
  DiskImage,
  Gif,
  Document,
  Text,
  AliasFile,
  SymbolicLink
};

// Conversion utilities
std::string to_string(FileType type);
std::optional<FileType> file_type_from_string(const std::string& str);

// Uniform type identifier the backend stores in kMDItemContentTypeTree.
std::string to_uti(FileType type);

}  // namespace mdquery
