#include "mdquery/types.hpp"

namespace mdquery {

std::string to_string(FileType type) {
  switch (type) {
    case FileType::Executable:
      return "executable";
    case FileType::Folder:
      return "folder";
    case FileType::Image:
      return "image";
    case FileType::Video:
      return "video";
    case FileType::Audio:
      return "audio";
    case FileType::Pdf:
      return "pdf";
    case FileType::Presentation:
      return "presentation";
    case FileType::Application:
      return "application";
    case FileType::Archive:
      return "archive";
    case FileType::DiskImage:
      return "disk-image";
    case FileType::Gif:
      return "gif";
    case FileType::Document:
      return "document";
    case FileType::Text:
      return "text";
    case FileType::AliasFile:
      return "alias";
    case FileType::SymbolicLink:
      return "symlink";
    default:
      return "unknown";
  }
}

std::optional<FileType> file_type_from_string(const std::string& str) {
  if (str == "executable") return FileType::Executable;
  if (str == "folder") return FileType::Folder;
  if (str == "image") return FileType::Image;
  if (str == "video") return FileType::Video;
  if (str == "audio") return FileType::Audio;
  if (str == "pdf") return FileType::Pdf;
  if (str == "presentation") return FileType::Presentation;
  if (str == "application") return FileType::Application;
  if (str == "archive") return FileType::Archive;
  if (str == "disk-image") return FileType::DiskImage;
  if (str == "gif") return FileType::Gif;
  if (str == "document") return FileType::Document;
  if (str == "text") return FileType::Text;
  if (str == "alias") return FileType::AliasFile;
  if (str == "symlink") return FileType::SymbolicLink;
  return std::nullopt;
}

std::string to_uti(FileType type) {
  switch (type) {
    case FileType::Executable:
      return "public.executable";
    case FileType::Folder:
      return "public.folder";
    case FileType::Image:
      return "public.image";
    case FileType::Video:
      return "public.movie";
    case FileType::Audio:
      return "public.audio";
    case FileType::Pdf:
      return "com.adobe.pdf";
    case FileType::Presentation:
      return "public.presentation";
    case FileType::Application:
      return "com.apple.application";
    case FileType::Archive:
      return "public.archive";
    case FileType::DiskImage:
      return "public.disk-image";
    case FileType::Gif:
      return "com.compuserve.gif";
    case FileType::Document:
      return "public.content";
    case FileType::Text:
      return "public.text";
    case FileType::AliasFile:
      return "com.apple.alias-file";
    case FileType::SymbolicLink:
      return "public.symlink";
    default:
      return "public.item";
  }
}

}  // namespace mdquery
