#include "mdquery/index/file_system_indexer.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <unordered_map>

namespace mdquery {

namespace {

// Types each type directly conforms to; the tree is the breadth-first closure.
const std::unordered_map<std::string, std::vector<std::string>>& type_parents() {
  static const std::unordered_map<std::string, std::vector<std::string>> parents = {
      {"public.item", {}},
      {"public.content", {"public.item"}},
      {"public.data", {"public.item"}},
      {"public.directory", {"public.item"}},
      {"public.folder", {"public.directory"}},
      {"public.symlink", {"public.item"}},
      {"public.executable", {"public.item"}},
      {"public.unix-executable", {"public.data", "public.executable"}},
      {"com.apple.application", {"public.executable"}},
      {"com.apple.application-bundle", {"com.apple.application", "public.directory"}},
      {"public.text", {"public.data", "public.content"}},
      {"public.plain-text", {"public.text"}},
      {"public.source-code", {"public.plain-text"}},
      {"net.daringfireball.markdown", {"public.plain-text"}},
      {"public.comma-separated-values-text", {"public.text"}},
      {"public.json", {"public.text"}},
      {"public.html", {"public.text"}},
      {"public.image", {"public.data", "public.content"}},
      {"public.jpeg", {"public.image"}},
      {"public.png", {"public.image"}},
      {"public.heic", {"public.image"}},
      {"com.compuserve.gif", {"public.image"}},
      {"public.audiovisual-content", {"public.data", "public.content"}},
      {"public.movie", {"public.audiovisual-content"}},
      {"public.mpeg-4", {"public.movie"}},
      {"com.apple.quicktime-movie", {"public.movie"}},
      {"org.matroska.mkv", {"public.movie"}},
      {"public.audio", {"public.audiovisual-content"}},
      {"public.mp3", {"public.audio"}},
      {"com.apple.m4a-audio", {"public.audio"}},
      {"com.microsoft.waveform-audio", {"public.audio"}},
      {"public.composite-content", {"public.content"}},
      {"com.adobe.pdf", {"public.data", "public.composite-content"}},
      {"public.presentation", {"public.composite-content"}},
      {"com.apple.keynote.key", {"public.data", "public.presentation"}},
      {"org.openxmlformats.presentationml.presentation", {"public.data", "public.presentation"}},
      {"org.openxmlformats.wordprocessingml.document", {"public.data", "public.composite-content"}},
      {"public.archive", {"public.data"}},
      {"public.zip-archive", {"public.archive"}},
      {"public.tar-archive", {"public.archive"}},
      {"org.gnu.gnu-zip-archive", {"public.archive"}},
      {"public.disk-image", {"public.data", "public.archive"}},
      {"com.apple.disk-image-udif", {"public.disk-image"}},
      {"public.iso-image", {"public.disk-image"}},
  };
  return parents;
}

const std::unordered_map<std::string, std::string>& extension_types() {
  static const std::unordered_map<std::string, std::string> types = {
      {"txt", "public.plain-text"},
      {"md", "net.daringfireball.markdown"},
      {"markdown", "net.daringfireball.markdown"},
      {"csv", "public.comma-separated-values-text"},
      {"json", "public.json"},
      {"html", "public.html"},
      {"htm", "public.html"},
      {"c", "public.source-code"},
      {"cc", "public.source-code"},
      {"cpp", "public.source-code"},
      {"h", "public.source-code"},
      {"hpp", "public.source-code"},
      {"py", "public.source-code"},
      {"swift", "public.source-code"},
      {"sh", "public.source-code"},
      {"jpg", "public.jpeg"},
      {"jpeg", "public.jpeg"},
      {"png", "public.png"},
      {"heic", "public.heic"},
      {"gif", "com.compuserve.gif"},
      {"mp4", "public.mpeg-4"},
      {"m4v", "public.mpeg-4"},
      {"mov", "com.apple.quicktime-movie"},
      {"mkv", "org.matroska.mkv"},
      {"mp3", "public.mp3"},
      {"m4a", "com.apple.m4a-audio"},
      {"wav", "com.microsoft.waveform-audio"},
      {"pdf", "com.adobe.pdf"},
      {"key", "com.apple.keynote.key"},
      {"pptx", "org.openxmlformats.presentationml.presentation"},
      {"docx", "org.openxmlformats.wordprocessingml.document"},
      {"zip", "public.zip-archive"},
      {"tar", "public.tar-archive"},
      {"gz", "org.gnu.gnu-zip-archive"},
      {"dmg", "com.apple.disk-image-udif"},
      {"iso", "public.iso-image"},
      {"app", "com.apple.application-bundle"},
  };
  return types;
}

std::string lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

TimePoint to_system_time(std::filesystem::file_time_type ftime) {
  return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
      ftime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
}

bool is_hidden(const std::filesystem::path& path) {
  const std::string name = path.filename().string();
  return !name.empty() && name.front() == '.';
}

}  // namespace

FileSystemIndexer::FileSystemIndexer(SqliteIndexBackend& backend, bool verbose)
    : backend_(backend), verbose_(verbose) {}

std::string FileSystemIndexer::content_type_for_extension(const std::string& extension) {
  const auto& types = extension_types();
  auto it = types.find(lower(extension));
  return it == types.end() ? "public.data" : it->second;
}

std::vector<std::string> FileSystemIndexer::content_type_tree(const std::string& content_type) {
  const auto& parents = type_parents();
  std::vector<std::string> tree{content_type};
  // Unknown types are plain data.
  if (parents.count(content_type) == 0 && content_type != "public.data") {
    tree.push_back("public.data");
  }
  for (size_t i = 0; i < tree.size(); ++i) {
    auto it = parents.find(tree[i]);
    if (it == parents.end()) {
      continue;
    }
    for (const auto& parent : it->second) {
      if (std::find(tree.begin(), tree.end(), parent) == tree.end()) {
        tree.push_back(parent);
      }
    }
  }
  return tree;
}

AttributeValues FileSystemIndexer::read_attributes(const std::filesystem::path& path) {
  namespace fs = std::filesystem;

  AttributeValues values;
  const std::string name = path.filename().string();
  values[keys::kFileName] = name;
  values["kMDItemDisplayName"] = name;
  values["kMDItemFSInvisible"] = is_hidden(path);

  const fs::file_status link_status = fs::symlink_status(path);
  std::string content_type;
  if (fs::is_symlink(link_status)) {
    content_type = "public.symlink";
  } else if (fs::is_directory(link_status)) {
    const std::string extension = lower(path.extension().string());
    content_type = extension == ".app" ? "com.apple.application-bundle" : "public.folder";
    std::error_code ec;
    int64_t entries = 0;
    for (auto it = fs::directory_iterator(path, ec); !ec && it != fs::directory_iterator();
         it.increment(ec)) {
      ++entries;
    }
    values["kMDItemFSNodeCount"] = entries;
  } else {
    std::string extension = path.extension().string();
    if (!extension.empty()) {
      extension.erase(0, 1);
    }
    content_type = content_type_for_extension(extension);
    if (content_type == "public.data" &&
        (fs::status(path).permissions() & fs::perms::owner_exec) != fs::perms::none) {
      content_type = "public.unix-executable";
    }
    values["kMDItemFSSize"] = static_cast<std::int64_t>(fs::file_size(path));
  }
  values[keys::kContentType] = content_type;
  values[keys::kContentTypeTree] = content_type_tree(content_type);

  const TimePoint modified = to_system_time(fs::last_write_time(path));
  values["kMDItemFSContentChangeDate"] = modified;
  values["kMDItemContentModificationDate"] = modified;

  struct stat info {};
  if (::stat(path.c_str(), &info) == 0) {
    // No birth time through stat(); the inode change time stands in for it.
    const TimePoint changed = Clock::from_time_t(info.st_ctime);
    values["kMDItemFSCreationDate"] = std::min(changed, modified);
    values["kMDItemAttributeChangeDate"] = changed;
  } else {
    values["kMDItemFSCreationDate"] = modified;
  }
  return values;
}

ItemId FileSystemIndexer::index_path(const std::filesystem::path& path) {
  const std::string absolute = std::filesystem::absolute(path).lexically_normal().string();
  return backend_.upsert(absolute, read_attributes(path));
}

IndexStats FileSystemIndexer::index_directory(const std::filesystem::path& root,
                                              bool include_hidden) {
  namespace fs = std::filesystem;

  IndexStats stats;
  if (!fs::is_directory(root)) {
    throw IndexBackendError(IndexErrorKind::InvalidArgument, "Not a directory: " + root.string());
  }

  if (verbose_) {
    std::cout << "[Indexer] indexing " << root << std::endl;
  }

  auto index_one = [&](const fs::path& path) {
    try {
      index_path(path);
      if (fs::is_directory(fs::symlink_status(path))) {
        ++stats.folders_indexed;
      } else {
        ++stats.files_indexed;
      }
    } catch (const fs::filesystem_error& e) {
      ++stats.errors;
      std::cerr << "[Indexer] ERROR reading " << path << ": " << e.what() << std::endl;
    }
  };

  index_one(root);

  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    throw IndexBackendError(IndexErrorKind::Storage,
                            "Cannot read directory " + root.string() + ": " + ec.message());
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      ++stats.errors;
      std::cerr << "[Indexer] ERROR walking " << root << ": " << ec.message() << std::endl;
      break;
    }
    const fs::path& path = it->path();
    if (!include_hidden && is_hidden(path)) {
      if (it->is_directory(ec)) {
        it.disable_recursion_pending();
      }
      continue;
    }
    index_one(path);
  }

  if (verbose_) {
    std::cout << "[Indexer] indexed " << stats.files_indexed << " files, " << stats.folders_indexed
              << " folders (" << stats.errors << " errors)" << std::endl;
  }
  return stats;
}

}  // namespace mdquery
