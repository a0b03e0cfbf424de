#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "mdquery/query/metadata_item.hpp"

namespace mdquery {

struct HierarchyFile {
  std::string path;
  std::string name;
  MetadataItemPtr item;
};

struct HierarchyFolder {
  std::string path;
  std::string name;
  // Set when the folder itself is one of the results.
  MetadataItemPtr item;
  std::vector<HierarchyFile> files;
  std::vector<std::unique_ptr<HierarchyFolder>> subfolders;
};

/**
 * @class HierarchicalResults
 * @brief Result items arranged as a folder/file tree by path.
 *
 * The root is the deepest folder common to every item. Each input item is
 * placed exactly once: as a folder when it is a directory or an ancestor of
 * another item, otherwise as a file. Items without a path are root files.
 */
class HierarchicalResults {
 public:
  HierarchicalResults();

  HierarchicalResults(HierarchicalResults&&) = default;
  HierarchicalResults& operator=(HierarchicalResults&&) = default;
  HierarchicalResults(const HierarchicalResults&) = delete;
  HierarchicalResults& operator=(const HierarchicalResults&) = delete;

  const std::string& top_level_path() const { return root_->path; }
  const HierarchyFolder& root() const { return *root_; }
  const std::vector<HierarchyFile>& files() const { return root_->files; }
  const std::vector<std::unique_ptr<HierarchyFolder>>& folders() const {
    return root_->subfolders;
  }

  const HierarchyFile* file_at(const std::string& path) const;
  const HierarchyFolder* folder_at(const std::string& path) const;
  MetadataItemPtr item_at(const std::string& path) const;

  // Depth first, files of a folder before its subfolders.
  std::vector<const HierarchyFile*> all_files() const;
  std::vector<const HierarchyFolder*> all_folders() const;
  std::vector<MetadataItemPtr> all_items() const;

 private:
  friend HierarchicalResults build_hierarchy(const std::vector<MetadataItemPtr>& items);

  void index();

  std::unique_ptr<HierarchyFolder> root_;
  std::unordered_map<std::string, const HierarchyFile*> files_by_path_;
  std::unordered_map<std::string, const HierarchyFolder*> folders_by_path_;
};

HierarchicalResults build_hierarchy(const std::vector<MetadataItemPtr>& items);

// "/a/b/" -> {"a", "b"}
std::vector<std::string> split_path(const std::string& path);

std::string join_path(const std::vector<std::string>& components, size_t count);

}  // namespace mdquery
