#include "mdquery/projection/hierarchical_results.hpp"

#include <algorithm>
#include <unordered_set>

namespace mdquery {

std::vector<std::string> split_path(const std::string& path) {
  std::vector<std::string> components;
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find('/', start);
    if (end == std::string::npos) {
      end = path.size();
    }
    if (end > start) {
      components.push_back(path.substr(start, end - start));
    }
    start = end + 1;
  }
  return components;
}

std::string join_path(const std::vector<std::string>& components, size_t count) {
  if (count == 0) {
    return "/";
  }
  std::string path;
  for (size_t i = 0; i < count && i < components.size(); ++i) {
    path += "/";
    path += components[i];
  }
  return path;
}

namespace {

std::string normalize(const std::string& path) {
  const auto components = split_path(path);
  return join_path(components, components.size());
}

HierarchyFolder& child_folder(HierarchyFolder& parent, const std::vector<std::string>& components,
                              size_t depth) {
  const std::string& name = components[depth - 1];
  for (auto& folder : parent.subfolders) {
    if (folder->name == name) {
      return *folder;
    }
  }
  auto folder = std::make_unique<HierarchyFolder>();
  folder->name = name;
  folder->path = join_path(components, depth);
  parent.subfolders.push_back(std::move(folder));
  return *parent.subfolders.back();
}

void collect_files(const HierarchyFolder& folder, std::vector<const HierarchyFile*>& out) {
  for (const auto& file : folder.files) {
    out.push_back(&file);
  }
  for (const auto& subfolder : folder.subfolders) {
    collect_files(*subfolder, out);
  }
}

void collect_folders(const HierarchyFolder& folder, std::vector<const HierarchyFolder*>& out) {
  for (const auto& subfolder : folder.subfolders) {
    out.push_back(subfolder.get());
    collect_folders(*subfolder, out);
  }
}

}  // namespace

HierarchicalResults::HierarchicalResults() : root_(std::make_unique<HierarchyFolder>()) {
  root_->path = "/";
}

void HierarchicalResults::index() {
  files_by_path_.clear();
  folders_by_path_.clear();
  for (const HierarchyFile* file : all_files()) {
    if (!file->path.empty()) {
      files_by_path_.emplace(file->path, file);
    }
  }
  folders_by_path_.emplace(root_->path, root_.get());
  for (const HierarchyFolder* folder : all_folders()) {
    folders_by_path_.emplace(folder->path, folder);
  }
}

const HierarchyFile* HierarchicalResults::file_at(const std::string& path) const {
  auto it = files_by_path_.find(normalize(path));
  return it == files_by_path_.end() ? nullptr : it->second;
}

const HierarchyFolder* HierarchicalResults::folder_at(const std::string& path) const {
  auto it = folders_by_path_.find(normalize(path));
  return it == folders_by_path_.end() ? nullptr : it->second;
}

MetadataItemPtr HierarchicalResults::item_at(const std::string& path) const {
  if (const HierarchyFile* file = file_at(path)) {
    return file->item;
  }
  if (const HierarchyFolder* folder = folder_at(path)) {
    return folder->item;
  }
  return nullptr;
}

std::vector<const HierarchyFile*> HierarchicalResults::all_files() const {
  std::vector<const HierarchyFile*> files;
  collect_files(*root_, files);
  return files;
}

std::vector<const HierarchyFolder*> HierarchicalResults::all_folders() const {
  std::vector<const HierarchyFolder*> folders;
  collect_folders(*root_, folders);
  return folders;
}

std::vector<MetadataItemPtr> HierarchicalResults::all_items() const {
  std::vector<MetadataItemPtr> items;
  for (const HierarchyFile* file : all_files()) {
    items.push_back(file->item);
  }
  for (const HierarchyFolder* folder : all_folders()) {
    if (folder->item) {
      items.push_back(folder->item);
    }
  }
  return items;
}

HierarchicalResults build_hierarchy(const std::vector<MetadataItemPtr>& items) {
  HierarchicalResults results;

  struct Placed {
    MetadataItemPtr item;
    std::vector<std::string> components;
  };
  std::vector<Placed> placed;
  std::vector<MetadataItemPtr> unplaced;

  for (const auto& item : items) {
    if (!item) continue;
    auto path = item->path();
    auto components = path ? split_path(*path) : std::vector<std::string>{};
    if (components.empty()) {
      unplaced.push_back(item);
    } else {
      placed.push_back({item, std::move(components)});
    }
  }

  // Deepest folder shared by the parents of every placed item.
  size_t common = 0;
  if (!placed.empty()) {
    common = placed.front().components.size() - 1;
    for (const auto& entry : placed) {
      const auto& first = placed.front().components;
      size_t limit = std::min(common, entry.components.size() - 1);
      size_t i = 0;
      while (i < limit && entry.components[i] == first[i]) ++i;
      common = i;
    }
    results.root_->path = join_path(placed.front().components, common);
    results.root_->name = common == 0 ? "/" : placed.front().components[common - 1];
  }

  std::unordered_set<std::string> ancestors;
  for (const auto& entry : placed) {
    for (size_t depth = common + 1; depth < entry.components.size(); ++depth) {
      ancestors.insert(join_path(entry.components, depth));
    }
  }

  for (const auto& entry : placed) {
    const auto& components = entry.components;
    HierarchyFolder* parent = results.root_.get();
    for (size_t depth = common + 1; depth < components.size(); ++depth) {
      parent = &child_folder(*parent, components, depth);
    }

    const std::string path = join_path(components, components.size());
    if (entry.item->is_folder() || ancestors.count(path) > 0) {
      HierarchyFolder& folder = child_folder(*parent, components, components.size());
      if (!folder.item) {
        folder.item = entry.item;
        continue;
      }
    }
    parent->files.push_back(HierarchyFile{path, components.back(), entry.item});
  }

  for (const auto& item : unplaced) {
    results.root_->files.push_back(HierarchyFile{"", "", item});
  }

  results.index();
  return results;
}

}  // namespace mdquery
