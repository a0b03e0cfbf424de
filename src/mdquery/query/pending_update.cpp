#include "mdquery/query/pending_update.hpp"

#include <algorithm>

namespace mdquery {

void PendingUpdate::erase_from(std::vector<ItemId>& list, std::unordered_set<ItemId>& set,
                               ItemId id) {
  if (set.erase(id) > 0) {
    list.erase(std::remove(list.begin(), list.end(), id), list.end());
  }
}

void PendingUpdate::add(ItemId id) {
  if (is_added(id)) return;
  if (is_removed(id)) {
    erase_from(removed_, removed_set_, id);
    if (changed_set_.insert(id).second) changed_.push_back(id);
    return;
  }
  erase_from(changed_, changed_set_, id);
  added_set_.insert(id);
  added_.push_back(id);
}

void PendingUpdate::remove(ItemId id) {
  if (is_removed(id)) return;
  if (is_added(id)) {
    erase_from(added_, added_set_, id);
    return;
  }
  erase_from(changed_, changed_set_, id);
  removed_set_.insert(id);
  removed_.push_back(id);
}

void PendingUpdate::change(ItemId id) {
  if (is_added(id) || is_removed(id) || is_changed(id)) return;
  changed_set_.insert(id);
  changed_.push_back(id);
}

void PendingUpdate::merge(const std::vector<ItemId>& added, const std::vector<ItemId>& removed,
                          const std::vector<ItemId>& changed) {
  for (auto id : added) add(id);
  for (auto id : changed) change(id);
  for (auto id : removed) remove(id);
}

void PendingUpdate::clear() {
  added_.clear();
  removed_.clear();
  changed_.clear();
  added_set_.clear();
  removed_set_.clear();
  changed_set_.clear();
}

}  // namespace mdquery
