#pragma once

#include <cstddef>
#include <unordered_set>
#include <vector>

#include "mdquery/types/attribute_value.hpp"

namespace mdquery {

/**
 * @class PendingUpdate
 * @brief Added / removed / changed ids collected between two publishes.
 *
 * Collapse rules within one window:
 *  - added then removed   -> absent
 *  - added then changed   -> added
 *  - removed then added   -> changed
 *  - changed then added   -> added
 *  - changed then removed -> removed
 *  - changed after removed is ignored
 * Each id appears in at most one list; lists keep first-seen order.
 */
class PendingUpdate {
 public:
  void add(ItemId id);
  void remove(ItemId id);
  void change(ItemId id);

  // Applies one backend batch: added, then changed, then removed.
  void merge(const std::vector<ItemId>& added, const std::vector<ItemId>& removed,
             const std::vector<ItemId>& changed);

  const std::vector<ItemId>& added() const { return added_; }
  const std::vector<ItemId>& removed() const { return removed_; }
  const std::vector<ItemId>& changed() const { return changed_; }

  bool is_added(ItemId id) const { return added_set_.count(id) > 0; }
  bool is_removed(ItemId id) const { return removed_set_.count(id) > 0; }
  bool is_changed(ItemId id) const { return changed_set_.count(id) > 0; }

  bool empty() const { return added_.empty() && removed_.empty() && changed_.empty(); }
  size_t size() const { return added_.size() + removed_.size() + changed_.size(); }
  void clear();

 private:
  static void erase_from(std::vector<ItemId>& list, std::unordered_set<ItemId>& set, ItemId id);

  std::vector<ItemId> added_;
  std::vector<ItemId> removed_;
  std::vector<ItemId> changed_;
  std::unordered_set<ItemId> added_set_;
  std::unordered_set<ItemId> removed_set_;
  std::unordered_set<ItemId> changed_set_;
};

}  // namespace mdquery
