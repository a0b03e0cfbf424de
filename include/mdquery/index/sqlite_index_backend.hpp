#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <sqlite_modern_cpp.h>

#include "mdquery/index/index_error.hpp"
#include "mdquery/query/query_backend.hpp"

namespace mdquery {

/**
 * @class SqliteIndexBackend
 * @brief IQueryBackend over a SQLite table of item attribute values.
 *
 * Items are stored as (id, path, attributes JSON). Requests evaluate their
 * predicate in process. start() gathers synchronously and emits
 * GatheringStarted, GatheringProgress batches of gathering_threshold items
 * and GatheringFinished on the calling thread. Mutations (upsert, remove,
 * move) are re-evaluated against every request with live updates enabled
 * and reported as ResultsUpdated.
 *
 * Events are always dispatched with the index lock released, in mutation
 * order.
 */
class SqliteIndexBackend : public IQueryBackend {
 public:
  // db_path may be ":memory:".
  explicit SqliteIndexBackend(const std::string& db_path, bool verbose = false);
  ~SqliteIndexBackend() override = default;

  SqliteIndexBackend(const SqliteIndexBackend&) = delete;
  SqliteIndexBackend& operator=(const SqliteIndexBackend&) = delete;

  // --- Index maintenance ---
  // Inserts or replaces the values stored for path. kMDItemFSName is derived
  // from the path when missing.
  ItemId upsert(const std::string& path, AttributeValues values);
  // Returns false when nothing is stored at path.
  bool remove(const std::string& path);
  // Keeps the item id; updates the stored name.
  bool move(const std::string& from, const std::string& to);
  std::optional<ItemId> lookup(const std::string& path) const;
  std::optional<AttributeValues> values(ItemId id) const;
  size_t item_count() const;

  // Directory the Home search scope resolves to. Defaults to $HOME.
  void set_home_directory(std::string path);

  // --- IQueryBackend ---
  RequestHandle submit(const QueryRequest& request, Handler handler) override;
  void start(RequestHandle handle) override;
  void cancel(RequestHandle handle) override;
  std::vector<ItemId> results(RequestHandle handle) override;
  std::size_t result_count(RequestHandle handle) override;
  AttributeValues fetch_values(RequestHandle handle, const std::vector<std::string>& keys,
                               ItemId item) override;
  void enable_live_updates(RequestHandle handle) override;
  void disable_live_updates(RequestHandle handle) override;
  void set_batching(RequestHandle handle, const BatchingPolicy& policy) override;

  size_t active_requests() const;

 private:
  struct Record {
    ItemId id = 0;
    std::string path;
    AttributeValues values;
  };

  struct RequestState {
    QueryRequest request;
    Handler handler;
    BatchingPolicy batching;
    bool started = false;
    bool live = false;
    std::unordered_set<ItemId> pinned;
    std::vector<ItemId> results;
    // Values of the sort keys per result, for re-sorting after mutations.
    std::unordered_map<ItemId, AttributeValues> sort_values;
  };

  using PendingEvents = std::vector<BackendEvent>;

  void setup_schema();
  std::optional<Record> load_locked(ItemId id) const;
  std::vector<Record> load_all_locked() const;
  static Record make_record(int64_t id, const std::string& path, const std::string& attributes);

  bool in_scope_locked(const RequestState& state, const Record& record) const;
  bool matches_locked(const RequestState& state, const Record& record) const;
  void sort_results(RequestState& state) const;
  // Re-evaluates one item against the live requests. `record` is null when
  // the item was removed.
  PendingEvents reevaluate_locked(ItemId id, const Record* record);
  void dispatch(const PendingEvents& events);

  const bool verbose_;
  std::string home_directory_;

  mutable std::mutex mu_;
  mutable sqlite::database db_;
  std::unordered_map<RequestHandle, RequestState> requests_;
  RequestHandle next_handle_ = 1;

  // Held across a mutation and its event dispatch so events keep mutation
  // order. Recursive: a handler may mutate the index.
  std::recursive_mutex dispatch_mu_;
};

// True when path equals directory or lies below it.
bool path_is_within(const std::string& path, const std::string& directory);

// Last path component.
std::string path_basename(const std::string& path);

}  // namespace mdquery
