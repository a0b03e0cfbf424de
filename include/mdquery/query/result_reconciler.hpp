#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mdquery/async/deferred_executor.hpp"
#include "mdquery/async/worker_pool.hpp"
#include "mdquery/query/metadata_item.hpp"
#include "mdquery/query/pending_update.hpp"
#include "mdquery/query/query_backend.hpp"
#include "mdquery/query/query_options.hpp"

namespace mdquery {

struct ResultsDifference {
  std::vector<MetadataItemPtr> added;
  std::vector<MetadataItemPtr> removed;
  std::vector<MetadataItemPtr> changed;

  bool empty() const { return added.empty() && removed.empty() && changed.empty(); }
};

using ResultsHandler =
    std::function<void(const std::vector<MetadataItemPtr>& items, const ResultsDifference& diff)>;

// Runs a results delivery; defaults to calling it inline.
using CallbackExecutor = std::function<void(std::function<void()>)>;

enum class ReconcilerPhase { Idle, Gathering, Monitoring };

std::string to_string(ReconcilerPhase phase);

struct ReconcilerStats {
  uint64_t publishes = 0;
  uint64_t silent_publishes = 0;
  uint64_t fetch_failures = 0;
  uint64_t stale_publishes_discarded = 0;
  uint64_t prefetches_applied = 0;
  uint64_t prefetches_discarded = 0;
};

// Requested attributes + sort keys + group keys + path, de-duplicated.
std::vector<std::string> resolve_fetch_keys(const std::vector<AttributeId>& attributes,
                                            const std::vector<SortDescriptor>& sort,
                                            const std::vector<AttributeId>& group_by);

/**
 * @class ResultReconciler
 * @brief Owns the authoritative result snapshot of one query.
 *
 * Backend batches are merged into a PendingUpdate; publish() materializes the
 * backend's current item list (the backend owns membership and order),
 * refreshes values for added and changed items, and hands the caller a full
 * snapshot plus the difference to the previous one.
 *
 * Thread safety: every entry point may be called from any thread. State is
 * guarded by one mutex, publishes are serialized, and the results handler is
 * always invoked with no internal lock held. Work scheduled for an earlier
 * generation (restart or stop) is discarded.
 *
 * Entry points never throw; backend failures are logged and absorbed.
 */
class ResultReconciler {
 public:
  ResultReconciler(IQueryBackend& backend, const QueryOptions& options);
  ~ResultReconciler();

  ResultReconciler(const ResultReconciler&) = delete;
  ResultReconciler& operator=(const ResultReconciler&) = delete;

  void set_results_handler(ResultsHandler handler);
  void set_callback_executor(CallbackExecutor executor);
  void set_batching_policy(const BatchingPolicy& policy);
  void set_post_gathering_updates(bool enabled);

  // Clears snapshot and pending state and starts a new generation.
  void on_gathering_started(RequestHandle handle, std::vector<std::string> fetch_keys);

  // `phase` is Gathering for progress batches, Monitoring for live updates.
  void on_batch(const std::vector<ItemId>& added, const std::vector<ItemId>& removed,
                const std::vector<ItemId>& changed, ReconcilerPhase phase);

  void on_gathering_finished(bool monitor);

  // Live updates toggled after gathering finished.
  void set_monitoring(bool monitoring);

  // Materializes the backend's list; invokes the handler when `post` is set.
  void publish(bool post = true);

  // Synchronous read: forces a silent publish, then returns the snapshot.
  std::vector<MetadataItemPtr> snapshot();

  // Current snapshot without contacting the backend.
  std::vector<MetadataItemPtr> current_items() const;

  // Ends the generation; cancels deferred work and queued prefetches.
  // The last snapshot stays readable. No callback is emitted.
  void stop();

  ReconcilerPhase phase() const;
  uint64_t generation() const;
  ReconcilerStats stats() const;

  // Blocks until queued path prefetches have run.
  void wait_for_prefetch();

 private:
  struct Delivery {
    uint64_t generation;
    std::vector<MetadataItemPtr> items;
    ResultsDifference diff;
  };

  struct BatchWindow {
    std::chrono::milliseconds interval;
    size_t threshold;
  };

  BatchWindow current_window_locked() const;
  void flush(uint64_t generation, uint64_t token);
  void finish_recheck(uint64_t generation);
  std::optional<AttributeValues> fetch(RequestHandle handle, const std::vector<std::string>& keys,
                                       ItemId id);
  void schedule_prefetch(uint64_t generation, RequestHandle handle, const std::vector<ItemId>& ids);
  void prefetch_path(uint64_t generation, RequestHandle handle, ItemId id);
  void deliver_pending();

  IQueryBackend& backend_;
  const bool debug_;
  const bool prefetch_enabled_;
  const std::chrono::milliseconds finish_recheck_delay_;

  mutable std::mutex mu_;
  ReconcilerPhase phase_ = ReconcilerPhase::Idle;
  bool active_ = false;
  uint64_t generation_ = 0;
  RequestHandle handle_ = kInvalidRequestHandle;
  std::vector<std::string> fetch_keys_;
  std::vector<MetadataItemPtr> snapshot_;
  std::unordered_map<ItemId, size_t> positions_;
  PendingUpdate pending_;
  BatchingPolicy policy_;
  bool post_gathering_updates_;
  bool has_published_ = false;
  bool gathering_finished_ = false;
  bool flush_armed_ = false;
  uint64_t flush_token_ = 0;
  std::chrono::steady_clock::time_point last_publish_{};
  ResultsHandler handler_;
  CallbackExecutor executor_;
  ReconcilerStats stats_;

  // Serial delivery queue; whoever finds it idle drains it with no lock held.
  std::deque<Delivery> deliveries_;
  bool delivering_ = false;

  // Serializes materialization so snapshots are installed in order.
  std::mutex publish_mu_;

  // Declared last: destroyed (and joined) before the state above.
  async::DeferredExecutor deferred_;
  async::WorkerPool prefetch_pool_;
};

}  // namespace mdquery
