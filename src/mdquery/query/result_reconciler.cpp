#include "mdquery/query/result_reconciler.hpp"

#include <algorithm>
#include <iostream>
#include <unordered_set>

namespace mdquery {

std::string to_string(ReconcilerPhase phase) {
  switch (phase) {
    case ReconcilerPhase::Idle:
      return "idle";
    case ReconcilerPhase::Gathering:
      return "gathering";
    case ReconcilerPhase::Monitoring:
      return "monitoring";
  }
  return "unknown";
}

std::vector<std::string> resolve_fetch_keys(const std::vector<AttributeId>& attributes,
                                            const std::vector<SortDescriptor>& sort,
                                            const std::vector<AttributeId>& group_by) {
  const auto& catalog = AttributeCatalog::get_instance();
  std::vector<std::string> result;
  std::unordered_set<std::string> seen;
  auto push = [&](const std::string& key) {
    if (key == keys::kAnyText) {
      return;
    }
    if (seen.insert(key).second) {
      result.push_back(key);
    }
  };

  for (AttributeId attribute : attributes) {
    for (const auto& key : catalog.resolve(attribute)) push(key);
  }
  for (const auto& descriptor : sort) {
    push(descriptor.backend_key());
  }
  for (AttributeId attribute : group_by) {
    for (const auto& key : catalog.resolve(attribute)) push(key);
  }
  push(keys::kPath);
  return result;
}

ResultReconciler::ResultReconciler(IQueryBackend& backend, const QueryOptions& options)
    : backend_(backend),
      debug_(options.debug),
      prefetch_enabled_(options.prefetch_paths),
      finish_recheck_delay_(options.finish_recheck_delay_ms),
      policy_(options.batching),
      post_gathering_updates_(options.post_gathering_updates),
      deferred_("Reconciler"),
      prefetch_pool_(static_cast<size_t>(options.prefetch_concurrency), "PathPrefetch",
                     options.debug) {
  if (prefetch_enabled_) {
    prefetch_pool_.start();
  }
}

ResultReconciler::~ResultReconciler() {
  stop();
  deferred_.stop();
  prefetch_pool_.stop();
}

void ResultReconciler::set_results_handler(ResultsHandler handler) {
  std::lock_guard<std::mutex> lk(mu_);
  handler_ = std::move(handler);
}

void ResultReconciler::set_callback_executor(CallbackExecutor executor) {
  std::lock_guard<std::mutex> lk(mu_);
  executor_ = std::move(executor);
}

void ResultReconciler::set_batching_policy(const BatchingPolicy& policy) {
  std::lock_guard<std::mutex> lk(mu_);
  policy_ = policy;
}

void ResultReconciler::set_post_gathering_updates(bool enabled) {
  std::lock_guard<std::mutex> lk(mu_);
  post_gathering_updates_ = enabled;
}

void ResultReconciler::on_gathering_started(RequestHandle handle,
                                            std::vector<std::string> fetch_keys) {
  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    generation = ++generation_;
    active_ = true;
    handle_ = handle;
    fetch_keys_ = std::move(fetch_keys);
    snapshot_.clear();
    positions_.clear();
    pending_.clear();
    deliveries_.clear();
    has_published_ = false;
    gathering_finished_ = false;
    flush_armed_ = false;
    phase_ = ReconcilerPhase::Gathering;
    last_publish_ = std::chrono::steady_clock::now();
  }
  deferred_.cancel_all();
  prefetch_pool_.cancel_pending();

  if (debug_) {
    std::cout << "[Reconciler] gathering started, generation " << generation << ", request "
              << handle << std::endl;
  }
}

ResultReconciler::BatchWindow ResultReconciler::current_window_locked() const {
  if (!has_published_) {
    return {policy_.initial_delay, policy_.initial_threshold};
  }
  if (!gathering_finished_) {
    return {policy_.gathering_interval, policy_.gathering_threshold};
  }
  return {policy_.monitoring_interval, policy_.monitoring_threshold};
}

void ResultReconciler::on_batch(const std::vector<ItemId>& added,
                                const std::vector<ItemId>& removed,
                                const std::vector<ItemId>& changed, ReconcilerPhase phase) {
  bool publish_now = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!active_) {
      return;
    }
    pending_.merge(added, removed, changed);

    if (debug_) {
      std::cout << "[Reconciler] batch (" << to_string(phase) << "): +" << added.size() << " -"
                << removed.size() << " ~" << changed.size() << ", pending " << pending_.size()
                << std::endl;
    }

    if (phase == ReconcilerPhase::Gathering && !gathering_finished_ && !post_gathering_updates_) {
      return;
    }
    if (pending_.empty()) {
      return;
    }

    const BatchWindow window = current_window_locked();
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - last_publish_);
    if (pending_.size() >= window.threshold || elapsed >= window.interval) {
      publish_now = true;
    } else if (!flush_armed_) {
      flush_armed_ = true;
      const uint64_t generation = generation_;
      const uint64_t token = ++flush_token_;
      deferred_.schedule_after(window.interval - elapsed,
                               [this, generation, token] { flush(generation, token); });
    }
  }

  if (publish_now) {
    publish(true);
  }
}

void ResultReconciler::flush(uint64_t generation, uint64_t token) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!active_ || generation != generation_ || !flush_armed_ || token != flush_token_) {
      return;
    }
  }
  publish(true);
}

void ResultReconciler::on_gathering_finished(bool monitor) {
  bool publish_now = false;
  RequestHandle handle = kInvalidRequestHandle;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!active_) {
      return;
    }
    gathering_finished_ = true;
    phase_ = monitor ? ReconcilerPhase::Monitoring : ReconcilerPhase::Idle;
    publish_now = !pending_.empty() || !has_published_;
    handle = handle_;
  }

  if (!publish_now) {
    size_t backend_count = 0;
    try {
      backend_count = backend_.result_count(handle);
    } catch (const std::exception& e) {
      std::cerr << "[Reconciler] ERROR reading result count: " << e.what() << std::endl;
    }

    std::lock_guard<std::mutex> lk(mu_);
    if (!active_ || handle != handle_) {
      return;
    }
    if (backend_count == snapshot_.size()) {
      publish_now = true;
    } else {
      // Values for some items are not materialized yet; look once more later.
      const uint64_t generation = generation_;
      deferred_.schedule_after(finish_recheck_delay_,
                               [this, generation] { finish_recheck(generation); });
      if (debug_) {
        std::cout << "[Reconciler] gathering finished with " << backend_count
                  << " backend results, " << snapshot_.size() << " materialized; re-check in "
                  << finish_recheck_delay_.count() << "ms" << std::endl;
      }
    }
  }

  if (publish_now) {
    publish(true);
  }
}

void ResultReconciler::finish_recheck(uint64_t generation) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!active_ || generation != generation_) {
      return;
    }
  }
  publish(true);
}

void ResultReconciler::set_monitoring(bool monitoring) {
  std::lock_guard<std::mutex> lk(mu_);
  if (active_ && gathering_finished_) {
    phase_ = monitoring ? ReconcilerPhase::Monitoring : ReconcilerPhase::Idle;
  }
}

std::optional<AttributeValues> ResultReconciler::fetch(RequestHandle handle,
                                                       const std::vector<std::string>& keys,
                                                       ItemId id) {
  try {
    return backend_.fetch_values(handle, keys, id);
  } catch (const std::exception& e) {
    std::cerr << "[Reconciler] ERROR fetching values for item " << id << ": " << e.what()
              << std::endl;
    std::lock_guard<std::mutex> lk(mu_);
    ++stats_.fetch_failures;
    return std::nullopt;
  }
}

void ResultReconciler::publish(bool post) {
  std::unique_lock<std::mutex> publish_lock(publish_mu_);

  PendingUpdate pending;
  std::vector<MetadataItemPtr> previous;
  std::unordered_map<ItemId, size_t> previous_positions;
  std::vector<std::string> fetch_keys;
  RequestHandle handle = kInvalidRequestHandle;
  uint64_t generation = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!active_) {
      return;
    }
    pending = std::move(pending_);
    pending_.clear();
    flush_armed_ = false;
    previous = snapshot_;
    previous_positions = positions_;
    fetch_keys = fetch_keys_;
    handle = handle_;
    generation = generation_;
  }

  std::vector<ItemId> ids;
  try {
    ids = backend_.results(handle);
  } catch (const std::exception& e) {
    std::cerr << "[Reconciler] ERROR reading results: " << e.what() << std::endl;
    ids.reserve(previous.size());
    for (const auto& item : previous) {
      ids.push_back(item->id());
    }
  }

  std::vector<MetadataItemPtr> items;
  std::unordered_map<ItemId, size_t> positions;
  std::vector<ItemId> missing_paths;
  ResultsDifference diff;
  items.reserve(ids.size());

  for (ItemId id : ids) {
    if (positions.count(id) > 0) {
      continue;
    }

    MetadataItemPtr item;
    bool refreshed = false;
    auto previous_it = previous_positions.find(id);
    if (previous_it == previous_positions.end()) {
      // Initial fetch: nothing to diff against.
      auto values = fetch(handle, fetch_keys, id);
      item = std::make_shared<MetadataItem>(id, values ? std::move(*values) : AttributeValues{});
      diff.added.push_back(item);
      refreshed = true;
    } else {
      const MetadataItemPtr& old_item = previous[previous_it->second];
      item = old_item;
      if (pending.is_changed(id) || pending.is_added(id)) {
        auto values = fetch(handle, fetch_keys, id);
        if (values) {
          item = std::make_shared<MetadataItem>(id, std::move(*values), old_item->values());
          diff.changed.push_back(item);
          refreshed = true;
        }
      }
    }

    if (refreshed && !item->path()) {
      missing_paths.push_back(id);
    }
    positions.emplace(id, items.size());
    items.push_back(std::move(item));
  }

  for (const auto& old_item : previous) {
    if (positions.count(old_item->id()) == 0) {
      diff.removed.push_back(old_item);
    }
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    if (generation != generation_) {
      ++stats_.stale_publishes_discarded;
      return;
    }
    snapshot_ = items;
    positions_ = std::move(positions);
    has_published_ = true;
    last_publish_ = std::chrono::steady_clock::now();
    if (post) {
      ++stats_.publishes;
      deliveries_.push_back(Delivery{generation, std::move(items), std::move(diff)});
    } else {
      ++stats_.silent_publishes;
    }
  }

  if (debug_) {
    std::cout << "[Reconciler] " << (post ? "published " : "materialized ") << ids.size()
              << " results" << std::endl;
  }

  schedule_prefetch(generation, handle, missing_paths);
  publish_lock.unlock();
  deliver_pending();
}

void ResultReconciler::deliver_pending() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (delivering_) {
      return;
    }
    delivering_ = true;
  }

  while (true) {
    Delivery delivery;
    ResultsHandler handler;
    CallbackExecutor executor;
    {
      std::lock_guard<std::mutex> lk(mu_);
      if (deliveries_.empty()) {
        delivering_ = false;
        return;
      }
      delivery = std::move(deliveries_.front());
      deliveries_.pop_front();
      if (delivery.generation != generation_ || !handler_) {
        continue;
      }
      handler = handler_;
      executor = executor_;
    }

    try {
      if (executor) {
        auto items = std::make_shared<std::vector<MetadataItemPtr>>(std::move(delivery.items));
        auto diff = std::make_shared<ResultsDifference>(std::move(delivery.diff));
        executor([handler, items, diff] { handler(*items, *diff); });
      } else {
        handler(delivery.items, delivery.diff);
      }
    } catch (const std::exception& e) {
      std::cerr << "[Reconciler] ERROR in results handler: " << e.what() << std::endl;
    }
  }
}

void ResultReconciler::schedule_prefetch(uint64_t generation, RequestHandle handle,
                                         const std::vector<ItemId>& ids) {
  if (!prefetch_enabled_) {
    return;
  }
  for (ItemId id : ids) {
    if (!prefetch_pool_.submit([this, generation, handle, id] {
          prefetch_path(generation, handle, id);
        })) {
      return;
    }
  }
}

void ResultReconciler::prefetch_path(uint64_t generation, RequestHandle handle, ItemId id) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (generation != generation_ || positions_.count(id) == 0) {
      ++stats_.prefetches_discarded;
      return;
    }
  }

  auto values = fetch(handle, {keys::kPath}, id);
  if (!values) {
    std::lock_guard<std::mutex> lk(mu_);
    ++stats_.prefetches_discarded;
    return;
  }
  auto it = values->find(keys::kPath);
  if (it == values->end() || !std::holds_alternative<std::string>(it->second)) {
    std::lock_guard<std::mutex> lk(mu_);
    ++stats_.prefetches_discarded;
    return;
  }

  std::lock_guard<std::mutex> lk(mu_);
  auto position = positions_.find(id);
  if (generation != generation_ || position == positions_.end()) {
    ++stats_.prefetches_discarded;
    return;
  }
  MetadataItemPtr& current = snapshot_[position->second];
  if (current->path()) {
    ++stats_.prefetches_discarded;
    return;
  }
  current = current->with_path(std::get<std::string>(it->second));
  ++stats_.prefetches_applied;
}

std::vector<MetadataItemPtr> ResultReconciler::snapshot() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!active_ || pending_.empty()) {
      return snapshot_;
    }
  }
  publish(false);
  return current_items();
}

std::vector<MetadataItemPtr> ResultReconciler::current_items() const {
  std::lock_guard<std::mutex> lk(mu_);
  return snapshot_;
}

void ResultReconciler::stop() {
  bool was_active = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    was_active = active_;
    ++generation_;
    active_ = false;
    phase_ = ReconcilerPhase::Idle;
    pending_.clear();
    deliveries_.clear();
    flush_armed_ = false;
  }
  const size_t dropped_tasks = deferred_.cancel_all();
  const size_t dropped_prefetches = prefetch_pool_.cancel_pending();

  if (debug_ && was_active) {
    std::cout << "[Reconciler] stopped; dropped " << dropped_tasks << " deferred tasks and "
              << dropped_prefetches << " prefetches" << std::endl;
  }
}

ReconcilerPhase ResultReconciler::phase() const {
  std::lock_guard<std::mutex> lk(mu_);
  return phase_;
}

uint64_t ResultReconciler::generation() const {
  std::lock_guard<std::mutex> lk(mu_);
  return generation_;
}

ReconcilerStats ResultReconciler::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stats_;
}

void ResultReconciler::wait_for_prefetch() {
  prefetch_pool_.wait_idle();
}

}  // namespace mdquery
