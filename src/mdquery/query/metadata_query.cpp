#include "mdquery/query/metadata_query.hpp"

#include <iostream>

namespace mdquery {

std::string to_string(QueryState state) {
  switch (state) {
    case QueryState::Stopped:
      return "stopped";
    case QueryState::Gathering:
      return "gathering";
    case QueryState::Monitoring:
      return "monitoring";
  }
  return "unknown";
}

MetadataQuery::MetadataQuery(IQueryBackend& backend, QueryOptions options)
    : backend_(backend),
      options_(std::move(options)),
      compiled_(compile_predicate(Predicate{})),
      monitor_results_(options_.monitor_results),
      batching_(options_.batching),
      reconciler_(backend, options_) {}

MetadataQuery::~MetadataQuery() {
  stop();
}

// ----------------------------------------------------------------------------
// Request configuration
// ----------------------------------------------------------------------------

void MetadataQuery::set_search_locations(std::vector<std::string> locations) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    search_locations_ = std::move(locations);
  }
  restart_if_running();
}

void MetadataQuery::set_search_scopes(std::vector<SearchScope> scopes) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    search_scopes_ = std::move(scopes);
  }
  restart_if_running();
}

void MetadataQuery::set_urls(std::vector<std::string> urls) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    urls_ = std::move(urls);
  }
  restart_if_running();
}

void MetadataQuery::set_attributes(std::vector<AttributeId> attributes) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    attributes_ = std::move(attributes);
  }
  restart_if_running();
}

void MetadataQuery::set_predicate(Predicate predicate) {
  CompiledPredicate compiled = compile_predicate(predicate);
  {
    std::lock_guard<std::mutex> lk(mu_);
    predicate_ = std::move(predicate);
    compiled_ = std::move(compiled);
  }
  if (options_.debug) {
    std::cout << "[MetadataQuery] predicate: " << predicate_format() << std::endl;
  }
  restart_if_running();
}

void MetadataQuery::set_predicate(const PredicateBuilder& builder) {
  if (!builder) {
    set_predicate(Predicate{});
    return;
  }
  set_predicate(builder(PredicateRoot{}));
}

void MetadataQuery::set_sort(std::vector<SortDescriptor> sort) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    sort_ = std::move(sort);
  }
  restart_if_running();
}

void MetadataQuery::set_grouping(std::vector<AttributeId> attributes) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    grouping_ = make_group_keys(attributes);
  }
  restart_if_running();
}

// ----------------------------------------------------------------------------
// Delivery configuration
// ----------------------------------------------------------------------------

void MetadataQuery::set_monitor_results(bool monitor) {
  RequestHandle handle = kInvalidRequestHandle;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (monitor_results_ == monitor) {
      return;
    }
    monitor_results_ = monitor;
    if (handle_ == kInvalidRequestHandle || !gathering_finished_) {
      // Applied when gathering finishes.
      return;
    }
    handle = handle_;
    state_ = monitor ? QueryState::Monitoring : QueryState::Stopped;
  }

  try {
    if (monitor) {
      backend_.enable_live_updates(handle);
    } else {
      backend_.disable_live_updates(handle);
    }
  } catch (const std::exception& e) {
    std::cerr << "[MetadataQuery] ERROR toggling live updates: " << e.what() << std::endl;
  }
  reconciler_.set_monitoring(monitor);
}

void MetadataQuery::set_post_gathering_updates(bool enabled) {
  reconciler_.set_post_gathering_updates(enabled);
}

void MetadataQuery::set_batching_policy(const BatchingPolicy& policy) {
  RequestHandle handle = kInvalidRequestHandle;
  {
    std::lock_guard<std::mutex> lk(mu_);
    batching_ = policy;
    handle = handle_;
  }
  reconciler_.set_batching_policy(policy);
  if (handle != kInvalidRequestHandle) {
    try {
      backend_.set_batching(handle, policy);
    } catch (const std::exception& e) {
      std::cerr << "[MetadataQuery] ERROR applying batching policy: " << e.what() << std::endl;
    }
  }
}

void MetadataQuery::set_results_handler(ResultsHandler handler) {
  reconciler_.set_results_handler(std::move(handler));
}

void MetadataQuery::set_callback_executor(CallbackExecutor executor) {
  reconciler_.set_callback_executor(std::move(executor));
}

// ----------------------------------------------------------------------------
// Lifecycle
// ----------------------------------------------------------------------------

QueryRequest MetadataQuery::build_request_locked() const {
  QueryRequest request;
  request.query = compiled_.query;
  request.predicate = predicate_;
  request.search_locations = search_locations_;
  request.search_scopes = search_scopes_;
  request.urls = urls_;
  request.sort = sort_;
  request.group_by = grouping_;
  request.fetch_keys = resolve_fetch_keys(attributes_, sort_, grouping_);
  return request;
}

void MetadataQuery::start() {
  QueryRequest request;
  BatchingPolicy batching;
  uint64_t generation = 0;
  RequestHandle finished_handle = kInvalidRequestHandle;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (state_ != QueryState::Stopped) {
      return;
    }
    generation = ++generation_;
    request = build_request_locked();
    batching = batching_;
    state_ = QueryState::Gathering;
    finished_handle = handle_;
    handle_ = kInvalidRequestHandle;
    gathering_finished_ = false;
  }

  // A query that finished without monitoring still holds its request.
  if (finished_handle != kInvalidRequestHandle) {
    reconciler_.stop();
    backend_.cancel(finished_handle);
  }

  if (options_.debug) {
    std::cout << "[MetadataQuery] starting: " << request.query << std::endl;
  }

  RequestHandle handle = kInvalidRequestHandle;
  try {
    handle = backend_.submit(request, [this, generation](const BackendEvent& event) {
      handle_event(generation, event);
    });
  } catch (const std::exception& e) {
    std::cerr << "[MetadataQuery] ERROR submitting query: " << e.what() << std::endl;
    std::lock_guard<std::mutex> lk(mu_);
    if (generation == generation_) {
      state_ = QueryState::Stopped;
    }
    throw;
  }

  bool superseded = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    superseded = generation != generation_;
    if (!superseded) {
      handle_ = handle;
    }
  }
  if (superseded) {
    // Stopped or restarted while submitting.
    backend_.cancel(handle);
    return;
  }

  try {
    backend_.set_batching(handle, batching);
    reconciler_.on_gathering_started(handle, request.fetch_keys);
    backend_.start(handle);
  } catch (const std::exception& e) {
    std::cerr << "[MetadataQuery] ERROR starting query: " << e.what() << std::endl;
    bool current = false;
    {
      std::lock_guard<std::mutex> lk(mu_);
      current = generation == generation_;
      if (current) {
        state_ = QueryState::Stopped;
        handle_ = kInvalidRequestHandle;
        gathering_finished_ = false;
      }
    }
    if (current) {
      reconciler_.stop();
      backend_.cancel(handle);
    }
    throw;
  }
}

void MetadataQuery::stop() {
  RequestHandle handle = kInvalidRequestHandle;
  bool was_running = false;
  {
    std::lock_guard<std::mutex> lk(mu_);
    was_running = state_ != QueryState::Stopped;
    ++generation_;
    handle = handle_;
    handle_ = kInvalidRequestHandle;
    state_ = QueryState::Stopped;
    gathering_finished_ = false;
  }

  reconciler_.stop();
  if (handle != kInvalidRequestHandle) {
    try {
      backend_.cancel(handle);
    } catch (const std::exception& e) {
      std::cerr << "[MetadataQuery] ERROR cancelling request " << handle << ": " << e.what()
                << std::endl;
    }
  }

  if (options_.debug && was_running) {
    std::cout << "[MetadataQuery] stopped" << std::endl;
  }
}

void MetadataQuery::restart_if_running() {
  if (!is_running()) {
    return;
  }
  if (options_.debug) {
    std::cout << "[MetadataQuery] configuration changed, restarting" << std::endl;
  }
  stop();
  start();
}

void MetadataQuery::handle_event(uint64_t generation, const BackendEvent& event) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (generation != generation_ || event.handle != handle_) {
      return;
    }
  }

  switch (event.kind) {
    case BackendEventKind::GatheringStarted:
      if (options_.debug) {
        std::cout << "[MetadataQuery] gathering started" << std::endl;
      }
      break;

    case BackendEventKind::GatheringProgress:
      reconciler_.on_batch(event.added, event.removed, event.changed, ReconcilerPhase::Gathering);
      break;

    case BackendEventKind::GatheringFinished: {
      if (!event.added.empty() || !event.removed.empty() || !event.changed.empty()) {
        reconciler_.on_batch(event.added, event.removed, event.changed,
                             ReconcilerPhase::Gathering);
      }
      bool monitor = false;
      RequestHandle handle = kInvalidRequestHandle;
      {
        std::lock_guard<std::mutex> lk(mu_);
        if (generation != generation_) {
          return;
        }
        monitor = monitor_results_;
        gathering_finished_ = true;
        state_ = monitor ? QueryState::Monitoring : QueryState::Stopped;
        handle = handle_;
      }
      if (monitor) {
        try {
          backend_.enable_live_updates(handle);
        } catch (const std::exception& e) {
          std::cerr << "[MetadataQuery] ERROR enabling live updates: " << e.what() << std::endl;
        }
      }
      if (options_.debug) {
        std::cout << "[MetadataQuery] gathering finished, " << (monitor ? "monitoring" : "done")
                  << std::endl;
      }
      reconciler_.on_gathering_finished(monitor);
      break;
    }

    case BackendEventKind::ResultsUpdated:
      reconciler_.on_batch(event.added, event.removed, event.changed, ReconcilerPhase::Monitoring);
      break;
  }
}

// ----------------------------------------------------------------------------
// Results
// ----------------------------------------------------------------------------

QueryState MetadataQuery::state() const {
  std::lock_guard<std::mutex> lk(mu_);
  return state_;
}

std::vector<MetadataItemPtr> MetadataQuery::results() {
  return reconciler_.snapshot();
}

HierarchicalResults MetadataQuery::hierarchical_results() {
  return build_hierarchy(results());
}

std::vector<ResultGroup> MetadataQuery::grouped_results() {
  std::vector<AttributeId> grouping;
  {
    std::lock_guard<std::mutex> lk(mu_);
    grouping = grouping_;
  }
  return build_groups(results(), grouping);
}

std::string MetadataQuery::predicate_format() const {
  std::lock_guard<std::mutex> lk(mu_);
  return compiled_.query;
}

std::vector<AttributeId> MetadataQuery::attributes() const {
  std::lock_guard<std::mutex> lk(mu_);
  return attributes_;
}

std::vector<SortDescriptor> MetadataQuery::sort() const {
  std::lock_guard<std::mutex> lk(mu_);
  return sort_;
}

std::vector<AttributeId> MetadataQuery::grouping() const {
  std::lock_guard<std::mutex> lk(mu_);
  return grouping_;
}

bool MetadataQuery::monitor_results() const {
  std::lock_guard<std::mutex> lk(mu_);
  return monitor_results_;
}

BatchingPolicy MetadataQuery::batching_policy() const {
  std::lock_guard<std::mutex> lk(mu_);
  return batching_;
}

}  // namespace mdquery
