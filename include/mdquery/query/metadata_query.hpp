#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "mdquery/predicate/fields.hpp"
#include "mdquery/predicate/predicate_compiler.hpp"
#include "mdquery/projection/hierarchical_results.hpp"
#include "mdquery/projection/result_group.hpp"
#include "mdquery/query/query_backend.hpp"
#include "mdquery/query/query_options.hpp"
#include "mdquery/query/result_reconciler.hpp"

namespace mdquery {

enum class QueryState { Stopped, Gathering, Monitoring };

std::string to_string(QueryState state);

/**
 * @class MetadataQuery
 * @brief Searches items by predicate, fetches their attributes and follows
 * result changes.
 *
 * Usage:
 *   MetadataQuery query(backend);
 *   query.set_predicate([](const PredicateRoot& item) {
 *     return item.file_extension().equals_any({"mp4", "mov"});
 *   });
 *   query.set_attributes({AttributeId::Duration, AttributeId::FileSize});
 *   query.set_results_handler([](const auto& items, const auto& diff) { ... });
 *   query.start();
 *
 * Setters that change the backend request restart a running query: the old
 * request is cancelled, its results are dropped and a new request is issued.
 * Events from a superseded request are ignored.
 *
 * The query must outlive its backend request; do not destroy it from inside
 * the results handler.
 */
class MetadataQuery {
 public:
  using PredicateBuilder = std::function<Predicate(const PredicateRoot&)>;

  explicit MetadataQuery(IQueryBackend& backend, QueryOptions options = QueryOptions{});
  ~MetadataQuery();

  MetadataQuery(const MetadataQuery&) = delete;
  MetadataQuery& operator=(const MetadataQuery&) = delete;

  // --- Request configuration (restarts a running query) ---
  void set_search_locations(std::vector<std::string> locations);
  void set_search_scopes(std::vector<SearchScope> scopes);
  void set_urls(std::vector<std::string> urls);
  void set_attributes(std::vector<AttributeId> attributes);
  // Compiled immediately; PredicateError propagates and leaves the query unchanged.
  void set_predicate(Predicate predicate);
  void set_predicate(const PredicateBuilder& builder);
  // QueryConfigError is raised when the descriptors are built.
  void set_sort(std::vector<SortDescriptor> sort);
  void set_grouping(std::vector<AttributeId> attributes);

  // --- Delivery configuration (applies without restart) ---
  void set_monitor_results(bool monitor);
  void set_post_gathering_updates(bool enabled);
  void set_batching_policy(const BatchingPolicy& policy);
  void set_results_handler(ResultsHandler handler);
  void set_callback_executor(CallbackExecutor executor);

  // No-op while running.
  void start();
  // Cancels the request and pending work. No final callback is delivered.
  void stop();

  QueryState state() const;
  bool is_running() const { return state() != QueryState::Stopped; }

  // Snapshot read. Applies pending changes first (without a callback).
  std::vector<MetadataItemPtr> results();
  HierarchicalResults hierarchical_results();
  std::vector<ResultGroup> grouped_results();

  std::string predicate_format() const;
  std::vector<AttributeId> attributes() const;
  std::vector<SortDescriptor> sort() const;
  std::vector<AttributeId> grouping() const;
  bool monitor_results() const;
  BatchingPolicy batching_policy() const;

  const ResultReconciler& reconciler() const { return reconciler_; }

 private:
  QueryRequest build_request_locked() const;
  void restart_if_running();
  void handle_event(uint64_t generation, const BackendEvent& event);

  IQueryBackend& backend_;
  const QueryOptions options_;

  mutable std::mutex mu_;
  std::vector<std::string> search_locations_;
  std::vector<SearchScope> search_scopes_;
  std::vector<std::string> urls_;
  std::vector<AttributeId> attributes_;
  Predicate predicate_;
  CompiledPredicate compiled_;
  std::vector<SortDescriptor> sort_;
  std::vector<AttributeId> grouping_;
  bool monitor_results_;
  BatchingPolicy batching_;

  QueryState state_ = QueryState::Stopped;
  RequestHandle handle_ = kInvalidRequestHandle;
  bool gathering_finished_ = false;
  uint64_t generation_ = 0;

  ResultReconciler reconciler_;
};

}  // namespace mdquery
