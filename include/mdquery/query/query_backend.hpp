#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "mdquery/predicate/predicate.hpp"
#include "mdquery/query/batching_policy.hpp"
#include "mdquery/query/sort_descriptor.hpp"
#include "mdquery/types/attribute_value.hpp"

namespace mdquery {

using RequestHandle = std::uint64_t;
inline constexpr RequestHandle kInvalidRequestHandle = 0;

// Predefined search scopes; explicit locations and urls narrow further.
enum class SearchScope {
  Home,            // the user's home directory
  Local,           // every local volume
  LocalIndexed,    // indexed local volumes only
  Network,         // mounted network volumes
  NetworkIndexed,  // indexed network volumes only
};

std::string to_string(SearchScope scope);

struct QueryRequest {
  // Compiled query string.
  std::string query;
  // Source tree, for backends that evaluate in process.
  Predicate predicate;
  std::vector<std::string> search_locations;
  std::vector<SearchScope> search_scopes;
  // When non-empty, only these items are considered.
  std::vector<std::string> urls;
  std::vector<SortDescriptor> sort;
  std::vector<AttributeId> group_by;
  // Backend keys that will be fetched for every result.
  std::vector<std::string> fetch_keys;
};

enum class BackendEventKind { GatheringStarted, GatheringProgress, GatheringFinished, ResultsUpdated };

std::string to_string(BackendEventKind kind);

struct BackendEvent {
  BackendEventKind kind = BackendEventKind::GatheringStarted;
  RequestHandle handle = kInvalidRequestHandle;
  std::vector<ItemId> added;
  std::vector<ItemId> removed;
  std::vector<ItemId> changed;
};

/**
 * @class IQueryBackend
 * @brief The search service a MetadataQuery runs against.
 *
 * A request is submitted first and started separately so the caller can
 * record the handle before any event arrives. Events for one request are
 * delivered in order, possibly from a backend thread; the handler must not
 * be called while the backend holds a lock the handler could need.
 */
class IQueryBackend {
 public:
  using Handler = std::function<void(const BackendEvent&)>;

  virtual ~IQueryBackend() = default;

  virtual RequestHandle submit(const QueryRequest& request, Handler handler) = 0;
  virtual void start(RequestHandle handle) = 0;
  // Drops the request; no events are delivered afterwards.
  virtual void cancel(RequestHandle handle) = 0;

  // Current result ids in backend (sorted) order.
  virtual std::vector<ItemId> results(RequestHandle handle) = 0;
  virtual std::size_t result_count(RequestHandle handle) = 0;

  // Values for the requested keys; empty for unknown items.
  virtual AttributeValues fetch_values(RequestHandle handle, const std::vector<std::string>& keys,
                                       ItemId item) = 0;

  virtual void enable_live_updates(RequestHandle handle) = 0;
  virtual void disable_live_updates(RequestHandle handle) = 0;

  virtual void set_batching(RequestHandle handle, const BatchingPolicy& policy) = 0;
};

}  // namespace mdquery
