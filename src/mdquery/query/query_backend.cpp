#include "mdquery/query/query_backend.hpp"

namespace mdquery {

std::string to_string(SearchScope scope) {
  switch (scope) {
    case SearchScope::Home:
      return "home";
    case SearchScope::Local:
      return "local";
    case SearchScope::LocalIndexed:
      return "local_indexed";
    case SearchScope::Network:
      return "network";
    case SearchScope::NetworkIndexed:
      return "network_indexed";
    default:
      return "unknown";
  }
}

std::string to_string(BackendEventKind kind) {
  switch (kind) {
    case BackendEventKind::GatheringStarted:
      return "GatheringStarted";
    case BackendEventKind::GatheringProgress:
      return "GatheringProgress";
    case BackendEventKind::GatheringFinished:
      return "GatheringFinished";
    case BackendEventKind::ResultsUpdated:
      return "ResultsUpdated";
    default:
      return "Unknown";
  }
}

}  // namespace mdquery
