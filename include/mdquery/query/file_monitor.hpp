#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mdquery/query/metadata_query.hpp"

namespace mdquery {

/**
 * @class FileMonitor
 * @brief Follows one file through renames, moves and deletion.
 *
 * Runs a monitoring MetadataQuery scoped to the file. The handler receives
 * the new path after a rename or move and std::nullopt once the file is
 * gone. Unchanged paths are not reported.
 */
class FileMonitor {
 public:
  using Handler = std::function<void(const std::optional<std::string>& new_path)>;

  struct HistoryEntry {
    TimePoint date;
    std::optional<std::string> path;
  };

  FileMonitor(IQueryBackend& backend, std::string path, Handler handler,
              QueryOptions options = QueryOptions{});
  ~FileMonitor();

  FileMonitor(const FileMonitor&) = delete;
  FileMonitor& operator=(const FileMonitor&) = delete;

  void start();
  void stop();
  bool is_monitoring() const { return query_.is_running(); }

  // Current path; std::nullopt after the file was deleted.
  std::optional<std::string> path() const;

  // Follows a different file. An empty path stops monitoring.
  void set_path(std::optional<std::string> path);

  // Newest first.
  std::vector<HistoryEntry> history() const;

  void set_notification_interval(std::chrono::milliseconds interval);

 private:
  static QueryOptions monitor_options(QueryOptions options);
  void on_results(const std::vector<MetadataItemPtr>& items);

  mutable std::mutex mu_;
  std::optional<std::string> path_;
  std::vector<HistoryEntry> history_;
  Handler handler_;

  MetadataQuery query_;
};

}  // namespace mdquery
