#include "mdquery/query/file_monitor.hpp"

namespace mdquery {

QueryOptions FileMonitor::monitor_options(QueryOptions options) {
  options.monitor_results = true;
  options.batching.monitoring_interval = std::chrono::milliseconds(500);
  return options;
}

FileMonitor::FileMonitor(IQueryBackend& backend, std::string path, Handler handler,
                         QueryOptions options)
    : path_(std::move(path)),
      handler_(std::move(handler)),
      query_(backend, monitor_options(std::move(options))) {
  query_.set_urls({*path_});
  query_.set_attributes({AttributeId::FileName});
  query_.set_results_handler(
      [this](const std::vector<MetadataItemPtr>& items, const ResultsDifference&) {
        on_results(items);
      });
}

FileMonitor::~FileMonitor() {
  query_.set_results_handler(nullptr);
  query_.stop();
}

void FileMonitor::start() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!path_) {
      return;
    }
    if (history_.empty()) {
      history_.push_back(HistoryEntry{Clock::now(), path_});
    }
  }
  query_.start();
}

void FileMonitor::stop() {
  query_.stop();
}

std::optional<std::string> FileMonitor::path() const {
  std::lock_guard<std::mutex> lk(mu_);
  return path_;
}

void FileMonitor::set_path(std::optional<std::string> path) {
  const bool monitoring = query_.is_running();
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (path_ == path) {
      return;
    }
    path_ = path;
    history_.clear();
    if (path && monitoring) {
      history_.push_back(HistoryEntry{Clock::now(), path});
    }
  }

  if (path) {
    query_.set_urls({*path});
  } else {
    query_.stop();
  }
}

std::vector<FileMonitor::HistoryEntry> FileMonitor::history() const {
  std::lock_guard<std::mutex> lk(mu_);
  return history_;
}

void FileMonitor::set_notification_interval(std::chrono::milliseconds interval) {
  BatchingPolicy policy = query_.batching_policy();
  policy.monitoring_interval = interval;
  query_.set_batching_policy(policy);
}

void FileMonitor::on_results(const std::vector<MetadataItemPtr>& items) {
  std::optional<std::string> new_path;
  for (const auto& item : items) {
    if (auto item_path = item->path()) {
      new_path = std::move(item_path);
      break;
    }
  }

  Handler handler;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (new_path == path_) {
      return;
    }
    path_ = new_path;
    history_.insert(history_.begin(), HistoryEntry{Clock::now(), new_path});
    handler = handler_;
  }
  if (handler) {
    handler(new_path);
  }
}

}  // namespace mdquery
