#pragma once

#include <chrono>
#include <fstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "mdquery/query/batching_policy.hpp"

namespace mdquery {

class QueryOptions {
 public:
  BatchingPolicy batching;
  bool monitor_results = false;
  bool post_gathering_updates = false;

  // Background path prefetch for items whose path was not fetched.
  bool prefetch_paths = true;
  int prefetch_concurrency = 80;

  // Delay of the single re-check after gathering finished while per-item
  // fetches are still outstanding.
  int finish_recheck_delay_ms = 100;

  // Log lifecycle and publish events to stdout.
  bool debug = false;

  // Load options from a JSON file at the given path
  static QueryOptions from_file(const std::string& filename) {
    std::ifstream file_stream(filename);
    if (!file_stream.is_open()) {
      throw std::runtime_error("Failed to open config file: " + filename);
    }

    nlohmann::json json_config;
    try {
      file_stream >> json_config;
    } catch (const std::exception& e) {
      throw std::runtime_error(std::string("Failed to parse JSON in config file '") + filename +
                               "': " + e.what());
    }

    return from_json(json_config);
  }

  // Construct options from a JSON object (useful for tests)
  static QueryOptions from_json(const nlohmann::json& json_config) {
    QueryOptions options;

    options.monitor_results = json_config.value("monitor_results", false);
    options.post_gathering_updates = json_config.value("post_gathering_updates", false);
    options.prefetch_paths = json_config.value("prefetch_paths", true);
    options.prefetch_concurrency = json_config.value("prefetch_concurrency", 80);
    options.finish_recheck_delay_ms = json_config.value("finish_recheck_delay_ms", 100);
    options.debug = json_config.value("debug", false);

    if (json_config.contains("batching")) {
      const auto& batching = json_config.at("batching");
      if (!batching.is_object()) {
        throw std::runtime_error("batching must be an object");
      }
      BatchingPolicy& p = options.batching;
      p.initial_delay = std::chrono::milliseconds(
          batching.value("initial_delay_ms", static_cast<long long>(p.initial_delay.count())));
      p.initial_threshold = batching.value("initial_threshold", p.initial_threshold);
      p.gathering_interval = std::chrono::milliseconds(batching.value(
          "gathering_interval_ms", static_cast<long long>(p.gathering_interval.count())));
      p.gathering_threshold = batching.value("gathering_threshold", p.gathering_threshold);
      p.monitoring_interval = std::chrono::milliseconds(batching.value(
          "monitoring_interval_ms", static_cast<long long>(p.monitoring_interval.count())));
      p.monitoring_threshold = batching.value("monitoring_threshold", p.monitoring_threshold);
    }

    options.validate();
    return options;
  }

  void validate() const {
    if (prefetch_concurrency <= 0) {
      throw std::runtime_error("prefetch_concurrency must be greater than 0");
    }
    if (finish_recheck_delay_ms < 0) {
      throw std::runtime_error("finish_recheck_delay_ms cannot be negative");
    }
    if (batching.initial_delay.count() < 0 || batching.gathering_interval.count() < 0 ||
        batching.monitoring_interval.count() < 0) {
      throw std::runtime_error("batching intervals cannot be negative");
    }
    if (batching.initial_threshold == 0 || batching.gathering_threshold == 0 ||
        batching.monitoring_threshold == 0) {
      throw std::runtime_error("batching thresholds must be greater than 0");
    }
  }
};

}  // namespace mdquery
