#pragma once

#include <chrono>
#include <cstddef>

namespace mdquery {

// How long / how many pending changes accumulate before a publish is forced,
// per lifecycle phase. Advisory: a publish can come later than an interval,
// or earlier when a threshold is reached.
struct BatchingPolicy {
  // Before the first publish of a query run.
  std::chrono::milliseconds initial_delay{80};
  std::size_t initial_threshold = 20;

  // Rest of the gathering phase.
  std::chrono::milliseconds gathering_interval{1000};
  std::size_t gathering_threshold = 50000;

  // Live updates after gathering finished.
  std::chrono::milliseconds monitoring_interval{1000};
  std::size_t monitoring_threshold = 50000;

  bool operator==(const BatchingPolicy& other) const {
    return initial_delay == other.initial_delay && initial_threshold == other.initial_threshold &&
           gathering_interval == other.gathering_interval &&
           gathering_threshold == other.gathering_threshold &&
           monitoring_interval == other.monitoring_interval &&
           monitoring_threshold == other.monitoring_threshold;
  }
  bool operator!=(const BatchingPolicy& other) const { return !(*this == other); }
};

}  // namespace mdquery
