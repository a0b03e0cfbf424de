#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace mdquery::async {

/**
 * @class DeferredExecutor
 * @brief Runs tasks after a delay on one timer thread.
 *
 * Tasks due at the same instant run in scheduling order. cancel_all() drops
 * everything not yet started; a task that is already running completes.
 */
class DeferredExecutor {
 public:
  using Clock = std::chrono::steady_clock;
  using Task = std::function<void()>;

  explicit DeferredExecutor(std::string name = "DeferredExecutor");
  ~DeferredExecutor();

  void schedule_after(std::chrono::milliseconds delay, Task task);

  // Returns how many tasks were dropped.
  size_t cancel_all();

  size_t pending_count() const;

  // Joins the timer thread (safe to call multiple times).
  void stop();

  DeferredExecutor(const DeferredExecutor&) = delete;
  DeferredExecutor& operator=(const DeferredExecutor&) = delete;

 private:
  void run_loop();

  const std::string name_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::multimap<Clock::time_point, Task> tasks_;
  bool running_ = false;
  bool stopped_ = false;
  std::thread thread_;
};

}  // namespace mdquery::async
