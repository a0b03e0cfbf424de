#pragma once

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mdquery/async/worker.hpp"

namespace mdquery::async {

/**
 * @class WorkerPool
 * @brief Bounded pool of Worker threads running queued jobs.
 *
 * Threads are created on demand, up to max_threads, when a job is submitted
 * and no worker is idle. The pool owns the workers' lifecycle and joins them
 * on destruction (RAII).
 */
class WorkerPool {
 public:
  using Job = std::function<void()>;

  /**
   * @param max_threads Upper bound on concurrently running jobs.
   * @param name Prefix for log lines.
   * @param verbose Log lifecycle messages to stdout.
   */
  explicit WorkerPool(size_t max_threads, std::string name = "WorkerPool", bool verbose = false);

  /**
   * @brief Destructor. Stops and joins all worker threads.
   */
  ~WorkerPool();

  /**
   * @brief Allows submit() to accept jobs.
   */
  void start();

  /**
   * @brief Signals all workers to stop and drops queued jobs.
   *
   * Running jobs finish; this method does not block on them.
   */
  void stop();

  // Returns false (and drops the job) when the pool is not running.
  bool submit(Job job);

  // Drops queued jobs that have not started. Returns how many were dropped.
  size_t cancel_pending();

  // Blocks until the queue is empty and no job is running.
  void wait_idle();

  size_t pending_count() const;
  size_t thread_count() const;
  size_t max_threads() const { return max_threads_; }
  bool is_running() const { return is_running_.load(); }

  // --- Rule of Five: Make the class non-copyable and non-movable ---
  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;
  WorkerPool(WorkerPool&&) = delete;
  WorkerPool& operator=(WorkerPool&&) = delete;

 private:
  friend class Worker;

  // Called from worker threads.
  std::optional<Job> wait_for_job(const std::atomic<bool>& should_stop);
  void job_finished();
  void wake_all();

  const size_t max_threads_;
  const std::string name_;
  const bool verbose_;

  mutable std::mutex mu_;
  std::condition_variable job_cv_;
  std::condition_variable idle_cv_;
  std::deque<Job> jobs_;
  size_t idle_workers_ = 0;
  size_t active_jobs_ = 0;
  std::vector<std::unique_ptr<Worker>> workers_;
  std::atomic<bool> is_running_{false};
};

}  // namespace mdquery::async
