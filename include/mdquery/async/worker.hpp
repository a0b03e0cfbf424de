#pragma once

#include <atomic>
#include <thread>

namespace mdquery {
namespace async {

class WorkerPool;

/**
 * @class Worker
 * @brief A single background thread that runs jobs from its WorkerPool.
 *
 * This class is managed by a WorkerPool. It is non-copyable and non-movable
 * to ensure clear ownership of the underlying thread.
 */
class Worker {
 public:
  /**
   * @brief Constructs a Worker instance.
   * @param worker_id A unique identifier for this worker, used for logging.
   * @param pool The pool the worker takes its jobs from.
   */
  Worker(int worker_id, WorkerPool& pool);

  /**
   * @brief Destructor. Ensures the worker thread is stopped and joined cleanly.
   */
  ~Worker();

  /**
   * @brief Starts the worker's processing loop in a new background thread.
   *
   * Throws if the worker is already running.
   */
  void start();

  /**
   * @brief Signals the worker to stop after its current job.
   *
   * Does NOT block; the destructor joins the thread.
   */
  void stop();

  Worker(const Worker&) = delete;
  Worker& operator=(const Worker&) = delete;
  Worker(Worker&&) = delete;
  Worker& operator=(Worker&&) = delete;

 private:
  void run_loop();

  int worker_id_;
  WorkerPool& pool_;
  std::atomic<bool> should_stop{false};
  std::thread thread;
};

}  // namespace async
}  // namespace mdquery
