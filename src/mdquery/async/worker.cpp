#include "mdquery/async/worker.hpp"

#include <iostream>
#include <stdexcept>

#include "mdquery/async/worker_pool.hpp"

namespace mdquery {
namespace async {

Worker::Worker(int worker_id, WorkerPool& pool) : worker_id_(worker_id), pool_(pool) {}

Worker::~Worker() {
  stop();
  pool_.wake_all();
  // Blocks until the current job (if any) has finished.
  if (thread.joinable()) {
    thread.join();
  }
}

void Worker::start() {
  if (thread.joinable()) {
    throw std::runtime_error("Worker is already running.");
  }
  should_stop.store(false);
  thread = std::thread(&Worker::run_loop, this);
}

void Worker::stop() {
  should_stop.store(true);
}

void Worker::run_loop() {
  while (!should_stop.load()) {
    std::optional<WorkerPool::Job> job = pool_.wait_for_job(should_stop);
    if (!job) {
      continue;
    }
    try {
      (*job)();
    } catch (const std::exception& e) {
      std::cerr << "Worker [" << worker_id_ << "] ERROR running job: " << e.what() << std::endl;
    }
    pool_.job_finished();
  }
}

}  // namespace async
}  // namespace mdquery
