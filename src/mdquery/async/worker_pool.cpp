#include "mdquery/async/worker_pool.hpp"

#include <iostream>
#include <stdexcept>

namespace mdquery::async {

WorkerPool::WorkerPool(size_t max_threads, std::string name, bool verbose)
    : max_threads_(max_threads), name_(std::move(name)), verbose_(verbose) {
  if (max_threads == 0) {
    throw std::invalid_argument("WorkerPool must allow at least one thread.");
  }
  workers_.reserve(max_threads);
  if (verbose_) {
    std::cout << "[" << name_ << "] created with up to " << max_threads << " workers."
              << std::endl;
  }
}

WorkerPool::~WorkerPool() {
  stop();
  std::vector<std::unique_ptr<Worker>> workers;
  {
    std::lock_guard<std::mutex> lk(mu_);
    workers.swap(workers_);
  }
  // Worker destructors join their threads.
  workers.clear();
}

void WorkerPool::start() {
  if (is_running_.exchange(true)) {
    std::cerr << "[" << name_ << "] Warning: pool is already running." << std::endl;
    return;
  }
  if (verbose_) {
    std::cout << "[" << name_ << "] started." << std::endl;
  }
}

void WorkerPool::stop() {
  if (!is_running_.exchange(false)) {
    return;
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    jobs_.clear();
    for (const auto& worker : workers_) {
      worker->stop();
    }
  }
  job_cv_.notify_all();
  idle_cv_.notify_all();
  if (verbose_) {
    std::cout << "[" << name_ << "] stopping all workers." << std::endl;
  }
}

bool WorkerPool::submit(Job job) {
  if (!is_running_.load()) {
    return false;
  }
  {
    std::lock_guard<std::mutex> lk(mu_);
    jobs_.push_back(std::move(job));
    if (idle_workers_ < jobs_.size() && workers_.size() < max_threads_) {
      auto worker = std::make_unique<Worker>(static_cast<int>(workers_.size()), *this);
      worker->start();
      workers_.push_back(std::move(worker));
    }
  }
  job_cv_.notify_one();
  return true;
}

size_t WorkerPool::cancel_pending() {
  size_t dropped = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    dropped = jobs_.size();
    jobs_.clear();
  }
  idle_cv_.notify_all();
  return dropped;
}

void WorkerPool::wait_idle() {
  std::unique_lock<std::mutex> lk(mu_);
  idle_cv_.wait(lk, [this] { return (jobs_.empty() && active_jobs_ == 0) || !is_running_.load(); });
}

size_t WorkerPool::pending_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return jobs_.size();
}

size_t WorkerPool::thread_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return workers_.size();
}

std::optional<WorkerPool::Job> WorkerPool::wait_for_job(const std::atomic<bool>& should_stop) {
  std::unique_lock<std::mutex> lk(mu_);
  ++idle_workers_;
  job_cv_.wait(lk, [&] { return should_stop.load() || !jobs_.empty(); });
  --idle_workers_;
  if (should_stop.load() || jobs_.empty()) {
    return std::nullopt;
  }
  Job job = std::move(jobs_.front());
  jobs_.pop_front();
  ++active_jobs_;
  return job;
}

void WorkerPool::job_finished() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    --active_jobs_;
  }
  idle_cv_.notify_all();
}

void WorkerPool::wake_all() {
  // Lock so a worker cannot miss the wakeup between its predicate check and wait.
  { std::lock_guard<std::mutex> lk(mu_); }
  job_cv_.notify_all();
}

}  // namespace mdquery::async
