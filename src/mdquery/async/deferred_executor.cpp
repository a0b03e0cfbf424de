#include "mdquery/async/deferred_executor.hpp"

#include <iostream>

namespace mdquery::async {

DeferredExecutor::DeferredExecutor(std::string name) : name_(std::move(name)) {}

DeferredExecutor::~DeferredExecutor() {
  stop();
}

void DeferredExecutor::schedule_after(std::chrono::milliseconds delay, Task task) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopped_) {
      return;
    }
    tasks_.emplace(Clock::now() + delay, std::move(task));
    if (!running_) {
      running_ = true;
      thread_ = std::thread([this] { this->run_loop(); });
    }
  }
  cv_.notify_all();
}

size_t DeferredExecutor::cancel_all() {
  std::lock_guard<std::mutex> lk(mu_);
  size_t dropped = tasks_.size();
  tasks_.clear();
  return dropped;
}

size_t DeferredExecutor::pending_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return tasks_.size();
}

void DeferredExecutor::stop() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (stopped_) return;
    stopped_ = true;
    tasks_.clear();
  }
  cv_.notify_all();
  if (!thread_.joinable()) {
    return;
  }
  if (thread_.get_id() == std::this_thread::get_id()) {
    // Stopped from one of its own tasks; the loop exits after the task returns.
    thread_.detach();
    return;
  }
  thread_.join();
}

void DeferredExecutor::run_loop() {
  std::unique_lock<std::mutex> lk(mu_);
  while (!stopped_) {
    if (tasks_.empty()) {
      cv_.wait(lk);
      continue;
    }
    auto next = tasks_.begin();
    if (Clock::now() < next->first) {
      cv_.wait_until(lk, next->first);
      continue;
    }
    Task task = std::move(next->second);
    tasks_.erase(next);
    lk.unlock();
    try {
      task();
    } catch (const std::exception& e) {
      std::cerr << "[" << name_ << "] ERROR in deferred task: " << e.what() << std::endl;
    }
    lk.lock();
  }
}

}  // namespace mdquery::async
