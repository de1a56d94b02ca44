// Repository: Retrovue-vqexec
// Component: WorkerPool
// Purpose: Fixed pool of threads draining a task queue.
// Copyright (c) 2026 RetroVue

#include "vqexec/executor/WorkerPool.hpp"

#include <stdexcept>

namespace vqexec::executor {

WorkerPool::WorkerPool(size_t worker_count) {
  if (worker_count == 0) {
    throw std::invalid_argument("WorkerPool needs at least one worker");
  }
  workers_.reserve(worker_count);
  for (size_t i = 0; i < worker_count; ++i) {
    workers_.emplace_back(&WorkerPool::WorkerLoop, this);
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutdown_ = true;
  }
  work_cv_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

void WorkerPool::Enqueue(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutdown_) {
      throw std::logic_error("WorkerPool::Submit after shutdown");
    }
    queue_.push_back(std::move(job));
  }
  work_cv_.notify_one();
}

void WorkerPool::WorkerLoop() {
  while (true) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      work_cv_.wait(lock, [this] { return shutdown_ || !queue_.empty(); });
      // Drain before exiting: every submitted future gets a value.
      if (queue_.empty()) return;
      job = std::move(queue_.front());
      queue_.pop_front();
    }
    job();
  }
}

}  // namespace vqexec::executor
