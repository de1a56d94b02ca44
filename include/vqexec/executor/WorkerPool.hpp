// Repository: Retrovue-vqexec
// Component: WorkerPool
// Purpose: Fixed-size thread pool returning futures for submitted jobs.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_EXECUTOR_WORKER_POOL_HPP_
#define VQEXEC_EXECUTOR_WORKER_POOL_HPP_

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <thread>
#include <type_traits>
#include <vector>

namespace vqexec::executor {

// Jobs run in submission order on at most worker_count threads. A job's
// exception is delivered through its future; it never reaches the worker.
// The destructor finishes every queued job before joining.
class WorkerPool {
 public:
  // Throws std::invalid_argument when worker_count is 0.
  explicit WorkerPool(size_t worker_count);
  ~WorkerPool();

  WorkerPool(const WorkerPool&) = delete;
  WorkerPool& operator=(const WorkerPool&) = delete;

  template <typename Fn>
  std::future<std::invoke_result_t<Fn>> Submit(Fn fn) {
    using R = std::invoke_result_t<Fn>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
    std::future<R> future = task->get_future();
    Enqueue([task] { (*task)(); });
    return future;
  }

  size_t worker_count() const { return workers_.size(); }

 private:
  void Enqueue(std::function<void()> job);
  void WorkerLoop();

  std::mutex mutex_;
  std::condition_variable work_cv_;
  std::deque<std::function<void()>> queue_;  // Guarded by mutex_
  bool shutdown_ = false;                    // Guarded by mutex_
  std::vector<std::thread> workers_;
};

}  // namespace vqexec::executor

#endif  // VQEXEC_EXECUTOR_WORKER_POOL_HPP_
