// Repository: Retrovue-vqexec
// Component: StreamingProducer
// Purpose: One background thread that creates a stage's named pipe and then
//          produces into it. Supports abort before pipe creation and
//          abandonment of a thread blocked on a pipe peer.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_PIPELINE_STREAMING_PRODUCER_HPP_
#define VQEXEC_PIPELINE_STREAMING_PRODUCER_HPP_

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "vqexec/pipeline/ITranscoder.hpp"

namespace vqexec::pipeline {

// Lifecycle:
//
//   Start()            thread: [abort?] → delay hook → [abort?] → mkfifo → work
//   WaitFor(timeout)   true once the thread has returned
//   Abandon()          abort + repeatedly poke pipes / SIGTERM the child
//                      until the thread returns, then join
//   Join()             join a finished thread
//
// Errors thrown by the work function are captured and exposed by error();
// they are never rethrown on the producer thread. A producer that fails after
// creating its pipe retires the pipe: a consumer already inside open() sees
// end of stream, a later one sees the path gone.
class StreamingProducer {
 public:
  // Produces into the pipe. Must report any child process through on_spawn
  // so Abandon() can terminate it.
  using WorkFn = std::function<void(const ProcessObserver& on_spawn)>;
  using DelayHookFn = std::function<void()>;

  // `fifo_path` is created by the producer. `wake_paths` are the pipes the
  // producer (or its child) may block on while opening; Abandon() pokes them.
  StreamingProducer(std::string name, std::string fifo_path,
                    std::vector<std::string> wake_paths, WorkFn work);
  ~StreamingProducer();

  StreamingProducer(const StreamingProducer&) = delete;
  StreamingProducer& operator=(const StreamingProducer&) = delete;

  // Test-only hook runs on the producer thread before pipe creation.
  void Start(DelayHookFn delay_hook = nullptr);

  // A producer that has not created its pipe yet never will.
  void RequestAbort();

  bool WaitFor(std::chrono::milliseconds timeout);
  void Abandon();
  void Join();

  bool Finished() const;
  bool pipe_created() const { return pipe_created_.load(std::memory_order_acquire); }
  std::exception_ptr error() const;
  // True when the work failed before any abort was requested, i.e. the
  // failure was not induced by Abandon().
  bool FailedUnprompted() const;
  const std::string& name() const { return name_; }
  const std::string& fifo_path() const { return fifo_path_; }

 private:
  void Run(DelayHookFn delay_hook);
  bool AbortRequested() const { return abort_.load(std::memory_order_acquire); }

  const std::string name_;
  const std::string fifo_path_;
  const std::vector<std::string> wake_paths_;
  WorkFn work_;

  std::thread thread_;
  std::atomic<bool> abort_{false};
  std::atomic<bool> pipe_created_{false};
  std::atomic<pid_t> child_pid_{0};

  mutable std::mutex mutex_;
  std::condition_variable done_cv_;
  bool done_ = false;             // Guarded by mutex_
  std::exception_ptr error_;      // Guarded by mutex_
  bool failed_unprompted_ = false;  // Guarded by mutex_
};

}  // namespace vqexec::pipeline

#endif  // VQEXEC_PIPELINE_STREAMING_PRODUCER_HPP_
