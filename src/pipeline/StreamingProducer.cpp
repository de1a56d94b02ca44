// Repository: Retrovue-vqexec
// Component: StreamingProducer
// Purpose: Background producer that fills one named pipe, with abort
//          checkpoints and pipe retirement on stop.
// Copyright (c) 2026 RetroVue

#include "vqexec/pipeline/StreamingProducer.hpp"

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>

#include "vqexec/util/FileSystem.hpp"
#include "vqexec/util/Logger.hpp"

namespace vqexec::pipeline {

using util::Logger;

namespace {

constexpr auto kAbandonPollInterval = std::chrono::milliseconds(20);

// Holds the pipe open as both peers while unlinking it, so no consumer can
// stay blocked in open(): earlier openers get end of stream, later ones ENOENT.
void RetireFifo(const std::string& path) {
  const int fd = open(path.c_str(), O_RDWR | O_NONBLOCK | O_CLOEXEC);
  unlink(path.c_str());
  if (fd >= 0) {
    close(fd);
  }
}

}  // namespace

StreamingProducer::StreamingProducer(std::string name, std::string fifo_path,
                                     std::vector<std::string> wake_paths, WorkFn work)
    : name_(std::move(name)),
      fifo_path_(std::move(fifo_path)),
      wake_paths_(std::move(wake_paths)),
      work_(std::move(work)) {}

StreamingProducer::~StreamingProducer() {
  if (thread_.joinable()) {
    Abandon();
  }
}

void StreamingProducer::Start(DelayHookFn delay_hook) {
  thread_ = std::thread(&StreamingProducer::Run, this, std::move(delay_hook));
}

void StreamingProducer::RequestAbort() {
  abort_.store(true, std::memory_order_release);
}

bool StreamingProducer::WaitFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return done_cv_.wait_for(lock, timeout, [this] { return done_; });
}

bool StreamingProducer::Finished() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return done_;
}

std::exception_ptr StreamingProducer::error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return error_;
}

bool StreamingProducer::FailedUnprompted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return failed_unprompted_;
}

void StreamingProducer::Join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

void StreamingProducer::Abandon() {
  RequestAbort();
  while (!WaitFor(kAbandonPollInterval)) {
    // The thread (or its child) is blocked on a pipe whose peer is gone.
    for (const auto& path : wake_paths_) {
      util::PokeFifo(path);
    }
    const pid_t pid = child_pid_.load(std::memory_order_acquire);
    if (pid > 0) {
      kill(pid, SIGTERM);
    }
  }
  Join();
}

// =============================================================================
// Run: producer thread, two abort checkpoints before the pipe exists
// =============================================================================

void StreamingProducer::Run(DelayHookFn delay_hook) {
  std::exception_ptr failure;
  bool unprompted = false;
  try {
    // Checkpoint 1
    if (!AbortRequested()) {
      // Test hook: artificial delay
      if (delay_hook) delay_hook();

      // Checkpoint 2
      if (!AbortRequested()) {
        util::MakeFifo(fifo_path_);
        pipe_created_.store(true, std::memory_order_release);
        Logger::Debug("[StreamingProducer] PIPE_CREATED name=" + name_ +
                      " path=" + fifo_path_);

        work_([this](pid_t pid) { child_pid_.store(pid, std::memory_order_release); });
        child_pid_.store(0, std::memory_order_release);
      } else {
        Logger::Debug("[StreamingProducer] ABORTED_BEFORE_PIPE name=" + name_);
      }
    }
  } catch (...) {
    child_pid_.store(0, std::memory_order_release);
    failure = std::current_exception();
    unprompted = !AbortRequested();
  }

  if (failure && pipe_created()) {
    RetireFifo(fifo_path_);
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = failure;
    failed_unprompted_ = unprompted;
    done_ = true;
  }
  done_cv_.notify_all();
}

}  // namespace vqexec::pipeline
