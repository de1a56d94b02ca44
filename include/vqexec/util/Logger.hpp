// Repository: Retrovue-vqexec
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by every engine thread.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_UTIL_LOGGER_HPP_
#define VQEXEC_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace vqexec::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so lines from concurrent threads never interleave
// (scheduler workers, streaming producers, transcoder watchers).
//
// Info  → stdout (normal operational logs)
// Debug → stdout only when VQEXEC_DEBUG env is set (state transitions)
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (asset failures, hard faults)
//
// Test-only: SetInfoSink / SetErrorSink install callbacks invoked for every
// Info() / Error() line (in addition to the console).
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // Call with nullptr to clear.
  static void SetInfoSink(std::function<void(const std::string&)> sink);
  static void SetErrorSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> info_sink_;
  static std::function<void(const std::string&)> error_sink_;
};

}  // namespace vqexec::util

#endif  // VQEXEC_UTIL_LOGGER_HPP_
