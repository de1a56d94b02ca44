// Repository: Retrovue-vqexec
// Component: Executor Errors
// Purpose: Error taxonomy for asset preparation, computation and caching.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_CORE_ERRORS_HPP_
#define VQEXEC_CORE_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace vqexec::core {

// =============================================================================
// Error Kinds
// =============================================================================

enum class ErrorKind {
  // Fatal, pre-execution: missing explicit geometry, format mismatch,
  // missing source path, contradictory executor options.
  kConfiguration,

  // Required external tool (transcoder) is not available.
  kMissingDependency,

  // A streaming stage's pipe never materialized within the bounded poll.
  kResourceTimeout,

  // External process (transcoder) exited nonzero or could not be started.
  kExternalProcess,

  // Plugin failed while generating its raw artifact.
  kCompute,

  // Plugin failed to parse its raw artifact.
  kParse,

  // Filesystem or raw-stream fault inside the engine.
  kIo,
};

const char* ErrorKindToString(ErrorKind kind);

// Base of every error raised by the engine. Carries the kind so callers that
// only catch ExecutorError can still route on it.
class ExecutorError : public std::runtime_error {
 public:
  ExecutorError(ErrorKind kind, const std::string& what)
      : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

 private:
  ErrorKind kind_;
};

class ConfigurationError : public ExecutorError {
 public:
  explicit ConfigurationError(const std::string& what)
      : ExecutorError(ErrorKind::kConfiguration, what) {}
};

class MissingDependencyError : public ExecutorError {
 public:
  explicit MissingDependencyError(const std::string& what)
      : ExecutorError(ErrorKind::kMissingDependency, what) {}
};

class ResourceTimeoutError : public ExecutorError {
 public:
  explicit ResourceTimeoutError(const std::string& what)
      : ExecutorError(ErrorKind::kResourceTimeout, what) {}
};

class ExternalProcessError : public ExecutorError {
 public:
  ExternalProcessError(const std::string& what, int exit_status)
      : ExecutorError(ErrorKind::kExternalProcess, what),
        exit_status_(exit_status) {}

  // Exit code, or 128 + signal number when the process was killed.
  int exit_status() const { return exit_status_; }

 private:
  int exit_status_;
};

class ComputeError : public ExecutorError {
 public:
  explicit ComputeError(const std::string& what)
      : ExecutorError(ErrorKind::kCompute, what) {}
};

class ParseError : public ExecutorError {
 public:
  explicit ParseError(const std::string& what)
      : ExecutorError(ErrorKind::kParse, what) {}
};

class IoError : public ExecutorError {
 public:
  explicit IoError(const std::string& what)
      : ExecutorError(ErrorKind::kIo, what) {}
};

}  // namespace vqexec::core

#endif  // VQEXEC_CORE_ERRORS_HPP_
