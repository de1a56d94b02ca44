// Repository: Retrovue-vqexec
// Component: Executor Errors
// Purpose: Display names for executor error kinds.
// Copyright (c) 2026 RetroVue

#include "vqexec/core/Errors.hpp"

namespace vqexec::core {

const char* ErrorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kConfiguration:
      return "CONFIGURATION";
    case ErrorKind::kMissingDependency:
      return "MISSING_DEPENDENCY";
    case ErrorKind::kResourceTimeout:
      return "RESOURCE_TIMEOUT";
    case ErrorKind::kExternalProcess:
      return "EXTERNAL_PROCESS";
    case ErrorKind::kCompute:
      return "COMPUTE";
    case ErrorKind::kParse:
      return "PARSE";
    case ErrorKind::kIo:
      return "IO";
  }
  return "UNKNOWN";
}

}  // namespace vqexec::core
