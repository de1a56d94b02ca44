// Repository: Retrovue-vqexec
// Component: Executor Configuration
// Purpose: Display names for executor configuration enums.
// Copyright (c) 2026 RetroVue

#include "vqexec/core/ExecutorConfig.hpp"

namespace vqexec::core {

const char* CacheRacePolicyToString(CacheRacePolicy policy) {
  switch (policy) {
    case CacheRacePolicy::kTolerateDuplicates:
      return "TOLERATE_DUPLICATES";
    case CacheRacePolicy::kExclusiveLease:
      return "EXCLUSIVE_LEASE";
  }
  return "UNKNOWN";
}

}  // namespace vqexec::core
