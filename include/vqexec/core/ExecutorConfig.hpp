// Repository: Retrovue-vqexec
// Component: Executor Configuration
// Purpose: Configuration structures for Executor and Scheduler.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_CORE_EXECUTOR_CONFIG_HPP_
#define VQEXEC_CORE_EXECUTOR_CONFIG_HPP_

#include <optional>
#include <string>

#include "vqexec/core/ExecutorIdentity.hpp"

namespace vqexec::core {

// What happens when two callers miss the cache for the same
// (asset, executor) at the same time.
enum class CacheRacePolicy {
  kTolerateDuplicates,  // Both compute; last Save wins (default)
  kExclusiveLease       // Hold the store's compute lease across check..save
};

const char* CacheRacePolicyToString(CacheRacePolicy policy);

// Configuration for Executor
// POD struct - immutable after construction
struct ExecutorConfig {
  bool fifo_mode = true;         // Stream intermediate stages through named pipes
  bool delete_workdir = true;    // Remove stage artifacts, log and run dir after success
  bool save_workfiles = false;   // Snapshot workfiles into the store (requires !fifo_mode)

  // Part of the executor id and therefore of every cache key.
  OptionalParams optional_params;

  // Passed to the plugin only; never part of the executor id (e.g. a path to
  // a model or data cache).
  OptionalParams optional_params2;

  int fifo_poll_retries = 10;        // Attempts to see every stage pipe exist
  int fifo_poll_interval_ms = 100;   // Sleep between attempts

  // Transcoder binary. Empty: $VQEXEC_FFMPEG, then "ffmpeg" on PATH.
  std::string ffmpeg_path;

  CacheRacePolicy race_policy = CacheRacePolicy::kTolerateDuplicates;
};

// Options for one Executor::Run call.
struct RunOptions {
  bool parallelize = false;
  // Pool size; only meaningful with parallelize. Default: host parallelism.
  std::optional<int> max_workers;
};

}  // namespace vqexec::core

#endif  // VQEXEC_CORE_EXECUTOR_CONFIG_HPP_
