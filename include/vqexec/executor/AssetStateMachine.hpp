// Repository: Retrovue-vqexec
// Component: AssetStateMachine
// Purpose: Runs one asset from cache check to cleanup, in strict state order.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_EXECUTOR_ASSET_STATE_MACHINE_HPP_
#define VQEXEC_EXECUTOR_ASSET_STATE_MACHINE_HPP_

#include <functional>
#include <string>

#include "vqexec/asset/Asset.hpp"
#include "vqexec/cache/IResultStore.hpp"
#include "vqexec/core/ExecutorConfig.hpp"
#include "vqexec/core/ExecutorIdentity.hpp"
#include "vqexec/core/Result.hpp"
#include "vqexec/executor/IComputePlugin.hpp"
#include "vqexec/pipeline/ITranscoder.hpp"
#include "vqexec/pipeline/Topology.hpp"

namespace vqexec::executor {

// CACHE_CHECK ─hit──────────────────────────────────────────────────────▶ DONE
//      └─miss─▶ VALIDATE ▶ PATH_RESOLVE ▶ TEARDOWN ▶ OPEN_TRANSCODE
//               ▶ OPEN_SAMPLE_TRANSFORM ▶ LOG_INIT ▶ COMPUTE ▶ READ_RESULT
//               ▶ CACHE_SAVE ▶ CLEANUP ▶ DONE
enum class RunState {
  kCacheCheck,
  kValidate,
  kPathResolve,
  kTeardown,
  kOpenTranscode,
  kOpenSampleTransform,
  kLogInit,
  kCompute,
  kReadResult,
  kCacheSave,
  kCleanup,
  kDone,
};

const char* RunStateToString(RunState state);

// Stateless between runs; one instance serves every scheduler worker.
class AssetStateMachine {
 public:
  using StateObserverFn = std::function<void(const asset::Asset&, RunState)>;
  using DelayHookFn = std::function<void()>;

  AssetStateMachine(const core::ExecutorIdentity& identity,
                    const core::ExecutorConfig& config,
                    const pipeline::Topology& topology, IComputePlugin& plugin,
                    cache::IResultStore& store, pipeline::ITranscoder& transcoder);

  // Returns the post-processed result. On failure after CACHE_CHECK,
  // producers are stopped, created stage paths and the log are removed
  // (best effort), the run directory is removed if empty, and the error
  // propagates. Nothing is cached.
  core::Result Run(const asset::Asset& a) const;

  // Test-only: observes every state entered, on the running thread.
  void SetStateObserver(StateObserverFn observer) { state_observer_ = std::move(observer); }

  // Test-only: runs on each streaming producer before pipe creation.
  void SetProducerDelayHook(DelayHookFn hook) { producer_delay_hook_ = std::move(hook); }

 private:
  void Enter(const asset::Asset& a, RunState state) const;
  core::Result RunMiss(const asset::Asset& a) const;

  const core::ExecutorIdentity& identity_;
  const core::ExecutorConfig& config_;
  const pipeline::Topology& topology_;
  IComputePlugin& plugin_;
  cache::IResultStore& store_;
  pipeline::ITranscoder& transcoder_;

  StateObserverFn state_observer_;       // Test-only
  DelayHookFn producer_delay_hook_;      // Test-only
};

}  // namespace vqexec::executor

#endif  // VQEXEC_EXECUTOR_ASSET_STATE_MACHINE_HPP_
