// Repository: Retrovue-vqexec
// Component: Executor
// Purpose: Binds one plugin, config, result store, transcoder and topology;
//          entry point for running and removing results over many assets.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_EXECUTOR_EXECUTOR_HPP_
#define VQEXEC_EXECUTOR_EXECUTOR_HPP_

#include <memory>
#include <vector>

#include "vqexec/asset/Asset.hpp"
#include "vqexec/cache/IResultStore.hpp"
#include "vqexec/core/ExecutorConfig.hpp"
#include "vqexec/core/ExecutorIdentity.hpp"
#include "vqexec/core/Result.hpp"
#include "vqexec/executor/AssetStateMachine.hpp"
#include "vqexec/executor/IComputePlugin.hpp"
#include "vqexec/pipeline/ITranscoder.hpp"
#include "vqexec/pipeline/Topology.hpp"

namespace vqexec::executor {

// Plugin, store and an injected transcoder are borrowed and must outlive the
// Executor.
class Executor {
 public:
  // Uses an owned FfmpegTranscoder configured from config.ffmpeg_path.
  // Throws core::ConfigurationError for contradictory options
  // (save_workfiles with fifo_mode, non-positive poll budget).
  Executor(core::ExecutorConfig config, IComputePlugin& plugin,
           cache::IResultStore& store,
           pipeline::Topology topology = pipeline::Topology::FullReference());

  Executor(core::ExecutorConfig config, IComputePlugin& plugin,
           cache::IResultStore& store, pipeline::ITranscoder& transcoder,
           pipeline::Topology topology = pipeline::Topology::FullReference());

  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;

  // Preflight (every asset, before anything is scheduled): structural
  // validation, plus transcoder availability when any asset needs the
  // transcode stage. Source existence is checked per asset on a cache miss,
  // so a cached result survives the removal of its sources. Then schedules
  // the state machine per asset. Results are in input order.
  std::vector<core::Result> Run(const std::vector<asset::Asset>& assets,
                                const core::RunOptions& options = {});

  // Deletes cached results and retained workfile snapshots for this executor.
  void RemoveResults(const std::vector<asset::Asset>& assets);

  const core::ExecutorIdentity& identity() const { return identity_; }
  const core::ExecutorConfig& config() const { return config_; }
  const pipeline::Topology& topology() const { return topology_; }

  // Test-only hooks, forwarded to the state machine.
  void SetStateObserver(AssetStateMachine::StateObserverFn observer);
  void SetProducerDelayHook(AssetStateMachine::DelayHookFn hook);

 private:
  void Preflight(const std::vector<asset::Asset>& assets);

  const core::ExecutorConfig config_;
  IComputePlugin& plugin_;
  cache::IResultStore& store_;
  const pipeline::Topology topology_;
  const core::ExecutorIdentity identity_;
  std::unique_ptr<pipeline::ITranscoder> owned_transcoder_;
  pipeline::ITranscoder& transcoder_;
  AssetStateMachine state_machine_;
};

}  // namespace vqexec::executor

#endif  // VQEXEC_EXECUTOR_EXECUTOR_HPP_
