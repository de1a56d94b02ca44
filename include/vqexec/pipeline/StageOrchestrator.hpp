// Repository: Retrovue-vqexec
// Component: StageOrchestrator
// Purpose: File/pipe lifecycle of the two optional intermediate stages
//          (transcode → workfile, sample transform → procfile) for one run.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_PIPELINE_STAGE_ORCHESTRATOR_HPP_
#define VQEXEC_PIPELINE_STAGE_ORCHESTRATOR_HPP_

#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "vqexec/asset/Asset.hpp"
#include "vqexec/core/ExecutorConfig.hpp"
#include "vqexec/pipeline/ITranscoder.hpp"
#include "vqexec/pipeline/RunLayout.hpp"
#include "vqexec/pipeline/StreamingProducer.hpp"
#include "vqexec/pipeline/Topology.hpp"

namespace vqexec::pipeline {

// Ordering contract for one run:
//
//   Teardown()                 removes stale files/pipes at every owned
//                              target path of BOTH stages, all roles
//   OpenTranscodeStage()       stage 1 (no-op when the decision skips it)
//   OpenSampleTransformStage() stage 2 (no-op when the decision skips it)
//   ... compute ...
//   Settle()                   streaming: wait for producers, rethrow failure
//   RemoveStagePaths()         cleanup
//
// Abort() is the failure path: producers are stopped and joined before any
// path is removed. Paths aliased to an upstream path (the source, or a
// workfile reused as procfile) are never created or removed here.
class StageOrchestrator {
 public:
  using DelayHookFn = StreamingProducer::DelayHookFn;

  StageOrchestrator(const asset::Asset& a, const Topology& topology,
                    const StageDecision& decision, const RunLayout& layout,
                    asset::Geometry compute_geometry, std::string workfile_yuv_type,
                    ITranscoder& transcoder, const core::ExecutorConfig& config);
  ~StageOrchestrator();

  StageOrchestrator(const StageOrchestrator&) = delete;
  StageOrchestrator& operator=(const StageOrchestrator&) = delete;

  void Teardown();

  // Materialized: runs the stage to completion. Streaming: starts one
  // producer per role and polls until every pipe exists; throws
  // core::ResourceTimeoutError when the poll is exhausted, or the producer's
  // own error if one fails first.
  void OpenTranscodeStage();
  void OpenSampleTransformStage();

  // Streaming: waits for every producer to finish (bounded by the pipe-poll
  // budget) and rethrows the first producer failure, upstream stage first.
  // Materialized: no-op.
  void Settle();

  // Stops and joins every producer. Producer errors are logged, not thrown;
  // returns the first one that was not induced by the abort (nullptr if none)
  // so the caller can report the root cause.
  std::exception_ptr Abort();

  // Settle, tear down and reopen both stages so the consumer can read every
  // stream again from the first frame.
  void RefreshStreams();

  // Removes every owned stage path. Throws core::IoError.
  void RemoveStagePaths();

  // Test-only: runs on each streaming producer thread before pipe creation.
  void SetDelayHook(DelayHookFn hook) { delay_hook_ = std::move(hook); }

  bool HasLiveProducers() const { return !producers_.empty(); }

 private:
  // Materialized
  void TranscodeRole(asset::StreamRole role, const ProcessObserver& on_spawn);
  void TransformRole(asset::StreamRole role);

  // Streaming
  void StartProducer(std::unique_ptr<StreamingProducer> producer);
  void WaitForPipes(const std::vector<std::string>& paths, const char* stage);

  TranscodeRequest BuildRequest(asset::StreamRole role) const;
  std::vector<std::string> OwnedPaths() const;

  const asset::Asset& asset_;
  const Topology& topology_;
  const StageDecision decision_;
  const RunLayout& layout_;
  const asset::Geometry compute_geometry_;
  const std::string workfile_yuv_type_;
  ITranscoder& transcoder_;
  const core::ExecutorConfig& config_;

  // Upstream stage first, then role order.
  std::vector<std::unique_ptr<StreamingProducer>> producers_;
  DelayHookFn delay_hook_;
};

}  // namespace vqexec::pipeline

#endif  // VQEXEC_PIPELINE_STAGE_ORCHESTRATOR_HPP_
