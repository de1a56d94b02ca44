// Repository: Retrovue-vqexec
// Component: Executor
// Purpose: Batch entry point: configuration checks, preflight, dispatch and
//          cached-result removal.
// Copyright (c) 2026 RetroVue

#include "vqexec/executor/Executor.hpp"

#include <sstream>

#include "vqexec/core/Errors.hpp"
#include "vqexec/executor/Scheduler.hpp"
#include "vqexec/pipeline/FfmpegTranscoder.hpp"
#include "vqexec/util/Logger.hpp"

namespace vqexec::executor {

using util::Logger;

namespace {

void CheckConfig(const core::ExecutorConfig& config) {
  if (config.save_workfiles && config.fifo_mode) {
    throw core::ConfigurationError(
        "save_workfiles requires fifo_mode off: named pipes cannot be retained");
  }
  if (config.fifo_poll_retries < 1) {
    throw core::ConfigurationError("fifo_poll_retries must be at least 1");
  }
  if (config.fifo_poll_interval_ms < 0) {
    throw core::ConfigurationError("fifo_poll_interval_ms must not be negative");
  }
  // The interval also sizes the producer settle budget.
  if (config.fifo_mode && config.fifo_poll_interval_ms < 1) {
    throw core::ConfigurationError("fifo_poll_interval_ms must be at least 1 with fifo_mode");
  }
}

}  // namespace

Executor::Executor(core::ExecutorConfig config, IComputePlugin& plugin,
                   cache::IResultStore& store, pipeline::Topology topology)
    : config_(std::move(config)),
      plugin_(plugin),
      store_(store),
      topology_(std::move(topology)),
      identity_(plugin.Type(), plugin.Version(), config_.optional_params),
      owned_transcoder_(std::make_unique<pipeline::FfmpegTranscoder>(config_.ffmpeg_path)),
      transcoder_(*owned_transcoder_),
      state_machine_(identity_, config_, topology_, plugin_, store_, transcoder_) {
  CheckConfig(config_);
}

Executor::Executor(core::ExecutorConfig config, IComputePlugin& plugin,
                   cache::IResultStore& store, pipeline::ITranscoder& transcoder,
                   pipeline::Topology topology)
    : config_(std::move(config)),
      plugin_(plugin),
      store_(store),
      topology_(std::move(topology)),
      identity_(plugin.Type(), plugin.Version(), config_.optional_params),
      transcoder_(transcoder),
      state_machine_(identity_, config_, topology_, plugin_, store_, transcoder_) {
  CheckConfig(config_);
}

void Executor::SetStateObserver(AssetStateMachine::StateObserverFn observer) {
  state_machine_.SetStateObserver(std::move(observer));
}

void Executor::SetProducerDelayHook(AssetStateMachine::DelayHookFn hook) {
  state_machine_.SetProducerDelayHook(std::move(hook));
}

void Executor::Preflight(const std::vector<asset::Asset>& assets) {
  bool needs_transcoder = false;
  for (const auto& a : assets) {
    topology_.ValidateStructure(a);
    needs_transcoder = needs_transcoder || topology_.NeedsTranscode(a);
  }
  if (needs_transcoder) {
    transcoder_.EnsureAvailable();
  }
}

std::vector<core::Result> Executor::Run(const std::vector<asset::Asset>& assets,
                                        const core::RunOptions& options) {
  // Option errors are configuration errors too: reject before any work.
  Scheduler::ResolveWorkerCount(options);
  Preflight(assets);

  {
    std::ostringstream oss;
    oss << "[Executor] RUN executor=" << identity_.Id()
        << " topology=" << topology_.Name() << " assets=" << assets.size()
        << " fifo_mode=" << (config_.fifo_mode ? "Y" : "N")
        << " race_policy=" << core::CacheRacePolicyToString(config_.race_policy);
    Logger::Info(oss.str());
  }

  const Scheduler scheduler(
      [this](const asset::Asset& a) { return state_machine_.Run(a); });
  return scheduler.Run(assets, options);
}

void Executor::RemoveResults(const std::vector<asset::Asset>& assets) {
  for (const auto& a : assets) {
    store_.Delete(a, identity_.Id());
    for (asset::StreamRole role : topology_.roles()) {
      store_.DeleteWorkfile(a, identity_.Id(), role);
    }
    Logger::Info("[Executor] RESULT_REMOVED executor=" + identity_.Id() +
                 " asset=" + a.ToString());
  }
}

}  // namespace vqexec::executor
