// Repository: Retrovue-vqexec
// Component: AssetStateMachine
// Purpose: Drive one asset from cache check through compute to cleanup.
// Copyright (c) 2026 RetroVue

#include "vqexec/executor/AssetStateMachine.hpp"

#include <exception>
#include <fstream>
#include <memory>
#include <sstream>

#include "vqexec/core/Errors.hpp"
#include "vqexec/pipeline/RunLayout.hpp"
#include "vqexec/pipeline/StageOrchestrator.hpp"
#include "vqexec/util/FileSystem.hpp"
#include "vqexec/util/Logger.hpp"

namespace vqexec::executor {

using asset::StreamRole;
using util::Logger;

const char* RunStateToString(RunState state) {
  switch (state) {
    case RunState::kCacheCheck:
      return "CACHE_CHECK";
    case RunState::kValidate:
      return "VALIDATE";
    case RunState::kPathResolve:
      return "PATH_RESOLVE";
    case RunState::kTeardown:
      return "TEARDOWN";
    case RunState::kOpenTranscode:
      return "OPEN_TRANSCODE";
    case RunState::kOpenSampleTransform:
      return "OPEN_SAMPLE_TRANSFORM";
    case RunState::kLogInit:
      return "LOG_INIT";
    case RunState::kCompute:
      return "COMPUTE";
    case RunState::kReadResult:
      return "READ_RESULT";
    case RunState::kCacheSave:
      return "CACHE_SAVE";
    case RunState::kCleanup:
      return "CLEANUP";
    case RunState::kDone:
      return "DONE";
  }
  return "UNKNOWN";
}

namespace {

void WriteLogHeader(const std::string& path, const std::string& executor_id) {
  std::ofstream out(path, std::ios::trunc);
  out << executor_id << "\n\n";
  out.flush();
  if (!out) {
    throw core::IoError("cannot write log file " + path);
  }
}

// Failure-path removal: a leftover artifact must not mask the real error.
void RemoveQuietly(const std::string& what, const std::function<void()>& remove) {
  try {
    remove();
  } catch (const core::IoError& e) {
    Logger::Warn("[AssetStateMachine] CLEANUP_FAILED what=" + what +
                 " error=" + e.what());
  }
}

}  // namespace

AssetStateMachine::AssetStateMachine(const core::ExecutorIdentity& identity,
                                     const core::ExecutorConfig& config,
                                     const pipeline::Topology& topology,
                                     IComputePlugin& plugin, cache::IResultStore& store,
                                     pipeline::ITranscoder& transcoder)
    : identity_(identity),
      config_(config),
      topology_(topology),
      plugin_(plugin),
      store_(store),
      transcoder_(transcoder) {}

void AssetStateMachine::Enter(const asset::Asset& a, RunState state) const {
  Logger::Debug("[AssetStateMachine] STATE asset=" + a.Fingerprint() +
                " state=" + RunStateToString(state));
  if (state_observer_) {
    state_observer_(a, state);
  }
}

core::Result AssetStateMachine::Run(const asset::Asset& a) const {
  Enter(a, RunState::kCacheCheck);

  // Held from the cache check through CACHE_SAVE: a racing caller waits and
  // then hits the cache instead of computing again.
  std::unique_ptr<cache::ComputeLease> lease;
  if (config_.race_policy == core::CacheRacePolicy::kExclusiveLease) {
    lease = store_.AcquireComputeLease(a, identity_.Id());
  }

  if (auto hit = store_.Load(a, identity_.Id())) {
    Logger::Info("[AssetStateMachine] CACHE_HIT executor=" + identity_.Id() +
                 " asset=" + a.ToString());
    Enter(a, RunState::kDone);
    return plugin_.PostProcess(std::move(*hit));
  }
  Logger::Info("[AssetStateMachine] CACHE_MISS executor=" + identity_.Id() +
               " asset=" + a.ToString());

  core::Result result = RunMiss(a);
  lease.reset();

  Enter(a, RunState::kDone);
  return plugin_.PostProcess(std::move(result));
}

core::Result AssetStateMachine::RunMiss(const asset::Asset& a) const {
  // No resource is touched before the decision record exists.
  Enter(a, RunState::kValidate);
  topology_.Validate(a);

  Enter(a, RunState::kPathResolve);
  const pipeline::StageDecision decision = topology_.Decide(a);
  const pipeline::RunLayout layout =
      pipeline::RunLayout::Resolve(a, topology_, identity_.Id(), decision);
  const asset::Geometry geometry = *topology_.ComputeGeometry(a);
  const std::string workfile_yuv_type = topology_.WorkfileYuvType(a);
  {
    std::ostringstream oss;
    oss << "[AssetStateMachine] PATHS_RESOLVED asset=" << a.Fingerprint()
        << " run_dir=" << layout.run_dir
        << " use_path_as_workpath=" << (decision.use_path_as_workpath ? "Y" : "N")
        << " use_workpath_as_procpath=" << (decision.use_workpath_as_procpath ? "Y" : "N")
        << " geometry=" << geometry.ToString() << " workfile_fmt=" << workfile_yuv_type;
    Logger::Debug(oss.str());
  }

  pipeline::StageOrchestrator stages(a, topology_, decision, layout, geometry,
                                     workfile_yuv_type, transcoder_, config_);
  if (producer_delay_hook_) {
    stages.SetDelayHook(producer_delay_hook_);
  }
  const RunContext context(a, identity_, topology_, layout, geometry, workfile_yuv_type,
                           config_.optional_params2,
                           [&stages] { stages.RefreshStreams(); });

  RunState state = RunState::kTeardown;
  try {
    Enter(a, state);
    stages.Teardown();

    state = RunState::kOpenTranscode;
    Enter(a, state);
    stages.OpenTranscodeStage();

    state = RunState::kOpenSampleTransform;
    Enter(a, state);
    stages.OpenSampleTransformStage();

    state = RunState::kLogInit;
    Enter(a, state);
    util::MakeDirs(layout.run_dir);
    WriteLogHeader(layout.log_path, identity_.Id());

    state = RunState::kCompute;
    Enter(a, state);
    Logger::Info("[AssetStateMachine] COMPUTE_START executor=" + identity_.Id() +
                 " asset=" + a.ToString());
    plugin_.GenerateResult(context);
    stages.Settle();

    state = RunState::kReadResult;
    Enter(a, state);
    core::Result result = plugin_.ReadResult(context);

    state = RunState::kCacheSave;
    Enter(a, state);
    store_.Save(result);
    if (config_.save_workfiles) {
      for (StreamRole role : topology_.roles()) {
        store_.SaveWorkfile(result, layout.For(role).workfile, role);
      }
    }

    state = RunState::kCleanup;
    Enter(a, state);
    if (config_.delete_workdir) {
      stages.RemoveStagePaths();
      util::RemoveIfExists(layout.log_path);
      if (!util::RemoveDirIfEmpty(layout.run_dir)) {
        Logger::Debug("[AssetStateMachine] RUN_DIR_KEPT path=" + layout.run_dir);
      }
    }
    return result;
  } catch (const std::exception& e) {
    const std::exception_ptr producer_failure = stages.Abort();
    RemoveQuietly("stage_paths", [&stages] { stages.RemoveStagePaths(); });
    RemoveQuietly("log", [&layout] { util::RemoveIfExists(layout.log_path); });
    RemoveQuietly("run_dir", [&layout] { util::RemoveDirIfEmpty(layout.run_dir); });

    Logger::Error("[AssetStateMachine] ASSET_FAILED executor=" + identity_.Id() +
                  " asset=" + a.ToString() + " state=" + RunStateToString(state) +
                  " error=" + e.what());
    // A consumer fed by a failed producer reports a symptom; surface the cause.
    if (producer_failure) {
      std::rethrow_exception(producer_failure);
    }
    throw;
  }
}

}  // namespace vqexec::executor
