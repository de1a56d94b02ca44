// Repository: Retrovue-vqexec
// Component: StageOrchestrator
// Purpose: Open the transcode and sample-transform stages for each role,
//          materialized or streamed.
// Copyright (c) 2026 RetroVue

#include "vqexec/pipeline/StageOrchestrator.hpp"

#include <algorithm>
#include <sstream>
#include <thread>

#include "vqexec/core/Errors.hpp"
#include "vqexec/io/PixelFormat.hpp"
#include "vqexec/io/RawPlaneReader.hpp"
#include "vqexec/util/FileSystem.hpp"
#include "vqexec/util/Logger.hpp"

namespace vqexec::pipeline {

using asset::StreamRole;
using util::Logger;

namespace {

std::string DescribeError(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  }
}

}  // namespace

StageOrchestrator::StageOrchestrator(const asset::Asset& a, const Topology& topology,
                                     const StageDecision& decision,
                                     const RunLayout& layout,
                                     asset::Geometry compute_geometry,
                                     std::string workfile_yuv_type,
                                     ITranscoder& transcoder,
                                     const core::ExecutorConfig& config)
    : asset_(a),
      topology_(topology),
      decision_(decision),
      layout_(layout),
      compute_geometry_(compute_geometry),
      workfile_yuv_type_(std::move(workfile_yuv_type)),
      transcoder_(transcoder),
      config_(config) {}

StageOrchestrator::~StageOrchestrator() {
  if (!producers_.empty()) {
    Abort();
  }
}

std::vector<std::string> StageOrchestrator::OwnedPaths() const {
  // Downstream stage first.
  std::vector<std::string> paths;
  for (StreamRole role : topology_.roles()) {
    if (layout_.OwnsProcfile(role)) paths.push_back(layout_.For(role).procfile);
  }
  for (StreamRole role : topology_.roles()) {
    if (layout_.OwnsWorkfile(role)) paths.push_back(layout_.For(role).workfile);
  }
  return paths;
}

void StageOrchestrator::RemoveStagePaths() {
  if (!producers_.empty()) {
    Abort();
  }
  for (const auto& path : OwnedPaths()) {
    util::RemoveIfExists(path);
  }
}

// Every stale file or pipe of BOTH stages goes before anything is created:
// a stage-2 producer must never open a leftover stage-1 artifact.
void StageOrchestrator::Teardown() {
  RemoveStagePaths();
  Logger::Debug("[StageOrchestrator] TEARDOWN run_dir=" + layout_.run_dir +
                " owned_paths=" + std::to_string(OwnedPaths().size()));
}

TranscodeRequest StageOrchestrator::BuildRequest(StreamRole role) const {
  TranscodeRequest request;
  request.source = asset_.Stream(role);
  request.target_geometry = compute_geometry_;
  request.target_yuv_type = workfile_yuv_type_;
  request.dest_path = layout_.For(role).workfile;
  return request;
}

// =============================================================================
// Stage 1: transcode
// =============================================================================

void StageOrchestrator::TranscodeRole(StreamRole role, const ProcessObserver& on_spawn) {
  transcoder_.Transcode(BuildRequest(role), on_spawn);
}

void StageOrchestrator::OpenTranscodeStage() {
  if (decision_.use_path_as_workpath) {
    Logger::Debug("[StageOrchestrator] STAGE_SKIP stage=transcode");
    return;
  }
  util::MakeDirs(layout_.run_dir);

  if (!config_.fifo_mode) {
    for (StreamRole role : topology_.roles()) {
      TranscodeRole(role, nullptr);
    }
    Logger::Debug("[StageOrchestrator] STAGE_DONE stage=transcode mode=materialized");
    return;
  }

  std::vector<std::string> pipes;
  for (StreamRole role : topology_.roles()) {
    const std::string& workfile = layout_.For(role).workfile;
    StartProducer(std::make_unique<StreamingProducer>(
        std::string("transcode_") + asset::StreamRoleName(role), workfile,
        std::vector<std::string>{workfile},
        [this, role](const ProcessObserver& on_spawn) { TranscodeRole(role, on_spawn); }));
    pipes.push_back(workfile);
  }
  WaitForPipes(pipes, "transcode");
}

// =============================================================================
// Stage 2: per-sample transform (luma only; chroma passes through)
// =============================================================================

void StageOrchestrator::TransformRole(StreamRole role) {
  const StreamPaths& paths = layout_.For(role);
  const auto& callback = asset_.Stream(role).proc_callback;
  const io::PixelFormat format = io::PixelFormat::Lookup(workfile_yuv_type_);

  io::RawPlaneReader reader(paths.workfile, format, compute_geometry_.width,
                            compute_geometry_.height);
  io::RawPlaneWriter writer(paths.procfile, format, compute_geometry_.width,
                            compute_geometry_.height);
  io::PlanarFrame frame;
  while (reader.Next(frame)) {
    if (callback) {
      callback->fn(frame.y);
    }
    writer.Write(frame);
  }
  writer.Close();

  std::ostringstream oss;
  oss << "[StageOrchestrator] TRANSFORM_DONE role=" << asset::StreamRoleName(role)
      << " frames=" << writer.frames_written()
      << " callback=" << (callback ? callback->name : "none");
  Logger::Debug(oss.str());
}

void StageOrchestrator::OpenSampleTransformStage() {
  if (decision_.use_workpath_as_procpath) {
    Logger::Debug("[StageOrchestrator] STAGE_SKIP stage=sample_transform");
    return;
  }
  util::MakeDirs(layout_.run_dir);

  if (!config_.fifo_mode) {
    for (StreamRole role : topology_.roles()) {
      TransformRole(role);
    }
    Logger::Debug(
        "[StageOrchestrator] STAGE_DONE stage=sample_transform mode=materialized");
    return;
  }

  std::vector<std::string> pipes;
  for (StreamRole role : topology_.roles()) {
    const StreamPaths& paths = layout_.For(role);
    StartProducer(std::make_unique<StreamingProducer>(
        std::string("transform_") + asset::StreamRoleName(role), paths.procfile,
        std::vector<std::string>{paths.procfile, paths.workfile},
        [this, role](const ProcessObserver&) { TransformRole(role); }));
    pipes.push_back(paths.procfile);
  }
  WaitForPipes(pipes, "sample_transform");
}

// =============================================================================
// Streaming support
// =============================================================================

void StageOrchestrator::StartProducer(std::unique_ptr<StreamingProducer> producer) {
  producer->Start(delay_hook_);
  producers_.push_back(std::move(producer));
}

void StageOrchestrator::WaitForPipes(const std::vector<std::string>& paths,
                                     const char* stage) {
  const auto interval = std::chrono::milliseconds(config_.fifo_poll_interval_ms);
  for (int attempt = 0; attempt < config_.fifo_poll_retries; ++attempt) {
    // A failed producer has retired its pipe or never created it.
    for (const auto& producer : producers_) {
      if (producer->Finished() && producer->error()) {
        std::rethrow_exception(producer->error());
      }
    }
    const bool all_exist = std::all_of(paths.begin(), paths.end(), util::PathExists);
    if (all_exist) {
      Logger::Debug("[StageOrchestrator] PIPES_READY stage=" + std::string(stage) +
                    " attempts=" + std::to_string(attempt + 1));
      return;
    }
    std::this_thread::sleep_for(interval);
  }

  std::ostringstream oss;
  oss << stage << " pipes did not appear after " << config_.fifo_poll_retries
      << " polls of " << config_.fifo_poll_interval_ms << "ms in " << layout_.run_dir;
  throw core::ResourceTimeoutError(oss.str());
}

void StageOrchestrator::Settle() {
  if (producers_.empty()) return;

  const auto budget = std::chrono::milliseconds(
      static_cast<int64_t>(config_.fifo_poll_retries) * config_.fifo_poll_interval_ms);
  for (const auto& producer : producers_) {
    if (!producer->WaitFor(budget)) {
      const std::string name = producer->name();
      Abort();
      throw core::ResourceTimeoutError("producer " + name +
                                       " still running after its consumer finished");
    }
  }

  std::exception_ptr first;
  for (const auto& producer : producers_) {
    producer->Join();
    if (!first && producer->error()) {
      first = producer->error();
    }
  }
  producers_.clear();
  Logger::Debug("[StageOrchestrator] SETTLED run_dir=" + layout_.run_dir);
  if (first) {
    std::rethrow_exception(first);
  }
}

std::exception_ptr StageOrchestrator::Abort() {
  for (const auto& producer : producers_) {
    producer->RequestAbort();
  }
  std::exception_ptr root_cause;
  for (const auto& producer : producers_) {
    producer->Abandon();
    if (auto error = producer->error()) {
      Logger::Warn("[StageOrchestrator] PRODUCER_ERROR name=" + producer->name() +
                   " unprompted=" + (producer->FailedUnprompted() ? "Y" : "N") +
                   " error=" + DescribeError(error));
      if (!root_cause && producer->FailedUnprompted()) {
        root_cause = error;
      }
    }
  }
  producers_.clear();
  return root_cause;
}

void StageOrchestrator::RefreshStreams() {
  if (!config_.fifo_mode) {
    // Materialized artifacts can simply be read again.
    return;
  }
  Settle();
  Teardown();
  OpenTranscodeStage();
  OpenSampleTransformStage();
  Logger::Debug("[StageOrchestrator] REFRESHED run_dir=" + layout_.run_dir);
}

}  // namespace vqexec::pipeline
