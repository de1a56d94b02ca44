// Repository: Retrovue-vqexec
// Component: Run Layout
// Purpose: Derived paths for one (executor, asset) run.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_PIPELINE_RUN_LAYOUT_HPP_
#define VQEXEC_PIPELINE_RUN_LAYOUT_HPP_

#include <map>
#include <string>

#include "vqexec/asset/Asset.hpp"
#include "vqexec/pipeline/Topology.hpp"

namespace vqexec::pipeline {

struct StreamPaths {
  std::string source;
  std::string workfile;  // == source when the transcode stage is skipped
  std::string procfile;  // == workfile when the sample-transform stage is skipped
};

// Layout of one run:
//
//   {workdir}/{executor_id}_{fingerprint}/            run_dir
//   {run_dir}/{executor_id}.log                       log_path
//   {run_dir}/{ref|dis}_workfile.yuv                  (transcode stage)
//   {run_dir}/{ref|dis}_procfile.yuv                  (sample-transform stage)
struct RunLayout {
  std::string run_dir;
  std::string log_path;
  std::map<asset::StreamRole, StreamPaths> streams;  // Required roles only

  // Throws std::out_of_range for a role the topology does not require.
  const StreamPaths& For(asset::StreamRole role) const { return streams.at(role); }

  bool Requires(asset::StreamRole role) const { return streams.count(role) != 0; }

  // True when the workfile is a distinct artifact this run creates.
  bool OwnsWorkfile(asset::StreamRole role) const;
  // True when the procfile is a distinct artifact this run creates.
  bool OwnsProcfile(asset::StreamRole role) const;

  static RunLayout Resolve(const asset::Asset& a, const Topology& topology,
                           const std::string& executor_id,
                           const StageDecision& decision);
};

}  // namespace vqexec::pipeline

#endif  // VQEXEC_PIPELINE_RUN_LAYOUT_HPP_
