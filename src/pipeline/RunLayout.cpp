// Repository: Retrovue-vqexec
// Component: Run Layout
// Purpose: Resolve per-run scratch paths and which of them a run owns.
// Copyright (c) 2026 RetroVue

#include "vqexec/pipeline/RunLayout.hpp"

namespace vqexec::pipeline {

bool RunLayout::OwnsWorkfile(asset::StreamRole role) const {
  const auto& p = For(role);
  return p.workfile != p.source;
}

bool RunLayout::OwnsProcfile(asset::StreamRole role) const {
  const auto& p = For(role);
  return p.procfile != p.workfile;
}

RunLayout RunLayout::Resolve(const asset::Asset& a, const Topology& topology,
                             const std::string& executor_id,
                             const StageDecision& decision) {
  RunLayout layout;
  layout.run_dir = a.workdir() + "/" + executor_id + "_" + a.Fingerprint();
  layout.log_path = layout.run_dir + "/" + executor_id + ".log";

  for (asset::StreamRole role : topology.roles()) {
    const std::string tag = asset::StreamRoleName(role);
    StreamPaths paths;
    paths.source = a.Stream(role).path;
    paths.workfile = decision.use_path_as_workpath
                         ? paths.source
                         : layout.run_dir + "/" + tag + "_workfile.yuv";
    paths.procfile = decision.use_workpath_as_procpath
                         ? paths.workfile
                         : layout.run_dir + "/" + tag + "_procfile.yuv";
    layout.streams.emplace(role, std::move(paths));
  }
  return layout;
}

}  // namespace vqexec::pipeline
