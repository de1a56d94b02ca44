// Repository: Retrovue-vqexec
// Component: Transcoder Interface
// Purpose: Contract of the external tool that turns a source stream into a
//          raw planar workfile at the compute geometry and format.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_PIPELINE_I_TRANSCODER_HPP_
#define VQEXEC_PIPELINE_I_TRANSCODER_HPP_

#include <sys/types.h>

#include <functional>
#include <string>

#include "vqexec/asset/Asset.hpp"

namespace vqexec::pipeline {

struct TranscodeRequest {
  asset::StreamSpec source;         // Path, native format/geometry, range, filters
  asset::Geometry target_geometry;  // Compute geometry
  std::string target_yuv_type;      // Workfile format
  std::string dest_path;            // Regular file or named pipe
};

// Called with the child pid once the transcoder process is running, so a
// supervisor can terminate it.
using ProcessObserver = std::function<void(pid_t pid)>;

class ITranscoder {
 public:
  virtual ~ITranscoder() = default;

  // Throws core::MissingDependencyError when the tool cannot be run.
  virtual void EnsureAvailable() = 0;

  // Blocks until the destination is fully written. Throws
  // core::ExternalProcessError on a nonzero exit.
  virtual void Transcode(const TranscodeRequest& request,
                         const ProcessObserver& on_spawn = nullptr) = 0;
};

}  // namespace vqexec::pipeline

#endif  // VQEXEC_PIPELINE_I_TRANSCODER_HPP_
