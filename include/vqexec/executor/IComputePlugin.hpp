// Repository: Retrovue-vqexec
// Component: Compute Plugin Interface
// Purpose: The delegated computation: generate a raw artifact from prepared
//          streams, parse it into a Result, optionally post-process.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_EXECUTOR_I_COMPUTE_PLUGIN_HPP_
#define VQEXEC_EXECUTOR_I_COMPUTE_PLUGIN_HPP_

#include <functional>
#include <string>

#include "vqexec/asset/Asset.hpp"
#include "vqexec/core/ExecutorIdentity.hpp"
#include "vqexec/core/Result.hpp"
#include "vqexec/pipeline/RunLayout.hpp"
#include "vqexec/pipeline/Topology.hpp"

namespace vqexec::executor {

// Everything a plugin may see about one run. Valid only for the duration of
// the GenerateResult / ReadResult call it is passed to.
class RunContext {
 public:
  using RefreshFn = std::function<void()>;

  RunContext(const asset::Asset& a, const core::ExecutorIdentity& identity,
             const pipeline::Topology& topology, const pipeline::RunLayout& layout,
             asset::Geometry compute_geometry, std::string workfile_yuv_type,
             const core::OptionalParams& optional_params2, RefreshFn refresh)
      : asset_(a),
        identity_(identity),
        topology_(topology),
        layout_(layout),
        compute_geometry_(compute_geometry),
        workfile_yuv_type_(std::move(workfile_yuv_type)),
        optional_params2_(optional_params2),
        refresh_(std::move(refresh)) {}

  const asset::Asset& asset() const { return asset_; }
  const std::string& executor_id() const { return identity_.Id(); }
  const core::ExecutorIdentity& identity() const { return identity_; }
  const pipeline::Topology& topology() const { return topology_; }
  const pipeline::RunLayout& layout() const { return layout_; }
  const asset::Geometry& compute_geometry() const { return compute_geometry_; }
  const std::string& workfile_yuv_type() const { return workfile_yuv_type_; }

  // Identity parameters (part of the executor id).
  const core::OptionalParams& optional_params() const { return identity_.params(); }
  // Non-identity parameters (never part of the executor id).
  const core::OptionalParams& optional_params2() const { return optional_params2_; }

  // Stream the plugin reads for a role: workfile_yuv_type at compute_geometry.
  const std::string& ProcfilePath(asset::StreamRole role) const {
    return layout_.For(role).procfile;
  }

  // Raw-artifact file. Starts with the executor id and a blank line; plugins
  // append their output after it.
  const std::string& LogPath() const { return layout_.log_path; }

  // Re-opens every stream from its first frame. Required between passes in
  // streaming mode; a no-op in materialized mode.
  void RefreshStreams() const {
    if (refresh_) refresh_();
  }

 private:
  const asset::Asset& asset_;
  const core::ExecutorIdentity& identity_;
  const pipeline::Topology& topology_;
  const pipeline::RunLayout& layout_;
  const asset::Geometry compute_geometry_;
  const std::string workfile_yuv_type_;
  const core::OptionalParams& optional_params2_;
  RefreshFn refresh_;
};

// Implementations are shared by all scheduler workers and must tolerate
// concurrent calls for different assets. In streaming mode every stream must
// be read to its end (or RefreshStreams() called) before GenerateResult
// returns.
class IComputePlugin {
 public:
  virtual ~IComputePlugin() = default;

  virtual std::string Type() const = 0;
  virtual std::string Version() const = 0;

  // Throws core::ComputeError.
  virtual void GenerateResult(const RunContext& context) = 0;

  // Throws core::ParseError.
  virtual core::Result ReadResult(const RunContext& context) = 0;

  // Applied on both cache hits and fresh results; never stored.
  virtual core::Result PostProcess(core::Result result) const { return result; }
};

}  // namespace vqexec::executor

#endif  // VQEXEC_EXECUTOR_I_COMPUTE_PLUGIN_HPP_
