// Repository: Retrovue-vqexec
// Component: Topology
// Purpose: Which stream roles a computation consumes, and the stage
//          necessity predicates and preconditions evaluated over them.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_PIPELINE_TOPOLOGY_HPP_
#define VQEXEC_PIPELINE_TOPOLOGY_HPP_

#include <optional>
#include <string>
#include <vector>

#include "vqexec/asset/Asset.hpp"

namespace vqexec::pipeline {

// Per-run stage decision. Computed once before any file is touched and
// never reverted; every later stage and cleanup reads the same record.
struct StageDecision {
  // Source is already a workfile: no transcode stage.
  bool use_path_as_workpath = false;
  // Workfile is already a procfile: no sample-transform stage.
  bool use_workpath_as_procpath = false;
};

// A topology is a value, not a subclass: full-reference computations consume
// {reference, distorted}; no-reference ones consume {distorted} only and
// ignore an asset's reference stream entirely.
class Topology {
 public:
  static Topology FullReference();
  static Topology NoReference();

  const std::vector<asset::StreamRole>& roles() const { return roles_; }
  const char* Name() const;
  bool Requires(asset::StreamRole role) const;

  // Explicit compute geometry, else the native geometry shared by every
  // required stream that declares one. nullopt when unknown or ambiguous.
  std::optional<asset::Geometry> ComputeGeometry(const asset::Asset& a) const;

  // True when any required stream must go through the transcoder: geometry
  // mismatch or unknown, notyuv input, frame range, format override that
  // disagrees, or any configured filter.
  bool NeedsTranscode(const asset::Asset& a) const;

  // True when any required stream has a per-sample callback.
  bool NeedsSampleTransform(const asset::Asset& a) const;

  // Override, else the first raw required stream's format, else yuv420p.
  std::string WorkfileYuvType(const asset::Asset& a) const;

  // Structural preconditions only: roles, geometry, formats, filters.
  // Throws core::ConfigurationError. Needs no file on disk.
  void ValidateStructure(const asset::Asset& a) const;

  // Every required source path (or image-sequence pattern) matches a file.
  // Throws core::ConfigurationError.
  void ValidateSources(const asset::Asset& a) const;

  // ValidateStructure, then ValidateSources. Run on a cache miss before any
  // resource is touched.
  void Validate(const asset::Asset& a) const;

  StageDecision Decide(const asset::Asset& a) const;

 private:
  explicit Topology(std::vector<asset::StreamRole> roles) : roles_(std::move(roles)) {}

  std::vector<asset::StreamRole> roles_;
};

}  // namespace vqexec::pipeline

#endif  // VQEXEC_PIPELINE_TOPOLOGY_HPP_
