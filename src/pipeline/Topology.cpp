// Repository: Retrovue-vqexec
// Component: Topology
// Purpose: Required roles and asset validation for a quality model.
// Copyright (c) 2026 RetroVue

#include "vqexec/pipeline/Topology.hpp"

#include <algorithm>

#include "vqexec/core/Errors.hpp"
#include "vqexec/io/PixelFormat.hpp"
#include "vqexec/util/FileSystem.hpp"

namespace vqexec::pipeline {

using asset::Asset;
using asset::Geometry;
using asset::StreamRole;
using asset::StreamSpec;

Topology Topology::FullReference() {
  return Topology({StreamRole::kReference, StreamRole::kDistorted});
}

Topology Topology::NoReference() {
  return Topology({StreamRole::kDistorted});
}

const char* Topology::Name() const {
  return roles_.size() == 1 ? "no_reference" : "full_reference";
}

bool Topology::Requires(StreamRole role) const {
  return std::find(roles_.begin(), roles_.end(), role) != roles_.end();
}

std::optional<Geometry> Topology::ComputeGeometry(const Asset& a) const {
  if (a.HasExplicitQualityGeometry()) return a.spec().quality_geometry;

  std::optional<Geometry> inherited;
  for (StreamRole role : roles_) {
    if (!a.HasStream(role)) continue;
    const auto& native = a.Stream(role).geometry;
    if (!native) continue;
    if (!inherited) {
      inherited = native;
    } else if (*inherited != *native) {
      return std::nullopt;
    }
  }
  return inherited;
}

bool Topology::NeedsTranscode(const Asset& a) const {
  const auto compute = ComputeGeometry(a);
  const auto& override_type = a.WorkfileYuvTypeOverride();

  for (StreamRole role : roles_) {
    const StreamSpec& s = a.Stream(role);
    if (!compute || !s.geometry || *s.geometry != *compute) return true;
    if (!s.IsRaw()) return true;
    if (s.frame_range) return true;
    if (override_type && *override_type != s.yuv_type) return true;
    for (const auto& key : asset::OrderedFilterList()) {
      if (s.Filter(key) != nullptr) return true;
    }
  }
  return false;
}

bool Topology::NeedsSampleTransform(const Asset& a) const {
  for (StreamRole role : roles_) {
    if (a.Stream(role).proc_callback) return true;
  }
  return false;
}

std::string Topology::WorkfileYuvType(const Asset& a) const {
  if (const auto& override_type = a.WorkfileYuvTypeOverride()) return *override_type;
  for (StreamRole role : roles_) {
    const StreamSpec& s = a.Stream(role);
    if (s.IsRaw()) return s.yuv_type;
  }
  return asset::kDefaultYuvType;
}

void Topology::ValidateStructure(const Asset& a) const {
  const std::string where = " (" + a.ToString() + ")";

  for (StreamRole role : roles_) {
    if (!a.HasStream(role)) {
      throw core::ConfigurationError(std::string(Name()) + " computation requires a " +
                                     asset::StreamRoleName(role) + " stream" + where);
    }
  }

  if (!ComputeGeometry(a)) {
    throw core::ConfigurationError(
        "compute geometry unknown: set quality geometry or matching native geometry" +
        where);
  }

  std::optional<std::string> raw_type;
  for (StreamRole role : roles_) {
    const StreamSpec& s = a.Stream(role);
    const char* name = asset::StreamRoleName(role);

    for (const auto& [key, value] : s.filters) {
      if (asset::IsGeometryFilter(key) && !a.HasExplicitQualityGeometry()) {
        throw core::ConfigurationError(std::string(name) + " stream uses '" + key +
                                       "': quality geometry must be explicit" + where);
      }
    }

    if (s.IsRaw()) {
      if (!s.geometry) {
        throw core::ConfigurationError(std::string(name) +
                                       " stream is raw but has no native geometry" +
                                       where);
      }
      if (!io::PixelFormat::IsSupported(s.yuv_type)) {
        throw core::ConfigurationError(std::string(name) + " stream format '" +
                                       s.yuv_type + "' is not supported" + where);
      }
      if (raw_type && *raw_type != s.yuv_type && !a.WorkfileYuvTypeOverride()) {
        throw core::ConfigurationError("stream formats differ (" + *raw_type + " vs " +
                                       s.yuv_type +
                                       ") and no workfile format override is set" +
                                       where);
      }
      raw_type = s.yuv_type;
    }
  }

  const std::string wf_type = WorkfileYuvType(a);
  if (!io::PixelFormat::IsSupported(wf_type)) {
    throw core::ConfigurationError("workfile format '" + wf_type +
                                   "' is not supported" + where);
  }
}

void Topology::ValidateSources(const Asset& a) const {
  for (StreamRole role : roles_) {
    const StreamSpec& s = a.Stream(role);
    if (!util::MatchAnyFiles(s.path)) {
      throw core::ConfigurationError(std::string(asset::StreamRoleName(role)) +
                                     " source does not exist: " + s.path);
    }
  }
}

void Topology::Validate(const Asset& a) const {
  ValidateStructure(a);
  ValidateSources(a);
}

StageDecision Topology::Decide(const Asset& a) const {
  StageDecision d;
  d.use_path_as_workpath = !NeedsTranscode(a);
  d.use_workpath_as_procpath = !NeedsSampleTransform(a);
  return d;
}

}  // namespace vqexec::pipeline
