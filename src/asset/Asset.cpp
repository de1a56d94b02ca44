// Repository: Retrovue-vqexec
// Component: Asset
// Purpose: Asset validation, stream lookup and the canonical repr that
//          fingerprints an asset.
// Copyright (c) 2026 RetroVue

#include "vqexec/asset/Asset.hpp"

#include <algorithm>
#include <sstream>

#include "vqexec/core/Errors.hpp"
#include "vqexec/util/FileSystem.hpp"
#include "vqexec/util/Hash.hpp"

namespace vqexec::asset {

const char* StreamRoleName(StreamRole role) {
  switch (role) {
    case StreamRole::kReference:
      return "ref";
    case StreamRole::kDistorted:
      return "dis";
  }
  return "unknown";
}

const std::vector<std::string>& OrderedFilterList() {
  static const std::vector<std::string> kFilters = {
      "crop", "pad", "gblur", "eq", "lutyuv"};
  return kFilters;
}

bool IsGeometryFilter(const std::string& key) {
  return key == "crop" || key == "pad";
}

std::string Geometry::ToString() const {
  return std::to_string(width) + "x" + std::to_string(height);
}

const std::string* StreamSpec::Filter(const std::string& key) const {
  auto it = filters.find(key);
  return it == filters.end() ? nullptr : &it->second;
}

namespace {

void ValidateStreamSpec(const char* role, const StreamSpec& stream) {
  if (stream.path.empty()) {
    throw core::ConfigurationError(std::string(role) + " stream path is empty");
  }
  const auto& known = OrderedFilterList();
  for (const auto& [key, value] : stream.filters) {
    if (std::find(known.begin(), known.end(), key) == known.end()) {
      throw core::ConfigurationError(std::string(role) + " stream: unknown filter '" +
                                     key + "'");
    }
  }
  if (stream.frame_range) {
    const auto& r = *stream.frame_range;
    if (r.start_frame < 0 || r.end_frame < r.start_frame) {
      throw core::ConfigurationError(
          std::string(role) + " stream: invalid frame range [" +
          std::to_string(r.start_frame) + "," + std::to_string(r.end_frame) + "]");
    }
  }
  if (stream.geometry &&
      (stream.geometry->width <= 0 || stream.geometry->height <= 0)) {
    throw core::ConfigurationError(std::string(role) + " stream: invalid geometry " +
                                   stream.geometry->ToString());
  }
}

// Options that differ from the defaults, in a fixed order. Defaults render as
// nothing so adding a new option never changes existing fingerprints.
void AppendStreamOptions(std::ostringstream& oss, const char* role,
                         const StreamSpec& stream) {
  if (stream.yuv_type != kDefaultYuvType) {
    oss << "_" << role << "fmt" << stream.yuv_type;
  }
  if (stream.frame_range) {
    oss << "_" << role << "frames" << stream.frame_range->start_frame << "to"
        << stream.frame_range->end_frame;
  }
  for (const auto& key : OrderedFilterList()) {
    if (const std::string* value = stream.Filter(key)) {
      oss << "_" << role << key << *value;
    }
  }
  if (stream.resampling_type != kDefaultResamplingType) {
    oss << "_" << role << "rs" << stream.resampling_type;
  }
  if (stream.proc_callback) {
    oss << "_" << role << "proc" << stream.proc_callback->name;
  }
}

std::string DescribeStream(const StreamSpec& stream) {
  std::string text = util::BaseName(stream.path);
  if (stream.geometry) {
    text += "_" + stream.geometry->ToString();
  } else if (!stream.IsRaw()) {
    text += "_" + std::string(kNotYuv);
  }
  return text;
}

}  // namespace

Asset::Asset(AssetSpec spec) : spec_(std::move(spec)) {
  if (spec_.workdir.empty()) {
    throw core::ConfigurationError("asset workdir is empty");
  }
  if (spec_.reference) {
    ValidateStreamSpec("ref", *spec_.reference);
  }
  ValidateStreamSpec("dis", spec_.distorted);
  if (spec_.quality_geometry &&
      (spec_.quality_geometry->width <= 0 || spec_.quality_geometry->height <= 0)) {
    throw core::ConfigurationError("invalid quality geometry " +
                                   spec_.quality_geometry->ToString());
  }

  repr_ = BuildRepr();
  fingerprint_ = util::Sha1Hex(repr_);
}

bool Asset::HasStream(StreamRole role) const {
  return role == StreamRole::kDistorted || spec_.reference.has_value();
}

const StreamSpec& Asset::Stream(StreamRole role) const {
  if (role == StreamRole::kDistorted) return spec_.distorted;
  if (!spec_.reference) {
    throw core::ConfigurationError("asset " + repr_ + " has no reference stream");
  }
  return *spec_.reference;
}

std::optional<Geometry> Asset::QualityGeometry() const {
  if (spec_.quality_geometry) return spec_.quality_geometry;

  std::optional<Geometry> inherited;
  auto merge = [&inherited](const StreamSpec& stream) -> bool {
    if (!stream.geometry) return true;
    if (!inherited) {
      inherited = stream.geometry;
      return true;
    }
    return *inherited == *stream.geometry;
  };
  if (spec_.reference && !merge(*spec_.reference)) return std::nullopt;
  if (!merge(spec_.distorted)) return std::nullopt;
  return inherited;
}

std::string Asset::BuildRepr() const {
  std::ostringstream oss;
  oss << spec_.dataset << "_" << spec_.content_id << "_" << spec_.asset_id << "_";
  if (spec_.reference) {
    oss << DescribeStream(*spec_.reference) << "_vs_";
  }
  oss << DescribeStream(spec_.distorted);

  if (auto q = QualityGeometry()) {
    oss << "_q_" << q->ToString();
  }
  if (spec_.reference) {
    AppendStreamOptions(oss, "ref", *spec_.reference);
  }
  AppendStreamOptions(oss, "dis", spec_.distorted);
  if (spec_.workfile_yuv_type) {
    oss << "_wf" << *spec_.workfile_yuv_type;
  }
  return oss.str();
}

}  // namespace vqexec::asset
