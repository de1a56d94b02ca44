// Repository: Retrovue-vqexec
// Component: Asset
// Purpose: Immutable description of one unit of work (one or two source
//          streams plus processing options) and its canonical string form.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_ASSET_ASSET_HPP_
#define VQEXEC_ASSET_ASSET_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "vqexec/io/PlanarFrame.hpp"

namespace vqexec::asset {

enum class StreamRole { kReference, kDistorted };

// "ref" / "dis". Used in file names, side-artifact tags and log lines.
const char* StreamRoleName(StreamRole role);

// Sample format of encoded (non-raw) inputs; such streams always need the
// transcoder.
inline constexpr const char* kNotYuv = "notyuv";
inline constexpr const char* kDefaultYuvType = "yuv420p";
inline constexpr const char* kDefaultResamplingType = "bicubic";

// Transcoder filters in application order. Keys outside this list are
// rejected at construction.
const std::vector<std::string>& OrderedFilterList();

// Filters that change the picture geometry; configuring one requires an
// explicit compute geometry.
bool IsGeometryFilter(const std::string& key);

struct Geometry {
  int width = 0;
  int height = 0;

  bool operator==(const Geometry& o) const {
    return width == o.width && height == o.height;
  }
  bool operator!=(const Geometry& o) const { return !(*this == o); }

  // "1920x1080"
  std::string ToString() const;
};

// Inclusive frame range [start_frame, end_frame].
struct FrameRange {
  int64_t start_frame = 0;
  int64_t end_frame = 0;

  int64_t FrameCount() const { return end_frame - start_frame + 1; }
};

// Per-sample transform applied to the luma plane by the procfile stage.
// The name is the callback's identity in the asset string.
struct PlaneCallback {
  std::string name;
  std::function<void(io::FloatPlane&)> fn;
};

struct StreamSpec {
  std::string path;
  std::optional<Geometry> geometry;  // Native geometry; required for raw input
  std::string yuv_type = kDefaultYuvType;
  std::optional<FrameRange> frame_range;
  std::map<std::string, std::string> filters;  // key from OrderedFilterList()
  std::string resampling_type = kDefaultResamplingType;
  std::optional<PlaneCallback> proc_callback;

  bool IsRaw() const { return yuv_type != kNotYuv; }

  // Filter argument, or nullptr when the filter is not configured.
  const std::string* Filter(const std::string& key) const;
};

struct AssetSpec {
  std::string dataset;
  int64_t content_id = 0;
  int64_t asset_id = 0;
  std::string workdir;

  std::optional<StreamSpec> reference;  // Absent for no-reference assets
  StreamSpec distorted;

  // Compute ("quality") geometry. When absent it is inherited from the
  // streams' native geometry.
  std::optional<Geometry> quality_geometry;

  // Explicit workfile sample format; forces a transcode when it disagrees
  // with a stream's native format.
  std::optional<std::string> workfile_yuv_type;
};

// Asset is immutable once constructed. Everything a run decides about it
// (stage skipping, paths) lives in a per-run record, never on the asset.
class Asset {
 public:
  // Throws core::ConfigurationError for an empty distorted path or workdir,
  // an unknown filter key, or an inverted/negative frame range.
  explicit Asset(AssetSpec spec);

  const std::string& dataset() const { return spec_.dataset; }
  int64_t content_id() const { return spec_.content_id; }
  int64_t asset_id() const { return spec_.asset_id; }
  const std::string& workdir() const { return spec_.workdir; }
  const AssetSpec& spec() const { return spec_; }

  bool HasStream(StreamRole role) const;

  // Throws core::ConfigurationError when the role is absent.
  const StreamSpec& Stream(StreamRole role) const;

  bool HasExplicitQualityGeometry() const { return spec_.quality_geometry.has_value(); }

  // Explicit compute geometry, else the native geometry shared by every
  // present stream that declares one. nullopt when unknown or ambiguous.
  std::optional<Geometry> QualityGeometry() const;

  const std::optional<std::string>& WorkfileYuvTypeOverride() const {
    return spec_.workfile_yuv_type;
  }

  // Canonical string form. Two assets with equal strings are the same unit of
  // work: they share cache entries, run directories and scheduler locks.
  const std::string& ToString() const { return repr_; }

  // Lowercase hex SHA-1 of ToString().
  const std::string& Fingerprint() const { return fingerprint_; }

 private:
  std::string BuildRepr() const;

  AssetSpec spec_;
  std::string repr_;
  std::string fingerprint_;
};

}  // namespace vqexec::asset

#endif  // VQEXEC_ASSET_ASSET_HPP_
