// Repository: Retrovue-vqexec
// Component: Pixel Format
// Purpose: Pixel format lookup and frame sizing via libavutil.
// Copyright (c) 2026 RetroVue

#include "vqexec/io/PixelFormat.hpp"

// libavutil headers are C.
extern "C" {
#include <libavutil/pixdesc.h>
#include <libavutil/pixfmt.h>
}

#include "vqexec/core/Errors.hpp"

namespace vqexec::io {

namespace {

// Why a descriptor cannot be read plane-by-plane, or nullptr if it can.
const char* UnsupportedReason(const AVPixFmtDescriptor* desc) {
  if (desc->flags & AV_PIX_FMT_FLAG_RGB) return "RGB layout";
  if (desc->flags & AV_PIX_FMT_FLAG_ALPHA) return "alpha plane";
  if (desc->flags & AV_PIX_FMT_FLAG_BE) return "big-endian samples";
  if (desc->flags & AV_PIX_FMT_FLAG_BITSTREAM) return "bitstream layout";
  if (desc->flags & AV_PIX_FMT_FLAG_PAL) return "palette";
  if (desc->flags & AV_PIX_FMT_FLAG_HWACCEL) return "hardware surface";
  if (desc->nb_components == 3 && !(desc->flags & AV_PIX_FMT_FLAG_PLANAR)) {
    return "packed layout";
  }
  if (desc->nb_components != 1 && desc->nb_components != 3) {
    return "component count";
  }
  // One component per plane, tightly packed.
  for (int c = 0; c < desc->nb_components; ++c) {
    if (desc->comp[c].plane != c || desc->comp[c].offset != 0 ||
        desc->comp[c].shift != 0) {
      return "interleaved components";
    }
  }
  if (desc->comp[0].depth > 16) return "sample depth";
  return nullptr;
}

}  // namespace

PixelFormat PixelFormat::Lookup(const std::string& name) {
  const AVPixelFormat fmt = av_get_pix_fmt(name.c_str());
  if (fmt == AV_PIX_FMT_NONE) {
    throw core::ConfigurationError("unknown sample format '" + name + "'");
  }
  const AVPixFmtDescriptor* desc = av_pix_fmt_desc_get(fmt);
  if (desc == nullptr) {
    throw core::ConfigurationError("no descriptor for sample format '" + name + "'");
  }
  if (const char* reason = UnsupportedReason(desc)) {
    throw core::ConfigurationError("unsupported sample format '" + name +
                                   "': " + reason);
  }

  PixelFormat pf;
  pf.name_ = name;
  pf.bit_depth_ = desc->comp[0].depth;
  pf.bytes_per_sample_ = (pf.bit_depth_ + 7) / 8;
  pf.plane_count_ = desc->nb_components;
  pf.log2_chroma_w_ = desc->log2_chroma_w;
  pf.log2_chroma_h_ = desc->log2_chroma_h;
  return pf;
}

bool PixelFormat::IsSupported(const std::string& name) {
  try {
    Lookup(name);
    return true;
  } catch (const core::ConfigurationError&) {
    return false;
  }
}

int PixelFormat::PlaneWidth(int plane, int luma_width) const {
  if (plane == 0) return luma_width;
  // Same rounding as AV_CEIL_RSHIFT.
  return (luma_width + (1 << log2_chroma_w_) - 1) >> log2_chroma_w_;
}

int PixelFormat::PlaneHeight(int plane, int luma_height) const {
  if (plane == 0) return luma_height;
  return (luma_height + (1 << log2_chroma_h_) - 1) >> log2_chroma_h_;
}

size_t PixelFormat::PlaneBytes(int plane, int luma_width, int luma_height) const {
  return static_cast<size_t>(PlaneWidth(plane, luma_width)) *
         static_cast<size_t>(PlaneHeight(plane, luma_height)) *
         static_cast<size_t>(bytes_per_sample_);
}

size_t PixelFormat::FrameBytes(int luma_width, int luma_height) const {
  size_t total = 0;
  for (int p = 0; p < plane_count_; ++p) {
    total += PlaneBytes(p, luma_width, luma_height);
  }
  return total;
}

}  // namespace vqexec::io
