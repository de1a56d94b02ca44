// Repository: Retrovue-vqexec
// Component: Pixel Format
// Purpose: Plane layout of the raw planar sample formats, taken from the
//          libavutil pixel-format descriptors.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_IO_PIXEL_FORMAT_HPP_
#define VQEXEC_IO_PIXEL_FORMAT_HPP_

#include <cstddef>
#include <string>

namespace vqexec::io {

// Layout of one supported raw format: planar YUV (4:2:0, 4:2:2, 4:4:4) or
// gray, 8-bit or little-endian 9..16-bit, no alpha.
class PixelFormat {
 public:
  // Throws core::ConfigurationError for names libavutil does not know or
  // layouts the raw-plane reader cannot handle (packed, RGB, alpha, BE).
  static PixelFormat Lookup(const std::string& name);

  static bool IsSupported(const std::string& name);

  const std::string& name() const { return name_; }
  int bit_depth() const { return bit_depth_; }
  int bytes_per_sample() const { return bytes_per_sample_; }
  int plane_count() const { return plane_count_; }

  // Largest integer sample value: 2^bit_depth - 1.
  int max_value() const { return (1 << bit_depth_) - 1; }

  int PlaneWidth(int plane, int luma_width) const;
  int PlaneHeight(int plane, int luma_height) const;

  size_t PlaneBytes(int plane, int luma_width, int luma_height) const;
  size_t FrameBytes(int luma_width, int luma_height) const;

 private:
  PixelFormat() = default;

  std::string name_;
  int bit_depth_ = 8;
  int bytes_per_sample_ = 1;
  int plane_count_ = 3;
  int log2_chroma_w_ = 1;
  int log2_chroma_h_ = 1;
};

}  // namespace vqexec::io

#endif  // VQEXEC_IO_PIXEL_FORMAT_HPP_
