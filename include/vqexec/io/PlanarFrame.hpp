// Repository: Retrovue-vqexec
// Component: Planar Frame
// Purpose: One decoded raw frame as normalized float planes.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_IO_PLANAR_FRAME_HPP_
#define VQEXEC_IO_PLANAR_FRAME_HPP_

#include <cstddef>
#include <vector>

namespace vqexec::io {

// Row-major samples normalized to [0, 1] (sample / (2^bit_depth - 1)).
struct FloatPlane {
  int width = 0;
  int height = 0;
  std::vector<float> samples;

  void Resize(int w, int h) {
    width = w;
    height = h;
    samples.assign(static_cast<size_t>(w) * static_cast<size_t>(h), 0.0f);
  }

  float& at(int x, int y) { return samples[static_cast<size_t>(y) * width + x]; }
  float at(int x, int y) const { return samples[static_cast<size_t>(y) * width + x]; }
};

// Luma plus up to two chroma planes. Gray formats leave u/v empty.
struct PlanarFrame {
  FloatPlane y;
  FloatPlane u;
  FloatPlane v;

  bool HasChroma() const { return !u.samples.empty(); }
};

}  // namespace vqexec::io

#endif  // VQEXEC_IO_PLANAR_FRAME_HPP_
