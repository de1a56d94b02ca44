// Repository: Retrovue-vqexec
// Component: PSNR Plugin
// Purpose: Per-frame luma PSNR between reference and distorted streams.
// Copyright (c) 2026 RetroVue

#include "vqexec/plugins/PsnrPlugin.hpp"

#include <algorithm>
#include <cmath>
#include <vector>

#include "vqexec/core/Errors.hpp"
#include "vqexec/io/PixelFormat.hpp"
#include "vqexec/io/RawPlaneReader.hpp"
#include "vqexec/plugins/ScoreLog.hpp"
#include "vqexec/util/Logger.hpp"

namespace vqexec::plugins {

using asset::StreamRole;

double PsnrPlugin::PsnrFromMse(double mse, int bit_depth) {
  const double ceiling = 6.0 * bit_depth + 12.0;
  if (mse <= 0.0) return ceiling;
  return std::min(ceiling, 10.0 * std::log10(1.0 / mse));
}

void PsnrPlugin::GenerateResult(const executor::RunContext& context) {
  const auto& geometry = context.compute_geometry();
  const io::PixelFormat format = io::PixelFormat::Lookup(context.workfile_yuv_type());

  std::vector<double> psnr;
  try {
    io::RawPlaneReader ref(context.ProcfilePath(StreamRole::kReference), format,
                           geometry.width, geometry.height);
    io::RawPlaneReader dis(context.ProcfilePath(StreamRole::kDistorted), format,
                           geometry.width, geometry.height);
    io::PlanarFrame ref_frame;
    io::PlanarFrame dis_frame;
    while (true) {
      const bool has_ref = ref.Next(ref_frame);
      const bool has_dis = dis.Next(dis_frame);
      if (has_ref != has_dis) {
        throw core::ComputeError("reference and distorted frame counts differ after " +
                                 std::to_string(psnr.size()) + " frames");
      }
      if (!has_ref) break;

      double sum = 0.0;
      const auto& a = ref_frame.y.samples;
      const auto& b = dis_frame.y.samples;
      for (size_t i = 0; i < a.size(); ++i) {
        const double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += d * d;
      }
      psnr.push_back(PsnrFromMse(sum / static_cast<double>(a.size()), format.bit_depth()));
    }
  } catch (const core::IoError& e) {
    throw core::ComputeError(std::string("PSNR input: ") + e.what());
  }

  if (psnr.empty()) {
    throw core::ComputeError("PSNR: no frames in " +
                             context.ProcfilePath(StreamRole::kDistorted));
  }
  AppendScoreLines(context.LogPath(), {{kScoreKey, psnr}});
  util::Logger::Debug("[PsnrPlugin] FRAMES=" + std::to_string(psnr.size()) +
                      " asset=" + context.asset().Fingerprint());
}

core::Result PsnrPlugin::ReadResult(const executor::RunContext& context) {
  core::ScoreMap scores = ParseScoreLog(context.LogPath(), context.executor_id());
  if (scores.count(kScoreKey) == 0) {
    throw core::ParseError(std::string("log has no ") + kScoreKey + " scores: " +
                           context.LogPath());
  }
  return core::Result(context.asset(), context.executor_id(), std::move(scores));
}

}  // namespace vqexec::plugins
