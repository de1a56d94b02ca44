// Repository: Retrovue-vqexec
// Component: Mean Luma Plugin
// Purpose: No-reference mean luma and deviation over two passes.
// Copyright (c) 2026 RetroVue

#include "vqexec/plugins/MeanLumaPlugin.hpp"

#include <cmath>
#include <numeric>

#include "vqexec/core/Errors.hpp"
#include "vqexec/io/PixelFormat.hpp"
#include "vqexec/io/RawPlaneReader.hpp"
#include "vqexec/plugins/ScoreLog.hpp"

namespace vqexec::plugins {

using asset::StreamRole;

template <typename Reduce>
std::vector<double> MeanLumaPlugin::Pass(const executor::RunContext& context,
                                         Reduce reduce) const {
  const auto& geometry = context.compute_geometry();
  const io::PixelFormat format = io::PixelFormat::Lookup(context.workfile_yuv_type());
  const std::string& path = context.ProcfilePath(StreamRole::kDistorted);

  std::vector<double> values;
  try {
    io::RawPlaneReader reader(path, format, geometry.width, geometry.height);
    io::PlanarFrame frame;
    while (reader.Next(frame)) {
      values.push_back(reduce(frame.y));
    }
  } catch (const core::IoError& e) {
    throw core::ComputeError(std::string("mean luma input: ") + e.what());
  }
  if (values.empty()) {
    throw core::ComputeError("mean luma: no frames in " + path);
  }
  return values;
}

void MeanLumaPlugin::GenerateResult(const executor::RunContext& context) {
  const std::vector<double> means = Pass(context, [](const io::FloatPlane& y) {
    return std::accumulate(y.samples.begin(), y.samples.end(), 0.0) /
           static_cast<double>(y.samples.size());
  });
  const double clip_mean = std::accumulate(means.begin(), means.end(), 0.0) /
                           static_cast<double>(means.size());

  // Pipes can only be read once.
  context.RefreshStreams();

  const std::vector<double> deviations = Pass(context, [clip_mean](const io::FloatPlane& y) {
    double sum = 0.0;
    for (float s : y.samples) sum += std::fabs(static_cast<double>(s) - clip_mean);
    return sum / static_cast<double>(y.samples.size());
  });
  if (deviations.size() != means.size()) {
    throw core::ComputeError("mean luma: second pass read " +
                             std::to_string(deviations.size()) + " frames, first pass " +
                             std::to_string(means.size()));
  }

  AppendScoreLines(context.LogPath(), {{kMeanKey, means}, {kDeviationKey, deviations}});
}

core::Result MeanLumaPlugin::ReadResult(const executor::RunContext& context) {
  core::ScoreMap scores = ParseScoreLog(context.LogPath(), context.executor_id());
  if (scores.count(kMeanKey) == 0 || scores.count(kDeviationKey) == 0) {
    throw core::ParseError("log lacks mean luma scores: " + context.LogPath());
  }
  return core::Result(context.asset(), context.executor_id(), std::move(scores));
}

}  // namespace vqexec::plugins
