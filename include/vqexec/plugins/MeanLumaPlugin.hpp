// Repository: Retrovue-vqexec
// Component: Mean Luma Plugin
// Purpose: No-reference per-frame luma statistics, computed in two passes.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_PLUGINS_MEAN_LUMA_PLUGIN_HPP_
#define VQEXEC_PLUGINS_MEAN_LUMA_PLUGIN_HPP_

#include <string>
#include <vector>

#include "vqexec/executor/IComputePlugin.hpp"

namespace vqexec::plugins {

// Pass 1: "mean_luma", the per-frame mean of normalized luma.
// Pass 2 (after RefreshStreams): "luma_deviation", the per-frame mean
// absolute deviation of luma from the clip-level mean of pass 1.
class MeanLumaPlugin : public executor::IComputePlugin {
 public:
  static constexpr const char* kType = "MEAN_LUMA";
  static constexpr const char* kVersion = "1.0";
  static constexpr const char* kMeanKey = "mean_luma";
  static constexpr const char* kDeviationKey = "luma_deviation";

  std::string Type() const override { return kType; }
  std::string Version() const override { return kVersion; }

  void GenerateResult(const executor::RunContext& context) override;
  core::Result ReadResult(const executor::RunContext& context) override;

 private:
  // One full read of the distorted stream; `reduce` maps a luma plane to a
  // per-frame value.
  template <typename Reduce>
  std::vector<double> Pass(const executor::RunContext& context, Reduce reduce) const;
};

}  // namespace vqexec::plugins

#endif  // VQEXEC_PLUGINS_MEAN_LUMA_PLUGIN_HPP_
