// Repository: Retrovue-vqexec
// Component: PSNR Plugin
// Purpose: Full-reference per-frame luma PSNR.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_PLUGINS_PSNR_PLUGIN_HPP_
#define VQEXEC_PLUGINS_PSNR_PLUGIN_HPP_

#include <string>

#include "vqexec/executor/IComputePlugin.hpp"

namespace vqexec::plugins {

// Score key "psnr_y". Identical frames score the format's ceiling,
// 6 * bit_depth + 12 dB (60 dB at 8 bits).
class PsnrPlugin : public executor::IComputePlugin {
 public:
  static constexpr const char* kType = "PSNR";
  static constexpr const char* kVersion = "1.0";
  static constexpr const char* kScoreKey = "psnr_y";

  std::string Type() const override { return kType; }
  std::string Version() const override { return kVersion; }

  void GenerateResult(const executor::RunContext& context) override;
  core::Result ReadResult(const executor::RunContext& context) override;

  // PSNR in dB for a normalized mean squared error, capped at the ceiling.
  static double PsnrFromMse(double mse, int bit_depth);
};

}  // namespace vqexec::plugins

#endif  // VQEXEC_PLUGINS_PSNR_PLUGIN_HPP_
