// Repository: Retrovue-vqexec
// Component: Result
// Purpose: Scores produced by one executor for one asset.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_CORE_RESULT_HPP_
#define VQEXEC_CORE_RESULT_HPP_

#include <map>
#include <string>
#include <vector>

#include "vqexec/asset/Asset.hpp"

namespace vqexec::core {

// Per-frame score series keyed by score name ("psnr_y", "mean_luma", ...).
using ScoreMap = std::map<std::string, std::vector<double>>;

class Result {
 public:
  Result(asset::Asset asset, std::string executor_id, ScoreMap scores);

  const asset::Asset& asset() const { return asset_; }
  const std::string& executor_id() const { return executor_id_; }
  const ScoreMap& scores() const { return scores_; }
  ScoreMap& mutable_scores() { return scores_; }

  bool HasScore(const std::string& key) const;

  // Throws std::out_of_range for an unknown key.
  const std::vector<double>& Scores(const std::string& key) const;

  // Aggregates over the per-frame series. Throws std::out_of_range for an
  // unknown key and std::domain_error for an empty series.
  double Mean(const std::string& key) const;
  double Min(const std::string& key) const;
  double Max(const std::string& key) const;

  // Multi-line human-readable summary for the CLI and logs.
  std::string Summary() const;

 private:
  asset::Asset asset_;
  std::string executor_id_;
  ScoreMap scores_;
};

}  // namespace vqexec::core

#endif  // VQEXEC_CORE_RESULT_HPP_
