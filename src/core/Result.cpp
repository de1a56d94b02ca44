// Repository: Retrovue-vqexec
// Component: Result
// Purpose: Per-frame score series and their aggregates.
// Copyright (c) 2026 RetroVue

#include "vqexec/core/Result.hpp"

#include <algorithm>
#include <iomanip>
#include <numeric>
#include <sstream>
#include <stdexcept>

namespace vqexec::core {

namespace {

const std::vector<double>& NonEmpty(const Result& r, const std::string& key) {
  const auto& series = r.Scores(key);
  if (series.empty()) {
    throw std::domain_error("score series '" + key + "' is empty");
  }
  return series;
}

}  // namespace

Result::Result(asset::Asset asset, std::string executor_id, ScoreMap scores)
    : asset_(std::move(asset)),
      executor_id_(std::move(executor_id)),
      scores_(std::move(scores)) {}

bool Result::HasScore(const std::string& key) const {
  return scores_.count(key) != 0;
}

const std::vector<double>& Result::Scores(const std::string& key) const {
  auto it = scores_.find(key);
  if (it == scores_.end()) {
    throw std::out_of_range("no score '" + key + "' in result for " +
                            asset_.ToString());
  }
  return it->second;
}

double Result::Mean(const std::string& key) const {
  const auto& series = NonEmpty(*this, key);
  return std::accumulate(series.begin(), series.end(), 0.0) /
         static_cast<double>(series.size());
}

double Result::Min(const std::string& key) const {
  const auto& series = NonEmpty(*this, key);
  return *std::min_element(series.begin(), series.end());
}

double Result::Max(const std::string& key) const {
  const auto& series = NonEmpty(*this, key);
  return *std::max_element(series.begin(), series.end());
}

std::string Result::Summary() const {
  std::ostringstream oss;
  oss << "asset=" << asset_.ToString() << "\n";
  oss << "executor=" << executor_id_ << "\n";
  oss << std::fixed << std::setprecision(6);
  for (const auto& [key, series] : scores_) {
    oss << key << ": frames=" << series.size();
    if (!series.empty()) {
      oss << " mean=" << Mean(key) << " min=" << Min(key) << " max=" << Max(key);
    }
    oss << "\n";
  }
  return oss.str();
}

}  // namespace vqexec::core
