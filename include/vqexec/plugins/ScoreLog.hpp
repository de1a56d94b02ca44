// Repository: Retrovue-vqexec
// Component: Score Log
// Purpose: Raw-artifact format shared by the bundled plugins: one line per
//          frame, appended after the executor-id header of the run log.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_PLUGINS_SCORE_LOG_HPP_
#define VQEXEC_PLUGINS_SCORE_LOG_HPP_

#include <string>

#include "vqexec/core/Result.hpp"

namespace vqexec::plugins {

// Appends "frame=<i> <key>=<value> ..." for every frame. All series must have
// the same length. Throws core::ComputeError on mismatch or write failure.
void AppendScoreLines(const std::string& log_path, const core::ScoreMap& scores);

// Parses a run log written by LOG_INIT plus AppendScoreLines. The first line
// must equal `executor_id`. Throws core::ParseError on any deviation.
core::ScoreMap ParseScoreLog(const std::string& log_path, const std::string& executor_id);

}  // namespace vqexec::plugins

#endif  // VQEXEC_PLUGINS_SCORE_LOG_HPP_
