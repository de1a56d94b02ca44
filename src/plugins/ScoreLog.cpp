// Repository: Retrovue-vqexec
// Component: Score Log
// Purpose: Append per-frame score lines to a run log and parse them back,
//          checking the executor id header and frame ordering.
// Copyright (c) 2026 RetroVue

#include "vqexec/plugins/ScoreLog.hpp"

#include <fstream>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "vqexec/core/Errors.hpp"

namespace vqexec::plugins {

namespace {

// Unsigned decimal only: a sign, fraction or exponent is malformed.
size_t ParseFrameIndex(const std::string& text, const std::string& where) {
  if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
    throw core::ParseError("malformed frame index '" + text + "' at " + where);
  }
  unsigned long long index = 0;
  try {
    index = std::stoull(text);
  } catch (const std::out_of_range&) {
    throw core::ParseError("frame index '" + text + "' out of range at " + where);
  }
  if (index > std::numeric_limits<size_t>::max()) {
    throw core::ParseError("frame index '" + text + "' out of range at " + where);
  }
  return static_cast<size_t>(index);
}

}  // namespace

void AppendScoreLines(const std::string& log_path, const core::ScoreMap& scores) {
  size_t frames = 0;
  bool first = true;
  for (const auto& [key, series] : scores) {
    if (first) {
      frames = series.size();
      first = false;
    } else if (series.size() != frames) {
      throw core::ComputeError("score series '" + key + "' has " +
                               std::to_string(series.size()) + " frames, expected " +
                               std::to_string(frames));
    }
  }

  std::ofstream out(log_path, std::ios::app);
  if (!out) {
    throw core::ComputeError("cannot append to log " + log_path);
  }
  out << std::setprecision(std::numeric_limits<double>::max_digits10);
  for (size_t i = 0; i < frames; ++i) {
    out << "frame=" << i;
    for (const auto& [key, series] : scores) {
      out << ' ' << key << '=' << series[i];
    }
    out << '\n';
  }
  out.flush();
  if (!out) {
    throw core::ComputeError("write failed on log " + log_path);
  }
}

core::ScoreMap ParseScoreLog(const std::string& log_path, const std::string& executor_id) {
  std::ifstream in(log_path);
  if (!in) {
    throw core::ParseError("cannot open log " + log_path);
  }

  std::string line;
  if (!std::getline(in, line) || line != executor_id) {
    throw core::ParseError("log " + log_path + " does not start with executor id " +
                           executor_id);
  }

  core::ScoreMap scores;
  size_t expected_frame = 0;
  size_t line_no = 1;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) continue;

    const std::string where = log_path + ":" + std::to_string(line_no);
    std::istringstream fields(line);
    std::string field;
    bool saw_frame = false;
    while (fields >> field) {
      const auto eq = field.find('=');
      if (eq == std::string::npos || eq == 0) {
        throw core::ParseError("malformed field '" + field + "' at " + where);
      }
      const std::string key = field.substr(0, eq);
      const std::string text = field.substr(eq + 1);
      if (key == "frame") {
        if (ParseFrameIndex(text, where) != expected_frame) {
          throw core::ParseError("expected frame " + std::to_string(expected_frame) +
                                 " at " + where);
        }
        saw_frame = true;
        continue;
      }
      size_t consumed = 0;
      double value = 0.0;
      try {
        value = std::stod(text, &consumed);
      } catch (const std::logic_error&) {
        consumed = 0;
      }
      if (consumed != text.size() || text.empty()) {
        throw core::ParseError("non-numeric value '" + text + "' at " + where);
      }

      scores[key].push_back(value);
    }
    if (!saw_frame) {
      throw core::ParseError("missing frame index at " + where);
    }
    ++expected_frame;
  }

  for (const auto& [key, series] : scores) {
    if (series.size() != expected_frame) {
      throw core::ParseError("score '" + key + "' missing on some frames in " + log_path);
    }
  }
  return scores;
}

}  // namespace vqexec::plugins
