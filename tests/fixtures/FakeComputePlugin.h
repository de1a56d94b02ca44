// Repository: Retrovue-vqexec
// Component: Fake Compute Plugin
// Purpose: Scripted IComputePlugin for executor contract tests. Reads every
//          required procfile to its end, writes per-frame luma means to the
//          run log, and records what it saw.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_TESTS_FIXTURES_FAKE_COMPUTE_PLUGIN_H_
#define VQEXEC_TESTS_FIXTURES_FAKE_COMPUTE_PLUGIN_H_

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <numeric>
#include <string>
#include <thread>
#include <vector>

#include "vqexec/core/Errors.hpp"
#include "vqexec/executor/IComputePlugin.hpp"
#include "vqexec/io/PixelFormat.hpp"
#include "vqexec/io/RawPlaneReader.hpp"
#include "vqexec/plugins/ScoreLog.hpp"

namespace vqexec::tests::fixtures {

class FakeComputePlugin : public executor::IComputePlugin {
 public:
  static constexpr const char* kDisMeanKey = "dis_mean";
  static constexpr const char* kRefMeanKey = "ref_mean";
  static constexpr const char* kPostKey = "post";

  explicit FakeComputePlugin(std::string type = "FAKE", std::string version = "1.0")
      : type_(std::move(type)), version_(std::move(version)) {}

  std::string Type() const override { return type_; }
  std::string Version() const override { return version_; }

  void GenerateResult(const executor::RunContext& context) override {
    generate_calls_.fetch_add(1);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      for (asset::StreamRole role : context.topology().roles()) {
        procfiles_seen_[role] = context.ProcfilePath(role);
      }
      log_paths_seen_.push_back(context.LogPath());
    }
    if (hold_ms_ > 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(hold_ms_));
    }
    if (fail_compute_) {
      throw core::ComputeError("scripted compute failure");
    }

    core::ScoreMap scores;
    for (int pass = 0; pass < passes_; ++pass) {
      if (pass > 0) {
        context.RefreshStreams();
      }
      core::ScoreMap pass_scores;
      for (asset::StreamRole role : context.topology().roles()) {
        const char* key =
            role == asset::StreamRole::kReference ? kRefMeanKey : kDisMeanKey;
        pass_scores[key] = ReadMeans(context, role);
      }
      if (pass > 0 && pass_scores != scores) {
        throw core::ComputeError("pass " + std::to_string(pass) +
                                 " read different frames than pass 0");
      }
      scores = std::move(pass_scores);
    }
    plugins::AppendScoreLines(context.LogPath(), scores);
  }

  core::Result ReadResult(const executor::RunContext& context) override {
    read_calls_.fetch_add(1);
    core::ScoreMap scores = plugins::ParseScoreLog(context.LogPath(), context.executor_id());
    return core::Result(context.asset(), context.executor_id(), std::move(scores));
  }

  core::Result PostProcess(core::Result result) const override {
    post_process_calls_.fetch_add(1);
    if (add_post_score_) {
      result.mutable_scores()[kPostKey] = {1.0};
    }
    return result;
  }

  // Scripting
  void set_passes(int passes) { passes_ = passes; }
  void set_fail_compute(bool fail) { fail_compute_ = fail; }
  void set_hold_ms(int ms) { hold_ms_ = ms; }
  void set_add_post_score(bool add) { add_post_score_ = add; }

  // Observations
  int generate_calls() const { return generate_calls_.load(); }
  int read_calls() const { return read_calls_.load(); }
  int post_process_calls() const { return post_process_calls_.load(); }

  std::string ProcfileSeen(asset::StreamRole role) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = procfiles_seen_.find(role);
    return it == procfiles_seen_.end() ? std::string() : it->second;
  }

  std::vector<std::string> LogPathsSeen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_paths_seen_;
  }

 private:
  static std::vector<double> ReadMeans(const executor::RunContext& context,
                                       asset::StreamRole role) {
    const auto& g = context.compute_geometry();
    const io::PixelFormat format = io::PixelFormat::Lookup(context.workfile_yuv_type());
    std::vector<double> means;
    try {
      io::RawPlaneReader reader(context.ProcfilePath(role), format, g.width, g.height);
      io::PlanarFrame frame;
      while (reader.Next(frame)) {
        const auto& s = frame.y.samples;
        means.push_back(std::accumulate(s.begin(), s.end(), 0.0) /
                        static_cast<double>(s.size()));
      }
    } catch (const core::IoError& e) {
      throw core::ComputeError(std::string("fake plugin input: ") + e.what());
    }
    if (means.empty()) {
      throw core::ComputeError("fake plugin: no frames in " + context.ProcfilePath(role));
    }
    return means;
  }

  const std::string type_;
  const std::string version_;

  int passes_ = 1;
  bool fail_compute_ = false;
  int hold_ms_ = 0;
  bool add_post_score_ = false;

  std::atomic<int> generate_calls_{0};
  std::atomic<int> read_calls_{0};
  mutable std::atomic<int> post_process_calls_{0};

  mutable std::mutex mutex_;
  std::map<asset::StreamRole, std::string> procfiles_seen_;  // Guarded by mutex_
  std::vector<std::string> log_paths_seen_;                  // Guarded by mutex_
};

}  // namespace vqexec::tests::fixtures

#endif  // VQEXEC_TESTS_FIXTURES_FAKE_COMPUTE_PLUGIN_H_
