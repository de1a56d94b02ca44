// Repository: Retrovue-vqexec
// Component: Streaming Contract Tests
// Purpose: Executor::Run with stages streamed through named pipes: producer
//          lifecycle, re-reading via refresh, pipe timeouts, and failure
//          attribution between producers and the consumer.
// Copyright (c) 2026 RetroVue

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

#include "contracts/ExecutorContractFixture.h"
#include "vqexec/core/Errors.hpp"
#include "vqexec/plugins/MeanLumaPlugin.hpp"
#include "vqexec/plugins/PsnrPlugin.hpp"

namespace vqexec::tests::contracts {
namespace {

using asset::Asset;
using asset::StreamRole;
using fixtures::FakeComputePlugin;

double RampMean(int base, int frame) { return (base + frame + 11.0) / 255.0; }

std::vector<double> Ramp(int base) {
  return {RampMean(base, 0), RampMean(base, 1), RampMean(base, 2), RampMean(base, 3)};
}

std::vector<double> InvertedRamp(int base) {
  std::vector<double> out = Ramp(base);
  for (double& v : out) v = 1.0 - v;
  return out;
}

void ExpectSeries(const std::vector<double>& actual, const std::vector<double>& expected) {
  ASSERT_EQ(actual.size(), expected.size());
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_NEAR(actual[i], expected[i], 1e-6) << "frame " << i;
  }
}

class StreamingExecutorTest : public ExecutorContractTest {
 protected:
  // Small poll budget for the timeout tests: 3 x 10ms.
  static core::ExecutorConfig ImpatientConfig() {
    core::ExecutorConfig config = Config(true);
    config.fifo_poll_retries = 3;
    config.fifo_poll_interval_ms = 10;
    return config;
  }

  // Scratch tree holds nothing but the (empty) workdir.
  void ExpectNoLeftovers(const executor::Executor& executor, const Asset& a) {
    const std::string run_dir = RunDirFor(executor, a);
    EXPECT_FALSE(HasFifoIn(run_dir));
    EXPECT_FALSE(util::PathExists(run_dir));
  }
};

// =============================================================================
// Pipelines
// =============================================================================

TEST_F(StreamingExecutorTest, TranscodeStageStreamsThroughPipes) {
  auto executor = MakeExecutor(Config(true));
  const Asset a(TranscodeSpec());
  const auto results = executor->Run({a});

  const std::string run_dir = RunDirFor(*executor, a);
  EXPECT_EQ(transcoder_.transcode_calls(), 2);
  EXPECT_EQ(plugin_.ProcfileSeen(StreamRole::kReference), run_dir + "/ref_workfile.yuv");
  EXPECT_EQ(plugin_.ProcfileSeen(StreamRole::kDistorted), run_dir + "/dis_workfile.yuv");
  ExpectSeries(results[0].Scores(FakeComputePlugin::kRefMeanKey), Ramp(16));
  ExpectSeries(results[0].Scores(FakeComputePlugin::kDisMeanKey), Ramp(40));
  EXPECT_TRUE(store_.Contains(a, executor->identity().Id()));
  ExpectNoLeftovers(*executor, a);
}

TEST_F(StreamingExecutorTest, SampleTransformStreamsFromSourcesInPlace) {
  asset::AssetSpec spec = DirectSpec();
  spec.distorted.proc_callback = InvertLuma();
  auto executor = MakeExecutor(Config(true));
  const Asset a(spec);
  const auto results = executor->Run({a});

  EXPECT_EQ(transcoder_.transcode_calls(), 0);
  EXPECT_EQ(plugin_.ProcfileSeen(StreamRole::kDistorted),
            RunDirFor(*executor, a) + "/dis_procfile.yuv");
  ExpectSeries(results[0].Scores(FakeComputePlugin::kDisMeanKey), InvertedRamp(40));
  ExpectSeries(results[0].Scores(FakeComputePlugin::kRefMeanKey), Ramp(16));
  ExpectNoLeftovers(*executor, a);
}

TEST_F(StreamingExecutorTest, BothStagesChainPipeToPipe) {
  asset::AssetSpec spec = TranscodeSpec();
  spec.reference->frame_range = asset::FrameRange{1, 2};
  spec.distorted.frame_range = asset::FrameRange{2, 3};
  spec.distorted.proc_callback = InvertLuma();
  auto executor = MakeExecutor(Config(true));
  const Asset a(spec);
  const auto results = executor->Run({a});

  EXPECT_EQ(transcoder_.transcode_calls(), 2);
  ExpectSeries(results[0].Scores(FakeComputePlugin::kRefMeanKey),
               {RampMean(16, 1), RampMean(16, 2)});
  ExpectSeries(results[0].Scores(FakeComputePlugin::kDisMeanKey),
               {1.0 - RampMean(40, 2), 1.0 - RampMean(40, 3)});
  ExpectNoLeftovers(*executor, a);
}

TEST_F(StreamingExecutorTest, RefreshReopensEveryStreamForASecondPass) {
  plugin_.set_passes(2);
  asset::AssetSpec spec = TranscodeSpec();
  spec.distorted.proc_callback = InvertLuma();
  auto executor = MakeExecutor(Config(true));
  const Asset a(spec);
  const auto results = executor->Run({a});

  // Each pass reopens the transcode stage for both roles.
  EXPECT_EQ(transcoder_.transcode_calls(), 4);
  ExpectSeries(results[0].Scores(FakeComputePlugin::kDisMeanKey), InvertedRamp(40));
  ExpectNoLeftovers(*executor, a);
}

TEST_F(StreamingExecutorTest, StalePathsAreClearedBeforePipesAreCreated) {
  auto executor = MakeExecutor(Config(true));
  const Asset a(TranscodeSpec());
  const std::string run_dir = RunDirFor(*executor, a);

  // Leftovers of an interrupted run: a regular file and a pipe.
  util::MakeDirs(run_dir);
  fixtures::WriteRawStream(run_dir + "/dis_workfile.yuv", "yuv420p", kWidth, kHeight, 1, 200);
  util::MakeFifo(run_dir + "/ref_workfile.yuv");

  const auto results = executor->Run({a});
  ExpectSeries(results[0].Scores(FakeComputePlugin::kDisMeanKey), Ramp(40));
  ExpectNoLeftovers(*executor, a);
}

TEST_F(StreamingExecutorTest, PooledAssetsStreamIndependently) {
  auto executor = MakeExecutor(Config(true));
  std::vector<Asset> assets;
  for (int id = 1; id <= 4; ++id) assets.emplace_back(TranscodeSpec(id));

  core::RunOptions options;
  options.parallelize = true;
  options.max_workers = 4;
  const auto results = executor->Run(assets, options);

  ASSERT_EQ(results.size(), 4u);
  for (size_t i = 0; i < results.size(); ++i) {
    EXPECT_EQ(results[i].asset().asset_id(), assets[i].asset_id());
    ExpectSeries(results[i].Scores(FakeComputePlugin::kDisMeanKey), Ramp(40));
  }
  EXPECT_EQ(transcoder_.transcode_calls(), 8);
  EXPECT_EQ(fixtures::CountEntries(WorkDir()), 0);
}

// =============================================================================
// Timeouts
// =============================================================================

TEST_F(StreamingExecutorTest, SlowProducerTimesOutWithoutCachingAnything) {
  auto executor = MakeExecutor(ImpatientConfig());
  executor->SetProducerDelayHook(
      [] { std::this_thread::sleep_for(std::chrono::milliseconds(150)); });
  const Asset a(TranscodeSpec());

  EXPECT_THROW(executor->Run({a}), core::ResourceTimeoutError);
  EXPECT_EQ(plugin_.generate_calls(), 0);
  EXPECT_EQ(store_.size(), 0u);
  // Producers were stopped at their second checkpoint: nothing was started.
  EXPECT_EQ(transcoder_.transcode_calls(), 0);
  ExpectNoLeftovers(*executor, a);
}

TEST_F(StreamingExecutorTest, ProducerWithinBudgetIsWaitedFor) {
  auto executor = MakeExecutor(Config(true));
  executor->SetProducerDelayHook(
      [] { std::this_thread::sleep_for(std::chrono::milliseconds(60)); });
  const Asset a(TranscodeSpec());

  const auto results = executor->Run({a});
  ExpectSeries(results[0].Scores(FakeComputePlugin::kDisMeanKey), Ramp(40));
  ExpectNoLeftovers(*executor, a);
}

// =============================================================================
// Failure attribution
// =============================================================================

TEST_F(StreamingExecutorTest, FailedTranscoderIsReportedInsteadOfTheStarvedConsumer) {
  transcoder_.set_fail(true);
  auto executor = MakeExecutor(Config(true));
  const Asset a(TranscodeSpec());

  try {
    executor->Run({a});
    FAIL() << "expected ExternalProcessError";
  } catch (const core::ExternalProcessError& e) {
    EXPECT_EQ(e.exit_status(), 1);
  }
  EXPECT_EQ(store_.size(), 0u);
  ExpectNoLeftovers(*executor, a);
}

TEST_F(StreamingExecutorTest, ConsumerFailureStopsBlockedProducers) {
  plugin_.set_fail_compute(true);
  asset::AssetSpec spec = TranscodeSpec();
  spec.distorted.proc_callback = InvertLuma();
  auto executor = MakeExecutor(Config(true));
  const Asset a(spec);

  // Every producer is blocked opening its pipe when the plugin gives up.
  EXPECT_THROW(executor->Run({a}), core::ComputeError);
  EXPECT_EQ(store_.size(), 0u);
  ExpectNoLeftovers(*executor, a);

  // The executor is reusable after a failed run.
  plugin_.set_fail_compute(false);
  const auto results = executor->Run({a});
  ExpectSeries(results[0].Scores(FakeComputePlugin::kDisMeanKey), InvertedRamp(40));
}

// =============================================================================
// Bundled plugins
// =============================================================================

TEST_F(StreamingExecutorTest, PsnrReadsBothPipesInLockstep) {
  plugins::PsnrPlugin psnr;
  executor::Executor executor(Config(true), psnr, store_, transcoder_);
  asset::AssetSpec spec = TranscodeSpec();
  spec.distorted.path = ref_path_;
  const auto results = executor.Run({Asset(spec)});

  ExpectSeries(results[0].Scores(plugins::PsnrPlugin::kScoreKey), {60.0, 60.0, 60.0, 60.0});
}

TEST_F(StreamingExecutorTest, MeanLumaSecondPassRestartsTheProducer) {
  plugins::MeanLumaPlugin mean_luma;
  executor::Executor executor(Config(true), mean_luma, store_, transcoder_,
                              pipeline::Topology::NoReference());
  asset::AssetSpec spec = TranscodeSpec();
  spec.reference.reset();
  const Asset a(spec);
  const auto results = executor.Run({a});

  EXPECT_EQ(transcoder_.transcode_calls(), 2);
  ExpectSeries(results[0].Scores(plugins::MeanLumaPlugin::kMeanKey), Ramp(40));
  // Each frame's mean absolute deviation from the clip mean is positive.
  for (double d : results[0].Scores(plugins::MeanLumaPlugin::kDeviationKey)) {
    EXPECT_GT(d, 0.0);
  }
  EXPECT_FALSE(util::PathExists(RunDirFor(executor, a)));
}

}  // namespace
}  // namespace vqexec::tests::contracts
