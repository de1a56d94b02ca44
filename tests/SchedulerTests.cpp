// Repository: Retrovue-vqexec
// Component: Scheduler Tests
// Purpose: Identity-keyed locking, the worker pool, and sequential vs pooled
//          scheduling (ordering, failure propagation, option validation).
// Copyright (c) 2026 RetroVue

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "vqexec/core/Errors.hpp"
#include "vqexec/executor/LockRegistry.hpp"
#include "vqexec/executor/Scheduler.hpp"
#include "vqexec/executor/WorkerPool.hpp"

namespace vqexec::executor {
namespace {

using asset::Asset;
using asset::AssetSpec;

Asset MakeAsset(int asset_id, const std::string& dis = "/data/dis.yuv") {
  AssetSpec spec;
  spec.dataset = "sched";
  spec.content_id = 0;
  spec.asset_id = asset_id;
  spec.workdir = "/tmp/vqexec-sched";
  spec.distorted.path = dis;
  spec.distorted.geometry = asset::Geometry{8, 4};
  return Asset(spec);
}

core::Result ResultFor(const Asset& a) {
  return core::Result(a, "FAKE_1.0", {{"id", {static_cast<double>(a.asset_id())}}});
}

std::vector<int64_t> AssetIds(const std::vector<core::Result>& results) {
  std::vector<int64_t> ids;
  for (const auto& r : results) ids.push_back(r.asset().asset_id());
  return ids;
}

core::RunOptions Pooled(int workers) {
  core::RunOptions options;
  options.parallelize = true;
  options.max_workers = workers;
  return options;
}

// =============================================================================
// LockRegistry
// =============================================================================

TEST(LockRegistryTest, EqualAssetsShareOneLock) {
  const Asset a1 = MakeAsset(1);
  const Asset a1_again = MakeAsset(1);
  const Asset a2 = MakeAsset(2);
  const LockRegistry locks({a1, a2, a1_again});

  EXPECT_EQ(locks.size(), 2u);
  EXPECT_EQ(locks.LockFor(a1), locks.LockFor(a1_again));
  EXPECT_NE(locks.LockFor(a1), locks.LockFor(a2));
  EXPECT_THROW(locks.LockFor(MakeAsset(3)), std::out_of_range);
}

// =============================================================================
// WorkerPool
// =============================================================================

TEST(WorkerPoolTest, FuturesCarryValuesAndExceptions) {
  WorkerPool pool(2);
  auto ok = pool.Submit([] { return 42; });
  auto bad = pool.Submit([]() -> int { throw std::runtime_error("job failed"); });
  EXPECT_EQ(ok.get(), 42);
  EXPECT_THROW(bad.get(), std::runtime_error);
}

TEST(WorkerPoolTest, NeverExceedsWorkerCount) {
  std::atomic<int> active{0};
  std::atomic<int> peak{0};
  {
    WorkerPool pool(3);
    for (int i = 0; i < 12; ++i) {
      pool.Submit([&] {
        const int now = active.fetch_add(1) + 1;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        active.fetch_sub(1);
      });
    }
  }
  EXPECT_LE(peak.load(), 3);
  EXPECT_GE(peak.load(), 2);
}

TEST(WorkerPoolTest, ZeroWorkersRejected) {
  EXPECT_THROW(WorkerPool(0), std::invalid_argument);
}

// =============================================================================
// Scheduler
// =============================================================================

TEST(SchedulerTest, SequentialRunsInInputOrder) {
  std::vector<int64_t> order;
  const Scheduler scheduler([&order](const Asset& a) {
    order.push_back(a.asset_id());
    return ResultFor(a);
  });
  const auto results = scheduler.Run({MakeAsset(3), MakeAsset(1), MakeAsset(2)}, {});
  EXPECT_EQ(order, (std::vector<int64_t>{3, 1, 2}));
  EXPECT_EQ(AssetIds(results), (std::vector<int64_t>{3, 1, 2}));
}

TEST(SchedulerTest, SequentialStopsAtFirstFailure) {
  std::vector<int64_t> ran;
  const Scheduler scheduler([&ran](const Asset& a) {
    ran.push_back(a.asset_id());
    if (a.asset_id() == 2) throw core::ComputeError("asset 2 failed");
    return ResultFor(a);
  });
  EXPECT_THROW(scheduler.Run({MakeAsset(1), MakeAsset(2), MakeAsset(3)}, {}),
               core::ComputeError);
  EXPECT_EQ(ran, (std::vector<int64_t>{1, 2}));
}

TEST(SchedulerTest, PooledResultsKeepInputOrderDespiteCompletionOrder) {
  // Earlier assets sleep longer, so they finish last.
  const Scheduler scheduler([](const Asset& a) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10 * (5 - a.asset_id())));
    return ResultFor(a);
  });
  std::vector<Asset> assets;
  for (int i = 0; i < 5; ++i) assets.push_back(MakeAsset(i));

  const auto results = scheduler.Run(assets, Pooled(5));
  EXPECT_EQ(AssetIds(results), (std::vector<int64_t>{0, 1, 2, 3, 4}));
}

TEST(SchedulerTest, PooledRunsEveryJobAndRethrowsEarliestFailure) {
  std::mutex mutex;
  std::vector<int64_t> ran;
  const Scheduler scheduler([&](const Asset& a) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      ran.push_back(a.asset_id());
    }
    // Asset 3 fails first in time; asset 1 is earlier in input order.
    if (a.asset_id() == 1) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
      throw core::ComputeError("asset 1");
    }
    if (a.asset_id() == 3) throw core::ParseError("asset 3");
    return ResultFor(a);
  });

  std::vector<Asset> assets;
  for (int i = 0; i < 5; ++i) assets.push_back(MakeAsset(i));
  try {
    scheduler.Run(assets, Pooled(4));
    FAIL() << "expected failure";
  } catch (const core::ComputeError& e) {
    EXPECT_STREQ(e.what(), "asset 1");
  }
  std::sort(ran.begin(), ran.end());
  EXPECT_EQ(ran, (std::vector<int64_t>{0, 1, 2, 3, 4}));
}

TEST(SchedulerTest, SameAssetNeverRunsConcurrently) {
  std::mutex mutex;
  std::map<std::string, int> active;
  bool overlapped = false;
  std::atomic<int> distinct_peak{0};
  std::atomic<int> running{0};

  const Scheduler scheduler([&](const Asset& a) {
    {
      std::lock_guard<std::mutex> lock(mutex);
      if (++active[a.ToString()] > 1) overlapped = true;
    }
    const int now = running.fetch_add(1) + 1;
    int prev = distinct_peak.load();
    while (now > prev && !distinct_peak.compare_exchange_weak(prev, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    running.fetch_sub(1);
    {
      std::lock_guard<std::mutex> lock(mutex);
      --active[a.ToString()];
    }
    return ResultFor(a);
  });

  // Four copies of asset 1 and one asset 2.
  const auto results = scheduler.Run(
      {MakeAsset(1), MakeAsset(1), MakeAsset(2), MakeAsset(1), MakeAsset(1)}, Pooled(5));
  EXPECT_EQ(results.size(), 5u);
  EXPECT_FALSE(overlapped);
  EXPECT_LE(distinct_peak.load(), 2);
}

TEST(SchedulerTest, WorkerOptionsValidated) {
  core::RunOptions sequential_with_workers;
  sequential_with_workers.max_workers = 2;
  EXPECT_THROW(Scheduler::ResolveWorkerCount(sequential_with_workers),
               core::ConfigurationError);
  EXPECT_THROW(Scheduler::ResolveWorkerCount(Pooled(0)), core::ConfigurationError);
  EXPECT_EQ(Scheduler::ResolveWorkerCount({}), 1u);
  EXPECT_EQ(Scheduler::ResolveWorkerCount(Pooled(3)), 3u);

  core::RunOptions pooled_default;
  pooled_default.parallelize = true;
  EXPECT_GE(Scheduler::ResolveWorkerCount(pooled_default), 1u);
}

TEST(SchedulerTest, EmptyInputYieldsNoResults) {
  const Scheduler scheduler([](const Asset& a) { return ResultFor(a); });
  EXPECT_TRUE(scheduler.Run({}, {}).empty());
  EXPECT_TRUE(scheduler.Run({}, Pooled(2)).empty());
}

}  // namespace
}  // namespace vqexec::executor
