// Repository: Retrovue-vqexec
// Component: Scheduler
// Purpose: Serial or pooled dispatch of assets with ordered results.
// Copyright (c) 2026 RetroVue

#include "vqexec/executor/Scheduler.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <mutex>
#include <sstream>
#include <thread>

#include "vqexec/core/Errors.hpp"
#include "vqexec/executor/LockRegistry.hpp"
#include "vqexec/executor/WorkerPool.hpp"
#include "vqexec/util/Logger.hpp"

namespace vqexec::executor {

using util::Logger;

size_t Scheduler::ResolveWorkerCount(const core::RunOptions& options) {
  if (options.max_workers && !options.parallelize) {
    throw core::ConfigurationError("max_workers requires parallelize");
  }
  if (!options.parallelize) return 1;
  if (options.max_workers) {
    if (*options.max_workers < 1) {
      throw core::ConfigurationError("max_workers must be at least 1, got " +
                                     std::to_string(*options.max_workers));
    }
    return static_cast<size_t>(*options.max_workers);
  }
  const unsigned hw = std::thread::hardware_concurrency();
  return hw == 0 ? 1 : hw;
}

std::vector<core::Result> Scheduler::Run(const std::vector<asset::Asset>& assets,
                                         const core::RunOptions& options) const {
  const size_t workers = ResolveWorkerCount(options);
  const LockRegistry locks(assets);

  auto locked_job = [this, &locks](const asset::Asset& a) {
    const auto mutex = locks.LockFor(a);
    std::lock_guard<std::mutex> guard(*mutex);
    return job_(a);
  };

  std::vector<core::Result> results;
  results.reserve(assets.size());

  if (!options.parallelize) {
    Logger::Info("[Scheduler] RUN mode=sequential assets=" +
                 std::to_string(assets.size()));
    for (const auto& a : assets) {
      results.push_back(locked_job(a));
    }
    return results;
  }

  const size_t pool_size = std::max<size_t>(1, std::min(workers, assets.size()));
  {
    std::ostringstream oss;
    oss << "[Scheduler] RUN mode=pooled assets=" << assets.size()
        << " workers=" << pool_size << " distinct_locks=" << locks.size();
    Logger::Info(oss.str());
  }

  std::vector<std::future<core::Result>> futures;
  futures.reserve(assets.size());
  {
    WorkerPool pool(pool_size);
    for (const auto& a : assets) {
      futures.push_back(pool.Submit([&locked_job, &a] { return locked_job(a); }));
    }
    // Pool destructor drains the queue: every future is ready past this point.
  }

  std::exception_ptr first_failure;
  size_t failures = 0;
  for (auto& future : futures) {
    try {
      results.push_back(future.get());
    } catch (...) {
      ++failures;
      if (!first_failure) {
        first_failure = std::current_exception();
      }
    }
  }
  if (first_failure) {
    Logger::Error("[Scheduler] RUN_FAILED failed_assets=" + std::to_string(failures) +
                  " of " + std::to_string(assets.size()));
    std::rethrow_exception(first_failure);
  }
  return results;
}

}  // namespace vqexec::executor
