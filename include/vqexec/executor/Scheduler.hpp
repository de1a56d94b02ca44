// Repository: Retrovue-vqexec
// Component: Scheduler
// Purpose: Runs one job per asset, sequentially or on a bounded pool, under
//          identity-keyed mutual exclusion.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_EXECUTOR_SCHEDULER_HPP_
#define VQEXEC_EXECUTOR_SCHEDULER_HPP_

#include <functional>
#include <vector>

#include "vqexec/asset/Asset.hpp"
#include "vqexec/core/ExecutorConfig.hpp"
#include "vqexec/core/Result.hpp"

namespace vqexec::executor {

// Sequential: input order; the first failure stops scheduling and propagates.
//
// Pooled: every job runs to completion even if another fails. Results come
// back in input order. When any job failed, the failure of the earliest
// failed asset (input order) is rethrown after all jobs have settled.
class Scheduler {
 public:
  using JobFn = std::function<core::Result(const asset::Asset&)>;

  explicit Scheduler(JobFn job) : job_(std::move(job)) {}

  std::vector<core::Result> Run(const std::vector<asset::Asset>& assets,
                                const core::RunOptions& options) const;

  // Pool size for `options`. Throws core::ConfigurationError when
  // max_workers is set without parallelize or is below 1.
  static size_t ResolveWorkerCount(const core::RunOptions& options);

 private:
  JobFn job_;
};

}  // namespace vqexec::executor

#endif  // VQEXEC_EXECUTOR_SCHEDULER_HPP_
