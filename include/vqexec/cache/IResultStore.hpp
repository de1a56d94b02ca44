// Repository: Retrovue-vqexec
// Component: Result Store Interface
// Purpose: Load / save / delete cached Results keyed by (asset, executor id),
//          plus retained workfile snapshots and an optional compute lease.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_CACHE_I_RESULT_STORE_HPP_
#define VQEXEC_CACHE_I_RESULT_STORE_HPP_

#include <memory>
#include <optional>
#include <string>

#include "vqexec/asset/Asset.hpp"
#include "vqexec/core/Result.hpp"

namespace vqexec::cache {

// Held for the duration of one computation. Releasing (destroying) the lease
// lets the next caller proceed.
class ComputeLease {
 public:
  virtual ~ComputeLease() = default;
};

// Implementations must tolerate concurrent callers from scheduler workers.
// A miss-then-miss race may compute twice; the last Save wins.
class IResultStore {
 public:
  virtual ~IResultStore() = default;

  // nullopt on a miss. A stored record that does not match the query is a
  // miss, never an error.
  virtual std::optional<core::Result> Load(const asset::Asset& a,
                                           const std::string& executor_id) = 0;

  virtual void Save(const core::Result& result) = 0;

  // Missing entries are not an error.
  virtual void Delete(const asset::Asset& a, const std::string& executor_id) = 0;

  // Retains a copy of an intermediate stream next to the result, tagged by
  // role.
  virtual void SaveWorkfile(const core::Result& result, const std::string& path,
                            asset::StreamRole role) = 0;

  virtual void DeleteWorkfile(const asset::Asset& a, const std::string& executor_id,
                              asset::StreamRole role) = 0;

  // Serializes computation of one (asset, executor) across callers, including
  // other processes sharing the store. nullptr when unsupported.
  virtual std::unique_ptr<ComputeLease> AcquireComputeLease(
      const asset::Asset& a, const std::string& executor_id) {
    (void)a;
    (void)executor_id;
    return nullptr;
  }
};

}  // namespace vqexec::cache

#endif  // VQEXEC_CACHE_I_RESULT_STORE_HPP_
