// Repository: Retrovue-vqexec
// Component: LockRegistry
// Purpose: One mutex per distinct asset string, built once per scheduling call.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_EXECUTOR_LOCK_REGISTRY_HPP_
#define VQEXEC_EXECUTOR_LOCK_REGISTRY_HPP_

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "vqexec/asset/Asset.hpp"

namespace vqexec::executor {

// Assets with equal canonical strings share one lock instance, so two jobs
// for the same unit of work never run the state machine concurrently (they
// would share the run directory). The map is immutable after construction.
class LockRegistry {
 public:
  explicit LockRegistry(const std::vector<asset::Asset>& assets);

  // Throws std::out_of_range for an asset that was not registered.
  std::shared_ptr<std::mutex> LockFor(const asset::Asset& a) const;

  size_t size() const { return locks_.size(); }

 private:
  std::map<std::string, std::shared_ptr<std::mutex>> locks_;
};

}  // namespace vqexec::executor

#endif  // VQEXEC_EXECUTOR_LOCK_REGISTRY_HPP_
