// Repository: Retrovue-vqexec
// Component: LockRegistry
// Purpose: Named mutexes shared by workers touching the same asset.
// Copyright (c) 2026 RetroVue

#include "vqexec/executor/LockRegistry.hpp"

#include <stdexcept>

namespace vqexec::executor {

LockRegistry::LockRegistry(const std::vector<asset::Asset>& assets) {
  for (const auto& a : assets) {
    auto& slot = locks_[a.ToString()];
    if (!slot) {
      slot = std::make_shared<std::mutex>();
    }
  }
}

std::shared_ptr<std::mutex> LockRegistry::LockFor(const asset::Asset& a) const {
  auto it = locks_.find(a.ToString());
  if (it == locks_.end()) {
    throw std::out_of_range("no lock registered for asset " + a.ToString());
  }
  return it->second;
}

}  // namespace vqexec::executor
