// Repository: Retrovue-vqexec
// Component: Hash Helpers
// Purpose: Stable content-independent digests for asset fingerprints.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_UTIL_HASH_HPP_
#define VQEXEC_UTIL_HASH_HPP_

#include <string>

namespace vqexec::util {

// Lowercase hex SHA-1 of `input`. Stable across runs, hosts and processes.
std::string Sha1Hex(const std::string& input);

}  // namespace vqexec::util

#endif  // VQEXEC_UTIL_HASH_HPP_
