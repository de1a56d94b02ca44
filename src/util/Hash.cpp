// Repository: Retrovue-vqexec
// Component: Hash Helpers
// Purpose: SHA-1 hex digests (OpenSSL EVP) for asset fingerprints.
// Copyright (c) 2026 RetroVue

#include "vqexec/util/Hash.hpp"

#include <openssl/evp.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace vqexec::util {

std::string Sha1Hex(const std::string& input) {
  const EVP_MD* md = EVP_sha1();
  if (md == nullptr) {
    throw std::runtime_error("EVP_sha1 unavailable");
  }

  EVP_MD_CTX* context = EVP_MD_CTX_new();
  if (context == nullptr) {
    throw std::runtime_error("Failed to allocate EVP_MD_CTX");
  }

  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_length = 0;

  if (EVP_DigestInit_ex(context, md, nullptr) != 1 ||
      EVP_DigestUpdate(context, input.data(), input.size()) != 1 ||
      EVP_DigestFinal_ex(context, hash, &hash_length) != 1) {
    EVP_MD_CTX_free(context);
    throw std::runtime_error("Failed to compute SHA-1 digest");
  }
  EVP_MD_CTX_free(context);

  std::ostringstream oss;
  for (unsigned int i = 0; i < hash_length; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0')
        << static_cast<int>(hash[i]);
  }
  return oss.str();
}

}  // namespace vqexec::util
