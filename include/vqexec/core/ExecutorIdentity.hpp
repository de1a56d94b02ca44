// Repository: Retrovue-vqexec
// Component: Executor Identity
// Purpose: Canonical executor id, used as cache-key prefix and run label.
// Copyright (c) 2026 RetroVue

#ifndef VQEXEC_CORE_EXECUTOR_IDENTITY_HPP_
#define VQEXEC_CORE_EXECUTOR_IDENTITY_HPP_

#include <cstdint>
#include <map>
#include <string>

namespace vqexec::core {

// A callable-valued parameter (model loader, pooling function, ...). Only
// its declared name takes part in identity; two callables with the same name
// are the same configuration.
struct NamedCallable {
  std::string name;
};

// One optional-parameter value. Implicit constructors keep literal maps
// readable: {{"bitrate_kbps", 45}, {"max_buffer_sec", 5.0}}.
class ParamValue {
 public:
  enum class Type { kBool, kInteger, kReal, kString, kCallable };

  ParamValue(bool v) : type_(Type::kBool), bool_(v) {}
  ParamValue(int v) : type_(Type::kInteger), int_(v) {}
  ParamValue(long v) : type_(Type::kInteger), int_(v) {}
  ParamValue(long long v) : type_(Type::kInteger), int_(static_cast<int64_t>(v)) {}
  ParamValue(double v) : type_(Type::kReal), real_(v) {}
  ParamValue(const char* v) : type_(Type::kString), string_(v) {}
  ParamValue(std::string v) : type_(Type::kString), string_(std::move(v)) {}
  ParamValue(NamedCallable v) : type_(Type::kCallable), string_(std::move(v.name)) {}

  Type type() const { return type_; }
  bool AsBool() const { return bool_; }
  int64_t AsInteger() const { return int_; }
  double AsReal() const { return real_; }
  // String value, or the callable's declared name.
  const std::string& AsString() const { return string_; }

  // Canonical rendering used in the executor id:
  //   bool → True/False, integer → decimal,
  //   real → shortest round-trip decimal with a fractional part ("5.0"),
  //   string → verbatim, callable → declared name.
  std::string Render() const;

  bool operator==(const ParamValue& other) const;
  bool operator!=(const ParamValue& other) const { return !(*this == other); }

 private:
  Type type_;
  bool bool_ = false;
  int64_t int_ = 0;
  double real_ = 0.0;
  std::string string_;
};

// Ordered by key, so any construction order yields the same normalization.
using OptionalParams = std::map<std::string, ParamValue>;

// {type, version, optional parameters} → executor id.
//
//   id = "{type}_{version}"                       (no parameters)
//   id = "{type}_{version}_{k1}_{v1}_{k2}_{v2}"   (keys sorted)
//
// Quotes, spaces and '/' are replaced by '_' so the id is always a single
// path component. Pure function of configuration.
class ExecutorIdentity {
 public:
  // Throws ConfigurationError if type/version contain characters outside
  // [A-Za-z0-9._-] or are empty.
  ExecutorIdentity(std::string type, std::string version,
                   OptionalParams params = {});

  const std::string& type() const { return type_; }
  const std::string& version() const { return version_; }
  const OptionalParams& params() const { return params_; }

  const std::string& Id() const { return id_; }

  // Name of the private run directory / log artifact for one asset.
  std::string RunLabel(const std::string& asset_fingerprint) const;

  // "k1_v1_k2_v2" with keys in sorted order.
  static std::string NormalizeParams(const OptionalParams& params);

 private:
  std::string type_;
  std::string version_;
  OptionalParams params_;
  std::string id_;
};

}  // namespace vqexec::core

#endif  // VQEXEC_CORE_EXECUTOR_IDENTITY_HPP_
