// Repository: Retrovue-vqexec
// Component: Executor Identity
// Purpose: Executor type/version validation, parameter normalization and
//          per-asset run labels.
// Copyright (c) 2026 RetroVue

#include "vqexec/core/ExecutorIdentity.hpp"

#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>

#include "vqexec/core/Errors.hpp"

namespace vqexec::core {

namespace {

bool IsIdentityChar(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
         (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
}

void RequireIdentityToken(const std::string& what, const std::string& token) {
  if (token.empty()) {
    throw ConfigurationError("executor " + what + " must not be empty");
  }
  for (char c : token) {
    if (!IsIdentityChar(c)) {
      throw ConfigurationError("executor " + what + " '" + token +
                               "' contains invalid character '" +
                               std::string(1, c) + "'");
    }
  }
}

// Shortest decimal that parses back to exactly `v`; always carries a
// fractional part or exponent so 5 and 5.0 never render alike.
std::string RenderReal(double v) {
  if (std::isnan(v)) return "nan";
  if (std::isinf(v)) return v > 0 ? "inf" : "-inf";

  std::string text;
  for (int precision = 1; precision <= std::numeric_limits<double>::max_digits10;
       ++precision) {
    std::ostringstream oss;
    oss << std::setprecision(precision) << v;
    text = oss.str();
    if (std::strtod(text.c_str(), nullptr) == v) break;
  }
  if (text.find_first_of(".e") == std::string::npos) {
    text += ".0";
  }
  return text;
}

}  // namespace

std::string ParamValue::Render() const {
  switch (type_) {
    case Type::kBool:
      return bool_ ? "True" : "False";
    case Type::kInteger:
      return std::to_string(int_);
    case Type::kReal:
      return RenderReal(real_);
    case Type::kString:
    case Type::kCallable:
      return string_;
  }
  return "";
}

bool ParamValue::operator==(const ParamValue& other) const {
  if (type_ != other.type_) return false;
  switch (type_) {
    case Type::kBool:
      return bool_ == other.bool_;
    case Type::kInteger:
      return int_ == other.int_;
    case Type::kReal:
      return real_ == other.real_;
    case Type::kString:
    case Type::kCallable:
      return string_ == other.string_;
  }
  return false;
}

ExecutorIdentity::ExecutorIdentity(std::string type, std::string version,
                                   OptionalParams params)
    : type_(std::move(type)),
      version_(std::move(version)),
      params_(std::move(params)) {
  RequireIdentityToken("type", type_);
  RequireIdentityToken("version", version_);

  id_ = type_ + "_" + version_;
  if (!params_.empty()) {
    // Optional parameters change results, so they are part of the cache key.
    id_ += "_" + NormalizeParams(params_);
    for (char& c : id_) {
      if (c == '\'' || c == ' ' || c == '/') c = '_';
    }
  }
}

std::string ExecutorIdentity::RunLabel(const std::string& asset_fingerprint) const {
  return id_ + "_" + asset_fingerprint;
}

std::string ExecutorIdentity::NormalizeParams(const OptionalParams& params) {
  std::ostringstream oss;
  bool first = true;
  for (const auto& [key, value] : params) {
    if (!first) oss << '_';
    oss << key << '_' << value.Render();
    first = false;
  }
  return oss.str();
}

}  // namespace vqexec::core
