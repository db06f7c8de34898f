#include "lp/protocol/Params.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

namespace lp {

namespace {

[[noreturn]] void wrongType(const char* key, const char* expected) {
  throw std::invalid_argument(std::string("param '") + key + "' must be " + expected);
}

} // anonymous namespace

int saturateToInt(double d) {
  constexpr double kMin = static_cast<double>(std::numeric_limits<int>::min());
  constexpr double kMax = static_cast<double>(std::numeric_limits<int>::max());
  if (std::isnan(d)) return 0;
  if (d <= kMin) return std::numeric_limits<int>::min();
  if (d >= kMax) return std::numeric_limits<int>::max();
  return static_cast<int>(d);
}

const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key) {
  if (!obj.IsObject()) return nullptr;
  auto it = obj.FindMember(key);
  if (it == obj.MemberEnd() || it->value.IsNull()) return nullptr;
  return &it->value;
}

std::string stringOr(const rapidjson::Value& obj, const char* key, const std::string& fallback) {
  const auto* v = getMember(obj, key);
  if (!v) return fallback;
  if (!v->IsString()) wrongType(key, "a string");
  return std::string(v->GetString(), v->GetStringLength());
}

double numberOr(const rapidjson::Value& obj, const char* key, double fallback) {
  const auto* v = getMember(obj, key);
  if (!v) return fallback;
  if (!v->IsNumber()) wrongType(key, "a number");
  double d = v->GetDouble();
  if (!std::isfinite(d)) wrongType(key, "a finite number");
  return d;
}

int intOr(const rapidjson::Value& obj, const char* key, int fallback) {
  const auto* v = getMember(obj, key);
  if (!v) return fallback;
  if (v->IsInt()) return v->GetInt();
  if (v->IsNumber()) return saturateToInt(v->GetDouble());
  wrongType(key, "an integer");
}

bool boolOr(const rapidjson::Value& obj, const char* key, bool fallback) {
  const auto* v = getMember(obj, key);
  if (!v) return fallback;
  if (!v->IsBool()) wrongType(key, "a boolean");
  return v->GetBool();
}

const rapidjson::Value* arrayOrNull(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return nullptr;
  if (!v->IsArray()) wrongType(key, "an array");
  return v;
}

const rapidjson::Value* objectOrNull(const rapidjson::Value& obj, const char* key) {
  const auto* v = getMember(obj, key);
  if (!v) return nullptr;
  if (!v->IsObject()) wrongType(key, "an object");
  return v;
}

} // namespace lp
