#pragma once
#include <rapidjson/document.h>

#include <string>

namespace lp {

// Accessors for command params. A missing or null member yields the
// fallback; a member of the wrong type throws std::invalid_argument.

// Truncates toward zero, saturating at the int range. NaN gives 0.
int saturateToInt(double d);

const rapidjson::Value* getMember(const rapidjson::Value& obj, const char* key);

std::string stringOr(const rapidjson::Value& obj, const char* key, const std::string& fallback);
double numberOr(const rapidjson::Value& obj, const char* key, double fallback);
int intOr(const rapidjson::Value& obj, const char* key, int fallback);
bool boolOr(const rapidjson::Value& obj, const char* key, bool fallback);

// nullptr when missing or null.
const rapidjson::Value* arrayOrNull(const rapidjson::Value& obj, const char* key);
const rapidjson::Value* objectOrNull(const rapidjson::Value& obj, const char* key);

} // namespace lp
