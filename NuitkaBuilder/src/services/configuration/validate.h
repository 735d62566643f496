#pragma once
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

#include "services/schema/SettingSchema.h"

namespace nkb::cfgvalidate {
// Keys use dotted segments with [a-z0-9_]+ per segment, no empty segments
bool isValidKey(std::string_view key);

// Convert any JSON value into the closest ConfigValue alternative. Values
// that have no scalar or string-list form are kept as raw JSON.
ConfigValue fromJson(const nlohmann::json& j);

// Convert ConfigValue to JSON
nlohmann::json toJson(const ConfigValue& v);

bool valuesEqual(const ConfigValue& lhs, const ConfigValue& rhs);

// True for unset values, empty strings and empty lists.
bool isEmptyValue(const ConfigValue& v) noexcept;

// Short human-readable rendering used in log lines and diagnostics.
std::string describe(const ConfigValue& v);
}
