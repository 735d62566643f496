#pragma once
#include <cstddef>
#include <string>
#include <string_view>

#include "services/schema/SettingSchema.h"

namespace nkb {
class ConfigurationStore;
}

namespace nkb::envoverrides {

inline constexpr std::string_view kPrefix = "NKB_";

// NKB_BASIC__OUTPUT_DIR -> basic.output_dir. Double underscores separate
// segments, everything is lower-cased.
std::string mapEnvKeyToConfigKey(std::string_view name);

// Interprets a raw environment string. Known settings are coerced to their
// declared type (string lists split on ','); unknown keys fall back to
// bool, integer, double and finally string.
ConfigValue parseEnvValue(const SettingDefinition* definition, const std::string& raw);

// Applies every NKB_* variable containing "__" to the store. Control
// variables such as NKB_CONFIG_DIR are skipped. Returns the number applied.
std::size_t apply(ConfigurationStore& store);
}
