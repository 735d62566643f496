#pragma once

#include "services/schema/SettingSchema.h"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nkb {

class ConfigurationStore;

struct PresetDefinition {
    std::string id;
    std::string name;
    std::string description;
    std::vector<std::pair<std::string, ConfigValue>> applies;
};

struct PresetChange {
    std::string key;
    ConfigValue oldValue;
    ConfigValue newValue;
};

class PresetCatalog {
public:
    [[nodiscard]] static const std::vector<PresetDefinition>& builtin();

    // Matches either the id ("onefile") or the display name.
    [[nodiscard]] static const PresetDefinition* find(std::string_view idOrName) noexcept;

    // Sets each preset value that differs from the store and reports what
    // changed. Keys the loaded schema does not declare are skipped.
    static std::vector<PresetChange> apply(ConfigurationStore& store, const PresetDefinition& preset);
};

} // namespace nkb
