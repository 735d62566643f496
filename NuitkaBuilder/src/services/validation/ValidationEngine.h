#pragma once

#include "ValidationRules.h"

#include <memory>
#include <string_view>
#include <vector>

namespace nkb {

class ValidationEngine {
public:
    explicit ValidationEngine(const SettingRegistry& registry,
                              platform::ToolLocator locator = platform::defaultToolLocator());

    // Checks one value as if it were stored under `path`. Shape errors come
    // first; declared rules run in order and stop at the first error.
    [[nodiscard]] std::vector<ValidationResult> validateField(std::string_view path, const ConfigValue& value,
                                                              const ConfigurationStore& config) const;
    [[nodiscard]] std::vector<ValidationResult> validateField(std::string_view path,
                                                              const ConfigurationStore& config) const;

    // Every definition in schema order, then one warning per unrecognized key.
    [[nodiscard]] std::vector<ValidationResult> validateAll(const ConfigurationStore& config) const;

    [[nodiscard]] static bool hasErrors(const std::vector<ValidationResult>& results) noexcept;
    [[nodiscard]] static std::size_t count(const std::vector<ValidationResult>& results, Severity severity) noexcept;

private:
    const SettingRegistry& registry_;
    std::vector<std::vector<std::unique_ptr<ValidationRule>>> rules_; // parallel to registry definitions
};

} // namespace nkb
