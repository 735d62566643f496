#pragma once

#include "services/platform/PlatformDetector.h"
#include "services/schema/SettingSchema.h"

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace nkb {

class ConfigurationStore;

struct ValidationResult {
    std::string field;
    Severity severity{Severity::Error};
    std::string message;
    std::optional<std::string> suggestion;
};

// One check attached to a setting. Implementations return nullopt when the
// value passes.
class ValidationRule {
public:
    explicit ValidationRule(Severity severity) : severity_(severity) {}
    virtual ~ValidationRule() = default;

    ValidationRule(const ValidationRule&) = delete;
    ValidationRule& operator=(const ValidationRule&) = delete;

    [[nodiscard]] virtual std::optional<ValidationResult> validate(const SettingDefinition& definition,
                                                                   const ConfigValue& value,
                                                                   const ConfigurationStore& config) const = 0;

    [[nodiscard]] Severity severity() const noexcept { return severity_; }

protected:
    [[nodiscard]] ValidationResult makeResult(const SettingDefinition& definition, std::string message,
                                              std::optional<std::string> suggestion = std::nullopt) const;

private:
    Severity severity_;
};

class RequiredRule final : public ValidationRule {
public:
    explicit RequiredRule(Severity severity) : ValidationRule(severity) {}
    std::optional<ValidationResult> validate(const SettingDefinition& definition, const ConfigValue& value,
                                             const ConfigurationStore& config) const override;
};

class FileExistsRule final : public ValidationRule {
public:
    explicit FileExistsRule(Severity severity) : ValidationRule(severity) {}
    std::optional<ValidationResult> validate(const SettingDefinition& definition, const ConfigValue& value,
                                             const ConfigurationStore& config) const override;
};

class DirectoryExistsRule final : public ValidationRule {
public:
    explicit DirectoryExistsRule(Severity severity) : ValidationRule(severity) {}
    std::optional<ValidationResult> validate(const SettingDefinition& definition, const ConfigValue& value,
                                             const ConfigurationStore& config) const override;
};

class ExtensionRule final : public ValidationRule {
public:
    ExtensionRule(Severity severity, std::vector<std::string> allowed);
    std::optional<ValidationResult> validate(const SettingDefinition& definition, const ConfigValue& value,
                                             const ConfigurationStore& config) const override;

private:
    std::vector<std::string> allowed_; // lower-case, with leading '.'
};

class ToolAvailableRule final : public ValidationRule {
public:
    ToolAvailableRule(Severity severity, std::string tool, std::vector<std::string> when, platform::ToolLocator locator);
    std::optional<ValidationResult> validate(const SettingDefinition& definition, const ConfigValue& value,
                                             const ConfigurationStore& config) const override;

private:
    std::string tool_;
    std::vector<std::string> when_;
    platform::ToolLocator locator_;
};

class PatternRule final : public ValidationRule {
public:
    PatternRule(Severity severity, const std::string& regex, std::string message);
    std::optional<ValidationResult> validate(const SettingDefinition& definition, const ConfigValue& value,
                                             const ConfigurationStore& config) const override;

private:
    std::regex regex_;
    std::string pattern_;
    std::string message_;
};

// Cross-field dependency: while this setting holds one of `when` (or any
// truthy value when `when` is empty), setting `key` must equal `equals`.
class RequiresRule final : public ValidationRule {
public:
    RequiresRule(Severity severity, std::string key, ConfigValue equals, std::vector<ConfigValue> when, std::string message);
    std::optional<ValidationResult> validate(const SettingDefinition& definition, const ConfigValue& value,
                                             const ConfigurationStore& config) const override;

private:
    std::string key_;
    ConfigValue equals_;
    std::vector<ConfigValue> when_;
    std::string message_;
};

[[nodiscard]] Severity defaultSeverity(RuleKind kind) noexcept;

std::unique_ptr<ValidationRule> makeRule(const RuleSpec& spec, const platform::ToolLocator& locator);

// Type, enum membership and integer bounds. Runs before any declared rule.
std::optional<ValidationResult> checkValueShape(const SettingDefinition& definition, const ConfigValue& value);

} // namespace nkb
