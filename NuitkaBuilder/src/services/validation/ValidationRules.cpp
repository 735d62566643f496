#include "ValidationRules.h"

#include "services/configuration/ConfigurationStore.h"
#include "services/configuration/validate.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace nkb {

namespace {

namespace fs = std::filesystem;

const std::string& labelOf(const SettingDefinition& definition) {
    return definition.label.empty() ? definition.key : definition.label;
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Non-empty path strings held by a string or string-list value.
std::vector<std::string> pathsOf(const ConfigValue& value) {
    std::vector<std::string> out;
    if (const auto* text = std::get_if<std::string>(&value)) {
        if (!text->empty()) {
            out.push_back(*text);
        }
    } else if (const auto* list = std::get_if<std::vector<std::string>>(&value)) {
        for (const auto& entry : *list) {
            if (!entry.empty()) {
                out.push_back(entry);
            }
        }
    }
    return out;
}

bool isTruthy(const ConfigValue& value) {
    if (const auto* flag = std::get_if<bool>(&value)) {
        return *flag;
    }
    if (const auto* number = std::get_if<std::int64_t>(&value)) {
        return *number != 0;
    }
    return !cfgvalidate::isEmptyValue(value);
}

std::string joinChoices(const SettingDefinition& definition) {
    std::ostringstream out;
    for (std::size_t i = 0; i < definition.choices.size(); ++i) {
        if (i != 0) {
            out << ", ";
        }
        out << definition.choices[i].value;
    }
    return out.str();
}

std::vector<std::string> stringList(const nlohmann::json& params, const char* name) {
    std::vector<std::string> out;
    if (auto it = params.find(name); it != params.end() && it->is_array()) {
        for (const auto& entry : *it) {
            if (entry.is_string()) {
                out.push_back(entry.get<std::string>());
            }
        }
    }
    return out;
}

std::string stringParam(const nlohmann::json& params, const char* name) {
    auto it = params.find(name);
    return it != params.end() && it->is_string() ? it->get<std::string>() : std::string{};
}

} // namespace

ValidationResult ValidationRule::makeResult(const SettingDefinition& definition, std::string message,
                                            std::optional<std::string> suggestion) const {
    return ValidationResult{definition.key, severity_, std::move(message), std::move(suggestion)};
}

std::optional<ValidationResult> RequiredRule::validate(const SettingDefinition& definition, const ConfigValue& value,
                                                       const ConfigurationStore&) const {
    if (!cfgvalidate::isEmptyValue(value)) {
        return std::nullopt;
    }
    return makeResult(definition, labelOf(definition) + " is required");
}

std::optional<ValidationResult> FileExistsRule::validate(const SettingDefinition& definition, const ConfigValue& value,
                                                         const ConfigurationStore&) const {
    for (const auto& path : pathsOf(value)) {
        std::error_code ec;
        const auto status = fs::status(path, ec);
        if (!fs::exists(status)) {
            return makeResult(definition, "File not found: " + path, "Check the path or pick an existing file");
        }
        if (!fs::is_regular_file(status)) {
            return makeResult(definition, "Not a regular file: " + path);
        }
    }
    return std::nullopt;
}

std::optional<ValidationResult> DirectoryExistsRule::validate(const SettingDefinition& definition,
                                                              const ConfigValue& value,
                                                              const ConfigurationStore&) const {
    for (const auto& path : pathsOf(value)) {
        std::error_code ec;
        const auto status = fs::status(path, ec);
        if (!fs::exists(status)) {
            return makeResult(definition, "Directory not found: " + path, "It will be created when the build runs");
        }
        if (!fs::is_directory(status)) {
            return makeResult(definition, "Not a directory: " + path);
        }
    }
    return std::nullopt;
}

ExtensionRule::ExtensionRule(Severity severity, std::vector<std::string> allowed)
    : ValidationRule(severity) {
    for (auto& extension : allowed) {
        extension = toLower(std::move(extension));
        if (!extension.empty() && extension.front() != '.') {
            extension.insert(extension.begin(), '.');
        }
        allowed_.push_back(std::move(extension));
    }
}

std::optional<ValidationResult> ExtensionRule::validate(const SettingDefinition& definition, const ConfigValue& value,
                                                        const ConfigurationStore&) const {
    for (const auto& path : pathsOf(value)) {
        const std::string extension = toLower(fs::path(path).extension().string());
        if (std::find(allowed_.begin(), allowed_.end(), extension) != allowed_.end()) {
            continue;
        }
        std::string expected;
        for (const auto& allowed : allowed_) {
            expected += expected.empty() ? allowed : ", " + allowed;
        }
        return makeResult(definition, path + " must have one of the extensions: " + expected);
    }
    return std::nullopt;
}

ToolAvailableRule::ToolAvailableRule(Severity severity, std::string tool, std::vector<std::string> when,
                                     platform::ToolLocator locator)
    : ValidationRule(severity), tool_(std::move(tool)), when_(std::move(when)), locator_(std::move(locator)) {}

std::optional<ValidationResult> ToolAvailableRule::validate(const SettingDefinition& definition,
                                                            const ConfigValue& value,
                                                            const ConfigurationStore&) const {
    if (when_.empty()) {
        if (!isTruthy(value)) {
            return std::nullopt;
        }
    } else {
        const auto* selected = std::get_if<std::string>(&value);
        if (!selected || std::find(when_.begin(), when_.end(), *selected) == when_.end()) {
            return std::nullopt;
        }
    }
    if (locator_ && locator_(tool_)) {
        return std::nullopt;
    }
    return makeResult(definition, tool_ + " was not found on PATH", "Install " + tool_ + " or choose another option");
}

PatternRule::PatternRule(Severity severity, const std::string& regex, std::string message)
    : ValidationRule(severity), regex_(regex), pattern_(regex), message_(std::move(message)) {}

std::optional<ValidationResult> PatternRule::validate(const SettingDefinition& definition, const ConfigValue& value,
                                                      const ConfigurationStore&) const {
    for (const auto& entry : pathsOf(value)) {
        if (std::regex_match(entry, regex_)) {
            continue;
        }
        if (!message_.empty()) {
            return makeResult(definition, message_);
        }
        return makeResult(definition, "'" + entry + "' does not match the expected format", "Expected pattern: " + pattern_);
    }
    return std::nullopt;
}

RequiresRule::RequiresRule(Severity severity, std::string key, ConfigValue equals, std::vector<ConfigValue> when,
                           std::string message)
    : ValidationRule(severity),
      key_(std::move(key)),
      equals_(std::move(equals)),
      when_(std::move(when)),
      message_(std::move(message)) {}

std::optional<ValidationResult> RequiresRule::validate(const SettingDefinition& definition, const ConfigValue& value,
                                                       const ConfigurationStore& config) const {
    bool triggered = false;
    if (when_.empty()) {
        triggered = isTruthy(value);
    } else {
        triggered = std::any_of(when_.begin(), when_.end(),
                                [&](const ConfigValue& candidate) { return cfgvalidate::valuesEqual(value, candidate); });
    }
    if (!triggered) {
        return std::nullopt;
    }
    const ConfigValue actual = config.get(key_);
    if (cfgvalidate::valuesEqual(actual, equals_)) {
        return std::nullopt;
    }
    if (!message_.empty()) {
        return makeResult(definition, message_);
    }
    return makeResult(definition, labelOf(definition) + " requires " + key_ + " = " + cfgvalidate::describe(equals_),
                      "Set " + key_ + " to " + cfgvalidate::describe(equals_));
}

Severity defaultSeverity(RuleKind kind) noexcept {
    switch (kind) {
    case RuleKind::Required:
    case RuleKind::FileExists:
    case RuleKind::Extension:
    case RuleKind::Pattern:
        return Severity::Error;
    case RuleKind::DirectoryExists:
    case RuleKind::ToolAvailable:
    case RuleKind::Requires:
        return Severity::Warning;
    }
    return Severity::Error;
}

std::unique_ptr<ValidationRule> makeRule(const RuleSpec& spec, const platform::ToolLocator& locator) {
    const Severity severity = spec.severity.value_or(defaultSeverity(spec.kind));
    const auto& params = spec.params;
    switch (spec.kind) {
    case RuleKind::Required:
        return std::make_unique<RequiredRule>(severity);
    case RuleKind::FileExists:
        return std::make_unique<FileExistsRule>(severity);
    case RuleKind::DirectoryExists:
        return std::make_unique<DirectoryExistsRule>(severity);
    case RuleKind::Extension:
        return std::make_unique<ExtensionRule>(severity, stringList(params, "allowed"));
    case RuleKind::ToolAvailable:
        return std::make_unique<ToolAvailableRule>(severity, stringParam(params, "tool"),
                                                   stringList(params, "when"), locator);
    case RuleKind::Pattern:
        return std::make_unique<PatternRule>(severity, stringParam(params, "regex"), stringParam(params, "message"));
    case RuleKind::Requires: {
        std::vector<ConfigValue> when;
        if (auto it = params.find("when"); it != params.end() && it->is_array()) {
            for (const auto& entry : *it) {
                when.push_back(cfgvalidate::fromJson(entry));
            }
        }
        ConfigValue equals = params.contains("equals") ? cfgvalidate::fromJson(params.at("equals")) : ConfigValue{};
        return std::make_unique<RequiresRule>(severity, stringParam(params, "key"), std::move(equals), std::move(when),
                                              stringParam(params, "message"));
    }
    }
    return nullptr;
}

std::optional<ValidationResult> checkValueShape(const SettingDefinition& definition, const ConfigValue& value) {
    auto mismatch = [&](const char* expected) {
        return ValidationResult{definition.key, Severity::Error,
                                labelOf(definition) + " expects " + expected + ", got " + cfgvalidate::describe(value),
                                std::nullopt};
    };
    const bool unset = std::holds_alternative<std::monostate>(value);
    switch (definition.type) {
    case SettingType::Boolean:
        if (!std::holds_alternative<bool>(value)) {
            return mismatch("true or false");
        }
        break;
    case SettingType::String:
    case SettingType::PathFile:
    case SettingType::PathDirectory:
        if (!unset && !std::holds_alternative<std::string>(value)) {
            return mismatch("a string");
        }
        break;
    case SettingType::Enum: {
        if (unset) {
            break;
        }
        const auto* selected = std::get_if<std::string>(&value);
        if (!selected) {
            return mismatch("one of its choices");
        }
        if (!definition.findChoice(*selected)) {
            return ValidationResult{definition.key, Severity::Error,
                                    "'" + *selected + "' is not a valid choice for " + labelOf(definition),
                                    "Choose one of: " + joinChoices(definition)};
        }
        break;
    }
    case SettingType::StringList:
        if (!unset && !std::holds_alternative<std::vector<std::string>>(value)) {
            return mismatch("a list of strings");
        }
        break;
    case SettingType::Integer: {
        if (unset) {
            break;
        }
        const auto* number = std::get_if<std::int64_t>(&value);
        if (!number) {
            return mismatch("an integer");
        }
        if ((definition.min && *number < *definition.min) || (definition.max && *number > *definition.max)) {
            std::string range = definition.min ? std::to_string(*definition.min) : std::string("-inf");
            range += " and ";
            range += definition.max ? std::to_string(*definition.max) : std::string("+inf");
            return ValidationResult{definition.key, Severity::Error,
                                    labelOf(definition) + " must be between " + range + ", got " + std::to_string(*number),
                                    std::nullopt};
        }
        break;
    }
    }
    return std::nullopt;
}

} // namespace nkb
