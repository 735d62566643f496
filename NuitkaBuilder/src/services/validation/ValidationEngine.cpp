#include "ValidationEngine.h"

#include "services/configuration/ConfigurationStore.h"
#include "services/logger/LogManager.h"

#include <algorithm>

namespace nkb {

ValidationEngine::ValidationEngine(const SettingRegistry& registry, platform::ToolLocator locator)
    : registry_(registry) {
    rules_.reserve(registry_.size());
    for (const auto& definition : registry_.definitions()) {
        std::vector<std::unique_ptr<ValidationRule>> rules;
        rules.reserve(definition.rules.size());
        for (const auto& spec : definition.rules) {
            if (auto rule = makeRule(spec, locator)) {
                rules.push_back(std::move(rule));
            }
        }
        rules_.push_back(std::move(rules));
    }
}

std::vector<ValidationResult> ValidationEngine::validateField(std::string_view path, const ConfigValue& value,
                                                              const ConfigurationStore& config) const {
    std::vector<ValidationResult> results;
    const auto index = registry_.indexOf(path);
    if (!index) {
        results.push_back(ValidationResult{std::string(path), Severity::Warning,
                                           "Unrecognized setting '" + std::string(path) + "'",
                                           std::string("It is kept in the file but not passed to the compiler")});
        return results;
    }
    const auto& definition = registry_.definitions()[*index];
    if (auto shape = checkValueShape(definition, value)) {
        results.push_back(std::move(*shape));
        return results;
    }
    for (const auto& rule : rules_[*index]) {
        auto result = rule->validate(definition, value, config);
        if (!result) {
            continue;
        }
        const bool isError = result->severity == Severity::Error;
        results.push_back(std::move(*result));
        if (isError) {
            break;
        }
    }
    return results;
}

std::vector<ValidationResult> ValidationEngine::validateField(std::string_view path,
                                                              const ConfigurationStore& config) const {
    return validateField(path, config.get(path), config);
}

std::vector<ValidationResult> ValidationEngine::validateAll(const ConfigurationStore& config) const {
    std::vector<ValidationResult> results;
    for (const auto& definition : registry_.definitions()) {
        auto field = validateField(definition.key, config.get(definition.key, definition.defaultValue), config);
        results.insert(results.end(), std::make_move_iterator(field.begin()), std::make_move_iterator(field.end()));
    }
    for (const auto& key : config.unrecognizedKeys()) {
        results.push_back(ValidationResult{key, Severity::Warning, "Unrecognized setting '" + key + "'",
                                           std::string("It is kept in the file but not passed to the compiler")});
    }
    logging::LogManager::debug("Validation finished: {} error(s), {} warning(s), {} info",
                               count(results, Severity::Error), count(results, Severity::Warning),
                               count(results, Severity::Info));
    return results;
}

bool ValidationEngine::hasErrors(const std::vector<ValidationResult>& results) noexcept {
    return std::any_of(results.begin(), results.end(),
                       [](const ValidationResult& result) { return result.severity == Severity::Error; });
}

std::size_t ValidationEngine::count(const std::vector<ValidationResult>& results, Severity severity) noexcept {
    return static_cast<std::size_t>(std::count_if(results.begin(), results.end(),
                                                  [severity](const ValidationResult& result) { return result.severity == severity; }));
}

} // namespace nkb
