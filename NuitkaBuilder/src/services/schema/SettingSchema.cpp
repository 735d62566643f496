#include "SettingSchema.h"

#include <algorithm>
#include <array>

namespace nkb {

namespace {

template <typename Enum, std::size_t N>
std::optional<Enum> lookupName(const std::array<std::pair<const char*, Enum>, N>& table, std::string_view text) noexcept {
    for (const auto& [name, value] : table) {
        if (text == name) {
            return value;
        }
    }
    return std::nullopt;
}

constexpr std::array<std::pair<const char*, SettingType>, 7> kTypeNames = {{
    {"boolean", SettingType::Boolean},
    {"string", SettingType::String},
    {"path-file", SettingType::PathFile},
    {"path-directory", SettingType::PathDirectory},
    {"enum", SettingType::Enum},
    {"string-list", SettingType::StringList},
    {"integer", SettingType::Integer},
}};

constexpr std::array<std::pair<const char*, RiskTier>, 4> kRiskNames = {{
    {"safe", RiskTier::Safe},
    {"caution", RiskTier::Caution},
    {"risky", RiskTier::Risky},
    {"expert", RiskTier::Expert},
}};

constexpr std::array<std::pair<const char*, Severity>, 3> kSeverityNames = {{
    {"error", Severity::Error},
    {"warning", Severity::Warning},
    {"info", Severity::Info},
}};

constexpr std::array<std::pair<const char*, RuleKind>, 7> kRuleNames = {{
    {"required", RuleKind::Required},
    {"file_exists", RuleKind::FileExists},
    {"directory_exists", RuleKind::DirectoryExists},
    {"extension", RuleKind::Extension},
    {"tool_available", RuleKind::ToolAvailable},
    {"pattern", RuleKind::Pattern},
    {"requires", RuleKind::Requires},
}};

template <typename Enum, std::size_t N>
const char* nameFor(const std::array<std::pair<const char*, Enum>, N>& table, Enum value) noexcept {
    for (const auto& [name, entry] : table) {
        if (entry == value) {
            return name;
        }
    }
    return "unknown";
}

} // namespace

const char* to_string(SettingType type) noexcept { return nameFor(kTypeNames, type); }
const char* to_string(RiskTier tier) noexcept { return nameFor(kRiskNames, tier); }
const char* to_string(Severity severity) noexcept { return nameFor(kSeverityNames, severity); }
const char* to_string(RuleKind kind) noexcept { return nameFor(kRuleNames, kind); }

std::optional<SettingType> parseSettingType(std::string_view text) noexcept { return lookupName(kTypeNames, text); }
std::optional<RiskTier> parseRiskTier(std::string_view text) noexcept { return lookupName(kRiskNames, text); }
std::optional<Severity> parseSeverity(std::string_view text) noexcept { return lookupName(kSeverityNames, text); }
std::optional<RuleKind> parseRuleKind(std::string_view text) noexcept { return lookupName(kRuleNames, text); }

const EnumChoice* SettingDefinition::findChoice(std::string_view value) const noexcept {
    for (const auto& choice : choices) {
        if (choice.value == value) {
            return &choice;
        }
    }
    return nullptr;
}

bool SettingDefinition::appliesTo(std::string_view platform) const noexcept {
    if (platforms.empty()) {
        return true;
    }
    return std::find(platforms.begin(), platforms.end(), platform) != platforms.end();
}

std::string SettingDefinition::namespaceName() const {
    const auto dot = key.rfind('.');
    if (dot == std::string::npos) {
        return {};
    }
    return key.substr(0, dot);
}

UnknownKeyError::UnknownKeyError(std::string key)
    : std::runtime_error("Unknown setting: " + key), key_(std::move(key)) {}

const SettingDefinition* SettingRegistry::find(std::string_view key) const noexcept {
    auto it = index_.find(std::string(key));
    if (it == index_.end()) {
        return nullptr;
    }
    return &definitions_[it->second];
}

const SettingDefinition& SettingRegistry::at(std::string_view key) const {
    if (const auto* definition = find(key)) {
        return *definition;
    }
    throw UnknownKeyError(std::string(key));
}

std::optional<std::size_t> SettingRegistry::indexOf(std::string_view key) const noexcept {
    auto it = index_.find(std::string(key));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

const SettingDefinition* SettingRegistry::positional() const noexcept {
    for (const auto& definition : definitions_) {
        if (definition.positional) {
            return &definition;
        }
    }
    return nullptr;
}

std::vector<SettingRegistry::NamespaceGroup> SettingRegistry::groupedByNamespace() const {
    std::vector<NamespaceGroup> groups;
    std::unordered_map<std::string, std::size_t> slots;
    for (const auto& definition : definitions_) {
        std::string ns = definition.namespaceName();
        auto [it, inserted] = slots.emplace(ns, groups.size());
        if (inserted) {
            groups.emplace_back(std::move(ns), std::vector<const SettingDefinition*>{});
        }
        groups[it->second].second.push_back(&definition);
    }
    return groups;
}

std::vector<const SettingDefinition*> SettingRegistry::byRiskTier(RiskTier tier) const {
    std::vector<const SettingDefinition*> out;
    for (const auto& definition : definitions_) {
        if (definition.risk == tier) {
            out.push_back(&definition);
        }
    }
    return out;
}

std::vector<const SettingDefinition*> SettingRegistry::forTab(std::string_view tabId) const {
    std::vector<const SettingDefinition*> out;
    for (const auto& definition : definitions_) {
        if (definition.tabId == tabId) {
            out.push_back(&definition);
        }
    }
    return out;
}

} // namespace nkb
