#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace nkb {

enum class SettingType : std::uint8_t {
    Boolean,
    String,
    PathFile,
    PathDirectory,
    Enum,
    StringList,
    Integer,
};

enum class RiskTier : std::uint8_t {
    Safe,
    Caution,
    Risky,
    Expert,
};

enum class Severity : std::uint8_t {
    Error,
    Warning,
    Info,
};

enum class RuleKind : std::uint8_t {
    Required,
    FileExists,
    DirectoryExists,
    Extension,
    ToolAvailable,
    Pattern,
    Requires,
};

[[nodiscard]] const char* to_string(SettingType type) noexcept;
[[nodiscard]] const char* to_string(RiskTier tier) noexcept;
[[nodiscard]] const char* to_string(Severity severity) noexcept;
[[nodiscard]] const char* to_string(RuleKind kind) noexcept;

[[nodiscard]] std::optional<SettingType> parseSettingType(std::string_view text) noexcept;
[[nodiscard]] std::optional<RiskTier> parseRiskTier(std::string_view text) noexcept;
[[nodiscard]] std::optional<Severity> parseSeverity(std::string_view text) noexcept;
[[nodiscard]] std::optional<RuleKind> parseRuleKind(std::string_view text) noexcept;

using ConfigValue = std::variant<std::monostate, bool, std::int64_t, double, std::string, std::vector<std::string>, nlohmann::json>;

// One declared validation rule. Rule-specific parameters stay as JSON and are
// interpreted by the validation engine.
struct RuleSpec {
    RuleKind kind{RuleKind::Required};
    std::optional<Severity> severity;
    nlohmann::json params = nlohmann::json::object();
};

struct EnumChoice {
    std::string value;
    std::string flag;
};

struct SettingDefinition {
    std::string key;
    SettingType type{SettingType::String};
    std::string label;
    std::string description;
    std::string flag;
    std::vector<EnumChoice> choices;
    ConfigValue defaultValue;
    RiskTier risk{RiskTier::Safe};
    std::vector<RuleSpec> rules;
    std::optional<std::int64_t> min;
    std::optional<std::int64_t> max;
    bool positional{false};
    std::vector<std::string> platforms;
    std::string tabId;
    std::string sectionId;
    std::string sectionTitle;

    [[nodiscard]] bool hasFlag() const noexcept { return !flag.empty(); }
    [[nodiscard]] const EnumChoice* findChoice(std::string_view value) const noexcept;
    [[nodiscard]] bool appliesTo(std::string_view platform) const noexcept;
    [[nodiscard]] std::string namespaceName() const;
};

struct SettingSection {
    std::string id;
    std::string title;
    std::vector<std::string> keys;
};

struct SettingTab {
    std::string id;
    std::string title;
    std::vector<SettingSection> sections;
};

struct ToolSpec {
    std::string executable{"python3"};
    std::vector<std::string> arguments{"-m", "nuitka"};
};

class UnknownKeyError : public std::runtime_error {
public:
    explicit UnknownKeyError(std::string key);

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class SettingRegistry {
public:
    SettingRegistry() = default;

    [[nodiscard]] const SettingDefinition* find(std::string_view key) const noexcept;
    [[nodiscard]] const SettingDefinition& at(std::string_view key) const;
    [[nodiscard]] bool contains(std::string_view key) const noexcept { return find(key) != nullptr; }
    [[nodiscard]] std::optional<std::size_t> indexOf(std::string_view key) const noexcept;

    [[nodiscard]] const std::vector<SettingDefinition>& definitions() const noexcept { return definitions_; }
    [[nodiscard]] const std::vector<SettingTab>& tabs() const noexcept { return tabs_; }
    [[nodiscard]] const ToolSpec& tool() const noexcept { return tool_; }
    [[nodiscard]] const SettingDefinition* positional() const noexcept;
    [[nodiscard]] int version() const noexcept { return version_; }
    [[nodiscard]] std::size_t size() const noexcept { return definitions_.size(); }

    using NamespaceGroup = std::pair<std::string, std::vector<const SettingDefinition*>>;
    [[nodiscard]] std::vector<NamespaceGroup> groupedByNamespace() const;
    [[nodiscard]] std::vector<const SettingDefinition*> byRiskTier(RiskTier tier) const;
    [[nodiscard]] std::vector<const SettingDefinition*> forTab(std::string_view tabId) const;

    template <typename Callback>
    void forEachDefinition(const Callback& cb) const {
        for (const auto& definition : definitions_) {
            cb(definition);
        }
    }

private:
    friend class SettingSchemaLoader;

    std::vector<SettingDefinition> definitions_;
    std::vector<SettingTab> tabs_;
    std::unordered_map<std::string, std::size_t> index_;
    ToolSpec tool_;
    int version_{1};
};

} // namespace nkb
