#include "SettingSchemaLoader.h"

#include "services/configuration/json_io.h"
#include "services/configuration/validate.h"
#include "services/logger/LogManager.h"

#include <algorithm>
#include <array>
#include <cctype>
#include <regex>
#include <unordered_set>

#include <nlohmann/json.hpp>

namespace nkb {

namespace {

using nlohmann::json;

constexpr std::array<const char*, 3> kPlatforms = {"windows", "macos", "linux"};

[[noreturn]] void fail(const std::string& origin, const std::string& detail) {
    throw SchemaLoadError(SchemaLoadError::Kind::Malformed, origin, detail);
}

std::string settingContext(const std::string& key) {
    return "setting '" + key + "'";
}

std::string optionalString(const json& node, const char* name, const std::string& origin, const std::string& context) {
    auto it = node.find(name);
    if (it == node.end() || it->is_null()) {
        return {};
    }
    if (!it->is_string()) {
        fail(origin, context + ": '" + name + "' must be a string");
    }
    return it->get<std::string>();
}

std::vector<std::string> stringArray(const json& node, const std::string& origin, const std::string& context) {
    if (!node.is_array()) {
        fail(origin, context + " must be an array of strings");
    }
    std::vector<std::string> out;
    out.reserve(node.size());
    for (const auto& entry : node) {
        if (!entry.is_string()) {
            fail(origin, context + " must be an array of strings");
        }
        out.push_back(entry.get<std::string>());
    }
    return out;
}

bool takesValue(SettingType type) noexcept {
    switch (type) {
    case SettingType::String:
    case SettingType::PathFile:
    case SettingType::PathDirectory:
    case SettingType::StringList:
    case SettingType::Integer:
        return true;
    case SettingType::Boolean:
    case SettingType::Enum:
        return false;
    }
    return false;
}

void checkFlag(const SettingDefinition& def, const std::string& origin) {
    const auto ctx = settingContext(def.key);
    if (def.flag.empty()) {
        return;
    }
    if (def.type == SettingType::Enum) {
        fail(origin, ctx + ": enum settings declare their flags per choice");
    }
    if (def.positional) {
        fail(origin, ctx + ": positional settings cannot declare a flag");
    }
    if (!SettingSchemaLoader::isValidFlagTemplate(def.flag)) {
        fail(origin, ctx + ": malformed flag template '" + def.flag + "'");
    }
    const auto placeholders = SettingSchemaLoader::placeholderCount(def.flag);
    if (def.type == SettingType::Boolean && placeholders != 0) {
        fail(origin, ctx + ": boolean flags cannot contain a {value} placeholder");
    }
    if (takesValue(def.type) && placeholders != 1) {
        fail(origin, ctx + ": flag '" + def.flag + "' needs a {value} placeholder");
    }
}

void parseChoices(SettingDefinition& def, const json& node, const std::string& origin) {
    const auto ctx = settingContext(def.key);
    auto it = node.find("choices");
    if (it == node.end() || !it->is_array() || it->empty()) {
        fail(origin, ctx + ": enum settings need a non-empty 'choices' array");
    }
    std::unordered_set<std::string> seen;
    for (const auto& entry : *it) {
        if (!entry.is_object()) {
            fail(origin, ctx + ": each choice must be an object");
        }
        EnumChoice choice;
        choice.value = optionalString(entry, "value", origin, ctx);
        choice.flag = optionalString(entry, "flag", origin, ctx);
        if (choice.value.empty()) {
            fail(origin, ctx + ": choice without a value");
        }
        if (!seen.insert(choice.value).second) {
            fail(origin, ctx + ": duplicate choice '" + choice.value + "'");
        }
        if (!choice.flag.empty() && !SettingSchemaLoader::isValidFlagTemplate(choice.flag)) {
            fail(origin, ctx + ": malformed flag template '" + choice.flag + "' for choice '" + choice.value + "'");
        }
        def.choices.push_back(std::move(choice));
    }
}

ConfigValue parseDefault(const SettingDefinition& def, const json& node, const std::string& origin) {
    const auto ctx = settingContext(def.key);
    auto it = node.find("default");
    const bool absent = it == node.end() || it->is_null();
    switch (def.type) {
    case SettingType::Boolean:
        if (absent) return false;
        if (!it->is_boolean()) fail(origin, ctx + ": default must be a boolean");
        return it->get<bool>();
    case SettingType::String:
    case SettingType::PathFile:
    case SettingType::PathDirectory:
        if (absent) return std::string{};
        if (!it->is_string()) fail(origin, ctx + ": default must be a string");
        return it->get<std::string>();
    case SettingType::Enum: {
        if (absent) return def.choices.front().value;
        if (!it->is_string() || !def.findChoice(it->get<std::string>())) {
            fail(origin, ctx + ": default must be one of the declared choices");
        }
        return it->get<std::string>();
    }
    case SettingType::StringList:
        if (absent) return std::vector<std::string>{};
        return stringArray(*it, origin, ctx + ": default");
    case SettingType::Integer: {
        if (absent) return std::monostate{};
        if (!it->is_number_integer()) fail(origin, ctx + ": default must be an integer");
        const auto value = it->get<std::int64_t>();
        if ((def.min && value < *def.min) || (def.max && value > *def.max)) {
            fail(origin, ctx + ": default is outside the declared bounds");
        }
        return value;
    }
    }
    return std::monostate{};
}

void checkRuleParams(const SettingDefinition& def, const RuleSpec& rule, const std::string& origin) {
    const auto ctx = settingContext(def.key) + " rule '" + to_string(rule.kind) + "'";
    const auto& p = rule.params;
    switch (rule.kind) {
    case RuleKind::Extension: {
        auto it = p.find("allowed");
        if (it == p.end() || stringArray(*it, origin, ctx + ": 'allowed'").empty()) {
            fail(origin, ctx + ": needs a non-empty 'allowed' list");
        }
        break;
    }
    case RuleKind::ToolAvailable: {
        auto it = p.find("tool");
        if (it == p.end() || !it->is_string() || it->get<std::string>().empty()) {
            fail(origin, ctx + ": needs a 'tool' name");
        }
        break;
    }
    case RuleKind::Pattern: {
        auto it = p.find("regex");
        if (it == p.end() || !it->is_string()) {
            fail(origin, ctx + ": needs a 'regex' string");
        }
        try {
            std::regex compiled(it->get<std::string>());
            (void)compiled;
        } catch (const std::regex_error& e) {
            fail(origin, ctx + ": invalid regex: " + e.what());
        }
        break;
    }
    case RuleKind::Requires: {
        auto key = p.find("key");
        if (key == p.end() || !key->is_string()) {
            fail(origin, ctx + ": needs a 'key' string");
        }
        if (!p.contains("equals")) {
            fail(origin, ctx + ": needs an 'equals' value");
        }
        break;
    }
    case RuleKind::Required:
    case RuleKind::FileExists:
    case RuleKind::DirectoryExists:
        break;
    }
    if (auto when = p.find("when"); when != p.end() && !when->is_array()) {
        fail(origin, ctx + ": 'when' must be an array");
    }
}

std::vector<RuleSpec> parseRules(const SettingDefinition& def, const json& node, const std::string& origin) {
    std::vector<RuleSpec> rules;
    auto it = node.find("validation");
    if (it == node.end() || it->is_null()) {
        return rules;
    }
    const auto ctx = settingContext(def.key);
    if (!it->is_array()) {
        fail(origin, ctx + ": 'validation' must be an array");
    }
    for (const auto& entry : *it) {
        if (!entry.is_object()) {
            fail(origin, ctx + ": each validation rule must be an object");
        }
        const std::string name = optionalString(entry, "rule", origin, ctx);
        auto kind = parseRuleKind(name);
        if (!kind) {
            fail(origin, ctx + ": unknown validation rule '" + name + "'");
        }
        RuleSpec rule;
        rule.kind = *kind;
        if (auto sev = entry.find("severity"); sev != entry.end()) {
            auto parsed = sev->is_string() ? parseSeverity(sev->get<std::string>()) : std::nullopt;
            if (!parsed) {
                fail(origin, ctx + ": unknown severity " + sev->dump());
            }
            rule.severity = parsed;
        }
        rule.params = entry;
        rule.params.erase("rule");
        rule.params.erase("severity");
        checkRuleParams(def, rule, origin);
        rules.push_back(std::move(rule));
    }
    return rules;
}

std::optional<std::int64_t> optionalInt(const json& node, const char* name, const std::string& origin, const std::string& ctx) {
    auto it = node.find(name);
    if (it == node.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_number_integer()) {
        fail(origin, ctx + ": '" + name + "' must be an integer");
    }
    return it->get<std::int64_t>();
}

SettingDefinition parseSetting(const json& node, const SettingTab& tab, const SettingSection& section, const std::string& origin) {
    if (!node.is_object()) {
        fail(origin, "section '" + section.id + "': settings must be objects");
    }
    SettingDefinition def;
    def.key = optionalString(node, "key", origin, "section '" + section.id + "'");
    if (!cfgvalidate::isValidKey(def.key)) {
        fail(origin, "section '" + section.id + "': invalid setting key '" + def.key + "'");
    }
    const auto ctx = settingContext(def.key);

    const std::string typeName = optionalString(node, "type", origin, ctx);
    auto type = parseSettingType(typeName);
    if (!type) {
        fail(origin, ctx + ": unknown type '" + typeName + "'");
    }
    def.type = *type;

    if (auto risk = node.find("risk"); risk != node.end()) {
        auto parsed = risk->is_string() ? parseRiskTier(risk->get<std::string>()) : std::nullopt;
        if (!parsed) {
            fail(origin, ctx + ": unknown risk tier " + risk->dump());
        }
        def.risk = *parsed;
    }

    def.label = optionalString(node, "label", origin, ctx);
    def.description = optionalString(node, "description", origin, ctx);
    def.flag = optionalString(node, "flag", origin, ctx);
    if (auto positional = node.find("positional"); positional != node.end()) {
        if (!positional->is_boolean()) {
            fail(origin, ctx + ": 'positional' must be a boolean");
        }
        def.positional = positional->get<bool>();
    }
    if (def.positional && def.type != SettingType::String && def.type != SettingType::PathFile) {
        fail(origin, ctx + ": only string or file settings can be positional");
    }

    if (def.type == SettingType::Enum) {
        parseChoices(def, node, origin);
    }
    checkFlag(def, origin);

    def.min = optionalInt(node, "min", origin, ctx);
    def.max = optionalInt(node, "max", origin, ctx);
    if ((def.min || def.max) && def.type != SettingType::Integer) {
        fail(origin, ctx + ": bounds are only valid on integer settings");
    }
    if (def.min && def.max && *def.min > *def.max) {
        fail(origin, ctx + ": min is greater than max");
    }

    def.defaultValue = parseDefault(def, node, origin);
    def.rules = parseRules(def, node, origin);

    if (auto platforms = node.find("platforms"); platforms != node.end()) {
        def.platforms = stringArray(*platforms, origin, ctx + ": 'platforms'");
        for (const auto& platform : def.platforms) {
            if (std::find(kPlatforms.begin(), kPlatforms.end(), platform) == kPlatforms.end()) {
                fail(origin, ctx + ": unknown platform '" + platform + "'");
            }
        }
    }

    def.tabId = tab.id;
    def.sectionId = section.id;
    def.sectionTitle = section.title;
    return def;
}

ToolSpec parseTool(const json& document, const std::string& origin) {
    ToolSpec tool;
    auto it = document.find("tool");
    if (it == document.end()) {
        return tool;
    }
    if (!it->is_object()) {
        fail(origin, "'tool' must be an object");
    }
    std::string executable = optionalString(*it, "executable", origin, "tool");
    if (!executable.empty()) {
        tool.executable = std::move(executable);
    }
    if (auto args = it->find("arguments"); args != it->end()) {
        tool.arguments = stringArray(*args, origin, "tool.arguments");
    }
    return tool;
}

} // namespace

SchemaLoadError::SchemaLoadError(Kind kind, std::string origin, const std::string& detail)
    : std::runtime_error(std::string(kind == Kind::Unreadable ? "Cannot read settings schema " : "Malformed settings schema ")
                         + origin + ": " + detail),
      kind_(kind),
      origin_(std::move(origin)) {}

bool SettingSchemaLoader::isValidFlagTemplate(std::string_view flag) noexcept {
    if (flag.empty() || flag.front() != '-') {
        return false;
    }
    if (placeholderCount(flag) > 1) {
        return false;
    }
    std::size_t pos = 0;
    while (pos < flag.size()) {
        if (flag.compare(pos, kValuePlaceholder.size(), kValuePlaceholder) == 0) {
            pos += kValuePlaceholder.size();
            continue;
        }
        const char c = flag[pos];
        if (c == '{' || c == '}' || std::isspace(static_cast<unsigned char>(c))) {
            return false;
        }
        ++pos;
    }
    return true;
}

std::size_t SettingSchemaLoader::placeholderCount(std::string_view flag) noexcept {
    std::size_t count = 0;
    for (auto pos = flag.find(kValuePlaceholder); pos != std::string_view::npos;
         pos = flag.find(kValuePlaceholder, pos + kValuePlaceholder.size())) {
        ++count;
    }
    return count;
}

SettingRegistry SettingSchemaLoader::loadFile(const std::string& path) {
    auto read = jsonio::readJson(path);
    switch (read.status) {
    case jsonio::ReadStatus::Ok:
        break;
    case jsonio::ReadStatus::Malformed:
        throw SchemaLoadError(SchemaLoadError::Kind::Malformed, path, read.message);
    case jsonio::ReadStatus::NotFound:
    case jsonio::ReadStatus::Unreadable:
    case jsonio::ReadStatus::TooLarge:
        throw SchemaLoadError(SchemaLoadError::Kind::Unreadable, path, read.message);
    }
    auto registry = loadJson(read.document, path);
    logging::LogManager::info("Loaded {} setting definitions from {}", registry.size(), path);
    return registry;
}

SettingRegistry SettingSchemaLoader::loadString(std::string_view text, const std::string& origin) {
    json document;
    try {
        document = json::parse(text.begin(), text.end());
    } catch (const json::parse_error& e) {
        throw SchemaLoadError(SchemaLoadError::Kind::Malformed, origin, e.what());
    }
    return loadJson(document, origin);
}

SettingRegistry SettingSchemaLoader::loadJson(const json& document, const std::string& origin) {
    if (!document.is_object()) {
        fail(origin, "top-level value must be an object");
    }
    SettingRegistry registry;
    if (auto version = document.find("version"); version != document.end()) {
        if (!version->is_number_integer()) {
            fail(origin, "'version' must be an integer");
        }
        registry.version_ = version->get<int>();
    }
    registry.tool_ = parseTool(document, origin);

    auto tabs = document.find("tabs");
    if (tabs == document.end() || !tabs->is_array()) {
        fail(origin, "'tabs' must be an array");
    }

    const SettingDefinition* positional = nullptr;
    for (const auto& tabNode : *tabs) {
        if (!tabNode.is_object()) {
            fail(origin, "tabs must be objects");
        }
        SettingTab tab;
        tab.id = optionalString(tabNode, "id", origin, "tab");
        tab.title = optionalString(tabNode, "title", origin, "tab '" + tab.id + "'");
        auto sections = tabNode.find("sections");
        if (sections == tabNode.end() || !sections->is_array()) {
            fail(origin, "tab '" + tab.id + "': 'sections' must be an array");
        }
        for (const auto& sectionNode : *sections) {
            if (!sectionNode.is_object()) {
                fail(origin, "tab '" + tab.id + "': sections must be objects");
            }
            SettingSection section;
            section.id = optionalString(sectionNode, "id", origin, "tab '" + tab.id + "'");
            section.title = optionalString(sectionNode, "title", origin, "section '" + section.id + "'");
            auto settings = sectionNode.find("settings");
            if (settings == sectionNode.end() || !settings->is_array()) {
                fail(origin, "section '" + section.id + "': 'settings' must be an array");
            }
            for (const auto& settingNode : *settings) {
                SettingDefinition def = parseSetting(settingNode, tab, section, origin);
                if (registry.index_.count(def.key) != 0) {
                    fail(origin, "duplicate setting key '" + def.key + "'");
                }
                section.keys.push_back(def.key);
                registry.index_.emplace(def.key, registry.definitions_.size());
                registry.definitions_.push_back(std::move(def));
            }
            tab.sections.push_back(std::move(section));
        }
        registry.tabs_.push_back(std::move(tab));
    }

    // Keys map onto one nested document, so no key may nest under another.
    for (const auto& def : registry.definitions_) {
        for (std::size_t dot = def.key.find('.'); dot != std::string::npos; dot = def.key.find('.', dot + 1)) {
            const std::string parent = def.key.substr(0, dot);
            if (registry.index_.count(parent) != 0) {
                fail(origin, "setting key '" + def.key + "' nests under setting '" + parent + "'");
            }
        }
    }

    for (const auto& def : registry.definitions_) {
        if (def.positional) {
            if (positional) {
                fail(origin, "both '" + positional->key + "' and '" + def.key + "' are marked positional");
            }
            positional = &def;
        }
        for (const auto& rule : def.rules) {
            if (rule.kind != RuleKind::Requires) {
                continue;
            }
            const auto target = rule.params.at("key").get<std::string>();
            if (registry.index_.count(target) == 0) {
                fail(origin, settingContext(def.key) + ": rule 'requires' references unknown setting '" + target + "'");
            }
        }
    }
    return registry;
}

} // namespace nkb
