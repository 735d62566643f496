#include "CommandCompiler.h"

#include "services/configuration/ConfigurationStore.h"
#include "services/configuration/validate.h"
#include "services/schema/SettingSchemaLoader.h"

#include <algorithm>
#include <cctype>
#include <map>
#include <string_view>

namespace nkb {

namespace {

[[noreturn]] void invalid(const SettingDefinition& definition, const ConfigValue& value, const std::string& expected) {
    throw InvalidValueError(definition.key, "expected " + expected + ", got " + cfgvalidate::describe(value));
}

void emit(CompiledCommand& command, std::string id, std::string arg, const SettingDefinition& definition) {
    command.argv.push_back(arg);
    command.flags.push_back(FlagAtom{std::move(id), std::move(arg), definition.key});
}

void compileBoolean(CompiledCommand& command, const SettingDefinition& definition, const ConfigValue& value) {
    const auto* flag = std::get_if<bool>(&value);
    if (!flag) {
        if (std::holds_alternative<std::monostate>(value)) {
            return;
        }
        invalid(definition, value, "a boolean");
    }
    if (*flag && definition.hasFlag()) {
        emit(command, definition.key, definition.flag, definition);
    }
}

void compileString(CompiledCommand& command, const SettingDefinition& definition, const ConfigValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return;
    }
    const auto* text = std::get_if<std::string>(&value);
    if (!text) {
        invalid(definition, value, "a string");
    }
    if (text->empty() || !definition.hasFlag()) {
        return;
    }
    emit(command, definition.key, CommandCompiler::substitute(definition.flag, *text), definition);
}

void compileEnum(CompiledCommand& command, const SettingDefinition& definition, const ConfigValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return;
    }
    const auto* selected = std::get_if<std::string>(&value);
    if (!selected) {
        invalid(definition, value, "one of its choices");
    }
    const EnumChoice* choice = definition.findChoice(*selected);
    if (!choice) {
        throw InvalidValueError(definition.key, "'" + *selected + "' is not a declared choice");
    }
    if (!choice->flag.empty()) {
        emit(command, definition.key, CommandCompiler::substitute(choice->flag, choice->value), definition);
    }
}

void compileList(CompiledCommand& command, const SettingDefinition& definition, const ConfigValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return;
    }
    const auto* list = std::get_if<std::vector<std::string>>(&value);
    if (!list) {
        invalid(definition, value, "a list of strings");
    }
    if (!definition.hasFlag()) {
        return;
    }
    for (const auto& item : *list) {
        if (item.empty()) {
            continue;
        }
        emit(command, definition.key + ":" + item, CommandCompiler::substitute(definition.flag, item), definition);
    }
}

void compileInteger(CompiledCommand& command, const SettingDefinition& definition, const ConfigValue& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return;
    }
    const auto* number = std::get_if<std::int64_t>(&value);
    if (!number) {
        invalid(definition, value, "an integer");
    }
    if ((definition.min && *number < *definition.min) || (definition.max && *number > *definition.max)) {
        throw InvalidValueError(definition.key, std::to_string(*number) + " is outside the allowed range");
    }
    if (definition.hasFlag()) {
        emit(command, definition.key, CommandCompiler::substitute(definition.flag, std::to_string(*number)), definition);
    }
}

} // namespace

InvalidValueError::InvalidValueError(std::string key, const std::string& detail)
    : std::runtime_error("Invalid value for " + key + ": " + detail), key_(std::move(key)) {}

std::string CommandCompiler::substitute(const std::string& flagTemplate, const std::string& value) {
    const auto pos = flagTemplate.find(kValuePlaceholder);
    if (pos == std::string::npos) {
        return flagTemplate;
    }
    std::string out = flagTemplate;
    out.replace(pos, kValuePlaceholder.size(), value);
    return out;
}

std::string CommandCompiler::quote(const std::string& arg) {
    if (arg.empty()) {
        return "''";
    }
    const bool plain = std::all_of(arg.begin(), arg.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || std::string_view("-_./=:,+@%").find(c) != std::string_view::npos;
    });
    if (plain) {
        return arg;
    }
    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += '\'';
    return out;
}

std::string CompiledCommand::toString() const {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out += ' ';
        }
        out += CommandCompiler::quote(arg);
    }
    return out;
}

CompiledCommand CommandCompiler::compile(const SettingRegistry& registry, const ConfigurationStore& config,
                                         const CompileOptions& options) {
    CompiledCommand command;
    const ToolSpec& tool = registry.tool();
    command.argv.push_back(options.toolPath.value_or(tool.executable));
    command.argv.insert(command.argv.end(), tool.arguments.begin(), tool.arguments.end());

    const SettingDefinition* positional = nullptr;
    for (const auto& definition : registry.definitions()) {
        if (options.platform && !definition.appliesTo(*options.platform)) {
            continue;
        }
        const ConfigValue value = config.get(definition.key, definition.defaultValue);
        if (definition.positional) {
            positional = &definition;
            if (!std::holds_alternative<std::monostate>(value) && !std::holds_alternative<std::string>(value)) {
                invalid(definition, value, "a string");
            }
            continue;
        }
        switch (definition.type) {
        case SettingType::Boolean:
            compileBoolean(command, definition, value);
            break;
        case SettingType::String:
        case SettingType::PathFile:
        case SettingType::PathDirectory:
            compileString(command, definition, value);
            break;
        case SettingType::Enum:
            compileEnum(command, definition, value);
            break;
        case SettingType::StringList:
            compileList(command, definition, value);
            break;
        case SettingType::Integer:
            compileInteger(command, definition, value);
            break;
        }
    }

    if (positional) {
        const ConfigValue value = config.get(positional->key, positional->defaultValue);
        const auto* input = std::get_if<std::string>(&value);
        if (input && !input->empty()) {
            command.entryScript = *input;
            command.argv.push_back(*input);
        }
    }
    return command;
}

CommandDiff diffCommands(const CompiledCommand& before, const CompiledCommand& after) {
    std::map<std::string, std::string> a;
    std::map<std::string, std::string> b;
    for (const auto& atom : before.flags) {
        a[atom.id] = atom.arg;
    }
    for (const auto& atom : after.flags) {
        b[atom.id] = atom.arg;
    }

    CommandDiff diff;
    for (const auto& [id, arg] : b) {
        auto it = a.find(id);
        if (it == a.end()) {
            diff.added.push_back(id);
        } else if (it->second != arg) {
            diff.changed.push_back(id);
        }
    }
    for (const auto& [id, arg] : a) {
        if (b.count(id) == 0) {
            diff.removed.push_back(id);
        }
    }
    // Entry script changes are reported like any other argument.
    if (before.entryScript != after.entryScript) {
        if (!before.entryScript) {
            diff.added.push_back("<entry>");
        } else if (!after.entryScript) {
            diff.removed.push_back("<entry>");
        } else {
            diff.changed.push_back("<entry>");
        }
        std::sort(diff.added.begin(), diff.added.end());
        std::sort(diff.removed.begin(), diff.removed.end());
        std::sort(diff.changed.begin(), diff.changed.end());
    }
    return diff;
}

} // namespace nkb
