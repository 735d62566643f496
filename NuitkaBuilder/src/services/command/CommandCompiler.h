#pragma once

#include "services/schema/SettingSchema.h"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace nkb {

class ConfigurationStore;

class InvalidValueError : public std::runtime_error {
public:
    InvalidValueError(std::string key, const std::string& detail);

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

// One emitted argument, traced back to the setting that produced it. List
// settings produce one atom per element, identified as "<key>:<element>".
struct FlagAtom {
    std::string id;
    std::string arg;
    std::string source;
};

struct CompiledCommand {
    std::vector<std::string> argv;
    std::vector<FlagAtom> flags;
    std::optional<std::string> entryScript;

    [[nodiscard]] std::string toString() const;
};

struct CompileOptions {
    // Overrides the schema's tool executable as argv[0].
    std::optional<std::string> toolPath;
    // When set, settings restricted to other platforms are skipped.
    std::optional<std::string> platform;
};

class CommandCompiler {
public:
    // Deterministic for identical inputs. Throws InvalidValueError and never
    // returns a partial command.
    static CompiledCommand compile(const SettingRegistry& registry, const ConfigurationStore& config,
                                   const CompileOptions& options = {});

    static std::string substitute(const std::string& flagTemplate, const std::string& value);
    static std::string quote(const std::string& arg);
};

struct CommandDiff {
    std::vector<std::string> added;
    std::vector<std::string> removed;
    std::vector<std::string> changed;

    [[nodiscard]] bool empty() const noexcept { return added.empty() && removed.empty() && changed.empty(); }
};

// Compares flag atoms by id; each list is sorted.
CommandDiff diffCommands(const CompiledCommand& before, const CompiledCommand& after);

} // namespace nkb
