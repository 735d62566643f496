#include "PresetCatalog.h"

#include "services/configuration/ConfigurationStore.h"
#include "services/configuration/validate.h"
#include "services/logger/LogManager.h"

namespace nkb {

namespace {

std::vector<PresetDefinition> makeBuiltins() {
    using Entry = std::pair<std::string, ConfigValue>;
    std::vector<PresetDefinition> presets;
    presets.push_back(PresetDefinition{
        "standalone-gui",
        "Standalone GUI App",
        "Standalone folder build without a console window.",
        {
            Entry{"basic.mode", std::string{"standalone"}},
            Entry{"modules.follow_imports", true},
            Entry{"output.no_progressbar", false},
            Entry{"platform.windows.console_mode", std::string{"disable"}},
        },
    });
    presets.push_back(PresetDefinition{
        "cli-tool",
        "CLI Tool",
        "Standalone build that keeps its console.",
        {
            Entry{"basic.mode", std::string{"standalone"}},
            Entry{"modules.follow_imports", true},
            Entry{"platform.windows.console_mode", std::string{"force"}},
        },
    });
    presets.push_back(PresetDefinition{
        "onefile",
        "Onefile Distribution",
        "Single self-extracting executable.",
        {
            Entry{"basic.mode", std::string{"onefile"}},
            Entry{"modules.follow_imports", true},
            Entry{"output.no_progressbar", false},
        },
    });
    presets.push_back(PresetDefinition{
        "debug-trace",
        "Debug / Trace Build",
        "Debug checks, execution tracing and unstripped binaries.",
        {
            Entry{"advanced.debug", true},
            Entry{"advanced.trace_execution", true},
            Entry{"advanced.unstripped", true},
        },
    });
    presets.push_back(PresetDefinition{
        "minimal-size",
        "Minimal Size",
        "Link-time optimisation and a quiet build.",
        {
            Entry{"advanced.lto", std::string{"yes"}},
            Entry{"output.no_progressbar", true},
            Entry{"output.quiet", true},
        },
    });
    presets.push_back(PresetDefinition{
        "max-compat",
        "Max Compatibility",
        "Full CPython compatibility, including the standard library.",
        {
            Entry{"advanced.full_compat", true},
            Entry{"modules.follow_stdlib", true},
            Entry{"advanced.static_libpython", std::string{"no"}},
        },
    });
    return presets;
}

} // namespace

const std::vector<PresetDefinition>& PresetCatalog::builtin() {
    static const std::vector<PresetDefinition> presets = makeBuiltins();
    return presets;
}

const PresetDefinition* PresetCatalog::find(std::string_view idOrName) noexcept {
    for (const auto& preset : builtin()) {
        if (preset.id == idOrName || preset.name == idOrName) {
            return &preset;
        }
    }
    return nullptr;
}

std::vector<PresetChange> PresetCatalog::apply(ConfigurationStore& store, const PresetDefinition& preset) {
    std::vector<PresetChange> changes;
    for (const auto& [key, value] : preset.applies) {
        if (!store.isRecognized(key)) {
            logging::LogManager::warn("Preset '{}' skips '{}': not declared by the schema", preset.name, key);
            continue;
        }
        ConfigValue old = store.get(key);
        if (cfgvalidate::valuesEqual(old, value)) {
            continue;
        }
        store.set(key, value);
        changes.push_back(PresetChange{key, std::move(old), value});
    }
    logging::LogManager::info("Applied preset '{}' ({} change(s))", preset.name, changes.size());
    return changes;
}

} // namespace nkb
