#pragma once

#include "services/command/CommandCompiler.h"
#include "services/configuration/ConfigurationStore.h"
#include "services/platform/PlatformDetector.h"
#include "services/presets/PresetCatalog.h"
#include "services/process/ProcessRunner.h"
#include "services/schema/SettingSchema.h"
#include "services/validation/ValidationEngine.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace nkb {

struct EngineOptions {
    platform::ToolLocator toolLocator = platform::defaultToolLocator();
    // Replaces the schema's tool executable as argv[0].
    std::optional<std::string> toolPath;
    // Skip settings restricted to other platforms when compiling.
    bool currentPlatformOnly{true};
    std::chrono::milliseconds gracePeriod{ProcessRunner::kDefaultGracePeriod};
};

struct CommandPreview {
    std::optional<CompiledCommand> command;
    std::string error;
    std::string errorKey;
    // Flag changes relative to the previous successful preview.
    CommandDiff diff;

    [[nodiscard]] bool ok() const noexcept { return command.has_value(); }
};

struct BuildStart {
    std::shared_ptr<ProcessHandle> handle;
    std::vector<ValidationResult> issues;
    std::string error;

    [[nodiscard]] bool started() const noexcept { return handle != nullptr; }
};

// Owns the registry, the current configuration, the validator and the
// process runner, and is the only surface a presentation layer talks to.
// Everything except the runner's worker runs on the caller's thread.
class EngineContext {
public:
    explicit EngineContext(SettingRegistry registry, EngineOptions options = {});

    // Throws SchemaLoadError.
    static std::unique_ptr<EngineContext> fromSchemaFile(const std::string& path, EngineOptions options = {});

    EngineContext(const EngineContext&) = delete;
    EngineContext& operator=(const EngineContext&) = delete;

    [[nodiscard]] const SettingRegistry& getDefinitions() const noexcept { return registry_; }
    [[nodiscard]] ConfigValue getConfigValue(std::string_view path) const;
    bool setConfigValue(std::string_view path, ConfigValue value);

    [[nodiscard]] std::vector<ValidationResult> validateField(std::string_view path) const;
    [[nodiscard]] std::vector<ValidationResult> validateAll() const;

    // Throws InvalidValueError.
    [[nodiscard]] CompiledCommand compileCommand() const;
    CommandPreview previewCommand();

    std::shared_ptr<ProcessHandle> startRun(const CompiledCommand& command, RunCallbacks callbacks);
    std::shared_ptr<ProcessHandle> startRun(const CompiledCommand& command,
                                            std::function<void(const std::string&)> onOutput,
                                            std::function<void(const std::string&)> onError,
                                            std::function<void(RunState, int)> onExit);
    // Validate, compile and start; refuses to start while errors remain.
    BuildStart startBuild(RunCallbacks callbacks);
    void stopRun();
    std::size_t pollEvents();
    bool waitForExit(std::chrono::milliseconds timeout);
    [[nodiscard]] bool isRunning() const noexcept { return runner_.isRunning(); }
    [[nodiscard]] std::shared_ptr<ProcessHandle> currentRun() const noexcept { return runner_.currentHandle(); }

    ConfigIoResult loadConfig(const std::string& path);
    ConfigIoResult saveConfig(const std::string& path);
    void resetConfig();
    // nullopt when no preset matches.
    std::optional<std::vector<PresetChange>> applyPreset(std::string_view idOrName);
    std::size_t applyEnvironmentOverrides();

    [[nodiscard]] ConfigurationStore& store() noexcept { return store_; }
    [[nodiscard]] const ConfigurationStore& store() const noexcept { return store_; }
    [[nodiscard]] const EngineOptions& options() const noexcept { return options_; }

private:
    [[nodiscard]] CompileOptions compileOptions() const;

    SettingRegistry registry_;
    EngineOptions options_;
    ConfigurationStore store_;
    ValidationEngine validator_;
    ProcessRunner runner_;
    std::optional<CompiledCommand> lastPreview_;
};

} // namespace nkb
