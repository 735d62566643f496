#include "EngineContext.h"

#include "services/configuration/env_overrides.h"
#include "services/logger/LogManager.h"
#include "services/schema/SettingSchemaLoader.h"

namespace nkb {

EngineContext::EngineContext(SettingRegistry registry, EngineOptions options)
    : registry_(std::move(registry)),
      options_(std::move(options)),
      store_(registry_),
      validator_(registry_, options_.toolLocator),
      runner_(options_.gracePeriod) {}

std::unique_ptr<EngineContext> EngineContext::fromSchemaFile(const std::string& path, EngineOptions options) {
    return std::make_unique<EngineContext>(SettingSchemaLoader::loadFile(path), std::move(options));
}

ConfigValue EngineContext::getConfigValue(std::string_view path) const {
    return store_.get(path);
}

bool EngineContext::setConfigValue(std::string_view path, ConfigValue value) {
    return store_.set(path, std::move(value));
}

std::vector<ValidationResult> EngineContext::validateField(std::string_view path) const {
    return validator_.validateField(path, store_);
}

std::vector<ValidationResult> EngineContext::validateAll() const {
    return validator_.validateAll(store_);
}

CompileOptions EngineContext::compileOptions() const {
    CompileOptions compile;
    compile.toolPath = options_.toolPath;
    if (options_.currentPlatformOnly) {
        compile.platform = platform::currentPlatform();
    }
    return compile;
}

CompiledCommand EngineContext::compileCommand() const {
    return CommandCompiler::compile(registry_, store_, compileOptions());
}

CommandPreview EngineContext::previewCommand() {
    CommandPreview preview;
    try {
        preview.command = compileCommand();
    } catch (const InvalidValueError& e) {
        preview.error = e.what();
        preview.errorKey = e.key();
        logging::LogManager::debug("Command preview unavailable: {}", preview.error);
        return preview;
    }
    if (lastPreview_) {
        preview.diff = diffCommands(*lastPreview_, *preview.command);
    }
    lastPreview_ = preview.command;
    return preview;
}

std::shared_ptr<ProcessHandle> EngineContext::startRun(const CompiledCommand& command, RunCallbacks callbacks) {
    return runner_.start(command.argv, std::move(callbacks));
}

std::shared_ptr<ProcessHandle> EngineContext::startRun(const CompiledCommand& command,
                                                       std::function<void(const std::string&)> onOutput,
                                                       std::function<void(const std::string&)> onError,
                                                       std::function<void(RunState, int)> onExit) {
    return startRun(command, RunCallbacks{std::move(onOutput), std::move(onError), std::move(onExit)});
}

BuildStart EngineContext::startBuild(RunCallbacks callbacks) {
    BuildStart result;
    result.issues = validateAll();
    if (ValidationEngine::hasErrors(result.issues)) {
        result.error = "Fix the reported errors before building";
        logging::LogManager::warn("Build blocked by {} validation error(s)",
                                  ValidationEngine::count(result.issues, Severity::Error));
        return result;
    }
    CompiledCommand command;
    try {
        command = compileCommand();
    } catch (const InvalidValueError& e) {
        result.error = e.what();
        logging::LogManager::error("Build blocked: {}", result.error);
        return result;
    }
    try {
        result.handle = startRun(command, std::move(callbacks));
    } catch (const AlreadyRunningError& e) {
        result.error = e.what();
        logging::LogManager::warn("{}", result.error);
    }
    return result;
}

void EngineContext::stopRun() {
    runner_.stop();
}

std::size_t EngineContext::pollEvents() {
    return runner_.pollEvents();
}

bool EngineContext::waitForExit(std::chrono::milliseconds timeout) {
    return runner_.waitForExit(timeout);
}

ConfigIoResult EngineContext::loadConfig(const std::string& path) {
    return store_.load(path);
}

ConfigIoResult EngineContext::saveConfig(const std::string& path) {
    return store_.save(path);
}

void EngineContext::resetConfig() {
    store_.reset();
    logging::LogManager::info("Configuration reset to defaults");
}

std::optional<std::vector<PresetChange>> EngineContext::applyPreset(std::string_view idOrName) {
    const PresetDefinition* preset = PresetCatalog::find(idOrName);
    if (!preset) {
        logging::LogManager::warn("Unknown preset '{}'", std::string(idOrName));
        return std::nullopt;
    }
    return PresetCatalog::apply(store_, *preset);
}

std::size_t EngineContext::applyEnvironmentOverrides() {
    return envoverrides::apply(store_);
}

} // namespace nkb
