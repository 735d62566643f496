// NuitkaBuilder.cpp : headless host for the build engine.
//
// Usage: NuitkaBuilder [config.json]

#include "services/EngineContext.h"
#include "services/configuration/paths.h"
#include "services/logger/LogManager.h"
#include "services/schema/SettingSchemaLoader.h"

#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void onInterrupt(int) {
    g_interrupted = 1;
}

bool envFlag(const char* name) {
    const char* value = std::getenv(name);
    if (!value) return false;
    const std::string text(value);
    return text == "1" || text == "true" || text == "yes" || text == "on";
}

nkb::logging::Level envLogLevel() {
    if (const char* value = std::getenv("NKB_LOG_LEVEL")) {
        if (auto level = nkb::logging::parse_level(value)) {
            return *level;
        }
    }
    return nkb::logging::Level::info;
}

void reportIssues(const std::vector<nkb::ValidationResult>& issues) {
    for (const auto& issue : issues) {
        const std::string text = issue.suggestion ? issue.message + " (" + *issue.suggestion + ")" : issue.message;
        switch (issue.severity) {
        case nkb::Severity::Error:
            nkb::logging::LogManager::error("{}: {}", issue.field, text);
            break;
        case nkb::Severity::Warning:
            nkb::logging::LogManager::warn("{}: {}", issue.field, text);
            break;
        case nkb::Severity::Info:
            nkb::logging::LogManager::info("{}: {}", issue.field, text);
            break;
        }
    }
}

int exitStatusFor(nkb::RunState outcome, int code) {
    switch (outcome) {
    case nkb::RunState::Completed:
        return 0;
    case nkb::RunState::Terminated:
        return 130;
    case nkb::RunState::Failed:
        return code > 0 ? code : 1;
    case nkb::RunState::Idle:
    case nkb::RunState::Running:
        break;
    }
    return 1;
}

} // namespace

int main(int argc, char** argv)
{
    nkb::logging::Config logCfg;
    logCfg.name = "NuitkaBuilder";
    logCfg.level = envLogLevel();
    logCfg.pattern = "[%H:%M:%S] [%^%l%$] %v";
    if (const char* file = std::getenv("NKB_LOG_FILE")) {
        logCfg.file = file;
    }
    if (nkb::logging::LogManager::init(logCfg) == nkb::logging::Status::error) {
        return 1;
    }
    nkb::logging::LogManager::info("Starting NuitkaBuilder");

    const std::string schemaPath = nkb::paths::schemaFilePath();
    std::unique_ptr<nkb::EngineContext> engine;
    try {
        engine = nkb::EngineContext::fromSchemaFile(schemaPath);
    } catch (const nkb::SchemaLoadError& e) {
        nkb::logging::LogManager::critical("{}", e.what());
        nkb::logging::LogManager::shutdown();
        return 1;
    }

    const std::string configPath = argc > 1 ? std::string(argv[1]) : nkb::paths::buildConfigFilePath();
    const auto loaded = engine->loadConfig(configPath);
    if (!loaded.ok()) {
        if (loaded.status == nkb::ConfigIoStatus::NotFound) {
            nkb::logging::LogManager::warn("No configuration at {}; using defaults", configPath);
        } else {
            nkb::logging::LogManager::error("Configuration {} is {}; using defaults", configPath, nkb::to_string(loaded.status));
        }
    }
    if (const auto overrides = engine->applyEnvironmentOverrides(); overrides > 0) {
        nkb::logging::LogManager::info("Applied {} environment override(s)", overrides);
    }

    const auto issues = engine->validateAll();
    reportIssues(issues);

    const auto preview = engine->previewCommand();
    if (!preview.ok()) {
        nkb::logging::LogManager::error("Cannot build command: {}", preview.error);
        nkb::logging::LogManager::shutdown();
        return 1;
    }
    std::printf("%s\n", preview.command->toString().c_str());
    std::fflush(stdout);

    if (!envFlag("NKB_RUN")) {
        nkb::logging::LogManager::shutdown();
        return nkb::ValidationEngine::hasErrors(issues) ? 1 : 0;
    }

    std::signal(SIGINT, onInterrupt);
    nkb::RunState outcome = nkb::RunState::Idle;
    int exitCode = 0;
    nkb::RunCallbacks callbacks;
    callbacks.onOutput = [](const std::string& line) {
        std::printf("%s\n", line.c_str());
        std::fflush(stdout);
    };
    // Run errors are already logged by the runner.
    callbacks.onExit = [&](nkb::RunState state, int code) {
        outcome = state;
        exitCode = code;
    };

    const auto build = engine->startBuild(std::move(callbacks));
    if (!build.started()) {
        nkb::logging::LogManager::error("{}", build.error);
        nkb::logging::LogManager::shutdown();
        return 1;
    }

    bool stopRequested = false;
    while (!engine->waitForExit(std::chrono::milliseconds(100))) {
        if (g_interrupted && !stopRequested) {
            stopRequested = true;
            engine->stopRun();
        }
    }

    nkb::logging::LogManager::info("Build {} in {} ms", nkb::to_string(outcome), build.handle->elapsed().count());
    nkb::logging::LogManager::shutdown();
    return exitStatusFor(outcome, exitCode);
}
