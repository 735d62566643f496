#include <catch2/catch_test_macros.hpp>

#include "services/configuration/ConfigurationStore.h"
#include "services/configuration/env_overrides.h"
#include "test_helpers.h"

using nkb::ConfigurationStore;
namespace env = nkb::envoverrides;

TEST_CASE("env key mapping", "[config][env]") {
    CHECK(env::mapEnvKeyToConfigKey("BASIC__OUTPUT_DIR") == "basic.output_dir");
    CHECK(env::mapEnvKeyToConfigKey("PLATFORM__WINDOWS__ICON") == "platform.windows.icon");
}

TEST_CASE("env overrides apply with schema types", "[config][env]") {
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);

    nkbtest::set_env("NKB_BASIC__MODE", "onefile");
    nkbtest::set_env("NKB_BASIC__JOBS", "8");
    nkbtest::set_env("NKB_MODULES__FOLLOW_IMPORTS", "yes");
    nkbtest::set_env("NKB_MODULES__INCLUDE_PACKAGES", "requests, numpy,,yaml");
    nkbtest::set_env("NKB_EXTRA__RATIO", "0.5");
    nkbtest::set_env("NKB_CONFIG_DIR", "/tmp/ignored");

    CHECK(env::apply(store) == 5);
    CHECK(std::get<std::string>(store.get("basic.mode")) == "onefile");
    CHECK(std::get<std::int64_t>(store.get("basic.jobs")) == 8);
    CHECK(std::get<bool>(store.get("modules.follow_imports")) == true);
    auto packages = std::get<std::vector<std::string>>(store.get("modules.include_packages"));
    REQUIRE(packages.size() == 3);
    CHECK(packages[1] == "numpy");
    CHECK(std::get<double>(store.get("extra.ratio")) == 0.5);
    CHECK_FALSE(store.isRecognized("config_dir"));
}

TEST_CASE("string settings keep numeric-looking values as text", "[config][env]") {
    auto registry = nkbtest::loadTestSchema();
    const auto* outputDir = registry.find("basic.output_dir");
    REQUIRE(outputDir != nullptr);
    auto value = env::parseEnvValue(outputDir, "2024");
    CHECK(std::get<std::string>(value) == "2024");
    auto untyped = env::parseEnvValue(nullptr, "2024");
    CHECK(std::get<std::int64_t>(untyped) == 2024);
    auto badInt = env::parseEnvValue(registry.find("basic.jobs"), "lots");
    CHECK(std::get<std::string>(badInt) == "lots");
}

TEST_CASE("env overrides nested under a setting are skipped", "[config][env]") {
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);
    nkbtest::set_env("NKB_BASIC__INPUT_FILE__NOTE", "keep me");
    CHECK(env::apply(store) == 0);
    CHECK(store.unrecognizedKeys().empty());
    CHECK(std::get<std::string>(store.get("basic.input_file")).empty());
}
