#include <catch2/catch_test_macros.hpp>

#include "services/configuration/ConfigurationStore.h"
#include "services/validation/ValidationEngine.h"
#include "test_helpers.h"

#include <optional>
#include <string_view>
#include <string>
#include <vector>

using nkb::ConfigurationStore;
using nkb::Severity;
using nkb::ValidationEngine;
using nkb::ValidationResult;

namespace {
nkb::platform::ToolLocator locatorWith(std::vector<std::string> available) {
    return [available](std::string_view name) -> std::optional<std::string> {
        for (const auto& tool : available) {
            if (tool == name) return "/usr/bin/" + tool;
        }
        return std::nullopt;
    };
}

std::vector<ValidationResult> forField(const std::vector<ValidationResult>& results, const std::string& field) {
    std::vector<ValidationResult> out;
    for (const auto& result : results) {
        if (result.field == field) out.push_back(result);
    }
    return out;
}

std::string makeScript(const char* dirName) {
    auto dir = nkbtest::makeTempDir(dirName);
    auto script = dir / "app.py";
    nkbtest::writeFile(script, "print('hi')\n");
    return script.string();
}
}

TEST_CASE("empty required input yields a single required error", "[validation]") {
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);
    ValidationEngine engine(registry, locatorWith({}));
    store.set("basic.input_file", std::string{});

    auto results = engine.validateAll(store);
    auto input = forField(results, "basic.input_file");
    REQUIRE(input.size() == 1);
    CHECK(input[0].severity == Severity::Error);
    CHECK(input[0].message.find("required") != std::string::npos);
    CHECK(ValidationEngine::hasErrors(results));
    CHECK(ValidationEngine::count(results, Severity::Error) == 1);
}

TEST_CASE("missing input file yields a single file-not-found error", "[validation]") {
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);
    ValidationEngine engine(registry, locatorWith({}));
    store.set("basic.input_file", std::string{"missing.py"});

    auto input = engine.validateField("basic.input_file", store);
    REQUIRE(input.size() == 1);
    CHECK(input[0].severity == Severity::Error);
    CHECK(input[0].message.find("File not found") != std::string::npos);
    CHECK(input[0].suggestion.has_value());
}

TEST_CASE("existing script passes and wrong extension fails", "[validation]") {
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);
    ValidationEngine engine(registry, locatorWith({}));

    const auto script = makeScript("nkb_validation_script");
    CHECK(engine.validateField("basic.input_file", std::string{script}, store).empty());

    auto text = std::filesystem::path(script).replace_extension(".TXT");
    nkbtest::writeFile(text, "x");
    auto results = engine.validateField("basic.input_file", text.string(), store);
    REQUIRE(results.size() == 1);
    CHECK(results[0].message.find(".py") != std::string::npos);

    auto upper = std::filesystem::path(script).replace_extension(".PY");
    nkbtest::writeFile(upper, "x");
    CHECK(engine.validateField("basic.input_file", upper.string(), store).empty());
}

TEST_CASE("directory check is a warning and never blocks", "[validation]") {
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);
    ValidationEngine engine(registry, locatorWith({}));
    store.set("basic.input_file", makeScript("nkb_validation_dir"));
    store.set("basic.output_dir", std::string{"/definitely/not/here"});

    auto results = engine.validateAll(store);
    auto dir = forField(results, "basic.output_dir");
    REQUIRE(dir.size() == 1);
    CHECK(dir[0].severity == Severity::Warning);
    CHECK_FALSE(ValidationEngine::hasErrors(results));
}

TEST_CASE("shape checks run before declared rules", "[validation]") {
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);
    ValidationEngine engine(registry, locatorWith({}));

    SECTION("enum membership") {
        auto results = engine.validateField("basic.mode", std::string{"bogus"}, store);
        REQUIRE(results.size() == 1);
        CHECK(results[0].severity == Severity::Error);
        REQUIRE(results[0].suggestion.has_value());
        CHECK(results[0].suggestion->find("standalone") != std::string::npos);
    }
    SECTION("integer bounds") {
        CHECK(engine.validateField("basic.jobs", std::int64_t{8}, store).empty());
        CHECK(engine.validateField("basic.jobs", nkb::ConfigValue{}, store).empty());
        auto results = engine.validateField("basic.jobs", std::int64_t{0}, store);
        REQUIRE(results.size() == 1);
        CHECK(results[0].message.find("between 1 and 64") != std::string::npos);
    }
    SECTION("type mismatch") {
        auto results = engine.validateField("modules.follow_imports", std::string{"true"}, store);
        REQUIRE(results.size() == 1);
        CHECK(results[0].severity == Severity::Error);
        auto list = engine.validateField("modules.include_packages", std::string{"requests"}, store);
        REQUIRE(list.size() == 1);
        CHECK(list[0].severity == Severity::Error);
    }
}

TEST_CASE("tool availability is checked only for the selected value", "[validation]") {
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);

    ValidationEngine withoutZig(registry, locatorWith({}));
    CHECK(withoutZig.validateField("basic.compiler", std::string{"auto"}, store).empty());
    auto missing = withoutZig.validateField("basic.compiler", std::string{"zig"}, store);
    REQUIRE(missing.size() == 1);
    CHECK(missing[0].severity == Severity::Warning);
    CHECK(missing[0].message.find("zig") != std::string::npos);

    ValidationEngine withZig(registry, locatorWith({"zig"}));
    CHECK(withZig.validateField("basic.compiler", std::string{"zig"}, store).empty());
}

TEST_CASE("pattern rule checks every list entry", "[validation]") {
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);
    ValidationEngine engine(registry, locatorWith({}));
    CHECK(engine.validateField("modules.include_packages", std::vector<std::string>{"requests", "a.b_c"}, store).empty());
    auto results = engine.validateField("modules.include_packages", std::vector<std::string>{"ok", "not-valid"}, store);
    REQUIRE(results.size() == 1);
    CHECK(results[0].message == "Invalid package name");
}

TEST_CASE("requires rule reads the other field", "[validation]") {
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);
    ValidationEngine engine(registry, locatorWith({}));
    store.set("modules.follow_stdlib", true);

    auto results = engine.validateField("modules.follow_stdlib", store);
    REQUIRE(results.size() == 1);
    CHECK(results[0].severity == Severity::Warning);
    CHECK(results[0].message.find("modules.follow_imports") != std::string::npos);

    store.set("modules.follow_imports", true);
    CHECK(engine.validateField("modules.follow_stdlib", store).empty());
}

TEST_CASE("unrecognized keys produce one warning each after schema results", "[validation]") {
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);
    ValidationEngine engine(registry, locatorWith({}));
    store.set("basic.input_file", makeScript("nkb_validation_unknown"));
    store.set("legacy.a", true);
    store.set("legacy.b", std::int64_t{2});

    auto results = engine.validateAll(store);
    REQUIRE(results.size() == 2);
    CHECK(results[0].field == "legacy.a");
    CHECK(results[1].field == "legacy.b");
    CHECK(results[0].severity == Severity::Warning);
    CHECK_FALSE(ValidationEngine::hasErrors(results));
}
