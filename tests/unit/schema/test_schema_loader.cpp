#include <catch2/catch_test_macros.hpp>

#include "services/schema/SettingSchemaLoader.h"
#include "test_helpers.h"

#include <string>

using nkb::SchemaLoadError;
using nkb::SettingSchemaLoader;
using nkb::SettingType;

namespace {
// Wraps a single setting object in a one-tab schema document.
std::string schemaWith(const std::string& settings) {
    return R"({"version":1,"tabs":[{"id":"t","title":"T","sections":[{"id":"s","title":"S","settings":[)" + settings + "]}]}]}";
}

SchemaLoadError::Kind loadKind(const std::string& text) {
    try {
        (void)SettingSchemaLoader::loadString(text);
    } catch (const SchemaLoadError& e) {
        return e.kind();
    }
    FAIL("schema loaded without error");
    return SchemaLoadError::Kind::Unreadable;
}
}

TEST_CASE("loader builds a registry in schema order", "[schema]") {
    auto registry = nkbtest::loadTestSchema();
    REQUIRE(registry.size() == 8);
    CHECK(registry.definitions().front().key == "basic.input_file");
    CHECK(registry.definitions().back().key == "modules.include_packages");
    CHECK(registry.tool().executable == "python3");
    REQUIRE(registry.tool().arguments.size() == 2);
    CHECK(registry.tool().arguments[1] == "nuitka");

    const auto* mode = registry.find("basic.mode");
    REQUIRE(mode != nullptr);
    CHECK(mode->type == SettingType::Enum);
    REQUIRE(mode->choices.size() == 3);
    CHECK(mode->choices[1].value == "standalone");
    CHECK(mode->choices[1].flag == "--standalone");
    CHECK(std::get<std::string>(mode->defaultValue) == "accelerated");

    const auto* jobs = registry.find("basic.jobs");
    REQUIRE(jobs != nullptr);
    CHECK(jobs->min == 1);
    CHECK(jobs->max == 64);
    CHECK(std::holds_alternative<std::monostate>(jobs->defaultValue));

    REQUIRE(registry.positional() != nullptr);
    CHECK(registry.positional()->key == "basic.input_file");
    CHECK(registry.find("basic.nope") == nullptr);
    CHECK(registry.indexOf("basic.mode") == std::size_t{1});
}

TEST_CASE("loader fills type defaults when none are declared", "[schema]") {
    auto registry = SettingSchemaLoader::loadString(schemaWith(R"(
        {"key":"a.flag","type":"boolean","flag":"--flag"},
        {"key":"a.list","type":"string-list","flag":"--item={value}"},
        {"key":"a.text","type":"string","flag":"--text={value}"}
    )"));
    CHECK(std::get<bool>(registry.at("a.flag").defaultValue) == false);
    CHECK(std::get<std::vector<std::string>>(registry.at("a.list").defaultValue).empty());
    CHECK(std::get<std::string>(registry.at("a.text").defaultValue).empty());
    CHECK(registry.at("a.text").risk == nkb::RiskTier::Safe);
}

TEST_CASE("loader rejects structural mistakes", "[schema]") {
    using Kind = SchemaLoadError::Kind;
    SECTION("invalid JSON") {
        CHECK(loadKind("{ not json") == Kind::Malformed);
    }
    SECTION("duplicate keys") {
        CHECK(loadKind(schemaWith(R"({"key":"a.b","type":"boolean"},{"key":"a.b","type":"boolean"})")) == Kind::Malformed);
    }
    SECTION("key nested under another key") {
        CHECK(loadKind(schemaWith(R"({"key":"a.b","type":"string","flag":"--b={value}"},{"key":"a.b.c","type":"boolean"})")) == Kind::Malformed);
        CHECK(loadKind(schemaWith(R"({"key":"a.b.c","type":"boolean"},{"key":"a.b","type":"boolean"})")) == Kind::Malformed);
    }
    SECTION("unknown type") {
        CHECK(loadKind(schemaWith(R"({"key":"a.b","type":"float"})")) == Kind::Malformed);
    }
    SECTION("bad key syntax") {
        CHECK(loadKind(schemaWith(R"({"key":"A..b","type":"boolean"})")) == Kind::Malformed);
    }
    SECTION("boolean flag with placeholder") {
        CHECK(loadKind(schemaWith(R"({"key":"a.b","type":"boolean","flag":"--b={value}"})")) == Kind::Malformed);
    }
    SECTION("value flag without placeholder") {
        CHECK(loadKind(schemaWith(R"({"key":"a.b","type":"string","flag":"--b"})")) == Kind::Malformed);
    }
    SECTION("flag containing whitespace") {
        CHECK(loadKind(schemaWith(R"({"key":"a.b","type":"boolean","flag":"--b c"})")) == Kind::Malformed);
    }
    SECTION("enum default outside its choices") {
        CHECK(loadKind(schemaWith(R"({"key":"a.b","type":"enum","choices":[{"value":"x","flag":""}],"default":"y"})")) == Kind::Malformed);
    }
    SECTION("bounds on a non-integer") {
        CHECK(loadKind(schemaWith(R"({"key":"a.b","type":"string","flag":"--b={value}","min":1})")) == Kind::Malformed);
    }
    SECTION("min above max") {
        CHECK(loadKind(schemaWith(R"({"key":"a.b","type":"integer","flag":"--b={value}","min":5,"max":1})")) == Kind::Malformed);
    }
    SECTION("two positional settings") {
        CHECK(loadKind(schemaWith(R"({"key":"a.b","type":"string","positional":true},{"key":"a.c","type":"string","positional":true})")) == Kind::Malformed);
    }
    SECTION("unknown validation rule") {
        CHECK(loadKind(schemaWith(R"({"key":"a.b","type":"string","validation":[{"rule":"sparkles"}]})")) == Kind::Malformed);
    }
    SECTION("invalid regex") {
        CHECK(loadKind(schemaWith(R"({"key":"a.b","type":"string","validation":[{"rule":"pattern","regex":"([a-z"}]})")) == Kind::Malformed);
    }
    SECTION("requires rule pointing at an unknown key") {
        CHECK(loadKind(schemaWith(R"({"key":"a.b","type":"boolean","validation":[{"rule":"requires","key":"a.z","equals":true}]})")) == Kind::Malformed);
    }
}

TEST_CASE("loadFile reports missing files as unreadable", "[schema]") {
    auto dir = nkbtest::makeTempDir("nkb_schema_missing");
    try {
        (void)SettingSchemaLoader::loadFile((dir / "absent.json").string());
        FAIL("expected SchemaLoadError");
    } catch (const SchemaLoadError& e) {
        CHECK(e.kind() == SchemaLoadError::Kind::Unreadable);
        CHECK(e.origin().find("absent.json") != std::string::npos);
    }
}

TEST_CASE("flag template checks", "[schema]") {
    CHECK(SettingSchemaLoader::isValidFlagTemplate("--standalone"));
    CHECK(SettingSchemaLoader::isValidFlagTemplate("--output-dir={value}"));
    CHECK(SettingSchemaLoader::isValidFlagTemplate("-j"));
    CHECK_FALSE(SettingSchemaLoader::isValidFlagTemplate(""));
    CHECK_FALSE(SettingSchemaLoader::isValidFlagTemplate("standalone"));
    CHECK_FALSE(SettingSchemaLoader::isValidFlagTemplate("--a={value}{value}"));
    CHECK_FALSE(SettingSchemaLoader::isValidFlagTemplate("--a={other}"));
    CHECK_FALSE(SettingSchemaLoader::isValidFlagTemplate("--a b"));
    CHECK(SettingSchemaLoader::placeholderCount("--a={value}") == 1);
    CHECK(SettingSchemaLoader::placeholderCount("--a") == 0);
}

TEST_CASE("shipped schema loads", "[schema]") {
    auto registry = SettingSchemaLoader::loadFile(nkbtest::shippedSchemaPath());
    CHECK(registry.size() > 30);
    REQUIRE(registry.positional() != nullptr);
    CHECK(registry.positional()->key == "basic.input_file");
    CHECK(registry.contains("modules.follow_imports"));
    CHECK(registry.at("modules.follow_imports").flag == "--follow-imports");
}
