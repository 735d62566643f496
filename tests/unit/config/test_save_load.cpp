#include <catch2/catch_test_macros.hpp>

#include "services/configuration/ConfigurationStore.h"
#include "services/configuration/json_io.h"
#include "test_helpers.h"

#include <filesystem>
#include <string>

using nkb::ConfigIoStatus;
using nkb::ConfigurationStore;

TEST_CASE("atomic save writes and replaces cleanly", "[config][io]") {
    namespace fs = std::filesystem;
    auto dir = nkbtest::makeTempDir("nkb_config_atomic");
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);
    const auto path = (dir / "nuitka_build.json").string();

    store.set("basic.jobs", std::int64_t{1111});
    REQUIRE(store.save(path).ok());
    REQUIRE(fs::exists(path));
    CHECK_FALSE(store.isDirty());
    CHECK(store.filePath() == path);

    store.set("basic.jobs", std::int64_t{2222});
    CHECK(store.isDirty());
    REQUIRE(store.save(path).ok());
    CHECK(nkbtest::readFile(path).find("2222") != std::string::npos);

    size_t tmpCount = 0;
    for (auto& p : fs::directory_iterator(dir)) {
        if (p.path().filename().string().find("nuitka_build.json.tmp") != std::string::npos) tmpCount++;
    }
    CHECK(tmpCount == 0);
}

TEST_CASE("save and load round-trip keeps unknown keys", "[config][io]") {
    auto dir = nkbtest::makeTempDir("nkb_config_roundtrip");
    auto registry = nkbtest::loadTestSchema();
    const auto path = (dir / "build.json").string();
    {
        ConfigurationStore store(registry);
        store.set("basic.mode", std::string{"standalone"});
        store.set("modules.include_packages", std::vector<std::string>{"pkg.one"});
        store.set("ui.window.width", std::int64_t{1280});
        REQUIRE(store.save(path).ok());
    }
    ConfigurationStore reloaded(registry);
    auto result = reloaded.load(path);
    REQUIRE(result.ok());
    CHECK(std::get<std::string>(reloaded.get("basic.mode")) == "standalone");
    CHECK(std::get<std::vector<std::string>>(reloaded.get("modules.include_packages")).front() == "pkg.one");
    CHECK(std::get<std::int64_t>(reloaded.get("ui.window.width")) == 1280);
    CHECK_FALSE(reloaded.isDirty());
}

TEST_CASE("failed loads report a status and keep the last good state", "[config][io]") {
    auto dir = nkbtest::makeTempDir("nkb_config_failures");
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);
    store.set("basic.mode", std::string{"onefile"});

    SECTION("missing file") {
        auto result = store.load((dir / "missing.json").string());
        CHECK(result.status == ConfigIoStatus::NotFound);
        CHECK_FALSE(result.message.empty());
    }
    SECTION("invalid JSON") {
        nkbtest::writeFile(dir / "broken.json", "{ \"basic\": ");
        auto result = store.load((dir / "broken.json").string());
        CHECK(result.status == ConfigIoStatus::Malformed);
    }
    SECTION("top-level array") {
        nkbtest::writeFile(dir / "array.json", "[1, 2, 3]");
        auto result = store.load((dir / "array.json").string());
        CHECK(result.status == ConfigIoStatus::Malformed);
    }
    SECTION("oversized file") {
        std::string big = "{\"pad\":\"" + std::string(nkb::jsonio::kMaxJsonBytes, 'x') + "\"}";
        nkbtest::writeFile(dir / "big.json", big);
        auto result = store.load((dir / "big.json").string());
        CHECK(result.status == ConfigIoStatus::TooLarge);
    }
    CHECK(std::get<std::string>(store.get("basic.mode")) == "onefile");
}

TEST_CASE("save into an unwritable location fails without throwing", "[config][io]") {
    auto dir = nkbtest::makeTempDir("nkb_config_unwritable");
    nkbtest::writeFile(dir / "blocker", "not a directory");
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);
    auto result = store.save((dir / "blocker" / "build.json").string());
    CHECK(result.status == ConfigIoStatus::WriteFailed);
    CHECK_FALSE(result.message.empty());
}

TEST_CASE("readDocument throws typed load errors", "[config][io]") {
    using Kind = nkb::ConfigLoadError::Kind;
    auto dir = nkbtest::makeTempDir("nkb_config_read_document");
    nkbtest::writeFile(dir / "ok.json", R"({"basic":{"mode":"onefile"}})");
    nkbtest::writeFile(dir / "broken.json", "{ nope");
    nkbtest::writeFile(dir / "list.json", "[]");

    auto document = ConfigurationStore::readDocument((dir / "ok.json").string());
    CHECK(document["basic"]["mode"] == "onefile");

    auto kindOf = [](const std::string& path) {
        try {
            (void)ConfigurationStore::readDocument(path);
        } catch (const nkb::ConfigLoadError& e) {
            return e.kind();
        }
        FAIL("expected ConfigLoadError for " << path);
        return Kind::Malformed;
    };
    CHECK(kindOf((dir / "missing.json").string()) == Kind::NotFound);
    CHECK(kindOf((dir / "broken.json").string()) == Kind::Malformed);
    CHECK(kindOf((dir / "list.json").string()) == Kind::Malformed);
}
