#include <catch2/catch_test_macros.hpp>

#include "services/command/CommandCompiler.h"
#include "services/configuration/ConfigurationStore.h"
#include "test_helpers.h"

using nkb::CommandCompiler;
using nkb::ConfigurationStore;
using nkb::diffCommands;

using Ids = std::vector<std::string>;

TEST_CASE("identical commands have an empty diff", "[command][diff]") {
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);
    store.set("modules.follow_imports", true);
    auto command = CommandCompiler::compile(registry, store);
    CHECK(diffCommands(command, command).empty());
}

TEST_CASE("diff reports added removed and changed atoms", "[command][diff]") {
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);
    store.set("basic.jobs", std::int64_t{2});
    store.set("modules.include_packages", std::vector<std::string>{"a", "b"});
    auto before = CommandCompiler::compile(registry, store);

    store.set("basic.jobs", std::int64_t{8});
    store.set("modules.follow_imports", true);
    store.set("modules.include_packages", std::vector<std::string>{"b", "c"});
    auto after = CommandCompiler::compile(registry, store);

    auto diff = diffCommands(before, after);
    CHECK(diff.added == Ids{"modules.follow_imports", "modules.include_packages:c"});
    CHECK(diff.removed == Ids{"modules.include_packages:a"});
    CHECK(diff.changed == Ids{"basic.jobs"});
}

TEST_CASE("entry script changes appear as <entry>", "[command][diff]") {
    auto registry = nkbtest::loadTestSchema();
    ConfigurationStore store(registry);
    auto none = CommandCompiler::compile(registry, store);
    store.set("basic.input_file", std::string{"a.py"});
    auto first = CommandCompiler::compile(registry, store);
    store.set("basic.input_file", std::string{"b.py"});
    auto second = CommandCompiler::compile(registry, store);

    CHECK(diffCommands(none, first).added == Ids{"<entry>"});
    CHECK(diffCommands(first, none).removed == Ids{"<entry>"});
    CHECK(diffCommands(first, second).changed == Ids{"<entry>"});
}
