#include <catch2/catch_test_macros.hpp>

#include "services/process/ProcessRunner.h"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using nkb::ProcessRunner;
using nkb::RunCallbacks;
using nkb::RunState;

namespace {
struct Recorder {
    std::vector<std::string> lines;
    std::vector<std::string> errors;
    std::vector<std::pair<RunState, int>> exits;

    RunCallbacks callbacks() {
        RunCallbacks cb;
        cb.onOutput = [this](const std::string& line) { lines.push_back(line); };
        cb.onError = [this](const std::string& message) { errors.push_back(message); };
        cb.onExit = [this](RunState state, int code) { exits.emplace_back(state, code); };
        return cb;
    }
};
}

TEST_CASE("runner streams merged output and reports success", "[integration][process]") {
    ProcessRunner runner;
    Recorder rec;
    auto handle = runner.start({"sh", "-c", "echo one; echo two 1>&2; printf 'three\\r\\nfour'"}, rec.callbacks());
    REQUIRE(handle);
    REQUIRE(runner.waitForExit(10s));

    CHECK(rec.lines == std::vector<std::string>{"one", "two", "three", "four"});
    REQUIRE(rec.exits.size() == 1);
    CHECK(rec.exits[0].first == RunState::Completed);
    CHECK(rec.exits[0].second == 0);
    CHECK(handle->state() == RunState::Completed);
    CHECK(handle->exitCode() == 0);
    CHECK(handle->output() == rec.lines);
    CHECK(handle->finishedAt().has_value());
    CHECK_FALSE(runner.isRunning());
}

TEST_CASE("non-zero exit is a failure with the child's code", "[integration][process]") {
    ProcessRunner runner;
    Recorder rec;
    auto handle = runner.start({"sh", "-c", "exit 3"}, rec.callbacks());
    REQUIRE(runner.waitForExit(10s));
    CHECK(handle->state() == RunState::Failed);
    CHECK(handle->exitCode() == 3);
    REQUIRE(rec.exits.size() == 1);
    CHECK(rec.exits[0].second == 3);
}

TEST_CASE("missing executable fails without output", "[integration][process]") {
    ProcessRunner runner;
    Recorder rec;
    auto handle = runner.start({"nkb-no-such-program-xyz", "--version"}, rec.callbacks());
    REQUIRE(runner.waitForExit(10s));
    CHECK(handle->state() == RunState::Failed);
    CHECK(handle->exitCode() == -1);
    CHECK(rec.lines.empty());
    REQUIRE(rec.errors.size() == 1);
    CHECK(rec.errors[0].find("Failed to start nkb-no-such-program-xyz") != std::string::npos);
    REQUIRE(rec.exits.size() == 1);
}

TEST_CASE("empty argv is rejected", "[integration][process]") {
    ProcessRunner runner;
    CHECK_THROWS_AS(runner.start({}), std::invalid_argument);
    CHECK(runner.currentHandle() == nullptr);
}

TEST_CASE("only one run at a time", "[integration][process]") {
    ProcessRunner runner(2000ms);
    auto first = runner.start({"sleep", "30"});
    CHECK(runner.isRunning());
    CHECK_THROWS_AS(runner.start({"true"}), nkb::AlreadyRunningError);
    CHECK(runner.currentHandle() == first);
    runner.stop();
    CHECK(first->state() == RunState::Terminated);

    auto second = runner.start({"true"});
    REQUIRE(runner.waitForExit(10s));
    CHECK(second->state() == RunState::Completed);
}

TEST_CASE("stop terminates the run and a second stop is a no-op", "[integration][process]") {
    ProcessRunner runner(3000ms);
    Recorder rec;
    auto handle = runner.start({"sh", "-c", "echo started; sleep 30"}, rec.callbacks());
    // Wait for the child to be up before stopping.
    const auto deadline = std::chrono::steady_clock::now() + 10s;
    while (rec.lines.empty() && std::chrono::steady_clock::now() < deadline) {
        (void)runner.waitForExit(50ms);
    }
    REQUIRE(rec.lines == std::vector<std::string>{"started"});

    const auto before = std::chrono::steady_clock::now();
    runner.stop();
    CHECK(std::chrono::steady_clock::now() - before < 3000ms);
    CHECK(handle->state() == RunState::Terminated);
    CHECK(handle->exitCode() == 128 + 15);
    REQUIRE(rec.exits.size() == 1);
    CHECK(rec.exits[0].first == RunState::Terminated);

    runner.stop();
    CHECK(rec.exits.size() == 1);
    CHECK(handle->state() == RunState::Terminated);
}

TEST_CASE("stop right after start terminates before any output", "[integration][process]") {
    for (int i = 0; i < 20; ++i) {
        ProcessRunner runner(3000ms);
        Recorder rec;
        auto handle = runner.start({"sh", "-c", "sleep 30"}, rec.callbacks());

        const auto before = std::chrono::steady_clock::now();
        runner.stop();
        CHECK(std::chrono::steady_clock::now() - before < 3000ms);
        CHECK_FALSE(runner.isRunning());
        CHECK(handle->state() == RunState::Terminated);
        REQUIRE(rec.exits.size() == 1);
        CHECK(rec.exits[0].first == RunState::Terminated);

        runner.stop();
        CHECK(runner.pollEvents() == 0);
        CHECK(rec.exits.size() == 1);
    }
}

TEST_CASE("stop after the child exited keeps its own outcome", "[integration][process]") {
    ProcessRunner runner;
    Recorder rec;
    auto handle = runner.start({"sh", "-c", "exit 0"}, rec.callbacks());
    // Give the worker time to reap the child; its Exit message stays queued
    // until the runner dispatches it.
    std::this_thread::sleep_for(1s);
    CHECK_FALSE(handle->finishedAt().has_value());

    runner.stop();
    CHECK_FALSE(runner.isRunning());
    REQUIRE(rec.exits.size() == 1);
    CHECK(rec.exits[0].first == RunState::Completed);
    CHECK(handle->state() == RunState::Completed);
}

TEST_CASE("a child ignoring SIGTERM is killed after the grace period", "[integration][process]") {
    ProcessRunner runner(300ms);
    Recorder rec;
    auto handle = runner.start({"sh", "-c", "trap '' TERM; echo ready; sleep 30"}, rec.callbacks());
    const auto deadline = std::chrono::steady_clock::now() + 10s;
    while (rec.lines.empty() && std::chrono::steady_clock::now() < deadline) {
        (void)runner.waitForExit(50ms);
    }
    REQUIRE_FALSE(rec.lines.empty());

    runner.stop();
    CHECK(handle->state() == RunState::Terminated);
    CHECK(handle->exitCode() == 128 + 9);
    CHECK(rec.exits.size() == 1);
}

TEST_CASE("stop without a run does nothing", "[integration][process]") {
    ProcessRunner runner;
    CHECK_NOTHROW(runner.stop());
    CHECK(runner.pollEvents() == 0);
    CHECK(runner.waitForExit(10ms));
}
