#pragma once

#include "RunChannel.h"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace nkb {

class AlreadyRunningError : public std::runtime_error {
public:
    AlreadyRunningError() : std::runtime_error("A build is already running") {}
};

struct RunCallbacks {
    std::function<void(const std::string& line)> onOutput;
    std::function<void(const std::string& message)> onError;
    std::function<void(RunState outcome, int exitCode)> onExit;
};

// Observable state of one run. Only ProcessRunner mutates it, and only on the
// thread that calls pollEvents()/waitForExit()/stop().
class ProcessHandle {
public:
    using Clock = std::chrono::steady_clock;

    explicit ProcessHandle(std::vector<std::string> command);

    [[nodiscard]] RunState state() const noexcept { return state_; }
    [[nodiscard]] bool isFinished() const noexcept;
    [[nodiscard]] const std::vector<std::string>& command() const noexcept { return command_; }
    [[nodiscard]] const std::vector<std::string>& output() const noexcept { return output_; }
    [[nodiscard]] const std::vector<std::string>& errors() const noexcept { return errors_; }
    [[nodiscard]] std::optional<int> exitCode() const noexcept { return exitCode_; }
    [[nodiscard]] Clock::time_point startedAt() const noexcept { return startedAt_; }
    [[nodiscard]] std::optional<Clock::time_point> finishedAt() const noexcept { return finishedAt_; }
    [[nodiscard]] std::chrono::milliseconds elapsed() const;

private:
    friend class ProcessRunner;

    std::vector<std::string> command_;
    RunState state_{RunState::Running};
    std::vector<std::string> output_;
    std::vector<std::string> errors_;
    std::optional<int> exitCode_;
    Clock::time_point startedAt_;
    std::optional<Clock::time_point> finishedAt_;
};

// Runs one child process at a time. The child gets its own process group and
// a single pipe for stdout and stderr; a worker thread reads it line by line
// and posts messages that the owner dispatches with pollEvents().
class ProcessRunner {
public:
    static constexpr std::chrono::milliseconds kDefaultGracePeriod{5000};

    explicit ProcessRunner(std::chrono::milliseconds gracePeriod = kDefaultGracePeriod);
    ~ProcessRunner();

    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    std::shared_ptr<ProcessHandle> start(const std::vector<std::string>& argv, RunCallbacks callbacks = {});

    // SIGTERM to the process group, SIGKILL after the grace period. Returns
    // once the exit has been dispatched. Safe to call repeatedly.
    void stop();

    // Dispatches queued messages; returns how many were handled.
    std::size_t pollEvents();
    // Dispatches messages until the run finishes or the timeout expires.
    bool waitForExit(std::chrono::milliseconds timeout);

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] std::shared_ptr<ProcessHandle> currentHandle() const noexcept { return handle_; }
    [[nodiscard]] std::chrono::milliseconds gracePeriod() const noexcept { return grace_; }

    struct RunContext;

private:
    void dispatch(RunMessage message);
    void joinWorker();

    std::chrono::milliseconds grace_;
    std::shared_ptr<RunContext> context_;
    std::shared_ptr<ProcessHandle> handle_;
    RunCallbacks callbacks_;
    std::thread worker_;
};

} // namespace nkb
