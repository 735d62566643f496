#include "ProcessRunner.h"

#include "services/logger/LogManager.h"

#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace nkb {

const char* to_string(RunState state) noexcept {
    switch (state) {
    case RunState::Idle: return "idle";
    case RunState::Running: return "running";
    case RunState::Completed: return "completed";
    case RunState::Failed: return "failed";
    case RunState::Terminated: return "terminated";
    }
    return "unknown";
}

struct ProcessRunner::RunContext {
    RunChannel channel;
    std::atomic<bool> cancelRequested{false};
    std::mutex mtx;
    std::condition_variable exitedCv;
    pid_t pid{-1};
    bool exited{false};
};

namespace {

constexpr int kPollIntervalMs = 100;

std::string errnoText(int err) {
    return std::strerror(err);
}

void postError(ProcessRunner::RunContext& ctx, std::string text) {
    ctx.channel.push(RunMessage{RunMessage::Kind::Error, std::move(text), RunState::Idle, 0});
}

void postExit(ProcessRunner::RunContext& ctx, RunState outcome, int code) {
    ctx.channel.push(RunMessage{RunMessage::Kind::Exit, {}, outcome, code});
}

void markExited(ProcessRunner::RunContext& ctx) {
    {
        std::lock_guard<std::mutex> lock(ctx.mtx);
        ctx.exited = true;
    }
    ctx.exitedCv.notify_all();
}

// Splits a byte stream into lines, dropping '\r' before '\n'.
class LineSplitter {
public:
    explicit LineSplitter(ProcessRunner::RunContext& ctx) : ctx_(ctx) {}

    void feed(const char* data, std::size_t size) {
        for (std::size_t i = 0; i < size; ++i) {
            if (data[i] == '\n') {
                emit();
            } else {
                partial_.push_back(data[i]);
            }
        }
    }

    void finish() {
        if (!partial_.empty()) {
            emit();
        }
    }

private:
    void emit() {
        if (!partial_.empty() && partial_.back() == '\r') {
            partial_.pop_back();
        }
        ctx_.channel.push(RunMessage{RunMessage::Kind::Output, std::move(partial_), RunState::Idle, 0});
        partial_.clear();
    }

    ProcessRunner::RunContext& ctx_;
    std::string partial_;
};

bool childHasExited(pid_t pid) {
    siginfo_t info{};
    if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) != 0) {
        return false;
    }
    return info.si_pid == pid;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void runWorker(std::shared_ptr<ProcessRunner::RunContext> ctx, std::vector<std::string> argv) {
    int out[2] = {-1, -1};
    int execErr[2] = {-1, -1};
    if (::pipe2(out, O_CLOEXEC) != 0 || ::pipe2(execErr, O_CLOEXEC) != 0) {
        const int err = errno;
        closeFd(out[0]);
        closeFd(out[1]);
        postError(*ctx, "Failed to create pipe: " + errnoText(err));
        markExited(*ctx);
        postExit(*ctx, RunState::Failed, -1);
        return;
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (auto& arg : argv) {
        args.push_back(arg.data());
    }
    args.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int err = errno;
        closeFd(out[0]);
        closeFd(out[1]);
        closeFd(execErr[0]);
        closeFd(execErr[1]);
        postError(*ctx, "Failed to fork: " + errnoText(err));
        markExited(*ctx);
        postExit(*ctx, RunState::Failed, -1);
        return;
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls until exec.
        (void)::setpgid(0, 0);
        if (::dup2(out[1], STDOUT_FILENO) < 0 || ::dup2(out[1], STDERR_FILENO) < 0) {
            const int err = errno;
            ssize_t ignored = ::write(execErr[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }
        ::execvp(args[0], args.data());
        const int err = errno;
        ssize_t ignored = ::write(execErr[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Also set from the parent so the group exists before stop() can signal
    // it; EACCES after the child has exec'd is expected.
    (void)::setpgid(pid, pid);
    closeFd(out[1]);
    closeFd(execErr[1]);
    {
        std::lock_guard<std::mutex> lock(ctx->mtx);
        ctx->pid = pid;
    }

    // A successful exec closes the CLOEXEC end, so EOF means the tool started.
    int execErrno = 0;
    ssize_t n = 0;
    do {
        n = ::read(execErr[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);
    closeFd(execErr[0]);

    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        {
            std::lock_guard<std::mutex> lock(ctx->mtx);
            int status = 0;
            while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
            }
            ctx->exited = true;
        }
        ctx->exitedCv.notify_all();
        closeFd(out[0]);
        postError(*ctx, "Failed to start " + argv.front() + ": " + errnoText(execErrno));
        postExit(*ctx, RunState::Failed, -1);
        return;
    }

    if (ctx->cancelRequested.load()) {
        (void)::kill(-pid, SIGTERM);
    }

    LineSplitter splitter(*ctx);
    char buffer[4096];
    for (;;) {
        pollfd pfd{out[0], POLLIN, 0};
        const int ready = ::poll(&pfd, 1, kPollIntervalMs);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            postError(*ctx, "Failed to poll build output: " + errnoText(errno));
            break;
        }
        if (ready == 0) {
            // Descendants outside the group may keep the pipe open after a stop.
            if (ctx->cancelRequested.load() && childHasExited(pid)) {
                break;
            }
            continue;
        }
        const ssize_t got = ::read(out[0], buffer, sizeof(buffer));
        if (got < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            postError(*ctx, "Failed to read build output: " + errnoText(errno));
            break;
        }
        if (got == 0) {
            break;
        }
        splitter.feed(buffer, static_cast<std::size_t>(got));
    }
    splitter.finish();
    closeFd(out[0]);

    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT) != 0 && errno == EINTR) {
    }
    int status = 0;
    bool cancelled = false;
    {
        // Reap under the lock so stop() never signals a recycled pid and a
        // stop request either precedes the exit or is not made at all.
        std::lock_guard<std::mutex> lock(ctx->mtx);
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        ctx->exited = true;
        cancelled = ctx->cancelRequested.load();
    }
    ctx->exitedCv.notify_all();

    int code = -1;
    if (WIFEXITED(status)) {
        code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        code = 128 + WTERMSIG(status);
    }

    RunState outcome = RunState::Failed;
    if (cancelled) {
        outcome = RunState::Terminated;
    } else if (WIFEXITED(status) && code == 0) {
        outcome = RunState::Completed;
    }
    postExit(*ctx, outcome, code);
}

} // namespace

ProcessHandle::ProcessHandle(std::vector<std::string> command)
    : command_(std::move(command)), startedAt_(Clock::now()) {}

bool ProcessHandle::isFinished() const noexcept {
    return state_ == RunState::Completed || state_ == RunState::Failed || state_ == RunState::Terminated;
}

std::chrono::milliseconds ProcessHandle::elapsed() const {
    const auto end = finishedAt_.value_or(Clock::now());
    return std::chrono::duration_cast<std::chrono::milliseconds>(end - startedAt_);
}

ProcessRunner::ProcessRunner(std::chrono::milliseconds gracePeriod)
    : grace_(gracePeriod) {}

ProcessRunner::~ProcessRunner() {
    if (isRunning()) {
        stop();
    }
    joinWorker();
}

std::shared_ptr<ProcessHandle> ProcessRunner::start(const std::vector<std::string>& argv, RunCallbacks callbacks) {
    if (argv.empty() || argv.front().empty()) {
        throw std::invalid_argument("Cannot start a process without a program");
    }
    pollEvents();
    if (isRunning()) {
        throw AlreadyRunningError();
    }
    joinWorker();

    context_ = std::make_shared<RunContext>();
    handle_ = std::make_shared<ProcessHandle>(argv);
    callbacks_ = std::move(callbacks);
    logging::LogManager::info("Starting build: {}", argv.front());
    worker_ = std::thread(runWorker, context_, argv);
    return handle_;
}

void ProcessRunner::stop() {
    if (!isRunning() || !context_) {
        return;
    }
    auto ctx = context_;
    std::unique_lock<std::mutex> lock(ctx->mtx);
    if (ctx->exited) {
        // Finished on its own; its Exit message keeps the real outcome.
        lock.unlock();
        joinWorker();
        pollEvents();
        return;
    }
    const bool firstRequest = !ctx->cancelRequested.exchange(true);
    if (firstRequest) {
        logging::LogManager::info("Stopping build");
    }
    if (firstRequest && ctx->pid > 0) {
        if (::kill(-ctx->pid, SIGTERM) != 0) {
            postError(*ctx, "Failed to terminate build: " + errnoText(errno));
        }
    }
    if (!ctx->exitedCv.wait_for(lock, grace_, [&] { return ctx->exited; })) {
        if (ctx->pid > 0 && ::kill(-ctx->pid, SIGKILL) != 0) {
            postError(*ctx, "Failed to kill build: " + errnoText(errno));
        } else {
            logging::LogManager::warn("Build ignored SIGTERM for {} ms, sent SIGKILL", grace_.count());
        }
        ctx->exitedCv.wait(lock, [&] { return ctx->exited; });
    }
    lock.unlock();

    // The worker posts Exit right after reaping; joining makes it visible here.
    joinWorker();
    pollEvents();
}

std::size_t ProcessRunner::pollEvents() {
    if (!context_) {
        return 0;
    }
    std::size_t handled = 0;
    auto ctx = context_;
    while (auto message = ctx->channel.tryPop()) {
        dispatch(std::move(*message));
        ++handled;
    }
    return handled;
}

bool ProcessRunner::waitForExit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (isRunning()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (auto message = context_->channel.waitPop(remaining)) {
            dispatch(std::move(*message));
        }
    }
    pollEvents();
    return true;
}

bool ProcessRunner::isRunning() const noexcept {
    return handle_ && handle_->state() == RunState::Running;
}

void ProcessRunner::dispatch(RunMessage message) {
    if (!handle_) {
        return;
    }
    switch (message.kind) {
    case RunMessage::Kind::Output:
        handle_->output_.push_back(message.text);
        if (callbacks_.onOutput) {
            callbacks_.onOutput(message.text);
        }
        break;
    case RunMessage::Kind::Error:
        handle_->errors_.push_back(message.text);
        logging::LogManager::error("{}", message.text);
        if (callbacks_.onError) {
            callbacks_.onError(message.text);
        }
        break;
    case RunMessage::Kind::Exit:
        if (handle_->isFinished()) {
            break;
        }
        handle_->state_ = message.outcome;
        handle_->exitCode_ = message.exitCode;
        handle_->finishedAt_ = ProcessHandle::Clock::now();
        logging::LogManager::info("Build {} with exit code {} after {} ms", to_string(message.outcome), message.exitCode,
                                  handle_->elapsed().count());
        if (callbacks_.onExit) {
            callbacks_.onExit(message.outcome, message.exitCode);
        }
        break;
    }
}

void ProcessRunner::joinWorker() {
    if (worker_.joinable()) {
        worker_.join();
    }
}

} // namespace nkb
