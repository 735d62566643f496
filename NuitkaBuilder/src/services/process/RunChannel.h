#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace nkb {

enum class RunState {
    Idle,
    Running,
    Completed,
    Failed,
    Terminated,
};

const char* to_string(RunState state) noexcept;

struct RunMessage {
    enum class Kind {
        Output,
        Error,
        Exit, // always the last message of a run
    };

    Kind kind{Kind::Output};
    std::string text;
    RunState outcome{RunState::Idle};
    int exitCode{0};
};

// Single-producer queue carrying messages from a run's worker thread to the
// thread that dispatches callbacks.
class RunChannel {
public:
    void push(RunMessage message) {
        {
            std::lock_guard<std::mutex> lock(mtx_);
            queue_.push_back(std::move(message));
        }
        cv_.notify_one();
    }

    std::optional<RunMessage> tryPop() {
        std::lock_guard<std::mutex> lock(mtx_);
        return popLocked();
    }

    std::optional<RunMessage> waitPop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); });
        return popLocked();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return queue_.size();
    }

private:
    std::optional<RunMessage> popLocked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        RunMessage message = std::move(queue_.front());
        queue_.pop_front();
        return message;
    }

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<RunMessage> queue_;
};

} // namespace nkb
