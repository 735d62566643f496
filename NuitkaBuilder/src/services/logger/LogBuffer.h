#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <spdlog/common.h>
#include <spdlog/sinks/base_sink.h>

namespace nkb::logging {

struct LogRecord {
    std::uint64_t seq{0};
    spdlog::level::level_enum level{spdlog::level::info};
    std::chrono::system_clock::time_point time;
    std::string text;
};

// Bounded log history. Sequence numbers keep growing across clear() so a
// reader can poll with readSince(lastSeq) without missing or repeating lines.
class LogBuffer {
public:
    std::uint64_t append(spdlog::level::level_enum level, std::chrono::system_clock::time_point time, std::string text);
    void clear();
    void setCapacity(std::size_t cap);
    std::size_t capacity() const;
    std::size_t size() const;
    std::uint64_t lastSeq() const;

    std::vector<LogRecord> readSince(std::uint64_t seq) const;
    std::vector<LogRecord> readTail(std::size_t maxRecords) const;

    // Records appended since the last clear(), per spdlog level, including
    // those already evicted by the capacity limit.
    std::size_t countAt(spdlog::level::level_enum level) const;

    static LogBuffer& instance();

private:
    void trimLocked();

    mutable std::mutex mtx_;
    std::deque<LogRecord> records_;
    std::size_t capacity_ = 2000;
    std::uint64_t nextSeq_ = 1;
    std::array<std::size_t, spdlog::level::n_levels> counts_{};
};

template <typename Mutex>
class buffer_sink : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit buffer_sink(LogBuffer& target) : target_(target) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted;
        this->formatter_->format(msg, formatted);
        std::string text(formatted.data(), formatted.size());
        while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
            text.pop_back();
        }
        target_.append(msg.level, msg.time, std::move(text));
    }
    void flush_() override {}

private:
    LogBuffer& target_;
};

using buffer_sink_mt = buffer_sink<std::mutex>;

std::shared_ptr<spdlog::sinks::sink> create_buffer_sink(LogBuffer& target = LogBuffer::instance());

} // namespace nkb::logging
