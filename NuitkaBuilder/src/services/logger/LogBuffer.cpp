#include "LogBuffer.h"

#include <algorithm>

namespace nkb::logging {

LogBuffer& LogBuffer::instance() {
    static LogBuffer buffer;
    return buffer;
}

std::uint64_t LogBuffer::append(spdlog::level::level_enum level, std::chrono::system_clock::time_point time,
                                std::string text) {
    std::lock_guard<std::mutex> lock(mtx_);
    const std::uint64_t seq = nextSeq_++;
    if (level >= 0 && level < spdlog::level::n_levels) {
        ++counts_[static_cast<std::size_t>(level)];
    }
    if (capacity_ == 0) {
        return seq;
    }
    records_.push_back(LogRecord{seq, level, time, std::move(text)});
    trimLocked();
    return seq;
}

void LogBuffer::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    records_.clear();
    counts_.fill(0);
}

void LogBuffer::setCapacity(std::size_t cap) {
    std::lock_guard<std::mutex> lock(mtx_);
    capacity_ = cap;
    trimLocked();
}

std::size_t LogBuffer::capacity() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return capacity_;
}

std::size_t LogBuffer::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return records_.size();
}

std::uint64_t LogBuffer::lastSeq() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return nextSeq_ - 1;
}

std::vector<LogRecord> LogBuffer::readSince(std::uint64_t seq) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto first = std::upper_bound(records_.begin(), records_.end(), seq,
                                  [](std::uint64_t value, const LogRecord& record) { return value < record.seq; });
    return std::vector<LogRecord>(first, records_.end());
}

std::vector<LogRecord> LogBuffer::readTail(std::size_t maxRecords) const {
    std::lock_guard<std::mutex> lock(mtx_);
    const std::size_t count = std::min(maxRecords, records_.size());
    return std::vector<LogRecord>(records_.end() - static_cast<std::ptrdiff_t>(count), records_.end());
}

std::size_t LogBuffer::countAt(spdlog::level::level_enum level) const {
    if (level < 0 || level >= spdlog::level::n_levels) {
        return 0;
    }
    std::lock_guard<std::mutex> lock(mtx_);
    return counts_[static_cast<std::size_t>(level)];
}

void LogBuffer::trimLocked() {
    while (records_.size() > capacity_) {
        records_.pop_front();
    }
}

std::shared_ptr<spdlog::sinks::sink> create_buffer_sink(LogBuffer& target) {
    return std::make_shared<buffer_sink_mt>(target);
}

} // namespace nkb::logging
