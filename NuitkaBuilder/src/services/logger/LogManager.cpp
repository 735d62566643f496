#include "LogManager.h"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <memory>
#include <mutex>
#include "LogBuffer.h"

namespace nkb::logging {
namespace {
    std::shared_ptr<spdlog::logger> g_logger;
    std::mutex g_mtx;

    spdlog::level::level_enum toSpd(Level lvl) {
        switch (lvl) {
            case Level::trace: return spdlog::level::trace;
            case Level::debug: return spdlog::level::debug;
            case Level::info: return spdlog::level::info;
            case Level::warn: return spdlog::level::warn;
            case Level::err: return spdlog::level::err;
            case Level::critical: return spdlog::level::critical;
            case Level::off: break;
        }
        return spdlog::level::off;
    }

    Level fromSpd(spdlog::level::level_enum lvl) {
        switch (lvl) {
            case spdlog::level::trace: return Level::trace;
            case spdlog::level::debug: return Level::debug;
            case spdlog::level::warn: return Level::warn;
            case spdlog::level::err: return Level::err;
            case spdlog::level::critical: return Level::critical;
            case spdlog::level::off: return Level::off;
            default: return Level::info;
        }
    }

    void applyLocked(const Config& cfg) {
        g_logger->set_level(toSpd(cfg.level));
        g_logger->set_pattern(cfg.pattern);
        // Build failures should reach the file even if the process dies.
        g_logger->flush_on(spdlog::level::err);
    }

    Status initLocked(const Config& cfg) {
        if (g_logger) return Status::already_initialized;
        try {
            std::vector<spdlog::sink_ptr> sinks;
            if (cfg.console) {
                sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            }
            if (!cfg.file.empty()) {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.file));
            }
            sinks.push_back(create_buffer_sink());
            auto logger = std::make_shared<spdlog::logger>(cfg.name, sinks.begin(), sinks.end());
            spdlog::register_logger(logger);
            g_logger = std::move(logger);
            applyLocked(cfg);
            return Status::ok;
        } catch (const spdlog::spdlog_ex& e) {
            if (g_logger) spdlog::drop(g_logger->name());
            g_logger.reset();
            fmt::print(stderr, "logging init failed: {}\n", e.what());
            return Status::error;
        }
    }

    std::vector<LogLine> toLines(std::vector<LogRecord> records) {
        std::vector<LogLine> out;
        out.reserve(records.size());
        for (auto& r : records) {
            out.push_back(LogLine{ r.seq, fromSpd(r.level), std::move(r.text) });
        }
        return out;
    }
}

Status LogManager::init(const Config& cfg) {
    std::lock_guard<std::mutex> lock(g_mtx);
    return initLocked(cfg);
}

bool LogManager::isInitialized() {
    std::lock_guard<std::mutex> lock(g_mtx);
    return (bool)g_logger;
}

Status LogManager::reconfigure(const Config& cfg) {
    std::lock_guard<std::mutex> lock(g_mtx);
    if (!g_logger) return Status::not_initialized;
    try {
        applyLocked(cfg);
        return Status::ok;
    } catch (const spdlog::spdlog_ex& e) {
        fmt::print(stderr, "logging reconfigure failed: {}\n", e.what());
        return Status::error;
    }
}

Status LogManager::shutdown() {
    std::lock_guard<std::mutex> lock(g_mtx);
    if (!g_logger) return Status::not_initialized;
    g_logger->flush();
    spdlog::drop(g_logger->name());
    g_logger.reset();
    return Status::ok;
}

void LogManager::write(Level lvl, std::string_view message) {
    if (lvl == Level::off) return;
    std::shared_ptr<spdlog::logger> local;
    {
        // Lazily start with defaults so early messages are not lost.
        std::lock_guard<std::mutex> lock(g_mtx);
        if (!g_logger) (void)initLocked(Config{});
        local = g_logger;
    }
    if (!local) return;
    local->log(toSpd(lvl), "{}", message);
}

std::vector<LogLine> read_log_lines_snapshot(size_t max_lines) {
    return toLines(LogBuffer::instance().readTail(max_lines));
}

std::vector<LogLine> read_log_lines_since(std::uint64_t seq) {
    return toLines(LogBuffer::instance().readSince(seq));
}

std::size_t log_count(Level level) {
    if (level == Level::off) return 0;
    return LogBuffer::instance().countAt(toSpd(level));
}

const char* level_to_label(Level l) {
    switch (l) {
        case Level::trace: return "TRACE";
        case Level::debug: return "DEBUG";
        case Level::info: return "INFO";
        case Level::warn: return "WARN";
        case Level::err: return "ERROR";
        case Level::critical: return "CRIT";
        case Level::off: break;
    }
    return "OFF";
}

std::optional<Level> parse_level(std::string_view text) {
    if (text == "trace") return Level::trace;
    if (text == "debug") return Level::debug;
    if (text == "info") return Level::info;
    if (text == "warn" || text == "warning") return Level::warn;
    if (text == "error" || text == "err") return Level::err;
    if (text == "critical") return Level::critical;
    if (text == "off") return Level::off;
    return std::nullopt;
}

void clear_log_buffer() { LogBuffer::instance().clear(); }
void set_log_buffer_capacity(size_t cap) { LogBuffer::instance().setCapacity(cap); }

} // namespace nkb::logging
