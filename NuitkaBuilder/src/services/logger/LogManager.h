#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace nkb::logging {

enum class Level { trace, debug, info, warn, err, critical, off };

struct Config {
    std::string name = "NKB";
    Level level = Level::info;
    std::string pattern = "[%H:%M:%S] [%l] %v";
    bool console = true;
    // Appends to this file as well when non-empty.
    std::string file;
};

enum class Status { ok, already_initialized, not_initialized, error };

class LogManager {
public:
    static Status init(const Config& cfg = {});
    static bool isInitialized();
    // Level and pattern only; sinks are fixed at init.
    static Status reconfigure(const Config& cfg);
    static Status shutdown();

    template <typename... Args>
    static void trace(std::string_view fmt, Args&&... args) { log(Level::trace, fmt, std::forward<Args>(args)...); }
    template <typename... Args>
    static void debug(std::string_view fmt, Args&&... args) { log(Level::debug, fmt, std::forward<Args>(args)...); }
    template <typename... Args>
    static void info(std::string_view fmt, Args&&... args)  { log(Level::info,  fmt, std::forward<Args>(args)...); }
    template <typename... Args>
    static void warn(std::string_view fmt, Args&&... args)  { log(Level::warn,  fmt, std::forward<Args>(args)...); }
    template <typename... Args>
    static void error(std::string_view fmt, Args&&... args) { log(Level::err,   fmt, std::forward<Args>(args)...); }
    template <typename... Args>
    static void critical(std::string_view fmt, Args&&... args) { log(Level::critical, fmt, std::forward<Args>(args)...); }

private:
    template <typename... Args>
    static void log(Level lvl, std::string_view fmt, Args&&... args) {
        std::string s;
        try {
            s = fmt::vformat(fmt, fmt::make_format_args(args...));
        } catch (const fmt::format_error& e) {
            s = std::string(fmt) + " <format error: " + e.what() + ">";
        }
        write(lvl, s);
    }
    static void write(Level lvl, std::string_view message);
};

// Log panel helpers backed by LogBuffer::instance().
struct LogLine {
    std::uint64_t seq;
    Level level;
    std::string text;
};
std::vector<LogLine> read_log_lines_snapshot(size_t max_lines = 1000);
std::vector<LogLine> read_log_lines_since(std::uint64_t seq);
std::size_t log_count(Level level);
const char* level_to_label(Level l);
std::optional<Level> parse_level(std::string_view text);
void clear_log_buffer();
void set_log_buffer_capacity(size_t cap);

}
