#pragma once

#include <cstdio>
#include <atomic>
#include <optional>
#include <string_view>

namespace trellis {

enum class log_level : int {
    off = 0,
    error = 1,
    warn = 2,
    info = 3,
    debug = 4
};

inline std::atomic<log_level>& current_log_level() {
    static std::atomic<log_level> level{log_level::warn};
    return level;
}

inline void set_log_level(log_level level) {
    current_log_level().store(level, std::memory_order_relaxed);
}

inline log_level get_log_level() {
    return current_log_level().load(std::memory_order_relaxed);
}

/// Parses "off", "error", "warn", "info" or "debug".
inline std::optional<log_level> parse_log_level(std::string_view name) {
    if (name == "off") return log_level::off;
    if (name == "error") return log_level::error;
    if (name == "warn" || name == "warning") return log_level::warn;
    if (name == "info") return log_level::info;
    if (name == "debug") return log_level::debug;
    return std::nullopt;
}

inline const char* to_string(log_level level) {
    switch (level) {
        case log_level::off: return "off";
        case log_level::error: return "error";
        case log_level::warn: return "warn";
        case log_level::info: return "info";
        case log_level::debug: return "debug";
    }
    return "off";
}

/// Sets a log level for the lifetime of the guard, then restores the previous one.
class scoped_log_level {
public:
    explicit scoped_log_level(log_level level) : previous_(get_log_level()) {
        set_log_level(level);
    }
    ~scoped_log_level() { set_log_level(previous_); }

    scoped_log_level(const scoped_log_level&) = delete;
    scoped_log_level& operator=(const scoped_log_level&) = delete;

private:
    log_level previous_;
};

}  // namespace trellis

#define TRELLIS_LOG(level, tag, fmt, ...) \
    do { \
        if (static_cast<int>(level) <= static_cast<int>(trellis::current_log_level().load(std::memory_order_relaxed))) { \
            std::fprintf(stderr, "[%s] " fmt "\n", tag, ##__VA_ARGS__); \
        } \
    } while(0)

#define LOG_ERROR(tag, fmt, ...) TRELLIS_LOG(trellis::log_level::error, tag, fmt, ##__VA_ARGS__)
#define LOG_WARN(tag, fmt, ...)  TRELLIS_LOG(trellis::log_level::warn, tag, fmt, ##__VA_ARGS__)
#define LOG_INFO(tag, fmt, ...)  TRELLIS_LOG(trellis::log_level::info, tag, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(tag, fmt, ...) TRELLIS_LOG(trellis::log_level::debug, tag, fmt, ##__VA_ARGS__)
