#pragma once

#include <cstdio>
#include <functional>
#include <mutex>
#include <string>

namespace warden {

/**
 * @brief Severity of a library log message.
 */
enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] inline const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

/** @brief Receives every message at or above the configured level. */
using LogCallback = std::function<void(LogLevel, const std::string&)>;

namespace detail {

struct LogState {
    std::mutex mutex;
    LogCallback callback;
    LogLevel min_level = LogLevel::Warn;
};

inline LogState& log_state() {
    static LogState state;
    return state;
}

inline void default_log_sink(LogLevel level, const std::string& message) {
    std::fprintf(stderr, "warden [%s] %s\n", log_level_to_string(level), message.c_str());
}

} // namespace detail

/**
 * @brief Route library log output through a custom callback.
 *
 * Passing an empty callback restores the default stderr sink. The callback
 * may be invoked concurrently from worker threads.
 */
inline void set_log_callback(LogCallback callback) {
    auto& state = detail::log_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.callback = std::move(callback);
}

/** @brief Messages below this level are dropped (default: Warn). */
inline void set_log_level(LogLevel level) {
    auto& state = detail::log_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.min_level = level;
}

inline LogLevel log_level() {
    auto& state = detail::log_state();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.min_level;
}

inline void log(LogLevel level, const std::string& message) {
    LogCallback callback;
    {
        auto& state = detail::log_state();
        std::lock_guard<std::mutex> lock(state.mutex);
        if (level < state.min_level) {
            return;
        }
        callback = state.callback;
    }
    if (callback) {
        callback(level, message);
    } else {
        detail::default_log_sink(level, message);
    }
}

inline void log_debug(const std::string& message) { log(LogLevel::Debug, message); }
inline void log_info(const std::string& message) { log(LogLevel::Info, message); }
inline void log_warn(const std::string& message) { log(LogLevel::Warn, message); }
inline void log_error(const std::string& message) { log(LogLevel::Error, message); }

} // namespace warden
