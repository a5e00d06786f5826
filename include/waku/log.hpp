// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 waku-cpp Contributors


/**
 * @file log.hpp
 * @brief Logging interface for waku-cpp
 *
 * The log handler is process-wide and thread-safe. The library is silent
 * until a handler is installed.
 *
 * Example:
 * @code
 *   waku::set_log_handler([](waku::LogLevel level, std::string_view msg) {
 *       std::cerr << "[" << waku::log_level_name(level) << "] " << msg << "\n";
 *   });
 *
 *   auto node = waku::sync_wait(waku::NodeHandle<waku::Initialized>::create());
 *   waku::log_emit(waku::LogLevel::Info, "node created");
 *
 *   waku::clear_log_handler();
 * @endcode
 */

#ifndef WAKU_LOG_HPP
#define WAKU_LOG_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>

namespace waku {

/// Log severity levels (match syslog priorities 1:1)
enum class LogLevel {
    Error = 3,   ///< Error condition
    Warning = 4, ///< Warning condition
    Notice = 5,  ///< Normal but significant
    Info = 6,    ///< Informational
    Debug = 7    ///< Debug-level
};

/// Return a short name for the given log level ("ERR", "WARN", etc.)
[[nodiscard]] inline const char *log_level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return "ERR";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Notice:
        return "NOTICE";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    default:
        return "???";
    }
}

/// Log handler callback type
using LogHandler = std::function<void(LogLevel, std::string_view)>;

namespace detail {

/// Global handler state
inline std::mutex log_mutex;
inline LogHandler log_handler_fn;
inline std::atomic<bool> log_installed{false};

} // namespace detail

/// Install a process-wide log handler.
///
/// Replaces any previously installed handler.  The handler is called from
/// whichever thread emits the log message, including engine callback
/// threads; it must be thread-safe and must not call back into the log API.
inline void set_log_handler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(detail::log_mutex);
    detail::log_handler_fn = std::move(handler);
    detail::log_installed.store(static_cast<bool>(detail::log_handler_fn),
                                std::memory_order_release);
}

/// Remove the current log handler.
///
/// After this call the library is silent (default state).
inline void clear_log_handler() noexcept {
    std::lock_guard<std::mutex> lock(detail::log_mutex);
    detail::log_installed.store(false, std::memory_order_release);
    detail::log_handler_fn = nullptr;
}

/// Emit a log message through the registered handler (if any).
///
/// No-op when no handler is installed.  Thread-safe.
inline void log_emit(LogLevel level, std::string_view msg) {
    // Fast path: avoid locking when nobody listens
    if (!detail::log_installed.load(std::memory_order_acquire)) {
        return;
    }
    std::lock_guard<std::mutex> lock(detail::log_mutex);
    if (detail::log_handler_fn) {
        detail::log_handler_fn(level, msg);
    }
}

/// Concatenating convenience overload for context-rich messages.
inline void log_emit(LogLevel level, std::string_view prefix, std::string_view msg) {
    if (!detail::log_installed.load(std::memory_order_acquire)) {
        return;
    }
    std::string line;
    line.reserve(prefix.size() + msg.size() + 2);
    line.append(prefix).append(": ").append(msg);
    log_emit(level, line);
}

} // namespace waku

#endif // WAKU_LOG_HPP
