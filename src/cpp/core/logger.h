#pragma once

#include "result.h"

#include <cstdio>
#include <cstdint>
#include <atomic>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

/**
 * Logging system for ripcord
 *
 * Features:
 * - Zero-cost when disabled (compile-time)
 * - Tagged subsystem logging (App, Router, Chain, Transport, ...)
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - Runtime filtering by level and tag
 * - Redirectable output (stderr or an append-mode file)
 *
 * Usage:
 *   LOG_DEBUG("Transport", "Connection accepted: fd=%d", fd);
 *   LOG_INFO("App", "Listening on %s:%d", host.c_str(), port);
 *   LOG_WARN("Chain", "next() invoked twice for %s", path.c_str());
 *   LOG_ERROR("App", "Handler threw: %s", e.what());
 *
 * Build-time control:
 *   Define RIPCORD_ENABLE_LOGGING to enable the LOG_* macros.
 *   If undefined, all LOG_* macros compile to nothing. Logger::write()
 *   is always available and is what the access-log middleware uses.
 */

namespace ripcord {
namespace core {

enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    NONE = 255  // Disable all logging
};

/**
 * Parse "debug", "info", "warn", "error" or "none" (case-insensitive).
 */
result<LogLevel> parse_log_level(std::string_view name);

/**
 * Thread-safe logger singleton
 */
class Logger {
public:
    static Logger& instance() noexcept {
        static Logger logger;
        return logger;
    }

    /**
     * Log a formatted message (called by macros, not meant for direct use)
     *
     * @param level Log level
     * @param tag Subsystem tag (e.g., "App", "Router")
     * @param file Source file name
     * @param line Source line number
     * @param fmt Printf-style format string
     */
    void log(LogLevel level, const char* tag, const char* file, int line,
             const char* fmt, ...) noexcept __attribute__((format(printf, 6, 7)));

    /**
     * Log a preformatted message without source location.
     */
    void write(LogLevel level, const char* tag, std::string_view message) noexcept;

    void set_level(LogLevel level) noexcept {
        min_level_.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
    }

    LogLevel get_level() const noexcept {
        return static_cast<LogLevel>(min_level_.load(std::memory_order_relaxed));
    }

    /**
     * Enable/disable a specific tag. Tags never configured are enabled.
     */
    void set_tag_enabled(const char* tag, bool enabled);

    bool is_tag_enabled(const char* tag) const;

    /**
     * Redirect output to a file (opened in append mode).
     *
     * @param path File path (nullptr reverts to stderr)
     * @return true on success, false if the file could not be opened
     */
    bool set_output_file(const char* path) noexcept;

    /**
     * Close output file and revert to stderr
     */
    void close_output_file() noexcept;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

private:
    Logger() noexcept = default;
    ~Logger() noexcept;

    bool should_log(LogLevel level, const char* tag) const;
    void emit(LogLevel level, const char* tag, const char* message,
              const char* file, int line) noexcept;

    std::atomic<uint8_t> min_level_{static_cast<uint8_t>(LogLevel::INFO)};
    mutable std::mutex output_mutex_;  // Protects output_file_ and tag_filters_
    FILE* output_file_{stderr};
    bool owns_file_{false};
    std::unordered_map<std::string, bool> tag_filters_;

    static const char* level_to_string(LogLevel level) noexcept;
    static void format_timestamp(char* buf, size_t size) noexcept;
};

} // namespace core
} // namespace ripcord

// ============================================================================
// Logging Macros
// ============================================================================

#ifdef RIPCORD_ENABLE_LOGGING

#define LOG_DEBUG(tag, fmt, ...) \
    ::ripcord::core::Logger::instance().log( \
        ::ripcord::core::LogLevel::DEBUG, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_INFO(tag, fmt, ...) \
    ::ripcord::core::Logger::instance().log( \
        ::ripcord::core::LogLevel::INFO, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_WARN(tag, fmt, ...) \
    ::ripcord::core::Logger::instance().log( \
        ::ripcord::core::LogLevel::WARN, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_ERROR(tag, fmt, ...) \
    ::ripcord::core::Logger::instance().log( \
        ::ripcord::core::LogLevel::ERROR, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#else

#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#define LOG_INFO(tag, fmt, ...)  ((void)0)
#define LOG_WARN(tag, fmt, ...)  ((void)0)
#define LOG_ERROR(tag, fmt, ...) ((void)0)

#endif // RIPCORD_ENABLE_LOGGING
