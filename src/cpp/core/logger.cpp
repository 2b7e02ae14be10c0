#include "logger.h"
#include <cctype>
#include <cstdarg>
#include <cstring>
#include <chrono>
#include <ctime>

namespace ripcord {
namespace core {

result<LogLevel> parse_log_level(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info")  return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "none" || lower == "off") return LogLevel::NONE;

    return err<LogLevel>(error_code::bad_request, "unknown log level: " + std::string(name));
}

Logger::~Logger() noexcept {
    close_output_file();
}

const char* Logger::level_to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default:              return "?????";
    }
}

void Logger::format_timestamp(char* buf, size_t size) noexcept {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    struct tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    snprintf(buf, size, "%04d-%02d-%02d %02d:%02d:%02d.%03d",
             tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
             tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
             static_cast<int>(ms.count()));
}

bool Logger::should_log(LogLevel level, const char* tag) const {
    if (static_cast<uint8_t>(level) < min_level_.load(std::memory_order_relaxed)) {
        return false;
    }
    return is_tag_enabled(tag);
}

void Logger::log(LogLevel level, const char* tag, const char* file, int line,
                 const char* fmt, ...) noexcept {
    if (!should_log(level, tag)) {
        return;
    }

    char message_buf[4096];
    va_list args;
    va_start(args, fmt);
    vsnprintf(message_buf, sizeof(message_buf), fmt, args);
    va_end(args);

    // Strip directories from __FILE__
    const char* filename = strrchr(file, '/');
    filename = filename ? filename + 1 : file;

    emit(level, tag, message_buf, filename, line);
}

void Logger::write(LogLevel level, const char* tag, std::string_view message) noexcept {
    if (!should_log(level, tag)) {
        return;
    }

    std::string owned(message);
    emit(level, tag, owned.c_str(), nullptr, 0);
}

void Logger::emit(LogLevel level, const char* tag, const char* message,
                  const char* file, int line) noexcept {
    char timestamp_buf[32];
    format_timestamp(timestamp_buf, sizeof(timestamp_buf));

    std::lock_guard<std::mutex> lock(output_mutex_);
    if (file) {
        fprintf(output_file_, "%s [%s] [%s] %s (%s:%d)\n",
                timestamp_buf, level_to_string(level), tag, message, file, line);
    } else {
        fprintf(output_file_, "%s [%s] [%s] %s\n",
                timestamp_buf, level_to_string(level), tag, message);
    }
    fflush(output_file_);
}

void Logger::set_tag_enabled(const char* tag, bool enabled) {
    std::lock_guard<std::mutex> lock(output_mutex_);
    tag_filters_[tag] = enabled;
}

bool Logger::is_tag_enabled(const char* tag) const {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (tag_filters_.empty()) {
        return true;
    }
    auto it = tag_filters_.find(tag);
    return it == tag_filters_.end() || it->second;
}

bool Logger::set_output_file(const char* path) noexcept {
    if (!path) {
        close_output_file();
        return true;
    }

    FILE* new_file = fopen(path, "a");
    if (!new_file) {
        return false;
    }

    std::lock_guard<std::mutex> lock(output_mutex_);
    if (owns_file_ && output_file_ != stderr) {
        fclose(output_file_);
    }
    output_file_ = new_file;
    owns_file_ = true;
    return true;
}

void Logger::close_output_file() noexcept {
    std::lock_guard<std::mutex> lock(output_mutex_);
    if (owns_file_ && output_file_ != stderr) {
        fclose(output_file_);
    }
    output_file_ = stderr;
    owns_file_ = false;
}

} // namespace core
} // namespace ripcord
