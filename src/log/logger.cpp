#include "mcpmux/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace mcpmux {

namespace {

constexpr std::string_view kReset  = "\033[0m";
constexpr std::string_view kGray   = "\033[90m";
constexpr std::string_view kBold   = "\033[1m";

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35m";
        case LogLevel::Off:   return kReset;
    }
    return kReset;
}

[[nodiscard]] std::string format_timestamp(const std::chrono::system_clock::time_point& tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm tm_buf{};
    localtime_r(&seconds, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

[[nodiscard]] std::string_view basename_of(const char* path) noexcept {
    std::string_view sv(path);
    const auto slash = sv.find_last_of('/');
    return slash == std::string_view::npos ? sv : sv.substr(slash + 1);
}

}  // namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    std::string lower(name.size(), '\0');
    std::transform(name.begin(), name.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info")  return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "fatal" || lower == "critical") return LogLevel::Fatal;
    if (lower == "off")   return LogLevel::Off;
    return LogLevel::Info;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

void ConsoleLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }

    std::ostringstream oss;
    if (colors_enabled_) {
        oss << kGray << format_timestamp(record.timestamp) << kReset
            << ' ' << kBold << level_color(record.level)
            << std::setw(5) << std::left << to_string(record.level) << kReset
            << ' ' << kGray << basename_of(record.location.file_name())
            << ':' << record.location.line() << kReset;
    } else {
        oss << format_timestamp(record.timestamp)
            << ' ' << std::setw(5) << std::left << to_string(record.level)
            << ' ' << basename_of(record.location.file_name())
            << ':' << record.location.line();
    }
    oss << ' ' << record.message << '\n';

    // One write per record so lines from concurrent connect attempts never interleave
    static std::mutex output_mutex;
    std::lock_guard lock(output_mutex);
    std::cerr << oss.str();
}

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide default logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::mutex& default_logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

LoggerPtr& default_logger_slot() {
    static LoggerPtr instance = std::make_shared<NullLogger>();
    return instance;
}

}  // namespace

LoggerPtr default_logger() noexcept {
    std::lock_guard lock(default_logger_mutex());
    return default_logger_slot();
}

void set_default_logger(LoggerPtr logger) noexcept {
    std::lock_guard lock(default_logger_mutex());
    if (logger) {
        default_logger_slot() = std::move(logger);
    } else {
        default_logger_slot() = std::make_shared<NullLogger>();
    }
}

}  // namespace mcpmux
