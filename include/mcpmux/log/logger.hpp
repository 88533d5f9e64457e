#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace mcpmux {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,  // Recoverable: a server was skipped, a listing failed
    Error = 4,  // An operation failed
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse "trace", "debug", "info", "warn", "error", "fatal" or "off"
/// (case-insensitive). Unknown names map to Info.
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger - diagnostic sink
// ─────────────────────────────────────────────────────────────────────────────
// Components that talk to child processes take an ILogger so tests can
// capture what was reported. Implementations must never write to stdout:
// stdout is the protocol stream of every stdio server built on this library.

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Trace, msg, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, loc);
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Fatal, msg, loc);
    }

private:
    void write(LogLevel level, std::string_view msg, const std::source_location& loc) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }
};

using LoggerPtr = std::shared_ptr<ILogger>;

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - plain stderr output, optional ANSI colours
// ─────────────────────────────────────────────────────────────────────────────

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    void set_level(LogLevel level) noexcept { min_level_ = level; }
    [[nodiscard]] LogLevel level() const noexcept { return min_level_; }

    void set_colors_enabled(bool enabled) noexcept { colors_enabled_ = enabled; }

private:
    LogLevel min_level_;
    bool colors_enabled_ = true;
};

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide default logger
// ─────────────────────────────────────────────────────────────────────────────
// Used by the MCPMUX_LOG_* macros and by any component constructed without an
// explicit logger. Defaults to a NullLogger.

[[nodiscard]] LoggerPtr default_logger() noexcept;

/// Replace the process-wide logger. nullptr restores the NullLogger.
void set_default_logger(LoggerPtr logger) noexcept;

/// Returns `logger` when set, otherwise the process-wide logger.
[[nodiscard]] inline LoggerPtr logger_or_default(const LoggerPtr& logger) noexcept {
    return logger ? logger : default_logger();
}

#define MCPMUX_LOG_AT(level, fn, msg) \
    do { auto mcpmux_logger_ = ::mcpmux::default_logger(); \
         if (mcpmux_logger_->should_log(level)) mcpmux_logger_->fn(msg); } while (false)

#define MCPMUX_LOG_TRACE(msg) MCPMUX_LOG_AT(::mcpmux::LogLevel::Trace, trace, msg)
#define MCPMUX_LOG_DEBUG(msg) MCPMUX_LOG_AT(::mcpmux::LogLevel::Debug, debug, msg)
#define MCPMUX_LOG_INFO(msg)  MCPMUX_LOG_AT(::mcpmux::LogLevel::Info, info, msg)
#define MCPMUX_LOG_WARN(msg)  MCPMUX_LOG_AT(::mcpmux::LogLevel::Warn, warn, msg)
#define MCPMUX_LOG_ERROR(msg) MCPMUX_LOG_AT(::mcpmux::LogLevel::Error, error, msg)

}  // namespace mcpmux
