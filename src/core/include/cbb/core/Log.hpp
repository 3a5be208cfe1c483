/**
 * @file Log.hpp
 * @brief Minimal logging façade with runtime severity filtering.
 *
 * Every subsystem logs through Log with a short tag ("series", "feature",
 * "model", "playback", ...). Output goes to an ILogger; the built-in sink
 * writes one line per message to stderr, and tests swap in a capturing
 * sink with Log::setLogger().
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef CBB_CORE_LOG_HPP
    #define CBB_CORE_LOG_HPP

    #include "Types.hpp"

    #include <optional>
    #include <string_view>

namespace cbb::core {

/**
 * @brief Severity levels for log messages.
 */
enum class LogLevel : u8 {
    kDebug = 0,
    kInfo,
    kWarn,
    kError,
    kFatal
};

/// Lower-case name of @p level ("debug" ... "fatal").
[[nodiscard]] std::string_view levelName(LogLevel level) noexcept;

/**
 * @brief Inverse of levelName().
 */
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view text) noexcept;

/**
 * @brief Abstract sink for log messages.
 */
class ILogger {
public:
    virtual ~ILogger() = default;

    /**
     * @brief Write a log entry.
     * @param level   Severity.
     * @param tag     Subsystem tag (e.g. "feature", "model", "playback").
     * @param message Formatted message body.
     */
    virtual void write(LogLevel level, std::string_view tag, std::string_view message) = 0;
};

/**
 * @brief Static logging façade used throughout the pipeline.
 *
 * Messages below minLevel() are dropped before reaching the sink. The
 * pipeline is single-threaded; the façade adds no locking of its own.
 */
class Log final {
public:
    Log() = delete;

    /// Installs @p logger; nullptr restores the stderr sink.
    static void setLogger(ILogger *logger);
    static void setMinLevel(LogLevel level);
    [[nodiscard]] static LogLevel minLevel();

    /// True if a message at @p level would reach the sink.
    [[nodiscard]] static bool enabled(LogLevel level);

    static void write(LogLevel level, std::string_view tag, std::string_view msg);

    static void debug(std::string_view tag, std::string_view msg) { write(LogLevel::kDebug, tag, msg); }
    static void info(std::string_view tag, std::string_view msg) { write(LogLevel::kInfo, tag, msg); }
    static void warn(std::string_view tag, std::string_view msg) { write(LogLevel::kWarn, tag, msg); }
    static void error(std::string_view tag, std::string_view msg) { write(LogLevel::kError, tag, msg); }
    static void fatal(std::string_view tag, std::string_view msg) { write(LogLevel::kFatal, tag, msg); }

    static void debug(std::string_view msg) { debug(kDefaultTag, msg); }
    static void info(std::string_view msg) { info(kDefaultTag, msg); }
    static void warn(std::string_view msg) { warn(kDefaultTag, msg); }
    static void error(std::string_view msg) { error(kDefaultTag, msg); }
    static void fatal(std::string_view msg) { fatal(kDefaultTag, msg); }

private:
    static constexpr std::string_view kDefaultTag = "cbb";
};

} // namespace cbb::core

#endif // CBB_CORE_LOG_HPP
