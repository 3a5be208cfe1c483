/**
 * @file Log.cpp
 * @brief Log façade dispatch and the stderr sink.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#include "cbb/core/Log.hpp"

#include <array>
#include <chrono>
#include <cstdio>

namespace cbb::core {

namespace {

constexpr std::array<std::string_view, 5> kLevelNames = {"debug", "info", "warn", "error", "fatal"};

/// Prefixes each line with the seconds elapsed since the first message.
class StderrSink final : public ILogger {
public:
    void write(LogLevel level, std::string_view tag, std::string_view message) override
    {
        const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - _origin;
        const auto name = levelName(level);
        std::fprintf(stderr, "%9.3f %-5.*s [%.*s] %.*s\n", elapsed.count(),
                     static_cast<int>(name.size()), name.data(),
                     static_cast<int>(tag.size()), tag.data(),
                     static_cast<int>(message.size()), message.data());
    }

private:
    std::chrono::steady_clock::time_point _origin = std::chrono::steady_clock::now();
};

struct LogState {
    StderrSink fallback;
    ILogger *sink = &fallback;
    LogLevel threshold = LogLevel::kInfo;
};

LogState &state()
{
    static LogState instance;
    return instance;
}

} // namespace

std::string_view levelName(LogLevel level) noexcept
{
    const auto index = static_cast<std::size_t>(level);
    return index < kLevelNames.size() ? kLevelNames[index] : "?";
}

std::optional<LogLevel> parseLogLevel(std::string_view text) noexcept
{
    for (std::size_t i = 0; i < kLevelNames.size(); ++i) {
        if (kLevelNames[i] == text)
            return static_cast<LogLevel>(i);
    }
    return std::nullopt;
}

void Log::setLogger(ILogger *logger)
{
    auto &s = state();
    s.sink = logger != nullptr ? logger : &s.fallback;
}

void Log::setMinLevel(LogLevel level)
{
    state().threshold = level;
}

LogLevel Log::minLevel()
{
    return state().threshold;
}

bool Log::enabled(LogLevel level)
{
    return level >= state().threshold;
}

void Log::write(LogLevel level, std::string_view tag, std::string_view msg)
{
    if (enabled(level))
        state().sink->write(level, tag, msg);
}

} // namespace cbb::core
