#include "logging.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <utility>

namespace lwgpu
{
namespace
{
LogLevel gLogLevel = LogLevel::Info;
LogSink  gLogSink;

void stderrSink(const LogLevel level, const std::string_view message)
{
    fmt::print(stderr, "[{}] {}\n", logLevelToStr(level), message);
}
} // namespace

const char* logLevelToStr(const LogLevel level) noexcept
{
    switch (level)
    {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Off:
        return "OFF";
    }
    return "UNKNOWN";
}

std::optional<LogLevel> parseLogLevel(const std::string_view text) noexcept
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](const unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "trace")
    {
        return LogLevel::Trace;
    }
    if (lower == "debug")
    {
        return LogLevel::Debug;
    }
    if (lower == "info")
    {
        return LogLevel::Info;
    }
    if (lower == "warn" || lower == "warning")
    {
        return LogLevel::Warn;
    }
    if (lower == "error")
    {
        return LogLevel::Error;
    }
    if (lower == "off")
    {
        return LogLevel::Off;
    }
    return std::nullopt;
}

void setLogLevel(const LogLevel level) noexcept { gLogLevel = level; }

LogLevel logLevel() noexcept { return gLogLevel; }

bool isLogLevelEnabled(const LogLevel level) noexcept
{
    return level != LogLevel::Off && level >= gLogLevel;
}

void initLoggingFromEnvironment(const char* const envVar, const LogLevel fallback)
{
    LogLevel level = fallback;
    if (const char* const value = std::getenv(envVar))
    {
        if (const auto parsed = parseLogLevel(value))
        {
            level = *parsed;
        }
        else
        {
            stderrSink(
                LogLevel::Warn,
                fmt::format("Ignoring unrecognized {} value \"{}\".", envVar, value));
        }
    }
    setLogLevel(level);
}

void setLogSink(LogSink sink) { gLogSink = std::move(sink); }

void logMessage(const LogLevel level, const std::string_view message)
{
    if (gLogSink)
    {
        gLogSink(level, message);
    }
    else
    {
        stderrSink(level, message);
    }
}
} // namespace lwgpu
