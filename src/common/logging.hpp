#pragma once

#include <fmt/core.h>

#include <functional>
#include <optional>
#include <string_view>
#include <utility>

namespace lwgpu
{
enum class LogLevel
{
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

using LogSink = std::function<void(LogLevel, std::string_view)>;

const char*             logLevelToStr(LogLevel level) noexcept;
std::optional<LogLevel> parseLogLevel(std::string_view text) noexcept;

void     setLogLevel(LogLevel level) noexcept;
LogLevel logLevel() noexcept;
bool     isLogLevelEnabled(LogLevel level) noexcept;

// Reads the level from the environment variable `envVar`, falling back to `fallback` if the
// variable is unset or unparseable.
void initLoggingFromEnvironment(const char* envVar, LogLevel fallback);

// Replaces the output sink. Passing an empty function restores the default stderr sink.
void setLogSink(LogSink sink);

void logMessage(LogLevel level, std::string_view message);

template<typename... Args>
void logAt(const LogLevel level, fmt::format_string<Args...> format, Args&&... args)
{
    if (isLogLevelEnabled(level))
    {
        logMessage(level, fmt::format(format, std::forward<Args>(args)...));
    }
}

template<typename... Args>
void logTrace(fmt::format_string<Args...> format, Args&&... args)
{
    logAt(LogLevel::Trace, format, std::forward<Args>(args)...);
}

template<typename... Args>
void logDebug(fmt::format_string<Args...> format, Args&&... args)
{
    logAt(LogLevel::Debug, format, std::forward<Args>(args)...);
}

template<typename... Args>
void logInfo(fmt::format_string<Args...> format, Args&&... args)
{
    logAt(LogLevel::Info, format, std::forward<Args>(args)...);
}

template<typename... Args>
void logWarn(fmt::format_string<Args...> format, Args&&... args)
{
    logAt(LogLevel::Warn, format, std::forward<Args>(args)...);
}

template<typename... Args>
void logError(fmt::format_string<Args...> format, Args&&... args)
{
    logAt(LogLevel::Error, format, std::forward<Args>(args)...);
}
} // namespace lwgpu
