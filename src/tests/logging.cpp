#include <common/logging.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using namespace lwgpu;

namespace
{
// Captures log output for the lifetime of the object and restores the previous level.
class CapturedLog
{
public:
    CapturedLog()
        : mPreviousLevel(logLevel())
    {
        setLogSink([this](const LogLevel level, const std::string_view message) {
            messages.emplace_back(level, std::string(message));
        });
    }
    ~CapturedLog()
    {
        setLogSink({});
        setLogLevel(mPreviousLevel);
    }

    std::vector<std::pair<LogLevel, std::string>> messages;

private:
    LogLevel mPreviousLevel;
};

void setEnv(const char* name, const char* value)
{
#if defined(_WIN32)
    _putenv_s(name, value);
#else
    setenv(name, value, 1);
#endif
}

void unsetEnv(const char* name)
{
#if defined(_WIN32)
    _putenv_s(name, "");
#else
    unsetenv(name);
#endif
}
} // namespace

TEST_CASE("Log levels parse case-insensitively", "[logging]")
{
    REQUIRE(parseLogLevel("trace") == LogLevel::Trace);
    REQUIRE(parseLogLevel("DEBUG") == LogLevel::Debug);
    REQUIRE(parseLogLevel("Info") == LogLevel::Info);
    REQUIRE(parseLogLevel("warn") == LogLevel::Warn);
    REQUIRE(parseLogLevel("warning") == LogLevel::Warn);
    REQUIRE(parseLogLevel("error") == LogLevel::Error);
    REQUIRE(parseLogLevel("off") == LogLevel::Off);
    REQUIRE_FALSE(parseLogLevel("verbose").has_value());
    REQUIRE_FALSE(parseLogLevel("").has_value());
}

TEST_CASE("Messages below the log level are dropped", "[logging]")
{
    CapturedLog log;
    setLogLevel(LogLevel::Warn);

    logDebug("debug {}", 1);
    logInfo("info {}", 2);
    logWarn("warn {}", 3);
    logError("error {}", 4);

    REQUIRE(log.messages.size() == 2);
    REQUIRE(log.messages[0] == std::pair{LogLevel::Warn, std::string("warn 3")});
    REQUIRE(log.messages[1] == std::pair{LogLevel::Error, std::string("error 4")});

    REQUIRE(isLogLevelEnabled(LogLevel::Error));
    REQUIRE_FALSE(isLogLevelEnabled(LogLevel::Info));
}

TEST_CASE("The Off level silences everything", "[logging]")
{
    CapturedLog log;
    setLogLevel(LogLevel::Off);

    logError("not shown");

    REQUIRE(log.messages.empty());
    REQUIRE_FALSE(isLogLevelEnabled(LogLevel::Off));
}

TEST_CASE("The log level is read from the environment", "[logging]")
{
    CapturedLog log;

    SECTION("a valid value is used")
    {
        setEnv("LWGPU_TEST_LOG", "debug");
        initLoggingFromEnvironment("LWGPU_TEST_LOG", LogLevel::Error);
        REQUIRE(logLevel() == LogLevel::Debug);
    }

    SECTION("an unset variable uses the fallback")
    {
        unsetEnv("LWGPU_TEST_LOG");
        initLoggingFromEnvironment("LWGPU_TEST_LOG", LogLevel::Warn);
        REQUIRE(logLevel() == LogLevel::Warn);
    }

    SECTION("an unrecognized value uses the fallback")
    {
        setEnv("LWGPU_TEST_LOG", "loud");
        initLoggingFromEnvironment("LWGPU_TEST_LOG", LogLevel::Info);
        REQUIRE(logLevel() == LogLevel::Info);
    }

    unsetEnv("LWGPU_TEST_LOG");
}
