#include <learn-webgpu/app_config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace lwgpu;

namespace
{
AppConfig parse(std::vector<const char*> args)
{
    args.insert(args.begin(), "learn-webgpu");
    return parseCommandLine(static_cast<int>(args.size()), args.data());
}
} // namespace

TEST_CASE("Defaults without arguments", "[app_config]")
{
    const AppConfig config = parse({});

    REQUIRE(config.windowSize == Extent2i{800, 600});
    REQUIRE(config.title == "learn-webgpu");
    REQUIRE(config.presentMode == PresentMode::Fifo);
    REQUIRE(config.clearColor == Color{0.1, 0.2, 0.3, 1.0});
    REQUIRE(config.shaderPath == "shader.wgsl");
    REQUIRE_FALSE(config.hotReload);
    REQUIRE_FALSE(config.logLevel.has_value());
    REQUIRE_FALSE(config.showHelp);
}

TEST_CASE("Options with values", "[app_config]")
{
    const AppConfig config = parse(
        {"--width",
         "1280",
         "--height=720",
         "--title",
         "triangle",
         "--present-mode",
         "mailbox",
         "--clear-color",
         "0,0.5,1",
         "--shader=shaders/triangle.wgsl",
         "--hot-reload",
         "--log-level",
         "debug"});

    REQUIRE(config.windowSize == Extent2i{1280, 720});
    REQUIRE(config.title == "triangle");
    REQUIRE(config.presentMode == PresentMode::Mailbox);
    REQUIRE(config.clearColor == Color{0.0, 0.5, 1.0, 1.0});
    REQUIRE(config.shaderPath == "shaders/triangle.wgsl");
    REQUIRE(config.hotReload);
    REQUIRE(config.logLevel == LogLevel::Debug);
}

TEST_CASE("Help is requested", "[app_config]")
{
    REQUIRE(parse({"--help"}).showHelp);
    REQUIRE(parse({"-h"}).showHelp);
    REQUIRE(usage("learn-webgpu").find("--present-mode") != std::string::npos);
}

TEST_CASE("Invalid arguments are configuration errors", "[app_config]")
{
    REQUIRE_THROWS_AS(parse({"--width", "0"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--height", "-600"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--width", "80x"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--width"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--present-mode", "vsync"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--clear-color", "1,0"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--clear-color", "1,0,2"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--clear-color", "nan,0,0"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--log-level", "loud"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--shader="}), ConfigError);
    REQUIRE_THROWS_AS(parse({"--fullscreen"}), ConfigError);
    REQUIRE_THROWS_AS(parse({"triangle.wgsl"}), ConfigError);
}

TEST_CASE("Parsing colors", "[app_config]")
{
    REQUIRE(parseColor("0.1,0.2,0.3") == Color{0.1, 0.2, 0.3, 1.0});
    REQUIRE(parseColor("1, 1, 1, 0.5") == Color{1.0, 1.0, 1.0, 0.5});
    REQUIRE_FALSE(parseColor("").has_value());
    REQUIRE_FALSE(parseColor("0.1,,0.3").has_value());
    REQUIRE_FALSE(parseColor("0.1,0.2,0.3,0.4,0.5").has_value());
    REQUIRE_FALSE(parseColor("red,green,blue").has_value());
    REQUIRE_FALSE(parseColor("nan,0,0").has_value());
    REQUIRE_FALSE(parseColor("0,0,inf").has_value());
    REQUIRE_FALSE(parseColor("0,-nan,0,1").has_value());
}

TEST_CASE("Parsing present modes", "[app_config]")
{
    REQUIRE(parsePresentMode("fifo") == PresentMode::Fifo);
    REQUIRE(parsePresentMode("fifo-relaxed") == PresentMode::FifoRelaxed);
    REQUIRE(parsePresentMode("immediate") == PresentMode::Immediate);
    REQUIRE_FALSE(parsePresentMode("Fifo").has_value());
}
