#include "app_config.hpp"

#include <fmt/core.h>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <string>
#include <system_error>
#include <vector>

namespace lwgpu
{
namespace
{
std::optional<std::int32_t> parsePositiveInt(const std::string_view text) noexcept
{
    std::int32_t value = 0;
    const char*  end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end || value <= 0)
    {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parseUnitDouble(std::string_view text)
{
    while (!text.empty() && text.front() == ' ')
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && text.back() == ' ')
    {
        text.remove_suffix(1);
    }
    if (text.empty())
    {
        return std::nullopt;
    }

    // std::stod ignores trailing characters.
    const std::string component(text);
    std::size_t       consumed = 0;
    double            value = 0.0;
    try
    {
        value = std::stod(component, &consumed);
    }
    catch (const std::invalid_argument&)
    {
        return std::nullopt;
    }
    catch (const std::out_of_range&)
    {
        return std::nullopt;
    }
    // Written so that NaN is rejected too.
    if (consumed != component.size() || !(value >= 0.0 && value <= 1.0))
    {
        return std::nullopt;
    }
    return value;
}
} // namespace

std::optional<PresentMode> parsePresentMode(const std::string_view text) noexcept
{
    if (text == "fifo")
    {
        return PresentMode::Fifo;
    }
    if (text == "fifo-relaxed")
    {
        return PresentMode::FifoRelaxed;
    }
    if (text == "immediate")
    {
        return PresentMode::Immediate;
    }
    if (text == "mailbox")
    {
        return PresentMode::Mailbox;
    }
    return std::nullopt;
}

std::optional<Color> parseColor(const std::string_view text)
{
    std::vector<double> components;
    std::size_t         begin = 0;
    while (true)
    {
        const std::size_t comma = text.find(',', begin);
        const auto        component = parseUnitDouble(text.substr(
            begin, comma == std::string_view::npos ? std::string_view::npos : comma - begin));
        if (!component)
        {
            return std::nullopt;
        }
        components.push_back(*component);
        if (comma == std::string_view::npos)
        {
            break;
        }
        begin = comma + 1;
    }

    if (components.size() != 3 && components.size() != 4)
    {
        return std::nullopt;
    }
    return Color{
        components[0], components[1], components[2], components.size() == 4 ? components[3] : 1.0};
}

AppConfig parseCommandLine(const int argc, const char* const* const argv)
{
    AppConfig config;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];

        if (arg == "--help" || arg == "-h")
        {
            config.showHelp = true;
            continue;
        }
        if (arg == "--hot-reload")
        {
            config.hotReload = true;
            continue;
        }
        if (!arg.starts_with("--"))
        {
            throw ConfigError(fmt::format("Unexpected argument \"{}\".", arg));
        }

        std::string_view name = arg;
        std::string_view value;
        if (const std::size_t eq = arg.find('='); eq != std::string_view::npos)
        {
            name = arg.substr(0, eq);
            value = arg.substr(eq + 1);
        }
        else
        {
            if (i + 1 >= argc)
            {
                throw ConfigError(fmt::format("Option {} requires a value.", name));
            }
            value = argv[++i];
        }

        if (name == "--width" || name == "--height")
        {
            const auto size = parsePositiveInt(value);
            if (!size)
            {
                throw ConfigError(fmt::format(
                    "Option {} expects a positive integer, got \"{}\".", name, value));
            }
            (name == "--width" ? config.windowSize.x : config.windowSize.y) = *size;
        }
        else if (name == "--title")
        {
            config.title = std::string(value);
        }
        else if (name == "--present-mode")
        {
            const auto mode = parsePresentMode(value);
            if (!mode)
            {
                throw ConfigError(fmt::format(
                    "Option --present-mode expects one of fifo, fifo-relaxed, immediate or "
                    "mailbox, got \"{}\".",
                    value));
            }
            config.presentMode = *mode;
        }
        else if (name == "--clear-color")
        {
            const auto color = parseColor(value);
            if (!color)
            {
                throw ConfigError(fmt::format(
                    "Option --clear-color expects R,G,B[,A] in [0, 1], got \"{}\".", value));
            }
            config.clearColor = *color;
        }
        else if (name == "--shader")
        {
            if (value.empty())
            {
                throw ConfigError("Option --shader expects a path.");
            }
            config.shaderPath = std::string(value);
        }
        else if (name == "--log-level")
        {
            const auto level = parseLogLevel(value);
            if (!level)
            {
                throw ConfigError(fmt::format(
                    "Option --log-level expects trace, debug, info, warn, error or off, got "
                    "\"{}\".",
                    value));
            }
            config.logLevel = *level;
        }
        else
        {
            throw ConfigError(fmt::format("Unknown option {}.", name));
        }
    }

    return config;
}

std::string usage(const std::string_view programName)
{
    return fmt::format(
        "Usage:\n"
        "\t{} [options]\n"
        "\n"
        "Options:\n"
        "\t--width N                 window width in pixels (default 800)\n"
        "\t--height N                window height in pixels (default 600)\n"
        "\t--title TEXT              window title (default learn-webgpu)\n"
        "\t--present-mode MODE       fifo, fifo-relaxed, immediate or mailbox (default fifo)\n"
        "\t--clear-color R,G,B[,A]   clear color (default 0.1,0.2,0.3,1.0)\n"
        "\t--shader PATH             WGSL shader file (default shader.wgsl)\n"
        "\t--hot-reload              rebuild the pipeline when the shader file changes\n"
        "\t--log-level LEVEL         trace, debug, info, warn, error or off\n"
        "\t--help                    print this message\n"
        "\n"
        "The log level can also be set with the LWGPU_LOG environment variable.\n",
        programName);
}
} // namespace lwgpu
