#pragma once

#include <render-loop/gpu_types.hpp>

#include <common/extent.hpp>
#include <common/logging.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lwgpu
{
// Thrown for unknown options and malformed option values.
class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

struct AppConfig
{
    Extent2i    windowSize{800, 600};
    std::string title = "learn-webgpu";
    PresentMode presentMode = PresentMode::Fifo;
    Color       clearColor{0.1, 0.2, 0.3, 1.0};
    std::string shaderPath = "shader.wgsl";
    bool        hotReload = false;
    // Unset means the LWGPU_LOG environment variable or the platform default decides.
    std::optional<LogLevel> logLevel;
    bool                    showHelp = false;
};

// Options are accepted as `--name value` or `--name=value`. Throws ConfigError.
AppConfig parseCommandLine(int argc, const char* const* argv);

std::optional<PresentMode> parsePresentMode(std::string_view text) noexcept;
// Parses "R,G,B" or "R,G,B,A" with components in [0, 1].
std::optional<Color> parseColor(std::string_view text);

std::string usage(std::string_view programName);
} // namespace lwgpu
