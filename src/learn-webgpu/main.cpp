#include "app_config.hpp"
#include "window.hpp"
#include "wgpu_backend.hpp"

#include <render-loop/frame_loop.hpp>
#include <render-loop/gpu_context.hpp>
#include <render-loop/pipeline_registry.hpp>
#include <render-loop/shader_source.hpp>

#include <common/logging.hpp>
#include <common/platform.hpp>

#include <fmt/core.h>
#include <glm/glm.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <span>
#include <stdexcept>

#if LWGPU_PLATFORM == LWGPU_EMSCRIPTEN
#include <emscripten/emscripten.h>
#endif

namespace
{
#if LWGPU_PLATFORM == LWGPU_EMSCRIPTEN
constexpr lwgpu::LogLevel defaultLogLevel = lwgpu::LogLevel::Warn;
#else
constexpr lwgpu::LogLevel defaultLogLevel = lwgpu::LogLevel::Info;
#endif

constexpr const char* TRIANGLE_PIPELINE = "triangle";

struct Vertex
{
    glm::vec3 position;
    glm::vec3 color;
};

// clang-format off
const std::array<Vertex, 3> TRIANGLE_VERTICES{{
    {.position = { 0.0f,  0.5f, 0.0f}, .color = {1.0f, 0.0f, 0.0f}},
    {.position = {-0.5f, -0.5f, 0.0f}, .color = {0.0f, 1.0f, 0.0f}},
    {.position = { 0.5f, -0.5f, 0.0f}, .color = {0.0f, 0.0f, 1.0f}},
}};
// clang-format on

lwgpu::VertexLayout vertexLayout()
{
    return lwgpu::VertexLayout{
        .arrayStride = sizeof(Vertex),
        .stepMode = lwgpu::VertexStepMode::Vertex,
        .attributes =
            {
                lwgpu::VertexAttribute{
                    .format = lwgpu::VertexFormat::Float32x3,
                    .offset = offsetof(Vertex, position),
                    .shaderLocation = 0,
                },
                lwgpu::VertexAttribute{
                    .format = lwgpu::VertexFormat::Float32x3,
                    .offset = offsetof(Vertex, color),
                    .shaderLocation = 1,
                },
            },
    };
}

#if LWGPU_PLATFORM == LWGPU_EMSCRIPTEN
void tickFrameLoop(void* const userData)
{
    lwgpu::FrameLoop& frameLoop = *static_cast<lwgpu::FrameLoop*>(userData);
    frameLoop.tick();
    if (frameLoop.state() == lwgpu::FrameLoopState::Stopped)
    {
        emscripten_cancel_main_loop();
    }
}
#endif
} // namespace

int main(int argc, char** argv)
try
{
    lwgpu::initLoggingFromEnvironment("LWGPU_LOG", defaultLogLevel);

    const lwgpu::AppConfig config = lwgpu::parseCommandLine(argc, argv);

    if (config.showHelp)
    {
        fmt::print("{}", lwgpu::usage("learn-webgpu"));
        return 0;
    }
    if (config.logLevel)
    {
        lwgpu::setLogLevel(*config.logLevel);
    }

    lwgpu::Window window{lwgpu::WindowDescriptor{
        .windowSize = config.windowSize,
        .title = config.title,
    }};

    lwgpu::GpuContext gpuContext{
        std::make_unique<lwgpu::WgpuBackend>(window.ptr()),
        window.framebufferSize(),
        lwgpu::SurfaceSettings{
            .preferredFormat = lwgpu::TextureFormat::BGRA8Unorm,
            .presentMode = config.presentMode,
        }};

    lwgpu::PipelineRegistry pipelines;
    pipelines.insert(
        TRIANGLE_PIPELINE,
        lwgpu::PipelineRegistry::build(
            gpuContext, lwgpu::loadShaderSource(config.shaderPath), vertexLayout()));

    const std::unique_ptr<lwgpu::GpuVertexBuffer> vertexBuffer = gpuContext.createVertexBuffer(
        "Triangle vertex buffer", std::as_bytes(std::span(TRIANGLE_VERTICES)));

    lwgpu::FrameLoop frameLoop{
        gpuContext,
        pipelines,
        window,
        lwgpu::FrameLoopDescriptor{.clearColor = config.clearColor}};
    frameLoop.setMesh(vertexBuffer.get(), static_cast<std::uint32_t>(TRIANGLE_VERTICES.size()));

    std::optional<lwgpu::ShaderFileWatcher> shaderWatcher;
    if (config.hotReload)
    {
        shaderWatcher.emplace(config.shaderPath);
        lwgpu::logInfo("Watching {} for changes.", config.shaderPath);
    }

    frameLoop.setUpdateCallback([&](float /*deltaTime*/) {
        if (!shaderWatcher || !shaderWatcher->poll())
        {
            return;
        }
        try
        {
            pipelines.reload(
                gpuContext, TRIANGLE_PIPELINE, lwgpu::loadShaderSource(config.shaderPath));
        }
        catch (const std::runtime_error& e)
        {
            lwgpu::logWarn("Shader not reloaded: {}", e.what());
        }
    });

#if LWGPU_PLATFORM == LWGPU_EMSCRIPTEN
    emscripten_set_main_loop_arg(tickFrameLoop, &frameLoop, 0, true);
#else
    frameLoop.run();
#endif

    return 0;
}
catch (const lwgpu::ConfigError& e)
{
    fmt::print(stderr, "{}\n\n{}", e.what(), lwgpu::usage("learn-webgpu"));
    return 1;
}
catch (const std::exception& e)
{
    fmt::print(stderr, "Exception occurred. {}\n", e.what());
    return 1;
}
