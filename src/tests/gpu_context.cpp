#include "fakes.hpp"

#include <render-loop/errors.hpp>
#include <render-loop/gpu_context.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

using namespace lwgpu;
using namespace lwgpu::test;

namespace
{
struct ContextFixture
{
    std::shared_ptr<FakeGpuState> state = std::make_shared<FakeGpuState>();

    std::unique_ptr<GpuContext> makeContext(
        const FramebufferSize  size = {800, 600},
        const SurfaceSettings& settings = {})
    {
        return std::make_unique<GpuContext>(
            std::make_unique<FakeGpuBackend>(state), size, settings);
    }
};

RenderPassDescriptor clearPass(const GpuRenderPipeline& pipeline)
{
    return RenderPassDescriptor{.pipeline = &pipeline};
}
} // namespace

SCENARIO("Surface configuration follows the framebuffer size", "[gpu_context]")
{
    ContextFixture fixture;

    GIVEN("a context initialized at 800x600")
    {
        auto context = fixture.makeContext({800, 600});

        THEN("the surface is configured once at 800x600")
        {
            REQUIRE(fixture.state->configurations.size() == 1);
            REQUIRE(context->configuration().size == Extent2u(800, 600));
        }

        WHEN("the window is resized to 400x300")
        {
            REQUIRE(context->reconfigure({400, 300}));

            THEN("the next acquired frame uses 400x300")
            {
                REQUIRE(fixture.state->configurations.back().size == Extent2u(400, 300));
                Frame frame = context->acquireFrame();
                REQUIRE(frame.size() == Extent2u(400, 300));
                context->discard(std::move(frame));
            }

            AND_WHEN("the window is resized to 0x300")
            {
                REQUIRE_FALSE(context->reconfigure({0, 300}));

                THEN("the surface is not reconfigured and keeps 400x300")
                {
                    REQUIRE(fixture.state->configurations.size() == 2);
                    REQUIRE(context->configuration().size == Extent2u(400, 300));
                }
            }
        }

        WHEN("the window is resized to 640x0")
        {
            REQUIRE_FALSE(context->reconfigure({640, 0}));

            THEN("no configuration with a zero dimension reaches the backend")
            {
                for (const SurfaceConfiguration& config : fixture.state->configurations)
                {
                    REQUIRE(config.size.x > 0);
                    REQUIRE(config.size.y > 0);
                }
                REQUIRE(context->configuration().size == Extent2u(800, 600));
            }
        }

        WHEN("reconfiguring with the current size")
        {
            REQUIRE(context->reconfigure({800, 600}));

            THEN("the configuration is unchanged")
            {
                REQUIRE(fixture.state->configurations.size() == 2);
                REQUIRE(fixture.state->configurations[0] == fixture.state->configurations[1]);
            }
        }
    }
}

TEST_CASE("Resize sequences end at the last non-empty size", "[gpu_context]")
{
    ContextFixture fixture;
    auto           context = fixture.makeContext({800, 600});

    const FramebufferSize sizes[] = {
        {1024, 768}, {0, 0}, {300, 200}, {0, 200}, {1920, 1080}, {1920, 0}, {0, 1080}};
    for (const FramebufferSize size : sizes)
    {
        context->reconfigure(size);
    }

    REQUIRE(context->configuration().size == Extent2u(1920, 1080));
    REQUIRE(fixture.state->configurations.size() == 4);
}

TEST_CASE("Initialization selects the surface format and present mode", "[gpu_context]")
{
    ContextFixture fixture;

    SECTION("the preferred format is used when supported")
    {
        auto context = fixture.makeContext(
            {800, 600}, SurfaceSettings{.preferredFormat = TextureFormat::RGBA8Unorm});
        REQUIRE(context->configuration().format == TextureFormat::RGBA8Unorm);
    }

    SECTION("the first supported format is used otherwise")
    {
        auto context = fixture.makeContext(
            {800, 600}, SurfaceSettings{.preferredFormat = TextureFormat::BGRA8UnormSrgb});
        REQUIRE(context->configuration().format == TextureFormat::BGRA8Unorm);
    }

    SECTION("a supported present mode is used")
    {
        auto context =
            fixture.makeContext({800, 600}, SurfaceSettings{.presentMode = PresentMode::Mailbox});
        REQUIRE(context->configuration().presentMode == PresentMode::Mailbox);
    }

    SECTION("an unsupported present mode falls back to Fifo")
    {
        auto context = fixture.makeContext(
            {800, 600}, SurfaceSettings{.presentMode = PresentMode::Immediate});
        REQUIRE(context->configuration().presentMode == PresentMode::Fifo);
    }

    SECTION("a surface reporting only a wide color format uses it")
    {
        fixture.state->capabilities.formats = {TextureFormat::RGBA16Float};
        auto context = fixture.makeContext();
        REQUIRE(context->configuration().format == TextureFormat::RGBA16Float);
    }

    SECTION("a surface without formats is an initialization error")
    {
        fixture.state->capabilities.formats.clear();
        REQUIRE_THROWS_AS(fixture.makeContext(), InitializationError);
    }

    SECTION("an empty framebuffer is an initialization error")
    {
        REQUIRE_THROWS_AS(fixture.makeContext({0, 600}), InitializationError);
        REQUIRE(fixture.state->configurations.empty());
    }
}

TEST_CASE("Acquisition failures are reported as surface errors", "[gpu_context]")
{
    ContextFixture fixture;
    auto           context = fixture.makeContext();

    const auto expectKind = [&](const SurfaceStatus status, const SurfaceErrorKind kind) {
        fixture.state->acquireStatuses.push_back(status);
        try
        {
            Frame frame = context->acquireFrame();
            FAIL("acquireFrame did not throw");
        }
        catch (const SurfaceError& e)
        {
            REQUIRE(e.kind() == kind);
        }
        REQUIRE_FALSE(context->hasOutstandingFrame());
    };

    expectKind(SurfaceStatus::Timeout, SurfaceErrorKind::Timeout);
    expectKind(SurfaceStatus::Outdated, SurfaceErrorKind::Outdated);
    expectKind(SurfaceStatus::Lost, SurfaceErrorKind::Lost);
    expectKind(SurfaceStatus::OutOfMemory, SurfaceErrorKind::OutOfMemory);
    expectKind(SurfaceStatus::DeviceLost, SurfaceErrorKind::DeviceLost);

    REQUIRE(isRecoverable(SurfaceErrorKind::Outdated));
    REQUIRE(isRecoverable(SurfaceErrorKind::Lost));
    REQUIRE_FALSE(isRecoverable(SurfaceErrorKind::Timeout));
    REQUIRE_FALSE(isRecoverable(SurfaceErrorKind::OutOfMemory));
}

TEST_CASE("At most one frame is outstanding", "[gpu_context]")
{
    ContextFixture     fixture;
    auto               context = fixture.makeContext();
    FakeRenderPipeline pipeline;

    Frame frame = context->acquireFrame();
    REQUIRE(context->hasOutstandingFrame());
    REQUIRE_THROWS_AS(context->acquireFrame(), std::logic_error);

    SECTION("presenting releases the frame")
    {
        context->submit(frame, context->encode(frame, clearPass(pipeline)));
        context->present(std::move(frame));
        REQUIRE_FALSE(context->hasOutstandingFrame());
        REQUIRE(fixture.state->texturesAlive == 0);
    }

    SECTION("discarding releases the frame")
    {
        context->discard(std::move(frame));
        REQUIRE_FALSE(context->hasOutstandingFrame());
        REQUIRE(fixture.state->count(BackendCall::Present) == 0);
    }

    SECTION("a frame going out of scope is discarded")
    {
        {
            Frame moved = std::move(frame);
            REQUIRE_FALSE(frame.valid());
            REQUIRE(moved.valid());
        }
        REQUIRE_FALSE(context->hasOutstandingFrame());
        REQUIRE(fixture.state->texturesAlive == 0);
    }

    Frame next = context->acquireFrame();
    REQUIRE(next.index() > 1);
    context->discard(std::move(next));
}

TEST_CASE("Frames are submitted before they are presented", "[gpu_context]")
{
    ContextFixture     fixture;
    auto               context = fixture.makeContext();
    FakeRenderPipeline pipeline;

    Frame frame = context->acquireFrame();

    REQUIRE_THROWS_AS(context->present(std::move(frame)), std::logic_error);
    REQUIRE(frame.valid());

    context->submit(frame, context->encode(frame, clearPass(pipeline)));
    REQUIRE(frame.submitted());
    REQUIRE_THROWS_AS(
        context->submit(frame, context->encode(frame, clearPass(pipeline))), std::logic_error);

    context->present(std::move(frame));
    REQUIRE(context->framesPresented() == 1);
    REQUIRE_THROWS_AS(context->present(std::move(frame)), std::logic_error);
}

TEST_CASE("Frames are presented in submission order", "[gpu_context]")
{
    ContextFixture     fixture;
    auto               context = fixture.makeContext();
    FakeRenderPipeline pipeline;

    constexpr int numFrames = 5;
    for (int i = 0; i < numFrames; ++i)
    {
        Frame frame = context->acquireFrame();
        context->submit(frame, context->encode(frame, clearPass(pipeline)));
        context->present(std::move(frame));
    }

    REQUIRE(context->framesPresented() == numFrames);
    REQUIRE(fixture.state->presentedTextures == fixture.state->submittedTextures);
    REQUIRE(fixture.state->presentedTextures == std::vector<std::uint64_t>{1, 2, 3, 4, 5});
}
