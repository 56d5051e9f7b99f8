#include "errors.hpp"
#include "frame_loop.hpp"
#include "pipeline_registry.hpp"

#include <common/assert.hpp>
#include <common/logging.hpp>

#include <stdexcept>
#include <utility>

namespace lwgpu
{
const char* frameLoopStateToStr(const FrameLoopState state) noexcept
{
    switch (state)
    {
    case FrameLoopState::Idle:
        return "Idle";
    case FrameLoopState::FrameAcquired:
        return "FrameAcquired";
    case FrameLoopState::Encoding:
        return "Encoding";
    case FrameLoopState::Submitted:
        return "Submitted";
    case FrameLoopState::Stopped:
        return "Stopped";
    }
    LWGPU_ASSERT(!"Unknown FrameLoopState");
    return "Unknown";
}

FrameLoop::FrameLoop(
    GpuContext&                context,
    const PipelineRegistry&    registry,
    EventSource&               eventSource,
    const FrameLoopDescriptor& desc)
    : mContext(context),
      mRegistry(registry),
      mEventSource(eventSource),
      mDispatcher(),
      mPolledEvents(),
      mClearColor(desc.clearColor),
      mLastTime(std::chrono::steady_clock::now())
{
    mDispatcher.subscribe(WindowEventKind::Resized, [this](const WindowEvent& event) {
        mContext.reconfigure(event.size);
    });
    mDispatcher.subscribe(WindowEventKind::RedrawRequested, [this](const WindowEvent&) {
        mRedrawRequested = true;
    });
    mDispatcher.subscribe(WindowEventKind::CloseRequested, [this](const WindowEvent&) {
        mStopRequested = true;
    });
}

void FrameLoop::run()
{
    while (mState != FrameLoopState::Stopped)
    {
        tick();
    }
}

void FrameLoop::tick()
{
    if (mState == FrameLoopState::Stopped)
    {
        return;
    }
    LWGPU_ASSERT(mState == FrameLoopState::Idle);

    mPolledEvents.clear();
    mEventSource.pollEvents(mPolledEvents);
    for (const WindowEvent& event : mPolledEvents)
    {
        mDispatcher.post(event);
    }
    mDispatcher.dispatchPending();

    if (mStopRequested)
    {
        stop();
        return;
    }

    if (!mRedrawRequested)
    {
        return;
    }
    mRedrawRequested = false;

    const auto  currentTime = std::chrono::steady_clock::now();
    const float deltaTime =
        std::chrono::duration<float, std::chrono::seconds::period>(currentTime - mLastTime)
            .count();
    mLastTime = currentTime;

    if (mUpdateCallback)
    {
        mUpdateCallback(deltaTime);
    }

    if (mStopRequested)
    {
        stop();
        return;
    }

    renderFrame();
}

void FrameLoop::setMesh(
    const GpuVertexBuffer* const vertexBuffer,
    const std::uint32_t          vertexCount) noexcept
{
    mVertexBuffer = vertexBuffer;
    mVertexCount = vertexCount;
}

void FrameLoop::renderFrame()
{
    const std::shared_ptr<const Pipeline> pipeline = mRegistry.active();
    if (!pipeline)
    {
        throw std::logic_error("The frame loop requires an active pipeline.");
    }

    std::optional<Frame> frame = acquireFrame();
    if (!frame)
    {
        mStats.framesSkipped += 1;
        return;
    }

    try
    {
        transition(FrameLoopState::FrameAcquired);

        const bool hasVertexInput = pipeline->vertexLayout().empty() || mVertexBuffer != nullptr;
        const RenderPassDescriptor renderPassDesc{
            .label = "Render pass",
            .clearColor = mClearColor,
            .pipeline = &pipeline->gpuPipeline(),
            .vertexBuffer = pipeline->vertexLayout().empty() ? nullptr : mVertexBuffer,
            .vertexCount = hasVertexInput ? mVertexCount : 0,
        };

        transition(FrameLoopState::Encoding);
        std::unique_ptr<GpuCommandBuffer> commands = mContext.encode(*frame, renderPassDesc);

        mContext.submit(*frame, std::move(commands));
        transition(FrameLoopState::Submitted);

        const bool suboptimal = frame->suboptimal();
        mContext.present(std::move(*frame));
        mStats.framesPresented += 1;
        transition(FrameLoopState::Idle);

        if (suboptimal)
        {
            logDebug("Surface texture was suboptimal, reconfiguring.");
            mContext.reconfigure(mEventSource.framebufferSize());
        }
    }
    catch (...)
    {
        // The frame, if still held, is discarded on unwinding.
        mState = FrameLoopState::Idle;
        throw;
    }
}

std::optional<Frame> FrameLoop::acquireFrame()
{
    try
    {
        return mContext.acquireFrame();
    }
    catch (const SurfaceError& e)
    {
        if (e.kind() == SurfaceErrorKind::Timeout)
        {
            logWarn("Timed out acquiring a surface texture, skipping frame.");
            return std::nullopt;
        }
        if (!isRecoverable(e.kind()))
        {
            throw;
        }
        logWarn("{}. Reconfiguring the surface.", e.what());
    }

    mStats.recoveries += 1;
    if (!mContext.reconfigure(mEventSource.framebufferSize()))
    {
        return std::nullopt;
    }

    try
    {
        return mContext.acquireFrame();
    }
    catch (const SurfaceError& e)
    {
        if (e.kind() == SurfaceErrorKind::Timeout)
        {
            logWarn("Timed out acquiring a surface texture, skipping frame.");
            return std::nullopt;
        }
        logError("Surface did not recover after reconfiguring: {}", e.what());
        throw;
    }
}

void FrameLoop::stop()
{
    logInfo("Close requested, waiting for submitted GPU work.");
    mContext.waitForSubmittedWork();
    transition(FrameLoopState::Stopped);
    logInfo(
        "Frame loop stopped after {} presented frames ({} skipped).",
        mStats.framesPresented,
        mStats.framesSkipped);
}

void FrameLoop::transition(const FrameLoopState next)
{
    logTrace("Frame loop: {} -> {}", frameLoopStateToStr(mState), frameLoopStateToStr(next));
    mState = next;
    if (mStateObserver)
    {
        mStateObserver(next);
    }
}
} // namespace lwgpu
