#pragma once

#include "event_dispatcher.hpp"
#include "gpu_context.hpp"
#include "gpu_types.hpp"
#include "window_event.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace lwgpu
{
class GpuVertexBuffer;
class PipelineRegistry;

// Idle -> FrameAcquired -> Encoding -> Submitted -> Idle, until a close request moves the
// loop to Stopped.
enum class FrameLoopState
{
    Idle,
    FrameAcquired,
    Encoding,
    Submitted,
    Stopped,
};

const char* frameLoopStateToStr(FrameLoopState state) noexcept;

struct FrameStats
{
    std::uint64_t framesPresented = 0;
    // Frames not drawn because the surface timed out or the window was empty.
    std::uint64_t framesSkipped = 0;
    // Surface reconfigurations after an outdated or lost surface.
    std::uint64_t recoveries = 0;
};

struct FrameLoopDescriptor
{
    Color clearColor{0.1, 0.2, 0.3, 1.0};
};

using UpdateCallback = std::function<void(float deltaTime)>;
using StateObserver = std::function<void(FrameLoopState)>;

// Drives the frame loop on the thread which owns the window.
//
// Each tick polls the event source and dispatches the events: resizes reconfigure the
// context immediately, a close request stops the loop once in-flight GPU work has drained,
// and a redraw request renders one frame with the registry's active pipeline.
class FrameLoop
{
public:
    FrameLoop(
        GpuContext&                context,
        const PipelineRegistry&    registry,
        EventSource&               eventSource,
        const FrameLoopDescriptor& desc = {});

    FrameLoop(const FrameLoop&) = delete;
    FrameLoop& operator=(const FrameLoop&) = delete;

    // The event handlers refer back to the loop.
    FrameLoop(FrameLoop&&) = delete;
    FrameLoop& operator=(FrameLoop&&) = delete;

    // Run loop

    // Ticks until the loop is stopped.
    void run();
    void tick();
    // Observed at the start of the next tick, or before encoding if called from the update
    // callback. A frame which is already being encoded is still submitted and presented.
    void requestStop() noexcept { mStopRequested = true; }

    // Frame contents

    // Draws `vertexCount` vertices from `vertexBuffer` each frame. The buffer may be null if
    // the active pipeline has an empty vertex layout. With a zero vertex count the render
    // pass only clears the surface.
    void setMesh(const GpuVertexBuffer* vertexBuffer, std::uint32_t vertexCount) noexcept;
    void setClearColor(const Color& color) noexcept { mClearColor = color; }

    // Hooks

    void setUpdateCallback(UpdateCallback callback) { mUpdateCallback = std::move(callback); }
    // Invoked on every state transition.
    void setStateObserver(StateObserver observer) { mStateObserver = std::move(observer); }

    // Accessors

    inline FrameLoopState    state() const noexcept { return mState; }
    inline bool              stopRequested() const noexcept { return mStopRequested; }
    inline const FrameStats& stats() const noexcept { return mStats; }
    inline EventDispatcher&  dispatcher() noexcept { return mDispatcher; }

private:
    void                 renderFrame();
    std::optional<Frame> acquireFrame();
    void                 stop();
    void                 transition(FrameLoopState next);

    GpuContext&             mContext;
    const PipelineRegistry& mRegistry;
    EventSource&            mEventSource;
    EventDispatcher         mDispatcher;

    std::vector<WindowEvent>              mPolledEvents;
    FrameLoopState                        mState = FrameLoopState::Idle;
    FrameStats                            mStats;
    bool                                  mStopRequested = false;
    bool                                  mRedrawRequested = false;
    Color                                 mClearColor;
    const GpuVertexBuffer*                mVertexBuffer = nullptr;
    std::uint32_t                         mVertexCount = 0;
    UpdateCallback                        mUpdateCallback;
    StateObserver                         mStateObserver;
    std::chrono::steady_clock::time_point mLastTime;
};
} // namespace lwgpu
