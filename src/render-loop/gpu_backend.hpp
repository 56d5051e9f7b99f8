#pragma once

#include "gpu_types.hpp"

#include <cstddef>
#include <memory>
#include <span>

namespace lwgpu
{
// Backend-owned GPU objects. Each is released when its owner destroys it.

class GpuRenderPipeline
{
public:
    virtual ~GpuRenderPipeline() = default;
};

class GpuVertexBuffer
{
public:
    virtual ~GpuVertexBuffer() = default;

    virtual std::size_t byteSize() const noexcept = 0;
};

class GpuSurfaceTexture
{
public:
    virtual ~GpuSurfaceTexture() = default;
};

class GpuCommandBuffer
{
public:
    virtual ~GpuCommandBuffer() = default;
};

enum class SurfaceStatus
{
    Success,
    Timeout,
    Outdated,
    Lost,
    OutOfMemory,
    DeviceLost,
};

struct SurfaceAcquisition
{
    SurfaceStatus                      status = SurfaceStatus::Success;
    std::unique_ptr<GpuSurfaceTexture> texture;
    // The texture can still be presented, but the surface should be reconfigured.
    bool suboptimal = false;
};

// The boundary between the frame loop and a GPU API. A backend owns the instance, surface,
// adapter, device and queue.
class GpuBackend
{
public:
    virtual ~GpuBackend() = default;

    // Surface

    virtual SurfaceCapabilities surfaceCapabilities() const = 0;
    virtual void                configureSurface(const SurfaceConfiguration&) = 0;
    virtual SurfaceAcquisition  acquireSurfaceTexture() = 0;
    virtual void                presentSurfaceTexture(GpuSurfaceTexture&) = 0;

    // Resources

    // Throws CompilationError if the shader module or pipeline fails to build.
    virtual std::unique_ptr<GpuRenderPipeline> createRenderPipeline(
        const RenderPipelineDescriptor&) = 0;
    virtual std::unique_ptr<GpuVertexBuffer> createVertexBuffer(
        const char*                label,
        std::span<const std::byte> data) = 0;

    // Commands

    virtual std::unique_ptr<GpuCommandBuffer> encodeRenderPass(
        GpuSurfaceTexture&,
        const RenderPassDescriptor&) = 0;
    virtual void submit(std::unique_ptr<GpuCommandBuffer>) = 0;
    // Blocks until all submitted work has completed.
    virtual void waitForSubmittedWork() = 0;
};
} // namespace lwgpu
