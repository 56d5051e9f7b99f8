#pragma once

#include <common/platform.hpp>
#include <render-loop/gpu_backend.hpp>

#include <webgpu/webgpu.h>

#include <cstddef>
#include <memory>
#include <span>

struct GLFWwindow;

namespace lwgpu
{
// GpuBackend implemented on webgpu.h. Owns the instance, the window's surface, the adapter,
// the device and its queue.
class WgpuBackend final : public GpuBackend
{
public:
    // Throws InitializationError if any of the GPU objects cannot be created.
    explicit WgpuBackend(GLFWwindow* window);
    ~WgpuBackend() override;

    WgpuBackend(const WgpuBackend&) = delete;
    WgpuBackend& operator=(const WgpuBackend&) = delete;

    WgpuBackend(WgpuBackend&&) = delete;
    WgpuBackend& operator=(WgpuBackend&&) = delete;

    // Surface

    SurfaceCapabilities surfaceCapabilities() const override;
    void                configureSurface(const SurfaceConfiguration&) override;
    SurfaceAcquisition  acquireSurfaceTexture() override;
    void                presentSurfaceTexture(GpuSurfaceTexture&) override;

    // Resources

    std::unique_ptr<GpuRenderPipeline> createRenderPipeline(
        const RenderPipelineDescriptor&) override;
    std::unique_ptr<GpuVertexBuffer> createVertexBuffer(
        const char*                label,
        std::span<const std::byte> data) override;

    // Commands

    std::unique_ptr<GpuCommandBuffer> encodeRenderPass(
        GpuSurfaceTexture&,
        const RenderPassDescriptor&) override;
    void submit(std::unique_ptr<GpuCommandBuffer>) override;
    void waitForSubmittedWork() override;

    // Raw access

    inline WGPUDevice device() const noexcept { return mDevice; }

private:
    void releaseAll() noexcept;
#if LWGPU_PLATFORM != LWGPU_EMSCRIPTEN
    // Ticks the device until a callback sets `done`. The browser cannot be blocked on, so
    // no callback registered with stack state may outlive its caller there.
    void waitUntil(const bool& done);
#endif

    WGPUInstance mInstance;
    WGPUSurface  mSurface;
    WGPUAdapter  mAdapter;
    WGPUDevice   mDevice;
    WGPUQueue    mQueue;
    bool         mSurfaceConfigured;
};
} // namespace lwgpu
