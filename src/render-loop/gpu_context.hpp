#pragma once

#include "gpu_backend.hpp"
#include "gpu_types.hpp"

#include <common/extent.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>

namespace lwgpu
{
class GpuContext;

// A presentable surface texture, valid for the duration of one frame. A Frame must be handed
// back to the context that acquired it through `GpuContext::present` or
// `GpuContext::discard`; a Frame which goes out of scope while still holding its texture is
// discarded.
class Frame
{
public:
    Frame(const Frame&) = delete;
    Frame& operator=(const Frame&) = delete;

    Frame(Frame&&) noexcept;
    Frame& operator=(Frame&&) noexcept;

    ~Frame();

    // Accessors

    inline std::uint64_t   index() const noexcept { return mIndex; }
    inline const Extent2u& size() const noexcept { return mSize; }
    inline bool            suboptimal() const noexcept { return mSuboptimal; }
    inline bool            submitted() const noexcept { return mSubmitted; }
    inline bool            valid() const noexcept { return mTexture != nullptr; }

private:
    friend class GpuContext;

    Frame(
        GpuContext&                        context,
        std::unique_ptr<GpuSurfaceTexture> texture,
        std::uint64_t                      index,
        Extent2u                           size,
        bool                               suboptimal);

    GpuContext*                        mContext = nullptr;
    std::unique_ptr<GpuSurfaceTexture> mTexture;
    std::uint64_t                      mIndex = 0;
    Extent2u                           mSize;
    bool                               mSuboptimal = false;
    bool                               mSubmitted = false;
};

struct SurfaceSettings
{
    // Used if the surface supports it, otherwise the surface's first supported format.
    TextureFormat preferredFormat = TextureFormat::BGRA8Unorm;
    // Used if the surface supports it, otherwise Fifo.
    PresentMode presentMode = PresentMode::Fifo;
};

// Owns the GPU backend and the surface configuration. The configuration's size always
// tracks the window's last non-empty framebuffer size.
class GpuContext
{
public:
    // Throws InitializationError if the framebuffer is empty or the surface reports no
    // supported formats.
    GpuContext(
        std::unique_ptr<GpuBackend> backend,
        FramebufferSize             framebufferSize,
        const SurfaceSettings&      settings = {});
    ~GpuContext();

    GpuContext(const GpuContext&) = delete;
    GpuContext& operator=(const GpuContext&) = delete;

    // Frames keep a pointer to the context which acquired them.
    GpuContext(GpuContext&&) = delete;
    GpuContext& operator=(GpuContext&&) = delete;

    // Surface

    // Reconfigures the surface to the new framebuffer size. Returns false without touching
    // the surface if either dimension is zero.
    bool reconfigure(FramebufferSize newSize);

    // Throws SurfaceError if no texture could be acquired, and std::logic_error if a
    // previously acquired frame has not been presented or discarded.
    Frame acquireFrame();

    // Commands

    std::unique_ptr<GpuCommandBuffer> encode(const Frame&, const RenderPassDescriptor&);
    void                              submit(Frame&, std::unique_ptr<GpuCommandBuffer>);
    // The frame's commands must have been submitted.
    void present(Frame&&);
    void discard(Frame&&);
    void waitForSubmittedWork();

    // Resources

    std::unique_ptr<GpuVertexBuffer> createVertexBuffer(
        const char*                label,
        std::span<const std::byte> data);

    // Accessors

    inline const SurfaceConfiguration& configuration() const noexcept { return mConfig; }
    inline bool          hasOutstandingFrame() const noexcept { return mFrameOutstanding; }
    inline std::uint64_t framesPresented() const noexcept { return mFramesPresented; }
    inline GpuBackend&   backend() noexcept { return *mBackend; }

private:
    friend class Frame;

    void checkOwnership(const Frame&, const char* operation) const;
    void releaseFrame(Frame&) noexcept;

    std::unique_ptr<GpuBackend> mBackend;
    SurfaceConfiguration        mConfig;
    std::uint64_t               mNextFrameIndex = 1;
    std::uint64_t               mLastPresentedIndex = 0;
    std::uint64_t               mFramesPresented = 0;
    bool                        mFrameOutstanding = false;
};
} // namespace lwgpu
