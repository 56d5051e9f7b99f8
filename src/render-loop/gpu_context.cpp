#include "errors.hpp"
#include "gpu_context.hpp"

#include <common/assert.hpp>
#include <common/logging.hpp>

#include <fmt/core.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace lwgpu
{
namespace
{
SurfaceErrorKind surfaceStatusToErrorKind(const SurfaceStatus status)
{
    switch (status)
    {
    case SurfaceStatus::Timeout:
        return SurfaceErrorKind::Timeout;
    case SurfaceStatus::Outdated:
        return SurfaceErrorKind::Outdated;
    case SurfaceStatus::Lost:
        return SurfaceErrorKind::Lost;
    case SurfaceStatus::OutOfMemory:
        return SurfaceErrorKind::OutOfMemory;
    case SurfaceStatus::DeviceLost:
        return SurfaceErrorKind::DeviceLost;
    case SurfaceStatus::Success:
        break;
    }
    LWGPU_ASSERT(!"SurfaceStatus::Success is not an error");
    return SurfaceErrorKind::Lost;
}

template<typename T>
bool contains(const std::vector<T>& values, const T value)
{
    return std::find(values.begin(), values.end(), value) != values.end();
}
} // namespace

Frame::Frame(
    GpuContext&                        context,
    std::unique_ptr<GpuSurfaceTexture> texture,
    const std::uint64_t                index,
    const Extent2u                     size,
    const bool                         suboptimal)
    : mContext(&context),
      mTexture(std::move(texture)),
      mIndex(index),
      mSize(size),
      mSuboptimal(suboptimal),
      mSubmitted(false)
{
}

Frame::Frame(Frame&& other) noexcept
    : mContext(other.mContext),
      mTexture(std::move(other.mTexture)),
      mIndex(other.mIndex),
      mSize(other.mSize),
      mSuboptimal(other.mSuboptimal),
      mSubmitted(other.mSubmitted)
{
    other.mContext = nullptr;
}

Frame& Frame::operator=(Frame&& other) noexcept
{
    if (this != &other)
    {
        if (mContext && mTexture)
        {
            mContext->releaseFrame(*this);
        }

        mContext = other.mContext;
        mTexture = std::move(other.mTexture);
        mIndex = other.mIndex;
        mSize = other.mSize;
        mSuboptimal = other.mSuboptimal;
        mSubmitted = other.mSubmitted;

        other.mContext = nullptr;
    }
    return *this;
}

Frame::~Frame()
{
    if (mContext && mTexture)
    {
        mContext->releaseFrame(*this);
    }
}

GpuContext::GpuContext(
    std::unique_ptr<GpuBackend> backend,
    const FramebufferSize       framebufferSize,
    const SurfaceSettings&      settings)
    : mBackend(std::move(backend)),
      mConfig()
{
    LWGPU_ASSERT(mBackend != nullptr);

    if (isEmpty(framebufferSize))
    {
        throw InitializationError(fmt::format(
            "Cannot configure a surface for an empty framebuffer ({}x{}).",
            framebufferSize.x,
            framebufferSize.y));
    }

    const SurfaceCapabilities caps = mBackend->surfaceCapabilities();
    if (caps.formats.empty())
    {
        throw InitializationError("The surface is not compatible with the adapter.");
    }

    mConfig.size = Extent2u(framebufferSize);
    mConfig.format = contains(caps.formats, settings.preferredFormat) ? settings.preferredFormat
                                                                       : caps.formats.front();
    if (contains(caps.presentModes, settings.presentMode))
    {
        mConfig.presentMode = settings.presentMode;
    }
    else
    {
        logWarn(
            "Present mode {} is not supported by the surface, falling back to {}.",
            presentModeToStr(settings.presentMode),
            presentModeToStr(PresentMode::Fifo));
        mConfig.presentMode = PresentMode::Fifo;
    }

    mBackend->configureSurface(mConfig);

    logInfo(
        "Surface configured: {}x{}, format {}, present mode {}.",
        mConfig.size.x,
        mConfig.size.y,
        textureFormatToStr(mConfig.format),
        presentModeToStr(mConfig.presentMode));
}

GpuContext::~GpuContext() { LWGPU_ASSERT(!mFrameOutstanding); }

bool GpuContext::reconfigure(const FramebufferSize newSize)
{
    if (isEmpty(newSize))
    {
        logDebug("Skipping surface reconfiguration for empty size {}x{}.", newSize.x, newSize.y);
        return false;
    }

    mConfig.size = Extent2u(newSize);
    mBackend->configureSurface(mConfig);
    logDebug("Surface reconfigured: {}x{}.", mConfig.size.x, mConfig.size.y);

    return true;
}

Frame GpuContext::acquireFrame()
{
    if (mFrameOutstanding)
    {
        throw std::logic_error(
            "The previous frame must be presented or discarded before acquiring a new one.");
    }

    SurfaceAcquisition acquisition = mBackend->acquireSurfaceTexture();
    if (acquisition.status != SurfaceStatus::Success)
    {
        throw SurfaceError(surfaceStatusToErrorKind(acquisition.status));
    }
    if (!acquisition.texture)
    {
        throw SurfaceError(SurfaceErrorKind::Lost, "The surface returned no texture.");
    }

    mFrameOutstanding = true;
    return Frame(
        *this,
        std::move(acquisition.texture),
        mNextFrameIndex++,
        mConfig.size,
        acquisition.suboptimal);
}

std::unique_ptr<GpuCommandBuffer> GpuContext::encode(
    const Frame&                frame,
    const RenderPassDescriptor& desc)
{
    checkOwnership(frame, "encode");
    if (frame.mSubmitted)
    {
        throw std::logic_error("Cannot encode into a frame whose commands were submitted.");
    }
    LWGPU_ASSERT(desc.pipeline != nullptr);

    return mBackend->encodeRenderPass(*frame.mTexture, desc);
}

void GpuContext::submit(Frame& frame, std::unique_ptr<GpuCommandBuffer> commands)
{
    checkOwnership(frame, "submit");
    if (frame.mSubmitted)
    {
        throw std::logic_error("A frame's commands can only be submitted once.");
    }
    LWGPU_ASSERT(commands != nullptr);

    mBackend->submit(std::move(commands));
    frame.mSubmitted = true;
}

void GpuContext::present(Frame&& frame)
{
    checkOwnership(frame, "present");
    if (!frame.mSubmitted)
    {
        throw std::logic_error("A frame cannot be presented before its commands are submitted.");
    }
    LWGPU_ASSERT(frame.mIndex > mLastPresentedIndex);

    mBackend->presentSurfaceTexture(*frame.mTexture);
    mLastPresentedIndex = frame.mIndex;
    mFramesPresented += 1;

    releaseFrame(frame);
}

void GpuContext::discard(Frame&& frame)
{
    checkOwnership(frame, "discard");
    releaseFrame(frame);
}

void GpuContext::waitForSubmittedWork() { mBackend->waitForSubmittedWork(); }

std::unique_ptr<GpuVertexBuffer> GpuContext::createVertexBuffer(
    const char* const                label,
    const std::span<const std::byte> data)
{
    return mBackend->createVertexBuffer(label, data);
}

void GpuContext::checkOwnership(const Frame& frame, const char* const operation) const
{
    if (frame.mContext != this || !frame.mTexture)
    {
        throw std::logic_error(
            fmt::format("Cannot {} a frame which is not outstanding on this context.", operation));
    }
}

void GpuContext::releaseFrame(Frame& frame) noexcept
{
    LWGPU_ASSERT(frame.mContext == this);
    frame.mTexture.reset();
    frame.mContext = nullptr;
    mFrameOutstanding = false;
}
} // namespace lwgpu
