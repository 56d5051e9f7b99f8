#pragma once

#include <render-loop/gpu_backend.hpp>

#include <webgpu/webgpu.h>

#include <cstddef>
#include <span>

namespace lwgpu
{
// A WGPUBuffer with unique ownership semantics, filled with data at creation.
class WgpuBuffer final : public GpuVertexBuffer
{
public:
    WgpuBuffer(
        WGPUDevice                 device,
        const char*                label,
        WGPUBufferUsageFlags       usage,
        std::span<const std::byte> data);
    ~WgpuBuffer() override;

    WgpuBuffer(const WgpuBuffer&) = delete;
    WgpuBuffer& operator=(const WgpuBuffer&) = delete;

    WgpuBuffer(WgpuBuffer&&) = delete;
    WgpuBuffer& operator=(WgpuBuffer&&) = delete;

    // Raw access

    inline WGPUBuffer ptr() const noexcept { return mBuffer; }
    // The size of the data the buffer was created with. The buffer itself may be padded.
    std::size_t byteSize() const noexcept override { return mByteSize; }

private:
    WGPUBuffer  mBuffer = nullptr;
    std::size_t mByteSize = 0;
};
} // namespace lwgpu
