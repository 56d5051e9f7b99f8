#include "gpu_buffer.hpp"

#include <common/assert.hpp>

#include <fmt/core.h>

#include <cstdint>
#include <cstring>
#include <stdexcept>

namespace lwgpu
{
namespace
{
// Mapped ranges must be a multiple of 4 bytes in size.
constexpr std::size_t COPY_BUFFER_ALIGNMENT = 4;

constexpr std::size_t alignedSize(const std::size_t byteSize) noexcept
{
    return (byteSize + COPY_BUFFER_ALIGNMENT - 1) & ~(COPY_BUFFER_ALIGNMENT - 1);
}

void bufferSafeRelease(const WGPUBuffer buffer)
{
    if (buffer)
    {
        wgpuBufferDestroy(buffer);
        wgpuBufferRelease(buffer);
    }
}
} // namespace

WgpuBuffer::WgpuBuffer(
    const WGPUDevice                 device,
    const char* const                label,
    const WGPUBufferUsageFlags       usage,
    const std::span<const std::byte> data)
    : mBuffer(nullptr),
      mByteSize(data.size())
{
    LWGPU_ASSERT(device != nullptr);

    if (data.empty())
    {
        throw std::invalid_argument(fmt::format("Buffer \"{}\" cannot be empty.", label));
    }

    const std::size_t bufferSize = alignedSize(mByteSize);

    const WGPUBufferDescriptor bufferDesc{
        .nextInChain = nullptr,
        .label = label,
        .usage = usage,
        .size = static_cast<std::uint64_t>(bufferSize),
        .mappedAtCreation = true,
    };
    mBuffer = wgpuDeviceCreateBuffer(device, &bufferDesc);

    if (!mBuffer)
    {
        throw std::runtime_error(fmt::format("Failed to create buffer \"{}\".", label));
    }

    // It's legal to set mappedAtCreation = true and use the mapped range even if the usage doesn't
    // include MAP_READ or MAP_WRITE.
    // https://www.w3.org/TR/webgpu/#dom-gpubufferdescriptor-mappedatcreation

    void* const mappedData = wgpuBufferGetMappedRange(mBuffer, 0, bufferSize);
    if (!mappedData)
    {
        bufferSafeRelease(mBuffer);
        mBuffer = nullptr;
        throw std::runtime_error(
            fmt::format("Failed to map buffer \"{}\", bytesize: {}.", label, bufferSize));
    }
    std::memset(mappedData, 0, bufferSize);
    std::memcpy(mappedData, data.data(), mByteSize);
    wgpuBufferUnmap(mBuffer);
}

WgpuBuffer::~WgpuBuffer()
{
    bufferSafeRelease(mBuffer);
    mBuffer = nullptr;
}
} // namespace lwgpu
