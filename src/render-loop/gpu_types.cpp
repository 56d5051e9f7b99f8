#include "gpu_types.hpp"

#include <common/assert.hpp>

namespace lwgpu
{
const char* textureFormatToStr(const TextureFormat format) noexcept
{
    switch (format)
    {
    case TextureFormat::Undefined:
        return "Undefined";
    case TextureFormat::BGRA8Unorm:
        return "BGRA8Unorm";
    case TextureFormat::BGRA8UnormSrgb:
        return "BGRA8UnormSrgb";
    case TextureFormat::RGBA8Unorm:
        return "RGBA8Unorm";
    case TextureFormat::RGBA8UnormSrgb:
        return "RGBA8UnormSrgb";
    case TextureFormat::RGB10A2Unorm:
        return "RGB10A2Unorm";
    case TextureFormat::RGBA16Float:
        return "RGBA16Float";
    }
    LWGPU_ASSERT(!"Unknown TextureFormat");
    return "Unknown";
}

const char* presentModeToStr(const PresentMode mode) noexcept
{
    switch (mode)
    {
    case PresentMode::Fifo:
        return "Fifo";
    case PresentMode::FifoRelaxed:
        return "FifoRelaxed";
    case PresentMode::Immediate:
        return "Immediate";
    case PresentMode::Mailbox:
        return "Mailbox";
    }
    LWGPU_ASSERT(!"Unknown PresentMode");
    return "Unknown";
}

std::uint32_t vertexFormatByteSize(const VertexFormat format) noexcept
{
    switch (format)
    {
    case VertexFormat::Float32:
        return 4;
    case VertexFormat::Float32x2:
        return 8;
    case VertexFormat::Float32x3:
        return 12;
    case VertexFormat::Float32x4:
        return 16;
    case VertexFormat::Uint32:
        return 4;
    }
    LWGPU_ASSERT(!"Unknown VertexFormat");
    return 0;
}
} // namespace lwgpu
