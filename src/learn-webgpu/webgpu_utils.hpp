#pragma once

#include <render-loop/gpu_types.hpp>

#include <common/assert.hpp>

#include <webgpu/webgpu.h>

namespace lwgpu
{
inline void renderPipelineSafeRelease(const WGPURenderPipeline pipeline) noexcept
{
    if (pipeline)
    {
        wgpuRenderPipelineRelease(pipeline);
    }
}

inline void pipelineLayoutSafeRelease(const WGPUPipelineLayout pipelineLayout) noexcept
{
    if (pipelineLayout)
    {
        wgpuPipelineLayoutRelease(pipelineLayout);
    }
}

inline void shaderModuleSafeRelease(const WGPUShaderModule shaderModule) noexcept
{
    if (shaderModule)
    {
        wgpuShaderModuleRelease(shaderModule);
    }
}

inline void commandBufferSafeRelease(const WGPUCommandBuffer commandBuffer) noexcept
{
    if (commandBuffer)
    {
        wgpuCommandBufferRelease(commandBuffer);
    }
}

inline void textureViewSafeRelease(const WGPUTextureView textureView) noexcept
{
    if (textureView)
    {
        wgpuTextureViewRelease(textureView);
    }
}

// Surface textures are owned by the surface and must not be destroyed, only released.
inline void surfaceTextureSafeRelease(const WGPUTexture texture) noexcept
{
    if (texture)
    {
        wgpuTextureRelease(texture);
    }
}

inline WGPUTextureFormat toWGPUTextureFormat(const TextureFormat format) noexcept
{
    switch (format)
    {
    case TextureFormat::Undefined:
        return WGPUTextureFormat_Undefined;
    case TextureFormat::BGRA8Unorm:
        return WGPUTextureFormat_BGRA8Unorm;
    case TextureFormat::BGRA8UnormSrgb:
        return WGPUTextureFormat_BGRA8UnormSrgb;
    case TextureFormat::RGBA8Unorm:
        return WGPUTextureFormat_RGBA8Unorm;
    case TextureFormat::RGBA8UnormSrgb:
        return WGPUTextureFormat_RGBA8UnormSrgb;
    case TextureFormat::RGB10A2Unorm:
        return WGPUTextureFormat_RGB10A2Unorm;
    case TextureFormat::RGBA16Float:
        return WGPUTextureFormat_RGBA16Float;
    }
    LWGPU_ASSERT(!"Unknown TextureFormat");
    return WGPUTextureFormat_Undefined;
}

// Formats which cannot be rendered to as a surface, e.g. depth or compressed formats, map to
// Undefined.
inline TextureFormat fromWGPUTextureFormat(const WGPUTextureFormat format) noexcept
{
    switch (format)
    {
    case WGPUTextureFormat_BGRA8Unorm:
        return TextureFormat::BGRA8Unorm;
    case WGPUTextureFormat_BGRA8UnormSrgb:
        return TextureFormat::BGRA8UnormSrgb;
    case WGPUTextureFormat_RGBA8Unorm:
        return TextureFormat::RGBA8Unorm;
    case WGPUTextureFormat_RGBA8UnormSrgb:
        return TextureFormat::RGBA8UnormSrgb;
    case WGPUTextureFormat_RGB10A2Unorm:
        return TextureFormat::RGB10A2Unorm;
    case WGPUTextureFormat_RGBA16Float:
        return TextureFormat::RGBA16Float;
    default:
        return TextureFormat::Undefined;
    }
}

inline WGPUPresentMode toWGPUPresentMode(const PresentMode mode) noexcept
{
    switch (mode)
    {
    case PresentMode::Fifo:
        return WGPUPresentMode_Fifo;
    case PresentMode::FifoRelaxed:
        return WGPUPresentMode_FifoRelaxed;
    case PresentMode::Immediate:
        return WGPUPresentMode_Immediate;
    case PresentMode::Mailbox:
        return WGPUPresentMode_Mailbox;
    }
    LWGPU_ASSERT(!"Unknown PresentMode");
    return WGPUPresentMode_Fifo;
}

inline bool fromWGPUPresentMode(const WGPUPresentMode wgpuMode, PresentMode& mode) noexcept
{
    switch (wgpuMode)
    {
    case WGPUPresentMode_Fifo:
        mode = PresentMode::Fifo;
        return true;
    case WGPUPresentMode_FifoRelaxed:
        mode = PresentMode::FifoRelaxed;
        return true;
    case WGPUPresentMode_Immediate:
        mode = PresentMode::Immediate;
        return true;
    case WGPUPresentMode_Mailbox:
        mode = PresentMode::Mailbox;
        return true;
    default:
        return false;
    }
}

inline WGPUVertexFormat toWGPUVertexFormat(const VertexFormat format) noexcept
{
    switch (format)
    {
    case VertexFormat::Float32:
        return WGPUVertexFormat_Float32;
    case VertexFormat::Float32x2:
        return WGPUVertexFormat_Float32x2;
    case VertexFormat::Float32x3:
        return WGPUVertexFormat_Float32x3;
    case VertexFormat::Float32x4:
        return WGPUVertexFormat_Float32x4;
    case VertexFormat::Uint32:
        return WGPUVertexFormat_Uint32;
    }
    LWGPU_ASSERT(!"Unknown VertexFormat");
    return WGPUVertexFormat_Undefined;
}

inline WGPUVertexStepMode toWGPUVertexStepMode(const VertexStepMode stepMode) noexcept
{
    return stepMode == VertexStepMode::Instance ? WGPUVertexStepMode_Instance
                                                : WGPUVertexStepMode_Vertex;
}

inline WGPUPrimitiveTopology toWGPUPrimitiveTopology(const PrimitiveTopology topology) noexcept
{
    switch (topology)
    {
    case PrimitiveTopology::PointList:
        return WGPUPrimitiveTopology_PointList;
    case PrimitiveTopology::LineList:
        return WGPUPrimitiveTopology_LineList;
    case PrimitiveTopology::LineStrip:
        return WGPUPrimitiveTopology_LineStrip;
    case PrimitiveTopology::TriangleList:
        return WGPUPrimitiveTopology_TriangleList;
    case PrimitiveTopology::TriangleStrip:
        return WGPUPrimitiveTopology_TriangleStrip;
    }
    LWGPU_ASSERT(!"Unknown PrimitiveTopology");
    return WGPUPrimitiveTopology_TriangleList;
}

inline WGPUFrontFace toWGPUFrontFace(const FrontFace frontFace) noexcept
{
    return frontFace == FrontFace::CW ? WGPUFrontFace_CW : WGPUFrontFace_CCW;
}

inline WGPUCullMode toWGPUCullMode(const CullMode cullMode) noexcept
{
    switch (cullMode)
    {
    case CullMode::None:
        return WGPUCullMode_None;
    case CullMode::Front:
        return WGPUCullMode_Front;
    case CullMode::Back:
        return WGPUCullMode_Back;
    }
    LWGPU_ASSERT(!"Unknown CullMode");
    return WGPUCullMode_None;
}
} // namespace lwgpu
