#pragma once

#include <common/extent.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace lwgpu
{
enum class TextureFormat : std::uint32_t
{
    Undefined = 0,
    BGRA8Unorm,
    BGRA8UnormSrgb,
    RGBA8Unorm,
    RGBA8UnormSrgb,
    RGB10A2Unorm,
    RGBA16Float,
};

// Fifo is the only mode every surface is required to support.
enum class PresentMode : std::uint32_t
{
    Fifo = 0,
    FifoRelaxed,
    Immediate,
    Mailbox,
};

const char* textureFormatToStr(TextureFormat format) noexcept;
const char* presentModeToStr(PresentMode mode) noexcept;

struct SurfaceConfiguration
{
    Extent2u      size;
    TextureFormat format = TextureFormat::Undefined;
    PresentMode   presentMode = PresentMode::Fifo;

    bool operator==(const SurfaceConfiguration&) const noexcept = default;
};

struct SurfaceCapabilities
{
    std::vector<TextureFormat> formats;
    std::vector<PresentMode>   presentModes;
};

enum class VertexFormat : std::uint32_t
{
    Float32 = 0,
    Float32x2,
    Float32x3,
    Float32x4,
    Uint32,
};

std::uint32_t vertexFormatByteSize(VertexFormat format) noexcept;

enum class VertexStepMode : std::uint32_t
{
    Vertex = 0,
    Instance,
};

struct VertexAttribute
{
    VertexFormat  format = VertexFormat::Float32x3;
    std::uint64_t offset = 0;
    std::uint32_t shaderLocation = 0;

    bool operator==(const VertexAttribute&) const noexcept = default;
};

// An empty layout (no attributes, zero stride) means the vertex shader generates its own
// vertices from the vertex index and no vertex buffer is bound.
struct VertexLayout
{
    std::uint64_t                arrayStride = 0;
    VertexStepMode               stepMode = VertexStepMode::Vertex;
    std::vector<VertexAttribute> attributes;

    bool empty() const noexcept { return attributes.empty(); }

    bool operator==(const VertexLayout&) const noexcept = default;
};

enum class PrimitiveTopology : std::uint32_t
{
    PointList = 0,
    LineList,
    LineStrip,
    TriangleList,
    TriangleStrip,
};

enum class FrontFace : std::uint32_t
{
    CCW = 0,
    CW,
};

enum class CullMode : std::uint32_t
{
    None = 0,
    Front,
    Back,
};

struct PrimitiveState
{
    PrimitiveTopology topology = PrimitiveTopology::TriangleList;
    FrontFace         frontFace = FrontFace::CCW;
    CullMode          cullMode = CullMode::Back;

    bool operator==(const PrimitiveState&) const noexcept = default;
};

struct ShaderSources
{
    std::string label;
    std::string wgsl;
    std::string vertexEntryPoint = "vs_main";
    std::string fragmentEntryPoint = "fs_main";

    bool operator==(const ShaderSources&) const noexcept = default;
};

// Everything the backend needs to compile one render pipeline.
struct RenderPipelineDescriptor
{
    const ShaderSources&  shaders;
    const VertexLayout&   vertexLayout;
    const PrimitiveState& primitive;
    TextureFormat         colorFormat;
};

struct Color
{
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 1.0;

    bool operator==(const Color&) const noexcept = default;
};

class GpuRenderPipeline;
class GpuVertexBuffer;

struct RenderPassDescriptor
{
    const char*              label = "Render pass";
    Color                    clearColor;
    const GpuRenderPipeline* pipeline = nullptr;
    // Optional; null when the pipeline's vertex layout is empty.
    const GpuVertexBuffer* vertexBuffer = nullptr;
    std::uint32_t          vertexCount = 0;
};
} // namespace lwgpu
