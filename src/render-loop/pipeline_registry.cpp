#include "errors.hpp"
#include "gpu_context.hpp"
#include "pipeline_registry.hpp"

#include <common/logging.hpp>

#include <fmt/core.h>

#include <set>
#include <stdexcept>
#include <utility>

namespace lwgpu
{
namespace
{
void validateShaderSources(const ShaderSources& shaders)
{
    if (shaders.wgsl.empty())
    {
        throw CompilationError(fmt::format("Shader \"{}\" has no source.", shaders.label));
    }
    if (shaders.vertexEntryPoint.empty() || shaders.fragmentEntryPoint.empty())
    {
        throw CompilationError(
            fmt::format("Shader \"{}\" is missing an entry point name.", shaders.label));
    }
}

void validateVertexLayout(const VertexLayout& layout, const std::string& label)
{
    if (layout.empty())
    {
        return;
    }

    if (layout.arrayStride == 0)
    {
        throw CompilationError(
            fmt::format("Pipeline \"{}\": vertex layout has attributes but no stride.", label));
    }

    std::set<std::uint32_t> shaderLocations;
    for (const VertexAttribute& attribute : layout.attributes)
    {
        const std::uint64_t end = attribute.offset + vertexFormatByteSize(attribute.format);
        if (end > layout.arrayStride)
        {
            throw CompilationError(fmt::format(
                "Pipeline \"{}\": attribute at location {} ends at byte {}, past the stride of "
                "{} bytes.",
                label,
                attribute.shaderLocation,
                end,
                layout.arrayStride));
        }

        if (!shaderLocations.insert(attribute.shaderLocation).second)
        {
            throw CompilationError(fmt::format(
                "Pipeline \"{}\": shader location {} is used by more than one attribute.",
                label,
                attribute.shaderLocation));
        }
    }
}
} // namespace

Pipeline::Pipeline(
    std::string                              label,
    ShaderSources                            shaders,
    VertexLayout                             vertexLayout,
    PrimitiveState                           primitive,
    TextureFormat                            colorFormat,
    std::shared_ptr<const GpuRenderPipeline> gpuPipeline)
    : mLabel(std::move(label)),
      mShaders(std::move(shaders)),
      mVertexLayout(std::move(vertexLayout)),
      mPrimitive(primitive),
      mColorFormat(colorFormat),
      mGpuPipeline(std::move(gpuPipeline))
{
    if (!mGpuPipeline)
    {
        throw std::invalid_argument("A Pipeline requires a GPU pipeline object.");
    }
}

Pipeline buildPipeline(
    GpuContext&           context,
    const ShaderSources&  shaders,
    const VertexLayout&   vertexLayout,
    const PrimitiveState& primitive)
{
    validateShaderSources(shaders);
    validateVertexLayout(vertexLayout, shaders.label);

    const TextureFormat colorFormat = context.configuration().format;

    const RenderPipelineDescriptor pipelineDesc{
        .shaders = shaders,
        .vertexLayout = vertexLayout,
        .primitive = primitive,
        .colorFormat = colorFormat,
    };
    std::shared_ptr<const GpuRenderPipeline> gpuPipeline =
        context.backend().createRenderPipeline(pipelineDesc);

    if (!gpuPipeline)
    {
        throw CompilationError(
            fmt::format("Failed to create render pipeline \"{}\".", shaders.label));
    }

    return Pipeline(
        shaders.label, shaders, vertexLayout, primitive, colorFormat, std::move(gpuPipeline));
}

Pipeline PipelineRegistry::build(
    GpuContext&           context,
    const ShaderSources&  shaders,
    const VertexLayout&   vertexLayout,
    const PrimitiveState& primitive)
{
    return buildPipeline(context, shaders, vertexLayout, primitive);
}

void PipelineRegistry::insert(std::string name, Pipeline pipeline)
{
    // An empty active name means that no pipeline is active.
    if (name.empty())
    {
        throw std::invalid_argument("Pipeline names must not be empty.");
    }
    if (mPipelines.contains(name))
    {
        throw std::invalid_argument(fmt::format("Pipeline \"{}\" already exists.", name));
    }

    if (mActiveName.empty())
    {
        mActiveName = name;
    }
    mPipelines.emplace(std::move(name), std::make_shared<const Pipeline>(std::move(pipeline)));
}

void PipelineRegistry::replace(const std::string_view name, Pipeline pipeline)
{
    const auto it = mPipelines.find(name);
    if (it == mPipelines.end())
    {
        throw std::out_of_range(fmt::format("No pipeline named \"{}\".", name));
    }
    it->second = std::make_shared<const Pipeline>(std::move(pipeline));
}

bool PipelineRegistry::reload(
    GpuContext&            context,
    const std::string_view name,
    const ShaderSources&   shaders)
{
    const std::shared_ptr<const Pipeline> current = find(name);
    if (!current)
    {
        throw std::out_of_range(fmt::format("No pipeline named \"{}\".", name));
    }

    try
    {
        replace(name, build(context, shaders, current->vertexLayout(), current->primitive()));
    }
    catch (const CompilationError& e)
    {
        logError("Keeping the previous \"{}\" pipeline: {}", name, e.what());
        return false;
    }

    logInfo("Reloaded pipeline \"{}\".", name);
    return true;
}

bool PipelineRegistry::contains(const std::string_view name) const
{
    return mPipelines.find(name) != mPipelines.end();
}

std::shared_ptr<const Pipeline> PipelineRegistry::find(const std::string_view name) const
{
    const auto it = mPipelines.find(name);
    return it != mPipelines.end() ? it->second : nullptr;
}

const Pipeline& PipelineRegistry::get(const std::string_view name) const
{
    const auto it = mPipelines.find(name);
    if (it == mPipelines.end())
    {
        throw std::out_of_range(fmt::format("No pipeline named \"{}\".", name));
    }
    return *it->second;
}

void PipelineRegistry::setActive(const std::string_view name)
{
    if (!contains(name))
    {
        throw std::out_of_range(fmt::format("No pipeline named \"{}\".", name));
    }
    mActiveName = name;
}

std::shared_ptr<const Pipeline> PipelineRegistry::active() const { return find(mActiveName); }
} // namespace lwgpu
