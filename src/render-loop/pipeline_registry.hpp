#pragma once

#include "gpu_backend.hpp"
#include "gpu_types.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace lwgpu
{
class GpuContext;

// Immutable compiled render state. Copies share the backend pipeline object.
class Pipeline
{
public:
    Pipeline(
        std::string                              label,
        ShaderSources                            shaders,
        VertexLayout                             vertexLayout,
        PrimitiveState                           primitive,
        TextureFormat                            colorFormat,
        std::shared_ptr<const GpuRenderPipeline> gpuPipeline);

    inline const std::string&       label() const noexcept { return mLabel; }
    inline const ShaderSources&     shaders() const noexcept { return mShaders; }
    inline const VertexLayout&      vertexLayout() const noexcept { return mVertexLayout; }
    inline const PrimitiveState&    primitive() const noexcept { return mPrimitive; }
    inline TextureFormat            colorFormat() const noexcept { return mColorFormat; }
    inline const GpuRenderPipeline& gpuPipeline() const noexcept { return *mGpuPipeline; }

private:
    std::string                              mLabel;
    ShaderSources                            mShaders;
    VertexLayout                             mVertexLayout;
    PrimitiveState                           mPrimitive;
    TextureFormat                            mColorFormat;
    std::shared_ptr<const GpuRenderPipeline> mGpuPipeline;
};

// Builds a pipeline targeting the context's surface format. Throws CompilationError if the
// inputs are invalid or the backend fails to compile them.
Pipeline buildPipeline(
    GpuContext&           context,
    const ShaderSources&  shaders,
    const VertexLayout&   vertexLayout,
    const PrimitiveState& primitive = {});

// Owns the named pipelines. Entries are replaced whole, so a pipeline obtained from the
// registry is never modified underneath its holder.
class PipelineRegistry
{
public:
    PipelineRegistry() = default;

    PipelineRegistry(const PipelineRegistry&) = delete;
    PipelineRegistry& operator=(const PipelineRegistry&) = delete;

    PipelineRegistry(PipelineRegistry&&) = default;
    PipelineRegistry& operator=(PipelineRegistry&&) = default;

    // Same as `buildPipeline`.
    static Pipeline build(
        GpuContext&           context,
        const ShaderSources&  shaders,
        const VertexLayout&   vertexLayout,
        const PrimitiveState& primitive = {});

    // Throws std::invalid_argument if the name is empty or already taken. The first pipeline
    // inserted becomes the active one.
    void insert(std::string name, Pipeline pipeline);
    // Throws std::out_of_range if there is no pipeline with the name.
    void replace(std::string_view name, Pipeline pipeline);

    // Rebuilds the named pipeline from new shader sources, keeping its vertex layout and
    // primitive state. If the build fails the error is logged, the old pipeline stays in
    // place, and false is returned.
    bool reload(GpuContext& context, std::string_view name, const ShaderSources& shaders);

    // Accessors

    bool                            contains(std::string_view name) const;
    std::shared_ptr<const Pipeline> find(std::string_view name) const;
    // Throws std::out_of_range if there is no pipeline with the name.
    const Pipeline& get(std::string_view name) const;

    // Throws std::out_of_range if there is no pipeline with the name.
    void                            setActive(std::string_view name);
    std::shared_ptr<const Pipeline> active() const;
    inline const std::string&       activeName() const noexcept { return mActiveName; }

    inline std::size_t size() const noexcept { return mPipelines.size(); }
    inline bool        empty() const noexcept { return mPipelines.empty(); }

private:
    std::map<std::string, std::shared_ptr<const Pipeline>, std::less<>> mPipelines;
    std::string                                                         mActiveName;
};
} // namespace lwgpu
