#include "gpu_buffer.hpp"
#include "webgpu_utils.hpp"
#include "wgpu_backend.hpp"

#include <render-loop/errors.hpp>

#include <common/assert.hpp>
#include <common/logging.hpp>
#include <common/platform.hpp>

#include <fmt/core.h>
#include <GLFW/glfw3.h>
#include <glfw3webgpu.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace lwgpu
{
namespace
{
const char* WGPUDeviceLostReasonToStr(const WGPUDeviceLostReason reason)
{
    switch (reason)
    {
    case WGPUDeviceLostReason_Undefined:
        return "Undefined";
    case WGPUDeviceLostReason_Destroyed:
        return "Destroyed";
    default:
        return "Unknown";
    }
}

const char* WGPUErrorTypeToStr(const WGPUErrorType type)
{
    switch (type)
    {
    case WGPUErrorType_NoError:
        return "NoError";
    case WGPUErrorType_Validation:
        return "Validation";
    case WGPUErrorType_OutOfMemory:
        return "OutOfMemory";
    case WGPUErrorType_Internal:
        return "Internal";
    case WGPUErrorType_Unknown:
        return "Unknown";
    case WGPUErrorType_DeviceLost:
        return "DeviceLost";
    default:
        return "Unknown";
    }
}

const char* WGPUQueueWorkDoneStatusToStr(const WGPUQueueWorkDoneStatus status)
{
    switch (status)
    {
    case WGPUQueueWorkDoneStatus_Success:
        return "Success";
    case WGPUQueueWorkDoneStatus_Error:
        return "Error";
    case WGPUQueueWorkDoneStatus_Unknown:
        return "Unknown";
    case WGPUQueueWorkDoneStatus_DeviceLost:
        return "DeviceLost";
    default:
        return "Unknown";
    }
}

void onDeviceLost(WGPUDeviceLostReason reason, const char* const message, void* /*userdata*/)
{
    // Releasing the device at shutdown reports a Destroyed loss, which is expected.
    if (reason == WGPUDeviceLostReason_Destroyed)
    {
        logDebug("Device destroyed.");
        return;
    }
    logError(
        "Device lost, reason: {}. {}",
        WGPUDeviceLostReasonToStr(reason),
        message ? message : "");
}

void onDeviceError(WGPUErrorType type, const char* const message, void* /*userdata*/)
{
    logError("Uncaptured device error: {}. {}", WGPUErrorTypeToStr(type), message ? message : "");
}

class WgpuRenderPipeline final : public GpuRenderPipeline
{
public:
    explicit WgpuRenderPipeline(const WGPURenderPipeline pipeline) noexcept
        : mPipeline(pipeline)
    {
    }
    ~WgpuRenderPipeline() override { renderPipelineSafeRelease(mPipeline); }

    WgpuRenderPipeline(const WgpuRenderPipeline&) = delete;
    WgpuRenderPipeline& operator=(const WgpuRenderPipeline&) = delete;

    inline WGPURenderPipeline ptr() const noexcept { return mPipeline; }

private:
    WGPURenderPipeline mPipeline;
};

class WgpuSurfaceTexture final : public GpuSurfaceTexture
{
public:
    WgpuSurfaceTexture(const WGPUTexture texture, const WGPUTextureView view) noexcept
        : mTexture(texture),
          mView(view)
    {
    }
    ~WgpuSurfaceTexture() override
    {
        textureViewSafeRelease(mView);
        surfaceTextureSafeRelease(mTexture);
    }

    WgpuSurfaceTexture(const WgpuSurfaceTexture&) = delete;
    WgpuSurfaceTexture& operator=(const WgpuSurfaceTexture&) = delete;

    inline WGPUTextureView view() const noexcept { return mView; }

private:
    WGPUTexture     mTexture;
    WGPUTextureView mView;
};

class WgpuCommandBuffer final : public GpuCommandBuffer
{
public:
    explicit WgpuCommandBuffer(const WGPUCommandBuffer commandBuffer) noexcept
        : mCommandBuffer(commandBuffer)
    {
    }
    ~WgpuCommandBuffer() override { commandBufferSafeRelease(mCommandBuffer); }

    WgpuCommandBuffer(const WgpuCommandBuffer&) = delete;
    WgpuCommandBuffer& operator=(const WgpuCommandBuffer&) = delete;

    // Ownership passes to the caller.
    WGPUCommandBuffer release() noexcept { return std::exchange(mCommandBuffer, nullptr); }

private:
    WGPUCommandBuffer mCommandBuffer;
};

SurfaceStatus toSurfaceStatus(const WGPUSurfaceGetCurrentTextureStatus status)
{
    switch (status)
    {
    case WGPUSurfaceGetCurrentTextureStatus_Success:
        return SurfaceStatus::Success;
    case WGPUSurfaceGetCurrentTextureStatus_Timeout:
        return SurfaceStatus::Timeout;
    case WGPUSurfaceGetCurrentTextureStatus_Outdated:
        return SurfaceStatus::Outdated;
    case WGPUSurfaceGetCurrentTextureStatus_Lost:
        return SurfaceStatus::Lost;
    case WGPUSurfaceGetCurrentTextureStatus_OutOfMemory:
        return SurfaceStatus::OutOfMemory;
    case WGPUSurfaceGetCurrentTextureStatus_DeviceLost:
        return SurfaceStatus::DeviceLost;
    default:
        return SurfaceStatus::Lost;
    }
}

#if LWGPU_PLATFORM != LWGPU_EMSCRIPTEN
struct CompilationResult
{
    bool        done = false;
    bool        hasErrors = false;
    std::string messages;
};

struct ErrorScopeResult
{
    bool          done = false;
    WGPUErrorType type = WGPUErrorType_NoError;
    std::string   message;
};
#endif
} // namespace

WgpuBackend::WgpuBackend(GLFWwindow* const window)
    : mInstance(nullptr),
      mSurface(nullptr),
      mAdapter(nullptr),
      mDevice(nullptr),
      mQueue(nullptr),
      mSurfaceConfigured(false)
{
    LWGPU_ASSERT(window != nullptr);

    mInstance = []() -> WGPUInstance {
        const WGPUInstanceDescriptor instanceDesc{
            .nextInChain = nullptr,
        };
        return wgpuCreateInstance(&instanceDesc);
    }();

    if (!mInstance)
    {
        throw InitializationError("Failed to create WGPUInstance instance.");
    }

    // The surface is the part of the window we draw to. `glfwGetWGPUSurface` uses
    // platform-specific code to create it.
    mSurface = glfwGetWGPUSurface(mInstance, window);

    if (!mSurface)
    {
        releaseAll();
        throw InitializationError("Failed to create WGPUSurface instance.");
    }

    mAdapter = [this]() -> WGPUAdapter {
        const WGPURequestAdapterOptions adapterOptions{
            .nextInChain = nullptr,
            .compatibleSurface = mSurface,
            .powerPreference = WGPUPowerPreference_LowPower,
        };
        WGPUAdapter adapter = nullptr;

        auto onAdapterResponse = [](WGPURequestAdapterStatus status,
                                    WGPUAdapter              adapterResponse,
                                    char const*              message,
                                    void*                    userData) {
            WGPUAdapter* adapter = reinterpret_cast<WGPUAdapter*>(userData);
            if (status == WGPURequestAdapterStatus_Success)
            {
                *adapter = adapterResponse;
            }
            else
            {
                logError("Failed to request adapter: {}", message ? message : "");
            }
        };

        wgpuInstanceRequestAdapter(mInstance, &adapterOptions, onAdapterResponse, &adapter);

        return adapter;
    }();

    if (!mAdapter)
    {
        releaseAll();
        throw InitializationError("No adapter compatible with the window surface was found.");
    }

    mDevice = [this]() -> WGPUDevice {
        const WGPUDeviceDescriptor deviceDesc{
            .nextInChain = nullptr,
            .label = "Device",
            .requiredFeatureCount = 0,
            .requiredFeatures = nullptr,
            .requiredLimits = nullptr,
            .defaultQueue = WGPUQueueDescriptor{.nextInChain = nullptr, .label = "Default queue"},
            .deviceLostCallback = onDeviceLost,
            .deviceLostUserdata = nullptr,
        };
        WGPUDevice device = nullptr;

        auto onDeviceResponse = [](WGPURequestDeviceStatus status,
                                   WGPUDevice              maybeDevice,
                                   char const* const       message,
                                   void*                   userData) -> void {
            WGPUDevice* device = reinterpret_cast<WGPUDevice*>(userData);
            if (status == WGPURequestDeviceStatus_Success)
            {
                *device = maybeDevice;
                wgpuDeviceSetUncapturedErrorCallback(*device, onDeviceError, nullptr);
            }
            else
            {
                logError("Failed to request device: {}", message ? message : "");
            }
        };

        wgpuAdapterRequestDevice(mAdapter, &deviceDesc, onDeviceResponse, &device);

        return device;
    }();

    if (!mDevice)
    {
        releaseAll();
        throw InitializationError("Failed to create WGPUDevice instance.");
    }

    mQueue = wgpuDeviceGetQueue(mDevice);

    logInfo("WebGPU device created.");
}

WgpuBackend::~WgpuBackend() { releaseAll(); }

void WgpuBackend::releaseAll() noexcept
{
    if (mQueue)
    {
        wgpuQueueRelease(mQueue);
        mQueue = nullptr;
    }
    if (mSurface && mSurfaceConfigured)
    {
        wgpuSurfaceUnconfigure(mSurface);
        mSurfaceConfigured = false;
    }
    if (mDevice)
    {
        wgpuDeviceRelease(mDevice);
        mDevice = nullptr;
    }
    if (mAdapter)
    {
        wgpuAdapterRelease(mAdapter);
        mAdapter = nullptr;
    }
    if (mSurface)
    {
        wgpuSurfaceRelease(mSurface);
        mSurface = nullptr;
    }
    if (mInstance)
    {
        wgpuInstanceRelease(mInstance);
        mInstance = nullptr;
    }
}

SurfaceCapabilities WgpuBackend::surfaceCapabilities() const
{
    WGPUSurfaceCapabilities wgpuCaps{};
    wgpuSurfaceGetCapabilities(mSurface, mAdapter, &wgpuCaps);

    SurfaceCapabilities caps;
    for (std::size_t i = 0; i < wgpuCaps.formatCount; ++i)
    {
        const TextureFormat format = fromWGPUTextureFormat(wgpuCaps.formats[i]);
        if (format != TextureFormat::Undefined)
        {
            caps.formats.push_back(format);
        }
        else
        {
            logDebug(
                "Skipping unsupported surface format {:#x}.",
                static_cast<std::uint32_t>(wgpuCaps.formats[i]));
        }
    }
    for (std::size_t i = 0; i < wgpuCaps.presentModeCount; ++i)
    {
        PresentMode mode;
        if (fromWGPUPresentMode(wgpuCaps.presentModes[i], mode))
        {
            caps.presentModes.push_back(mode);
        }
    }

    wgpuSurfaceCapabilitiesFreeMembers(wgpuCaps);

    return caps;
}

void WgpuBackend::configureSurface(const SurfaceConfiguration& config)
{
    LWGPU_ASSERT(config.size.x > 0 && config.size.y > 0);

    const WGPUSurfaceConfiguration surfaceConfig{
        .nextInChain = nullptr,
        .device = mDevice,
        .format = toWGPUTextureFormat(config.format),
        .usage = WGPUTextureUsage_RenderAttachment,
        .viewFormatCount = 0,
        .viewFormats = nullptr,
        .alphaMode = WGPUCompositeAlphaMode_Auto,
        .width = config.size.x,
        .height = config.size.y,
        .presentMode = toWGPUPresentMode(config.presentMode),
    };
    wgpuSurfaceConfigure(mSurface, &surfaceConfig);
    mSurfaceConfigured = true;
}

SurfaceAcquisition WgpuBackend::acquireSurfaceTexture()
{
    LWGPU_ASSERT(mSurfaceConfigured);

#if LWGPU_PLATFORM != LWGPU_EMSCRIPTEN
    // Non-standard Dawn way to ensure that Dawn ticks pending async operations.
    wgpuDeviceTick(mDevice);
#endif

    WGPUSurfaceTexture surfaceTexture{};
    wgpuSurfaceGetCurrentTexture(mSurface, &surfaceTexture);

    const SurfaceStatus status = toSurfaceStatus(surfaceTexture.status);
    if (status != SurfaceStatus::Success)
    {
        surfaceTextureSafeRelease(surfaceTexture.texture);
        return SurfaceAcquisition{.status = status, .texture = nullptr, .suboptimal = false};
    }

    const WGPUTextureView view = wgpuTextureCreateView(surfaceTexture.texture, nullptr);
    if (!view)
    {
        surfaceTextureSafeRelease(surfaceTexture.texture);
        return SurfaceAcquisition{
            .status = SurfaceStatus::Lost, .texture = nullptr, .suboptimal = false};
    }

    return SurfaceAcquisition{
        .status = SurfaceStatus::Success,
        .texture = std::make_unique<WgpuSurfaceTexture>(surfaceTexture.texture, view),
        .suboptimal = surfaceTexture.suboptimal != 0,
    };
}

void WgpuBackend::presentSurfaceTexture(GpuSurfaceTexture& /*texture*/)
{
#if LWGPU_PLATFORM != LWGPU_EMSCRIPTEN
    wgpuSurfacePresent(mSurface);
#endif
    // The browser presents when control returns to the event loop.
}

std::unique_ptr<GpuRenderPipeline> WgpuBackend::createRenderPipeline(
    const RenderPipelineDescriptor& desc)
{
    const std::string& label = desc.shaders.label;

    // Shader module

    const WGPUShaderModuleWGSLDescriptor shaderCodeDesc{
        .chain =
            WGPUChainedStruct{
                .next = nullptr,
                .sType = WGPUSType_ShaderModuleWGSLDescriptor,
            },
        .code = desc.shaders.wgsl.c_str(),
    };

    const WGPUShaderModuleDescriptor shaderDesc{
        .nextInChain = &shaderCodeDesc.chain,
        .label = label.c_str(),
    };

    const WGPUShaderModule shaderModule = wgpuDeviceCreateShaderModule(mDevice, &shaderDesc);
    if (!shaderModule)
    {
        throw CompilationError(fmt::format("Failed to create shader module \"{}\".", label));
    }

#if LWGPU_PLATFORM != LWGPU_EMSCRIPTEN
    // In the browser compilation info arrives after this function has returned, and shader
    // errors are written to the console.
    {
        CompilationResult result;
        wgpuShaderModuleGetCompilationInfo(
            shaderModule,
            [](WGPUCompilationInfoRequestStatus status,
               const WGPUCompilationInfo*       info,
               void*                            userData) {
                CompilationResult& result = *reinterpret_cast<CompilationResult*>(userData);
                result.done = true;
                if (status != WGPUCompilationInfoRequestStatus_Success || !info)
                {
                    return;
                }
                for (std::size_t i = 0; i < info->messageCount; ++i)
                {
                    const WGPUCompilationMessage& msg = info->messages[i];
                    if (msg.type != WGPUCompilationMessageType_Error)
                    {
                        continue;
                    }
                    result.hasErrors = true;
                    result.messages += fmt::format(
                        "\n  {}:{}: {}", msg.lineNum, msg.linePos, msg.message ? msg.message : "");
                }
            },
            &result);

        waitUntil(result.done);
        if (result.hasErrors)
        {
            shaderModuleSafeRelease(shaderModule);
            throw CompilationError(
                fmt::format("Shader \"{}\" failed to compile:{}", label, result.messages));
        }
    }
#endif

    // Color target, replacing the cleared color

    const WGPUBlendState blendState{
        .color =
            WGPUBlendComponent{
                .operation = WGPUBlendOperation_Add,
                .srcFactor = WGPUBlendFactor_One,
                .dstFactor = WGPUBlendFactor_Zero,
            },
        .alpha =
            WGPUBlendComponent{
                .operation = WGPUBlendOperation_Add,
                .srcFactor = WGPUBlendFactor_One,
                .dstFactor = WGPUBlendFactor_Zero,
            },
    };

    const WGPUColorTargetState colorTarget{
        .nextInChain = nullptr,
        .format = toWGPUTextureFormat(desc.colorFormat),
        .blend = &blendState,
        .writeMask = WGPUColorWriteMask_All,
    };

    const WGPUFragmentState fragmentState{
        .nextInChain = nullptr,
        .module = shaderModule,
        .entryPoint = desc.shaders.fragmentEntryPoint.c_str(),
        .constantCount = 0,
        .constants = nullptr,
        .targetCount = 1,
        .targets = &colorTarget,
    };

    // Vertex layout

    std::vector<WGPUVertexAttribute> vertexAttributes;
    vertexAttributes.reserve(desc.vertexLayout.attributes.size());
    for (const VertexAttribute& attribute : desc.vertexLayout.attributes)
    {
        vertexAttributes.push_back(WGPUVertexAttribute{
            .format = toWGPUVertexFormat(attribute.format),
            .offset = attribute.offset,
            .shaderLocation = attribute.shaderLocation,
        });
    }

    const WGPUVertexBufferLayout vertexBufferLayout{
        .arrayStride = desc.vertexLayout.arrayStride,
        .stepMode = toWGPUVertexStepMode(desc.vertexLayout.stepMode),
        .attributeCount = vertexAttributes.size(),
        .attributes = vertexAttributes.data(),
    };

    // Pipeline layout, no bind groups

    const WGPUPipelineLayoutDescriptor pipelineLayoutDesc{
        .nextInChain = nullptr,
        .label = "Pipeline layout",
        .bindGroupLayoutCount = 0,
        .bindGroupLayouts = nullptr,
    };

    const WGPUPipelineLayout pipelineLayout =
        wgpuDeviceCreatePipelineLayout(mDevice, &pipelineLayoutDesc);

    // Pipeline

    const WGPURenderPipelineDescriptor pipelineDesc{
        .nextInChain = nullptr,
        .label = label.c_str(),
        .layout = pipelineLayout,
        .vertex =
            WGPUVertexState{
                .nextInChain = nullptr,
                .module = shaderModule,
                .entryPoint = desc.shaders.vertexEntryPoint.c_str(),
                .constantCount = 0,
                .constants = nullptr,
                .bufferCount = desc.vertexLayout.empty() ? 0u : 1u,
                .buffers = desc.vertexLayout.empty() ? nullptr : &vertexBufferLayout,
            },
        .primitive =
            WGPUPrimitiveState{
                .nextInChain = nullptr,
                .topology = toWGPUPrimitiveTopology(desc.primitive.topology),
                // Only non-indexed draws are issued.
                .stripIndexFormat = WGPUIndexFormat_Undefined,
                .frontFace = toWGPUFrontFace(desc.primitive.frontFace),
                .cullMode = toWGPUCullMode(desc.primitive.cullMode),
            },
        .depthStencil = nullptr,
        .multisample =
            WGPUMultisampleState{
                .nextInChain = nullptr,
                .count = 1,
                .mask = ~0u,
                .alphaToCoverageEnabled = false,
            },
        .fragment = &fragmentState,
    };

#if LWGPU_PLATFORM == LWGPU_EMSCRIPTEN
    // Validation errors are reported to the uncaptured error callback.
    const WGPURenderPipeline pipeline = wgpuDeviceCreateRenderPipeline(mDevice, &pipelineDesc);

    pipelineLayoutSafeRelease(pipelineLayout);
    shaderModuleSafeRelease(shaderModule);

    if (!pipeline)
    {
        throw CompilationError(fmt::format("Failed to create render pipeline \"{}\".", label));
    }
#else
    // Validation errors in the pipeline, e.g. a misspelled entry point, are only reported
    // through error scopes.
    wgpuDevicePushErrorScope(mDevice, WGPUErrorFilter_Validation);
    const WGPURenderPipeline pipeline = wgpuDeviceCreateRenderPipeline(mDevice, &pipelineDesc);

    ErrorScopeResult scopeResult;
    wgpuDevicePopErrorScope(
        mDevice,
        [](WGPUErrorType type, const char* message, void* userData) {
            ErrorScopeResult& result = *reinterpret_cast<ErrorScopeResult*>(userData);
            result.done = true;
            result.type = type;
            result.message = message ? message : "";
        },
        &scopeResult);
    waitUntil(scopeResult.done);

    pipelineLayoutSafeRelease(pipelineLayout);
    shaderModuleSafeRelease(shaderModule);

    if (scopeResult.type != WGPUErrorType_NoError || !pipeline)
    {
        renderPipelineSafeRelease(pipeline);
        throw CompilationError(fmt::format(
            "Render pipeline \"{}\" is invalid ({}): {}",
            label,
            WGPUErrorTypeToStr(scopeResult.type),
            scopeResult.message));
    }
#endif

    logDebug("Created render pipeline \"{}\".", label);

    return std::make_unique<WgpuRenderPipeline>(pipeline);
}

std::unique_ptr<GpuVertexBuffer> WgpuBackend::createVertexBuffer(
    const char* const                label,
    const std::span<const std::byte> data)
{
    return std::make_unique<WgpuBuffer>(
        mDevice, label, WGPUBufferUsage_CopyDst | WGPUBufferUsage_Vertex, data);
}

std::unique_ptr<GpuCommandBuffer> WgpuBackend::encodeRenderPass(
    GpuSurfaceTexture&          target,
    const RenderPassDescriptor& desc)
{
    LWGPU_ASSERT(desc.pipeline != nullptr);

    const WGPUTextureView targetView = static_cast<WgpuSurfaceTexture&>(target).view();

    const WGPUCommandEncoder encoder = [this]() {
        const WGPUCommandEncoderDescriptor cmdEncoderDesc{
            .nextInChain = nullptr,
            .label = "Render encoder",
        };
        return wgpuDeviceCreateCommandEncoder(mDevice, &cmdEncoderDesc);
    }();

    const WGPURenderPassEncoder renderPassEncoder =
        [encoder, targetView, &desc]() -> WGPURenderPassEncoder {
        const WGPURenderPassColorAttachment renderPassColorAttachment{
            .nextInChain = nullptr,
            .view = targetView,
            .depthSlice = WGPU_DEPTH_SLICE_UNDEFINED, // depthSlice must be initialized with
                                                      // 'undefined' value for 2d color attachments.
            .resolveTarget = nullptr,
            .loadOp = WGPULoadOp_Clear,
            .storeOp = WGPUStoreOp_Store,
            .clearValue =
                WGPUColor{
                    desc.clearColor.r,
                    desc.clearColor.g,
                    desc.clearColor.b,
                    desc.clearColor.a,
                },
        };

        const WGPURenderPassDescriptor renderPassDesc{
            .nextInChain = nullptr,
            .label = desc.label,
            .colorAttachmentCount = 1,
            .colorAttachments = &renderPassColorAttachment,
            .depthStencilAttachment = nullptr,
            .occlusionQuerySet = nullptr,
            .timestampWrites = nullptr,
        };

        return wgpuCommandEncoderBeginRenderPass(encoder, &renderPassDesc);
    }();

    {
        const auto& pipeline = static_cast<const WgpuRenderPipeline&>(*desc.pipeline);
        wgpuRenderPassEncoderSetPipeline(renderPassEncoder, pipeline.ptr());

        if (desc.vertexCount > 0)
        {
            if (desc.vertexBuffer)
            {
                const auto& vertexBuffer = static_cast<const WgpuBuffer&>(*desc.vertexBuffer);
                wgpuRenderPassEncoderSetVertexBuffer(
                    renderPassEncoder, 0, vertexBuffer.ptr(), 0, vertexBuffer.byteSize());
            }
            wgpuRenderPassEncoderDraw(renderPassEncoder, desc.vertexCount, 1, 0, 0);
        }
    }

    wgpuRenderPassEncoderEnd(renderPassEncoder);
    wgpuRenderPassEncoderRelease(renderPassEncoder);

    const WGPUCommandBuffer cmdBuffer = [encoder]() {
        const WGPUCommandBufferDescriptor cmdBufferDesc{
            .nextInChain = nullptr,
            .label = "Render command buffer",
        };
        return wgpuCommandEncoderFinish(encoder, &cmdBufferDesc);
    }();
    wgpuCommandEncoderRelease(encoder);

    return std::make_unique<WgpuCommandBuffer>(cmdBuffer);
}

void WgpuBackend::submit(std::unique_ptr<GpuCommandBuffer> commands)
{
    LWGPU_ASSERT(commands != nullptr);

    const WGPUCommandBuffer cmdBuffer = static_cast<WgpuCommandBuffer&>(*commands).release();
    wgpuQueueSubmit(mQueue, 1, &cmdBuffer);
    commandBufferSafeRelease(cmdBuffer);
}

void WgpuBackend::waitForSubmittedWork()
{
#if LWGPU_PLATFORM == LWGPU_EMSCRIPTEN
    // The browser cannot be blocked on; it drains submitted work itself.
    logDebug("Submitted work is drained by the browser.");
#else
    bool done = false;
    wgpuQueueOnSubmittedWorkDone(
        mQueue,
        [](WGPUQueueWorkDoneStatus status, void* userData) {
            if (status != WGPUQueueWorkDoneStatus_Success)
            {
                logWarn("Queue work done status: {}", WGPUQueueWorkDoneStatusToStr(status));
            }
            *reinterpret_cast<bool*>(userData) = true;
        },
        &done);
    waitUntil(done);
#endif
}

#if LWGPU_PLATFORM != LWGPU_EMSCRIPTEN
void WgpuBackend::waitUntil(const bool& done)
{
    while (!done)
    {
        wgpuDeviceTick(mDevice);
    }
}
#endif
} // namespace lwgpu
