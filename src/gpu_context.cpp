#include <penumbra/gpu_context.h>

#include <webgpu/wgpu.h>  // wgpu-native extensions (wgpuDevicePoll)
#include <glfw3webgpu.h>

#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

namespace penumbra {

namespace {

std::string fromStringView(WGPUStringView message, const char* fallback) {
    if (!message.data) return fallback;
    size_t length = message.length == WGPU_STRLEN ? std::strlen(message.data) : message.length;
    return std::string(message.data, length);
}

struct AdapterUserData {
    WGPUAdapter adapter = nullptr;
    bool done = false;
};

void onAdapterRequestEnded(WGPURequestAdapterStatus status, WGPUAdapter adapter,
                           WGPUStringView message, void* userdata1, void* userdata2) {
    (void)userdata2;
    auto* data = static_cast<AdapterUserData*>(userdata1);
    if (status == WGPURequestAdapterStatus_Success) {
        data->adapter = adapter;
    } else {
        std::cerr << "[GpuContext] Failed to request adapter: "
                  << fromStringView(message, "unknown error") << std::endl;
    }
    data->done = true;
}

struct DeviceUserData {
    WGPUDevice device = nullptr;
    bool done = false;
};

void onDeviceRequestEnded(WGPURequestDeviceStatus status, WGPUDevice device,
                          WGPUStringView message, void* userdata1, void* userdata2) {
    (void)userdata2;
    auto* data = static_cast<DeviceUserData*>(userdata1);
    if (status == WGPURequestDeviceStatus_Success) {
        data->device = device;
    } else {
        std::cerr << "[GpuContext] Failed to request device: "
                  << fromStringView(message, "unknown error") << std::endl;
    }
    data->done = true;
}

void onDeviceLost(WGPUDevice const* device, WGPUDeviceLostReason reason,
                  WGPUStringView message, void* userdata1, void* userdata2) {
    (void)device; (void)userdata1; (void)userdata2;
    // Destroyed is the normal shutdown path
    if (reason == WGPUDeviceLostReason_Destroyed) return;
    std::cerr << "[GpuContext] Device lost: " << fromStringView(message, "unknown") << std::endl;
}

void onDeviceError(WGPUDevice const* device, WGPUErrorType type,
                   WGPUStringView message, void* userdata1, void* userdata2) {
    (void)device; (void)type; (void)userdata1; (void)userdata2;
    std::cerr << "[GpuContext] WebGPU error: " << fromStringView(message, "unknown") << std::endl;
}

} // namespace

BufferHandle createBuffer(WGPUDevice device, const char* label, uint64_t size, WGPUBufferUsage usage) {
    WGPUBufferDescriptor bufferDesc = {};
    bufferDesc.label = toStringView(label);
    bufferDesc.size = (size + 3) & ~uint64_t(3);
    bufferDesc.usage = usage;
    bufferDesc.mappedAtCreation = false;
    return BufferHandle(wgpuDeviceCreateBuffer(device, &bufferDesc));
}

GpuContext::GpuContext(GLFWwindow* window, uint32_t width, uint32_t height)
    : m_width(width), m_height(height) {
    WGPUInstanceDescriptor instanceDesc = {};
    m_instance.reset(wgpuCreateInstance(&instanceDesc));
    if (!m_instance) {
        throw std::runtime_error("Failed to create WebGPU instance");
    }

    m_surface.reset(glfwCreateWindowWGPUSurface(m_instance, window));
    if (!m_surface) {
        throw std::runtime_error("Failed to create surface");
    }

    // Adapter
    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.compatibleSurface = m_surface;
    adapterOpts.powerPreference = WGPUPowerPreference_HighPerformance;

    AdapterUserData adapterData;
    WGPURequestAdapterCallbackInfo adapterCallback = {};
    adapterCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    adapterCallback.callback = onAdapterRequestEnded;
    adapterCallback.userdata1 = &adapterData;
    wgpuInstanceRequestAdapter(m_instance, &adapterOpts, adapterCallback);

    // wgpu-native resolves the request before returning
    while (!adapterData.done) {
        wgpuInstanceProcessEvents(m_instance);
    }
    if (!adapterData.adapter) {
        throw std::runtime_error("Failed to get adapter");
    }
    m_adapter.reset(adapterData.adapter);

    WGPUAdapterInfo info = {};
    wgpuAdapterGetInfo(m_adapter, &info);
    std::cout << "[GpuContext] Adapter: " << fromStringView(info.device, "unknown") << std::endl;
    wgpuAdapterInfoFreeMembers(info);

    // Device
    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = toStringView("penumbra device");
    deviceDesc.deviceLostCallbackInfo.callback = onDeviceLost;
    deviceDesc.uncapturedErrorCallbackInfo.callback = onDeviceError;

    DeviceUserData deviceData;
    WGPURequestDeviceCallbackInfo deviceCallback = {};
    deviceCallback.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceCallback.callback = onDeviceRequestEnded;
    deviceCallback.userdata1 = &deviceData;
    wgpuAdapterRequestDevice(m_adapter, &deviceDesc, deviceCallback);

    while (!deviceData.done) {
        wgpuInstanceProcessEvents(m_instance);
    }
    if (!deviceData.device) {
        throw std::runtime_error("Failed to get device");
    }
    m_device.reset(deviceData.device);
    m_queue.reset(wgpuDeviceGetQueue(m_device));

    // Prefer an sRGB BGRA surface, otherwise take what the surface offers first
    WGPUSurfaceCapabilities capabilities = {};
    wgpuSurfaceGetCapabilities(m_surface, m_adapter, &capabilities);
    if (capabilities.formatCount > 0) {
        m_surfaceFormat = capabilities.formats[0];
        for (size_t i = 0; i < capabilities.formatCount; ++i) {
            if (capabilities.formats[i] == WGPUTextureFormat_BGRA8UnormSrgb) {
                m_surfaceFormat = WGPUTextureFormat_BGRA8UnormSrgb;
                break;
            }
        }
    }
    wgpuSurfaceCapabilitiesFreeMembers(capabilities);

    configureSurface();

    std::cout << "[GpuContext] WebGPU initialized, surface " << m_width << "x" << m_height
              << std::endl;
}

GpuContext::~GpuContext() {
    if (m_surface && m_device) {
        wgpuSurfaceUnconfigure(m_surface);
    }
}

float GpuContext::aspect() const {
    return m_height == 0 ? 1.0f : static_cast<float>(m_width) / static_cast<float>(m_height);
}

void GpuContext::configureSurface() {
    WGPUSurfaceConfiguration config = {};
    config.device = m_device;
    config.format = m_surfaceFormat;
    config.width = m_width;
    config.height = m_height;
    config.presentMode = WGPUPresentMode_Fifo;
    config.alphaMode = WGPUCompositeAlphaMode_Auto;
    config.usage = WGPUTextureUsage_RenderAttachment;
    wgpuSurfaceConfigure(m_surface, &config);
}

void GpuContext::resize(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) return;
    m_width = width;
    m_height = height;
    configureSurface();
}

CommandEncoderHandle GpuContext::createEncoder(const char* label) const {
    WGPUCommandEncoderDescriptor encoderDesc = {};
    encoderDesc.label = toStringView(label);
    return CommandEncoderHandle(wgpuDeviceCreateCommandEncoder(m_device, &encoderDesc));
}

void GpuContext::submit(CommandEncoderHandle encoder) const {
    WGPUCommandBufferDescriptor cmdDesc = {};
    WGPUCommandBuffer cmdBuffer = wgpuCommandEncoderFinish(encoder, &cmdDesc);
    wgpuQueueSubmit(m_queue, 1, &cmdBuffer);
    wgpuCommandBufferRelease(cmdBuffer);
}

SurfaceFrame GpuContext::acquireFrame() {
    WGPUSurfaceTexture surfaceTexture = {};
    wgpuSurfaceGetCurrentTexture(m_surface, &surfaceTexture);

    if (surfaceTexture.status == WGPUSurfaceGetCurrentTextureStatus_Outdated ||
        surfaceTexture.status == WGPUSurfaceGetCurrentTextureStatus_Lost) {
        if (surfaceTexture.texture) {
            wgpuTextureRelease(surfaceTexture.texture);
        }
        configureSurface();
        surfaceTexture = {};
        wgpuSurfaceGetCurrentTexture(m_surface, &surfaceTexture);
    }

    if (surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal &&
        surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal) {
        if (surfaceTexture.texture) {
            wgpuTextureRelease(surfaceTexture.texture);
        }
        if (surfaceTexture.status == WGPUSurfaceGetCurrentTextureStatus_Timeout) {
            throw std::runtime_error("Timeout getting surface texture");
        }
        throw std::runtime_error("Failed to get surface texture (status " +
                                 std::to_string(static_cast<int>(surfaceTexture.status)) + ")");
    }

    SurfaceFrame frame;
    frame.texture.reset(surfaceTexture.texture);

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = m_surfaceFormat;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;
    frame.view.reset(wgpuTextureCreateView(frame.texture, &viewDesc));
    return frame;
}

void GpuContext::present(SurfaceFrame& frame) {
    wgpuSurfacePresent(m_surface);
    wgpuDevicePoll(m_device, false, nullptr);
    frame.view.reset();
    frame.texture.reset();
}

} // namespace penumbra
