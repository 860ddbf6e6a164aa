#pragma once

/**
 * @file gpu_context.h
 * @brief WebGPU instance, device, queue and window surface
 */

#include <penumbra/gpu_handle.h>

#include <webgpu/webgpu.h>

#include <cstdint>

struct GLFWwindow;

namespace penumbra {

/// WGPUStringView over a null-terminated string
inline WGPUStringView toStringView(const char* str) {
    WGPUStringView sv;
    sv.data = str;
    sv.length = WGPU_STRLEN;
    return sv;
}

/// Create a buffer; size is rounded up to a multiple of 4
BufferHandle createBuffer(WGPUDevice device, const char* label, uint64_t size, WGPUBufferUsage usage);

/// Current swap-chain texture and a view onto it
struct SurfaceFrame {
    TextureHandle texture;
    TextureViewHandle view;
};

/**
 * @brief Owns the device and the configured surface
 *
 * Construction requests an adapter compatible with the window surface, a
 * device with logging lost/error callbacks, and configures the surface with
 * FIFO presentation.
 */
class GpuContext {
public:
    /// @throws std::runtime_error when any WebGPU object cannot be created
    GpuContext(GLFWwindow* window, uint32_t width, uint32_t height);
    ~GpuContext();

    GpuContext(const GpuContext&) = delete;
    GpuContext& operator=(const GpuContext&) = delete;

    WGPUDevice device() const { return m_device; }
    WGPUQueue queue() const { return m_queue; }
    WGPUTextureFormat surfaceFormat() const { return m_surfaceFormat; }

    uint32_t width() const { return m_width; }
    uint32_t height() const { return m_height; }
    float aspect() const;

    /// Reconfigure the surface; a zero size (minimized window) is ignored
    void resize(uint32_t width, uint32_t height);

    /// New command encoder; the caller finishes it with submit()
    CommandEncoderHandle createEncoder(const char* label) const;

    /// Finish the encoder and submit its command buffer
    void submit(CommandEncoderHandle encoder) const;

    /**
     * @brief Acquire the next surface texture
     *
     * An outdated or lost surface is reconfigured and retried once.
     * @throws std::runtime_error on timeout or any other failure
     */
    SurfaceFrame acquireFrame();

    /// Present and release the frame
    void present(SurfaceFrame& frame);

private:
    void configureSurface();

    InstanceHandle m_instance;
    SurfaceHandle m_surface;
    AdapterHandle m_adapter;
    DeviceHandle m_device;
    QueueHandle m_queue;
    WGPUTextureFormat m_surfaceFormat = WGPUTextureFormat_BGRA8UnormSrgb;
    uint32_t m_width = 0;
    uint32_t m_height = 0;
};

} // namespace penumbra
