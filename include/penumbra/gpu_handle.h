#pragma once

/**
 * @file gpu_handle.h
 * @brief Owning wrappers for WebGPU objects
 *
 * Every GPU object in penumbra has exactly one GpuHandle owner. Replacing a
 * light, recreating the shadow array or dropping a frame's surface texture
 * releases the old object when its handle is reset or destroyed.
 *
 * @code
 * BufferHandle buffer(wgpuDeviceCreateBuffer(device, &desc));
 * wgpuQueueWriteBuffer(queue, buffer, 0, &record, sizeof(record));
 * buffer.reset();   // released here
 * @endcode
 */

#include <webgpu/webgpu.h>

namespace penumbra {

/// Maps a WebGPU handle type to its wgpu*Release() function
template<typename T>
struct WGPUReleaseTrait;

#define PENUMBRA_RELEASE_TRAIT(Type, releaseFn)            \
    template<>                                             \
    struct WGPUReleaseTrait<Type> {                        \
        static void release(Type h) { if (h) releaseFn(h); } \
    }

PENUMBRA_RELEASE_TRAIT(WGPUInstance, wgpuInstanceRelease);
PENUMBRA_RELEASE_TRAIT(WGPUAdapter, wgpuAdapterRelease);
PENUMBRA_RELEASE_TRAIT(WGPUDevice, wgpuDeviceRelease);
PENUMBRA_RELEASE_TRAIT(WGPUQueue, wgpuQueueRelease);
PENUMBRA_RELEASE_TRAIT(WGPUSurface, wgpuSurfaceRelease);
PENUMBRA_RELEASE_TRAIT(WGPUTexture, wgpuTextureRelease);
PENUMBRA_RELEASE_TRAIT(WGPUTextureView, wgpuTextureViewRelease);
PENUMBRA_RELEASE_TRAIT(WGPUBuffer, wgpuBufferRelease);
PENUMBRA_RELEASE_TRAIT(WGPUSampler, wgpuSamplerRelease);
PENUMBRA_RELEASE_TRAIT(WGPUShaderModule, wgpuShaderModuleRelease);
PENUMBRA_RELEASE_TRAIT(WGPUBindGroup, wgpuBindGroupRelease);
PENUMBRA_RELEASE_TRAIT(WGPUBindGroupLayout, wgpuBindGroupLayoutRelease);
PENUMBRA_RELEASE_TRAIT(WGPUPipelineLayout, wgpuPipelineLayoutRelease);
PENUMBRA_RELEASE_TRAIT(WGPURenderPipeline, wgpuRenderPipelineRelease);
PENUMBRA_RELEASE_TRAIT(WGPUCommandEncoder, wgpuCommandEncoderRelease);

#undef PENUMBRA_RELEASE_TRAIT

/**
 * @brief Move-only owner of one WebGPU object
 *
 * Converts implicitly to the raw handle so it can be passed straight to the
 * C API. reset() releases the current object and adopts a new one.
 */
template<typename T>
class GpuHandle {
public:
    GpuHandle() = default;
    explicit GpuHandle(T handle) : m_handle(handle) {}
    ~GpuHandle() { reset(); }

    GpuHandle(GpuHandle&& other) noexcept : m_handle(other.m_handle) {
        other.m_handle = nullptr;
    }

    GpuHandle& operator=(GpuHandle&& other) noexcept {
        if (this != &other) {
            reset(other.m_handle);
            other.m_handle = nullptr;
        }
        return *this;
    }

    GpuHandle(const GpuHandle&) = delete;
    GpuHandle& operator=(const GpuHandle&) = delete;

    operator T() const { return m_handle; }
    explicit operator bool() const { return m_handle != nullptr; }

    void reset(T handle = nullptr) {
        WGPUReleaseTrait<T>::release(m_handle);
        m_handle = handle;
    }

private:
    T m_handle = nullptr;
};

using InstanceHandle = GpuHandle<WGPUInstance>;
using AdapterHandle = GpuHandle<WGPUAdapter>;
using DeviceHandle = GpuHandle<WGPUDevice>;
using QueueHandle = GpuHandle<WGPUQueue>;
using SurfaceHandle = GpuHandle<WGPUSurface>;
using TextureHandle = GpuHandle<WGPUTexture>;
using TextureViewHandle = GpuHandle<WGPUTextureView>;
using BufferHandle = GpuHandle<WGPUBuffer>;
using SamplerHandle = GpuHandle<WGPUSampler>;
using ShaderModuleHandle = GpuHandle<WGPUShaderModule>;
using BindGroupHandle = GpuHandle<WGPUBindGroup>;
using BindGroupLayoutHandle = GpuHandle<WGPUBindGroupLayout>;
using PipelineLayoutHandle = GpuHandle<WGPUPipelineLayout>;
using RenderPipelineHandle = GpuHandle<WGPURenderPipeline>;
using CommandEncoderHandle = GpuHandle<WGPUCommandEncoder>;

} // namespace penumbra
