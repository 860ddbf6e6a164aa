#pragma once

/**
 * @file renderer.h
 * @brief Main colour pass: shadowed models followed by light markers
 */

#include <penumbra/gpu_handle.h>
#include <penumbra/texture.h>

#include <webgpu/webgpu.h>

#include <cstdint>
#include <vector>

namespace penumbra {

class BindGroupLayouts;
class CameraUniformBuffer;
class GpuContext;
class Lighting;
class Model;
class ShaderLibrary;

class Renderer {
public:
    Renderer(WGPUDevice device, const BindGroupLayouts& layouts, const ShaderLibrary& shaders,
             WGPUTextureFormat colorFormat, uint32_t width, uint32_t height);

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    /**
     * @brief Record and submit the main pass into target
     *
     * Shadow maps must already be baked for this frame. Groups 0-2 are bound
     * once; each model binds its materials at group 3.
     */
    void render(const GpuContext& gpu, WGPUTextureView target, const CameraUniformBuffer& camera,
                const Lighting& lighting, const std::vector<const Model*>& models) const;

    /// Recreate the depth buffer
    void resize(uint32_t width, uint32_t height);

    static constexpr WGPUColor CLEAR_COLOR = {0.1, 0.2, 0.3, 1.0};

private:
    WGPUDevice m_device;
    RenderPipelineHandle m_pipeline;
    Texture m_depth;
};

} // namespace penumbra
