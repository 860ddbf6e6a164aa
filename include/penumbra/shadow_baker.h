#pragma once

/**
 * @file shadow_baker.h
 * @brief Renders one shadow map per light into a depth texture array
 *
 * Layer i of the array belongs to the light in slot i. Every light is baked
 * every frame; there is no dirty tracking.
 */

#include <penumbra/gpu_handle.h>

#include <webgpu/webgpu.h>

#include <cstdint>
#include <memory>
#include <vector>

namespace penumbra {

class BindGroupLayouts;
class Light;
class Model;
class ShaderLibrary;

class ShadowBaker {
public:
    /// Constant and slope-scaled depth bias of the shadow pipeline
    static constexpr int32_t DEPTH_BIAS = 2;
    static constexpr float DEPTH_BIAS_SLOPE_SCALE = 2.0f;

    ShadowBaker(WGPUDevice device, const BindGroupLayouts& layouts, const ShaderLibrary& shaders,
                uint32_t width, uint32_t height);

    ShadowBaker(const ShadowBaker&) = delete;
    ShadowBaker& operator=(const ShadowBaker&) = delete;

    /**
     * @brief Record the depth passes for all lights
     *
     * For each light: copy its record into the scratch uniform, then clear
     * and draw every model into the light's layer.
     */
    void bake(WGPUCommandEncoder encoder, const std::vector<std::unique_ptr<Light>>& lights,
              const std::vector<const Model*>& models) const;

    /// Recreate the depth array at the new size and rebuild the shadow bind group
    void resize(uint32_t width, uint32_t height);

    /// Depth array view and comparison sampler (group 2 of the model pipeline)
    WGPUBindGroup bindGroup() const { return m_bindGroup; }

    WGPUTextureView arrayView() const { return m_arrayView; }
    uint32_t width() const { return m_width; }
    uint32_t height() const { return m_height; }

private:
    void createDepthArray();

    WGPUDevice m_device;
    const BindGroupLayouts& m_layouts;
    uint32_t m_width = 0;
    uint32_t m_height = 0;

    TextureHandle m_depthArray;
    TextureViewHandle m_arrayView;
    std::vector<TextureViewHandle> m_layerViews;
    SamplerHandle m_sampler;
    BindGroupHandle m_bindGroup;

    BufferHandle m_scratchBuffer;
    BindGroupHandle m_scratchBindGroup;
    RenderPipelineHandle m_pipeline;
};

} // namespace penumbra
