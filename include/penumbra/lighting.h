#pragma once

/**
 * @file lighting.h
 * @brief The light registry: named lights, the GPU light array and shadow maps
 *
 * Lights occupy array slots in registration order. The model shader reads the
 * active count and the array at group 1; slot i's shadow map is layer i of the
 * shadow baker's depth array.
 */

#include <penumbra/gpu_handle.h>
#include <penumbra/light.h>
#include <penumbra/light_slots.h>
#include <penumbra/model.h>
#include <penumbra/shadow_baker.h>

#include <webgpu/webgpu.h>

#include <memory>
#include <string>
#include <vector>

namespace penumbra {

class BindGroupLayouts;
class Projection;
class ShaderLibrary;
class View;

class Lighting {
public:
    /// Takes ownership of the marker model; it gets one instance per slot
    Lighting(WGPUDevice device, WGPUQueue queue, const BindGroupLayouts& layouts,
             const ShaderLibrary& shaders, WGPUTextureFormat colorFormat,
             uint32_t width, uint32_t height, Model markerModel);

    Lighting(const Lighting&) = delete;
    Lighting& operator=(const Lighting&) = delete;

    /**
     * @brief Register a spotlight under a name
     *
     * A new name takes the next slot; the light's record and the new count
     * are copied into the light array buffers and submitted immediately. An
     * existing name replaces that light in place. Fails with
     * LightError::CapacityExceeded once LIGHT_CAPACITY lights are registered.
     */
    LightSlot addSpotlight(const std::string& name, const glm::vec3& color,
                           const Projection& projection, const View& view);

    /// nullptr if no light has this name
    const Light* get(const std::string& name) const;
    bool contains(const std::string& name) const { return m_slots.contains(name); }
    uint32_t size() const { return m_slots.size(); }

    /// Lights in slot order
    const std::vector<std::unique_ptr<Light>>& lights() const { return m_lights; }
    const std::vector<std::string>& names() const { return m_slots.names(); }

    bool setLightPosition(const std::string& name, const glm::vec3& position);
    bool setLightColor(const std::string& name, const glm::vec3& color);

    bool markersVisible() const { return m_markersVisible; }
    void setMarkersVisible(bool visible) { m_markersVisible = visible; }
    void toggleMarkers() { m_markersVisible = !m_markersVisible; }

    /// Record one depth pass per light into encoder
    void bake(WGPUCommandEncoder encoder, const std::vector<const Model*>& models) const;

    /// Draw a marker at every light (no-op while markers are hidden)
    void renderMarkers(WGPURenderPassEncoder pass, WGPUBindGroup cameraBindGroup) const;

    /// Resize the shadow maps to the surface
    void resize(uint32_t width, uint32_t height) { m_baker.resize(width, height); }

    /// Count and light array (group 1 of the model pipeline)
    WGPUBindGroup bindGroup() const { return m_bindGroup; }

    /// Depth array and comparison sampler (group 2 of the model pipeline)
    WGPUBindGroup shadowBindGroup() const { return m_baker.bindGroup(); }

private:
    void syncSlot(uint32_t index);

    WGPUDevice m_device;
    WGPUQueue m_queue;
    const BindGroupLayouts& m_layouts;

    LightSlots m_slots;
    std::vector<std::unique_ptr<Light>> m_lights;

    BufferHandle m_countBuffer;
    BufferHandle m_countStaging;
    BufferHandle m_arrayBuffer;
    BindGroupHandle m_bindGroup;

    Model m_markerModel;
    RenderPipelineHandle m_markerPipeline;
    bool m_markersVisible = false;

    ShadowBaker m_baker;
};

} // namespace penumbra
