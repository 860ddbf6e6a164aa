#pragma once

/**
 * @file light.h
 * @brief A registered light: its geometry plus the GPU resources it owns
 */

#include <penumbra/gpu_handle.h>
#include <penumbra/light_source.h>

#include <webgpu/webgpu.h>

namespace penumbra {

class BindGroupLayouts;
class Model;

/**
 * @brief LightSource with a uniform buffer holding its LightRecord
 *
 * The buffer is both a uniform (marker pass, group 1) and a copy source for
 * the light array and the shadow scratch buffer. The marker instance is the
 * light's slot in the marker model's instance buffer.
 */
class Light {
public:
    Light(WGPUDevice device, WGPUQueue queue, const BindGroupLayouts& layouts,
          const LightSource& source, uint32_t markerInstance);

    Light(const Light&) = delete;
    Light& operator=(const Light&) = delete;

    const LightSource& source() const { return m_source; }
    LightKind kind() const { return m_source.kind(); }
    glm::vec3 position() const { return m_source.position(); }
    glm::vec3 color() const { return m_source.color(); }
    const LightRecord& record() const { return m_source.record(); }

    WGPUBuffer buffer() const { return m_buffer; }
    WGPUBindGroup bindGroup() const { return m_bindGroup; }
    uint32_t markerInstance() const { return m_markerInstance; }

    void setPosition(WGPUQueue queue, const glm::vec3& position);
    void setColor(WGPUQueue queue, const glm::vec3& color);

    /// Move the light's marker instance to the light position
    void placeMarker(WGPUQueue queue, Model& markers) const;

private:
    void writeRecord(WGPUQueue queue) const;

    LightSource m_source;
    BufferHandle m_buffer;
    BindGroupHandle m_bindGroup;
    uint32_t m_markerInstance;
};

} // namespace penumbra
