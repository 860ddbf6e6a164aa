#pragma once

/**
 * @file uniforms.h
 * @brief Camera uniform buffer and its group-0 bind group
 */

#include <penumbra/gpu_handle.h>

#include <webgpu/webgpu.h>

namespace penumbra {

class BindGroupLayouts;
class Camera;

class CameraUniformBuffer {
public:
    CameraUniformBuffer(WGPUDevice device, const BindGroupLayouts& layouts);

    /// Write eye position and the depth-remapped view-projection matrix
    void update(WGPUQueue queue, const Camera& camera);

    WGPUBuffer buffer() const { return m_buffer; }
    WGPUBindGroup bindGroup() const { return m_bindGroup; }

private:
    BufferHandle m_buffer;
    BindGroupHandle m_bindGroup;
};

} // namespace penumbra
