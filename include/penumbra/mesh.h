#pragma once

#include <penumbra/gpu_handle.h>
#include <penumbra/gpu_structs.h>

#include <webgpu/webgpu.h>

#include <cstdint>
#include <string>
#include <vector>

namespace penumbra {

/// Indexed triangle mesh with GPU vertex and index buffers
class Mesh {
public:
    std::string name;
    std::vector<Vertex> vertices;
    std::vector<uint32_t> indices;
    uint32_t materialIndex = 0;

    Mesh() = default;
    Mesh(Mesh&&) = default;
    Mesh& operator=(Mesh&&) = default;

    /// Upload vertices and indices to new GPU buffers
    void upload(WGPUDevice device, WGPUQueue queue);

    /// Release GPU resources
    void release();

    bool valid() const { return m_vertexBuffer && m_indexBuffer; }

    WGPUBuffer vertexBuffer() const { return m_vertexBuffer; }
    WGPUBuffer indexBuffer() const { return m_indexBuffer; }
    uint32_t indexCount() const { return static_cast<uint32_t>(indices.size()); }
    uint32_t vertexCount() const { return static_cast<uint32_t>(vertices.size()); }

private:
    BufferHandle m_vertexBuffer;
    BufferHandle m_indexBuffer;
};

} // namespace penumbra
