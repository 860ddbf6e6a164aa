#include <penumbra/mesh.h>
#include <penumbra/gpu_context.h>

namespace penumbra {

void Mesh::upload(WGPUDevice device, WGPUQueue queue) {
    release();
    if (vertices.empty() || indices.empty()) return;

    uint64_t vertexBytes = vertices.size() * sizeof(Vertex);
    m_vertexBuffer = createBuffer(device, "Mesh Vertex Buffer", vertexBytes,
                                  WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst);
    wgpuQueueWriteBuffer(queue, m_vertexBuffer, 0, vertices.data(), vertexBytes);

    uint64_t indexBytes = indices.size() * sizeof(uint32_t);
    m_indexBuffer = createBuffer(device, "Mesh Index Buffer", indexBytes,
                                 WGPUBufferUsage_Index | WGPUBufferUsage_CopyDst);
    wgpuQueueWriteBuffer(queue, m_indexBuffer, 0, indices.data(), indexBytes);
}

void Mesh::release() {
    if (m_vertexBuffer) {
        wgpuBufferDestroy(m_vertexBuffer);
        m_vertexBuffer.reset();
    }
    if (m_indexBuffer) {
        wgpuBufferDestroy(m_indexBuffer);
        m_indexBuffer.reset();
    }
}

} // namespace penumbra
