#include <penumbra/model.h>
#include <penumbra/gpu_context.h>
#include <penumbra/pipeline_builder.h>

#include <algorithm>

namespace penumbra {

// -----------------------------------------------------------------------------
// Material
// -----------------------------------------------------------------------------

Material::Material(WGPUDevice device, const BindGroupLayouts& layouts, std::string name,
                   Texture diffuse)
    : m_name(std::move(name)), m_diffuse(std::move(diffuse)) {
    WGPUBindGroupEntry entries[2] = {};
    entries[0].binding = 0;
    entries[0].textureView = m_diffuse.view();
    entries[1].binding = 1;
    entries[1].sampler = m_diffuse.sampler();

    WGPUBindGroupDescriptor bindDesc = {};
    bindDesc.label = toStringView(m_name.c_str());
    bindDesc.layout = layouts.material();
    bindDesc.entryCount = 2;
    bindDesc.entries = entries;
    m_bindGroup.reset(wgpuDeviceCreateBindGroup(device, &bindDesc));
}

// -----------------------------------------------------------------------------
// Model
// -----------------------------------------------------------------------------

Model::Model(std::vector<Mesh> meshes, std::vector<Material> materials)
    : m_meshes(std::move(meshes)), m_materials(std::move(materials)) {}

const Material& Model::materialFor(const Mesh& mesh) const {
    size_t index = std::min<size_t>(mesh.materialIndex, m_materials.size() - 1);
    return m_materials[index];
}

void Model::setInstances(WGPUDevice device, WGPUQueue queue, std::vector<Instance> instances) {
    m_instances = std::move(instances);
    if (m_instances.empty()) return;

    if (m_instances.size() > m_instanceCapacity) {
        m_instanceBuffer = createBuffer(device, "Instance Buffer",
                                        m_instances.size() * sizeof(InstanceRecord),
                                        WGPUBufferUsage_Vertex | WGPUBufferUsage_CopyDst);
        m_instanceCapacity = m_instances.size();
    }

    std::vector<InstanceRecord> records = toRecords(m_instances);
    wgpuQueueWriteBuffer(queue, m_instanceBuffer, 0, records.data(),
                         records.size() * sizeof(InstanceRecord));
}

void Model::updateInstance(WGPUQueue queue, size_t index, const Instance& instance) {
    if (index >= m_instances.size()) return;
    m_instances[index] = instance;
    InstanceRecord record = instance.toRecord();
    wgpuQueueWriteBuffer(queue, m_instanceBuffer, index * sizeof(InstanceRecord),
                         &record, sizeof(InstanceRecord));
}

void Model::draw(WGPURenderPassEncoder pass, int materialGroup) const {
    drawRange(pass, materialGroup, 0, instanceCount());
}

void Model::drawInstance(WGPURenderPassEncoder pass, int materialGroup, uint32_t index) const {
    if (index >= instanceCount()) return;
    drawRange(pass, materialGroup, index, 1);
}

void Model::drawRange(WGPURenderPassEncoder pass, int materialGroup,
                      uint32_t firstInstance, uint32_t count) const {
    if (count == 0 || !m_instanceBuffer) return;

    uint64_t instanceBytes = m_instances.size() * sizeof(InstanceRecord);
    for (const auto& mesh : m_meshes) {
        if (!mesh.valid()) continue;

        if (materialGroup >= 0 && !m_materials.empty()) {
            wgpuRenderPassEncoderSetBindGroup(pass, static_cast<uint32_t>(materialGroup),
                                              materialFor(mesh).bindGroup(), 0, nullptr);
        }
        wgpuRenderPassEncoderSetVertexBuffer(pass, 0, mesh.vertexBuffer(), 0,
                                             mesh.vertexCount() * sizeof(Vertex));
        wgpuRenderPassEncoderSetVertexBuffer(pass, 1, m_instanceBuffer, 0, instanceBytes);
        wgpuRenderPassEncoderSetIndexBuffer(pass, mesh.indexBuffer(), WGPUIndexFormat_Uint32, 0,
                                            mesh.indexCount() * sizeof(uint32_t));
        wgpuRenderPassEncoderDrawIndexed(pass, mesh.indexCount(), count, 0, 0, firstInstance);
    }
}

} // namespace penumbra
