#include <penumbra/light.h>
#include <penumbra/gpu_context.h>
#include <penumbra/model.h>
#include <penumbra/pipeline_builder.h>

namespace penumbra {

Light::Light(WGPUDevice device, WGPUQueue queue, const BindGroupLayouts& layouts,
             const LightSource& source, uint32_t markerInstance)
    : m_source(source), m_markerInstance(markerInstance) {
    m_buffer = createBuffer(device, "Light Buffer", sizeof(LightRecord),
                            WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst |
                            WGPUBufferUsage_CopySrc);
    writeRecord(queue);

    WGPUBindGroupEntry entry = {};
    entry.binding = 0;
    entry.buffer = m_buffer;
    entry.offset = 0;
    entry.size = sizeof(LightRecord);

    WGPUBindGroupDescriptor bindDesc = {};
    bindDesc.label = toStringView("Light Bind Group");
    bindDesc.layout = layouts.light();
    bindDesc.entryCount = 1;
    bindDesc.entries = &entry;
    m_bindGroup.reset(wgpuDeviceCreateBindGroup(device, &bindDesc));
}

void Light::setPosition(WGPUQueue queue, const glm::vec3& position) {
    m_source.setPosition(position);
    writeRecord(queue);
}

void Light::setColor(WGPUQueue queue, const glm::vec3& color) {
    m_source.setColor(color);
    writeRecord(queue);
}

void Light::placeMarker(WGPUQueue queue, Model& markers) const {
    markers.updateInstance(queue, m_markerInstance, Instance::at(position()));
}

void Light::writeRecord(WGPUQueue queue) const {
    const LightRecord& lightRecord = m_source.record();
    wgpuQueueWriteBuffer(queue, m_buffer, 0, &lightRecord, sizeof(LightRecord));
}

} // namespace penumbra
