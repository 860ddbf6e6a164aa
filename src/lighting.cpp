#include <penumbra/lighting.h>
#include <penumbra/camera.h>
#include <penumbra/gpu_context.h>
#include <penumbra/pipeline_builder.h>
#include <penumbra/shader_library.h>

#include <iostream>

namespace penumbra {

Lighting::Lighting(WGPUDevice device, WGPUQueue queue, const BindGroupLayouts& layouts,
                   const ShaderLibrary& shaders, WGPUTextureFormat colorFormat,
                   uint32_t width, uint32_t height, Model markerModel)
    : m_device(device),
      m_queue(queue),
      m_layouts(layouts),
      m_markerModel(std::move(markerModel)),
      m_baker(device, layouts, shaders, width, height) {
    m_countBuffer = createBuffer(device, "Light Count", sizeof(uint32_t),
                                 WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst);
    m_countStaging = createBuffer(device, "Light Count Staging", sizeof(uint32_t),
                                  WGPUBufferUsage_CopySrc | WGPUBufferUsage_CopyDst);
    m_arrayBuffer = createBuffer(device, "Light Array", LIGHT_ARRAY_SIZE,
                                 WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst);

    uint32_t zero = 0;
    wgpuQueueWriteBuffer(queue, m_countBuffer, 0, &zero, sizeof(zero));

    WGPUBindGroupEntry entries[2] = {};
    entries[0].binding = 0;
    entries[0].buffer = m_countBuffer;
    entries[0].size = sizeof(uint32_t);
    entries[1].binding = 1;
    entries[1].buffer = m_arrayBuffer;
    entries[1].size = LIGHT_ARRAY_SIZE;

    WGPUBindGroupDescriptor bindDesc = {};
    bindDesc.label = toStringView("Lighting Bind Group");
    bindDesc.layout = layouts.lighting();
    bindDesc.entryCount = 2;
    bindDesc.entries = entries;
    m_bindGroup.reset(wgpuDeviceCreateBindGroup(device, &bindDesc));

    m_markerPipeline = PipelineBuilder(device, shaders.marker())
        .label("Light Marker Pipeline")
        .bindGroupLayout(layouts.camera())
        .bindGroupLayout(layouts.light())
        .colorTarget(colorFormat)
        .build();

    // One marker instance per slot, placed when a light takes the slot
    m_markerModel.setInstances(device, queue, std::vector<Instance>(MAX_LIGHTS));
}

LightSlot Lighting::addSpotlight(const std::string& name, const glm::vec3& color,
                                 const Projection& projection, const View& view) {
    LightSlot slot = m_slots.acquire(name);
    if (!slot) {
        std::cerr << "[Lighting] Cannot add light '" << name << "': "
                  << toString(slot.error) << " (" << m_slots.capacity() << " lights)"
                  << std::endl;
        return slot;
    }

    if (slot.replaced) {
        // Old buffer and bind group are released before the new light is built
        m_lights[slot.index].reset();
    } else {
        m_lights.emplace_back();
    }

    m_lights[slot.index] = std::make_unique<Light>(
        m_device, m_queue, m_layouts, LightSource(Spotlight(color, projection, view)), slot.index);
    m_lights[slot.index]->placeMarker(m_queue, m_markerModel);

    syncSlot(slot.index);

    std::cout << "[Lighting] " << (slot.replaced ? "Replaced" : "Added") << " light '" << name
              << "' in slot " << slot.index << std::endl;
    return slot;
}

void Lighting::syncSlot(uint32_t index) {
    uint32_t count = m_slots.size();
    wgpuQueueWriteBuffer(m_queue, m_countStaging, 0, &count, sizeof(count));

    CommandEncoderHandle encoder(wgpuDeviceCreateCommandEncoder(m_device, nullptr));
    wgpuCommandEncoderCopyBufferToBuffer(encoder, m_lights[index]->buffer(), 0,
                                         m_arrayBuffer, lightSlotOffset(index),
                                         sizeof(LightRecord));
    wgpuCommandEncoderCopyBufferToBuffer(encoder, m_countStaging, 0,
                                         m_countBuffer, 0, sizeof(uint32_t));

    WGPUCommandBuffer commands = wgpuCommandEncoderFinish(encoder, nullptr);
    wgpuQueueSubmit(m_queue, 1, &commands);
    wgpuCommandBufferRelease(commands);
}

const Light* Lighting::get(const std::string& name) const {
    auto index = m_slots.find(name);
    if (!index) return nullptr;
    return m_lights[*index].get();
}

bool Lighting::setLightPosition(const std::string& name, const glm::vec3& position) {
    auto index = m_slots.find(name);
    if (!index) return false;

    Light& light = *m_lights[*index];
    light.setPosition(m_queue, position);
    light.placeMarker(m_queue, m_markerModel);
    wgpuQueueWriteBuffer(m_queue, m_arrayBuffer, lightSlotOffset(*index),
                         &light.record(), sizeof(LightRecord));
    return true;
}

bool Lighting::setLightColor(const std::string& name, const glm::vec3& color) {
    auto index = m_slots.find(name);
    if (!index) return false;

    Light& light = *m_lights[*index];
    light.setColor(m_queue, color);
    wgpuQueueWriteBuffer(m_queue, m_arrayBuffer, lightSlotOffset(*index),
                         &light.record(), sizeof(LightRecord));
    return true;
}

void Lighting::bake(WGPUCommandEncoder encoder, const std::vector<const Model*>& models) const {
    m_baker.bake(encoder, m_lights, models);
}

void Lighting::renderMarkers(WGPURenderPassEncoder pass, WGPUBindGroup cameraBindGroup) const {
    if (!m_markersVisible || m_lights.empty()) return;

    wgpuRenderPassEncoderSetPipeline(pass, m_markerPipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, cameraBindGroup, 0, nullptr);
    for (const auto& light : m_lights) {
        wgpuRenderPassEncoderSetBindGroup(pass, 1, light->bindGroup(), 0, nullptr);
        m_markerModel.drawInstance(pass, -1, light->markerInstance());
    }
}

} // namespace penumbra
