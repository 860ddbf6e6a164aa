#include <penumbra/uniforms.h>
#include <penumbra/camera.h>
#include <penumbra/gpu_context.h>
#include <penumbra/gpu_structs.h>
#include <penumbra/pipeline_builder.h>

namespace penumbra {

CameraUniformBuffer::CameraUniformBuffer(WGPUDevice device, const BindGroupLayouts& layouts) {
    m_buffer = createBuffer(device, "Camera Uniforms", sizeof(CameraUniforms),
                            WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst);

    WGPUBindGroupEntry entry = {};
    entry.binding = 0;
    entry.buffer = m_buffer;
    entry.offset = 0;
    entry.size = sizeof(CameraUniforms);

    WGPUBindGroupDescriptor bindDesc = {};
    bindDesc.label = toStringView("Camera Bind Group");
    bindDesc.layout = layouts.camera();
    bindDesc.entryCount = 1;
    bindDesc.entries = &entry;
    m_bindGroup.reset(wgpuDeviceCreateBindGroup(device, &bindDesc));
}

void CameraUniformBuffer::update(WGPUQueue queue, const Camera& camera) {
    CameraUniforms uniforms = makeCameraUniforms(camera.view().eye(),
                                                 camera.buildViewProjectionMatrix());
    wgpuQueueWriteBuffer(queue, m_buffer, 0, &uniforms, sizeof(CameraUniforms));
}

} // namespace penumbra
