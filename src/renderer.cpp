#include <penumbra/renderer.h>
#include <penumbra/gpu_context.h>
#include <penumbra/lighting.h>
#include <penumbra/model.h>
#include <penumbra/pipeline_builder.h>
#include <penumbra/shader_library.h>
#include <penumbra/uniforms.h>

namespace penumbra {

Renderer::Renderer(WGPUDevice device, const BindGroupLayouts& layouts,
                   const ShaderLibrary& shaders, WGPUTextureFormat colorFormat,
                   uint32_t width, uint32_t height)
    : m_device(device) {
    m_pipeline = PipelineBuilder(device, shaders.model())
        .label("Model Pipeline")
        .bindGroupLayout(layouts.camera())
        .bindGroupLayout(layouts.lighting())
        .bindGroupLayout(layouts.shadow())
        .bindGroupLayout(layouts.material())
        .colorTarget(colorFormat)
        .build();

    m_depth = Texture::createDepth(device, width, height, "Main Depth");
}

void Renderer::resize(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) return;
    m_depth = Texture::createDepth(m_device, width, height, "Main Depth");
}

void Renderer::render(const GpuContext& gpu, WGPUTextureView target,
                      const CameraUniformBuffer& camera, const Lighting& lighting,
                      const std::vector<const Model*>& models) const {
    CommandEncoderHandle encoder = gpu.createEncoder("Main Encoder");

    WGPURenderPassColorAttachment colorAttachment = {};
    colorAttachment.view = target;
    colorAttachment.depthSlice = WGPU_DEPTH_SLICE_UNDEFINED;
    colorAttachment.loadOp = WGPULoadOp_Clear;
    colorAttachment.storeOp = WGPUStoreOp_Store;
    colorAttachment.clearValue = CLEAR_COLOR;

    WGPURenderPassDepthStencilAttachment depthAttachment = {};
    depthAttachment.view = m_depth.view();
    depthAttachment.depthLoadOp = WGPULoadOp_Clear;
    depthAttachment.depthStoreOp = WGPUStoreOp_Store;
    depthAttachment.depthClearValue = 1.0f;

    WGPURenderPassDescriptor passDesc = {};
    passDesc.label = toStringView("Main Pass");
    passDesc.colorAttachmentCount = 1;
    passDesc.colorAttachments = &colorAttachment;
    passDesc.depthStencilAttachment = &depthAttachment;

    WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);

    wgpuRenderPassEncoderSetPipeline(pass, m_pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, camera.bindGroup(), 0, nullptr);
    wgpuRenderPassEncoderSetBindGroup(pass, 1, lighting.bindGroup(), 0, nullptr);
    wgpuRenderPassEncoderSetBindGroup(pass, 2, lighting.shadowBindGroup(), 0, nullptr);
    for (const Model* model : models) {
        model->draw(pass, 3);
    }

    lighting.renderMarkers(pass, camera.bindGroup());

    wgpuRenderPassEncoderEnd(pass);
    wgpuRenderPassEncoderRelease(pass);

    gpu.submit(std::move(encoder));
}

} // namespace penumbra
