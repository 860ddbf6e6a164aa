#include <penumbra/shadow_baker.h>
#include <penumbra/gpu_context.h>
#include <penumbra/gpu_structs.h>
#include <penumbra/light.h>
#include <penumbra/model.h>
#include <penumbra/pipeline_builder.h>
#include <penumbra/shader_library.h>

#include <iostream>

namespace penumbra {

ShadowBaker::ShadowBaker(WGPUDevice device, const BindGroupLayouts& layouts,
                         const ShaderLibrary& shaders, uint32_t width, uint32_t height)
    : m_device(device), m_layouts(layouts), m_width(width), m_height(height) {
    // Comparison sampler for the main pass
    WGPUSamplerDescriptor samplerDesc = {};
    samplerDesc.label = toStringView("Shadow Comparison Sampler");
    samplerDesc.addressModeU = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeV = WGPUAddressMode_ClampToEdge;
    samplerDesc.addressModeW = WGPUAddressMode_ClampToEdge;
    samplerDesc.magFilter = WGPUFilterMode_Linear;
    samplerDesc.minFilter = WGPUFilterMode_Linear;
    samplerDesc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
    samplerDesc.lodMinClamp = 0.0f;
    samplerDesc.lodMaxClamp = 32.0f;
    samplerDesc.compare = WGPUCompareFunction_LessEqual;
    samplerDesc.maxAnisotropy = 1;
    m_sampler.reset(wgpuDeviceCreateSampler(device, &samplerDesc));

    // Scratch uniform holding the light being baked
    m_scratchBuffer = createBuffer(device, "Shadow Scratch Light", sizeof(LightRecord),
                                   WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst);

    WGPUBindGroupEntry scratchEntry = {};
    scratchEntry.binding = 0;
    scratchEntry.buffer = m_scratchBuffer;
    scratchEntry.size = sizeof(LightRecord);

    WGPUBindGroupDescriptor scratchDesc = {};
    scratchDesc.label = toStringView("Shadow Scratch Bind Group");
    scratchDesc.layout = layouts.light();
    scratchDesc.entryCount = 1;
    scratchDesc.entries = &scratchEntry;
    m_scratchBindGroup.reset(wgpuDeviceCreateBindGroup(device, &scratchDesc));

    m_pipeline = PipelineBuilder(device, shaders.shadow())
        .label("Shadow Pipeline")
        .bindGroupLayout(layouts.light())
        .depthOnly()
        .cullMode(WGPUCullMode_Back)
        .depthBias(DEPTH_BIAS, DEPTH_BIAS_SLOPE_SCALE)
        .build();

    createDepthArray();
}

void ShadowBaker::createDepthArray() {
    m_bindGroup.reset();
    m_layerViews.clear();
    m_arrayView.reset();
    m_depthArray.reset();

    WGPUTextureDescriptor texDesc = {};
    texDesc.label = toStringView("Shadow Depth Array");
    texDesc.size.width = m_width;
    texDesc.size.height = m_height;
    texDesc.size.depthOrArrayLayers = MAX_LIGHTS;
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = DEPTH_FORMAT;
    texDesc.usage = WGPUTextureUsage_RenderAttachment | WGPUTextureUsage_TextureBinding;
    m_depthArray.reset(wgpuDeviceCreateTexture(m_device, &texDesc));

    // One view per layer for the depth passes
    m_layerViews.reserve(MAX_LIGHTS);
    for (uint32_t layer = 0; layer < MAX_LIGHTS; ++layer) {
        WGPUTextureViewDescriptor layerDesc = {};
        layerDesc.label = toStringView("Shadow Layer View");
        layerDesc.format = DEPTH_FORMAT;
        layerDesc.dimension = WGPUTextureViewDimension_2D;
        layerDesc.baseMipLevel = 0;
        layerDesc.mipLevelCount = 1;
        layerDesc.baseArrayLayer = layer;
        layerDesc.arrayLayerCount = 1;
        layerDesc.aspect = WGPUTextureAspect_DepthOnly;
        m_layerViews.emplace_back(wgpuTextureCreateView(m_depthArray, &layerDesc));
    }

    // Whole array for sampling
    WGPUTextureViewDescriptor arrayDesc = {};
    arrayDesc.label = toStringView("Shadow Array View");
    arrayDesc.format = DEPTH_FORMAT;
    arrayDesc.dimension = WGPUTextureViewDimension_2DArray;
    arrayDesc.baseMipLevel = 0;
    arrayDesc.mipLevelCount = 1;
    arrayDesc.baseArrayLayer = 0;
    arrayDesc.arrayLayerCount = MAX_LIGHTS;
    arrayDesc.aspect = WGPUTextureAspect_DepthOnly;
    m_arrayView.reset(wgpuTextureCreateView(m_depthArray, &arrayDesc));

    WGPUBindGroupEntry entries[2] = {};
    entries[0].binding = 0;
    entries[0].textureView = m_arrayView;
    entries[1].binding = 1;
    entries[1].sampler = m_sampler;

    WGPUBindGroupDescriptor bindDesc = {};
    bindDesc.label = toStringView("Shadow Bind Group");
    bindDesc.layout = m_layouts.shadow();
    bindDesc.entryCount = 2;
    bindDesc.entries = entries;
    m_bindGroup.reset(wgpuDeviceCreateBindGroup(m_device, &bindDesc));
}

void ShadowBaker::resize(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) return;
    if (width == m_width && height == m_height) return;
    m_width = width;
    m_height = height;
    createDepthArray();
    std::cout << "[ShadowBaker] Shadow maps resized to " << width << "x" << height << std::endl;
}

void ShadowBaker::bake(WGPUCommandEncoder encoder,
                       const std::vector<std::unique_ptr<Light>>& lights,
                       const std::vector<const Model*>& models) const {
    for (size_t i = 0; i < lights.size() && i < m_layerViews.size(); ++i) {
        const Light& light = *lights[i];

        wgpuCommandEncoderCopyBufferToBuffer(encoder, light.buffer(), 0,
                                             m_scratchBuffer, 0, sizeof(LightRecord));

        WGPURenderPassDepthStencilAttachment depthAttachment = {};
        depthAttachment.view = m_layerViews[i];
        depthAttachment.depthLoadOp = WGPULoadOp_Clear;
        depthAttachment.depthStoreOp = WGPUStoreOp_Store;
        depthAttachment.depthClearValue = 1.0f;
        // Depth32Float has no stencil aspect; load/store ops stay undefined
        depthAttachment.stencilClearValue = 0;

        WGPURenderPassDescriptor passDesc = {};
        passDesc.label = toStringView("Shadow Pass");
        passDesc.colorAttachmentCount = 0;
        passDesc.depthStencilAttachment = &depthAttachment;

        WGPURenderPassEncoder pass = wgpuCommandEncoderBeginRenderPass(encoder, &passDesc);
        wgpuRenderPassEncoderSetPipeline(pass, m_pipeline);
        wgpuRenderPassEncoderSetBindGroup(pass, 0, m_scratchBindGroup, 0, nullptr);

        for (const Model* model : models) {
            model->draw(pass, -1);
        }

        wgpuRenderPassEncoderEnd(pass);
        wgpuRenderPassEncoderRelease(pass);
    }
}

} // namespace penumbra
