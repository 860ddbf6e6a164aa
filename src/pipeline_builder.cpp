#include <penumbra/pipeline_builder.h>
#include <penumbra/gpu_context.h>
#include <penumbra/gpu_structs.h>

#include <iostream>
#include <stdexcept>

namespace penumbra {

// -----------------------------------------------------------------------------
// Bind group layouts
// -----------------------------------------------------------------------------

static WGPUBindGroupLayoutEntry uniformEntry(uint32_t binding, uint64_t size,
                                             WGPUShaderStage visibility) {
    WGPUBindGroupLayoutEntry entry = {};
    entry.binding = binding;
    entry.visibility = visibility;
    entry.buffer.type = WGPUBufferBindingType_Uniform;
    entry.buffer.minBindingSize = size;
    return entry;
}

static WGPUBindGroupLayout createLayout(WGPUDevice device, const char* label,
                                        const WGPUBindGroupLayoutEntry* entries, size_t count) {
    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.label = toStringView(label);
    layoutDesc.entryCount = count;
    layoutDesc.entries = entries;
    return wgpuDeviceCreateBindGroupLayout(device, &layoutDesc);
}

BindGroupLayouts::BindGroupLayouts(WGPUDevice device) {
    const WGPUShaderStage vertexFragment = WGPUShaderStage_Vertex | WGPUShaderStage_Fragment;

    WGPUBindGroupLayoutEntry cameraEntry = uniformEntry(0, sizeof(CameraUniforms), vertexFragment);
    m_camera.reset(createLayout(device, "camera layout", &cameraEntry, 1));

    WGPUBindGroupLayoutEntry lightEntry = uniformEntry(0, sizeof(LightRecord), vertexFragment);
    m_light.reset(createLayout(device, "light layout", &lightEntry, 1));

    WGPUBindGroupLayoutEntry lightingEntries[2] = {
        uniformEntry(0, sizeof(uint32_t), WGPUShaderStage_Fragment),
        uniformEntry(1, LIGHT_ARRAY_SIZE, WGPUShaderStage_Fragment),
    };
    m_lighting.reset(createLayout(device, "lighting layout", lightingEntries, 2));

    WGPUBindGroupLayoutEntry shadowEntries[2] = {};
    shadowEntries[0].binding = 0;
    shadowEntries[0].visibility = WGPUShaderStage_Fragment;
    shadowEntries[0].texture.sampleType = WGPUTextureSampleType_Depth;
    shadowEntries[0].texture.viewDimension = WGPUTextureViewDimension_2DArray;
    shadowEntries[1].binding = 1;
    shadowEntries[1].visibility = WGPUShaderStage_Fragment;
    shadowEntries[1].sampler.type = WGPUSamplerBindingType_Comparison;
    m_shadow.reset(createLayout(device, "shadow layout", shadowEntries, 2));

    WGPUBindGroupLayoutEntry materialEntries[2] = {};
    materialEntries[0].binding = 0;
    materialEntries[0].visibility = WGPUShaderStage_Fragment;
    materialEntries[0].texture.sampleType = WGPUTextureSampleType_Float;
    materialEntries[0].texture.viewDimension = WGPUTextureViewDimension_2D;
    materialEntries[1].binding = 1;
    materialEntries[1].visibility = WGPUShaderStage_Fragment;
    materialEntries[1].sampler.type = WGPUSamplerBindingType_Filtering;
    m_material.reset(createLayout(device, "material layout", materialEntries, 2));
}

// -----------------------------------------------------------------------------
// PipelineBuilder
// -----------------------------------------------------------------------------

PipelineBuilder::PipelineBuilder(WGPUDevice device, WGPUShaderModule module)
    : m_device(device), m_module(module) {}

PipelineBuilder& PipelineBuilder::label(const char* label) {
    m_label = label;
    return *this;
}

PipelineBuilder& PipelineBuilder::bindGroupLayout(WGPUBindGroupLayout layout) {
    m_layouts.push_back(layout);
    return *this;
}

PipelineBuilder& PipelineBuilder::colorTarget(WGPUTextureFormat format) {
    m_hasColorTarget = true;
    m_colorFormat = format;
    return *this;
}

PipelineBuilder& PipelineBuilder::depthOnly() {
    m_hasColorTarget = false;
    m_colorFormat = WGPUTextureFormat_Undefined;
    return *this;
}

PipelineBuilder& PipelineBuilder::cullMode(WGPUCullMode mode) {
    m_cullMode = mode;
    return *this;
}

PipelineBuilder& PipelineBuilder::depthBias(int32_t constant, float slopeScale) {
    m_depthBias = constant;
    m_depthBiasSlopeScale = slopeScale;
    return *this;
}

RenderPipelineHandle PipelineBuilder::build() {
    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = m_layouts.size();
    pipelineLayoutDesc.bindGroupLayouts = m_layouts.data();
    PipelineLayoutHandle pipelineLayout(wgpuDeviceCreatePipelineLayout(m_device, &pipelineLayoutDesc));

    // Slot 0: mesh vertices
    WGPUVertexAttribute vertexAttributes[3] = {
        {WGPUVertexFormat_Float32x3, 0, 0},   // position
        {WGPUVertexFormat_Float32x2, 12, 1},  // uv
        {WGPUVertexFormat_Float32x3, 20, 2},  // normal
    };

    // Slot 1: per-instance model and normal matrices
    WGPUVertexAttribute instanceAttributes[7] = {
        {WGPUVertexFormat_Float32x4, 0, 3},
        {WGPUVertexFormat_Float32x4, 16, 4},
        {WGPUVertexFormat_Float32x4, 32, 5},
        {WGPUVertexFormat_Float32x4, 48, 6},
        {WGPUVertexFormat_Float32x3, 64, 7},
        {WGPUVertexFormat_Float32x3, 76, 8},
        {WGPUVertexFormat_Float32x3, 88, 9},
    };

    WGPUVertexBufferLayout bufferLayouts[2] = {};
    bufferLayouts[0].arrayStride = sizeof(Vertex);
    bufferLayouts[0].stepMode = WGPUVertexStepMode_Vertex;
    bufferLayouts[0].attributeCount = 3;
    bufferLayouts[0].attributes = vertexAttributes;
    bufferLayouts[1].arrayStride = sizeof(InstanceRecord);
    bufferLayouts[1].stepMode = WGPUVertexStepMode_Instance;
    bufferLayouts[1].attributeCount = 7;
    bufferLayouts[1].attributes = instanceAttributes;

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = m_colorFormat;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragmentState = {};
    fragmentState.module = m_module;
    fragmentState.entryPoint = toStringView("fs_main");
    fragmentState.targetCount = m_hasColorTarget ? 1 : 0;
    fragmentState.targets = m_hasColorTarget ? &colorTarget : nullptr;

    WGPUDepthStencilState depthState = {};
    depthState.format = DEPTH_FORMAT;
    depthState.depthWriteEnabled = WGPUOptionalBool_True;
    depthState.depthCompare = WGPUCompareFunction_Less;
    depthState.stencilFront.compare = WGPUCompareFunction_Always;
    depthState.stencilBack.compare = WGPUCompareFunction_Always;
    depthState.stencilReadMask = 0;
    depthState.stencilWriteMask = 0;
    depthState.depthBias = m_depthBias;
    depthState.depthBiasSlopeScale = m_depthBiasSlopeScale;
    depthState.depthBiasClamp = 0.0f;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = toStringView(m_label.c_str());
    pipelineDesc.layout = pipelineLayout;
    pipelineDesc.vertex.module = m_module;
    pipelineDesc.vertex.entryPoint = toStringView("vs_main");
    pipelineDesc.vertex.bufferCount = 2;
    pipelineDesc.vertex.buffers = bufferLayouts;
    pipelineDesc.fragment = &fragmentState;
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    pipelineDesc.primitive.frontFace = WGPUFrontFace_CCW;
    pipelineDesc.primitive.cullMode = m_cullMode;
    pipelineDesc.depthStencil = &depthState;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = ~0u;

    RenderPipelineHandle pipeline(wgpuDeviceCreateRenderPipeline(m_device, &pipelineDesc));
    if (!pipeline) {
        std::cerr << "[PipelineBuilder] ERROR: Failed to create " << m_label << std::endl;
        throw std::runtime_error("Failed to create render pipeline: " + m_label);
    }
    return pipeline;
}

} // namespace penumbra
