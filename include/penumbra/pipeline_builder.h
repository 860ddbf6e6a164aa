#pragma once

/**
 * @file pipeline_builder.h
 * @brief Fluent construction of the render pipelines and the shared bind group layouts
 *
 * Every pipeline draws instanced meshes: vertex buffer slot 0 carries Vertex
 * (locations 0-2), slot 1 carries InstanceRecord (locations 3-9).
 */

#include <penumbra/gpu_handle.h>

#include <webgpu/webgpu.h>

#include <cstdint>
#include <string>
#include <vector>

namespace penumbra {

/// Depth format for the main depth buffer and the shadow array
constexpr WGPUTextureFormat DEPTH_FORMAT = WGPUTextureFormat_Depth32Float;

/// Bind group layouts, created once and shared by pipelines and bind groups
class BindGroupLayouts {
public:
    explicit BindGroupLayouts(WGPUDevice device);

    /// Camera uniforms (binding 0)
    WGPUBindGroupLayout camera() const { return m_camera; }
    /// One LightRecord (binding 0)
    WGPUBindGroupLayout light() const { return m_light; }
    /// Light count (binding 0) and light array (binding 1)
    WGPUBindGroupLayout lighting() const { return m_lighting; }
    /// Depth array texture (binding 0) and comparison sampler (binding 1)
    WGPUBindGroupLayout shadow() const { return m_shadow; }
    /// Material texture (binding 0) and filtering sampler (binding 1)
    WGPUBindGroupLayout material() const { return m_material; }

private:
    BindGroupLayoutHandle m_camera;
    BindGroupLayoutHandle m_light;
    BindGroupLayoutHandle m_lighting;
    BindGroupLayoutHandle m_shadow;
    BindGroupLayoutHandle m_material;
};

/// Pipeline builder with fluent interface
class PipelineBuilder {
public:
    PipelineBuilder(WGPUDevice device, WGPUShaderModule module);

    PipelineBuilder& label(const char* label);

    /// Append a bind group layout; the n-th call describes group n
    PipelineBuilder& bindGroupLayout(WGPUBindGroupLayout layout);

    /// Render into a colour target of this format
    PipelineBuilder& colorTarget(WGPUTextureFormat format);

    /// No colour target; depth is the only output
    PipelineBuilder& depthOnly();

    PipelineBuilder& cullMode(WGPUCullMode mode);
    PipelineBuilder& depthBias(int32_t constant, float slopeScale);

    /// @throws std::runtime_error if the pipeline cannot be created
    RenderPipelineHandle build();

private:
    WGPUDevice m_device;
    WGPUShaderModule m_module;
    std::string m_label = "render pipeline";
    std::vector<WGPUBindGroupLayout> m_layouts;
    bool m_hasColorTarget = false;
    WGPUTextureFormat m_colorFormat = WGPUTextureFormat_Undefined;
    WGPUCullMode m_cullMode = WGPUCullMode_Back;
    int32_t m_depthBias = 0;
    float m_depthBiasSlopeScale = 0.0f;
};

} // namespace penumbra
