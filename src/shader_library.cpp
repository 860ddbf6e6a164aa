#include <penumbra/shader_library.h>
#include <penumbra/gpu_context.h>

#include <iostream>
#include <stdexcept>
#include <string>

namespace penumbra {

// Shared declarations. Light matches LightRecord: vec3f members align to 16.
static const char* COMMON_SHADER_SOURCE = R"(
struct Camera {
    viewPosition: vec4f,
    viewProj: mat4x4f,
}

struct Light {
    position: vec3f,
    color: vec3f,
    viewProj: mat4x4f,
}

struct VertexInput {
    @location(0) position: vec3f,
    @location(1) uv: vec2f,
    @location(2) normal: vec3f,
}

struct InstanceInput {
    @location(3) model0: vec4f,
    @location(4) model1: vec4f,
    @location(5) model2: vec4f,
    @location(6) model3: vec4f,
    @location(7) normal0: vec3f,
    @location(8) normal1: vec3f,
    @location(9) normal2: vec3f,
}

fn instanceModel(instance: InstanceInput) -> mat4x4f {
    return mat4x4f(instance.model0, instance.model1, instance.model2, instance.model3);
}

fn instanceNormal(instance: InstanceInput) -> mat3x3f {
    return mat3x3f(instance.normal0, instance.normal1, instance.normal2);
}

// Light matrices use the [-1, 1] depth range
fn remapDepth(clip: vec4f) -> vec4f {
    return vec4f(clip.x, clip.y, clip.z * 0.5 + clip.w * 0.5, clip.w);
}
)";

static const char* MODEL_SHADER_SOURCE = R"(
const MAX_LIGHTS: u32 = 10u;
const AMBIENT: f32 = 0.1;

@group(0) @binding(0) var<uniform> camera: Camera;
@group(1) @binding(0) var<uniform> lightCount: u32;
@group(1) @binding(1) var<uniform> lights: array<Light, 10>;
@group(2) @binding(0) var shadowMaps: texture_depth_2d_array;
@group(2) @binding(1) var shadowSampler: sampler_comparison;
@group(3) @binding(0) var diffuseTexture: texture_2d<f32>;
@group(3) @binding(1) var diffuseSampler: sampler;

struct VertexOutput {
    @builtin(position) clipPosition: vec4f,
    @location(0) uv: vec2f,
    @location(1) worldNormal: vec3f,
    @location(2) worldPosition: vec3f,
}

@vertex
fn vs_main(vertex: VertexInput, instance: InstanceInput) -> VertexOutput {
    let world = instanceModel(instance) * vec4f(vertex.position, 1.0);
    var out: VertexOutput;
    out.clipPosition = camera.viewProj * world;
    out.uv = vertex.uv;
    out.worldNormal = instanceNormal(instance) * vertex.normal;
    out.worldPosition = world.xyz;
    return out;
}

// 1.0 = lit. Fragments outside the light frustum are lit.
fn shadowFactor(index: u32, worldPosition: vec3f) -> f32 {
    let lightClip = remapDepth(lights[index].viewProj * vec4f(worldPosition, 1.0));
    if (lightClip.w <= 0.0) {
        return 1.0;
    }
    let ndc = lightClip.xyz / lightClip.w;
    let uv = vec2f(ndc.x * 0.5 + 0.5, -ndc.y * 0.5 + 0.5);
    if (uv.x < 0.0 || uv.x > 1.0 || uv.y < 0.0 || uv.y > 1.0 || ndc.z > 1.0) {
        return 1.0;
    }
    return textureSampleCompareLevel(shadowMaps, shadowSampler, uv, i32(index), ndc.z);
}

@fragment
fn fs_main(in: VertexOutput) -> @location(0) vec4f {
    let base = textureSample(diffuseTexture, diffuseSampler, in.uv);
    let normal = normalize(in.worldNormal);

    var color = base.rgb * AMBIENT;
    let count = min(lightCount, MAX_LIGHTS);
    for (var i = 0u; i < count; i = i + 1u) {
        let toLight = normalize(lights[i].position - in.worldPosition);
        let diffuse = max(dot(normal, toLight), 0.0);
        color = color + base.rgb * lights[i].color * diffuse * shadowFactor(i, in.worldPosition);
    }
    return vec4f(color, base.a);
}
)";

static const char* MARKER_SHADER_SOURCE = R"(
@group(0) @binding(0) var<uniform> camera: Camera;
@group(1) @binding(0) var<uniform> light: Light;

@vertex
fn vs_main(vertex: VertexInput, instance: InstanceInput) -> @builtin(position) vec4f {
    return camera.viewProj * instanceModel(instance) * vec4f(vertex.position, 1.0);
}

@fragment
fn fs_main() -> @location(0) vec4f {
    return vec4f(light.color, 1.0);
}
)";

static const char* SHADOW_SHADER_SOURCE = R"(
@group(0) @binding(0) var<uniform> light: Light;

@vertex
fn vs_main(vertex: VertexInput, instance: InstanceInput) -> @builtin(position) vec4f {
    let world = instanceModel(instance) * vec4f(vertex.position, 1.0);
    return remapDepth(light.viewProj * world);
}

@fragment
fn fs_main() {}
)";

static ShaderModuleHandle compileModule(WGPUDevice device, const char* label, const char* body) {
    std::string source = std::string(COMMON_SHADER_SOURCE) + body;

    WGPUShaderSourceWGSL wgsl = {};
    wgsl.chain.sType = WGPUSType_ShaderSourceWGSL;
    wgsl.code = toStringView(source.c_str());

    WGPUShaderModuleDescriptor moduleDesc = {};
    moduleDesc.nextInChain = &wgsl.chain;
    moduleDesc.label = toStringView(label);

    ShaderModuleHandle module(wgpuDeviceCreateShaderModule(device, &moduleDesc));
    if (!module) {
        std::cerr << "[ShaderLibrary] ERROR: Failed to create " << label << std::endl;
        throw std::runtime_error(std::string("Failed to compile shader: ") + label);
    }
    return module;
}

ShaderLibrary::ShaderLibrary(WGPUDevice device)
    : m_model(compileModule(device, "model shader", MODEL_SHADER_SOURCE)),
      m_marker(compileModule(device, "marker shader", MARKER_SHADER_SOURCE)),
      m_shadow(compileModule(device, "shadow shader", SHADOW_SHADER_SOURCE)) {}

} // namespace penumbra
