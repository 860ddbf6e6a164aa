#pragma once

/**
 * @file gpu_structs.h
 * @brief CPU mirrors of the records the shaders read
 *
 * Contains struct definitions that match the WGSL uniform, storage and vertex
 * layouts byte for byte. All structs have static_assert size checks.
 */

#include <glm/glm.hpp>
#include <cstddef>
#include <cstdint>

namespace penumbra {

// Number of slots in the light array and layers in the shadow depth array
constexpr uint32_t MAX_LIGHTS = 10;

// Lights the registry accepts; one array slot stays unused
constexpr uint32_t LIGHT_CAPACITY = MAX_LIGHTS - 1;

// Per-light record (96 bytes, 16-byte aligned)
struct LightRecord {
    float position[3];    // vec3f: 12 bytes, offset 0
    float _pad0;          // 4 bytes, offset 12
    float color[3];       // vec3f: 12 bytes, offset 16
    float _pad1;          // 4 bytes, offset 28
    float viewProj[16];   // mat4x4f: 64 bytes, offset 32
};

static_assert(sizeof(LightRecord) == 96, "LightRecord struct must be 96 bytes");

// Camera uniforms, group 0 binding 0 (80 bytes)
struct CameraUniforms {
    float viewPosition[4];  // vec4f: 16 bytes, offset 0 (w = 1)
    float viewProj[16];     // mat4x4f: 64 bytes, offset 16
};

static_assert(sizeof(CameraUniforms) == 80, "CameraUniforms struct must be 80 bytes");

// Per-instance vertex data, tightly packed (100 bytes)
struct InstanceRecord {
    float model[16];      // 4 x Float32x4: locations 3-6, offset 0
    float normal[9];      // 3 x Float32x3: locations 7-9, offset 64
};

static_assert(sizeof(InstanceRecord) == 100, "InstanceRecord struct must be 100 bytes");

// Mesh vertex (32 bytes)
struct Vertex {
    float position[3];    // Float32x3: location 0, offset 0
    float texCoord[2];    // Float32x2: location 1, offset 12
    float normal[3];      // Float32x3: location 2, offset 20
};

static_assert(sizeof(Vertex) == 32, "Vertex struct must be 32 bytes");

/// Build a light record; viewProj is copied column-major
LightRecord makeLightRecord(const glm::vec3& position, const glm::vec3& color,
                            const glm::mat4& viewProj);

/// Build the camera uniforms from an eye position and a remapped view-projection
CameraUniforms makeCameraUniforms(const glm::vec3& eye, const glm::mat4& viewProj);

/// Byte offset of a light's slot in the light array buffer
inline uint64_t lightSlotOffset(uint32_t index) {
    return static_cast<uint64_t>(index) * sizeof(LightRecord);
}

/// Size of the light array buffer
constexpr uint64_t LIGHT_ARRAY_SIZE = static_cast<uint64_t>(MAX_LIGHTS) * sizeof(LightRecord);

} // namespace penumbra
