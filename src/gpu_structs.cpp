#include <penumbra/gpu_structs.h>

#include <glm/gtc/type_ptr.hpp>

#include <cstring>

namespace penumbra {

LightRecord makeLightRecord(const glm::vec3& position, const glm::vec3& color,
                            const glm::mat4& viewProj) {
    LightRecord record = {};
    record.position[0] = position.x;
    record.position[1] = position.y;
    record.position[2] = position.z;
    record.color[0] = color.r;
    record.color[1] = color.g;
    record.color[2] = color.b;
    std::memcpy(record.viewProj, glm::value_ptr(viewProj), sizeof(record.viewProj));
    return record;
}

CameraUniforms makeCameraUniforms(const glm::vec3& eye, const glm::mat4& viewProj) {
    CameraUniforms uniforms = {};
    uniforms.viewPosition[0] = eye.x;
    uniforms.viewPosition[1] = eye.y;
    uniforms.viewPosition[2] = eye.z;
    uniforms.viewPosition[3] = 1.0f;
    std::memcpy(uniforms.viewProj, glm::value_ptr(viewProj), sizeof(uniforms.viewProj));
    return uniforms;
}

} // namespace penumbra
