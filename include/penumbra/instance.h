#pragma once

/**
 * @file instance.h
 * @brief Placed copies of a mesh and their per-instance vertex records
 */

#include <penumbra/gpu_structs.h>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

#include <cstdint>
#include <vector>

namespace penumbra {

/// One placed copy of a model, drawn through instanced rendering
struct Instance {
    glm::vec3 position{0.0f};
    glm::quat rotation{1.0f, 0.0f, 0.0f, 0.0f};

    /// Unrotated instance at a position
    static Instance at(const glm::vec3& position);

    /// translation * rotation
    glm::mat4 modelMatrix() const;

    /// Model matrix plus the inverse-transpose of its upper-left 3x3
    InstanceRecord toRecord() const;
};

/// Records for a whole instance list, in order
std::vector<InstanceRecord> toRecords(const std::vector<Instance>& instances);

/**
 * @brief Square grid of instances in the XZ plane
 *
 * Coordinates are spacing * (i - perRow / 2) along x and z. Each instance is
 * rotated 45 degrees about its normalized position; the one at the origin
 * keeps the identity rotation.
 */
std::vector<Instance> makeInstanceGrid(uint32_t perRow, float spacing);

/// Rotate a point about the +Y axis through the origin
glm::vec3 rotateAboutY(const glm::vec3& point, float degrees);

} // namespace penumbra
