#include <penumbra/instance.h>

#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/type_ptr.hpp>

#include <cstring>

namespace penumbra {

Instance Instance::at(const glm::vec3& position) {
    Instance instance;
    instance.position = position;
    return instance;
}

glm::mat4 Instance::modelMatrix() const {
    return glm::translate(glm::mat4(1.0f), position) * glm::mat4_cast(rotation);
}

InstanceRecord Instance::toRecord() const {
    glm::mat4 model = modelMatrix();
    glm::mat3 normal = glm::transpose(glm::inverse(glm::mat3(model)));

    InstanceRecord record = {};
    std::memcpy(record.model, glm::value_ptr(model), sizeof(record.model));
    std::memcpy(record.normal, glm::value_ptr(normal), sizeof(record.normal));
    return record;
}

std::vector<InstanceRecord> toRecords(const std::vector<Instance>& instances) {
    std::vector<InstanceRecord> records;
    records.reserve(instances.size());
    for (const auto& instance : instances) {
        records.push_back(instance.toRecord());
    }
    return records;
}

std::vector<Instance> makeInstanceGrid(uint32_t perRow, float spacing) {
    std::vector<Instance> instances;
    instances.reserve(static_cast<size_t>(perRow) * perRow);

    float half = static_cast<float>(perRow) / 2.0f;
    for (uint32_t z = 0; z < perRow; ++z) {
        for (uint32_t x = 0; x < perRow; ++x) {
            Instance instance;
            instance.position = glm::vec3(spacing * (static_cast<float>(x) - half),
                                          0.0f,
                                          spacing * (static_cast<float>(z) - half));
            // A zero axis would give a degenerate quaternion
            if (glm::length(instance.position) > 0.0f) {
                instance.rotation = glm::angleAxis(glm::radians(45.0f),
                                                   glm::normalize(instance.position));
            }
            instances.push_back(instance);
        }
    }
    return instances;
}

glm::vec3 rotateAboutY(const glm::vec3& point, float degrees) {
    return glm::angleAxis(glm::radians(degrees), glm::vec3(0.0f, 1.0f, 0.0f)) * point;
}

} // namespace penumbra
