#include <penumbra/camera.h>

#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

#include <algorithm>

namespace penumbra {

const glm::mat4 DEPTH_REMAP = glm::mat4(
    1.0f, 0.0f, 0.0f, 0.0f,
    0.0f, 1.0f, 0.0f, 0.0f,
    0.0f, 0.0f, 0.5f, 0.0f,
    0.0f, 0.0f, 0.5f, 1.0f
);

// -----------------------------------------------------------------------------
// Projection
// -----------------------------------------------------------------------------

Projection::Projection(float aspect, float fovY, float zNear, float zFar)
    : m_aspect(aspect), m_fovY(fovY), m_zNear(zNear), m_zFar(zFar) {
    rebuild();
}

void Projection::setAspect(float aspect) {
    m_aspect = aspect;
    rebuild();
}

void Projection::setFovY(float degrees) {
    m_fovY = degrees;
    rebuild();
}

void Projection::setClipPlanes(float zNear, float zFar) {
    m_zNear = zNear;
    m_zFar = zFar;
    rebuild();
}

void Projection::rebuild() {
    m_matrix = glm::perspective(glm::radians(m_fovY), m_aspect, m_zNear, m_zFar);
}

// -----------------------------------------------------------------------------
// View
// -----------------------------------------------------------------------------

View::View()
    : View(glm::vec3(0.0f, 0.0f, 50.0f), glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f)) {}

View::View(const glm::vec3& eye, const glm::vec3& target, const glm::vec3& up)
    : m_eye(eye), m_target(target), m_up(glm::normalize(up)) {
    rebuild();
}

void View::setPosition(const glm::vec3& eye) {
    m_eye = eye;
    rebuild();
}

void View::rebuild() {
    m_matrix = glm::lookAt(m_eye, m_target, m_up);
}

View View::sphericalAdjust(float yawDegrees, float pitchDegrees, float rollDegrees,
                           float radial, float zNear) const {
    glm::vec3 forward = glm::normalize(m_target - m_eye);
    glm::vec3 right = glm::normalize(glm::cross(forward, m_up));

    // Applied right to left: roll, then pitch, then yaw
    glm::quat rotation = glm::angleAxis(glm::radians(yawDegrees), m_up)
                       * glm::angleAxis(glm::radians(pitchDegrees), right)
                       * glm::angleAxis(glm::radians(rollDegrees), forward);

    glm::vec3 offset = m_eye - m_target;
    float distance = std::max(glm::length(offset) - radial, zNear);
    glm::vec3 eye = m_target + glm::normalize(rotation * offset) * distance;

    glm::vec3 newForward = glm::normalize(m_target - eye);
    glm::vec3 up = glm::normalize(rotation * m_up);
    up = up - glm::dot(up, newForward) * newForward;

    return View(eye, m_target, up);
}

// -----------------------------------------------------------------------------
// Camera
// -----------------------------------------------------------------------------

glm::mat4 Camera::buildViewProjectionMatrix() const {
    return DEPTH_REMAP * m_projection.matrix() * m_view.matrix();
}

} // namespace penumbra
