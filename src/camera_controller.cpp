#include <penumbra/camera_controller.h>
#include <penumbra/camera.h>

namespace penumbra {

void CameraController::process(CameraIntent intent, bool pressed) {
    m_held[static_cast<std::size_t>(intent)] = pressed;
}

bool CameraController::isHeld(CameraIntent intent) const {
    return m_held[static_cast<std::size_t>(intent)];
}

void CameraController::reset() {
    m_held.fill(false);
}

bool CameraController::updateCamera(Camera& camera) const {
    float yaw = 0.0f;
    if (isHeld(CameraIntent::Right)) {
        yaw = ROTATION_STEP_DEGREES;
    } else if (isHeld(CameraIntent::Left)) {
        yaw = -ROTATION_STEP_DEGREES;
    }

    float pitch = 0.0f;
    if (isHeld(CameraIntent::Up)) {
        pitch = ROTATION_STEP_DEGREES;
    } else if (isHeld(CameraIntent::Down)) {
        pitch = -ROTATION_STEP_DEGREES;
    }

    float roll = 0.0f;
    if (isHeld(CameraIntent::RollCounterClockwise)) {
        roll = ROTATION_STEP_DEGREES;
    } else if (isHeld(CameraIntent::RollClockwise)) {
        roll = -ROTATION_STEP_DEGREES;
    }

    float radial = 0.0f;
    if (isHeld(CameraIntent::Forward)) {
        radial = RADIAL_STEP;
    } else if (isHeld(CameraIntent::Backward)) {
        radial = -RADIAL_STEP;
    }

    if (yaw == 0.0f && pitch == 0.0f && roll == 0.0f && radial == 0.0f) {
        return false;
    }

    camera.setView(camera.view().sphericalAdjust(yaw, pitch, roll, radial,
                                                 camera.projection().zNear()));
    return true;
}

} // namespace penumbra
