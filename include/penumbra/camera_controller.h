#pragma once

#include <array>
#include <cstddef>

namespace penumbra {

class Camera;

/// Movement intents the controller tracks. Input glue maps keys onto these.
enum class CameraIntent {
    Up,
    Down,
    Left,
    Right,
    Forward,
    Backward,
    RollClockwise,
    RollCounterClockwise,
};

/// Turns held intents into one spherical adjustment of the camera per frame
class CameraController {
public:
    static constexpr float ROTATION_STEP_DEGREES = 6.0f;
    static constexpr float RADIAL_STEP = 0.3f;

    /// Record an intent as held (pressed) or released
    void process(CameraIntent intent, bool pressed);

    bool isHeld(CameraIntent intent) const;

    /// Release every intent
    void reset();

    /**
     * @brief Apply the held intents to the camera
     *
     * yaw +step for Right, -step for Left; pitch +step for Up, -step for Down;
     * roll +step for RollCounterClockwise, -step for RollClockwise; radial
     * +RADIAL_STEP for Forward, -RADIAL_STEP for Backward. The first of each
     * pair wins when both are held.
     *
     * @return false (camera untouched) when every delta is zero
     */
    bool updateCamera(Camera& camera) const;

private:
    static constexpr std::size_t INTENT_COUNT = 8;
    std::array<bool, INTENT_COUNT> m_held{};
};

} // namespace penumbra
