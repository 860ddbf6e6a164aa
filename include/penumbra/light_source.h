#pragma once

/**
 * @file light_source.h
 * @brief Light geometry, independent of any GPU resources
 *
 * The set of light kinds is closed. LightSource holds one of them and
 * dispatches on kind(); adding a kind means extending LightKind, the variant
 * and each switch.
 */

#include <penumbra/camera.h>
#include <penumbra/gpu_structs.h>

#include <glm/glm.hpp>

#include <variant>

namespace penumbra {

/// Shadow-casting light looking from its eye toward a target
class Spotlight {
public:
    Spotlight(const glm::vec3& color, const Projection& projection, const View& view);

    const glm::vec3& position() const { return m_view.eye(); }
    const glm::vec3& color() const { return m_color; }
    const View& view() const { return m_view; }
    const Projection& projection() const { return m_projection; }

    /// projection * view, without the depth remap the camera applies
    const glm::mat4& viewProjection() const { return m_viewProjection; }

    /// Record for the light array and the shadow pass
    const LightRecord& record() const { return m_record; }

    void setPosition(const glm::vec3& position);
    void setColor(const glm::vec3& color);

private:
    void rebuild();

    glm::vec3 m_color;
    Projection m_projection;
    View m_view;
    glm::mat4 m_viewProjection{1.0f};
    LightRecord m_record{};
};

/**
 * @brief Up vector for a light looking from position toward target
 *
 * World +Y, or world +Z when the light looks (nearly) straight up or down,
 * where +Y would be parallel to the view direction.
 */
glm::vec3 spotlightUp(const glm::vec3& position, const glm::vec3& target);

enum class LightKind {
    Spot,
};

/// One light of any supported kind
class LightSource {
public:
    LightSource(const Spotlight& spotlight) : m_light(spotlight) {}

    LightKind kind() const;

    glm::vec3 position() const;
    glm::vec3 color() const;
    const LightRecord& record() const;

    void setPosition(const glm::vec3& position);
    void setColor(const glm::vec3& color);

    /// nullptr unless kind() == LightKind::Spot
    const Spotlight* asSpotlight() const { return std::get_if<Spotlight>(&m_light); }

private:
    std::variant<Spotlight> m_light;
};

} // namespace penumbra
