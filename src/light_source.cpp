#include <penumbra/light_source.h>

#include <cmath>

namespace penumbra {

// -----------------------------------------------------------------------------
// Spotlight
// -----------------------------------------------------------------------------

Spotlight::Spotlight(const glm::vec3& color, const Projection& projection, const View& view)
    : m_color(color), m_projection(projection), m_view(view) {
    rebuild();
}

void Spotlight::setPosition(const glm::vec3& position) {
    m_view.setPosition(position);
    rebuild();
}

void Spotlight::setColor(const glm::vec3& color) {
    m_color = color;
    rebuild();
}

void Spotlight::rebuild() {
    m_viewProjection = m_projection.matrix() * m_view.matrix();
    m_record = makeLightRecord(m_view.eye(), m_color, m_viewProjection);
}

glm::vec3 spotlightUp(const glm::vec3& position, const glm::vec3& target) {
    const glm::vec3 worldUp(0.0f, 1.0f, 0.0f);
    glm::vec3 direction = target - position;
    float length = glm::length(direction);
    if (length <= 0.0f) {
        return worldUp;
    }
    if (std::abs(glm::dot(direction / length, worldUp)) > 0.999f) {
        return glm::vec3(0.0f, 0.0f, 1.0f);
    }
    return worldUp;
}

// -----------------------------------------------------------------------------
// LightSource
// -----------------------------------------------------------------------------

// Variant alternatives are declared in LightKind order
LightKind LightSource::kind() const {
    return static_cast<LightKind>(m_light.index());
}

glm::vec3 LightSource::position() const {
    switch (kind()) {
        case LightKind::Spot:
            return std::get<Spotlight>(m_light).position();
    }
    return glm::vec3(0.0f);
}

glm::vec3 LightSource::color() const {
    switch (kind()) {
        case LightKind::Spot:
            return std::get<Spotlight>(m_light).color();
    }
    return glm::vec3(0.0f);
}

const LightRecord& LightSource::record() const {
    switch (kind()) {
        case LightKind::Spot:
        default:
            return std::get<Spotlight>(m_light).record();
    }
}

void LightSource::setPosition(const glm::vec3& position) {
    switch (kind()) {
        case LightKind::Spot:
            std::get<Spotlight>(m_light).setPosition(position);
            break;
    }
}

void LightSource::setColor(const glm::vec3& color) {
    switch (kind()) {
        case LightKind::Spot:
            std::get<Spotlight>(m_light).setColor(color);
            break;
    }
}

} // namespace penumbra
