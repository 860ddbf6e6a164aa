#pragma once

/**
 * @file camera.h
 * @brief Viewpoint and perspective model
 *
 * View and Projection cache their matrices and recompute them inside every
 * constructor and setter, so the cached matrix always matches the parameters.
 */

#include <glm/glm.hpp>

namespace penumbra {

/// Remaps clip-space z from the OpenGL range [-1, 1] to the WebGPU range [0, 1]
/// (z' = 0.5 z + 0.5 w). Columns: (1,0,0,0) (0,1,0,0) (0,0,0.5,0) (0,0,0.5,1).
extern const glm::mat4 DEPTH_REMAP;

/// Perspective parameters and the matrix built from them
class Projection {
public:
    static constexpr float DEFAULT_FOV_Y = 45.0f;
    static constexpr float DEFAULT_Z_NEAR = 0.1f;
    static constexpr float DEFAULT_Z_FAR = 100.0f;

    /// @param fovY Vertical field of view in degrees
    /// @note 0 < zNear < zFar is not validated
    explicit Projection(float aspect,
                        float fovY = DEFAULT_FOV_Y,
                        float zNear = DEFAULT_Z_NEAR,
                        float zFar = DEFAULT_Z_FAR);

    /// Projection with default fov and clip planes
    static Projection withAspect(float aspect) { return Projection(aspect); }

    // -------------------------------------------------------------------------
    /// @name Setters
    /// @{

    /// Set aspect ratio (width / height), e.g. on window resize
    void setAspect(float aspect);
    void setFovY(float degrees);
    void setClipPlanes(float zNear, float zFar);

    /// @}
    // -------------------------------------------------------------------------
    /// @name Accessors
    /// @{

    float aspect() const { return m_aspect; }
    float fovY() const { return m_fovY; }
    float zNear() const { return m_zNear; }
    float zFar() const { return m_zFar; }

    /// OpenGL-convention perspective matrix
    const glm::mat4& matrix() const { return m_matrix; }

    /// @}

private:
    void rebuild();

    float m_aspect;
    float m_fovY;
    float m_zNear;
    float m_zFar;
    glm::mat4 m_matrix{1.0f};
};

/// Eye, look-at target and up direction
class View {
public:
    /// Eye at (0, 0, 50) looking at the origin with +Y up
    View();

    /// @note up is normalized; a zero up vector is a caller error
    View(const glm::vec3& eye, const glm::vec3& target, const glm::vec3& up);

    const glm::vec3& eye() const { return m_eye; }
    const glm::vec3& target() const { return m_target; }
    const glm::vec3& up() const { return m_up; }

    /// Look-at matrix
    const glm::mat4& matrix() const { return m_matrix; }

    /// Move the eye and recompute the matrix. Target and up are kept.
    void setPosition(const glm::vec3& eye);

    /**
     * @brief Orbit the eye around the target
     *
     * Rotates the eye offset and up by roll about forward, then pitch about
     * right, then yaw about up (all in degrees). The orbit radius shrinks by
     * radial but never below zNear. The new up is re-orthogonalized against
     * the new forward direction and normalized.
     *
     * @return A new View; this one is unchanged
     */
    View sphericalAdjust(float yawDegrees, float pitchDegrees, float rollDegrees,
                         float radial,
                         float zNear = Projection::DEFAULT_Z_NEAR) const;

private:
    void rebuild();

    glm::vec3 m_eye;
    glm::vec3 m_target;
    glm::vec3 m_up;
    glm::mat4 m_matrix{1.0f};
};

/// A View and a Projection
class Camera {
public:
    Camera(const View& view, const Projection& projection)
        : m_view(view), m_projection(projection) {}

    const View& view() const { return m_view; }
    void setView(const View& view) { m_view = view; }

    const Projection& projection() const { return m_projection; }
    Projection& projection() { return m_projection; }

    /// DEPTH_REMAP * projection * view
    glm::mat4 buildViewProjectionMatrix() const;

private:
    View m_view;
    Projection m_projection;
};

} // namespace penumbra
