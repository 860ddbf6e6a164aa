/**
 * @file test_camera.cpp
 * @brief Unit tests for View, Projection and Camera
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <penumbra/camera.h>

#include <glm/gtc/matrix_transform.hpp>

#include <cmath>

using namespace penumbra;
using Catch::Matchers::WithinAbs;

namespace {

void requireVec3(const glm::vec3& actual, const glm::vec3& expected, float eps = 1e-4f) {
    REQUIRE_THAT(actual.x, WithinAbs(expected.x, eps));
    REQUIRE_THAT(actual.y, WithinAbs(expected.y, eps));
    REQUIRE_THAT(actual.z, WithinAbs(expected.z, eps));
}

void requireMat4(const glm::mat4& actual, const glm::mat4& expected, float eps = 1e-5f) {
    for (int c = 0; c < 4; ++c) {
        for (int r = 0; r < 4; ++r) {
            REQUIRE_THAT(actual[c][r], WithinAbs(expected[c][r], eps));
        }
    }
}

} // namespace

TEST_CASE("View defaults", "[camera][view]") {
    View view;

    requireVec3(view.eye(), glm::vec3(0.0f, 0.0f, 50.0f));
    requireVec3(view.target(), glm::vec3(0.0f));
    requireVec3(view.up(), glm::vec3(0.0f, 1.0f, 0.0f));
    requireMat4(view.matrix(), glm::lookAt(view.eye(), view.target(), view.up()));
}

TEST_CASE("View normalizes up", "[camera][view]") {
    View view(glm::vec3(0.0f, 0.0f, 10.0f), glm::vec3(0.0f), glm::vec3(0.0f, 3.0f, 0.0f));
    REQUIRE_THAT(glm::length(view.up()), WithinAbs(1.0f, 1e-6f));
}

TEST_CASE("View setPosition rebuilds the matrix", "[camera][view]") {
    View view;
    view.setPosition(glm::vec3(10.0f, 5.0f, 10.0f));

    requireVec3(view.eye(), glm::vec3(10.0f, 5.0f, 10.0f));
    requireMat4(view.matrix(), glm::lookAt(view.eye(), view.target(), view.up()));
}

TEST_CASE("sphericalAdjust yaw orbits on a circle", "[camera][view]") {
    View view;
    View adjusted = view.sphericalAdjust(6.0f, 0.0f, 0.0f, 0.0f);

    float angle = glm::radians(6.0f);
    requireVec3(adjusted.eye(), glm::vec3(50.0f * std::sin(angle), 0.0f, 50.0f * std::cos(angle)));
    REQUIRE_THAT(glm::length(adjusted.eye()), WithinAbs(50.0f, 1e-3f));

    SECTION("target and up are preserved") {
        requireVec3(adjusted.target(), view.target());
        requireVec3(adjusted.up(), glm::vec3(0.0f, 1.0f, 0.0f));
    }

    SECTION("receiver is unchanged") {
        requireVec3(view.eye(), glm::vec3(0.0f, 0.0f, 50.0f));
    }

    SECTION("opposite yaw returns to the start") {
        View back = adjusted.sphericalAdjust(-6.0f, 0.0f, 0.0f, 0.0f);
        requireVec3(back.eye(), view.eye(), 1e-3f);
    }

    SECTION("sixty steps go all the way round") {
        View current = view;
        for (int i = 0; i < 60; ++i) {
            current = current.sphericalAdjust(6.0f, 0.0f, 0.0f, 0.0f);
        }
        requireVec3(current.eye(), view.eye(), 1e-2f);
    }
}

TEST_CASE("sphericalAdjust keeps up orthonormal", "[camera][view]") {
    View view(glm::vec3(3.0f, 4.0f, 20.0f), glm::vec3(1.0f, 0.0f, -2.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    View adjusted = view.sphericalAdjust(17.0f, -23.0f, 31.0f, 1.5f);

    glm::vec3 forward = glm::normalize(adjusted.target() - adjusted.eye());
    REQUIRE_THAT(glm::length(adjusted.up()), WithinAbs(1.0f, 1e-5f));
    REQUIRE_THAT(glm::dot(adjusted.up(), forward), WithinAbs(0.0f, 1e-5f));
    requireVec3(adjusted.target(), view.target());
}

TEST_CASE("sphericalAdjust radial movement", "[camera][view]") {
    View view;

    SECTION("positive radial moves toward the target") {
        View closer = view.sphericalAdjust(0.0f, 0.0f, 0.0f, 0.3f);
        REQUIRE_THAT(glm::length(closer.eye() - closer.target()), WithinAbs(49.7f, 1e-4f));
    }

    SECTION("negative radial moves away") {
        View farther = view.sphericalAdjust(0.0f, 0.0f, 0.0f, -0.3f);
        REQUIRE_THAT(glm::length(farther.eye() - farther.target()), WithinAbs(50.3f, 1e-4f));
    }

    SECTION("distance is clamped at zNear") {
        View clamped = view.sphericalAdjust(0.0f, 0.0f, 0.0f, 100.0f, 0.5f);
        REQUIRE_THAT(glm::length(clamped.eye() - clamped.target()), WithinAbs(0.5f, 1e-5f));
        REQUIRE(clamped.eye().z > 0.0f);
    }
}

TEST_CASE("sphericalAdjust roll leaves the eye in place", "[camera][view]") {
    View view;
    View rolled = view.sphericalAdjust(0.0f, 0.0f, 6.0f, 0.0f);

    requireVec3(rolled.eye(), view.eye());
    REQUIRE(rolled.up().x > 0.0f);
    REQUIRE_THAT(glm::length(rolled.up()), WithinAbs(1.0f, 1e-5f));
}

TEST_CASE("Projection setters recompute the matrix", "[camera][projection]") {
    Projection projection(2.0f);

    REQUIRE_THAT(projection.fovY(), WithinAbs(Projection::DEFAULT_FOV_Y, 1e-6f));
    REQUIRE_THAT(projection.zNear(), WithinAbs(Projection::DEFAULT_Z_NEAR, 1e-6f));
    REQUIRE_THAT(projection.zFar(), WithinAbs(Projection::DEFAULT_Z_FAR, 1e-6f));
    requireMat4(projection.matrix(), glm::perspective(glm::radians(45.0f), 2.0f, 0.1f, 100.0f));

    SECTION("setAspect") {
        projection.setAspect(1.0f);
        requireMat4(projection.matrix(), glm::perspective(glm::radians(45.0f), 1.0f, 0.1f, 100.0f));
    }

    SECTION("setFovY") {
        projection.setFovY(90.0f);
        requireMat4(projection.matrix(), glm::perspective(glm::radians(90.0f), 2.0f, 0.1f, 100.0f));
    }

    SECTION("setClipPlanes") {
        projection.setClipPlanes(1.0f, 10.0f);
        requireMat4(projection.matrix(), glm::perspective(glm::radians(45.0f), 2.0f, 1.0f, 10.0f));
    }

    SECTION("withAspect uses the defaults") {
        requireMat4(Projection::withAspect(2.0f).matrix(), projection.matrix());
    }
}

TEST_CASE("Camera view-projection includes the depth remap", "[camera]") {
    Camera camera(View(), Projection(1.5f));

    glm::mat4 expected = DEPTH_REMAP * camera.projection().matrix() * camera.view().matrix();
    REQUIRE(camera.buildViewProjectionMatrix() == expected);

    SECTION("near plane maps to depth 0, far plane to depth 1") {
        glm::mat4 viewProj = camera.buildViewProjectionMatrix();
        glm::vec4 nearPoint = viewProj * glm::vec4(0.0f, 0.0f, 50.0f - 0.1f, 1.0f);
        glm::vec4 farPoint = viewProj * glm::vec4(0.0f, 0.0f, 50.0f - 100.0f, 1.0f);
        REQUIRE_THAT(nearPoint.z / nearPoint.w, WithinAbs(0.0f, 1e-3f));
        REQUIRE_THAT(farPoint.z / farPoint.w, WithinAbs(1.0f, 1e-3f));
    }

    SECTION("projection changes are picked up") {
        camera.projection().setAspect(0.5f);
        glm::mat4 updated = DEPTH_REMAP * camera.projection().matrix() * camera.view().matrix();
        REQUIRE(camera.buildViewProjectionMatrix() == updated);
    }
}
