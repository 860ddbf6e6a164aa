/**
 * @file test_camera_controller.cpp
 * @brief Unit tests for CameraController
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <penumbra/camera.h>
#include <penumbra/camera_controller.h>

using namespace penumbra;
using Catch::Matchers::WithinAbs;

namespace {

Camera makeCamera() {
    return Camera(View(), Projection(1.0f));
}

} // namespace

TEST_CASE("CameraController with nothing held", "[camera][controller]") {
    CameraController controller;
    Camera camera = makeCamera();

    REQUIRE_FALSE(controller.updateCamera(camera));
    REQUIRE_THAT(camera.view().eye().z, WithinAbs(50.0f, 1e-6f));
}

TEST_CASE("CameraController press and release", "[camera][controller]") {
    CameraController controller;

    controller.process(CameraIntent::Left, true);
    REQUIRE(controller.isHeld(CameraIntent::Left));
    REQUIRE_FALSE(controller.isHeld(CameraIntent::Right));

    controller.process(CameraIntent::Left, false);
    REQUIRE_FALSE(controller.isHeld(CameraIntent::Left));

    SECTION("reset clears everything") {
        controller.process(CameraIntent::Up, true);
        controller.process(CameraIntent::Forward, true);
        controller.reset();
        REQUIRE_FALSE(controller.isHeld(CameraIntent::Up));
        REQUIRE_FALSE(controller.isHeld(CameraIntent::Forward));
    }
}

TEST_CASE("CameraController intent mapping", "[camera][controller]") {
    CameraController controller;
    Camera camera = makeCamera();

    SECTION("right yaws toward +x") {
        controller.process(CameraIntent::Right, true);
        REQUIRE(controller.updateCamera(camera));
        REQUIRE(camera.view().eye().x > 0.0f);
        REQUIRE_THAT(glm::length(camera.view().eye()), WithinAbs(50.0f, 1e-3f));
    }

    SECTION("left yaws toward -x") {
        controller.process(CameraIntent::Left, true);
        REQUIRE(controller.updateCamera(camera));
        REQUIRE(camera.view().eye().x < 0.0f);
    }

    SECTION("up and down pitch in opposite directions") {
        controller.process(CameraIntent::Up, true);
        REQUIRE(controller.updateCamera(camera));
        float upY = camera.view().eye().y;

        Camera other = makeCamera();
        CameraController down;
        down.process(CameraIntent::Down, true);
        REQUIRE(down.updateCamera(other));

        REQUIRE(upY != 0.0f);
        REQUIRE_THAT(other.view().eye().y, WithinAbs(-upY, 1e-4f));
    }

    SECTION("forward moves in by one radial step") {
        controller.process(CameraIntent::Forward, true);
        REQUIRE(controller.updateCamera(camera));
        REQUIRE_THAT(glm::length(camera.view().eye()),
                     WithinAbs(50.0f - CameraController::RADIAL_STEP, 1e-4f));
    }

    SECTION("backward moves out by one radial step") {
        controller.process(CameraIntent::Backward, true);
        REQUIRE(controller.updateCamera(camera));
        REQUIRE_THAT(glm::length(camera.view().eye()),
                     WithinAbs(50.0f + CameraController::RADIAL_STEP, 1e-4f));
    }

    SECTION("roll turns up but not the eye") {
        controller.process(CameraIntent::RollCounterClockwise, true);
        REQUIRE(controller.updateCamera(camera));
        REQUIRE_THAT(camera.view().eye().z, WithinAbs(50.0f, 1e-4f));
        REQUIRE(camera.view().up().x > 0.0f);
    }

    SECTION("clockwise roll goes the other way") {
        controller.process(CameraIntent::RollClockwise, true);
        REQUIRE(controller.updateCamera(camera));
        REQUIRE(camera.view().up().x < 0.0f);
    }
}

TEST_CASE("CameraController opposing intents", "[camera][controller]") {
    CameraController controller;
    Camera camera = makeCamera();

    SECTION("right wins over left") {
        controller.process(CameraIntent::Left, true);
        controller.process(CameraIntent::Right, true);
        REQUIRE(controller.updateCamera(camera));
        REQUIRE(camera.view().eye().x > 0.0f);
    }

    SECTION("forward wins over backward") {
        controller.process(CameraIntent::Forward, true);
        controller.process(CameraIntent::Backward, true);
        REQUIRE(controller.updateCamera(camera));
        REQUIRE_THAT(glm::length(camera.view().eye()),
                     WithinAbs(50.0f - CameraController::RADIAL_STEP, 1e-4f));
    }
}

TEST_CASE("CameraController clamps at the camera's near plane", "[camera][controller]") {
    CameraController controller;
    Camera camera(View(glm::vec3(0.0f, 0.0f, 1.1f), glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f)),
                  Projection(1.0f, 45.0f, 1.0f, 100.0f));

    controller.process(CameraIntent::Forward, true);
    for (int i = 0; i < 10; ++i) {
        REQUIRE(controller.updateCamera(camera));
    }
    REQUIRE_THAT(glm::length(camera.view().eye()), WithinAbs(1.0f, 1e-5f));
}
