/**
 * @file test_gpu_structs.cpp
 * @brief Byte layout of the structs shared with WGSL
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <penumbra/gpu_structs.h>

#include <cstddef>

using namespace penumbra;
using Catch::Matchers::WithinAbs;

TEST_CASE("GPU struct sizes", "[gpu][layout]") {
    REQUIRE(sizeof(LightRecord) == 96);
    REQUIRE(sizeof(CameraUniforms) == 80);
    REQUIRE(sizeof(InstanceRecord) == 100);
    REQUIRE(sizeof(Vertex) == 32);
}

TEST_CASE("GPU struct field offsets", "[gpu][layout]") {
    SECTION("LightRecord") {
        REQUIRE(offsetof(LightRecord, position) == 0);
        REQUIRE(offsetof(LightRecord, color) == 16);
        REQUIRE(offsetof(LightRecord, viewProj) == 32);
    }

    SECTION("CameraUniforms") {
        REQUIRE(offsetof(CameraUniforms, viewPosition) == 0);
        REQUIRE(offsetof(CameraUniforms, viewProj) == 16);
    }

    SECTION("InstanceRecord") {
        REQUIRE(offsetof(InstanceRecord, model) == 0);
        REQUIRE(offsetof(InstanceRecord, normal) == 64);
    }

    SECTION("Vertex") {
        REQUIRE(offsetof(Vertex, position) == 0);
        REQUIRE(offsetof(Vertex, texCoord) == 12);
        REQUIRE(offsetof(Vertex, normal) == 20);
    }
}

TEST_CASE("Light array addressing", "[gpu][layout]") {
    REQUIRE(LIGHT_CAPACITY == MAX_LIGHTS - 1);
    REQUIRE(LIGHT_ARRAY_SIZE == 960);
    REQUIRE(lightSlotOffset(0) == 0);
    REQUIRE(lightSlotOffset(3) == 288);
    REQUIRE(lightSlotOffset(MAX_LIGHTS - 1) + sizeof(LightRecord) == LIGHT_ARRAY_SIZE);
}

TEST_CASE("makeLightRecord", "[gpu][light]") {
    glm::mat4 viewProj(1.0f);
    viewProj[3][0] = 7.0f;

    LightRecord record = makeLightRecord(glm::vec3(1.0f, 2.0f, 3.0f),
                                         glm::vec3(0.25f, 0.5f, 0.75f), viewProj);

    REQUIRE_THAT(record.position[0], WithinAbs(1.0f, 1e-6f));
    REQUIRE_THAT(record.position[2], WithinAbs(3.0f, 1e-6f));
    REQUIRE_THAT(record.color[1], WithinAbs(0.5f, 1e-6f));
    REQUIRE_THAT(record._pad0, WithinAbs(0.0f, 1e-6f));
    REQUIRE_THAT(record._pad1, WithinAbs(0.0f, 1e-6f));
    // Column-major: column 3, row 0
    REQUIRE_THAT(record.viewProj[12], WithinAbs(7.0f, 1e-6f));
    REQUIRE_THAT(record.viewProj[0], WithinAbs(1.0f, 1e-6f));
}

TEST_CASE("makeCameraUniforms", "[gpu][camera]") {
    glm::mat4 viewProj(2.0f);
    CameraUniforms uniforms = makeCameraUniforms(glm::vec3(4.0f, 5.0f, 6.0f), viewProj);

    REQUIRE_THAT(uniforms.viewPosition[0], WithinAbs(4.0f, 1e-6f));
    REQUIRE_THAT(uniforms.viewPosition[1], WithinAbs(5.0f, 1e-6f));
    REQUIRE_THAT(uniforms.viewPosition[2], WithinAbs(6.0f, 1e-6f));
    REQUIRE_THAT(uniforms.viewPosition[3], WithinAbs(1.0f, 1e-6f));
    REQUIRE_THAT(uniforms.viewProj[0], WithinAbs(2.0f, 1e-6f));
    REQUIRE_THAT(uniforms.viewProj[1], WithinAbs(0.0f, 1e-6f));
}
