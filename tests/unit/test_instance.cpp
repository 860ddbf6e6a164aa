/**
 * @file test_instance.cpp
 * @brief Unit tests for instances and the instance grid
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <penumbra/instance.h>

#include <glm/gtc/matrix_transform.hpp>

using namespace penumbra;
using Catch::Matchers::WithinAbs;

TEST_CASE("Instance records", "[instance]") {
    SECTION("translation only gives an identity normal matrix") {
        InstanceRecord record = Instance::at(glm::vec3(1.0f, 2.0f, 3.0f)).toRecord();

        REQUIRE_THAT(record.model[12], WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(record.model[13], WithinAbs(2.0f, 1e-6f));
        REQUIRE_THAT(record.model[14], WithinAbs(3.0f, 1e-6f));
        for (int i = 0; i < 9; ++i) {
            float expected = (i % 4 == 0) ? 1.0f : 0.0f;
            REQUIRE_THAT(record.normal[i], WithinAbs(expected, 1e-6f));
        }
    }

    SECTION("rotation normal matrix equals the rotation") {
        Instance instance;
        instance.rotation = glm::angleAxis(glm::radians(30.0f), glm::vec3(0.0f, 0.0f, 1.0f));
        InstanceRecord record = instance.toRecord();

        glm::mat3 rotation = glm::mat3_cast(instance.rotation);
        for (int c = 0; c < 3; ++c) {
            for (int r = 0; r < 3; ++r) {
                REQUIRE_THAT(record.normal[c * 3 + r], WithinAbs(rotation[c][r], 1e-5f));
            }
        }
    }

    SECTION("toRecords keeps order") {
        std::vector<Instance> instances = {Instance::at(glm::vec3(1.0f)), Instance::at(glm::vec3(2.0f))};
        std::vector<InstanceRecord> records = toRecords(instances);
        REQUIRE(records.size() == 2);
        REQUIRE_THAT(records[1].model[12], WithinAbs(2.0f, 1e-6f));
    }
}

TEST_CASE("makeInstanceGrid", "[instance][grid]") {
    std::vector<Instance> grid = makeInstanceGrid(2, 3.0f);

    REQUIRE(grid.size() == 4);
    REQUIRE_THAT(grid[0].position.x, WithinAbs(-3.0f, 1e-6f));
    REQUIRE_THAT(grid[0].position.z, WithinAbs(-3.0f, 1e-6f));
    REQUIRE_THAT(grid[0].position.y, WithinAbs(0.0f, 1e-6f));

    SECTION("instance at the origin is not rotated") {
        const Instance& center = grid[3];
        REQUIRE_THAT(glm::length(center.position), WithinAbs(0.0f, 1e-6f));
        REQUIRE_THAT(center.rotation.w, WithinAbs(1.0f, 1e-6f));
    }

    SECTION("other instances turn 45 degrees about their position") {
        const Instance& corner = grid[0];
        REQUIRE_THAT(glm::degrees(glm::angle(corner.rotation)), WithinAbs(45.0f, 1e-3f));
        glm::vec3 axis = glm::axis(corner.rotation);
        glm::vec3 expected = glm::normalize(corner.position);
        REQUIRE_THAT(glm::dot(axis, expected), WithinAbs(1.0f, 1e-4f));
    }

    SECTION("empty grid") {
        REQUIRE(makeInstanceGrid(0, 3.0f).empty());
    }
}

TEST_CASE("rotateAboutY", "[instance]") {
    glm::vec3 rotated = rotateAboutY(glm::vec3(1.0f, 2.0f, 0.0f), 90.0f);

    REQUIRE_THAT(rotated.x, WithinAbs(0.0f, 1e-5f));
    REQUIRE_THAT(rotated.y, WithinAbs(2.0f, 1e-5f));
    REQUIRE_THAT(rotated.z, WithinAbs(-1.0f, 1e-5f));
}
