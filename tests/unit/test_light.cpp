/**
 * @file test_light.cpp
 * @brief Unit tests for Spotlight, LightSource and LightSlots
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <penumbra/light_slots.h>
#include <penumbra/light_source.h>

#include <glm/gtc/type_ptr.hpp>

#include <cmath>

#include <string>
#include <vector>

using namespace penumbra;
using Catch::Matchers::WithinAbs;

namespace {

Spotlight makeSpotlight(const glm::vec3& position = glm::vec3(5.0f, 10.0f, 5.0f)) {
    return Spotlight(glm::vec3(1.0f, 0.5f, 0.25f),
                     Projection(1.0f, 60.0f, 1.0f, 100.0f),
                     View(position, glm::vec3(0.0f), glm::vec3(0.0f, 1.0f, 0.0f)));
}

} // namespace

TEST_CASE("Spotlight record", "[light][spotlight]") {
    Spotlight light = makeSpotlight();
    const LightRecord& record = light.record();

    REQUIRE_THAT(record.position[0], WithinAbs(5.0f, 1e-6f));
    REQUIRE_THAT(record.position[1], WithinAbs(10.0f, 1e-6f));
    REQUIRE_THAT(record.color[2], WithinAbs(0.25f, 1e-6f));

    SECTION("viewProj is projection times view without remap") {
        glm::mat4 expected = light.projection().matrix() * light.view().matrix();
        const float* values = glm::value_ptr(expected);
        for (int i = 0; i < 16; ++i) {
            REQUIRE_THAT(record.viewProj[i], WithinAbs(values[i], 1e-5f));
        }
    }

    SECTION("setPosition rebuilds the record") {
        light.setPosition(glm::vec3(-3.0f, 6.0f, 2.0f));
        REQUIRE_THAT(light.record().position[0], WithinAbs(-3.0f, 1e-6f));

        glm::mat4 expected = light.projection().matrix() * light.view().matrix();
        REQUIRE_THAT(light.record().viewProj[12], WithinAbs(expected[3][0], 1e-5f));
    }

    SECTION("setColor rebuilds the record") {
        light.setColor(glm::vec3(0.0f, 1.0f, 0.0f));
        REQUIRE_THAT(light.record().color[0], WithinAbs(0.0f, 1e-6f));
        REQUIRE_THAT(light.record().color[1], WithinAbs(1.0f, 1e-6f));
    }
}

TEST_CASE("spotlightUp avoids a vertical view direction", "[light][spotlight]") {
    const glm::vec3 worldUp(0.0f, 1.0f, 0.0f);

    REQUIRE(spotlightUp(glm::vec3(5.0f, 10.0f, 5.0f), glm::vec3(0.0f)) == worldUp);
    REQUIRE(spotlightUp(glm::vec3(0.0f, 10.0f, 0.0f), glm::vec3(0.0f)) != worldUp);
    REQUIRE(spotlightUp(glm::vec3(0.0f, -10.0f, 0.0f), glm::vec3(0.0f)) != worldUp);

    SECTION("a light straight above its target has a finite view") {
        glm::vec3 position(0.0f, 10.0f, 0.0f);
        glm::vec3 target(0.0f);
        Spotlight light(glm::vec3(1.0f), Projection(1.0f, 60.0f, 1.0f, 100.0f),
                        View(position, target, spotlightUp(position, target)));

        const float* values = glm::value_ptr(light.viewProjection());
        for (int i = 0; i < 16; ++i) {
            REQUIRE_FALSE(std::isnan(values[i]));
            REQUIRE_FALSE(std::isnan(light.record().viewProj[i]));
        }

        // Orbiting about +Y keeps it above the target; the view stays valid
        light.setPosition(glm::vec3(0.0f, 12.0f, 0.0f));
        values = glm::value_ptr(light.viewProjection());
        for (int i = 0; i < 16; ++i) {
            REQUIRE_FALSE(std::isnan(values[i]));
        }
    }
}

TEST_CASE("LightSource dispatch", "[light][source]") {
    LightSource source = makeSpotlight();

    REQUIRE(source.kind() == LightKind::Spot);
    REQUIRE(source.asSpotlight() != nullptr);
    REQUIRE_THAT(source.position().y, WithinAbs(10.0f, 1e-6f));
    REQUIRE_THAT(source.color().g, WithinAbs(0.5f, 1e-6f));

    source.setPosition(glm::vec3(1.0f, 2.0f, 3.0f));
    REQUIRE_THAT(source.record().position[2], WithinAbs(3.0f, 1e-6f));
    REQUIRE_THAT(source.asSpotlight()->position().x, WithinAbs(1.0f, 1e-6f));

    source.setColor(glm::vec3(0.1f, 0.2f, 0.3f));
    REQUIRE_THAT(source.record().color[0], WithinAbs(0.1f, 1e-6f));
}

TEST_CASE("LightSlots capacity", "[light][slots]") {
    LightSlots slots;
    REQUIRE(slots.capacity() == MAX_LIGHTS - 1);

    for (uint32_t i = 0; i < LIGHT_CAPACITY; ++i) {
        LightSlot slot = slots.acquire("light" + std::to_string(i));
        REQUIRE(slot);
        REQUIRE(slot.index == i);
        REQUIRE_FALSE(slot.replaced);
    }
    REQUIRE(slots.full());

    LightSlot overflow = slots.acquire("one too many");
    REQUIRE_FALSE(overflow);
    REQUIRE(overflow.error == LightError::CapacityExceeded);
    REQUIRE(slots.size() == LIGHT_CAPACITY);
    REQUIRE_FALSE(slots.contains("one too many"));

    SECTION("existing names still resolve when full") {
        LightSlot again = slots.acquire("light4");
        REQUIRE(again);
        REQUIRE(again.replaced);
        REQUIRE(again.index == 4);
        REQUIRE(slots.size() == LIGHT_CAPACITY);
    }
}

TEST_CASE("LightSlots replacement and lookup", "[light][slots]") {
    LightSlots slots(3);

    REQUIRE(slots.acquire("key").index == 0);
    REQUIRE(slots.acquire("fill").index == 1);

    LightSlot replaced = slots.acquire("key");
    REQUIRE(replaced);
    REQUIRE(replaced.replaced);
    REQUIRE(replaced.index == 0);
    REQUIRE(slots.size() == 2);

    REQUIRE(slots.find("fill").value_or(99) == 1);
    REQUIRE_FALSE(slots.find("rim").has_value());

    std::vector<std::string> expected = {"key", "fill"};
    REQUIRE(slots.names() == expected);
}

TEST_CASE("LightError names", "[light][slots]") {
    REQUIRE(std::string(toString(LightError::None)) == "none");
    REQUIRE(std::string(toString(LightError::CapacityExceeded)) == "light capacity exceeded");
}
