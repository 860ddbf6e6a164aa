/**
 * @file test_config.cpp
 * @brief Unit tests for viewer configuration: defaults, JSON and command line
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <penumbra/config.h>

#include <vector>

using namespace penumbra;
using Catch::Matchers::WithinAbs;

namespace {

int parse(std::vector<const char*> args, ViewerConfig& config) {
    args.insert(args.begin(), "penumbra");
    return parseArguments(static_cast<int>(args.size()), args.data(), config);
}

} // namespace

TEST_CASE("ViewerConfig defaults", "[config]") {
    ViewerConfig config;

    REQUIRE(config.windowWidth == 1280);
    REQUIRE(config.windowHeight == 720);
    REQUIRE(config.modelPath == "res/sphere.obj");
    REQUIRE(config.lightModelPath == "res/light.obj");
    REQUIRE(config.gridSize == 10);
    REQUIRE_THAT(config.gridSpacing, WithinAbs(3.0f, 1e-6f));
    REQUIRE_THAT(config.lightOrbitDegrees, WithinAbs(1.0f, 1e-6f));
    REQUIRE_FALSE(config.showLights);
    REQUIRE(config.maxFrames == 0);

    REQUIRE(config.lights.size() == 2);
    REQUIRE(config.lights[0].name == "key");
    REQUIRE(config.lights[1].name == "fill");
}

TEST_CASE("parseSize", "[config]") {
    int width = 0;
    int height = 0;

    REQUIRE(parseSize("800x600", width, height));
    REQUIRE(width == 800);
    REQUIRE(height == 600);

    REQUIRE_FALSE(parseSize("800", width, height));
    REQUIRE_FALSE(parseSize("0x600", width, height));
    REQUIRE_FALSE(parseSize("800x-1", width, height));
    REQUIRE_FALSE(parseSize("800x600abc", width, height));
    REQUIRE_FALSE(parseSize("80q0x600", width, height));
    REQUIRE_FALSE(parseSize("x600", width, height));
    REQUIRE_FALSE(parseSize("800x", width, height));
    REQUIRE(width == 800);
    REQUIRE(height == 600);
}

TEST_CASE("applyConfigJson", "[config][json]") {
    ViewerConfig config;

    SECTION("valid settings are applied") {
        REQUIRE(applyConfigJson(R"({
            "window": "640x480",
            "model": "scene.gltf",
            "gridSize": 4,
            "gridSpacing": 2.5,
            "lightOrbitDegrees": 0,
            "showLights": true,
            "lights": [
                {"name": "sun", "color": [1, 0.9, 0.8], "position": [0, 20, 0], "target": [1, 0, 0]}
            ]
        })", config));

        REQUIRE(config.windowWidth == 640);
        REQUIRE(config.windowHeight == 480);
        REQUIRE(config.modelPath == "scene.gltf");
        REQUIRE(config.gridSize == 4);
        REQUIRE_THAT(config.gridSpacing, WithinAbs(2.5f, 1e-6f));
        REQUIRE_THAT(config.lightOrbitDegrees, WithinAbs(0.0f, 1e-6f));
        REQUIRE(config.showLights);
        REQUIRE(config.lights.size() == 1);
        REQUIRE(config.lights[0].name == "sun");
        REQUIRE_THAT(config.lights[0].color.g, WithinAbs(0.9f, 1e-6f));
        REQUIRE_THAT(config.lights[0].position.y, WithinAbs(20.0f, 1e-6f));
        REQUIRE_THAT(config.lights[0].target.x, WithinAbs(1.0f, 1e-6f));
        REQUIRE_THAT(config.lights[0].fovY, WithinAbs(60.0f, 1e-6f));
    }

    SECTION("malformed JSON keeps the defaults") {
        REQUIRE_FALSE(applyConfigJson("{ not json", config));
        REQUIRE(config.windowWidth == 1280);
        REQUIRE(config.lights.size() == 2);
    }

    SECTION("non-object top level is rejected") {
        REQUIRE_FALSE(applyConfigJson("[1, 2, 3]", config));
    }

    SECTION("bad values are skipped, good ones still apply") {
        REQUIRE_FALSE(applyConfigJson(R"({"gridSize": -2, "showLights": "yes", "model": "a.obj"})",
                                      config));
        REQUIRE(config.gridSize == 10);
        REQUIRE_FALSE(config.showLights);
        REQUIRE(config.modelPath == "a.obj");
    }

    SECTION("lights without a name are dropped") {
        REQUIRE_FALSE(applyConfigJson(R"({"lights": [{"color": [1, 1, 1]}, {"name": "ok"}]})",
                                      config));
        REQUIRE(config.lights.size() == 1);
        REQUIRE(config.lights[0].name == "ok");
    }
}

TEST_CASE("parseArguments", "[config][cli]") {
    ViewerConfig config;

    SECTION("no arguments continues with defaults") {
        REQUIRE(parse({}, config) == -1);
        REQUIRE(config.gridSize == 10);
    }

    SECTION("flags override defaults") {
        REQUIRE(parse({"--window", "1024x768", "--model", "teapot.obj", "--grid", "3",
                       "--frames", "120", "--show-lights", "--quiet"}, config) == -1);
        REQUIRE(config.windowWidth == 1024);
        REQUIRE(config.windowHeight == 768);
        REQUIRE(config.modelPath == "teapot.obj");
        REQUIRE(config.gridSize == 3);
        REQUIRE(config.maxFrames == 120);
        REQUIRE(config.showLights);
        REQUIRE(config.quiet);
    }

    SECTION("equals form is accepted") {
        REQUIRE(parse({"--light-model=marker.obj"}, config) == -1);
        REQUIRE(config.lightModelPath == "marker.obj");
    }

    SECTION("help exits successfully") {
        REQUIRE(parse({"--help"}, config) == 0);
    }

    SECTION("zero grid is an error") {
        REQUIRE(parse({"--grid", "0"}, config) > 0);
    }

    SECTION("unknown option is an error") {
        REQUIRE(parse({"--bogus"}, config) > 0);
    }

    SECTION("missing config file is an error") {
        REQUIRE(parse({"--config", "/nonexistent/penumbra.json"}, config) > 0);
    }
}
