#pragma once

/**
 * @file config.h
 * @brief Viewer settings from a JSON file and the command line
 *
 * Precedence: built-in defaults, then the file named by --config, then the
 * remaining command-line flags.
 *
 * @par Example config
 * @code
 * {
 *   "window": "1600x900",
 *   "model": "res/sphere.obj",
 *   "gridSize": 8,
 *   "lights": [
 *     { "name": "key", "color": [1, 1, 1], "position": [5, 10, 5], "target": [0, 0, 0] }
 *   ]
 * }
 * @endcode
 */

#include <glm/glm.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace penumbra {

/// One spotlight to create at startup
struct LightConfig {
    std::string name;
    glm::vec3 color{1.0f};
    glm::vec3 position{5.0f, 10.0f, 5.0f};
    glm::vec3 target{0.0f};
    float fovY = 60.0f;           ///< Degrees
    float zNear = 1.0f;
    float zFar = 100.0f;
};

struct ViewerConfig {
    int windowWidth = 1280;
    int windowHeight = 720;

    std::string modelPath = "res/sphere.obj";
    std::string lightModelPath = "res/light.obj";

    uint32_t gridSize = 10;
    float gridSpacing = 3.0f;
    float lightOrbitDegrees = 1.0f;   ///< Per frame, about +Y

    bool showLights = false;
    std::vector<LightConfig> lights = defaultLights();

    std::string configPath;
    int maxFrames = 0;                ///< 0 = unlimited
    bool quiet = false;

    /// Key light plus a dimmer, bluish fill light
    static std::vector<LightConfig> defaultLights();
};

/// Parse "WxH"; returns false and leaves w/h untouched on malformed input
bool parseSize(const std::string& text, int& width, int& height);

/// Apply a JSON document; unknown keys are ignored, bad values are logged and skipped
bool applyConfigJson(const std::string& text, ViewerConfig& config);

/// Load and apply a JSON config file
bool loadConfigFile(const std::string& path, ViewerConfig& config);

/**
 * @brief Fill the configuration from argv
 *
 * The --config file is applied first, then every flag given on the command
 * line overrides it.
 *
 * @return -1 to continue running, otherwise the process exit code
 *         (after --help, --version or a parse error)
 */
int parseArguments(int argc, const char* const* argv, ViewerConfig& config);

} // namespace penumbra
