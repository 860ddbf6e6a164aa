#include <penumbra/config.h>
#include <penumbra/version.h>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <charconv>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace penumbra {

using json = nlohmann::json;

std::vector<LightConfig> ViewerConfig::defaultLights() {
    LightConfig key;
    key.name = "key";
    key.color = glm::vec3(1.0f, 1.0f, 1.0f);
    key.position = glm::vec3(5.0f, 10.0f, 5.0f);

    LightConfig fill;
    fill.name = "fill";
    fill.color = glm::vec3(0.35f, 0.35f, 0.5f);
    fill.position = glm::vec3(-12.0f, 8.0f, -4.0f);

    return {key, fill};
}

namespace {

// Whole-string integer; trailing characters are an error
bool parseInt(const char* first, const char* last, int& value) {
    auto [end, error] = std::from_chars(first, last, value);
    return error == std::errc() && end == last && first != last;
}

} // namespace

bool parseSize(const std::string& text, int& width, int& height) {
    size_t x = text.find('x');
    if (x == std::string::npos) {
        return false;
    }
    const char* begin = text.data();
    int w = 0;
    int h = 0;
    if (!parseInt(begin, begin + x, w) || !parseInt(begin + x + 1, begin + text.size(), h)) {
        return false;
    }
    if (w <= 0 || h <= 0) {
        return false;
    }
    width = w;
    height = h;
    return true;
}

namespace {

bool readVec3(const json& value, glm::vec3& out) {
    if (!value.is_array() || value.size() != 3) {
        return false;
    }
    for (const auto& component : value) {
        if (!component.is_number()) {
            return false;
        }
    }
    out = glm::vec3(value[0].get<float>(), value[1].get<float>(), value[2].get<float>());
    return true;
}

bool readLight(const json& entry, LightConfig& light) {
    if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
        std::cerr << "[Config] Light entry needs a string \"name\"" << std::endl;
        return false;
    }
    light.name = entry["name"].get<std::string>();

    bool ok = true;
    if (entry.contains("color")) ok = readVec3(entry["color"], light.color) && ok;
    if (entry.contains("position")) ok = readVec3(entry["position"], light.position) && ok;
    if (entry.contains("target")) ok = readVec3(entry["target"], light.target) && ok;
    if (entry.contains("fovY") && entry["fovY"].is_number()) light.fovY = entry["fovY"].get<float>();
    if (entry.contains("zNear") && entry["zNear"].is_number()) light.zNear = entry["zNear"].get<float>();
    if (entry.contains("zFar") && entry["zFar"].is_number()) light.zFar = entry["zFar"].get<float>();

    if (!ok) {
        std::cerr << "[Config] Light \"" << light.name
                  << "\": vectors must be arrays of 3 numbers" << std::endl;
    }
    return ok;
}

} // namespace

bool applyConfigJson(const std::string& text, ViewerConfig& config) {
    json data;
    try {
        data = json::parse(text);
    } catch (const json::parse_error& e) {
        std::cerr << "[Config] Parse error: " << e.what() << std::endl;
        return false;
    }

    if (!data.is_object()) {
        std::cerr << "[Config] Top level must be an object" << std::endl;
        return false;
    }

    bool ok = true;
    auto warn = [&ok](const char* key) {
        std::cerr << "[Config] Ignoring invalid value for \"" << key << "\"" << std::endl;
        ok = false;
    };

    if (data.contains("window")) {
        const json& window = data["window"];
        if (!window.is_string() ||
            !parseSize(window.get<std::string>(), config.windowWidth, config.windowHeight)) {
            warn("window");
        }
    }
    if (data.contains("model")) {
        if (data["model"].is_string()) config.modelPath = data["model"].get<std::string>();
        else warn("model");
    }
    if (data.contains("lightModel")) {
        if (data["lightModel"].is_string()) config.lightModelPath = data["lightModel"].get<std::string>();
        else warn("lightModel");
    }
    if (data.contains("gridSize")) {
        if (data["gridSize"].is_number_unsigned()) config.gridSize = data["gridSize"].get<uint32_t>();
        else warn("gridSize");
    }
    if (data.contains("gridSpacing")) {
        if (data["gridSpacing"].is_number()) config.gridSpacing = data["gridSpacing"].get<float>();
        else warn("gridSpacing");
    }
    if (data.contains("lightOrbitDegrees")) {
        if (data["lightOrbitDegrees"].is_number()) config.lightOrbitDegrees = data["lightOrbitDegrees"].get<float>();
        else warn("lightOrbitDegrees");
    }
    if (data.contains("showLights")) {
        if (data["showLights"].is_boolean()) config.showLights = data["showLights"].get<bool>();
        else warn("showLights");
    }
    if (data.contains("lights")) {
        const json& lights = data["lights"];
        if (!lights.is_array()) {
            warn("lights");
        } else {
            std::vector<LightConfig> parsed;
            for (const auto& entry : lights) {
                LightConfig light;
                if (readLight(entry, light)) {
                    parsed.push_back(light);
                } else {
                    ok = false;
                }
            }
            config.lights = parsed;
        }
    }

    return ok;
}

bool loadConfigFile(const std::string& path, ViewerConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "[Config] Failed to open: " << path << std::endl;
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    bool ok = applyConfigJson(buffer.str(), config);
    std::cout << "[Config] Loaded: " << path << (ok ? "" : " (with errors)") << std::endl;
    return ok;
}

int parseArguments(int argc, const char* const* argv, ViewerConfig& config) {
    CLI::App app{"penumbra - multi-light shadow-mapped viewer"};
    app.set_version_flag("-v,--version", std::string(VERSION));
    app.set_help_flag("-h,--help", "Show this help");
    app.footer("Controls:\n"
               "  W/S, Up/Down       Pitch\n"
               "  A/D, Left/Right    Yaw\n"
               "  Q/E                Roll\n"
               "  Left Shift/Ctrl    Move toward/away from the target\n"
               "  L                  Toggle light markers\n"
               "  Escape             Quit");

    std::string configPath;
    std::string window;
    std::string modelPath;
    std::string lightModelPath;
    uint32_t gridSize = 0;
    int maxFrames = 0;
    bool showLights = false;
    bool quiet = false;

    app.add_option("-c,--config", configPath, "Load settings from a JSON file")
       ->check(CLI::ExistingFile);
    auto* windowOpt = app.add_option("--window", window, "Window size as WxH (default 1280x720)");
    auto* modelOpt = app.add_option("--model", modelPath, "Scene model");
    auto* lightModelOpt = app.add_option("--light-model", lightModelPath, "Light marker model");
    auto* gridOpt = app.add_option("--grid", gridSize, "Instances per grid row")
                       ->check(CLI::PositiveNumber);
    auto* framesOpt = app.add_option("--frames", maxFrames, "Exit after N frames (0 = unlimited)")
                         ->check(CLI::NonNegativeNumber);
    app.add_flag("--show-lights", showLights, "Start with light markers visible");
    app.add_flag("-q,--quiet", quiet, "Less console output");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    // The config file is the base the flags override
    if (!configPath.empty()) {
        config.configPath = configPath;
        if (!loadConfigFile(configPath, config)) {
            std::cerr << "[Config] Using defaults for invalid settings" << std::endl;
        }
    }

    if (windowOpt->count() > 0 &&
        !parseSize(window, config.windowWidth, config.windowHeight)) {
        std::cerr << "[Config] Invalid --window value, expected WxH" << std::endl;
    }
    if (modelOpt->count() > 0) config.modelPath = modelPath;
    if (lightModelOpt->count() > 0) config.lightModelPath = lightModelPath;
    if (gridOpt->count() > 0) config.gridSize = gridSize;
    if (framesOpt->count() > 0) config.maxFrames = maxFrames;
    if (showLights) config.showLights = true;
    if (quiet) config.quiet = true;

    return -1;
}

} // namespace penumbra
