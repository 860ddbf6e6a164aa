#pragma once

/**
 * @file viewer.h
 * @brief Window, GPU objects and the frame loop of the viewer
 */

#include <penumbra/camera.h>
#include <penumbra/camera_controller.h>
#include <penumbra/config.h>
#include <penumbra/gpu_context.h>
#include <penumbra/lighting.h>
#include <penumbra/model.h>
#include <penumbra/pipeline_builder.h>
#include <penumbra/renderer.h>
#include <penumbra/shader_library.h>
#include <penumbra/uniforms.h>
#include <penumbra/window.h>

#include <cstdint>
#include <optional>
#include <utility>

namespace penumbra {

/**
 * @brief Interactive scene viewer
 *
 * Each frame: apply pending resizes, orbit the lights, move the camera from
 * held keys, bake shadow maps, draw the main pass and present.
 *
 * @throws std::runtime_error from the constructor if any window, GPU or model
 * resource cannot be created
 */
class Viewer {
public:
    explicit Viewer(const ViewerConfig& config);

    Viewer(const Viewer&) = delete;
    Viewer& operator=(const Viewer&) = delete;

    /// Run until the window closes or the frame limit is reached
    void run();

private:
    void addConfiguredLights();
    void onKey(int key, bool pressed);
    void applyResize();
    void update();
    void renderFrame();
    void updateFps();

    ViewerConfig m_config;
    Window m_window;
    GpuContext m_gpu;
    ShaderLibrary m_shaders;
    BindGroupLayouts m_layouts;

    Camera m_camera;
    CameraController m_controller;
    CameraUniformBuffer m_uniforms;

    Model m_scene;
    Lighting m_lighting;
    Renderer m_renderer;

    std::optional<std::pair<uint32_t, uint32_t>> m_pendingResize;
    uint64_t m_frameCount = 0;
    uint32_t m_fpsFrames = 0;
    double m_lastFpsTime = 0.0;
};

} // namespace penumbra
