#include <penumbra/viewer.h>
#include <penumbra/instance.h>
#include <penumbra/light_source.h>
#include <penumbra/model_loader.h>

#include <GLFW/glfw3.h>

#include <iostream>
#include <string>

namespace penumbra {

static const char* WINDOW_TITLE = "penumbra";

Viewer::Viewer(const ViewerConfig& config)
    : m_config(config),
      m_window(config.windowWidth, config.windowHeight, WINDOW_TITLE),
      m_gpu(m_window.handle(), static_cast<uint32_t>(m_window.width()),
            static_cast<uint32_t>(m_window.height())),
      m_shaders(m_gpu.device()),
      m_layouts(m_gpu.device()),
      m_camera(View(), Projection(m_gpu.aspect())),
      m_uniforms(m_gpu.device(), m_layouts),
      m_scene(loadModel(m_gpu.device(), m_gpu.queue(), m_layouts, config.modelPath)),
      m_lighting(m_gpu.device(), m_gpu.queue(), m_layouts, m_shaders, m_gpu.surfaceFormat(),
                 m_gpu.width(), m_gpu.height(),
                 loadModel(m_gpu.device(), m_gpu.queue(), m_layouts, config.lightModelPath)),
      m_renderer(m_gpu.device(), m_layouts, m_shaders, m_gpu.surfaceFormat(),
                 m_gpu.width(), m_gpu.height()) {
    m_scene.setInstances(m_gpu.device(), m_gpu.queue(),
                         makeInstanceGrid(m_config.gridSize, m_config.gridSpacing));
    m_uniforms.update(m_gpu.queue(), m_camera);

    addConfiguredLights();
    m_lighting.setMarkersVisible(m_config.showLights);

    m_window.setKeyCallback([this](int key, bool pressed) { onKey(key, pressed); });
    m_window.setResizeCallback([this](int width, int height) {
        if (width > 0 && height > 0) {
            m_pendingResize = std::make_pair(static_cast<uint32_t>(width),
                                             static_cast<uint32_t>(height));
        }
    });

    if (!m_config.quiet) {
        std::cout << "[Viewer] " << m_scene.instanceCount() << " instances, "
                  << m_lighting.size() << " lights" << std::endl;
    }
}

void Viewer::addConfiguredLights() {
    for (const auto& lightConfig : m_config.lights) {
        Projection projection(m_gpu.aspect(), lightConfig.fovY, lightConfig.zNear, lightConfig.zFar);
        View view(lightConfig.position, lightConfig.target,
                  spotlightUp(lightConfig.position, lightConfig.target));

        LightSlot slot = m_lighting.addSpotlight(lightConfig.name, lightConfig.color,
                                                 projection, view);
        if (!slot) {
            std::cerr << "[Viewer] Skipping light '" << lightConfig.name << "'" << std::endl;
        }
    }
}

void Viewer::onKey(int key, bool pressed) {
    switch (key) {
        case GLFW_KEY_W:
        case GLFW_KEY_UP:
            m_controller.process(CameraIntent::Up, pressed);
            break;
        case GLFW_KEY_S:
        case GLFW_KEY_DOWN:
            m_controller.process(CameraIntent::Down, pressed);
            break;
        case GLFW_KEY_A:
        case GLFW_KEY_LEFT:
            m_controller.process(CameraIntent::Left, pressed);
            break;
        case GLFW_KEY_D:
        case GLFW_KEY_RIGHT:
            m_controller.process(CameraIntent::Right, pressed);
            break;
        case GLFW_KEY_LEFT_SHIFT:
            m_controller.process(CameraIntent::Forward, pressed);
            break;
        case GLFW_KEY_LEFT_CONTROL:
            m_controller.process(CameraIntent::Backward, pressed);
            break;
        case GLFW_KEY_E:
            m_controller.process(CameraIntent::RollClockwise, pressed);
            break;
        case GLFW_KEY_Q:
            m_controller.process(CameraIntent::RollCounterClockwise, pressed);
            break;
        case GLFW_KEY_L:
            if (pressed) m_lighting.toggleMarkers();
            break;
        case GLFW_KEY_ESCAPE:
            if (pressed) m_window.requestClose();
            break;
        default:
            break;
    }
}

void Viewer::applyResize() {
    if (!m_pendingResize) return;
    auto [width, height] = *m_pendingResize;
    m_pendingResize.reset();

    m_gpu.resize(width, height);
    m_camera.projection().setAspect(m_gpu.aspect());
    m_uniforms.update(m_gpu.queue(), m_camera);
    m_renderer.resize(width, height);
    m_lighting.resize(width, height);

    if (!m_config.quiet) {
        std::cout << "[Viewer] Resized to " << width << "x" << height << std::endl;
    }
}

void Viewer::update() {
    if (m_config.lightOrbitDegrees != 0.0f) {
        for (const auto& name : m_lighting.names()) {
            const Light* light = m_lighting.get(name);
            m_lighting.setLightPosition(name, rotateAboutY(light->position(),
                                                           m_config.lightOrbitDegrees));
        }
    }

    if (m_controller.updateCamera(m_camera)) {
        m_uniforms.update(m_gpu.queue(), m_camera);
    }
}

void Viewer::renderFrame() {
    std::vector<const Model*> models = {&m_scene};

    CommandEncoderHandle bakeEncoder = m_gpu.createEncoder("Shadow Bake Encoder");
    m_lighting.bake(bakeEncoder, models);
    m_gpu.submit(std::move(bakeEncoder));

    SurfaceFrame frame = m_gpu.acquireFrame();
    m_renderer.render(m_gpu, frame.view, m_uniforms, m_lighting, models);
    m_gpu.present(frame);
}

void Viewer::updateFps() {
    ++m_fpsFrames;
    double now = m_window.time();
    if (now - m_lastFpsTime >= 1.0) {
        m_window.setTitle(std::string(WINDOW_TITLE) + " (" + std::to_string(m_fpsFrames) + " fps)");
        m_fpsFrames = 0;
        m_lastFpsTime = now;
    }
}

void Viewer::run() {
    m_lastFpsTime = m_window.time();

    while (!m_window.shouldClose()) {
        m_window.pollEvents();
        applyResize();
        update();
        renderFrame();
        updateFps();

        ++m_frameCount;
        if (m_config.maxFrames > 0 && m_frameCount >= static_cast<uint64_t>(m_config.maxFrames)) {
            if (!m_config.quiet) {
                std::cout << "[Viewer] Reached " << m_frameCount << " frames, exiting" << std::endl;
            }
            break;
        }
    }
}

} // namespace penumbra
