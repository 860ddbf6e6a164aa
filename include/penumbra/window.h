#pragma once

#include <functional>
#include <string>

// Forward declare GLFW types
struct GLFWwindow;

namespace penumbra {

/// GLFW window without a client API; WebGPU renders through a surface
class Window {
public:
    using KeyCallback = std::function<void(int key, bool pressed)>;
    using ResizeCallback = std::function<void(int width, int height)>;

    /// @throws std::runtime_error if GLFW or the window cannot be created
    Window(int width, int height, const std::string& title);
    ~Window();

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    bool shouldClose() const;
    void requestClose();
    void pollEvents();

    GLFWwindow* handle() const { return m_window; }

    /// Framebuffer size in pixels
    int width() const { return m_width; }
    int height() const { return m_height; }

    void setTitle(const std::string& title);

    /// Seconds since GLFW initialization
    double time() const;

    /// Called for key press and release; repeats are dropped
    void setKeyCallback(KeyCallback callback) { m_keyCallback = std::move(callback); }

    /// Called with the new framebuffer size
    void setResizeCallback(ResizeCallback callback) { m_resizeCallback = std::move(callback); }

private:
    static void framebufferResizeCallback(GLFWwindow* window, int width, int height);
    static void keyCallback(GLFWwindow* window, int key, int scancode, int action, int mods);

    GLFWwindow* m_window = nullptr;
    int m_width = 0;
    int m_height = 0;
    KeyCallback m_keyCallback;
    ResizeCallback m_resizeCallback;
};

} // namespace penumbra
