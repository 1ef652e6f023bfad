/*
* File: window
* Project: prism
* Created on: 1/21/2026
*
* Description: GLFW window with a GL 3.3 core context, acting as the frame host
*/

#ifndef PRISM_WINDOW_HPP
#define PRISM_WINDOW_HPP

#include <string>
#include <cstdint>
#include <vector>

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

#include "frame_host.hpp"

namespace prism {

class Window final : public IFrameHost {
public:
    Window(uint32_t width, uint32_t height, const std::string& name, bool vsync = true);
    ~Window() override;

    Window(const Window&) = delete;
    Window& operator=(const Window&) = delete;

    // Pumps events and runs queued animation frames until the window is closed.
    // Resizes from one poll are delivered before that refresh's frames.
    void run();

    [[nodiscard]] bool shouldClose() const;

    [[nodiscard]] GLFWwindow* getGLFWwindow() const { return m_window; }
    [[nodiscard]] const std::string& getName() const { return m_name; }

    // IFrameHost
    [[nodiscard]] bool isAvailable() const override { return m_window != nullptr; }
    bool requestAnimationFrame(FrameCallback callback) override;
    bool addResizeListener(ResizeCallback callback) override;
    [[nodiscard]] uint32_t surfaceWidth() const override { return m_width; }
    [[nodiscard]] uint32_t surfaceHeight() const override { return m_height; }

private:
    void onResize(int width, int height);

    uint32_t    m_width = 0, m_height = 0;
    std::string m_name;
    GLFWwindow* m_window = nullptr;

    std::vector<FrameCallback>  m_pendingFrames;
    std::vector<ResizeCallback> m_resizeListeners;
};

} // namespace prism

#endif // PRISM_WINDOW_HPP
