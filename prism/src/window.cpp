/*
* File: window.cpp
* Project: prism
* Created on: 1/21/2026
* Description: GLFW window / frame host implementation
*/

#include "window.hpp"

#include <glad/glad.h>

#include <iostream>
#include <stdexcept>
#include <utility>

using namespace prism;

Window::Window(uint32_t width, uint32_t height, const std::string& name, bool vsync)
    : m_name(name)
{
    if (!glfwInit()) {
        throw std::runtime_error("Failed to initialize GLFW");
    }

    glfwWindowHint(GLFW_CLIENT_API, GLFW_OPENGL_API);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
    glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
#ifdef __APPLE__
    glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
#endif
    glfwWindowHint(GLFW_RESIZABLE, GLFW_TRUE);

    m_window = glfwCreateWindow(static_cast<int>(width),
                                static_cast<int>(height),
                                m_name.c_str(),
                                nullptr, nullptr);
    if (!m_window) {
        glfwTerminate();
        throw std::runtime_error("Failed to create GLFW window");
    }

    glfwMakeContextCurrent(m_window);
    if (!gladLoadGLLoader((GLADloadproc)glfwGetProcAddress)) {
        glfwDestroyWindow(m_window);
        glfwTerminate();
        throw std::runtime_error("Failed to initialize GLAD");
    }
    glfwSwapInterval(vsync ? 1 : 0);

    // framebuffer pixels, not screen coordinates
    int fbWidth = 0, fbHeight = 0;
    glfwGetFramebufferSize(m_window, &fbWidth, &fbHeight);
    m_width  = static_cast<uint32_t>(fbWidth);
    m_height = static_cast<uint32_t>(fbHeight);

    glfwSetWindowUserPointer(m_window, this);

    glfwSetFramebufferSizeCallback(m_window, [](GLFWwindow* w, int fbw, int fbh) {
        auto* self = static_cast<Window*>(glfwGetWindowUserPointer(w));
        if (self) self->onResize(fbw, fbh);
    });

    std::cout << "[WINDOW] " << m_name << " " << m_width << "x" << m_height << std::endl;
}

Window::~Window() {
    m_pendingFrames.clear();
    m_resizeListeners.clear();

    if (m_window) {
        glfwDestroyWindow(m_window);
        m_window = nullptr;
    }

    glfwTerminate();
}

bool Window::requestAnimationFrame(FrameCallback callback) {
    if (!m_window || !callback) return false;
    m_pendingFrames.push_back(std::move(callback));
    return true;
}

bool Window::addResizeListener(ResizeCallback callback) {
    if (!m_window || !callback) return false;
    m_resizeListeners.push_back(std::move(callback));
    return true;
}

bool Window::shouldClose() const {
    return m_window ? glfwWindowShouldClose(m_window) : true;
}

void Window::run() {
    while (!shouldClose()) {
        if (m_pendingFrames.empty()) glfwWaitEvents();
        else glfwPollEvents();

        // frames requested while these run belong to the next refresh
        std::vector<FrameCallback> frames;
        frames.swap(m_pendingFrames);
        for (auto& frame : frames) frame();

        if (!frames.empty()) glfwSwapBuffers(m_window);
    }
}

void Window::onResize(int width, int height) {
    m_width  = static_cast<uint32_t>(width);
    m_height = static_cast<uint32_t>(height);

    // copy: a listener may register another one
    auto listeners = m_resizeListeners;
    for (auto& listener : listeners) listener(m_width, m_height);
}
