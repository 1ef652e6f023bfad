/*
* File: app.cpp
* Project: prism
* Created on: 1/23/2026
*/
#include "app.hpp"

#include <utility>

#include "frame_scheduler.hpp"
#include "gl_device.hpp"
#include "scene.hpp"
#include "window.hpp"

namespace prism {

App::App(SceneConfig config)
    : m_config(std::move(config)) {}

App::~App() {
    shutdown();
}

void App::run() {
    init();

    m_scheduler->start([this](bool surfaceChanged) {
        m_scene->onFrame(*m_device, surfaceChanged, m_window->surfaceWidth(), m_window->surfaceHeight());
    });

    m_window->run();

    shutdown();
}

void App::init() {
    m_window = std::make_unique<Window>(m_config.window.width, m_config.window.height,
                                        m_config.window.title, m_config.window.vsync);
    m_device = std::make_unique<GLDevice>();
    m_scene = makeScene(*m_device, m_config);
    m_scheduler = std::make_unique<FrameScheduler>(*m_window);
}

void App::shutdown() {
    // GL objects have to go while the context still exists
    m_scheduler.reset();
    m_scene.reset();
    m_device.reset();
    m_window.reset();
}

} // namespace prism
