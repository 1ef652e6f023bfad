/*
* File: app.hpp
* Project: prism
* Created on: 1/23/2026
*/
#ifndef PRISM_APP_HPP
#define PRISM_APP_HPP

#include <memory>

#include "config.hpp"

namespace prism {

class Window;
class GLDevice;
class IScene;
class FrameScheduler;

class App {
public:
    explicit App(SceneConfig config);
    ~App();

    // Blocks until the window is closed
    void run();

private:
    void init();
    void shutdown();

    SceneConfig m_config;

    // destroyed in reverse: scheduler, scene, device, window (context last)
    std::unique_ptr<Window> m_window;
    std::unique_ptr<GLDevice> m_device;
    std::unique_ptr<IScene> m_scene;
    std::unique_ptr<FrameScheduler> m_scheduler;
};

} // namespace prism
#endif
