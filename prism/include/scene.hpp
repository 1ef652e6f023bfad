/*
* File: scene
* Project: prism
* Created on: 1/22/2026
*
* Description: Demo scene interface. A scene owns its program and buffers and
* is driven once per FrameScheduler callback.
*/
#ifndef PRISM_SCENE_HPP
#define PRISM_SCENE_HPP

#include <cstdint>
#include <memory>

#include "config.hpp"
#include "gpu_device.hpp"

namespace prism {

class IScene {
public:
    virtual ~IScene() = default;

    // surfaceChanged: width/height may differ from the last call
    virtual void onFrame(IGPUDevice& device, bool surfaceChanged, uint32_t width, uint32_t height) = 0;
};

std::unique_ptr<IScene> makeScene(IGPUDevice& device, const SceneConfig& config);

} // namespace prism

#endif // PRISM_SCENE_HPP
