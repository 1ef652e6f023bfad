/*
* File: scene.cpp
* Project: prism
* Created on: 1/23/2026
*/
#include "scene.hpp"

#include <iostream>

#include "cube_scene.hpp"
#include "triangle_scene.hpp"

using namespace prism;

std::unique_ptr<IScene> prism::makeScene(IGPUDevice& device, const SceneConfig& config) {
    std::cout << "[SCENE] " << toString(config.scene) << std::endl;
    switch (config.scene) {
    case SceneKind::Cube:     return std::make_unique<CubeScene>(device, config);
    case SceneKind::Triangle: return std::make_unique<TriangleScene>(device, config);
    }
    return nullptr;
}
