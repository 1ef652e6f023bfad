/*
* File: config
* Project: prism
* Created on: 1/22/2026
*
* Description: YAML scene configuration for the demo
*/
#ifndef PRISM_CONFIG_HPP
#define PRISM_CONFIG_HPP

#include <cstdint>
#include <string>

#include <glm/glm.hpp>

namespace prism {

enum class SceneKind : uint8_t {
    Cube,
    Triangle
};

const char* toString(SceneKind kind);

struct WindowConfig {
    uint32_t width = 1280;
    uint32_t height = 720;
    std::string title = "prism";
    bool vsync = true;
};

struct CameraConfig {
    float fovDegrees = 90.0f;
    float zNear = 0.1f;
    float zFar = 1000.0f;
};

// Every key is optional; missing keys keep these defaults
struct SceneConfig {
    WindowConfig window;
    SceneKind scene = SceneKind::Cube;
    glm::vec4 clearColor{0.0f, 0.0f, 0.0f, 1.0f};
    CameraConfig camera;
    uint32_t instances = 5000;
    bool depthTest = true;
};

// Both throw ConfigError naming the offending key
SceneConfig parseSceneConfig(const std::string& yamlText);
SceneConfig loadSceneConfig(const std::string& path);

} // namespace prism

#endif //PRISM_CONFIG_HPP
