/*
* File: config.cpp
* Project: prism
* Created on: 1/22/2026
*/
#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include "errors.hpp"

using namespace prism;

namespace {

template <typename T>
void read(const YAML::Node& parent, const char* key, const std::string& path, T& out) {
    const YAML::Node n = parent[key];
    if (!n) return;
    try {
        out = n.as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(path, e.msg);
    }
}

void requireMap(const YAML::Node& n, const std::string& path) {
    if (n && !n.IsMap()) throw ConfigError(path, "expected a mapping");
}

SceneKind parseSceneKind(const std::string& name) {
    if (name == "cube") return SceneKind::Cube;
    if (name == "triangle") return SceneKind::Triangle;
    throw ConfigError("scene", "unknown scene '" + name + "' (expected cube or triangle)");
}

SceneConfig fromNode(const YAML::Node& root) {
    SceneConfig cfg;
    if (!root || root.IsNull()) return cfg;
    if (!root.IsMap()) throw ConfigError("<root>", "expected a mapping");

    const YAML::Node window = root["window"];
    requireMap(window, "window");
    if (window) {
        read(window, "width", "window.width", cfg.window.width);
        read(window, "height", "window.height", cfg.window.height);
        read(window, "title", "window.title", cfg.window.title);
        read(window, "vsync", "window.vsync", cfg.window.vsync);
        if (cfg.window.width == 0 || cfg.window.height == 0) {
            throw ConfigError("window", "width and height must be non-zero");
        }
    }

    if (root["scene"]) {
        std::string name;
        read(root, "scene", "scene", name);
        cfg.scene = parseSceneKind(name);
    }

    if (const YAML::Node cc = root["clear_color"]) {
        if (!cc.IsSequence() || cc.size() != 4) {
            throw ConfigError("clear_color", "expected a list of 4 numbers");
        }
        for (size_t i = 0; i < 4; ++i) {
            try {
                cfg.clearColor[static_cast<glm::length_t>(i)] = cc[i].as<float>();
            } catch (const YAML::Exception& e) {
                throw ConfigError("clear_color", e.msg);
            }
        }
    }

    const YAML::Node camera = root["camera"];
    requireMap(camera, "camera");
    if (camera) {
        read(camera, "fov", "camera.fov", cfg.camera.fovDegrees);
        read(camera, "near", "camera.near", cfg.camera.zNear);
        read(camera, "far", "camera.far", cfg.camera.zFar);
        if (cfg.camera.fovDegrees <= 0.0f || cfg.camera.fovDegrees >= 180.0f) {
            throw ConfigError("camera.fov", "must be between 0 and 180 degrees");
        }
        if (cfg.camera.zNear <= 0.0f || cfg.camera.zFar <= cfg.camera.zNear) {
            throw ConfigError("camera", "need 0 < near < far");
        }
    }

    read(root, "instances", "instances", cfg.instances);
    read(root, "depth_test", "depth_test", cfg.depthTest);
    return cfg;
}

} // namespace

const char* prism::toString(SceneKind kind) {
    switch (kind) {
    case SceneKind::Cube:     return "cube";
    case SceneKind::Triangle: return "triangle";
    }
    return "unknown";
}

SceneConfig prism::parseSceneConfig(const std::string& yamlText) {
    YAML::Node root;
    try {
        root = YAML::Load(yamlText);
    } catch (const YAML::Exception& e) {
        throw ConfigError("<document>", e.what());
    }
    return fromNode(root);
}

SceneConfig prism::loadSceneConfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::BadFile&) {
        throw ConfigError("<file>", "cannot open " + path);
    } catch (const YAML::Exception& e) {
        throw ConfigError("<document>", path + ": " + e.what());
    }
    return fromNode(root);
}
