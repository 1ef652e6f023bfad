/*
* File: test_config.cpp
* Project: prism
* Created on: 1/26/2026
*/
#include <gtest/gtest.h>

#include "config.hpp"
#include "errors.hpp"

using namespace prism;

namespace {

std::string keyOf(const std::string& yaml) {
    try {
        (void)parseSceneConfig(yaml);
    } catch (const ConfigError& e) {
        return e.key();
    }
    return "<none>";
}

} // namespace

TEST(SceneConfig, EmptyDocumentGivesDefaults) {
    const SceneConfig cfg = parseSceneConfig("");

    EXPECT_EQ(cfg.window.width, 1280u);
    EXPECT_EQ(cfg.window.height, 720u);
    EXPECT_EQ(cfg.window.title, "prism");
    EXPECT_TRUE(cfg.window.vsync);
    EXPECT_EQ(cfg.scene, SceneKind::Cube);
    EXPECT_EQ(cfg.clearColor, glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
    EXPECT_FLOAT_EQ(cfg.camera.fovDegrees, 90.0f);
    EXPECT_FLOAT_EQ(cfg.camera.zNear, 0.1f);
    EXPECT_FLOAT_EQ(cfg.camera.zFar, 1000.0f);
    EXPECT_EQ(cfg.instances, 5000u);
    EXPECT_TRUE(cfg.depthTest);
}

TEST(SceneConfig, ParsesEveryKey) {
    const SceneConfig cfg = parseSceneConfig(R"(
window: { width: 640, height: 480, title: demo, vsync: false }
scene: triangle
clear_color: [0.1, 0.2, 0.3, 1]
camera: { fov: 60, near: 0.5, far: 50 }
instances: 12
depth_test: false
)");

    EXPECT_EQ(cfg.window.width, 640u);
    EXPECT_EQ(cfg.window.height, 480u);
    EXPECT_EQ(cfg.window.title, "demo");
    EXPECT_FALSE(cfg.window.vsync);
    EXPECT_EQ(cfg.scene, SceneKind::Triangle);
    EXPECT_FLOAT_EQ(cfg.clearColor.g, 0.2f);
    EXPECT_FLOAT_EQ(cfg.camera.fovDegrees, 60.0f);
    EXPECT_FLOAT_EQ(cfg.camera.zFar, 50.0f);
    EXPECT_EQ(cfg.instances, 12u);
    EXPECT_FALSE(cfg.depthTest);
}

TEST(SceneConfig, PartialSectionsKeepOtherDefaults) {
    const SceneConfig cfg = parseSceneConfig("window: { title: only-title }\n");

    EXPECT_EQ(cfg.window.title, "only-title");
    EXPECT_EQ(cfg.window.width, 1280u);
    EXPECT_EQ(cfg.scene, SceneKind::Cube);
}

TEST(SceneConfig, ErrorsNameTheOffendingKey) {
    EXPECT_EQ(keyOf("scene: sphere"), "scene");
    EXPECT_EQ(keyOf("window: { width: wide }"), "window.width");
    EXPECT_EQ(keyOf("window: 3"), "window");
    EXPECT_EQ(keyOf("clear_color: [1, 0, 0]"), "clear_color");
    EXPECT_EQ(keyOf("clear_color: [1, 0, red, 1]"), "clear_color");
    EXPECT_EQ(keyOf("camera: { fov: 200 }"), "camera.fov");
    EXPECT_EQ(keyOf("camera: { near: 10, far: 1 }"), "camera");
    EXPECT_EQ(keyOf("depth_test: maybe"), "depth_test");
    EXPECT_EQ(keyOf("- just\n- a list\n"), "<root>");
}

TEST(SceneConfig, MalformedYamlIsAConfigError) {
    try {
        (void)parseSceneConfig("window: [1, 2");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.key(), "<document>");
        EXPECT_EQ(e.kind(), ErrorKind::Config);
    }
}

TEST(SceneConfig, MissingFileIsAConfigError) {
    try {
        (void)loadSceneConfig("/nonexistent/prism/scene.yaml");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.key(), "<file>");
        EXPECT_NE(std::string(e.what()).find("/nonexistent/prism/scene.yaml"), std::string::npos);
    }
}

TEST(SceneConfig, SceneNamesRoundTrip) {
    EXPECT_STREQ(toString(SceneKind::Cube), "cube");
    EXPECT_STREQ(toString(SceneKind::Triangle), "triangle");
}
