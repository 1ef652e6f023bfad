/*
* File: triangle_scene
* Project: prism
* Created on: 1/23/2026
*
* Description: Single colored triangle whose base corners sway in x
*/
#ifndef PRISM_TRIANGLE_SCENE_HPP
#define PRISM_TRIANGLE_SCENE_HPP

#include <cstdint>

#include "buffer_set.hpp"
#include "math.hpp"
#include "scene.hpp"
#include "shader_program.hpp"

namespace prism {

struct TriangleVertex {
    Vector3 position;
    Vector3 color;
};

class TriangleScene final : public IScene {
public:
    TriangleScene(IGPUDevice& device, const SceneConfig& config);

    void onFrame(IGPUDevice& device, bool surfaceChanged, uint32_t width, uint32_t height) override;

    [[nodiscard]] const BufferSet& buffers() const { return m_buffers; }
    [[nodiscard]] BufferSlot<TriangleVertex> vertexSlot() const { return m_vertices; }
    [[nodiscard]] uint32_t frameCount() const { return m_frame; }

private:
    SceneConfig m_config;
    ShaderProgram m_program;
    BufferSlot<TriangleVertex> m_vertices;
    BufferSet m_buffers;
    uint32_t m_frame = 0;
};

} // namespace prism

#endif //PRISM_TRIANGLE_SCENE_HPP
