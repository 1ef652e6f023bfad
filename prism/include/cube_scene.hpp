/*
* File: cube_scene
* Project: prism
* Created on: 1/22/2026
*
* Description: Field of instanced cubes spinning about Y. The vertex shader
* lays instances out 40 to a row, one row per unit of depth.
*/
#ifndef PRISM_CUBE_SCENE_HPP
#define PRISM_CUBE_SCENE_HPP

#include <cstdint>

#include "buffer_set.hpp"
#include "math.hpp"
#include "scene.hpp"
#include "shader_program.hpp"

namespace prism {

struct CubeVertex {
    Vector3 pos;
    Vector3 color;
};

class CubeScene final : public IScene {
public:
    static constexpr float kRadiansPerFrame = 1.0f / 30.0f;

    CubeScene(IGPUDevice& device, const SceneConfig& config);

    void onFrame(IGPUDevice& device, bool surfaceChanged, uint32_t width, uint32_t height) override;

    [[nodiscard]] const ShaderProgram& program() const { return m_program; }
    [[nodiscard]] const BufferSet& buffers() const { return m_buffers; }
    [[nodiscard]] BufferSlot<CubeVertex> vertexSlot() const { return m_vertices; }
    [[nodiscard]] BufferSlot<uint8_t> indexSlot() const { return m_indices; }

private:
    static BufferSet buildGeometry(IGPUDevice& device, BufferSlot<CubeVertex>& vertices, BufferSlot<uint8_t>& indices);

    SceneConfig m_config;
    ShaderProgram m_program;
    BufferSlot<CubeVertex> m_vertices;
    BufferSlot<uint8_t> m_indices;
    BufferSet m_buffers;
};

} // namespace prism

#endif //PRISM_CUBE_SCENE_HPP
