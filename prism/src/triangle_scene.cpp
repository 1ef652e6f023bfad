/*
* File: triangle_scene.cpp
* Project: prism
* Created on: 1/23/2026
*/
#include "triangle_scene.hpp"

#include <cmath>
#include <vector>

using namespace prism;

namespace {

constexpr const char* kVertexSource = R"(#version 330 core
in vec3 position;
in vec3 vertexColor;
out vec3 color;

void main() {
    color = vertexColor;
    gl_Position = vec4(position, 1.0);
}
)";

constexpr const char* kFragmentSource = R"(#version 330 core
in vec3 color;
out vec4 outColor;

void main() {
    outColor = vec4(color, 1.0);
}
)";

BufferSet buildTriangle(IGPUDevice& device, BufferSlot<TriangleVertex>& slot) {
    BufferSet::Builder builder;
    slot = builder.add(std::vector<TriangleVertex>{
                           {{-0.7f, -0.7f, 0.0f}, {1.0f, 0.0f, 0.0f}},
                           {{ 0.7f, -0.7f, 0.0f}, {0.0f, 1.0f, 0.0f}},
                           {{ 0.0f,  0.7f, 0.0f}, {0.0f, 0.0f, 1.0f}},
                       },
                       BufferKind::VERTEX, UpdateFrequency::DYNAMIC);
    return builder.build(device);
}

} // namespace

TriangleScene::TriangleScene(IGPUDevice& device, const SceneConfig& config)
    : m_config(config),
      m_program(device, kVertexSource, kFragmentSource, {}, {"position", "vertexColor"}),
      m_buffers(buildTriangle(device, m_vertices))
{
    const auto& vbo = m_buffers.buffer(m_vertices);
    vbo.bindField(m_program.findAttribute("position"), PRISM_VERTEX_FIELD(TriangleVertex, position));
    vbo.bindField(m_program.findAttribute("vertexColor"), PRISM_VERTEX_FIELD(TriangleVertex, color));
}

void TriangleScene::onFrame(IGPUDevice& device, bool surfaceChanged, uint32_t width, uint32_t height) {
    if (surfaceChanged) {
        device.setViewport(0, 0, width, height);
    }

    ++m_frame;
    device.setClearColor(m_config.clearColor);
    device.clear(ClearMask::COLOR | ClearMask::DEPTH);

    // corners 0 and 1 swing in opposite directions, period 60*pi frames
    const float sway = std::sin(static_cast<float>(m_frame) / 30.0f);
    auto& vbo = m_buffers.buffer(m_vertices);
    vbo[0].position.x = sway;
    vbo[1].position.x = -sway;
    vbo.synchronize();

    m_program.activate();
    m_buffers.drawArrays(m_vertices, PrimitiveTopology::TRIANGLES);
}
