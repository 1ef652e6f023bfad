/*
* File: cube_scene.cpp
* Project: prism
* Created on: 1/22/2026
*/
#include "cube_scene.hpp"

#include <vector>

using namespace prism;

namespace {

constexpr const char* kVertexSource = R"(#version 330 core
uniform mat4 projection;
in vec3 pos;
in vec3 color;
out vec3 vColor;

void main() {
    vColor = color;
    vec3 offset = vec3((gl_InstanceID % 40) - 20, -1, -(gl_InstanceID / 40));
    gl_Position = projection * vec4(pos + offset, 1.0);
}
)";

constexpr const char* kFragmentSource = R"(#version 330 core
in vec3 vColor;
out vec4 outColor;

void main() {
    outColor = vec4(vColor, 1.0);
}
)";

constexpr float h = 0.4f;

std::vector<CubeVertex> cubeVertices() {
    return {
        {{-h, -h, -h}, {0.0f, 0.0f, 0.0f}},
        {{ h, -h, -h}, {1.0f, 0.0f, 0.0f}},
        {{-h,  h, -h}, {0.0f, 1.0f, 0.0f}},
        {{-h, -h,  h}, {0.0f, 0.0f, 1.0f}},
        {{ h,  h, -h}, {1.0f, 1.0f, 0.0f}},
        {{-h,  h,  h}, {0.0f, 1.0f, 1.0f}},
        {{ h, -h,  h}, {1.0f, 0.0f, 1.0f}},
        {{ h,  h,  h}, {1.0f, 1.0f, 1.0f}},
    };
}

std::vector<uint8_t> cubeIndices() {
    return {
        0, 1, 2, 1, 2, 4, // back
        3, 6, 5, 6, 5, 7, // front
        0, 2, 3, 2, 3, 5, // left
        1, 4, 6, 4, 6, 7, // right
        0, 1, 3, 1, 3, 6, // top
        2, 4, 5, 4, 5, 7, // bottom
    };
}

} // namespace

CubeScene::CubeScene(IGPUDevice& device, const SceneConfig& config)
    : m_config(config),
      m_program(device, kVertexSource, kFragmentSource, {"projection"}, {"pos", "color"}),
      m_buffers(buildGeometry(device, m_vertices, m_indices))
{
    // the set is still bound from build()
    const auto& vbo = m_buffers.buffer(m_vertices);
    vbo.bindField(m_program.findAttribute("pos"), PRISM_VERTEX_FIELD(CubeVertex, pos));
    vbo.bindField(m_program.findAttribute("color"), PRISM_VERTEX_FIELD(CubeVertex, color));

    if (m_config.depthTest) device.enable(Feature::DEPTH_TEST);
    else device.disable(Feature::DEPTH_TEST);
}

BufferSet CubeScene::buildGeometry(IGPUDevice& device, BufferSlot<CubeVertex>& vertices, BufferSlot<uint8_t>& indices) {
    BufferSet::Builder builder;
    vertices = builder.add(cubeVertices(), BufferKind::VERTEX, UpdateFrequency::DYNAMIC);
    indices = builder.add(cubeIndices(), BufferKind::INDEX, UpdateFrequency::STATIC);
    return builder.build(device);
}

void CubeScene::onFrame(IGPUDevice& device, bool surfaceChanged, uint32_t width, uint32_t height) {
    m_program.activate();

    if (surfaceChanged) {
        device.setViewport(0, 0, width, height);
        // minimized windows report 0x0; keep the old projection
        if (width > 0 && height > 0) {
            const float aspect = static_cast<float>(width) / static_cast<float>(height);
            m_program.setUniform("projection", perspective(glm::radians(m_config.camera.fovDegrees), aspect,
                                                           m_config.camera.zNear, m_config.camera.zFar));
        }
    }

    device.setClearColor(m_config.clearColor);
    device.clear(ClearMask::COLOR | ClearMask::DEPTH);

    auto& vbo = m_buffers.buffer(m_vertices);
    for (CubeVertex& v : vbo.records()) {
        v.pos = rotateAboutAxis(v.pos, Vector3(0.0f, 1.0f, 0.0f), kRadiansPerFrame);
    }
    vbo.synchronize();

    m_buffers.drawIndexed(m_indices, PrimitiveTopology::TRIANGLES, m_config.instances);
}
