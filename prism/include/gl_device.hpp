/*
* File: gl_device
* Project: prism
* Created on: 1/21/2026
*
* Description: OpenGL 3.3 core implementation of IGPUDevice. Needs a current
* context with the GL entry points already loaded (see Window).
*/
#ifndef PRISM_GL_DEVICE_HPP
#define PRISM_GL_DEVICE_HPP

#include "gpu_device.hpp"

namespace prism {

class GLDevice final : public IGPUDevice {
public:
    GLDevice();
    ~GLDevice() override = default;

    GLDevice(const GLDevice&) = delete;
    GLDevice& operator=(const GLDevice&) = delete;

    // Buffers
    BufferHandle createBuffer() override;
    void destroyBuffer(BufferHandle buffer) override;
    void bindBuffer(BufferKind kind, BufferHandle buffer) override;
    void uploadBuffer(BufferKind kind, std::span<const std::byte> bytes, UpdateFrequency frequency) override;

    // Shaders / programs
    ShaderHandle createShader(ShaderStage stage) override;
    bool compileShader(ShaderHandle shader, std::string_view source) override;
    std::string shaderInfoLog(ShaderHandle shader) override;
    void destroyShader(ShaderHandle shader) override;
    ProgramHandle createProgram() override;
    bool linkProgram(ProgramHandle program, ShaderHandle vertex, ShaderHandle fragment) override;
    std::string programInfoLog(ProgramHandle program) override;
    void destroyProgram(ProgramHandle program) override;
    void useProgram(ProgramHandle program) override;
    std::optional<AttributeSlot> attributeLocation(ProgramHandle program, std::string_view name) override;
    std::optional<UniformLocation> uniformLocation(ProgramHandle program, std::string_view name) override;

    // Vertex input
    VertexArrayHandle createVertexArray() override;
    void bindVertexArray(VertexArrayHandle vao) override;
    void destroyVertexArray(VertexArrayHandle vao) override;
    void vertexAttribPointer(AttributeSlot slot, uint32_t components, ComponentType type,
                             bool normalized, uint32_t stride, size_t offset) override;
    void enableVertexAttrib(AttributeSlot slot) override;
    void vertexAttribDivisor(AttributeSlot slot, uint32_t divisor) override;

    // Uniforms
    void setUniform(UniformLocation location, int32_t value) override;
    void setUniform(UniformLocation location, float value) override;
    void setUniform(UniformLocation location, const glm::vec2& value) override;
    void setUniform(UniformLocation location, const glm::vec3& value) override;
    void setUniform(UniformLocation location, const glm::vec4& value) override;
    void setUniform(UniformLocation location, const glm::mat4& value) override;

    // Draws
    void drawArrays(PrimitiveTopology topology, uint32_t first, uint32_t count, uint32_t instances) override;
    void drawElements(PrimitiveTopology topology, uint32_t count, IndexType type,
                      size_t offsetBytes, uint32_t instances) override;

    // Frame state
    void setClearColor(const glm::vec4& rgba) override;
    void clear(ClearMask mask) override;
    void setViewport(int32_t x, int32_t y, uint32_t width, uint32_t height) override;
    void enable(Feature feature) override;
    void disable(Feature feature) override;

    // Off-screen targets
    TextureHandle createTexture(const TextureDescriptor& desc) override;
    void bindTexture(uint32_t unit, TextureHandle texture) override;
    void destroyTexture(TextureHandle texture) override;
    FramebufferHandle createFramebuffer() override;
    void bindFramebuffer(FramebufferHandle framebuffer) override;
    void attachDepthTexture(FramebufferHandle framebuffer, TextureHandle texture) override;
    bool framebufferComplete(FramebufferHandle framebuffer) override;
    void destroyFramebuffer(FramebufferHandle framebuffer) override;
};

} // namespace prism

#endif //PRISM_GL_DEVICE_HPP
