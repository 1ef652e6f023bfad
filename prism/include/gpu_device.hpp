/*
* File: gpu_device
* Project: prism
* Created on: 1/12/2026
*
* Description: GPU capability interface - this is the one overloaded by API
*/
#ifndef PRISM_GPU_DEVICE_HPP
#define PRISM_GPU_DEVICE_HPP

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include <glm/glm.hpp>

#include "gpu_types.hpp"
#include "gpu_handles.hpp"

namespace prism {

/*
 * Device
 *
 * Object-creating calls return kNullHandle when the backend refuses the
 * allocation. Every call must be made from the thread that owns the context.
 */

class IGPUDevice {
public:
    virtual ~IGPUDevice() = default;

    // Buffers
    virtual BufferHandle createBuffer() = 0;
    virtual void destroyBuffer(BufferHandle) = 0;
    virtual void bindBuffer(BufferKind kind, BufferHandle buffer) = 0;
    // replaces the whole content of the buffer bound at `kind`
    virtual void uploadBuffer(BufferKind kind, std::span<const std::byte> bytes, UpdateFrequency frequency) = 0;

    // Shaders
    virtual ShaderHandle createShader(ShaderStage stage) = 0;
    virtual bool compileShader(ShaderHandle shader, std::string_view source) = 0;
    virtual std::string shaderInfoLog(ShaderHandle shader) = 0;
    virtual void destroyShader(ShaderHandle) = 0;

    // Programs
    virtual ProgramHandle createProgram() = 0;
    virtual bool linkProgram(ProgramHandle program, ShaderHandle vertex, ShaderHandle fragment) = 0;
    virtual std::string programInfoLog(ProgramHandle program) = 0;
    virtual void destroyProgram(ProgramHandle) = 0;
    virtual void useProgram(ProgramHandle) = 0;
    virtual std::optional<AttributeSlot> attributeLocation(ProgramHandle program, std::string_view name) = 0;
    virtual std::optional<UniformLocation> uniformLocation(ProgramHandle program, std::string_view name) = 0;

    // Vertex input
    virtual VertexArrayHandle createVertexArray() = 0;
    virtual void bindVertexArray(VertexArrayHandle) = 0;
    virtual void destroyVertexArray(VertexArrayHandle) = 0;
    virtual void vertexAttribPointer(AttributeSlot slot, uint32_t components, ComponentType type,
                                     bool normalized, uint32_t stride, size_t offset) = 0;
    virtual void enableVertexAttrib(AttributeSlot slot) = 0;
    virtual void vertexAttribDivisor(AttributeSlot slot, uint32_t divisor) = 0;

    // Uniforms (on the program in use)
    virtual void setUniform(UniformLocation location, int32_t value) = 0;
    virtual void setUniform(UniformLocation location, float value) = 0;
    virtual void setUniform(UniformLocation location, const glm::vec2& value) = 0;
    virtual void setUniform(UniformLocation location, const glm::vec3& value) = 0;
    virtual void setUniform(UniformLocation location, const glm::vec4& value) = 0;
    virtual void setUniform(UniformLocation location, const glm::mat4& value) = 0;

    // Draws
    virtual void drawArrays(PrimitiveTopology topology, uint32_t first, uint32_t count, uint32_t instances = 1) = 0;
    virtual void drawElements(PrimitiveTopology topology, uint32_t count, IndexType type,
                              size_t offsetBytes = 0, uint32_t instances = 1) = 0;

    // Frame state
    virtual void setClearColor(const glm::vec4& rgba) = 0;
    virtual void clear(ClearMask mask) = 0;
    virtual void setViewport(int32_t x, int32_t y, uint32_t width, uint32_t height) = 0;
    virtual void enable(Feature feature) = 0;
    virtual void disable(Feature feature) = 0;

    // Off-screen render targets (shadow passes and similar)
    virtual TextureHandle createTexture(const TextureDescriptor& desc) = 0;
    virtual void bindTexture(uint32_t unit, TextureHandle texture) = 0;
    virtual void destroyTexture(TextureHandle) = 0;
    virtual FramebufferHandle createFramebuffer() = 0;
    virtual void bindFramebuffer(FramebufferHandle framebuffer) = 0;
    virtual void attachDepthTexture(FramebufferHandle framebuffer, TextureHandle texture) = 0;
    virtual bool framebufferComplete(FramebufferHandle framebuffer) = 0;
    virtual void destroyFramebuffer(FramebufferHandle) = 0;
};

} // namespace prism

#endif //PRISM_GPU_DEVICE_HPP
