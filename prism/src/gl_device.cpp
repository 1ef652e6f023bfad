/*
* File: gl_device
* Project: prism
* Created on: 1/21/2026
* Description: GL object management and draw calls
*/
#include "gl_device.hpp"

#include <glad/glad.h>

#include <glm/gtc/type_ptr.hpp>

#include <iostream>
#include <stdexcept>
#include <string>

using namespace prism;

static GLenum toGL(BufferKind kind) {
    return kind == BufferKind::INDEX ? GL_ELEMENT_ARRAY_BUFFER : GL_ARRAY_BUFFER;
}

static GLenum toGL(UpdateFrequency frequency) {
    return frequency == UpdateFrequency::DYNAMIC ? GL_DYNAMIC_DRAW : GL_STATIC_DRAW;
}

static GLenum toGL(ShaderStage stage) {
    return stage == ShaderStage::FRAGMENT ? GL_FRAGMENT_SHADER : GL_VERTEX_SHADER;
}

static GLenum toGL(ComponentType type) {
    switch (type) {
    case ComponentType::BYTE:           return GL_BYTE;
    case ComponentType::UNSIGNED_BYTE:  return GL_UNSIGNED_BYTE;
    case ComponentType::SHORT:          return GL_SHORT;
    case ComponentType::UNSIGNED_SHORT: return GL_UNSIGNED_SHORT;
    case ComponentType::INT:            return GL_INT;
    case ComponentType::UNSIGNED_INT:   return GL_UNSIGNED_INT;
    case ComponentType::FLOAT:          return GL_FLOAT;
    }
    return GL_FLOAT;
}

static GLenum toGL(IndexType type) {
    switch (type) {
    case IndexType::UINT8:  return GL_UNSIGNED_BYTE;
    case IndexType::UINT16: return GL_UNSIGNED_SHORT;
    case IndexType::UINT32: return GL_UNSIGNED_INT;
    }
    return GL_UNSIGNED_INT;
}

static GLenum toGL(PrimitiveTopology topology) {
    switch (topology) {
    case PrimitiveTopology::POINTS:         return GL_POINTS;
    case PrimitiveTopology::LINES:          return GL_LINES;
    case PrimitiveTopology::LINE_STRIP:     return GL_LINE_STRIP;
    case PrimitiveTopology::TRIANGLES:      return GL_TRIANGLES;
    case PrimitiveTopology::TRIANGLE_STRIP: return GL_TRIANGLE_STRIP;
    case PrimitiveTopology::TRIANGLE_FAN:   return GL_TRIANGLE_FAN;
    }
    return GL_TRIANGLES;
}

static GLenum toGL(Feature feature) {
    switch (feature) {
    case Feature::DEPTH_TEST: return GL_DEPTH_TEST;
    case Feature::CULL_FACE:  return GL_CULL_FACE;
    case Feature::BLEND:      return GL_BLEND;
    }
    return GL_DEPTH_TEST;
}

GLDevice::GLDevice() {
    // glad has to be loaded by whoever made the context current
    if (!glCreateShader) {
        throw std::runtime_error("GL entry points are not loaded");
    }
    std::cout << "[GL] " << reinterpret_cast<const char*>(glGetString(GL_VERSION))
              << " on " << reinterpret_cast<const char*>(glGetString(GL_RENDERER)) << std::endl;
}

/*
 * Buffers
 */

BufferHandle GLDevice::createBuffer() {
    GLuint b = 0;
    glGenBuffers(1, &b);
    return b;
}

void GLDevice::destroyBuffer(BufferHandle buffer) {
    if (buffer) glDeleteBuffers(1, &buffer);
}

void GLDevice::bindBuffer(BufferKind kind, BufferHandle buffer) {
    glBindBuffer(toGL(kind), buffer);
}

void GLDevice::uploadBuffer(BufferKind kind, std::span<const std::byte> bytes, UpdateFrequency frequency) {
    glBufferData(toGL(kind),
                 static_cast<GLsizeiptr>(bytes.size()),
                 bytes.empty() ? nullptr : bytes.data(),
                 toGL(frequency));
}

/*
 * Shaders / programs
 */

ShaderHandle GLDevice::createShader(ShaderStage stage) {
    return glCreateShader(toGL(stage));
}

bool GLDevice::compileShader(ShaderHandle shader, std::string_view source) {
    const char* src = source.data();
    const GLint len = static_cast<GLint>(source.size());
    glShaderSource(shader, 1, &src, &len);
    glCompileShader(shader);
    GLint ok = GL_FALSE;
    glGetShaderiv(shader, GL_COMPILE_STATUS, &ok);
    return ok == GL_TRUE;
}

std::string GLDevice::shaderInfoLog(ShaderHandle shader) {
    GLint len = 0;
    glGetShaderiv(shader, GL_INFO_LOG_LENGTH, &len);
    if (len <= 1) return {};
    std::string log(static_cast<size_t>(len), '\0');
    glGetShaderInfoLog(shader, len, nullptr, log.data());
    log.resize(static_cast<size_t>(len - 1));
    return log;
}

void GLDevice::destroyShader(ShaderHandle shader) {
    if (shader) glDeleteShader(shader);
}

ProgramHandle GLDevice::createProgram() {
    return glCreateProgram();
}

bool GLDevice::linkProgram(ProgramHandle program, ShaderHandle vertex, ShaderHandle fragment) {
    glAttachShader(program, vertex);
    glAttachShader(program, fragment);
    glLinkProgram(program);
    GLint ok = GL_FALSE;
    glGetProgramiv(program, GL_LINK_STATUS, &ok);
    if (ok == GL_TRUE) {
        // shaders can be deleted right away once detached
        glDetachShader(program, vertex);
        glDetachShader(program, fragment);
    }
    return ok == GL_TRUE;
}

std::string GLDevice::programInfoLog(ProgramHandle program) {
    GLint len = 0;
    glGetProgramiv(program, GL_INFO_LOG_LENGTH, &len);
    if (len <= 1) return {};
    std::string log(static_cast<size_t>(len), '\0');
    glGetProgramInfoLog(program, len, nullptr, log.data());
    log.resize(static_cast<size_t>(len - 1));
    return log;
}

void GLDevice::destroyProgram(ProgramHandle program) {
    if (program) glDeleteProgram(program);
}

void GLDevice::useProgram(ProgramHandle program) {
    glUseProgram(program);
}

std::optional<AttributeSlot> GLDevice::attributeLocation(ProgramHandle program, std::string_view name) {
    const std::string n(name);
    GLint loc = glGetAttribLocation(program, n.c_str());
    if (loc < 0) return std::nullopt;
    return static_cast<AttributeSlot>(loc);
}

std::optional<UniformLocation> GLDevice::uniformLocation(ProgramHandle program, std::string_view name) {
    const std::string n(name);
    GLint loc = glGetUniformLocation(program, n.c_str());
    if (loc < 0) return std::nullopt;
    return loc;
}

/*
 * Vertex input
 */

VertexArrayHandle GLDevice::createVertexArray() {
    GLuint vao = 0;
    glGenVertexArrays(1, &vao);
    return vao;
}

void GLDevice::bindVertexArray(VertexArrayHandle vao) {
    glBindVertexArray(vao);
}

void GLDevice::destroyVertexArray(VertexArrayHandle vao) {
    if (vao) glDeleteVertexArrays(1, &vao);
}

void GLDevice::vertexAttribPointer(AttributeSlot slot, uint32_t components, ComponentType type,
                                   bool normalized, uint32_t stride, size_t offset) {
    glVertexAttribPointer(slot,
                          static_cast<GLint>(components),
                          toGL(type),
                          normalized ? GL_TRUE : GL_FALSE,
                          static_cast<GLsizei>(stride),
                          reinterpret_cast<const void*>(offset));
}

void GLDevice::enableVertexAttrib(AttributeSlot slot) {
    glEnableVertexAttribArray(slot);
}

void GLDevice::vertexAttribDivisor(AttributeSlot slot, uint32_t divisor) {
    glVertexAttribDivisor(slot, divisor);
}

/*
 * Uniforms
 */

void GLDevice::setUniform(UniformLocation location, int32_t value) {
    glUniform1i(location, value);
}

void GLDevice::setUniform(UniformLocation location, float value) {
    glUniform1f(location, value);
}

void GLDevice::setUniform(UniformLocation location, const glm::vec2& value) {
    glUniform2fv(location, 1, glm::value_ptr(value));
}

void GLDevice::setUniform(UniformLocation location, const glm::vec3& value) {
    glUniform3fv(location, 1, glm::value_ptr(value));
}

void GLDevice::setUniform(UniformLocation location, const glm::vec4& value) {
    glUniform4fv(location, 1, glm::value_ptr(value));
}

void GLDevice::setUniform(UniformLocation location, const glm::mat4& value) {
    glUniformMatrix4fv(location, 1, GL_FALSE, glm::value_ptr(value));
}

/*
 * Draws
 */

void GLDevice::drawArrays(PrimitiveTopology topology, uint32_t first, uint32_t count, uint32_t instances) {
    if (instances == 1) {
        glDrawArrays(toGL(topology), static_cast<GLint>(first), static_cast<GLsizei>(count));
    } else {
        glDrawArraysInstanced(toGL(topology), static_cast<GLint>(first),
                              static_cast<GLsizei>(count), static_cast<GLsizei>(instances));
    }
}

void GLDevice::drawElements(PrimitiveTopology topology, uint32_t count, IndexType type,
                            size_t offsetBytes, uint32_t instances) {
    const void* offset = reinterpret_cast<const void*>(offsetBytes);
    if (instances == 1) {
        glDrawElements(toGL(topology), static_cast<GLsizei>(count), toGL(type), offset);
    } else {
        glDrawElementsInstanced(toGL(topology), static_cast<GLsizei>(count), toGL(type),
                                offset, static_cast<GLsizei>(instances));
    }
}

/*
 * Frame state
 */

void GLDevice::setClearColor(const glm::vec4& rgba) {
    glClearColor(rgba.r, rgba.g, rgba.b, rgba.a);
}

void GLDevice::clear(ClearMask mask) {
    GLbitfield bits = 0;
    if (hasFlag(mask, ClearMask::COLOR))   bits |= GL_COLOR_BUFFER_BIT;
    if (hasFlag(mask, ClearMask::DEPTH))   bits |= GL_DEPTH_BUFFER_BIT;
    if (hasFlag(mask, ClearMask::STENCIL)) bits |= GL_STENCIL_BUFFER_BIT;
    if (bits) glClear(bits);
}

void GLDevice::setViewport(int32_t x, int32_t y, uint32_t width, uint32_t height) {
    glViewport(x, y, static_cast<GLsizei>(width), static_cast<GLsizei>(height));
}

void GLDevice::enable(Feature feature) {
    glEnable(toGL(feature));
}

void GLDevice::disable(Feature feature) {
    glDisable(toGL(feature));
}

/*
 * Off-screen targets
 */

TextureHandle GLDevice::createTexture(const TextureDescriptor& desc) {
    GLuint tex = 0;
    glGenTextures(1, &tex);
    if (!tex) return kNullHandle;

    GLint internalFormat = GL_RGBA8;
    GLenum format = GL_RGBA;
    GLenum type = GL_UNSIGNED_BYTE;
    switch (desc.format) {
    case Format::RGBA8_UNORM:
        break;
    case Format::DEPTH24:
        internalFormat = GL_DEPTH_COMPONENT24; format = GL_DEPTH_COMPONENT; type = GL_UNSIGNED_INT;
        break;
    case Format::DEPTH32_FLOAT:
        internalFormat = GL_DEPTH_COMPONENT32F; format = GL_DEPTH_COMPONENT; type = GL_FLOAT;
        break;
    }

    glBindTexture(GL_TEXTURE_2D, tex);
    glTexImage2D(GL_TEXTURE_2D, 0, internalFormat,
                 static_cast<GLsizei>(desc.width), static_cast<GLsizei>(desc.height),
                 0, format, type, nullptr);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
    glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
    glBindTexture(GL_TEXTURE_2D, 0);
    return tex;
}

void GLDevice::bindTexture(uint32_t unit, TextureHandle texture) {
    glActiveTexture(GL_TEXTURE0 + unit);
    glBindTexture(GL_TEXTURE_2D, texture);
}

void GLDevice::destroyTexture(TextureHandle texture) {
    if (texture) glDeleteTextures(1, &texture);
}

FramebufferHandle GLDevice::createFramebuffer() {
    GLuint fbo = 0;
    glGenFramebuffers(1, &fbo);
    return fbo;
}

void GLDevice::bindFramebuffer(FramebufferHandle framebuffer) {
    glBindFramebuffer(GL_FRAMEBUFFER, framebuffer);
}

void GLDevice::attachDepthTexture(FramebufferHandle framebuffer, TextureHandle texture) {
    glBindFramebuffer(GL_FRAMEBUFFER, framebuffer);
    glFramebufferTexture2D(GL_FRAMEBUFFER, GL_DEPTH_ATTACHMENT, GL_TEXTURE_2D, texture, 0);
    // depth-only target
    glDrawBuffer(GL_NONE);
    glReadBuffer(GL_NONE);
}

bool GLDevice::framebufferComplete(FramebufferHandle framebuffer) {
    glBindFramebuffer(GL_FRAMEBUFFER, framebuffer);
    return glCheckFramebufferStatus(GL_FRAMEBUFFER) == GL_FRAMEBUFFER_COMPLETE;
}

void GLDevice::destroyFramebuffer(FramebufferHandle framebuffer) {
    if (framebuffer) glDeleteFramebuffers(1, &framebuffer);
}
