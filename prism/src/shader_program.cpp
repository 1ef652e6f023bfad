/*
* File: shader_program.cpp
* Project: prism
* Created on: 1/14/2026
*/
#include "shader_program.hpp"

#include <iostream>
#include <utility>

#include "errors.hpp"

using namespace prism;

ShaderHandle ShaderProgram::compileStage(IGPUDevice& device, ShaderStage stage, std::string_view source) {
    ShaderHandle s = device.createShader(stage);
    if (s == kNullHandle) {
        throw ShaderCompileError(stage, "Unable to create shader object");
    }

    if (!device.compileShader(s, source)) {
        std::string log = device.shaderInfoLog(s);
        device.destroyShader(s);
        throw ShaderCompileError(stage, log.empty() ? "Unknown error creating shader" : std::move(log));
    }
    return s;
}

ProgramHandle ShaderProgram::linkStages(IGPUDevice& device, ShaderHandle vs, ShaderHandle fs) {
    ProgramHandle p = device.createProgram();
    if (p == kNullHandle) {
        throw ShaderLinkError("Unable to create program object");
    }

    if (!device.linkProgram(p, vs, fs)) {
        std::string log = device.programInfoLog(p);
        device.destroyProgram(p);
        throw ShaderLinkError(log.empty() ? "Unknown error linking program" : std::move(log));
    }
    return p;
}

ShaderProgram::ShaderProgram(IGPUDevice& device,
                             std::string_view vertexSource,
                             std::string_view fragmentSource,
                             const std::vector<std::string>& uniformNames,
                             const std::vector<std::string>& attributeNames)
    : m_device(&device) {
    ShaderHandle vs = compileStage(device, ShaderStage::VERTEX, vertexSource);
    ShaderHandle fs = kNullHandle;
    try {
        fs = compileStage(device, ShaderStage::FRAGMENT, fragmentSource);
        m_program = linkStages(device, vs, fs);
    } catch (...) {
        device.destroyShader(vs);
        if (fs != kNullHandle) device.destroyShader(fs);
        throw;
    }

    // the linked program keeps what it needs from the stages
    device.destroyShader(vs);
    device.destroyShader(fs);

    try {
        resolveBindings(uniformNames, attributeNames);
    } catch (...) {
        release();
        throw;
    }

    std::cout << "[SHADER] program " << m_program << " linked ("
              << m_attributes.size() << " attributes, "
              << m_uniforms.size() << " uniforms)" << std::endl;
}

void ShaderProgram::resolveBindings(const std::vector<std::string>& uniformNames,
                                    const std::vector<std::string>& attributeNames) {
    for (const auto& name : attributeNames) {
        auto slot = m_device->attributeLocation(m_program, name);
        if (!slot) throw UnknownBindingError(name);
        m_attributes.emplace(name, *slot);
    }
    for (const auto& name : uniformNames) {
        auto loc = m_device->uniformLocation(m_program, name);
        if (!loc) throw UnknownBindingError(name);
        m_uniforms.emplace(name, *loc);
    }
}

ShaderProgram::~ShaderProgram() { release(); }

ShaderProgram::ShaderProgram(ShaderProgram&& other) noexcept
    : m_device(other.m_device),
      m_program(std::exchange(other.m_program, kNullHandle)),
      m_attributes(std::move(other.m_attributes)),
      m_uniforms(std::move(other.m_uniforms)) {}

ShaderProgram& ShaderProgram::operator=(ShaderProgram&& other) noexcept {
    if (this != &other) {
        release();
        m_device = other.m_device;
        m_program = std::exchange(other.m_program, kNullHandle);
        m_attributes = std::move(other.m_attributes);
        m_uniforms = std::move(other.m_uniforms);
    }
    return *this;
}

void ShaderProgram::release() {
    if (m_program != kNullHandle) {
        m_device->destroyProgram(m_program);
        m_program = kNullHandle;
    }
}

AttributeSlot ShaderProgram::findAttribute(std::string_view name) const {
    auto it = m_attributes.find(name);
    if (it == m_attributes.end()) throw UnknownBindingError(std::string(name));
    return it->second;
}

UniformLocation ShaderProgram::findUniform(std::string_view name) const {
    auto it = m_uniforms.find(name);
    if (it == m_uniforms.end()) throw UnknownBindingError(std::string(name));
    return it->second;
}

void ShaderProgram::activate() const {
    m_device->useProgram(m_program);
}
