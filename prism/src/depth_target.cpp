/*
* File: depth_target.cpp
* Project: prism
* Created on: 1/24/2026
*/
#include "depth_target.hpp"

#include <stdexcept>

#include "errors.hpp"

using namespace prism;

DepthTarget::DepthTarget(IGPUDevice& device, uint32_t width, uint32_t height, Format format)
    : m_device(device), m_width(width), m_height(height), m_format(format)
{
    if (format == Format::RGBA8_UNORM) {
        throw std::invalid_argument("depth target needs a depth format");
    }
    allocate();
}

DepthTarget::~DepthTarget() {
    release();
}

void DepthTarget::allocate() {
    if (m_width == 0 || m_height == 0) {
        throw BufferAllocationError("depth target of zero size");
    }

    m_texture = m_device.createTexture({m_width, m_height, m_format});
    if (m_texture == kNullHandle) {
        throw BufferAllocationError("depth texture");
    }

    m_framebuffer = m_device.createFramebuffer();
    if (m_framebuffer == kNullHandle) {
        release();
        throw BufferAllocationError("framebuffer");
    }

    m_device.attachDepthTexture(m_framebuffer, m_texture);
    const bool complete = m_device.framebufferComplete(m_framebuffer);
    m_device.bindFramebuffer(kNullHandle);
    if (!complete) {
        release();
        throw BufferAllocationError("complete depth framebuffer");
    }
}

void DepthTarget::release() {
    if (m_framebuffer != kNullHandle) {
        m_device.destroyFramebuffer(m_framebuffer);
        m_framebuffer = kNullHandle;
    }
    if (m_texture != kNullHandle) {
        m_device.destroyTexture(m_texture);
        m_texture = kNullHandle;
    }
}

void DepthTarget::resize(uint32_t width, uint32_t height) {
    if (width == m_width && height == m_height) return;
    release();
    m_width = width;
    m_height = height;
    allocate();
}

void DepthTarget::bind() const {
    m_device.bindFramebuffer(m_framebuffer);
    m_device.setViewport(0, 0, m_width, m_height);
}

void DepthTarget::unbind() const {
    m_device.bindFramebuffer(kNullHandle);
}

void DepthTarget::bindTexture(uint32_t unit) const {
    m_device.bindTexture(unit, m_texture);
}
