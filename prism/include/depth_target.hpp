/*
* File: depth_target
* Project: prism
* Created on: 1/24/2026
*
* Description: Off-screen depth-only render target (shadow-pass style)
*/
#ifndef PRISM_DEPTH_TARGET_HPP
#define PRISM_DEPTH_TARGET_HPP

#include <cstdint>

#include "gpu_device.hpp"

namespace prism {

class DepthTarget {
public:
    // Throws BufferAllocationError if the texture or framebuffer can't be made
    // or the backend reports the framebuffer incomplete.
    DepthTarget(IGPUDevice& device, uint32_t width, uint32_t height, Format format = Format::DEPTH24);
    ~DepthTarget();

    DepthTarget(const DepthTarget&) = delete;
    DepthTarget& operator=(const DepthTarget&) = delete;

    // Recreates the depth texture at the new size. No-op when unchanged.
    void resize(uint32_t width, uint32_t height);

    // Renders into the target and sets the viewport to cover it
    void bind() const;
    // Back to the default framebuffer
    void unbind() const;

    void bindTexture(uint32_t unit) const;

    [[nodiscard]] uint32_t width() const { return m_width; }
    [[nodiscard]] uint32_t height() const { return m_height; }
    [[nodiscard]] TextureHandle texture() const { return m_texture; }
    [[nodiscard]] FramebufferHandle framebuffer() const { return m_framebuffer; }

private:
    void allocate();
    void release();

    IGPUDevice& m_device;
    uint32_t m_width;
    uint32_t m_height;
    Format m_format;
    TextureHandle m_texture = kNullHandle;
    FramebufferHandle m_framebuffer = kNullHandle;
};

} // namespace prism

#endif //PRISM_DEPTH_TARGET_HPP
