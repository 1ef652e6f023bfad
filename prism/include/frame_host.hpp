/*
* File: frame_host.hpp
* Project: prism
* Created on: 1/19/2026
*
* Description: Event source the frame loop is driven by (window, canvas, ...)
*/
#ifndef PRISM_FRAME_HOST_HPP
#define PRISM_FRAME_HOST_HPP

#include <cstdint>
#include <functional>

namespace prism {

class IFrameHost {
public:
    using FrameCallback = std::function<void()>;
    using ResizeCallback = std::function<void(uint32_t width, uint32_t height)>;

    virtual ~IFrameHost() = default;

    // false when there is no output surface to schedule against
    [[nodiscard]] virtual bool isAvailable() const = 0;

    // One-shot: `callback` runs once, before the next display refresh.
    // Returns false if the request could not be registered.
    virtual bool requestAnimationFrame(FrameCallback callback) = 0;

    // `callback` runs every time the output surface changes size
    virtual bool addResizeListener(ResizeCallback callback) = 0;

    [[nodiscard]] virtual uint32_t surfaceWidth() const = 0;
    [[nodiscard]] virtual uint32_t surfaceHeight() const = 0;
};

} // namespace prism

#endif //PRISM_FRAME_HOST_HPP
