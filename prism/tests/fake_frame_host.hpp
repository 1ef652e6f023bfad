/*
* File: fake_frame_host
* Project: prism
* Created on: 1/25/2026
*
* Description: Hand-cranked IFrameHost. Tests decide when refreshes and
* resizes happen.
*/
#ifndef PRISM_FAKE_FRAME_HOST_HPP
#define PRISM_FAKE_FRAME_HOST_HPP

#include <utility>
#include <vector>

#include "frame_host.hpp"

namespace prism::test {

class FakeFrameHost final : public IFrameHost {
public:
    bool available = true;
    bool rejectFrames = false;
    bool rejectResize = false;
    uint32_t width = 800;
    uint32_t height = 600;

    std::vector<FrameCallback> pendingFrames;
    std::vector<ResizeCallback> resizeListeners;
    size_t frameRequests = 0;

    bool isAvailable() const override { return available; }

    bool requestAnimationFrame(FrameCallback callback) override {
        if (rejectFrames) return false;
        pendingFrames.push_back(std::move(callback));
        ++frameRequests;
        return true;
    }

    bool addResizeListener(ResizeCallback callback) override {
        if (rejectResize) return false;
        resizeListeners.push_back(std::move(callback));
        return true;
    }

    uint32_t surfaceWidth() const override { return width; }
    uint32_t surfaceHeight() const override { return height; }

    // One display refresh: runs the frames requested before it. Returns how many ran.
    size_t fireAnimationFrame() {
        std::vector<FrameCallback> frames;
        frames.swap(pendingFrames);
        for (auto& frame : frames) frame();
        return frames.size();
    }

    void fireResize(uint32_t w, uint32_t h) {
        width = w;
        height = h;
        auto listeners = resizeListeners;
        for (auto& listener : listeners) listener(w, h);
    }
};

} // namespace prism::test

#endif //PRISM_FAKE_FRAME_HOST_HPP
