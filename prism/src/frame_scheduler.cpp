/*
* File: frame_scheduler.cpp
* Project: prism
* Created on: 1/19/2026
*/
#include "frame_scheduler.hpp"

#include <iostream>
#include <utility>

#include "errors.hpp"

using namespace prism;

namespace {
// clears the in-callback flag even when the callback throws
struct CallbackScope {
    bool& active;
    explicit CallbackScope(bool& flag) : active(flag) { active = true; }
    ~CallbackScope() { active = false; }
};
}

FrameScheduler::FrameScheduler(IFrameHost& host)
    : m_host(host), m_token(std::make_shared<FrameScheduler*>(this)) {}

FrameScheduler::~FrameScheduler() {
    m_token.reset();
}

void FrameScheduler::start(Callback callback) {
    if (m_state == State::Running) {
        throw SchedulerInitError("already running");
    }
    if (!callback) {
        throw SchedulerInitError("no frame callback given");
    }
    if (!m_host.isAvailable()) {
        throw SchedulerInitError("host has no output surface");
    }

    m_callback = std::move(callback);
    m_state = State::Running;

    try {
        // layout pass before the first animation frame exists
        dispatch(true);

        std::weak_ptr<FrameScheduler*> weak = m_token;
        bool registered = m_host.addResizeListener([weak](uint32_t width, uint32_t height) {
            if (auto self = weak.lock()) (*self)->onResize(width, height);
        });
        if (!registered) {
            throw SchedulerInitError("host rejected the resize listener");
        }

        requestNextFrame();
    } catch (...) {
        reset();
        throw;
    }

    std::cout << "[SCHED] running at " << m_host.surfaceWidth() << "x" << m_host.surfaceHeight() << std::endl;
}

void FrameScheduler::requestNextFrame() {
    std::weak_ptr<FrameScheduler*> weak = m_token;
    bool requested = m_host.requestAnimationFrame([weak]() {
        if (auto self = weak.lock()) (*self)->onAnimationFrame();
    });
    if (!requested) {
        throw SchedulerInitError("host rejected the animation frame request");
    }
}

void FrameScheduler::onAnimationFrame() {
    dispatch(false);
    requestNextFrame();
}

void FrameScheduler::onResize(uint32_t, uint32_t) {
    dispatch(true);
}

void FrameScheduler::dispatch(bool surfaceChanged) {
    if (m_inCallback) {
        // delivered from inside the running callback; replay once it returns
        if (surfaceChanged) m_layoutPending = true;
        else m_framePending = true;
        return;
    }

    {
        CallbackScope scope(m_inCallback);
        m_callback(surfaceChanged);
    }

    if (m_layoutPending) {
        m_layoutPending = false;
        dispatch(true);
    }
    if (m_framePending) {
        m_framePending = false;
        dispatch(false);
    }
}

void FrameScheduler::reset() {
    // orphan whatever closures the host still holds
    m_token = std::make_shared<FrameScheduler*>(this);
    m_callback = nullptr;
    m_state = State::Idle;
    m_layoutPending = false;
    m_framePending = false;
}
