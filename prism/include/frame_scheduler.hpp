/*
* File: frame_scheduler.hpp
* Project: prism
* Created on: 1/19/2026
*
* Description: Drives a per-frame callback off an IFrameHost.
*
* callback(true)  - the surface may have changed size; recompute layout state
* callback(false) - ordinary animation step
*
* start() runs callback(true) once before anything else, then every resize
* produces one callback(true) and every display refresh one callback(false).
* Callbacks never nest: a resize delivered while a callback is running is
* replayed as soon as that callback returns.
*/
#ifndef PRISM_FRAME_SCHEDULER_HPP
#define PRISM_FRAME_SCHEDULER_HPP

#include <cstdint>
#include <functional>
#include <memory>

#include "frame_host.hpp"

namespace prism {

class FrameScheduler {
public:
    enum class State { Idle, Running };
    using Callback = std::function<void(bool surfaceChanged)>;

    explicit FrameScheduler(IFrameHost& host);
    ~FrameScheduler();

    FrameScheduler(const FrameScheduler&) = delete;
    FrameScheduler& operator=(const FrameScheduler&) = delete;

    // Throws SchedulerInitError if already running, if the host has no surface,
    // or if the host rejects either registration.
    void start(Callback callback);

    [[nodiscard]] State state() const { return m_state; }
    [[nodiscard]] bool isRunning() const { return m_state == State::Running; }

private:
    void requestNextFrame();
    void onAnimationFrame();
    void onResize(uint32_t width, uint32_t height);
    void dispatch(bool surfaceChanged);
    void reset();

    IFrameHost& m_host;
    Callback m_callback;
    State m_state = State::Idle;

    // host-held closures only reach `this` while this token is alive
    std::shared_ptr<FrameScheduler*> m_token;

    bool m_inCallback = false;
    bool m_layoutPending = false;
    bool m_framePending = false;
};

} // namespace prism

#endif //PRISM_FRAME_SCHEDULER_HPP
