/*
* File: test_frame_scheduler.cpp
* Project: prism
* Created on: 1/26/2026
*/
#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <vector>

#include "errors.hpp"
#include "frame_scheduler.hpp"
#include "fake_frame_host.hpp"

using namespace prism;
using prism::test::FakeFrameHost;

namespace {

class FrameSchedulerTest : public ::testing::Test {
protected:
    FrameScheduler::Callback recorder() {
        return [this](bool surfaceChanged) { calls.push_back(surfaceChanged); };
    }

    FakeFrameHost host;
    std::vector<bool> calls;
};

} // namespace

TEST_F(FrameSchedulerTest, StartRunsOneLayoutPassSynchronously) {
    FrameScheduler scheduler(host);
    EXPECT_EQ(scheduler.state(), FrameScheduler::State::Idle);

    size_t requestsSeen = 99;
    size_t listenersSeen = 99;
    scheduler.start([&](bool surfaceChanged) {
        if (calls.empty()) {
            // nothing is registered with the host yet
            requestsSeen = host.frameRequests;
            listenersSeen = host.resizeListeners.size();
        }
        calls.push_back(surfaceChanged);
    });

    EXPECT_EQ(requestsSeen, 0u);
    EXPECT_EQ(listenersSeen, 0u);
    EXPECT_EQ(calls, std::vector<bool>{true});
    EXPECT_TRUE(scheduler.isRunning());
    EXPECT_EQ(host.frameRequests, 1u);
    EXPECT_EQ(host.resizeListeners.size(), 1u);
}

TEST_F(FrameSchedulerTest, EachRefreshRunsOneFrameAndRequestsTheNext) {
    FrameScheduler scheduler(host);
    scheduler.start(recorder());

    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(host.fireAnimationFrame(), 1u);
    }

    EXPECT_EQ(calls, (std::vector<bool>{true, false, false, false}));
    EXPECT_EQ(host.frameRequests, 4u);
    EXPECT_EQ(host.pendingFrames.size(), 1u);
}

TEST_F(FrameSchedulerTest, ResizeBetweenFramesAddsExactlyOneLayoutPass) {
    FrameScheduler scheduler(host);
    scheduler.start(recorder());

    host.fireAnimationFrame();
    host.fireResize(1024, 768);
    host.fireAnimationFrame();

    EXPECT_EQ(calls, (std::vector<bool>{true, false, true, false}));
}

TEST_F(FrameSchedulerTest, ResizeInsideCallbackIsDeferredNotNested) {
    FrameScheduler scheduler(host);
    int depth = 0;
    int maxDepth = 0;
    bool resized = false;

    scheduler.start([&](bool surfaceChanged) {
        ++depth;
        maxDepth = std::max(maxDepth, depth);
        calls.push_back(surfaceChanged);
        if (!surfaceChanged && !resized) {
            resized = true;
            host.fireResize(640, 480);
            // still inside the frame pass
            EXPECT_EQ(calls.back(), false);
        }
        --depth;
    });

    host.fireAnimationFrame();

    EXPECT_EQ(maxDepth, 1);
    EXPECT_EQ(calls, (std::vector<bool>{true, false, true}));
    EXPECT_EQ(host.pendingFrames.size(), 1u);
}

TEST_F(FrameSchedulerTest, BackToBackResizesAreNotCoalesced) {
    FrameScheduler scheduler(host);
    scheduler.start(recorder());

    host.fireResize(300, 200);
    host.fireResize(300, 201);
    host.fireAnimationFrame();

    EXPECT_EQ(calls, (std::vector<bool>{true, true, true, false}));
}

TEST_F(FrameSchedulerTest, UnavailableHostFailsBeforeAnyCallback) {
    host.available = false;
    FrameScheduler scheduler(host);

    try {
        scheduler.start(recorder());
        FAIL() << "expected SchedulerInitError";
    } catch (const SchedulerInitError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::SchedulerInit);
    }
    EXPECT_TRUE(calls.empty());
    EXPECT_FALSE(scheduler.isRunning());
    EXPECT_EQ(host.frameRequests, 0u);
}

TEST_F(FrameSchedulerTest, EmptyCallbackIsRejected) {
    FrameScheduler scheduler(host);
    EXPECT_THROW(scheduler.start(nullptr), SchedulerInitError);
    EXPECT_FALSE(scheduler.isRunning());
}

TEST_F(FrameSchedulerTest, StartingTwiceIsRejected) {
    FrameScheduler scheduler(host);
    scheduler.start(recorder());

    EXPECT_THROW(scheduler.start(recorder()), SchedulerInitError);
    EXPECT_TRUE(scheduler.isRunning());
    EXPECT_EQ(calls.size(), 1u);
}

TEST_F(FrameSchedulerTest, RejectedFrameRequestFailsAndOrphansTheListener) {
    host.rejectFrames = true;
    FrameScheduler scheduler(host);

    EXPECT_THROW(scheduler.start(recorder()), SchedulerInitError);
    EXPECT_FALSE(scheduler.isRunning());

    // the listener was already handed to the host but no longer reaches us
    host.fireResize(10, 10);
    EXPECT_EQ(calls, std::vector<bool>{true});
}

TEST_F(FrameSchedulerTest, RejectedResizeListenerFails) {
    host.rejectResize = true;
    FrameScheduler scheduler(host);

    EXPECT_THROW(scheduler.start(recorder()), SchedulerInitError);
    EXPECT_EQ(host.frameRequests, 0u);
}

TEST_F(FrameSchedulerTest, CallbackExceptionDuringStartupPropagates) {
    FrameScheduler scheduler(host);

    EXPECT_THROW(scheduler.start([](bool) { throw std::runtime_error("scene failed"); }), std::runtime_error);
    EXPECT_FALSE(scheduler.isRunning());

    // the guard was released, a second start works
    scheduler.start(recorder());
    EXPECT_EQ(calls, std::vector<bool>{true});
}

TEST_F(FrameSchedulerTest, DestroyedSchedulerIgnoresHostEvents) {
    auto scheduler = std::make_unique<FrameScheduler>(host);
    scheduler->start(recorder());
    scheduler.reset();

    host.fireResize(1, 1);
    EXPECT_EQ(host.fireAnimationFrame(), 1u);
    EXPECT_EQ(calls, std::vector<bool>{true});
    EXPECT_TRUE(host.pendingFrames.empty());
}
