#include <gtest/gtest.h>
#include <deque>
#include <functional>
#include <vector>

#include "axis.h"
#include "fakes.h"
#include "motion_dispatcher.h"

namespace {

AxisConfig dispatcherAxisConfig(const char* name, float maxLimitDeg) {
    AxisConfig c;
    c.name = name;
    c.minLimitDeg = 0.0f;
    c.maxLimitDeg = maxLimitDeg;
    c.stepsPerDegree = 10.0f;
    c.defaultSpeed = 100.0f;
    c.minSpeed = 1.0f;
    c.maxSpeed = 1000.0f;
    c.homingSpeed = 50.0f;
    c.correctionSpeed = 50.0f;
    c.enableSettleMs = 100;
    c.dirSetupUs = 1000;
    return c;
}

class FakeQueue : public MotionQueue {
public:
    bool push(const MotionRequest& request) override {
        if (items.size() >= capacity) {
            return false;
        }
        items.push_back(request);
        pushed.push_back(request);
        if (onPush) {
            onPush(request);
        }
        return true;
    }

    void clear() override {
        items.clear();
        clears++;
    }

    size_t pending() const override { return items.size(); }

    bool pop(MotionRequest& request) {
        if (items.empty()) {
            return false;
        }
        request = items.front();
        items.pop_front();
        return true;
    }

    size_t capacity = 4;
    int clears = 0;
    std::deque<MotionRequest> items;
    std::vector<MotionRequest> pushed;
    std::function<void(const MotionRequest&)> onPush;
};

// Records launches; the test runs runHoming() itself
class FakeLauncher : public HomingLauncher {
public:
    struct Launch {
        uint32_t generation;
        bool stopFirst;
    };

    bool launch(uint32_t generation, bool stopFirst) override {
        launches.push_back(Launch{generation, stopFirst});
        return accept;
    }

    bool accept = true;
    std::vector<Launch> launches;
};

class MotionDispatcherTest : public ::testing::Test {
protected:
    MotionDispatcherTest()
        : azimuth(dispatcherAxisConfig("AZ", 360.0f), azimuthOutputs, clock),
          elevation(dispatcherAxisConfig("EL", 90.0f), elevationOutputs, clock),
          dispatcher(azimuth, azimuthQueue, elevation, elevationQueue, clock, launcher, 500) {}

    void SetUp() override {
        azimuth.begin();
        elevation.begin();
        azimuth.enable();
        elevation.enable();
    }

    // Plays both axis workers: run everything queued, in order.
    // Step pulses sleep too, so nested calls are ignored.
    void drain() {
        if (draining) {
            return;
        }
        draining = true;
        MotionRequest request;
        while (elevationQueue.pop(request)) {
            dispatcher.execute(AxisId::Elevation, request);
        }
        while (azimuthQueue.pop(request)) {
            dispatcher.execute(AxisId::Azimuth, request);
        }
        draining = false;
    }

    void drainWhileWaiting() {
        clock.onSleep = [this](long) { drain(); };
    }

    MotionRequest popAzimuth() {
        MotionRequest request;
        EXPECT_TRUE(azimuthQueue.pop(request));
        return request;
    }

    FakeClock clock;
    FakeOutputs azimuthOutputs;
    FakeOutputs elevationOutputs;
    StepperAxis azimuth;
    StepperAxis elevation;
    FakeQueue azimuthQueue;
    FakeQueue elevationQueue;
    FakeLauncher launcher;
    MotionDispatcher dispatcher;
    bool draining = false;
};

}  // namespace

// --- Moves ---

TEST_F(MotionDispatcherTest, CommandMovesAtDefaultSpeed) {
    ASSERT_TRUE(dispatcher.requestMove(AxisId::Azimuth, 1.0f, MotionSource::Command));
    MotionRequest request = popAzimuth();

    uint64_t start = clock.now;
    EXPECT_EQ(dispatcher.execute(AxisId::Azimuth, request), MoveResult::Completed);
    // Direction setup, then 10 steps of 2 x 5000 us
    EXPECT_EQ(clock.now - start, 1000u + 10u * 10000u);
    EXPECT_NEAR(azimuth.positionDeg(), 1.0f, 1e-4);
}

TEST_F(MotionDispatcherTest, CorrectionMovesAtCorrectionSpeed) {
    ASSERT_TRUE(dispatcher.requestMove(AxisId::Azimuth, 1.0f, MotionSource::Correction));
    MotionRequest request = popAzimuth();

    uint64_t start = clock.now;
    EXPECT_EQ(dispatcher.execute(AxisId::Azimuth, request), MoveResult::Completed);
    EXPECT_EQ(clock.now - start, 1000u + 10u * 20000u);
}

TEST_F(MotionDispatcherTest, NewCommandReplacesPendingCommand) {
    dispatcher.requestMove(AxisId::Azimuth, 10.0f, MotionSource::Command);
    dispatcher.requestMove(AxisId::Azimuth, 20.0f, MotionSource::Command);

    ASSERT_EQ(azimuthQueue.items.size(), 1u);
    EXPECT_FLOAT_EQ(azimuthQueue.items.front().targetDeg, 20.0f);
    EXPECT_EQ(azimuthQueue.clears, 2);
    EXPECT_EQ(elevationQueue.clears, 0);
}

TEST_F(MotionDispatcherTest, CommandDropsPendingCorrection) {
    dispatcher.requestMove(AxisId::Elevation, 5.0f, MotionSource::Correction);
    dispatcher.requestMove(AxisId::Elevation, 30.0f, MotionSource::Command);

    ASSERT_EQ(elevationQueue.items.size(), 1u);
    EXPECT_FLOAT_EQ(elevationQueue.items.front().targetDeg, 30.0f);
    EXPECT_EQ(elevationQueue.items.front().source, MotionSource::Command);
}

TEST_F(MotionDispatcherTest, CorrectionDoesNotFlush) {
    dispatcher.requestMove(AxisId::Azimuth, 10.0f, MotionSource::Command);
    dispatcher.requestMove(AxisId::Azimuth, 12.0f, MotionSource::Correction);

    ASSERT_EQ(azimuthQueue.items.size(), 2u);
    EXPECT_FLOAT_EQ(azimuthQueue.items[0].targetDeg, 10.0f);
    EXPECT_FLOAT_EQ(azimuthQueue.items[1].targetDeg, 12.0f);
}

TEST_F(MotionDispatcherTest, FullQueueRejectsRequest) {
    for (int i = 0; i < 4; i++) {
        EXPECT_TRUE(dispatcher.requestMove(AxisId::Azimuth, 10.0f + i, MotionSource::Correction));
    }
    EXPECT_FALSE(dispatcher.requestMove(AxisId::Azimuth, 20.0f, MotionSource::Correction));
    EXPECT_EQ(azimuthQueue.items.size(), 4u);
}

TEST_F(MotionDispatcherTest, TicketsIncreasePerAxis) {
    dispatcher.requestMove(AxisId::Azimuth, 10.0f, MotionSource::Correction);
    dispatcher.requestMove(AxisId::Azimuth, 11.0f, MotionSource::Correction);
    dispatcher.requestMove(AxisId::Elevation, 10.0f, MotionSource::Correction);

    EXPECT_EQ(azimuthQueue.items[0].ticket, 1u);
    EXPECT_EQ(azimuthQueue.items[1].ticket, 2u);
    EXPECT_EQ(elevationQueue.items[0].ticket, 1u);
}

TEST_F(MotionDispatcherTest, DisabledAxisReportsNotEnabled) {
    elevation.disable();
    dispatcher.requestMove(AxisId::Elevation, 10.0f, MotionSource::Command);
    MotionRequest request;
    ASSERT_TRUE(elevationQueue.pop(request));

    EXPECT_EQ(dispatcher.execute(AxisId::Elevation, request), MoveResult::NotEnabled);
    EXPECT_EQ(elevationOutputs.stepPulses, 0);
}

// --- Busy ---

TEST_F(MotionDispatcherTest, IdleWhenNothingQueued) {
    EXPECT_FALSE(dispatcher.isBusy(AxisId::Azimuth));
    EXPECT_FALSE(dispatcher.isBusy(AxisId::Elevation));
}

TEST_F(MotionDispatcherTest, BusyWhileRequestPending) {
    dispatcher.requestMove(AxisId::Azimuth, 10.0f, MotionSource::Command);
    EXPECT_TRUE(dispatcher.isBusy(AxisId::Azimuth));
    EXPECT_FALSE(dispatcher.isBusy(AxisId::Elevation));
}

TEST_F(MotionDispatcherTest, BusyWhileMoveRuns) {
    dispatcher.requestMove(AxisId::Azimuth, 1.0f, MotionSource::Command);
    MotionRequest request = popAzimuth();

    bool busyDuringMove = false;
    clock.onSleep = [&](long) { busyDuringMove = busyDuringMove || dispatcher.isBusy(AxisId::Azimuth); };
    dispatcher.execute(AxisId::Azimuth, request);
    clock.onSleep = nullptr;

    EXPECT_TRUE(busyDuringMove);
    EXPECT_FALSE(dispatcher.isBusy(AxisId::Azimuth));
}

TEST_F(MotionDispatcherTest, BusyWhileHomingLaunched) {
    ASSERT_TRUE(dispatcher.requestHomeAll(false));
    EXPECT_TRUE(dispatcher.isBusy(AxisId::Azimuth));
    EXPECT_TRUE(dispatcher.isBusy(AxisId::Elevation));
}

// --- Stop ---

TEST_F(MotionDispatcherTest, StopAllFlushesBothQueues) {
    dispatcher.requestMove(AxisId::Azimuth, 10.0f, MotionSource::Command);
    dispatcher.requestMove(AxisId::Elevation, 10.0f, MotionSource::Command);

    dispatcher.stopAll();

    EXPECT_TRUE(azimuthQueue.items.empty());
    EXPECT_TRUE(elevationQueue.items.empty());
    EXPECT_FALSE(dispatcher.isBusy(AxisId::Azimuth));
}

TEST_F(MotionDispatcherTest, StopBetweenDequeueAndFirstPulseCancelsMove) {
    dispatcher.requestMove(AxisId::Azimuth, 180.0f, MotionSource::Command);
    MotionRequest request = popAzimuth();

    // The worker holds the request but has not pulsed yet
    dispatcher.stopAll();

    EXPECT_EQ(dispatcher.execute(AxisId::Azimuth, request), MoveResult::Stopped);
    EXPECT_EQ(azimuthOutputs.stepPulses, 0);
    EXPECT_FLOAT_EQ(azimuth.positionDeg(), 0.0f);
}

TEST_F(MotionDispatcherTest, RequestAfterStopRuns) {
    dispatcher.stopAll();
    dispatcher.requestMove(AxisId::Azimuth, 2.0f, MotionSource::Command);
    MotionRequest request = popAzimuth();

    EXPECT_EQ(dispatcher.execute(AxisId::Azimuth, request), MoveResult::Completed);
    EXPECT_EQ(azimuthOutputs.stepPulses, 20);
}

TEST_F(MotionDispatcherTest, StopAllMidMoveEndsMove) {
    dispatcher.requestMove(AxisId::Azimuth, 10.0f, MotionSource::Command);
    MotionRequest request = popAzimuth();

    clock.onSleep = [&](long n) {
        if (n == 20) dispatcher.stopAll();
    };
    EXPECT_EQ(dispatcher.execute(AxisId::Azimuth, request), MoveResult::Stopped);
    EXPECT_GT(azimuthOutputs.stepPulses, 0);
    EXPECT_LT(azimuthOutputs.stepPulses, 100);
}

// --- Homing ---

TEST_F(MotionDispatcherTest, HomesElevationThenAzimuth) {
    dispatcher.requestMove(AxisId::Azimuth, 3.0f, MotionSource::Command);
    drain();
    dispatcher.requestMove(AxisId::Elevation, 2.0f, MotionSource::Command);
    drain();

    std::vector<AxisId> order;
    elevationQueue.onPush = [&](const MotionRequest& r) {
        if (r.kind == RequestKind::Home) order.push_back(AxisId::Elevation);
    };
    azimuthQueue.onPush = [&](const MotionRequest& r) {
        if (r.kind == RequestKind::Home) order.push_back(AxisId::Azimuth);
    };

    ASSERT_TRUE(dispatcher.requestHomeAll(false));
    ASSERT_EQ(launcher.launches.size(), 1u);
    EXPECT_FALSE(launcher.launches[0].stopFirst);

    drainWhileWaiting();
    EXPECT_TRUE(dispatcher.runHoming(launcher.launches[0].generation, false));

    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], AxisId::Elevation);
    EXPECT_EQ(order[1], AxisId::Azimuth);
    EXPECT_TRUE(elevation.isHomed());
    EXPECT_TRUE(azimuth.isHomed());
    EXPECT_EQ(azimuth.stepCount(), 0);
    EXPECT_EQ(elevation.stepCount(), 0);
    EXPECT_FALSE(dispatcher.isBusy(AxisId::Azimuth));
    EXPECT_FALSE(dispatcher.isBusy(AxisId::Elevation));
}

TEST_F(MotionDispatcherTest, AzimuthWaitsForElevationHome) {
    dispatcher.requestMove(AxisId::Elevation, 1.0f, MotionSource::Command);
    drain();

    bool elevationHomedBeforeAzimuthQueued = false;
    azimuthQueue.onPush = [&](const MotionRequest& r) {
        if (r.kind == RequestKind::Home) elevationHomedBeforeAzimuthQueued = elevation.isHomed();
    };

    dispatcher.requestHomeAll(false);
    drainWhileWaiting();
    EXPECT_TRUE(dispatcher.runHoming(launcher.launches[0].generation, false));
    EXPECT_TRUE(elevationHomedBeforeAzimuthQueued);
}

TEST_F(MotionDispatcherTest, CommandsDoNotFlushDuringHoming) {
    ASSERT_TRUE(dispatcher.requestHomeAll(false));

    dispatcher.requestMove(AxisId::Azimuth, 10.0f, MotionSource::Command);
    dispatcher.requestMove(AxisId::Azimuth, 20.0f, MotionSource::Command);

    EXPECT_EQ(azimuthQueue.clears, 0);
    EXPECT_EQ(azimuthQueue.items.size(), 2u);
}

TEST_F(MotionDispatcherTest, ResetPausesBeforeHoming) {
    uint64_t firstPushAt = 0;
    elevationQueue.onPush = [&](const MotionRequest&) {
        if (firstPushAt == 0) firstPushAt = clock.now;
    };

    ASSERT_TRUE(dispatcher.requestHomeAll(true));
    ASSERT_EQ(launcher.launches.size(), 1u);
    EXPECT_TRUE(launcher.launches[0].stopFirst);

    uint64_t start = clock.now;
    drainWhileWaiting();
    EXPECT_TRUE(dispatcher.runHoming(launcher.launches[0].generation, true));
    EXPECT_GE(firstPushAt, start + 500000u);
}

TEST_F(MotionDispatcherTest, ResetStopsAndFlushesFirst) {
    dispatcher.requestMove(AxisId::Azimuth, 10.0f, MotionSource::Command);
    uint32_t tokenBefore = azimuth.stopToken();

    ASSERT_TRUE(dispatcher.requestHomeAll(true));

    EXPECT_TRUE(azimuthQueue.items.empty());
    EXPECT_NE(azimuth.stopToken(), tokenBefore);
}

TEST_F(MotionDispatcherTest, StopAllAbortsLaunchedHoming) {
    ASSERT_TRUE(dispatcher.requestHomeAll(false));
    dispatcher.stopAll();

    EXPECT_FALSE(dispatcher.runHoming(launcher.launches[0].generation, false));
    EXPECT_TRUE(elevationQueue.pushed.empty());
    EXPECT_TRUE(azimuthQueue.pushed.empty());
    EXPECT_FALSE(dispatcher.isBusy(AxisId::Azimuth));
}

TEST_F(MotionDispatcherTest, StopAllAbortsRunningHoming) {
    dispatcher.requestMove(AxisId::Elevation, 1.0f, MotionSource::Command);
    drain();
    ASSERT_TRUE(dispatcher.requestHomeAll(false));

    // Stop while the sequence waits for the elevation home
    bool stopped = false;
    clock.onSleep = [&](long) {
        if (!stopped) {
            stopped = true;
            dispatcher.stopAll();
        }
    };

    EXPECT_FALSE(dispatcher.runHoming(launcher.launches[0].generation, false));
    EXPECT_TRUE(elevationQueue.items.empty());
    EXPECT_TRUE(azimuthQueue.pushed.empty());
    EXPECT_FALSE(elevation.isHomed());
    EXPECT_FALSE(dispatcher.isBusy(AxisId::Elevation));
}

TEST_F(MotionDispatcherTest, NewerHomingSupersedesWaitingSequence) {
    ASSERT_TRUE(dispatcher.requestHomeAll(false));
    uint32_t first = launcher.launches[0].generation;

    // A second home request arrives while the first waits on elevation
    bool requested = false;
    clock.onSleep = [&](long) {
        if (!requested) {
            requested = true;
            dispatcher.requestHomeAll(false);
        }
    };
    EXPECT_FALSE(dispatcher.runHoming(first, false));
    clock.onSleep = nullptr;

    // The first sequence is gone but its request is still queued
    ASSERT_EQ(launcher.launches.size(), 2u);
    ASSERT_EQ(elevationQueue.items.size(), 1u);
    EXPECT_TRUE(azimuthQueue.pushed.empty());

    // Running it now only updates the completion slot
    drain();
    EXPECT_TRUE(elevation.isHomed());

    drainWhileWaiting();
    EXPECT_TRUE(dispatcher.runHoming(launcher.launches[1].generation, false));
    EXPECT_TRUE(azimuth.isHomed());
    EXPECT_FALSE(dispatcher.isBusy(AxisId::Azimuth));
}

TEST_F(MotionDispatcherTest, CompletedLaterRequestEndsWait) {
    ASSERT_TRUE(dispatcher.requestHomeAll(false));

    // The queued home is lost and a later request finishes instead
    bool replaced = false;
    clock.onSleep = [&](long) {
        if (!replaced) {
            replaced = true;
            elevationQueue.items.clear();
            dispatcher.requestMove(AxisId::Elevation, 0.0f, MotionSource::Correction);
            drain();
        }
    };

    EXPECT_FALSE(dispatcher.runHoming(launcher.launches[0].generation, false));
    EXPECT_TRUE(azimuthQueue.pushed.empty());
}

TEST_F(MotionDispatcherTest, FailedLaunchLeavesAxesIdle) {
    launcher.accept = false;

    EXPECT_FALSE(dispatcher.requestHomeAll(false));
    EXPECT_FALSE(dispatcher.isBusy(AxisId::Azimuth));
    EXPECT_FALSE(dispatcher.isBusy(AxisId::Elevation));
}

TEST_F(MotionDispatcherTest, GenerationsFitLauncherParameter) {
    for (int i = 0; i < 3; i++) {
        dispatcher.requestHomeAll(false);
    }
    for (const FakeLauncher::Launch& l : launcher.launches) {
        EXPECT_EQ(l.generation & ~HOMING_GENERATION_MASK, 0u);
    }
    EXPECT_LT(launcher.launches[0].generation, launcher.launches[2].generation);
}
