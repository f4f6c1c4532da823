#ifndef MOTION_DISPATCHER_H
#define MOTION_DISPATCHER_H

#include <stddef.h>
#include <stdint.h>
#include <atomic>
#include <mutex>

#include "axis.h"
#include "motion.h"

// =============================================================================
// Motion Dispatcher
// =============================================================================
// Queueing and homing policy for both axes. The firmware supplies one
// MotionQueue per axis (a FreeRTOS queue drained by that axis' worker task)
// and a HomingLauncher (a short-lived task). Workers hand every dequeued
// request to execute().
//
// Completion is published in a per-axis slot (ticket + result), so nobody
// waiting on a request has to outlive it.
// =============================================================================

// Sequencer poll period while waiting for a homing move
#define HOMING_POLL_MS 10

// Generations fit in 31 bits so a launcher can pack them with stopFirst
#define HOMING_GENERATION_MASK 0x7FFFFFFFu

enum class RequestKind : uint8_t {
    Move,
    Home
};

struct MotionRequest {
    RequestKind kind = RequestKind::Move;
    float targetDeg = 0.0f;
    MotionSource source = MotionSource::Command;
    uint32_t ticket = 0;      // per-axis sequence number, 0 = none
    uint32_t stopToken = 0;   // axis stopToken() when queued
};

// Bounded FIFO feeding one axis worker. push() never blocks.
class MotionQueue {
public:
    virtual ~MotionQueue() {}
    virtual bool push(const MotionRequest& request) = 0;
    virtual void clear() = 0;
    virtual size_t pending() const = 0;
};

// Runs MotionDispatcher::runHoming(generation, stopFirst) somewhere it may block
class HomingLauncher {
public:
    virtual ~HomingLauncher() {}
    virtual bool launch(uint32_t generation, bool stopFirst) = 0;
};

class MotionDispatcher : public MotionControl {
public:
    MotionDispatcher(StepperAxis& azimuth, MotionQueue& azimuthQueue,
                     StepperAxis& elevation, MotionQueue& elevationQueue,
                     MotionClock& clock, HomingLauncher& launcher,
                     uint32_t resetSettleMs);

    // MotionControl
    bool requestMove(AxisId axis, float targetDeg, MotionSource source) override;
    bool requestHomeAll(bool stopFirst) override;
    void stopAll() override;
    AxisStatus status(AxisId axis) const override;
    bool isBusy(AxisId axis) const override;

    // Worker side: run one dequeued request and publish its result
    MoveResult execute(AxisId axis, const MotionRequest& request);

    // Launcher side: elevation then azimuth. Returns false when a newer
    // home request or stopAll() superseded this sequence, or a move failed.
    bool runHoming(uint32_t generation, bool stopFirst);

private:
    struct Lane {
        Lane(StepperAxis& axis, MotionQueue& queue)
            : axis(axis), queue(queue), active(false), nextTicket(1),
              completedTicket(0), completedResult(MoveResult::Completed) {}

        StepperAxis& axis;
        MotionQueue& queue;
        std::atomic<bool> active;
        std::atomic<uint32_t> nextTicket;

        // Tickets reach the queue in order
        std::mutex enqueueMutex;

        std::mutex completionMutex;
        uint32_t completedTicket;
        MoveResult completedResult;
    };

    Lane& lane(AxisId axis);
    const Lane& lane(AxisId axis) const;

    bool enqueue(Lane& lane, const MotionRequest& request, uint32_t& ticket);
    bool homeAndWait(Lane& lane, uint32_t generation);
    bool homingCurrent(uint32_t generation) const;

    Lane azimuthLane;
    Lane elevationLane;
    MotionClock& clock;
    HomingLauncher& launcher;
    uint32_t resetSettleMs;

    std::atomic<uint32_t> homingGeneration;
    std::atomic<int> homingSequences;
};

#endif // MOTION_DISPATCHER_H
