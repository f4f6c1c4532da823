#ifndef MOTION_H
#define MOTION_H

#include <stdint.h>

// =============================================================================
// Motion Control Interface
// =============================================================================
// Everything that wants an axis to move (protocol commands, feedback loop,
// homing) goes through MotionControl. The firmware implementation queues the
// request on the axis worker, so at most one move per axis runs at a time.
// =============================================================================

enum class AxisId : uint8_t {
    Azimuth,
    Elevation
};

// Who asked for the move. Decides the speed the worker uses.
enum class MotionSource : uint8_t {
    Command,    // Client command - axis default speed
    Correction  // Feedback loop - correction speed
};

enum class MoveResult : uint8_t {
    Completed,      // Reached target (or already within deadband)
    Stopped,        // Interrupted by stop() - partial move, not an error
    NotEnabled,     // Axis disabled
    LimitExceeded   // Target outside soft limits, nothing moved
};

inline bool isMoveSuccess(MoveResult result) {
    return result == MoveResult::Completed || result == MoveResult::Stopped;
}

const char* moveResultName(MoveResult result);
const char* axisIdName(AxisId axis);

// Snapshot of one axis
struct AxisStatus {
    float positionDeg = 0.0f;
    long stepCount = 0;
    bool enabled = false;
    bool moving = false;
    bool homed = false;
    float minLimitDeg = 0.0f;
    float maxLimitDeg = 0.0f;
};

class MotionControl {
public:
    virtual ~MotionControl() {}

    // Queue a move to an absolute angle. Returns false if it could not be queued.
    virtual bool requestMove(AxisId axis, float targetDeg, MotionSource source) = 0;

    // Home elevation, then azimuth, in the background.
    // stopFirst: stop both axes and pause before homing (reset).
    virtual bool requestHomeAll(bool stopFirst) = 0;

    // Stop both axes, drop queued requests, abort homing
    virtual void stopAll() = 0;

    virtual AxisStatus status(AxisId axis) const = 0;

    // Move running, requests queued, or homing in progress
    virtual bool isBusy(AxisId axis) const = 0;
};

#endif // MOTION_H
