#ifndef FEEDBACK_H
#define FEEDBACK_H

#include "motion.h"
#include "state.h"

// Shortest signed azimuth error (target - measured), wrapped into -180..180
float azimuthError(float targetDeg, float measuredDeg);

// What one feedback tick did (for logging and tests)
struct FeedbackTick {
    bool ran = false;              // false when feedback is off or IMU is down
    float azimuthErrorDeg = 0.0f;
    float elevationErrorDeg = 0.0f;
    bool azimuthCorrected = false;
    bool elevationCorrected = false;
};

// Closed-loop correction: compares commanded targets with the IMU attitude
// and queues small correction moves. Call tick() periodically.
class FeedbackController {
public:
    FeedbackController(ServerState& state, const ImuSampleCell& imu, MotionControl& motion);

    FeedbackTick tick();

private:
    bool correct(AxisId axis, float errorDeg, float toleranceDeg);

    ServerState& state;
    const ImuSampleCell& imu;
    MotionControl& motion;
};

#endif // FEEDBACK_H
