#include "feedback.h"
#include "logger.h"
#include <math.h>

float azimuthError(float targetDeg, float measuredDeg) {
    float error = targetDeg - measuredDeg;

    // Wrap to shortest turn
    if (error > 180.0f) {
        error -= 360.0f;
    } else if (error < -180.0f) {
        error += 360.0f;
    }
    return error;
}

FeedbackController::FeedbackController(ServerState& state, const ImuSampleCell& imu, MotionControl& motion)
    : state(state), imu(imu), motion(motion) {}

FeedbackTick FeedbackController::tick() {
    FeedbackTick result;

    TargetState targets = state.snapshot();
    if (!targets.feedbackEnabled || !imu.isConnected()) {
        return result;
    }

    ImuSample measured = imu.latest();
    result.ran = true;
    result.azimuthErrorDeg = azimuthError(targets.azimuthDeg, measured.yawDeg);
    // Elevation is mechanically bounded - no wraparound
    result.elevationErrorDeg = targets.elevationDeg - measured.pitchDeg;

    result.azimuthCorrected = correct(AxisId::Azimuth, result.azimuthErrorDeg, targets.positionToleranceDeg);
    result.elevationCorrected = correct(AxisId::Elevation, result.elevationErrorDeg, targets.positionToleranceDeg);
    return result;
}

bool FeedbackController::correct(AxisId axis, float errorDeg, float toleranceDeg) {
    if (fabsf(errorDeg) <= toleranceDeg) {
        return false;
    }

    // Let the running move or queued request finish; re-evaluated next tick
    if (motion.isBusy(axis)) {
        return false;
    }

    AxisStatus status = motion.status(axis);
    float correctionTarget = status.positionDeg + errorDeg;
    if (correctionTarget < status.minLimitDeg || correctionTarget > status.maxLimitDeg) {
        LOG_DEBUGF("%s: correction to %.2f outside limits, skipped", axisIdName(axis), correctionTarget);
        return false;
    }

    LOG_DEBUGF("%s: correcting %.2f deg (to %.2f)", axisIdName(axis), errorDeg, correctionTarget);
    if (!motion.requestMove(axis, correctionTarget, MotionSource::Correction)) {
        LOG_WARNF("%s: correction move not queued", axisIdName(axis));
        return false;
    }
    return true;
}
