#include "state.h"

// Global application state - targets written by client tasks, read by the
// feedback task and status API. Attitude written by the IMU task.
ServerState serverState;
ImuSampleCell imuSample;

TargetState ServerState::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return targets;
}

void ServerState::setTargetAzimuth(float deg) {
    std::lock_guard<std::mutex> lock(mutex);
    targets.azimuthDeg = deg;
}

void ServerState::setTargetElevation(float deg) {
    std::lock_guard<std::mutex> lock(mutex);
    targets.elevationDeg = deg;
}

void ServerState::resetTargets() {
    std::lock_guard<std::mutex> lock(mutex);
    targets.azimuthDeg = 0.0f;
    targets.elevationDeg = 0.0f;
}

void ServerState::setFeedbackEnabled(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex);
    targets.feedbackEnabled = enabled;
}

void ServerState::setPositionTolerance(float deg) {
    std::lock_guard<std::mutex> lock(mutex);
    targets.positionToleranceDeg = deg;
}

void ImuSampleCell::publish(const ImuSample& s, unsigned long nowMs) {
    {
        std::lock_guard<std::mutex> lock(mutex);
        sample = s;
    }
    lastUpdateMs = nowMs;
    count++;
}

ImuSample ImuSampleCell::latest() const {
    std::lock_guard<std::mutex> lock(mutex);
    return sample;
}
