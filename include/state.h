#ifndef STATE_H
#define STATE_H

#include <stdint.h>
#include <atomic>
#include <mutex>

// =============================================================================
// Application State - Targets & Attitude
// =============================================================================
// Shared between the client tasks, the feedback task, the IMU task and the
// status API. Every accessor copies under a lock; nothing hands out
// references to the live data.
// =============================================================================

// -----------------------------------------------------------------------------
// Commanded targets and feedback settings
// -----------------------------------------------------------------------------

struct TargetState {
    float azimuthDeg = 0.0f;
    float elevationDeg = 0.0f;
    bool feedbackEnabled = true;
    float positionToleranceDeg = 0.5f;
};

class ServerState {
public:
    ServerState() {}
    explicit ServerState(const TargetState& initial) : targets(initial) {}

    TargetState snapshot() const;

    void setTargetAzimuth(float deg);
    void setTargetElevation(float deg);
    void resetTargets();

    void setFeedbackEnabled(bool enabled);
    void setPositionTolerance(float deg);

private:
    mutable std::mutex mutex;
    TargetState targets;
};

// -----------------------------------------------------------------------------
// IMU attitude (WT901C angle packet)
// -----------------------------------------------------------------------------
// yaw: 0-360, pitch/roll: -180..180 as decoded

struct ImuSample {
    float yawDeg = 0.0f;
    float pitchDeg = 0.0f;
    float rollDeg = 0.0f;
};

// Latest-value cell: one writer (IMU task), any number of readers
class ImuSampleCell {
public:
    ImuSampleCell() : connected(false), count(0), lastUpdateMs(0) {}

    void publish(const ImuSample& sample, unsigned long nowMs);
    ImuSample latest() const;

    // Link up and data fresh - maintained by the IMU task
    void setConnected(bool isConnected) { connected = isConnected; }
    bool isConnected() const { return connected.load(); }

    uint32_t sampleCount() const { return count.load(); }
    unsigned long lastUpdate() const { return lastUpdateMs.load(); }

private:
    mutable std::mutex mutex;
    ImuSample sample;
    std::atomic<bool> connected;
    std::atomic<uint32_t> count;
    std::atomic<unsigned long> lastUpdateMs;
};

// Global state instances (defined in state.cpp)
extern ServerState serverState;
extern ImuSampleCell imuSample;

#endif // STATE_H
