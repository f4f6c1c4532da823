#ifndef AXIS_H
#define AXIS_H

#include <stdint.h>
#include <atomic>
#include <mutex>

#include "motion.h"

// =============================================================================
// Stepper Axis
// =============================================================================
// Open-loop position control of one rotator axis through a step/dir/enable
// driver. Position is tracked by counting emitted steps.
// =============================================================================

// Moves smaller than this are treated as already at target
#define AXIS_MOVE_DEADBAND_DEG 0.1f

// Driver lines of one axis
enum class AxisLine : uint8_t {
    Direction,
    Step,
    Enable
};

// Digital outputs of one axis. Levels are raw line levels (enable is active LOW).
class AxisOutputs {
public:
    virtual ~AxisOutputs() {}
    virtual void begin() = 0;
    virtual void write(AxisLine line, bool high) = 0;
    // Return the pins to their reset state
    virtual void release() = 0;
};

// Monotonic microsecond clock used to pace step pulses
class MotionClock {
public:
    virtual ~MotionClock() {}
    virtual uint64_t nowMicros() = 0;
    virtual void sleepUntilMicros(uint64_t deadline) = 0;

    void sleepMicros(uint64_t us) { sleepUntilMicros(nowMicros() + us); }
};

// Emits edges on a fixed half period. Deadlines advance from the previous
// deadline, not from "now", so time spent writing pins does not add up.
class StepScheduler {
public:
    StepScheduler(MotionClock& clock, uint32_t halfPeriodUs);

    void start();
    void waitHalfPeriod();

    uint32_t halfPeriodUs() const { return halfPeriod; }

private:
    MotionClock& clock;
    uint32_t halfPeriod;
    uint64_t deadline;
};

struct AxisConfig {
    const char* name = "Axis";
    float minLimitDeg = 0.0f;
    float maxLimitDeg = 360.0f;
    float stepsPerDegree = 1.0f;
    float defaultSpeed = 100.0f;    // steps/s
    float minSpeed = 1.0f;
    float maxSpeed = 1000.0f;
    float homingSpeed = 50.0f;
    float correctionSpeed = 50.0f;  // feedback moves
    uint32_t enableSettleMs = 100;
    uint32_t dirSetupUs = 1000;
};

// steps/rev * microstep * gear ratio / 360
float computeStepsPerDegree(uint32_t stepsPerRevolution, uint32_t microstepMultiplier, float gearRatio);

class StepperAxis {
public:
    StepperAxis(const AxisConfig& config, AxisOutputs& outputs, MotionClock& clock);

    // Configure the pins, driver disabled
    void begin();

    void enable();
    void disable();

    // Blocking move to an absolute angle. Runs on the axis worker only.
    // stopToken is the value of stopToken() when the move was requested; a
    // stop() issued after that ends the move, even before the first pulse.
    MoveResult moveTo(float targetDeg);
    MoveResult moveTo(float targetDeg, float speed);
    MoveResult moveTo(float targetDeg, float speed, uint32_t stopToken);

    // Cancel every move requested before this call. A running move ends at
    // the next step boundary.
    void stop();
    uint32_t stopToken() const { return stopGeneration.load(); }

    // Move to 0 at homing speed and zero the step counter
    MoveResult home();
    MoveResult home(uint32_t stopToken);

    float clampSpeed(float speed) const;
    uint32_t halfPeriodMicros(float speed) const;

    const char* name() const { return config.name; }
    const AxisConfig& getConfig() const { return config; }

    float positionDeg() const;
    long stepCount() const;
    bool isEnabled() const { return enabled.load(); }
    bool isMoving() const { return moving.load(); }
    bool isHomed() const { return homed.load(); }
    AxisStatus status() const;

private:
    AxisConfig config;
    AxisOutputs& outputs;
    MotionClock& clock;

    mutable std::mutex positionMutex;
    double position = 0.0;
    long steps = 0;

    std::atomic<bool> enabled;
    std::atomic<bool> moving;
    std::atomic<bool> homed;
    std::atomic<uint32_t> stopGeneration;
};

#endif // AXIS_H
