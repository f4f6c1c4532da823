#include "axis.h"
#include "logger.h"
#include <math.h>

const char* moveResultName(MoveResult result) {
    switch (result) {
        case MoveResult::Completed: return "completed";
        case MoveResult::Stopped: return "stopped";
        case MoveResult::NotEnabled: return "not enabled";
        case MoveResult::LimitExceeded: return "limit exceeded";
        default: return "unknown";
    }
}

const char* axisIdName(AxisId axis) {
    return axis == AxisId::Azimuth ? "Azimuth" : "Elevation";
}

float computeStepsPerDegree(uint32_t stepsPerRevolution, uint32_t microstepMultiplier, float gearRatio) {
    return (float)stepsPerRevolution * (float)microstepMultiplier * gearRatio / 360.0f;
}

// -----------------------------------------------------------------------------
// StepScheduler
// -----------------------------------------------------------------------------

StepScheduler::StepScheduler(MotionClock& clock, uint32_t halfPeriodUs)
    : clock(clock), halfPeriod(halfPeriodUs), deadline(0) {}

void StepScheduler::start() {
    deadline = clock.nowMicros();
}

void StepScheduler::waitHalfPeriod() {
    deadline += halfPeriod;
    clock.sleepUntilMicros(deadline);
}

// -----------------------------------------------------------------------------
// StepperAxis
// -----------------------------------------------------------------------------

StepperAxis::StepperAxis(const AxisConfig& config, AxisOutputs& outputs, MotionClock& clock)
    : config(config), outputs(outputs), clock(clock),
      enabled(false), moving(false), homed(false), stopGeneration(0) {}

void StepperAxis::begin() {
    outputs.begin();
    outputs.write(AxisLine::Direction, false);
    outputs.write(AxisLine::Step, false);
    outputs.write(AxisLine::Enable, true);  // Active LOW - HIGH = disabled
    enabled = false;
    LOG_INFOF("%s axis initialized - Steps/degree: %.2f, limits [%.1f, %.1f]",
              config.name, config.stepsPerDegree, config.minLimitDeg, config.maxLimitDeg);
}

void StepperAxis::enable() {
    outputs.write(AxisLine::Enable, false);  // Active LOW
    enabled = true;
    clock.sleepMicros((uint64_t)config.enableSettleMs * 1000);
    LOG_DEBUGF("%s motor enabled", config.name);
}

void StepperAxis::disable() {
    outputs.write(AxisLine::Enable, true);
    enabled = false;
    moving = false;
    LOG_DEBUGF("%s motor disabled", config.name);
}

float StepperAxis::clampSpeed(float speed) const {
    if (!(speed >= config.minSpeed)) return config.minSpeed;
    if (speed > config.maxSpeed) return config.maxSpeed;
    return speed;
}

uint32_t StepperAxis::halfPeriodMicros(float speed) const {
    // delay = 1 / (2 * speed) seconds
    return (uint32_t)lroundf(1000000.0f / (2.0f * clampSpeed(speed)));
}

MoveResult StepperAxis::moveTo(float targetDeg) {
    return moveTo(targetDeg, config.defaultSpeed, stopToken());
}

MoveResult StepperAxis::moveTo(float targetDeg, float speed) {
    return moveTo(targetDeg, speed, stopToken());
}

MoveResult StepperAxis::moveTo(float targetDeg, float speed, uint32_t token) {
    if (!enabled) {
        LOG_WARNF("%s: Motor not enabled", config.name);
        return MoveResult::NotEnabled;
    }

    // Written so that NaN fails the check too
    if (!(targetDeg >= config.minLimitDeg && targetDeg <= config.maxLimitDeg)) {
        LOG_WARNF("%s: Target %.2f outside limits [%.1f, %.1f]",
                  config.name, targetDeg, config.minLimitDeg, config.maxLimitDeg);
        return MoveResult::LimitExceeded;
    }

    const float start = positionDeg();
    const float error = targetDeg - start;
    if (fabsf(error) < AXIS_MOVE_DEADBAND_DEG) {
        return MoveResult::Completed;
    }

    if (stopGeneration.load() != token) {
        LOG_INFOF("%s: Move to %.2f cancelled before start", config.name, targetDeg);
        return MoveResult::Stopped;
    }

    const long stepsNeeded = lroundf(fabsf(error) * config.stepsPerDegree);
    const bool positive = error > 0;
    const double stepDeg = 1.0 / config.stepsPerDegree;
    StepScheduler scheduler(clock, halfPeriodMicros(speed));

    LOG_INFOF("%s: Moving from %.2f to %.2f (%ld steps at %.0f steps/s)",
              config.name, start, targetDeg, stepsNeeded, clampSpeed(speed));

    moving = true;
    outputs.write(AxisLine::Direction, positive);
    clock.sleepMicros(config.dirSetupUs);

    scheduler.start();
    long taken = 0;
    while (taken < stepsNeeded) {
        if (stopGeneration.load() != token || !enabled) {
            break;
        }

        outputs.write(AxisLine::Step, true);
        scheduler.waitHalfPeriod();
        outputs.write(AxisLine::Step, false);
        scheduler.waitHalfPeriod();

        {
            std::lock_guard<std::mutex> lock(positionMutex);
            if (positive) {
                position += stepDeg;
                steps++;
            } else {
                position -= stepDeg;
                steps--;
            }
        }
        taken++;
    }

    moving = false;

    if (taken < stepsNeeded) {
        LOG_INFOF("%s: Move stopped after %ld of %ld steps. Position: %.2f",
                  config.name, taken, stepsNeeded, positionDeg());
        return MoveResult::Stopped;
    }

    LOG_INFOF("%s: Move complete. Position: %.2f", config.name, positionDeg());
    return MoveResult::Completed;
}

void StepperAxis::stop() {
    stopGeneration++;
    LOG_INFOF("%s: Movement stopped", config.name);
}

MoveResult StepperAxis::home() {
    return home(stopToken());
}

MoveResult StepperAxis::home(uint32_t token) {
    LOG_INFOF("%s: Homing...", config.name);
    MoveResult result = moveTo(0.0f, config.homingSpeed, token);
    if (result != MoveResult::Completed) {
        LOG_WARNF("%s: Homing not finished (%s)", config.name, moveResultName(result));
        return result;
    }

    {
        std::lock_guard<std::mutex> lock(positionMutex);
        position = 0.0;
        steps = 0;
    }
    homed = true;
    LOG_INFOF("%s: Homed successfully", config.name);
    return result;
}

float StepperAxis::positionDeg() const {
    std::lock_guard<std::mutex> lock(positionMutex);
    return (float)position;
}

long StepperAxis::stepCount() const {
    std::lock_guard<std::mutex> lock(positionMutex);
    return steps;
}

AxisStatus StepperAxis::status() const {
    AxisStatus s;
    {
        std::lock_guard<std::mutex> lock(positionMutex);
        s.positionDeg = (float)position;
        s.stepCount = steps;
    }
    s.enabled = enabled;
    s.moving = moving;
    s.homed = homed;
    s.minLimitDeg = config.minLimitDeg;
    s.maxLimitDeg = config.maxLimitDeg;
    return s;
}
