#include "steppers.h"
#include "axis.h"
#include "config.h"
#include "logger.h"
#include "motion_dispatcher.h"
#include "shutdown.h"
#include <stdint.h>
#include <esp_timer.h>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <freertos/task.h>

// =============================================================================
// Hardware bindings
// =============================================================================

class GpioAxisOutputs : public AxisOutputs {
public:
    GpioAxisOutputs(uint8_t dirPin, uint8_t stepPin, uint8_t enablePin)
        : dirPin(dirPin), stepPin(stepPin), enablePin(enablePin) {}

    void begin() override {
        pinMode(dirPin, OUTPUT);
        pinMode(stepPin, OUTPUT);
        pinMode(enablePin, OUTPUT);
    }

    void write(AxisLine line, bool high) override {
        digitalWrite(pinFor(line), high ? HIGH : LOW);
    }

    void release() override {
        pinMode(dirPin, INPUT);
        pinMode(stepPin, INPUT);
        pinMode(enablePin, INPUT);
    }

private:
    uint8_t pinFor(AxisLine line) const {
        switch (line) {
            case AxisLine::Direction: return dirPin;
            case AxisLine::Step: return stepPin;
            case AxisLine::Enable:
            default: return enablePin;
        }
    }

    uint8_t dirPin;
    uint8_t stepPin;
    uint8_t enablePin;
};

// esp_timer is monotonic. Whole ticks are slept, the remainder is spun so
// pulse timing stays accurate below the 1 ms FreeRTOS tick.
class EspMotionClock : public MotionClock {
public:
    uint64_t nowMicros() override {
        return (uint64_t)esp_timer_get_time();
    }

    void sleepUntilMicros(uint64_t deadline) override {
        uint64_t now = nowMicros();
        if (deadline <= now) {
            return;
        }
        uint64_t remaining = deadline - now;
        if (remaining > 2000) {
            vTaskDelay(pdMS_TO_TICKS((remaining - 1000) / 1000));
        }
        now = nowMicros();
        if (deadline > now) {
            delayMicroseconds((uint32_t)(deadline - now));
        }
    }
};

static AxisConfig makeAxisConfig(const char* name, float minDeg, float maxDeg, float gearRatio) {
    AxisConfig c;
    c.name = name;
    c.minLimitDeg = minDeg;
    c.maxLimitDeg = maxDeg;
    c.stepsPerDegree = computeStepsPerDegree(MOTOR_STEPS_PER_REV, DRIVER_MICROSTEP, gearRatio);
    c.defaultSpeed = MOTION_DEFAULT_SPEED;
    c.minSpeed = MOTION_MIN_SPEED;
    c.maxSpeed = MOTION_MAX_SPEED;
    c.homingSpeed = MOTION_HOMING_SPEED;
    c.correctionSpeed = MOTION_CORRECTION_SPEED;
    c.enableSettleMs = MOTOR_ENABLE_SETTLE_MS;
    c.dirSetupUs = MOTOR_DIR_SETUP_US;
    return c;
}

static EspMotionClock motionClock;
static GpioAxisOutputs azimuthOutputs(PIN_AZ_DIR, PIN_AZ_STEP, PIN_AZ_ENABLE);
static GpioAxisOutputs elevationOutputs(PIN_EL_DIR, PIN_EL_STEP, PIN_EL_ENABLE);
static StepperAxis azimuthAxis(makeAxisConfig("Azimuth", AZ_MIN_LIMIT_DEG, AZ_MAX_LIMIT_DEG, AZ_GEAR_RATIO),
                               azimuthOutputs, motionClock);
static StepperAxis elevationAxis(makeAxisConfig("Elevation", EL_MIN_LIMIT_DEG, EL_MAX_LIMIT_DEG, EL_GEAR_RATIO),
                                 elevationOutputs, motionClock);

// =============================================================================
// FreeRTOS bindings for the dispatcher
// =============================================================================
// Each axis has one queue and one task. Only the task calls execute(), so an
// axis never runs two moves at once.

class FreeRtosMotionQueue : public MotionQueue {
public:
    bool create(UBaseType_t length) {
        handle = xQueueCreate(length, sizeof(MotionRequest));
        return handle != NULL;
    }

    bool push(const MotionRequest& request) override {
        return handle != NULL && xQueueSend(handle, &request, 0) == pdTRUE;
    }

    void clear() override {
        if (handle != NULL) {
            xQueueReset(handle);
        }
    }

    size_t pending() const override {
        return handle != NULL ? (size_t)uxQueueMessagesWaiting(handle) : 0;
    }

    bool receive(MotionRequest& request, TickType_t wait) {
        return handle != NULL && xQueueReceive(handle, &request, wait) == pdTRUE;
    }

private:
    QueueHandle_t handle = NULL;
};

// Homing runs in its own task; generation and stopFirst travel in the task parameter
class TaskHomingLauncher : public HomingLauncher {
public:
    bool launch(uint32_t generation, bool stopFirst) override;
};

static FreeRtosMotionQueue azimuthQueue;
static FreeRtosMotionQueue elevationQueue;
static TaskHomingLauncher homingLauncher;
static MotionDispatcher dispatcher(azimuthAxis, azimuthQueue, elevationAxis, elevationQueue,
                                   motionClock, homingLauncher, RESET_SETTLE_MS);

struct AxisWorker {
    AxisId axis;
    FreeRtosMotionQueue* queue;
};

static AxisWorker azimuthWorker = {AxisId::Azimuth, &azimuthQueue};
static AxisWorker elevationWorker = {AxisId::Elevation, &elevationQueue};

static void axisWorkerTask(void* arg) {
    AxisWorker* worker = static_cast<AxisWorker*>(arg);
    MotionRequest request;

    while (!shutdownController.isRequested()) {
        if (worker->queue->receive(request, pdMS_TO_TICKS(100))) {
            dispatcher.execute(worker->axis, request);
        }
    }

    LOG_DEBUGF("%s worker stopped", axisIdName(worker->axis));
    vTaskDelete(NULL);
}

static void homingTask(void* arg) {
    uintptr_t packed = (uintptr_t)arg;
    dispatcher.runHoming((uint32_t)(packed >> 1), (packed & 1) != 0);
    vTaskDelete(NULL);
}

bool TaskHomingLauncher::launch(uint32_t generation, bool stopFirst) {
    uintptr_t packed = ((uintptr_t)generation << 1) | (stopFirst ? 1 : 0);
    return xTaskCreatePinnedToCore(homingTask, "homing", MOTION_TASK_STACK, (void*)packed, 1, NULL, 1) == pdPASS;
}

MotionControl& motionControl() {
    return dispatcher;
}

// =============================================================================
// Lifecycle
// =============================================================================

static bool startWorker(AxisWorker& worker, const char* taskName) {
    const char* name = axisIdName(worker.axis);
    if (!worker.queue->create(MOTION_QUEUE_LENGTH)) {
        LOG_ERRORF("%s: motion queue could not be created", name);
        return false;
    }
    if (xTaskCreatePinnedToCore(axisWorkerTask, taskName, MOTION_TASK_STACK, &worker, 1, NULL, 1) != pdPASS) {
        LOG_ERRORF("%s: motion task could not be created", name);
        return false;
    }
    return true;
}

bool initSteppers() {
    azimuthAxis.begin();
    elevationAxis.begin();

    LOG_INFO("Stepper motors initialized");
    LOG_INFOF("  Azimuth motor: GPIO%d(DIR), GPIO%d(STEP), GPIO%d(EN)", PIN_AZ_DIR, PIN_AZ_STEP, PIN_AZ_ENABLE);
    LOG_INFOF("  Elevation motor: GPIO%d(DIR), GPIO%d(STEP), GPIO%d(EN)", PIN_EL_DIR, PIN_EL_STEP, PIN_EL_ENABLE);
    LOG_INFO("  All motors disabled (free movement)");
    LOG_INFO("  Enable pins: Active LOW");

    return startWorker(azimuthWorker, "az-motion") && startWorker(elevationWorker, "el-motion");
}

void enableSteppers() {
    azimuthAxis.enable();
    elevationAxis.enable();
    LOG_INFO("Rotator motors ENGAGED (holding position)");
}

void disableSteppers() {
    azimuthAxis.disable();
    elevationAxis.disable();
    LOG_INFO("Rotator motors RELEASED (free movement)");
}

void releaseSteppers() {
    azimuthOutputs.release();
    elevationOutputs.release();
    LOG_DEBUG("Stepper pins released");
}
