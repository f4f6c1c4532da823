#include "feedback_task.h"
#include "config.h"
#include "feedback.h"
#include "logger.h"
#include "shutdown.h"
#include "state.h"
#include "steppers.h"
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

static void feedbackTask(void* arg) {
    (void)arg;
    FeedbackController controller(serverState, imuSample, motionControl());
    TickType_t lastWake = xTaskGetTickCount();
    bool wasRunning = false;

    while (!shutdownController.isRequested()) {
        FeedbackTick result = controller.tick();
        if (result.ran != wasRunning) {
            LOG_INFOF("Closed-loop feedback %s", result.ran ? "active" : "idle");
            wasRunning = result.ran;
        }
        vTaskDelayUntil(&lastWake, pdMS_TO_TICKS(FEEDBACK_PERIOD_MS));
    }

    LOG_DEBUG("Feedback task stopped");
    vTaskDelete(NULL);
}

void startFeedbackTask() {
    if (xTaskCreatePinnedToCore(feedbackTask, "feedback", FEEDBACK_TASK_STACK, NULL, 1, NULL, 1) != pdPASS) {
        LOG_ERROR("Feedback task could not be created - running open loop");
        return;
    }
    LOG_INFOF("Feedback task started (%d ms period)", FEEDBACK_PERIOD_MS);
}
