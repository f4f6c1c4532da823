#ifndef FEEDBACK_TASK_H
#define FEEDBACK_TASK_H

#include <Arduino.h>

// Run the closed-loop correction every FEEDBACK_PERIOD_MS until shutdown.
// Call after initSteppers().
void startFeedbackTask();

#endif // FEEDBACK_TASK_H
