#ifndef STEPPERS_H
#define STEPPERS_H

#include <Arduino.h>
#include "motion.h"

// Configure driver pins, create both axes and their motion workers.
// Drivers stay disabled. Returns false if the queues or tasks could not be created.
bool initSteppers();

// Energize both drivers (active LOW enable)
void enableSteppers();

// De-energize both drivers (motors free)
void disableSteppers();

// Return all driver pins to inputs
void releaseSteppers();

// Queued motion control for both axes (valid after initSteppers)
MotionControl& motionControl();

#endif // STEPPERS_H
