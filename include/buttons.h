#ifndef BUTTONS_H
#define BUTTONS_H

#include <Arduino.h>

// Emergency stop button on PIN_STOP_BUTTON, wired to GND (internal pull-up)
void initStopButton();

// Debounced poll from loop(). A press runs the shutdown sequence:
// motion stops, drivers are released, servers close.
void pollStopButton();

#endif // BUTTONS_H
