#include "buttons.h"
#include "config.h"
#include "logger.h"
#include "shutdown.h"

// Button state tracking
static bool stopButtonState = false;
static bool stopButtonReading = false;
static unsigned long lastChangeTime = 0;

void initStopButton() {
  LOG_INFO("Initializing stop button...");

  // Button to GND, active LOW
  pinMode(PIN_STOP_BUTTON, INPUT_PULLUP);

  LOG_INFOF("  - Stop button: GPIO%d (debounce %d ms)", PIN_STOP_BUTTON, STOP_BUTTON_DEBOUNCE_MS);
}

void pollStopButton() {
  unsigned long now = millis();
  bool pressed = !digitalRead(PIN_STOP_BUTTON);

  if (pressed != stopButtonReading) {
    stopButtonReading = pressed;
    lastChangeTime = now;
    return;
  }

  if (pressed == stopButtonState || now - lastChangeTime < STOP_BUTTON_DEBOUNCE_MS) {
    return;
  }
  stopButtonState = pressed;

  if (pressed) {
    LOG_WARN("Stop button pressed");
    shutdownController.trigger("stop button");
  }
}
