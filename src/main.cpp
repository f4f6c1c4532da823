#include <Arduino.h>
#include "config.h"
#include "logger.h"
#include "state.h"
#include "shutdown.h"
#include "buttons.h"
#include "steppers.h"
#include "imu_serial.h"
#include "feedback_task.h"
#include "rotator_server.h"
#include "web_server.h"

static void serialOutput(const char* line) {
  Serial.println(line);
}

static unsigned long boardMillis() {
  return millis();
}

// Teardown order: motion first, drivers off, then the inputs, pins last
static void registerShutdownSteps() {
  shutdownController.addStep("stop motion", []() { motionControl().stopAll(); });
  shutdownController.addStep("disable drivers", disableSteppers);
  shutdownController.addStep("close rotator server", stopRotatorServer);
  shutdownController.addStep("close IMU serial", closeImuSerial);
  shutdownController.addStep("release pins", releaseSteppers);
}

static void fatal(const char* reason) {
  LOG_ERRORF("Startup failed: %s", reason);
  shutdownController.trigger(reason);
}

void setup() {
  // Initialize Serial for debugging
  Serial.begin(115200);
  delay(1000);

  // Initialize logger
  logger.setOutput(serialOutput);
  logger.setClock(boardMillis);
  logger.begin(LOG_BUFFER_SIZE);

  LOG_INFO("=== ESP32 Antenna Rotator ===");

  serverState.setFeedbackEnabled(FEEDBACK_ENABLED_DEFAULT);
  serverState.setPositionTolerance(FEEDBACK_TOLERANCE_DEG);

  registerShutdownSteps();

  // Stop button works from the first moment the drivers exist
  initStopButton();

  if (!initSteppers()) {
    fatal("motion workers");
    return;
  }

  // IMU is optional, without it the rotator runs open loop
  initImuSerial();
  startImuTask();

  // Network is required: the protocol server is the only way to command moves
  if (!initWebServer()) {
    fatal("no network");
    return;
  }
  startWebServerTask();  // Run web/OTA in background task (low priority)

  if (!startRotatorServer()) {
    fatal("rotator listener");
    return;
  }

  enableSteppers();
  startFeedbackTask();

  if (ROTATOR_HOME_ON_STARTUP) {
    if (!motionControl().requestHomeAll(false)) {
      LOG_WARN("Startup homing could not be started");
    }
  }

  LOG_INFOF("=== System Ready (%s:%d) ===", getIPAddress().c_str(), ROTATOR_TCP_PORT);
}

void loop() {
  static unsigned long lastHeartbeat = 0;
  unsigned long now = millis();

  if (!shutdownController.isRequested()) {
    pollStopButton();
  }

  if (now - lastHeartbeat >= 2000) {
    lastHeartbeat = now;
    LOG_DEBUGF("Heartbeat: %lu ms, %d client(s)", now, rotatorClientCount());
  }

  delay(10);
}
