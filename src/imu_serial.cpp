#include "imu_serial.h"
#include "config.h"
#include "imu_decoder.h"
#include "logger.h"
#include "shutdown.h"
#include "state.h"
#include <atomic>
#include <limits.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

// Use Serial1 for the IMU (separate from USB debug Serial)
HardwareSerial ImuSerial(1);

static ImuDecoder decoder(IMU_BUFFER_LIMIT);
static std::atomic<bool> serialOpen(false);
static std::atomic<bool> taskRunning(false);

void initImuSerial() {
    ImuSerial.begin(IMU_SERIAL_BAUD, SERIAL_8N1, PIN_IMU_RX, PIN_IMU_TX);
    serialOpen = true;

    LOG_INFO("IMU serial receiver initialized");
    LOG_INFOF("  RX Pin: GPIO%d", PIN_IMU_RX);
    LOG_INFOF("  Baud rate: %d", IMU_SERIAL_BAUD);
}

unsigned long getImuDataAge() {
    if (imuSample.sampleCount() == 0) {
        return ULONG_MAX;
    }
    return millis() - imuSample.lastUpdate();
}

static void updateConnection() {
    bool fresh = getImuDataAge() < IMU_DATA_TIMEOUT_MS;
    if (fresh != imuSample.isConnected()) {
        if (fresh) {
            LOG_INFO("IMU data valid - closed loop available");
        } else {
            LOG_WARNF("IMU data lost (no angle packet for %d ms)", IMU_DATA_TIMEOUT_MS);
        }
        imuSample.setConnected(fresh);
    }
}

static void imuTask(void* arg) {
    (void)arg;
    uint8_t buf[64];

    while (serialOpen && !shutdownController.isRequested()) {
        // Read all available bytes
        int available = ImuSerial.available();
        while (available > 0) {
            size_t n = ImuSerial.read(buf, available < (int)sizeof(buf) ? (size_t)available : sizeof(buf));
            if (n == 0) {
                break;
            }
            if (decoder.feed(buf, n) > 0) {
                imuSample.publish(decoder.lastSample(), millis());
            }
            available = ImuSerial.available();
        }

        updateConnection();
        vTaskDelay(pdMS_TO_TICKS(IMU_POLL_MS));
    }

    imuSample.setConnected(false);
    LOG_DEBUGF("IMU task stopped (%u packets decoded, %u skipped)",
               (unsigned)decoder.decodedCount(), (unsigned)decoder.skippedCount());
    taskRunning = false;
    vTaskDelete(NULL);
}

void startImuTask() {
    taskRunning = true;
    if (xTaskCreatePinnedToCore(imuTask, "imu", 4096, NULL, 2, NULL, 0) != pdPASS) {
        taskRunning = false;
        LOG_ERROR("IMU task could not be created - running open loop");
        return;
    }
    LOG_INFO("IMU task started (Core 0, 100 Hz)");
}

void closeImuSerial() {
    if (!serialOpen) {
        return;
    }
    serialOpen = false;

    // Let the read loop leave before the UART goes away
    for (int i = 0; i < 20 && taskRunning; i++) {
        vTaskDelay(pdMS_TO_TICKS(IMU_POLL_MS));
    }
    ImuSerial.end();
    imuSample.setConnected(false);
    LOG_INFO("IMU disconnected");
}
