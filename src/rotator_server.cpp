#include "rotator_server.h"
#include "command_protocol.h"
#include "config.h"
#include "logger.h"
#include "shutdown.h"
#include "state.h"
#include "steppers.h"
#include <WiFi.h>
#include <stdint.h>
#include <atomic>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

static WiFiServer rotatorServer(ROTATOR_TCP_PORT);
static std::atomic<bool> listening(false);
static std::atomic<bool> acceptRunning(false);
static std::atomic<int> clientCount(0);

// Connection slots. Claimed by the accept task, released by the client task.
static WiFiClient clientSlots[ROTATOR_MAX_CLIENTS];
static std::atomic<bool> slotUsed[ROTATOR_MAX_CLIENTS];

static int claimSlot() {
    for (int i = 0; i < ROTATOR_MAX_CLIENTS; i++) {
        if (!slotUsed[i].load()) {
            slotUsed[i] = true;
            return i;
        }
    }
    return -1;
}

// One task per connection, parameter is the slot index
static void clientTask(void* arg) {
    int slot = (int)(intptr_t)arg;
    WiFiClient* client = &clientSlots[slot];
    char address[24];
    snprintf(address, sizeof(address), "%s:%u", client->remoteIP().toString().c_str(), client->remotePort());

    clientCount++;
    LOG_INFOF("Client connected from %s", address);

    CommandProcessor processor(serverState, motionControl(), imuSample);
    LineAssembler lines(ROTATOR_MAX_LINE_LENGTH);
    std::string line;
    uint8_t buf[128];

    while (client->connected() && !shutdownController.isRequested()) {
        int available = client->available();
        if (available <= 0) {
            vTaskDelay(pdMS_TO_TICKS(ROTATOR_CLIENT_POLL_MS));
            continue;
        }

        int n = client->read(buf, available < (int)sizeof(buf) ? (size_t)available : sizeof(buf));
        if (n <= 0) {
            LOG_WARNF("Client %s read error", address);
            break;
        }

        bool writeFailed = false;
        for (int i = 0; i < n && !writeFailed; i++) {
            if (!lines.push((char)buf[i], line)) {
                continue;
            }

            LOG_DEBUGF("Received from %s: %s", address, line.c_str());
            std::string response = processor.execute(line) + "\n";
            size_t written = client->write((const uint8_t*)response.data(), response.size());
            if (written != response.size()) {
                LOG_WARNF("Client %s write error", address);
                writeFailed = true;
            }
        }
        if (writeFailed) {
            break;
        }
    }

    client->stop();
    *client = WiFiClient();
    slotUsed[slot] = false;
    clientCount--;
    LOG_INFOF("Client %s disconnected", address);
    vTaskDelete(NULL);
}

static void acceptTask(void* arg) {
    (void)arg;

    while (listening && !shutdownController.isRequested()) {
        WiFiClient client = rotatorServer.accept();
        if (client) {
            int slot = claimSlot();
            if (slot < 0) {
                LOG_WARNF("Client limit (%d) reached - connection refused", ROTATOR_MAX_CLIENTS);
                client.stop();
            } else {
                clientSlots[slot] = client;
                if (xTaskCreatePinnedToCore(clientTask, "rotctl", ROTATOR_CLIENT_STACK,
                                            (void*)(intptr_t)slot, 1, NULL, 0) != pdPASS) {
                    LOG_ERROR("No memory for client task - connection refused");
                    clientSlots[slot].stop();
                    clientSlots[slot] = WiFiClient();
                    slotUsed[slot] = false;
                }
            }
        }
        vTaskDelay(pdMS_TO_TICKS(ROTATOR_ACCEPT_POLL_MS));
    }

    acceptRunning = false;
    vTaskDelete(NULL);
}

bool startRotatorServer() {
    rotatorServer.begin();
    rotatorServer.setNoDelay(true);
    if (!rotatorServer) {
        LOG_ERRORF("Rotator server could not listen on port %d", ROTATOR_TCP_PORT);
        return false;
    }
    listening = true;

    acceptRunning = true;
    if (xTaskCreatePinnedToCore(acceptTask, "rotctl-accept", 4096, NULL, 1, NULL, 0) != pdPASS) {
        acceptRunning = false;
        listening = false;
        rotatorServer.end();
        LOG_ERROR("Rotator accept task could not be created");
        return false;
    }

    LOG_INFOF("Rotator server listening on %s:%d", WiFi.localIP().toString().c_str(), ROTATOR_TCP_PORT);
    return true;
}

void stopRotatorServer() {
    if (!listening) {
        return;
    }
    listening = false;

    for (int i = 0; i < 20 && acceptRunning; i++) {
        vTaskDelay(pdMS_TO_TICKS(ROTATOR_ACCEPT_POLL_MS));
    }
    rotatorServer.end();
    LOG_INFO("Rotator server closed");
}

int rotatorClientCount() {
    return clientCount.load();
}
