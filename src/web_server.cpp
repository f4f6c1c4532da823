#include "web_server.h"
#include "config.h"
#include "imu_serial.h"
#include "logger.h"
#include "ota_progress.h"
#include "rotator_server.h"
#include "shutdown.h"
#include "state.h"
#include "steppers.h"
#include <WiFi.h>
#include <WebServer.h>
#include <ArduinoJson.h>
#include <ESPmDNS.h>
#include <ArduinoOTA.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <math.h>

static bool isWiFiEnabled() {
    return strlen(WIFI_SSID) > 0;
}

static WebServer server(WEB_SERVER_PORT);
static bool wifiConnected = false;

static void handleNotFound() {
    String message = "Not Found\n\nURI: ";
    message += server.uri();
    message += "\nEndpoints: GET /api/state, POST /api/feedback, GET /logs\n";
    server.send(404, "text/plain", message);
}

static void addAxisJson(JsonObject obj, const AxisStatus& s) {
    obj["position"] = s.positionDeg;
    obj["steps"] = s.stepCount;
    obj["enabled"] = s.enabled;
    obj["moving"] = s.moving;
    obj["homed"] = s.homed;
    obj["minLimit"] = s.minLimitDeg;
    obj["maxLimit"] = s.maxLimitDeg;
}

// Build complete state as JSON
static void buildStateJson(JsonDocument& doc) {
    TargetState targets = serverState.snapshot();

    JsonObject target = doc.createNestedObject("target");
    target["azimuth"] = targets.azimuthDeg;
    target["elevation"] = targets.elevationDeg;

    JsonObject feedback = doc.createNestedObject("feedback");
    feedback["enabled"] = targets.feedbackEnabled;
    feedback["toleranceDeg"] = targets.positionToleranceDeg;

    JsonObject axes = doc.createNestedObject("axes");
    addAxisJson(axes.createNestedObject("azimuth"), motionControl().status(AxisId::Azimuth));
    addAxisJson(axes.createNestedObject("elevation"), motionControl().status(AxisId::Elevation));

    ImuSample sample = imuSample.latest();
    JsonObject imu = doc.createNestedObject("imu");
    imu["connected"] = imuSample.isConnected();
    imu["yaw"] = sample.yawDeg;
    imu["pitch"] = sample.pitchDeg;
    imu["roll"] = sample.rollDeg;
    imu["samples"] = imuSample.sampleCount();
    long age = -1;
    if (imuSample.sampleCount() > 0) {
        age = (long)getImuDataAge();
    }
    imu["lastDataAgeMs"] = age;

    doc["clients"] = rotatorClientCount();
    doc["shutdown"] = shutdownController.isRequested();
    doc["uptimeMs"] = millis();
}

static void setupOTA() {
    ArduinoOTA.setHostname(WIFI_HOSTNAME);
    ArduinoOTA.setPassword(OTA_PASSWORD);

    ArduinoOTA.onStart([]() {
        String type;
        if (ArduinoOTA.getCommand() == U_FLASH) {
            type = "sketch";
        } else {
            type = "filesystem";
        }
        LOG_INFOF("Start OTA updating %s", type.c_str());
        // Motors must be parked before the flash write stalls the CPU
        shutdownController.trigger("OTA update");
    });

    ArduinoOTA.onEnd([]() {
        LOG_INFO("OTA update complete");
    });

    ArduinoOTA.onProgress([](unsigned int progress, unsigned int total) {
        // Use DEBUG to avoid flooding log buffer
        LOG_DEBUGF("OTA Progress: %u%%", otaProgressPercent(progress, total));
    });

    ArduinoOTA.onError([](ota_error_t error) {
        if (error == OTA_AUTH_ERROR) {
            LOG_ERROR("OTA Error: Auth Failed");
        } else if (error == OTA_BEGIN_ERROR) {
            LOG_ERROR("OTA Error: Begin Failed");
        } else if (error == OTA_CONNECT_ERROR) {
            LOG_ERROR("OTA Error: Connect Failed");
        } else if (error == OTA_RECEIVE_ERROR) {
            LOG_ERROR("OTA Error: Receive Failed");
        } else if (error == OTA_END_ERROR) {
            LOG_ERROR("OTA Error: End Failed");
        }
    });

    ArduinoOTA.begin();
    LOG_INFO("OTA ready");
}

static void setupRoutes() {
    server.on("/api/state", HTTP_GET, []() {
        StaticJsonDocument<1024> doc;
        buildStateJson(doc);
        String json;
        serializeJson(doc, json);
        server.send(200, "application/json", json);
    });

    server.on("/api/feedback", HTTP_POST, []() {
        if (!server.hasArg("plain")) {
            server.send(400, "application/json", "{\"error\":\"JSON body required\"}");
            return;
        }
        String body = server.arg("plain");
        StaticJsonDocument<128> doc;
        DeserializationError err = deserializeJson(doc, body);
        if (err) {
            server.send(400, "application/json", "{\"error\":\"Invalid JSON\"}");
            return;
        }
        if (doc.containsKey("toleranceDeg")) {
            float tolerance = doc["toleranceDeg"].as<float>();
            if (!isfinite(tolerance) || tolerance < 0.0f) {
                server.send(400, "application/json", "{\"error\":\"toleranceDeg must be >= 0\"}");
                return;
            }
            serverState.setPositionTolerance(tolerance);
            LOG_INFOF("Feedback tolerance: %.2f deg", tolerance);
        }
        if (doc.containsKey("enabled")) {
            serverState.setFeedbackEnabled(doc["enabled"].as<bool>());
            LOG_INFOF("Closed-loop feedback: %s", serverState.snapshot().feedbackEnabled ? "ON" : "OFF");
        }

        TargetState targets = serverState.snapshot();
        StaticJsonDocument<128> reply;
        reply["enabled"] = targets.feedbackEnabled;
        reply["toleranceDeg"] = targets.positionToleranceDeg;
        String json;
        serializeJson(reply, json);
        server.send(200, "application/json", json);
    });

    server.on("/logs", HTTP_GET, []() {
        std::string logsJSON = logger.getEntriesJSON();
        server.send(200, "application/json", logsJSON.c_str());
    });

    server.onNotFound(handleNotFound);
}

bool initWebServer() {
    if (!isWiFiEnabled()) {
        LOG_ERROR("WiFi SSID not configured - rotator server needs a network");
        return false;
    }

    LOG_INFO("=== WiFi Configuration ===");
    LOG_INFOF("SSID: %s", WIFI_SSID);

    // Set WiFi mode to station
    WiFi.mode(WIFI_STA);

    // Set hostname for DHCP
    WiFi.setHostname(WIFI_HOSTNAME);

    WiFi.begin(WIFI_SSID, WIFI_PASSWORD);

    LOG_INFO("Connecting to WiFi...");
    unsigned long startAttemptTime = millis();

    // Wait for connection with timeout
    while (WiFi.status() != WL_CONNECTED &&
           millis() - startAttemptTime < WIFI_CONNECT_TIMEOUT) {
        delay(100);
    }

    if (WiFi.status() != WL_CONNECTED) {
        wifiConnected = false;
        LOG_ERROR("WiFi connection failed!");
        LOG_ERRORF("WiFi status: %d", WiFi.status());
        return false;
    }

    wifiConnected = true;
    LOG_INFO("WiFi connected!");
    LOG_INFOF("IP Address: %s", WiFi.localIP().toString().c_str());

    // Initialize mDNS
    if (MDNS.begin(WIFI_HOSTNAME)) {
        MDNS.addService("http", "tcp", WEB_SERVER_PORT);
        LOG_INFOF("mDNS responder started: %s.local", WIFI_HOSTNAME);
    }

    setupOTA();
    setupRoutes();

    server.begin();
    LOG_INFOF("Web server started on port %d", WEB_SERVER_PORT);
    LOG_INFOF("Status: http://%s/api/state", WiFi.localIP().toString().c_str());
    return true;
}

static void webTask(void* arg) {
    (void)arg;
    for (;;) {
        ArduinoOTA.handle();
        server.handleClient();
        vTaskDelay(1);  // Yield to other tasks
    }
}

void startWebServerTask() {
    if (!wifiConnected) return;
    if (xTaskCreatePinnedToCore(webTask, "web", 4096, NULL, 0, NULL, 0) != pdPASS) {
        LOG_ERROR("Web server task could not be created");
        return;
    }
    LOG_INFO("Web server task started (Core 0, low priority)");
}

String getIPAddress() {
    if (wifiConnected) {
        return WiFi.localIP().toString();
    }
    return "Not connected";
}
