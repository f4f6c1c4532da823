#ifndef WEB_SERVER_H
#define WEB_SERVER_H

#include <Arduino.h>

// Join WiFi (station mode), then bring up mDNS, OTA and the status API:
//   GET  /api/state     targets, axes, IMU, clients
//   POST /api/feedback  {"enabled": bool, "toleranceDeg": float}
//   GET  /logs          stored log entries
// Returns false when no SSID is configured or the network could not be joined.
bool initWebServer();

// Serve HTTP and OTA from a low priority task on core 0.
// Keeps running after shutdown so logs stay readable and OTA stays possible.
void startWebServerTask();

// Station IP, or "Not connected"
String getIPAddress();

#endif // WEB_SERVER_H
