#ifndef CONFIG_H
#define CONFIG_H

// ============================================================================
// ESP32 Ground Station Rotator - Configuration
// ============================================================================

// ----------------------------------------------------------------------------
// WiFi Configuration
// ----------------------------------------------------------------------------
// WiFi credentials can be configured in two ways:
// 1. Create "secrets.h" in this directory with WIFI_SSID_SECRET and WIFI_PASSWORD_SECRET
//    (recommended - secrets.h is gitignored)
// 2. Or modify the default values below (not recommended for public repos)
//
// The rotator protocol server needs the network, so the firmware refuses to
// start motion control when WiFi cannot be joined.

#if __has_include("secrets.h")
#include "secrets.h"
  #define WIFI_SSID           WIFI_SSID_SECRET
  #define WIFI_PASSWORD       WIFI_PASSWORD_SECRET
#else
  #define WIFI_SSID           ""          // Your WiFi SSID
  #define WIFI_PASSWORD       ""          // Your WiFi password
#endif

#define WIFI_HOSTNAME         "esp32-rotator"
#define WIFI_CONNECT_TIMEOUT  10000       // WiFi connection timeout in milliseconds
#define WEB_SERVER_PORT       80          // Status page / JSON API port
#define OTA_PASSWORD          "admin"     // Change this to a secure password

// ----------------------------------------------------------------------------
// Rotator Control Protocol (rotctld / Gpredict, GS-232 style)
// ----------------------------------------------------------------------------
#define ROTATOR_TCP_PORT          4533
#define ROTATOR_MAX_LINE_LENGTH   64    // Longer lines are discarded
#define ROTATOR_CLIENT_POLL_MS    10
#define ROTATOR_ACCEPT_POLL_MS    20
#define ROTATOR_CLIENT_STACK      4096
#define ROTATOR_MAX_CLIENTS       4     // Concurrent protocol connections
#define ROTATOR_HOME_ON_STARTUP   true

// ----------------------------------------------------------------------------
// Stepper Pins (DM542 / TB6600 style drivers)
// ----------------------------------------------------------------------------
// Enable pins are active LOW: HIGH = driver disabled, motor free.
#define PIN_AZ_DIR        4
#define PIN_AZ_STEP       5
#define PIN_AZ_ENABLE     16
#define PIN_EL_DIR        42
#define PIN_EL_STEP       2
#define PIN_EL_ENABLE     1

// Stop button - input with pullup, pressed = LOW. Runs the shutdown sequence.
#define PIN_STOP_BUTTON   15
#define STOP_BUTTON_DEBOUNCE_MS 50

// ----------------------------------------------------------------------------
// Motor / Driver Calibration
// ----------------------------------------------------------------------------
// steps per degree = steps/rev * microstep multiplier * gear ratio / 360
#define MOTOR_STEPS_PER_REV       200     // 1.8 degree motor
#define DRIVER_MICROSTEP          1       // Driver DIP switch setting
#define AZ_GEAR_RATIO             40.0f   // Worm gear ratio
#define EL_GEAR_RATIO             40.0f

// Speeds in steps per second
#define MOTION_DEFAULT_SPEED      100.0f
#define MOTION_MIN_SPEED          1.0f
#define MOTION_MAX_SPEED          1000.0f
#define MOTION_HOMING_SPEED       50.0f
#define MOTION_CORRECTION_SPEED   50.0f

// Safety limits in degrees
#define AZ_MIN_LIMIT_DEG          0.0f
#define AZ_MAX_LIMIT_DEG          360.0f
#define EL_MIN_LIMIT_DEG          0.0f
#define EL_MAX_LIMIT_DEG          90.0f

// Timing
#define MOTOR_ENABLE_SETTLE_MS    100     // Driver stabilization after enable
#define MOTOR_DIR_SETUP_US        1000    // Direction setup time before first pulse
#define MOTION_QUEUE_LENGTH       4       // Pending requests per axis
#define MOTION_TASK_STACK         4096
#define RESET_SETTLE_MS           500     // Pause between stop and homing on 'R'

// ----------------------------------------------------------------------------
// IMU (WT901C angle output over UART / RS485 adapter)
// ----------------------------------------------------------------------------
#define IMU_SERIAL_BAUD       115200
#define PIN_IMU_RX            13
#define PIN_IMU_TX            14
#define IMU_POLL_MS           10      // 100 Hz read loop
#define IMU_DATA_TIMEOUT_MS   500     // No packet for this long = disconnected
#define IMU_BUFFER_LIMIT      512     // Accumulator cap in bytes

// ----------------------------------------------------------------------------
// Closed-loop Feedback
// ----------------------------------------------------------------------------
#define FEEDBACK_ENABLED_DEFAULT      true
#define FEEDBACK_PERIOD_MS            100   // 10 Hz
#define FEEDBACK_TOLERANCE_DEG        0.5f
#define FEEDBACK_TASK_STACK           4096

/*
                            ┌─────────────────┐
                        ┌───└─────────────────┘───┐
                        │3V3                   GND│
                        │3v3                GPIO43│  USB serial (log)
                        │RST                GPIO44│  USB serial (log)
          AZ-DIR        │GPIO4               GPIO1│  EL-ENABLE
          AZ-STEP       │GPIO5               GPIO2│  EL-STEP
                        │GPIO6              GPIO42│  EL-DIR
                        │GPIO7              GPIO41│
          STOP-BUTTON   │GPIO15             GPIO40│
          AZ-ENABLE     │GPIO16             GPIO39│
                        │GPIO17             GPIO38│
                        │GPIO18             GPIO37│  PSRAM-RESERVED
                        │GPIO8              GPIO36│  PSRAM-RESERVED
                        │GPIO3              GPIO35│  PSRAM-RESERVED
                      x │GPIO46              GPIO0│
                        │GPIO9              GPIO45│
                        │GPIO10             GPIO48│
                        │GPIO11             GPIO47│
                        │GPIO12             GPIO21│
          IMU-RX        │GPIO13             GPIO20│
          IMU-TX        │GPIO14             GPIO19│
                        │5V0                   GND│
                        │GND    USB   UART     GND│
                        └───────┌──┐──┌──┐────────┘
                                └──┘  └──┘
*/

// ----------------------------------------------------------------------------
// Logging Configuration
// ----------------------------------------------------------------------------
// Number of log messages to keep in memory for web interface display
// DEBUG level logs are not stored, only INFO, WARN, and ERROR
#define LOG_BUFFER_SIZE     50

#endif // CONFIG_H
