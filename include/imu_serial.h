#ifndef IMU_SERIAL_H
#define IMU_SERIAL_H

#include <Arduino.h>

// Open the IMU UART (Serial1, 8N1)
void initImuSerial();

// Background read/decode loop publishing into imuSample
void startImuTask();

// Stop the read loop and close the UART
void closeImuSerial();

// Time since last valid angle packet (milliseconds)
unsigned long getImuDataAge();

#endif // IMU_SERIAL_H
