#ifndef ROTATOR_SERVER_H
#define ROTATOR_SERVER_H

#include <Arduino.h>

// Bind the protocol listener (ROTATOR_TCP_PORT) and start accepting clients.
// Requires WiFi. Returns false if the listener could not be opened.
bool startRotatorServer();

// Close the listener. Client tasks see the shutdown request and disconnect.
void stopRotatorServer();

// Number of connected protocol clients
int rotatorClientCount();

#endif // ROTATOR_SERVER_H
