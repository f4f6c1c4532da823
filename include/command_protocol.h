#ifndef COMMAND_PROTOCOL_H
#define COMMAND_PROTOCOL_H

#include <stddef.h>
#include <stdint.h>
#include <string>

#include "motion.h"
#include "state.h"

/*
 * Rotator control protocol (rotctld / Gpredict, GS-232 style)
 * ASCII, one command per line (\n or \r\n), case-insensitive.
 *
 *   AZ<deg>   set azimuth target and start moving      -> OK
 *   EL<deg>   set elevation target and start moving    -> OK
 *   P         report position                          -> AZ=123.4 EL=45.0
 *   S         stop both axes                           -> OK
 *   H         home both axes, targets back to 0        -> OK
 *   R         stop, pause, then home                   -> OK
 *   anything else                                      -> ERROR
 *
 * Motion commands answer immediately; the move runs in the background.
 */

#define RESPONSE_OK     "OK"
#define RESPONSE_ERROR  "ERROR"

enum class CommandType : uint8_t {
    SetAzimuth,
    SetElevation,
    QueryPosition,
    StopAll,
    HomeAll,
    Reset,
    Invalid
};

struct ProtocolCommand {
    CommandType type = CommandType::Invalid;
    float value = 0.0f;  // degrees, SetAzimuth / SetElevation only
};

// Trim, uppercase and parse one line
ProtocolCommand parseCommand(const std::string& line);

// "AZ=%.1f EL=%.1f"
std::string formatPosition(float azimuthDeg, float elevationDeg);

// Splits a byte stream into lines. Lines longer than maxLength are dropped
// up to the next terminator. Blank lines are skipped.
class LineAssembler {
public:
    explicit LineAssembler(size_t maxLength);

    // Returns true when c completed a line, which is moved into line
    bool push(char c, std::string& line);

    void reset();

private:
    std::string current;
    size_t maxLength;
    bool overflow;
};

// Applies parsed commands to the shared state and the motion layer.
// One instance per client connection.
class CommandProcessor {
public:
    CommandProcessor(ServerState& state, MotionControl& motion, const ImuSampleCell& imu);

    // Parse + dispatch, returns the response line without terminator
    std::string execute(const std::string& line);

    std::string dispatch(const ProtocolCommand& command);

private:
    std::string setTarget(AxisId axis, float deg);
    std::string queryPosition() const;

    ServerState& state;
    MotionControl& motion;
    const ImuSampleCell& imu;
};

#endif // COMMAND_PROTOCOL_H
