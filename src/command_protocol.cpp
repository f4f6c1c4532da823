#include "command_protocol.h"
#include "logger.h"
#include <ctype.h>
#include <math.h>
#include <stdio.h>
#include <stdlib.h>

/*=============================================================================
  SMALL HELPERS
=============================================================================*/

static std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && isspace((unsigned char)s[begin])) begin++;
    while (end > begin && isspace((unsigned char)s[end - 1])) end--;
    return s.substr(begin, end - begin);
}

static std::string toUpper(const std::string& s) {
    std::string out(s);
    for (size_t i = 0; i < out.size(); i++) {
        out[i] = (char)toupper((unsigned char)out[i]);
    }
    return out;
}

// Plain decimal only: no hex, nan or inf
static bool parseDegrees(const std::string& text, float& out) {
    std::string s = trim(text);
    if (s.empty()) return false;

    for (size_t i = 0; i < s.size(); i++) {
        char c = s[i];
        if (!isdigit((unsigned char)c) && c != '.' && c != '+' && c != '-' && c != 'E') {
            return false;
        }
    }

    char* end = nullptr;
    float value = strtof(s.c_str(), &end);
    if (end != s.c_str() + s.size() || !isfinite(value)) {
        return false;
    }
    out = value;
    return true;
}

// Avoid printing "-0.0" for positions that sit a hair below zero
static float displayValue(float deg) {
    return fabsf(deg) < 0.05f ? 0.0f : deg;
}

/*=============================================================================
  PARSE
=============================================================================*/

ProtocolCommand parseCommand(const std::string& line) {
    ProtocolCommand cmd;
    std::string s = toUpper(trim(line));

    if (s == "P") {
        cmd.type = CommandType::QueryPosition;
    } else if (s == "S") {
        cmd.type = CommandType::StopAll;
    } else if (s == "H") {
        cmd.type = CommandType::HomeAll;
    } else if (s == "R") {
        cmd.type = CommandType::Reset;
    } else if (s.compare(0, 2, "AZ") == 0 && parseDegrees(s.substr(2), cmd.value)) {
        cmd.type = CommandType::SetAzimuth;
    } else if (s.compare(0, 2, "EL") == 0 && parseDegrees(s.substr(2), cmd.value)) {
        cmd.type = CommandType::SetElevation;
    } else {
        cmd.type = CommandType::Invalid;
        cmd.value = 0.0f;
    }
    return cmd;
}

std::string formatPosition(float azimuthDeg, float elevationDeg) {
    char buf[48];
    snprintf(buf, sizeof(buf), "AZ=%.1f EL=%.1f", displayValue(azimuthDeg), displayValue(elevationDeg));
    return std::string(buf);
}

/*=============================================================================
  LINE ASSEMBLY
=============================================================================*/

LineAssembler::LineAssembler(size_t maxLength) : maxLength(maxLength), overflow(false) {
    current.reserve(maxLength);
}

void LineAssembler::reset() {
    current.clear();
    overflow = false;
}

bool LineAssembler::push(char c, std::string& line) {
    if (c == '\n' || c == '\r') {
        bool dropped = overflow;
        overflow = false;
        if (dropped || trim(current).empty()) {
            current.clear();
            return false;
        }
        line.swap(current);
        current.clear();
        return true;
    }

    if (overflow) {
        return false;
    }

    if (current.size() >= maxLength) {
        // Buffer overflow, discard line
        LOG_DEBUGF("Protocol line longer than %u bytes discarded", (unsigned)maxLength);
        current.clear();
        overflow = true;
        return false;
    }

    current += c;
    return false;
}

/*=============================================================================
  DISPATCH
=============================================================================*/

CommandProcessor::CommandProcessor(ServerState& state, MotionControl& motion, const ImuSampleCell& imu)
    : state(state), motion(motion), imu(imu) {}

std::string CommandProcessor::execute(const std::string& line) {
    ProtocolCommand cmd = parseCommand(line);
    if (cmd.type == CommandType::Invalid) {
        LOG_DEBUGF("Invalid command: %s", trim(line).c_str());
    }
    return dispatch(cmd);
}

std::string CommandProcessor::dispatch(const ProtocolCommand& command) {
    switch (command.type) {
        case CommandType::SetAzimuth:
            return setTarget(AxisId::Azimuth, command.value);

        case CommandType::SetElevation:
            return setTarget(AxisId::Elevation, command.value);

        case CommandType::QueryPosition:
            return queryPosition();

        case CommandType::StopAll:
            motion.stopAll();
            return RESPONSE_OK;

        case CommandType::HomeAll:
        case CommandType::Reset:
            if (!motion.requestHomeAll(command.type == CommandType::Reset)) {
                return RESPONSE_ERROR;
            }
            state.resetTargets();
            return RESPONSE_OK;

        case CommandType::Invalid:
        default:
            return RESPONSE_ERROR;
    }
}

std::string CommandProcessor::setTarget(AxisId axis, float deg) {
    if (!motion.requestMove(axis, deg, MotionSource::Command)) {
        LOG_WARNF("%s: move to %.2f not queued", axisIdName(axis), deg);
        return RESPONSE_ERROR;
    }

    if (axis == AxisId::Azimuth) {
        state.setTargetAzimuth(deg);
    } else {
        state.setTargetElevation(deg);
    }
    return RESPONSE_OK;
}

std::string CommandProcessor::queryPosition() const {
    // Prefer measured attitude, fall back to step-counted position
    if (imu.isConnected()) {
        ImuSample sample = imu.latest();
        return formatPosition(sample.yawDeg, sample.pitchDeg);
    }
    return formatPosition(motion.status(AxisId::Azimuth).positionDeg,
                          motion.status(AxisId::Elevation).positionDeg);
}
