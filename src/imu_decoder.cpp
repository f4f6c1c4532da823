#include "imu_decoder.h"
#include <algorithm>

ImuDecoder::ImuDecoder(size_t bufferLimit)
    : bufferLimit(std::max<size_t>(bufferLimit, IMU_PACKET_SIZE)), decoded(0), skipped(0) {
    buffer.reserve(this->bufferLimit);
}

void ImuDecoder::reset() {
    buffer.clear();
    decoded = 0;
    skipped = 0;
    sample = ImuSample();
}

float ImuDecoder::rawToDegrees(int16_t raw) {
    return (float)(raw / 32768.0 * 180.0);
}

size_t ImuDecoder::feed(const uint8_t* data, size_t length) {
    if (data != nullptr && length > 0) {
        buffer.insert(buffer.end(), data, data + length);
    }

    // Keep the newest bytes; the scan below realigns on the next sync byte
    if (buffer.size() > bufferLimit) {
        buffer.erase(buffer.begin(), buffer.end() - bufferLimit);
    }

    return parse();
}

size_t ImuDecoder::parse() {
    size_t samples = 0;

    while (buffer.size() >= IMU_PACKET_SIZE) {
        std::vector<uint8_t>::iterator sync = std::find(buffer.begin(), buffer.end(), (uint8_t)IMU_PACKET_SYNC);
        if (sync == buffer.end()) {
            // No packet start anywhere - everything is noise
            buffer.clear();
            break;
        }

        if (sync != buffer.begin()) {
            buffer.erase(buffer.begin(), sync);
        }

        if (buffer.size() < IMU_PACKET_SIZE) {
            break;  // Wait for the rest of the packet
        }

        if (buffer[1] == IMU_PACKET_ANGLE) {
            decodeAngle(buffer.data(), sample);
            decoded++;
            samples++;
        } else {
            skipped++;
        }

        // Consume one packet length whether it was used or not
        buffer.erase(buffer.begin(), buffer.begin() + IMU_PACKET_SIZE);
    }

    return samples;
}

void ImuDecoder::decodeAngle(const uint8_t* packet, ImuSample& out) {
    // Extract angles (little-endian int16)
    int16_t rollRaw = (int16_t)(packet[2] | (packet[3] << 8));
    int16_t pitchRaw = (int16_t)(packet[4] | (packet[5] << 8));
    int16_t yawRaw = (int16_t)(packet[6] | (packet[7] << 8));

    out.rollDeg = rawToDegrees(rollRaw);
    out.pitchDeg = rawToDegrees(pitchRaw);
    out.yawDeg = rawToDegrees(yawRaw);

    // Normalize yaw to 0-360
    if (out.yawDeg < 0.0f) {
        out.yawDeg += 360.0f;
    }
}
