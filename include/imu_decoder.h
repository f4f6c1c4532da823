#ifndef IMU_DECODER_H
#define IMU_DECODER_H

#include <stddef.h>
#include <stdint.h>
#include <vector>

#include "state.h"

// WT901C binary protocol
// [0x55][type][d0 d1][d2 d3][d4 d5][d6 d7][sum]
// Angle packet (0x53): roll, pitch, yaw as little-endian int16, 32768 = 180 deg
#define IMU_PACKET_SYNC       0x55
#define IMU_PACKET_ANGLE      0x53
#define IMU_PACKET_SIZE       11

// Reassembles packets from an arbitrary byte stream. Noise and unknown
// packets are dropped; the decoder resynchronizes on the next sync byte.
class ImuDecoder {
public:
    explicit ImuDecoder(size_t bufferLimit = 512);

    // Append received bytes and parse. Returns number of angle samples decoded.
    size_t feed(const uint8_t* data, size_t length);

    // Most recent decoded sample (valid once hasSample() is true)
    const ImuSample& lastSample() const { return sample; }
    bool hasSample() const { return decoded > 0; }

    uint32_t decodedCount() const { return decoded; }
    uint32_t skippedCount() const { return skipped; }
    size_t buffered() const { return buffer.size(); }

    void reset();

    // raw / 32768 * 180
    static float rawToDegrees(int16_t raw);

private:
    size_t parse();
    static void decodeAngle(const uint8_t* packet, ImuSample& out);

    std::vector<uint8_t> buffer;
    size_t bufferLimit;
    ImuSample sample;
    uint32_t decoded;
    uint32_t skipped;
};

#endif // IMU_DECODER_H
