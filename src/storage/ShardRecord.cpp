#include "storage/ShardRecord.h"
#include <string.h>

static_assert(sizeof(float) == 4, "shard records assume 32-bit floats");

// -----------------------------------------------------------------------------
// Little-endian helpers (byte order fixed regardless of host)
// -----------------------------------------------------------------------------

static inline size_t putU16(uint8_t* p, uint16_t v) {
    p[0] = static_cast<uint8_t>(v & 0xFF);
    p[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    return 2;
}

static inline size_t putU32(uint8_t* p, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        p[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
    return 4;
}

static inline size_t putU64(uint8_t* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        p[i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
    return 8;
}

static inline size_t putF32(uint8_t* p, float v) {
    uint32_t bits = 0;
    memcpy(&bits, &v, sizeof(bits));
    return putU32(p, bits);
}

static inline uint16_t getU16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (static_cast<uint16_t>(p[1]) << 8));
}

static inline uint32_t getU32(const uint8_t* p) {
    uint32_t v = 0;
    for (int i = 3; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

static inline uint64_t getU64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) {
        v = (v << 8) | p[i];
    }
    return v;
}

static inline float getF32(const uint8_t* p) {
    const uint32_t bits = getU32(p);
    float v = 0.0f;
    memcpy(&v, &bits, sizeof(v));
    return v;
}

namespace ShardRecord {

size_t encode(const PhaseSnapshot& snap, uint8_t* out, size_t outLen) {
    if (out == nullptr || outLen < kSize) return 0;

    const Reading& r = snap.reading;
    size_t pos = 0;
    pos += putU16(out + pos, snap.phaseId);
    pos += putF32(out + pos, r.realPower_W);
    pos += putF32(out + pos, r.apparentPower_VA);
    pos += putF32(out + pos, r.iRms_A);
    pos += putF32(out + pos, r.vRms_V);
    pos += putF32(out + pos, r.energy_kWh);
    pos += putU64(out + pos, r.timestampMs);
    return pos;
}

bool decode(const uint8_t* in, size_t inLen, PhaseSnapshot& out) {
    if (in == nullptr || inLen < kSize) return false;

    out.phaseId                  = getU16(in + 0);
    out.reading.realPower_W      = getF32(in + 2);
    out.reading.apparentPower_VA = getF32(in + 6);
    out.reading.iRms_A           = getF32(in + 10);
    out.reading.vRms_V           = getF32(in + 14);
    out.reading.energy_kWh       = getF32(in + 18);
    out.reading.timestampMs      = getU64(in + 22);
    return true;
}

} // namespace ShardRecord
