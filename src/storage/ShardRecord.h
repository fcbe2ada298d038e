/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef SHARD_RECORD_H
#define SHARD_RECORD_H

#include <stddef.h>
#include <stdint.h>
#include "metering/Reading.h"

/**
 * @file ShardRecord.h
 * @brief Fixed-size little-endian record written to shard files.
 *
 * Layout (30 bytes, no padding, no header):
 *   off  0  u16  phase id
 *   off  2  f32  real power [W]
 *   off  6  f32  apparent power [VA]
 *   off 10  f32  I rms [A]
 *   off 14  f32  V rms [V]
 *   off 18  f32  energy [kWh]
 *   off 22  u64  timestamp [epoch ms]
 */
namespace ShardRecord {

    static constexpr size_t kSize = 2 + 4 * 5 + 8;

    // Returns bytes written (kSize), or 0 if @p outLen is too small.
    size_t encode(const PhaseSnapshot& snap, uint8_t* out, size_t outLen);

    // Returns false if @p inLen is shorter than one record.
    bool decode(const uint8_t* in, size_t inLen, PhaseSnapshot& out);
}

#endif // SHARD_RECORD_H
