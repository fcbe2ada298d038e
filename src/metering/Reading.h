/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef READING_H
#define READING_H

#include <stdint.h>

// ----------------------------------------------------------------------------
// One phase's derived measurement.
// ----------------------------------------------------------------------------

struct Reading {
    float    realPower_W      = 0.0f;
    float    apparentPower_VA = 0.0f;   // >= 0
    float    iRms_A           = 0.0f;
    float    vRms_V           = 0.0f;
    float    energy_kWh       = 0.0f;   // accumulated over the save period
    uint64_t timestampMs      = 0;      // epoch milliseconds
};

// Reading tagged with the phase it belongs to (one shard record).
struct PhaseSnapshot {
    uint16_t phaseId = 0;
    Reading  reading;
};

/**
 * @brief Combine a running reading with a fresh estimate.
 *
 * RMS and power fields become the mean of both (fixed 50/50 weight),
 * energy is summed. The timestamp is left as in @p older; callers stamp
 * the result from the fresh reading.
 */
Reading mergeReadings(const Reading& older, const Reading& newer);

// Zero every field, energy and timestamp included (save period boundary).
void resetReading(Reading& r);

#endif // READING_H
