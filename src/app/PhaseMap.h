/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef PHASE_MAP_H
#define PHASE_MAP_H

#include <stdint.h>
#include "system/Config.h"

// ============================================================================
// Board wiring: which ADC pins feed which phase, plus factory calibration.
// NVS keys override the ratios and phase coefficient at boot.
// ============================================================================

struct PhasePins {
    uint16_t    id;
    uint8_t     currentPin;
    uint8_t     voltagePin;
    float       iCal;          // CT burden ratio
    float       vCal;          // voltage divider ratio
    float       phaseCal;      // V/I sequential-read skew
    float       offsetI;       // boot DC offset [mV]
    float       offsetV;
    const char* iCalKey;
    const char* vCalKey;
    const char* phaseCalKey;
};

#ifdef CTMETER_THREE_PHASE
static const PhasePins PHASE_MAP[AC_PHASE_COUNT] = {
    { 1, 32, 39, 30.0f, 219.25f, 1.7f, 1066.0f, 1288.0f, P1_ICAL_KEY, P1_VCAL_KEY, P1_PHASECAL_KEY },
    { 2, 35, 36, 30.0f, 219.25f, 1.7f, 1066.0f, 1288.0f, P2_ICAL_KEY, P2_VCAL_KEY, P2_PHASECAL_KEY },
    { 3, 34, 33, 30.0f, 219.25f, 1.7f, 1066.0f, 1288.0f, P3_ICAL_KEY, P3_VCAL_KEY, P3_PHASECAL_KEY },
};
#else
static const PhasePins PHASE_MAP[AC_PHASE_COUNT] = {
    { 1, 35, 34, 102.0f, 232.5f, 1.7f, 1066.0f, 1288.0f, P1_ICAL_KEY, P1_VCAL_KEY, P1_PHASECAL_KEY },
};
#endif

#endif // PHASE_MAP_H
