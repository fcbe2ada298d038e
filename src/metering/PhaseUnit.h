/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef PHASE_UNIT_H
#define PHASE_UNIT_H

#include <stdint.h>
#include "metering/Reading.h"
#include "sensing/SampleChannel.h"

// ============================================================================
// Per-phase measurement unit: CT channel + voltage channel + calibration.
// ============================================================================
//
// ratio and phaseCal are fixed at boot from the phase table / NVS.
// offset is the running DC estimate [ADC units], rewritten by every
// EnergyEstimator::estimate() call so the next call starts converged.
// Channels are not owned; they must outlive the unit.
// ============================================================================

struct ChannelCalibration {
    float ratio    = 1.0f;   // raw -> physical scale
    float offset   = 0.0f;   // running DC offset
    float phaseCal = 1.0f;   // voltage channel only: sequential-read skew
};

struct PhaseUnit {
    uint16_t           id             = 0;
    SampleChannel*     currentChannel = nullptr;
    SampleChannel*     voltageChannel = nullptr;
    ChannelCalibration current;
    ChannelCalibration voltage;
    Reading            reading;

    PhaseSnapshot snapshot() const {
        PhaseSnapshot s;
        s.phaseId = id;
        s.reading = reading;
        return s;
    }

    void resetReading() { ::resetReading(reading); }
};

#endif // PHASE_UNIT_H
