/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef ENERGY_ESTIMATOR_H
#define ENERGY_ESTIMATOR_H

#include <stdint.h>
#include "system/Config.h"
#include "system/Clock.h"
#include "metering/PhaseUnit.h"

// ============================================================================
// Zero-cross gated V/I estimator
// ============================================================================
//
// One estimate() call:
//  1. Settle: poll the voltage channel until it sits in the mid-scale band
//     (45%..55% of full scale); that sample is the crossing reference.
//  2. Integrate: sample I and V pairs until the voltage has crossed the
//     reference `crossings` times or the timeout expires. DC offsets are
//     tracked with a 1/512 low-pass, V is phase-shifted toward I before the
//     power product.
//  3. Finalize: refine offsets with the min/max midpoint, scale to RMS,
//     real/apparent power and an energy increment over the time spent.
//
// The timeout covers the whole call (settle + integrate), so a dead sensor
// costs at most `timeoutMs` plus one sample pair. Settling is capped at half
// the timeout; a biased waveform that never reaches the band is still
// integrated against the last voltage sample. No yielding inside the
// sampling window.
// ============================================================================

struct EstimatorSettings {
    float    adcFullScale   = ADC_FULL_SCALE_MV;
    float    supplyVoltage  = ADC_SUPPLY_VOLTAGE;
    float    noiseThreshold = NOISE_THRESHOLD;
    uint32_t savePeriodS    = DEFAULT_SAVE_PERIOD_S;
};

class EnergyEstimator {
public:
    struct Result {
        Reading  reading;          ///< this call's estimate (not merged)
        uint32_t samples    = 0;   ///< I/V pairs integrated
        uint32_t crossings  = 0;   ///< reference crossings seen
        uint32_t durationMs = 0;   ///< integration time
        bool     settled    = false;
        bool     timedOut   = false;
    };

    explicit EnergyEstimator(Clock& clock,
                             const EstimatorSettings& settings = EstimatorSettings());

    /**
     * @brief Run one bounded sampling window on @p unit.
     *
     * Updates unit.current.offset / unit.voltage.offset and merges the
     * fresh reading into unit.reading (timestamp taken from the fresh one).
     */
    Result estimate(PhaseUnit& unit, uint32_t crossings, uint32_t timeoutMs);

    void setSavePeriod(uint32_t savePeriodS) { _settings.savePeriodS = savePeriodS; }
    const EstimatorSettings& settings() const { return _settings; }

private:
    uint16_t settleReference(SampleChannel& voltage,
                             uint64_t startUs,
                             uint64_t budgetUs,
                             bool& settled);

    Clock&            _clock;
    EstimatorSettings _settings;
};

#endif // ENERGY_ESTIMATOR_H
