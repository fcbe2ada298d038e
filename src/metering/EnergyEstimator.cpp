#include "metering/EnergyEstimator.h"
#include "system/Utils.h"
#include <math.h>

EnergyEstimator::EnergyEstimator(Clock& clock, const EstimatorSettings& settings)
    : _clock(clock),
      _settings(settings)
{
}

// ============================================================================
// settleReference()
//   - Poll V until it sits in the mid-scale band, or the settle budget runs out.
//   - A failed read keeps the previous value.
// ============================================================================

uint16_t EnergyEstimator::settleReference(SampleChannel& voltage,
                                          uint64_t startUs,
                                          uint64_t budgetUs,
                                          bool& settled)
{
    const float lowBand  = _settings.adcFullScale * ADC_SETTLE_BAND_LOW;
    const float highBand = _settings.adcFullScale * ADC_SETTLE_BAND_HIGH;

    uint16_t startV = 0;
    settled = false;

    for (;;) {
        uint16_t s = 0;
        if (voltage.read(s)) {
            startV = s;
        }

        const float v = static_cast<float>(startV);
        if (v > lowBand && v < highBand) {
            settled = true;
            break;
        }
        if ((_clock.micros() - startUs) >= budgetUs) {
            break;
        }
    }
    return startV;
}

// ============================================================================
// estimate()
// ============================================================================

EnergyEstimator::Result EnergyEstimator::estimate(PhaseUnit& unit,
                                                  uint32_t crossings,
                                                  uint32_t timeoutMs)
{
    Result res;

    if (unit.currentChannel == nullptr || unit.voltageChannel == nullptr) {
        DEBUG_PRINTF("[Estimator] Phase %u has no channels bound\n", (unsigned)unit.id);
        return res;
    }

    const uint64_t budgetUs    = static_cast<uint64_t>(timeoutMs) * 1000ULL;
    const uint64_t callStartUs = _clock.micros();

    // 1) Zero reference near mid-scale. Settling may use at most half the
    //    budget; without a reference the last voltage sample is used.
    const uint16_t startV = settleReference(*unit.voltageChannel, callStartUs,
                                            budgetUs / 2, res.settled);

    // 2) Main measurement loop
    float offsetI = unit.current.offset;
    float offsetV = unit.voltage.offset;

    uint16_t sampleI = 0;
    uint16_t sampleV = 0;
    float lastFilteredI = 0.0f;
    float lastFilteredV = 0.0f;

    uint16_t minI = UINT16_MAX, maxI = 0;
    uint16_t minV = UINT16_MAX, maxV = 0;

    double sumI = 0.0;
    double sumV = 0.0;
    double sumP = 0.0;

    bool     aboveRef  = false;
    uint32_t crossCount = 0;
    uint32_t n          = 0;

    const float phaseCal = unit.voltage.phaseCal;
    const float noise    = _settings.noiseThreshold;

    const uint64_t integStartUs = _clock.micros();

    while (crossCount < crossings &&
           (_clock.micros() - callStartUs) < budgetUs) {
        // A) Raw samples, stale value on a failed conversion
        uint16_t s = 0;
        if (unit.currentChannel->read(s)) sampleI = s;
        if (unit.voltageChannel->read(s)) sampleV = s;

        // B) Track and remove the DC bias
        offsetI += (static_cast<float>(sampleI) - offsetI) / OFFSET_FILTER_DIVISOR;
        const float filteredI = static_cast<float>(sampleI) - offsetI;

        offsetV += (static_cast<float>(sampleV) - offsetV) / OFFSET_FILTER_DIVISOR;
        const float filteredV = static_cast<float>(sampleV) - offsetV;

        // Spikes stay out of the min/max used for the offset refinement
        if (fabsf(lastFilteredV - filteredV) < noise) {
            if (sampleV < minV) minV = sampleV;
            if (sampleV > maxV) maxV = sampleV;
        }
        if (fabsf(lastFilteredI - filteredI) < noise) {
            if (sampleI < minI) minI = sampleI;
            if (sampleI > maxI) maxI = sampleI;
        }

        // C) RMS accumulators
        sumV += static_cast<double>(filteredV) * filteredV;
        sumI += static_cast<double>(filteredI) * filteredI;

        // D) Interpolate V to the instant I was taken, then power
        const float shiftedV = lastFilteredV + phaseCal * (filteredV - lastFilteredV);
        sumP += static_cast<double>(shiftedV) * filteredI;

        // E) Count reference crossings (two per wavelength)
        const bool above = sampleV > startV;
        if (n > 0 && above != aboveRef) {
            ++crossCount;
        }
        aboveRef = above;

        ++n;
        lastFilteredV = filteredV;
        lastFilteredI = filteredI;
    }

    const uint64_t integEndUs = _clock.micros();

    res.samples    = n;
    res.crossings  = crossCount;
    res.durationMs = static_cast<uint32_t>((integEndUs - integStartUs) / 1000ULL);
    res.timedOut   = crossCount < crossings;

    // 3) Better midpoint for the next call
    if (minI <= maxI) {
        offsetI = (offsetI + (static_cast<float>(minI) + static_cast<float>(maxI)) / 2.0f) / 2.0f;
    }
    if (minV <= maxV) {
        offsetV = (offsetV + (static_cast<float>(minV) + static_cast<float>(maxV)) / 2.0f) / 2.0f;
    }
    unit.current.offset = offsetI;
    unit.voltage.offset = offsetV;

    // 4) Scale to physical units
    const float adcToVolts = _settings.supplyVoltage / _settings.adcFullScale;
    const float vRatio = unit.voltage.ratio * adcToVolts;
    const float iRatio = unit.current.ratio * adcToVolts;

    Reading fresh;
    if (n > 0) {
        const double count = static_cast<double>(n);
        fresh.vRms_V      = vRatio * static_cast<float>(sqrt(sumV / count));
        fresh.iRms_A      = iRatio * static_cast<float>(sqrt(sumI / count));
        fresh.realPower_W = fabsf(vRatio * iRatio * static_cast<float>(sumP / count));
        fresh.apparentPower_VA = fresh.vRms_V * fresh.iRms_A;
    }

    if (_settings.savePeriodS > 0) {
        const float elapsedS = static_cast<float>(integEndUs - integStartUs) / 1000000.0f;
        fresh.energy_kWh = fresh.realPower_W * elapsedS /
                           static_cast<float>(_settings.savePeriodS);
    }
    fresh.timestampMs = _clock.epochMs();

    res.reading = fresh;

    Reading merged    = mergeReadings(unit.reading, fresh);
    merged.timestampMs = fresh.timestampMs;
    unit.reading      = merged;

    DEBUGGSTART();
    DEBUG_PRINTF("[Estimator] Phase %u: offsets I=%.1f V=%.1f\n",
                 (unsigned)unit.id, (double)offsetI, (double)offsetV);
    DEBUG_PRINTF("[Estimator] Phase %u: n=%lu crossings=%lu dur=%lu ms\n",
                 (unsigned)unit.id,
                 (unsigned long)res.samples,
                 (unsigned long)res.crossings,
                 (unsigned long)res.durationMs);
    if (!res.settled) {
        DEBUG_PRINTF("[Estimator] Phase %u: no mid-scale reference, using %u\n",
                     (unsigned)unit.id, (unsigned)startV);
    }
    if (res.timedOut) {
        DEBUG_PRINTF("[Estimator] Phase %u: timeout after %lu/%lu crossings\n",
                     (unsigned)unit.id,
                     (unsigned long)res.crossings,
                     (unsigned long)crossings);
    }
    DEBUGGSTOP();

    return res;
}
