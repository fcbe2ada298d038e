#include "sensing/AdcChannel.h"
#include "system/Utils.h"
#include <Arduino.h>

AdcChannel::AdcChannel(uint8_t pin)
    : _pin(pin)
{
}

// ============================================================================
// begin()
//   - 12-bit resolution, 11 dB attenuation (0..~2.45 V calibrated range)
// ============================================================================

void AdcChannel::begin() {
    pinMode(_pin, INPUT);
    analogReadResolution(12);
    analogSetPinAttenuation(_pin, ADC_11db);

    DEBUG_PRINTF("[AdcChannel] GPIO %u ready (11 dB, full scale %.0f mV)\n",
                 (unsigned)_pin, (double)ADC_FULL_SCALE_MV);
}

// ============================================================================
// read()
//   - Single conversion, eFuse-calibrated millivolts.
// ============================================================================

bool AdcChannel::read(uint16_t& out) {
    const uint32_t mv = analogReadMilliVolts(_pin);
    if (mv > static_cast<uint32_t>(ADC_FULL_SCALE_MV)) {
        return false;
    }
    out = static_cast<uint16_t>(mv);
    return true;
}
