/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef ADC_CHANNEL_H
#define ADC_CHANNEL_H

#include "sensing/SampleChannel.h"
#include "system/Config.h"

// ============================================================================
// ESP32 ADC1 input read in calibrated millivolts (11 dB attenuation).
// ============================================================================
//
// Notes:
//  - Only ADC1 pins may be used (ADC2 is shared with Wi-Fi).
//  - A conversion above ADC_FULL_SCALE_MV is reported as a failed read.
// ============================================================================

class AdcChannel : public SampleChannel {
public:
    explicit AdcChannel(uint8_t pin);

    // Configure pin mode and attenuation.
    void begin();

    bool read(uint16_t& out) override;

private:
    uint8_t _pin;
};

#endif // ADC_CHANNEL_H
