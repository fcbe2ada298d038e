/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef SAMPLE_CHANNEL_H
#define SAMPLE_CHANNEL_H

#include <stdint.h>

/**
 * @brief One sampleable analog input (a CT or a voltage divider tap).
 *
 * read() returns false on a failed conversion; the caller decides whether to
 * reuse the previous value. Values are raw ADC units in 0..full scale.
 */
class SampleChannel {
public:
    virtual ~SampleChannel() {}

    virtual bool read(uint16_t& out) = 0;
};

#endif // SAMPLE_CHANNEL_H
