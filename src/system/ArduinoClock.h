/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef ARDUINO_CLOCK_H
#define ARDUINO_CLOCK_H

#include "system/Clock.h"

// esp_timer for elapsed time, system time (SNTP / settimeofday) for stamps.
class ArduinoClock : public Clock {
public:
    uint64_t micros() override;
    uint64_t epochMs() override;
};

#endif // ARDUINO_CLOCK_H
