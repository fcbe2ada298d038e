/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef CLOCK_H
#define CLOCK_H

#include <stdint.h>

/**
 * @brief Time source used by the estimator and the meter scheduler.
 *
 *  - micros():  monotonic counter for timeout / elapsed checks.
 *  - epochMs(): wall clock for reading timestamps (0 until time is set).
 */
class Clock {
public:
    virtual ~Clock() {}

    virtual uint64_t micros() = 0;
    virtual uint64_t epochMs() = 0;
};

#endif // CLOCK_H
