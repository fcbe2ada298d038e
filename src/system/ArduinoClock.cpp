#include "system/ArduinoClock.h"
#include <Arduino.h>
#include <esp_timer.h>
#include <sys/time.h>

uint64_t ArduinoClock::micros() {
    return static_cast<uint64_t>(esp_timer_get_time());
}

uint64_t ArduinoClock::epochMs() {
    struct timeval tv;
    if (gettimeofday(&tv, nullptr) != 0 || tv.tv_sec < 0) {
        return 0;
    }
    return static_cast<uint64_t>(tv.tv_sec) * 1000ULL +
           static_cast<uint64_t>(tv.tv_usec / 1000);
}
