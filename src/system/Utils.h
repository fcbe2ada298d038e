/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/

#ifndef UTILS_H
#define UTILS_H

/**
 * @file Utils.h
 * @brief Non-blocking debug printing for the meter firmware.
 *
 * Provides:
 *  - Thread-safe debug output via a background task + queue (device build).
 *  - Atomic "grouped" printing (Debug::groupStart/Stop/Cancel).
 *
 * The declarations use plain C types only so the metering core can include
 * this header on any target. Host builds set DEBUGMODE=0 and never link the
 * implementation.
 */

#include <stdint.h>
#include <stddef.h>

// ===================== Global debug switch =====================

#ifndef DEBUGMODE
#define DEBUGMODE true          ///< Compile-time enable/disable debug output
#endif

#ifndef SERIAL_BAUD_RATE
#define SERIAL_BAUD_RATE 921600 ///< Default Serial baud rate for Debug::begin()
#endif

// ===================== Thread-safe debug API =====================

namespace Debug {
    // Initialization (usually auto-called on first print)
    void begin(unsigned long baud = SERIAL_BAUD_RATE);

    void print(const char* s);
    void println(const char* s);
    void println();                                 // blank line

    void print(int32_t v);
    void print(uint32_t v);
    void print(float v, int digits = 3);
    void println(int32_t v);
    void println(uint32_t v);
    void println(float v, int digits = 3);

    // printf-style
    void printf(const char* fmt, ...);

    // ===== Grouped printing (atomic burst) =====

    /**
     * @brief Start a grouped print section.
     *
     * The calling task becomes the owner; subsequent Debug::print* from this
     * task will append into an internal static buffer until groupStop.
     */
    void groupStart();

    /**
     * @brief Flush grouped content as a contiguous burst and release ownership.
     * @param addTrailingNewline If true, appends a newline after the group.
     */
    void groupStop(bool addTrailingNewline = false);
}

// ===================== Debug macros =====================

#if DEBUGMODE

    #define DEBUG_PRINT(...)      Debug::print(__VA_ARGS__)
    #define DEBUG_PRINTLN(...)    Debug::println(__VA_ARGS__)
    #define DEBUG_PRINTF(...)     Debug::printf(__VA_ARGS__)

    #ifndef DEBUGGSTART
    #define DEBUGGSTART()         Debug::groupStart()
    #endif

    #ifndef DEBUGGSTOP
    #define DEBUGGSTOP()          Debug::groupStop(false)
    #endif

#else

    #define DEBUG_PRINT(...)      do {} while (0)
    #define DEBUG_PRINTLN(...)    do {} while (0)
    #define DEBUG_PRINTF(...)     do {} while (0)
    #define DEBUGGSTART()         do {} while (0)
    #define DEBUGGSTOP()          do {} while (0)

#endif // DEBUGMODE

#endif // UTILS_H
