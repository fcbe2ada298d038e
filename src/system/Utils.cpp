/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/

#include "system/Utils.h"
#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <freertos/semphr.h>
#include <freertos/queue.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>

// ===================== Internal config =====================

// Max characters per queued line (including NUL).
#ifndef DBG_LINE_MAX
#define DBG_LINE_MAX        160
#endif

// Queue depth (lines are copied by value, no heap traffic per message).
#ifndef DBG_QUEUE_DEPTH
#define DBG_QUEUE_DEPTH     48
#endif

// Max bytes for a single grouped burst (static buffer, never reallocs).
#ifndef DBG_GROUP_MAX
#define DBG_GROUP_MAX       2048
#endif

static_assert(DBG_LINE_MAX >= 32,        "DBG_LINE_MAX too small");
static_assert(DBG_GROUP_MAX >= DBG_LINE_MAX,
              "DBG_GROUP_MAX must be >= DBG_LINE_MAX");

// ===================== Debug implementation =====================

namespace {

struct DebugLine {
    uint16_t len;
    char     text[DBG_LINE_MAX];
};

QueueHandle_t     s_dbgQ        = nullptr; // Queue of DebugLine (by value)
TaskHandle_t      s_dbgTask     = nullptr; // Background writer task
bool              s_started     = false;

// Grouping (atomic bursts)
SemaphoreHandle_t s_groupGate   = nullptr; // Recursive gate protecting group state
TaskHandle_t      s_groupOwner  = nullptr;
bool              s_groupActive = false;

static char   s_groupBuf[DBG_GROUP_MAX];
static size_t s_groupLen = 0;

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------

void writerTask_(void*) {
    DebugLine line;
    for (;;) {
        if (xQueueReceive(s_dbgQ, &line, portMAX_DELAY) == pdTRUE) {
            Serial.write(reinterpret_cast<const uint8_t*>(line.text), line.len);
        }
    }
}

// Push one chunk; if full, drop oldest (never block writers).
void enqueue_(const char* data, size_t n) {
    if (!s_dbgQ || n == 0) return;

    DebugLine line;
    if (n > DBG_LINE_MAX - 1) n = DBG_LINE_MAX - 1;
    memcpy(line.text, data, n);
    line.text[n] = '\0';
    line.len     = static_cast<uint16_t>(n);

    if (xQueueSend(s_dbgQ, &line, 0) == pdTRUE) return;

    DebugLine old;
    if (xQueueReceive(s_dbgQ, &old, 0) == pdTRUE) {
        (void)xQueueSend(s_dbgQ, &line, 0);   // still full: line is lost
    }
}

void ensureDebugStart_(unsigned long baud = SERIAL_BAUD_RATE) {
    if (s_started) return;

    if (!s_groupGate) {
        s_groupGate = xSemaphoreCreateRecursiveMutex();
    }
    if (!s_dbgQ) {
        s_dbgQ = xQueueCreate(DBG_QUEUE_DEPTH, sizeof(DebugLine));
    }
    if (!Serial) {
        Serial.begin(baud);
    }
    if (!s_dbgTask && s_dbgQ) {
        xTaskCreatePinnedToCore(writerTask_, "DebugPrintTask", 3072,
                                nullptr, 1, &s_dbgTask, tskNO_AFFINITY);
    }

    s_started = true;
}

void flushGroup_() {
    size_t offset = 0;
    while (offset < s_groupLen) {
        size_t slice = s_groupLen - offset;
        if (slice > DBG_LINE_MAX - 1) slice = DBG_LINE_MAX - 1;
        enqueue_(s_groupBuf + offset, slice);
        offset += slice;
    }
    s_groupLen = 0;
}

void groupAppend_(const char* data, size_t n) {
    while (n > 0) {
        size_t space = DBG_GROUP_MAX - s_groupLen;
        if (space == 0) {
            flushGroup_();
            space = DBG_GROUP_MAX;
        }
        const size_t chunk = (n < space) ? n : space;
        memcpy(s_groupBuf + s_groupLen, data, chunk);
        s_groupLen += chunk;
        data       += chunk;
        n          -= chunk;
    }
}

// Route text either into the caller's open group or straight to the queue.
void emit_(const char* s, bool nl) {
    ensureDebugStart_();
    if (!s) s = "";

    const size_t n = strnlen(s, DBG_LINE_MAX - 2);

    if (s_groupGate) xSemaphoreTakeRecursive(s_groupGate, portMAX_DELAY);

    if (s_groupActive && s_groupOwner == xTaskGetCurrentTaskHandle()) {
        groupAppend_(s, n);
        if (nl) groupAppend_("\n", 1);
    } else {
        char buf[DBG_LINE_MAX];
        memcpy(buf, s, n);
        size_t len = n;
        if (nl) buf[len++] = '\n';
        enqueue_(buf, len);
    }

    if (s_groupGate) xSemaphoreGiveRecursive(s_groupGate);
}

} // namespace (internal)


// ===================== Public Debug namespace =====================

namespace Debug {

void begin(unsigned long baud) {
    ensureDebugStart_(baud);
}

void print(const char* s)   { emit_(s, false); }
void println(const char* s) { emit_(s, true); }
void println()              { emit_("", true); }

void print(int32_t v) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%ld", static_cast<long>(v));
    emit_(buf, false);
}

void print(uint32_t v) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%lu", static_cast<unsigned long>(v));
    emit_(buf, false);
}

void print(float v, int digits) {
    if (digits < 0) digits = 0;
    if (digits > 8) digits = 8;
    char buf[32];
    snprintf(buf, sizeof(buf), "%.*f", digits, static_cast<double>(v));
    emit_(buf, false);
}

void println(int32_t v)           { print(v); emit_("", true); }
void println(uint32_t v)          { print(v); emit_("", true); }
void println(float v, int digits) { print(v, digits); emit_("", true); }

void printf(const char* fmt, ...) {
    char buf[DBG_LINE_MAX];
    va_list ap;
    va_start(ap, fmt);
    vsnprintf(buf, sizeof(buf), fmt ? fmt : "", ap);
    va_end(ap);
    emit_(buf, false);
}

void groupStart() {
    ensureDebugStart_();
    xSemaphoreTakeRecursive(s_groupGate, portMAX_DELAY);
    s_groupOwner  = xTaskGetCurrentTaskHandle();
    s_groupActive = true;
    s_groupLen    = 0;
}

void groupStop(bool addTrailingNewline) {
    ensureDebugStart_();
    if (addTrailingNewline) groupAppend_("\n", 1);
    flushGroup_();
    s_groupActive = false;
    s_groupOwner  = nullptr;
    xSemaphoreGiveRecursive(s_groupGate);
}

} // namespace Debug
