/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef NVS_MANAGER_H
#define NVS_MANAGER_H

#include <Arduino.h>
#include <Preferences.h>
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include "system/Config.h"
#include "system/Utils.h"

// ============================================================================
// NVS: thread-safe wrapper around ESP32 Preferences (namespace CONFIG_PARTITION)
// ============================================================================

class NVS {
public:
    static void Init();
    static NVS* Get();

    /**
     * @brief Open the namespace and make sure every meter key exists.
     *
     * First boot (reset flag set) writes all defaults; later boots only
     * add keys that are missing, keeping user overrides.
     */
    void begin();
    void end();

    bool getResetFlag();
    void initializeDefaults();
    void ensureMissingDefaults();

    int   GetInt  (const char* key, int defaultValue);
    float GetFloat(const char* key, float defaultValue);

    void PutBool (const char* key, bool value);
    void PutInt  (const char* key, int value);
    void PutFloat(const char* key, float value);

private:
    NVS();
    ~NVS();
    NVS(const NVS&) = delete;
    NVS& operator=(const NVS&) = delete;

    void ensureOpenRO_();
    void ensureOpenRW_();
    void lock_();
    void unlock_();

    static NVS*       s_instance;

    Preferences       preferences;
    const char*       namespaceName;
    SemaphoreHandle_t mutex_   = nullptr;
    bool              is_open_ = false;
    bool              open_rw_ = false;
};

#define CONF NVS::Get()

#endif // NVS_MANAGER_H
