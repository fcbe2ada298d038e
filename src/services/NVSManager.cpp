#include "services/NVSManager.h"
#include "app/PhaseMap.h"

// ======================================================
// Static singleton pointer
// ======================================================
NVS* NVS::s_instance = nullptr;


// ======================================================
// Singleton Init() and Get()
// ======================================================
void NVS::Init() {
    (void)NVS::Get();
}

NVS* NVS::Get() {
    if (!s_instance) {
        s_instance = new NVS();
    }
    return s_instance;
}


// ======================================================
// ctor / dtor
// ======================================================
NVS::NVS()
: namespaceName(CONFIG_PARTITION) {
    mutex_ = xSemaphoreCreateRecursiveMutex();
}

NVS::~NVS() {
    end();
    if (mutex_) {
        vSemaphoreDelete(mutex_);
        mutex_ = nullptr;
    }
}


// ======================================================
// locking helpers
// ======================================================
void NVS::lock_()   { if (mutex_) xSemaphoreTakeRecursive(mutex_, portMAX_DELAY); }
void NVS::unlock_() { if (mutex_) xSemaphoreGiveRecursive(mutex_); }


// ======================================================
// Preferences open state helpers
// - Lazy open RO or RW
// - RO -> RW reopens the namespace
// ======================================================
void NVS::ensureOpenRO_() {
    if (!is_open_) {
        preferences.begin(namespaceName, /*readOnly=*/true);
        is_open_ = true;
        open_rw_ = false;
    }
}

void NVS::ensureOpenRW_() {
    if (!is_open_) {
        preferences.begin(namespaceName, /*readOnly=*/false);
        is_open_ = true;
        open_rw_ = true;
    } else if (!open_rw_) {
        preferences.end();
        preferences.begin(namespaceName, /*readOnly=*/false);
        is_open_ = true;
        open_rw_ = true;
    }
}

void NVS::end() {
    lock_();
    if (is_open_) {
        preferences.end();
        is_open_ = false;
        open_rw_ = false;
    }
    unlock_();
}


// ======================================================
// begin()
/*
   Usage at startup:
       NVS::Init();
       CONF->begin();
*/
// ======================================================
void NVS::begin() {
    DEBUGGSTART();
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTLN("#                 Starting NVS Manager                    #");
    DEBUG_PRINTLN("###########################################################");
    DEBUGGSTOP();

    if (getResetFlag()) {
        DEBUG_PRINTLN("[NVS] First boot, writing meter defaults");
        initializeDefaults();
    } else {
        DEBUG_PRINTLN("[NVS] Using existing configuration...");
        ensureMissingDefaults();
    }
}

bool NVS::getResetFlag() {
    lock_();
    ensureOpenRO_();
    bool v = preferences.getBool(RESET_FLAG, true);
    unlock_();
    return v;
}

void NVS::initializeDefaults() {
    PutInt(CROSSINGS_KEY,        DEFAULT_CROSSINGS);
    PutInt(ESTIMATE_TIMEOUT_KEY, DEFAULT_ESTIMATE_TIMEOUT_MS);
    PutInt(SAVE_PERIOD_KEY,      DEFAULT_SAVE_PERIOD_S);
    PutInt(MAX_SHARD_SIZE_KEY,   static_cast<int>(DEFAULT_MAX_SHARD_SIZE));

    for (size_t i = 0; i < AC_PHASE_COUNT; ++i) {
        const PhasePins& p = PHASE_MAP[i];
        PutFloat(p.iCalKey,     p.iCal);
        PutFloat(p.vCalKey,     p.vCal);
        PutFloat(p.phaseCalKey, p.phaseCal);
    }

    // Last, so an interrupted first boot starts over
    PutBool(RESET_FLAG, false);
}

void NVS::ensureMissingDefaults() {
    lock_();
    ensureOpenRW_();

    auto ensureBool = [&](const char* key, bool value) {
        if (!preferences.isKey(key)) preferences.putBool(key, value);
    };
    auto ensureInt = [&](const char* key, int value) {
        if (!preferences.isKey(key)) preferences.putInt(key, value);
    };
    auto ensureFloat = [&](const char* key, float value) {
        if (!preferences.isKey(key)) preferences.putFloat(key, value);
    };

    ensureBool(RESET_FLAG, false);

    ensureInt(CROSSINGS_KEY,        DEFAULT_CROSSINGS);
    ensureInt(ESTIMATE_TIMEOUT_KEY, DEFAULT_ESTIMATE_TIMEOUT_MS);
    ensureInt(SAVE_PERIOD_KEY,      DEFAULT_SAVE_PERIOD_S);
    ensureInt(MAX_SHARD_SIZE_KEY,   static_cast<int>(DEFAULT_MAX_SHARD_SIZE));

    for (size_t i = 0; i < AC_PHASE_COUNT; ++i) {
        const PhasePins& p = PHASE_MAP[i];
        ensureFloat(p.iCalKey,     p.iCal);
        ensureFloat(p.vCalKey,     p.vCal);
        ensureFloat(p.phaseCalKey, p.phaseCal);
    }

    unlock_();
}


// ======================================================
// Getters / setters
// ======================================================
int NVS::GetInt(const char* key, int defaultValue) {
    lock_();
    ensureOpenRO_();
    int v = preferences.getInt(key, defaultValue);
    unlock_();
    return v;
}

float NVS::GetFloat(const char* key, float defaultValue) {
    lock_();
    ensureOpenRO_();
    float v = preferences.getFloat(key, defaultValue);
    unlock_();
    return v;
}

void NVS::PutBool(const char* key, bool value) {
    lock_();
    ensureOpenRW_();
    if (preferences.isKey(key)) preferences.remove(key);
    preferences.putBool(key, value);
    unlock_();
}

void NVS::PutInt(const char* key, int value) {
    lock_();
    ensureOpenRW_();
    if (preferences.isKey(key)) preferences.remove(key);
    preferences.putInt(key, value);
    unlock_();
}

void NVS::PutFloat(const char* key, float value) {
    lock_();
    ensureOpenRW_();
    if (preferences.isKey(key)) preferences.remove(key);
    preferences.putFloat(key, value);
    unlock_();
}
