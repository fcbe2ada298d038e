#include <Arduino.h>
#include <FS.h>
#include <LittleFS.h>
#include "system/Config.h"
#include "system/Utils.h"

// **************************************************************
//                       Module Includes
// **************************************************************
#include "app/PhaseMap.h"
#include "system/ArduinoClock.h"
#include "sensing/AdcChannel.h"
#include "metering/EnergyEstimator.h"
#include "storage/FsShardFs.h"
#include "storage/ShardStore.h"
#include "services/NVSManager.h"
#include "services/MeterScheduler.h"
#include "services/MeterTask.h"

// **************************************************************
//                   Global Object Pointers
// **************************************************************

ArduinoClock    clockSrc;
PhaseUnit       phases[AC_PHASE_COUNT];
AdcChannel*     currentChannels[AC_PHASE_COUNT] = {};
AdcChannel*     voltageChannels[AC_PHASE_COUNT] = {};

FsShardFs*       shardFs   = nullptr;
ShardStore*      store     = nullptr;
EnergyEstimator* estimator = nullptr;
MeterScheduler*  scheduler = nullptr;
MeterTask*       meterTask = nullptr;

// Non-positive NVS values fall back to the compile-time default.
static uint32_t confU32(const char* key, uint32_t fallback) {
  const int v = CONF->GetInt(key, static_cast<int>(fallback));
  return (v > 0) ? static_cast<uint32_t>(v) : fallback;
}

// **************************************************************
//                           setup()
// **************************************************************
void setup() {
  // --------------------------------------------------
  // 1) Debug / Diagnostics FIRST
  // --------------------------------------------------
  Debug::begin(SERIAL_BAUD_RATE);
  DEBUG_PRINTLN();
  DEBUG_PRINTLN("==================================================");
  DEBUG_PRINTF("[Setup] CT meter boot, fw %s, %u phase(s)\n",
               DEVICE_SW_VERSION, (unsigned)AC_PHASE_COUNT);
  DEBUG_PRINTLN("==================================================");

  // --------------------------------------------------
  // 2) Filesystem
  //    A failed mount is not fatal: sampling still runs and the
  //    scheduler reports storage as unhealthy.
  // --------------------------------------------------
  DEBUG_PRINTLN("[Setup] Mounting LittleFS...");
  if (!LittleFS.begin(true, FS_MOUNT_POINT, 10, FS_PARTITION_LABEL)) {
    DEBUG_PRINTLN("[Setup] ERROR: LittleFS mount failed");
  } else {
    DEBUG_PRINTF("[Setup] LittleFS mounted, %lu/%lu bytes used\n",
                 (unsigned long)LittleFS.usedBytes(),
                 (unsigned long)LittleFS.totalBytes());
  }

  // --------------------------------------------------
  // 3) Persistent config
  // --------------------------------------------------
  NVS::Init();
  CONF->begin();

  MeterSettings settings;
  settings.crossings    = confU32(CROSSINGS_KEY, DEFAULT_CROSSINGS);
  settings.timeoutMs    = confU32(ESTIMATE_TIMEOUT_KEY, DEFAULT_ESTIMATE_TIMEOUT_MS);
  settings.savePeriodMs = confU32(SAVE_PERIOD_KEY, DEFAULT_SAVE_PERIOD_S) * 1000UL;
  const uint32_t maxShardBytes = confU32(MAX_SHARD_SIZE_KEY, DEFAULT_MAX_SHARD_SIZE);

  DEBUG_PRINTLN("[Setup] NVS config loaded.");

  // --------------------------------------------------
  // 4) Phase units from the board table (+ NVS calibration)
  // --------------------------------------------------
  for (size_t i = 0; i < AC_PHASE_COUNT; ++i) {
    const PhasePins& p = PHASE_MAP[i];

    currentChannels[i] = new AdcChannel(p.currentPin);
    voltageChannels[i] = new AdcChannel(p.voltagePin);
    currentChannels[i]->begin();
    voltageChannels[i]->begin();

    PhaseUnit& u        = phases[i];
    u.id                = p.id;
    u.currentChannel    = currentChannels[i];
    u.voltageChannel    = voltageChannels[i];
    u.current.ratio     = CONF->GetFloat(p.iCalKey, p.iCal);
    u.current.offset    = p.offsetI;
    u.voltage.ratio     = CONF->GetFloat(p.vCalKey, p.vCal);
    u.voltage.phaseCal  = CONF->GetFloat(p.phaseCalKey, p.phaseCal);
    u.voltage.offset    = p.offsetV;

    DEBUG_PRINTF("[Setup] Phase %u: I=GPIO%u (x%.2f) V=GPIO%u (x%.2f) phaseCal=%.2f\n",
                 (unsigned)u.id,
                 (unsigned)p.currentPin, (double)u.current.ratio,
                 (unsigned)p.voltagePin, (double)u.voltage.ratio,
                 (double)u.voltage.phaseCal);
  }

  // --------------------------------------------------
  // 5) Estimator + storage + scheduler
  // --------------------------------------------------
  estimator = new EnergyEstimator(clockSrc);
  shardFs   = new FsShardFs(LittleFS);
  store     = new ShardStore(*shardFs, CT_STORAGE_ROOT, maxShardBytes, AC_PHASE_COUNT);
  scheduler = new MeterScheduler(clockSrc, *estimator, *store,
                                 phases, AC_PHASE_COUNT, settings);
  scheduler->begin();

  // --------------------------------------------------
  // 6) Meter task (LAST)
  // --------------------------------------------------
  meterTask = new MeterTask(*scheduler);
  if (!meterTask->start()) {
    DEBUG_PRINTLN("[Setup] ERROR: meter task not started");
  }

  DEBUG_PRINTLN("==================================================");
  DEBUG_PRINTLN("[Setup] Boot sequence complete.");
  DEBUG_PRINTLN("==================================================");
}

// **************************************************************
//                            loop()
// **************************************************************
void loop() {
  // Sampling runs on MeterTask; loop stays lightweight.
  vTaskDelay(pdMS_TO_TICKS(1000));
}
