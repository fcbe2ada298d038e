/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef METER_SCHEDULER_H
#define METER_SCHEDULER_H

#include <stddef.h>
#include <stdint.h>
#include <vector>
#include "system/Config.h"
#include "system/Clock.h"
#include "metering/EnergyEstimator.h"
#include "storage/ShardStore.h"

// ============================================================================
// Meter scheduler
// ============================================================================
//
// Drives the estimate/save cycle for all phases:
//   - every cycle: estimate each phase in order, merging into its Reading
//   - once per save period: snapshot all phases and append them to the store
//       success -> reset every Reading, start a new period
//       failure -> keep accumulating, retry on the next cycle
//
// Keeping the readings after a failed save is deliberate: a storage fault
// never discards a period's energy.
//
// A store whose discovery failed is re-discovered before each save attempt.
// After STORAGE_FAULT_THRESHOLD consecutive failures storage is unhealthy
// until the next successful save.
// ============================================================================

struct MeterSettings {
    uint32_t crossings    = DEFAULT_CROSSINGS;
    uint32_t timeoutMs    = DEFAULT_ESTIMATE_TIMEOUT_MS;
    uint32_t savePeriodMs = DEFAULT_SAVE_PERIOD_S * 1000UL;
};

class MeterScheduler {
public:
    MeterScheduler(Clock& clock,
                   EnergyEstimator& estimator,
                   ShardStore& store,
                   PhaseUnit* units,
                   size_t unitCount,
                   const MeterSettings& settings = MeterSettings());

    void begin();
    void runCycle();

    // Also pushes the save period to the estimator's energy scaling.
    void applySettings(const MeterSettings& settings);
    const MeterSettings& settings() const { return _settings; }

    bool        storageReady() const        { return _storeReady; }
    bool        storageHealthy() const      { return _healthy; }
    uint32_t    consecutiveFailures() const { return _failures; }
    uint32_t    savesCompleted() const      { return _saves; }
    uint32_t    cyclesCompleted() const     { return _cycles; }
    uint32_t    lastSavedShard() const      { return _lastShard; }
    StoreStatus lastStatus() const          { return _lastStatus; }

private:
    bool periodElapsed() const;
    void attemptSave();
    void recordFailure(StoreStatus st);

    Clock&           _clock;
    EnergyEstimator& _estimator;
    ShardStore&      _store;
    PhaseUnit*       _units;
    size_t           _unitCount;
    MeterSettings    _settings;

    std::vector<PhaseSnapshot> _snapshots;

    uint64_t    _periodStartUs = 0;
    bool        _storeReady    = false;
    bool        _healthy       = true;
    uint32_t    _failures      = 0;
    uint32_t    _saves         = 0;
    uint32_t    _cycles        = 0;
    uint32_t    _lastShard     = 0;
    StoreStatus _lastStatus    = StoreStatus::Ok;
};

#endif // METER_SCHEDULER_H
