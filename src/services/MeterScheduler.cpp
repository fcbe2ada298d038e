#include "services/MeterScheduler.h"
#include "system/Utils.h"

MeterScheduler::MeterScheduler(Clock& clock,
                               EnergyEstimator& estimator,
                               ShardStore& store,
                               PhaseUnit* units,
                               size_t unitCount,
                               const MeterSettings& settings)
    : _clock(clock),
      _estimator(estimator),
      _store(store),
      _units(units),
      _unitCount(units ? unitCount : 0),
      _snapshots(_unitCount)
{
    applySettings(settings);
}

void MeterScheduler::applySettings(const MeterSettings& settings) {
    _settings = settings;
    // Whole seconds, rounded up (never 0 for a non-zero period)
    _estimator.setSavePeriod((_settings.savePeriodMs + 999UL) / 1000UL);
}

// ============================================================================
// begin()
// ============================================================================

void MeterScheduler::begin() {
    DEBUGGSTART();
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTLN("#                 Starting Meter Scheduler                #");
    DEBUG_PRINTLN("###########################################################");
    DEBUG_PRINTF("[Meter] %u phase(s), %lu crossings, timeout %lu ms, save every %lu ms\n",
                 (unsigned)_unitCount,
                 (unsigned long)_settings.crossings,
                 (unsigned long)_settings.timeoutMs,
                 (unsigned long)_settings.savePeriodMs);
    DEBUGGSTOP();

    const StoreStatus st = _store.discover();
    _storeReady = (st == StoreStatus::Ok);
    _lastStatus = st;
    if (!_storeReady) {
        DEBUG_PRINTF("[Meter] Storage discovery failed: %s (sampling continues)\n",
                     storeStatusName(st));
    }

    _periodStartUs = _clock.micros();
}

// ============================================================================
// runCycle()
// ============================================================================

void MeterScheduler::runCycle() {
    for (size_t i = 0; i < _unitCount; ++i) {
        _estimator.estimate(_units[i], _settings.crossings, _settings.timeoutMs);
    }
    ++_cycles;

    if (periodElapsed()) {
        attemptSave();
    }
}

bool MeterScheduler::periodElapsed() const {
    const uint64_t elapsedUs = _clock.micros() - _periodStartUs;
    return elapsedUs >= static_cast<uint64_t>(_settings.savePeriodMs) * 1000ULL;
}

void MeterScheduler::attemptSave() {
    if (!_storeReady) {
        const StoreStatus st = _store.discover();
        if (st != StoreStatus::Ok) {
            recordFailure(st);
            return;
        }
        _storeReady = true;
    }

    for (size_t i = 0; i < _unitCount; ++i) {
        _snapshots[i] = _units[i].snapshot();
    }

    const StoreStatus st = _store.save(_snapshots.data(), _snapshots.size());
    if (st != StoreStatus::Ok) {
        recordFailure(st);
        return;
    }

    for (size_t i = 0; i < _unitCount; ++i) {
        _units[i].resetReading();
    }
    _periodStartUs = _clock.micros();
    _lastStatus    = st;
    _lastShard     = _store.activeShard();
    _failures      = 0;
    ++_saves;

    if (!_healthy) {
        DEBUG_PRINTLN("[Meter] Storage recovered");
        _healthy = true;
    }
    DEBUG_PRINTF("[Meter] Saved %u reading(s) to shard %lu\n",
                 (unsigned)_unitCount, (unsigned long)_lastShard);
}

void MeterScheduler::recordFailure(StoreStatus st) {
    _lastStatus = st;
    if (_failures < UINT32_MAX) ++_failures;

    DEBUG_PRINTF("[Meter] ERROR: save failed (%s), attempt %lu\n",
                 storeStatusName(st), (unsigned long)_failures);

    if (_healthy && _failures >= STORAGE_FAULT_THRESHOLD) {
        _healthy = false;
        DEBUG_PRINTF("[Meter] ERROR: storage unhealthy after %lu failed saves\n",
                     (unsigned long)_failures);
    }
}
