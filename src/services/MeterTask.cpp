#include "services/MeterTask.h"
#include "system/Utils.h"

MeterTask::MeterTask(MeterScheduler& scheduler)
    : _scheduler(scheduler)
{
}

bool MeterTask::start(uint32_t stackSize, UBaseType_t priority, BaseType_t core) {
    if (_handle != nullptr) {
        DEBUG_PRINTLN("[Meter] Task already running");
        return true;
    }

    BaseType_t result = xTaskCreatePinnedToCore(
        MeterTask::taskThunk,
        "MeterTask",
        stackSize,
        this,
        priority,
        &_handle,
        core
    );

    if (result != pdPASS) {
        DEBUG_PRINTLN("[Meter] Failed to create MeterTask");
        _handle = nullptr;
        return false;
    }
    return true;
}

void MeterTask::taskThunk(void* param) {
    auto* self = static_cast<MeterTask*>(param);
    if (self) {
        self->taskLoop();
    }
    vTaskDelete(nullptr);
}

void MeterTask::taskLoop() {
    DEBUG_PRINTLN("[Meter] Task started");
    for (;;) {
        _scheduler.runCycle();
        vTaskDelay(1);   // let IDLE feed the watchdog between windows
    }
}
