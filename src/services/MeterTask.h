/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef METER_TASK_H
#define METER_TASK_H

#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include "services/MeterScheduler.h"

// Runs MeterScheduler::runCycle() forever on its own pinned task.
class MeterTask {
public:
    explicit MeterTask(MeterScheduler& scheduler);

    bool start(uint32_t stackSize = METER_TASK_STACK_SIZE,
               UBaseType_t priority = METER_TASK_PRIORITY,
               BaseType_t core = METER_TASK_CORE);

private:
    static void taskThunk(void* param);
    void taskLoop();

    MeterScheduler& _scheduler;
    TaskHandle_t    _handle = nullptr;
};

#endif // METER_TASK_H
