/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef CONFIG_H
#define CONFIG_H

// Compile-time defaults and NVS keys shared by the metering core and the
// device glue. Nothing in here pulls in Arduino headers, so the core builds
// on the host for tests.

#include <stdint.h>

#define CONFIG_PARTITION               "ctmeter"   // NVS namespace name
#define DEVICE_SW_VERSION              "1.0.0"

// ==================================================
// Phase layout (build-time choice)
// ==================================================

#ifdef CTMETER_THREE_PHASE
#define AC_PHASE_COUNT                 3
#else
#define AC_PHASE_COUNT                 1
#endif

// ==================================================
// ADC front-end
// ==================================================

#define ADC_FULL_SCALE_MV              2450.0f     // 11 dB attenuation full scale [mV]
#define ADC_SUPPLY_VOLTAGE             3.3f        // Sensor bias supply [V]
#define ADC_SETTLE_BAND_LOW            0.45f       // Mid-scale band for the zero reference
#define ADC_SETTLE_BAND_HIGH           0.55f
#define OFFSET_FILTER_DIVISOR          512.0f      // DC offset low-pass time constant
#define NOISE_THRESHOLD                80.0f       // Max filtered step [mV] for min/max tracking

// ==================================================
// Sampling schedule
// ==================================================

#define DEFAULT_CROSSINGS              20          // Half-wavelengths integrated per estimate
#define DEFAULT_ESTIMATE_TIMEOUT_MS    2000        // Worst-case estimate duration
#define DEFAULT_SAVE_PERIOD_S          300         // Readings flushed to flash every 5 min
#define STORAGE_FAULT_THRESHOLD        3           // Consecutive failed saves before fault

// ==================================================
// Shard storage
// ==================================================

#define CT_STORAGE_ROOT                "/ct_readings"
#define DEFAULT_MAX_SHARD_SIZE         (64UL * 1024UL)  // Bytes per shard file
#define FS_MOUNT_POINT                 "/littlefs"
#define FS_PARTITION_LABEL             "spiffs"

// ==================================================
// Meter task
// ==================================================

#define METER_TASK_STACK_SIZE          6144
#define METER_TASK_PRIORITY            3
#define METER_TASK_CORE                1

// ==================================================
// NVS keys (max 15 chars)
// ==================================================

#define RESET_FLAG                     "RTFLG"     // Cleared once defaults are written
#define CROSSINGS_KEY                  "XCROS"     // int: crossing target
#define ESTIMATE_TIMEOUT_KEY           "ESTTO"     // int: estimate timeout [ms]
#define SAVE_PERIOD_KEY                "SVPER"     // int: save period [s]
#define MAX_SHARD_SIZE_KEY             "SHMAX"     // int: max shard size [bytes]

#define P1_ICAL_KEY                    "P1ICL"     // float: phase 1 current ratio
#define P1_VCAL_KEY                    "P1VCL"     // float: phase 1 voltage ratio
#define P1_PHASECAL_KEY                "P1PHC"     // float: phase 1 phase coefficient
#define P2_ICAL_KEY                    "P2ICL"
#define P2_VCAL_KEY                    "P2VCL"
#define P2_PHASECAL_KEY                "P2PHC"
#define P3_ICAL_KEY                    "P3ICL"
#define P3_VCAL_KEY                    "P3VCL"
#define P3_PHASECAL_KEY                "P3PHC"

#endif // CONFIG_H
