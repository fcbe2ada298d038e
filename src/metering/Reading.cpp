#include "metering/Reading.h"

Reading mergeReadings(const Reading& older, const Reading& newer) {
    Reading out;
    out.realPower_W      = (older.realPower_W      + newer.realPower_W)      / 2.0f;
    out.apparentPower_VA = (older.apparentPower_VA + newer.apparentPower_VA) / 2.0f;
    out.iRms_A           = (older.iRms_A           + newer.iRms_A)           / 2.0f;
    out.vRms_V           = (older.vRms_V           + newer.vRms_V)           / 2.0f;
    out.energy_kWh       = older.energy_kWh + newer.energy_kWh;
    out.timestampMs      = older.timestampMs;
    return out;
}

void resetReading(Reading& r) {
    r.realPower_W      = 0.0f;
    r.apparentPower_VA = 0.0f;
    r.iRms_A           = 0.0f;
    r.vRms_V           = 0.0f;
    r.energy_kWh       = 0.0f;
    r.timestampMs      = 0;
}
