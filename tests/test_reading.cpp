#include "TestSupport.h"
#include "metering/Reading.h"
#include "metering/PhaseUnit.h"

static Reading makeReading(float p, float s, float i, float v, float e, uint64_t ts) {
    Reading r;
    r.realPower_W      = p;
    r.apparentPower_VA = s;
    r.iRms_A           = i;
    r.vRms_V           = v;
    r.energy_kWh       = e;
    r.timestampMs      = ts;
    return r;
}

static void testMergeAveragesAndSums() {
    std::cout << "merge: averages RMS/power, sums energy" << std::endl;
    const Reading a = makeReading(100.0f, 120.0f, 0.5f, 230.0f, 0.010f, 1000);
    const Reading b = makeReading(300.0f, 320.0f, 1.5f, 234.0f, 0.020f, 2000);

    const Reading m = mergeReadings(a, b);
    CHECK(m.realPower_W == 200.0f);
    CHECK(m.apparentPower_VA == 220.0f);
    CHECK(m.iRms_A == 1.0f);
    CHECK(m.vRms_V == 232.0f);
    CHECK(m.energy_kWh == 0.010f + 0.020f);
    CHECK(m.timestampMs == 1000);
}

static void testEnergyOverManyMerges() {
    std::cout << "merge: energy after N merges equals the sum of increments" << std::endl;
    Reading acc;
    float expected = 0.0f;
    for (int i = 1; i <= 50; ++i) {
        const float inc = 0.001f * static_cast<float>(i);
        acc = mergeReadings(acc, makeReading(10.0f * i, 11.0f * i, 0.1f, 230.0f, inc, i));
        expected += inc;
    }
    CHECK(acc.energy_kWh == expected);
}

static void testResetZeroesEverything() {
    std::cout << "reset: every field exactly zero" << std::endl;
    PhaseUnit u;
    u.id = 2;
    u.reading = makeReading(1.0f, 2.0f, 3.0f, 4.0f, 5.0f, 6);
    u.current.offset = 1066.0f;
    u.resetReading();

    CHECK(u.reading.realPower_W == 0.0f);
    CHECK(u.reading.apparentPower_VA == 0.0f);
    CHECK(u.reading.iRms_A == 0.0f);
    CHECK(u.reading.vRms_V == 0.0f);
    CHECK(u.reading.energy_kWh == 0.0f);
    CHECK(u.reading.timestampMs == 0);
    // Calibration survives a period reset
    CHECK(u.current.offset == 1066.0f);

    const PhaseSnapshot s = u.snapshot();
    CHECK(s.phaseId == 2);
    CHECK(s.reading.energy_kWh == 0.0f);
}

int main() {
    std::cout << "Running Reading tests..." << std::endl;
    testMergeAveragesAndSums();
    testEnergyOverManyMerges();
    testResetZeroesEverything();
    return finish("test_reading");
}
