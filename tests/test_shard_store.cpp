#include "TestSupport.h"
#include "storage/ShardStore.h"
#include "storage/ShardRecord.h"

static const char* ROOT = "/ct_readings";
static const uint8_t PHASES = 3;
static const size_t ARRAY = PHASES * ShardRecord::kSize;

static void fillSnapshots(PhaseSnapshot* snaps, float base) {
    for (uint8_t i = 0; i < PHASES; ++i) {
        snaps[i].phaseId                  = static_cast<uint16_t>(i + 1);
        snaps[i].reading.realPower_W      = base + i;
        snaps[i].reading.apparentPower_VA = base + i + 10.0f;
        snaps[i].reading.iRms_A           = 1.0f + i;
        snaps[i].reading.vRms_V           = 230.0f;
        snaps[i].reading.energy_kWh       = 0.01f * (i + 1);
        snaps[i].reading.timestampMs      = 1700000000000ULL + i;
    }
}

static void testEmptyRoot() {
    std::cout << "empty root: created, first save writes shard 1" << std::endl;
    MemoryShardFs fs;
    ShardStore store(fs, ROOT, 1000, PHASES);

    CHECK(store.discover() == StoreStatus::Ok);
    CHECK(fs.dirs.count(ROOT) == 1);
    CHECK(store.knownShards().empty());
    CHECK(store.activeShard() == 1);
    CHECK(fs.files.empty());

    PhaseSnapshot snaps[PHASES];
    fillSnapshots(snaps, 100.0f);
    CHECK(store.save(snaps, PHASES) == StoreStatus::Ok);
    CHECK(fs.files.count("/ct_readings/1") == 1);
    CHECK(fs.files["/ct_readings/1"].size() == ARRAY);
    CHECK(store.knownShards().count(1) == 1);

    // Records back to back, in phase order
    const std::vector<uint8_t>& data = fs.files["/ct_readings/1"];
    for (uint8_t i = 0; i < PHASES; ++i) {
        PhaseSnapshot out;
        CHECK(ShardRecord::decode(data.data() + i * ShardRecord::kSize,
                                  ShardRecord::kSize, out));
        CHECK(out.phaseId == i + 1);
        CHECK(out.reading.realPower_W == snaps[i].reading.realPower_W);
        CHECK(out.reading.timestampMs == snaps[i].reading.timestampMs);
    }
}

static void testExistingShards() {
    std::cout << "existing shards 1,2,5: newest is active" << std::endl;
    MemoryShardFs fs;
    fs.addDir(ROOT);
    fs.addFile("/ct_readings/1", 300);
    fs.addFile("/ct_readings/2", 300);
    fs.addFile("/ct_readings/5", 90);
    ShardStore store(fs, ROOT, 1000, PHASES);

    CHECK(store.discover() == StoreStatus::Ok);
    CHECK(store.activeShard() == 5);
    CHECK(store.knownShards() == std::set<uint32_t>({1, 2, 5}));

    PhaseSnapshot snaps[PHASES];
    fillSnapshots(snaps, 1.0f);
    CHECK(store.save(snaps, PHASES) == StoreStatus::Ok);
    CHECK(fs.files["/ct_readings/5"].size() == 90 + ARRAY);
    CHECK(fs.files["/ct_readings/1"].size() == 300);
    CHECK(fs.files.count("/ct_readings/6") == 0);
}

static void testRotationWhenFull() {
    std::cout << "rotation: shard at 99% moves to id + 1, old bytes untouched" << std::endl;
    MemoryShardFs fs;
    fs.addDir(ROOT);
    fs.addFile("/ct_readings/4", 990, 0x5A);
    ShardStore store(fs, ROOT, 1000, PHASES);
    CHECK(store.discover() == StoreStatus::Ok);
    CHECK(store.activeShard() == 4);

    const std::vector<uint8_t> before = fs.files["/ct_readings/4"];

    PhaseSnapshot snaps[PHASES];
    fillSnapshots(snaps, 2.0f);
    CHECK(store.save(snaps, PHASES) == StoreStatus::Ok);

    CHECK(store.activeShard() == 5);
    CHECK(store.knownShards().count(5) == 1);
    CHECK(fs.files["/ct_readings/4"] == before);
    CHECK(fs.files["/ct_readings/5"].size() == ARRAY);
}

static void testExactFitDoesNotRotate() {
    std::cout << "rotation: array that lands exactly on the limit stays" << std::endl;
    MemoryShardFs fs;
    fs.addDir(ROOT);
    fs.addFile("/ct_readings/1", 1000 - ARRAY);
    ShardStore store(fs, ROOT, 1000, PHASES);
    CHECK(store.discover() == StoreStatus::Ok);

    PhaseSnapshot snaps[PHASES];
    fillSnapshots(snaps, 3.0f);
    CHECK(store.save(snaps, PHASES) == StoreStatus::Ok);
    CHECK(store.activeShard() == 1);
    CHECK(fs.files["/ct_readings/1"].size() == 1000);
}

static void testSizeBoundOverManySaves() {
    std::cout << "bound: no shard passes the limit, ids strictly increase" << std::endl;
    MemoryShardFs fs;
    ShardStore store(fs, ROOT, 1000, PHASES);
    CHECK(store.discover() == StoreStatus::Ok);

    PhaseSnapshot snaps[PHASES];
    uint32_t lastId = store.activeShard();
    for (int k = 0; k < 60; ++k) {
        fillSnapshots(snaps, static_cast<float>(k));
        CHECK(store.save(snaps, PHASES) == StoreStatus::Ok);
        CHECK(store.activeShard() >= lastId);
        lastId = store.activeShard();
    }

    size_t total = 0;
    for (const auto& f : fs.files) {
        CHECK(f.second.size() <= 1000);
        CHECK(f.second.size() % ARRAY == 0);
        total += f.second.size();
    }
    CHECK(total == 60 * ARRAY);
    // 11 arrays fit in 1000 bytes
    CHECK(store.activeShard() == 6);
    CHECK(store.knownShards().size() == 6);
}

static void testOversizedArrayStillWrites() {
    std::cout << "bound: limit below one array still writes one array per shard" << std::endl;
    MemoryShardFs fs;
    ShardStore store(fs, ROOT, 50, PHASES);
    CHECK(store.discover() == StoreStatus::Ok);

    PhaseSnapshot snaps[PHASES];
    fillSnapshots(snaps, 1.0f);
    CHECK(store.save(snaps, PHASES) == StoreStatus::Ok);
    CHECK(store.save(snaps, PHASES) == StoreStatus::Ok);
    CHECK(fs.files["/ct_readings/1"].size() == ARRAY);
    CHECK(fs.files["/ct_readings/2"].size() == ARRAY);
}

static void testCorruptEntries() {
    std::cout << "discover: foreign entries are fatal" << std::endl;
    const char* bad[] = { "abc", "0", "007", "-3", "12.bin", "99999999999", "2147483648" };
    for (size_t k = 0; k < sizeof(bad) / sizeof(bad[0]); ++k) {
        MemoryShardFs fs;
        fs.addDir(ROOT);
        fs.addFile("/ct_readings/1", 90);
        fs.addFile(std::string("/ct_readings/") + bad[k], 10);
        ShardStore store(fs, ROOT, 1000, PHASES);

        CHECK(store.discover() == StoreStatus::CorruptShardEntry);
        CHECK(!store.isDiscovered());
        CHECK(store.knownShards().empty());
    }

    uint32_t id = 0;
    CHECK(ShardStore::parseShardId("2147483647", id) && id == 2147483647u);
    CHECK(ShardStore::parseShardId("42", id) && id == 42);
    CHECK(!ShardStore::parseShardId("", id));
    CHECK(!ShardStore::parseShardId(nullptr, id));
}

static void testRootFailures() {
    std::cout << "discover: unusable root" << std::endl;
    {
        MemoryShardFs fs;
        fs.addFile(ROOT, 4);
        ShardStore store(fs, ROOT, 1000, PHASES);
        CHECK(store.discover() == StoreStatus::RootUnavailable);
    }
    {
        MemoryShardFs fs;
        fs.addDir(ROOT);
        fs.faults.failList = true;
        ShardStore store(fs, ROOT, 1000, PHASES);
        CHECK(store.discover() == StoreStatus::RootUnavailable);
    }
    {
        MemoryShardFs fs;
        fs.faults.failCreateDir = true;
        ShardStore store(fs, ROOT, 1000, PHASES);
        CHECK(store.discover() == StoreStatus::RootUnavailable);
        CHECK(!store.isDiscovered());
    }
    {
        // Trailing slash names the same directory
        MemoryShardFs fs;
        fs.addDir(ROOT);
        fs.addFile("/ct_readings/3", 0);
        ShardStore store(fs, "/ct_readings/", 1000, PHASES);
        CHECK(store.discover() == StoreStatus::Ok);
        CHECK(store.activeShard() == 3);
        CHECK(store.shardPath(3) == "/ct_readings/3");
    }
}

static void testSaveFailures() {
    std::cout << "save: filesystem errors surface as status" << std::endl;
    PhaseSnapshot snaps[PHASES];
    fillSnapshots(snaps, 5.0f);

    {
        MemoryShardFs fs;
        fs.addDir(ROOT);
        fs.addFile("/ct_readings/1", 90);
        ShardStore store(fs, ROOT, 1000, PHASES);
        CHECK(store.discover() == StoreStatus::Ok);
        fs.faults.failStat = true;
        CHECK(store.save(snaps, PHASES) == StoreStatus::StatFailed);
        CHECK(fs.files["/ct_readings/1"].size() == 90);
    }
    {
        MemoryShardFs fs;
        ShardStore store(fs, ROOT, 1000, PHASES);
        CHECK(store.discover() == StoreStatus::Ok);
        fs.faults.failOpen = true;
        CHECK(store.save(snaps, PHASES) == StoreStatus::OpenFailed);
        CHECK(store.knownShards().empty());
    }
    {
        MemoryShardFs fs;
        ShardStore store(fs, ROOT, 1000, PHASES);
        CHECK(store.discover() == StoreStatus::Ok);
        fs.faults.shortWrite = 7;
        CHECK(store.save(snaps, PHASES) == StoreStatus::WriteFailed);
    }
    {
        MemoryShardFs fs;
        ShardStore store(fs, ROOT, 1000, PHASES);
        CHECK(store.discover() == StoreStatus::Ok);
        fs.faults.failFlush = true;
        CHECK(store.save(snaps, PHASES) == StoreStatus::FlushFailed);
        // The next attempt goes through once the fault clears
        fs.faults.failFlush = false;
        CHECK(store.save(snaps, PHASES) == StoreStatus::Ok);
    }
    {
        MemoryShardFs fs;
        fs.addDir(ROOT);
        fs.addDir("/ct_readings/2");
        ShardStore store(fs, ROOT, 1000, PHASES);
        CHECK(store.discover() == StoreStatus::Ok);
        CHECK(store.activeShard() == 2);
        CHECK(store.save(snaps, PHASES) == StoreStatus::StatFailed);
    }
    {
        MemoryShardFs fs;
        ShardStore store(fs, ROOT, 1000, PHASES);
        CHECK(store.discover() == StoreStatus::Ok);
        CHECK(store.save(snaps, PHASES - 1) == StoreStatus::PhaseCountMismatch);
        CHECK(store.save(nullptr, PHASES) == StoreStatus::PhaseCountMismatch);
        CHECK(fs.files.empty());
    }
}

static void testStatusNames() {
    std::cout << "status names" << std::endl;
    CHECK(std::string(storeStatusName(StoreStatus::Ok)) == "ok");
    CHECK(std::string(storeStatusName(StoreStatus::FlushFailed)) == "flush failed");
    CHECK(std::string(storeStatusName(StoreStatus::CorruptShardEntry)) == "corrupt shard entry");
}

int main() {
    std::cout << "Running ShardStore tests..." << std::endl;
    testEmptyRoot();
    testExistingShards();
    testRotationWhenFull();
    testExactFitDoesNotRotate();
    testSizeBoundOverManySaves();
    testOversizedArrayStillWrites();
    testCorruptEntries();
    testRootFailures();
    testSaveFailures();
    testStatusNames();
    return finish("test_shard_store");
}
