/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef SHARD_STORE_H
#define SHARD_STORE_H

#include <stddef.h>
#include <stdint.h>
#include <set>
#include <string>
#include "storage/ShardFs.h"
#include "metering/Reading.h"

// ============================================================================
// Rotating append-only record storage
// ============================================================================
//
// Files live directly under the storage root and are named by a decimal id
// ("1", "2", ...). Each save() appends one record per phase to the active
// shard. Once the active shard cannot take another full record array without
// passing the size limit, the next save moves to id + 1.
//
// Single writer. Callers that share one store across tasks must serialize.
// ============================================================================

enum class StoreStatus : uint8_t {
    Ok = 0,
    RootUnavailable,     // root missing and not creatable, or not a directory
    CorruptShardEntry,   // entry under the root is not a shard id
    StatFailed,
    OpenFailed,
    WriteFailed,
    FlushFailed,
    PhaseCountMismatch
};

const char* storeStatusName(StoreStatus st);

class ShardStore {
public:
    ShardStore(ShardFs& fs, const char* root, uint32_t maxShardBytes, uint8_t phaseCount);

    /**
     * @brief Scan the root and pick the highest shard id as active.
     *
     * Creates the root when missing (empty known set, active id 1).
     * On failure the previous state is left untouched.
     */
    StoreStatus discover();

    /**
     * @brief Append one record per phase to the active shard.
     *
     * @p count must equal the phase count given at construction.
     */
    StoreStatus save(const PhaseSnapshot* snapshots, size_t count);

    uint32_t activeShard() const             { return _activeId; }
    const std::set<uint32_t>& knownShards() const { return _known; }
    bool     isDiscovered() const            { return _discovered; }
    size_t   recordArrayBytes() const;

    std::string shardPath(uint32_t id) const;

    // Accepts 1..INT32_MAX as plain decimal digits, no sign or leading zero.
    static bool parseShardId(const char* name, uint32_t& id);

private:
    ShardFs&           _fs;
    std::string        _root;
    uint32_t           _maxShardBytes;
    uint8_t            _phaseCount;

    uint32_t           _activeId   = 1;
    std::set<uint32_t> _known;
    bool               _discovered = false;
};

#endif // SHARD_STORE_H
