#include "storage/ShardStore.h"
#include "storage/ShardRecord.h"
#include "system/Utils.h"
#include <vector>

const char* storeStatusName(StoreStatus st) {
    switch (st) {
        case StoreStatus::Ok:                 return "ok";
        case StoreStatus::RootUnavailable:    return "root unavailable";
        case StoreStatus::CorruptShardEntry:  return "corrupt shard entry";
        case StoreStatus::StatFailed:         return "stat failed";
        case StoreStatus::OpenFailed:         return "open failed";
        case StoreStatus::WriteFailed:        return "write failed";
        case StoreStatus::FlushFailed:        return "flush failed";
        case StoreStatus::PhaseCountMismatch: return "phase count mismatch";
    }
    return "unknown";
}

ShardStore::ShardStore(ShardFs& fs, const char* root, uint32_t maxShardBytes, uint8_t phaseCount)
    : _fs(fs),
      _root(root ? root : ""),
      _maxShardBytes(maxShardBytes),
      _phaseCount(phaseCount)
{
    // "/ct_readings/" and "/ct_readings" name the same directory
    while (_root.size() > 1 && _root[_root.size() - 1] == '/') {
        _root.erase(_root.size() - 1);
    }
}

size_t ShardStore::recordArrayBytes() const {
    return static_cast<size_t>(_phaseCount) * ShardRecord::kSize;
}

std::string ShardStore::shardPath(uint32_t id) const {
    std::string path = _root;
    if (path.empty() || path[path.size() - 1] != '/') path += '/';
    path += std::to_string(id);
    return path;
}

bool ShardStore::parseShardId(const char* name, uint32_t& id) {
    if (name == nullptr || name[0] == '\0') return false;
    if (name[0] == '0') return false;   // "0" and zero-padded names

    uint64_t v = 0;
    for (const char* p = name; *p; ++p) {
        if (*p < '0' || *p > '9') return false;
        v = v * 10u + static_cast<uint64_t>(*p - '0');
        if (v > static_cast<uint64_t>(INT32_MAX)) return false;
    }
    id = static_cast<uint32_t>(v);
    return true;
}

// ============================================================================
// discover()
// ============================================================================

StoreStatus ShardStore::discover() {
    const char* root = _root.c_str();

    switch (_fs.kind(root)) {
        case ShardFs::PathKind::Missing:
            if (!_fs.createDir(root)) {
                DEBUG_PRINTF("[ShardStore] Cannot create %s\n", root);
                return StoreStatus::RootUnavailable;
            }
            _known.clear();
            _activeId   = 1;
            _discovered = true;
            DEBUG_PRINTF("[ShardStore] Created %s, first shard is 1\n", root);
            return StoreStatus::Ok;

        case ShardFs::PathKind::File:
            DEBUG_PRINTF("[ShardStore] %s is not a directory\n", root);
            return StoreStatus::RootUnavailable;

        case ShardFs::PathKind::Directory:
            break;
    }

    std::vector<std::string> names;
    if (!_fs.listDir(root, names)) {
        DEBUG_PRINTF("[ShardStore] Cannot list %s\n", root);
        return StoreStatus::RootUnavailable;
    }

    std::set<uint32_t> found;
    uint32_t maxId = 1;
    for (size_t i = 0; i < names.size(); ++i) {
        uint32_t id = 0;
        if (!parseShardId(names[i].c_str(), id)) {
            DEBUG_PRINTF("[ShardStore] Unexpected entry '%s' under %s\n",
                         names[i].c_str(), root);
            return StoreStatus::CorruptShardEntry;
        }
        found.insert(id);
        if (id > maxId) maxId = id;
    }

    _known.swap(found);
    _activeId   = maxId;
    _discovered = true;

    DEBUG_PRINTF("[ShardStore] %u shard(s) found, active %lu\n",
                 (unsigned)_known.size(), (unsigned long)_activeId);
    return StoreStatus::Ok;
}

// ============================================================================
// save()
//   - Rotate if the active shard cannot take one more record array.
//   - Append every phase record in a single write, then flush.
// ============================================================================

StoreStatus ShardStore::save(const PhaseSnapshot* snapshots, size_t count) {
    if (snapshots == nullptr || count != _phaseCount) {
        DEBUG_PRINTF("[ShardStore] Expected %u readings, got %u\n",
                     (unsigned)_phaseCount, (unsigned)count);
        return StoreStatus::PhaseCountMismatch;
    }

    const size_t arrayBytes = recordArrayBytes();

    // 1) Rotation check on the active shard
    std::string path = shardPath(_activeId);
    uint32_t size = 0;
    switch (_fs.kind(path.c_str())) {
        case ShardFs::PathKind::Missing:
            size = 0;
            break;
        case ShardFs::PathKind::File:
            if (!_fs.fileSize(path.c_str(), size)) {
                DEBUG_PRINTF("[ShardStore] Cannot stat %s\n", path.c_str());
                return StoreStatus::StatFailed;
            }
            break;
        case ShardFs::PathKind::Directory:
            DEBUG_PRINTF("[ShardStore] %s is a directory\n", path.c_str());
            return StoreStatus::StatFailed;
    }

    if (size > 0 &&
        static_cast<uint64_t>(size) + arrayBytes > static_cast<uint64_t>(_maxShardBytes)) {
        ++_activeId;
        path = shardPath(_activeId);
        DEBUG_PRINTF("[ShardStore] Shard full (%lu B), rotating to %lu\n",
                     (unsigned long)size, (unsigned long)_activeId);
    }

    // 2) Serialize all phases back to back
    std::vector<uint8_t> buf(arrayBytes);
    size_t pos = 0;
    for (size_t i = 0; i < count; ++i) {
        pos += ShardRecord::encode(snapshots[i], buf.data() + pos, buf.size() - pos);
    }

    // 3) Append + flush
    std::unique_ptr<ShardFile> file = _fs.openAppend(path.c_str());
    if (!file) {
        DEBUG_PRINTF("[ShardStore] Cannot open %s\n", path.c_str());
        return StoreStatus::OpenFailed;
    }
    _known.insert(_activeId);

    if (file->write(buf.data(), pos) != pos) {
        DEBUG_PRINTF("[ShardStore] Short write to %s\n", path.c_str());
        return StoreStatus::WriteFailed;
    }
    if (!file->flush()) {
        DEBUG_PRINTF("[ShardStore] Flush failed on %s\n", path.c_str());
        return StoreStatus::FlushFailed;
    }
    return StoreStatus::Ok;
}
