#ifndef TEST_SUPPORT_H
#define TEST_SUPPORT_H

// Host-side fakes shared by the test executables.

#include <cmath>
#include <cstdint>
#include <iostream>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "system/Clock.h"
#include "sensing/SampleChannel.h"
#include "storage/ShardFs.h"

#ifndef M_PI
#define M_PI 3.14159265358979323846
#endif

static int g_failures = 0;

#define CHECK(cond)                                                         \
    do {                                                                    \
        if (!(cond)) {                                                      \
            std::cout << "  FAIL " << __FILE__ << ":" << __LINE__           \
                      << "  " #cond << std::endl;                           \
            ++g_failures;                                                   \
        }                                                                   \
    } while (0)

#define CHECK_NEAR(a, b, tol)                                               \
    do {                                                                    \
        const double a_ = (a), b_ = (b);                                    \
        if (!(std::fabs(a_ - b_) <= (tol))) {                               \
            std::cout << "  FAIL " << __FILE__ << ":" << __LINE__           \
                      << "  " #a " = " << a_ << ", expected " << b_         \
                      << " +/- " << (tol) << std::endl;                     \
            ++g_failures;                                                   \
        }                                                                   \
    } while (0)

static inline int finish(const char* name) {
    if (g_failures == 0) {
        std::cout << name << ": all checks passed" << std::endl;
        return 0;
    }
    std::cout << name << ": " << g_failures << " check(s) failed" << std::endl;
    return 1;
}

// ============================================================================
// Clock: time moves only when a channel reads (or a test advances it)
// ============================================================================

class FakeClock : public Clock {
public:
    uint64_t micros() override  { return _nowUs; }
    uint64_t epochMs() override { return _epochBaseMs + _nowUs / 1000ULL; }

    void advance(uint64_t us)          { _nowUs += us; }
    void setEpochBase(uint64_t ms)     { _epochBaseMs = ms; }
    double seconds() const             { return static_cast<double>(_nowUs) / 1e6; }

private:
    uint64_t _nowUs       = 0;
    uint64_t _epochBaseMs = 1700000000000ULL;
};

// ============================================================================
// Sample channels
// ============================================================================

// offset + amplitude * sin(2*pi*f*t + phase), sampled at the clock's time.
class SineChannel : public SampleChannel {
public:
    SineChannel(FakeClock& clock, double offset, double amplitude,
                double freqHz = 50.0, double phaseRad = 0.0, uint64_t readUs = 50)
        : _clock(clock), _offset(offset), _amplitude(amplitude),
          _freqHz(freqHz), _phaseRad(phaseRad), _readUs(readUs) {}

    bool read(uint16_t& out) override {
        const double t = _clock.seconds();
        double v = _offset + _amplitude * std::sin(2.0 * M_PI * _freqHz * t + _phaseRad);
        if (v < 0.0) v = 0.0;
        if (v > 4095.0) v = 4095.0;
        out = static_cast<uint16_t>(std::lround(v));
        _clock.advance(_readUs);
        ++reads;
        return true;
    }

    uint32_t reads = 0;

private:
    FakeClock& _clock;
    double     _offset;
    double     _amplitude;
    double     _freqHz;
    double     _phaseRad;
    uint64_t   _readUs;
};

class FlatChannel : public SampleChannel {
public:
    FlatChannel(FakeClock& clock, uint16_t value, uint64_t readUs = 50)
        : _clock(clock), _value(value), _readUs(readUs) {}

    bool read(uint16_t& out) override {
        out = _value;
        _clock.advance(_readUs);
        return true;
    }

private:
    FakeClock& _clock;
    uint16_t   _value;
    uint64_t   _readUs;
};

// Wraps another channel; every `failEvery`-th read fails (0 = never,
// 1 = always). A failed read still costs the inner channel's time.
class FlakyChannel : public SampleChannel {
public:
    FlakyChannel(SampleChannel& inner, uint32_t failEvery)
        : _inner(inner), _failEvery(failEvery) {}

    bool read(uint16_t& out) override {
        uint16_t v = 0;
        const bool ok = _inner.read(v);
        ++_count;
        if (!ok || (_failEvery != 0 && (_count % _failEvery) == 0)) {
            ++failed;
            return false;
        }
        out = v;
        return true;
    }

    uint32_t failed = 0;

private:
    SampleChannel& _inner;
    uint32_t       _failEvery;
    uint32_t       _count = 0;
};

// ============================================================================
// In-memory filesystem with fault injection
// ============================================================================

class MemoryShardFs : public ShardFs {
public:
    struct Faults {
        bool   failCreateDir = false;
        bool   failList      = false;
        bool   failStat      = false;
        bool   failOpen      = false;
        bool   failFlush     = false;
        size_t shortWrite    = 0;    // bytes dropped from the next writes
    };

    Faults faults;
    std::map<std::string, std::vector<uint8_t>> files;
    std::set<std::string> dirs;
    uint32_t opens = 0;

    void addDir(const std::string& path) { dirs.insert(path); }

    void addFile(const std::string& path, size_t bytes = 0, uint8_t fill = 0xAB) {
        files[path] = std::vector<uint8_t>(bytes, fill);
    }

    PathKind kind(const char* path) override {
        if (dirs.count(path))  return PathKind::Directory;
        if (files.count(path)) return PathKind::File;
        return PathKind::Missing;
    }

    bool createDir(const char* path) override {
        if (faults.failCreateDir) return false;
        dirs.insert(path);
        return true;
    }

    bool listDir(const char* path, std::vector<std::string>& names) override {
        names.clear();
        if (faults.failList || !dirs.count(path)) return false;
        const std::string prefix = std::string(path) + "/";
        for (const auto& f : files) {
            const std::string* rest = childOf(prefix, f.first);
            if (rest) names.push_back(*rest);
        }
        for (const auto& d : dirs) {
            const std::string* rest = childOf(prefix, d);
            if (rest) names.push_back(*rest);
        }
        return true;
    }

    bool fileSize(const char* path, uint32_t& size) override {
        if (faults.failStat) return false;
        auto it = files.find(path);
        if (it == files.end()) return false;
        size = static_cast<uint32_t>(it->second.size());
        return true;
    }

    std::unique_ptr<ShardFile> openAppend(const char* path) override {
        if (faults.failOpen) return std::unique_ptr<ShardFile>();
        ++opens;
        return std::unique_ptr<ShardFile>(new MemoryFile(*this, files[path]));
    }

private:
    class MemoryFile : public ShardFile {
    public:
        MemoryFile(MemoryShardFs& fs, std::vector<uint8_t>& data) : _fs(fs), _data(data) {}

        size_t write(const uint8_t* data, size_t len) override {
            size_t n = len;
            if (_fs.faults.shortWrite > 0) {
                n = (len > _fs.faults.shortWrite) ? len - _fs.faults.shortWrite : 0;
            }
            _data.insert(_data.end(), data, data + n);
            return n;
        }

        bool flush() override { return !_fs.faults.failFlush; }

    private:
        MemoryShardFs&        _fs;
        std::vector<uint8_t>& _data;
    };

    // Direct child name of `prefix`, or nullptr.
    const std::string* childOf(const std::string& prefix, const std::string& full) {
        if (full.size() <= prefix.size() || full.compare(0, prefix.size(), prefix) != 0) {
            return nullptr;
        }
        _scratch = full.substr(prefix.size());
        if (_scratch.find('/') != std::string::npos) return nullptr;
        return &_scratch;
    }

    std::string _scratch;
};

#endif // TEST_SUPPORT_H
