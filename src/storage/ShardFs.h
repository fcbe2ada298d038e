/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef SHARD_FS_H
#define SHARD_FS_H

#include <stddef.h>
#include <stdint.h>
#include <memory>
#include <string>
#include <vector>

// ============================================================================
// Filesystem operations the shard store needs, nothing more.
// ============================================================================

// Append handle; closes when destroyed.
class ShardFile {
public:
    virtual ~ShardFile() {}

    virtual size_t write(const uint8_t* data, size_t len) = 0;
    virtual bool   flush() = 0;
};

class ShardFs {
public:
    enum class PathKind : uint8_t { Missing, File, Directory };

    virtual ~ShardFs() {}

    virtual PathKind kind(const char* path) = 0;
    virtual bool     createDir(const char* path) = 0;

    // Entry base names (no directory prefix). False if unreadable.
    virtual bool listDir(const char* path, std::vector<std::string>& names) = 0;

    // Size of an existing file. False if it cannot be stat'ed.
    virtual bool fileSize(const char* path, uint32_t& size) = 0;

    // Open for append, creating the file if needed. nullptr on failure.
    virtual std::unique_ptr<ShardFile> openAppend(const char* path) = 0;
};

#endif // SHARD_FS_H
