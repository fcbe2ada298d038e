/**************************************************************
 *  Author      : Tshibangu Samuel
 *  Role        : Freelance Embedded Systems Engineer
 *  Expertise   : Secure IoT Systems, Embedded C++, RTOS, Control Logic
 *  Contact     : tshibsamuel47@gmail.com
 *  Portfolio   : https://www.freelancer.com/u/tshibsamuel477
 *  Phone       : +216 54 429 793
 **************************************************************/
#ifndef FS_SHARD_FS_H
#define FS_SHARD_FS_H

#include <FS.h>
#include "storage/ShardFs.h"

// ============================================================================
// ShardFs over an Arduino fs::FS (LittleFS on the device)
// ============================================================================

class FsShardFile : public ShardFile {
public:
    explicit FsShardFile(fs::File file);
    ~FsShardFile() override;

    size_t write(const uint8_t* data, size_t len) override;
    bool   flush() override;

private:
    fs::File _file;
    size_t   _startSize;   // file size when opened
    size_t   _written;     // bytes accepted by write() since then
};

class FsShardFs : public ShardFs {
public:
    explicit FsShardFs(fs::FS& fs);

    PathKind kind(const char* path) override;
    bool     createDir(const char* path) override;
    bool     listDir(const char* path, std::vector<std::string>& names) override;
    bool     fileSize(const char* path, uint32_t& size) override;
    std::unique_ptr<ShardFile> openAppend(const char* path) override;

private:
    fs::FS& _fs;
};

#endif // FS_SHARD_FS_H
