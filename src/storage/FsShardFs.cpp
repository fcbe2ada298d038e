#include "storage/FsShardFs.h"
#include "system/Utils.h"
#include <string.h>

// Older cores report the full path from File::name(), newer ones the base name.
static std::string baseName(const char* raw) {
    if (raw == nullptr) return std::string();
    const char* slash = strrchr(raw, '/');
    return std::string(slash ? slash + 1 : raw);
}

// ============================================================================
// FsShardFile
// ============================================================================

FsShardFile::FsShardFile(fs::File file)
    : _file(file),
      _startSize(file ? file.size() : 0),
      _written(0)
{
}

FsShardFile::~FsShardFile() {
    if (_file) _file.close();
}

size_t FsShardFile::write(const uint8_t* data, size_t len) {
    if (!_file || data == nullptr) return 0;
    const size_t n = _file.write(data, len);
    _written += n;
    return n;
}

// fs::File never sets its write-error flag, so a flush is judged by the
// file size: it must have grown by exactly the bytes written.
bool FsShardFile::flush() {
    if (!_file) return false;
    _file.flush();
    const size_t size = _file.size();
    if (size != _startSize + _written) {
        DEBUG_PRINTF("[ShardStore] flush: size %u, expected %u\n",
                     (unsigned)size, (unsigned)(_startSize + _written));
        return false;
    }
    return true;
}

// ============================================================================
// FsShardFs
// ============================================================================

FsShardFs::FsShardFs(fs::FS& fs)
    : _fs(fs)
{
}

ShardFs::PathKind FsShardFs::kind(const char* path) {
    if (!_fs.exists(path)) return PathKind::Missing;

    fs::File f = _fs.open(path, FILE_READ);
    if (!f) return PathKind::Missing;
    const bool isDir = f.isDirectory();
    f.close();
    return isDir ? PathKind::Directory : PathKind::File;
}

bool FsShardFs::createDir(const char* path) {
    return _fs.mkdir(path);
}

bool FsShardFs::listDir(const char* path, std::vector<std::string>& names) {
    names.clear();

    fs::File dir = _fs.open(path, FILE_READ);
    if (!dir || !dir.isDirectory()) {
        if (dir) dir.close();
        return false;
    }

    fs::File entry = dir.openNextFile();
    while (entry) {
        names.push_back(baseName(entry.name()));
        entry.close();
        entry = dir.openNextFile();
    }
    dir.close();
    return true;
}

bool FsShardFs::fileSize(const char* path, uint32_t& size) {
    fs::File f = _fs.open(path, FILE_READ);
    if (!f || f.isDirectory()) {
        if (f) f.close();
        return false;
    }
    size = static_cast<uint32_t>(f.size());
    f.close();
    return true;
}

std::unique_ptr<ShardFile> FsShardFs::openAppend(const char* path) {
    fs::File f = _fs.open(path, FILE_APPEND, true);
    if (!f) {
        DEBUG_PRINTF("[ShardStore] fs open(%s, append) failed\n", path);
        return std::unique_ptr<ShardFile>();
    }
    return std::unique_ptr<ShardFile>(new FsShardFile(f));
}
