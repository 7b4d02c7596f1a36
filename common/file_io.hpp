#pragma once

// ============================================================
// file_io.hpp -- Memory-mapped file I/O and name guards
// ============================================================

#include "platform.hpp"
#include <string>
#include <stdexcept>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const char* data() const { return data_; }
    u64 size() const { return size_; }

    // Bytes available from offset, clamped to max_len
    u64 chunk_len(u64 offset, u64 max_len) const {
        if (offset >= size_) return 0;
        u64 remaining = size_ - offset;
        return remaining < max_len ? remaining : max_len;
    }

    void close();

private:
    const char* data_{nullptr};
    u64 size_{0};
    int fd_{-1};
};

// ---- MmapWriter: preallocated write via mmap ----
class MmapWriter {
public:
    MmapWriter() = default;
    ~MmapWriter();

    MmapWriter(const MmapWriter&) = delete;
    MmapWriter& operator=(const MmapWriter&) = delete;

    // Create (truncating) path, preallocate to size, then mmap
    void open(const std::string& path, u64 size);

    // Write data at given offset; throws if it would run past size()
    void write_at(u64 offset, const void* data, size_t len);

    // msync and close; throws if the data could not be flushed
    void close();

    bool is_open() const { return fd_ >= 0; }
    u64 size() const { return size_; }
    const std::string& path() const { return path_; }

private:
    char*       data_{nullptr};
    u64         size_{0};
    int         fd_{-1};
    std::string path_;
};

// ---- Name guards ----

// Why a name offered by a peer cannot be stored, or "" if it can.
// A storable name is a single non-empty path component of at most
// NAME_MAX bytes: no '/' or '\\', no NUL, and not "." or "..".
std::string file_name_problem(const std::string& name);

// Resolve name under root_dir. Throws TransferError(PATH_SECURITY)
// if the name is not storable or the result escapes root_dir.
fs::path resolve_in(const fs::path& root_dir, const std::string& name);

// Last component of a local path, used as the name offered on the wire
std::string base_name(const std::string& path);

// Create directory (and parents) if it doesn't exist
void ensure_dir(const std::string& path);

} // namespace file_io
