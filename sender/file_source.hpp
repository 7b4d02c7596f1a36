#pragma once

// ============================================================
// file_source.hpp -- A local file as the bytes of an offer
// ============================================================

#include "../common/platform.hpp"
#include "../common/transfer_io.hpp"
#include "../common/file_io.hpp"
#include <string>

// Maps the whole file read-only; throws if it cannot be opened
// or is not a regular file.
class MappedFileSource : public FileSource {
public:
    explicit MappedFileSource(const std::string& path);

    u64 size() const override { return reader_.size(); }
    size_t read(u8* buf, size_t len) override;

    const std::string& path() const { return path_; }

private:
    std::string         path_;
    file_io::MmapReader reader_;
    u64                 offset_{0};
};
