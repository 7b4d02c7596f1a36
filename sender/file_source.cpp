// ============================================================
// file_source.cpp
// ============================================================

#include "file_source.hpp"
#include <cstring>

MappedFileSource::MappedFileSource(const std::string& path)
    : path_(path)
    , reader_(path)
{}

size_t MappedFileSource::read(u8* buf, size_t len) {
    u64 n = reader_.chunk_len(offset_, len);
    if (n == 0) return 0;
    std::memcpy(buf, reader_.data() + offset_, (size_t)n);
    offset_ += n;
    return (size_t)n;
}
