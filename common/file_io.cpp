// ============================================================
// file_io.cpp -- Memory-mapped file I/O implementation
// ============================================================

#include "file_io.hpp"
#include "errors.hpp"
#include <climits>
#include <cstring>
#include <stdexcept>
#include <string>
#include <filesystem>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace file_io;

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path + ": " + strerror(errno));
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("fstat failed: " + path);
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("Not a regular file: " + path);
    }
    size_ = (u64)st.st_size;

    if (size_ == 0) {
        data_ = nullptr;
        return;
    }

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("mmap failed: " + path);
    }
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    data_ = static_cast<const char*>(p);
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    size_ = 0;
}

// ============================================================
// MmapWriter
// ============================================================

MmapWriter::~MmapWriter() {
    if (data_ && size_ > 0) munmap(data_, (size_t)size_);
    if (fd_ >= 0) ::close(fd_);
}

void MmapWriter::open(const std::string& file_path, u64 size) {
    path_ = file_path;
    size_ = size;

    fd_ = ::open(file_path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot create file: " + file_path + ": " + strerror(errno));
    }

    if (size == 0) {
        data_ = nullptr;
        return;
    }

    // Reserve the blocks up front so a full disk fails here, not mid-stream
    int rc = posix_fallocate(fd_, 0, (off_t)size);
    if (rc != 0 && ftruncate(fd_, (off_t)size) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("Cannot preallocate " + std::to_string(size) +
                                 " bytes for " + file_path + ": " + strerror(rc));
    }

    void* p = mmap(nullptr, (size_t)size, PROT_WRITE, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("mmap(write) failed: " + path_);
    }
    data_ = static_cast<char*>(p);
}

void MmapWriter::write_at(u64 offset, const void* data, size_t len) {
    if (len == 0) return;
    if (!data_ || offset + len > size_) {
        throw std::runtime_error("MmapWriter::write_at out of bounds");
    }
    std::memcpy(data_ + offset, data, len);
}

void MmapWriter::close() {
    bool flushed = true;
    if (data_ && size_ > 0) {
        flushed = msync(data_, (size_t)size_, MS_SYNC) == 0;
        munmap(data_, (size_t)size_);
        data_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    size_ = 0;
    if (!flushed) {
        throw std::runtime_error("msync failed: " + path_);
    }
}

// ============================================================
// Name guards
// ============================================================

std::string file_io::file_name_problem(const std::string& name) {
    if (name.empty()) return "empty file name";
    if (name == "." || name == "..") return "file name '" + name + "' is a directory reference";
    if (name.size() > NAME_MAX) {
        return "file name longer than " + std::to_string(NAME_MAX) + " bytes";
    }
    for (char c : name) {
        if (c == '\0') return "file name contains NUL";
        if (c == '/' || c == '\\') return "file name contains a path separator";
    }
    return "";
}

fs::path file_io::resolve_in(const fs::path& root_dir, const std::string& name) {
    std::string problem = file_name_problem(name);
    if (!problem.empty()) {
        throw TransferError(ErrorKind::PATH_SECURITY, problem);
    }

    return root_dir / name;
}

std::string file_io::base_name(const std::string& path) {
    return fs::path(path).filename().string();
}

void file_io::ensure_dir(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        throw std::runtime_error("Cannot create directory " + path + ": " + ec.message());
    }
    if (!fs::is_directory(path, ec)) {
        throw std::runtime_error("Not a directory: " + path);
    }
}
