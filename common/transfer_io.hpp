#pragma once

// ============================================================
// transfer_io.hpp -- What a session reads from and writes to
//
// The sender side hands a session a FileSource (bytes of known
// length). The receiver side hands it a ReceiveTarget, which
// decides on offers and, on acceptance, gives back the FileSink
// the streamed bytes go into.
// ============================================================

#include "platform.hpp"
#include "errors.hpp"
#include <memory>
#include <string>

class FileSource {
public:
    virtual ~FileSource() = default;

    // Total bytes this source will produce
    virtual u64 size() const = 0;

    // Copy up to len bytes into buf; 0 means the source is exhausted.
    // Throws on local read failure.
    virtual size_t read(u8* buf, size_t len) = 0;
};

class FileSink {
public:
    virtual ~FileSink() = default;

    // Prepare storage for exactly size bytes (called once, after SEND)
    virtual void open(u64 size) = 0;

    // Append bytes in stream order
    virtual void write(const u8* data, size_t len) = 0;

    // All bytes arrived: make the file visible under its final name
    virtual void commit() = 0;

    // Destroying an uncommitted sink discards everything it wrote
};

struct Admission {
    bool                      accepted{false};
    std::string               reason;  // sent in NACK when !accepted
    ErrorKind                 error{ErrorKind::NONE};
    std::unique_ptr<FileSink> sink;    // set when accepted

    static Admission accept(std::unique_ptr<FileSink> sink) {
        Admission a;
        a.accepted = true;
        a.sink     = std::move(sink);
        return a;
    }

    static Admission reject(const std::string& reason,
                            ErrorKind error = ErrorKind::NONE) {
        Admission a;
        a.reason = reason;
        a.error  = error;
        return a;
    }
};

class ReceiveTarget {
public:
    virtual ~ReceiveTarget() = default;

    // Decide on an offer. Called concurrently from many sessions.
    virtual Admission admit(const std::string& file_name, u64 file_size) = 0;
};
