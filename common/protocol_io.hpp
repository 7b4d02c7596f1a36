#pragma once

// ============================================================
// protocol_io.hpp -- Message encode/decode with byte-order handling
// ============================================================

#include "protocol.hpp"
#include "errors.hpp"
#include <vector>
#include <stdexcept>
#include <cstring>
#include <endian.h>

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) { return htobe16(v); }
inline u64 hton64(u64 v) { return htobe64(v); }
inline u16 ntoh16(u16 v) { return be16toh(v); }
inline u64 ntoh64(u64 v) { return be64toh(v); }

// ---- Encoding ----

// Serialise one message. Throws std::length_error if a string
// field exceeds MAX_STRING_LEN.
std::vector<u8> encode(const Message& msg);

// ---- Decoding ----

// In-memory byte source with the same recv_all contract as TcpSocket:
// returns false if fewer than len bytes remain.
class BufferReader {
public:
    BufferReader(const u8* data, size_t len) : data_(data), len_(len) {}

    bool recv_all(void* buf, size_t len) {
        if (len_ - pos_ < len) {
            pos_ = len_;
            return false;
        }
        if (len > 0) std::memcpy(buf, data_ + pos_, len);
        pos_ += len;
        return true;
    }

    size_t consumed() const { return pos_; }

private:
    const u8* data_;
    size_t    len_;
    size_t    pos_{0};
};

template<typename Source>
void read_exact(Source& src, void* buf, size_t len, const char* what) {
    if (!src.recv_all(buf, len)) {
        throw DecodeFailure(DecodeError::TRUNCATED,
                            std::string("stream ended while reading ") + what);
    }
}

template<typename Source>
u64 read_u64(Source& src, const char* what) {
    u64 v;
    read_exact(src, &v, sizeof(v), what);
    return ntoh64(v);
}

template<typename Source>
std::string read_string(Source& src, const char* what) {
    u16 len_be;
    read_exact(src, &len_be, sizeof(len_be), what);
    u16 len = ntoh16(len_be);
    if (len > MAX_STRING_LEN) {
        throw DecodeFailure(DecodeError::MALFORMED,
                            std::string(what) + " length " + std::to_string(len) +
                            " exceeds " + std::to_string(MAX_STRING_LEN));
    }
    std::string s(len, '\0');
    if (len > 0) read_exact(src, &s[0], len, what);
    return s;
}

// Read exactly one message from any source exposing
// bool recv_all(void*, size_t). Throws DecodeFailure.
template<typename Source>
Message read_message(Source& src) {
    u8 tag;
    read_exact(src, &tag, 1, "tag");

    switch (static_cast<MsgTag>(tag)) {
        case MsgTag::MT_HELLO: {
            Hello h;
            h.file_name = read_string(src, "file name");
            h.file_size = read_u64(src, "file size");
            return h;
        }
        case MsgTag::MT_ACK:
            return Ack{};
        case MsgTag::MT_NACK: {
            Nack n;
            n.reason = read_string(src, "reason");
            return n;
        }
        case MsgTag::MT_SEND: {
            Send s;
            s.file_size = read_u64(src, "file size");
            return s;
        }
    }
    throw DecodeFailure(DecodeError::UNKNOWN_TAG,
                        "tag " + std::to_string(tag) + " is not a known message");
}

// Decode one message from the front of a buffer. If consumed is
// non-null it receives the number of bytes the message occupied.
Message decode(const u8* data, size_t len, size_t* consumed = nullptr);

inline Message decode(const std::vector<u8>& buf, size_t* consumed = nullptr) {
    return decode(buf.data(), buf.size(), consumed);
}

} // namespace proto
