#pragma once

// protocol.hpp -- Wire protocol definitions for peercp

#include "platform.hpp"
#include <string>
#include <variant>

// Longest string (file name, NACK reason) a peer may declare on the wire.
// Anything above is treated as hostile and rejected before allocation.
static constexpr u16 MAX_STRING_LEN = 4096;

static constexpr u16 PEERCP_DEFAULT_PORT = 40001;

// ---- Message tags (one byte on the wire) ----
enum class MsgTag : u8 {
    MT_HELLO = 0x01,
    MT_ACK   = 0x02,
    MT_NACK  = 0x03,
    MT_SEND  = 0x04,
};

// ============================================================
// Messages
//   HELLO: u8 tag, u16 name_len, name bytes, u64 file_size
//   ACK:   u8 tag
//   NACK:  u8 tag, u16 reason_len, reason bytes
//   SEND:  u8 tag, u64 file_size
// All integers big-endian. After HELLO/ACK/SEND the connection
// carries exactly file_size raw bytes with no further framing.
// ============================================================

// Sender's offer
struct Hello {
    std::string file_name;
    u64         file_size{0};
};

// Receiver accepts the offer
struct Ack {};

// Receiver rejects the offer
struct Nack {
    std::string reason;
};

// Sender commits to stream exactly file_size bytes (must repeat Hello's size)
struct Send {
    u64 file_size{0};
};

using Message = std::variant<Hello, Ack, Nack, Send>;

inline MsgTag tag_of(const Message& m) {
    switch (m.index()) {
        case 0:  return MsgTag::MT_HELLO;
        case 1:  return MsgTag::MT_ACK;
        case 2:  return MsgTag::MT_NACK;
        default: return MsgTag::MT_SEND;
    }
}

inline const char* msg_name(const Message& m) {
    switch (tag_of(m)) {
        case MsgTag::MT_HELLO: return "HELLO";
        case MsgTag::MT_ACK:   return "ACK";
        case MsgTag::MT_NACK:  return "NACK";
        case MsgTag::MT_SEND:  return "SEND";
    }
    return "?";
}

// Fixed-width equality, used by tests and by the session's size check
inline bool operator==(const Hello& a, const Hello& b) {
    return a.file_name == b.file_name && a.file_size == b.file_size;
}
inline bool operator==(const Ack&, const Ack&) { return true; }
inline bool operator==(const Nack& a, const Nack& b) { return a.reason == b.reason; }
inline bool operator==(const Send& a, const Send& b) { return a.file_size == b.file_size; }
