#pragma once

// ============================================================
// errors.hpp -- Error taxonomy and transfer outcomes
// ============================================================

#include "platform.hpp"
#include "hash.hpp"
#include <stdexcept>
#include <string>

// Everything that can end a session early.
enum class ErrorKind : u8 {
    NONE               = 0,
    CONNECTION         = 1,  // cannot connect/accept, peer reset or disconnected
    DECODE             = 2,  // malformed wire data
    PROTOCOL_VIOLATION = 3,  // size mismatch, out-of-order message
    TIMEOUT            = 4,
    IO                 = 5,  // local file read/write failure
    PATH_SECURITY      = 6,  // offered name would escape the output directory
};

inline const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE:               return "none";
        case ErrorKind::CONNECTION:         return "connection error";
        case ErrorKind::DECODE:             return "decode error";
        case ErrorKind::PROTOCOL_VIOLATION: return "protocol violation";
        case ErrorKind::TIMEOUT:            return "timeout";
        case ErrorKind::IO:                 return "I/O error";
        case ErrorKind::PATH_SECURITY:      return "path security error";
    }
    return "unknown";
}

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// ---- Wire decode errors ----
enum class DecodeError : u8 {
    TRUNCATED   = 1,  // stream ended inside a message
    UNKNOWN_TAG = 2,
    MALFORMED   = 3,  // implausible declared length
};

inline const char* decode_error_name(DecodeError e) {
    switch (e) {
        case DecodeError::TRUNCATED:   return "truncated";
        case DecodeError::UNKNOWN_TAG: return "unknown tag";
        case DecodeError::MALFORMED:   return "malformed";
    }
    return "unknown";
}

class DecodeFailure : public std::runtime_error {
public:
    DecodeFailure(DecodeError error, const std::string& what)
        : std::runtime_error(std::string(decode_error_name(error)) + ": " + what)
        , error_(error) {}

    DecodeError error() const { return error_; }

private:
    DecodeError error_;
};

// ---- Outcome of one session, reported to the caller ----
enum class OutcomeKind : u8 {
    COMPLETED = 0,
    REJECTED  = 1,
    FAILED    = 2,
};

struct Outcome {
    OutcomeKind   kind{OutcomeKind::FAILED};
    u64           bytes{0};           // COMPLETED: bytes moved
    std::string   reason;             // REJECTED: peer's reason; FAILED: detail
    ErrorKind     error{ErrorKind::NONE};
    std::string   file_name;          // negotiated name, if the offer got that far
    hash::Hash128 digest{};           // COMPLETED: xxh3-128 of the streamed bytes

    static Outcome completed(u64 bytes, const hash::Hash128& digest) {
        Outcome o;
        o.kind   = OutcomeKind::COMPLETED;
        o.bytes  = bytes;
        o.digest = digest;
        return o;
    }

    static Outcome rejected(const std::string& reason,
                            ErrorKind error = ErrorKind::NONE) {
        Outcome o;
        o.kind   = OutcomeKind::REJECTED;
        o.reason = reason;
        o.error  = error;
        return o;
    }

    static Outcome failed(ErrorKind error, const std::string& detail) {
        Outcome o;
        o.kind   = OutcomeKind::FAILED;
        o.error  = error;
        o.reason = detail;
        return o;
    }

    bool is_completed() const { return kind == OutcomeKind::COMPLETED; }
    bool is_rejected()  const { return kind == OutcomeKind::REJECTED; }
    bool is_failed()    const { return kind == OutcomeKind::FAILED; }

    std::string describe() const {
        switch (kind) {
            case OutcomeKind::COMPLETED:
                return "completed (" + std::to_string(bytes) + " bytes, xxh3 " +
                       hash::to_hex(digest) + ")";
            case OutcomeKind::REJECTED:
                return "rejected: " + reason;
            case OutcomeKind::FAILED:
                return std::string("failed [") + error_kind_name(error) + "]: " + reason;
        }
        return "unknown";
    }
};
