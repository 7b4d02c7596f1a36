// ============================================================
// protocol_io.cpp -- Message serialisation
// ============================================================

#include "protocol_io.hpp"
#include <cstring>
#include <stdexcept>
#include <string>

namespace {

void put_u8(std::vector<u8>& out, u8 v) {
    out.push_back(v);
}

void put_u16(std::vector<u8>& out, u16 v) {
    u16 be = proto::hton16(v);
    const u8* p = reinterpret_cast<const u8*>(&be);
    out.insert(out.end(), p, p + sizeof(be));
}

void put_u64(std::vector<u8>& out, u64 v) {
    u64 be = proto::hton64(v);
    const u8* p = reinterpret_cast<const u8*>(&be);
    out.insert(out.end(), p, p + sizeof(be));
}

void put_string(std::vector<u8>& out, const std::string& s, const char* what) {
    if (s.size() > MAX_STRING_LEN) {
        throw std::length_error(std::string(what) + " too long for the wire: " +
                                std::to_string(s.size()) + " bytes");
    }
    put_u16(out, (u16)s.size());
    out.insert(out.end(), s.begin(), s.end());
}

struct Encoder {
    std::vector<u8>& out;

    void operator()(const Hello& h) const {
        put_u8(out, (u8)MsgTag::MT_HELLO);
        put_string(out, h.file_name, "file name");
        put_u64(out, h.file_size);
    }
    void operator()(const Ack&) const {
        put_u8(out, (u8)MsgTag::MT_ACK);
    }
    void operator()(const Nack& n) const {
        put_u8(out, (u8)MsgTag::MT_NACK);
        put_string(out, n.reason, "reason");
    }
    void operator()(const Send& s) const {
        put_u8(out, (u8)MsgTag::MT_SEND);
        put_u64(out, s.file_size);
    }
};

} // namespace

std::vector<u8> proto::encode(const Message& msg) {
    std::vector<u8> out;
    out.reserve(16);
    std::visit(Encoder{out}, msg);
    return out;
}

Message proto::decode(const u8* data, size_t len, size_t* consumed) {
    BufferReader reader(data, len);
    Message m = read_message(reader);
    if (consumed) *consumed = reader.consumed();
    return m;
}
