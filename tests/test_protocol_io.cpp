// ============================================================
// test_protocol_io.cpp -- Wire codec
// ============================================================

#include "common/protocol_io.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

DecodeError decode_error_of(const std::vector<u8>& bytes) {
    try {
        proto::decode(bytes);
    } catch (const DecodeFailure& e) {
        return e.error();
    }
    ADD_FAILURE() << "decode succeeded on " << bytes.size() << " bytes";
    return DecodeError::MALFORMED;
}

} // namespace

TEST(ProtocolIo, HelloLayoutIsBigEndian) {
    std::vector<u8> bytes = proto::encode(Hello{"a.txt", 0x0102030405060708ULL});
    std::vector<u8> expected = {
        0x01,
        0x00, 0x05, 'a', '.', 't', 'x', 't',
        0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08,
    };
    EXPECT_EQ(bytes, expected);
}

TEST(ProtocolIo, FixedLayouts) {
    EXPECT_EQ(proto::encode(Ack{}), std::vector<u8>({0x02}));
    EXPECT_EQ(proto::encode(Nack{"no"}), std::vector<u8>({0x03, 0x00, 0x02, 'n', 'o'}));
    EXPECT_EQ(proto::encode(Send{300}),
              std::vector<u8>({0x04, 0, 0, 0, 0, 0, 0, 0x01, 0x2C}));
}

TEST(ProtocolIo, DecodeReportsConsumedBytes) {
    std::vector<u8> buf = proto::encode(Hello{"report.pdf", 1234});
    size_t hello_len = buf.size();
    std::vector<u8> tail = proto::encode(Ack{});
    buf.insert(buf.end(), tail.begin(), tail.end());

    size_t consumed = 0;
    Message msg = proto::decode(buf, &consumed);
    EXPECT_EQ(consumed, hello_len);
    ASSERT_TRUE(std::holds_alternative<Hello>(msg));
    EXPECT_EQ(std::get<Hello>(msg), (Hello{"report.pdf", 1234}));

    Message next = proto::decode(buf.data() + consumed, buf.size() - consumed);
    EXPECT_TRUE(std::holds_alternative<Ack>(next));
}

TEST(ProtocolIo, EmptyStringsAndZeroSizes) {
    Message nack = proto::decode(proto::encode(Nack{""}));
    ASSERT_TRUE(std::holds_alternative<Nack>(nack));
    EXPECT_TRUE(std::get<Nack>(nack).reason.empty());

    Message send = proto::decode(proto::encode(Send{0}));
    ASSERT_TRUE(std::holds_alternative<Send>(send));
    EXPECT_EQ(std::get<Send>(send).file_size, 0u);
}

TEST(ProtocolIo, EveryStrictPrefixIsTruncated) {
    std::vector<Message> messages = {
        Hello{"holiday-photos.tar", 987654321},
        Ack{},
        Nack{"file already exists"},
        Send{987654321},
    };
    for (const Message& msg : messages) {
        std::vector<u8> full = proto::encode(msg);
        for (size_t n = 0; n < full.size(); ++n) {
            std::vector<u8> prefix(full.begin(), full.begin() + n);
            EXPECT_EQ(decode_error_of(prefix), DecodeError::TRUNCATED)
                << msg_name(msg) << " prefix of " << n << " bytes";
        }
    }
}

TEST(ProtocolIo, UnknownTagIsRejected) {
    EXPECT_EQ(decode_error_of({0x00}), DecodeError::UNKNOWN_TAG);
    EXPECT_EQ(decode_error_of({0x05, 0x00}), DecodeError::UNKNOWN_TAG);
    EXPECT_EQ(decode_error_of({0xFF}), DecodeError::UNKNOWN_TAG);
}

TEST(ProtocolIo, OversizedStringLengthIsMalformed) {
    // Declared length 0xFFFF > MAX_STRING_LEN; rejected before the body is read
    EXPECT_EQ(decode_error_of({0x01, 0xFF, 0xFF, 'x'}), DecodeError::MALFORMED);
    EXPECT_EQ(decode_error_of({0x03, 0x10, 0x01}), DecodeError::MALFORMED);
}

TEST(ProtocolIo, LongestAllowedName) {
    std::string name(MAX_STRING_LEN, 'n');
    Message msg = proto::decode(proto::encode(Hello{name, 1}));
    ASSERT_TRUE(std::holds_alternative<Hello>(msg));
    EXPECT_EQ(std::get<Hello>(msg).file_name.size(), (size_t)MAX_STRING_LEN);
}

TEST(ProtocolIo, EncodeRefusesOverlongString) {
    std::string name(MAX_STRING_LEN + 1, 'n');
    EXPECT_THROW(proto::encode(Hello{name, 1}), std::length_error);
    EXPECT_THROW(proto::encode(Nack{name}), std::length_error);
}

TEST(ProtocolIo, MessageNames) {
    EXPECT_STREQ(msg_name(Hello{}), "HELLO");
    EXPECT_STREQ(msg_name(Ack{}), "ACK");
    EXPECT_STREQ(msg_name(Nack{}), "NACK");
    EXPECT_STREQ(msg_name(Send{}), "SEND");
    EXPECT_EQ(tag_of(Send{}), MsgTag::MT_SEND);
}
