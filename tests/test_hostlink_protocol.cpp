// =============================================================================
// Unit tests for the wire framing (src/hostlink_protocol.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <algorithm>
#include <vector>
#include "hostlink_protocol.hpp"

using namespace hostlink;
using namespace hostlink::protocol;

// Reader over a fixed buffer that hands out at most `step` bytes per call
struct ScriptedReader {
    std::vector<uint8_t> data;
    size_t pos = 0;
    size_t step = 1 << 20;

    ReadFn fn() {
        return [this](uint8_t* buf, size_t len) -> Result<size_t> {
            size_t n = std::min({len, step, data.size() - pos});
            std::copy(data.begin() + (std::ptrdiff_t)pos, data.begin() + (std::ptrdiff_t)(pos + n), buf);
            pos += n;
            return Ok(n);
        };
    }
};

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------
TEST(HostLinkProtocolTest, EncodeLayoutIsLittleEndian) {
    const uint8_t payload[] = {0xAA, 0xBB, 0xCC};
    auto r = encodeFrame(OP_LIST_DIR, 0x01020304, payload, sizeof(payload));
    ASSERT_TRUE(r.is_ok());
    const std::vector<uint8_t> expected = {
        0x09, 0x00, 0x00, 0x00,         // length = 6 + 3
        0x02, 0x00,                     // opcode
        0x04, 0x03, 0x02, 0x01,         // correlation id
        0xAA, 0xBB, 0xCC,
    };
    EXPECT_EQ(r.value(), expected);
}

TEST(HostLinkProtocolTest, EmptyPayloadFrameIsTenBytes) {
    auto r = encodeFrame(OP_GET_DRIVES, 7, nullptr, 0);
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value().size(), FRAME_OVERHEAD);
    EXPECT_EQ(get_u32(r.value().data()), FIXED_HEADER_SIZE);
}

TEST(HostLinkProtocolTest, EncodeRejectsOversizedPayload) {
    std::vector<uint8_t> big(101);
    auto r = encodeFrame(OP_WRITE_CHUNK, 1, big.data(), big.size(), 100);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::FrameTooLarge);

    EXPECT_TRUE(encodeFrame(OP_WRITE_CHUNK, 1, big.data(), 100, 100).is_ok());
}

// ---------------------------------------------------------------------------
// readFrame
// ---------------------------------------------------------------------------
TEST(HostLinkProtocolTest, ReadFrameAcrossSingleByteReads) {
    Frame f;
    f.opcode = OP_DATA;
    f.correlation_id = 42;
    f.payload = {1, 2, 3, 4, 5};

    ScriptedReader src;
    src.data = encodeFrame(f).value();
    src.step = 1;
    auto r = readFrame(src.fn());
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().opcode, OP_DATA);
    EXPECT_EQ(r.value().correlation_id, 42u);
    EXPECT_EQ(r.value().payload, f.payload);
}

TEST(HostLinkProtocolTest, ReadFrameConsumesExactlyOneFrame) {
    ScriptedReader src;
    auto a = encodeFrame(OP_OK, 1, nullptr, 0).value();
    const uint8_t p[] = {9};
    auto b = encodeFrame(OP_DATA, 2, p, 1).value();
    src.data = a;
    src.data.insert(src.data.end(), b.begin(), b.end());

    auto fn = src.fn();
    auto first = readFrame(fn);
    auto second = readFrame(fn);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(first.value().correlation_id, 1u);
    EXPECT_EQ(second.value().correlation_id, 2u);
    EXPECT_EQ(second.value().payload, std::vector<uint8_t>{9});
}

TEST(HostLinkProtocolTest, CleanEndOfStreamIsLinkLost) {
    ScriptedReader src;
    auto r = readFrame(src.fn());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::LinkLost);
}

TEST(HostLinkProtocolTest, EndOfStreamInsideFrameIsTruncated) {
    const uint8_t p[] = {1, 2, 3, 4};
    auto bytes = encodeFrame(OP_DATA, 5, p, sizeof(p)).value();

    // Inside the length field, inside the header and inside the payload
    for (size_t cut : {2u, 7u, 12u}) {
        ScriptedReader src;
        src.data.assign(bytes.begin(), bytes.begin() + (std::ptrdiff_t)cut);
        auto r = readFrame(src.fn());
        ASSERT_TRUE(r.is_err()) << "cut " << cut;
        EXPECT_EQ(r.error().kind, ErrorKind::Truncated) << "cut " << cut;
    }
}

TEST(HostLinkProtocolTest, LengthBelowHeaderIsMalformed) {
    ScriptedReader src;
    src.data = {0x05, 0, 0, 0, 0, 0, 0, 0, 0};
    auto r = readFrame(src.fn());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Malformed);
}

TEST(HostLinkProtocolTest, AnnouncedPayloadAboveMaxIsMalformed) {
    ScriptedReader src;
    src.data.resize(4);
    put_u32(src.data.data(), (uint32_t)(FIXED_HEADER_SIZE + 2048));
    auto r = readFrame(src.fn(), 1024);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Malformed);
    EXPECT_EQ(src.pos, 4u) << "payload must not be read";
}

TEST(HostLinkProtocolTest, ReadErrorsPassThrough) {
    ReadFn failing = [](uint8_t*, size_t) -> Result<size_t> {
        return Err<size_t>(ErrorKind::LinkLost, "usb gone");
    };
    auto r = readFrame(failing);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().message, "usb gone");
}

// ---------------------------------------------------------------------------
// FrameParser
// ---------------------------------------------------------------------------
TEST(FrameParserTest, ReassemblesSplitFrames) {
    const uint8_t p[] = {0x10, 0x20};
    auto a = encodeFrame(OP_READ_CHUNK, 11, p, 2).value();
    auto b = encodeFrame(OP_WRITE_END, 12, nullptr, 0).value();
    std::vector<uint8_t> stream = a;
    stream.insert(stream.end(), b.begin(), b.end());

    FrameParser parser;
    parser.feed(stream.data(), 5);
    auto none = parser.next();
    ASSERT_TRUE(none.is_ok());
    EXPECT_FALSE(none.value().has_value());

    parser.feed(stream.data() + 5, stream.size() - 5);
    auto first = parser.next();
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(first.value().has_value());
    EXPECT_EQ(first.value()->correlation_id, 11u);
    EXPECT_EQ(first.value()->payload, std::vector<uint8_t>(p, p + 2));

    auto second = parser.next();
    ASSERT_TRUE(second.is_ok());
    ASSERT_TRUE(second.value().has_value());
    EXPECT_EQ(second.value()->opcode, OP_WRITE_END);
    EXPECT_EQ(parser.buffered(), 0u);
}

TEST(FrameParserTest, MalformedLengthDiscardsBuffer) {
    FrameParser parser(16);
    std::vector<uint8_t> bad(4);
    put_u32(bad.data(), 6 + 17);
    parser.feed(bad.data(), bad.size());

    auto r = parser.next();
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Malformed);
    EXPECT_EQ(parser.buffered(), 0u);
}

// ---------------------------------------------------------------------------
// Names
// ---------------------------------------------------------------------------
TEST(HostLinkProtocolTest, OpcodeAndErrorNames) {
    EXPECT_STREQ(opcodeName(OP_HANDSHAKE), "HANDSHAKE");
    EXPECT_STREQ(opcodeName(OP_WRITE_END), "WRITE_END");
    EXPECT_STREQ(opcodeName(OP_DISCONNECT), "DISCONNECT");
    EXPECT_STREQ(opcodeName(0x1234), "UNKNOWN");
    EXPECT_STREQ(hostErrorName(HOST_NOT_EMPTY), "not empty");
    EXPECT_TRUE(isResponse(OP_DATA));
    EXPECT_FALSE(isResponse(OP_READ_CHUNK));
}
