// =============================================================================
// HostLink - Wire Protocol
// =============================================================================
// Frame layout (little-endian):
//   length:         4 bytes  (bytes that follow this field = 6 + payload)
//   opcode:         2 bytes
//   correlation id: 4 bytes
//   payload:        length - 6 bytes
// Pure transforms; the only I/O is through the caller-supplied ReadFn.
// =============================================================================
#pragma once
#include <cstdint>
#include <cstddef>
#include <cstring>
#include <functional>
#include <optional>
#include <vector>
#include "result.hpp"

namespace hostlink::protocol {

static constexpr size_t LENGTH_FIELD_SIZE = 4;
static constexpr size_t FIXED_HEADER_SIZE = 6;   // opcode + correlation id
static constexpr size_t FRAME_OVERHEAD = LENGTH_FIELD_SIZE + FIXED_HEADER_SIZE;
static constexpr uint32_t DEFAULT_MAX_PAYLOAD = 1024 * 1024;

// Requests (client -> host)
static constexpr uint16_t OP_HANDSHAKE        = 0x01;
static constexpr uint16_t OP_LIST_DIR         = 0x02;
static constexpr uint16_t OP_GET_FILE_INFO    = 0x03;
static constexpr uint16_t OP_READ_CHUNK       = 0x04;
static constexpr uint16_t OP_WRITE_BEGIN      = 0x05;
static constexpr uint16_t OP_CREATE_DIR       = 0x06;
static constexpr uint16_t OP_DELETE           = 0x07;
static constexpr uint16_t OP_RENAME           = 0x08;
static constexpr uint16_t OP_SEARCH           = 0x09;
static constexpr uint16_t OP_GET_DRIVES       = 0x0A;
static constexpr uint16_t OP_GET_STORAGE_INFO = 0x0B;
static constexpr uint16_t OP_WRITE_CHUNK      = 0x0C;
static constexpr uint16_t OP_WRITE_END        = 0x0D;
static constexpr uint16_t OP_DISCONNECT       = 0xFF;

// Responses (host -> client)
static constexpr uint16_t OP_OK    = 0x80;
static constexpr uint16_t OP_ERROR = 0x81;
static constexpr uint16_t OP_DATA  = 0x82;

// Host error codes carried in ERROR payloads
static constexpr uint32_t HOST_SUCCESS           = 0;
static constexpr uint32_t HOST_UNKNOWN_COMMAND   = 1;
static constexpr uint32_t HOST_INVALID_PATH      = 2;
static constexpr uint32_t HOST_NOT_FOUND         = 3;
static constexpr uint32_t HOST_PERMISSION_DENIED = 4;
static constexpr uint32_t HOST_ALREADY_EXISTS    = 5;
static constexpr uint32_t HOST_NOT_EMPTY         = 6;
static constexpr uint32_t HOST_NO_SPACE          = 7;
static constexpr uint32_t HOST_IO_ERROR          = 8;
static constexpr uint32_t HOST_TIMEOUT           = 9;
static constexpr uint32_t HOST_PROTOCOL_ERROR    = 10;

struct Frame {
    uint16_t opcode = 0;
    uint32_t correlation_id = 0;
    std::vector<uint8_t> payload;
};

// =============================================================================
// Little-endian helpers
// =============================================================================
inline void put_u16(uint8_t* p, uint16_t v) {
    p[0] = (uint8_t)(v & 0xFF);
    p[1] = (uint8_t)(v >> 8);
}
inline void put_u32(uint8_t* p, uint32_t v) {
    for (int i = 0; i < 4; ++i) p[i] = (uint8_t)(v >> (8 * i));
}
inline void put_u64(uint8_t* p, uint64_t v) {
    for (int i = 0; i < 8; ++i) p[i] = (uint8_t)(v >> (8 * i));
}
inline uint16_t get_u16(const uint8_t* p) {
    return (uint16_t)(p[0] | (p[1] << 8));
}
inline uint32_t get_u32(const uint8_t* p) {
    return (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16) | ((uint32_t)p[3] << 24);
}
inline uint64_t get_u64(const uint8_t* p) {
    uint64_t v = 0;
    for (int i = 7; i >= 0; --i) v = (v << 8) | p[i];
    return v;
}

// =============================================================================
// Encode / decode
// =============================================================================

// FrameTooLarge if payload exceeds max_payload
Result<std::vector<uint8_t>> encodeFrame(uint16_t opcode, uint32_t correlation_id,
                                         const uint8_t* payload, size_t payload_len,
                                         uint32_t max_payload = DEFAULT_MAX_PAYLOAD);

inline Result<std::vector<uint8_t>> encodeFrame(const Frame& f,
                                                uint32_t max_payload = DEFAULT_MAX_PAYLOAD) {
    return encodeFrame(f.opcode, f.correlation_id, f.payload.data(), f.payload.size(), max_payload);
}

// Blocking byte source: fills up to `len` bytes, returns the count read.
// Zero means the stream ended.
using ReadFn = std::function<Result<size_t>(uint8_t* buf, size_t len)>;

// Consumes exactly one frame.
//   LinkLost   stream ended cleanly before the first byte
//   Truncated  stream ended inside a frame
//   Malformed  length shorter than the fixed header or payload above max
// Errors from `read` are passed through.
Result<Frame> readFrame(const ReadFn& read, uint32_t max_payload = DEFAULT_MAX_PAYLOAD);

// Incremental parser over accumulated bytes (used where data arrives in
// arbitrary pieces, e.g. the in-memory test host).
class FrameParser {
public:
    explicit FrameParser(uint32_t max_payload = DEFAULT_MAX_PAYLOAD) : max_payload_(max_payload) {}

    void feed(const uint8_t* data, size_t len);

    // Ok(nullopt) when more bytes are needed. After a Malformed error the
    // buffered data is discarded; the stream cannot be resynchronized.
    Result<std::optional<Frame>> next();

    size_t buffered() const { return buf_.size() - pos_; }
    void reset() { buf_.clear(); pos_ = 0; }

private:
    uint32_t max_payload_;
    std::vector<uint8_t> buf_;
    size_t pos_ = 0;
};

const char* opcodeName(uint16_t opcode);
const char* hostErrorName(uint32_t code);

inline bool isResponse(uint16_t opcode) {
    return opcode == OP_OK || opcode == OP_ERROR || opcode == OP_DATA;
}

} // namespace hostlink::protocol
