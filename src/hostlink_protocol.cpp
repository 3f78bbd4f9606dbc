#include "hostlink_protocol.hpp"
#include "hostlink_log.hpp"

namespace hostlink::protocol {

Result<std::vector<uint8_t>> encodeFrame(uint16_t opcode, uint32_t correlation_id,
                                         const uint8_t* payload, size_t payload_len,
                                         uint32_t max_payload) {
    if (payload_len > max_payload) {
        return Err<std::vector<uint8_t>>(ErrorKind::FrameTooLarge,
            "payload " + std::to_string(payload_len) + " > max " + std::to_string(max_payload));
    }
    std::vector<uint8_t> out(FRAME_OVERHEAD + payload_len);
    put_u32(out.data(), (uint32_t)(FIXED_HEADER_SIZE + payload_len));
    put_u16(out.data() + 4, opcode);
    put_u32(out.data() + 6, correlation_id);
    if (payload_len > 0) memcpy(out.data() + FRAME_OVERHEAD, payload, payload_len);
    return Ok(std::move(out));
}

// Reads exactly `len` bytes. `started` tells whether any byte of the frame
// was consumed before this call.
static Status readExact(const ReadFn& read, uint8_t* buf, size_t len, bool started) {
    size_t got = 0;
    while (got < len) {
        auto r = read(buf + got, len - got);
        if (r.is_err()) return r.error();
        size_t n = r.value();
        if (n == 0) {
            if (!started && got == 0) return Error(ErrorKind::LinkLost, "stream closed");
            return Error(ErrorKind::Truncated,
                         "stream closed after " + std::to_string(got) + "/" + std::to_string(len) + " bytes");
        }
        got += n;
    }
    return Ok();
}

Result<Frame> readFrame(const ReadFn& read, uint32_t max_payload) {
    uint8_t len_buf[LENGTH_FIELD_SIZE];
    auto s = readExact(read, len_buf, sizeof(len_buf), false);
    if (s.is_err()) return s.error();

    uint32_t length = get_u32(len_buf);
    if (length < FIXED_HEADER_SIZE) {
        return Err<Frame>(ErrorKind::Malformed, "frame length " + std::to_string(length) + " below header size");
    }
    if (length - FIXED_HEADER_SIZE > max_payload) {
        return Err<Frame>(ErrorKind::Malformed,
            "announced payload " + std::to_string(length - FIXED_HEADER_SIZE) + " > max " + std::to_string(max_payload));
    }

    uint8_t hdr[FIXED_HEADER_SIZE];
    s = readExact(read, hdr, sizeof(hdr), true);
    if (s.is_err()) return s.error();

    Frame f;
    f.opcode = get_u16(hdr);
    f.correlation_id = get_u32(hdr + 2);
    f.payload.resize(length - FIXED_HEADER_SIZE);
    if (!f.payload.empty()) {
        s = readExact(read, f.payload.data(), f.payload.size(), true);
        if (s.is_err()) return s.error();
    }
    return Ok(std::move(f));
}

void FrameParser::feed(const uint8_t* data, size_t len) {
    // Compact consumed prefix before growing
    if (pos_ > 0 && pos_ >= buf_.size() / 2) {
        buf_.erase(buf_.begin(), buf_.begin() + (ptrdiff_t)pos_);
        pos_ = 0;
    }
    buf_.insert(buf_.end(), data, data + len);
}

Result<std::optional<Frame>> FrameParser::next() {
    using R = Result<std::optional<Frame>>;
    size_t avail = buf_.size() - pos_;
    if (avail < LENGTH_FIELD_SIZE) return R(std::optional<Frame>{});

    const uint8_t* p = buf_.data() + pos_;
    uint32_t length = get_u32(p);
    if (length < FIXED_HEADER_SIZE || length - FIXED_HEADER_SIZE > max_payload_) {
        HLOG_WARN("codec", "Malformed frame length %u, dropping %zu buffered bytes", length, avail);
        reset();
        return Err<std::optional<Frame>>(ErrorKind::Malformed, "bad frame length " + std::to_string(length));
    }
    if (avail < LENGTH_FIELD_SIZE + length) return R(std::optional<Frame>{});

    Frame f;
    f.opcode = get_u16(p + 4);
    f.correlation_id = get_u32(p + 6);
    f.payload.assign(p + FRAME_OVERHEAD, p + LENGTH_FIELD_SIZE + length);
    pos_ += LENGTH_FIELD_SIZE + length;
    return R(std::optional<Frame>(std::move(f)));
}

const char* opcodeName(uint16_t opcode) {
    switch (opcode) {
        case OP_HANDSHAKE:        return "HANDSHAKE";
        case OP_LIST_DIR:         return "LIST_DIR";
        case OP_GET_FILE_INFO:    return "GET_FILE_INFO";
        case OP_READ_CHUNK:       return "READ_CHUNK";
        case OP_WRITE_BEGIN:      return "WRITE_BEGIN";
        case OP_CREATE_DIR:       return "CREATE_DIR";
        case OP_DELETE:           return "DELETE";
        case OP_RENAME:           return "RENAME";
        case OP_SEARCH:           return "SEARCH";
        case OP_GET_DRIVES:       return "GET_DRIVES";
        case OP_GET_STORAGE_INFO: return "GET_STORAGE_INFO";
        case OP_WRITE_CHUNK:      return "WRITE_CHUNK";
        case OP_WRITE_END:        return "WRITE_END";
        case OP_DISCONNECT:       return "DISCONNECT";
        case OP_OK:               return "OK";
        case OP_ERROR:            return "ERROR";
        case OP_DATA:             return "DATA";
        default:                  return "UNKNOWN";
    }
}

const char* hostErrorName(uint32_t code) {
    switch (code) {
        case HOST_SUCCESS:           return "success";
        case HOST_UNKNOWN_COMMAND:   return "unknown command";
        case HOST_INVALID_PATH:      return "invalid path";
        case HOST_NOT_FOUND:         return "not found";
        case HOST_PERMISSION_DENIED: return "permission denied";
        case HOST_ALREADY_EXISTS:    return "already exists";
        case HOST_NOT_EMPTY:         return "not empty";
        case HOST_NO_SPACE:          return "no space";
        case HOST_IO_ERROR:          return "io error";
        case HOST_TIMEOUT:           return "timeout";
        case HOST_PROTOCOL_ERROR:    return "protocol error";
        default:                     return "unknown error";
    }
}

} // namespace hostlink::protocol
