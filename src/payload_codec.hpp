// =============================================================================
// HostLink - Payload Codec
// =============================================================================
// Request and response payload layouts (little-endian):
//   string        u32 length + UTF-8 bytes
//   file item     name, path, u8 flags (bit0 = dir), u64 size, u64 mtime ms,
//                 u32 permission bits
//   file list     u32 count + items
//   drive list    u32 count + strings
//   storage info  u64 total, u64 free, label, volume name
//   error         u32 code + message
//   read chunk    path, u64 offset, u64 length
//   write begin   path, u64 total, u32 chunk size, u64 start offset
//   write chunk   u64 offset + raw bytes
//   write end     u64 total written
// Short or inconsistent input decodes to ErrorKind::Malformed.
// Both directions are provided; the host side is used by tests.
// =============================================================================
#pragma once
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "hostlink_types.hpp"
#include "result.hpp"

namespace hostlink::protocol {

using Bytes = std::vector<uint8_t>;

static constexpr uint8_t FILE_FLAG_DIRECTORY = 0x01;

class PayloadWriter {
public:
    PayloadWriter& u8(uint8_t v);
    PayloadWriter& u32(uint32_t v);
    PayloadWriter& u64(uint64_t v);
    PayloadWriter& str(const std::string& s);
    PayloadWriter& raw(const uint8_t* data, size_t len);

    const Bytes& bytes() const { return out_; }
    Bytes take() { return std::move(out_); }

private:
    Bytes out_;
};

// Bounds-checked cursor. Each read returns false without consuming when the
// remaining input is too short.
class PayloadReader {
public:
    PayloadReader(const uint8_t* data, size_t len) : data_(data), len_(len) {}
    explicit PayloadReader(const Bytes& b) : PayloadReader(b.data(), b.size()) {}

    bool u8(uint8_t& v);
    bool u32(uint32_t& v);
    bool u64(uint64_t& v);
    bool str(std::string& s);

    size_t remaining() const { return len_ - pos_; }
    const uint8_t* cursor() const { return data_ + pos_; }

private:
    const uint8_t* data_;
    size_t len_;
    size_t pos_ = 0;
};

struct RenameRequest {
    std::string path;
    std::string new_name;
};

struct SearchRequest {
    std::string query;
    std::string root_path;
};

struct ReadChunkRequest {
    std::string path;
    uint64_t offset = 0;
    uint64_t length = 0;
};

struct WriteBeginRequest {
    std::string path;
    uint64_t total_size = 0;
    uint32_t chunk_size = 0;
    uint64_t start_offset = 0;
};

struct WriteChunkRequest {
    uint64_t offset = 0;
    Bytes data;
};

struct ErrorRecord {
    uint32_t code = 0;
    std::string message;
};

// --- Requests ---
Bytes encodeString(const std::string& s);   // path, handshake client id
Bytes encodeRename(const RenameRequest& r);
Bytes encodeSearch(const SearchRequest& r);
Bytes encodeReadChunk(const ReadChunkRequest& r);
Bytes encodeWriteBegin(const WriteBeginRequest& r);
Bytes encodeWriteChunk(uint64_t offset, const uint8_t* data, size_t len);
Bytes encodeWriteEnd(uint64_t total_written);

Result<std::string> decodeString(const Bytes& p);
Result<RenameRequest> decodeRename(const Bytes& p);
Result<SearchRequest> decodeSearch(const Bytes& p);
Result<ReadChunkRequest> decodeReadChunk(const Bytes& p);
Result<WriteBeginRequest> decodeWriteBegin(const Bytes& p);
Result<WriteChunkRequest> decodeWriteChunk(const Bytes& p);
Result<uint64_t> decodeWriteEnd(const Bytes& p);

// --- Responses ---
Bytes encodeFileItem(const FileItem& item);
Bytes encodeFileList(const std::vector<FileItem>& items);
Bytes encodeDriveList(const std::vector<std::string>& drives);
Bytes encodeStorageInfo(const StorageInfo& info);
Bytes encodeError(const ErrorRecord& e);

Result<FileItem> decodeFileItem(const Bytes& p);
Result<std::vector<FileItem>> decodeFileList(const Bytes& p);
Result<std::vector<std::string>> decodeDriveList(const Bytes& p);
// free_bytes is clamped to total_bytes
Result<StorageInfo> decodeStorageInfo(const Bytes& p);
Result<ErrorRecord> decodeError(const Bytes& p);

} // namespace hostlink::protocol
