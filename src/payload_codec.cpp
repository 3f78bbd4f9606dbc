#include "payload_codec.hpp"
#include "hostlink_log.hpp"
#include "hostlink_protocol.hpp"

namespace hostlink::protocol {

// =============================================================================
// PayloadWriter / PayloadReader
// =============================================================================

PayloadWriter& PayloadWriter::u8(uint8_t v) {
    out_.push_back(v);
    return *this;
}

PayloadWriter& PayloadWriter::u32(uint32_t v) {
    size_t at = out_.size();
    out_.resize(at + 4);
    put_u32(out_.data() + at, v);
    return *this;
}

PayloadWriter& PayloadWriter::u64(uint64_t v) {
    size_t at = out_.size();
    out_.resize(at + 8);
    put_u64(out_.data() + at, v);
    return *this;
}

PayloadWriter& PayloadWriter::str(const std::string& s) {
    u32((uint32_t)s.size());
    out_.insert(out_.end(), s.begin(), s.end());
    return *this;
}

PayloadWriter& PayloadWriter::raw(const uint8_t* data, size_t len) {
    if (len > 0) out_.insert(out_.end(), data, data + len);
    return *this;
}

bool PayloadReader::u8(uint8_t& v) {
    if (remaining() < 1) return false;
    v = data_[pos_++];
    return true;
}

bool PayloadReader::u32(uint32_t& v) {
    if (remaining() < 4) return false;
    v = get_u32(data_ + pos_);
    pos_ += 4;
    return true;
}

bool PayloadReader::u64(uint64_t& v) {
    if (remaining() < 8) return false;
    v = get_u64(data_ + pos_);
    pos_ += 8;
    return true;
}

bool PayloadReader::str(std::string& s) {
    if (remaining() < 4) return false;
    uint32_t n = get_u32(data_ + pos_);
    if (remaining() - 4 < n) return false;
    s.assign(reinterpret_cast<const char*>(data_ + pos_ + 4), n);
    pos_ += 4 + n;
    return true;
}

template<typename T>
static Result<T> malformed(const char* what) {
    return Err<T>(ErrorKind::Malformed, std::string("short or inconsistent ") + what + " payload");
}

// =============================================================================
// Requests
// =============================================================================

Bytes encodeString(const std::string& s) {
    return PayloadWriter().str(s).take();
}

Bytes encodeRename(const RenameRequest& r) {
    return PayloadWriter().str(r.path).str(r.new_name).take();
}

Bytes encodeSearch(const SearchRequest& r) {
    return PayloadWriter().str(r.query).str(r.root_path).take();
}

Bytes encodeReadChunk(const ReadChunkRequest& r) {
    return PayloadWriter().str(r.path).u64(r.offset).u64(r.length).take();
}

Bytes encodeWriteBegin(const WriteBeginRequest& r) {
    return PayloadWriter().str(r.path).u64(r.total_size).u32(r.chunk_size).u64(r.start_offset).take();
}

Bytes encodeWriteChunk(uint64_t offset, const uint8_t* data, size_t len) {
    PayloadWriter w;
    w.u64(offset).raw(data, len);
    return w.take();
}

Bytes encodeWriteEnd(uint64_t total_written) {
    return PayloadWriter().u64(total_written).take();
}

Result<std::string> decodeString(const Bytes& p) {
    PayloadReader r(p);
    std::string s;
    if (!r.str(s)) return malformed<std::string>("string");
    return Ok(std::move(s));
}

Result<RenameRequest> decodeRename(const Bytes& p) {
    PayloadReader r(p);
    RenameRequest req;
    if (!r.str(req.path) || !r.str(req.new_name)) return malformed<RenameRequest>("rename");
    return Ok(std::move(req));
}

Result<SearchRequest> decodeSearch(const Bytes& p) {
    PayloadReader r(p);
    SearchRequest req;
    if (!r.str(req.query) || !r.str(req.root_path)) return malformed<SearchRequest>("search");
    return Ok(std::move(req));
}

Result<ReadChunkRequest> decodeReadChunk(const Bytes& p) {
    PayloadReader r(p);
    ReadChunkRequest req;
    if (!r.str(req.path) || !r.u64(req.offset) || !r.u64(req.length)) {
        return malformed<ReadChunkRequest>("read-chunk");
    }
    return Ok(std::move(req));
}

Result<WriteBeginRequest> decodeWriteBegin(const Bytes& p) {
    PayloadReader r(p);
    WriteBeginRequest req;
    if (!r.str(req.path) || !r.u64(req.total_size) || !r.u32(req.chunk_size) || !r.u64(req.start_offset)) {
        return malformed<WriteBeginRequest>("write-begin");
    }
    return Ok(std::move(req));
}

Result<WriteChunkRequest> decodeWriteChunk(const Bytes& p) {
    PayloadReader r(p);
    WriteChunkRequest req;
    if (!r.u64(req.offset)) return malformed<WriteChunkRequest>("write-chunk");
    req.data.assign(r.cursor(), r.cursor() + r.remaining());
    return Ok(std::move(req));
}

Result<uint64_t> decodeWriteEnd(const Bytes& p) {
    PayloadReader r(p);
    uint64_t total = 0;
    if (!r.u64(total)) return malformed<uint64_t>("write-end");
    return Ok(total);
}

// =============================================================================
// Responses
// =============================================================================

static void writeItem(PayloadWriter& w, const FileItem& item) {
    w.str(item.name)
     .str(item.path)
     .u8(item.is_directory ? FILE_FLAG_DIRECTORY : 0)
     .u64(item.size_bytes)
     .u64((uint64_t)item.modified_at)
     .u32(item.permission_bits);
}

static bool readItem(PayloadReader& r, FileItem& item) {
    uint8_t flags = 0;
    uint64_t mtime = 0;
    if (!r.str(item.name) || !r.str(item.path) || !r.u8(flags) ||
        !r.u64(item.size_bytes) || !r.u64(mtime) || !r.u32(item.permission_bits)) {
        return false;
    }
    item.is_directory = (flags & FILE_FLAG_DIRECTORY) != 0;
    item.modified_at = (int64_t)mtime;
    return true;
}

Bytes encodeFileItem(const FileItem& item) {
    PayloadWriter w;
    writeItem(w, item);
    return w.take();
}

Bytes encodeFileList(const std::vector<FileItem>& items) {
    PayloadWriter w;
    w.u32((uint32_t)items.size());
    for (const auto& it : items) writeItem(w, it);
    return w.take();
}

Bytes encodeDriveList(const std::vector<std::string>& drives) {
    PayloadWriter w;
    w.u32((uint32_t)drives.size());
    for (const auto& d : drives) w.str(d);
    return w.take();
}

Bytes encodeStorageInfo(const StorageInfo& info) {
    return PayloadWriter()
        .u64(info.total_bytes)
        .u64(info.free_bytes)
        .str(info.drive_label)
        .str(info.volume_name)
        .take();
}

Bytes encodeError(const ErrorRecord& e) {
    return PayloadWriter().u32(e.code).str(e.message).take();
}

Result<FileItem> decodeFileItem(const Bytes& p) {
    PayloadReader r(p);
    FileItem item;
    if (!readItem(r, item)) return malformed<FileItem>("file-item");
    return Ok(std::move(item));
}

Result<std::vector<FileItem>> decodeFileList(const Bytes& p) {
    PayloadReader r(p);
    uint32_t count = 0;
    if (!r.u32(count)) return malformed<std::vector<FileItem>>("file-list");
    std::vector<FileItem> items;
    // Each item needs at least 29 bytes; don't trust count for reserve
    if ((uint64_t)count * 29 <= r.remaining()) items.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        FileItem item;
        if (!readItem(r, item)) return malformed<std::vector<FileItem>>("file-list");
        items.push_back(std::move(item));
    }
    return Ok(std::move(items));
}

Result<std::vector<std::string>> decodeDriveList(const Bytes& p) {
    PayloadReader r(p);
    uint32_t count = 0;
    if (!r.u32(count)) return malformed<std::vector<std::string>>("drive-list");
    std::vector<std::string> drives;
    for (uint32_t i = 0; i < count; ++i) {
        std::string d;
        if (!r.str(d)) return malformed<std::vector<std::string>>("drive-list");
        drives.push_back(std::move(d));
    }
    return Ok(std::move(drives));
}

Result<StorageInfo> decodeStorageInfo(const Bytes& p) {
    PayloadReader r(p);
    StorageInfo info;
    if (!r.u64(info.total_bytes) || !r.u64(info.free_bytes) ||
        !r.str(info.drive_label) || !r.str(info.volume_name)) {
        return malformed<StorageInfo>("storage-info");
    }
    if (info.free_bytes > info.total_bytes) {
        HLOG_WARN("codec", "Storage %s reports free %llu > total %llu, clamping",
                  info.drive_label.c_str(), (unsigned long long)info.free_bytes,
                  (unsigned long long)info.total_bytes);
        info.free_bytes = info.total_bytes;
    }
    return Ok(std::move(info));
}

Result<ErrorRecord> decodeError(const Bytes& p) {
    PayloadReader r(p);
    ErrorRecord e;
    if (!r.u32(e.code) || !r.str(e.message)) return malformed<ErrorRecord>("error");
    return Ok(std::move(e));
}

} // namespace hostlink::protocol
