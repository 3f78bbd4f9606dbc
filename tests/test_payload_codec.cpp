// =============================================================================
// Unit tests for request/response payloads (src/payload_codec.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "hostlink_protocol.hpp"
#include "payload_codec.hpp"

using namespace hostlink;
using namespace hostlink::protocol;

// ---------------------------------------------------------------------------
// Primitive layout
// ---------------------------------------------------------------------------
TEST(PayloadCodecTest, StringIsLengthPrefixed) {
    auto b = encodeString("/sdcard");
    ASSERT_EQ(b.size(), 4u + 7u);
    EXPECT_EQ(get_u32(b.data()), 7u);
    EXPECT_EQ(std::string(b.begin() + 4, b.end()), "/sdcard");

    auto back = decodeString(b);
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.value(), "/sdcard");
}

TEST(PayloadCodecTest, Utf8NamesSurvive) {
    const std::string name = "\xE5\x86\x99\xE7\x9C\x9F.jpg";
    auto back = decodeString(encodeString(name));
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.value(), name);
}

TEST(PayloadCodecTest, ReaderDoesNotConsumeOnShortInput) {
    Bytes b = {1, 2, 3};
    PayloadReader r(b);
    uint32_t v = 0;
    EXPECT_FALSE(r.u32(v));
    EXPECT_EQ(r.remaining(), 3u);
    uint8_t x = 0;
    EXPECT_TRUE(r.u8(x));
    EXPECT_EQ(x, 1);
}

TEST(PayloadCodecTest, StringLengthPastEndIsMalformed) {
    Bytes b = PayloadWriter().u32(100).raw(reinterpret_cast<const uint8_t*>("abc"), 3).take();
    auto r = decodeString(b);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Malformed);
}

// ---------------------------------------------------------------------------
// Requests
// ---------------------------------------------------------------------------
TEST(PayloadCodecTest, ReadChunkRequest) {
    ReadChunkRequest req{"/host/a.bin", 131072, 65536};
    auto b = encodeReadChunk(req);
    EXPECT_EQ(b.size(), 4u + 11u + 8u + 8u);

    auto back = decodeReadChunk(b);
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.value().path, "/host/a.bin");
    EXPECT_EQ(back.value().offset, 131072u);
    EXPECT_EQ(back.value().length, 65536u);
}

TEST(PayloadCodecTest, WriteBeginCarriesResumeOffset) {
    WriteBeginRequest req{"/up/b.bin", 5000, 1024, 2048};
    auto back = decodeWriteBegin(encodeWriteBegin(req));
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.value().total_size, 5000u);
    EXPECT_EQ(back.value().chunk_size, 1024u);
    EXPECT_EQ(back.value().start_offset, 2048u);
}

TEST(PayloadCodecTest, WriteChunkKeepsRawBytes) {
    const uint8_t data[] = {0, 0xFF, 0x10};
    auto b = encodeWriteChunk(4096, data, sizeof(data));
    ASSERT_EQ(b.size(), 8u + 3u);

    auto back = decodeWriteChunk(b);
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.value().offset, 4096u);
    EXPECT_EQ(back.value().data, Bytes(data, data + 3));

    EXPECT_TRUE(decodeWriteChunk(Bytes{1, 2}).is_err());
}

TEST(PayloadCodecTest, RenameAndSearch) {
    auto rn = decodeRename(encodeRename(RenameRequest{"/a/old.txt", "new.txt"}));
    ASSERT_TRUE(rn.is_ok());
    EXPECT_EQ(rn.value().path, "/a/old.txt");
    EXPECT_EQ(rn.value().new_name, "new.txt");

    auto s = decodeSearch(encodeSearch(SearchRequest{"report", "/docs"}));
    ASSERT_TRUE(s.is_ok());
    EXPECT_EQ(s.value().query, "report");
    EXPECT_EQ(s.value().root_path, "/docs");

    EXPECT_TRUE(decodeRename(encodeString("/only-path")).is_err());
}

// ---------------------------------------------------------------------------
// Responses
// ---------------------------------------------------------------------------
TEST(PayloadCodecTest, FileListPreservesEntries) {
    FileItem dir;
    dir.name = "DCIM";
    dir.path = "/DCIM";
    dir.is_directory = true;
    dir.modified_at = 1700000000000LL;
    dir.permission_bits = 0755;

    FileItem file;
    file.name = "a.bin";
    file.path = "/a.bin";
    file.size_bytes = 204800;
    file.modified_at = 1700000000123LL;
    file.permission_bits = 0644;

    auto back = decodeFileList(encodeFileList({dir, file}));
    ASSERT_TRUE(back.is_ok());
    ASSERT_EQ(back.value().size(), 2u);
    EXPECT_TRUE(back.value()[0].is_directory);
    EXPECT_EQ(back.value()[0].permission_bits, 0755u);
    EXPECT_FALSE(back.value()[1].is_directory);
    EXPECT_EQ(back.value()[1].size_bytes, 204800u);
    EXPECT_EQ(back.value()[1].modified_at, 1700000000123LL);
}

TEST(PayloadCodecTest, FileListCountBeyondDataIsMalformed) {
    FileItem file;
    file.name = "x";
    file.path = "/x";
    Bytes b = encodeFileList({file});
    put_u32(b.data(), 1000000);
    auto r = decodeFileList(b);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Malformed);
}

TEST(PayloadCodecTest, DriveList) {
    auto back = decodeDriveList(encodeDriveList({"C:", "D:"}));
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.value(), (std::vector<std::string>{"C:", "D:"}));

    auto empty = decodeDriveList(encodeDriveList({}));
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value().empty());
}

TEST(PayloadCodecTest, StorageInfoClampsFreeToTotal) {
    StorageInfo in;
    in.drive_label = "C:";
    in.volume_name = "System";
    in.total_bytes = 1000;
    in.free_bytes = 5000;

    auto back = decodeStorageInfo(encodeStorageInfo(in));
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.value().drive_label, "C:");
    EXPECT_EQ(back.value().volume_name, "System");
    EXPECT_EQ(back.value().free_bytes, 1000u);
    EXPECT_EQ(back.value().usedBytes(), 0u);
}

TEST(PayloadCodecTest, ErrorRecord) {
    auto b = encodeError(ErrorRecord{HOST_NOT_FOUND, "no such file"});
    EXPECT_EQ(get_u32(b.data()), HOST_NOT_FOUND);

    auto back = decodeError(b);
    ASSERT_TRUE(back.is_ok());
    EXPECT_EQ(back.value().code, HOST_NOT_FOUND);
    EXPECT_EQ(back.value().message, "no such file");

    EXPECT_TRUE(decodeError(Bytes{1, 0}).is_err());
}
