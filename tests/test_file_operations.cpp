// =============================================================================
// Unit tests for FileOperationsClient (src/file_operations_client.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "fake_host.hpp"
#include "file_operations_client.hpp"

using namespace hostlink;
using namespace hostlink::fake;
namespace proto = hostlink::protocol;

class FileOperationsTest : public ::testing::Test {
protected:
    void SetUp() override {
        st.host->addDir("/docs", 3000);
        st.host->addDir("/Music", 1000);
        st.host->addFile("/zeta.txt", pattern(30), 500);
        st.host->addFile("/alpha.bin", pattern(4000), 9000);
        st.host->addFile("/docs/report.txt", pattern(12));
        st.host->addFile("/docs/notes.md", pattern(5));
        ASSERT_TRUE(st.connect());
    }

    static std::vector<std::string> names(const std::vector<FileItem>& items) {
        std::vector<std::string> out;
        for (const auto& it : items) out.push_back(it.name);
        return out;
    }

    Stack st;
    FileOperationsClient ops{st.dispatcher, std::chrono::milliseconds(2000)};
};

TEST(JoinRemotePathTest, AddsSingleSeparator) {
    EXPECT_EQ(joinRemotePath("/sdcard", "DCIM"), "/sdcard/DCIM");
    EXPECT_EQ(joinRemotePath("/sdcard/", "DCIM"), "/sdcard/DCIM");
    EXPECT_EQ(joinRemotePath("C:\\Users\\", "me"), "C:\\Users\\me");
    EXPECT_EQ(joinRemotePath("", "x"), "x");
}

// ---------------------------------------------------------------------------
// Handshake and listing
// ---------------------------------------------------------------------------
TEST_F(FileOperationsTest, HandshakeSendsClientId) {
    auto r = ops.handshake("HostLink/cli");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value(), "FakeHost/1.0");
    EXPECT_EQ(st.host->lastClientId(), "HostLink/cli");
}

TEST_F(FileOperationsTest, ListPutsDirectoriesFirstSortedByName) {
    auto r = ops.list("/");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(names(r.value()), (std::vector<std::string>{"docs", "Music", "alpha.bin", "zeta.txt"}));
    EXPECT_TRUE(r.value()[0].is_directory);
    EXPECT_EQ(r.value()[2].size_bytes, 4000u);
}

TEST_F(FileOperationsTest, ListHonoursSortOrder) {
    auto r = ops.list("/", SortOrder{SortField::ModifiedAt, false});
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(names(r.value()), (std::vector<std::string>{"docs", "Music", "alpha.bin", "zeta.txt"}));

    auto bySize = ops.list("/", SortOrder{SortField::Size, true});
    ASSERT_TRUE(bySize.is_ok());
    EXPECT_EQ(bySize.value()[2].name, "zeta.txt");
    EXPECT_EQ(bySize.value()[3].name, "alpha.bin");
}

TEST_F(FileOperationsTest, ListMissingDirectoryIsRemoteNotFound) {
    auto r = ops.list("/nowhere");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::Remote);
    EXPECT_EQ(r.error().code, (int)proto::HOST_NOT_FOUND);
    EXPECT_EQ(r.error().message, "not found");
}

TEST_F(FileOperationsTest, GetInfoReturnsItem) {
    auto r = ops.getInfo("/docs/report.txt");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value().name, "report.txt");
    EXPECT_EQ(r.value().size_bytes, 12u);
    EXPECT_FALSE(r.value().is_directory);
    EXPECT_EQ(r.value().extension(), "txt");
}

TEST_F(FileOperationsTest, SearchMatchesUnderRoot) {
    auto r = ops.search("report", "/docs");
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value().size(), 1u);
    EXPECT_EQ(r.value()[0].path, "/docs/report.txt");

    auto none = ops.search("alpha", "/docs");
    ASSERT_TRUE(none.is_ok());
    EXPECT_TRUE(none.value().empty());
}

// ---------------------------------------------------------------------------
// Mutations
// ---------------------------------------------------------------------------
TEST_F(FileOperationsTest, CreateFolderJoinsParentAndName) {
    ASSERT_TRUE(ops.createFolder("/docs/", "drafts").is_ok());
    EXPECT_TRUE(st.host->exists("/docs/drafts"));

    auto again = ops.createFolder("/docs", "drafts");
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.error().kind, ErrorKind::Remote);
    EXPECT_EQ(again.error().code, (int)proto::HOST_ALREADY_EXISTS);
}

TEST_F(FileOperationsTest, EmptyNamesAreRejectedWithoutRequest) {
    auto c = ops.createFolder("/docs", "");
    ASSERT_TRUE(c.is_err());
    EXPECT_EQ(c.error().kind, ErrorKind::InvalidArgument);

    auto r = ops.rename("/zeta.txt", "");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::InvalidArgument);

    EXPECT_EQ(st.host->opCount(proto::OP_CREATE_DIR), 0);
    EXPECT_EQ(st.host->opCount(proto::OP_RENAME), 0);
}

TEST_F(FileOperationsTest, RenameKeepsParent) {
    ASSERT_TRUE(ops.rename("/docs/notes.md", "notes-old.md").is_ok());
    EXPECT_FALSE(st.host->exists("/docs/notes.md"));
    EXPECT_TRUE(st.host->exists("/docs/notes-old.md"));
    EXPECT_EQ(st.host->fileData("/docs/notes-old.md"), pattern(5));
}

TEST_F(FileOperationsTest, RemoveAttemptsEveryPath) {
    auto report = ops.remove({"/zeta.txt", "/missing.txt", "/alpha.bin", "/docs"});

    EXPECT_EQ(report.deleted, (std::vector<std::string>{"/zeta.txt", "/alpha.bin"}));
    ASSERT_EQ(report.failed.size(), 2u);
    EXPECT_EQ(report.failed[0].path, "/missing.txt");
    EXPECT_EQ(report.failed[0].error.code, (int)proto::HOST_NOT_FOUND);
    EXPECT_EQ(report.failed[1].path, "/docs");
    EXPECT_EQ(report.failed[1].error.code, (int)proto::HOST_NOT_EMPTY);
    EXPECT_FALSE(report.ok());

    auto s = report.status();
    ASSERT_TRUE(s.is_err());
    EXPECT_EQ(s.error().kind, ErrorKind::Remote);
    EXPECT_NE(s.error().message.find("2 of 4"), std::string::npos);
    EXPECT_NE(s.error().message.find("/missing.txt"), std::string::npos);
    EXPECT_NE(s.error().message.find("/docs"), std::string::npos);
    EXPECT_EQ(st.host->opCount(proto::OP_DELETE), 4);
}

TEST_F(FileOperationsTest, RemoveNothingIsOk) {
    auto report = ops.remove({});
    EXPECT_TRUE(report.ok());
    EXPECT_TRUE(report.status().is_ok());
    EXPECT_EQ(st.host->opCount(proto::OP_DELETE), 0);
}

// ---------------------------------------------------------------------------
// Drives and storage
// ---------------------------------------------------------------------------
TEST_F(FileOperationsTest, DrivesAndStorageInfo) {
    auto drives = ops.getDrives();
    ASSERT_TRUE(drives.is_ok());
    EXPECT_EQ(drives.value(), (std::vector<std::string>{"internal", "sdcard"}));

    auto info = ops.getStorageInfo("sdcard");
    ASSERT_TRUE(info.is_ok());
    EXPECT_EQ(info.value().drive_label, "sdcard");
    EXPECT_EQ(info.value().volume_name, "FakeVolume");
    EXPECT_EQ(info.value().total_bytes, 64ULL << 30);
    EXPECT_EQ(info.value().usedBytes(), 48ULL << 30);
    EXPECT_FLOAT_EQ(info.value().usagePercent(), 75.0f);

    auto bad = ops.getStorageInfo("floppy");
    ASSERT_TRUE(bad.is_err());
    EXPECT_EQ(bad.error().code, (int)proto::HOST_NOT_FOUND);
}

TEST_F(FileOperationsTest, OperationsFailWithLinkLostWhenDisconnected) {
    st.csm.disconnect();
    auto r = ops.list("/");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind, ErrorKind::LinkLost);
}
