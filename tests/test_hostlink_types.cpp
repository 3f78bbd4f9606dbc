// =============================================================================
// Unit tests for the shared data model (src/hostlink_types.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "hostlink_types.hpp"

using namespace hostlink;

static FileItem makeItem(const std::string& name, bool dir, uint64_t size = 0, int64_t mtime = 0) {
    FileItem it;
    it.name = name;
    it.path = "/" + name;
    it.is_directory = dir;
    it.size_bytes = size;
    it.modified_at = mtime;
    return it;
}

static std::vector<std::string> names(const std::vector<FileItem>& items) {
    std::vector<std::string> out;
    for (const auto& it : items) out.push_back(it.name);
    return out;
}

// ---------------------------------------------------------------------------
// ConnectionState
// ---------------------------------------------------------------------------
TEST(ConnectionStateTest, ToString) {
    EXPECT_EQ(ConnectionState::disconnected().toString(), "Disconnected");
    EXPECT_EQ(ConnectionState::permissionRequired().toString(), "PermissionRequired");
    EXPECT_EQ(ConnectionState::connecting(TransportKind::AdbTunnel).toString(), "Connecting(AdbTunnel)");
    EXPECT_EQ(ConnectionState::connected(TransportKind::UsbDirect).toString(), "Connected(UsbDirect)");
    EXPECT_EQ(ConnectionState::error("host unreachable").toString(), "Error(host unreachable)");
}

TEST(ConnectionStateTest, EqualityIgnoresUnusedFields) {
    auto a = ConnectionState::disconnected();
    auto b = ConnectionState::disconnected();
    b.transport = TransportKind::SimulatedTcp;
    EXPECT_EQ(a, b);

    EXPECT_NE(ConnectionState::connected(TransportKind::UsbDirect),
              ConnectionState::connected(TransportKind::AdbTunnel));
    EXPECT_NE(ConnectionState::error("a"), ConnectionState::error("b"));
    EXPECT_TRUE(ConnectionState::connected(TransportKind::SimulatedTcp).isConnected());
    EXPECT_FALSE(ConnectionState::connecting(TransportKind::SimulatedTcp).isConnected());
}

// ---------------------------------------------------------------------------
// FileItem helpers
// ---------------------------------------------------------------------------
TEST(FileItemTest, Extension) {
    EXPECT_EQ(makeItem("photo.JPG", false).extension(), "JPG");
    EXPECT_EQ(makeItem("archive.tar.gz", false).extension(), "gz");
    EXPECT_EQ(makeItem("README", false).extension(), "");
    EXPECT_EQ(makeItem("trailing.", false).extension(), "");
    EXPECT_EQ(makeItem("dir.d", true).extension(), "");
}

TEST(FileItemTest, FormatBytes) {
    EXPECT_EQ(formatBytes(0), "0 B");
    EXPECT_EQ(formatBytes(1023), "1023 B");
    EXPECT_EQ(formatBytes(2048), "2 KB");
    EXPECT_EQ(formatBytes(5ULL * 1024 * 1024), "5 MB");
    EXPECT_EQ(formatBytes(3ULL * 1024 * 1024 * 1024 / 2), "1.50 GB");
}

// ---------------------------------------------------------------------------
// Sorting
// ---------------------------------------------------------------------------
TEST(SortFileItemsTest, DirectoriesFirstThenNameCaseInsensitive) {
    std::vector<FileItem> items = {
        makeItem("beta.txt", false), makeItem("Zeta", true), makeItem("alpha.txt", false),
        makeItem("apps", true),
    };
    sortFileItems(items, SortOrder{});
    EXPECT_EQ(names(items), (std::vector<std::string>{"apps", "Zeta", "alpha.txt", "beta.txt"}));
}

TEST(SortFileItemsTest, DescendingKeepsDirectoriesFirst) {
    std::vector<FileItem> items = {
        makeItem("a", false, 10), makeItem("d1", true), makeItem("b", false, 30), makeItem("c", false, 20),
    };
    sortFileItems(items, SortOrder{SortField::Size, false});
    EXPECT_EQ(names(items), (std::vector<std::string>{"d1", "b", "c", "a"}));
}

TEST(SortFileItemsTest, ByModifiedAtAndType) {
    std::vector<FileItem> items = {
        makeItem("x.png", false, 0, 300), makeItem("y.doc", false, 0, 100), makeItem("z.apk", false, 0, 200),
    };
    sortFileItems(items, SortOrder{SortField::ModifiedAt, true});
    EXPECT_EQ(names(items), (std::vector<std::string>{"y.doc", "z.apk", "x.png"}));

    sortFileItems(items, SortOrder{SortField::Type, true});
    EXPECT_EQ(names(items), (std::vector<std::string>{"z.apk", "y.doc", "x.png"}));
}

TEST(SortFileItemsTest, StableForEqualKeys) {
    std::vector<FileItem> items = {
        makeItem("first", false, 5), makeItem("second", false, 5), makeItem("third", false, 5),
    };
    sortFileItems(items, SortOrder{SortField::Size, true});
    EXPECT_EQ(names(items), (std::vector<std::string>{"first", "second", "third"}));
}

TEST(SortFileItemsTest, ToggledFlipsDirectionOnly) {
    SortOrder o{SortField::ModifiedAt, true};
    auto t = o.toggled();
    EXPECT_EQ(t.field, SortField::ModifiedAt);
    EXPECT_FALSE(t.ascending);
}

// ---------------------------------------------------------------------------
// StorageInfo
// ---------------------------------------------------------------------------
TEST(StorageInfoTest, UsedAndPercent) {
    StorageInfo s;
    s.total_bytes = 1000;
    s.free_bytes = 250;
    EXPECT_EQ(s.usedBytes(), 750u);
    EXPECT_FLOAT_EQ(s.usagePercent(), 75.0f);

    StorageInfo empty;
    EXPECT_FLOAT_EQ(empty.usagePercent(), 0.0f);
}

// ---------------------------------------------------------------------------
// TransferTask
// ---------------------------------------------------------------------------
TEST(TransferTaskTest, ProgressPercent) {
    TransferTask t;
    t.total_bytes = 204800;
    t.transferred_bytes = 65536;
    EXPECT_EQ(t.progressPercent(), 32);

    t.transferred_bytes = 204800;
    EXPECT_EQ(t.progressPercent(), 100);
}

TEST(TransferTaskTest, EmptyFileProgress) {
    TransferTask t;
    EXPECT_EQ(t.progressPercent(), 0);
    t.state = TransferState::Completed;
    EXPECT_EQ(t.progressPercent(), 100);
}

TEST(TransferTaskTest, ActiveAndTerminal) {
    TransferTask t;
    for (auto s : {TransferState::Pending, TransferState::InProgress}) {
        t.state = s;
        EXPECT_TRUE(t.isActive());
        EXPECT_FALSE(t.isTerminal());
    }
    t.state = TransferState::Paused;
    EXPECT_FALSE(t.isActive());
    EXPECT_FALSE(t.isTerminal());
    for (auto s : {TransferState::Completed, TransferState::Failed, TransferState::Cancelled}) {
        t.state = s;
        EXPECT_FALSE(t.isActive());
        EXPECT_TRUE(t.isTerminal());
    }
}
