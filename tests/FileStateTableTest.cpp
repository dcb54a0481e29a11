#include <gtest/gtest.h>

#include "mirrorsync/FileStateTable.hpp"
#include "mirrorsync/MockTransportClient.hpp"
#include "TestSupport.hpp"

using namespace mirrorsync;
using test::readFile;

namespace {

class DiffTest : public ::testing::Test {
protected:
    test::TempDir local;
    MockTransportClient server;
    test::RecordingReporter reporter;
    FileStateTable table;

    void SetUp() override {
        std::string err;
        SessionOptions opt;
        opt.host = "h";
        opt.username = "u";
        ASSERT_TRUE(server.connect(opt, err)) << err;
        server.makeDir("/data");
    }

    bool cycle() { return diffAndReconcile(server, "/data", local.str(), table, reporter); }
};

} // namespace

TEST_F(DiffTest, NewRemoteFileIsDownloadedOnce) {
    server.putFile("/data/a.txt", "0123456789");
    EXPECT_TRUE(cycle());
    EXPECT_EQ(readFile(local.path() / "a.txt"), "0123456789");
    ASSERT_NE(table.find("a.txt"), nullptr);
    EXPECT_EQ(table.find("a.txt")->size, 10);

    // Nothing changed: no second transfer
    EXPECT_FALSE(cycle());
    EXPECT_FALSE(cycle());
    EXPECT_EQ(server.downloadCount("/data/a.txt"), 1);
}

TEST_F(DiffTest, SizeChangeTriggersDownload) {
    server.putFile("/data/a.txt", "short");
    ASSERT_TRUE(cycle());
    server.putFile("/data/a.txt", "much longer content");
    EXPECT_TRUE(cycle());
    EXPECT_EQ(readFile(local.path() / "a.txt"), "much longer content");
    EXPECT_EQ(server.downloadCount("/data/a.txt"), 2);
    EXPECT_TRUE(reporter.contains("FILE CHANGED: a.txt"));
}

TEST_F(DiffTest, RemoteDeletionRemovesLocalCopyAndEntry) {
    server.putFile("/data/a.txt", "x");
    ASSERT_TRUE(cycle());
    ASSERT_TRUE(std::filesystem::exists(local.path() / "a.txt"));

    server.eraseFile("/data/a.txt");
    EXPECT_TRUE(cycle());
    EXPECT_FALSE(std::filesystem::exists(local.path() / "a.txt"));
    EXPECT_FALSE(table.contains("a.txt"));
    EXPECT_TRUE(reporter.contains("FILE DELETED LOCALLY: a.txt"));
}

TEST_F(DiffTest, FailedDownloadIsRetriedNextCycle) {
    server.putFile("/data/a.txt", "data");
    server.failDownloads("/data/a.txt", 1);
    // Nothing was mirrored, so the cycle reports no change
    EXPECT_FALSE(cycle());
    EXPECT_FALSE(table.contains("a.txt"));
    EXPECT_EQ(reporter.errors(ErrorKind::Transfer), 1);

    EXPECT_TRUE(cycle());
    EXPECT_TRUE(table.contains("a.txt"));
    EXPECT_EQ(readFile(local.path() / "a.txt"), "data");
    EXPECT_EQ(server.downloadCount("/data/a.txt"), 2);
}

TEST_F(DiffTest, ListingErrorLeavesTableUntouched) {
    server.putFile("/data/a.txt", "data");
    ASSERT_TRUE(cycle());

    server.setListingFails(true);
    EXPECT_FALSE(cycle());
    EXPECT_TRUE(table.contains("a.txt"));
    EXPECT_TRUE(std::filesystem::exists(local.path() / "a.txt"));
    EXPECT_EQ(reporter.errors(ErrorKind::Listing), 1);
}

TEST_F(DiffTest, SubdirectoriesAreSkipped) {
    server.makeDir("/data/nested");
    server.putFile("/data/nested/inner.txt", "x");
    server.putFile("/data/top.txt", "y");
    EXPECT_TRUE(cycle());
    EXPECT_EQ(table.size(), 1u);
    EXPECT_TRUE(table.contains("top.txt"));
    EXPECT_FALSE(std::filesystem::exists(local.path() / "nested"));
}

TEST_F(DiffTest, DroppedConnectionStopsTheCycle) {
    server.putFile("/data/a.txt", "data");
    server.dropConnection();
    EXPECT_FALSE(cycle());
    EXPECT_TRUE(table.empty());
    EXPECT_FALSE(server.isConnected());
}

TEST(FileStateTableTest, RecordFindErase) {
    FileStateTable t;
    FileState st;
    st.size = 42;
    t.record("a", st);
    t.record("b", st);
    ASSERT_NE(t.find("a"), nullptr);
    EXPECT_EQ(t.find("a")->size, 42);
    EXPECT_EQ(t.names(), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(t.erase("a"));
    EXPECT_FALSE(t.erase("a"));
    t.clear();
    EXPECT_TRUE(t.empty());
}
