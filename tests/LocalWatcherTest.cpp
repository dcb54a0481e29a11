#include <gtest/gtest.h>

#include "mirrorsync/LocalWatcher.hpp"
#include "mirrorsync/MockTransportClient.hpp"
#include "TestSupport.hpp"

#include <thread>

using namespace mirrorsync;
using std::chrono::milliseconds;
using Clock = std::chrono::steady_clock;

namespace {

template <typename Pred>
bool waitUntil(Pred pred, milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    while (Clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(milliseconds(10));
    }
    return pred();
}

class LocalWatcherTest : public ::testing::Test {
protected:
    test::TempDir local;
    SyncConfig cfg = test::mockConfig(local.str(), Direction::LocalToRemote);
    MockTransportClient server;
    test::RecordingReporter reporter;
    SessionContext ctx{milliseconds(10)};
    ReconnectSupervisor supervisor{server, cfg.session, reporter, ctx, cfg.tuning.reconnectDelay};

    void SetUp() override {
        std::string err;
        ASSERT_TRUE(server.connect(cfg.session, err)) << err;
        server.makeDir("/data");
    }
};

} // namespace

TEST_F(LocalWatcherTest, RapidWritesUploadOnceAfterDebounce) {
    LocalWatcher watcher(server, cfg, reporter, ctx, supervisor);
    bool ok = false;
    std::thread runner([&] { ok = watcher.run(); });
    ASSERT_TRUE(waitUntil([&] { return reporter.contains("Initial sync complete"); }, milliseconds(3000)));

    const auto start = Clock::now();
    test::writeFile(local.path() / "report.txt", "v1");
    std::this_thread::sleep_for(milliseconds(300));
    test::writeFile(local.path() / "report.txt", "v2-longer");
    std::this_thread::sleep_for(milliseconds(300));
    test::writeFile(local.path() / "report.txt", "v3-final!!");

    // Last write at ~600 ms, so nothing may go out before ~2.6 s
    std::this_thread::sleep_for(milliseconds(1200) - (Clock::now() - start));
    EXPECT_EQ(server.uploadCount("/data/report.txt"), 0);

    ASSERT_TRUE(waitUntil([&] { return server.uploadCount("/data/report.txt") >= 1; }, milliseconds(5000)));
    std::this_thread::sleep_for(milliseconds(500));
    EXPECT_GE(Clock::now() - start, milliseconds(2500));
    EXPECT_EQ(server.uploadCount("/data/report.txt"), 1);
    EXPECT_EQ(server.content("/data/report.txt"), "v3-final!!");

    ctx.requestStop();
    runner.join();
    EXPECT_TRUE(ok);
}

TEST_F(LocalWatcherTest, DeleteUnderRunningWatcherRemovesRemote) {
    test::writeFile(local.path() / "old.txt", "keep me");
    LocalWatcher watcher(server, cfg, reporter, ctx, supervisor);
    bool ok = false;
    std::thread runner([&] { ok = watcher.run(); });
    ASSERT_TRUE(waitUntil([&] { return server.hasFile("/data/old.txt"); }, milliseconds(3000)));
    ASSERT_TRUE(waitUntil([&] { return reporter.contains("Initial sync complete"); }, milliseconds(3000)));

    std::filesystem::remove(local.path() / "old.txt");
    EXPECT_TRUE(waitUntil([&] { return !server.hasFile("/data/old.txt"); }, milliseconds(3000)));

    ctx.requestStop();
    runner.join();
    EXPECT_TRUE(ok);
}
