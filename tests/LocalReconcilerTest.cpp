#include <gtest/gtest.h>

#include "mirrorsync/LocalReconciler.hpp"
#include "mirrorsync/MockTransportClient.hpp"
#include "TestSupport.hpp"

using namespace mirrorsync;
using test::writeFile;
using std::chrono::milliseconds;
using Kind = ChangeEvent::Kind;

namespace {

class LocalReconcilerTest : public ::testing::Test {
protected:
    test::TempDir local;
    SyncConfig cfg = test::mockConfig(local.str(), Direction::LocalToRemote);
    test::RecordingReporter reporter;
    SessionContext ctx{milliseconds(10)};
    LocalReconciler::Clock::time_point t0 = LocalReconciler::Clock::now();

    void connect(MockTransportClient& server) {
        std::string err;
        ASSERT_TRUE(server.connect(cfg.session, err)) << err;
        server.makeDir("/data");
    }
};

} // namespace

TEST_F(LocalReconcilerTest, BurstOfWritesProducesOneUpload) {
    MockTransportClient server;
    connect(server);
    ReconnectSupervisor sup(server, cfg.session, reporter, ctx, cfg.tuning.reconnectDelay);
    LocalReconciler rec(server, cfg, reporter, ctx, sup);

    writeFile(local.path() / "f.txt", "v1");
    rec.handle({Kind::Created, "f.txt", {}}, t0);
    writeFile(local.path() / "f.txt", "v2");
    rec.handle({Kind::Modified, "f.txt", {}}, t0 + milliseconds(300));
    writeFile(local.path() / "f.txt", "final");
    rec.handle({Kind::Modified, "f.txt", {}}, t0 + milliseconds(600));

    ASSERT_TRUE(rec.fireDue(t0 + milliseconds(1500)));
    EXPECT_EQ(server.uploadCount("/data/f.txt"), 0);
    ASSERT_TRUE(rec.nextDeadline().has_value());
    EXPECT_EQ(*rec.nextDeadline(), t0 + milliseconds(2600));

    ASSERT_TRUE(rec.fireDue(t0 + milliseconds(2600)));
    EXPECT_EQ(server.uploadCount("/data/f.txt"), 1);
    EXPECT_EQ(server.content("/data/f.txt"), "final");
    EXPECT_FALSE(rec.isPending("f.txt"));
    EXPECT_TRUE(rec.mirrored().contains("f.txt"));
    EXPECT_TRUE(ctx.lastActivity().has_value());

    ASSERT_TRUE(rec.fireDue(t0 + milliseconds(10000)));
    EXPECT_EQ(server.uploadCount("/data/f.txt"), 1);
}

TEST_F(LocalReconcilerTest, CreateUploadsAfterSettleDelay) {
    MockTransportClient server;
    connect(server);
    ReconnectSupervisor sup(server, cfg.session, reporter, ctx, cfg.tuning.reconnectDelay);
    LocalReconciler rec(server, cfg, reporter, ctx, sup);

    writeFile(local.path() / "new.bin", "abc");
    rec.handle({Kind::Created, "new.bin", {}}, t0);
    ASSERT_TRUE(rec.fireDue(t0 + milliseconds(999)));
    EXPECT_FALSE(server.hasFile("/data/new.bin"));
    ASSERT_TRUE(rec.fireDue(t0 + cfg.tuning.settleDelay));
    EXPECT_EQ(server.content("/data/new.bin"), "abc");
}

TEST_F(LocalReconcilerTest, FileGoneBeforeSettleIsNotUploaded) {
    MockTransportClient server;
    connect(server);
    ReconnectSupervisor sup(server, cfg.session, reporter, ctx, cfg.tuning.reconnectDelay);
    LocalReconciler rec(server, cfg, reporter, ctx, sup);

    writeFile(local.path() / "tmp.txt", "x");
    rec.handle({Kind::Created, "tmp.txt", {}}, t0);
    std::filesystem::remove(local.path() / "tmp.txt");
    ASSERT_TRUE(rec.fireDue(t0 + milliseconds(5000)));
    EXPECT_EQ(server.totalUploads(), 0);
}

TEST_F(LocalReconcilerTest, DeleteCancelsPendingAndRemovesRemote) {
    MockTransportClient server;
    connect(server);
    server.putFile("/data/gone.txt", "old");
    ReconnectSupervisor sup(server, cfg.session, reporter, ctx, cfg.tuning.reconnectDelay);
    LocalReconciler rec(server, cfg, reporter, ctx, sup);

    rec.handle({Kind::Modified, "gone.txt", {}}, t0);
    ASSERT_TRUE(rec.isPending("gone.txt"));
    rec.handle({Kind::Deleted, "gone.txt", {}}, t0 + milliseconds(100));
    EXPECT_FALSE(rec.isPending("gone.txt"));
    EXPECT_FALSE(server.hasFile("/data/gone.txt"));
    EXPECT_TRUE(reporter.contains("FILE DELETED REMOTELY: gone.txt"));
    EXPECT_EQ(reporter.errors(ErrorKind::Transfer), 0);
}

TEST_F(LocalReconcilerTest, DeleteOfNeverUploadedFileIsQuiet) {
    MockTransportClient server;
    connect(server);
    ReconnectSupervisor sup(server, cfg.session, reporter, ctx, cfg.tuning.reconnectDelay);
    LocalReconciler rec(server, cfg, reporter, ctx, sup);

    rec.handle({Kind::Deleted, "never.txt", {}}, t0);
    EXPECT_EQ(reporter.errors(ErrorKind::Transfer), 0);
}

TEST_F(LocalReconcilerTest, MoveUsesNativeRenameOnSftp) {
    MockTransportClient server;
    connect(server);
    server.putFile("/data/a.txt", "content");
    writeFile(local.path() / "b.txt", "content");
    ReconnectSupervisor sup(server, cfg.session, reporter, ctx, cfg.tuning.reconnectDelay);
    LocalReconciler rec(server, cfg, reporter, ctx, sup);

    rec.handle({Kind::Moved, "a.txt", "b.txt"}, t0);
    EXPECT_FALSE(server.hasFile("/data/a.txt"));
    EXPECT_EQ(server.content("/data/b.txt"), "content");
    EXPECT_EQ(server.totalUploads(), 0);
    EXPECT_EQ(server.totalDownloads(), 0);
    EXPECT_FALSE(rec.isPending("b.txt"));
}

TEST_F(LocalReconcilerTest, MoveOfUnknownFileBecomesUpload) {
    MockTransportClient server;
    connect(server);
    writeFile(local.path() / "b.txt", "fresh");
    ReconnectSupervisor sup(server, cfg.session, reporter, ctx, cfg.tuning.reconnectDelay);
    LocalReconciler rec(server, cfg, reporter, ctx, sup);

    rec.handle({Kind::Moved, "a.txt", "b.txt"}, t0);
    EXPECT_TRUE(rec.isPending("b.txt"));
    ASSERT_TRUE(rec.fireDue(t0 + milliseconds(5000)));
    EXPECT_EQ(server.content("/data/b.txt"), "fresh");
}

TEST_F(LocalReconcilerTest, FtpRenameIsEmulatedByCopy) {
    MockTransportClient server(TransportKind::Ftp);
    connect(server);
    server.putFile("/data/a.txt", "content");
    ReconnectSupervisor sup(server, cfg.session, reporter, ctx, cfg.tuning.reconnectDelay);
    LocalReconciler rec(server, cfg, reporter, ctx, sup);

    rec.handle({Kind::Moved, "a.txt", "b.txt"}, t0);
    EXPECT_FALSE(server.hasFile("/data/a.txt"));
    EXPECT_EQ(server.content("/data/b.txt"), "content");
    EXPECT_EQ(server.downloadCount("/data/a.txt"), 1);
    EXPECT_EQ(server.uploadCount("/data/b.txt"), 1);
}

TEST_F(LocalReconcilerTest, HalfDoneFtpRenameIsAProtocolLimitation) {
    MockTransportClient server(TransportKind::Ftp);
    connect(server);
    server.putFile("/data/a.txt", "content");
    server.failUploads("/data/b.txt", 1);
    ReconnectSupervisor sup(server, cfg.session, reporter, ctx, cfg.tuning.reconnectDelay);
    LocalReconciler rec(server, cfg, reporter, ctx, sup);

    rec.handle({Kind::Moved, "a.txt", "b.txt"}, t0);
    EXPECT_EQ(reporter.errors(ErrorKind::ProtocolLimitation), 1);
    EXPECT_FALSE(server.hasFile("/data/a.txt"));
    EXPECT_FALSE(server.hasFile("/data/b.txt"));
    // Not retried by the event path
    EXPECT_FALSE(rec.isPending("b.txt"));
}

TEST_F(LocalReconcilerTest, DirectoriesAndLogsAreIgnored) {
    MockTransportClient server;
    connect(server);
    std::filesystem::create_directories(local.path() / "sub");
    ReconnectSupervisor sup(server, cfg.session, reporter, ctx, cfg.tuning.reconnectDelay);
    LocalReconciler rec(server, cfg, reporter, ctx, sup);

    rec.handle({Kind::Created, "sub", {}}, t0);
    rec.handle({Kind::Created, "logs", {}}, t0);
    rec.handle({Kind::Modified, "logs", {}}, t0);
    EXPECT_EQ(rec.pendingCount(), 0u);
}

TEST_F(LocalReconcilerTest, ReconcileUploadsMissingAndDifferentFiles) {
    MockTransportClient server;
    connect(server);
    server.putFile("/data/same.txt", "12345");
    server.putFile("/data/stale.txt", "old");
    writeFile(local.path() / "same.txt", "abcde");
    writeFile(local.path() / "stale.txt", "newer content");
    writeFile(local.path() / "missing.txt", "m");
    std::filesystem::create_directories(local.path() / "logs");
    writeFile(local.path() / "logs" / "sync.log", "log");
    ReconnectSupervisor sup(server, cfg.session, reporter, ctx, cfg.tuning.reconnectDelay);
    LocalReconciler rec(server, cfg, reporter, ctx, sup);

    ASSERT_TRUE(rec.reconcile());
    EXPECT_EQ(server.uploadCount("/data/same.txt"), 0);
    EXPECT_EQ(server.content("/data/stale.txt"), "newer content");
    EXPECT_EQ(server.content("/data/missing.txt"), "m");
    EXPECT_FALSE(server.hasFile("/data/logs"));
    EXPECT_EQ(rec.mirrored().size(), 3u);

    // Deleted locally without an event: the next pass removes it remotely
    std::filesystem::remove(local.path() / "missing.txt");
    ASSERT_TRUE(rec.reconcile());
    EXPECT_FALSE(server.hasFile("/data/missing.txt"));
    EXPECT_FALSE(rec.mirrored().contains("missing.txt"));
    EXPECT_TRUE(server.hasFile("/data/same.txt"));
}

TEST_F(LocalReconcilerTest, OverflowTriggersFullReconciliation) {
    MockTransportClient server;
    connect(server);
    writeFile(local.path() / "lost.txt", "event was dropped");
    ReconnectSupervisor sup(server, cfg.session, reporter, ctx, cfg.tuning.reconnectDelay);
    LocalReconciler rec(server, cfg, reporter, ctx, sup);

    rec.handle({Kind::Overflow, {}, {}}, t0);
    ASSERT_TRUE(rec.fireDue(t0));
    EXPECT_EQ(server.content("/data/lost.txt"), "event was dropped");
}

TEST_F(LocalReconcilerTest, UploadAfterConnectionLossIsRetriedAfterReconnect) {
    MockTransportClient server;
    connect(server);
    writeFile(local.path() / "f.txt", "data");
    ReconnectSupervisor sup(server, cfg.session, reporter, ctx, cfg.tuning.reconnectDelay);
    LocalReconciler rec(server, cfg, reporter, ctx, sup);

    rec.handle({Kind::Modified, "f.txt", {}}, t0);
    server.dropConnection();
    ASSERT_TRUE(rec.fireDue(t0 + milliseconds(5000)));
    EXPECT_EQ(sup.reconnects(), 1);
    EXPECT_EQ(reporter.errors(ErrorKind::Transfer), 1);
    EXPECT_EQ(server.content("/data/f.txt"), "data");
}

TEST_F(LocalReconcilerTest, FailedReconnectIsFatal) {
    MockTransportClient server;
    connect(server);
    writeFile(local.path() / "f.txt", "data");
    ReconnectSupervisor sup(server, cfg.session, reporter, ctx, cfg.tuning.reconnectDelay);
    LocalReconciler rec(server, cfg, reporter, ctx, sup);

    rec.handle({Kind::Modified, "f.txt", {}}, t0);
    server.dropConnection();
    server.setConnectFails(true);
    EXPECT_FALSE(rec.fireDue(t0 + milliseconds(5000)));
    EXPECT_TRUE(rec.failed());
    EXPECT_EQ(reporter.errors(ErrorKind::Connection), 1);
}
