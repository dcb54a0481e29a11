#include <gtest/gtest.h>

#include "mirrorsync/MockTransportClient.hpp"
#include "mirrorsync/SyncEngine.hpp"
#include "TestSupport.hpp"

#include <thread>

using namespace mirrorsync;
using std::chrono::milliseconds;

namespace {

// Owned by the engine; the test keeps a raw pointer to inspect it.
struct EngineHarness {
    test::TempDir local;
    test::RecordingReporter reporter;
    SessionContext ctx{milliseconds(10)};
    MockTransportClient* server = nullptr;

    std::unique_ptr<SyncEngine> make(Direction dir) {
        auto mock = std::make_unique<MockTransportClient>();
        mock->makeDir("/data");
        server = mock.get();
        return std::make_unique<SyncEngine>(test::mockConfig(local.str(), dir), reporter, ctx, std::move(mock));
    }

    void stopAfter(milliseconds d, std::thread& t) {
        t = std::thread([this, d] {
            std::this_thread::sleep_for(d);
            ctx.requestStop();
        });
    }
};

} // namespace

TEST(SyncEngineTest, InvalidConfigIsReported) {
    test::RecordingReporter reporter;
    SessionContext ctx;
    SyncConfig cfg;
    SyncEngine engine(cfg, reporter, ctx, std::make_unique<MockTransportClient>());
    EXPECT_EQ(engine.run(), SessionResult::ConfigError);
    EXPECT_EQ(exitCodeFor(SessionResult::ConfigError), 1);
}

TEST(SyncEngineTest, ConnectFailureIsAConnectionError) {
    EngineHarness h;
    auto engine = h.make(Direction::RemoteToLocal);
    h.server->setConnectFails(true);
    EXPECT_EQ(engine->run(), SessionResult::ConnectionError);
    EXPECT_EQ(h.reporter.errors(ErrorKind::Connection), 1);
    EXPECT_EQ(exitCodeFor(SessionResult::ConnectionError), 2);
}

TEST(SyncEngineTest, RemoteToLocalMirrorsUntilStopped) {
    EngineHarness h;
    auto engine = h.make(Direction::RemoteToLocal);
    h.server->putFile("/data/report.csv", "a,b,c");
    std::thread stopper;
    h.stopAfter(milliseconds(200), stopper);
    EXPECT_EQ(engine->run(), SessionResult::Stopped);
    stopper.join();
    EXPECT_EQ(test::readFile(h.local.path() / "report.csv"), "a,b,c");
    EXPECT_EQ(h.server->downloadCount("/data/report.csv"), 1);
    EXPECT_FALSE(h.server->isConnected());
    EXPECT_TRUE(h.reporter.contains("Direction: REMOTE"));
}

TEST(SyncEngineTest, LocalToRemoteRunsInitialSync) {
    EngineHarness h;
    auto engine = h.make(Direction::LocalToRemote);
    test::writeFile(h.local.path() / "existing.txt", "already here");
    std::thread stopper;
    h.stopAfter(milliseconds(300), stopper);
    EXPECT_EQ(engine->run(), SessionResult::Stopped);
    stopper.join();
    EXPECT_EQ(h.server->content("/data/existing.txt"), "already here");
    EXPECT_EQ(h.server->uploadCount("/data/existing.txt"), 1);
    EXPECT_TRUE(h.reporter.contains("Initial sync complete"));
}

TEST(SyncEngineTest, LocalRootIsCreated) {
    EngineHarness h;
    const auto nested = h.local.path() / "deep" / "mirror";
    auto mock = std::make_unique<MockTransportClient>();
    mock->makeDir("/data");
    SyncEngine engine(test::mockConfig(nested.string(), Direction::RemoteToLocal), h.reporter, h.ctx,
                      std::move(mock));
    h.ctx.requestStop();
    EXPECT_EQ(engine.run(), SessionResult::Stopped);
    EXPECT_TRUE(std::filesystem::is_directory(nested));
}
