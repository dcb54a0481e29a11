#include <gtest/gtest.h>

#include "CommandLine.hpp"

using namespace mirrorsync;

namespace {

bool parse(const QStringList& extra, SyncConfig& cfg, CliRequest& req, QString& err) {
    QStringList args{"mirrorsync"};
    args << extra;
    return parseCommandLine(args, nullptr, cfg, req, err);
}

} // namespace

TEST(CommandLineTest, BuildsSftpConfig) {
    SyncConfig cfg;
    CliRequest req;
    QString err;
    ASSERT_TRUE(parse({"--host", "files.example.org", "--user", "alice", "--remote", "/srv/out", "--local",
                       "/tmp/mirror", "--interval", "300"},
                      cfg, req, err))
        << err.toStdString();
    EXPECT_EQ(cfg.transport, TransportKind::Sftp);
    EXPECT_EQ(cfg.session.host, "files.example.org");
    EXPECT_EQ(cfg.session.port, 22);
    EXPECT_EQ(cfg.session.username, "alice");
    EXPECT_EQ(cfg.remoteRoot, "/srv/out");
    EXPECT_EQ(cfg.localRoot, "/tmp/mirror");
    EXPECT_EQ(cfg.baseIntervalSec, 300);
    EXPECT_EQ(cfg.direction, Direction::RemoteToLocal);
    EXPECT_FALSE(req.browse);
}

TEST(CommandLineTest, FtpSwitchesDefaultPort) {
    SyncConfig cfg;
    CliRequest req;
    QString err;
    ASSERT_TRUE(parse({"--protocol", "ftp", "--direction", "local"}, cfg, req, err)) << err.toStdString();
    EXPECT_EQ(cfg.transport, TransportKind::Ftp);
    EXPECT_EQ(cfg.session.port, 21);
    EXPECT_EQ(cfg.direction, Direction::LocalToRemote);
}

TEST(CommandLineTest, ExplicitPortWins) {
    SyncConfig cfg;
    CliRequest req;
    QString err;
    ASSERT_TRUE(parse({"--protocol", "ftp", "--port", "2121"}, cfg, req, err)) << err.toStdString();
    EXPECT_EQ(cfg.session.port, 2121);
}

TEST(CommandLineTest, HostKeyPolicy) {
    SyncConfig cfg;
    CliRequest req;
    QString err;
    ASSERT_TRUE(parse({"--kh-policy", "accept-new", "--browse"}, cfg, req, err)) << err.toStdString();
    EXPECT_EQ(cfg.session.known_hosts_policy, KnownHostsPolicy::AcceptNew);
    EXPECT_TRUE(req.browse);
}

TEST(CommandLineTest, RejectsInvalidValues) {
    SyncConfig cfg;
    CliRequest req;
    QString err;
    EXPECT_FALSE(parse({"--protocol", "http"}, cfg, req, err));
    EXPECT_FALSE(parse({"--interval", "0"}, cfg, req, err));
    EXPECT_FALSE(parse({"--interval", "soon"}, cfg, req, err));
    EXPECT_FALSE(parse({"--port", "70000"}, cfg, req, err));
    EXPECT_FALSE(parse({"--direction", "both"}, cfg, req, err));
    EXPECT_FALSE(parse({"--no-such-option"}, cfg, req, err));
}

TEST(CommandLineTest, UnknownProfileWithoutStore) {
    SyncConfig cfg;
    CliRequest req;
    QString err;
    EXPECT_FALSE(parse({"--profile", "work"}, cfg, req, err));
    EXPECT_TRUE(err.contains("work"));
}
