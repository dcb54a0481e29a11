#include <gtest/gtest.h>

#include "mirrorsync/SyncTypes.hpp"
#include "TestSupport.hpp"

using namespace mirrorsync;

TEST(SyncTypesTest, DefaultPortsFollowProtocol) {
    EXPECT_EQ(defaultPort(TransportKind::Sftp), 22);
    EXPECT_EQ(defaultPort(TransportKind::Ftp), 21);
}

TEST(SyncTypesTest, IntervalPresets) {
    EXPECT_EQ(intervalPresets(), (std::vector<int>{60, 300, 1200, 3600}));
}

TEST(SyncTypesTest, ValidConfigPasses) {
    std::string err;
    EXPECT_TRUE(validateConfig(test::mockConfig("/tmp/x", Direction::RemoteToLocal), err)) << err;
}

TEST(SyncTypesTest, MissingFieldsAreRejected) {
    std::string err;
    auto cfg = test::mockConfig("/tmp/x", Direction::RemoteToLocal);
    cfg.session.host.clear();
    EXPECT_FALSE(validateConfig(cfg, err));
    EXPECT_NE(err.find("Host"), std::string::npos);

    cfg = test::mockConfig("", Direction::RemoteToLocal);
    EXPECT_FALSE(validateConfig(cfg, err));

    cfg = test::mockConfig("/tmp/x", Direction::RemoteToLocal);
    cfg.baseIntervalSec = 0;
    EXPECT_FALSE(validateConfig(cfg, err));
}

TEST(SyncTypesTest, KeyAuthIsSftpOnly) {
    std::string err;
    auto cfg = test::mockConfig("/tmp/x", Direction::RemoteToLocal);
    cfg.transport = TransportKind::Ftp;
    cfg.session.private_key_path = std::string("/home/u/.ssh/id_ed25519");
    EXPECT_FALSE(validateConfig(cfg, err));
}
