#include <gtest/gtest.h>

#include "mirrorsync/Reporter.hpp"
#include "TestSupport.hpp"

#include <regex>

using namespace mirrorsync;

TEST(ReporterTest, SessionLogFileName) {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 2;
    tm.tm_mday = 7;
    tm.tm_hour = 9;
    tm.tm_min = 5;
    tm.tm_sec = 3;
    tm.tm_isdst = -1;
    EXPECT_EQ(sessionLogFileName(std::mktime(&tm)), "sync_monitor_20240307_090503.log");
}

TEST(ReporterTest, WritesLevelledLinesToLogFile) {
    test::TempDir dir;
    SessionLogReporter reporter;
    std::string err;
    ASSERT_TRUE(reporter.open(dir.str(), err)) << err;
    reporter.info("hello");
    reporter.error(ErrorKind::Transfer, "DOWNLOAD FAILED: a.txt - boom");
    reporter.status("Monitoring... (3s until next check)");

    const std::string content = test::readFile(reporter.logPath());
    EXPECT_TRUE(std::regex_search(content, std::regex(R"(\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} - INFO - hello)")));
    EXPECT_NE(content.find(" - ERROR - [TransferError] DOWNLOAD FAILED: a.txt - boom"), std::string::npos);
    // Status text stays on the console
    EXPECT_EQ(content.find("Monitoring..."), std::string::npos);
    EXPECT_EQ(std::filesystem::path(reporter.logPath()).parent_path(), dir.path() / "logs");
}
