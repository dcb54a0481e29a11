// Helpers shared by the engine tests: temp folders, a recording reporter, configs for the mock server.
#pragma once
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "mirrorsync/Reporter.hpp"
#include "mirrorsync/SyncTypes.hpp"

namespace mirrorsync {
namespace test {

class TempDir {
public:
    TempDir();
    ~TempDir();
    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

void writeFile(const std::filesystem::path& p, const std::string& content);
std::string readFile(const std::filesystem::path& p);

struct Line {
    LogLevel level;
    std::string message;
};

class RecordingReporter : public Reporter {
public:
    void log(LogLevel level, const std::string& message) override;
    void status(const std::string& text) override;

    std::vector<Line> lines() const;
    // Number of error lines tagged with the given kind.
    int errors(ErrorKind kind) const;
    bool contains(const std::string& fragment) const;
    int statusCount() const;

private:
    mutable std::mutex mtx_;
    std::vector<Line> lines_;
    int statuses_ = 0;
};

// Config pointing at the mock server, with millisecond timings.
SyncConfig mockConfig(const std::string& localRoot, Direction direction);

} // namespace test
} // namespace mirrorsync
