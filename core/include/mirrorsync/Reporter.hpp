// Sink for user-visible session messages. The engine only emits leveled lines,
// formatting belongs to the implementation.
#pragma once
#include <cstddef>
#include <ctime>
#include <fstream>
#include <mutex>
#include <string>

namespace mirrorsync {

enum class LogLevel {
    Info,
    Warning,
    Error
};

// Error taxonomy used for markers in console and log output.
enum class ErrorKind {
    Connection,         // initial connect or reconnect failed: ends the session
    Transfer,           // single download/upload failed: retried on the next cycle
    ProtocolLimitation, // e.g. emulated FTP rename broke half way: not retried
    Listing,            // directory enumeration failed: no changes this cycle
    Local               // local filesystem operation failed
};

const char* toString(LogLevel level);
const char* toString(ErrorKind kind);

class Reporter {
public:
    virtual ~Reporter() = default;

    virtual void log(LogLevel level, const std::string& message) = 0;
    // Transient status text (countdowns); not part of the session log.
    virtual void status(const std::string& text) = 0;
    // Transfer progress for `name`; total is 0 when unknown.
    virtual void progress(const std::string& name, std::size_t done, std::size_t total) {
        (void)name; (void)done; (void)total;
    }

    void info(const std::string& message) { log(LogLevel::Info, message); }
    void warn(const std::string& message) { log(LogLevel::Warning, message); }
    void error(ErrorKind kind, const std::string& message) {
        log(LogLevel::Error, std::string("[") + toString(kind) + "] " + message);
    }
};

// Console + per-session log file under <local root>/logs.
class SessionLogReporter : public Reporter {
public:
    SessionLogReporter() = default;

    // Create <localRoot>/logs and open sync_monitor_YYYYMMDD_HHMMSS.log.
    bool open(const std::string& localRoot, std::string& err);
    const std::string& logPath() const { return logPath_; }

    void log(LogLevel level, const std::string& message) override;
    void status(const std::string& text) override;
    void progress(const std::string& name, std::size_t done, std::size_t total) override;

private:
    std::mutex mtx_;
    std::ofstream file_;
    std::string logPath_;
    bool statusShown_ = false; // a status line is on screen and must be cleared first

    void clearStatusLocked();
};

// File name of the session log started at `start` (local time).
std::string sessionLogFileName(std::time_t start);

} // namespace mirrorsync
