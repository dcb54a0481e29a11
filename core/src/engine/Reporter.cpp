// Session log: every message goes to the console and to logs/sync_monitor_*.log.
#include "mirrorsync/Reporter.hpp"

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace mirrorsync {

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::Info:    return "INFO";
        case LogLevel::Warning: return "WARNING";
        case LogLevel::Error:   return "ERROR";
    }
    return "INFO";
}

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Connection:         return "ConnectionError";
        case ErrorKind::Transfer:           return "TransferError";
        case ErrorKind::ProtocolLimitation: return "ProtocolLimitationError";
        case ErrorKind::Listing:            return "ListingError";
        case ErrorKind::Local:              return "LocalError";
    }
    return "Error";
}

static std::tm localTime(std::time_t t) {
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

std::string sessionLogFileName(std::time_t start) {
    const std::tm tm = localTime(start);
    std::ostringstream oss;
    oss << "sync_monitor_" << std::put_time(&tm, "%Y%m%d_%H%M%S") << ".log";
    return oss.str();
}

bool SessionLogReporter::open(const std::string& localRoot, std::string& err) {
    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path dir = fs::path(localRoot) / "logs";
    fs::create_directories(dir, ec);
    if (ec) {
        err = "Could not create log directory " + dir.string() + ": " + ec.message();
        return false;
    }
    const fs::path file = dir / sessionLogFileName(std::time(nullptr));
    std::lock_guard<std::mutex> lk(mtx_);
    file_.open(file, std::ios::app);
    if (!file_) {
        err = "Could not open log file " + file.string();
        return false;
    }
    logPath_ = file.string();
    return true;
}

void SessionLogReporter::clearStatusLocked() {
    if (!statusShown_) return;
    std::cout << '\r' << std::string(70, ' ') << '\r' << std::flush;
    statusShown_ = false;
}

void SessionLogReporter::log(LogLevel level, const std::string& message) {
    const std::tm tm = localTime(std::time(nullptr));
    std::lock_guard<std::mutex> lk(mtx_);
    clearStatusLocked();
    std::ostream& out = (level == LogLevel::Error) ? std::cerr : std::cout;
    out << std::put_time(&tm, "%H:%M:%S") << " [" << toString(level) << "] " << message << std::endl;
    if (file_.is_open()) {
        file_ << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " - " << toString(level) << " - " << message
              << std::endl;
    }
}

void SessionLogReporter::status(const std::string& text) {
    std::lock_guard<std::mutex> lk(mtx_);
    std::cout << '\r' << text << std::flush;
    statusShown_ = true;
}

void SessionLogReporter::progress(const std::string& name, std::size_t done, std::size_t total) {
    if (total == 0) return;
    std::lock_guard<std::mutex> lk(mtx_);
    std::cout << '\r' << name << ": " << (done * 100 / total) << "% (" << done << "/" << total << " bytes)"
              << std::flush;
    statusShown_ = true;
}

} // namespace mirrorsync
