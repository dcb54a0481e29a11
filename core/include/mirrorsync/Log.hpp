// Minimal diagnostic logging (header-only) for the MirrorSync core.
// Enabled with MIRRORSYNC_LOG=1; user-visible messages go through Reporter instead.
#pragma once
#include <cstdio>
#include <cstdlib>
#include <cstdarg>
#include <mutex>

namespace mirrorsync {

inline bool logEnabled() {
    static const bool enabled = [] {
        const char* v = std::getenv("MIRRORSYNC_LOG");
        return v && *v && *v != '0';
    }();
    return enabled;
}

inline void logf(const char* level, const char* fmt, ...) {
    if (!logEnabled()) return;
    // Watcher and reconciler threads log concurrently
    static std::mutex mtx;
    std::lock_guard<std::mutex> lk(mtx);
    std::fprintf(stderr, "[MirrorSync][%s] ", level);
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fprintf(stderr, "\n");
}

} // namespace mirrorsync

#define LOGI(fmt, ...) \
    do { \
        if (mirrorsync::logEnabled()) \
            mirrorsync::logf("INFO", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGW(fmt, ...) \
    do { \
        if (mirrorsync::logEnabled()) \
            mirrorsync::logf("WARN", fmt, ##__VA_ARGS__); \
    } while (0)

#define LOGE(fmt, ...) \
    do { \
        if (mirrorsync::logEnabled()) \
            mirrorsync::logf("ERROR", fmt, ##__VA_ARGS__); \
    } while (0)
