#include "mirrorsync/SessionContext.hpp"

#include <algorithm>

namespace mirrorsync {

void SessionContext::requestStop() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        running_.store(false);
    }
    cv_.notify_all();
}

bool SessionContext::sleepFor(std::chrono::milliseconds d,
                              const std::function<void(std::chrono::milliseconds)>& onTick) {
    using clock = std::chrono::steady_clock;
    const auto end = clock::now() + d;
    for (;;) {
        if (!running()) return false;
        const auto now = clock::now();
        if (now >= end) return true;
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(end - now);
        if (onTick) onTick(remaining);
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait_for(lk, std::min(remaining, tick_), [this] { return !running_.load(); });
    }
}

void SessionContext::markActivity() {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    lastActivityMs_.store(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

std::optional<std::chrono::system_clock::time_point> SessionContext::lastActivity() const {
    const std::int64_t ms = lastActivityMs_.load();
    if (ms == 0) return std::nullopt;
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace mirrorsync
