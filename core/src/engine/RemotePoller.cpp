#include "mirrorsync/RemotePoller.hpp"
#include "mirrorsync/Log.hpp"

#include <cstdio>
#include <ctime>

namespace mirrorsync {

std::chrono::milliseconds pollIntervalFor(int noChangeCount,
                                          const EngineTuning& tuning,
                                          std::chrono::milliseconds base) {
    if (noChangeCount <= 3) return tuning.fastInterval;
    if (noChangeCount <= 6) return tuning.mediumInterval;
    return base;
}

void PollState::reset(const EngineTuning& tuning) {
    noChangeCount = 0;
    interval = tuning.fastInterval;
}

void PollState::advance(bool changed, const EngineTuning& tuning, std::chrono::milliseconds base) {
    if (changed) {
        reset(tuning);
        return;
    }
    ++noChangeCount;
    interval = pollIntervalFor(noChangeCount, tuning, base);
}

RemotePoller::RemotePoller(TransportClient& transport,
                           const SyncConfig& cfg,
                           Reporter& reporter,
                           SessionContext& ctx,
                           ReconnectSupervisor& supervisor)
    : transport_(transport), cfg_(cfg), reporter_(reporter), ctx_(ctx), supervisor_(supervisor) {
    poll_.reset(cfg_.tuning);
}

bool RemotePoller::cycle() {
    const bool changed = diffAndReconcile(transport_, cfg_.remoteRoot, cfg_.localRoot, table_, reporter_);
    if (changed) ctx_.markActivity();

    if (!transport_.isConnected()) {
        if (!supervisor_.recover()) return false;
        // Remote state may have moved on while disconnected: start from scratch.
        table_.clear();
        poll_.reset(cfg_.tuning);
        return true;
    }
    poll_.advance(changed, cfg_.tuning, cfg_.baseInterval());
    LOGI("cycle done: changed=%d quiet=%d next=%lldms", changed ? 1 : 0, poll_.noChangeCount,
         (long long)poll_.interval.count());
    return true;
}

static std::string formatClock(std::chrono::system_clock::time_point tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
    return buf;
}

bool RemotePoller::run() {
    while (ctx_.running()) {
        if (!cycle()) return !ctx_.running();
        ctx_.sleepFor(poll_.interval, [this](std::chrono::milliseconds remaining) {
            const auto secs = std::chrono::duration_cast<std::chrono::seconds>(remaining).count();
            std::string line = "Monitoring... (" + std::to_string(secs) + "s until next check)";
            if (auto last = ctx_.lastActivity()) line += " | Last activity: " + formatClock(*last);
            reporter_.status(line);
        });
    }
    return true;
}

} // namespace mirrorsync
