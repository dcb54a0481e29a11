// Shared run state of one sync session: cancellation flag, last activity, interruptible sleeps.
#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>

namespace mirrorsync {

class SessionContext {
public:
    explicit SessionContext(std::chrono::milliseconds tick = std::chrono::seconds(1))
        : tick_(tick) {}

    bool running() const { return running_.load(); }
    // Ask every loop of the session to stop at its next tick.
    void requestStop();

    // Sleep for `d` in slices of at most one tick. onTick receives the remaining
    // time before each slice. Returns false when stopped early.
    bool sleepFor(std::chrono::milliseconds d,
                  const std::function<void(std::chrono::milliseconds)>& onTick = {});

    // Record a successful transfer.
    void markActivity();
    std::optional<std::chrono::system_clock::time_point> lastActivity() const;

    std::chrono::milliseconds tick() const { return tick_; }

private:
    const std::chrono::milliseconds tick_;
    std::atomic<bool> running_{true};
    std::atomic<std::int64_t> lastActivityMs_{0}; // 0 = none yet
    std::mutex mtx_;
    std::condition_variable cv_;
};

} // namespace mirrorsync
