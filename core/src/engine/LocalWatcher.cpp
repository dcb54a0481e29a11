#include "mirrorsync/LocalWatcher.hpp"
#include "mirrorsync/InotifyWatcher.hpp"
#include "mirrorsync/Log.hpp"

#include <algorithm>

namespace mirrorsync {

LocalWatcher::LocalWatcher(TransportClient& transport,
                           const SyncConfig& cfg,
                           Reporter& reporter,
                           SessionContext& ctx,
                           ReconnectSupervisor& supervisor)
    : cfg_(cfg),
      reporter_(reporter),
      ctx_(ctx),
      queue_(cfg.tuning.eventQueueCapacity),
      reconciler_(transport, cfg, reporter, ctx, supervisor) {}

bool LocalWatcher::run() {
    using Clock = LocalReconciler::Clock;

    // Watch first so nothing written during the initial sync is missed.
    InotifyWatcher watcher(cfg_.localRoot, queue_);
    std::string err;
    if (!watcher.start(err)) {
        reporter_.error(ErrorKind::Local, err);
        return false;
    }

    reporter_.info("Performing initial sync...");
    if (!reconciler_.reconcile()) {
        watcher.stop();
        return !ctx_.running();
    }
    reporter_.info("Initial sync complete");

    auto nextReconcile = Clock::now() + cfg_.baseInterval();
    bool ok = true;
    while (ctx_.running()) {
        auto wake = std::min(nextReconcile, Clock::now() + ctx_.tick());
        if (auto due = reconciler_.nextDeadline()) wake = std::min(wake, *due);

        ChangeEvent ev;
        if (queue_.popUntil(ev, wake)) {
            LOGI("event %d %s %s", (int)ev.kind, ev.name.c_str(), ev.newName.c_str());
            reconciler_.handle(ev, Clock::now());
        }
        if (queue_.takeOverflow()) reconciler_.requestReconcile();

        const auto now = Clock::now();
        if (now >= nextReconcile) {
            reconciler_.requestReconcile();
            nextReconcile = now + cfg_.baseInterval();
        }
        if (!reconciler_.fireDue(now)) {
            ok = false;
            break;
        }
        if (reconciler_.pendingCount() == 0 && queue_.size() == 0) {
            const auto left = std::chrono::duration_cast<std::chrono::seconds>(nextReconcile - now).count();
            reporter_.status("Watching local folder... (" + std::to_string(left) + "s until next full check)");
        }
    }
    queue_.close();
    watcher.stop();
    return ok || !ctx_.running();
}

} // namespace mirrorsync
