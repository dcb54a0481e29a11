// Local -> remote mode: inotify reader thread feeding a single reconciler loop.
#pragma once
#include "LocalReconciler.hpp"

namespace mirrorsync {

class LocalWatcher {
public:
    LocalWatcher(TransportClient& transport,
                 const SyncConfig& cfg,
                 Reporter& reporter,
                 SessionContext& ctx,
                 ReconnectSupervisor& supervisor);

    // Initial sync, then events and periodic reconciliation until stopped.
    // False on a fatal error (lost connection, directory cannot be watched).
    bool run();

private:
    const SyncConfig& cfg_;
    Reporter& reporter_;
    SessionContext& ctx_;
    EventQueue queue_;
    LocalReconciler reconciler_;
};

} // namespace mirrorsync
