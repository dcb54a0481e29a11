// Entry point of one sync session: validate, connect, run the loop for the configured direction.
#pragma once
#include "Reporter.hpp"
#include "SessionContext.hpp"
#include "TransportClient.hpp"

#include <memory>

namespace mirrorsync {

enum class SessionResult {
    Stopped,         // stop requested, clean shutdown
    ConfigError,     // invalid configuration or local root unusable
    ConnectionError  // connect or reconnect failed, or the folder could not be watched
};

class SyncEngine {
public:
    // Without a transport, one is created from cfg.transport.
    SyncEngine(SyncConfig cfg,
               Reporter& reporter,
               SessionContext& ctx,
               std::unique_ptr<TransportClient> transport = nullptr);

    SessionResult run();

    const SyncConfig& config() const { return cfg_; }

private:
    SyncConfig cfg_;
    Reporter& reporter_;
    SessionContext& ctx_;
    std::unique_ptr<TransportClient> transport_;

    void printSummary();
};

// Process exit code for a session result (0, 1, 2).
int exitCodeFor(SessionResult result);

} // namespace mirrorsync
