#include "mirrorsync/SyncEngine.hpp"
#include "mirrorsync/LocalWatcher.hpp"
#include "mirrorsync/Log.hpp"
#include "mirrorsync/RemotePoller.hpp"

#include <filesystem>

namespace mirrorsync {

SyncEngine::SyncEngine(SyncConfig cfg,
                       Reporter& reporter,
                       SessionContext& ctx,
                       std::unique_ptr<TransportClient> transport)
    : cfg_(std::move(cfg)), reporter_(reporter), ctx_(ctx), transport_(std::move(transport)) {
    if (!transport_) transport_ = makeTransport(cfg_.transport);
}

void SyncEngine::printSummary() {
    reporter_.info("Sync configuration:");
    reporter_.info("  Protocol:  " + std::string(toString(cfg_.transport)));
    reporter_.info("  Server:    " + cfg_.session.username + "@" + cfg_.session.host + ":" +
                   std::to_string(cfg_.session.port));
    reporter_.info("  Remote:    " + cfg_.remoteRoot);
    reporter_.info("  Local:     " + cfg_.localRoot);
    reporter_.info("  Interval:  " + std::to_string(cfg_.baseIntervalSec) + "s");
    reporter_.info("  Direction: " + std::string(toString(cfg_.direction)));
}

SessionResult SyncEngine::run() {
    std::string err;
    if (!validateConfig(cfg_, err)) {
        reporter_.error(ErrorKind::Local, "Invalid configuration: " + err);
        return SessionResult::ConfigError;
    }
    std::error_code ec;
    std::filesystem::create_directories(cfg_.localRoot, ec);
    if (ec) {
        reporter_.error(ErrorKind::Local, "Cannot create local folder " + cfg_.localRoot + ": " + ec.message());
        return SessionResult::ConfigError;
    }

    reporter_.info("Connecting to " + cfg_.session.host + "...");
    if (!transport_->connect(cfg_.session, err)) {
        reporter_.error(ErrorKind::Connection, "Failed to connect to remote server: " + err);
        return SessionResult::ConnectionError;
    }
    reporter_.info(std::string("Connected via ") + toString(cfg_.transport));
    printSummary();

    ReconnectSupervisor supervisor(*transport_, cfg_.session, reporter_, ctx_, cfg_.tuning.reconnectDelay);
    bool ok = true;
    if (cfg_.direction == Direction::RemoteToLocal) {
        reporter_.info("Starting remote monitoring (Ctrl+C to stop)");
        RemotePoller poller(*transport_, cfg_, reporter_, ctx_, supervisor);
        ok = poller.run();
    } else {
        reporter_.info("Starting local monitoring (Ctrl+C to stop)");
        LocalWatcher watcher(*transport_, cfg_, reporter_, ctx_, supervisor);
        ok = watcher.run();
    }

    transport_->disconnect();
    if (!ok) {
        reporter_.error(ErrorKind::Connection, "Monitoring ended after an unrecoverable error");
        return SessionResult::ConnectionError;
    }
    reporter_.info("Monitoring stopped");
    return SessionResult::Stopped;
}

int exitCodeFor(SessionResult result) {
    switch (result) {
        case SessionResult::Stopped:         return 0;
        case SessionResult::ConfigError:     return 1;
        case SessionResult::ConnectionError: return 2;
    }
    return 1;
}

} // namespace mirrorsync
