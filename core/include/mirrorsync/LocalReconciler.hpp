// Local -> remote consumer: turns ChangeEvents into remote operations.
// Runs on a single thread and is the only user of the transport in local -> remote mode.
#pragma once
#include "EventQueue.hpp"
#include "FileStateTable.hpp"
#include "ReconnectSupervisor.hpp"
#include "SessionContext.hpp"
#include "SyncTypes.hpp"

#include <map>
#include <optional>

namespace mirrorsync {

class LocalReconciler {
public:
    using Clock = std::chrono::steady_clock;

    LocalReconciler(TransportClient& transport,
                    const SyncConfig& cfg,
                    Reporter& reporter,
                    SessionContext& ctx,
                    ReconnectSupervisor& supervisor);

    // Apply one event observed at `now`. Uploads are only scheduled here;
    // deletes and renames go to the server immediately.
    void handle(const ChangeEvent& ev, Clock::time_point now);

    // Run every pending upload whose deadline is <= now, then a full
    // reconciliation if one was requested. False on a fatal connection error.
    bool fireDue(Clock::time_point now);

    // Full pass: upload local files missing or different remotely, delete
    // remotely mirrored files that are gone locally.
    // False on a fatal connection error.
    bool reconcile();

    void requestReconcile() { reconcileRequested_ = true; }

    std::optional<Clock::time_point> nextDeadline() const;
    bool isPending(const std::string& name) const { return pending_.count(name) > 0; }
    std::size_t pendingCount() const { return pending_.size(); }
    // Files known to be mirrored on the server (uploaded or found in sync).
    const FileStateTable& mirrored() const { return mirrored_; }
    bool failed() const { return failed_; }

private:
    TransportClient& transport_;
    const SyncConfig& cfg_;
    Reporter& reporter_;
    SessionContext& ctx_;
    ReconnectSupervisor& supervisor_;

    std::map<std::string, Clock::time_point> pending_; // name -> fire time
    FileStateTable mirrored_;
    bool reconcileRequested_ = false;
    bool failed_ = false;

    static bool ignored(const std::string& name);
    std::string remotePath(const std::string& name) const;
    std::string localPath(const std::string& name) const;

    void schedule(const std::string& name, Clock::time_point when);
    bool cancel(const std::string& name);
    void uploadIfPresent(const std::string& name);
    bool uploadFile(const std::string& name, std::int64_t size);
    void deleteRemote(const std::string& name);
    void renameRemote(const std::string& from, const std::string& to, Clock::time_point now);
    // After a failed operation: reconnect when the link is gone. False once fatal.
    bool checkConnection();
};

} // namespace mirrorsync
