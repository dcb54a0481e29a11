#include "mirrorsync/LocalReconciler.hpp"
#include "mirrorsync/Log.hpp"

#include <filesystem>
#include <set>

namespace fs = std::filesystem;

namespace mirrorsync {

LocalReconciler::LocalReconciler(TransportClient& transport,
                                 const SyncConfig& cfg,
                                 Reporter& reporter,
                                 SessionContext& ctx,
                                 ReconnectSupervisor& supervisor)
    : transport_(transport), cfg_(cfg), reporter_(reporter), ctx_(ctx), supervisor_(supervisor) {}

bool LocalReconciler::ignored(const std::string& name) {
    return name.empty() || name == "logs";
}

std::string LocalReconciler::remotePath(const std::string& name) const {
    return joinRemote(cfg_.remoteRoot, name);
}

std::string LocalReconciler::localPath(const std::string& name) const {
    return (fs::path(cfg_.localRoot) / name).string();
}

std::optional<LocalReconciler::Clock::time_point> LocalReconciler::nextDeadline() const {
    std::optional<Clock::time_point> next;
    for (const auto& kv : pending_) {
        if (!next || kv.second < *next) next = kv.second;
    }
    return next;
}

void LocalReconciler::schedule(const std::string& name, Clock::time_point when) {
    auto it = pending_.find(name);
    if (it != pending_.end() && it->second > when) return;
    pending_[name] = when;
}

bool LocalReconciler::cancel(const std::string& name) {
    return pending_.erase(name) > 0;
}

void LocalReconciler::handle(const ChangeEvent& ev, Clock::time_point now) {
    if (failed_) return;
    std::error_code ec;
    switch (ev.kind) {
        case ChangeEvent::Kind::Overflow:
            reporter_.warn("File events were lost, scheduling a full reconciliation");
            requestReconcile();
            break;
        case ChangeEvent::Kind::Created:
            if (ignored(ev.name) || fs::is_directory(localPath(ev.name), ec)) return;
            reporter_.info("NEW FILE DETECTED: " + ev.name);
            schedule(ev.name, now + cfg_.tuning.settleDelay);
            break;
        case ChangeEvent::Kind::Modified:
            if (ignored(ev.name) || fs::is_directory(localPath(ev.name), ec)) return;
            // Latest modification wins: the timer restarts.
            pending_[ev.name] = now + cfg_.tuning.debounceDelay;
            break;
        case ChangeEvent::Kind::Deleted:
            if (ignored(ev.name)) return;
            cancel(ev.name);
            deleteRemote(ev.name);
            break;
        case ChangeEvent::Kind::Moved: {
            const bool fromIgnored = ignored(ev.name);
            const bool toIgnored = ignored(ev.newName);
            if (fromIgnored && toIgnored) return;
            if (fromIgnored) {
                schedule(ev.newName, now + cfg_.tuning.settleDelay);
            } else if (toIgnored) {
                cancel(ev.name);
                deleteRemote(ev.name);
            } else {
                renameRemote(ev.name, ev.newName, now);
            }
            break;
        }
    }
}

bool LocalReconciler::fireDue(Clock::time_point now) {
    if (failed_) return false;
    std::vector<std::string> due;
    for (const auto& kv : pending_) {
        if (kv.second <= now) due.push_back(kv.first);
    }
    for (const auto& name : due) {
        pending_.erase(name);
        uploadIfPresent(name);
        if (failed_) return false;
    }
    if (reconcileRequested_) return reconcile();
    return true;
}

void LocalReconciler::uploadIfPresent(const std::string& name) {
    const std::string path = localPath(name);
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        LOGI("%s is gone before upload, skipped", name.c_str());
        return;
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        reporter_.error(ErrorKind::Local, "Cannot read " + path + ": " + ec.message());
        return;
    }
    uploadFile(name, (std::int64_t)size);
}

bool LocalReconciler::uploadFile(const std::string& name, std::int64_t size) {
    std::string err;
    auto onProgress = [this, &name](std::size_t done, std::size_t total) {
        reporter_.progress(name, done, total);
    };
    if (!transport_.upload(localPath(name), remotePath(name), err, onProgress)) {
        reporter_.error(ErrorKind::Transfer, "UPLOAD FAILED: " + name + " - " + err);
        checkConnection();
        return false;
    }
    ctx_.markActivity();
    FileState st;
    st.size = size;
    st.lastSeen = std::chrono::system_clock::now();
    mirrored_.record(name, st);
    reporter_.info("UPLOADED: " + name + " from local to remote");
    return true;
}

void LocalReconciler::deleteRemote(const std::string& name) {
    std::string err;
    if (transport_.removeFile(remotePath(name), err)) {
        ctx_.markActivity();
        mirrored_.erase(name);
        reporter_.info("FILE DELETED REMOTELY: " + name);
        return;
    }
    if (!checkConnection()) return;
    // Never reached the server (e.g. deleted before its upload fired): nothing to do.
    bool isDir = false;
    std::string existsErr;
    if (!transport_.exists(remotePath(name), isDir, existsErr) && existsErr.empty()) {
        mirrored_.erase(name);
        LOGI("%s not on the server, delete skipped", name.c_str());
        return;
    }
    reporter_.error(ErrorKind::Transfer, "REMOTE DELETE FAILED: " + name + " - " + err);
}

void LocalReconciler::renameRemote(const std::string& from, const std::string& to, Clock::time_point now) {
    const bool wasPending = cancel(from);
    bool isDir = false;
    std::string err;
    const bool onServer = transport_.exists(remotePath(from), isDir, err);
    if (!checkConnection()) return;
    if (!onServer || isDir) {
        // Nothing to rename remotely: treat the new name as a fresh file.
        schedule(to, now + cfg_.tuning.settleDelay);
        return;
    }

    bool partial = false;
    err.clear();
    const bool ok = transport_.nativeRename()
                        ? transport_.rename(remotePath(from), remotePath(to), err)
                        : renameByCopy(transport_, remotePath(from), remotePath(to), err, &partial);
    if (ok) {
        ctx_.markActivity();
        if (const FileState* st = mirrored_.find(from)) {
            const FileState copy = *st;
            mirrored_.erase(from);
            mirrored_.record(to, copy);
        }
        reporter_.info("FILE RENAMED: " + from + " -> " + to);
        if (wasPending) schedule(to, now + cfg_.tuning.settleDelay);
        return;
    }
    if (partial) {
        mirrored_.erase(from);
        reporter_.error(ErrorKind::ProtocolLimitation, "Rename left the server half done: " + err);
    } else {
        reporter_.error(ErrorKind::Transfer, "RENAME FAILED: " + from + " -> " + to + " - " + err);
    }
    checkConnection();
}

bool LocalReconciler::checkConnection() {
    if (failed_) return false;
    if (transport_.isConnected()) return true;
    if (!supervisor_.recover()) {
        failed_ = true;
        return false;
    }
    // Whatever failed while the link was down is picked up by a full pass.
    requestReconcile();
    return true;
}

bool LocalReconciler::reconcile() {
    if (failed_) return false;
    reconcileRequested_ = false;

    std::map<std::string, std::int64_t> local;
    std::error_code ec;
    for (fs::directory_iterator it(cfg_.localRoot, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code fec;
        if (!it->is_regular_file(fec)) continue;
        const std::string name = it->path().filename().string();
        if (ignored(name)) continue;
        const auto size = it->file_size(fec);
        if (fec) continue;
        local[name] = (std::int64_t)size;
    }
    if (ec) {
        reporter_.error(ErrorKind::Local, "Cannot read local folder " + cfg_.localRoot + ": " + ec.message());
        return true;
    }

    std::vector<std::string> listing;
    std::string err;
    if (!transport_.listEntries(cfg_.remoteRoot, listing, err)) {
        reporter_.error(ErrorKind::Listing, "Could not list " + cfg_.remoteRoot + ": " + err);
        // A later pass is requested again by checkConnection() after a reconnect.
        return checkConnection();
    }
    const std::set<std::string> remote(listing.begin(), listing.end());

    for (const auto& kv : local) {
        const std::string& name = kv.first;
        if (isPending(name)) continue;
        const bool onServer = remote.count(name) > 0;
        const std::int64_t remoteSize = onServer ? transport_.statSize(remotePath(name)) : -1;
        if (!transport_.isConnected()) return checkConnection();
        if (onServer && remoteSize == kv.second) {
            if (!mirrored_.contains(name)) {
                FileState st;
                st.size = kv.second;
                st.lastSeen = std::chrono::system_clock::now();
                mirrored_.record(name, st);
            }
            continue;
        }
        reporter_.info(onServer ? "FILE CHANGED: " + name : "NEW FILE DETECTED: " + name);
        uploadFile(name, kv.second);
        if (failed_) return false;
    }

    for (const auto& name : mirrored_.names()) {
        if (local.count(name)) continue;
        if (remote.count(name)) {
            deleteRemote(name);
            if (failed_) return false;
        } else {
            mirrored_.erase(name);
        }
    }
    return !failed_;
}

} // namespace mirrorsync
