// Remote -> local change detection by listing + size comparison.
#include "mirrorsync/FileStateTable.hpp"
#include "mirrorsync/Log.hpp"

#include <filesystem>
#include <set>

namespace mirrorsync {

const FileState* FileStateTable::find(const std::string& name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? nullptr : &it->second;
}

std::vector<std::string> FileStateTable::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.first);
    return out;
}

namespace {

bool downloadInto(TransportClient& transport,
                  const std::string& remotePath,
                  const std::string& localPath,
                  const std::string& name,
                  Reporter& reporter) {
    std::string err;
    auto onProgress = [&reporter, &name](std::size_t done, std::size_t total) {
        reporter.progress(name, done, total);
    };
    if (!transport.download(remotePath, localPath, err, onProgress)) {
        reporter.error(ErrorKind::Transfer, "DOWNLOAD FAILED: " + name + " - " + err);
        return false;
    }
    reporter.info("DOWNLOADED: " + name + " from remote to local");
    return true;
}

} // namespace

bool diffAndReconcile(TransportClient& transport,
                      const std::string& remoteDir,
                      const std::string& localDir,
                      FileStateTable& table,
                      Reporter& reporter) {
    namespace fs = std::filesystem;

    std::vector<std::string> listing;
    std::string err;
    if (!transport.listEntries(remoteDir, listing, err)) {
        reporter.error(ErrorKind::Listing, "Could not list " + remoteDir + ": " + err);
        return false;
    }

    bool changed = false;
    std::set<std::string> present;
    for (const auto& name : listing) {
        const std::string remotePath = joinRemote(remoteDir, name);
        bool isDir = false;
        std::string existsErr;
        const bool found = transport.exists(remotePath, isDir, existsErr);
        if (!transport.isConnected()) return changed;
        if (!found) {
            // Vanished between listing and stat; the next cycle sorts it out.
            if (!existsErr.empty()) LOGW("stat %s failed: %s", remotePath.c_str(), existsErr.c_str());
            if (table.contains(name)) present.insert(name);
            continue;
        }
        if (isDir) continue;
        present.insert(name);

        const std::int64_t size = transport.statSize(remotePath);
        if (!transport.isConnected()) return changed;

        const FileState* known = table.find(name);
        if (known && known->size == size) continue;

        reporter.info(known ? "FILE CHANGED: " + name : "NEW FILE DETECTED: " + name);
        const std::string localPath = (fs::path(localDir) / name).string();
        if (downloadInto(transport, remotePath, localPath, name, reporter)) {
            changed = true;
            FileState st;
            st.size = size;
            st.lastSeen = std::chrono::system_clock::now();
            table.record(name, st);
        } else if (!transport.isConnected()) {
            return changed;
        }
        // A failed download leaves the old entry (or none), so the next cycle retries.
    }

    for (const auto& name : table.names()) {
        if (present.count(name)) continue;
        changed = true;
        table.erase(name);
        const fs::path localPath = fs::path(localDir) / name;
        std::error_code ec;
        if (fs::remove(localPath, ec)) {
            reporter.info("FILE DELETED LOCALLY: " + name);
        } else if (ec) {
            reporter.error(ErrorKind::Local, "Could not delete " + localPath.string() + ": " + ec.message());
        } else {
            reporter.info("FILE REMOVED REMOTELY: " + name + " (no local copy)");
        }
    }
    return changed;
}

} // namespace mirrorsync
