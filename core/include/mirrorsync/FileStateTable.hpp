// Last observed state of each remote file, and the diff that mirrors remote changes locally.
#pragma once
#include "Reporter.hpp"
#include "TransportClient.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace mirrorsync {

struct FileState {
    std::int64_t size = -1; // -1 when the server could not report it
    bool exists = true;
    std::chrono::system_clock::time_point lastSeen;
};

// Keyed by base name. Owned by a single loop, no locking.
class FileStateTable {
public:
    const FileState* find(const std::string& name) const;
    bool contains(const std::string& name) const { return entries_.count(name) > 0; }
    void record(const std::string& name, const FileState& state) { entries_[name] = state; }
    bool erase(const std::string& name) { return entries_.erase(name) > 0; }
    void clear() { entries_.clear(); }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    std::vector<std::string> names() const;

private:
    std::map<std::string, FileState> entries_;
};

// One detection cycle over remoteDir:
//  - new or resized files are downloaded into localDir and recorded once the download succeeds
//  - files gone from the listing are deleted locally and dropped from the table
//  - subdirectories are ignored
// A failed listing leaves the table untouched. Stops early if the transport loses
// its connection. Returns true when anything changed.
bool diffAndReconcile(TransportClient& transport,
                      const std::string& remoteDir,
                      const std::string& localDir,
                      FileStateTable& table,
                      Reporter& reporter);

} // namespace mirrorsync
