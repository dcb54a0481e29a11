// Basic types shared between the front end and the sync engine.
// Keeping these structures plain makes them easy to fill from settings or the command line.
#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <chrono>
#include <functional>

namespace mirrorsync {

enum class TransportKind {
    Sftp,
    Ftp
};

// Which side is authoritative for the session.
enum class Direction {
    RemoteToLocal,
    LocalToRemote
};

// known_hosts validation policy for the server host key (SFTP only).
enum class KnownHostsPolicy {
    Strict,     // Requires exact match with known_hosts.
    AcceptNew,  // TOFU: accept and save new hosts; reject key changes.
    Off         // No verification (not recommended).
};

struct FileInfo {
    std::string   name;     // base name
    bool          is_dir = false;
    std::uint64_t size  = 0;  // bytes (if applicable)
    std::uint64_t mtime = 0;  // epoch (seconds)
    std::uint32_t mode  = 0;  // POSIX bits (permissions/type)
};

// Progress callback: bytes transferred so far and total size (0 if unknown).
using ProgressCB = std::function<void(std::size_t /*done*/, std::size_t /*total*/)>;

// Connection parameters consumed by a transport backend.
struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Host key confirmation (TOFU) when known_hosts lacks an entry.
    // Return true to accept and save, false to reject.
    std::function<bool(const std::string& host,
                       std::uint16_t port,
                       const std::string& algorithm,
                       const std::string& fingerprint)> hostkey_confirm_cb;
};

// Timing knobs of the engine. Defaults are the production values;
// tests shrink them to keep runs short.
struct EngineTuning {
    std::chrono::milliseconds fastInterval{5000};
    std::chrono::milliseconds mediumInterval{15000};
    std::chrono::milliseconds debounceDelay{2000};
    std::chrono::milliseconds settleDelay{1000};
    std::chrono::milliseconds reconnectDelay{5000};
    std::chrono::milliseconds sleepTick{1000};
    std::size_t eventQueueCapacity = 4096;
};

// Preset base intervals offered by the front end (seconds).
inline const std::vector<int>& intervalPresets() {
    static const std::vector<int> presets = {60, 300, 1200, 3600};
    return presets;
}

inline std::uint16_t defaultPort(TransportKind kind) {
    return kind == TransportKind::Sftp ? 22 : 21;
}

// Complete configuration of one sync session. Immutable once the engine starts.
struct SyncConfig {
    TransportKind transport = TransportKind::Sftp;
    SessionOptions session;
    std::string remoteRoot;
    std::string localRoot;
    int baseIntervalSec = 60;
    Direction direction = Direction::RemoteToLocal;
    EngineTuning tuning;

    std::chrono::milliseconds baseInterval() const {
        return std::chrono::seconds(baseIntervalSec);
    }
};

// Validate a config before a session starts. Returns false with a message on the first problem.
bool validateConfig(const SyncConfig& cfg, std::string& err);

const char* toString(TransportKind kind);
const char* toString(Direction dir);

} // namespace mirrorsync
