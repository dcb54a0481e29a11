#include "mirrorsync/SyncTypes.hpp"

namespace mirrorsync {

const char* toString(TransportKind kind) {
    return kind == TransportKind::Sftp ? "SFTP" : "FTP";
}

const char* toString(Direction dir) {
    return dir == Direction::RemoteToLocal ? "REMOTE (remote -> local)" : "LOCAL (local -> remote)";
}

bool validateConfig(const SyncConfig& cfg, std::string& err) {
    if (cfg.session.host.empty()) {
        err = "Host is required";
        return false;
    }
    if (cfg.session.username.empty()) {
        err = "User name is required";
        return false;
    }
    if (cfg.session.port == 0) {
        err = "Port must be between 1 and 65535";
        return false;
    }
    if (cfg.remoteRoot.empty()) {
        err = "Remote folder is required";
        return false;
    }
    if (cfg.localRoot.empty()) {
        err = "Local folder is required";
        return false;
    }
    if (cfg.baseIntervalSec <= 0) {
        err = "Interval must be a positive number of seconds";
        return false;
    }
    if (cfg.transport == TransportKind::Ftp && cfg.session.private_key_path) {
        err = "Key authentication is only available over SFTP";
        return false;
    }
    return true;
}

} // namespace mirrorsync
