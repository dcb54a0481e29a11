// Abstract interface for remote file operations. Concrete backends (libssh2 SFTP,
// libcurl FTP, in-memory mock) follow this API so the engine never branches on protocol.
#pragma once
#include "SyncTypes.hpp"
#include <memory>

namespace mirrorsync {

class TransportClient {
public:
    virtual ~TransportClient() = default;

    // Connect and disconnect. connect() never throws; the cause goes to err.
    virtual bool connect(const SessionOptions& opt, std::string& err) = 0;
    // Safe to call when not connected.
    virtual void disconnect() = 0;
    // False once the backend has observed a dead connection.
    virtual bool isConnected() const = 0;

    // Names in remote_path, without "." and "..". On error out is empty and false is returned.
    virtual bool listEntries(const std::string& remote_path,
                             std::vector<std::string>& out,
                             std::string& err) = 0;

    // Subdirectory names in remote_path. Backends without reliable type
    // information may report false positives (see CurlFtpClient).
    virtual bool listSubdirectories(const std::string& remote_path,
                                    std::vector<std::string>& out,
                                    std::string& err) = 0;

    // Size in bytes, or -1 when unavailable (missing file or protocol error).
    virtual std::int64_t statSize(const std::string& remote_path) = 0;

    // Check existence (leave err empty if "does not exist")
    virtual bool exists(const std::string& remote_path,
                        bool& isDir,
                        std::string& err) = 0;

    // Download a remote file to local (create/truncate).
    virtual bool download(const std::string& remote,
                          const std::string& local,
                          std::string& err,
                          ProgressCB progress = {}) = 0;

    // Upload a local file to remote (create/truncate).
    virtual bool upload(const std::string& local,
                        const std::string& remote,
                        std::string& err,
                        ProgressCB progress = {}) = 0;

    virtual bool removeFile(const std::string& remote_path,
                            std::string& err) = 0;

    virtual bool rename(const std::string& from,
                        const std::string& to,
                        std::string& err) = 0;

    // Whether rename() is a single atomic server-side operation.
    virtual bool nativeRename() const = 0;

    virtual TransportKind kind() const = 0;
};

// Create the backend for the given protocol. Selected once per session.
std::unique_ptr<TransportClient> makeTransport(TransportKind kind);

// Rename for servers without a usable rename command:
// download `from` to a local temp file, delete `from`, upload as `to`, delete the temp file.
// Not atomic. On failure err tells which step broke; `partial` is set when the
// remote side was already modified (original deleted) before the failure.
bool renameByCopy(TransportClient& client,
                  const std::string& from,
                  const std::string& to,
                  std::string& err,
                  bool* partial = nullptr);

// Join a remote directory and a base name with '/'.
std::string joinRemote(const std::string& dir, const std::string& name);

} // namespace mirrorsync
