// TransportClient implementation using libssh2 for SSH/SFTP.
// Encapsulates the SSH session, SFTP channel, and TCP socket.
#pragma once
#include "TransportClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2 internal types (with leading underscore)
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace mirrorsync {

class Libssh2SftpClient : public TransportClient {
public:
    Libssh2SftpClient();
    ~Libssh2SftpClient() override;

    bool connect(const SessionOptions& opt, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    bool listEntries(const std::string& remote_path,
                     std::vector<std::string>& out,
                     std::string& err) override;

    bool listSubdirectories(const std::string& remote_path,
                            std::vector<std::string>& out,
                            std::string& err) override;

    std::int64_t statSize(const std::string& remote_path) override;

    bool exists(const std::string& remote_path,
                bool& isDir,
                std::string& err) override;

    bool download(const std::string& remote,
                  const std::string& local,
                  std::string& err,
                  ProgressCB progress) override;

    bool upload(const std::string& local,
                const std::string& remote,
                std::string& err,
                ProgressCB progress) override;

    bool removeFile(const std::string& remote_path,
                    std::string& err) override;

    bool rename(const std::string& from,
                const std::string& to,
                std::string& err) override;

    bool nativeRename() const override { return true; }
    TransportKind kind() const override { return TransportKind::Sftp; }

private:
    bool connected_ = false;
    int  sock_ = -1;
    _LIBSSH2_SESSION* session_ = nullptr; // <- uses internal libssh2 types
    _LIBSSH2_SFTP*    sftp_    = nullptr; // <- same

    // TCP connection + SSH handshake and authentication.
    bool tcpConnect(const std::string& host, uint16_t port, std::string& err);
    bool sshHandshakeAuth(const SessionOptions& opt, std::string& err);
    bool verifyHostKey(const SessionOptions& opt, std::string& err);
    bool authenticate(const SessionOptions& opt, std::string& err);
    bool authWithAgent(const std::string& user);

    // Full directory read shared by both listing calls.
    bool readDir(const std::string& remote_path,
                 std::vector<FileInfo>& out,
                 std::string& err);

    // Mark the session dead when libssh2 reports a socket-level failure.
    void checkSocketError();
};

} // namespace mirrorsync
