// Simulated remote server for engine tests without network.
// Keeps an in-memory file tree and allows injecting connection and transfer failures.
#pragma once
#include "TransportClient.hpp"
#include <map>
#include <mutex>
#include <set>

namespace mirrorsync {

class MockTransportClient : public TransportClient {
public:
    explicit MockTransportClient(TransportKind kind = TransportKind::Sftp)
        : kind_(kind) {}

    bool connect(const SessionOptions& opt, std::string& err) override;
    void disconnect() override;
    bool isConnected() const override;

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

    // FTP flavour emulates rename by copy like the real backend
    bool nativeRename() const override { return kind_ == TransportKind::Sftp; }
    TransportKind kind() const override { return kind_; }

    // --- Server-side manipulation (test setup) ---
    void putFile(const std::string& path, const std::string& content);
    void makeDir(const std::string& path);
    void eraseFile(const std::string& path);
    bool hasFile(const std::string& path) const;
    std::string content(const std::string& path) const;

    // --- Failure injection ---
    void setConnectFails(bool v);
    void setListingFails(bool v);
    // The next `times` downloads of `path` fail with a transfer error.
    void failDownloads(const std::string& path, int times);
    // The next `times` uploads of `path` fail with a transfer error.
    void failUploads(const std::string& path, int times);
    // Simulate a dropped link: every call fails until the next connect().
    void dropConnection();

    // --- Call accounting ---
    int downloadCount(const std::string& path) const;
    int uploadCount(const std::string& path) const;
    int totalDownloads() const;
    int totalUploads() const;
    int removeCount() const;
    int connectCount() const;

private:
    const TransportKind kind_;
    mutable std::mutex mtx_;
    bool connected_ = false;
    bool connectFails_ = false;
    bool listingFails_ = false;

    // Mini simulated remote FS: full path -> contents
    std::map<std::string, std::string> files_;
    std::set<std::string> dirs_ = {"/"};

    std::map<std::string, int> failDownloads_;
    std::map<std::string, int> failUploads_;
    std::map<std::string, int> downloads_;
    std::map<std::string, int> uploads_;
    int removes_ = 0;
    int connects_ = 0;

    static std::string parentOf(const std::string& path);
    static std::string baseName(const std::string& path);
};

} // namespace mirrorsync
