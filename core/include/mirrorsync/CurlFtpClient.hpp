// TransportClient implementation for plain FTP using libcurl.
// One easy handle is kept per session so libcurl reuses the control connection.
#pragma once
#include "TransportClient.hpp"
#include <string>
#include <vector>

typedef void CURL;

namespace mirrorsync {

// FTP has no reliable entry type in NLST output: listSubdirectories() reports every
// entry except "." and "..", so callers must tolerate files in that list.
// rename() is emulated with renameByCopy() and is not atomic.
class CurlFtpClient : public TransportClient {
public:
    CurlFtpClient();
    ~CurlFtpClient() override;

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

    bool nativeRename() const override { return false; }
    TransportKind kind() const override { return TransportKind::Ftp; }

private:
    bool connected_ = false;
    CURL* curl_ = nullptr;
    SessionOptions opt_{};

    // Reset the handle to the session defaults (credentials, timeouts, keepalive) and target url.
    void prepare(const std::string& url);
    // curl_easy_perform() with error text; marks the session dead on network-level failures.
    bool perform(const std::string& what, std::string& err);
    std::string urlFor(const std::string& remote_path, bool isDir) const;
};

} // namespace mirrorsync
