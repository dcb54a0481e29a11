// Backend selection and protocol-independent helpers.
#include "mirrorsync/TransportClient.hpp"
#include "mirrorsync/CurlFtpClient.hpp"
#include "mirrorsync/Libssh2SftpClient.hpp"
#include "mirrorsync/Log.hpp"

#include <filesystem>
#include <unistd.h>

namespace mirrorsync {

std::unique_ptr<TransportClient> makeTransport(TransportKind kind) {
    if (kind == TransportKind::Ftp) return std::make_unique<CurlFtpClient>();
    return std::make_unique<Libssh2SftpClient>();
}

std::string joinRemote(const std::string& dir, const std::string& name) {
    if (dir.empty()) return name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

bool renameByCopy(TransportClient& client,
                  const std::string& from,
                  const std::string& to,
                  std::string& err,
                  bool* partial) {
    namespace fs = std::filesystem;
    if (partial) *partial = false;

    std::error_code ec;
    fs::path tmpDir = fs::temp_directory_path(ec);
    if (ec) tmpDir = "/tmp";
    const std::string base = fs::path(from).filename().string();
    const fs::path tmp = tmpDir / ("mirrorsync-" + std::to_string(::getpid()) + "-" + base + ".part");

    std::string stepErr;
    if (!client.download(from, tmp.string(), stepErr)) {
        fs::remove(tmp, ec);
        err = "rename " + from + " -> " + to + ": download step failed: " + stepErr;
        return false;
    }
    if (!client.removeFile(from, stepErr)) {
        fs::remove(tmp, ec);
        err = "rename " + from + " -> " + to + ": delete step failed: " + stepErr;
        return false;
    }
    if (!client.upload(tmp.string(), to, stepErr)) {
        // The original is gone remotely; the temp copy is the only one left, keep it.
        if (partial) *partial = true;
        err = "rename " + from + " -> " + to + ": upload step failed after deleting the original (copy kept at " +
              tmp.string() + "): " + stepErr;
        return false;
    }
    if (!fs::remove(tmp, ec) && ec) {
        LOGW("could not remove temp file %s: %s", tmp.c_str(), ec.message().c_str());
    }
    return true;
}

} // namespace mirrorsync
