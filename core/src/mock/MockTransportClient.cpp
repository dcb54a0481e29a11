// Mock implementation: an in-memory map of remote paths to file contents.
#include "mirrorsync/MockTransportClient.hpp"
#include <fstream>
#include <iterator>

namespace mirrorsync {

std::string MockTransportClient::parentOf(const std::string& path) {
    const auto slash = path.find_last_of('/');
    if (slash == std::string::npos) return ".";
    if (slash == 0) return "/";
    return path.substr(0, slash);
}

std::string MockTransportClient::baseName(const std::string& path) {
    const auto slash = path.find_last_of('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool MockTransportClient::connect(const SessionOptions& opt, std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and user are required";
        return false;
    }
    ++connects_;
    if (connectFails_) {
        err = "Connection refused (mock)";
        return false;
    }
    connected_ = true;
    return true;
}

void MockTransportClient::disconnect() {
    std::lock_guard<std::mutex> lk(mtx_);
    connected_ = false;
}

bool MockTransportClient::isConnected() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return connected_;
}

bool MockTransportClient::listEntries(const std::string& remote_path,
                                      std::vector<std::string>& out,
                                      std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    out.clear();
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    if (listingFails_) {
        err = "Listing failed (mock)";
        return false;
    }
    if (!dirs_.count(remote_path)) {
        err = "Remote path not found in mock: " + remote_path;
        return false;
    }
    for (const auto& kv : files_) {
        if (parentOf(kv.first) == remote_path) out.push_back(baseName(kv.first));
    }
    for (const auto& d : dirs_) {
        if (d != "/" && parentOf(d) == remote_path) out.push_back(baseName(d));
    }
    return true;
}

bool MockTransportClient::listSubdirectories(const std::string& remote_path,
                                             std::vector<std::string>& out,
                                             std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    out.clear();
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    if (!dirs_.count(remote_path)) {
        err = "Remote path not found in mock: " + remote_path;
        return false;
    }
    for (const auto& d : dirs_) {
        if (d != "/" && parentOf(d) == remote_path) out.push_back(baseName(d));
    }
    // Same approximation as the real FTP backend
    if (kind_ == TransportKind::Ftp) {
        for (const auto& kv : files_) {
            if (parentOf(kv.first) == remote_path) out.push_back(baseName(kv.first));
        }
    }
    return true;
}

std::int64_t MockTransportClient::statSize(const std::string& remote_path) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!connected_) return -1;
    auto it = files_.find(remote_path);
    if (it == files_.end()) return -1;
    return (std::int64_t)it->second.size();
}

bool MockTransportClient::exists(const std::string& remote_path,
                                 bool& isDir,
                                 std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    isDir = false;
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    err.clear();
    if (files_.count(remote_path)) return true;
    if (dirs_.count(remote_path)) {
        isDir = true;
        return true;
    }
    return false;
}

bool MockTransportClient::download(const std::string& remote,
                                   const std::string& local,
                                   std::string& err,
                                   ProgressCB progress) {
    std::string data;
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (!connected_) {
            err = "Not connected";
            return false;
        }
        ++downloads_[remote];
        auto f = failDownloads_.find(remote);
        if (f != failDownloads_.end() && f->second > 0) {
            --f->second;
            err = "Download failed (mock): " + remote;
            return false;
        }
        auto it = files_.find(remote);
        if (it == files_.end()) {
            err = "No such remote file: " + remote;
            return false;
        }
        data = it->second;
    }
    std::ofstream os(local, std::ios::binary | std::ios::trunc);
    if (!os) {
        err = "Could not open local file for writing: " + local;
        return false;
    }
    os.write(data.data(), (std::streamsize)data.size());
    if (!os) {
        err = "Local write failed: " + local;
        return false;
    }
    if (progress) progress(data.size(), data.size());
    return true;
}

bool MockTransportClient::upload(const std::string& local,
                                 const std::string& remote,
                                 std::string& err,
                                 ProgressCB progress) {
    std::ifstream is(local, std::ios::binary);
    if (!is) {
        err = "Could not open local file for reading: " + local;
        return false;
    }
    std::string data((std::istreambuf_iterator<char>(is)), std::istreambuf_iterator<char>());

    std::lock_guard<std::mutex> lk(mtx_);
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    ++uploads_[remote];
    auto f = failUploads_.find(remote);
    if (f != failUploads_.end() && f->second > 0) {
        --f->second;
        err = "Upload failed (mock): " + remote;
        return false;
    }
    if (!dirs_.count(parentOf(remote))) {
        err = "No such remote directory: " + parentOf(remote);
        return false;
    }
    files_[remote] = data;
    if (progress) progress(data.size(), data.size());
    return true;
}

bool MockTransportClient::removeFile(const std::string& remote_path,
                                     std::string& err) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    ++removes_;
    if (!files_.erase(remote_path)) {
        err = "No such remote file: " + remote_path;
        return false;
    }
    return true;
}

bool MockTransportClient::rename(const std::string& from,
                                 const std::string& to,
                                 std::string& err) {
    if (!nativeRename()) return renameByCopy(*this, from, to, err);

    std::lock_guard<std::mutex> lk(mtx_);
    if (!connected_) {
        err = "Not connected";
        return false;
    }
    auto it = files_.find(from);
    if (it == files_.end()) {
        err = "No such remote file: " + from;
        return false;
    }
    files_[to] = it->second;
    files_.erase(from);
    return true;
}

void MockTransportClient::putFile(const std::string& path, const std::string& content) {
    std::lock_guard<std::mutex> lk(mtx_);
    files_[path] = content;
}

void MockTransportClient::makeDir(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    dirs_.insert(path);
}

void MockTransportClient::eraseFile(const std::string& path) {
    std::lock_guard<std::mutex> lk(mtx_);
    files_.erase(path);
}

bool MockTransportClient::hasFile(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    return files_.count(path) > 0;
}

std::string MockTransportClient::content(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = files_.find(path);
    return it == files_.end() ? std::string() : it->second;
}

void MockTransportClient::setConnectFails(bool v) {
    std::lock_guard<std::mutex> lk(mtx_);
    connectFails_ = v;
}

void MockTransportClient::setListingFails(bool v) {
    std::lock_guard<std::mutex> lk(mtx_);
    listingFails_ = v;
}

void MockTransportClient::failDownloads(const std::string& path, int times) {
    std::lock_guard<std::mutex> lk(mtx_);
    failDownloads_[path] = times;
}

void MockTransportClient::failUploads(const std::string& path, int times) {
    std::lock_guard<std::mutex> lk(mtx_);
    failUploads_[path] = times;
}

void MockTransportClient::dropConnection() {
    std::lock_guard<std::mutex> lk(mtx_);
    connected_ = false;
}

int MockTransportClient::downloadCount(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = downloads_.find(path);
    return it == downloads_.end() ? 0 : it->second;
}

int MockTransportClient::uploadCount(const std::string& path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = uploads_.find(path);
    return it == uploads_.end() ? 0 : it->second;
}

int MockTransportClient::totalDownloads() const {
    std::lock_guard<std::mutex> lk(mtx_);
    int n = 0;
    for (const auto& kv : downloads_) n += kv.second;
    return n;
}

int MockTransportClient::totalUploads() const {
    std::lock_guard<std::mutex> lk(mtx_);
    int n = 0;
    for (const auto& kv : uploads_) n += kv.second;
    return n;
}

int MockTransportClient::removeCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return removes_;
}

int MockTransportClient::connectCount() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return connects_;
}

} // namespace mirrorsync
