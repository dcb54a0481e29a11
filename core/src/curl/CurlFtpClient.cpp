// libcurl FTP backend: NLST listings, SIZE for stat, DELE via quote commands.
// The easy handle is reused across calls so the control connection stays open.
#include "mirrorsync/CurlFtpClient.hpp"
#include "mirrorsync/Log.hpp"
#include <curl/curl.h>

#include <cstdio>
#include <cstring>
#include <mutex>
#include <sstream>

namespace mirrorsync {

static std::once_flag g_curl_once;

// Seconds without progress before libcurl gives up on a request
static const long kTimeoutSec = 20;

namespace {

struct ProgressCtx {
    const ProgressCB* cb = nullptr;
    bool upload = false;
};

size_t appendToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* s = static_cast<std::string*>(userdata);
    s->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t writeToFile(char* ptr, size_t size, size_t nmemb, void* userdata) {
    return std::fwrite(ptr, size, nmemb, static_cast<FILE*>(userdata)) * size;
}

size_t readFromFile(char* ptr, size_t size, size_t nmemb, void* userdata) {
    FILE* f = static_cast<FILE*>(userdata);
    const size_t n = std::fread(ptr, size, nmemb, f);
    if (n == 0 && std::ferror(f)) return CURL_READFUNC_ABORT;
    return n * size;
}

int onTransferInfo(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                   curl_off_t ultotal, curl_off_t ulnow) {
    auto* ctx = static_cast<ProgressCtx*>(clientp);
    if (ctx && ctx->cb && *ctx->cb) {
        if (ctx->upload)
            (*ctx->cb)((std::size_t)ulnow, (std::size_t)ultotal);
        else
            (*ctx->cb)((std::size_t)dlnow, (std::size_t)dltotal);
    }
    return 0;
}

bool isNetworkFailure(CURLcode rc) {
    switch (rc) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_LOGIN_DENIED:
        case CURLE_FTP_ACCEPT_TIMEOUT:
            return true;
        default:
            return false;
    }
}

} // namespace

CurlFtpClient::CurlFtpClient() {
    std::call_once(g_curl_once, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) LOGE("curl_global_init failed");
    });
}

CurlFtpClient::~CurlFtpClient() {
    disconnect();
}

std::string CurlFtpClient::urlFor(const std::string& remote_path, bool isDir) const {
    std::ostringstream url;
    url << "ftp://" << opt_.host << ":" << opt_.port << "/";
    // Leading %2F makes the path absolute instead of relative to the login directory
    const bool absolute = !remote_path.empty() && remote_path[0] == '/';
    if (absolute) url << "%2F";

    std::string comp;
    bool first = true;
    std::istringstream parts(remote_path);
    while (std::getline(parts, comp, '/')) {
        if (comp.empty()) continue;
        char* esc = curl_easy_escape(curl_, comp.c_str(), (int)comp.size());
        if (!first) url << '/';
        url << (esc ? esc : comp.c_str());
        if (esc) curl_free(esc);
        first = false;
    }
    if (isDir && (!first || absolute)) url << '/';
    return url.str();
}

void CurlFtpClient::prepare(const std::string& url) {
    curl_easy_reset(curl_);
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_USERNAME, opt_.username.c_str());
    if (opt_.password) curl_easy_setopt(curl_, CURLOPT_PASSWORD, opt_.password->c_str());
    curl_easy_setopt(curl_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, kTimeoutSec);
    curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_TIME, kTimeoutSec);
    curl_easy_setopt(curl_, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl_, CURLOPT_SERVER_RESPONSE_TIMEOUT, kTimeoutSec);
    curl_easy_setopt(curl_, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl_, CURLOPT_FTP_FILEMETHOD, (long)CURLFTPMETHOD_SINGLECWD);
}

bool CurlFtpClient::perform(const std::string& what, std::string& err) {
    char errbuf[CURL_ERROR_SIZE];
    errbuf[0] = '\0';
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, errbuf);
    const CURLcode rc = curl_easy_perform(curl_);
    curl_easy_setopt(curl_, CURLOPT_ERRORBUFFER, nullptr);
    if (rc == CURLE_OK) return true;

    err = what + ": " + (errbuf[0] ? std::string(errbuf) : std::string(curl_easy_strerror(rc)));
    if (isNetworkFailure(rc)) {
        LOGW("FTP connection lost (%d): %s", (int)rc, err.c_str());
        connected_ = false;
    }
    return false;
}

bool CurlFtpClient::connect(const SessionOptions& opt, std::string& err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    disconnect();
    opt_ = opt;
    curl_ = curl_easy_init();
    if (!curl_) {
        err = "curl_easy_init failed";
        return false;
    }
    // Login + CWD to the server root, no transfer
    prepare(urlFor("", true));
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    connected_ = true;
    if (!perform("FTP login to " + opt.host, err)) {
        disconnect();
        return false;
    }
    LOGI("FTP connected to %s:%u", opt.host.c_str(), (unsigned)opt.port);
    return true;
}

void CurlFtpClient::disconnect() {
    if (curl_) {
        curl_easy_cleanup(curl_);
        curl_ = nullptr;
    }
    connected_ = false;
}

bool CurlFtpClient::listEntries(const std::string& remote_path,
                                std::vector<std::string>& out,
                                std::string& err) {
    out.clear();
    if (!connected_ || !curl_) {
        err = "Not connected";
        return false;
    }
    std::string raw;
    prepare(urlFor(remote_path, true));
    curl_easy_setopt(curl_, CURLOPT_DIRLISTONLY, 1L); // NLST
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, appendToString);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &raw);
    if (!perform("NLST " + remote_path, err)) return false;

    std::istringstream lines(raw);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        // Some servers answer NLST with paths instead of names
        const auto slash = line.find_last_of('/');
        if (slash != std::string::npos) line = line.substr(slash + 1);
        if (line.empty() || line == "." || line == "..") continue;
        out.push_back(line);
    }
    return true;
}

bool CurlFtpClient::listSubdirectories(const std::string& remote_path,
                                       std::vector<std::string>& out,
                                       std::string& err) {
    // No mode bits over NLST: every entry is offered as a directory.
    return listEntries(remote_path, out, err);
}

std::int64_t CurlFtpClient::statSize(const std::string& remote_path) {
    if (!connected_ || !curl_) return -1;
    std::string err;
    prepare(urlFor(remote_path, false));
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L); // SIZE (+ MDTM) without RETR
    if (!perform("SIZE " + remote_path, err)) return -1;
    curl_off_t len = -1;
    if (curl_easy_getinfo(curl_, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &len) != CURLE_OK) return -1;
    return len < 0 ? -1 : (std::int64_t)len;
}

bool CurlFtpClient::exists(const std::string& remote_path,
                           bool& isDir,
                           std::string& err) {
    isDir = false;
    if (!connected_ || !curl_) {
        err = "Not connected";
        return false;
    }
    if (statSize(remote_path) >= 0) return true;
    if (!connected_) {
        err = "Connection lost while checking " + remote_path;
        return false;
    }
    std::string dirErr;
    prepare(urlFor(remote_path, true));
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    if (perform("CWD " + remote_path, dirErr)) {
        isDir = true;
        return true;
    }
    if (!connected_) {
        err = dirErr;
        return false;
    }
    err.clear();
    return false; // does not exist
}

bool CurlFtpClient::download(const std::string& remote,
                             const std::string& local,
                             std::string& err,
                             ProgressCB progress) {
    if (!connected_ || !curl_) {
        err = "Not connected";
        return false;
    }
    FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        err = "Could not open local file for writing: " + local;
        return false;
    }
    ProgressCtx pctx{&progress, false};
    prepare(urlFor(remote, false));
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeToFile);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, lf);
    curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, onTransferInfo);
    curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &pctx);
    bool ok = perform("RETR " + remote, err);
    if (std::fclose(lf) != 0 && ok) {
        err = "Local write failed: " + local;
        ok = false;
    }
    return ok;
}

bool CurlFtpClient::upload(const std::string& local,
                           const std::string& remote,
                           std::string& err,
                           ProgressCB progress) {
    if (!connected_ || !curl_) {
        err = "Not connected";
        return false;
    }
    FILE* lf = std::fopen(local.c_str(), "rb");
    if (!lf) {
        err = "Could not open local file for reading: " + local;
        return false;
    }
    std::fseek(lf, 0, SEEK_END);
    long fsz = std::ftell(lf);
    std::fseek(lf, 0, SEEK_SET);

    ProgressCtx pctx{&progress, true};
    prepare(urlFor(remote, false));
    curl_easy_setopt(curl_, CURLOPT_UPLOAD, 1L); // STOR
    curl_easy_setopt(curl_, CURLOPT_READFUNCTION, readFromFile);
    curl_easy_setopt(curl_, CURLOPT_READDATA, lf);
    curl_easy_setopt(curl_, CURLOPT_INFILESIZE_LARGE, (curl_off_t)(fsz > 0 ? fsz : 0));
    curl_easy_setopt(curl_, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl_, CURLOPT_XFERINFOFUNCTION, onTransferInfo);
    curl_easy_setopt(curl_, CURLOPT_XFERINFODATA, &pctx);
    const bool ok = perform("STOR " + remote, err);
    std::fclose(lf);
    return ok;
}

bool CurlFtpClient::removeFile(const std::string& remote_path,
                               std::string& err) {
    if (!connected_ || !curl_) {
        err = "Not connected";
        return false;
    }
    struct curl_slist* cmds = curl_slist_append(nullptr, ("DELE " + remote_path).c_str());
    if (!cmds) {
        err = "curl_slist_append failed";
        return false;
    }
    prepare(urlFor("", true));
    curl_easy_setopt(curl_, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl_, CURLOPT_QUOTE, cmds);
    const bool ok = perform("DELE " + remote_path, err);
    curl_easy_setopt(curl_, CURLOPT_QUOTE, nullptr);
    curl_slist_free_all(cmds);
    return ok;
}

bool CurlFtpClient::rename(const std::string& from,
                           const std::string& to,
                           std::string& err) {
    return renameByCopy(*this, from, to, err);
}

} // namespace mirrorsync
