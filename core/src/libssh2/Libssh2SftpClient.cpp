// libssh2 backend: manages TCP socket, SSH session, and SFTP channel.
// Includes keepalive, known_hosts validation, and dead-connection detection.
#include "mirrorsync/Libssh2SftpClient.hpp"
#include "mirrorsync/Log.hpp"
#include <libssh2.h>
#include <libssh2_sftp.h>

#include <cstring>
#include <string>
#include <vector>
#include <chrono>
#include <thread>
#include <cstdlib>
#include <cstdio>
#include <sstream>
#include <mutex>

// POSIX sockets
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>
#include <unistd.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace mirrorsync {

// Global libssh2 initialization (once per process)
static std::once_flag g_libssh2_once;

// Context for keyboard-interactive: answer every prompt with the password
// unless the prompt asks for the user name.
struct KbdIntCtx {
    const char* user;
    const char* pass;
};

static char* dupResponse(const char* s, std::size_t len) {
    if (!s || len == 0) return nullptr;
    char* buf = static_cast<char*>(std::malloc(len + 1));
    if (!buf) return nullptr;
    std::memcpy(buf, s, len);
    buf[len] = '\0';
    return buf;
}

static bool promptWantsUser(const char* prompt) {
    std::string p = prompt ? prompt : "";
    for (auto& c : p) {
        if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    }
    return p.find("user") != std::string::npos || p.find("name") != std::string::npos;
}

static void kbint_callback(const char* name, int name_len,
                           const char* instruction, int instruction_len,
                           int num_prompts,
                           const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                           LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                           void** abstract) {
    (void)name; (void)name_len; (void)instruction; (void)instruction_len;
    if (!abstract || !*abstract) return;
    const KbdIntCtx* ctx = static_cast<const KbdIntCtx*>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        const char* prompt = (prompts && prompts[i].text) ? reinterpret_cast<const char*>(prompts[i].text) : "";
        const char* ans = promptWantsUser(prompt) ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = dupResponse(ans, alen);
        responses[i].length = responses[i].text ? (unsigned int)alen : 0;
    }
}

static std::string lastSessionError(LIBSSH2_SESSION* s) {
    char* msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(s, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, (size_t)len) : std::string();
}

Libssh2SftpClient::Libssh2SftpClient() {
    std::call_once(g_libssh2_once, [] {
        if (libssh2_init(0) != 0) LOGE("libssh2_init failed");
    });
}

Libssh2SftpClient::~Libssh2SftpClient() {
    disconnect();
}

bool Libssh2SftpClient::tcpConnect(const std::string& host, uint16_t port, std::string& err) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo* res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1) continue;
        // TCP keepalive so a silently dropped link is noticed between polls
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __linux__
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err = "Could not connect to " + host + ":" + portStr;
    return false;
}

bool Libssh2SftpClient::verifyHostKey(const SessionOptions& opt, std::string& err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off) return true;

    LIBSSH2_KNOWNHOSTS* nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else if (const char* home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty()) {
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    }
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char* hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not obtain host key";
        return false;
    }

    int alg = 0;
    std::string algName = "UNKNOWN";
    switch (keytype) {
        case LIBSSH2_HOSTKEY_TYPE_RSA:
            alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA; algName = "RSA"; break;
        case LIBSSH2_HOSTKEY_TYPE_DSS:
            alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS; algName = "DSA"; break;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
            alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256; algName = "ECDSA-256"; break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
            alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384; algName = "ECDSA-384"; break;
        case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
            alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521; algName = "ECDSA-521"; break;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
        case LIBSSH2_HOSTKEY_TYPE_ED25519:
            alg = LIBSSH2_KNOWNHOST_KEY_ED25519; algName = "ED25519"; break;
#endif
        default:
            break;
    }

    const int typemask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost* host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_hash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew && check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        // TOFU: SHA256 fingerprint in colon-separated hex
        std::string fpStr;
        const unsigned char* h = (const unsigned char*)libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256);
        if (h) {
            std::ostringstream oss;
            oss << "SHA256:";
            for (int i = 0; i < 32; ++i) {
                if (i) oss << ':';
                char b[4];
                std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
                oss << b;
            }
            fpStr = oss.str();
        }
        // Unattended sessions (reconnects) have no callback: accept what the policy allows
        const bool confirmed = opt.hostkey_confirm_cb
                                   ? opt.hostkey_confirm_cb(opt.host, opt.port, algName, fpStr)
                                   : true;
        if (!confirmed) {
            libssh2_knownhost_free(nh);
            err = "Unknown host: fingerprint not confirmed";
            return false;
        }
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path not set";
            return false;
        }
        const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr,
                                           hostkey, keylen,
                                           nullptr, 0, addMask, nullptr);
        if (addrc != 0 || libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = "Could not add host to known_hosts";
            return false;
        }
        LOGI("added %s key for %s to %s", algName.c_str(), opt.host.c_str(), khPath.c_str());
        libssh2_knownhost_free(nh);
        return true;
    }

    libssh2_knownhost_free(nh);
    if (opt.known_hosts_policy == KnownHostsPolicy::Strict || check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
                  ? "Host key does not match known_hosts"
                  : "Host not found in known_hosts";
        return false;
    }
    return true;
}

bool Libssh2SftpClient::authWithAgent(const std::string& user) {
    bool authed = false;
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (agent && libssh2_agent_connect(agent) == 0 && libssh2_agent_list_identities(agent) == 0) {
        struct libssh2_agent_publickey* identity = nullptr;
        struct libssh2_agent_publickey* prev = nullptr;
        int tries = 0;
        const int kMaxAgentTries = 3; // stay below typical MaxAuthTries
        while (!authed && tries < kMaxAgentTries &&
               libssh2_agent_get_identity(agent, &identity, prev) == 0) {
            prev = identity;
            ++tries;
            int arc = -1;
            for (;;) {
                arc = libssh2_agent_userauth(agent, user.c_str(), identity);
                if (arc != LIBSSH2_ERROR_EAGAIN) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            authed = (arc == 0);
        }
    }
    if (agent) {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    }
    return authed;
}

// Authentication order: private key if given; else password, then
// keyboard-interactive if the server offers it; ssh-agent as a last resort.
bool Libssh2SftpClient::authenticate(const SessionOptions& opt, std::string& err) {
    if (opt.private_key_path.has_value()) {
        const char* passphrase = opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        int rc = libssh2_userauth_publickey_fromfile(session_,
                                                     opt.username.c_str(),
                                                     nullptr, // public key derived from the private key
                                                     opt.private_key_path->c_str(),
                                                     passphrase);
        if (rc != 0) {
            err = "Public key authentication failed: " + lastSessionError(session_);
            return false;
        }
        return true;
    }

    std::string authlist;
    auto hasMethod = [&](const char* m) { return authlist.find(m) != std::string::npos; };
    auto fetchMethods = [&]() {
        if (!authlist.empty()) return;
        char* methods = libssh2_userauth_list(session_, opt.username.c_str(), (unsigned)opt.username.size());
        authlist = methods ? std::string(methods) : std::string();
    };

    if (opt.password.has_value()) {
        int rc_pw = -1;
        for (;;) {
            rc_pw = libssh2_userauth_password(session_, opt.username.c_str(), opt.password->c_str());
            if (rc_pw != LIBSSH2_ERROR_EAGAIN) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (rc_pw == 0) return true;

        // Server hung up after the password attempt: everything else would cascade-fail.
        if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
            rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
            err = "Server closed the connection after the password attempt";
            return false;
        }

        fetchMethods();
        if (hasMethod("keyboard-interactive")) {
            KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str()};
            void** abs = libssh2_session_abstract(session_);
            if (abs) *abs = &ctx;
            int rc_kbd = -1;
            for (;;) {
                rc_kbd = libssh2_userauth_keyboard_interactive(session_, opt.username.c_str(), kbint_callback);
                if (rc_kbd != LIBSSH2_ERROR_EAGAIN) break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (abs) *abs = nullptr;
            if (rc_kbd == 0) return true;
        }
    }

    fetchMethods();
    if (hasMethod("publickey") && authWithAgent(opt.username)) return true;

    err = std::string("Authentication failed") +
          (authlist.empty() ? std::string() : " (methods: " + authlist + ")");
    const std::string last = lastSessionError(session_);
    if (!last.empty()) err += ": " + last;
    return false;
}

bool Libssh2SftpClient::sshHandshakeAuth(const SessionOptions& opt, std::string& err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastSessionError(session_);
        return false;
    }

    // Blocking mode with a bounded timeout so a stalled server does not hang a cycle forever
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, 20000); // 20s

    // SSH keepalive every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err)) return false;
    if (!authenticate(opt, err)) return false;

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_) {
        err = "Could not initialize SFTP subsystem";
        return false;
    }
    return true;
}

bool Libssh2SftpClient::connect(const SessionOptions& opt, std::string& err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    // Leftovers from a dead session are released before dialing again
    disconnect();
    if (!tcpConnect(opt.host, opt.port, err)) return false;
    if (!sshHandshakeAuth(opt, err)) {
        disconnect();
        return false;
    }
    connected_ = true;
    LOGI("SFTP connected to %s:%u", opt.host.c_str(), (unsigned)opt.port);
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

void Libssh2SftpClient::checkSocketError() {
    if (!session_) return;
    switch (libssh2_session_last_errno(session_)) {
        case LIBSSH2_ERROR_SOCKET_SEND:
        case LIBSSH2_ERROR_SOCKET_RECV:
        case LIBSSH2_ERROR_SOCKET_DISCONNECT:
        case LIBSSH2_ERROR_SOCKET_TIMEOUT:
        case LIBSSH2_ERROR_TIMEOUT:
            LOGW("SFTP connection lost: %s", lastSessionError(session_).c_str());
            connected_ = false;
            break;
        default:
            break;
    }
}

bool Libssh2SftpClient::readDir(const std::string& remote_path,
                                std::vector<FileInfo>& out,
                                std::string& err) {
    out.clear();
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    const std::string path = remote_path.empty() ? "/" : remote_path;
    LIBSSH2_SFTP_HANDLE* dir = libssh2_sftp_opendir(sftp_, path.c_str());
    if (!dir) {
        err = "sftp_opendir failed for: " + path;
        checkSocketError();
        return false;
    }

    char filename[512];
    char longentry[1024];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        int rc = libssh2_sftp_readdir_ex(dir,
                                         filename, sizeof(filename),
                                         longentry, sizeof(longentry),
                                         &attrs);
        if (rc > 0) {
            FileInfo fi{};
            fi.name = std::string(filename, rc);
            if (fi.name == "." || fi.name == "..") continue;
            // Mode bits decide the entry type
            fi.is_dir = (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
                            ? ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR)
                            : false;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE) fi.size = attrs.filesize;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME) fi.mtime = attrs.mtime;
            if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) fi.mode = attrs.permissions;
            out.push_back(std::move(fi));
        } else if (rc == 0) {
            break; // end of directory
        } else {
            err = "sftp_readdir_ex failed for: " + path;
            libssh2_sftp_closedir(dir);
            out.clear();
            checkSocketError();
            return false;
        }
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::listEntries(const std::string& remote_path,
                                    std::vector<std::string>& out,
                                    std::string& err) {
    out.clear();
    std::vector<FileInfo> infos;
    if (!readDir(remote_path, infos, err)) return false;
    out.reserve(infos.size());
    for (auto& fi : infos) out.push_back(std::move(fi.name));
    return true;
}

bool Libssh2SftpClient::listSubdirectories(const std::string& remote_path,
                                           std::vector<std::string>& out,
                                           std::string& err) {
    out.clear();
    std::vector<FileInfo> infos;
    if (!readDir(remote_path, infos, err)) return false;
    for (auto& fi : infos) {
        if (fi.is_dir) out.push_back(std::move(fi.name));
    }
    return true;
}

std::int64_t Libssh2SftpClient::statSize(const std::string& remote_path) {
    if (!connected_ || !sftp_) return -1;
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        checkSocketError();
        return -1;
    }
    if (!(st.flags & LIBSSH2_SFTP_ATTR_SIZE)) return -1;
    return (std::int64_t)st.filesize;
}

// Lightweight existence check using sftp_stat.
bool Libssh2SftpClient::exists(const std::string& remote_path,
                               bool& isDir,
                               std::string& err) {
    isDir = false;
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    LIBSSH2_SFTP_ATTRIBUTES st{};
    int rc = libssh2_sftp_stat_ex(
        sftp_, remote_path.c_str(), (unsigned)remote_path.size(),
        LIBSSH2_SFTP_STAT, &st);

    if (rc == 0) {
        if (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
            isDir = ((st.permissions & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR);
        }
        return true;
    }

    if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL) {
        unsigned long sftp_err = libssh2_sftp_last_error(sftp_);
        if (sftp_err == LIBSSH2_FX_NO_SUCH_FILE || sftp_err == LIBSSH2_FX_FAILURE) {
            err.clear();
            return false; // does not exist
        }
    }

    err = "Remote stat failed: " + remote_path;
    checkSocketError();
    return false;
}

bool Libssh2SftpClient::download(const std::string& remote,
                                 const std::string& local,
                                 std::string& err,
                                 ProgressCB progress) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }

    // Remote size (for progress)
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote.c_str(), (unsigned)remote.size(),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        err = "Could not stat remote file: " + remote;
        checkSocketError();
        return false;
    }
    const std::size_t total = (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? (std::size_t)st.filesize : 0;

    LIBSSH2_SFTP_HANDLE* rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), (unsigned)remote.size(),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err = "Could not open remote file for reading: " + remote;
        checkSocketError();
        return false;
    }

    FILE* lf = std::fopen(local.c_str(), "wb");
    if (!lf) {
        libssh2_sftp_close(rh);
        err = "Could not open local file for writing: " + local;
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::size_t done = 0;
    bool ok = true;

    while (true) {
        ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n > 0) {
            if (std::fwrite(buf.data(), 1, (size_t)n, lf) != (size_t)n) {
                err = "Local write failed: " + local;
                ok = false;
                break;
            }
            done += (std::size_t)n;
            if (progress) progress(done, total);
        } else if (n == 0) {
            break; // EOF
        } else {
            err = "Remote read failed: " + remote;
            ok = false;
            break;
        }
    }

    if (std::fclose(lf) != 0 && ok) {
        err = "Local write failed: " + local;
        ok = false;
    }
    libssh2_sftp_close(rh);
    if (!ok) checkSocketError();
    return ok;
}

bool Libssh2SftpClient::upload(const std::string& local,
                               const std::string& remote,
                               std::string& err,
                               ProgressCB progress) {
    if (!connected_ || !sftp_) {
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
    const std::size_t total = fsz > 0 ? (std::size_t)fsz : 0;

    LIBSSH2_SFTP_HANDLE* wh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), (unsigned)remote.size(),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
        0644, LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        std::fclose(lf);
        err = "Could not open remote file for writing: " + remote;
        checkSocketError();
        return false;
    }

    const std::size_t CHUNK = 64 * 1024;
    std::vector<char> buf(CHUNK);
    std::size_t done = 0;
    bool ok = true;

    while (ok) {
        size_t n = std::fread(buf.data(), 1, buf.size(), lf);
        if (n == 0) {
            if (std::ferror(lf)) {
                err = "Local read failed: " + local;
                ok = false;
            }
            break; // EOF
        }
        char* p = buf.data();
        size_t remain = n;
        while (remain > 0) {
            ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                err = "Remote write failed: " + remote;
                ok = false;
                break;
            }
            remain -= (size_t)w;
            p += w;
            done += (size_t)w;
            if (progress) progress(done, total);
        }
    }

    libssh2_sftp_close(wh);
    std::fclose(lf);
    if (!ok) checkSocketError();
    return ok;
}

bool Libssh2SftpClient::removeFile(const std::string& remote_path,
                                   std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    if (libssh2_sftp_unlink(sftp_, remote_path.c_str()) != 0) {
        err = "sftp_unlink failed: " + remote_path;
        checkSocketError();
        return false;
    }
    return true;
}

bool Libssh2SftpClient::rename(const std::string& from,
                               const std::string& to,
                               std::string& err) {
    if (!connected_ || !sftp_) {
        err = "Not connected";
        return false;
    }
    const long flags = LIBSSH2_SFTP_RENAME_OVERWRITE | LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    int rc = libssh2_sftp_rename_ex(
        sftp_,
        from.c_str(), (unsigned)from.size(),
        to.c_str(), (unsigned)to.size(),
        flags);
    if (rc != 0) {
        err = "sftp_rename_ex failed: " + from + " -> " + to;
        checkSocketError();
        return false;
    }
    return true;
}

} // namespace mirrorsync
