// Reader thread: poll() the inotify fd with a short timeout so stop() is observed promptly.
#include "mirrorsync/InotifyWatcher.hpp"
#include "mirrorsync/Log.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <map>
#include <poll.h>
#include <sys/inotify.h>
#include <unistd.h>

namespace mirrorsync {

InotifyWatcher::~InotifyWatcher() {
    stop();
}

bool InotifyWatcher::start(std::string& err) {
    if (fd_ != -1) return true;
    fd_ = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd_ == -1) {
        err = std::string("Cannot monitor directory ") + dir_ + ": inotify_init1: " + std::strerror(errno);
        return false;
    }
    wd_ = ::inotify_add_watch(fd_, dir_.c_str(),
                              IN_ONLYDIR | IN_CREATE | IN_MODIFY | IN_CLOSE_WRITE | IN_DELETE |
                                  IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF | IN_MOVE_SELF);
    if (wd_ == -1) {
        const int ec = errno;
        err = std::string("Cannot monitor directory ") + dir_ + ": " + std::strerror(ec);
        if (ec == ENOSPC) err += " (raise fs.inotify.max_user_watches)";
        ::close(fd_);
        fd_ = -1;
        return false;
    }
    stop_ = false;
    thread_ = std::thread([this] { readLoop(); });
    return true;
}

void InotifyWatcher::stop() {
    stop_ = true;
    if (thread_.joinable()) thread_.join();
    if (fd_ != -1) {
        if (wd_ != -1) ::inotify_rm_watch(fd_, wd_);
        ::close(fd_);
        fd_ = -1;
        wd_ = -1;
    }
}

void InotifyWatcher::readLoop() {
    // Large enough for many events with names; inotify never splits an event.
    alignas(struct inotify_event) char buf[64 * 1024];
    while (!stop_) {
        pollfd pfd{fd_, POLLIN, 0};
        const int rc = ::poll(&pfd, 1, 200);
        if (rc < 0) {
            if (errno == EINTR) continue;
            LOGE("poll on inotify fd failed: %s", std::strerror(errno));
            queue_.push({ChangeEvent::Kind::Overflow, {}, {}});
            return;
        }
        if (rc == 0) {
            // Quiet period: a move source still unpaired left the directory.
            flushMoves();
            continue;
        }
        const ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EAGAIN || errno == EINTR) continue;
            LOGE("read on inotify fd failed: %s", std::strerror(errno));
            queue_.push({ChangeEvent::Kind::Overflow, {}, {}});
            return;
        }
        consume(buf, (std::size_t)n);
    }
    flushMoves();
}

void InotifyWatcher::flushMoves() {
    // Moved out of the watched directory
    for (const auto& kv : movedFrom_) queue_.push({ChangeEvent::Kind::Deleted, kv.second.name, {}});
    movedFrom_.clear();
}

void InotifyWatcher::consume(const char* buf, std::size_t len) {
    // IN_MOVED_FROM waits in movedFrom_ for its IN_MOVED_TO partner (same cookie),
    // which may arrive in the next read.
    for (auto& kv : movedFrom_) kv.second.carried = true;

    for (std::size_t off = 0; off < len;) {
        const auto* ev = reinterpret_cast<const struct inotify_event*>(buf + off);
        off += sizeof(struct inotify_event) + ev->len;

        if (ev->mask & IN_Q_OVERFLOW) {
            queue_.push({ChangeEvent::Kind::Overflow, {}, {}});
            continue;
        }
        if (ev->mask & (IN_DELETE_SELF | IN_MOVE_SELF)) {
            LOGW("watched directory %s was removed or moved", dir_.c_str());
            queue_.push({ChangeEvent::Kind::Overflow, {}, {}});
            continue;
        }
        if (ev->mask & IN_IGNORED) continue;
        if (ev->mask & IN_ISDIR) continue;
        if (ev->len == 0) continue;
        const std::string name(ev->name);

        if (ev->mask & IN_MOVED_FROM) {
            movedFrom_[ev->cookie] = PendingMove{name, false};
        } else if (ev->mask & IN_MOVED_TO) {
            auto it = movedFrom_.find(ev->cookie);
            if (it != movedFrom_.end()) {
                queue_.push({ChangeEvent::Kind::Moved, it->second.name, name});
                movedFrom_.erase(it);
            } else {
                queue_.push({ChangeEvent::Kind::Created, name, {}});
            }
        } else if (ev->mask & IN_CREATE) {
            queue_.push({ChangeEvent::Kind::Created, name, {}});
        } else if (ev->mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
            queue_.push({ChangeEvent::Kind::Modified, name, {}});
        } else if (ev->mask & IN_DELETE) {
            queue_.push({ChangeEvent::Kind::Deleted, name, {}});
        }
    }
    // A source already carried over from the previous read got no partner in this one either.
    for (auto it = movedFrom_.begin(); it != movedFrom_.end();) {
        if (it->second.carried) {
            queue_.push({ChangeEvent::Kind::Deleted, it->second.name, {}});
            it = movedFrom_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace mirrorsync
