// Non-recursive inotify watch on one directory, translated into ChangeEvents.
#pragma once
#include "EventQueue.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <string>
#include <thread>

namespace mirrorsync {

class InotifyWatcher {
public:
    InotifyWatcher(std::string dir, EventQueue& queue) : dir_(std::move(dir)), queue_(queue) {}
    ~InotifyWatcher();

    InotifyWatcher(const InotifyWatcher&) = delete;
    InotifyWatcher& operator=(const InotifyWatcher&) = delete;

    // Install the watch and start the reader thread.
    bool start(std::string& err);
    // Stop the reader thread and release the inotify descriptor. Idempotent.
    void stop();

    // Parse one read() buffer of inotify events into the queue. Called by the
    // reader thread; public so event buffers can be replayed directly.
    void consume(const char* buf, std::size_t len);
    // Report every unpaired move source as a delete.
    void flushMoves();

private:
    const std::string dir_;
    EventQueue& queue_;
    int fd_ = -1;
    int wd_ = -1;
    std::atomic<bool> stop_{false};
    std::thread thread_;

    struct PendingMove {
        std::string name;
        bool carried = false; // already survived one read without a partner
    };
    // Reader thread only
    std::map<std::uint32_t, PendingMove> movedFrom_;

    void readLoop();
};

} // namespace mirrorsync
