// Bounded hand-off between the filesystem watcher thread and the reconciler thread.
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

namespace mirrorsync {

struct ChangeEvent {
    enum class Kind {
        Created,
        Modified,
        Deleted,
        Moved,    // name -> newName
        Overflow  // events were lost, a full reconciliation is needed
    };
    Kind kind = Kind::Modified;
    std::string name;    // base name inside the watched directory
    std::string newName; // Moved only
};

class EventQueue {
public:
    explicit EventQueue(std::size_t capacity) : capacity_(capacity) {}

    // Never blocks. When full the event is dropped and the overflow flag is raised.
    bool push(ChangeEvent ev);

    // Wait until an event arrives, the deadline passes or the queue is closed.
    bool popUntil(ChangeEvent& out, std::chrono::steady_clock::time_point deadline);

    // Returns and clears the overflow flag.
    bool takeOverflow();

    void close();
    std::size_t size() const;

private:
    const std::size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<ChangeEvent> items_;
    bool overflow_ = false;
    bool closed_ = false;
};

} // namespace mirrorsync
