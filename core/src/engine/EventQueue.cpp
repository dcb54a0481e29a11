#include "mirrorsync/EventQueue.hpp"

namespace mirrorsync {

bool EventQueue::push(ChangeEvent ev) {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        if (closed_) return false;
        if (items_.size() >= capacity_) {
            overflow_ = true;
            return false;
        }
        items_.push_back(std::move(ev));
    }
    cv_.notify_one();
    return true;
}

bool EventQueue::popUntil(ChangeEvent& out, std::chrono::steady_clock::time_point deadline) {
    std::unique_lock<std::mutex> lk(mtx_);
    cv_.wait_until(lk, deadline, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) return false;
    out = std::move(items_.front());
    items_.pop_front();
    return true;
}

bool EventQueue::takeOverflow() {
    std::lock_guard<std::mutex> lk(mtx_);
    const bool v = overflow_;
    overflow_ = false;
    return v;
}

void EventQueue::close() {
    {
        std::lock_guard<std::mutex> lk(mtx_);
        closed_ = true;
    }
    cv_.notify_all();
}

std::size_t EventQueue::size() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return items_.size();
}

} // namespace mirrorsync
