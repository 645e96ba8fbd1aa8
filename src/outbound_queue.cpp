#include "relaychat/outbound_queue.hpp"

#include <utility>

namespace relaychat {

bool OutboundQueue::push(Outbound item) {
    {
        std::lock_guard<std::mutex> lg(mtx_);
        if (closed_) return false;
        queue_.push(std::move(item));
    }
    cv_.notify_one();
    return true;
}

bool OutboundQueue::pop(Outbound& item, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx_);
    if (cv_.wait_for(lock, timeout, [this]{ return !queue_.empty() || closed_; })) {
        if (queue_.empty()) return false;
        item = std::move(queue_.front());
        queue_.pop();
        return true;
    }
    return false;
}

void OutboundQueue::close() {
    {
        std::lock_guard<std::mutex> lg(mtx_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool OutboundQueue::closed() const {
    std::lock_guard<std::mutex> lg(mtx_);
    return closed_;
}

bool OutboundQueue::drained() const {
    std::lock_guard<std::mutex> lg(mtx_);
    return closed_ && queue_.empty();
}

std::size_t OutboundQueue::size() const {
    std::lock_guard<std::mutex> lg(mtx_);
    return queue_.size();
}

}
