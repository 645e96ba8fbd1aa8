#ifndef RELAYCHAT_OUTBOUND_QUEUE_HPP
#define RELAYCHAT_OUTBOUND_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

#include "relaychat/message.hpp"

namespace relaychat {

struct Outbound {
    Message msg;
    ClientId exclude_id{kNoClient};
};

// FIFO handing broadcast requests from session threads to the dispatcher.
class OutboundQueue {
public:
    // Returns false once the queue has been closed.
    bool push(Outbound item);

    // Waits up to timeout for an item. Returns false on timeout, or when the
    // queue is closed and fully drained.
    bool pop(Outbound& item, std::chrono::milliseconds timeout);

    void close();
    bool closed() const;
    bool drained() const;
    std::size_t size() const;

private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::queue<Outbound> queue_;
    bool closed_{false};
};

}

#endif
