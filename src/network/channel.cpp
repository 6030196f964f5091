#include "network/channel.hpp"
#include <boost/log/trivial.hpp>

namespace blobnet {
namespace network {

void Channel::produce(SessionEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(std::move(event));
        BOOST_LOG_TRIVIAL(trace) << "Channel: Added event. Channel size: " << queue_.size();
    }
    cv_.notify_one();
}

bool Channel::consume(SessionEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return false;
    }

    event = std::move(queue_.front());
    queue_.pop();
    BOOST_LOG_TRIVIAL(trace) << "Channel: Retrieved event. Channel size: " << queue_.size();
    return true;
}

bool Channel::consume_for(SessionEvent& event, std::chrono::steady_clock::duration timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this]() { return !queue_.empty(); })) {
        return false;
    }

    event = std::move(queue_.front());
    queue_.pop();
    return true;
}

bool Channel::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

std::size_t Channel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

} // namespace network
} // namespace blobnet
