#ifndef BLOBNET_NETWORK_CHANNEL_HPP
#define BLOBNET_NETWORK_CHANNEL_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <queue>
#include <vector>
#include "network/peer_session.hpp"

namespace blobnet {
namespace network {

// Completion of one request issued on a session
struct SessionEvent {
    SessionId session = 0;
    uint64_t request = 0;
    RequestOutcome outcome = RequestOutcome::CLOSED;
    std::vector<uint8_t> payload;
};

/**
 * Thread-safe FIFO carrying session events from the io threads to the
 * thread that issued the requests.
 */
class Channel {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR
    Channel() = default;
    ~Channel() = default;


    // ---- CHANNEL CONTROL METHODS ----
    // Adds an event to the back of the queue
    void produce(SessionEvent event);
    // Retrieves and removes the next event, false when empty
    bool consume(SessionEvent& event);
    // Waits up to timeout for the next event
    bool consume_for(SessionEvent& event, std::chrono::steady_clock::duration timeout);


    // ---- QUERY METHODS ----
    bool empty() const;
    std::size_t size() const;

private:
    // ---- PARAMETERS ----
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<SessionEvent> queue_;
};

} // namespace network
} // namespace blobnet

#endif // BLOBNET_NETWORK_CHANNEL_HPP
