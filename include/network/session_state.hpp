#ifndef BLOBNET_NETWORK_SESSION_STATE_HPP
#define BLOBNET_NETWORK_SESSION_STATE_HPP

#include <ostream>

namespace blobnet {
namespace network {

/**
 * SessionState tracks the lifecycle of one peer session and rejects
 * transitions the protocol does not allow.
 */
class SessionState {
public:
    /**
     * Peer session states:
     * CONNECTING     - Socket is being connected
     * HANDSHAKING    - Connected, waiting for the peer's hello
     * IDLE           - Handshake done, no request outstanding
     * AWAITING_BLOCK - One ask or ask-meta is outstanding
     * CLOSED         - Terminal, the socket is shut
     */
    enum class State {
        CONNECTING,
        HANDSHAKING,
        IDLE,
        AWAITING_BLOCK,
        CLOSED
    };

    SessionState() : current_state_(State::CONNECTING) {}
    explicit SessionState(State initial) : current_state_(initial) {}

    State current() const { return current_state_; }

    bool is_closed() const { return current_state_ == State::CLOSED; }

    // True once the peer's hello has been accepted
    bool is_established() const {
        return current_state_ == State::IDLE || current_state_ == State::AWAITING_BLOCK;
    }

    // Moves to next when the protocol allows it; otherwise leaves the state as is
    bool advance(State next) {
        if (!allowed(current_state_, next)) {
            return false;
        }
        current_state_ = next;
        return true;
    }

    static bool allowed(State from, State to) {
        // Any live session may be closed
        if (to == State::CLOSED) {
            return from != State::CLOSED;
        }

        switch (from) {
            case State::CONNECTING:
                return to == State::HANDSHAKING;

            case State::HANDSHAKING:
                return to == State::IDLE;

            case State::IDLE:
                return to == State::AWAITING_BLOCK;

            case State::AWAITING_BLOCK:
                return to == State::IDLE;

            case State::CLOSED:
                return false;
        }
        return false;
    }

    static const char* name(State state) {
        switch (state) {
            case State::CONNECTING:     return "CONNECTING";
            case State::HANDSHAKING:    return "HANDSHAKING";
            case State::IDLE:           return "IDLE";
            case State::AWAITING_BLOCK: return "AWAITING_BLOCK";
            case State::CLOSED:         return "CLOSED";
        }
        return "?";
    }

private:
    State current_state_;
};

inline std::ostream& operator<<(std::ostream& out, SessionState::State state) {
    return out << SessionState::name(state);
}

} // namespace network
} // namespace blobnet

#endif // BLOBNET_NETWORK_SESSION_STATE_HPP
