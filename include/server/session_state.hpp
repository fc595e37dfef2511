#ifndef VAULT_SERVER_SESSION_STATE_HPP
#define VAULT_SERVER_SESSION_STATE_HPP

#include <ostream>
#include <string>

namespace vault {
namespace server {

/**
 * SessionState tracks where a session is in the protocol and enforces the
 * allowed transitions.
 */
class SessionState {
public:
    /**
     * Session states:
     * CONNECTING     - Accepted, nothing exchanged yet
     * HANDSHAKING    - Waiting for the greeting token
     * AUTHENTICATING - Waiting for the single credential record
     * READY          - Reading one command per iteration
     * UPLOADING      - Receiving a file body
     * DOWNLOADING    - Sending a file body
     * TERMINATED     - Closed, no transitions out
     */
    enum class State {
        CONNECTING,
        HANDSHAKING,
        AUTHENTICATING,
        READY,
        UPLOADING,
        DOWNLOADING,
        TERMINATED
    };

    SessionState() : current_state_(State::CONNECTING) {}

    State get_state() const { return current_state_; }

    bool is_terminal() const { return current_state_ == State::TERMINATED; }

    /**
     * Attempt to transition to a new state.
     * @param new_state The target state
     * @return true if transition was successful, false if invalid
     */
    bool transition_to(State new_state) {
        if (!is_valid_transition(current_state_, new_state)) {
            return false;
        }
        current_state_ = new_state;
        return true;
    }

    // Every non-terminal state may terminate
    static bool is_valid_transition(State from, State to) {
        switch (from) {
            case State::CONNECTING:
                return to == State::HANDSHAKING ||
                       to == State::TERMINATED;

            case State::HANDSHAKING:
                return to == State::AUTHENTICATING ||
                       to == State::TERMINATED;

            case State::AUTHENTICATING:
                return to == State::READY ||
                       to == State::TERMINATED;

            case State::READY:
                return to == State::UPLOADING ||
                       to == State::DOWNLOADING ||
                       to == State::TERMINATED;

            case State::UPLOADING:
            case State::DOWNLOADING:
                return to == State::READY ||
                       to == State::TERMINATED;

            case State::TERMINATED:
                return false;
        }
        return false;
    }

    static std::string state_to_string(State state) {
        switch (state) {
            case State::CONNECTING:     return "CONNECTING";
            case State::HANDSHAKING:    return "HANDSHAKING";
            case State::AUTHENTICATING: return "AUTHENTICATING";
            case State::READY:          return "READY";
            case State::UPLOADING:      return "UPLOADING";
            case State::DOWNLOADING:    return "DOWNLOADING";
            case State::TERMINATED:     return "TERMINATED";
            default:                    return "UNKNOWN";
        }
    }

    std::string get_state_string() const {
        return state_to_string(current_state_);
    }

private:
    State current_state_;
};

// Stream operator for SessionState::State to support test assertions and logging
inline std::ostream& operator<<(std::ostream& os, const SessionState::State& state) {
    os << SessionState::state_to_string(state);
    return os;
}

} // namespace server
} // namespace vault

#endif // VAULT_SERVER_SESSION_STATE_HPP
