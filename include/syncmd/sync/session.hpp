#pragma once

#include "syncmd/core/result.hpp"

#include <chrono>
#include <string>

namespace syncmd::sync {

enum class SessionState {
    Connected,
    Authenticated,
    Syncing,
    Idle,
    Closed,
    Error
};

const char* to_string(SessionState state);

struct SessionInfo {
    std::string peer_address;
    std::string peer_device_id;     ///< Set once the handshake is accepted
    std::string identity;           ///< Identity returned by the authenticator
    SessionState state = SessionState::Connected;
    std::size_t syncs_completed = 0;
    std::string last_error;         ///< Populated when state == Error
};

/**
 * @brief Envelope-level state machine for one connection
 *
 * Connected -> Authenticated -> Syncing -> (Idle <-> Syncing) -> Closed.
 * Error is reachable from every live state and absorbs; so does Closed.
 */
class PeerSession {
public:
    explicit PeerSession(std::string peer_address);

    [[nodiscard]] SessionState state() const noexcept { return info_.state; }
    [[nodiscard]] const SessionInfo& info() const noexcept { return info_; }

    Result<void> authenticate(std::string peer_device_id, std::string identity);
    Result<void> transition_to(SessionState next_state);
    Result<void> mark_failed(std::string error_message);
    void close();

    /// True for Authenticated, Syncing and Idle.
    [[nodiscard]] bool is_authenticated() const noexcept;
    [[nodiscard]] bool is_terminal() const noexcept;

    [[nodiscard]] std::chrono::steady_clock::time_point last_transition() const noexcept {
        return last_transition_;
    }

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;

    SessionInfo info_;
    std::chrono::steady_clock::time_point last_transition_{};
};

} // namespace syncmd::sync
