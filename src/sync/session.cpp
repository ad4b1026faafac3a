#include "syncmd/sync/session.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace syncmd::sync {
namespace {

bool is_progressive(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::Connected, {SessionState::Authenticated}},
        {SessionState::Authenticated, {SessionState::Syncing}},
        {SessionState::Syncing, {SessionState::Idle}},
        {SessionState::Idle, {SessionState::Syncing}},
    };

    if (target == SessionState::Error || target == SessionState::Closed) {
        return true;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Connected: return "connected";
        case SessionState::Authenticated: return "authenticated";
        case SessionState::Syncing: return "syncing";
        case SessionState::Idle: return "idle";
        case SessionState::Closed: return "closed";
        case SessionState::Error: return "error";
    }
    return "unknown";
}

PeerSession::PeerSession(std::string peer_address) {
    info_.peer_address = std::move(peer_address);
    last_transition_ = std::chrono::steady_clock::now();
}

Result<void> PeerSession::authenticate(std::string peer_device_id, std::string identity) {
    if (info_.state != SessionState::Connected) {
        return Err<void>(ErrorKind::Protocol, "Handshake already completed");
    }
    auto result = transition_to(SessionState::Authenticated);
    if (result.is_error()) {
        return result;
    }
    info_.peer_device_id = std::move(peer_device_id);
    info_.identity = std::move(identity);
    return Ok();
}

Result<void> PeerSession::transition_to(SessionState next_state) {
    if (info_.state == next_state) {
        return Ok();
    }

    if (!can_transition(next_state)) {
        return Err<void>(ErrorKind::Protocol, std::string("Illegal session state transition: ") +
                                                  to_string(info_.state) + " -> " + to_string(next_state));
    }

    spdlog::debug("Session {}: {} -> {}", info_.peer_address, to_string(info_.state), to_string(next_state));
    if (info_.state == SessionState::Syncing && next_state == SessionState::Idle) {
        ++info_.syncs_completed;
    }
    info_.state = next_state;
    last_transition_ = std::chrono::steady_clock::now();
    if (next_state != SessionState::Error) {
        info_.last_error.clear();
    }
    return Ok();
}

Result<void> PeerSession::mark_failed(std::string error_message) {
    auto result = transition_to(SessionState::Error);
    if (result.is_ok()) {
        info_.last_error = std::move(error_message);
    }
    return result;
}

void PeerSession::close() {
    if (!is_terminal()) {
        info_.state = SessionState::Closed;
        last_transition_ = std::chrono::steady_clock::now();
    }
}

bool PeerSession::is_authenticated() const noexcept {
    return info_.state == SessionState::Authenticated || info_.state == SessionState::Syncing ||
           info_.state == SessionState::Idle;
}

bool PeerSession::is_terminal() const noexcept {
    return info_.state == SessionState::Closed || info_.state == SessionState::Error;
}

bool PeerSession::can_transition(SessionState target) const noexcept {
    if (info_.state == target) {
        return true;
    }

    if (is_terminal()) {
        return false;
    }

    return is_progressive(info_.state, target);
}

} // namespace syncmd::sync
