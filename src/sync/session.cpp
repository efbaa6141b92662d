#include "tandem/sync/session.hpp"

#include <algorithm>
#include <unordered_map>
#include <vector>

namespace tandem::sync {
namespace {

bool is_forward(SessionState current, SessionState target) {
    static const std::unordered_map<SessionState, std::vector<SessionState>> transitions {
        {SessionState::Idle, {SessionState::Active, SessionState::Ended}},
        {SessionState::Active, {SessionState::Ended}},
    };

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed = it->second;
    return std::find(allowed.begin(), allowed.end(), target) != allowed.end();
}

} // namespace

Session::Session(SessionId id, PeerRef host, std::uint64_t created_at_ms, std::uint64_t lifetime_ms)
    : id_(std::move(id)),
      host_(std::move(host)),
      created_at_ms_(created_at_ms),
      expires_at_ms_(created_at_ms + lifetime_ms) {}

Result<bool> Session::attach_client(PeerRef client) {
    if (state_ == SessionState::Ended) {
        return Err<bool>(ErrorCode::SessionEnded, "Session has ended: " + id_);
    }
    if (client.user_id == host_.user_id) {
        return Err<bool>(ErrorCode::Forbidden, "Host cannot join its own session as client");
    }
    if (client_ && client_->user_id != client.user_id) {
        return Err<bool>(ErrorCode::SessionFull, "Session already has a client: " + id_);
    }

    const bool rejoin = client_.has_value();
    if (rejoin) {
        if (!client.connection_id.empty()) {
            client_->connection_id = std::move(client.connection_id);
        }
    } else {
        client_ = std::move(client);
    }

    auto transition = transition_to(SessionState::Active);
    if (transition.is_error()) {
        return Err<bool>(transition.error());
    }
    return Ok(rejoin);
}

Result<void> Session::attach_host(const UserId& user_id, ConnectionId connection_id) {
    if (state_ == SessionState::Ended) {
        return Err<void>(ErrorCode::SessionEnded, "Session has ended: " + id_);
    }
    if (user_id != host_.user_id) {
        return Err<void>(ErrorCode::Forbidden, "User is not the host of session " + id_);
    }
    host_.connection_id = std::move(connection_id);
    host_disconnected_at_ms_.reset();
    return Ok();
}

std::optional<PeerRole> Session::detach_connection(const ConnectionId& connection_id, std::uint64_t now_ms) {
    if (connection_id.empty()) {
        return std::nullopt;
    }
    if (host_.connection_id == connection_id) {
        host_.connection_id.clear();
        host_disconnected_at_ms_ = now_ms;
        return PeerRole::Host;
    }
    if (client_ && client_->connection_id == connection_id) {
        client_->connection_id.clear();
        return PeerRole::Client;
    }
    return std::nullopt;
}

std::optional<PeerRole> Session::role_of_connection(const ConnectionId& connection_id) const {
    if (connection_id.empty()) {
        return std::nullopt;
    }
    if (host_.connection_id == connection_id) {
        return PeerRole::Host;
    }
    if (client_ && client_->connection_id == connection_id) {
        return PeerRole::Client;
    }
    return std::nullopt;
}

std::optional<PeerRole> Session::role_of_user(const UserId& user_id) const {
    if (user_id == host_.user_id) {
        return PeerRole::Host;
    }
    if (client_ && client_->user_id == user_id) {
        return PeerRole::Client;
    }
    return std::nullopt;
}

Result<void> Session::transition_to(SessionState next_state) {
    if (state_ == next_state) {
        return Ok();
    }
    if (!can_transition(next_state)) {
        return Err<void>(ErrorCode::SessionEnded,
                         std::string("Illegal session transition ") + to_string(state_) + " -> " +
                         to_string(next_state));
    }
    state_ = next_state;
    return Ok();
}

Result<void> Session::end(EndReason reason) {
    if (state_ == SessionState::Ended) {
        return Ok();
    }
    auto result = transition_to(SessionState::Ended);
    if (result.is_ok()) {
        end_reason_ = reason;
    }
    return result;
}

SessionView Session::view() const {
    const auto states = peers_.read();

    SessionView view;
    view.session_id = id_;
    view.state = state_;
    view.host_user_id = host_.user_id;
    view.host_connected = host_.connected();
    if (client_) {
        view.client_user_id = client_->user_id;
        view.client_connected = client_->connected();
    }
    view.host_snapshot = states.host;
    view.client_snapshot = states.client;
    view.client_offset_ms = states.client_offset_ms;
    view.created_at_ms = created_at_ms_;
    view.expires_at_ms = expires_at_ms_;
    view.last_sync_at_ms = last_sync_at_ms_;
    view.end_reason = end_reason_;
    return view;
}

bool Session::can_transition(SessionState target) const noexcept {
    if (state_ == target) {
        return true;
    }
    if (state_ == SessionState::Ended) {
        return false;
    }
    return is_forward(state_, target);
}

} // namespace tandem::sync
