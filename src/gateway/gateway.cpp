#include "tandem/gateway/gateway.hpp"

#include "tandem/events/events.hpp"

#include <spdlog/spdlog.h>

namespace tandem::gateway {

Gateway::Gateway(MessageSink& sink, const Clock& clock, events::EventBus& bus)
    : sink_(sink), clock_(clock), bus_(bus) {}

void Gateway::attach(sync::SessionManager& manager) {
    manager_ = &manager;
}

void Gateway::on_connect(const sync::ConnectionId& connection) {
    std::lock_guard lock(mutex_);
    connections_.emplace(connection, std::nullopt);
    spdlog::debug("Peer connection {} opened", connection);
}

void Gateway::on_message(const sync::ConnectionId& connection, const std::string& frame) {
    auto decoded = MessageCodec::decode(frame);
    if (decoded.is_error()) {
        reject(connection, "unknown", decoded.error());
        return;
    }

    const auto& message = decoded.value();
    const char* name = MessageCodec::event_name(message);
    if (!manager_) {
        reject(connection, name, Error{ErrorCode::Internal, "coordinator not ready"});
        return;
    }

    auto handled = std::visit([this, &connection](const auto& typed) { return handle(connection, typed); }, message);
    if (handled.is_error()) {
        reject(connection, name, handled.error());
    }
}

void Gateway::on_disconnect(const sync::ConnectionId& connection) {
    std::optional<Binding> binding;
    {
        std::lock_guard lock(mutex_);
        auto it = connections_.find(connection);
        if (it == connections_.end()) {
            return;
        }
        binding = it->second;
        connections_.erase(it);
        held_.erase(connection);
    }

    spdlog::debug("Peer connection {} closed", connection);
    if (binding && manager_) {
        manager_->peer_disconnected(binding->session_id, connection);
    }
}

Result<void> Gateway::deliver(const sync::PeerRef& peer, const sync::OutboundMessage& message) {
    if (!peer.connected()) {
        return Err<void>(ErrorCode::PeerUnavailable, peer.user_id + " is not connected");
    }
    auto frame = MessageCodec::encode(message);
    {
        std::lock_guard lock(mutex_);
        auto held = held_.find(peer.connection_id);
        if (held != held_.end()) {
            held->second.push_back(std::move(frame));
            return Ok();
        }
    }
    if (!sink_.send(peer.connection_id, frame)) {
        return Err<void>(ErrorCode::PeerUnavailable, "connection " + peer.connection_id + " is gone");
    }
    return Ok();
}

std::optional<Binding> Gateway::binding_of(const sync::ConnectionId& connection) const {
    std::lock_guard lock(mutex_);
    auto it = connections_.find(connection);
    if (it == connections_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::size_t Gateway::connection_count() const {
    std::lock_guard lock(mutex_);
    return connections_.size();
}

// ──────────────────────────────────────────────────────────
// Handlers
// ──────────────────────────────────────────────────────────

Result<void> Gateway::handle(const sync::ConnectionId& connection, const JoinSessionMessage& message) {
    if (auto existing = binding_of(connection)) {
        if (existing->session_id != message.session_id || existing->role != message.role ||
            existing->user_id != message.user_id) {
            return Err<void>(ErrorCode::Forbidden, "connection already joined session " + existing->session_id);
        }
    }

    {
        std::lock_guard lock(mutex_);
        held_.emplace(connection, std::vector<std::string>{});
    }

    auto joined = message.role == sync::PeerRole::Host
        ? manager_->attach_host(message.session_id, message.user_id, connection)
        : manager_->join_session(message.session_id, message.user_id, connection);

    std::vector<std::string> frames;
    {
        std::lock_guard lock(mutex_);
        auto held = held_.find(connection);
        if (held != held_.end()) {
            frames = std::move(held->second);
            held_.erase(held);
        }
        if (joined.is_ok()) {
            connections_[connection] = Binding{message.session_id, message.role, message.user_id};
        }
    }

    if (joined.is_ok()) {
        frames.insert(frames.begin(), MessageCodec::encode(JoinedMessage{joined.value()}));
    }
    for (const auto& frame : frames) {
        if (!sink_.send(connection, frame)) {
            spdlog::debug("Connection {} closed during join", connection);
            break;
        }
    }

    if (joined.is_error()) {
        return Err<void>(joined.error());
    }
    return Ok();
}

Result<void> Gateway::handle(const sync::ConnectionId& connection, const PlaybackStateMessage& message) {
    auto binding = require_binding(connection, sync::PeerRole::Host, message.report.session_id);
    if (binding.is_error()) {
        return Err<void>(binding.error());
    }
    return manager_->report_host_state(binding.value().session_id, connection, stamp(message.report));
}

Result<void> Gateway::handle(const sync::ConnectionId& connection, const ClientStateMessage& message) {
    auto binding = require_binding(connection, sync::PeerRole::Client, message.report.session_id);
    if (binding.is_error()) {
        return Err<void>(binding.error());
    }
    return manager_->report_client_state(binding.value().session_id, connection, stamp(message.report));
}

Result<void> Gateway::handle(const sync::ConnectionId& connection, const RequestSyncMessage& message) {
    auto binding = require_binding(connection, sync::PeerRole::Client, message.session_id);
    if (binding.is_error()) {
        return Err<void>(binding.error());
    }
    auto synced = manager_->request_immediate_sync(binding.value().session_id, binding.value().user_id);
    if (synced.is_error()) {
        return Err<void>(synced.error());
    }
    return Ok();
}

Result<void> Gateway::handle(const sync::ConnectionId& connection, const UpdateOffsetMessage& message) {
    auto binding = require_binding(connection, sync::PeerRole::Client, message.session_id);
    if (binding.is_error()) {
        return Err<void>(binding.error());
    }
    auto applied = manager_->update_offset(binding.value().session_id, binding.value().user_id, message.offset_ms);
    if (applied.is_error()) {
        return Err<void>(applied.error());
    }
    return Ok();
}

// ──────────────────────────────────────────────────────────
// Helpers
// ──────────────────────────────────────────────────────────

Result<Binding> Gateway::require_binding(const sync::ConnectionId& connection,
                                         sync::PeerRole role,
                                         const std::optional<sync::SessionId>& claimed_session) const {
    auto binding = binding_of(connection);
    if (!binding) {
        return Err<Binding>(ErrorCode::Forbidden, "join_session required first");
    }
    if (binding->role != role) {
        return Err<Binding>(ErrorCode::Forbidden,
                            std::string("only the ") + sync::to_string(role) + " may send this message");
    }
    if (claimed_session && *claimed_session != binding->session_id) {
        return Err<Binding>(ErrorCode::Forbidden, "connection is bound to session " + binding->session_id);
    }
    return Ok(*binding);
}

sync::PlaybackSnapshot Gateway::stamp(const PlaybackReport& report) const {
    sync::PlaybackSnapshot snapshot;
    snapshot.track_id = report.track_id;
    snapshot.position_ms = report.position_ms;
    snapshot.is_playing = report.is_playing;
    snapshot.reported_at_ms = clock_.now_ms();

    if (report.timestamp_ms) {
        spdlog::trace("Report stamped at {} (peer clock {})", snapshot.reported_at_ms, *report.timestamp_ms);
    }
    return snapshot;
}

void Gateway::reject(const sync::ConnectionId& connection, const std::string& event_name, const Error& error) {
    spdlog::warn("Rejected {} from {}: {} ({})", event_name, connection, error.message, to_string(error.code));
    bus_.emit(events::MessageRejectedEvent{connection, event_name, error.code, error.message});

    if (!sink_.send(connection, MessageCodec::encode(ErrorMessage{error.code, error.message}))) {
        spdlog::debug("Could not report error to {}: connection gone", connection);
    }
}

} // namespace tandem::gateway
