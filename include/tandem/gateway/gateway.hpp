#pragma once

#include "tandem/core/clock.hpp"
#include "tandem/core/result.hpp"
#include "tandem/events/event_bus.hpp"
#include "tandem/gateway/message_codec.hpp"
#include "tandem/network/websocket_server.hpp"
#include "tandem/sync/peer_notifier.hpp"
#include "tandem/sync/session_manager.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tandem::gateway {

/**
 * @brief Where encoded frames go; the WebSocket server in production
 */
class MessageSink {
public:
    virtual ~MessageSink() = default;

    /// @return false if the connection is unknown or already closed
    virtual bool send(const sync::ConnectionId& connection, const std::string& frame) = 0;
};

class WebSocketSink : public MessageSink {
public:
    explicit WebSocketSink(network::WebSocketServer& server) : server_(server) {}

    bool send(const sync::ConnectionId& connection, const std::string& frame) override {
        return server_.send(connection, frame);
    }

private:
    network::WebSocketServer& server_;
};

/**
 * @brief What a connection has joined as
 */
struct Binding {
    sync::SessionId session_id;
    sync::PeerRole role = sync::PeerRole::Client;
    sync::UserId user_id;
};

/**
 * @brief Protocol boundary between peer connections and the SessionManager
 *
 * Owns the connection table (connection id -> Binding). Every inbound
 * frame is decoded, checked against the connection's binding, and turned
 * into one SessionManager call; failures are answered with an `error`
 * frame on the same connection. As the manager's PeerNotifier it encodes
 * outbound messages and hands them to the sink.
 *
 * The manager is attached after construction because it needs this
 * object as its notifier.
 */
class Gateway : public sync::PeerNotifier {
public:
    Gateway(MessageSink& sink, const Clock& clock, events::EventBus& bus);

    void attach(sync::SessionManager& manager);

    void on_connect(const sync::ConnectionId& connection);
    void on_message(const sync::ConnectionId& connection, const std::string& frame);
    void on_disconnect(const sync::ConnectionId& connection);

    Result<void> deliver(const sync::PeerRef& peer, const sync::OutboundMessage& message) override;

    std::optional<Binding> binding_of(const sync::ConnectionId& connection) const;
    std::size_t connection_count() const;

private:
    Result<void> handle(const sync::ConnectionId& connection, const JoinSessionMessage& message);
    Result<void> handle(const sync::ConnectionId& connection, const PlaybackStateMessage& message);
    Result<void> handle(const sync::ConnectionId& connection, const ClientStateMessage& message);
    Result<void> handle(const sync::ConnectionId& connection, const RequestSyncMessage& message);
    Result<void> handle(const sync::ConnectionId& connection, const UpdateOffsetMessage& message);

    /// Binding for a post-join message; checks role and any explicit session id.
    Result<Binding> require_binding(const sync::ConnectionId& connection,
                                    sync::PeerRole role,
                                    const std::optional<sync::SessionId>& claimed_session) const;

    sync::PlaybackSnapshot stamp(const PlaybackReport& report) const;

    void reject(const sync::ConnectionId& connection, const std::string& event_name, const Error& error);

    MessageSink& sink_;
    const Clock& clock_;
    events::EventBus& bus_;
    sync::SessionManager* manager_ = nullptr;

    mutable std::mutex mutex_;
    // nullopt = connected but not joined
    std::unordered_map<sync::ConnectionId, std::optional<Binding>> connections_;
    // Frames for a connection whose join is in flight; sent after the `joined` ack
    std::unordered_map<sync::ConnectionId, std::vector<std::string>> held_;
};

} // namespace tandem::gateway
