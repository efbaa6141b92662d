/**
 * @file events.hpp
 * @brief Domain events published by the coordinator
 *
 * NAMING CONVENTION:
 * Events are past tense (SessionCreatedEvent, CorrectionIssuedEvent) and
 * carry plain values only, never references into session state.
 */

#pragma once

#include "tandem/core/error.hpp"
#include "tandem/sync/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace tandem::events {

// ════════════════════════════════════════════════════════
// Server Events
// ════════════════════════════════════════════════════════

struct ServerStartedEvent {
    std::uint16_t http_port;
    std::uint16_t ws_port;
    std::chrono::system_clock::time_point timestamp;

    ServerStartedEvent(std::uint16_t http, std::uint16_t ws)
        : http_port(http),
          ws_port(ws),
          timestamp(std::chrono::system_clock::now())
    {}
};

struct ServerShuttingDownEvent {
    std::string reason;
    std::chrono::system_clock::time_point timestamp;

    explicit ServerShuttingDownEvent(std::string r = "normal")
        : reason(std::move(r)),
          timestamp(std::chrono::system_clock::now())
    {}
};

// ════════════════════════════════════════════════════════
// Session Lifecycle Events
// ════════════════════════════════════════════════════════

/**
 * @brief A host created a session
 *
 * WHO EMITS: SessionManager::create_session
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct SessionCreatedEvent {
    sync::SessionId session_id;
    sync::UserId host_user_id;
    std::uint64_t expires_at_ms = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A peer registered with, or reattached to, a session
 */
struct PeerJoinedEvent {
    sync::SessionId session_id;
    sync::UserId user_id;
    sync::PeerRole role = sync::PeerRole::Client;
    bool rejoined = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct PeerDisconnectedEvent {
    sync::SessionId session_id;
    sync::UserId user_id;
    sync::PeerRole role = sync::PeerRole::Client;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct PeerReconnectedEvent {
    sync::SessionId session_id;
    sync::UserId user_id;
    sync::PeerRole role = sync::PeerRole::Host;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct SessionEndedEvent {
    sync::SessionId session_id;
    sync::EndReason reason = sync::EndReason::HostEnded;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Sync Events
// ════════════════════════════════════════════════════════

struct OffsetChangedEvent {
    sync::SessionId session_id;
    std::int64_t requested_ms = 0;
    std::int64_t applied_ms = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A correction was computed and handed to the transport
 *
 * `trigger` names what caused the evaluation: "join", "track_change",
 * "play_state_change", "offset", "request" or "periodic".
 */
struct CorrectionIssuedEvent {
    sync::SessionId session_id;
    sync::Correction correction;
    std::string trigger;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief An outbound message could not be delivered and was dropped
 */
struct DeliveryDroppedEvent {
    sync::SessionId session_id;
    sync::UserId user_id;
    std::string message_type;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Transport Events
// ════════════════════════════════════════════════════════

/**
 * @brief An inbound peer message was refused (malformed, forbidden, ...)
 */
struct MessageRejectedEvent {
    std::string connection_id;
    std::string event_name;
    ErrorCode code = ErrorCode::InvalidMessage;
    std::string detail;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace tandem::events
