#pragma once

#include "tandem/core/result.hpp"
#include "tandem/sync/peer_notifier.hpp"
#include "tandem/sync/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace tandem::gateway {

// ════════════════════════════════════════════════════════
// Peer -> coordinator
// ════════════════════════════════════════════════════════

struct JoinSessionMessage {
    sync::SessionId session_id;
    sync::PeerRole role = sync::PeerRole::Client;
    sync::UserId user_id;
};

/**
 * @brief Playback fields shared by host and client reports
 *
 * session_id is optional on every message sent after join: the
 * connection's binding is authoritative, and a mismatching id is refused.
 * timestamp_ms is the peer's own clock and is only logged.
 */
struct PlaybackReport {
    std::optional<sync::SessionId> session_id;
    std::string track_id;
    std::uint64_t position_ms = 0;
    bool is_playing = false;
    std::optional<std::uint64_t> timestamp_ms;
};

struct PlaybackStateMessage {
    PlaybackReport report;
};

struct ClientStateMessage {
    PlaybackReport report;
};

struct RequestSyncMessage {
    std::optional<sync::SessionId> session_id;
};

struct UpdateOffsetMessage {
    std::optional<sync::SessionId> session_id;
    std::int64_t offset_ms = 0;
};

using InboundMessage = std::variant<JoinSessionMessage,
                                    PlaybackStateMessage,
                                    ClientStateMessage,
                                    RequestSyncMessage,
                                    UpdateOffsetMessage>;

// ════════════════════════════════════════════════════════
// Coordinator -> peer, beyond sync::OutboundMessage
// ════════════════════════════════════════════════════════

struct JoinedMessage {
    sync::JoinResult join;
};

struct ErrorMessage {
    ErrorCode code = ErrorCode::Internal;
    std::string message;
};

/**
 * @brief JSON envelope codec: {"event": <name>, "data": {...}}
 *
 * Field names on the wire are camelCase. decode() never throws; anything
 * malformed comes back as ErrorCode::InvalidMessage with a reason.
 */
class MessageCodec {
public:
    static Result<InboundMessage> decode(const std::string& text);

    static std::string encode(const sync::OutboundMessage& message);
    static std::string encode(const JoinedMessage& message);
    static std::string encode(const ErrorMessage& message);

    /// Integer JSON value as int64; unsigned values past INT64_MAX saturate instead of wrapping.
    static std::int64_t saturated_integer(const nlohmann::json& value);

    /// Wire name of an inbound message, e.g. "playback_state".
    static const char* event_name(const InboundMessage& message);

    static nlohmann::json to_json(const sync::Correction& correction);
    static nlohmann::json to_json(const sync::PlaybackSnapshot& snapshot);
    static nlohmann::json to_json(const sync::SessionView& view);
    static nlohmann::json to_json(const sync::JoinResult& join);
};

} // namespace tandem::gateway
