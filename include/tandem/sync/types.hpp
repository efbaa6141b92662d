#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tandem::sync {

using SessionId = std::string;
using UserId = std::string;
using ConnectionId = std::string;

/// Largest position a peer may report (2^53 ms); keeps drift arithmetic in range.
constexpr std::uint64_t kMaxPositionMs = std::uint64_t{1} << 53;

/**
 * @brief Immutable, timestamped report of one peer's playback
 *
 * reported_at_ms is coordinator Clock time at capture, never the peer's
 * own wall clock.
 */
struct PlaybackSnapshot {
    std::string track_id;
    std::uint64_t position_ms = 0;
    bool is_playing = false;
    std::uint64_t reported_at_ms = 0;
};

inline bool operator==(const PlaybackSnapshot& a, const PlaybackSnapshot& b) {
    return a.track_id == b.track_id && a.position_ms == b.position_ms &&
           a.is_playing == b.is_playing && a.reported_at_ms == b.reported_at_ms;
}

enum class PeerRole {
    Host,
    Client
};

/**
 * @brief Identity of a peer plus the transport connection representing it
 *
 * connection_id is replaced on reconnect; user_id never changes. An empty
 * connection_id means the peer is registered but not currently connected.
 */
struct PeerRef {
    UserId user_id;
    ConnectionId connection_id;

    bool connected() const { return !connection_id.empty(); }
};

enum class SessionState {
    Idle,
    Active,
    Ended
};

enum class EndReason {
    HostEnded,
    HostDisconnected,
    SessionExpired
};

enum class CorrectionAction {
    Play,
    Pause,
    Seek,
    SwitchTrack
};

/**
 * @brief How quickly the client should apply a seek
 *
 * Gradual seeks may be smoothed by the playback layer; everything else
 * is applied at once.
 */
enum class Urgency {
    Gradual,
    Immediate
};

struct Correction {
    CorrectionAction action = CorrectionAction::Seek;
    std::string track_id;
    std::uint64_t position_ms = 0;
    std::uint64_t emitted_at_ms = 0;
    Urgency urgency = Urgency::Immediate;
    std::int64_t drift_ms = 0;
    /// Host play state; a SwitchTrack to a paused host leaves the client paused.
    bool is_playing = true;
};

enum class SyncQuality {
    Excellent,
    Good,
    Fair,
    Poor
};

struct DriftReport {
    std::int64_t drift_ms = 0;
    SyncQuality quality = SyncQuality::Excellent;
};

/**
 * @brief Read-only view returned by the "get state" control operation
 */
struct SessionView {
    SessionId session_id;
    SessionState state = SessionState::Idle;
    UserId host_user_id;
    bool host_connected = false;
    std::optional<UserId> client_user_id;
    bool client_connected = false;
    std::optional<PlaybackSnapshot> host_snapshot;
    std::optional<PlaybackSnapshot> client_snapshot;
    std::int64_t client_offset_ms = 0;
    std::uint64_t created_at_ms = 0;
    std::uint64_t expires_at_ms = 0;
    std::optional<std::uint64_t> last_sync_at_ms;
    std::optional<DriftReport> drift;
    std::optional<EndReason> end_reason;
};

struct CreateResult {
    SessionId session_id;
    PeerRole role = PeerRole::Host;
    std::uint64_t expires_at_ms = 0;
};

struct JoinResult {
    SessionId session_id;
    PeerRole role = PeerRole::Client;
    UserId host_name;
    std::uint64_t expires_at_ms = 0;
    bool rejoined = false;
};

const char* to_string(PeerRole role);
const char* to_string(SessionState state);
const char* to_string(EndReason reason);
const char* to_string(CorrectionAction action);
const char* to_string(SyncQuality quality);
const char* to_string(Urgency urgency);

std::optional<PeerRole> role_from_string(const std::string& text);
std::optional<CorrectionAction> action_from_string(const std::string& text);

} // namespace tandem::sync
