#include "tandem/sync/types.hpp"

namespace tandem::sync {

const char* to_string(PeerRole role) {
    return role == PeerRole::Host ? "host" : "client";
}

const char* to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "idle";
        case SessionState::Active: return "active";
        case SessionState::Ended: return "ended";
    }
    return "unknown";
}

const char* to_string(EndReason reason) {
    switch (reason) {
        case EndReason::HostEnded: return "host_ended";
        case EndReason::HostDisconnected: return "host_disconnected";
        case EndReason::SessionExpired: return "session_expired";
    }
    return "unknown";
}

const char* to_string(CorrectionAction action) {
    switch (action) {
        case CorrectionAction::Play: return "play";
        case CorrectionAction::Pause: return "pause";
        case CorrectionAction::Seek: return "seek";
        case CorrectionAction::SwitchTrack: return "switch_track";
    }
    return "unknown";
}

const char* to_string(SyncQuality quality) {
    switch (quality) {
        case SyncQuality::Excellent: return "excellent";
        case SyncQuality::Good: return "good";
        case SyncQuality::Fair: return "fair";
        case SyncQuality::Poor: return "poor";
    }
    return "unknown";
}

const char* to_string(Urgency urgency) {
    return urgency == Urgency::Gradual ? "gradual" : "immediate";
}

std::optional<PeerRole> role_from_string(const std::string& text) {
    if (text == "host") return PeerRole::Host;
    if (text == "client") return PeerRole::Client;
    return std::nullopt;
}

std::optional<CorrectionAction> action_from_string(const std::string& text) {
    if (text == "play") return CorrectionAction::Play;
    if (text == "pause") return CorrectionAction::Pause;
    if (text == "seek") return CorrectionAction::Seek;
    if (text == "switch_track") return CorrectionAction::SwitchTrack;
    return std::nullopt;
}

} // namespace tandem::sync
