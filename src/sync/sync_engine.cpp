#include "tandem/sync/sync_engine.hpp"

namespace tandem::sync {
namespace {

std::int64_t magnitude(std::int64_t value) {
    return value < 0 ? -value : value;
}

// Positions, elapsed time and offsets are bounded to +/-2^53 so that sums of
// three of them stay far inside int64_t.
std::uint64_t bounded(std::uint64_t value) {
    return value < kMaxPositionMs ? value : kMaxPositionMs;
}

std::int64_t bounded_offset(std::int64_t offset_ms) {
    const auto limit = static_cast<std::int64_t>(kMaxPositionMs);
    return offset_ms < -limit ? -limit : (offset_ms > limit ? limit : offset_ms);
}

Correction make_correction(CorrectionAction action,
                           const PlaybackSnapshot& host,
                           std::uint64_t position_ms,
                           std::uint64_t now_ms) {
    Correction correction;
    correction.action = action;
    correction.track_id = host.track_id;
    correction.position_ms = position_ms;
    correction.emitted_at_ms = now_ms;
    correction.urgency = Urgency::Immediate;
    correction.is_playing = host.is_playing;
    return correction;
}

} // namespace

SyncEngine::SyncEngine(SyncThresholds thresholds) : thresholds_(thresholds) {}

std::uint64_t SyncEngine::project_position(const PlaybackSnapshot& snapshot, std::uint64_t now_ms) noexcept {
    const auto position = bounded(snapshot.position_ms);
    if (!snapshot.is_playing || now_ms <= snapshot.reported_at_ms) {
        return position;
    }
    return position + bounded(now_ms - snapshot.reported_at_ms);
}

std::uint64_t SyncEngine::target_client_position(const PlaybackSnapshot& host,
                                                 std::int64_t client_offset_ms,
                                                 std::uint64_t now_ms) noexcept {
    const auto expected = static_cast<std::int64_t>(project_position(host, now_ms));
    const auto target = expected + bounded_offset(client_offset_ms);
    return target < 0 ? 0 : static_cast<std::uint64_t>(target);
}

std::int64_t SyncEngine::drift(const PlaybackSnapshot& host,
                               const PlaybackSnapshot& client,
                               std::int64_t client_offset_ms,
                               std::uint64_t now_ms) noexcept {
    // The client's reported position is compared as-is against the host projected to now
    const auto expected = static_cast<std::int64_t>(project_position(host, now_ms));
    const auto actual = static_cast<std::int64_t>(bounded(client.position_ms));
    return actual - (expected + bounded_offset(client_offset_ms));
}

SyncQuality SyncEngine::classify(std::int64_t drift_ms) const noexcept {
    const auto abs_drift = magnitude(drift_ms);
    if (abs_drift < thresholds_.excellent_ms) {
        return SyncQuality::Excellent;
    }
    if (abs_drift < thresholds_.gradual_ms) {
        return SyncQuality::Good;
    }
    if (abs_drift < thresholds_.immediate_ms) {
        return SyncQuality::Fair;
    }
    return SyncQuality::Poor;
}

std::optional<Correction> SyncEngine::evaluate(const std::optional<PlaybackSnapshot>& host,
                                               const std::optional<PlaybackSnapshot>& client,
                                               std::int64_t client_offset_ms,
                                               std::uint64_t now_ms) const {
    if (!host || !client) {
        return std::nullopt;
    }

    const auto target = target_client_position(*host, client_offset_ms, now_ms);

    if (host->track_id != client->track_id) {
        return make_correction(CorrectionAction::SwitchTrack, *host, target, now_ms);
    }

    const auto drift_ms = drift(*host, *client, client_offset_ms, now_ms);

    if (host->is_playing != client->is_playing) {
        auto correction = make_correction(host->is_playing ? CorrectionAction::Play : CorrectionAction::Pause,
                                          *host, target, now_ms);
        correction.drift_ms = drift_ms;
        return correction;
    }

    switch (classify(drift_ms)) {
        case SyncQuality::Excellent:
        case SyncQuality::Good:
            return std::nullopt;
        case SyncQuality::Fair: {
            auto correction = make_correction(CorrectionAction::Seek, *host, target, now_ms);
            correction.urgency = Urgency::Gradual;
            correction.drift_ms = drift_ms;
            return correction;
        }
        case SyncQuality::Poor: {
            auto correction = make_correction(CorrectionAction::Seek, *host, target, now_ms);
            correction.drift_ms = drift_ms;
            return correction;
        }
    }
    return std::nullopt;
}

std::optional<Correction> SyncEngine::full_sync(const std::optional<PlaybackSnapshot>& host,
                                                std::int64_t client_offset_ms,
                                                std::uint64_t now_ms) const {
    if (!host) {
        return std::nullopt;
    }
    return make_correction(CorrectionAction::SwitchTrack, *host,
                           target_client_position(*host, client_offset_ms, now_ms), now_ms);
}

std::optional<DriftReport> SyncEngine::assess(const std::optional<PlaybackSnapshot>& host,
                                              const std::optional<PlaybackSnapshot>& client,
                                              std::int64_t client_offset_ms,
                                              std::uint64_t now_ms) const {
    if (!host || !client || host->track_id != client->track_id) {
        return std::nullopt;
    }
    DriftReport report;
    report.drift_ms = drift(*host, *client, client_offset_ms, now_ms);
    report.quality = classify(report.drift_ms);
    return report;
}

} // namespace tandem::sync
