#pragma once

#include "tandem/core/config.hpp"
#include "tandem/sync/types.hpp"

#include <cstdint>
#include <optional>

namespace tandem::sync {

/**
 * @brief Drift computation and correction policy
 *
 * Pure: the result depends only on the arguments and the thresholds the
 * engine was built with. No locking, no I/O, safe to call from any thread.
 *
 * Decision order for evaluate():
 *   1. no host or no client snapshot -> nothing
 *   2. track mismatch                -> SwitchTrack (drift ignored)
 *   3. play/pause mismatch           -> Play or Pause
 *   4. |drift| >= immediate          -> Seek, Immediate
 *      |drift| >= gradual            -> Seek, Gradual
 *      otherwise                     -> nothing
 */
class SyncEngine {
public:
    explicit SyncEngine(SyncThresholds thresholds = {});

    [[nodiscard]] std::optional<Correction> evaluate(const std::optional<PlaybackSnapshot>& host,
                                                     const std::optional<PlaybackSnapshot>& client,
                                                     std::int64_t client_offset_ms,
                                                     std::uint64_t now_ms) const;

    /**
     * @brief Unconditional realignment used when a client (re)joins
     *
     * Returns a SwitchTrack to the host's projected position, or nothing if
     * the host has not reported yet.
     */
    [[nodiscard]] std::optional<Correction> full_sync(const std::optional<PlaybackSnapshot>& host,
                                                      std::int64_t client_offset_ms,
                                                      std::uint64_t now_ms) const;

    /**
     * @brief Drift and quality band, for status reporting
     *
     * Nothing when either snapshot is missing or the tracks differ.
     */
    [[nodiscard]] std::optional<DriftReport> assess(const std::optional<PlaybackSnapshot>& host,
                                                    const std::optional<PlaybackSnapshot>& client,
                                                    std::int64_t client_offset_ms,
                                                    std::uint64_t now_ms) const;

    [[nodiscard]] SyncQuality classify(std::int64_t drift_ms) const noexcept;

    [[nodiscard]] const SyncThresholds& thresholds() const noexcept { return thresholds_; }

    /// Position a peer has reached at now_ms; a paused peer stays put. Saturates at 2^54.
    static std::uint64_t project_position(const PlaybackSnapshot& snapshot, std::uint64_t now_ms) noexcept;

    /// Projected host position plus offset, floored at zero.
    static std::uint64_t target_client_position(const PlaybackSnapshot& host,
                                                std::int64_t client_offset_ms,
                                                std::uint64_t now_ms) noexcept;

    /// Reported client position minus the target at now_ms; positive means client ahead.
    static std::int64_t drift(const PlaybackSnapshot& host,
                              const PlaybackSnapshot& client,
                              std::int64_t client_offset_ms,
                              std::uint64_t now_ms) noexcept;

private:
    SyncThresholds thresholds_;
};

} // namespace tandem::sync
