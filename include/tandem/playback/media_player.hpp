#pragma once

#include "tandem/core/result.hpp"
#include "tandem/sync/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tandem::playback {

/**
 * @brief Narrow view of a device's playback SDK
 *
 * current_playback() returns nothing when the device is idle. Its
 * reported_at_ms is left at zero; callers stamp it with their own Clock.
 */
class MediaPlayer {
public:
    virtual ~MediaPlayer() = default;

    virtual Result<void> authenticate() = 0;
    virtual Result<std::optional<sync::PlaybackSnapshot>> current_playback() = 0;

    /// Start or resume; with a track id, switch to that track first.
    virtual Result<void> play(const std::optional<std::string>& track_id) = 0;
    virtual Result<void> pause() = 0;
    virtual Result<void> seek(std::uint64_t position_ms) = 0;
};

} // namespace tandem::playback
