#pragma once

#include "tandem/core/clock.hpp"
#include "tandem/core/result.hpp"
#include "tandem/playback/media_player.hpp"
#include "tandem/sync/types.hpp"

#include <optional>

namespace tandem::playback {

/**
 * @brief Turns the player's current state into timestamped snapshots
 *
 * A host reports on a fixed interval and additionally whenever the track
 * or play/pause state changes; should_report() makes that second call.
 */
class PlaybackReporter {
public:
    PlaybackReporter(MediaPlayer& player, const Clock& clock) : player_(player), clock_(clock) {}

    /// Nothing when the player is idle.
    Result<std::optional<sync::PlaybackSnapshot>> capture();

    /// Capture, and return the snapshot only if it differs in track or play state from the last one.
    Result<std::optional<sync::PlaybackSnapshot>> poll_for_change();

    static bool should_report(const std::optional<sync::PlaybackSnapshot>& previous,
                              const sync::PlaybackSnapshot& current);

private:
    MediaPlayer& player_;
    const Clock& clock_;
    std::optional<sync::PlaybackSnapshot> last_;
};

} // namespace tandem::playback
