#pragma once

#include "tandem/core/result.hpp"
#include "tandem/playback/media_player.hpp"
#include "tandem/sync/types.hpp"

#include <cstdint>
#include <optional>

namespace tandem::playback {

/**
 * @brief Applies coordinator corrections to the local player
 *
 *   play         -> play(track), seek(position)
 *   pause        -> pause()
 *   seek         -> seek(position)
 *   switch_track -> play(track), seek(position), pause() if the host is paused
 *
 * A correction older than the last one applied is skipped, so commands
 * that arrive out of order never move playback backwards in time.
 */
class CorrectionExecutor {
public:
    explicit CorrectionExecutor(MediaPlayer& player) : player_(player) {}

    /// @return true if applied, false if skipped as stale
    Result<bool> apply(const sync::Correction& correction);

    std::optional<std::uint64_t> last_applied_at_ms() const { return last_applied_at_ms_; }

private:
    Result<void> play_at(const sync::Correction& correction);

    MediaPlayer& player_;
    std::optional<std::uint64_t> last_applied_at_ms_;
};

} // namespace tandem::playback
