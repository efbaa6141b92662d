#include "tandem/playback/correction_executor.hpp"

#include <spdlog/spdlog.h>

namespace tandem::playback {

Result<bool> CorrectionExecutor::apply(const sync::Correction& correction) {
    if (last_applied_at_ms_ && correction.emitted_at_ms < *last_applied_at_ms_) {
        spdlog::debug("Skipping stale {} emitted at {} (last applied {})",
                      sync::to_string(correction.action), correction.emitted_at_ms, *last_applied_at_ms_);
        return Ok(false);
    }

    Result<void> result = Ok();
    switch (correction.action) {
        case sync::CorrectionAction::Play:
        case sync::CorrectionAction::SwitchTrack:
            result = play_at(correction);
            break;
        case sync::CorrectionAction::Pause:
            result = player_.pause();
            break;
        case sync::CorrectionAction::Seek:
            result = player_.seek(correction.position_ms);
            break;
    }

    if (result.is_error()) {
        spdlog::warn("Correction {} failed: {}", sync::to_string(correction.action), result.error().message);
        return Err<bool>(result.error());
    }

    last_applied_at_ms_ = correction.emitted_at_ms;
    spdlog::debug("Applied {} to {}@{}ms", sync::to_string(correction.action),
                  correction.track_id, correction.position_ms);
    return Ok(true);
}

Result<void> CorrectionExecutor::play_at(const sync::Correction& correction) {
    std::optional<std::string> track;
    if (!correction.track_id.empty()) {
        track = correction.track_id;
    }

    auto played = player_.play(track);
    if (played.is_error()) {
        return played;
    }
    auto sought = player_.seek(correction.position_ms);
    if (sought.is_error() || correction.is_playing) {
        return sought;
    }
    // Switching to a paused host's track: load it, then hold
    return player_.pause();
}

} // namespace tandem::playback
