#include "tandem/playback/playback_reporter.hpp"

namespace tandem::playback {

Result<std::optional<sync::PlaybackSnapshot>> PlaybackReporter::capture() {
    auto current = player_.current_playback();
    if (current.is_error()) {
        return current;
    }

    auto snapshot = current.value();
    if (snapshot) {
        snapshot->reported_at_ms = clock_.now_ms();
        last_ = snapshot;
    }
    return Ok(snapshot);
}

Result<std::optional<sync::PlaybackSnapshot>> PlaybackReporter::poll_for_change() {
    const auto previous = last_;
    auto captured = capture();
    if (captured.is_error() || !captured.value()) {
        return captured;
    }
    if (!should_report(previous, *captured.value())) {
        return Ok(std::optional<sync::PlaybackSnapshot>());
    }
    return captured;
}

bool PlaybackReporter::should_report(const std::optional<sync::PlaybackSnapshot>& previous,
                                     const sync::PlaybackSnapshot& current) {
    if (!previous) {
        return true;
    }
    return previous->track_id != current.track_id || previous->is_playing != current.is_playing;
}

} // namespace tandem::playback
