#include "tandem/sync/peer_state_store.hpp"

#include <algorithm>

namespace tandem::sync {

HostChange PeerStateStore::update_host(PlaybackSnapshot snapshot) {
    std::lock_guard lock(mutex_);
    HostChange change;
    change.track_changed = !states_.host || states_.host->track_id != snapshot.track_id;
    change.play_state_changed = !states_.host || states_.host->is_playing != snapshot.is_playing;
    states_.host = std::move(snapshot);
    return change;
}

void PeerStateStore::update_client(PlaybackSnapshot snapshot) {
    std::lock_guard lock(mutex_);
    states_.client = std::move(snapshot);
}

void PeerStateStore::clear_client() {
    std::lock_guard lock(mutex_);
    states_.client.reset();
}

std::int64_t PeerStateStore::set_offset(std::int64_t offset_ms, std::int64_t limit_ms) {
    std::lock_guard lock(mutex_);
    states_.client_offset_ms = clamp_offset(offset_ms, limit_ms);
    return states_.client_offset_ms;
}

PeerStates PeerStateStore::read() const {
    std::lock_guard lock(mutex_);
    return states_;
}

std::int64_t PeerStateStore::offset() const {
    std::lock_guard lock(mutex_);
    return states_.client_offset_ms;
}

std::int64_t PeerStateStore::clamp_offset(std::int64_t offset_ms, std::int64_t limit_ms) noexcept {
    const auto limit = std::max<std::int64_t>(limit_ms, 0);
    return std::clamp(offset_ms, -limit, limit);
}

} // namespace tandem::sync
