#pragma once

#include "tandem/sync/types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>

namespace tandem::sync {

/**
 * @brief Consistent copy of everything the engine needs for one session
 */
struct PeerStates {
    std::optional<PlaybackSnapshot> host;
    std::optional<PlaybackSnapshot> client;
    std::int64_t client_offset_ms = 0;
};

/**
 * @brief What a new host snapshot changed relative to the previous one
 *
 * The first host snapshot counts as a change of both.
 */
struct HostChange {
    bool track_changed = false;
    bool play_state_changed = false;
};

/**
 * @brief Latest host/client snapshots and the client offset of one session
 *
 * Snapshots are replaced wholesale; no history is kept. Every accessor
 * takes the internal lock, so read() never observes a half-applied update.
 */
class PeerStateStore {
public:
    PeerStateStore() = default;

    PeerStateStore(const PeerStateStore&) = delete;
    PeerStateStore& operator=(const PeerStateStore&) = delete;

    HostChange update_host(PlaybackSnapshot snapshot);

    void update_client(PlaybackSnapshot snapshot);

    void clear_client();

    /// Clamp to [-limit_ms, limit_ms], store, and return the stored value.
    std::int64_t set_offset(std::int64_t offset_ms, std::int64_t limit_ms);

    [[nodiscard]] PeerStates read() const;

    [[nodiscard]] std::int64_t offset() const;

    static std::int64_t clamp_offset(std::int64_t offset_ms, std::int64_t limit_ms) noexcept;

private:
    mutable std::mutex mutex_;
    PeerStates states_;
};

} // namespace tandem::sync
