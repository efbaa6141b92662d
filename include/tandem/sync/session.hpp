#pragma once

#include "tandem/core/result.hpp"
#include "tandem/sync/peer_state_store.hpp"
#include "tandem/sync/types.hpp"

#include <cstdint>
#include <optional>

namespace tandem::sync {

/**
 * @brief One host, at most one client, and their latest playback state
 *
 * Not internally synchronised apart from the PeerStateStore; the
 * SessionManager serialises every mutation through the owning slot's lock.
 */
class Session {
public:
    Session(SessionId id, PeerRef host, std::uint64_t created_at_ms, std::uint64_t lifetime_ms);

    [[nodiscard]] const SessionId& id() const noexcept { return id_; }
    [[nodiscard]] SessionState state() const noexcept { return state_; }
    [[nodiscard]] const PeerRef& host() const noexcept { return host_; }
    [[nodiscard]] const std::optional<PeerRef>& client() const noexcept { return client_; }
    [[nodiscard]] std::optional<EndReason> end_reason() const noexcept { return end_reason_; }

    [[nodiscard]] std::uint64_t created_at_ms() const noexcept { return created_at_ms_; }
    [[nodiscard]] std::uint64_t expires_at_ms() const noexcept { return expires_at_ms_; }
    [[nodiscard]] std::optional<std::uint64_t> last_sync_at_ms() const noexcept { return last_sync_at_ms_; }
    [[nodiscard]] std::optional<std::uint64_t> host_disconnected_at_ms() const noexcept {
        return host_disconnected_at_ms_;
    }

    [[nodiscard]] bool is_expired(std::uint64_t now_ms) const noexcept { return now_ms >= expires_at_ms_; }
    [[nodiscard]] bool is_ended() const noexcept { return state_ == SessionState::Ended; }

    PeerStateStore& peers() noexcept { return peers_; }
    const PeerStateStore& peers() const noexcept { return peers_; }

    /**
     * @brief Register the client, or rebind its connection on rejoin
     *
     * @return true if this was a rejoin by the already-registered user
     */
    Result<bool> attach_client(PeerRef client);

    /// Rebind the host's live connection; fails for any other user.
    Result<void> attach_host(const UserId& user_id, ConnectionId connection_id);

    /// Forget a live connection. Returns the role it belonged to, if any.
    std::optional<PeerRole> detach_connection(const ConnectionId& connection_id, std::uint64_t now_ms);

    [[nodiscard]] std::optional<PeerRole> role_of_connection(const ConnectionId& connection_id) const;
    [[nodiscard]] std::optional<PeerRole> role_of_user(const UserId& user_id) const;

    Result<void> transition_to(SessionState next_state);
    Result<void> end(EndReason reason);

    void mark_synced(std::uint64_t now_ms) noexcept { last_sync_at_ms_ = now_ms; }

    [[nodiscard]] SessionView view() const;

private:
    [[nodiscard]] bool can_transition(SessionState target) const noexcept;

    SessionId id_;
    PeerRef host_;
    std::optional<PeerRef> client_;
    PeerStateStore peers_;
    SessionState state_ = SessionState::Idle;
    std::optional<EndReason> end_reason_;
    std::uint64_t created_at_ms_ = 0;
    std::uint64_t expires_at_ms_ = 0;
    std::optional<std::uint64_t> last_sync_at_ms_;
    std::optional<std::uint64_t> host_disconnected_at_ms_;
};

} // namespace tandem::sync
