#pragma once

#include "tandem/core/clock.hpp"
#include "tandem/core/config.hpp"
#include "tandem/core/result.hpp"
#include "tandem/events/event_bus.hpp"
#include "tandem/sync/peer_notifier.hpp"
#include "tandem/sync/scheduler.hpp"
#include "tandem/sync/session_code.hpp"
#include "tandem/sync/session_repository.hpp"
#include "tandem/sync/sync_engine.hpp"
#include "tandem/sync/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tandem::sync {

/**
 * @brief Session lifecycle, membership rules and the triggers for evaluation
 *
 * Every public operation follows the same shape:
 *   1. look the slot up in the repository (shared lock, released at once)
 *   2. take the slot's mutex, validate, mutate, run the SyncEngine
 *   3. release the mutex, then deliver the collected messages and events
 * so a slow peer or subscriber never holds up another session.
 */
class SessionManager {
public:
    SessionManager(SessionConfig session_config,
                   SyncThresholds thresholds,
                   const Clock& clock,
                   Scheduler& scheduler,
                   PeerNotifier& notifier,
                   events::EventBus& bus,
                   std::unique_ptr<SessionRepository> repository = std::make_unique<InMemorySessionRepository>());
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Create an Idle session owned by host_user_id
     *
     * Fails with CapacityExceeded when max_sessions live sessions exist.
     */
    Result<CreateResult> create_session(const UserId& host_user_id);

    /**
     * @brief Register (or re-register) the client and force a full sync
     *
     * An empty connection_id registers the user without a live connection
     * (control-surface join); the transport join that follows rebinds it.
     */
    Result<JoinResult> join_session(const SessionId& session_id,
                                    const UserId& client_user_id,
                                    const ConnectionId& connection_id = {});

    /// Bind or rebind the host's live connection; `rejoined` is set after a disconnect.
    Result<JoinResult> attach_host(const SessionId& session_id,
                             const UserId& host_user_id,
                             const ConnectionId& connection_id);

    Result<void> report_host_state(const SessionId& session_id,
                                   const ConnectionId& connection_id,
                                   PlaybackSnapshot snapshot);

    Result<void> report_client_state(const SessionId& session_id,
                                     const ConnectionId& connection_id,
                                     PlaybackSnapshot snapshot);

    /// @return the offset actually stored, after clamping
    Result<std::int64_t> update_offset(const SessionId& session_id,
                                       const UserId& client_user_id,
                                       std::int64_t offset_ms);

    Result<std::optional<Correction>> request_immediate_sync(const SessionId& session_id,
                                                             const UserId& client_user_id);

    /// Scheduler entry point; a session without a connected client is a no-op.
    void run_periodic_sync(const SessionId& session_id);

    Result<void> end_session(const SessionId& session_id, const UserId& by_user_id);

    /// Transport lost `connection_id`; hosts get a grace window, clients just detach.
    void peer_disconnected(const SessionId& session_id, const ConnectionId& connection_id);

    Result<SessionView> get_state(const SessionId& session_id);

    /// Live (Idle or Active) sessions.
    std::size_t session_count() const;

    /// Cancel all timers and drop every session without notifying peers.
    void shutdown();

    const SyncEngine& engine() const noexcept { return engine_; }

private:
    struct Dispatch {
        PeerRef peer;
        OutboundMessage message;
    };

    // Work collected under a session lock and carried out after releasing it
    struct Outbox {
        std::vector<Dispatch> messages;
        std::vector<std::function<void()>> events;
        std::optional<EndReason> ended;
    };

    enum class Lookup {
        ReportEnded,   ///< a recently ended id answers SessionEnded
        HideEnded,     ///< a recently ended id answers SessionNotFound
        HideExpired    ///< like ReportEnded, but an expired id answers SessionNotFound
    };

    static bool hides(Lookup lookup, EndReason reason) {
        return lookup == Lookup::HideEnded ||
               (lookup == Lookup::HideExpired && reason == EndReason::SessionExpired);
    }

    Result<SessionSlotPtr> find_slot(const SessionId& session_id, Lookup lookup) const;

    /// Reject operations on ended or expired sessions; expires lazily.
    Result<void> check_live_locked(SessionSlot& slot, std::uint64_t now_ms, Lookup lookup, Outbox& outbox);

    std::optional<Correction> evaluate_locked(SessionSlot& slot,
                                              const char* trigger,
                                              std::uint64_t now_ms,
                                              Outbox& outbox);

    void force_full_sync_locked(SessionSlot& slot, std::uint64_t now_ms, Outbox& outbox);

    void finish_locked(SessionSlot& slot, EndReason reason, Outbox& outbox);

    void cancel_timers_locked(SessionSlot& slot);

    void start_periodic_locked(SessionSlot& slot);

    void on_host_grace_elapsed(const SessionId& session_id);
    void on_expired(const SessionId& session_id);

    void flush(const SessionSlotPtr& slot, Outbox& outbox);

    SessionConfig config_;
    SyncEngine engine_;
    const Clock& clock_;
    Scheduler& scheduler_;
    PeerNotifier& notifier_;
    events::EventBus& bus_;
    std::unique_ptr<SessionRepository> repository_;
    SessionCodeGenerator codes_;

    std::mutex create_mutex_;
};

} // namespace tandem::sync
