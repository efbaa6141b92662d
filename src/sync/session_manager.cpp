#include "tandem/sync/session_manager.hpp"

#include "tandem/events/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace tandem::sync {
namespace {

constexpr int kMaxCodeAttempts = 32;

const char* message_type(const OutboundMessage& message) {
    if (std::holds_alternative<SyncCommand>(message)) {
        return "sync_command";
    }
    if (std::holds_alternative<SessionEndedNotice>(message)) {
        return "session_ended";
    }
    return "sync_status";
}

} // namespace

SessionManager::SessionManager(SessionConfig session_config,
                               SyncThresholds thresholds,
                               const Clock& clock,
                               Scheduler& scheduler,
                               PeerNotifier& notifier,
                               events::EventBus& bus,
                               std::unique_ptr<SessionRepository> repository)
    : config_(std::move(session_config)),
      engine_(thresholds),
      clock_(clock),
      scheduler_(scheduler),
      notifier_(notifier),
      bus_(bus),
      repository_(std::move(repository)),
      codes_(config_.code_length) {}

SessionManager::~SessionManager() {
    shutdown();
}

Result<CreateResult> SessionManager::create_session(const UserId& host_user_id) {
    if (host_user_id.empty()) {
        return Err<CreateResult>(ErrorCode::InvalidArgument, "hostUserId required");
    }

    const auto now = clock_.now_ms();
    const auto lifetime = static_cast<std::uint64_t>(config_.lifetime.count());

    SessionSlotPtr slot;
    {
        std::lock_guard lock(create_mutex_);
        repository_->purge_tombstones(now);

        if (config_.max_sessions > 0 && repository_->size() >= config_.max_sessions) {
            return Err<CreateResult>(ErrorCode::CapacityExceeded,
                                     "Session limit reached (" + std::to_string(config_.max_sessions) + ")");
        }

        for (int attempt = 0; attempt < kMaxCodeAttempts && !slot; ++attempt) {
            auto candidate = std::make_shared<SessionSlot>(codes_.next(), PeerRef{host_user_id, {}}, now, lifetime);
            if (repository_->insert(candidate)) {
                slot = std::move(candidate);
            }
        }
        if (!slot) {
            return Err<CreateResult>(ErrorCode::Internal, "Could not allocate a unique session code");
        }
    }

    CreateResult result;
    {
        std::lock_guard lock(slot->mutex);
        const auto session_id = slot->session.id();
        slot->expiry_task = scheduler_.schedule_after(config_.lifetime, [this, session_id] {
            on_expired(session_id);
        });
        result.session_id = session_id;
        result.role = PeerRole::Host;
        result.expires_at_ms = slot->session.expires_at_ms();
    }

    bus_.emit(events::SessionCreatedEvent{result.session_id, host_user_id, result.expires_at_ms});
    return Ok(result);
}

Result<JoinResult> SessionManager::join_session(const SessionId& session_id,
                                                const UserId& client_user_id,
                                                const ConnectionId& connection_id) {
    if (client_user_id.empty()) {
        return Err<JoinResult>(ErrorCode::InvalidArgument, "userId required");
    }
    auto found = find_slot(session_id, Lookup::HideExpired);
    if (found.is_error()) {
        return Err<JoinResult>(found.error());
    }
    auto slot = found.value();

    Outbox outbox;
    JoinResult result;
    Result<void> status = Ok();
    {
        std::lock_guard lock(slot->mutex);
        const auto now = clock_.now_ms();

        status = check_live_locked(*slot, now, Lookup::HideExpired, outbox);
        if (status.is_ok()) {
            auto attached = slot->session.attach_client(PeerRef{client_user_id, connection_id});
            if (attached.is_error()) {
                status = Err<void>(attached.error());
            } else {
                result.session_id = session_id;
                result.role = PeerRole::Client;
                result.host_name = slot->session.host().user_id;
                result.expires_at_ms = slot->session.expires_at_ms();
                result.rejoined = attached.value();

                start_periodic_locked(*slot);
                if (!connection_id.empty()) {
                    force_full_sync_locked(*slot, now, outbox);
                }

                const bool rejoined = result.rejoined;
                outbox.events.push_back([this, session_id, client_user_id, rejoined] {
                    bus_.emit(events::PeerJoinedEvent{session_id, client_user_id, PeerRole::Client, rejoined});
                });
            }
        }
    }
    flush(slot, outbox);

    if (status.is_error()) {
        return Err<JoinResult>(status.error());
    }
    return Ok(result);
}

Result<JoinResult> SessionManager::attach_host(const SessionId& session_id,
                                               const UserId& host_user_id,
                                               const ConnectionId& connection_id) {
    if (connection_id.empty()) {
        return Err<JoinResult>(ErrorCode::InvalidArgument, "connection required to attach host");
    }
    auto found = find_slot(session_id, Lookup::ReportEnded);
    if (found.is_error()) {
        return Err<JoinResult>(found.error());
    }
    auto slot = found.value();

    Outbox outbox;
    JoinResult result;
    Result<void> status = Ok();
    {
        std::lock_guard lock(slot->mutex);
        status = check_live_locked(*slot, clock_.now_ms(), Lookup::ReportEnded, outbox);
        if (status.is_ok()) {
            const bool was_disconnected = slot->session.host_disconnected_at_ms().has_value();
            status = slot->session.attach_host(host_user_id, connection_id);
            if (status.is_ok()) {
                if (slot->grace_task) {
                    scheduler_.cancel(*slot->grace_task);
                    slot->grace_task.reset();
                }
                result.session_id = session_id;
                result.role = PeerRole::Host;
                result.host_name = host_user_id;
                result.expires_at_ms = slot->session.expires_at_ms();
                result.rejoined = was_disconnected;

                outbox.events.push_back([this, session_id, host_user_id, was_disconnected] {
                    if (was_disconnected) {
                        bus_.emit(events::PeerReconnectedEvent{session_id, host_user_id, PeerRole::Host});
                    } else {
                        bus_.emit(events::PeerJoinedEvent{session_id, host_user_id, PeerRole::Host, false});
                    }
                });
            }
        }
    }
    flush(slot, outbox);

    if (status.is_error()) {
        return Err<JoinResult>(status.error());
    }
    return Ok(result);
}

Result<void> SessionManager::report_host_state(const SessionId& session_id,
                                               const ConnectionId& connection_id,
                                               PlaybackSnapshot snapshot) {
    auto found = find_slot(session_id, Lookup::ReportEnded);
    if (found.is_error()) {
        return Err<void>(found.error());
    }
    auto slot = found.value();

    Outbox outbox;
    Result<void> status = Ok();
    {
        std::lock_guard lock(slot->mutex);
        const auto now = clock_.now_ms();
        status = check_live_locked(*slot, now, Lookup::ReportEnded, outbox);
        if (status.is_ok() && slot->session.role_of_connection(connection_id) != PeerRole::Host) {
            status = Err<void>(ErrorCode::Forbidden, "Connection is not the host of session " + session_id);
        }
        if (status.is_ok()) {
            const auto change = slot->session.peers().update_host(std::move(snapshot));
            if (change.track_changed) {
                evaluate_locked(*slot, "track_change", now, outbox);
            } else if (change.play_state_changed) {
                evaluate_locked(*slot, "play_state_change", now, outbox);
            }
        }
    }
    flush(slot, outbox);
    return status;
}

Result<void> SessionManager::report_client_state(const SessionId& session_id,
                                                 const ConnectionId& connection_id,
                                                 PlaybackSnapshot snapshot) {
    auto found = find_slot(session_id, Lookup::ReportEnded);
    if (found.is_error()) {
        return Err<void>(found.error());
    }
    auto slot = found.value();

    Outbox outbox;
    Result<void> status = Ok();
    {
        std::lock_guard lock(slot->mutex);
        status = check_live_locked(*slot, clock_.now_ms(), Lookup::ReportEnded, outbox);
        if (status.is_ok() && slot->session.role_of_connection(connection_id) != PeerRole::Client) {
            status = Err<void>(ErrorCode::Forbidden, "Connection is not the client of session " + session_id);
        }
        if (status.is_ok()) {
            slot->session.peers().update_client(std::move(snapshot));
        }
    }
    flush(slot, outbox);
    return status;
}

Result<std::int64_t> SessionManager::update_offset(const SessionId& session_id,
                                                   const UserId& client_user_id,
                                                   std::int64_t offset_ms) {
    auto found = find_slot(session_id, Lookup::HideEnded);
    if (found.is_error()) {
        return Err<std::int64_t>(found.error());
    }
    auto slot = found.value();

    Outbox outbox;
    std::int64_t applied = 0;
    Result<void> status = Ok();
    {
        std::lock_guard lock(slot->mutex);
        const auto now = clock_.now_ms();
        status = check_live_locked(*slot, now, Lookup::HideEnded, outbox);
        if (status.is_ok() && slot->session.role_of_user(client_user_id) != PeerRole::Client) {
            status = Err<void>(ErrorCode::Forbidden, "Only the session's client may change the offset");
        }
        if (status.is_ok()) {
            applied = slot->session.peers().set_offset(offset_ms, engine_.thresholds().offset_limit_ms);
            evaluate_locked(*slot, "offset", now, outbox);
            outbox.events.push_back([this, session_id, offset_ms, applied] {
                bus_.emit(events::OffsetChangedEvent{session_id, offset_ms, applied});
            });
        }
    }
    flush(slot, outbox);

    if (status.is_error()) {
        return Err<std::int64_t>(status.error());
    }
    return Ok(applied);
}

Result<std::optional<Correction>> SessionManager::request_immediate_sync(const SessionId& session_id,
                                                                         const UserId& client_user_id) {
    auto found = find_slot(session_id, Lookup::ReportEnded);
    if (found.is_error()) {
        return Err<std::optional<Correction>>(found.error());
    }
    auto slot = found.value();

    Outbox outbox;
    std::optional<Correction> correction;
    Result<void> status = Ok();
    {
        std::lock_guard lock(slot->mutex);
        const auto now = clock_.now_ms();
        status = check_live_locked(*slot, now, Lookup::ReportEnded, outbox);
        if (status.is_ok() && slot->session.role_of_user(client_user_id) != PeerRole::Client) {
            status = Err<void>(ErrorCode::Forbidden, "Only the session's client may request a sync");
        }
        if (status.is_ok()) {
            correction = evaluate_locked(*slot, "request", now, outbox);
        }
    }
    flush(slot, outbox);

    if (status.is_error()) {
        return Err<std::optional<Correction>>(status.error());
    }
    return Ok(correction);
}

void SessionManager::run_periodic_sync(const SessionId& session_id) {
    auto slot = repository_->find(session_id);
    if (!slot) {
        return;
    }

    Outbox outbox;
    {
        std::lock_guard lock(slot->mutex);
        const auto now = clock_.now_ms();
        // An expiry found here still leaves work in the outbox
        if (check_live_locked(*slot, now, Lookup::ReportEnded, outbox).is_ok()) {
            const auto& client = slot->session.client();
            if (client && client->connected()) {
                evaluate_locked(*slot, "periodic", now, outbox);
            } else {
                spdlog::debug("Periodic sync skipped for {}: no connected client", session_id);
            }
        }
    }
    flush(slot, outbox);
}

Result<void> SessionManager::end_session(const SessionId& session_id, const UserId& by_user_id) {
    auto found = find_slot(session_id, Lookup::HideEnded);
    if (found.is_error()) {
        return Err<void>(found.error());
    }
    auto slot = found.value();

    Outbox outbox;
    Result<void> status = Ok();
    {
        std::lock_guard lock(slot->mutex);
        status = check_live_locked(*slot, clock_.now_ms(), Lookup::HideEnded, outbox);
        if (status.is_ok() && slot->session.role_of_user(by_user_id) != PeerRole::Host) {
            status = Err<void>(ErrorCode::Forbidden, "Only the host may end session " + session_id);
        }
        if (status.is_ok()) {
            finish_locked(*slot, EndReason::HostEnded, outbox);
        }
    }
    flush(slot, outbox);
    return status;
}

void SessionManager::peer_disconnected(const SessionId& session_id, const ConnectionId& connection_id) {
    auto slot = repository_->find(session_id);
    if (!slot) {
        return;
    }

    Outbox outbox;
    {
        std::lock_guard lock(slot->mutex);
        if (slot->session.is_ended()) {
            return;
        }
        const auto now = clock_.now_ms();
        const auto role = slot->session.detach_connection(connection_id, now);
        if (!role) {
            return;
        }

        UserId user_id;
        if (*role == PeerRole::Host) {
            user_id = slot->session.host().user_id;
            const auto remaining = slot->session.expires_at_ms() > now
                ? std::chrono::milliseconds(slot->session.expires_at_ms() - now)
                : std::chrono::milliseconds(0);
            const auto grace = std::min(config_.host_grace, remaining);
            if (slot->grace_task) {
                scheduler_.cancel(*slot->grace_task);
            }
            slot->grace_task = scheduler_.schedule_after(grace, [this, session_id] {
                on_host_grace_elapsed(session_id);
            });
            spdlog::info("Host of {} disconnected; ending in {}ms unless it returns", session_id, grace.count());
        } else {
            user_id = slot->session.client()->user_id;
            // A stale client position must not drive corrections after it returns
            slot->session.peers().clear_client();
        }

        const auto peer_role = *role;
        outbox.events.push_back([this, session_id, user_id, peer_role] {
            bus_.emit(events::PeerDisconnectedEvent{session_id, user_id, peer_role});
        });
    }
    flush(slot, outbox);
}

Result<SessionView> SessionManager::get_state(const SessionId& session_id) {
    auto found = find_slot(session_id, Lookup::HideEnded);
    if (found.is_error()) {
        return Err<SessionView>(found.error());
    }
    auto slot = found.value();

    Outbox outbox;
    SessionView view;
    Result<void> status = Ok();
    {
        std::lock_guard lock(slot->mutex);
        const auto now = clock_.now_ms();
        status = check_live_locked(*slot, now, Lookup::HideEnded, outbox);
        if (status.is_ok()) {
            view = slot->session.view();
            view.drift = engine_.assess(view.host_snapshot, view.client_snapshot, view.client_offset_ms, now);
        }
    }
    flush(slot, outbox);

    if (status.is_error()) {
        return Err<SessionView>(status.error());
    }
    return Ok(view);
}

std::size_t SessionManager::session_count() const {
    return repository_->size();
}

void SessionManager::shutdown() {
    for (const auto& id : repository_->ids()) {
        auto slot = repository_->erase(id);
        if (!slot) {
            continue;
        }
        std::lock_guard lock(slot->mutex);
        cancel_timers_locked(*slot);
        slot->closed = true;
        auto ended = slot->session.end(EndReason::HostEnded);
        if (ended.is_error()) {
            spdlog::warn("Session {} could not be closed cleanly: {}", id, ended.error().message);
        }
    }
}

// ──────────────────────────────────────────────────────────
// Internals
// ──────────────────────────────────────────────────────────

Result<SessionSlotPtr> SessionManager::find_slot(const SessionId& session_id, Lookup lookup) const {
    if (auto slot = repository_->find(session_id)) {
        return Ok(slot);
    }
    if (auto reason = repository_->tombstone(session_id, clock_.now_ms()); reason && !hides(lookup, *reason)) {
        return Err<SessionSlotPtr>(ErrorCode::SessionEnded,
                                   "Session " + session_id + " has ended (" + to_string(*reason) + ")");
    }
    return Err<SessionSlotPtr>(ErrorCode::SessionNotFound, "Session not found: " + session_id);
}

Result<void> SessionManager::check_live_locked(SessionSlot& slot,
                                               std::uint64_t now_ms,
                                               Lookup lookup,
                                               Outbox& outbox) {
    auto& session = slot.session;
    if (!session.is_ended() && session.is_expired(now_ms)) {
        finish_locked(slot, EndReason::SessionExpired, outbox);
    }
    if (session.is_ended()) {
        if (hides(lookup, session.end_reason().value_or(EndReason::HostEnded))) {
            return Err<void>(ErrorCode::SessionNotFound, "Session not found: " + session.id());
        }
        return Err<void>(ErrorCode::SessionEnded, "Session " + session.id() + " has ended");
    }
    return Ok();
}

std::optional<Correction> SessionManager::evaluate_locked(SessionSlot& slot,
                                                          const char* trigger,
                                                          std::uint64_t now_ms,
                                                          Outbox& outbox) {
    auto& session = slot.session;
    const auto& client = session.client();
    if (!client) {
        return std::nullopt;
    }

    const auto states = session.peers().read();
    auto correction = engine_.evaluate(states.host, states.client, states.client_offset_ms, now_ms);
    if (correction) {
        session.mark_synced(now_ms);
        outbox.messages.push_back({*client, SyncCommand{session.id(), *correction}});

        const auto session_id = session.id();
        const auto issued = *correction;
        const std::string cause = trigger;
        outbox.events.push_back([this, session_id, issued, cause] {
            bus_.emit(events::CorrectionIssuedEvent{session_id, issued, cause});
        });
    }

    if (auto report = engine_.assess(states.host, states.client, states.client_offset_ms, now_ms)) {
        SyncStatusNotice status{session.id(), *report, session.last_sync_at_ms(), states.client_offset_ms};
        outbox.messages.push_back({*client, status});
        outbox.messages.push_back({session.host(), status});
    }
    return correction;
}

void SessionManager::force_full_sync_locked(SessionSlot& slot, std::uint64_t now_ms, Outbox& outbox) {
    auto& session = slot.session;
    const auto states = session.peers().read();
    auto correction = engine_.full_sync(states.host, states.client_offset_ms, now_ms);
    if (!correction) {
        spdlog::debug("Join of {} before the host reported; nothing to sync yet", session.id());
        return;
    }

    session.mark_synced(now_ms);
    outbox.messages.push_back({*session.client(), SyncCommand{session.id(), *correction}});

    const auto session_id = session.id();
    const auto issued = *correction;
    outbox.events.push_back([this, session_id, issued] {
        bus_.emit(events::CorrectionIssuedEvent{session_id, issued, "join"});
    });
}

void SessionManager::finish_locked(SessionSlot& slot, EndReason reason, Outbox& outbox) {
    auto& session = slot.session;
    auto ended = session.end(reason);
    if (ended.is_error()) {
        spdlog::error("Failed to end session {}: {}", session.id(), ended.error().message);
        return;
    }
    slot.closed = true;
    cancel_timers_locked(slot);

    const SessionEndedNotice notice{session.id(), reason};
    if (session.client()) {
        outbox.messages.push_back({*session.client(), notice});
    }
    if (reason == EndReason::SessionExpired) {
        outbox.messages.push_back({session.host(), notice});
    }
    outbox.ended = reason;
}

void SessionManager::cancel_timers_locked(SessionSlot& slot) {
    for (auto* task : {&slot.periodic_task, &slot.grace_task, &slot.expiry_task}) {
        if (*task) {
            scheduler_.cancel(**task);
            task->reset();
        }
    }
}

void SessionManager::start_periodic_locked(SessionSlot& slot) {
    if (slot.periodic_task) {
        return;
    }
    const auto session_id = slot.session.id();
    slot.periodic_task = scheduler_.schedule_every(config_.sync_interval, [this, session_id] {
        run_periodic_sync(session_id);
    });
}

void SessionManager::on_host_grace_elapsed(const SessionId& session_id) {
    auto slot = repository_->find(session_id);
    if (!slot) {
        return;
    }

    Outbox outbox;
    {
        std::lock_guard lock(slot->mutex);
        slot->grace_task.reset();
        if (slot->session.is_ended() || slot->session.host().connected()) {
            return;
        }
        finish_locked(*slot, EndReason::HostDisconnected, outbox);
    }
    flush(slot, outbox);
}

void SessionManager::on_expired(const SessionId& session_id) {
    auto slot = repository_->find(session_id);
    if (!slot) {
        return;
    }

    Outbox outbox;
    {
        std::lock_guard lock(slot->mutex);
        slot->expiry_task.reset();
        if (slot->session.is_ended()) {
            return;
        }
        finish_locked(*slot, EndReason::SessionExpired, outbox);
    }
    flush(slot, outbox);
}

void SessionManager::flush(const SessionSlotPtr& slot, Outbox& outbox) {
    const auto& session_id = slot->session.id();

    if (outbox.ended) {
        const auto now = clock_.now_ms();
        repository_->erase(session_id);
        repository_->purge_tombstones(now);
        repository_->add_tombstone(session_id, *outbox.ended,
                                   now + static_cast<std::uint64_t>(config_.ended_retention.count()));
    }

    for (const auto& dispatch : outbox.messages) {
        const bool is_end_notice = std::holds_alternative<SessionEndedNotice>(dispatch.message);
        // An end that raced in after this evaluation wins over its commands
        if (slot->closed && !is_end_notice) {
            spdlog::debug("Suppressed {} for ended session {}", message_type(dispatch.message), session_id);
            continue;
        }

        auto delivered = notifier_.deliver(dispatch.peer, dispatch.message);
        if (delivered.is_error()) {
            spdlog::warn("Dropped {} for {} in {}: {}", message_type(dispatch.message),
                         dispatch.peer.user_id, session_id, delivered.error().message);
            bus_.emit(events::DeliveryDroppedEvent{session_id, dispatch.peer.user_id,
                                                   message_type(dispatch.message),
                                                   delivered.error().message});
        }
    }

    for (auto& emit : outbox.events) {
        emit();
    }

    if (outbox.ended) {
        bus_.emit(events::SessionEndedEvent{session_id, *outbox.ended});
    }
}

} // namespace tandem::sync
