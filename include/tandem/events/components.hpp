/**
 * @file components.hpp
 * @brief Event-driven logging and metrics
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 */

#pragma once

#include "tandem/events/event_bus.hpp"
#include "tandem/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace tandem::events {

/**
 * @brief Writes one log line per domain event
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<ServerStartedEvent>([this](const ServerStartedEvent& e) {
            on_server_started(e);
        });

        bus_.subscribe<ServerShuttingDownEvent>([this](const ServerShuttingDownEvent& e) {
            on_server_shutdown(e);
        });

        bus_.subscribe<SessionCreatedEvent>([](const SessionCreatedEvent& e) {
            spdlog::info("[SessionCreated] session={} host={} expires_at={}",
                         e.session_id, e.host_user_id, e.expires_at_ms);
        });

        bus_.subscribe<PeerJoinedEvent>([](const PeerJoinedEvent& e) {
            spdlog::info("[PeerJoined] session={} user={} role={} rejoined={}",
                         e.session_id, e.user_id, sync::to_string(e.role), e.rejoined);
        });

        bus_.subscribe<PeerDisconnectedEvent>([](const PeerDisconnectedEvent& e) {
            spdlog::info("[PeerDisconnected] session={} user={} role={}",
                         e.session_id, e.user_id, sync::to_string(e.role));
        });

        bus_.subscribe<PeerReconnectedEvent>([](const PeerReconnectedEvent& e) {
            spdlog::info("[PeerReconnected] session={} user={} role={}",
                         e.session_id, e.user_id, sync::to_string(e.role));
        });

        bus_.subscribe<SessionEndedEvent>([](const SessionEndedEvent& e) {
            spdlog::info("[SessionEnded] session={} reason={}", e.session_id, sync::to_string(e.reason));
        });

        bus_.subscribe<OffsetChangedEvent>([](const OffsetChangedEvent& e) {
            spdlog::info("[OffsetChanged] session={} requested={}ms applied={}ms",
                         e.session_id, e.requested_ms, e.applied_ms);
        });

        bus_.subscribe<CorrectionIssuedEvent>([](const CorrectionIssuedEvent& e) {
            spdlog::info("[CorrectionIssued] session={} trigger={} action={} track={} position={} drift={}ms urgency={}",
                         e.session_id, e.trigger,
                         sync::to_string(e.correction.action),
                         e.correction.track_id,
                         e.correction.position_ms,
                         e.correction.drift_ms,
                         sync::to_string(e.correction.urgency));
        });

        bus_.subscribe<DeliveryDroppedEvent>([](const DeliveryDroppedEvent& e) {
            spdlog::warn("[DeliveryDropped] session={} user={} message={} reason={}",
                         e.session_id, e.user_id, e.message_type, e.reason);
        });

        bus_.subscribe<MessageRejectedEvent>([](const MessageRejectedEvent& e) {
            spdlog::warn("[MessageRejected] connection={} event={} code={} detail={}",
                         e.connection_id, e.event_name, to_string(e.code), e.detail);
        });
    }

private:
    void on_server_started(const ServerStartedEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Coordinator started: http={} ws={}", e.http_port, e.ws_port);
        spdlog::info("════════════════════════════════════════════");
    }

    void on_server_shutdown(const ServerShuttingDownEvent& e) {
        spdlog::info("════════════════════════════════════════════");
        spdlog::info("Coordinator shutting down: {}", e.reason);
        spdlog::info("════════════════════════════════════════════");
    }

    EventBus& bus_;
};

/**
 * @brief Counts sessions, joins, corrections and failures
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * auto& stats = metrics.get_stats();
 * spdlog::info("Corrections: {}", stats.corrections_issued.load());
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> sessions_created{0};
        std::atomic<uint64_t> sessions_ended{0};
        std::atomic<uint64_t> sessions_expired{0};
        std::atomic<uint64_t> host_timeouts{0};
        std::atomic<uint64_t> joins{0};
        std::atomic<uint64_t> rejoins{0};
        std::atomic<uint64_t> disconnects{0};
        std::atomic<uint64_t> offset_changes{0};
        std::atomic<uint64_t> corrections_issued{0};
        std::atomic<uint64_t> seeks{0};
        std::atomic<uint64_t> play_state_fixes{0};
        std::atomic<uint64_t> track_switches{0};
        std::atomic<uint64_t> deliveries_dropped{0};
        std::atomic<uint64_t> messages_rejected{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<SessionCreatedEvent>([this](const SessionCreatedEvent&) {
            stats_.sessions_created++;
        });

        bus_.subscribe<SessionEndedEvent>([this](const SessionEndedEvent& e) {
            on_session_ended(e);
        });

        bus_.subscribe<PeerJoinedEvent>([this](const PeerJoinedEvent& e) {
            if (e.rejoined) {
                stats_.rejoins++;
            } else {
                stats_.joins++;
            }
        });

        bus_.subscribe<PeerDisconnectedEvent>([this](const PeerDisconnectedEvent&) {
            stats_.disconnects++;
        });

        bus_.subscribe<OffsetChangedEvent>([this](const OffsetChangedEvent&) {
            stats_.offset_changes++;
        });

        bus_.subscribe<CorrectionIssuedEvent>([this](const CorrectionIssuedEvent& e) {
            on_correction(e);
        });

        bus_.subscribe<DeliveryDroppedEvent>([this](const DeliveryDroppedEvent&) {
            stats_.deliveries_dropped++;
        });

        bus_.subscribe<MessageRejectedEvent>([this](const MessageRejectedEvent&) {
            stats_.messages_rejected++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Coordinator Statistics:");
        spdlog::info("  Sessions created:   {}", stats_.sessions_created.load());
        spdlog::info("  Sessions ended:     {}", stats_.sessions_ended.load());
        spdlog::info("    expired:          {}", stats_.sessions_expired.load());
        spdlog::info("    host timeouts:    {}", stats_.host_timeouts.load());
        spdlog::info("  Joins / rejoins:    {} / {}", stats_.joins.load(), stats_.rejoins.load());
        spdlog::info("  Disconnects:        {}", stats_.disconnects.load());
        spdlog::info("  Offset changes:     {}", stats_.offset_changes.load());
        spdlog::info("  Corrections:        {}", stats_.corrections_issued.load());
        spdlog::info("    seeks:            {}", stats_.seeks.load());
        spdlog::info("    play/pause:       {}", stats_.play_state_fixes.load());
        spdlog::info("    track switches:   {}", stats_.track_switches.load());
        spdlog::info("  Dropped deliveries: {}", stats_.deliveries_dropped.load());
        spdlog::info("  Rejected messages:  {}", stats_.messages_rejected.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_session_ended(const SessionEndedEvent& e) {
        stats_.sessions_ended++;
        if (e.reason == sync::EndReason::SessionExpired) {
            stats_.sessions_expired++;
        } else if (e.reason == sync::EndReason::HostDisconnected) {
            stats_.host_timeouts++;
        }
    }

    void on_correction(const CorrectionIssuedEvent& e) {
        stats_.corrections_issued++;
        switch (e.correction.action) {
            case sync::CorrectionAction::Seek:
                stats_.seeks++;
                break;
            case sync::CorrectionAction::Play:
            case sync::CorrectionAction::Pause:
                stats_.play_state_fixes++;
                break;
            case sync::CorrectionAction::SwitchTrack:
                stats_.track_switches++;
                break;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace tandem::events
