#include "tandem/sync/session_manager.hpp"

#include "tandem/events/events.hpp"
#include "support/fakes.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

using tandem::ErrorCode;
using tandem::ManualClock;
using tandem::events::EventBus;
using tandem::testing::ManualScheduler;
using tandem::testing::RecordingNotifier;
using namespace tandem::sync;

namespace {

constexpr std::uint64_t kStart = 1'000'000;
constexpr std::uint64_t kLifetime = 600'000;
constexpr std::uint64_t kGrace = 30'000;
constexpr std::uint64_t kInterval = 10'000;

tandem::SessionConfig test_config(std::size_t max_sessions = 0) {
    tandem::SessionConfig config;
    config.lifetime = std::chrono::milliseconds(kLifetime);
    config.host_grace = std::chrono::milliseconds(kGrace);
    config.sync_interval = std::chrono::milliseconds(kInterval);
    config.ended_retention = std::chrono::milliseconds(60'000);
    config.max_sessions = max_sessions;
    return config;
}

PlaybackSnapshot snapshot(std::string track, std::uint64_t position, bool playing) {
    return PlaybackSnapshot{std::move(track), position, playing, 0};
}

} // namespace

class SessionManagerTest : public ::testing::Test {
protected:
    explicit SessionManagerTest(std::size_t max_sessions = 0)
        : scheduler(clock),
          manager(test_config(max_sessions), tandem::SyncThresholds{}, clock, scheduler, notifier, bus) {
        bus.subscribe<tandem::events::CorrectionIssuedEvent>([this](const tandem::events::CorrectionIssuedEvent& e) {
            triggers.push_back(e.trigger);
        });
        bus.subscribe<tandem::events::SessionEndedEvent>([this](const tandem::events::SessionEndedEvent& e) {
            ended.push_back(e.reason);
        });
    }

    SessionId create() {
        auto created = manager.create_session("host");
        EXPECT_TRUE(created.is_ok());
        const auto id = created.value().session_id;
        EXPECT_TRUE(manager.attach_host(id, "host", "ws-host").is_ok());
        return id;
    }

    // Session with a connected host that is playing track A from 45s, and a connected client
    SessionId create_playing() {
        const auto id = create();
        EXPECT_TRUE(manager.report_host_state(id, "ws-host", stamped(snapshot("A", 45000, true))).is_ok());
        EXPECT_TRUE(manager.join_session(id, "guest", "ws-guest").is_ok());
        return id;
    }

    PlaybackSnapshot stamped(PlaybackSnapshot s) {
        s.reported_at_ms = clock.now_ms();
        return s;
    }

    ManualClock clock{kStart};
    ManualScheduler scheduler;
    RecordingNotifier notifier;
    EventBus bus;
    SessionManager manager;

    std::vector<std::string> triggers;
    std::vector<EndReason> ended;
};

TEST_F(SessionManagerTest, CreateStartsIdleSession) {
    auto created = manager.create_session("host");
    ASSERT_TRUE(created.is_ok());
    EXPECT_EQ(created.value().role, PeerRole::Host);
    EXPECT_EQ(created.value().session_id.size(), 6u);
    EXPECT_EQ(created.value().expires_at_ms, kStart + kLifetime);

    auto state = manager.get_state(created.value().session_id);
    ASSERT_TRUE(state.is_ok());
    EXPECT_EQ(state.value().state, SessionState::Idle);
    EXPECT_EQ(state.value().host_user_id, "host");
    EXPECT_FALSE(state.value().host_connected);
    EXPECT_EQ(manager.session_count(), 1u);
}

TEST_F(SessionManagerTest, CreateRequiresHost) {
    auto created = manager.create_session("");
    ASSERT_TRUE(created.is_error());
    EXPECT_EQ(created.error().code, ErrorCode::InvalidArgument);
}

TEST_F(SessionManagerTest, JoinForcesFullSyncToProjectedHost) {
    const auto id = create();
    ASSERT_TRUE(manager.report_host_state(id, "ws-host", stamped(snapshot("A", 45000, true))).is_ok());
    clock.advance(2000);

    auto joined = manager.join_session(id, "guest", "ws-guest");
    ASSERT_TRUE(joined.is_ok());
    EXPECT_EQ(joined.value().role, PeerRole::Client);
    EXPECT_EQ(joined.value().host_name, "host");
    EXPECT_FALSE(joined.value().rejoined);

    auto commands = notifier.commands_to("guest");
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].action, CorrectionAction::SwitchTrack);
    EXPECT_EQ(commands[0].track_id, "A");
    EXPECT_EQ(commands[0].position_ms, 47000u);
    EXPECT_EQ(triggers, std::vector<std::string>{"join"});

    auto state = manager.get_state(id);
    ASSERT_TRUE(state.is_ok());
    EXPECT_EQ(state.value().state, SessionState::Active);
    EXPECT_EQ(state.value().last_sync_at_ms, kStart + 2000);
}

TEST_F(SessionManagerTest, JoinToPausedHostKeepsClientPaused) {
    const auto id = create();
    ASSERT_TRUE(manager.report_host_state(id, "ws-host", stamped(snapshot("A", 45000, false))).is_ok());
    clock.advance(2000);

    ASSERT_TRUE(manager.join_session(id, "guest", "ws-guest").is_ok());

    auto commands = notifier.commands_to("guest");
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].action, CorrectionAction::SwitchTrack);
    EXPECT_EQ(commands[0].position_ms, 45000u);
    EXPECT_FALSE(commands[0].is_playing);
}

TEST_F(SessionManagerTest, JoinBeforeHostReportsSendsNothing) {
    const auto id = create();
    ASSERT_TRUE(manager.join_session(id, "guest", "ws-guest").is_ok());
    EXPECT_TRUE(notifier.commands_to("guest").empty());
}

TEST_F(SessionManagerTest, ControlJoinWithoutConnectionDefersSync) {
    const auto id = create();
    ASSERT_TRUE(manager.report_host_state(id, "ws-host", stamped(snapshot("A", 0, true))).is_ok());

    ASSERT_TRUE(manager.join_session(id, "guest").is_ok());
    EXPECT_TRUE(notifier.commands_to("guest").empty());

    // The transport join that follows binds the connection and syncs
    auto bound = manager.join_session(id, "guest", "ws-guest");
    ASSERT_TRUE(bound.is_ok());
    EXPECT_TRUE(bound.value().rejoined);
    EXPECT_EQ(notifier.commands_to("guest").size(), 1u);
}

TEST_F(SessionManagerTest, SecondClientIsRejected) {
    const auto id = create_playing();
    auto other = manager.join_session(id, "intruder", "ws-3");
    ASSERT_TRUE(other.is_error());
    EXPECT_EQ(other.error().code, ErrorCode::SessionFull);
}

TEST_F(SessionManagerTest, HostCannotJoinAsClient) {
    const auto id = create();
    auto joined = manager.join_session(id, "host", "ws-other");
    ASSERT_TRUE(joined.is_error());
    EXPECT_EQ(joined.error().code, ErrorCode::Forbidden);
}

TEST_F(SessionManagerTest, UnknownSessionIsNotFound) {
    auto joined = manager.join_session("ZZZZZZ", "guest", "ws-guest");
    ASSERT_TRUE(joined.is_error());
    EXPECT_EQ(joined.error().code, ErrorCode::SessionNotFound);
    EXPECT_EQ(manager.get_state("ZZZZZZ").error().code, ErrorCode::SessionNotFound);
}

TEST_F(SessionManagerTest, PeriodicSyncSeeksStaleClient) {
    const auto id = create_playing();
    notifier.clear();
    triggers.clear();

    clock.advance(5000);
    ASSERT_TRUE(manager.report_client_state(id, "ws-guest", stamped(snapshot("A", 45200, true))).is_ok());
    EXPECT_TRUE(notifier.commands_to("guest").empty());

    scheduler.advance(kInterval - 5000);

    auto commands = notifier.commands_to("guest");
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].action, CorrectionAction::Seek);
    EXPECT_EQ(commands[0].urgency, Urgency::Immediate);
    EXPECT_EQ(commands[0].position_ms, 55000u);
    EXPECT_EQ(commands[0].drift_ms, -9800);
    EXPECT_EQ(triggers, std::vector<std::string>{"periodic"});

    auto host_status = notifier.sent_to<SyncStatusNotice>("host");
    ASSERT_EQ(host_status.size(), 1u);
    EXPECT_EQ(host_status[0].report.quality, SyncQuality::Poor);
    EXPECT_EQ(host_status[0].last_sync_at_ms, kStart + kInterval);
    EXPECT_EQ(notifier.sent_to<SyncStatusNotice>("guest").size(), 1u);
}

TEST_F(SessionManagerTest, PeriodicSyncSkipsDisconnectedClient) {
    const auto id = create_playing();
    ASSERT_TRUE(manager.report_client_state(id, "ws-guest", stamped(snapshot("A", 0, true))).is_ok());
    manager.peer_disconnected(id, "ws-guest");
    notifier.clear();

    scheduler.advance(kInterval * 3);
    EXPECT_TRUE(notifier.commands_to("guest").empty());
    EXPECT_EQ(notifier.failures(), 0u);
}

TEST_F(SessionManagerTest, HostTrackChangeSyncsImmediately) {
    const auto id = create_playing();
    ASSERT_TRUE(manager.report_client_state(id, "ws-guest", stamped(snapshot("A", 45000, true))).is_ok());
    notifier.clear();
    triggers.clear();

    clock.advance(1000);
    ASSERT_TRUE(manager.report_host_state(id, "ws-host", stamped(snapshot("B", 0, true))).is_ok());

    auto commands = notifier.commands_to("guest");
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].action, CorrectionAction::SwitchTrack);
    EXPECT_EQ(commands[0].track_id, "B");
    EXPECT_EQ(commands[0].position_ms, 0u);
    EXPECT_EQ(triggers, std::vector<std::string>{"track_change"});
}

TEST_F(SessionManagerTest, HostPauseSyncsImmediately) {
    const auto id = create_playing();
    ASSERT_TRUE(manager.report_client_state(id, "ws-guest", stamped(snapshot("A", 45000, true))).is_ok());
    notifier.clear();
    triggers.clear();

    ASSERT_TRUE(manager.report_host_state(id, "ws-host", stamped(snapshot("A", 45000, false))).is_ok());

    auto commands = notifier.commands_to("guest");
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].action, CorrectionAction::Pause);
    EXPECT_EQ(triggers, std::vector<std::string>{"play_state_change"});
}

TEST_F(SessionManagerTest, HostPositionReportWaitsForNextEvaluation) {
    const auto id = create_playing();
    ASSERT_TRUE(manager.report_client_state(id, "ws-guest", stamped(snapshot("A", 45000, true))).is_ok());
    notifier.clear();

    ASSERT_TRUE(manager.report_host_state(id, "ws-host", stamped(snapshot("A", 80000, true))).is_ok());
    EXPECT_TRUE(notifier.commands_to("guest").empty());

    auto correction = manager.request_immediate_sync(id, "guest");
    ASSERT_TRUE(correction.is_ok());
    ASSERT_TRUE(correction.value().has_value());
    EXPECT_EQ(correction.value()->position_ms, 80000u);
}

TEST_F(SessionManagerTest, ReportsRequireMatchingRole) {
    const auto id = create_playing();

    auto as_host = manager.report_host_state(id, "ws-guest", stamped(snapshot("A", 0, true)));
    ASSERT_TRUE(as_host.is_error());
    EXPECT_EQ(as_host.error().code, ErrorCode::Forbidden);

    auto as_client = manager.report_client_state(id, "ws-host", stamped(snapshot("A", 0, true)));
    ASSERT_TRUE(as_client.is_error());
    EXPECT_EQ(as_client.error().code, ErrorCode::Forbidden);

    auto stranger = manager.report_client_state(id, "ws-unknown", stamped(snapshot("A", 0, true)));
    EXPECT_TRUE(stranger.is_error());
}

TEST_F(SessionManagerTest, OffsetIsClampedAndApplied) {
    const auto id = create_playing();
    ASSERT_TRUE(manager.report_client_state(id, "ws-guest", stamped(snapshot("A", 45000, true))).is_ok());
    notifier.clear();
    triggers.clear();

    std::vector<tandem::events::OffsetChangedEvent> offsets;
    bus.subscribe<tandem::events::OffsetChangedEvent>([&](const tandem::events::OffsetChangedEvent& e) {
        offsets.push_back(e);
    });

    auto applied = manager.update_offset(id, "guest", 9000);
    ASSERT_TRUE(applied.is_ok());
    EXPECT_EQ(applied.value(), 5000);

    auto commands = notifier.commands_to("guest");
    ASSERT_EQ(commands.size(), 1u);
    EXPECT_EQ(commands[0].position_ms, 50000u);
    EXPECT_EQ(triggers, std::vector<std::string>{"offset"});

    ASSERT_EQ(offsets.size(), 1u);
    EXPECT_EQ(offsets[0].requested_ms, 9000);
    EXPECT_EQ(offsets[0].applied_ms, 5000);

    EXPECT_EQ(manager.get_state(id).value().client_offset_ms, 5000);
}

TEST_F(SessionManagerTest, RepeatedOffsetIsIdempotent) {
    const auto id = create_playing();
    ASSERT_TRUE(manager.report_client_state(id, "ws-guest", stamped(snapshot("A", 45000, true))).is_ok());
    notifier.clear();

    auto first = manager.update_offset(id, "guest", 2000);
    ASSERT_TRUE(first.is_ok());
    auto second = manager.update_offset(id, "guest", 2000);
    ASSERT_TRUE(second.is_ok());

    EXPECT_EQ(first.value(), 2000);
    EXPECT_EQ(second.value(), 2000);
    EXPECT_EQ(manager.get_state(id).value().client_offset_ms, 2000);

    auto commands = notifier.commands_to("guest");
    ASSERT_EQ(commands.size(), 2u);
    EXPECT_EQ(commands[0].action, commands[1].action);
    EXPECT_EQ(commands[0].urgency, commands[1].urgency);
    EXPECT_EQ(commands[0].position_ms, 47000u);
    EXPECT_EQ(commands[1].position_ms, 47000u);
    EXPECT_EQ(commands[0].drift_ms, commands[1].drift_ms);
    EXPECT_EQ(commands[0].emitted_at_ms, commands[1].emitted_at_ms);
}

TEST_F(SessionManagerTest, OnlyClientMayChangeOffset) {
    const auto id = create_playing();
    auto by_host = manager.update_offset(id, "host", 100);
    ASSERT_TRUE(by_host.is_error());
    EXPECT_EQ(by_host.error().code, ErrorCode::Forbidden);
}

TEST_F(SessionManagerTest, ImmediateSyncInSyncReturnsNothing) {
    const auto id = create_playing();
    ASSERT_TRUE(manager.report_client_state(id, "ws-guest", stamped(snapshot("A", 45050, true))).is_ok());
    notifier.clear();

    auto correction = manager.request_immediate_sync(id, "guest");
    ASSERT_TRUE(correction.is_ok());
    EXPECT_FALSE(correction.value().has_value());

    auto status = notifier.sent_to<SyncStatusNotice>("guest");
    ASSERT_EQ(status.size(), 1u);
    EXPECT_EQ(status[0].report.quality, SyncQuality::Excellent);

    auto by_host = manager.request_immediate_sync(id, "host");
    ASSERT_TRUE(by_host.is_error());
    EXPECT_EQ(by_host.error().code, ErrorCode::Forbidden);
}

TEST_F(SessionManagerTest, HostGraceExpiryEndsSession) {
    const auto id = create_playing();
    notifier.clear();

    manager.peer_disconnected(id, "ws-host");
    EXPECT_FALSE(manager.get_state(id).value().host_connected);

    scheduler.advance(kGrace - 1);
    EXPECT_TRUE(manager.get_state(id).is_ok());

    scheduler.advance(1);
    EXPECT_EQ(ended, std::vector<EndReason>{EndReason::HostDisconnected});

    auto notices = notifier.sent_to<SessionEndedNotice>("guest");
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].reason, EndReason::HostDisconnected);

    EXPECT_EQ(manager.get_state(id).error().code, ErrorCode::SessionNotFound);
    EXPECT_EQ(manager.join_session(id, "guest", "ws-guest").error().code, ErrorCode::SessionEnded);
    EXPECT_EQ(manager.session_count(), 0u);
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(SessionManagerTest, HostReturningWithinGraceKeepsSession) {
    const auto id = create_playing();
    manager.peer_disconnected(id, "ws-host");
    scheduler.advance(kGrace / 2);

    auto reattached = manager.attach_host(id, "host", "ws-host-2");
    ASSERT_TRUE(reattached.is_ok());
    EXPECT_TRUE(reattached.value().rejoined);
    EXPECT_EQ(reattached.value().role, PeerRole::Host);

    scheduler.advance(kGrace);
    EXPECT_TRUE(ended.empty());
    ASSERT_TRUE(manager.get_state(id).is_ok());
    EXPECT_TRUE(manager.get_state(id).value().host_connected);
    EXPECT_TRUE(manager.report_host_state(id, "ws-host-2", stamped(snapshot("A", 1, true))).is_ok());
}

TEST_F(SessionManagerTest, GraceNeverOutlivesSession) {
    const auto id = create_playing();
    scheduler.advance(kLifetime - 1000);
    manager.peer_disconnected(id, "ws-host");

    scheduler.advance(1000);
    EXPECT_EQ(ended.size(), 1u);
    EXPECT_EQ(manager.get_state(id).error().code, ErrorCode::SessionNotFound);
}

TEST_F(SessionManagerTest, ClientDisconnectKeepsSessionAndClearsState) {
    const auto id = create_playing();
    ASSERT_TRUE(manager.report_client_state(id, "ws-guest", stamped(snapshot("A", 45000, true))).is_ok());

    manager.peer_disconnected(id, "ws-guest");

    auto state = manager.get_state(id);
    ASSERT_TRUE(state.is_ok());
    EXPECT_EQ(state.value().state, SessionState::Active);
    EXPECT_EQ(state.value().client_user_id, "guest");
    EXPECT_FALSE(state.value().client_connected);
    EXPECT_FALSE(state.value().client_snapshot.has_value());

    notifier.clear();
    auto rejoined = manager.join_session(id, "guest", "ws-guest-2");
    ASSERT_TRUE(rejoined.is_ok());
    EXPECT_TRUE(rejoined.value().rejoined);
    EXPECT_EQ(notifier.commands_to("guest").size(), 1u);
}

TEST_F(SessionManagerTest, ExpiryNotifiesBothPeers) {
    const auto id = create_playing();
    notifier.clear();

    scheduler.advance(kLifetime);

    EXPECT_EQ(ended, std::vector<EndReason>{EndReason::SessionExpired});
    ASSERT_EQ(notifier.sent_to<SessionEndedNotice>("guest").size(), 1u);
    ASSERT_EQ(notifier.sent_to<SessionEndedNotice>("host").size(), 1u);
    EXPECT_EQ(notifier.sent_to<SessionEndedNotice>("host")[0].reason, EndReason::SessionExpired);
    EXPECT_EQ(scheduler.pending(), 0u);
}

TEST_F(SessionManagerTest, ExpiryIsAlsoDetectedOnAccess) {
    const auto id = create_playing();
    clock.advance(kLifetime);

    EXPECT_EQ(manager.get_state(id).error().code, ErrorCode::SessionNotFound);
    EXPECT_EQ(ended, std::vector<EndReason>{EndReason::SessionExpired});
    EXPECT_EQ(manager.request_immediate_sync(id, "guest").error().code, ErrorCode::SessionEnded);
}

TEST_F(SessionManagerTest, JoinAfterExpiryIsNotFound) {
    const auto id = create();
    clock.advance(kLifetime);

    auto joined = manager.join_session(id, "guest", "ws-guest");
    ASSERT_TRUE(joined.is_error());
    EXPECT_EQ(joined.error().code, ErrorCode::SessionNotFound);
    EXPECT_EQ(ended, std::vector<EndReason>{EndReason::SessionExpired});

    // Once collected the answer stays the same
    EXPECT_EQ(manager.join_session(id, "guest", "ws-guest").error().code, ErrorCode::SessionNotFound);
}

TEST_F(SessionManagerTest, HostEndsSession) {
    const auto id = create_playing();
    notifier.clear();

    auto by_client = manager.end_session(id, "guest");
    ASSERT_TRUE(by_client.is_error());
    EXPECT_EQ(by_client.error().code, ErrorCode::Forbidden);

    ASSERT_TRUE(manager.end_session(id, "host").is_ok());
    EXPECT_EQ(ended, std::vector<EndReason>{EndReason::HostEnded});

    auto notices = notifier.sent_to<SessionEndedNotice>("guest");
    ASSERT_EQ(notices.size(), 1u);
    EXPECT_EQ(notices[0].reason, EndReason::HostEnded);
    EXPECT_TRUE(notifier.sent_to<SessionEndedNotice>("host").empty());

    EXPECT_EQ(manager.end_session(id, "host").error().code, ErrorCode::SessionNotFound);
    EXPECT_EQ(scheduler.pending(), 0u);

    // Ended sessions ignore late reports and disconnects
    EXPECT_EQ(manager.report_host_state(id, "ws-host", stamped(snapshot("A", 0, true))).error().code,
              ErrorCode::SessionEnded);
    manager.peer_disconnected(id, "ws-host");
    EXPECT_EQ(ended.size(), 1u);
}

TEST_F(SessionManagerTest, UnreachablePeerDoesNotFailOperation) {
    const auto id = create();
    ASSERT_TRUE(manager.report_host_state(id, "ws-host", stamped(snapshot("A", 0, true))).is_ok());

    std::vector<std::string> dropped;
    bus.subscribe<tandem::events::DeliveryDroppedEvent>([&](const tandem::events::DeliveryDroppedEvent& e) {
        dropped.push_back(e.message_type);
    });

    notifier.make_unreachable("ws-guest");
    ASSERT_TRUE(manager.join_session(id, "guest", "ws-guest").is_ok());
    EXPECT_EQ(dropped, std::vector<std::string>{"sync_command"});
}

TEST_F(SessionManagerTest, ShutdownDropsEverything) {
    create_playing();
    create();
    ASSERT_EQ(manager.session_count(), 2u);

    notifier.clear();
    manager.shutdown();
    EXPECT_EQ(manager.session_count(), 0u);
    EXPECT_EQ(scheduler.pending(), 0u);
    EXPECT_TRUE(notifier.sent_to<SessionEndedNotice>("guest").empty());
}

TEST_F(SessionManagerTest, ConcurrentReportsAcrossSessions) {
    std::vector<SessionId> ids;
    for (int i = 0; i < 4; ++i) {
        ids.push_back(create_playing());
    }
    // The recording subscribers are not thread-safe
    bus.clear();

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (const auto& id : ids) {
        workers.emplace_back([&, id] {
            for (std::uint64_t n = 0; n < 200; ++n) {
                auto snap = snapshot("A", 45000 + n * 700, true);
                snap.reported_at_ms = clock.now_ms();
                if (manager.report_client_state(id, "ws-guest", snap).is_error()) {
                    failures++;
                }
                if (manager.request_immediate_sync(id, "guest").is_error()) {
                    failures++;
                }
                if (manager.get_state(id).is_error()) {
                    failures++;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(manager.session_count(), 4u);
}

class LimitedSessionManagerTest : public SessionManagerTest {
protected:
    LimitedSessionManagerTest() : SessionManagerTest(2) {}
};

TEST_F(LimitedSessionManagerTest, CapacityIsEnforced) {
    const auto first = create();
    create();

    auto third = manager.create_session("host-3");
    ASSERT_TRUE(third.is_error());
    EXPECT_EQ(third.error().code, ErrorCode::CapacityExceeded);

    ASSERT_TRUE(manager.end_session(first, "host").is_ok());
    EXPECT_TRUE(manager.create_session("host-3").is_ok());
}

TEST(SessionManagerTombstoneTest, EndingASessionPurgesOldTombstones) {
    ManualClock clock{kStart};
    ManualScheduler scheduler(clock);
    RecordingNotifier notifier;
    EventBus bus;
    auto repository = std::make_unique<InMemorySessionRepository>();
    auto* table = repository.get();
    SessionManager manager(test_config(), tandem::SyncThresholds{}, clock, scheduler, notifier, bus,
                           std::move(repository));

    const auto first = manager.create_session("host").value().session_id;
    const auto second = manager.create_session("host-2").value().session_id;

    ASSERT_TRUE(manager.end_session(first, "host").is_ok());
    EXPECT_TRUE(table->contains(first));

    clock.advance(60'000);
    ASSERT_TRUE(manager.end_session(second, "host-2").is_ok());

    EXPECT_FALSE(table->contains(first));
    EXPECT_TRUE(table->contains(second));
}
