#pragma once

#include "tandem/core/clock.hpp"
#include "tandem/gateway/gateway.hpp"
#include "tandem/playback/media_player.hpp"
#include "tandem/sync/peer_notifier.hpp"
#include "tandem/sync/scheduler.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace tandem::testing {

/**
 * @brief Scheduler driven by a ManualClock
 *
 * Nothing runs until advance(); tasks then fire in deadline order with the
 * clock set to each deadline, so a test sees exactly what a real timer
 * would have produced.
 */
class ManualScheduler : public sync::Scheduler {
public:
    explicit ManualScheduler(ManualClock& clock) : clock_(clock) {}

    sync::TaskId schedule_after(std::chrono::milliseconds delay, sync::Task task) override {
        return add(delay, std::chrono::milliseconds{0}, std::move(task));
    }

    sync::TaskId schedule_every(std::chrono::milliseconds interval, sync::Task task) override {
        return add(interval, interval, std::move(task));
    }

    void cancel(sync::TaskId id) override {
        tasks_.erase(id);
    }

    void advance(std::uint64_t ms) {
        const std::uint64_t target = clock_.now_ms() + ms;
        while (true) {
            auto next = std::min_element(tasks_.begin(), tasks_.end(), [](const auto& a, const auto& b) {
                return a.second.due_ms < b.second.due_ms ||
                       (a.second.due_ms == b.second.due_ms && a.first < b.first);
            });
            if (next == tasks_.end() || next->second.due_ms > target) {
                break;
            }

            auto entry = next->second;
            clock_.set(entry.due_ms);
            if (entry.interval_ms > 0) {
                next->second.due_ms += entry.interval_ms;
            } else {
                tasks_.erase(next);
            }
            entry.task();
            ++fired_;
        }
        clock_.set(target);
    }

    std::size_t pending() const { return tasks_.size(); }
    std::size_t fired() const { return fired_; }

private:
    struct Entry {
        std::uint64_t due_ms = 0;
        std::uint64_t interval_ms = 0;
        sync::Task task;
    };

    sync::TaskId add(std::chrono::milliseconds delay, std::chrono::milliseconds interval, sync::Task task) {
        const auto id = next_id_++;
        tasks_[id] = Entry{clock_.now_ms() + static_cast<std::uint64_t>(delay.count()),
                           static_cast<std::uint64_t>(interval.count()), std::move(task)};
        return id;
    }

    ManualClock& clock_;
    std::map<sync::TaskId, Entry> tasks_;
    sync::TaskId next_id_ = 1;
    std::size_t fired_ = 0;
};

/**
 * @brief PeerNotifier that remembers everything it was asked to deliver
 *
 * Peers without a connection fail with PeerUnavailable, as the real
 * gateway does.
 */
class RecordingNotifier : public sync::PeerNotifier {
public:
    struct Delivery {
        sync::PeerRef peer;
        sync::OutboundMessage message;
    };

    Result<void> deliver(const sync::PeerRef& peer, const sync::OutboundMessage& message) override {
        std::lock_guard lock(mutex_);
        if (!peer.connected() || unreachable_.count(peer.connection_id) > 0) {
            ++failures_;
            return Err<void>(ErrorCode::PeerUnavailable, peer.user_id + " unreachable");
        }
        deliveries_.push_back({peer, message});
        return Ok();
    }

    void make_unreachable(const sync::ConnectionId& connection) {
        std::lock_guard lock(mutex_);
        unreachable_.insert(connection);
    }

    template<typename T>
    std::vector<T> sent_to(const sync::UserId& user_id) const {
        std::lock_guard lock(mutex_);
        std::vector<T> out;
        for (const auto& delivery : deliveries_) {
            if (delivery.peer.user_id == user_id) {
                if (const auto* typed = std::get_if<T>(&delivery.message)) {
                    out.push_back(*typed);
                }
            }
        }
        return out;
    }

    std::vector<sync::Correction> commands_to(const sync::UserId& user_id) const {
        std::vector<sync::Correction> out;
        for (const auto& command : sent_to<sync::SyncCommand>(user_id)) {
            out.push_back(command.correction);
        }
        return out;
    }

    std::size_t failures() const {
        std::lock_guard lock(mutex_);
        return failures_;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        deliveries_.clear();
        failures_ = 0;
    }

private:
    mutable std::mutex mutex_;
    std::vector<Delivery> deliveries_;
    std::set<sync::ConnectionId> unreachable_;
    std::size_t failures_ = 0;
};

/**
 * @brief MessageSink that records frames per connection
 */
class RecordingSink : public gateway::MessageSink {
public:
    bool send(const sync::ConnectionId& connection, const std::string& frame) override {
        std::lock_guard lock(mutex_);
        if (closed_.count(connection) > 0) {
            return false;
        }
        frames_[connection].push_back(frame);
        return true;
    }

    void close(const sync::ConnectionId& connection) {
        std::lock_guard lock(mutex_);
        closed_.insert(connection);
    }

    std::vector<std::string> frames(const sync::ConnectionId& connection) const {
        std::lock_guard lock(mutex_);
        auto it = frames_.find(connection);
        return it == frames_.end() ? std::vector<std::string>{} : it->second;
    }

    void clear() {
        std::lock_guard lock(mutex_);
        frames_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::map<sync::ConnectionId, std::vector<std::string>> frames_;
    std::set<sync::ConnectionId> closed_;
};

/**
 * @brief Scripted media player; records every call as "play:A", "seek:1000", "pause"
 */
class FakeMediaPlayer : public playback::MediaPlayer {
public:
    Result<void> authenticate() override {
        calls.push_back("authenticate");
        if (!authorized) {
            return Err<void>(ErrorCode::Forbidden, "not authorized");
        }
        return Ok();
    }

    Result<std::optional<sync::PlaybackSnapshot>> current_playback() override {
        calls.push_back("current_playback");
        if (fail_next) {
            fail_next = false;
            return Err<std::optional<sync::PlaybackSnapshot>>(ErrorCode::PeerUnavailable, "player offline");
        }
        return Ok(state);
    }

    Result<void> play(const std::optional<std::string>& track_id) override {
        calls.push_back(track_id ? "play:" + *track_id : "play");
        if (fail_next) {
            fail_next = false;
            return Err<void>(ErrorCode::PeerUnavailable, "player offline");
        }
        if (!state) {
            state = sync::PlaybackSnapshot{};
        }
        if (track_id) {
            state->track_id = *track_id;
        }
        state->is_playing = true;
        return Ok();
    }

    Result<void> pause() override {
        calls.push_back("pause");
        if (state) {
            state->is_playing = false;
        }
        return Ok();
    }

    Result<void> seek(std::uint64_t position_ms) override {
        calls.push_back("seek:" + std::to_string(position_ms));
        if (state) {
            state->position_ms = position_ms;
        }
        return Ok();
    }

    std::optional<sync::PlaybackSnapshot> state;
    std::vector<std::string> calls;
    bool authorized = true;
    bool fail_next = false;
};

} // namespace tandem::testing
