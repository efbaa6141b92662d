#pragma once

#include "tandem/sync/scheduler.hpp"
#include "tandem/sync/session.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace tandem::sync {

/**
 * @brief A session plus the lock and timers that belong to it
 *
 * `mutex` is the session's critical section: every mutation and the
 * evaluation that follows it happen while it is held. It never guards
 * network I/O. `closed` mirrors the Ended state so that messages computed
 * before an end can be suppressed without retaking the lock.
 */
struct SessionSlot {
    SessionSlot(SessionId id, PeerRef host, std::uint64_t created_at_ms, std::uint64_t lifetime_ms)
        : session(std::move(id), std::move(host), created_at_ms, lifetime_ms) {}

    std::mutex mutex;
    std::atomic<bool> closed{false};
    Session session;
    std::optional<TaskId> periodic_task;
    std::optional<TaskId> grace_task;
    std::optional<TaskId> expiry_task;
};

using SessionSlotPtr = std::shared_ptr<SessionSlot>;

/**
 * @brief Logical read/write contract on the live session table
 */
class SessionRepository {
public:
    virtual ~SessionRepository() = default;

    /// @return false if the id is already present
    virtual bool insert(SessionSlotPtr slot) = 0;
    virtual SessionSlotPtr find(const SessionId& id) const = 0;
    virtual SessionSlotPtr erase(const SessionId& id) = 0;
    virtual bool contains(const SessionId& id) const = 0;
    virtual std::vector<SessionId> ids() const = 0;
    virtual std::size_t size() const = 0;

    /// Remember that `id` ended, until `until_ms`.
    virtual void add_tombstone(const SessionId& id, EndReason reason, std::uint64_t until_ms) = 0;
    virtual std::optional<EndReason> tombstone(const SessionId& id, std::uint64_t now_ms) const = 0;
    virtual void purge_tombstones(std::uint64_t now_ms) = 0;
};

/**
 * @brief In-process table; concurrent lookups, exclusive writes
 */
class InMemorySessionRepository : public SessionRepository {
public:
    bool insert(SessionSlotPtr slot) override;
    SessionSlotPtr find(const SessionId& id) const override;
    SessionSlotPtr erase(const SessionId& id) override;
    bool contains(const SessionId& id) const override;
    std::vector<SessionId> ids() const override;
    std::size_t size() const override;

    void add_tombstone(const SessionId& id, EndReason reason, std::uint64_t until_ms) override;
    std::optional<EndReason> tombstone(const SessionId& id, std::uint64_t now_ms) const override;
    void purge_tombstones(std::uint64_t now_ms) override;

private:
    struct Tombstone {
        EndReason reason;
        std::uint64_t until_ms;
    };

    mutable std::shared_mutex mutex_;
    std::unordered_map<SessionId, SessionSlotPtr> sessions_;
    std::unordered_map<SessionId, Tombstone> tombstones_;
};

} // namespace tandem::sync
