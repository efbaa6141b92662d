#include "tandem/sync/session_repository.hpp"

namespace tandem::sync {

bool InMemorySessionRepository::insert(SessionSlotPtr slot) {
    std::unique_lock lock(mutex_);
    const auto id = slot->session.id();
    if (sessions_.count(id) > 0 || tombstones_.count(id) > 0) {
        return false;
    }
    sessions_.emplace(id, std::move(slot));
    return true;
}

SessionSlotPtr InMemorySessionRepository::find(const SessionId& id) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

SessionSlotPtr InMemorySessionRepository::erase(const SessionId& id) {
    std::unique_lock lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    auto slot = std::move(it->second);
    sessions_.erase(it);
    return slot;
}

bool InMemorySessionRepository::contains(const SessionId& id) const {
    std::shared_lock lock(mutex_);
    return sessions_.count(id) > 0 || tombstones_.count(id) > 0;
}

std::vector<SessionId> InMemorySessionRepository::ids() const {
    std::shared_lock lock(mutex_);
    std::vector<SessionId> result;
    result.reserve(sessions_.size());
    for (const auto& [id, slot] : sessions_) {
        result.push_back(id);
    }
    return result;
}

std::size_t InMemorySessionRepository::size() const {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

void InMemorySessionRepository::add_tombstone(const SessionId& id, EndReason reason, std::uint64_t until_ms) {
    std::unique_lock lock(mutex_);
    tombstones_[id] = Tombstone{reason, until_ms};
}

std::optional<EndReason> InMemorySessionRepository::tombstone(const SessionId& id, std::uint64_t now_ms) const {
    std::shared_lock lock(mutex_);
    auto it = tombstones_.find(id);
    if (it == tombstones_.end() || now_ms >= it->second.until_ms) {
        return std::nullopt;
    }
    return it->second.reason;
}

void InMemorySessionRepository::purge_tombstones(std::uint64_t now_ms) {
    std::unique_lock lock(mutex_);
    for (auto it = tombstones_.begin(); it != tombstones_.end();) {
        if (now_ms >= it->second.until_ms) {
            it = tombstones_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace tandem::sync
