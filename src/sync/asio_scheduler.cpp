#include "tandem/sync/asio_scheduler.hpp"

#include <spdlog/spdlog.h>

namespace tandem::sync {

AsioScheduler::AsioScheduler(boost::asio::io_context& io_context)
    : io_context_(io_context),
      strand_(boost::asio::make_strand(io_context)) {}

AsioScheduler::~AsioScheduler() {
    cancel_all();
}

TaskId AsioScheduler::schedule_after(std::chrono::milliseconds delay, Task task) {
    return add(delay, std::chrono::milliseconds{0}, false, std::move(task));
}

TaskId AsioScheduler::schedule_every(std::chrono::milliseconds interval, Task task) {
    return add(interval, interval, true, std::move(task));
}

void AsioScheduler::cancel(TaskId id) {
    std::shared_ptr<Entry> entry;
    {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            return;
        }
        entry = it->second;
        entries_.erase(it);
    }
    boost::asio::post(strand_, [entry] { entry->timer.cancel(); });
}

void AsioScheduler::cancel_all() {
    std::unordered_map<TaskId, std::shared_ptr<Entry>> entries;
    {
        std::lock_guard lock(mutex_);
        entries.swap(entries_);
    }
    for (auto& [id, entry] : entries) {
        entry->timer.cancel();
    }
}

std::size_t AsioScheduler::pending() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

TaskId AsioScheduler::add(std::chrono::milliseconds delay,
                          std::chrono::milliseconds interval,
                          bool repeating,
                          Task task) {
    const TaskId id = next_id_++;
    auto entry = std::make_shared<Entry>(io_context_);
    entry->task = std::move(task);
    entry->interval = interval;
    entry->repeating = repeating;
    {
        std::lock_guard lock(mutex_);
        entries_.emplace(id, entry);
    }
    boost::asio::post(strand_, [this, id, entry, delay] {
        entry->timer.expires_after(delay);
        arm(id, entry);
    });
    return id;
}

void AsioScheduler::arm(TaskId id, const std::shared_ptr<Entry>& entry) {
    // The handler holds only a weak reference so cancel() can release the entry
    std::weak_ptr<Entry> weak = entry;
    entry->timer.async_wait(boost::asio::bind_executor(strand_, [this, id, weak](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        auto entry = weak.lock();
        if (!entry) {
            return;
        }
        if (ec) {
            spdlog::error("Scheduler timer {} failed: {}", id, ec.message());
            return;
        }

        {
            std::lock_guard lock(mutex_);
            if (entries_.find(id) == entries_.end()) {
                return;
            }
            if (!entry->repeating) {
                entries_.erase(id);
            }
        }

        try {
            entry->task();
        } catch (const std::exception& e) {
            spdlog::error("Scheduled task {} threw: {}", id, e.what());
        }

        if (entry->repeating) {
            std::lock_guard lock(mutex_);
            if (entries_.find(id) == entries_.end()) {
                return;
            }
            entry->timer.expires_at(entry->timer.expiry() + entry->interval);
            arm(id, entry);
        }
    }));
}

} // namespace tandem::sync
