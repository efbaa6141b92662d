#pragma once

#include "tandem/sync/scheduler.hpp"

#include <boost/asio.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace tandem::sync {

/**
 * @brief Scheduler backed by boost::asio::steady_timer
 *
 * Each task owns one timer on the given io_context. All timer operations
 * run on one strand, so schedule/cancel may be called from any thread.
 * Periodic tasks re-arm relative to their previous deadline.
 */
class AsioScheduler : public Scheduler {
public:
    explicit AsioScheduler(boost::asio::io_context& io_context);
    ~AsioScheduler() override;

    AsioScheduler(const AsioScheduler&) = delete;
    AsioScheduler& operator=(const AsioScheduler&) = delete;

    TaskId schedule_after(std::chrono::milliseconds delay, Task task) override;
    TaskId schedule_every(std::chrono::milliseconds interval, Task task) override;
    void cancel(TaskId id) override;

    /// Cancel every outstanding task.
    void cancel_all();

    std::size_t pending() const;

private:
    struct Entry {
        explicit Entry(boost::asio::io_context& io) : timer(io) {}

        boost::asio::steady_timer timer;
        Task task;
        std::chrono::milliseconds interval{0};
        bool repeating = false;
    };

    TaskId add(std::chrono::milliseconds delay, std::chrono::milliseconds interval, bool repeating, Task task);
    void arm(TaskId id, const std::shared_ptr<Entry>& entry);

    boost::asio::io_context& io_context_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    std::atomic<TaskId> next_id_{1};

    mutable std::mutex mutex_;
    std::unordered_map<TaskId, std::shared_ptr<Entry>> entries_;
};

} // namespace tandem::sync
