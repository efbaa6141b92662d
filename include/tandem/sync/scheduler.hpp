#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace tandem::sync {

using TaskId = std::uint64_t;
using Task = std::function<void()>;

/**
 * @brief Owner of the coordinator's timers (periodic sync, grace, expiry)
 *
 * Tasks run on the scheduler's own thread(s), never inside schedule_*().
 * cancel() on an unknown or already-finished id is a no-op; a task that
 * is already running when cancelled finishes, and the callee is expected
 * to re-check its own state.
 */
class Scheduler {
public:
    virtual ~Scheduler() = default;

    virtual TaskId schedule_after(std::chrono::milliseconds delay, Task task) = 0;
    virtual TaskId schedule_every(std::chrono::milliseconds interval, Task task) = 0;
    virtual void cancel(TaskId id) = 0;
};

} // namespace tandem::sync
