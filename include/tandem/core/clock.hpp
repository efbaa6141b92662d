#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace tandem {

/**
 * @brief Monotonic millisecond time source shared by all drift arithmetic
 *
 * Every timestamp the coordinator compares (snapshot capture, expiry,
 * last sync) comes from one Clock instance so that differences are
 * meaningful regardless of the peers' own wall clocks.
 */
class Clock {
public:
    virtual ~Clock() = default;

    virtual std::uint64_t now_ms() const = 0;
};

/**
 * @brief steady_clock based implementation, zeroed at construction
 */
class SteadyClock : public Clock {
public:
    SteadyClock() : origin_(std::chrono::steady_clock::now()) {}

    std::uint64_t now_ms() const override {
        const auto elapsed = std::chrono::steady_clock::now() - origin_;
        return static_cast<std::uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
    }

private:
    std::chrono::steady_clock::time_point origin_;
};

/**
 * @brief Manually driven clock for deterministic tests and simulations
 */
class ManualClock : public Clock {
public:
    explicit ManualClock(std::uint64_t start_ms = 0) : now_(start_ms) {}

    std::uint64_t now_ms() const override { return now_.load(); }

    void set(std::uint64_t ms) { now_.store(ms); }
    void advance(std::uint64_t ms) { now_.fetch_add(ms); }

private:
    std::atomic<std::uint64_t> now_;
};

} // namespace tandem
