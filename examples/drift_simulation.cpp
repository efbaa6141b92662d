// Offline run of the drift loop: a host player at nominal speed, a client
// player whose clock runs slightly fast, and the engine correcting the
// client every ten seconds of simulated time.

#include "tandem/core/clock.hpp"
#include "tandem/core/config.hpp"
#include "tandem/playback/correction_executor.hpp"
#include "tandem/playback/playback_reporter.hpp"
#include "tandem/sync/sync_engine.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <optional>
#include <string>

using tandem::ManualClock;
using tandem::Ok;
using tandem::Result;
using tandem::playback::CorrectionExecutor;
using tandem::playback::MediaPlayer;
using tandem::playback::PlaybackReporter;
using tandem::sync::PlaybackSnapshot;
using tandem::sync::SyncEngine;

namespace {

class SimulatedPlayer : public MediaPlayer {
public:
    SimulatedPlayer(const ManualClock& clock, double rate) : clock_(clock), rate_(rate) {}

    Result<void> authenticate() override { return Ok(); }

    Result<std::optional<PlaybackSnapshot>> current_playback() override {
        if (track_.empty()) {
            return Ok(std::optional<PlaybackSnapshot>{});
        }
        return Ok(std::optional<PlaybackSnapshot>(PlaybackSnapshot{track_, position(), playing_, 0}));
    }

    Result<void> play(const std::optional<std::string>& track_id) override {
        anchor();
        if (track_id) {
            track_ = *track_id;
            base_position_ = 0;
        }
        playing_ = true;
        return Ok();
    }

    Result<void> pause() override {
        anchor();
        playing_ = false;
        return Ok();
    }

    Result<void> seek(std::uint64_t position_ms) override {
        anchor();
        base_position_ = position_ms;
        return Ok();
    }

private:
    std::uint64_t position() const {
        if (!playing_) {
            return base_position_;
        }
        const auto elapsed = static_cast<double>(clock_.now_ms() - base_time_);
        return base_position_ + static_cast<std::uint64_t>(elapsed * rate_);
    }

    void anchor() {
        base_position_ = position();
        base_time_ = clock_.now_ms();
    }

    const ManualClock& clock_;
    double rate_;
    std::string track_;
    std::uint64_t base_position_ = 0;
    std::uint64_t base_time_ = 0;
    bool playing_ = false;
};

} // namespace

int main(int argc, char* argv[]) {
    // Client clock skew in parts per thousand
    const double skew = argc > 1 ? std::atof(argv[1]) : 60.0;

    tandem::configure_logging(tandem::LoggingConfig{});

    ManualClock clock(0);
    SimulatedPlayer host_player(clock, 1.0);
    SimulatedPlayer client_player(clock, 1.0 + skew / 1000.0);

    PlaybackReporter host(host_player, clock);
    PlaybackReporter client(client_player, clock);
    CorrectionExecutor executor(client_player);
    SyncEngine engine;

    (void)host_player.play(std::string("track-1"));
    (void)client_player.play(std::string("track-0"));

    for (int tick = 0; tick <= 12; ++tick) {
        if (tick == 6) {
            (void)host_player.pause();
        }
        if (tick == 8) {
            (void)host_player.play(std::nullopt);
        }

        auto host_snapshot = host.capture();
        auto client_snapshot = client.capture();
        if (host_snapshot.is_error() || client_snapshot.is_error()) {
            spdlog::error("Capture failed");
            return 1;
        }

        const auto now = clock.now_ms();
        if (auto report = engine.assess(host_snapshot.value(), client_snapshot.value(), 0, now)) {
            spdlog::info("t={}s drift={}ms quality={}", now / 1000, report->drift_ms,
                         tandem::sync::to_string(report->quality));
        }

        if (auto correction = engine.evaluate(host_snapshot.value(), client_snapshot.value(), 0, now)) {
            spdlog::info("t={}s {} {} @ {}ms", now / 1000, tandem::sync::to_string(correction->action),
                         correction->track_id, correction->position_ms);
            auto applied = executor.apply(*correction);
            if (applied.is_error()) {
                spdlog::error("Correction failed: {}", applied.error().message);
                return 1;
            }
        }

        clock.advance(10'000);
    }

    return 0;
}
