#pragma once

#include "tandem/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace tandem {

struct ServerConfig {
    std::string bind_address = "0.0.0.0";
    std::uint16_t http_port = 8080;
    std::uint16_t ws_port = 8081;
    std::size_t io_threads = 1;
};

struct SessionConfig {
    std::size_t code_length = 6;
    std::chrono::milliseconds lifetime{std::chrono::hours(4)};
    std::size_t max_sessions = 0;                       ///< 0 = unlimited
    std::chrono::milliseconds host_grace{std::chrono::seconds(30)};
    std::chrono::milliseconds sync_interval{std::chrono::minutes(2)};
    std::chrono::milliseconds ended_retention{std::chrono::minutes(10)};
};

/**
 * @brief Drift band boundaries and the manual offset range, in ms
 */
struct SyncThresholds {
    std::int64_t excellent_ms = 100;
    std::int64_t gradual_ms = 500;
    std::int64_t immediate_ms = 3000;
    std::int64_t offset_limit_ms = 5000;
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%H:%M:%S] [%^%l%$] %v";
};

struct Config {
    ServerConfig server;
    SessionConfig session;
    SyncThresholds sync;
    LoggingConfig logging;
    std::filesystem::path source;                        ///< File the config came from, if any
};

/**
 * @brief Load a JSON config file; keys that are absent keep their defaults
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Parse config from an in-memory JSON document
 */
Result<Config> parse_config(const std::string& text);

/**
 * @brief Apply command-line flags on top of an existing config
 *
 * Recognised: -c/--config FILE, -p/--port N, -w/--ws-port N,
 * -l/--log-level LEVEL. A --config flag reloads the base config from
 * FILE before the remaining flags are applied.
 */
Result<Config> apply_cli_overrides(Config config, int argc, const char* const argv[]);

Result<void> validate(const Config& config);

void configure_logging(const LoggingConfig& logging);

} // namespace tandem
