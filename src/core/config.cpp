#include "tandem/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace tandem {
namespace {

using json = nlohmann::json;

template<typename T>
Result<void> read_key(const json& object, const char* key, T& out) {
    auto it = object.find(key);
    if (it == object.end()) {
        return Ok();
    }
    try {
        out = it->get<T>();
    } catch (const json::exception& e) {
        return Err<void>(ErrorCode::InvalidArgument,
                         std::string("Invalid value for '") + key + "': " + e.what());
    }
    return Ok();
}

Result<void> read_millis(const json& object, const char* key, std::chrono::milliseconds& out) {
    std::int64_t raw = out.count();
    auto result = read_key(object, key, raw);
    if (result.is_error()) {
        return result;
    }
    if (raw < 0) {
        return Err<void>(ErrorCode::InvalidArgument, std::string("Negative duration for '") + key + "'");
    }
    out = std::chrono::milliseconds(raw);
    return Ok();
}

// Collects the first failure of a sequence of reads
class Reader {
public:
    explicit Reader(const json& object) : object_(object) {}

    template<typename T>
    Reader& key(const char* name, T& out) {
        if (ok()) {
            auto result = read_key(object_, name, out);
            if (result.is_error()) {
                error_ = result.error();
            }
        }
        return *this;
    }

    Reader& millis(const char* name, std::chrono::milliseconds& out) {
        if (ok()) {
            auto result = read_millis(object_, name, out);
            if (result.is_error()) {
                error_ = result.error();
            }
        }
        return *this;
    }

    bool ok() const { return !error_.has_value(); }
    const Error& error() const { return *error_; }

private:
    const json& object_;
    std::optional<Error> error_;
};

const json& section(const json& root, const char* name) {
    static const json empty = json::object();
    auto it = root.find(name);
    if (it == root.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

Result<std::uint16_t> parse_port(const std::string& text) {
    try {
        const int value = std::stoi(text);
        if (value <= 0 || value > 65535) {
            return Err<std::uint16_t>(ErrorCode::InvalidArgument, "Port out of range: " + text);
        }
        return Ok(static_cast<std::uint16_t>(value));
    } catch (const std::exception&) {
        return Err<std::uint16_t>(ErrorCode::InvalidArgument, "Invalid port: " + text);
    }
}

} // namespace

Result<Config> parse_config(const std::string& text) {
    auto root = json::parse(text, nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return Err<Config>(ErrorCode::InvalidArgument, "Config is not a JSON object");
    }

    Config config;
    Reader server(section(root, "server"));
    server.key("bind_address", config.server.bind_address)
          .key("http_port", config.server.http_port)
          .key("ws_port", config.server.ws_port)
          .key("io_threads", config.server.io_threads);
    if (!server.ok()) {
        return Err<Config>(server.error());
    }

    Reader session(section(root, "session"));
    session.key("code_length", config.session.code_length)
           .millis("lifetime_ms", config.session.lifetime)
           .key("max_sessions", config.session.max_sessions)
           .millis("host_grace_ms", config.session.host_grace)
           .millis("sync_interval_ms", config.session.sync_interval)
           .millis("ended_retention_ms", config.session.ended_retention);
    if (!session.ok()) {
        return Err<Config>(session.error());
    }

    Reader sync(section(root, "sync"));
    sync.key("excellent_threshold_ms", config.sync.excellent_ms)
        .key("gradual_threshold_ms", config.sync.gradual_ms)
        .key("immediate_threshold_ms", config.sync.immediate_ms)
        .key("offset_limit_ms", config.sync.offset_limit_ms);
    if (!sync.ok()) {
        return Err<Config>(sync.error());
    }

    Reader logging(section(root, "logging"));
    logging.key("level", config.logging.level)
           .key("pattern", config.logging.pattern);
    if (!logging.ok()) {
        return Err<Config>(logging.error());
    }

    return Ok(config);
}

Result<Config> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<Config>(ErrorCode::InvalidArgument, "Cannot open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto parsed = parse_config(buffer.str());
    if (parsed.is_ok()) {
        parsed.value().source = path;
    }
    return parsed;
}

Result<Config> apply_cli_overrides(Config config, int argc, const char* const argv[]) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;

        if ((arg == "-c" || arg == "--config") && has_value) {
            auto loaded = load_config(argv[++i]);
            if (loaded.is_error()) {
                return loaded;
            }
            config = std::move(loaded.value());
        } else if ((arg == "-p" || arg == "--port") && has_value) {
            auto port = parse_port(argv[++i]);
            if (port.is_error()) {
                return Err<Config>(port.error());
            }
            config.server.http_port = port.value();
        } else if ((arg == "-w" || arg == "--ws-port") && has_value) {
            auto port = parse_port(argv[++i]);
            if (port.is_error()) {
                return Err<Config>(port.error());
            }
            config.server.ws_port = port.value();
        } else if ((arg == "-l" || arg == "--log-level") && has_value) {
            config.logging.level = argv[++i];
        } else {
            return Err<Config>(ErrorCode::InvalidArgument, "Unknown or incomplete argument: " + arg);
        }
    }
    return Ok(config);
}

Result<void> validate(const Config& config) {
    const auto& sync = config.sync;
    if (!(0 <= sync.excellent_ms && sync.excellent_ms <= sync.gradual_ms &&
          sync.gradual_ms < sync.immediate_ms)) {
        return Err<void>(ErrorCode::InvalidArgument,
                         "Drift thresholds must satisfy 0 <= excellent <= gradual < immediate");
    }
    if (sync.offset_limit_ms < 0) {
        return Err<void>(ErrorCode::InvalidArgument, "offset_limit_ms must not be negative");
    }
    if (config.session.code_length < 4 || config.session.code_length > 16) {
        return Err<void>(ErrorCode::InvalidArgument, "code_length must be within [4, 16]");
    }
    if (config.session.sync_interval.count() == 0 || config.session.lifetime.count() == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "sync_interval and lifetime must be positive");
    }
    if (config.server.io_threads == 0) {
        return Err<void>(ErrorCode::InvalidArgument, "io_threads must be at least 1");
    }
    if (spdlog::level::from_str(config.logging.level) == spdlog::level::off &&
        config.logging.level != "off") {
        return Err<void>(ErrorCode::InvalidArgument, "Unknown log level: " + config.logging.level);
    }
    return Ok();
}

void configure_logging(const LoggingConfig& logging) {
    spdlog::set_level(spdlog::level::from_str(logging.level));
    spdlog::set_pattern(logging.pattern);
}

} // namespace tandem
