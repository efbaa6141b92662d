#include "tandem/gateway/message_codec.hpp"

#include <limits>
#include <unordered_map>

namespace tandem::gateway {
namespace {

using json = nlohmann::json;

Error invalid(std::string message) {
    return Error{ErrorCode::InvalidMessage, std::move(message)};
}

// Field readers: std::nullopt when absent, Error when present but wrong

Result<std::optional<std::string>> optional_string(const json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return Ok(std::optional<std::string>());
    }
    if (!it->is_string() || it->get_ref<const std::string&>().empty()) {
        return Err<std::optional<std::string>>(invalid(std::string("'") + key + "' must be a non-empty string"));
    }
    return Ok(std::optional<std::string>(it->get<std::string>()));
}

Result<std::string> required_string(const json& data, const char* key) {
    auto value = optional_string(data, key);
    if (value.is_error()) {
        return Err<std::string>(value.error());
    }
    if (!value.value()) {
        return Err<std::string>(invalid(std::string("missing '") + key + "'"));
    }
    return Ok(*value.value());
}

Result<std::optional<std::uint64_t>> optional_unsigned(const json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return Ok(std::optional<std::uint64_t>());
    }
    if (!it->is_number_integer() || (!it->is_number_unsigned() && it->get<std::int64_t>() < 0)) {
        return Err<std::optional<std::uint64_t>>(invalid(std::string("'") + key + "' must be a non-negative integer"));
    }
    return Ok(std::optional<std::uint64_t>(it->get<std::uint64_t>()));
}

Result<std::uint64_t> required_unsigned(const json& data, const char* key) {
    auto value = optional_unsigned(data, key);
    if (value.is_error()) {
        return Err<std::uint64_t>(value.error());
    }
    if (!value.value()) {
        return Err<std::uint64_t>(invalid(std::string("missing '") + key + "'"));
    }
    return Ok(*value.value());
}

Result<std::int64_t> required_integer(const json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return Err<std::int64_t>(invalid(std::string("missing '") + key + "'"));
    }
    if (!it->is_number_integer()) {
        return Err<std::int64_t>(invalid(std::string("'") + key + "' must be an integer"));
    }
    return Ok(MessageCodec::saturated_integer(*it));
}

Result<bool> required_bool(const json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end()) {
        return Err<bool>(invalid(std::string("missing '") + key + "'"));
    }
    if (!it->is_boolean()) {
        return Err<bool>(invalid(std::string("'") + key + "' must be a boolean"));
    }
    return Ok(it->get<bool>());
}

Result<InboundMessage> decode_join(const json& data) {
    auto session_id = required_string(data, "sessionId");
    if (session_id.is_error()) {
        return Err<InboundMessage>(session_id.error());
    }
    auto role_text = required_string(data, "role");
    if (role_text.is_error()) {
        return Err<InboundMessage>(role_text.error());
    }
    auto role = sync::role_from_string(role_text.value());
    if (!role) {
        return Err<InboundMessage>(invalid("unknown role '" + role_text.value() + "'"));
    }
    auto user_id = required_string(data, "userId");
    if (user_id.is_error()) {
        return Err<InboundMessage>(user_id.error());
    }
    return Ok(InboundMessage(JoinSessionMessage{session_id.value(), *role, user_id.value()}));
}

Result<PlaybackReport> decode_report(const json& data) {
    PlaybackReport report;

    auto session_id = optional_string(data, "sessionId");
    if (session_id.is_error()) {
        return Err<PlaybackReport>(session_id.error());
    }
    report.session_id = session_id.value();

    auto track_id = required_string(data, "trackId");
    if (track_id.is_error()) {
        return Err<PlaybackReport>(track_id.error());
    }
    report.track_id = track_id.value();

    auto position = required_unsigned(data, "positionMs");
    if (position.is_error()) {
        return Err<PlaybackReport>(position.error());
    }
    if (position.value() > sync::kMaxPositionMs) {
        return Err<PlaybackReport>(invalid("'positionMs' is out of range"));
    }
    report.position_ms = position.value();

    auto playing = required_bool(data, "isPlaying");
    if (playing.is_error()) {
        return Err<PlaybackReport>(playing.error());
    }
    report.is_playing = playing.value();

    auto timestamp = optional_unsigned(data, "timestampMs");
    if (timestamp.is_error()) {
        return Err<PlaybackReport>(timestamp.error());
    }
    report.timestamp_ms = timestamp.value();

    return Ok(report);
}

Result<InboundMessage> decode_playback_state(const json& data) {
    auto report = decode_report(data);
    if (report.is_error()) {
        return Err<InboundMessage>(report.error());
    }
    return Ok(InboundMessage(PlaybackStateMessage{report.value()}));
}

Result<InboundMessage> decode_client_state(const json& data) {
    auto report = decode_report(data);
    if (report.is_error()) {
        return Err<InboundMessage>(report.error());
    }
    return Ok(InboundMessage(ClientStateMessage{report.value()}));
}

Result<InboundMessage> decode_request_sync(const json& data) {
    auto session_id = optional_string(data, "sessionId");
    if (session_id.is_error()) {
        return Err<InboundMessage>(session_id.error());
    }
    return Ok(InboundMessage(RequestSyncMessage{session_id.value()}));
}

Result<InboundMessage> decode_update_offset(const json& data) {
    auto session_id = optional_string(data, "sessionId");
    if (session_id.is_error()) {
        return Err<InboundMessage>(session_id.error());
    }
    auto offset = required_integer(data, "offsetMs");
    if (offset.is_error()) {
        return Err<InboundMessage>(offset.error());
    }
    return Ok(InboundMessage(UpdateOffsetMessage{session_id.value(), offset.value()}));
}

using Decoder = Result<InboundMessage> (*)(const json&);

const std::unordered_map<std::string, Decoder>& decoders() {
    static const std::unordered_map<std::string, Decoder> table = {
        {"join_session", decode_join},
        {"playback_state", decode_playback_state},
        {"client_state", decode_client_state},
        {"request_sync", decode_request_sync},
        {"update_offset", decode_update_offset},
    };
    return table;
}

std::string envelope(const char* event, json data) {
    return json{{"event", event}, {"data", std::move(data)}}.dump();
}

template<typename T>
json optional_json(const std::optional<T>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

Result<InboundMessage> MessageCodec::decode(const std::string& text) {
    auto root = json::parse(text, nullptr, false);
    if (root.is_discarded()) {
        return Err<InboundMessage>(invalid("not valid JSON"));
    }
    if (!root.is_object()) {
        return Err<InboundMessage>(invalid("envelope must be a JSON object"));
    }

    auto event = root.find("event");
    if (event == root.end() || !event->is_string()) {
        return Err<InboundMessage>(invalid("missing 'event'"));
    }

    const auto& name = event->get_ref<const std::string&>();
    auto decoder = decoders().find(name);
    if (decoder == decoders().end()) {
        return Err<InboundMessage>(invalid("unknown event '" + name + "'"));
    }

    static const json empty = json::object();
    auto data = root.find("data");
    if (data != root.end() && !data->is_object() && !data->is_null()) {
        return Err<InboundMessage>(invalid("'data' must be an object"));
    }
    const json& payload = (data == root.end() || data->is_null()) ? empty : *data;

    return decoder->second(payload);
}

std::int64_t MessageCodec::saturated_integer(const json& value) {
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return std::numeric_limits<std::int64_t>::max();
    }
    return value.get<std::int64_t>();
}

const char* MessageCodec::event_name(const InboundMessage& message) {
    struct Namer {
        const char* operator()(const JoinSessionMessage&) const { return "join_session"; }
        const char* operator()(const PlaybackStateMessage&) const { return "playback_state"; }
        const char* operator()(const ClientStateMessage&) const { return "client_state"; }
        const char* operator()(const RequestSyncMessage&) const { return "request_sync"; }
        const char* operator()(const UpdateOffsetMessage&) const { return "update_offset"; }
    };
    return std::visit(Namer{}, message);
}

std::string MessageCodec::encode(const sync::OutboundMessage& message) {
    struct Encoder {
        std::string operator()(const sync::SyncCommand& command) const {
            auto data = MessageCodec::to_json(command.correction);
            data["sessionId"] = command.session_id;
            return envelope("sync_command", std::move(data));
        }

        std::string operator()(const sync::SessionEndedNotice& notice) const {
            return envelope("session_ended", {
                {"sessionId", notice.session_id},
                {"reason", sync::to_string(notice.reason)},
            });
        }

        std::string operator()(const sync::SyncStatusNotice& status) const {
            return envelope("sync_status", {
                {"sessionId", status.session_id},
                {"driftMs", status.report.drift_ms},
                {"quality", sync::to_string(status.report.quality)},
                {"lastSyncAtMs", optional_json(status.last_sync_at_ms)},
                {"offsetMs", status.client_offset_ms},
            });
        }
    };
    return std::visit(Encoder{}, message);
}

std::string MessageCodec::encode(const JoinedMessage& message) {
    return envelope("joined", to_json(message.join));
}

std::string MessageCodec::encode(const ErrorMessage& message) {
    return envelope("error", {
        {"code", to_string(message.code)},
        {"message", message.message},
    });
}

json MessageCodec::to_json(const sync::Correction& correction) {
    return {
        {"action", sync::to_string(correction.action)},
        {"trackId", correction.track_id},
        {"positionMs", correction.position_ms},
        {"timestampMs", correction.emitted_at_ms},
        {"urgency", sync::to_string(correction.urgency)},
        {"driftMs", correction.drift_ms},
        {"isPlaying", correction.is_playing},
    };
}

json MessageCodec::to_json(const sync::PlaybackSnapshot& snapshot) {
    return {
        {"trackId", snapshot.track_id},
        {"positionMs", snapshot.position_ms},
        {"isPlaying", snapshot.is_playing},
        {"reportedAtMs", snapshot.reported_at_ms},
    };
}

json MessageCodec::to_json(const sync::SessionView& view) {
    json out = {
        {"sessionId", view.session_id},
        {"state", sync::to_string(view.state)},
        {"host", {{"userId", view.host_user_id}, {"connected", view.host_connected}}},
        {"client", nullptr},
        {"hostState", nullptr},
        {"clientState", nullptr},
        {"offsetMs", view.client_offset_ms},
        {"createdAtMs", view.created_at_ms},
        {"expiresAtMs", view.expires_at_ms},
        {"lastSyncAtMs", optional_json(view.last_sync_at_ms)},
        {"drift", nullptr},
    };
    if (view.client_user_id) {
        out["client"] = {{"userId", *view.client_user_id}, {"connected", view.client_connected}};
    }
    if (view.host_snapshot) {
        out["hostState"] = to_json(*view.host_snapshot);
    }
    if (view.client_snapshot) {
        out["clientState"] = to_json(*view.client_snapshot);
    }
    if (view.drift) {
        out["drift"] = {{"driftMs", view.drift->drift_ms}, {"quality", sync::to_string(view.drift->quality)}};
    }
    if (view.end_reason) {
        out["endReason"] = sync::to_string(*view.end_reason);
    }
    return out;
}

json MessageCodec::to_json(const sync::JoinResult& join) {
    return {
        {"sessionId", join.session_id},
        {"role", sync::to_string(join.role)},
        {"hostName", join.host_name},
        {"expiresAtMs", join.expires_at_ms},
        {"rejoined", join.rejoined},
    };
}

} // namespace tandem::gateway
