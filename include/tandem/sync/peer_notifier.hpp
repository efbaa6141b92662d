#pragma once

#include "tandem/core/result.hpp"
#include "tandem/sync/types.hpp"

#include <cstdint>
#include <optional>
#include <variant>

namespace tandem::sync {

struct SyncCommand {
    SessionId session_id;
    Correction correction;
};

struct SessionEndedNotice {
    SessionId session_id;
    EndReason reason = EndReason::HostEnded;
};

struct SyncStatusNotice {
    SessionId session_id;
    DriftReport report;
    std::optional<std::uint64_t> last_sync_at_ms;
    std::int64_t client_offset_ms = 0;
};

using OutboundMessage = std::variant<SyncCommand, SessionEndedNotice, SyncStatusNotice>;

/**
 * @brief Outbound side of the transport, as seen by the SessionManager
 *
 * deliver() never blocks on the network. A peer without a live connection
 * yields ErrorCode::PeerUnavailable; the message is dropped, not queued.
 */
class PeerNotifier {
public:
    virtual ~PeerNotifier() = default;

    virtual Result<void> deliver(const PeerRef& peer, const OutboundMessage& message) = 0;
};

} // namespace tandem::sync
