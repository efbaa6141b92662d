#pragma once

#include <string>

namespace tandem {

/**
 * @brief Concrete failure reasons surfaced by the coordinator
 */
enum class ErrorCode {
    SessionNotFound,
    SessionFull,
    SessionEnded,
    CapacityExceeded,
    Forbidden,
    InvalidMessage,
    InvalidArgument,
    PeerUnavailable,
    Internal
};

/**
 * @brief Caller-facing classification of an ErrorCode
 *
 * NotFound  - session absent or expired; retry with create/join
 * Forbidden - role or identity mismatch; not retryable as-is
 * Conflict  - slot occupied or capacity reached
 * Invalid   - malformed message or out-of-range value
 * Transient - peer not connected; heals on the next evaluation
 */
enum class ErrorKind {
    NotFound,
    Forbidden,
    Conflict,
    Invalid,
    Transient,
    Internal
};

struct Error {
    ErrorCode code = ErrorCode::Internal;
    std::string message;
};

inline ErrorKind kind_of(ErrorCode code) {
    switch (code) {
        case ErrorCode::SessionNotFound:
        case ErrorCode::SessionEnded:
            return ErrorKind::NotFound;
        case ErrorCode::SessionFull:
        case ErrorCode::CapacityExceeded:
            return ErrorKind::Conflict;
        case ErrorCode::Forbidden:
            return ErrorKind::Forbidden;
        case ErrorCode::InvalidMessage:
        case ErrorCode::InvalidArgument:
            return ErrorKind::Invalid;
        case ErrorCode::PeerUnavailable:
            return ErrorKind::Transient;
        case ErrorCode::Internal:
            break;
    }
    return ErrorKind::Internal;
}

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SessionNotFound: return "session_not_found";
        case ErrorCode::SessionFull: return "session_full";
        case ErrorCode::SessionEnded: return "session_ended";
        case ErrorCode::CapacityExceeded: return "capacity_exceeded";
        case ErrorCode::Forbidden: return "forbidden";
        case ErrorCode::InvalidMessage: return "invalid_message";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::PeerUnavailable: return "peer_unavailable";
        case ErrorCode::Internal: return "internal";
    }
    return "internal";
}

} // namespace tandem
