#pragma once

#include <cstdint>
#include <string_view>

namespace rally {

/**
 * ErrorCode - failure taxonomy shared by every layer.
 *
 * Transport-level codes are absorbed by reconnection; signaling and argument
 * codes go back to the immediate caller; SequenceGap stays inside the sync
 * engine unless a resync itself fails.
 */
enum class ErrorCode : uint8_t {
    None = 0,
    NegotiationTimeout,
    NegotiationFailed,
    RoomNotFound,
    SignalingUnavailable,
    NotConnected,
    SequenceGap,
    QueueOperationExhausted,
    QueueFull,
    AlreadyInRoom,
    NotInRoom,
    NotInitialized,
    InvalidArgument,
    ProtocolError,
};

[[nodiscard]] constexpr std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::None: return "None";
        case ErrorCode::NegotiationTimeout: return "NegotiationTimeout";
        case ErrorCode::NegotiationFailed: return "NegotiationFailed";
        case ErrorCode::RoomNotFound: return "RoomNotFound";
        case ErrorCode::SignalingUnavailable: return "SignalingUnavailable";
        case ErrorCode::NotConnected: return "NotConnected";
        case ErrorCode::SequenceGap: return "SequenceGap";
        case ErrorCode::QueueOperationExhausted: return "QueueOperationExhausted";
        case ErrorCode::QueueFull: return "QueueFull";
        case ErrorCode::AlreadyInRoom: return "AlreadyInRoom";
        case ErrorCode::NotInRoom: return "NotInRoom";
        case ErrorCode::NotInitialized: return "NotInitialized";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::ProtocolError: return "ProtocolError";
    }
    return "Unknown";
}

// Transient conditions that the reconnection loop retries.
[[nodiscard]] constexpr bool is_transient(ErrorCode code) noexcept {
    return code == ErrorCode::NegotiationTimeout ||
           code == ErrorCode::NegotiationFailed ||
           code == ErrorCode::SignalingUnavailable ||
           code == ErrorCode::NotConnected;
}

} // namespace rally
