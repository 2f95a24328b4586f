#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes and failure taxonomy for the client core.

#include <cstdint>
#include <string_view>

namespace cgc::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), making it possible
/// to determine the error source from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    InvalidState = 0x0005,
    Disposed = 0x0006,

    // Network (0x0100 - 0x01FF)
    NetworkError = 0x0100,
    ConnectionFailed = 0x0101,
    ConnectionLost = 0x0102,
    ConnectionRefused = 0x0103,
    Timeout = 0x0104,
    SendFailed = 0x0105,
    NotConnected = 0x0106,
    AlreadyConnected = 0x0107,
    AlreadyInProgress = 0x0108,
    Backpressure = 0x0109,
    RetriesExhausted = 0x010A,
    ProbeTimeout = 0x010B,

    // Protocol (0x0200 - 0x02FF)
    ProtocolError = 0x0200,
    FrameTooLarge = 0x0201,
    MalformedFrame = 0x0202,
    CompressionFailed = 0x0203,
    DecompressionFailed = 0x0204,
    HandshakeRejected = 0x0205,

    // Config (0x0300 - 0x03FF)
    ConfigLoadFailed = 0x0300,
    ConfigKeyNotFound = 0x0301,
    ConfigTypeMismatch = 0x0302,
    InvalidConfig = 0x0303,

    // Scope (0x0400 - 0x04FF)
    OperationCancelled = 0x0400,
    OperationFailed = 0x0401,
    ScopeShutdown = 0x0402,
    TaskSubmitFailed = 0x0403,

    // Logger (0x0500 - 0x05FF)
    LoggerError = 0x0500,
    LoggerFlushFailed = 0x0501,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Network";
        case 0x0200: return "Protocol";
        case 0x0300: return "Config";
        case 0x0400: return "Scope";
        case 0x0500: return "Logger";
        default: return "Unknown";
    }
}

/// How the client reacts to a failure.
///
/// | Kind          | Reaction                                                |
/// |---------------|---------------------------------------------------------|
/// | Transient     | retried with backoff, OnError only after exhaustion     |
/// | Protocol      | link torn down, recovery left to the supervisor         |
/// | Configuration | returned synchronously, never retried                   |
/// | Cancellation  | reported as a status, never as an error event           |
/// | Usage         | caller mistake (wrong state, full queue), no side effect|
enum class ErrorKind : uint8_t {
    None,
    Transient,
    Protocol,
    Configuration,
    Cancellation,
    Usage
};

/// Classify an error code into its failure kind.
constexpr ErrorKind classifyError(ErrorCode code) {
    switch (code) {
        case ErrorCode::Success:
            return ErrorKind::None;

        case ErrorCode::NetworkError:
        case ErrorCode::ConnectionFailed:
        case ErrorCode::ConnectionLost:
        case ErrorCode::ConnectionRefused:
        case ErrorCode::Timeout:
        case ErrorCode::SendFailed:
        case ErrorCode::ProbeTimeout:
        case ErrorCode::RetriesExhausted:
            return ErrorKind::Transient;

        case ErrorCode::ProtocolError:
        case ErrorCode::FrameTooLarge:
        case ErrorCode::MalformedFrame:
        case ErrorCode::CompressionFailed:
        case ErrorCode::DecompressionFailed:
        case ErrorCode::HandshakeRejected:
            return ErrorKind::Protocol;

        case ErrorCode::ConfigLoadFailed:
        case ErrorCode::ConfigKeyNotFound:
        case ErrorCode::ConfigTypeMismatch:
        case ErrorCode::InvalidConfig:
            return ErrorKind::Configuration;

        case ErrorCode::OperationCancelled:
        case ErrorCode::ScopeShutdown:
            return ErrorKind::Cancellation;

        default:
            return ErrorKind::Usage;
    }
}

/// Return the string name for an error kind.
constexpr std::string_view errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:          return "none";
        case ErrorKind::Transient:     return "transient";
        case ErrorKind::Protocol:      return "protocol";
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::Cancellation:  return "cancellation";
        case ErrorKind::Usage:         return "usage";
    }
    return "unknown";
}

} // namespace cgc::foundation
