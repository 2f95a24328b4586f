#pragma once

/// @file message.hpp
/// @brief Wire message model shared by the codec and the connection client.

#include <chrono>
#include <cstdint>
#include <string_view>
#include <vector>

namespace cgc::net {

/// Message type tag, first byte of every message body.
enum class MessageType : uint8_t {
    Connect = 0,
    ConnectAck = 1,
    Disconnect = 2,
    Heartbeat = 3,
    HeartbeatAck = 4,

    GameData = 10,
    PlayerAction = 11,
    StateSync = 12,

    Acknowledgment = 20,
    Retransmission = 21,

    Error = 255
};

constexpr std::string_view messageTypeName(MessageType type) {
    switch (type) {
        case MessageType::Connect:        return "Connect";
        case MessageType::ConnectAck:     return "ConnectAck";
        case MessageType::Disconnect:     return "Disconnect";
        case MessageType::Heartbeat:      return "Heartbeat";
        case MessageType::HeartbeatAck:   return "HeartbeatAck";
        case MessageType::GameData:       return "GameData";
        case MessageType::PlayerAction:   return "PlayerAction";
        case MessageType::StateSync:      return "StateSync";
        case MessageType::Acknowledgment: return "Acknowledgment";
        case MessageType::Retransmission: return "Retransmission";
        case MessageType::Error:          return "Error";
    }
    return "Unknown";
}

/// Control messages are handled by the client itself and never reach
/// OnMessage subscribers.
constexpr bool isControlMessage(MessageType type) {
    switch (type) {
        case MessageType::Connect:
        case MessageType::ConnectAck:
        case MessageType::Disconnect:
        case MessageType::Heartbeat:
        case MessageType::HeartbeatAck:
        case MessageType::Error:
            return true;
        default:
            return false;
    }
}

/// Decoded application-level message.
struct Message {
    MessageType type = MessageType::GameData;
    uint32_t sequenceNumber = 0;
    uint64_t timestampMs = 0; ///< Milliseconds since the Unix epoch
    std::vector<uint8_t> payload;

    friend bool operator==(const Message&, const Message&) = default;
};

/// Current wall-clock time in milliseconds since the Unix epoch.
inline uint64_t nowEpochMs() {
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
}

} // namespace cgc::net
