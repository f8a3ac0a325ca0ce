#pragma once

#include "handoff/core/clock.hpp"
#include <cstdint>
#include <concepts>
#include <stdexcept>
#include <optional>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace handoff::network {

constexpr std::uint32_t PROTOCOL_MAGIC = 0x484E4446; // "HNDF"
constexpr std::uint16_t PROTOCOL_VERSION = 1;
constexpr std::size_t ENVELOPE_SIZE = 20;

enum class MessageType : std::uint8_t {
    CONNECTION_REQUEST  = 0x01,
    CONNECTION_APPROVED = 0x02,
    CONNECTION_DENIED   = 0x03,

    PIN_REQUIRED        = 0x10,
    PIN_ATTEMPT         = 0x11,
    PIN_VERIFIED        = 0x12,
    PIN_INVALID         = 0x13,

    BATCH_START         = 0x20,
    FILE_METADATA       = 0x21,
    FILE_CHUNK          = 0x22,
    FILE_COMPLETE       = 0x23,
    BATCH_COMPLETE      = 0x24,
    FILE_ERROR          = 0x25,

    HEARTBEAT           = 0x30,
    DISCONNECT          = 0x31
};

std::string message_type_name(MessageType type);

template<typename T>
concept MessagePayload = requires(T t) {
    { T::TYPE } -> std::convertible_to<MessageType>;
    { t.serialize() } -> std::convertible_to<std::vector<std::uint8_t>>;
    { T::deserialize(std::declval<std::span<const std::uint8_t>>()) } -> std::same_as<T>;
};

// Payload-less messages; any payload bytes are a decoding error.
template<MessageType Type>
struct EmptyMessage {
    static constexpr MessageType TYPE = Type;
    
    std::vector<std::uint8_t> serialize() const { return {}; }
    static EmptyMessage deserialize(std::span<const std::uint8_t> data);
};

using ConnectionApprovedMessage = EmptyMessage<MessageType::CONNECTION_APPROVED>;
using PinRequiredMessage = EmptyMessage<MessageType::PIN_REQUIRED>;
using PinVerifiedMessage = EmptyMessage<MessageType::PIN_VERIFIED>;
using HeartbeatMessage = EmptyMessage<MessageType::HEARTBEAT>;
using DisconnectMessage = EmptyMessage<MessageType::DISCONNECT>;

struct ConnectionRequestMessage {
    static constexpr MessageType TYPE = MessageType::CONNECTION_REQUEST;
    
    std::string peer_id;
    std::string device_info;
    
    std::vector<std::uint8_t> serialize() const;
    static ConnectionRequestMessage deserialize(std::span<const std::uint8_t> data);
};

struct ConnectionDeniedMessage {
    static constexpr MessageType TYPE = MessageType::CONNECTION_DENIED;
    
    std::string reason;
    
    std::vector<std::uint8_t> serialize() const;
    static ConnectionDeniedMessage deserialize(std::span<const std::uint8_t> data);
};

struct PinAttemptMessage {
    static constexpr MessageType TYPE = MessageType::PIN_ATTEMPT;
    
    std::string hashed_pin;
    std::uint32_t attempt_number = 0;
    
    std::vector<std::uint8_t> serialize() const;
    static PinAttemptMessage deserialize(std::span<const std::uint8_t> data);
};

struct PinInvalidMessage {
    static constexpr MessageType TYPE = MessageType::PIN_INVALID;
    
    std::uint32_t attempts_remaining = 0;
    
    std::vector<std::uint8_t> serialize() const;
    static PinInvalidMessage deserialize(std::span<const std::uint8_t> data);
};

struct BatchStartMessage {
    static constexpr MessageType TYPE = MessageType::BATCH_START;
    
    std::string batch_id;
    std::uint32_t total_files = 0;
    std::uint64_t total_size = 0;
    
    std::vector<std::uint8_t> serialize() const;
    static BatchStartMessage deserialize(std::span<const std::uint8_t> data);
};

struct FileMetadataMessage {
    static constexpr MessageType TYPE = MessageType::FILE_METADATA;
    
    std::string id;
    std::string name;
    std::uint64_t size = 0;
    std::string mime_type;
    std::uint64_t last_modified = 0;
    std::uint64_t total_chunks = 0;
    std::string batch_id;
    std::uint32_t file_index = 0;
    std::uint32_t total_files_in_batch = 0;
    std::optional<std::string> hash;    // checksum of the first chunk
    
    std::vector<std::uint8_t> serialize() const;
    static FileMetadataMessage deserialize(std::span<const std::uint8_t> data);
};

struct FileChunkMessage {
    static constexpr MessageType TYPE = MessageType::FILE_CHUNK;
    
    std::string file_id;
    std::uint64_t chunk_index = 0;
    std::uint64_t total_chunks = 0;
    std::vector<std::uint8_t> data;
    std::string checksum;
    
    std::vector<std::uint8_t> serialize() const;
    static FileChunkMessage deserialize(std::span<const std::uint8_t> data);
};

struct FileCompleteMessage {
    static constexpr MessageType TYPE = MessageType::FILE_COMPLETE;
    
    std::string file_id;
    std::string final_hash;
    
    std::vector<std::uint8_t> serialize() const;
    static FileCompleteMessage deserialize(std::span<const std::uint8_t> data);
};

struct BatchCompleteMessage {
    static constexpr MessageType TYPE = MessageType::BATCH_COMPLETE;
    
    std::string batch_id;
    
    std::vector<std::uint8_t> serialize() const;
    static BatchCompleteMessage deserialize(std::span<const std::uint8_t> data);
};

struct FileErrorMessage {
    static constexpr MessageType TYPE = MessageType::FILE_ERROR;
    
    std::string file_id;
    std::string error;
    
    std::vector<std::uint8_t> serialize() const;
    static FileErrorMessage deserialize(std::span<const std::uint8_t> data);
};

using MessageVariant = std::variant<
    ConnectionRequestMessage,
    ConnectionApprovedMessage,
    ConnectionDeniedMessage,
    PinRequiredMessage,
    PinAttemptMessage,
    PinVerifiedMessage,
    PinInvalidMessage,
    BatchStartMessage,
    FileMetadataMessage,
    FileChunkMessage,
    FileCompleteMessage,
    BatchCompleteMessage,
    FileErrorMessage,
    HeartbeatMessage,
    DisconnectMessage>;

// Wire envelope: fixed big-endian header followed by the typed payload.
struct PeerMessage {
    std::uint64_t timestamp = 0;    // unix milliseconds
    MessageVariant payload;
    
    MessageType type() const;
    
    template<MessagePayload T>
    static PeerMessage make(T body);
    
    template<MessagePayload T>
    const T* get_if() const { return std::get_if<T>(&payload); }
    
    std::vector<std::uint8_t> serialize() const;
    
    // Throws std::runtime_error on truncated, oversized or unknown input.
    static PeerMessage deserialize(std::span<const std::uint8_t> data);
};

template<MessageType Type>
EmptyMessage<Type> EmptyMessage<Type>::deserialize(std::span<const std::uint8_t> data) {
    if (!data.empty()) {
        throw std::runtime_error("Unexpected payload for " + message_type_name(Type));
    }
    return {};
}

template<MessagePayload T>
PeerMessage PeerMessage::make(T body) {
    PeerMessage message;
    message.timestamp = core::unix_time_ms();
    message.payload = std::move(body);
    return message;
}

template<typename... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}

static_assert(handoff::network::MessagePayload<handoff::network::ConnectionRequestMessage>);
static_assert(handoff::network::MessagePayload<handoff::network::ConnectionApprovedMessage>);
static_assert(handoff::network::MessagePayload<handoff::network::PinAttemptMessage>);
static_assert(handoff::network::MessagePayload<handoff::network::FileMetadataMessage>);
static_assert(handoff::network::MessagePayload<handoff::network::FileChunkMessage>);
static_assert(handoff::network::MessagePayload<handoff::network::HeartbeatMessage>);
