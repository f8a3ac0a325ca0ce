#include "handoff/network/peer_message.hpp"
#include <stdexcept>

namespace handoff::network {

namespace {
    // Upper bound for any length-prefixed field other than chunk data.
    constexpr std::uint32_t MAX_STRING_SIZE = 64 * 1024;

    void write_uint16(std::vector<std::uint8_t>& buffer, std::uint16_t value) {
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    void write_uint32(std::vector<std::uint8_t>& buffer, std::uint32_t value) {
        buffer.push_back((value >> 24) & 0xFF);
        buffer.push_back((value >> 16) & 0xFF);
        buffer.push_back((value >> 8) & 0xFF);
        buffer.push_back(value & 0xFF);
    }
    
    void write_uint64(std::vector<std::uint8_t>& buffer, std::uint64_t value) {
        write_uint32(buffer, static_cast<std::uint32_t>(value >> 32));
        write_uint32(buffer, static_cast<std::uint32_t>(value & 0xFFFFFFFF));
    }
    
    void write_string(std::vector<std::uint8_t>& buffer, const std::string& str) {
        write_uint32(buffer, static_cast<std::uint32_t>(str.size()));
        buffer.insert(buffer.end(), str.begin(), str.end());
    }
    
    void write_bytes(std::vector<std::uint8_t>& buffer, const std::vector<std::uint8_t>& bytes) {
        write_uint32(buffer, static_cast<std::uint32_t>(bytes.size()));
        buffer.insert(buffer.end(), bytes.begin(), bytes.end());
    }
    
    std::uint8_t read_uint8(std::span<const std::uint8_t>& data) {
        if (data.empty()) throw std::runtime_error("Insufficient data for uint8");
        auto value = data[0];
        data = data.subspan(1);
        return value;
    }
    
    std::uint16_t read_uint16(std::span<const std::uint8_t>& data) {
        if (data.size() < 2) throw std::runtime_error("Insufficient data for uint16");
        std::uint16_t value = (static_cast<std::uint16_t>(data[0]) << 8) |
                             static_cast<std::uint16_t>(data[1]);
        data = data.subspan(2);
        return value;
    }
    
    std::uint32_t read_uint32(std::span<const std::uint8_t>& data) {
        if (data.size() < 4) throw std::runtime_error("Insufficient data for uint32");
        std::uint32_t value = (static_cast<std::uint32_t>(data[0]) << 24) |
                             (static_cast<std::uint32_t>(data[1]) << 16) |
                             (static_cast<std::uint32_t>(data[2]) << 8) |
                             static_cast<std::uint32_t>(data[3]);
        data = data.subspan(4);
        return value;
    }
    
    std::uint64_t read_uint64(std::span<const std::uint8_t>& data) {
        std::uint64_t high = read_uint32(data);
        std::uint64_t low = read_uint32(data);
        return (high << 32) | low;
    }
    
    std::string read_string(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (length > MAX_STRING_SIZE) throw std::runtime_error("String field too long");
        if (data.size() < length) throw std::runtime_error("Insufficient data for string");
        std::string str(reinterpret_cast<const char*>(data.data()), length);
        data = data.subspan(length);
        return str;
    }
    
    std::vector<std::uint8_t> read_bytes(std::span<const std::uint8_t>& data) {
        auto length = read_uint32(data);
        if (data.size() < length) throw std::runtime_error("Insufficient data for byte field");
        std::vector<std::uint8_t> bytes(data.begin(), data.begin() + length);
        data = data.subspan(length);
        return bytes;
    }
    
    void expect_consumed(std::span<const std::uint8_t> data, MessageType type) {
        if (!data.empty()) {
            throw std::runtime_error("Trailing bytes after " + message_type_name(type) + " payload");
        }
    }
    
    template<MessagePayload T>
    MessageVariant decode_as(std::span<const std::uint8_t> data) {
        return T::deserialize(data);
    }
}

std::string message_type_name(MessageType type) {
    switch (type) {
        case MessageType::CONNECTION_REQUEST: return "connection_request";
        case MessageType::CONNECTION_APPROVED: return "connection_approved";
        case MessageType::CONNECTION_DENIED: return "connection_denied";
        case MessageType::PIN_REQUIRED: return "pin_required";
        case MessageType::PIN_ATTEMPT: return "pin_attempt";
        case MessageType::PIN_VERIFIED: return "pin_verified";
        case MessageType::PIN_INVALID: return "pin_invalid";
        case MessageType::BATCH_START: return "batch_start";
        case MessageType::FILE_METADATA: return "file_metadata";
        case MessageType::FILE_CHUNK: return "file_chunk";
        case MessageType::FILE_COMPLETE: return "file_complete";
        case MessageType::BATCH_COMPLETE: return "batch_complete";
        case MessageType::FILE_ERROR: return "file_error";
        case MessageType::HEARTBEAT: return "heartbeat";
        case MessageType::DISCONNECT: return "disconnect";
    }
    return "unknown(" + std::to_string(static_cast<int>(type)) + ")";
}

std::vector<std::uint8_t> ConnectionRequestMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, peer_id);
    write_string(buffer, device_info);
    return buffer;
}

ConnectionRequestMessage ConnectionRequestMessage::deserialize(std::span<const std::uint8_t> data) {
    ConnectionRequestMessage msg;
    auto span = data;
    msg.peer_id = read_string(span);
    msg.device_info = read_string(span);
    expect_consumed(span, TYPE);
    return msg;
}

std::vector<std::uint8_t> ConnectionDeniedMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, reason);
    return buffer;
}

ConnectionDeniedMessage ConnectionDeniedMessage::deserialize(std::span<const std::uint8_t> data) {
    ConnectionDeniedMessage msg;
    auto span = data;
    msg.reason = read_string(span);
    expect_consumed(span, TYPE);
    return msg;
}

std::vector<std::uint8_t> PinAttemptMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, hashed_pin);
    write_uint32(buffer, attempt_number);
    return buffer;
}

PinAttemptMessage PinAttemptMessage::deserialize(std::span<const std::uint8_t> data) {
    PinAttemptMessage msg;
    auto span = data;
    msg.hashed_pin = read_string(span);
    msg.attempt_number = read_uint32(span);
    expect_consumed(span, TYPE);
    return msg;
}

std::vector<std::uint8_t> PinInvalidMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_uint32(buffer, attempts_remaining);
    return buffer;
}

PinInvalidMessage PinInvalidMessage::deserialize(std::span<const std::uint8_t> data) {
    PinInvalidMessage msg;
    auto span = data;
    msg.attempts_remaining = read_uint32(span);
    expect_consumed(span, TYPE);
    return msg;
}

std::vector<std::uint8_t> BatchStartMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, batch_id);
    write_uint32(buffer, total_files);
    write_uint64(buffer, total_size);
    return buffer;
}

BatchStartMessage BatchStartMessage::deserialize(std::span<const std::uint8_t> data) {
    BatchStartMessage msg;
    auto span = data;
    msg.batch_id = read_string(span);
    msg.total_files = read_uint32(span);
    msg.total_size = read_uint64(span);
    expect_consumed(span, TYPE);
    return msg;
}

std::vector<std::uint8_t> FileMetadataMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, id);
    write_string(buffer, name);
    write_uint64(buffer, size);
    write_string(buffer, mime_type);
    write_uint64(buffer, last_modified);
    write_uint64(buffer, total_chunks);
    write_string(buffer, batch_id);
    write_uint32(buffer, file_index);
    write_uint32(buffer, total_files_in_batch);
    buffer.push_back(hash ? 1 : 0);
    if (hash) {
        write_string(buffer, *hash);
    }
    return buffer;
}

FileMetadataMessage FileMetadataMessage::deserialize(std::span<const std::uint8_t> data) {
    FileMetadataMessage msg;
    auto span = data;
    msg.id = read_string(span);
    msg.name = read_string(span);
    msg.size = read_uint64(span);
    msg.mime_type = read_string(span);
    msg.last_modified = read_uint64(span);
    msg.total_chunks = read_uint64(span);
    msg.batch_id = read_string(span);
    msg.file_index = read_uint32(span);
    msg.total_files_in_batch = read_uint32(span);
    if (read_uint8(span) != 0) {
        msg.hash = read_string(span);
    }
    expect_consumed(span, TYPE);
    return msg;
}

std::vector<std::uint8_t> FileChunkMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    buffer.reserve(file_id.size() + data.size() + checksum.size() + 32);
    write_string(buffer, file_id);
    write_uint64(buffer, chunk_index);
    write_uint64(buffer, total_chunks);
    write_bytes(buffer, data);
    write_string(buffer, checksum);
    return buffer;
}

FileChunkMessage FileChunkMessage::deserialize(std::span<const std::uint8_t> data) {
    FileChunkMessage msg;
    auto span = data;
    msg.file_id = read_string(span);
    msg.chunk_index = read_uint64(span);
    msg.total_chunks = read_uint64(span);
    msg.data = read_bytes(span);
    msg.checksum = read_string(span);
    expect_consumed(span, TYPE);
    return msg;
}

std::vector<std::uint8_t> FileCompleteMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_string(buffer, final_hash);
    return buffer;
}

FileCompleteMessage FileCompleteMessage::deserialize(std::span<const std::uint8_t> data) {
    FileCompleteMessage msg;
    auto span = data;
    msg.file_id = read_string(span);
    msg.final_hash = read_string(span);
    expect_consumed(span, TYPE);
    return msg;
}

std::vector<std::uint8_t> BatchCompleteMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, batch_id);
    return buffer;
}

BatchCompleteMessage BatchCompleteMessage::deserialize(std::span<const std::uint8_t> data) {
    BatchCompleteMessage msg;
    auto span = data;
    msg.batch_id = read_string(span);
    expect_consumed(span, TYPE);
    return msg;
}

std::vector<std::uint8_t> FileErrorMessage::serialize() const {
    std::vector<std::uint8_t> buffer;
    write_string(buffer, file_id);
    write_string(buffer, error);
    return buffer;
}

FileErrorMessage FileErrorMessage::deserialize(std::span<const std::uint8_t> data) {
    FileErrorMessage msg;
    auto span = data;
    msg.file_id = read_string(span);
    msg.error = read_string(span);
    expect_consumed(span, TYPE);
    return msg;
}

MessageType PeerMessage::type() const {
    return std::visit([](const auto& body) {
        return std::decay_t<decltype(body)>::TYPE;
    }, payload);
}

std::vector<std::uint8_t> PeerMessage::serialize() const {
    auto body = std::visit([](const auto& msg) { return msg.serialize(); }, payload);
    
    std::vector<std::uint8_t> buffer;
    buffer.reserve(ENVELOPE_SIZE + body.size());
    write_uint32(buffer, PROTOCOL_MAGIC);
    write_uint16(buffer, PROTOCOL_VERSION);
    buffer.push_back(static_cast<std::uint8_t>(type()));
    buffer.push_back(0);
    write_uint64(buffer, timestamp);
    write_uint32(buffer, static_cast<std::uint32_t>(body.size()));
    buffer.insert(buffer.end(), body.begin(), body.end());
    
    return buffer;
}

PeerMessage PeerMessage::deserialize(std::span<const std::uint8_t> data) {
    if (data.size() < ENVELOPE_SIZE) {
        throw std::runtime_error("Insufficient data for message envelope");
    }
    
    auto span = data;
    if (read_uint32(span) != PROTOCOL_MAGIC) {
        throw std::runtime_error("Invalid protocol magic");
    }
    if (read_uint16(span) != PROTOCOL_VERSION) {
        throw std::runtime_error("Unsupported protocol version");
    }
    
    auto type = static_cast<MessageType>(read_uint8(span));
    read_uint8(span);
    
    PeerMessage message;
    message.timestamp = read_uint64(span);
    auto payload_size = read_uint32(span);
    if (span.size() != payload_size) {
        throw std::runtime_error("Payload size mismatch");
    }
    
    switch (type) {
        case MessageType::CONNECTION_REQUEST:
            message.payload = decode_as<ConnectionRequestMessage>(span); break;
        case MessageType::CONNECTION_APPROVED:
            message.payload = decode_as<ConnectionApprovedMessage>(span); break;
        case MessageType::CONNECTION_DENIED:
            message.payload = decode_as<ConnectionDeniedMessage>(span); break;
        case MessageType::PIN_REQUIRED:
            message.payload = decode_as<PinRequiredMessage>(span); break;
        case MessageType::PIN_ATTEMPT:
            message.payload = decode_as<PinAttemptMessage>(span); break;
        case MessageType::PIN_VERIFIED:
            message.payload = decode_as<PinVerifiedMessage>(span); break;
        case MessageType::PIN_INVALID:
            message.payload = decode_as<PinInvalidMessage>(span); break;
        case MessageType::BATCH_START:
            message.payload = decode_as<BatchStartMessage>(span); break;
        case MessageType::FILE_METADATA:
            message.payload = decode_as<FileMetadataMessage>(span); break;
        case MessageType::FILE_CHUNK:
            message.payload = decode_as<FileChunkMessage>(span); break;
        case MessageType::FILE_COMPLETE:
            message.payload = decode_as<FileCompleteMessage>(span); break;
        case MessageType::BATCH_COMPLETE:
            message.payload = decode_as<BatchCompleteMessage>(span); break;
        case MessageType::FILE_ERROR:
            message.payload = decode_as<FileErrorMessage>(span); break;
        case MessageType::HEARTBEAT:
            message.payload = decode_as<HeartbeatMessage>(span); break;
        case MessageType::DISCONNECT:
            message.payload = decode_as<DisconnectMessage>(span); break;
        default:
            throw std::runtime_error("Unknown message type " + message_type_name(type));
    }
    
    return message;
}

}
