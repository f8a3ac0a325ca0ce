#include "handoff/core/limits.hpp"

namespace handoff::core {

TransferLimits TransferLimits::from_config(const Config& config) {
    TransferLimits limits;
    limits.chunk_size = static_cast<std::uint32_t>(
        config.get_uint64("transfer.chunk_size", limits.chunk_size));
    limits.max_file_size = config.get_uint64("transfer.max_file_size", limits.max_file_size);
    limits.max_session_size = config.get_uint64("transfer.max_session_size", limits.max_session_size);
    limits.max_files_per_batch = static_cast<std::size_t>(
        config.get_uint64("transfer.max_files_per_batch", limits.max_files_per_batch));
    limits.send_buffer_limit = static_cast<std::size_t>(
        config.get_uint64("transfer.send_buffer_limit", limits.send_buffer_limit));
    
    if (limits.chunk_size == 0) {
        limits.chunk_size = DEFAULT_CHUNK_SIZE;
    }
    return limits;
}

SecurityLimits SecurityLimits::from_config(const Config& config) {
    SecurityLimits limits;
    limits.room_code_length = static_cast<std::size_t>(
        config.get_uint64("security.room_code_length", limits.room_code_length));
    limits.room_code_expiry = std::chrono::seconds(
        config.get_uint64("security.room_code_expiry_seconds", limits.room_code_expiry.count()));
    limits.pin_length = static_cast<std::size_t>(
        config.get_uint64("security.pin_length", limits.pin_length));
    limits.max_pin_attempts = static_cast<std::uint32_t>(
        config.get_uint64("security.max_pin_attempts", limits.max_pin_attempts));
    limits.max_connection_attempts = static_cast<std::uint32_t>(
        config.get_uint64("security.max_connection_attempts", limits.max_connection_attempts));
    limits.connection_attempt_window = std::chrono::seconds(
        config.get_uint64("security.connection_attempt_window_seconds", limits.connection_attempt_window.count()));
    limits.rate_limit_block = std::chrono::seconds(
        config.get_uint64("security.rate_limit_block_seconds", limits.rate_limit_block.count()));
    limits.approval_timeout = std::chrono::milliseconds(
        config.get_uint64("security.approval_timeout_ms", limits.approval_timeout.count()));
    limits.heartbeat_interval = std::chrono::milliseconds(
        config.get_uint64("security.heartbeat_interval_ms", limits.heartbeat_interval.count()));
    return limits;
}

TransportLimits TransportLimits::from_config(const Config& config) {
    TransportLimits limits;
    limits.max_reconnect_attempts = static_cast<std::uint32_t>(
        config.get_uint64("transport.max_reconnect_attempts", limits.max_reconnect_attempts));
    return limits;
}

}
