#pragma once

#include "handoff/core/config.hpp"
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace handoff::core {

constexpr std::uint32_t DEFAULT_CHUNK_SIZE = 64 * 1024;
constexpr std::uint64_t DEFAULT_MAX_FILE_SIZE = 2ULL * 1024 * 1024 * 1024;
constexpr std::uint64_t DEFAULT_MAX_SESSION_SIZE = 10ULL * 1024 * 1024 * 1024;
constexpr std::size_t DEFAULT_MAX_FILES_PER_BATCH = 500;
constexpr std::size_t DEFAULT_SEND_BUFFER_LIMIT = 1024 * 1024;

constexpr std::size_t DEFAULT_ROOM_CODE_LENGTH = 8;
constexpr std::size_t DEFAULT_PIN_LENGTH = 4;
constexpr std::uint32_t DEFAULT_MAX_PIN_ATTEMPTS = 3;
constexpr std::uint32_t DEFAULT_MAX_CONNECTION_ATTEMPTS = 3;
constexpr std::uint32_t DEFAULT_MAX_RECONNECT_ATTEMPTS = 5;
constexpr std::uint16_t DEFAULT_PORT = 47800;

struct TransferLimits {
    std::uint32_t chunk_size = DEFAULT_CHUNK_SIZE;
    std::uint64_t max_file_size = DEFAULT_MAX_FILE_SIZE;
    std::uint64_t max_session_size = DEFAULT_MAX_SESSION_SIZE;
    std::size_t max_files_per_batch = DEFAULT_MAX_FILES_PER_BATCH;
    // The sender waits while the channel holds more than this many unsent bytes.
    std::size_t send_buffer_limit = DEFAULT_SEND_BUFFER_LIMIT;
    std::chrono::milliseconds send_buffer_poll{5};
    
    // Speed sampling: one sample per interval, averaged over the window.
    std::chrono::milliseconds speed_sample_interval{500};
    std::size_t speed_sample_window = 5;
    
    static TransferLimits from_config(const Config& config);
};

struct SecurityLimits {
    std::size_t room_code_length = DEFAULT_ROOM_CODE_LENGTH;
    std::chrono::seconds room_code_expiry{60 * 60};
    std::size_t pin_length = DEFAULT_PIN_LENGTH;
    std::uint32_t max_pin_attempts = DEFAULT_MAX_PIN_ATTEMPTS;
    std::uint32_t max_connection_attempts = DEFAULT_MAX_CONNECTION_ATTEMPTS;
    std::chrono::seconds connection_attempt_window{5 * 60};
    std::chrono::seconds rate_limit_block{5 * 60};
    std::chrono::milliseconds approval_timeout{30 * 1000};
    std::chrono::milliseconds heartbeat_interval{5 * 1000};
    
    static SecurityLimits from_config(const Config& config);
};

struct TransportLimits {
    std::uint32_t max_reconnect_attempts = DEFAULT_MAX_RECONNECT_ATTEMPTS;
    std::chrono::milliseconds initial_backoff{1000};
    std::chrono::milliseconds max_backoff{10000};
    std::uint32_t max_frame_size = 16 * 1024 * 1024;
    
    static TransportLimits from_config(const Config& config);
};

}
