#pragma once

#include <array>
#include <vector>
#include <span>
#include <string>
#include <cstdint>

namespace handoff::crypto {

constexpr size_t SHA256_HASH_SIZE = 32;

// Chunk checksums carry only the leading bytes of the digest.
constexpr size_t CHUNK_CHECKSUM_BYTES = 8;

using Sha256Hash = std::array<std::uint8_t, SHA256_HASH_SIZE>;

// Byte buffer wiped on destruction; holds plaintext PINs.
struct SecureBytes {
    std::vector<std::uint8_t> data;
    
    SecureBytes() = default;
    explicit SecureBytes(size_t size);
    explicit SecureBytes(const std::string& text);
    SecureBytes(std::span<const std::uint8_t> bytes);
    
    ~SecureBytes();
    
    SecureBytes(const SecureBytes&) = delete;
    SecureBytes& operator=(const SecureBytes&) = delete;
    
    SecureBytes(SecureBytes&& other) noexcept;
    SecureBytes& operator=(SecureBytes&& other) noexcept;
    
    std::uint8_t* data_ptr() { return data.data(); }
    const std::uint8_t* data_ptr() const { return data.data(); }
    size_t size() const { return data.size(); }
    bool empty() const { return data.empty(); }
    
    std::span<std::uint8_t> span() { return std::span(data); }
    std::span<const std::uint8_t> span() const { return std::span(data); }
    
    void clear();
};

// Overwrites the string's bytes in a way the optimizer cannot drop.
void secure_zero(std::string& text);

enum class CryptoError {
    SUCCESS = 0,
    INVALID_INPUT,
    BUFFER_TOO_SMALL,
    VERIFICATION_FAILED,
    RANDOM_GENERATION_FAILED,
    HASH_FAILED,
    INVALID_STATE,
    FILE_NOT_FOUND,
    FILE_READ_ERROR,
    VALIDATION_FAILED
};

struct CryptoResult {
    CryptoError error;
    std::string message;
    
    CryptoResult(CryptoError err = CryptoError::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}
    
    bool success() const { return error == CryptoError::SUCCESS; }
    operator bool() const { return success(); }
};

}
