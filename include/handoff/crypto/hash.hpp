#pragma once

#include "handoff/crypto/crypto_types.hpp"
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace handoff::crypto {

// Incremental SHA-256, used for whole-file digests while streaming chunks.
class Sha256Hasher {
public:
    Sha256Hasher();
    ~Sha256Hasher();
    
    Sha256Hasher(Sha256Hasher&&) noexcept;
    Sha256Hasher& operator=(Sha256Hasher&&) noexcept;
    
    CryptoResult update(std::span<const std::uint8_t> data);
    Sha256Hash finalize();
    void reset();
    
    static Sha256Hash hash(std::span<const std::uint8_t> data);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    bool finalized_;
};

namespace hash_utils {

std::string to_hex(std::span<const std::uint8_t> bytes);
std::string hash_to_hex(const Sha256Hash& hash);
std::optional<Sha256Hash> hash_from_hex(const std::string& hex_string);

Sha256Hash hash_string(const std::string& str);

// First CHUNK_CHECKSUM_BYTES of SHA-256 as lowercase hex.
std::string chunk_checksum(std::span<const std::uint8_t> data);

// Lowercase hex SHA-256 of the PIN bytes. The plaintext never leaves this call.
std::string hash_pin(const SecureBytes& pin);
std::string hash_pin(const std::string& pin);

bool constant_time_equals(const std::string& a, const std::string& b);

}

}
