#pragma once

#include "handoff/crypto/crypto_types.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace handoff::crypto {

// libsodium-backed randomness for room codes and identifiers.
class SecureRandom {
public:
    // Must succeed before any other call; safe to call repeatedly.
    static bool initialize();
    static bool is_initialized() { return initialized_; }
    
    static CryptoResult generate_bytes(std::span<std::uint8_t> output);
    // Throws std::runtime_error when the generator is not initialized.
    static std::vector<std::uint8_t> generate_bytes(size_t count);
    
    // Uniform in [0, upper_bound) without modulo bias.
    static std::uint32_t generate_uniform(std::uint32_t upper_bound);
    
    // `length` symbols drawn independently and uniformly from `alphabet`.
    static std::string generate_symbols(std::string_view alphabet, size_t length);
    
    // `byte_count` random bytes as lowercase hex.
    static std::string generate_hex_id(size_t byte_count = 8);

private:
    static void require_initialized();
    
    static bool initialized_;
};

}
