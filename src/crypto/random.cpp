#include "handoff/crypto/random.hpp"
#include "handoff/crypto/hash.hpp"
#include "handoff/core/logger.hpp"
#include <sodium.h>
#include <stdexcept>

namespace handoff::crypto {

bool SecureRandom::initialized_ = false;

bool SecureRandom::initialize() {
    if (initialized_) {
        return true;
    }
    
    // sodium_init returns 1 when another component already initialized it.
    if (sodium_init() < 0) {
        LOG_CRITICAL("libsodium could not be initialized; room codes and ids are unavailable");
        return false;
    }
    
    initialized_ = true;
    return true;
}

void SecureRandom::require_initialized() {
    if (!initialized_) {
        throw std::runtime_error("SecureRandom::initialize() has not succeeded");
    }
}

CryptoResult SecureRandom::generate_bytes(std::span<std::uint8_t> output) {
    if (!initialized_) {
        return {CryptoError::INVALID_STATE, "Random generator not initialized"};
    }
    if (output.empty()) {
        return {CryptoError::BUFFER_TOO_SMALL, "Output buffer is empty"};
    }
    
    randombytes_buf(output.data(), output.size());
    return {};
}

std::vector<std::uint8_t> SecureRandom::generate_bytes(size_t count) {
    require_initialized();
    std::vector<std::uint8_t> bytes(count);
    if (count > 0) {
        randombytes_buf(bytes.data(), bytes.size());
    }
    return bytes;
}

std::uint32_t SecureRandom::generate_uniform(std::uint32_t upper_bound) {
    require_initialized();
    return randombytes_uniform(upper_bound);
}

std::string SecureRandom::generate_symbols(std::string_view alphabet, size_t length) {
    if (alphabet.empty()) {
        throw std::invalid_argument("Symbol alphabet is empty");
    }
    require_initialized();
    
    std::string symbols;
    symbols.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        symbols.push_back(alphabet[randombytes_uniform(static_cast<std::uint32_t>(alphabet.size()))]);
    }
    return symbols;
}

std::string SecureRandom::generate_hex_id(size_t byte_count) {
    return hash_utils::to_hex(generate_bytes(byte_count));
}

}
