#include "handoff/crypto/hash.hpp"
#include <sodium.h>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace handoff::crypto {

struct Sha256Hasher::Impl {
    crypto_hash_sha256_state state;
};

Sha256Hasher::Sha256Hasher() 
    : impl_(std::make_unique<Impl>())
    , finalized_(false) {
    crypto_hash_sha256_init(&impl_->state);
}

Sha256Hasher::~Sha256Hasher() = default;
Sha256Hasher::Sha256Hasher(Sha256Hasher&&) noexcept = default;
Sha256Hasher& Sha256Hasher::operator=(Sha256Hasher&&) noexcept = default;

CryptoResult Sha256Hasher::update(std::span<const std::uint8_t> data) {
    if (!impl_ || finalized_) {
        return CryptoResult(CryptoError::INVALID_STATE, "Hasher already finalized");
    }
    
    if (crypto_hash_sha256_update(&impl_->state, data.data(), data.size()) != 0) {
        return CryptoResult(CryptoError::HASH_FAILED, "Failed to update hash");
    }
    
    return CryptoResult();
}

Sha256Hash Sha256Hasher::finalize() {
    if (!impl_ || finalized_) {
        throw std::runtime_error("Hasher already finalized");
    }
    
    Sha256Hash result;
    if (crypto_hash_sha256_final(&impl_->state, result.data()) != 0) {
        throw std::runtime_error("Failed to finalize hash");
    }
    
    finalized_ = true;
    return result;
}

void Sha256Hasher::reset() {
    if (!impl_) {
        impl_ = std::make_unique<Impl>();
    }
    crypto_hash_sha256_init(&impl_->state);
    finalized_ = false;
}

Sha256Hash Sha256Hasher::hash(std::span<const std::uint8_t> data) {
    Sha256Hash result;
    crypto_hash_sha256(result.data(), data.data(), data.size());
    return result;
}

namespace hash_utils {

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (auto byte : bytes) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

std::string hash_to_hex(const Sha256Hash& hash) {
    return to_hex(std::span(hash));
}

std::optional<Sha256Hash> hash_from_hex(const std::string& hex_string) {
    if (hex_string.length() != SHA256_HASH_SIZE * 2) {
        return std::nullopt;
    }
    
    Sha256Hash hash;
    size_t bin_len = 0;
    if (sodium_hex2bin(hash.data(), hash.size(), hex_string.data(), hex_string.size(),
                       nullptr, &bin_len, nullptr) != 0 || bin_len != hash.size()) {
        return std::nullopt;
    }
    
    return hash;
}

Sha256Hash hash_string(const std::string& str) {
    std::span<const std::uint8_t> data(reinterpret_cast<const std::uint8_t*>(str.data()), str.size());
    return Sha256Hasher::hash(data);
}

std::string chunk_checksum(std::span<const std::uint8_t> data) {
    auto digest = Sha256Hasher::hash(data);
    return to_hex(std::span(digest).first(CHUNK_CHECKSUM_BYTES));
}

std::string hash_pin(const SecureBytes& pin) {
    auto digest = Sha256Hasher::hash(pin.span());
    return hash_to_hex(digest);
}

std::string hash_pin(const std::string& pin) {
    SecureBytes bytes(pin);
    return hash_pin(bytes);
}

bool constant_time_equals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
}

}

}
