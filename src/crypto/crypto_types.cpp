#include "handoff/crypto/crypto_types.hpp"
#include <sodium.h>

namespace handoff::crypto {

namespace {

void wipe(void* bytes, size_t size) {
    if (size > 0) {
        sodium_memzero(bytes, size);
    }
}

}

SecureBytes::SecureBytes(size_t size) : data(size, 0) {}

SecureBytes::SecureBytes(const std::string& text) : data(text.begin(), text.end()) {}

SecureBytes::SecureBytes(std::span<const std::uint8_t> bytes) : data(bytes.begin(), bytes.end()) {}

SecureBytes::~SecureBytes() {
    clear();
}

// A moved-from vector is empty, so only one copy of the bytes survives.
SecureBytes::SecureBytes(SecureBytes&& other) noexcept : data(std::move(other.data)) {
    other.data.clear();
}

SecureBytes& SecureBytes::operator=(SecureBytes&& other) noexcept {
    if (this != &other) {
        clear();
        data = std::move(other.data);
        other.data.clear();
    }
    return *this;
}

void SecureBytes::clear() {
    wipe(data.data(), data.size());
    data.clear();
}

void secure_zero(std::string& text) {
    wipe(text.data(), text.size());
}

}
