#include "handoff/security/room_registry.hpp"
#include "handoff/crypto/random.hpp"
#include "handoff/core/logger.hpp"
#include <algorithm>
#include <cctype>

namespace handoff::security {

std::string generate_room_code(size_t length) {
    return crypto::SecureRandom::generate_symbols(ROOM_CODE_ALPHABET, length);
}

std::string normalize_room_code(const std::string& code) {
    std::string normalized;
    normalized.reserve(code.size());
    for (char c : code) {
        if (c == '-') continue;
        normalized.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return normalized;
}

std::string format_room_code(const std::string& code, size_t length) {
    auto normalized = normalize_room_code(code);
    if (normalized.size() != length || length % 2 != 0) {
        return code;
    }
    return normalized.substr(0, length / 2) + "-" + normalized.substr(length / 2);
}

bool is_valid_room_code_format(const std::string& code, size_t length) {
    auto normalized = normalize_room_code(code);
    if (normalized.size() != length) {
        return false;
    }
    return std::all_of(normalized.begin(), normalized.end(), [](char c) {
        return ROOM_CODE_ALPHABET.find(c) != std::string_view::npos;
    });
}

bool is_valid_pin_format(const std::string& pin, size_t length) {
    return pin.size() == length &&
           std::all_of(pin.begin(), pin.end(), [](char c) { return c >= '0' && c <= '9'; });
}

RoomRegistry::RoomRegistry(const core::Clock& clock, core::SecurityLimits limits)
    : clock_(clock)
    , limits_(limits) {}

Session RoomRegistry::issue() {
    cleanup_expired();
    
    std::string code;
    do {
        code = generate_room_code(limits_.room_code_length);
    } while (sessions_.count(code) > 0);
    
    auto now = clock_.now();
    Session session{code, now, now + limits_.room_code_expiry, std::nullopt};
    sessions_[code] = session;
    
    LOG_DEBUG("Issued room {}", format_room_code(code, limits_.room_code_length));
    return session;
}

bool RoomRegistry::is_valid(const std::string& code) {
    auto it = sessions_.find(normalize_room_code(code));
    if (it == sessions_.end()) {
        return false;
    }
    
    if (clock_.now() > it->second.expires_at) {
        LOG_DEBUG("Room {} expired", it->first);
        sessions_.erase(it);
        return false;
    }
    
    return true;
}

std::optional<Session> RoomRegistry::get(const std::string& code) {
    if (!is_valid(code)) {
        return std::nullopt;
    }
    return sessions_.at(normalize_room_code(code));
}

crypto::CryptoResult RoomRegistry::set_pin(const std::string& code, const std::string& pin_hash) {
    if (!is_valid(code)) {
        return crypto::CryptoResult(crypto::CryptoError::INVALID_STATE, "Unknown or expired room code");
    }
    if (pin_hash.size() != crypto::SHA256_HASH_SIZE * 2) {
        return crypto::CryptoResult(crypto::CryptoError::INVALID_INPUT, "PIN hash must be a hex SHA-256 digest");
    }
    
    sessions_[normalize_room_code(code)].pin_hash = pin_hash;
    return crypto::CryptoResult();
}

bool RoomRegistry::destroy(const std::string& code) {
    return sessions_.erase(normalize_room_code(code)) > 0;
}

size_t RoomRegistry::cleanup_expired() {
    auto now = clock_.now();
    size_t removed = 0;
    
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (now > it->second.expires_at) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    
    return removed;
}

}
