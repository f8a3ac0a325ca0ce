#pragma once

#include "handoff/core/clock.hpp"
#include "handoff/core/limits.hpp"
#include "handoff/crypto/crypto_types.hpp"
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace handoff::security {

// 32 symbols; 0, O, 1 and I are left out because they are easy to confuse.
constexpr std::string_view ROOM_CODE_ALPHABET = "ABCDEFGHJKLMNPQRSTUVWXYZ23456789";

struct Session {
    std::string room_code;
    core::Clock::time_point created_at;
    core::Clock::time_point expires_at;
    std::optional<std::string> pin_hash;
};

std::string generate_room_code(size_t length = core::DEFAULT_ROOM_CODE_LENGTH);

// Strips dashes and upper-cases; comparisons always use this form.
std::string normalize_room_code(const std::string& code);

// "XXXX-XXXX" for an 8-symbol code, anything else is returned unchanged.
std::string format_room_code(const std::string& code,
                             size_t length = core::DEFAULT_ROOM_CODE_LENGTH);

bool is_valid_room_code_format(const std::string& code,
                               size_t length = core::DEFAULT_ROOM_CODE_LENGTH);
bool is_valid_pin_format(const std::string& pin, size_t length = core::DEFAULT_PIN_LENGTH);

class RoomRegistry {
public:
    RoomRegistry(const core::Clock& clock, core::SecurityLimits limits);
    
    Session issue();
    
    // Evicts the session when it has expired.
    bool is_valid(const std::string& code);
    std::optional<Session> get(const std::string& code);
    
    crypto::CryptoResult set_pin(const std::string& code, const std::string& pin_hash);
    bool destroy(const std::string& code);
    
    size_t cleanup_expired();
    size_t size() const { return sessions_.size(); }
    
    const core::SecurityLimits& limits() const { return limits_; }

private:
    const core::Clock& clock_;
    core::SecurityLimits limits_;
    std::map<std::string, Session> sessions_;
};

}
