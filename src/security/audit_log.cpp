#include "handoff/security/audit_log.hpp"
#include "handoff/core/clock.hpp"
#include "handoff/core/logger.hpp"
#include "handoff/core/utils.hpp"
#include "handoff/crypto/random.hpp"
#include <algorithm>
#include <iterator>
#include <sstream>

namespace handoff::security {

namespace {

bool key_contains(const std::string& lower_key, std::initializer_list<const char*> needles) {
    return std::any_of(needles.begin(), needles.end(), [&](const char* needle) {
        return lower_key.find(needle) != std::string::npos;
    });
}

std::string format_details(const AuditDetails& details) {
    std::ostringstream oss;
    bool first = true;
    for (const auto& [key, value] : details) {
        if (!first) oss << ' ';
        oss << key << '=' << value;
        first = false;
    }
    return oss.str();
}

}

std::string audit_event_name(AuditEventType type) {
    switch (type) {
        case AuditEventType::ROOM_CREATED: return "room_created";
        case AuditEventType::CONNECTION_ATTEMPT: return "connection_attempt";
        case AuditEventType::CONNECTION_APPROVED: return "connection_approved";
        case AuditEventType::CONNECTION_DENIED: return "connection_denied";
        case AuditEventType::PIN_SET: return "pin_set";
        case AuditEventType::PIN_VERIFIED: return "pin_verified";
        case AuditEventType::PIN_FAILED: return "pin_failed";
        case AuditEventType::FILE_VALIDATION_PASSED: return "file_validation_passed";
        case AuditEventType::FILE_VALIDATION_FAILED: return "file_validation_failed";
        case AuditEventType::TRANSFER_STARTED: return "transfer_started";
        case AuditEventType::TRANSFER_COMPLETED: return "transfer_completed";
        case AuditEventType::TRANSFER_FAILED: return "transfer_failed";
        case AuditEventType::RATE_LIMIT_EXCEEDED: return "rate_limit_exceeded";
        case AuditEventType::SESSION_TIMEOUT: return "session_timeout";
        case AuditEventType::ERROR: return "error";
    }
    return "unknown";
}

std::string audit_severity_name(AuditSeverity severity) {
    switch (severity) {
        case AuditSeverity::INFO: return "info";
        case AuditSeverity::WARNING: return "warning";
        case AuditSeverity::ERROR: return "error";
    }
    return "unknown";
}

AuditSeverity default_severity(AuditEventType type) {
    switch (type) {
        case AuditEventType::CONNECTION_DENIED:
        case AuditEventType::PIN_FAILED:
        case AuditEventType::FILE_VALIDATION_FAILED:
        case AuditEventType::RATE_LIMIT_EXCEEDED:
        case AuditEventType::SESSION_TIMEOUT:
            return AuditSeverity::WARNING;
        case AuditEventType::TRANSFER_FAILED:
        case AuditEventType::ERROR:
            return AuditSeverity::ERROR;
        default:
            return AuditSeverity::INFO;
    }
}

AuditDetails sanitize_audit_details(const AuditDetails& details) {
    AuditDetails sanitized;
    
    for (const auto& [key, value] : details) {
        auto lower = core::utils::StringUtils::to_lower(key);
        
        if (key_contains(lower, {"pin", "password", "token", "secret", "key"})) {
            sanitized[key] = "[REDACTED]";
        } else if (key_contains(lower, {"peerid", "peer_id"})) {
            sanitized[key] = value.substr(0, 8) + "...";
        } else if (key_contains(lower, {"filename", "file_name"})) {
            auto pos = value.find_last_of("/\\");
            sanitized[key] = pos == std::string::npos ? value : value.substr(pos + 1);
        } else {
            sanitized[key] = value;
        }
    }
    
    return sanitized;
}

AuditLog::AuditLog(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

const AuditEvent& AuditLog::record(AuditEventType type, const AuditDetails& details) {
    return record(type, details, default_severity(type));
}

const AuditEvent& AuditLog::record(AuditEventType type, const AuditDetails& details, AuditSeverity severity) {
    AuditEvent event;
    event.timestamp_ms = core::unix_time_ms();
    event.id = std::to_string(event.timestamp_ms) + "-" + crypto::SecureRandom::generate_hex_id(3);
    event.type = type;
    event.details = sanitize_audit_details(details);
    event.severity = severity;
    
    switch (severity) {
        case AuditSeverity::INFO:
            LOG_INFO("[audit] {} {}", audit_event_name(type), format_details(event.details));
            break;
        case AuditSeverity::WARNING:
            LOG_WARN("[audit] {} {}", audit_event_name(type), format_details(event.details));
            break;
        case AuditSeverity::ERROR:
            LOG_ERROR("[audit] {} {}", audit_event_name(type), format_details(event.details));
            break;
    }
    
    events_.push_back(std::move(event));
    while (events_.size() > capacity_) {
        events_.pop_front();
    }
    
    return events_.back();
}

AuditSink AuditLog::sink() {
    return [this](AuditEventType type, const AuditDetails& details) {
        record(type, details);
    };
}

std::vector<AuditEvent> AuditLog::events() const {
    return {events_.begin(), events_.end()};
}

std::vector<AuditEvent> AuditLog::recent(size_t count) const {
    auto start = events_.size() > count ? events_.end() - static_cast<std::ptrdiff_t>(count) : events_.begin();
    return {start, events_.end()};
}

std::vector<AuditEvent> AuditLog::by_type(AuditEventType type) const {
    std::vector<AuditEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
                 [type](const AuditEvent& e) { return e.type == type; });
    return result;
}

std::vector<AuditEvent> AuditLog::by_severity(AuditSeverity severity) const {
    std::vector<AuditEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
                 [severity](const AuditEvent& e) { return e.severity == severity; });
    return result;
}

void AuditLog::clear() {
    events_.clear();
    LOG_DEBUG("[audit] log cleared");
}

std::string AuditLog::export_text() const {
    std::ostringstream oss;
    for (const auto& event : events_) {
        oss << core::utils::TimeUtils::format_timestamp(event.timestamp_ms)
            << " [" << audit_severity_name(event.severity) << "] "
            << audit_event_name(event.type);
        auto details = format_details(event.details);
        if (!details.empty()) {
            oss << ' ' << details;
        }
        oss << '\n';
    }
    return oss.str();
}

}
