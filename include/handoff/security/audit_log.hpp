#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace handoff::security {

enum class AuditEventType {
    ROOM_CREATED,
    CONNECTION_ATTEMPT,
    CONNECTION_APPROVED,
    CONNECTION_DENIED,
    PIN_SET,
    PIN_VERIFIED,
    PIN_FAILED,
    FILE_VALIDATION_PASSED,
    FILE_VALIDATION_FAILED,
    TRANSFER_STARTED,
    TRANSFER_COMPLETED,
    TRANSFER_FAILED,
    RATE_LIMIT_EXCEEDED,
    SESSION_TIMEOUT,
    ERROR
};

enum class AuditSeverity {
    INFO,
    WARNING,
    ERROR
};

using AuditDetails = std::map<std::string, std::string>;

// Called synchronously by the core; implementations must not block.
using AuditSink = std::function<void(AuditEventType, const AuditDetails&)>;

struct AuditEvent {
    std::string id;
    std::uint64_t timestamp_ms;
    AuditEventType type;
    AuditDetails details;
    AuditSeverity severity;
};

std::string audit_event_name(AuditEventType type);
std::string audit_severity_name(AuditSeverity severity);
AuditSeverity default_severity(AuditEventType type);

// Redacts secrets, shortens peer ids and strips directories from file names.
AuditDetails sanitize_audit_details(const AuditDetails& details);

// In-memory ring buffer of the most recent events.
class AuditLog {
public:
    static constexpr size_t DEFAULT_CAPACITY = 50;
    
    explicit AuditLog(size_t capacity = DEFAULT_CAPACITY);
    
    const AuditEvent& record(AuditEventType type, const AuditDetails& details = {});
    const AuditEvent& record(AuditEventType type, const AuditDetails& details, AuditSeverity severity);
    
    AuditSink sink();
    
    std::vector<AuditEvent> events() const;
    std::vector<AuditEvent> recent(size_t count = 10) const;
    std::vector<AuditEvent> by_type(AuditEventType type) const;
    std::vector<AuditEvent> by_severity(AuditSeverity severity) const;
    
    void clear();
    size_t size() const { return events_.size(); }
    size_t capacity() const { return capacity_; }
    
    // One line per event: "<iso time> [<severity>] <event> key=value ...".
    std::string export_text() const;

private:
    size_t capacity_;
    std::deque<AuditEvent> events_;
};

}
