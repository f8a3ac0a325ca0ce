#include <gtest/gtest.h>
#include "handoff/security/audit_log.hpp"
#include "handoff/crypto/random.hpp"
#include <algorithm>

using namespace handoff::security;

class AuditLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(handoff::crypto::SecureRandom::initialize());
    }
};

TEST_F(AuditLogTest, SanitizesSecretsPeerIdsAndPaths) {
    auto sanitized = sanitize_audit_details({
        {"pin", "1234"},
        {"hashedPin", "abcdef"},
        {"apiToken", "t"},
        {"peerId", "client-0123456789ab"},
        {"fileName", "/home/user/secret/report.pdf"},
        {"roomCode", "AB3D****"}
    });
    
    EXPECT_EQ(sanitized["pin"], "[REDACTED]");
    EXPECT_EQ(sanitized["hashedPin"], "[REDACTED]");
    EXPECT_EQ(sanitized["apiToken"], "[REDACTED]");
    EXPECT_EQ(sanitized["peerId"], "client-0...");
    EXPECT_EQ(sanitized["fileName"], "report.pdf");
    EXPECT_EQ(sanitized["roomCode"], "AB3D****");
}

TEST_F(AuditLogTest, RecordsWithDefaultSeverity) {
    AuditLog log;
    
    log.record(AuditEventType::ROOM_CREATED, {{"roomCode", "AB3D****"}});
    log.record(AuditEventType::PIN_FAILED);
    log.record(AuditEventType::TRANSFER_FAILED);
    
    auto events = log.events();
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].severity, AuditSeverity::INFO);
    EXPECT_EQ(events[1].severity, AuditSeverity::WARNING);
    EXPECT_EQ(events[2].severity, AuditSeverity::ERROR);
    EXPECT_FALSE(events[0].id.empty());
    EXPECT_NE(events[0].id, events[1].id);
}

TEST_F(AuditLogTest, KeepsOnlyMostRecentEvents) {
    AuditLog log(5);
    
    for (int i = 0; i < 12; ++i) {
        log.record(AuditEventType::CONNECTION_ATTEMPT, {{"n", std::to_string(i)}});
    }
    
    EXPECT_EQ(log.size(), 5u);
    auto events = log.events();
    EXPECT_EQ(events.front().details.at("n"), "7");
    EXPECT_EQ(events.back().details.at("n"), "11");
    
    auto last_two = log.recent(2);
    ASSERT_EQ(last_two.size(), 2u);
    EXPECT_EQ(last_two[0].details.at("n"), "10");
}

TEST_F(AuditLogTest, DefaultCapacityIsFifty) {
    AuditLog log;
    for (int i = 0; i < 60; ++i) {
        log.record(AuditEventType::CONNECTION_ATTEMPT);
    }
    EXPECT_EQ(log.size(), 50u);
}

TEST_F(AuditLogTest, QueriesByTypeAndSeverity) {
    AuditLog log;
    log.record(AuditEventType::PIN_FAILED);
    log.record(AuditEventType::PIN_VERIFIED);
    log.record(AuditEventType::PIN_FAILED);
    log.record(AuditEventType::ERROR, {}, AuditSeverity::ERROR);
    
    EXPECT_EQ(log.by_type(AuditEventType::PIN_FAILED).size(), 2u);
    EXPECT_EQ(log.by_severity(AuditSeverity::WARNING).size(), 2u);
    EXPECT_EQ(log.by_severity(AuditSeverity::ERROR).size(), 1u);
    
    log.clear();
    EXPECT_EQ(log.size(), 0u);
}

TEST_F(AuditLogTest, SinkRecordsSanitizedDetails) {
    AuditLog log;
    auto sink = log.sink();
    
    sink(AuditEventType::PIN_SET, {{"pin", "9999"}});
    
    ASSERT_EQ(log.size(), 1u);
    EXPECT_EQ(log.events()[0].details.at("pin"), "[REDACTED]");
}

TEST_F(AuditLogTest, ExportTextHasOneLinePerEvent) {
    AuditLog log;
    log.record(AuditEventType::ROOM_CREATED, {{"roomCode", "AB3D****"}});
    log.record(AuditEventType::CONNECTION_DENIED, {{"reason", "busy"}});
    
    auto text = log.export_text();
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 2);
    EXPECT_NE(text.find(audit_event_name(AuditEventType::ROOM_CREATED)), std::string::npos);
    EXPECT_NE(text.find("reason=busy"), std::string::npos);
}
