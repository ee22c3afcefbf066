/**
 * @file audit_logger_test.cpp
 * @brief Unit tests for the audit trail
 *
 * @see include/clinic/opd/security/audit_logger.h
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "clinic/opd/security/access_guard.h"
#include "clinic/opd/security/audit_logger.h"
#include "utils/test_helpers.h"

#include <nlohmann/json.hpp>

namespace clinic::opd::security {
namespace {

using namespace ::testing;

class MockAuditSink : public audit_sink {
public:
    MOCK_METHOD(bool, write, (const audit_record& record), (override));
};

// =============================================================================
// Builder and Statistics
// =============================================================================

class AuditLoggerTest : public Test {
protected:
    std::shared_ptr<test::manual_clock> clock_ =
        std::make_shared<test::manual_clock>(test::utc(2025, 1, 6, 9, 30));
    std::shared_ptr<MockAuditSink> sink_ = std::make_shared<MockAuditSink>();
};

TEST_F(AuditLoggerTest, BuilderFillsRecord) {
    audit_record captured;
    EXPECT_CALL(*sink_, write(_)).WillOnce(DoAll(SaveArg<0>(&captured), Return(true)));

    audit_logger audit(sink_, clock_);
    audit.log_event(audit_action::appointment_cancelled, "appointment", "appt-1")
        .session(test::cardiology_staff())
        .property("reason", "Patient travelling")
        .property("token", int64_t{7})
        .commit();

    EXPECT_EQ(captured.action, audit_action::appointment_cancelled);
    EXPECT_EQ(captured.tenant_id, test::tenant);
    EXPECT_EQ(captured.user_id, "user-frontdesk");
    EXPECT_EQ(captured.entity_type, "appointment");
    EXPECT_EQ(captured.entity_id, "appt-1");
    EXPECT_EQ(captured.timestamp, clock_->now());
    EXPECT_THAT(captured.properties,
                UnorderedElementsAre(Pair("reason", "Patient travelling"), Pair("token", "7")));

    EXPECT_EQ(audit.get_statistics().events_written, 1u);
}

TEST_F(AuditLoggerTest, FailingSinkIsCountedNotThrown) {
    EXPECT_CALL(*sink_, write(_)).WillRepeatedly(Return(false));

    audit_logger audit(sink_, clock_);
    EXPECT_NO_THROW(
        audit.log_event(audit_action::queue_rebuilt, "queue", "tenant-a").tenant("tenant-a").commit());
    EXPECT_NO_THROW(
        audit.log_event(audit_action::queue_rebuilt, "queue", "tenant-a").tenant("tenant-a").commit());

    auto stats = audit.get_statistics();
    EXPECT_EQ(stats.events_written, 0u);
    EXPECT_EQ(stats.write_failures, 2u);
}

TEST_F(AuditLoggerTest, NullSinkDisablesAuditing) {
    audit_logger audit(nullptr, clock_);
    audit.log_event(audit_action::appointment_created, "appointment", "a").commit();
    EXPECT_EQ(audit.get_statistics().events_written, 0u);
    EXPECT_EQ(audit.get_statistics().write_failures, 0u);
}

TEST(AuditActionTest, NamesAreUpperSnakeCase) {
    EXPECT_STREQ(to_string(audit_action::appointment_walk_in), "APPOINTMENT_WALK_IN");
    EXPECT_STREQ(to_string(audit_action::consultation_started), "CONSULTATION_STARTED");
}

TEST(AuditRecordTest, DetailsJsonEscapes) {
    audit_record record;
    record.properties["reason"] = "said \"later\"";
    auto details = nlohmann::json::parse(record.details_json());
    EXPECT_EQ(details["reason"], "said \"later\"");
}

// =============================================================================
// SQLite Sink
// =============================================================================

class SqliteAuditSinkTest : public test::store_test {};

TEST_F(SqliteAuditSinkTest, WritesRow) {
    audit_logger audit(std::make_shared<sqlite_audit_sink>(adapter_), clock_);
    audit.log_event(audit_action::consultation_started, "visit", "visit-1")
        .session(test::cardiology_staff())
        .property("forced", "true")
        .commit();

    EXPECT_EQ(test::query_text(*adapter_,
                               "SELECT action FROM audit_log WHERE entity_id = 'visit-1'"),
              "CONSULTATION_STARTED");
    EXPECT_EQ(test::query_text(*adapter_,
                               "SELECT created_at FROM audit_log WHERE entity_id = 'visit-1'"),
              "2025-01-06 08:00:00.000");

    auto details = nlohmann::json::parse(test::query_text(
        *adapter_, "SELECT details FROM audit_log WHERE entity_id = 'visit-1'"));
    EXPECT_EQ(details["forced"], "true");
}

TEST_F(SqliteAuditSinkTest, SystemEventsHaveNoUser) {
    audit_logger audit(std::make_shared<sqlite_audit_sink>(adapter_), clock_);
    audit.log_event(audit_action::queue_rebuilt, "queue", test::tenant)
        .tenant(test::tenant)
        .commit();

    EXPECT_EQ(test::query_int(*adapter_,
                              "SELECT COUNT(*) FROM audit_log WHERE user_id IS NULL"),
              1);
}

TEST_F(SqliteAuditSinkTest, MissingTableCountsFailure) {
    test::exec_sql(*adapter_, "DROP TABLE audit_log");

    audit_logger audit(std::make_shared<sqlite_audit_sink>(adapter_), clock_);
    audit.log_event(audit_action::appointment_created, "appointment", "a")
        .tenant(test::tenant)
        .commit();

    EXPECT_EQ(audit.get_statistics().write_failures, 1u);
}

}  // namespace
}  // namespace clinic::opd::security
