/**
 * @file audit_logger.cpp
 * @brief Audit logger and SQLite sink
 */

#include "clinic/opd/security/audit_logger.h"

#include "clinic/opd/integration/logger_adapter.h"
#include "clinic/opd/security/access_guard.h"

#include <nlohmann/json.hpp>

#include <format>

namespace clinic::opd::security {

namespace {

integration::logger_adapter& audit_log() {
    static auto logger = integration::create_logger("audit");
    return *logger;
}

}  // namespace

const char* to_string(audit_action action) noexcept {
    switch (action) {
        case audit_action::appointment_created:
            return "APPOINTMENT_CREATED";
        case audit_action::appointment_walk_in:
            return "APPOINTMENT_WALK_IN";
        case audit_action::appointment_rescheduled:
            return "APPOINTMENT_RESCHEDULED";
        case audit_action::appointment_cancelled:
            return "APPOINTMENT_CANCELLED";
        case audit_action::appointment_confirmed:
            return "APPOINTMENT_CONFIRMED";
        case audit_action::appointment_no_show:
            return "APPOINTMENT_NO_SHOW";
        case audit_action::appointment_checked_in:
            return "APPOINTMENT_CHECKED_IN";
        case audit_action::consultation_started:
            return "CONSULTATION_STARTED";
        case audit_action::consultation_completed:
            return "CONSULTATION_COMPLETED";
        case audit_action::availability_created:
            return "AVAILABILITY_CREATED";
        case audit_action::availability_updated:
            return "AVAILABILITY_UPDATED";
        case audit_action::availability_disabled:
            return "AVAILABILITY_DISABLED";
        case audit_action::queue_rebuilt:
            return "QUEUE_REBUILT";
        default:
            return "UNKNOWN";
    }
}

std::string audit_record::details_json() const {
    nlohmann::json details = nlohmann::json::object();
    for (const auto& [key, value] : properties) {
        details[key] = value;
    }
    return details.dump();
}

// =============================================================================
// SQLite Sink
// =============================================================================

sqlite_audit_sink::sqlite_audit_sink(
    std::shared_ptr<integration::database_adapter> adapter)
    : adapter_(std::move(adapter)) {}

bool sqlite_audit_sink::write(const audit_record& record) {
    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return false;
    }

    auto& conn = scope->connection();
    auto result = conn.query(
        "INSERT INTO audit_log (tenant_id, user_id, action, entity_type, "
        "entity_id, details, created_at) VALUES (?, ?, ?, ?, ?, ?, ?)",
        {record.tenant_id,
         record.user_id.empty() ? integration::database_value{}
                                : integration::database_value{record.user_id},
         std::string(to_string(record.action)), record.entity_type,
         record.entity_id, record.details_json(),
         storage::to_timestamp(record.timestamp)});
    if (!result) {
        audit_log().warning(std::format("Audit insert failed: {}", conn.last_error()));
        return false;
    }
    return true;
}

// =============================================================================
// Event Builder
// =============================================================================

audit_logger::event_builder::event_builder(audit_logger& logger, audit_action action,
                                           std::string_view entity_type,
                                           std::string_view entity_id)
    : logger_(logger) {
    record_.action = action;
    record_.entity_type = std::string(entity_type);
    record_.entity_id = std::string(entity_id);
}

audit_logger::event_builder& audit_logger::event_builder::session(
    const session_context& session) {
    record_.tenant_id = session.tenant_id;
    record_.user_id = session.user_id;
    return *this;
}

audit_logger::event_builder& audit_logger::event_builder::tenant(
    std::string_view tenant_id) {
    record_.tenant_id = std::string(tenant_id);
    return *this;
}

audit_logger::event_builder& audit_logger::event_builder::property(
    std::string_view key, std::string_view value) {
    record_.properties[std::string(key)] = std::string(value);
    return *this;
}

audit_logger::event_builder& audit_logger::event_builder::property(
    std::string_view key, int64_t value) {
    record_.properties[std::string(key)] = std::to_string(value);
    return *this;
}

void audit_logger::event_builder::commit() {
    logger_.log(std::move(record_));
}

// =============================================================================
// Audit Logger
// =============================================================================

audit_logger::audit_logger(std::shared_ptr<audit_sink> sink,
                           std::shared_ptr<const storage::clock> time_source)
    : sink_(std::move(sink)), clock_(std::move(time_source)) {}

audit_logger::event_builder audit_logger::log_event(audit_action action,
                                                    std::string_view entity_type,
                                                    std::string_view entity_id) {
    return event_builder(*this, action, entity_type, entity_id);
}

void audit_logger::log(audit_record record) {
    if (!sink_) {
        return;
    }
    if (record.timestamp == std::chrono::system_clock::time_point{}) {
        record.timestamp = clock_->now();
    }

    if (sink_->write(record)) {
        events_written_.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    write_failures_.fetch_add(1, std::memory_order_relaxed);
    audit_log().warning(std::format("Dropped audit event {} {}/{}",
                                    to_string(record.action), record.entity_type,
                                    record.entity_id));
}

audit_logger::statistics audit_logger::get_statistics() const noexcept {
    return {events_written_.load(std::memory_order_relaxed),
            write_failures_.load(std::memory_order_relaxed)};
}

}  // namespace clinic::opd::security
