#ifndef CLINIC_OPD_SECURITY_AUDIT_LOGGER_H
#define CLINIC_OPD_SECURITY_AUDIT_LOGGER_H

/**
 * @file audit_logger.h
 * @brief Audit trail of state-changing scheduling operations
 *
 * Audit writes are fire-and-forget: a failing sink is logged and counted
 * but never fails the operation that produced the event.
 *
 * @example Builder Pattern
 * ```cpp
 * audit.log_event(audit_action::appointment_cancelled, "appointment", id)
 *      .session(session)
 *      .property("reason", reason)
 *      .commit();
 * ```
 */

#include "clinic/opd/integration/database_adapter.h"
#include "clinic/opd/storage/timestamps.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace clinic::opd::security {

struct session_context;

// =============================================================================
// Audit Actions
// =============================================================================

enum class audit_action {
    appointment_created,
    appointment_walk_in,
    appointment_rescheduled,
    appointment_cancelled,
    appointment_confirmed,
    appointment_no_show,
    appointment_checked_in,
    consultation_started,
    consultation_completed,
    availability_created,
    availability_updated,
    availability_disabled,
    queue_rebuilt
};

[[nodiscard]] const char* to_string(audit_action action) noexcept;

// =============================================================================
// Audit Record
// =============================================================================

struct audit_record {
    std::chrono::system_clock::time_point timestamp;

    std::string tenant_id;

    /** Empty for system-initiated events */
    std::string user_id;

    audit_action action = audit_action::appointment_created;

    /** "appointment", "visit", "availability_template", "queue" */
    std::string entity_type;

    std::string entity_id;

    std::map<std::string, std::string> properties;

    /**
     * @brief Properties as a JSON object
     */
    [[nodiscard]] std::string details_json() const;
};

// =============================================================================
// Audit Sink
// =============================================================================

/**
 * @brief Destination for audit records
 */
class audit_sink {
public:
    virtual ~audit_sink() = default;

    /**
     * @return false if the record could not be stored
     */
    [[nodiscard]] virtual bool write(const audit_record& record) = 0;
};

/**
 * @brief Sink writing to the audit_log table
 */
class sqlite_audit_sink : public audit_sink {
public:
    explicit sqlite_audit_sink(std::shared_ptr<integration::database_adapter> adapter);

    [[nodiscard]] bool write(const audit_record& record) override;

private:
    std::shared_ptr<integration::database_adapter> adapter_;
};

// =============================================================================
// Audit Logger
// =============================================================================

class audit_logger {
public:
    /**
     * @brief Event builder for fluent API
     */
    class event_builder {
    public:
        event_builder(audit_logger& logger, audit_action action,
                      std::string_view entity_type, std::string_view entity_id);

        event_builder& session(const session_context& session);
        event_builder& tenant(std::string_view tenant_id);
        event_builder& property(std::string_view key, std::string_view value);
        event_builder& property(std::string_view key, int64_t value);

        void commit();

    private:
        audit_logger& logger_;
        audit_record record_;
    };

    /**
     * @param sink nullptr disables auditing
     */
    explicit audit_logger(std::shared_ptr<audit_sink> sink,
                          std::shared_ptr<const storage::clock> time_source =
                              storage::default_clock());

    [[nodiscard]] event_builder log_event(audit_action action,
                                          std::string_view entity_type,
                                          std::string_view entity_id);

    void log(audit_record record);

    struct statistics {
        std::size_t events_written = 0;
        std::size_t write_failures = 0;
    };

    [[nodiscard]] statistics get_statistics() const noexcept;

private:
    std::shared_ptr<audit_sink> sink_;
    std::shared_ptr<const storage::clock> clock_;
    std::atomic<std::size_t> events_written_{0};
    std::atomic<std::size_t> write_failures_{0};
};

}  // namespace clinic::opd::security

#endif  // CLINIC_OPD_SECURITY_AUDIT_LOGGER_H
