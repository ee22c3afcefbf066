#ifndef CLINIC_OPD_SCHEDULING_AVAILABILITY_SERVICE_H
#define CLINIC_OPD_SCHEDULING_AVAILABILITY_SERVICE_H

/**
 * @file availability_service.h
 * @brief Recurring availability templates and slot projection
 *
 * A template describes one weekly window of a practitioner in a
 * department ("MONDAY 09:00-13:00, 15 minute slots"). Slots are never
 * stored: each window is subdivided at read time into start times t with
 * t + duration <= end, and each slot is flagged against the day's
 * bookings.
 *
 * Active templates of one practitioner may not overlap on the same day,
 * across departments as well.
 */

#include "clinic/opd/config/scheduler_config.h"
#include "clinic/opd/integration/database_adapter.h"
#include "clinic/opd/scheduling/scheduling_error.h"
#include "clinic/opd/scheduling/scheduling_types.h"
#include "clinic/opd/security/access_guard.h"
#include "clinic/opd/security/audit_logger.h"
#include "clinic/opd/storage/timestamps.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clinic::opd::scheduling {

// =============================================================================
// Slot Projection
// =============================================================================

enum class slot_block_reason {
    /** An appointment holding the slot overlaps it */
    booked,

    /** Practitioner is ON_LEAVE or INACTIVE */
    practitioner_unavailable,

    /** Template belongs to another department than the one requested */
    department_mismatch
};

[[nodiscard]] std::string_view to_string(slot_block_reason reason) noexcept;

struct slot {
    std::string start_time;
    std::string end_time;
    bool available = false;
    std::optional<slot_block_reason> blocked_by;
    std::string template_id;
    std::string department_id;
};

/**
 * @brief Slots of one practitioner on one date plus day totals
 *
 * Totals count only slots of the requested department (all departments
 * when none was requested).
 */
struct day_slots {
    std::string practitioner_id;
    std::string practitioner_name;
    practitioner_status status = practitioner_status::active;
    std::string date;
    day_of_week day = day_of_week::monday;
    std::vector<slot> slots;

    int total_capacity = 0;

    /** Active bookings of the practitioner that day */
    int booked_count = 0;

    int available_count = 0;

    /** Smallest daily cap among the matching templates */
    std::optional<int> max_patients_per_day;

    bool is_day_full = false;
    bool allow_walk_in = false;
};

// =============================================================================
// Template Requests
// =============================================================================

/**
 * @brief Window and booking rules of a template
 */
struct availability_window {
    std::string start_time;
    std::string end_time;

    /** nullopt uses booking.default_slot_duration */
    std::optional<int> slot_duration_minutes;

    std::optional<int> max_patients_per_day;
    bool allow_walk_in = true;
    int walk_in_slots = 0;
    std::optional<std::string> effective_from;
    std::optional<std::string> effective_to;
};

/**
 * @brief Partial update; unset fields keep their value
 */
struct template_changes {
    std::optional<std::string> start_time;
    std::optional<std::string> end_time;
    std::optional<int> slot_duration_minutes;

    /** Set to reset_daily_cap to remove the cap */
    std::optional<int> max_patients_per_day;
    bool reset_daily_cap = false;

    std::optional<bool> allow_walk_in;
    std::optional<int> walk_in_slots;
    std::optional<std::string> effective_from;
    std::optional<std::string> effective_to;
    std::optional<template_status> status;
};

struct template_filter {
    std::optional<std::string> practitioner_id;
    std::optional<std::string> department_id;
    std::optional<day_of_week> day;
    bool include_inactive = false;
};

/**
 * @brief Booking request checked against availability
 */
struct slot_request {
    std::string practitioner_id;
    std::string department_id;
    std::string date;
    std::string time;
    bool walk_in = false;
};

/**
 * @brief Window a validated booking falls into
 */
struct slot_reservation {
    std::string template_id;
    std::string end_time;
};

// =============================================================================
// Availability Service
// =============================================================================

class availability_service {
public:
    availability_service(std::shared_ptr<integration::database_adapter> adapter,
                         config::booking_config booking,
                         std::shared_ptr<security::audit_logger> audit = nullptr,
                         std::shared_ptr<const storage::clock> time_source =
                             storage::default_clock());

    /**
     * @brief Project the bookable slots of a practitioner on a date
     *
     * Pure read. Requires SLOTS_VIEW; when @p department_id is given the
     * caller must be assigned to it.
     */
    [[nodiscard]] scheduling_result<day_slots> get_doctor_day_slots(
        const security::session_context& session,
        std::string_view practitioner_id,
        std::string_view date,
        const std::optional<std::string>& department_id = std::nullopt);

    /**
     * @brief Create one template per day in a single transaction
     *
     * Fails with AVAILABILITY_OVERLAP, naming the conflicting window, when
     * any day overlaps an active template or repeats within @p days.
     */
    [[nodiscard]] scheduling_result<std::vector<availability_template>>
    bulk_create_availability(const security::session_context& session,
                             std::string_view practitioner_id,
                             std::string_view department_id,
                             const std::vector<day_of_week>& days,
                             const availability_window& window);

    [[nodiscard]] scheduling_result<availability_template> create_template(
        const security::session_context& session,
        std::string_view practitioner_id,
        std::string_view department_id,
        day_of_week day,
        const availability_window& window);

    /**
     * @brief Apply @p changes if the stored version is @p expected_version
     *
     * The version increments on success; a mismatch is VERSION_CONFLICT.
     */
    [[nodiscard]] scheduling_result<availability_template> update_template(
        const security::session_context& session,
        std::string_view template_id,
        const template_changes& changes,
        int64_t expected_version);

    /**
     * @brief Duplicate a template's window onto other days
     */
    [[nodiscard]] scheduling_result<std::vector<availability_template>> copy_to_days(
        const security::session_context& session,
        std::string_view template_id,
        const std::vector<day_of_week>& days);

    /**
     * @brief Deactivate every active template of a practitioner/department/day
     * @return Number of templates deactivated
     */
    [[nodiscard]] scheduling_result<std::size_t> disable_day(
        const security::session_context& session,
        std::string_view practitioner_id,
        std::string_view department_id,
        day_of_week day);

    /**
     * @brief Templates in the caller's departments, in weekday order
     */
    [[nodiscard]] scheduling_result<std::vector<availability_template>> list_templates(
        const security::session_context& session,
        const template_filter& filter);

    /**
     * @brief Check whether a booking fits the availability
     *
     * Order of checks: a template covers the time, the practitioner is
     * ACTIVE, walk-ins are allowed, the slot is free, the daily cap is not
     * reached.
     */
    [[nodiscard]] scheduling_result<slot_reservation> validate_slot_booking(
        const security::session_context& session,
        const slot_request& request);

    /**
     * @brief validate_slot_booking() on the caller's connection
     *
     * Used inside booking transactions; performs no access checks.
     */
    [[nodiscard]] scheduling_result<slot_reservation> check_slot(
        integration::database_connection& conn,
        std::string_view tenant_id,
        const slot_request& request);

    /**
     * @brief First available slot of the department starting at or after
     *        @p not_before ("HH:MM")
     */
    [[nodiscard]] scheduling_result<std::optional<slot>> next_available_slot(
        const security::session_context& session,
        std::string_view practitioner_id,
        std::string_view department_id,
        std::string_view date,
        std::string_view not_before);

    /**
     * @brief next_available_slot() on the caller's connection
     */
    [[nodiscard]] scheduling_result<std::optional<slot>> find_next_slot(
        integration::database_connection& conn,
        std::string_view tenant_id,
        std::string_view practitioner_id,
        std::string_view department_id,
        std::string_view date,
        std::string_view not_before);

    [[nodiscard]] const config::booking_config& booking_rules() const noexcept {
        return booking_;
    }

private:
    [[nodiscard]] scheduling_result<day_slots> project_day(
        integration::database_connection& conn,
        std::string_view tenant_id,
        std::string_view practitioner_id,
        std::string_view date,
        const std::optional<std::string>& department_id);

    void audit_template(const security::session_context& session,
                        security::audit_action action,
                        const availability_template& tmpl);

    std::shared_ptr<integration::database_adapter> adapter_;
    config::booking_config booking_;
    std::shared_ptr<security::audit_logger> audit_;
    std::shared_ptr<const storage::clock> clock_;
};

}  // namespace clinic::opd::scheduling

#endif  // CLINIC_OPD_SCHEDULING_AVAILABILITY_SERVICE_H
