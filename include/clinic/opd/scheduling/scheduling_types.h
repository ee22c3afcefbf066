#ifndef CLINIC_OPD_SCHEDULING_SCHEDULING_TYPES_H
#define CLINIC_OPD_SCHEDULING_SCHEDULING_TYPES_H

/**
 * @file scheduling_types.h
 * @brief Appointment, visit and availability records
 *
 * Enumerations are stored in the database as their upper snake case
 * names ("BOOKED", "IN_PROGRESS", ...). Dates are "YYYY-MM-DD" and times
 * of day are "HH:MM".
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace clinic::opd::scheduling {

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief Appointment lifecycle
 *
 * BOOKED -> CONFIRMED -> CHECKED_IN -> IN_PROGRESS -> COMPLETED, with side
 * exits CANCELLED, NO_SHOW and RESCHEDULED.
 */
enum class appointment_status {
    booked,
    confirmed,
    checked_in,
    in_progress,
    completed,
    cancelled,
    no_show,
    rescheduled
};

enum class booking_source {
    online,
    reception,
    phone,
    walk_in
};

/**
 * @brief Visit urgency tier; EMERGENCY sorts first
 */
enum class priority {
    emergency,
    urgent,
    normal,
    low
};

enum class visit_status {
    waiting,
    in_progress,
    completed,
    cancelled
};

enum class visit_type {
    opd,
    ipd,
    emergency
};

enum class day_of_week {
    monday,
    tuesday,
    wednesday,
    thursday,
    friday,
    saturday,
    sunday
};

enum class practitioner_status {
    active,
    on_leave,
    inactive
};

enum class template_status {
    active,
    inactive
};

[[nodiscard]] std::string_view to_string(appointment_status status) noexcept;
[[nodiscard]] std::string_view to_string(booking_source source) noexcept;
[[nodiscard]] std::string_view to_string(priority value) noexcept;
[[nodiscard]] std::string_view to_string(visit_status status) noexcept;
[[nodiscard]] std::string_view to_string(visit_type type) noexcept;
[[nodiscard]] std::string_view to_string(day_of_week day) noexcept;
[[nodiscard]] std::string_view to_string(practitioner_status status) noexcept;
[[nodiscard]] std::string_view to_string(template_status status) noexcept;

[[nodiscard]] std::optional<appointment_status> parse_appointment_status(std::string_view str);
[[nodiscard]] std::optional<booking_source> parse_booking_source(std::string_view str);
[[nodiscard]] std::optional<priority> parse_priority(std::string_view str);
[[nodiscard]] std::optional<visit_status> parse_visit_status(std::string_view str);
[[nodiscard]] std::optional<visit_type> parse_visit_type(std::string_view str);
[[nodiscard]] std::optional<day_of_week> parse_day_of_week(std::string_view str);
[[nodiscard]] std::optional<practitioner_status> parse_practitioner_status(std::string_view str);
[[nodiscard]] std::optional<template_status> parse_template_status(std::string_view str);

/**
 * @brief Numeric sort key: EMERGENCY=4, URGENT=3, NORMAL=2, LOW=1
 */
[[nodiscard]] constexpr int priority_rank(priority value) noexcept {
    switch (value) {
        case priority::emergency:
            return 4;
        case priority::urgent:
            return 3;
        case priority::normal:
            return 2;
        case priority::low:
            return 1;
    }
    return 0;
}

/**
 * @brief COMPLETED, CANCELLED, NO_SHOW and RESCHEDULED accept no transition
 */
[[nodiscard]] constexpr bool is_terminal(appointment_status status) noexcept {
    return status == appointment_status::completed ||
           status == appointment_status::cancelled ||
           status == appointment_status::no_show ||
           status == appointment_status::rescheduled;
}

/**
 * @brief Whether an appointment in @p status occupies its slot
 */
[[nodiscard]] constexpr bool holds_slot(appointment_status status) noexcept {
    return status != appointment_status::cancelled &&
           status != appointment_status::no_show &&
           status != appointment_status::rescheduled;
}

/**
 * @brief Visits in these states appear in the queue (when OPD)
 */
[[nodiscard]] constexpr bool is_active(visit_status status) noexcept {
    return status == visit_status::waiting || status == visit_status::in_progress;
}

// =============================================================================
// Records
// =============================================================================

struct appointment {
    std::string id;
    std::string tenant_id;
    std::string patient_id;
    std::string practitioner_id;
    std::string department_id;
    std::string appointment_date;
    std::string appointment_time;
    std::optional<std::string> end_time;
    appointment_status status = appointment_status::booked;
    booking_source source = booking_source::reception;
    scheduling::priority priority = scheduling::priority::normal;
    int64_t token_number = 0;
    bool is_walk_in = false;
    std::optional<std::string> chief_complaint;
    std::optional<std::string> notes;
    std::optional<std::string> cancellation_reason;
    std::optional<std::string> cancelled_at;
    std::optional<std::string> checked_in_at;
    std::optional<std::string> completed_at;
    std::optional<std::string> rescheduled_from_id;
    std::optional<std::string> rescheduled_to_id;
    std::optional<std::string> created_by;
    std::string created_at;
    std::string updated_at;
};

struct visit {
    std::string id;
    std::string tenant_id;
    std::string patient_id;
    std::string practitioner_id;
    std::string department_id;
    std::optional<std::string> appointment_id;
    int64_t visit_number = 0;
    visit_type type = visit_type::opd;
    visit_status status = visit_status::waiting;
    scheduling::priority priority = scheduling::priority::normal;
    std::optional<int64_t> token_number;
    std::string check_in_time;
    std::optional<std::string> start_time;
    std::optional<std::string> end_time;
    std::string created_at;
    std::string updated_at;
};

/**
 * @brief Recurring weekly availability of a practitioner in a department
 */
struct availability_template {
    std::string id;
    std::string tenant_id;
    std::string practitioner_id;
    std::string department_id;
    day_of_week day = day_of_week::monday;
    std::string start_time;
    std::string end_time;
    int slot_duration_minutes = 15;
    std::optional<int> max_patients_per_day;
    bool allow_walk_in = true;

    /** Slots held back from advance booking for walk-ins */
    int walk_in_slots = 0;

    std::optional<std::string> effective_from;
    std::optional<std::string> effective_to;
    template_status status = template_status::active;

    /** Incremented on every update; compared for optimistic concurrency */
    int64_t version = 1;

    std::string created_at;
    std::string updated_at;
};

}  // namespace clinic::opd::scheduling

#endif  // CLINIC_OPD_SCHEDULING_SCHEDULING_TYPES_H
