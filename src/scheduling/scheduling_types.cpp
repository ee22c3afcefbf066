/**
 * @file scheduling_types.cpp
 * @brief Stored names of scheduling enumerations
 */

#include "clinic/opd/scheduling/scheduling_types.h"

#include <array>
#include <utility>

namespace clinic::opd::scheduling {

namespace {

template <typename Enum, std::size_t N>
std::string_view lookup_name(const std::array<std::pair<Enum, std::string_view>, N>& table,
                             Enum value) noexcept {
    for (const auto& [candidate, name] : table) {
        if (candidate == value) {
            return name;
        }
    }
    return "UNKNOWN";
}

template <typename Enum, std::size_t N>
std::optional<Enum> lookup_value(const std::array<std::pair<Enum, std::string_view>, N>& table,
                                 std::string_view str) {
    for (const auto& [value, name] : table) {
        if (name == str) {
            return value;
        }
    }
    return std::nullopt;
}

constexpr std::array<std::pair<appointment_status, std::string_view>, 8> appointment_statuses = {{
    {appointment_status::booked, "BOOKED"},
    {appointment_status::confirmed, "CONFIRMED"},
    {appointment_status::checked_in, "CHECKED_IN"},
    {appointment_status::in_progress, "IN_PROGRESS"},
    {appointment_status::completed, "COMPLETED"},
    {appointment_status::cancelled, "CANCELLED"},
    {appointment_status::no_show, "NO_SHOW"},
    {appointment_status::rescheduled, "RESCHEDULED"},
}};

constexpr std::array<std::pair<booking_source, std::string_view>, 4> booking_sources = {{
    {booking_source::online, "ONLINE"},
    {booking_source::reception, "RECEPTION"},
    {booking_source::phone, "PHONE"},
    {booking_source::walk_in, "WALKIN"},
}};

constexpr std::array<std::pair<priority, std::string_view>, 4> priorities = {{
    {priority::emergency, "EMERGENCY"},
    {priority::urgent, "URGENT"},
    {priority::normal, "NORMAL"},
    {priority::low, "LOW"},
}};

constexpr std::array<std::pair<visit_status, std::string_view>, 4> visit_statuses = {{
    {visit_status::waiting, "WAITING"},
    {visit_status::in_progress, "IN_PROGRESS"},
    {visit_status::completed, "COMPLETED"},
    {visit_status::cancelled, "CANCELLED"},
}};

constexpr std::array<std::pair<visit_type, std::string_view>, 3> visit_types = {{
    {visit_type::opd, "OPD"},
    {visit_type::ipd, "IPD"},
    {visit_type::emergency, "EMERGENCY"},
}};

constexpr std::array<std::pair<day_of_week, std::string_view>, 7> days = {{
    {day_of_week::monday, "MONDAY"},
    {day_of_week::tuesday, "TUESDAY"},
    {day_of_week::wednesday, "WEDNESDAY"},
    {day_of_week::thursday, "THURSDAY"},
    {day_of_week::friday, "FRIDAY"},
    {day_of_week::saturday, "SATURDAY"},
    {day_of_week::sunday, "SUNDAY"},
}};

constexpr std::array<std::pair<practitioner_status, std::string_view>, 3> practitioner_statuses = {{
    {practitioner_status::active, "ACTIVE"},
    {practitioner_status::on_leave, "ON_LEAVE"},
    {practitioner_status::inactive, "INACTIVE"},
}};

constexpr std::array<std::pair<template_status, std::string_view>, 2> template_statuses = {{
    {template_status::active, "ACTIVE"},
    {template_status::inactive, "INACTIVE"},
}};

}  // namespace

std::string_view to_string(appointment_status status) noexcept {
    return lookup_name(appointment_statuses, status);
}

std::string_view to_string(booking_source source) noexcept {
    return lookup_name(booking_sources, source);
}

std::string_view to_string(priority value) noexcept {
    return lookup_name(priorities, value);
}

std::string_view to_string(visit_status status) noexcept {
    return lookup_name(visit_statuses, status);
}

std::string_view to_string(visit_type type) noexcept {
    return lookup_name(visit_types, type);
}

std::string_view to_string(day_of_week day) noexcept {
    return lookup_name(days, day);
}

std::string_view to_string(practitioner_status status) noexcept {
    return lookup_name(practitioner_statuses, status);
}

std::string_view to_string(template_status status) noexcept {
    return lookup_name(template_statuses, status);
}

std::optional<appointment_status> parse_appointment_status(std::string_view str) {
    return lookup_value(appointment_statuses, str);
}

std::optional<booking_source> parse_booking_source(std::string_view str) {
    return lookup_value(booking_sources, str);
}

std::optional<priority> parse_priority(std::string_view str) {
    return lookup_value(priorities, str);
}

std::optional<visit_status> parse_visit_status(std::string_view str) {
    return lookup_value(visit_statuses, str);
}

std::optional<visit_type> parse_visit_type(std::string_view str) {
    return lookup_value(visit_types, str);
}

std::optional<day_of_week> parse_day_of_week(std::string_view str) {
    return lookup_value(days, str);
}

std::optional<practitioner_status> parse_practitioner_status(std::string_view str) {
    return lookup_value(practitioner_statuses, str);
}

std::optional<template_status> parse_template_status(std::string_view str) {
    return lookup_value(template_statuses, str);
}

}  // namespace clinic::opd::scheduling
