#ifndef CLINIC_OPD_SCHEDULING_SCHEDULING_ERROR_H
#define CLINIC_OPD_SCHEDULING_SCHEDULING_ERROR_H

/**
 * @file scheduling_error.h
 * @brief Caller-facing error codes of the booking, availability and queue
 *        operations
 */

#include "clinic/opd/integration/database_adapter.h"
#include "clinic/opd/security/access_guard.h"
#include "clinic/opd/security/rate_limiter.h"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace clinic::opd::scheduling {

// =============================================================================
// Error Codes (-1000 to -1019)
// =============================================================================

/**
 * @brief Scheduling error codes
 *
 * Allocated range: -1000 to -1019
 */
enum class scheduling_error : int {
    /** Another active appointment holds the practitioner's slot */
    slot_conflict = -1000,

    /** Resource belongs to a department the caller is not assigned to */
    department_access_denied = -1001,

    /** Resource belongs to another tenant */
    cross_tenant_access = -1002,

    /** Malformed input or transition not allowed from the current state */
    validation_error = -1003,

    not_found = -1004,

    /** Practitioner already has a consultation in progress */
    has_in_progress = -1005,

    /** Template changed since it was read */
    version_conflict = -1006,

    /** Caller lacks the capability for the action */
    permission_denied = -1007,

    /** Availability window overlaps an existing one */
    availability_overlap = -1008,

    rate_limited = -1009,

    /** Unexpected storage failure */
    internal = -1010
};

[[nodiscard]] constexpr int to_error_code(scheduling_error error) noexcept {
    return static_cast<int>(error);
}

/**
 * @brief External code: "SLOT_CONFLICT", "DEPT_ACCESS_DENIED", ...
 */
[[nodiscard]] constexpr const char* to_string(scheduling_error error) noexcept {
    switch (error) {
        case scheduling_error::slot_conflict:
            return "SLOT_CONFLICT";
        case scheduling_error::department_access_denied:
            return "DEPT_ACCESS_DENIED";
        case scheduling_error::cross_tenant_access:
            return "CROSS_TENANT_ACCESS";
        case scheduling_error::validation_error:
            return "VALIDATION_ERROR";
        case scheduling_error::not_found:
            return "NOT_FOUND";
        case scheduling_error::has_in_progress:
            return "HAS_IN_PROGRESS";
        case scheduling_error::version_conflict:
            return "VERSION_CONFLICT";
        case scheduling_error::permission_denied:
            return "PERMISSION_DENIED";
        case scheduling_error::availability_overlap:
            return "AVAILABILITY_OVERLAP";
        case scheduling_error::rate_limited:
            return "RATE_LIMITED";
        case scheduling_error::internal:
            return "INTERNAL";
        default:
            return "UNKNOWN";
    }
}

// =============================================================================
// Failure Details
// =============================================================================

/**
 * @brief Error code plus context for the caller
 */
struct scheduling_failure {
    scheduling_error code = scheduling_error::internal;

    std::string message;

    /**
     * Visit id for has_in_progress, template id for availability_overlap,
     * appointment id for slot_conflict when known.
     */
    std::optional<std::string> conflicting_id;

    [[nodiscard]] static scheduling_failure make(
        scheduling_error code, std::string message,
        std::optional<std::string> conflicting_id = std::nullopt) {
        return {code, std::move(message), std::move(conflicting_id)};
    }

    /** Access guard denial */
    [[nodiscard]] static scheduling_failure from(security::access_error error);

    /** Rate limiter denial or failure */
    [[nodiscard]] static scheduling_failure from(security::rate_limit_error error);

    /**
     * @brief Storage failure; constraint violations become slot_conflict
     */
    [[nodiscard]] static scheduling_failure from(integration::database_error error);

    /**
     * @brief "SLOT_CONFLICT: message"
     */
    [[nodiscard]] std::string to_string() const;
};

template <typename T>
using scheduling_result = std::expected<T, scheduling_failure>;

/**
 * @brief Shorthand for std::unexpected(scheduling_failure::make(...))
 */
[[nodiscard]] inline std::unexpected<scheduling_failure> fail(
    scheduling_error code, std::string message,
    std::optional<std::string> conflicting_id = std::nullopt) {
    return std::unexpected(
        scheduling_failure::make(code, std::move(message), std::move(conflicting_id)));
}

}  // namespace clinic::opd::scheduling

#endif  // CLINIC_OPD_SCHEDULING_SCHEDULING_ERROR_H
