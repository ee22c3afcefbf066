/**
 * @file scheduler_config.cpp
 * @brief Validation of the scheduler configuration
 */

#include "clinic/opd/config/scheduler_config.h"

#include <format>

namespace clinic::opd::config {

std::vector<validation_error_info> scheduler_config::validate() const {
    std::vector<validation_error_info> errors;

    if (name.empty()) {
        errors.push_back({.field_path = "name",
                          .message = "Instance name cannot be empty",
                          .actual_value = std::nullopt,
                          .expected = "Non-empty string"});
    }

    // Database
    if (database.database_path.empty()) {
        errors.push_back({.field_path = "database.path",
                          .message = "Database path cannot be empty",
                          .actual_value = std::nullopt,
                          .expected = "File path"});
    }
    if (database.pool_size == 0) {
        errors.push_back({.field_path = "database.pool_size",
                          .message = "Pool size must be > 0",
                          .actual_value = "0",
                          .expected = "Positive integer"});
    }
    if (database.busy_timeout_ms < 0) {
        errors.push_back({.field_path = "database.busy_timeout",
                          .message = "Busy timeout cannot be negative",
                          .actual_value = std::to_string(database.busy_timeout_ms),
                          .expected = ">= 0 ms"});
    }

    // Pagination
    if (!pagination.is_valid()) {
        if (pagination.default_limit == 0) {
            errors.push_back({.field_path = "pagination.default_limit",
                              .message = "Default limit must be > 0",
                              .actual_value = "0",
                              .expected = "Positive integer"});
        }
        if (pagination.max_limit < pagination.default_limit) {
            errors.push_back(
                {.field_path = "pagination.max_limit",
                 .message = "Maximum limit must not be below the default limit",
                 .actual_value = std::to_string(pagination.max_limit),
                 .expected = std::format(">= {}", pagination.default_limit)});
        }
    }

    // Booking
    if (!booking.is_valid()) {
        if (booking.utc_offset < std::chrono::minutes{-14 * 60} ||
            booking.utc_offset > std::chrono::minutes{14 * 60}) {
            errors.push_back({.field_path = "booking.utc_offset",
                              .message = "UTC offset out of range",
                              .actual_value = std::format(
                                  "{}m", booking.utc_offset.count()),
                              .expected = "-840m to 840m"});
        }
        if (booking.max_advance_days <= 0) {
            errors.push_back({.field_path = "booking.max_advance_days",
                              .message = "Advance booking window must be > 0",
                              .actual_value =
                                  std::to_string(booking.max_advance_days),
                              .expected = "Positive integer"});
        }
        if (booking.default_slot_duration_minutes < 5 ||
            booking.default_slot_duration_minutes > 120) {
            errors.push_back(
                {.field_path = "booking.default_slot_duration",
                 .message = "Slot duration out of range",
                 .actual_value =
                     std::to_string(booking.default_slot_duration_minutes),
                 .expected = "5-120 minutes"});
        }
        if (booking.max_cancel_reason_length == 0) {
            errors.push_back({.field_path = "booking.max_cancel_reason_length",
                              .message = "Cancel reason length must be > 0",
                              .actual_value = "0",
                              .expected = "Positive integer"});
        }
    }

    // Reconciliation
    if (!reconciliation.is_valid()) {
        if (reconciliation.interval.count() <= 0) {
            errors.push_back({.field_path = "reconciliation.interval",
                              .message = "Reconciliation interval must be > 0",
                              .actual_value = std::format(
                                  "{}s", reconciliation.interval.count()),
                              .expected = "Positive duration"});
        }
        if (reconciliation.snapshot_retention.count() < 0) {
            errors.push_back(
                {.field_path = "reconciliation.snapshot_retention",
                 .message = "Snapshot retention cannot be negative",
                 .actual_value = std::format(
                     "{}s", reconciliation.snapshot_retention.count()),
                 .expected = ">= 0"});
        }
    }

    // Rate limits
    auto check_rule = [&errors](const rate_limit_rule& rule,
                                std::string_view path) {
        if (rule.max_requests == 0) {
            errors.push_back({.field_path = std::format("{}.max_requests", path),
                              .message = "Maximum requests must be > 0",
                              .actual_value = "0",
                              .expected = "Positive integer"});
        }
        if (rule.window.count() <= 0) {
            errors.push_back({.field_path = std::format("{}.window", path),
                              .message = "Window must be > 0",
                              .actual_value =
                                  std::format("{}s", rule.window.count()),
                              .expected = "Positive duration"});
        }
    };
    check_rule(rate_limits.booking, "rate_limits.booking");
    check_rule(rate_limits.queue_read, "rate_limits.queue_read");

    // Logging
    if (!logging.is_valid()) {
        errors.push_back({.field_path = "logging.format",
                          .message = "Invalid log format",
                          .actual_value = logging.format,
                          .expected = "\"json\" or \"text\""});
    }

    return errors;
}

}  // namespace clinic::opd::config
