#ifndef CLINIC_OPD_CONFIG_SCHEDULER_CONFIG_H
#define CLINIC_OPD_CONFIG_SCHEDULER_CONFIG_H

/**
 * @file scheduler_config.h
 * @brief Configuration structures for the OPD scheduler
 *
 * Configuration Hierarchy:
 *   scheduler_config (root)
 *   ├── database_config (shared SQLite store)
 *   ├── pagination_config (listing limits)
 *   ├── booking_config (calendar and booking rules)
 *   ├── reconciliation_config (queue snapshot repair)
 *   ├── rate_limit_config (shared fixed-window limits)
 *   └── logging_config
 */

#include "clinic/opd/integration/database_adapter.h"
#include "clinic/opd/integration/logger_adapter.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace clinic::opd::config {

// =============================================================================
// Error Codes (-750 to -759)
// =============================================================================

/**
 * @brief Configuration specific error codes
 *
 * Allocated range: -750 to -759
 */
enum class config_error : int {
    /** Configuration file not found */
    file_not_found = -750,

    /** Failed to parse configuration file */
    parse_error = -751,

    /** Configuration validation failed */
    validation_error = -752,

    /** Invalid value for configuration field */
    invalid_value = -753,

    /** Environment variable not found */
    env_var_not_found = -754,

    /** Invalid file format (not YAML or JSON) */
    invalid_format = -755,

    /** Configuration file is empty */
    empty_config = -756,

    /** IO error reading file */
    io_error = -757
};

[[nodiscard]] constexpr int to_error_code(config_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(config_error error) noexcept {
    switch (error) {
        case config_error::file_not_found:
            return "Configuration file not found";
        case config_error::parse_error:
            return "Failed to parse configuration file";
        case config_error::validation_error:
            return "Configuration validation failed";
        case config_error::invalid_value:
            return "Invalid value for configuration field";
        case config_error::env_var_not_found:
            return "Environment variable not found";
        case config_error::invalid_format:
            return "Invalid configuration file format";
        case config_error::empty_config:
            return "Configuration file is empty";
        case config_error::io_error:
            return "IO error reading configuration file";
        default:
            return "Unknown configuration error";
    }
}

// =============================================================================
// Validation Error Details
// =============================================================================

/**
 * @brief Detailed validation error information
 */
struct validation_error_info {
    /** Path to the configuration field (e.g., "pagination.max_limit") */
    std::string field_path;

    std::string message;

    std::optional<std::string> actual_value;

    /** Expected value or constraint description */
    std::optional<std::string> expected;
};

// =============================================================================
// Section Configurations
// =============================================================================

/**
 * @brief Listing limits shared by every cursor-paginated read
 */
struct pagination_config {
    std::size_t default_limit = 20;
    std::size_t max_limit = 100;

    [[nodiscard]] bool is_valid() const noexcept {
        return default_limit > 0 && max_limit >= default_limit;
    }
};

/**
 * @brief Calendar and booking rules
 */
struct booking_config {
    /** Offset from UTC used to decide what "today" is for the hospital */
    std::chrono::minutes utc_offset{0};

    /** How far ahead an appointment may be booked */
    int max_advance_days = 90;

    /** Slot duration used when a template does not specify one */
    int default_slot_duration_minutes = 15;

    std::size_t max_cancel_reason_length = 500;

    [[nodiscard]] bool is_valid() const noexcept {
        if (utc_offset < std::chrono::minutes{-14 * 60} ||
            utc_offset > std::chrono::minutes{14 * 60}) {
            return false;
        }
        if (max_advance_days <= 0) return false;
        if (default_slot_duration_minutes < 5 ||
            default_slot_duration_minutes > 120) {
            return false;
        }
        return max_cancel_reason_length > 0;
    }
};

/**
 * @brief Periodic queue snapshot reconciliation
 */
struct reconciliation_config {
    bool enabled = true;

    /** Time between full per-tenant rebuild passes */
    std::chrono::seconds interval{300};

    /** Terminal snapshot rows older than this are removed by cleanup */
    std::chrono::seconds snapshot_retention{24 * 3600};

    [[nodiscard]] bool is_valid() const noexcept {
        return interval.count() > 0 && snapshot_retention.count() >= 0;
    }
};

/**
 * @brief One fixed-window limit
 */
struct rate_limit_rule {
    std::size_t max_requests = 100;
    std::chrono::seconds window{60};

    [[nodiscard]] bool is_valid() const noexcept {
        return max_requests > 0 && window.count() > 0;
    }
};

/**
 * @brief Shared-store rate limits
 */
struct rate_limit_config {
    bool enabled = true;
    rate_limit_rule booking{30, std::chrono::seconds{60}};
    rate_limit_rule queue_read{100, std::chrono::seconds{60}};

    [[nodiscard]] bool is_valid() const noexcept {
        return booking.is_valid() && queue_read.is_valid();
    }
};

/**
 * @brief Logging configuration
 */
struct logging_config {
    integration::log_level level = integration::log_level::info;

    /** "text" or "json" */
    std::string format = "text";

    [[nodiscard]] bool is_valid() const noexcept {
        return format == "json" || format == "text";
    }
};

// =============================================================================
// Complete Scheduler Configuration
// =============================================================================

/**
 * @brief Root configuration
 *
 * @example YAML Configuration
 * ```yaml
 * name: "opd_scheduler"
 * database:
 *   path: "/var/lib/opd/scheduler.db"
 *   pool_size: 8
 * pagination:
 *   default_limit: 20
 *   max_limit: 100
 * booking:
 *   utc_offset: 330m
 * reconciliation:
 *   interval: 5m
 *   snapshot_retention: 24h
 * rate_limits:
 *   booking:
 *     max_requests: 30
 *     window: 1m
 * logging:
 *   level: "info"
 *   format: "json"
 * ```
 */
struct scheduler_config {
    /** Instance name, used as the default logger name */
    std::string name = "opd_scheduler";

    integration::database_config database;
    pagination_config pagination;
    booking_config booking;
    reconciliation_config reconciliation;
    rate_limit_config rate_limits;
    logging_config logging;

    /**
     * @brief Validate every section
     * @return Validation errors (empty if valid)
     */
    [[nodiscard]] std::vector<validation_error_info> validate() const;

    [[nodiscard]] bool is_valid() const {
        return validate().empty();
    }
};

}  // namespace clinic::opd::config

#endif  // CLINIC_OPD_CONFIG_SCHEDULER_CONFIG_H
