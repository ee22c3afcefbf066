#ifndef CLINIC_OPD_STORAGE_COUNTER_STORE_H
#define CLINIC_OPD_STORAGE_COUNTER_STORE_H

/**
 * @file counter_store.h
 * @brief Atomic counters in the shared database
 *
 * Counters live in the shared store so that every process sees the same
 * value: token numbers per (tenant, department, date) and fixed-window
 * rate-limit counts both use this. Each increment is a single UPSERT
 * statement, so concurrent increments never observe the same value.
 *
 * A counter with a window restarts at 1 on the first increment after its
 * window has expired.
 */

#include "clinic/opd/integration/database_adapter.h"
#include "clinic/opd/storage/timestamps.h"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace clinic::opd::storage {

// =============================================================================
// Error Codes (-960 to -964)
// =============================================================================

/**
 * @brief Counter store error codes
 *
 * Allocated range: -960 to -964
 */
enum class counter_error : int {
    /** Counter key is empty */
    invalid_key = -960,

    /** Underlying database operation failed */
    storage_failed = -961,

    /** No connection available */
    unavailable = -962
};

[[nodiscard]] constexpr int to_error_code(counter_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(counter_error error) noexcept {
    switch (error) {
        case counter_error::invalid_key:
            return "Counter key is empty";
        case counter_error::storage_failed:
            return "Counter storage operation failed";
        case counter_error::unavailable:
            return "Counter store unavailable";
        default:
            return "Unknown counter error";
    }
}

/**
 * @brief Increment on an existing connection
 *
 * Joins whatever transaction @p conn has open, so a token taken inside a
 * booking transaction is released again if that transaction rolls back.
 *
 * @param window When set, the counter restarts after this long
 * @return Value after the increment (1 for a new or expired counter)
 */
[[nodiscard]] std::expected<int64_t, counter_error> increment_counter(
    integration::database_connection& conn,
    std::string_view key,
    std::optional<std::chrono::seconds> window,
    std::chrono::system_clock::time_point now);

/**
 * @brief Key of the token counter for one department day
 */
[[nodiscard]] std::string token_counter_key(std::string_view tenant_id,
                                            std::string_view department_id,
                                            std::string_view date);

/**
 * @brief Shared counter store with its own pooled connections
 */
class counter_store {
public:
    explicit counter_store(std::shared_ptr<integration::database_adapter> adapter,
                           std::shared_ptr<const clock> time_source = default_clock());

    /**
     * @brief Atomically increment @p key and return the new value
     */
    [[nodiscard]] std::expected<int64_t, counter_error> increment(
        std::string_view key,
        std::optional<std::chrono::seconds> window = std::nullopt);

    /**
     * @brief Current value; 0 when missing or its window has expired
     */
    [[nodiscard]] std::expected<int64_t, counter_error> get(std::string_view key);

    /**
     * @brief Time left in the counter's window, if it has one
     */
    [[nodiscard]] std::expected<std::optional<std::chrono::milliseconds>, counter_error>
    time_to_reset(std::string_view key);

    [[nodiscard]] std::expected<void, counter_error> reset(std::string_view key);

    /**
     * @brief Delete counters whose window has expired
     * @return Number of counters removed
     */
    [[nodiscard]] std::expected<std::size_t, counter_error> purge_expired();

private:
    std::shared_ptr<integration::database_adapter> adapter_;
    std::shared_ptr<const clock> clock_;
};

}  // namespace clinic::opd::storage

#endif  // CLINIC_OPD_STORAGE_COUNTER_STORE_H
