/**
 * @file counter_store.cpp
 * @brief Shared counters over SQLite UPSERT
 */

#include "clinic/opd/storage/counter_store.h"

#include "clinic/opd/integration/logger_adapter.h"

#include <format>

namespace clinic::opd::storage {

namespace {

// The CASE arms restart an expired window; a counter without a window
// never expires.
constexpr std::string_view increment_sql = R"(
INSERT INTO shared_counters (counter_key, value, window_expires_at)
VALUES (?, 1, ?)
ON CONFLICT(counter_key) DO UPDATE SET
    value = CASE
        WHEN shared_counters.window_expires_at IS NOT NULL
             AND shared_counters.window_expires_at <= ? THEN 1
        ELSE shared_counters.value + 1
    END,
    window_expires_at = CASE
        WHEN shared_counters.window_expires_at IS NOT NULL
             AND shared_counters.window_expires_at <= ? THEN excluded.window_expires_at
        ELSE shared_counters.window_expires_at
    END
RETURNING value
)";

integration::logger_adapter& counter_logger() {
    static auto logger = integration::create_logger("counter_store");
    return *logger;
}

}  // namespace

std::expected<int64_t, counter_error> increment_counter(
    integration::database_connection& conn,
    std::string_view key,
    std::optional<std::chrono::seconds> window,
    std::chrono::system_clock::time_point now) {
    if (key.empty()) {
        return std::unexpected(counter_error::invalid_key);
    }

    std::string now_str = to_timestamp(now);
    integration::database_value expires;
    if (window) {
        expires = to_timestamp(now + *window);
    }

    auto result = conn.query(increment_sql,
                             {std::string(key), expires, now_str, now_str});
    if (!result) {
        counter_logger().warning(std::format("Increment of '{}' failed: {}", key,
                                             conn.last_error()));
        return std::unexpected(counter_error::storage_failed);
    }
    if (!(*result)->next()) {
        return std::unexpected(counter_error::storage_failed);
    }
    return (*result)->current_row().get_int64(0);
}

std::string token_counter_key(std::string_view tenant_id,
                              std::string_view department_id,
                              std::string_view date) {
    return std::format("token:{}:{}:{}", tenant_id, department_id, date);
}

// =============================================================================
// counter_store
// =============================================================================

counter_store::counter_store(std::shared_ptr<integration::database_adapter> adapter,
                             std::shared_ptr<const clock> time_source)
    : adapter_(std::move(adapter)), clock_(std::move(time_source)) {}

std::expected<int64_t, counter_error> counter_store::increment(
    std::string_view key, std::optional<std::chrono::seconds> window) {
    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(counter_error::unavailable);
    }
    return increment_counter(scope->connection(), key, window, clock_->now());
}

std::expected<int64_t, counter_error> counter_store::get(std::string_view key) {
    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(counter_error::unavailable);
    }

    auto result = scope->connection().query(
        "SELECT value FROM shared_counters WHERE counter_key = ? "
        "AND (window_expires_at IS NULL OR window_expires_at > ?)",
        {std::string(key), to_timestamp(clock_->now())});
    if (!result) {
        return std::unexpected(counter_error::storage_failed);
    }
    if (!(*result)->next()) {
        return int64_t{0};
    }
    return (*result)->current_row().get_int64(0);
}

std::expected<std::optional<std::chrono::milliseconds>, counter_error>
counter_store::time_to_reset(std::string_view key) {
    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(counter_error::unavailable);
    }

    auto result = scope->connection().query(
        "SELECT window_expires_at FROM shared_counters WHERE counter_key = ?",
        {std::string(key)});
    if (!result) {
        return std::unexpected(counter_error::storage_failed);
    }
    if (!(*result)->next() || (*result)->current_row().is_null(0)) {
        return std::optional<std::chrono::milliseconds>{};
    }

    auto expires = parse_timestamp((*result)->current_row().get_string(0));
    if (!expires) {
        return std::unexpected(counter_error::storage_failed);
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        *expires - clock_->now());
    if (remaining.count() < 0) {
        remaining = std::chrono::milliseconds{0};
    }
    return std::optional<std::chrono::milliseconds>{remaining};
}

std::expected<void, counter_error> counter_store::reset(std::string_view key) {
    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(counter_error::unavailable);
    }

    auto result = scope->connection().query(
        "DELETE FROM shared_counters WHERE counter_key = ?", {std::string(key)});
    if (!result) {
        return std::unexpected(counter_error::storage_failed);
    }
    return {};
}

std::expected<std::size_t, counter_error> counter_store::purge_expired() {
    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(counter_error::unavailable);
    }

    auto result = scope->connection().query(
        "DELETE FROM shared_counters "
        "WHERE window_expires_at IS NOT NULL AND window_expires_at <= ?",
        {to_timestamp(clock_->now())});
    if (!result) {
        return std::unexpected(counter_error::storage_failed);
    }

    auto removed = (*result)->affected_rows();
    if (removed > 0) {
        counter_logger().debug(std::format("Purged {} expired counters", removed));
    }
    return removed;
}

}  // namespace clinic::opd::storage
