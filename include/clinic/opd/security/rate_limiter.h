#ifndef CLINIC_OPD_SECURITY_RATE_LIMITER_H
#define CLINIC_OPD_SECURITY_RATE_LIMITER_H

/**
 * @file rate_limiter.h
 * @brief Fixed-window rate limiting on the shared counter store
 *
 * Counts live in the shared database, so the limit holds across every
 * process serving the same tenant. Keys are per tier, tenant and user.
 */

#include "clinic/opd/config/scheduler_config.h"
#include "clinic/opd/storage/counter_store.h"

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

namespace clinic::opd::security {

// =============================================================================
// Error Codes (-965 to -969)
// =============================================================================

/**
 * @brief Rate limiter error codes
 *
 * Allocated range: -965 to -969
 */
enum class rate_limit_error : int {
    /** Window limit reached */
    limit_exceeded = -965,

    /** Counter store failed */
    store_unavailable = -966
};

[[nodiscard]] constexpr int to_error_code(rate_limit_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(rate_limit_error error) noexcept {
    switch (error) {
        case rate_limit_error::limit_exceeded:
            return "Rate limit exceeded";
        case rate_limit_error::store_unavailable:
            return "Rate limit store unavailable";
        default:
            return "Unknown rate limit error";
    }
}

// =============================================================================
// Rate Limit Result
// =============================================================================

/**
 * @brief Request class a limit applies to
 */
enum class rate_limit_tier {
    /** Appointment creation, reschedule, cancel */
    booking,

    /** Queue and slot reads */
    queue_read
};

[[nodiscard]] constexpr const char* to_string(rate_limit_tier tier) noexcept {
    switch (tier) {
        case rate_limit_tier::booking:
            return "booking";
        case rate_limit_tier::queue_read:
            return "queue_read";
        default:
            return "unknown";
    }
}

/**
 * @brief Result of a rate limit check
 */
struct rate_limit_result {
    bool allowed = false;

    /** Requests counted in the current window, including this one */
    std::size_t current_count = 0;

    std::size_t limit = 0;

    std::size_t remaining = 0;

    std::string limit_key;

    [[nodiscard]] static rate_limit_result allow(std::size_t current, std::size_t max) {
        rate_limit_result result;
        result.allowed = true;
        result.current_count = current;
        result.limit = max;
        result.remaining = (current < max) ? (max - current) : 0;
        return result;
    }

    [[nodiscard]] static rate_limit_result deny(std::size_t current, std::size_t max) {
        rate_limit_result result;
        result.allowed = false;
        result.current_count = current;
        result.limit = max;
        result.remaining = 0;
        return result;
    }
};

// =============================================================================
// Rate Limiter
// =============================================================================

/**
 * @brief Shared fixed-window limiter
 *
 * @example
 * @code
 * rate_limiter limiter(config.rate_limits, counters);
 * auto result = limiter.check(rate_limit_tier::booking, tenant, user);
 * if (result && !result->allowed) {
 *     // reject with RATE_LIMITED
 * }
 * @endcode
 */
class rate_limiter {
public:
    rate_limiter(config::rate_limit_config config,
                 std::shared_ptr<storage::counter_store> counters);

    /**
     * @brief Count one request and decide whether it is allowed
     *
     * A disabled limiter allows everything without touching the store.
     */
    [[nodiscard]] std::expected<rate_limit_result, rate_limit_error> check(
        rate_limit_tier tier,
        std::string_view tenant_id,
        std::string_view user_id);

    /**
     * @brief check(), folding a denial into limit_exceeded
     */
    [[nodiscard]] std::expected<void, rate_limit_error> enforce(
        rate_limit_tier tier,
        std::string_view tenant_id,
        std::string_view user_id);

    [[nodiscard]] const config::rate_limit_config& config() const noexcept {
        return config_;
    }

    [[nodiscard]] bool is_enabled() const noexcept { return config_.enabled; }

private:
    [[nodiscard]] const config::rate_limit_rule& rule_for(
        rate_limit_tier tier) const noexcept;

    config::rate_limit_config config_;
    std::shared_ptr<storage::counter_store> counters_;
};

}  // namespace clinic::opd::security

#endif  // CLINIC_OPD_SECURITY_RATE_LIMITER_H
