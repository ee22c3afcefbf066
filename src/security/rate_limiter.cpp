/**
 * @file rate_limiter.cpp
 * @brief Fixed-window rate limiter
 */

#include "clinic/opd/security/rate_limiter.h"

#include "clinic/opd/integration/logger_adapter.h"

#include <format>

namespace clinic::opd::security {

rate_limiter::rate_limiter(config::rate_limit_config config,
                           std::shared_ptr<storage::counter_store> counters)
    : config_(std::move(config)), counters_(std::move(counters)) {}

const config::rate_limit_rule& rate_limiter::rule_for(
    rate_limit_tier tier) const noexcept {
    return tier == rate_limit_tier::booking ? config_.booking : config_.queue_read;
}

std::expected<rate_limit_result, rate_limit_error> rate_limiter::check(
    rate_limit_tier tier, std::string_view tenant_id, std::string_view user_id) {
    const auto& rule = rule_for(tier);
    if (!config_.enabled) {
        return rate_limit_result::allow(0, rule.max_requests);
    }

    std::string key = std::format("rl:{}:{}:{}", to_string(tier), tenant_id, user_id);
    auto count = counters_->increment(key, rule.window);
    if (!count) {
        static auto logger = integration::create_logger("rate_limiter");
        logger->error(std::format("Counter increment failed for {}: {}", key,
                                  storage::to_string(count.error())));
        return std::unexpected(rate_limit_error::store_unavailable);
    }

    auto current = static_cast<std::size_t>(*count);
    auto result = current <= rule.max_requests
                      ? rate_limit_result::allow(current, rule.max_requests)
                      : rate_limit_result::deny(current, rule.max_requests);
    result.limit_key = std::move(key);
    return result;
}

std::expected<void, rate_limit_error> rate_limiter::enforce(
    rate_limit_tier tier, std::string_view tenant_id, std::string_view user_id) {
    auto result = check(tier, tenant_id, user_id);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!result->allowed) {
        return std::unexpected(rate_limit_error::limit_exceeded);
    }
    return {};
}

}  // namespace clinic::opd::security
