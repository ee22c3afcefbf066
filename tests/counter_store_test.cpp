/**
 * @file counter_store_test.cpp
 * @brief Unit tests for shared counters and the rate limiter built on them
 *
 * @see include/clinic/opd/storage/counter_store.h
 * @see include/clinic/opd/security/rate_limiter.h
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "clinic/opd/security/rate_limiter.h"
#include "clinic/opd/storage/counter_store.h"
#include "utils/test_helpers.h"

#include <algorithm>
#include <mutex>
#include <thread>
#include <vector>

namespace clinic::opd::storage {
namespace {

using namespace ::testing;
using namespace std::chrono_literals;

class CounterStoreTest : public test::store_test {
protected:
    void SetUp() override {
        store_test::SetUp();
        counters_ = std::make_shared<counter_store>(adapter_, clock_);
    }

    std::shared_ptr<counter_store> counters_;
};

// =============================================================================
// Counter Store
// =============================================================================

TEST_F(CounterStoreTest, IncrementStartsAtOne) {
    EXPECT_EQ(counters_->get("k").value(), 0);
    EXPECT_EQ(counters_->increment("k").value(), 1);
    EXPECT_EQ(counters_->increment("k").value(), 2);
    EXPECT_EQ(counters_->get("k").value(), 2);
}

TEST_F(CounterStoreTest, EmptyKeyIsRejected) {
    auto result = counters_->increment("");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), counter_error::invalid_key);
}

TEST_F(CounterStoreTest, ConcurrentIncrementsNeverShareAValue) {
    constexpr int threads = 4;
    constexpr int per_thread = 25;

    std::mutex mutex;
    std::vector<int64_t> values;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < per_thread; ++i) {
                auto v = counters_->increment("token:shared");
                ASSERT_TRUE(v.has_value());
                std::lock_guard<std::mutex> lock(mutex);
                values.push_back(*v);
            }
        });
    }
    for (auto& w : workers) w.join();

    std::sort(values.begin(), values.end());
    ASSERT_EQ(values.size(), static_cast<size_t>(threads * per_thread));
    for (size_t i = 0; i < values.size(); ++i) {
        EXPECT_EQ(values[i], static_cast<int64_t>(i + 1));
    }
}

TEST_F(CounterStoreTest, WindowRestartsAfterExpiry) {
    EXPECT_EQ(counters_->increment("rl", 60s).value(), 1);
    EXPECT_EQ(counters_->increment("rl", 60s).value(), 2);

    auto ttl = counters_->time_to_reset("rl");
    ASSERT_TRUE(ttl.has_value());
    ASSERT_TRUE(ttl->has_value());
    EXPECT_EQ(**ttl, 60000ms);

    clock_->advance(61s);
    EXPECT_EQ(counters_->get("rl").value(), 0);
    EXPECT_EQ(counters_->increment("rl", 60s).value(), 1);
}

TEST_F(CounterStoreTest, CounterWithoutWindowHasNoReset) {
    ASSERT_TRUE(counters_->increment("plain").has_value());
    auto ttl = counters_->time_to_reset("plain");
    ASSERT_TRUE(ttl.has_value());
    EXPECT_FALSE(ttl->has_value());
}

TEST_F(CounterStoreTest, PurgeExpiredKeepsLiveCounters) {
    ASSERT_TRUE(counters_->increment("short", 10s).has_value());
    ASSERT_TRUE(counters_->increment("long", 1h).has_value());
    ASSERT_TRUE(counters_->increment("forever").has_value());

    clock_->advance(30s);
    auto removed = counters_->purge_expired();
    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(*removed, 1u);
    EXPECT_EQ(test::query_int(*adapter_, "SELECT COUNT(*) FROM shared_counters"), 2);
}

TEST_F(CounterStoreTest, Reset) {
    ASSERT_TRUE(counters_->increment("k").has_value());
    ASSERT_TRUE(counters_->reset("k").has_value());
    EXPECT_EQ(counters_->increment("k").value(), 1);
}

TEST_F(CounterStoreTest, IncrementJoinsTransaction) {
    auto key = token_counter_key(test::tenant, test::cardiology, "2025-01-06");
    EXPECT_EQ(key, "token:tenant-a:dept-cardiology:2025-01-06");

    {
        auto scope = integration::connection_scope::acquire(*adapter_);
        ASSERT_TRUE(scope.has_value());
        auto tx = integration::transaction_guard::begin(
            scope->connection(), integration::transaction_mode::immediate);
        ASSERT_TRUE(tx.has_value());

        EXPECT_EQ(increment_counter(scope->connection(), key, std::nullopt, clock_->now())
                      .value(),
                  1);
        ASSERT_TRUE(tx->rollback().has_value());
    }

    EXPECT_EQ(counters_->increment(key).value(), 1);
}

}  // namespace
}  // namespace clinic::opd::storage

namespace clinic::opd::security {
namespace {

using namespace std::chrono_literals;

class RateLimiterTest : public test::store_test {
protected:
    void SetUp() override {
        store_test::SetUp();
        counters_ = std::make_shared<storage::counter_store>(adapter_, clock_);
        config_.booking = {3, std::chrono::seconds{60}};
        config_.queue_read = {100, std::chrono::seconds{60}};
    }

    std::shared_ptr<storage::counter_store> counters_;
    config::rate_limit_config config_;
};

TEST_F(RateLimiterTest, DeniesOverLimitUntilWindowPasses) {
    rate_limiter limiter(config_, counters_);

    for (int i = 1; i <= 3; ++i) {
        auto result = limiter.check(rate_limit_tier::booking, test::tenant, "user-1");
        ASSERT_TRUE(result.has_value());
        EXPECT_TRUE(result->allowed);
        EXPECT_EQ(result->remaining, static_cast<std::size_t>(3 - i));
    }

    auto denied = limiter.check(rate_limit_tier::booking, test::tenant, "user-1");
    ASSERT_TRUE(denied.has_value());
    EXPECT_FALSE(denied->allowed);
    EXPECT_EQ(denied->limit, 3u);
    EXPECT_EQ(denied->limit_key, "rl:booking:tenant-a:user-1");

    auto enforced = limiter.enforce(rate_limit_tier::booking, test::tenant, "user-1");
    ASSERT_FALSE(enforced.has_value());
    EXPECT_EQ(enforced.error(), rate_limit_error::limit_exceeded);

    clock_->advance(61s);
    EXPECT_TRUE(limiter.enforce(rate_limit_tier::booking, test::tenant, "user-1"));
}

TEST_F(RateLimiterTest, KeysAreScopedByTierTenantAndUser) {
    rate_limiter limiter(config_, counters_);
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(limiter.enforce(rate_limit_tier::booking, test::tenant, "user-1"));
    }

    EXPECT_TRUE(limiter.enforce(rate_limit_tier::booking, test::tenant, "user-2"));
    EXPECT_TRUE(limiter.enforce(rate_limit_tier::booking, test::other_tenant, "user-1"));
    EXPECT_TRUE(limiter.enforce(rate_limit_tier::queue_read, test::tenant, "user-1"));
}

TEST_F(RateLimiterTest, SharedAcrossLimiterInstances) {
    rate_limiter first(config_, counters_);
    rate_limiter second(config_, std::make_shared<storage::counter_store>(adapter_, clock_));

    ASSERT_TRUE(first.enforce(rate_limit_tier::booking, test::tenant, "user-1"));
    ASSERT_TRUE(second.enforce(rate_limit_tier::booking, test::tenant, "user-1"));
    ASSERT_TRUE(first.enforce(rate_limit_tier::booking, test::tenant, "user-1"));
    EXPECT_FALSE(second.enforce(rate_limit_tier::booking, test::tenant, "user-1"));
}

TEST_F(RateLimiterTest, DisabledLimiterDoesNotCount) {
    config_.enabled = false;
    rate_limiter limiter(config_, counters_);

    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(limiter.enforce(rate_limit_tier::booking, test::tenant, "user-1"));
    }
    EXPECT_FALSE(limiter.is_enabled());
    EXPECT_EQ(test::query_int(*adapter_, "SELECT COUNT(*) FROM shared_counters"), 0);
}

}  // namespace
}  // namespace clinic::opd::security
