/**
 * @file database_adapter_test.cpp
 * @brief Unit tests for the SQLite database adapter
 *
 * Tests for connection pooling, parameterized queries, transactions,
 * constraint mapping and the RAII guards.
 *
 * @see include/clinic/opd/integration/database_adapter.h
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "clinic/opd/integration/database_adapter.h"

#include "utils/test_helpers.h"

#include <filesystem>
#include <thread>
#include <vector>

namespace clinic::opd::integration {
namespace {

using namespace ::testing;

// =============================================================================
// Test Fixtures
// =============================================================================

class DatabaseAdapterTest : public Test {
protected:
    void SetUp() override {
        test_db_path_ = test::scratch_db_path("adapter");
        test::remove_db_files(test_db_path_);

        database_config config;
        config.database_path = test_db_path_.string();
        config.pool_size = 3;
        config.enable_wal = true;
        config.busy_timeout_ms = 5000;

        adapter_ = create_database_adapter(config);
    }

    void TearDown() override {
        adapter_.reset();
        test::remove_db_files(test_db_path_);
    }

    void create_items_table() {
        ASSERT_TRUE(adapter_->execute_schema(
            "CREATE TABLE items (id INTEGER PRIMARY KEY, name TEXT UNIQUE, price REAL)"
        ).has_value());
    }

    std::filesystem::path test_db_path_;
    std::shared_ptr<database_adapter> adapter_;
};

// =============================================================================
// Error Code Tests
// =============================================================================

TEST_F(DatabaseAdapterTest, ErrorCodeValues) {
    EXPECT_EQ(to_error_code(database_error::connection_failed), -800);
    EXPECT_EQ(to_error_code(database_error::query_failed), -801);
    EXPECT_EQ(to_error_code(database_error::prepare_failed), -802);
    EXPECT_EQ(to_error_code(database_error::bind_failed), -803);
    EXPECT_EQ(to_error_code(database_error::transaction_failed), -804);
    EXPECT_EQ(to_error_code(database_error::pool_exhausted), -805);
    EXPECT_EQ(to_error_code(database_error::constraint_violation), -806);
    EXPECT_EQ(to_error_code(database_error::busy), -807);
    EXPECT_EQ(to_error_code(database_error::script_failed), -808);
}

TEST_F(DatabaseAdapterTest, ErrorCodeStrings) {
    EXPECT_FALSE(to_string(database_error::connection_failed).empty());
    EXPECT_FALSE(to_string(database_error::constraint_violation).empty());
    EXPECT_FALSE(to_string(database_error::pool_exhausted).empty());
}

// =============================================================================
// Adapter Creation Tests
// =============================================================================

TEST_F(DatabaseAdapterTest, CreateAdapter) {
    ASSERT_NE(adapter_, nullptr);
    EXPECT_TRUE(adapter_->is_healthy());
}

TEST_F(DatabaseAdapterTest, ConfigAccess) {
    const auto& config = adapter_->config();
    EXPECT_EQ(config.database_path, test_db_path_.string());
    EXPECT_EQ(config.pool_size, 3u);
    EXPECT_TRUE(config.enable_wal);
}

TEST_F(DatabaseAdapterTest, ConfigValidation) {
    database_config config;
    EXPECT_TRUE(config.is_valid());

    config.database_path.clear();
    EXPECT_FALSE(config.is_valid());

    config.database_path = "x.db";
    config.pool_size = 0;
    EXPECT_FALSE(config.is_valid());
}

// =============================================================================
// Connection Pool Tests
// =============================================================================

TEST_F(DatabaseAdapterTest, AcquireAndRelease) {
    EXPECT_EQ(adapter_->active_connections(), 0u);

    auto conn = adapter_->acquire_connection();
    ASSERT_TRUE(conn.has_value());
    EXPECT_TRUE((*conn)->is_valid());
    EXPECT_EQ(adapter_->active_connections(), 1u);

    adapter_->release_connection(*conn);
    EXPECT_EQ(adapter_->active_connections(), 0u);
}

TEST_F(DatabaseAdapterTest, ConnectionScopeReturnsConnection) {
    {
        auto scope = connection_scope::acquire(*adapter_);
        ASSERT_TRUE(scope.has_value());
        EXPECT_EQ(adapter_->active_connections(), 1u);
    }
    EXPECT_EQ(adapter_->active_connections(), 0u);

    auto stats = adapter_->stats();
    EXPECT_EQ(stats.connections_acquired, stats.connections_released);
    EXPECT_GE(stats.peak_active_connections, 1u);
}

TEST_F(DatabaseAdapterTest, PoolGrowsToTwiceItsSizeThenFails) {
    std::vector<std::shared_ptr<database_connection>> connections;
    for (int i = 0; i < 6; ++i) {
        auto result = adapter_->acquire_connection();
        ASSERT_TRUE(result.has_value()) << "Failed to acquire connection " << i;
        connections.push_back(*result);
    }

    auto exhausted = adapter_->acquire_connection();
    ASSERT_FALSE(exhausted.has_value());
    EXPECT_EQ(exhausted.error(), database_error::pool_exhausted);

    for (auto& conn : connections) {
        adapter_->release_connection(conn);
    }
    EXPECT_EQ(adapter_->active_connections(), 0u);
}

// =============================================================================
// Schema Execution Tests
// =============================================================================

TEST_F(DatabaseAdapterTest, ExecuteSchema) {
    EXPECT_TRUE(adapter_->execute_schema(
        "CREATE TABLE IF NOT EXISTS a (id INTEGER PRIMARY KEY);"
        "CREATE TABLE IF NOT EXISTS b (id INTEGER PRIMARY KEY);"
    ).has_value());
    EXPECT_EQ(adapter_->stats().schemas_executed, 1u);
}

TEST_F(DatabaseAdapterTest, ExecuteInvalidSchema) {
    auto result = adapter_->execute_schema("CREATE TABLE");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(adapter_->stats().schema_failures, 1u);
}

// =============================================================================
// Query Tests
// =============================================================================

TEST_F(DatabaseAdapterTest, ParameterizedInsertAndSelect) {
    create_items_table();

    auto scope = connection_scope::acquire(*adapter_);
    ASSERT_TRUE(scope.has_value());
    auto& conn = scope->connection();

    {
        auto inserted = conn.query("INSERT INTO items (name, price) VALUES (?, ?)",
                                   {std::string("Stethoscope"), 42.5});
        ASSERT_TRUE(inserted.has_value()) << conn.last_error();
        EXPECT_EQ((*inserted)->affected_rows(), 1u);
    }

    auto selected = conn.query("SELECT id, name, price FROM items WHERE name = ?",
                               {std::string("Stethoscope")});
    ASSERT_TRUE(selected.has_value());
    ASSERT_TRUE((*selected)->next());

    const auto& row = (*selected)->current_row();
    EXPECT_EQ(row.column_count(), 3u);
    EXPECT_EQ(row.get_string(1), "Stethoscope");
    EXPECT_DOUBLE_EQ(row.get_double(2), 42.5);
    EXPECT_FALSE((*selected)->next());
}

TEST_F(DatabaseAdapterTest, NullableBinding) {
    create_items_table();

    auto scope = connection_scope::acquire(*adapter_);
    ASSERT_TRUE(scope.has_value());
    auto& conn = scope->connection();

    ASSERT_TRUE(conn.query("INSERT INTO items (name, price) VALUES (?, ?)",
                           {nullable(std::nullopt), std::monostate{}})
                    .has_value());

    auto selected = conn.query("SELECT name, price FROM items", {});
    ASSERT_TRUE(selected.has_value());
    ASSERT_TRUE((*selected)->next());
    const auto& row = (*selected)->current_row();
    EXPECT_TRUE(row.is_null(0));
    EXPECT_EQ(row.get_optional_string(0), std::nullopt);
    EXPECT_EQ(row.get_optional_int64(1), std::nullopt);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(row.get_value(1)));
}

TEST_F(DatabaseAdapterTest, UniqueViolationIsReportedAsConstraintViolation) {
    create_items_table();

    auto scope = connection_scope::acquire(*adapter_);
    ASSERT_TRUE(scope.has_value());
    auto& conn = scope->connection();

    ASSERT_TRUE(conn.query("INSERT INTO items (name) VALUES (?)", {std::string("Gauze")})
                    .has_value());
    auto duplicate = conn.query("INSERT INTO items (name) VALUES (?)",
                                {std::string("Gauze")});
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error(), database_error::constraint_violation);
    EXPECT_FALSE(conn.last_error().empty());
}

TEST_F(DatabaseAdapterTest, PreparedStatementBindAll) {
    create_items_table();

    auto scope = connection_scope::acquire(*adapter_);
    ASSERT_TRUE(scope.has_value());
    auto& conn = scope->connection();

    auto stmt = conn.prepare("INSERT INTO items (name, price) VALUES (?, ?)");
    ASSERT_TRUE(stmt.has_value());
    EXPECT_EQ((*stmt)->parameter_count(), 2u);

    ASSERT_TRUE((*stmt)->bind_all({std::string("Syringe"), int64_t{3}}).has_value());
    EXPECT_TRUE((*stmt)->execute().has_value());

    EXPECT_EQ(test::query_int(*adapter_, "SELECT COUNT(*) FROM items"), 1);
}

// =============================================================================
// Transaction Guard Tests
// =============================================================================

TEST_F(DatabaseAdapterTest, TransactionGuardCommit) {
    create_items_table();

    auto scope = connection_scope::acquire(*adapter_);
    ASSERT_TRUE(scope.has_value());
    auto& conn = scope->connection();

    {
        auto guard = transaction_guard::begin(conn, transaction_mode::immediate);
        ASSERT_TRUE(guard.has_value());
        EXPECT_TRUE(conn.in_transaction());

        ASSERT_TRUE(conn.query("INSERT INTO items (name) VALUES ('a')", {}).has_value());
        EXPECT_TRUE(guard->commit().has_value());
    }

    EXPECT_FALSE(conn.in_transaction());
    EXPECT_EQ(test::query_int(*adapter_, "SELECT COUNT(*) FROM items"), 1);
}

TEST_F(DatabaseAdapterTest, TransactionGuardRollsBackOnScopeExit) {
    create_items_table();

    auto scope = connection_scope::acquire(*adapter_);
    ASSERT_TRUE(scope.has_value());
    auto& conn = scope->connection();

    {
        auto guard = transaction_guard::begin(conn);
        ASSERT_TRUE(guard.has_value());
        ASSERT_TRUE(conn.query("INSERT INTO items (name) VALUES ('a')", {}).has_value());
    }

    EXPECT_FALSE(conn.in_transaction());
    EXPECT_EQ(test::query_int(*adapter_, "SELECT COUNT(*) FROM items"), 0);
}

TEST_F(DatabaseAdapterTest, NestedBeginFails) {
    auto scope = connection_scope::acquire(*adapter_);
    ASSERT_TRUE(scope.has_value());
    auto& conn = scope->connection();

    auto outer = transaction_guard::begin(conn);
    ASSERT_TRUE(outer.has_value());

    auto inner = transaction_guard::begin(conn);
    ASSERT_FALSE(inner.has_value());
    EXPECT_EQ(inner.error(), database_error::transaction_failed);
}

TEST_F(DatabaseAdapterTest, ImmediateTransactionsSerializeWriters) {
    create_items_table();
    ASSERT_TRUE(adapter_->execute_schema(
        "CREATE TABLE counter (id INTEGER PRIMARY KEY, value INTEGER);"
        "INSERT INTO counter (id, value) VALUES (1, 0);"
    ).has_value());

    constexpr int threads = 4;
    constexpr int increments = 10;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([this]() {
            for (int i = 0; i < increments; ++i) {
                auto scope = connection_scope::acquire(*adapter_);
                ASSERT_TRUE(scope.has_value());
                auto& conn = scope->connection();

                auto tx = transaction_guard::begin(conn, transaction_mode::immediate);
                ASSERT_TRUE(tx.has_value());
                int64_t value = 0;
                {
                    auto read = conn.query("SELECT value FROM counter WHERE id = 1", {});
                    ASSERT_TRUE(read.has_value());
                    ASSERT_TRUE((*read)->next());
                    value = (*read)->current_row().get_int64(0);
                }
                ASSERT_TRUE(conn.query("UPDATE counter SET value = ? WHERE id = 1",
                                       {value + 1})
                                .has_value());
                ASSERT_TRUE(tx->commit().has_value());
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(test::query_int(*adapter_, "SELECT value FROM counter WHERE id = 1"),
              threads * increments);
}

}  // namespace
}  // namespace clinic::opd::integration
