#ifndef CLINIC_OPD_INTEGRATION_DATABASE_ADAPTER_H
#define CLINIC_OPD_INTEGRATION_DATABASE_ADAPTER_H

/**
 * @file database_adapter.h
 * @brief Integration Module - Shared database access
 *
 * Connection pooling, prepared statements and RAII transaction handling
 * over the shared SQLite store that holds appointments, visits, the
 * queue snapshot and the shared counters.
 *
 * Storage-level constraint failures are reported as
 * database_error::constraint_violation so that callers can map a lost
 * slot reservation race to a domain conflict.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace clinic::opd::integration {

// =============================================================================
// Error Codes (-800 to -849)
// =============================================================================

/**
 * @brief Database adapter specific error codes
 *
 * Allocated range: -800 to -849
 */
enum class database_error : int {
    /** Connection to database failed */
    connection_failed = -800,

    /** Query execution failed */
    query_failed = -801,

    /** Statement preparation failed */
    prepare_failed = -802,

    /** Parameter binding failed */
    bind_failed = -803,

    /** Transaction operation failed */
    transaction_failed = -804,

    /** Connection pool exhausted */
    pool_exhausted = -805,

    /** UNIQUE, CHECK or FOREIGN KEY constraint rejected the write */
    constraint_violation = -806,

    /** Database stayed locked past the busy timeout */
    busy = -807,

    /** Script execution failed */
    script_failed = -808
};

[[nodiscard]] constexpr int to_error_code(database_error error) noexcept {
    return static_cast<int>(error);
}

/**
 * @brief Get human-readable error message for database_error
 */
[[nodiscard]] std::string_view to_string(database_error error) noexcept;

// =============================================================================
// Configuration
// =============================================================================

/**
 * @brief Database connection configuration
 */
struct database_config {
    /** Database file path */
    std::string database_path = "opd_scheduler.db";

    /** Connections created up front; the pool may grow to twice this */
    std::size_t pool_size = 5;

    /** Enable Write-Ahead Logging */
    bool enable_wal = true;

    /** Busy timeout in milliseconds */
    int busy_timeout_ms = 5000;

    [[nodiscard]] bool is_valid() const noexcept {
        return !database_path.empty() && pool_size > 0 && busy_timeout_ms >= 0;
    }
};

// =============================================================================
// Value Types
// =============================================================================

/**
 * @brief Value bound to, or read from, a statement column
 */
using database_value = std::variant<
    std::monostate,  // NULL
    int64_t,         // INTEGER
    double,          // REAL
    std::string      // TEXT
>;

/**
 * @brief Build a bindable value from an optional string (nullopt binds NULL)
 */
[[nodiscard]] database_value nullable(const std::optional<std::string>& value);

// =============================================================================
// Database Row
// =============================================================================

/**
 * @brief Result row abstraction
 */
class database_row {
public:
    virtual ~database_row() = default;

    /** Column value as string, or empty string if NULL */
    [[nodiscard]] virtual std::string get_string(std::size_t index) const = 0;

    /** Column value as int64_t, or 0 if NULL */
    [[nodiscard]] virtual int64_t get_int64(std::size_t index) const = 0;

    /** Column value as double, or 0.0 if NULL */
    [[nodiscard]] virtual double get_double(std::size_t index) const = 0;

    [[nodiscard]] virtual bool is_null(std::size_t index) const = 0;

    [[nodiscard]] virtual std::size_t column_count() const = 0;

    [[nodiscard]] virtual std::string column_name(std::size_t index) const = 0;

    [[nodiscard]] virtual database_value get_value(std::size_t index) const = 0;

    /**
     * @brief Column value as string, or nullopt if NULL
     */
    [[nodiscard]] std::optional<std::string> get_optional_string(
        std::size_t index) const {
        if (is_null(index)) {
            return std::nullopt;
        }
        return get_string(index);
    }

    [[nodiscard]] std::optional<int64_t> get_optional_int64(
        std::size_t index) const {
        if (is_null(index)) {
            return std::nullopt;
        }
        return get_int64(index);
    }
};

// =============================================================================
// Database Result
// =============================================================================

/**
 * @brief Result set abstraction
 */
class database_result {
public:
    virtual ~database_result() = default;

    /**
     * @brief Advance to next row
     * @return true if there is another row, false if at end
     */
    [[nodiscard]] virtual bool next() = 0;

    /**
     * @brief Current row (valid until next() is called)
     */
    [[nodiscard]] virtual const database_row& current_row() const = 0;

    /** Rows changed by INSERT/UPDATE/DELETE */
    [[nodiscard]] virtual std::size_t affected_rows() const = 0;

    [[nodiscard]] virtual int64_t last_insert_id() const = 0;

    [[nodiscard]] virtual bool empty() const = 0;
};

// =============================================================================
// Database Statement
// =============================================================================

/**
 * @brief Prepared statement abstraction
 *
 * Parameters are 1-indexed (first parameter is index 1). A result
 * returned by execute() borrows the statement and must not outlive it.
 */
class database_statement {
public:
    virtual ~database_statement() = default;

    [[nodiscard]] virtual std::expected<void, database_error>
    bind_string(std::size_t index, std::string_view value) = 0;

    [[nodiscard]] virtual std::expected<void, database_error>
    bind_int64(std::size_t index, int64_t value) = 0;

    [[nodiscard]] virtual std::expected<void, database_error>
    bind_double(std::size_t index, double value) = 0;

    [[nodiscard]] virtual std::expected<void, database_error>
    bind_null(std::size_t index) = 0;

    /**
     * @brief Bind a variant value, dispatching on its alternative
     */
    [[nodiscard]] std::expected<void, database_error>
    bind_value(std::size_t index, const database_value& value);

    /**
     * @brief Bind values to parameters 1..N in order
     */
    [[nodiscard]] std::expected<void, database_error>
    bind_all(const std::vector<database_value>& values);

    [[nodiscard]] virtual std::expected<void, database_error> clear_bindings() = 0;

    /**
     * @brief Reset statement for re-execution
     */
    [[nodiscard]] virtual std::expected<void, database_error> reset() = 0;

    [[nodiscard]] virtual std::expected<std::unique_ptr<database_result>, database_error>
    execute() = 0;

    [[nodiscard]] virtual std::size_t parameter_count() const = 0;
};

// =============================================================================
// Database Connection
// =============================================================================

/**
 * @brief Transaction locking mode
 */
enum class transaction_mode {
    /** Lock acquired on first read/write */
    deferred,

    /** Write lock acquired at BEGIN; serializes concurrent writers */
    immediate
};

/**
 * @brief Connection abstraction
 */
class database_connection {
public:
    virtual ~database_connection() = default;

    /**
     * @brief Prepare a SQL statement
     * @param sql SQL statement with parameter placeholders (?)
     */
    [[nodiscard]] virtual std::expected<std::unique_ptr<database_statement>, database_error>
    prepare(std::string_view sql) = 0;

    /**
     * @brief Execute a single SQL statement directly
     */
    [[nodiscard]] virtual std::expected<std::unique_ptr<database_result>, database_error>
    execute(std::string_view sql) = 0;

    /**
     * @brief Prepare, bind and execute a single statement
     *
     * The returned result owns its statement.
     *
     * @param sql SQL statement with parameter placeholders (?)
     * @param params Values bound to parameters 1..N
     */
    [[nodiscard]] virtual std::expected<std::unique_ptr<database_result>, database_error>
    query(std::string_view sql, const std::vector<database_value>& params) = 0;

    /**
     * @brief Execute a script of one or more statements
     */
    [[nodiscard]] virtual std::expected<void, database_error>
    execute_script(std::string_view sql) = 0;

    [[nodiscard]] virtual std::expected<void, database_error>
    begin_transaction(transaction_mode mode = transaction_mode::deferred) = 0;

    [[nodiscard]] virtual std::expected<void, database_error> commit() = 0;

    [[nodiscard]] virtual std::expected<void, database_error> rollback() = 0;

    [[nodiscard]] virtual bool in_transaction() const noexcept = 0;

    [[nodiscard]] virtual bool is_valid() const = 0;

    [[nodiscard]] virtual std::string last_error() const = 0;

    /** Number of changes from last statement */
    [[nodiscard]] virtual int64_t changes() const = 0;

    [[nodiscard]] virtual int64_t last_insert_rowid() const = 0;
};

// =============================================================================
// Scoped Transaction Guard
// =============================================================================

/**
 * @brief RAII transaction guard
 *
 * Rolls back on scope exit unless committed.
 *
 * @example
 * @code
 * auto tx = transaction_guard::begin(conn, transaction_mode::immediate);
 * if (!tx) {
 *     return std::unexpected(tx.error());
 * }
 * // writes...
 * if (auto committed = tx->commit(); !committed) {
 *     return std::unexpected(committed.error());
 * }
 * @endcode
 */
class transaction_guard {
public:
    [[nodiscard]] static std::expected<transaction_guard, database_error>
    begin(database_connection& conn,
          transaction_mode mode = transaction_mode::deferred);

    ~transaction_guard();

    transaction_guard(transaction_guard&& other) noexcept;
    transaction_guard& operator=(transaction_guard&& other) noexcept;
    transaction_guard(const transaction_guard&) = delete;
    transaction_guard& operator=(const transaction_guard&) = delete;

    [[nodiscard]] std::expected<void, database_error> commit();

    [[nodiscard]] std::expected<void, database_error> rollback();

private:
    explicit transaction_guard(database_connection& conn);

    database_connection* conn_;
    bool finished_;
};

// =============================================================================
// Database Adapter
// =============================================================================

/**
 * @brief Connection pool statistics
 */
struct database_adapter_stats {
    std::size_t connections_acquired = 0;
    std::size_t connections_released = 0;
    std::size_t connection_failures = 0;
    std::size_t peak_active_connections = 0;
    std::size_t schemas_executed = 0;
    std::size_t schema_failures = 0;
};

/**
 * @brief Main database adapter interface
 */
class database_adapter {
public:
    virtual ~database_adapter() = default;

    /**
     * @brief Acquire a connection from the pool
     * @return Connection or error if pool exhausted
     */
    [[nodiscard]] virtual std::expected<std::shared_ptr<database_connection>, database_error>
    acquire_connection() = 0;

    virtual void release_connection(std::shared_ptr<database_connection> conn) = 0;

    [[nodiscard]] virtual std::size_t available_connections() const = 0;

    [[nodiscard]] virtual std::size_t active_connections() const = 0;

    [[nodiscard]] virtual bool is_healthy() const = 0;

    /**
     * @brief Execute a DDL script (one or more statements)
     */
    [[nodiscard]] virtual std::expected<void, database_error>
    execute_schema(std::string_view ddl) = 0;

    [[nodiscard]] virtual database_adapter_stats stats() const = 0;

    [[nodiscard]] virtual const database_config& config() const = 0;
};

// =============================================================================
// Connection Scope Guard
// =============================================================================

/**
 * @brief RAII guard returning a pooled connection on scope exit
 */
class connection_scope {
public:
    [[nodiscard]] static std::expected<connection_scope, database_error>
    acquire(database_adapter& adapter);

    ~connection_scope();

    connection_scope(connection_scope&& other) noexcept;
    connection_scope& operator=(connection_scope&& other) noexcept;
    connection_scope(const connection_scope&) = delete;
    connection_scope& operator=(const connection_scope&) = delete;

    [[nodiscard]] database_connection& connection() noexcept;

    [[nodiscard]] const database_connection& connection() const noexcept;

private:
    connection_scope(database_adapter& adapter,
                     std::shared_ptr<database_connection> conn);

    database_adapter* adapter_;
    std::shared_ptr<database_connection> conn_;
};

// =============================================================================
// Factory Functions
// =============================================================================

/**
 * @brief Create a SQLite-backed database adapter
 */
[[nodiscard]] std::shared_ptr<database_adapter>
create_database_adapter(const database_config& config);

}  // namespace clinic::opd::integration

#endif  // CLINIC_OPD_INTEGRATION_DATABASE_ADAPTER_H
