/**
 * @file database_adapter.cpp
 * @brief SQLite implementation of the database adapter
 *
 * @see include/clinic/opd/integration/database_adapter.h
 */

#include "clinic/opd/integration/database_adapter.h"

#include <sqlite3.h>

#include <mutex>
#include <queue>

namespace clinic::opd::integration {

// =============================================================================
// Error Message Mapping
// =============================================================================

std::string_view to_string(database_error error) noexcept {
    switch (error) {
        case database_error::connection_failed:
            return "Connection to database failed";
        case database_error::query_failed:
            return "Query execution failed";
        case database_error::prepare_failed:
            return "Statement preparation failed";
        case database_error::bind_failed:
            return "Parameter binding failed";
        case database_error::transaction_failed:
            return "Transaction operation failed";
        case database_error::pool_exhausted:
            return "Connection pool exhausted";
        case database_error::constraint_violation:
            return "Database constraint violation";
        case database_error::busy:
            return "Database is locked";
        case database_error::script_failed:
            return "Script execution failed";
    }
    return "Unknown database error";
}

database_value nullable(const std::optional<std::string>& value) {
    if (!value) {
        return std::monostate{};
    }
    return *value;
}

namespace {

/**
 * @brief Map a failed sqlite3_step/exec return code to database_error
 */
database_error map_step_error(int rc) {
    switch (rc & 0xff) {
        case SQLITE_CONSTRAINT:
            return database_error::constraint_violation;
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return database_error::busy;
        default:
            return database_error::query_failed;
    }
}

}  // namespace

// =============================================================================
// Statement Binding Helpers
// =============================================================================

std::expected<void, database_error>
database_statement::bind_value(std::size_t index, const database_value& value) {
    if (std::holds_alternative<std::monostate>(value)) {
        return bind_null(index);
    }
    if (const auto* v = std::get_if<int64_t>(&value)) {
        return bind_int64(index, *v);
    }
    if (const auto* v = std::get_if<double>(&value)) {
        return bind_double(index, *v);
    }
    return bind_string(index, std::get<std::string>(value));
}

std::expected<void, database_error>
database_statement::bind_all(const std::vector<database_value>& values) {
    for (std::size_t i = 0; i < values.size(); ++i) {
        auto bound = bind_value(i + 1, values[i]);
        if (!bound) {
            return bound;
        }
    }
    return {};
}

// =============================================================================
// SQLite Row Implementation
// =============================================================================

class sqlite_row : public database_row {
public:
    explicit sqlite_row(sqlite3_stmt* stmt) : stmt_(stmt) {}

    [[nodiscard]] std::string get_string(std::size_t index) const override {
        if (index >= column_count()) {
            return "";
        }
        const auto* text = sqlite3_column_text(stmt_, static_cast<int>(index));
        if (!text) {
            return "";
        }
        return {reinterpret_cast<const char*>(text),
                static_cast<std::size_t>(
                    sqlite3_column_bytes(stmt_, static_cast<int>(index)))};
    }

    [[nodiscard]] int64_t get_int64(std::size_t index) const override {
        if (index >= column_count()) {
            return 0;
        }
        return sqlite3_column_int64(stmt_, static_cast<int>(index));
    }

    [[nodiscard]] double get_double(std::size_t index) const override {
        if (index >= column_count()) {
            return 0.0;
        }
        return sqlite3_column_double(stmt_, static_cast<int>(index));
    }

    [[nodiscard]] bool is_null(std::size_t index) const override {
        if (index >= column_count()) {
            return true;
        }
        return sqlite3_column_type(stmt_, static_cast<int>(index)) == SQLITE_NULL;
    }

    [[nodiscard]] std::size_t column_count() const override {
        return static_cast<std::size_t>(sqlite3_column_count(stmt_));
    }

    [[nodiscard]] std::string column_name(std::size_t index) const override {
        if (index >= column_count()) {
            return "";
        }
        const char* name = sqlite3_column_name(stmt_, static_cast<int>(index));
        return name ? name : "";
    }

    [[nodiscard]] database_value get_value(std::size_t index) const override {
        if (index >= column_count()) {
            return std::monostate{};
        }

        switch (sqlite3_column_type(stmt_, static_cast<int>(index))) {
            case SQLITE_INTEGER:
                return get_int64(index);
            case SQLITE_FLOAT:
                return get_double(index);
            case SQLITE_TEXT:
                return get_string(index);
            default:
                return std::monostate{};
        }
    }

private:
    sqlite3_stmt* stmt_;
};

// =============================================================================
// SQLite Result Implementation
// =============================================================================

/**
 * @brief Result over a stepped statement
 *
 * The first step happens before construction so that DML errors surface
 * from execute(); the first row (if any) is replayed by the first next().
 */
class sqlite_result : public database_result {
public:
    sqlite_result(sqlite3_stmt* stmt, sqlite3* db, bool owns_stmt, bool has_first_row)
        : stmt_(stmt), db_(db), row_(stmt), has_row_(has_first_row),
          owns_stmt_(owns_stmt), first_row_pending_(has_first_row),
          changes_(static_cast<std::size_t>(sqlite3_changes(db))),
          last_insert_id_(sqlite3_last_insert_rowid(db)) {}

    ~sqlite_result() override {
        if (stmt_ && owns_stmt_) {
            sqlite3_finalize(stmt_);
        }
    }

    sqlite_result(const sqlite_result&) = delete;
    sqlite_result& operator=(const sqlite_result&) = delete;
    sqlite_result(sqlite_result&&) = delete;
    sqlite_result& operator=(sqlite_result&&) = delete;

    [[nodiscard]] bool next() override {
        if (!stmt_) {
            return false;
        }
        if (first_row_pending_) {
            first_row_pending_ = false;
            return has_row_;
        }
        if (!has_row_) {
            return false;
        }
        has_row_ = (sqlite3_step(stmt_) == SQLITE_ROW);
        return has_row_;
    }

    [[nodiscard]] const database_row& current_row() const override {
        return row_;
    }

    [[nodiscard]] std::size_t affected_rows() const override {
        return changes_;
    }

    [[nodiscard]] int64_t last_insert_id() const override {
        return last_insert_id_;
    }

    [[nodiscard]] bool empty() const override {
        return !has_row_ && !first_row_pending_;
    }

private:
    sqlite3_stmt* stmt_;
    sqlite3* db_;
    sqlite_row row_;
    bool has_row_;
    bool owns_stmt_;
    bool first_row_pending_;
    std::size_t changes_;
    int64_t last_insert_id_;
};

// =============================================================================
// SQLite Statement Implementation
// =============================================================================

class sqlite_statement : public database_statement {
public:
    sqlite_statement(sqlite3_stmt* stmt, sqlite3* db, std::string* last_error)
        : stmt_(stmt), db_(db), last_error_(last_error) {}

    ~sqlite_statement() override {
        if (stmt_) {
            sqlite3_finalize(stmt_);
            stmt_ = nullptr;
        }
    }

    sqlite_statement(const sqlite_statement&) = delete;
    sqlite_statement& operator=(const sqlite_statement&) = delete;
    sqlite_statement(sqlite_statement&&) = delete;
    sqlite_statement& operator=(sqlite_statement&&) = delete;

    [[nodiscard]] std::expected<void, database_error>
    bind_string(std::size_t index, std::string_view value) override {
        return check_bind(sqlite3_bind_text(stmt_, static_cast<int>(index),
                                            value.data(),
                                            static_cast<int>(value.size()),
                                            SQLITE_TRANSIENT));
    }

    [[nodiscard]] std::expected<void, database_error>
    bind_int64(std::size_t index, int64_t value) override {
        return check_bind(
            sqlite3_bind_int64(stmt_, static_cast<int>(index), value));
    }

    [[nodiscard]] std::expected<void, database_error>
    bind_double(std::size_t index, double value) override {
        return check_bind(
            sqlite3_bind_double(stmt_, static_cast<int>(index), value));
    }

    [[nodiscard]] std::expected<void, database_error>
    bind_null(std::size_t index) override {
        return check_bind(sqlite3_bind_null(stmt_, static_cast<int>(index)));
    }

    [[nodiscard]] std::expected<void, database_error> clear_bindings() override {
        return check_bind(sqlite3_clear_bindings(stmt_));
    }

    [[nodiscard]] std::expected<void, database_error> reset() override {
        if (sqlite3_reset(stmt_) != SQLITE_OK) {
            return std::unexpected(database_error::prepare_failed);
        }
        return {};
    }

    [[nodiscard]] std::expected<std::unique_ptr<database_result>, database_error>
    execute() override {
        int rc = sqlite3_step(stmt_);
        bool has_row = (rc == SQLITE_ROW);
        if (!has_row && rc != SQLITE_DONE) {
            if (last_error_) {
                *last_error_ = sqlite3_errmsg(db_);
            }
            auto error = map_step_error(rc);
            sqlite3_reset(stmt_);
            return std::unexpected(error);
        }
        return std::make_unique<sqlite_result>(stmt_, db_, false, has_row);
    }

    [[nodiscard]] std::size_t parameter_count() const override {
        return static_cast<std::size_t>(sqlite3_bind_parameter_count(stmt_));
    }

private:
    [[nodiscard]] std::expected<void, database_error> check_bind(int rc) {
        if (rc != SQLITE_OK) {
            return std::unexpected(database_error::bind_failed);
        }
        return {};
    }

    sqlite3_stmt* stmt_;
    sqlite3* db_;
    std::string* last_error_;
};

// =============================================================================
// SQLite Connection Implementation
// =============================================================================

class sqlite_connection : public database_connection {
public:
    explicit sqlite_connection(const database_config& config)
        : db_(nullptr), config_(config), in_transaction_(false) {
        open();
    }

    ~sqlite_connection() override {
        close();
    }

    sqlite_connection(const sqlite_connection&) = delete;
    sqlite_connection& operator=(const sqlite_connection&) = delete;
    sqlite_connection(sqlite_connection&&) = delete;
    sqlite_connection& operator=(sqlite_connection&&) = delete;

    [[nodiscard]] std::expected<std::unique_ptr<database_statement>, database_error>
    prepare(std::string_view sql) override {
        auto stmt = prepare_raw(sql);
        if (!stmt) {
            return std::unexpected(stmt.error());
        }
        return std::make_unique<sqlite_statement>(*stmt, db_, &last_error_);
    }

    [[nodiscard]] std::expected<std::unique_ptr<database_result>, database_error>
    execute(std::string_view sql) override {
        return query(sql, {});
    }

    [[nodiscard]] std::expected<std::unique_ptr<database_result>, database_error>
    query(std::string_view sql, const std::vector<database_value>& params) override {
        auto stmt = prepare_raw(sql);
        if (!stmt) {
            return std::unexpected(stmt.error());
        }

        // Owns the statement from here; finalized on every path
        auto bound = sqlite_statement_binder(*stmt).bind(params);
        if (!bound) {
            sqlite3_finalize(*stmt);
            return std::unexpected(bound.error());
        }

        int rc = sqlite3_step(*stmt);
        bool has_first_row = (rc == SQLITE_ROW);
        if (!has_first_row && rc != SQLITE_DONE) {
            last_error_ = sqlite3_errmsg(db_);
            sqlite3_finalize(*stmt);
            return std::unexpected(map_step_error(rc));
        }

        return std::make_unique<sqlite_result>(*stmt, db_, true, has_first_row);
    }

    [[nodiscard]] std::expected<void, database_error>
    execute_script(std::string_view sql) override {
        if (!db_) {
            return std::unexpected(database_error::connection_failed);
        }
        std::string script(sql);
        if (!exec(script.c_str())) {
            return std::unexpected(database_error::script_failed);
        }
        return {};
    }

    [[nodiscard]] std::expected<void, database_error>
    begin_transaction(transaction_mode mode) override {
        if (!db_) {
            return std::unexpected(database_error::connection_failed);
        }
        if (in_transaction_) {
            return std::unexpected(database_error::transaction_failed);
        }

        const char* sql = mode == transaction_mode::immediate
                              ? "BEGIN IMMEDIATE"
                              : "BEGIN DEFERRED";
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            last_error_ = sqlite3_errmsg(db_);
            return std::unexpected((rc & 0xff) == SQLITE_BUSY
                                       ? database_error::busy
                                       : database_error::transaction_failed);
        }

        in_transaction_ = true;
        return {};
    }

    [[nodiscard]] std::expected<void, database_error> commit() override {
        if (!db_) {
            return std::unexpected(database_error::connection_failed);
        }
        if (!in_transaction_) {
            return std::unexpected(database_error::transaction_failed);
        }

        int rc = sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK) {
            last_error_ = sqlite3_errmsg(db_);
            // A failed COMMIT leaves the transaction open
            if (sqlite3_get_autocommit(db_) != 0) {
                in_transaction_ = false;
            }
            return std::unexpected((rc & 0xff) == SQLITE_BUSY
                                       ? database_error::busy
                                       : database_error::transaction_failed);
        }

        in_transaction_ = false;
        return {};
    }

    [[nodiscard]] std::expected<void, database_error> rollback() override {
        if (!db_) {
            return std::unexpected(database_error::connection_failed);
        }
        if (!in_transaction_) {
            return {};
        }

        in_transaction_ = false;
        if (!exec("ROLLBACK")) {
            return std::unexpected(database_error::transaction_failed);
        }
        return {};
    }

    [[nodiscard]] bool in_transaction() const noexcept override {
        return in_transaction_;
    }

    [[nodiscard]] bool is_valid() const override {
        return db_ != nullptr;
    }

    [[nodiscard]] std::string last_error() const override {
        if (!last_error_.empty()) {
            return last_error_;
        }
        if (db_) {
            return sqlite3_errmsg(db_);
        }
        return "No connection";
    }

    [[nodiscard]] int64_t changes() const override {
        return db_ ? sqlite3_changes(db_) : 0;
    }

    [[nodiscard]] int64_t last_insert_rowid() const override {
        return db_ ? sqlite3_last_insert_rowid(db_) : 0;
    }

private:
    /**
     * @brief Binds a parameter list onto a raw statement handle
     */
    class sqlite_statement_binder {
    public:
        explicit sqlite_statement_binder(sqlite3_stmt* stmt) : stmt_(stmt) {}

        [[nodiscard]] std::expected<void, database_error>
        bind(const std::vector<database_value>& params) {
            for (std::size_t i = 0; i < params.size(); ++i) {
                int index = static_cast<int>(i + 1);
                int rc = SQLITE_OK;
                const auto& value = params[i];
                if (const auto* v = std::get_if<int64_t>(&value)) {
                    rc = sqlite3_bind_int64(stmt_, index, *v);
                } else if (const auto* d = std::get_if<double>(&value)) {
                    rc = sqlite3_bind_double(stmt_, index, *d);
                } else if (const auto* s = std::get_if<std::string>(&value)) {
                    rc = sqlite3_bind_text(stmt_, index, s->data(),
                                           static_cast<int>(s->size()),
                                           SQLITE_TRANSIENT);
                } else {
                    rc = sqlite3_bind_null(stmt_, index);
                }
                if (rc != SQLITE_OK) {
                    return std::unexpected(database_error::bind_failed);
                }
            }
            return {};
        }

    private:
        sqlite3_stmt* stmt_;
    };

    [[nodiscard]] std::expected<sqlite3_stmt*, database_error>
    prepare_raw(std::string_view sql) {
        if (!db_) {
            return std::unexpected(database_error::connection_failed);
        }

        sqlite3_stmt* stmt = nullptr;
        int rc = sqlite3_prepare_v2(db_, sql.data(), static_cast<int>(sql.size()),
                                    &stmt, nullptr);
        if (rc != SQLITE_OK || !stmt) {
            last_error_ = sqlite3_errmsg(db_);
            if (stmt) {
                sqlite3_finalize(stmt);
            }
            return std::unexpected(database_error::prepare_failed);
        }
        return stmt;
    }

    bool exec(const char* sql) {
        char* error_msg = nullptr;
        int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
        if (error_msg) {
            last_error_ = error_msg;
            sqlite3_free(error_msg);
        }
        return rc == SQLITE_OK;
    }

    void open() {
        int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
        int rc = sqlite3_open_v2(config_.database_path.c_str(), &db_, flags, nullptr);

        if (rc != SQLITE_OK) {
            if (db_) {
                last_error_ = sqlite3_errmsg(db_);
                sqlite3_close(db_);
                db_ = nullptr;
            }
            return;
        }

        sqlite3_busy_timeout(db_, config_.busy_timeout_ms);
        exec("PRAGMA foreign_keys=ON");

        if (config_.enable_wal) {
            exec("PRAGMA journal_mode=WAL");
            exec("PRAGMA synchronous=NORMAL");
        }
        last_error_.clear();
    }

    void close() {
        if (db_) {
            if (in_transaction_) {
                sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
                in_transaction_ = false;
            }
            sqlite3_close(db_);
            db_ = nullptr;
        }
    }

    sqlite3* db_;
    database_config config_;
    std::string last_error_;
    bool in_transaction_;
};

// =============================================================================
// SQLite Database Adapter Implementation
// =============================================================================

class sqlite_database_adapter : public database_adapter {
public:
    explicit sqlite_database_adapter(const database_config& config)
        : config_(config) {
        if (config_.pool_size == 0) {
            config_.pool_size = 1;
        }

        for (std::size_t i = 0; i < config_.pool_size; ++i) {
            auto conn = std::make_shared<sqlite_connection>(config_);
            if (conn->is_valid()) {
                pool_.push(conn);
            }
        }
    }

    ~sqlite_database_adapter() override {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        while (!pool_.empty()) {
            pool_.pop();
        }
    }

    sqlite_database_adapter(const sqlite_database_adapter&) = delete;
    sqlite_database_adapter& operator=(const sqlite_database_adapter&) = delete;
    sqlite_database_adapter(sqlite_database_adapter&&) = delete;
    sqlite_database_adapter& operator=(sqlite_database_adapter&&) = delete;

    [[nodiscard]] std::expected<std::shared_ptr<database_connection>, database_error>
    acquire_connection() override {
        std::lock_guard<std::mutex> lock(pool_mutex_);

        if (pool_.empty()) {
            if (active_count_ < config_.pool_size * 2) {
                auto conn = std::make_shared<sqlite_connection>(config_);
                if (conn->is_valid()) {
                    active_count_++;
                    stats_.connections_acquired++;
                    update_peak_locked();
                    return conn;
                }
            }
            stats_.connection_failures++;
            return std::unexpected(database_error::pool_exhausted);
        }

        auto conn = pool_.front();
        pool_.pop();

        if (!conn->is_valid()) {
            conn = std::make_shared<sqlite_connection>(config_);
            if (!conn->is_valid()) {
                stats_.connection_failures++;
                return std::unexpected(database_error::connection_failed);
            }
        }

        active_count_++;
        stats_.connections_acquired++;
        update_peak_locked();
        return conn;
    }

    void release_connection(std::shared_ptr<database_connection> conn) override {
        if (!conn) {
            return;
        }

        // Never hand a connection with an open transaction to the next caller
        if (conn->in_transaction()) {
            (void)conn->rollback();
        }

        std::lock_guard<std::mutex> lock(pool_mutex_);
        active_count_--;
        stats_.connections_released++;

        if (conn->is_valid() && pool_.size() < config_.pool_size) {
            pool_.push(std::dynamic_pointer_cast<sqlite_connection>(conn));
        }
    }

    [[nodiscard]] std::size_t available_connections() const override {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        return pool_.size();
    }

    [[nodiscard]] std::size_t active_connections() const override {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        return active_count_;
    }

    [[nodiscard]] bool is_healthy() const override {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        return !pool_.empty() || active_count_ < config_.pool_size * 2;
    }

    [[nodiscard]] std::expected<void, database_error>
    execute_schema(std::string_view ddl) override {
        auto conn = acquire_connection();
        if (!conn) {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            stats_.schema_failures++;
            return std::unexpected(conn.error());
        }

        auto result = (*conn)->execute_script(ddl);
        release_connection(*conn);

        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (!result) {
            stats_.schema_failures++;
            return result;
        }
        stats_.schemas_executed++;
        return {};
    }

    [[nodiscard]] database_adapter_stats stats() const override {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        return stats_;
    }

    [[nodiscard]] const database_config& config() const override {
        return config_;
    }

private:
    /** Must be called under pool_mutex_ */
    void update_peak_locked() {
        if (active_count_ > stats_.peak_active_connections) {
            stats_.peak_active_connections = active_count_;
        }
    }

    database_config config_;
    mutable std::mutex pool_mutex_;
    std::queue<std::shared_ptr<sqlite_connection>> pool_;
    std::size_t active_count_ = 0;
    database_adapter_stats stats_;
};

// =============================================================================
// Transaction Guard Implementation
// =============================================================================

std::expected<transaction_guard, database_error>
transaction_guard::begin(database_connection& conn, transaction_mode mode) {
    auto result = conn.begin_transaction(mode);
    if (!result) {
        return std::unexpected(result.error());
    }
    return transaction_guard(conn);
}

transaction_guard::transaction_guard(database_connection& conn)
    : conn_(&conn), finished_(false) {}

transaction_guard::~transaction_guard() {
    if (conn_ && !finished_) {
        (void)conn_->rollback();
    }
}

transaction_guard::transaction_guard(transaction_guard&& other) noexcept
    : conn_(other.conn_), finished_(other.finished_) {
    other.conn_ = nullptr;
    other.finished_ = true;
}

transaction_guard& transaction_guard::operator=(transaction_guard&& other) noexcept {
    if (this != &other) {
        if (conn_ && !finished_) {
            (void)conn_->rollback();
        }
        conn_ = other.conn_;
        finished_ = other.finished_;
        other.conn_ = nullptr;
        other.finished_ = true;
    }
    return *this;
}

std::expected<void, database_error> transaction_guard::commit() {
    if (!conn_ || finished_) {
        return std::unexpected(database_error::transaction_failed);
    }
    auto result = conn_->commit();
    if (result) {
        finished_ = true;
    }
    return result;
}

std::expected<void, database_error> transaction_guard::rollback() {
    if (!conn_ || finished_) {
        return std::unexpected(database_error::transaction_failed);
    }
    finished_ = true;
    return conn_->rollback();
}

// =============================================================================
// Connection Scope Implementation
// =============================================================================

std::expected<connection_scope, database_error>
connection_scope::acquire(database_adapter& adapter) {
    auto conn = adapter.acquire_connection();
    if (!conn) {
        return std::unexpected(conn.error());
    }
    return connection_scope(adapter, std::move(*conn));
}

connection_scope::connection_scope(database_adapter& adapter,
                                   std::shared_ptr<database_connection> conn)
    : adapter_(&adapter), conn_(std::move(conn)) {}

connection_scope::~connection_scope() {
    if (adapter_ && conn_) {
        adapter_->release_connection(std::move(conn_));
    }
}

connection_scope::connection_scope(connection_scope&& other) noexcept
    : adapter_(other.adapter_), conn_(std::move(other.conn_)) {
    other.adapter_ = nullptr;
}

connection_scope& connection_scope::operator=(connection_scope&& other) noexcept {
    if (this != &other) {
        if (adapter_ && conn_) {
            adapter_->release_connection(std::move(conn_));
        }
        adapter_ = other.adapter_;
        conn_ = std::move(other.conn_);
        other.adapter_ = nullptr;
    }
    return *this;
}

database_connection& connection_scope::connection() noexcept {
    return *conn_;
}

const database_connection& connection_scope::connection() const noexcept {
    return *conn_;
}

// =============================================================================
// Factory Functions
// =============================================================================

std::shared_ptr<database_adapter> create_database_adapter(const database_config& config) {
    return std::make_shared<sqlite_database_adapter>(config);
}

}  // namespace clinic::opd::integration
