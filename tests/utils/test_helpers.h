/**
 * @file test_helpers.h
 * @brief Common fixtures and helpers for OPD scheduler tests
 *
 * Provides a scratch SQLite store with the schema applied, a controllable
 * clock, seeded reference data and ready-made sessions.
 * Uses Google Test (gtest) and Google Mock (gmock) frameworks.
 */

#ifndef CLINIC_OPD_TEST_HELPERS_H
#define CLINIC_OPD_TEST_HELPERS_H

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "clinic/opd/integration/database_adapter.h"
#include "clinic/opd/security/access_guard.h"
#include "clinic/opd/storage/schema.h"
#include "clinic/opd/storage/timestamps.h"

#include <atomic>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace clinic::opd::test {

// =============================================================================
// Clock
// =============================================================================

/**
 * @brief Clock that only moves when told to
 */
class manual_clock : public storage::clock {
public:
    explicit manual_clock(std::chrono::system_clock::time_point start)
        : now_(start.time_since_epoch().count()) {}

    [[nodiscard]] std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::time_point{
            std::chrono::system_clock::duration{now_.load()}};
    }

    void set(std::chrono::system_clock::time_point tp) {
        now_.store(tp.time_since_epoch().count());
    }

    void advance(std::chrono::system_clock::duration by) {
        now_.fetch_add(by.count());
    }

private:
    std::atomic<std::chrono::system_clock::rep> now_;
};

/**
 * @brief UTC instant from calendar fields
 */
inline std::chrono::system_clock::time_point utc(int y, unsigned m, unsigned d,
                                                 int hour = 0, int minute = 0) {
    using namespace std::chrono;
    return sys_days{year{y} / month{m} / day{d}} + hours{hour} + minutes{minute};
}

// =============================================================================
// Scratch Database
// =============================================================================

/**
 * @brief Unique database path for the running test
 */
inline std::filesystem::path scratch_db_path(std::string_view tag) {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    std::string name = std::string(tag);
    if (info != nullptr) {
        name += "_";
        name += info->test_suite_name();
        name += "_";
        name += info->name();
    }
    for (auto& c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c))) {
            c = '_';
        }
    }
    return std::filesystem::temp_directory_path() / (name + ".db");
}

inline void remove_db_files(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    std::filesystem::remove(path.string() + "-wal", ec);
    std::filesystem::remove(path.string() + "-shm", ec);
}

/**
 * @brief Run one statement on a pooled connection
 */
inline void exec_sql(integration::database_adapter& adapter, std::string_view sql,
                     const std::vector<integration::database_value>& params = {}) {
    auto scope = integration::connection_scope::acquire(adapter);
    ASSERT_TRUE(scope.has_value());
    auto result = scope->connection().query(sql, params);
    ASSERT_TRUE(result.has_value()) << sql << ": " << scope->connection().last_error();
}

/**
 * @brief First column of the first row as int64 (0 when no row)
 */
inline int64_t query_int(integration::database_adapter& adapter, std::string_view sql,
                         const std::vector<integration::database_value>& params = {}) {
    auto scope = integration::connection_scope::acquire(adapter);
    if (!scope) {
        ADD_FAILURE() << "No connection";
        return -1;
    }
    auto result = scope->connection().query(sql, params);
    if (!result) {
        ADD_FAILURE() << sql << ": " << scope->connection().last_error();
        return -1;
    }
    if (!(*result)->next()) {
        return 0;
    }
    return (*result)->current_row().get_int64(0);
}

/**
 * @brief First column of the first row as text (empty when no row)
 */
inline std::string query_text(integration::database_adapter& adapter, std::string_view sql,
                              const std::vector<integration::database_value>& params = {}) {
    auto scope = integration::connection_scope::acquire(adapter);
    if (!scope) {
        ADD_FAILURE() << "No connection";
        return {};
    }
    auto result = scope->connection().query(sql, params);
    if (!result) {
        ADD_FAILURE() << sql << ": " << scope->connection().last_error();
        return {};
    }
    if (!(*result)->next()) {
        return {};
    }
    return (*result)->current_row().get_string(0);
}

// =============================================================================
// Reference Data
// =============================================================================

inline constexpr std::string_view tenant = "tenant-a";
inline constexpr std::string_view other_tenant = "tenant-b";

inline constexpr std::string_view cardiology = "dept-cardiology";
inline constexpr std::string_view neurology = "dept-neurology";

/** Cardiology, ACTIVE */
inline constexpr std::string_view dr_rao = "pr-rao";
/** Cardiology, ACTIVE */
inline constexpr std::string_view dr_mehta = "pr-mehta";
/** Cardiology, ON_LEAVE */
inline constexpr std::string_view dr_iyer = "pr-iyer";
/** Neurology, ACTIVE */
inline constexpr std::string_view dr_sen = "pr-sen";

inline const std::vector<std::string>& patient_ids() {
    static const std::vector<std::string> ids = {"pat-1", "pat-2", "pat-3", "pat-4",
                                                 "pat-5", "pat-6"};
    return ids;
}

/**
 * @brief Departments, practitioners and patients of both tenants
 */
inline void seed_reference_data(integration::database_adapter& adapter) {
    const std::vector<std::vector<std::string>> departments = {
        {std::string(cardiology), std::string(tenant), "Cardiology"},
        {std::string(neurology), std::string(tenant), "Neurology"},
        {"dept-b-cardiology", std::string(other_tenant), "Cardiology"}};
    for (const auto& d : departments) {
        exec_sql(adapter, "INSERT INTO departments (id, tenant_id, name) VALUES (?, ?, ?)",
                 {d[0], d[1], d[2]});
    }

    const std::vector<std::vector<std::string>> practitioners = {
        {std::string(dr_rao), "Dr. Rao", "ACTIVE", std::string(cardiology)},
        {std::string(dr_mehta), "Dr. Mehta", "ACTIVE", std::string(cardiology)},
        {std::string(dr_iyer), "Dr. Iyer", "ON_LEAVE", std::string(cardiology)},
        {std::string(dr_sen), "Dr. Sen", "ACTIVE", std::string(neurology)}};
    for (const auto& p : practitioners) {
        exec_sql(adapter,
                 "INSERT INTO practitioners (id, tenant_id, name, status) VALUES (?, ?, ?, ?)",
                 {p[0], std::string(tenant), p[1], p[2]});
        exec_sql(adapter,
                 "INSERT INTO practitioner_departments (practitioner_id, department_id, "
                 "is_primary) VALUES (?, ?, 1)",
                 {p[0], p[3]});
    }

    int n = 0;
    for (const auto& id : patient_ids()) {
        ++n;
        exec_sql(adapter,
                 "INSERT INTO patients (id, tenant_id, uhid, name, phone, gender) "
                 "VALUES (?, ?, ?, ?, ?, ?)",
                 {id, std::string(tenant), "UHID-00" + std::to_string(n),
                  "Patient " + std::to_string(n), "98450000" + std::to_string(n),
                  n % 2 == 0 ? std::string("F") : std::string("M")});
    }
}

// =============================================================================
// Sessions
// =============================================================================

inline security::session_context make_session(std::vector<std::string> departments,
                                              security::capability_set permissions =
                                                  security::capability_set::all(),
                                              std::string tenant_id = std::string(tenant)) {
    security::session_context session;
    session.tenant_id = std::move(tenant_id);
    session.user_id = "user-frontdesk";
    session.department_ids = std::move(departments);
    session.permissions = std::move(permissions);
    return session;
}

/** Every capability, assigned to Cardiology only */
inline security::session_context cardiology_staff() {
    return make_session({std::string(cardiology)});
}

/** Every capability, assigned to Neurology only */
inline security::session_context neurology_staff() {
    return make_session({std::string(neurology)});
}

inline security::session_context tenant_admin() {
    auto session = make_session({});
    session.user_id = "user-admin";
    session.is_super_admin = true;
    return session;
}

// =============================================================================
// Base Fixture
// =============================================================================

/**
 * @brief Scratch store with schema and reference data
 *
 * The clock starts on Monday 2025-01-06 at 08:00 UTC.
 */
class store_test : public ::testing::Test {
protected:
    void SetUp() override {
        db_path_ = scratch_db_path("opd");
        remove_db_files(db_path_);

        integration::database_config config;
        config.database_path = db_path_.string();
        config.pool_size = 4;
        adapter_ = integration::create_database_adapter(config);
        ASSERT_TRUE(adapter_->is_healthy());
        ASSERT_TRUE(storage::apply_schema(*adapter_).has_value());

        clock_ = std::make_shared<manual_clock>(utc(2025, 1, 6, 8, 0));
        seed_reference_data(*adapter_);
    }

    void TearDown() override {
        adapter_.reset();
        remove_db_files(db_path_);
    }

    std::filesystem::path db_path_;
    std::shared_ptr<integration::database_adapter> adapter_;
    std::shared_ptr<manual_clock> clock_;
};

}  // namespace clinic::opd::test

#endif  // CLINIC_OPD_TEST_HELPERS_H
