#ifndef CLINIC_OPD_QUEUE_QUEUE_SYNCHRONIZER_H
#define CLINIC_OPD_QUEUE_QUEUE_SYNCHRONIZER_H

/**
 * @file queue_synchronizer.h
 * @brief Denormalized OPD queue read model
 *
 * opd_queue_snapshots holds one row per active OPD visit (WAITING or
 * IN_PROGRESS) with the patient, practitioner and department display data
 * copied in, so queue reads never join. Only this class writes the table.
 *
 * Writers call sync_snapshot() after their transaction commits. A failed
 * sync is logged, counted and recorded in queue_sync_failures; it never
 * fails the write that triggered it. rebuild_for_tenant() repairs drift
 * and drains the recorded failures.
 */

#include "clinic/opd/config/scheduler_config.h"
#include "clinic/opd/integration/database_adapter.h"
#include "clinic/opd/pagination/cursor.h"
#include "clinic/opd/scheduling/scheduling_error.h"
#include "clinic/opd/scheduling/scheduling_types.h"
#include "clinic/opd/security/access_guard.h"
#include "clinic/opd/security/rate_limiter.h"
#include "clinic/opd/storage/timestamps.h"

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clinic::opd::queue {

// =============================================================================
// Queue Error Codes (-910 to -919)
// =============================================================================

/**
 * @brief Queue synchronizer error codes
 *
 * Allocated range: -910 to -919
 */
enum class queue_error : int {
    /** No pooled connection or storage unreachable */
    database_error = -910,

    /** Visit row could not be read */
    visit_read_failed = -911,

    /** Snapshot upsert or delete failed */
    snapshot_write_failed = -912,

    /** Sync failure ledger could not be updated */
    failure_record_failed = -913,

    /** Tenant id missing */
    invalid_tenant = -914
};

[[nodiscard]] constexpr int to_error_code(queue_error error) noexcept {
    return static_cast<int>(error);
}

[[nodiscard]] constexpr const char* to_string(queue_error error) noexcept {
    switch (error) {
        case queue_error::database_error:
            return "Queue storage unavailable";
        case queue_error::visit_read_failed:
            return "Failed to read visit";
        case queue_error::snapshot_write_failed:
            return "Failed to write queue snapshot";
        case queue_error::failure_record_failed:
            return "Failed to record sync failure";
        case queue_error::invalid_tenant:
            return "Tenant id is required";
        default:
            return "Unknown queue error";
    }
}

// =============================================================================
// Snapshot Entry
// =============================================================================

/**
 * @brief One row of the queue read model
 */
struct queue_entry {
    std::string visit_id;
    std::string tenant_id;

    std::string patient_id;
    std::string patient_uhid;
    std::string patient_name;
    std::optional<std::string> patient_phone;
    std::optional<std::string> patient_gender;
    std::optional<std::string> patient_date_of_birth;

    std::string practitioner_id;
    std::string practitioner_name;
    std::string department_id;
    std::string department_name;
    std::optional<std::string> appointment_id;

    std::optional<int64_t> token_number;
    int64_t visit_number = 0;
    scheduling::priority priority = scheduling::priority::normal;
    int priority_rank = 2;
    scheduling::visit_status status = scheduling::visit_status::waiting;
    scheduling::visit_type type = scheduling::visit_type::opd;

    std::string check_in_time;
    std::optional<std::string> start_time;
    std::optional<std::string> end_time;

    /** updated_at of the visit the row was derived from */
    std::string visit_updated_at;
};

/**
 * @brief Queue read filters
 *
 * Empty department_ids means "all departments of the session"; empty
 * statuses means WAITING and IN_PROGRESS.
 */
struct queue_filter {
    std::vector<std::string> department_ids;
    std::optional<std::string> practitioner_id;
    std::vector<scheduling::visit_status> statuses;
    std::optional<scheduling::priority> priority;
};

struct queue_counts {
    std::size_t waiting = 0;
    std::size_t in_progress = 0;

    [[nodiscard]] std::size_t total() const noexcept { return waiting + in_progress; }
};

/**
 * @brief What a sync did to the snapshot
 */
enum class sync_outcome {
    /** Row inserted or refreshed */
    upserted,

    /** Row deleted (or already absent) because the visit is not queued */
    removed
};

/**
 * @brief Result of one rebuild_for_tenant() pass
 */
struct rebuild_report {
    std::size_t synced = 0;
    std::size_t stale_removed = 0;
    std::size_t failures_drained = 0;
    std::size_t failed = 0;
};

/**
 * @brief Synchronizer counters
 */
struct sync_statistics {
    std::size_t syncs = 0;
    std::size_t sync_failures = 0;
    std::size_t rebuilds = 0;
    std::size_t rows_cleaned = 0;
};

// =============================================================================
// Queue Synchronizer
// =============================================================================

class queue_synchronizer {
public:
    queue_synchronizer(std::shared_ptr<integration::database_adapter> adapter,
                       config::pagination_config pagination = {},
                       std::shared_ptr<security::rate_limiter> limiter = nullptr,
                       std::shared_ptr<const storage::clock> time_source =
                           storage::default_clock());

    ~queue_synchronizer();

    queue_synchronizer(const queue_synchronizer&) = delete;
    queue_synchronizer& operator=(const queue_synchronizer&) = delete;

    /**
     * @brief Bring the snapshot row of one visit in line with the visit
     *
     * Upserts when the visit is OPD and WAITING/IN_PROGRESS; deletes the
     * row otherwise, including when the visit does not exist. Running it
     * twice on an unchanged visit leaves the row identical.
     *
     * A failure is recorded in queue_sync_failures before it is returned.
     */
    [[nodiscard]] std::expected<sync_outcome, queue_error> sync_snapshot(
        std::string_view visit_id);

    /**
     * @brief sync_snapshot() for callers that have already committed
     *
     * Reports nothing back; failures are logged and recorded for
     * reconciliation.
     */
    void sync_after_commit(std::string_view visit_id);

    /**
     * @brief Read the queue, highest priority first, then by check-in time
     *
     * Requires QUEUE_VIEW. Requested departments outside the session
     * fail with DEPT_ACCESS_DENIED.
     */
    [[nodiscard]] scheduling::scheduling_result<pagination::page<queue_entry>> get_queue(
        const security::session_context& session,
        const queue_filter& filter,
        const std::optional<std::string>& cursor = std::nullopt,
        std::optional<std::size_t> limit = std::nullopt);

    [[nodiscard]] scheduling::scheduling_result<queue_counts> get_counts(
        const security::session_context& session,
        const queue_filter& filter);

    /**
     * @brief Re-sync every active OPD visit of a tenant
     *
     * Also removes rows whose visit is no longer queued and drains the
     * tenant's sync failure records.
     */
    [[nodiscard]] std::expected<rebuild_report, queue_error> rebuild_for_tenant(
        std::string_view tenant_id);

    /**
     * @brief Delete rows whose visit ended more than @p retention ago
     * @return Number of rows deleted
     */
    [[nodiscard]] std::expected<std::size_t, queue_error> cleanup(
        std::string_view tenant_id,
        std::chrono::seconds retention = std::chrono::hours{24});

    /**
     * @brief Tenants that have OPD visits, snapshot rows or pending failures
     */
    [[nodiscard]] std::expected<std::vector<std::string>, queue_error> list_tenants();

    /**
     * @brief Visits waiting in queue_sync_failures
     */
    [[nodiscard]] std::expected<std::size_t, queue_error> pending_failures(
        std::string_view tenant_id);

    [[nodiscard]] sync_statistics get_statistics() const;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace clinic::opd::queue

#endif  // CLINIC_OPD_QUEUE_QUEUE_SYNCHRONIZER_H
