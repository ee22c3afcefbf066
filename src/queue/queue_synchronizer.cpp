/**
 * @file queue_synchronizer.cpp
 * @brief Queue snapshot synchronization and reads
 */

#include "clinic/opd/queue/queue_synchronizer.h"

#include "clinic/opd/integration/logger_adapter.h"

#include <algorithm>
#include <format>
#include <mutex>

namespace clinic::opd::queue {

namespace {

using integration::database_value;

constexpr std::string_view snapshot_columns =
    "visit_id, tenant_id, patient_id, patient_uhid, patient_name, patient_phone, "
    "patient_gender, patient_date_of_birth, practitioner_id, practitioner_name, "
    "department_id, department_name, appointment_id, token_number, visit_number, "
    "priority, priority_rank, status, visit_type, check_in_time, start_time, "
    "end_time, visit_updated_at";

// Same order as snapshot_columns without priority_rank
constexpr std::string_view visit_projection =
    "SELECT v.id, v.tenant_id, v.patient_id, p.uhid, p.name, p.phone, p.gender, "
    "p.date_of_birth, v.practitioner_id, pr.name, v.department_id, d.name, "
    "v.appointment_id, v.token_number, v.visit_number, v.priority, v.status, "
    "v.visit_type, v.check_in_time, v.start_time, v.end_time, v.updated_at "
    "FROM visits v "
    "LEFT JOIN patients p ON p.id = v.patient_id AND p.tenant_id = v.tenant_id "
    "LEFT JOIN practitioners pr ON pr.id = v.practitioner_id "
    "AND pr.tenant_id = v.tenant_id "
    "LEFT JOIN departments d ON d.id = v.department_id AND d.tenant_id = v.tenant_id "
    "WHERE v.id = ?";

constexpr std::size_t col_priority = 15;
constexpr std::size_t col_status = 16;
constexpr std::size_t col_visit_type = 17;

const std::vector<pagination::sort_column>& queue_order() {
    static const std::vector<pagination::sort_column> order = {
        {"priority_rank", pagination::sort_direction::descending,
         pagination::column_type::integer},
        {"check_in_time", pagination::sort_direction::ascending,
         pagination::column_type::text},
        {"visit_id", pagination::sort_direction::ascending,
         pagination::column_type::text}};
    return order;
}

queue_entry read_entry(const integration::database_row& row) {
    queue_entry entry;
    entry.visit_id = row.get_string(0);
    entry.tenant_id = row.get_string(1);
    entry.patient_id = row.get_string(2);
    entry.patient_uhid = row.get_string(3);
    entry.patient_name = row.get_string(4);
    entry.patient_phone = row.get_optional_string(5);
    entry.patient_gender = row.get_optional_string(6);
    entry.patient_date_of_birth = row.get_optional_string(7);
    entry.practitioner_id = row.get_string(8);
    entry.practitioner_name = row.get_string(9);
    entry.department_id = row.get_string(10);
    entry.department_name = row.get_string(11);
    entry.appointment_id = row.get_optional_string(12);
    entry.token_number = row.get_optional_int64(13);
    entry.visit_number = row.get_int64(14);
    entry.priority = scheduling::parse_priority(row.get_string(15))
                         .value_or(scheduling::priority::normal);
    entry.priority_rank = static_cast<int>(row.get_int64(16));
    entry.status = scheduling::parse_visit_status(row.get_string(17))
                       .value_or(scheduling::visit_status::waiting);
    entry.type = scheduling::parse_visit_type(row.get_string(18))
                     .value_or(scheduling::visit_type::opd);
    entry.check_in_time = row.get_string(19);
    entry.start_time = row.get_optional_string(20);
    entry.end_time = row.get_optional_string(21);
    entry.visit_updated_at = row.get_string(22);
    return entry;
}

/**
 * @brief Visit row projected for the snapshot, or nullopt if missing
 */
std::expected<std::optional<std::vector<database_value>>, integration::database_error>
read_visit(integration::database_connection& conn, std::string_view visit_id) {
    auto result = conn.query(visit_projection, {std::string(visit_id)});
    if (!result) {
        return std::unexpected(result.error());
    }
    if (!(*result)->next()) {
        return std::optional<std::vector<database_value>>{};
    }

    const auto& row = (*result)->current_row();
    std::vector<database_value> values;
    values.reserve(row.column_count());
    for (std::size_t i = 0; i < row.column_count(); ++i) {
        values.push_back(row.get_value(i));
    }
    return std::optional<std::vector<database_value>>{std::move(values)};
}

std::string text_of(const database_value& value) {
    if (const auto* text = std::get_if<std::string>(&value)) {
        return *text;
    }
    return {};
}

bool is_queued(const std::vector<database_value>& visit) {
    auto type = scheduling::parse_visit_type(text_of(visit[col_visit_type]));
    auto status = scheduling::parse_visit_status(text_of(visit[col_status]));
    return type == scheduling::visit_type::opd && status &&
           scheduling::is_active(*status);
}

std::string placeholders(std::size_t count) {
    std::string out;
    for (std::size_t i = 0; i < count; ++i) {
        out += (i == 0) ? "?" : ", ?";
    }
    return out;
}

scheduling::scheduling_result<std::vector<scheduling::visit_status>> effective_statuses(
    const queue_filter& filter) {
    if (filter.statuses.empty()) {
        return std::vector<scheduling::visit_status>{scheduling::visit_status::waiting,
                                                     scheduling::visit_status::in_progress};
    }
    for (auto status : filter.statuses) {
        if (!scheduling::is_active(status)) {
            return scheduling::fail(
                scheduling::scheduling_error::validation_error,
                std::format("The queue holds no {} visits", scheduling::to_string(status)));
        }
    }
    return filter.statuses;
}

/**
 * @brief WHERE clause shared by queue reads and counts
 */
struct scoped_query {
    std::string where;
    std::vector<database_value> params;
};

scheduling::scheduling_result<scoped_query> scope_query(
    const security::session_context& session,
    const queue_filter& filter) {
    if (auto allowed = security::require_permission(session,
                                                    security::permission::queue_view);
        !allowed) {
        return std::unexpected(scheduling::scheduling_failure::from(allowed.error()));
    }

    security::department_filter departments = security::build_filter(session,
                                                                      "department_id");
    if (!filter.department_ids.empty()) {
        if (auto allowed = security::verify_department_list(session,
                                                            filter.department_ids);
            !allowed) {
            return std::unexpected(scheduling::scheduling_failure::from(allowed.error()));
        }
        departments = security::department_filter::restricted("department_id",
                                                              filter.department_ids);
    }

    auto statuses = effective_statuses(filter);
    if (!statuses) {
        return std::unexpected(statuses.error());
    }

    scoped_query query;
    query.where = std::format("tenant_id = ? AND {}", departments.to_sql());
    query.params.emplace_back(session.tenant_id);
    for (auto& value : departments.bindings()) {
        query.params.push_back(std::move(value));
    }

    if (filter.practitioner_id) {
        query.where += " AND practitioner_id = ?";
        query.params.emplace_back(*filter.practitioner_id);
    }

    query.where += std::format(" AND status IN ({})", placeholders(statuses->size()));
    for (auto status : *statuses) {
        query.params.emplace_back(std::string(scheduling::to_string(status)));
    }

    if (filter.priority) {
        query.where += " AND priority = ?";
        query.params.emplace_back(std::string(scheduling::to_string(*filter.priority)));
    }
    return query;
}

std::expected<std::vector<std::string>, integration::database_error> collect_ids(
    integration::database_connection& conn,
    std::string_view sql,
    const std::vector<database_value>& params) {
    auto result = conn.query(sql, params);
    if (!result) {
        return std::unexpected(result.error());
    }
    std::vector<std::string> ids;
    while ((*result)->next()) {
        ids.push_back((*result)->current_row().get_string(0));
    }
    return ids;
}

}  // namespace

// =============================================================================
// Implementation
// =============================================================================

class queue_synchronizer::impl {
public:
    impl(std::shared_ptr<integration::database_adapter> adapter,
         config::pagination_config pagination,
         std::shared_ptr<security::rate_limiter> limiter,
         std::shared_ptr<const storage::clock> time_source)
        : adapter_(std::move(adapter)),
          pagination_(pagination),
          limiter_(std::move(limiter)),
          clock_(std::move(time_source)),
          logger_(integration::create_logger("queue_sync")) {}

    std::expected<sync_outcome, queue_error> sync_snapshot(std::string_view visit_id) {
        auto scope = integration::connection_scope::acquire(*adapter_);
        if (!scope) {
            count_failure();
            logger_->warning(std::format("Queue sync for visit {} skipped: {}", visit_id,
                                         integration::to_string(scope.error())));
            return std::unexpected(queue_error::database_error);
        }
        auto& conn = scope->connection();

        auto visit = read_visit(conn, visit_id);
        if (!visit) {
            return fail_sync(conn, visit_id, queue_error::visit_read_failed);
        }

        sync_outcome outcome = sync_outcome::removed;
        if (*visit && is_queued(**visit)) {
            if (!upsert(conn, **visit)) {
                return fail_sync(conn, visit_id, queue_error::snapshot_write_failed);
            }
            outcome = sync_outcome::upserted;
        } else {
            auto removed = conn.query("DELETE FROM opd_queue_snapshots WHERE visit_id = ?",
                                      {std::string(visit_id)});
            if (!removed) {
                return fail_sync(conn, visit_id, queue_error::snapshot_write_failed);
            }
        }

        clear_failure(conn, visit_id);
        {
            std::lock_guard lock(stats_mutex_);
            ++stats_.syncs;
        }
        logger_->trace(std::format("Visit {} {}", visit_id,
                                   outcome == sync_outcome::upserted ? "queued"
                                                                     : "dequeued"));
        return outcome;
    }

    void sync_after_commit(std::string_view visit_id) {
        auto synced = sync_snapshot(visit_id);
        if (!synced) {
            // Already recorded in queue_sync_failures
            logger_->debug(std::format("Visit {} left for reconciliation", visit_id));
        }
    }

    scheduling::scheduling_result<pagination::page<queue_entry>> get_queue(
        const security::session_context& session,
        const queue_filter& filter,
        const std::optional<std::string>& cursor,
        std::optional<std::size_t> limit) {
        auto query = scope_query(session, filter);
        if (!query) {
            return std::unexpected(query.error());
        }
        if (auto throttled = throttle(session); !throttled) {
            return std::unexpected(throttled.error());
        }

        if (cursor) {
            auto position = pagination::decode(*cursor);
            if (!position) {
                return scheduling::fail(scheduling::scheduling_error::validation_error,
                                        pagination::to_string(position.error()));
            }
            auto predicate = pagination::build_keyset_predicate(queue_order(), *position);
            if (!predicate) {
                return scheduling::fail(scheduling::scheduling_error::validation_error,
                                        pagination::to_string(predicate.error()));
            }
            query->where += " AND " + predicate->sql;
            for (auto& value : predicate->bindings) {
                query->params.push_back(std::move(value));
            }
        }

        std::size_t page_size =
            pagination::sanitize_limit(limit, pagination_.default_limit, pagination_.max_limit);
        query->params.emplace_back(static_cast<int64_t>(page_size + 1));

        auto scope = integration::connection_scope::acquire(*adapter_);
        if (!scope) {
            return std::unexpected(scheduling::scheduling_failure::from(scope.error()));
        }

        auto result = scope->connection().query(
            std::format("SELECT {} FROM opd_queue_snapshots WHERE {} ORDER BY {} LIMIT ?",
                        snapshot_columns, query->where,
                        pagination::order_by_clause(queue_order())),
            query->params);
        if (!result) {
            logger_->error(std::format("Queue read failed: {}",
                                       scope->connection().last_error()));
            return std::unexpected(scheduling::scheduling_failure::from(result.error()));
        }

        std::vector<queue_entry> rows;
        while ((*result)->next()) {
            rows.push_back(read_entry((*result)->current_row()));
        }

        return pagination::make_page(std::move(rows), page_size, [](const queue_entry& e) {
            return pagination::cursor_position{
                {std::to_string(e.priority_rank), e.check_in_time}, e.visit_id};
        });
    }

    scheduling::scheduling_result<queue_counts> get_counts(
        const security::session_context& session,
        const queue_filter& filter) {
        auto query = scope_query(session, filter);
        if (!query) {
            return std::unexpected(query.error());
        }
        if (auto throttled = throttle(session); !throttled) {
            return std::unexpected(throttled.error());
        }

        auto scope = integration::connection_scope::acquire(*adapter_);
        if (!scope) {
            return std::unexpected(scheduling::scheduling_failure::from(scope.error()));
        }
        auto result = scope->connection().query(
            std::format("SELECT status, COUNT(*) FROM opd_queue_snapshots WHERE {} "
                        "GROUP BY status",
                        query->where),
            query->params);
        if (!result) {
            return std::unexpected(scheduling::scheduling_failure::from(result.error()));
        }

        queue_counts counts;
        while ((*result)->next()) {
            const auto& row = (*result)->current_row();
            auto count = static_cast<std::size_t>(row.get_int64(1));
            auto status = scheduling::parse_visit_status(row.get_string(0));
            if (status == scheduling::visit_status::waiting) {
                counts.waiting += count;
            } else if (status == scheduling::visit_status::in_progress) {
                counts.in_progress += count;
            }
        }
        return counts;
    }

    std::expected<rebuild_report, queue_error> rebuild_for_tenant(std::string_view tenant_id) {
        if (tenant_id.empty()) {
            return std::unexpected(queue_error::invalid_tenant);
        }

        std::vector<std::string> active;
        std::vector<std::string> stale;
        std::vector<std::string> failed_before;
        {
            auto scope = integration::connection_scope::acquire(*adapter_);
            if (!scope) {
                return std::unexpected(queue_error::database_error);
            }
            auto& conn = scope->connection();
            std::string tenant(tenant_id);

            auto active_ids = collect_ids(
                conn,
                "SELECT id FROM visits WHERE tenant_id = ? AND visit_type = 'OPD' "
                "AND status IN ('WAITING', 'IN_PROGRESS') ORDER BY check_in_time, id",
                {tenant});
            auto stale_ids = collect_ids(
                conn,
                "SELECT s.visit_id FROM opd_queue_snapshots s "
                "LEFT JOIN visits v ON v.id = s.visit_id "
                "WHERE s.tenant_id = ? AND (v.id IS NULL OR v.visit_type != 'OPD' "
                "OR v.status NOT IN ('WAITING', 'IN_PROGRESS'))",
                {tenant});
            auto failed_ids = collect_ids(
                conn, "SELECT visit_id FROM queue_sync_failures WHERE tenant_id = ?",
                {tenant});
            if (!active_ids || !stale_ids || !failed_ids) {
                logger_->error(std::format("Rebuild of tenant {} could not list visits: {}",
                                           tenant_id, conn.last_error()));
                return std::unexpected(queue_error::visit_read_failed);
            }
            active = std::move(*active_ids);
            stale = std::move(*stale_ids);
            failed_before = std::move(*failed_ids);
        }

        rebuild_report report;
        for (const auto& id : active) {
            if (sync_snapshot(id)) {
                ++report.synced;
            } else {
                ++report.failed;
            }
        }
        for (const auto& id : stale) {
            auto outcome = sync_snapshot(id);
            if (outcome && *outcome == sync_outcome::removed) {
                ++report.stale_removed;
            } else if (!outcome) {
                ++report.failed;
            }
        }
        // Failures of visits not covered above (e.g. a row that was never written)
        for (const auto& id : failed_before) {
            if (std::find(active.begin(), active.end(), id) != active.end() ||
                std::find(stale.begin(), stale.end(), id) != stale.end()) {
                continue;
            }
            if (!sync_snapshot(id)) {
                ++report.failed;
            }
        }

        auto remaining = pending_failures(tenant_id);
        if (!remaining) {
            return std::unexpected(remaining.error());
        }
        report.failures_drained =
            failed_before.size() > *remaining ? failed_before.size() - *remaining : 0;

        {
            std::lock_guard lock(stats_mutex_);
            ++stats_.rebuilds;
        }
        logger_->info(std::format(
            "Rebuilt queue of tenant {}: {} synced, {} stale removed, {} failures drained, "
            "{} failed",
            tenant_id, report.synced, report.stale_removed, report.failures_drained,
            report.failed));
        return report;
    }

    std::expected<std::size_t, queue_error> cleanup(std::string_view tenant_id,
                                                    std::chrono::seconds retention) {
        if (tenant_id.empty()) {
            return std::unexpected(queue_error::invalid_tenant);
        }

        auto scope = integration::connection_scope::acquire(*adapter_);
        if (!scope) {
            return std::unexpected(queue_error::database_error);
        }

        std::string cutoff = storage::to_timestamp(clock_->now() - retention);
        std::string tenant(tenant_id);
        auto result = scope->connection().query(
            "DELETE FROM opd_queue_snapshots WHERE tenant_id = ? AND visit_id IN ("
            "SELECT s.visit_id FROM opd_queue_snapshots s "
            "LEFT JOIN visits v ON v.id = s.visit_id WHERE s.tenant_id = ? AND ("
            "(v.id IS NULL AND s.visit_updated_at < ?) OR "
            "(v.status IN ('COMPLETED', 'CANCELLED') "
            "AND COALESCE(v.end_time, v.updated_at) < ?)))",
            {tenant, tenant, cutoff, cutoff});
        if (!result) {
            logger_->error(std::format("Queue cleanup of tenant {} failed: {}", tenant_id,
                                       scope->connection().last_error()));
            return std::unexpected(queue_error::snapshot_write_failed);
        }

        auto deleted = (*result)->affected_rows();
        if (deleted > 0) {
            std::lock_guard lock(stats_mutex_);
            stats_.rows_cleaned += deleted;
        }
        return deleted;
    }

    std::expected<std::vector<std::string>, queue_error> list_tenants() {
        auto scope = integration::connection_scope::acquire(*adapter_);
        if (!scope) {
            return std::unexpected(queue_error::database_error);
        }
        auto tenants = collect_ids(
            scope->connection(),
            "SELECT tenant_id FROM visits WHERE visit_type = 'OPD' "
            "UNION SELECT tenant_id FROM opd_queue_snapshots "
            "UNION SELECT tenant_id FROM queue_sync_failures "
            "ORDER BY 1",
            {});
        if (!tenants) {
            return std::unexpected(queue_error::visit_read_failed);
        }
        return std::move(*tenants);
    }

    std::expected<std::size_t, queue_error> pending_failures(std::string_view tenant_id) {
        auto scope = integration::connection_scope::acquire(*adapter_);
        if (!scope) {
            return std::unexpected(queue_error::database_error);
        }
        auto result = scope->connection().query(
            "SELECT COUNT(*) FROM queue_sync_failures WHERE tenant_id = ?",
            {std::string(tenant_id)});
        if (!result || !(*result)->next()) {
            return std::unexpected(queue_error::failure_record_failed);
        }
        return static_cast<std::size_t>((*result)->current_row().get_int64(0));
    }

    sync_statistics get_statistics() const {
        std::lock_guard lock(stats_mutex_);
        return stats_;
    }

private:
    bool upsert(integration::database_connection& conn,
                const std::vector<database_value>& visit) {
        std::vector<database_value> params(visit.begin(), visit.begin() + col_status);
        auto level = scheduling::parse_priority(text_of(visit[col_priority]))
                         .value_or(scheduling::priority::normal);
        params.emplace_back(static_cast<int64_t>(scheduling::priority_rank(level)));
        params.insert(params.end(), visit.begin() + col_status, visit.end());

        auto result = conn.query(
            std::format(
                "INSERT INTO opd_queue_snapshots ({}) VALUES ({}) "
                "ON CONFLICT(visit_id) DO UPDATE SET "
                "tenant_id = excluded.tenant_id, patient_id = excluded.patient_id, "
                "patient_uhid = excluded.patient_uhid, patient_name = excluded.patient_name, "
                "patient_phone = excluded.patient_phone, "
                "patient_gender = excluded.patient_gender, "
                "patient_date_of_birth = excluded.patient_date_of_birth, "
                "practitioner_id = excluded.practitioner_id, "
                "practitioner_name = excluded.practitioner_name, "
                "department_id = excluded.department_id, "
                "department_name = excluded.department_name, "
                "appointment_id = excluded.appointment_id, "
                "token_number = excluded.token_number, "
                "visit_number = excluded.visit_number, priority = excluded.priority, "
                "priority_rank = excluded.priority_rank, status = excluded.status, "
                "visit_type = excluded.visit_type, check_in_time = excluded.check_in_time, "
                "start_time = excluded.start_time, end_time = excluded.end_time, "
                "visit_updated_at = excluded.visit_updated_at",
                snapshot_columns, placeholders(params.size())),
            params);
        return result.has_value();
    }

    std::unexpected<queue_error> fail_sync(integration::database_connection& conn,
                                           std::string_view visit_id,
                                           queue_error error) {
        count_failure();
        std::string detail = conn.last_error();
        logger_->warning(std::format("Queue sync for visit {} failed: {} ({})", visit_id,
                                     to_string(error), detail));

        auto recorded = conn.query(
            "INSERT INTO queue_sync_failures "
            "(visit_id, tenant_id, last_error, attempt_count, last_failed_at) "
            "VALUES (?, ?, ?, 1, ?) "
            "ON CONFLICT(visit_id) DO UPDATE SET last_error = excluded.last_error, "
            "attempt_count = attempt_count + 1, last_failed_at = excluded.last_failed_at",
            {std::string(visit_id), tenant_of(conn, visit_id),
             std::format("{}: {}", to_string(error), detail),
             storage::to_timestamp(clock_->now())});
        if (!recorded) {
            logger_->error(std::format("Could not record sync failure of visit {}: {}",
                                       visit_id, conn.last_error()));
        }
        return std::unexpected(error);
    }

    /**
     * @brief Tenant of a visit, falling back to its snapshot row
     *
     * Empty when neither lookup succeeds.
     */
    std::string tenant_of(integration::database_connection& conn, std::string_view visit_id) {
        for (std::string_view sql :
             {std::string_view{"SELECT tenant_id FROM visits WHERE id = ?"},
              std::string_view{"SELECT tenant_id FROM opd_queue_snapshots WHERE visit_id = ?"}}) {
            auto result = conn.query(sql, {std::string(visit_id)});
            if (!result) {
                logger_->debug(std::format("Tenant lookup for visit {} failed: {}", visit_id,
                                           conn.last_error()));
                continue;
            }
            if ((*result)->next()) {
                return (*result)->current_row().get_string(0);
            }
        }
        return {};
    }

    void clear_failure(integration::database_connection& conn, std::string_view visit_id) {
        auto cleared = conn.query("DELETE FROM queue_sync_failures WHERE visit_id = ?",
                                  {std::string(visit_id)});
        if (!cleared) {
            logger_->warning(std::format("Could not clear sync failure of visit {}: {}",
                                         visit_id, conn.last_error()));
        }
    }

    void count_failure() {
        std::lock_guard lock(stats_mutex_);
        ++stats_.sync_failures;
    }

    scheduling::scheduling_result<void> throttle(const security::session_context& session) {
        if (!limiter_) {
            return {};
        }
        auto allowed = limiter_->enforce(security::rate_limit_tier::queue_read,
                                         session.tenant_id, session.user_id);
        if (!allowed) {
            return std::unexpected(scheduling::scheduling_failure::from(allowed.error()));
        }
        return {};
    }

    std::shared_ptr<integration::database_adapter> adapter_;
    config::pagination_config pagination_;
    std::shared_ptr<security::rate_limiter> limiter_;
    std::shared_ptr<const storage::clock> clock_;
    std::unique_ptr<integration::logger_adapter> logger_;

    mutable std::mutex stats_mutex_;
    sync_statistics stats_;
};

// =============================================================================
// Public Interface
// =============================================================================

queue_synchronizer::queue_synchronizer(
    std::shared_ptr<integration::database_adapter> adapter,
    config::pagination_config pagination,
    std::shared_ptr<security::rate_limiter> limiter,
    std::shared_ptr<const storage::clock> time_source)
    : pimpl_(std::make_unique<impl>(std::move(adapter), pagination, std::move(limiter),
                                    std::move(time_source))) {}

queue_synchronizer::~queue_synchronizer() = default;

std::expected<sync_outcome, queue_error> queue_synchronizer::sync_snapshot(
    std::string_view visit_id) {
    return pimpl_->sync_snapshot(visit_id);
}

void queue_synchronizer::sync_after_commit(std::string_view visit_id) {
    pimpl_->sync_after_commit(visit_id);
}

scheduling::scheduling_result<pagination::page<queue_entry>> queue_synchronizer::get_queue(
    const security::session_context& session,
    const queue_filter& filter,
    const std::optional<std::string>& cursor,
    std::optional<std::size_t> limit) {
    return pimpl_->get_queue(session, filter, cursor, limit);
}

scheduling::scheduling_result<queue_counts> queue_synchronizer::get_counts(
    const security::session_context& session,
    const queue_filter& filter) {
    return pimpl_->get_counts(session, filter);
}

std::expected<rebuild_report, queue_error> queue_synchronizer::rebuild_for_tenant(
    std::string_view tenant_id) {
    return pimpl_->rebuild_for_tenant(tenant_id);
}

std::expected<std::size_t, queue_error> queue_synchronizer::cleanup(
    std::string_view tenant_id,
    std::chrono::seconds retention) {
    return pimpl_->cleanup(tenant_id, retention);
}

std::expected<std::vector<std::string>, queue_error> queue_synchronizer::list_tenants() {
    return pimpl_->list_tenants();
}

std::expected<std::size_t, queue_error> queue_synchronizer::pending_failures(
    std::string_view tenant_id) {
    return pimpl_->pending_failures(tenant_id);
}

sync_statistics queue_synchronizer::get_statistics() const {
    return pimpl_->get_statistics();
}

}  // namespace clinic::opd::queue
