/**
 * @file availability_service.cpp
 * @brief Availability templates, slot projection and booking validation
 */

#include "clinic/opd/scheduling/availability_service.h"

#include "clinic/opd/integration/logger_adapter.h"
#include "clinic/opd/scheduling/calendar.h"
#include "clinic/opd/scheduling/directory.h"

#include <algorithm>
#include <format>
#include <set>

namespace clinic::opd::scheduling {

namespace {

using integration::database_value;

constexpr std::string_view template_columns =
    "id, tenant_id, practitioner_id, department_id, day_of_week, start_time, "
    "end_time, slot_duration_minutes, max_patients_per_day, allow_walk_in, "
    "walk_in_slots, effective_from, effective_to, status, version, created_at, "
    "updated_at";

constexpr std::string_view slot_holding_statuses =
    "status NOT IN ('CANCELLED', 'NO_SHOW', 'RESCHEDULED')";

integration::logger_adapter& availability_logger() {
    static auto logger = integration::create_logger("availability");
    return *logger;
}

availability_template read_template(const integration::database_row& row) {
    availability_template tmpl;
    tmpl.id = row.get_string(0);
    tmpl.tenant_id = row.get_string(1);
    tmpl.practitioner_id = row.get_string(2);
    tmpl.department_id = row.get_string(3);
    tmpl.day = parse_day_of_week(row.get_string(4)).value_or(day_of_week::monday);
    tmpl.start_time = row.get_string(5);
    tmpl.end_time = row.get_string(6);
    tmpl.slot_duration_minutes = static_cast<int>(row.get_int64(7));
    if (auto cap = row.get_optional_int64(8)) {
        tmpl.max_patients_per_day = static_cast<int>(*cap);
    }
    tmpl.allow_walk_in = row.get_int64(9) != 0;
    tmpl.walk_in_slots = static_cast<int>(row.get_int64(10));
    tmpl.effective_from = row.get_optional_string(11);
    tmpl.effective_to = row.get_optional_string(12);
    tmpl.status = parse_template_status(row.get_string(13)).value_or(template_status::inactive);
    tmpl.version = row.get_int64(14);
    tmpl.created_at = row.get_string(15);
    tmpl.updated_at = row.get_string(16);
    return tmpl;
}

scheduling_result<std::vector<availability_template>> query_templates(
    integration::database_connection& conn,
    const std::string& sql,
    const std::vector<database_value>& params) {
    auto result = conn.query(sql, params);
    if (!result) {
        availability_logger().error(
            std::format("Template query failed: {}", conn.last_error()));
        return std::unexpected(scheduling_failure::from(result.error()));
    }

    std::vector<availability_template> templates;
    while ((*result)->next()) {
        templates.push_back(read_template((*result)->current_row()));
    }
    return templates;
}

scheduling_result<std::optional<availability_template>> load_template(
    integration::database_connection& conn, std::string_view template_id) {
    auto templates = query_templates(
        conn,
        std::format("SELECT {} FROM availability_templates WHERE id = ?",
                    template_columns),
        {std::string(template_id)});
    if (!templates) {
        return std::unexpected(templates.error());
    }
    if (templates->empty()) {
        return std::optional<availability_template>{};
    }
    return std::optional<availability_template>{std::move(templates->front())};
}

/**
 * @brief Active templates of a practitioner in effect on @p date
 */
scheduling_result<std::vector<availability_template>> templates_in_effect(
    integration::database_connection& conn,
    std::string_view tenant_id,
    std::string_view practitioner_id,
    day_of_week day,
    std::string_view date) {
    return query_templates(
        conn,
        std::format("SELECT {} FROM availability_templates "
                    "WHERE tenant_id = ? AND practitioner_id = ? AND day_of_week = ? "
                    "AND status = 'ACTIVE' "
                    "AND (effective_from IS NULL OR effective_from <= ?) "
                    "AND (effective_to IS NULL OR effective_to >= ?) "
                    "ORDER BY start_time, id",
                    template_columns),
        {std::string(tenant_id), std::string(practitioner_id),
         std::string(to_string(day)), std::string(date), std::string(date)});
}

struct booking_entry {
    std::string id;
    std::string department_id;
    int minutes = 0;
    bool is_walk_in = false;
};

scheduling_result<std::vector<booking_entry>> bookings_on(
    integration::database_connection& conn,
    std::string_view tenant_id,
    std::string_view practitioner_id,
    std::string_view date) {
    auto result = conn.query(
        std::format("SELECT id, department_id, appointment_time, is_walk_in "
                    "FROM appointments WHERE tenant_id = ? AND practitioner_id = ? "
                    "AND appointment_date = ? AND {}",
                    slot_holding_statuses),
        {std::string(tenant_id), std::string(practitioner_id), std::string(date)});
    if (!result) {
        return std::unexpected(scheduling_failure::from(result.error()));
    }

    std::vector<booking_entry> bookings;
    while ((*result)->next()) {
        const auto& row = (*result)->current_row();
        auto minutes = parse_time_of_day(row.get_string(2));
        if (!minutes) {
            continue;
        }
        bookings.push_back({row.get_string(0), row.get_string(1), *minutes,
                            row.get_int64(3) != 0});
    }
    return bookings;
}

// =============================================================================
// Window Validation
// =============================================================================

struct normalized_window {
    int start = 0;
    int end = 0;
    int duration = 0;
    availability_window source;
};

scheduling_result<normalized_window> normalize(const availability_window& window,
                                               int default_duration) {
    auto start = parse_time_of_day(window.start_time);
    auto end = parse_time_of_day(window.end_time);
    if (!start || !end) {
        return fail(scheduling_error::validation_error,
                    "Window times must be HH:MM");
    }
    if (*start >= *end) {
        return fail(scheduling_error::validation_error,
                    "Window start must be before its end");
    }

    int duration = window.slot_duration_minutes.value_or(default_duration);
    if (duration < 5 || duration > 120) {
        return fail(scheduling_error::validation_error,
                    "Slot duration must be between 5 and 120 minutes");
    }
    if (*end - *start < duration) {
        return fail(scheduling_error::validation_error,
                    "Window is shorter than one slot");
    }
    if (window.max_patients_per_day && *window.max_patients_per_day <= 0) {
        return fail(scheduling_error::validation_error,
                    "Daily patient limit must be positive");
    }
    if (window.walk_in_slots < 0) {
        return fail(scheduling_error::validation_error,
                    "Walk-in reservation cannot be negative");
    }
    if (window.walk_in_slots > (*end - *start) / duration) {
        return fail(scheduling_error::validation_error,
                    "Walk-in reservation exceeds the slots in the window");
    }
    if ((window.effective_from && !parse_date(*window.effective_from)) ||
        (window.effective_to && !parse_date(*window.effective_to))) {
        return fail(scheduling_error::validation_error,
                    "Effective dates must be YYYY-MM-DD");
    }
    if (window.effective_from && window.effective_to &&
        *window.effective_from > *window.effective_to) {
        return fail(scheduling_error::validation_error,
                    "Effective range ends before it starts");
    }

    normalized_window normalized{*start, *end, duration, window};
    normalized.source.slot_duration_minutes = duration;
    return normalized;
}

bool effective_ranges_intersect(const std::optional<std::string>& a_from,
                                const std::optional<std::string>& a_to,
                                const std::optional<std::string>& b_from,
                                const std::optional<std::string>& b_to) {
    if (a_from && b_to && *a_from > *b_to) {
        return false;
    }
    if (b_from && a_to && *b_from > *a_to) {
        return false;
    }
    return true;
}

std::string describe(const availability_template& tmpl) {
    return std::format("{} {}-{}", to_string(tmpl.day), tmpl.start_time,
                       tmpl.end_time);
}

/**
 * @brief Fail with AVAILABILITY_OVERLAP if the window collides with an
 *        active template of the practitioner on @p day
 */
scheduling_result<void> check_overlap(integration::database_connection& conn,
                                      std::string_view tenant_id,
                                      std::string_view practitioner_id,
                                      day_of_week day,
                                      const normalized_window& window,
                                      const std::optional<std::string>& exclude_id) {
    std::string sql = std::format(
        "SELECT {} FROM availability_templates "
        "WHERE tenant_id = ? AND practitioner_id = ? AND day_of_week = ? "
        "AND status = 'ACTIVE' AND start_time < ? AND end_time > ?",
        template_columns);
    std::vector<database_value> params = {
        std::string(tenant_id), std::string(practitioner_id),
        std::string(to_string(day)), format_time_of_day(window.end),
        format_time_of_day(window.start)};
    if (exclude_id) {
        sql += " AND id != ?";
        params.emplace_back(*exclude_id);
    }

    auto existing = query_templates(conn, sql, params);
    if (!existing) {
        return std::unexpected(existing.error());
    }

    for (const auto& other : *existing) {
        if (effective_ranges_intersect(window.source.effective_from,
                                       window.source.effective_to,
                                       other.effective_from, other.effective_to)) {
            return fail(scheduling_error::availability_overlap,
                        std::format("Overlaps existing window {}", describe(other)),
                        other.id);
        }
    }
    return {};
}

scheduling_result<availability_template> insert_template(
    integration::database_connection& conn,
    std::string_view tenant_id,
    std::string_view practitioner_id,
    std::string_view department_id,
    day_of_week day,
    const normalized_window& window,
    const std::string& now) {
    availability_template tmpl;
    tmpl.id = storage::generate_record_id();
    tmpl.tenant_id = std::string(tenant_id);
    tmpl.practitioner_id = std::string(practitioner_id);
    tmpl.department_id = std::string(department_id);
    tmpl.day = day;
    tmpl.start_time = format_time_of_day(window.start);
    tmpl.end_time = format_time_of_day(window.end);
    tmpl.slot_duration_minutes = window.duration;
    tmpl.max_patients_per_day = window.source.max_patients_per_day;
    tmpl.allow_walk_in = window.source.allow_walk_in;
    tmpl.walk_in_slots = window.source.walk_in_slots;
    tmpl.effective_from = window.source.effective_from;
    tmpl.effective_to = window.source.effective_to;
    tmpl.status = template_status::active;
    tmpl.version = 1;
    tmpl.created_at = now;
    tmpl.updated_at = now;

    database_value cap;
    if (tmpl.max_patients_per_day) {
        cap = static_cast<int64_t>(*tmpl.max_patients_per_day);
    }

    auto result = conn.query(
        "INSERT INTO availability_templates (id, tenant_id, practitioner_id, "
        "department_id, day_of_week, start_time, end_time, slot_duration_minutes, "
        "max_patients_per_day, allow_walk_in, walk_in_slots, effective_from, "
        "effective_to, status, version, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, 'ACTIVE', 1, ?, ?)",
        {tmpl.id, tmpl.tenant_id, tmpl.practitioner_id, tmpl.department_id,
         std::string(to_string(day)), tmpl.start_time, tmpl.end_time,
         static_cast<int64_t>(tmpl.slot_duration_minutes), cap,
         static_cast<int64_t>(tmpl.allow_walk_in),
         static_cast<int64_t>(tmpl.walk_in_slots),
         integration::nullable(tmpl.effective_from),
         integration::nullable(tmpl.effective_to), now, now});
    if (!result) {
        availability_logger().error(
            std::format("Template insert failed: {}", conn.last_error()));
        return std::unexpected(scheduling_failure::make(
            scheduling_error::internal, "Failed to store availability template"));
    }
    return tmpl;
}

/**
 * @brief Practitioner exists in the tenant and belongs to the department
 */
scheduling_result<directory::practitioner_info> require_practitioner_in_department(
    integration::database_connection& conn,
    std::string_view tenant_id,
    std::string_view practitioner_id,
    std::string_view department_id) {
    auto practitioner = directory::find_practitioner(conn, tenant_id, practitioner_id);
    if (!practitioner) {
        return std::unexpected(scheduling_failure::from(practitioner.error()));
    }
    if (!*practitioner) {
        return fail(scheduling_error::not_found, "Practitioner not found");
    }

    auto member = directory::practitioner_in_department(conn, practitioner_id,
                                                        department_id);
    if (!member) {
        return std::unexpected(scheduling_failure::from(member.error()));
    }
    if (!*member) {
        return fail(scheduling_error::validation_error,
                    "Practitioner does not belong to the department");
    }
    return std::move(**practitioner);
}

scheduling_result<void> guard(const security::session_context& session,
                              std::optional<std::string> department_id,
                              security::permission action) {
    auto allowed = security::authorize(
        session, {session.tenant_id, std::move(department_id)}, action);
    if (!allowed) {
        return std::unexpected(scheduling_failure::from(allowed.error()));
    }
    return {};
}

scheduling_result<void> guard_record(const security::session_context& session,
                                     const availability_template& tmpl,
                                     security::permission action) {
    auto allowed = security::authorize(session, {tmpl.tenant_id, tmpl.department_id},
                                       action);
    if (!allowed) {
        return std::unexpected(scheduling_failure::from(allowed.error()));
    }
    return {};
}

}  // namespace

std::string_view to_string(slot_block_reason reason) noexcept {
    switch (reason) {
        case slot_block_reason::booked:
            return "BOOKED";
        case slot_block_reason::practitioner_unavailable:
            return "PRACTITIONER_UNAVAILABLE";
        case slot_block_reason::department_mismatch:
            return "DEPARTMENT_MISMATCH";
    }
    return "UNKNOWN";
}

availability_service::availability_service(
    std::shared_ptr<integration::database_adapter> adapter,
    config::booking_config booking,
    std::shared_ptr<security::audit_logger> audit,
    std::shared_ptr<const storage::clock> time_source)
    : adapter_(std::move(adapter)),
      booking_(std::move(booking)),
      audit_(std::move(audit)),
      clock_(std::move(time_source)) {}

void availability_service::audit_template(const security::session_context& session,
                                          security::audit_action action,
                                          const availability_template& tmpl) {
    if (!audit_) {
        return;
    }
    audit_->log_event(action, "availability_template", tmpl.id)
        .session(session)
        .property("practitioner_id", tmpl.practitioner_id)
        .property("department_id", tmpl.department_id)
        .property("window", describe(tmpl))
        .property("version", tmpl.version)
        .commit();
}

// =============================================================================
// Slot Projection
// =============================================================================

scheduling_result<day_slots> availability_service::get_doctor_day_slots(
    const security::session_context& session,
    std::string_view practitioner_id,
    std::string_view date,
    const std::optional<std::string>& department_id) {
    if (auto allowed = guard(session, department_id, security::permission::slots_view);
        !allowed) {
        return std::unexpected(allowed.error());
    }

    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(scheduling_failure::from(scope.error()));
    }
    return project_day(scope->connection(), session.tenant_id, practitioner_id, date,
                       department_id);
}

scheduling_result<day_slots> availability_service::project_day(
    integration::database_connection& conn,
    std::string_view tenant_id,
    std::string_view practitioner_id,
    std::string_view date,
    const std::optional<std::string>& department_id) {
    auto parsed = parse_date(date);
    if (!parsed) {
        return fail(scheduling_error::validation_error, "Date must be YYYY-MM-DD");
    }

    auto practitioner = directory::find_practitioner(conn, tenant_id, practitioner_id);
    if (!practitioner) {
        return std::unexpected(scheduling_failure::from(practitioner.error()));
    }
    if (!*practitioner) {
        return fail(scheduling_error::not_found, "Practitioner not found");
    }

    day_slots result;
    result.practitioner_id = (*practitioner)->id;
    result.practitioner_name = (*practitioner)->name;
    result.status = (*practitioner)->status;
    result.date = std::string(date);
    result.day = weekday_of(*parsed);

    auto templates = templates_in_effect(conn, tenant_id, practitioner_id, result.day,
                                         date);
    if (!templates) {
        return std::unexpected(templates.error());
    }
    auto bookings = bookings_on(conn, tenant_id, practitioner_id, date);
    if (!bookings) {
        return std::unexpected(bookings.error());
    }

    bool practitioner_unavailable = result.status != practitioner_status::active;

    for (const auto& tmpl : *templates) {
        auto start = parse_time_of_day(tmpl.start_time);
        auto end = parse_time_of_day(tmpl.end_time);
        int duration = tmpl.slot_duration_minutes;
        if (!start || !end || duration <= 0) {
            availability_logger().warning(
                std::format("Skipping malformed template {}", tmpl.id));
            continue;
        }

        bool department_matches = !department_id || tmpl.department_id == *department_id;
        if (department_matches) {
            result.allow_walk_in = result.allow_walk_in || tmpl.allow_walk_in;
            if (tmpl.max_patients_per_day &&
                (!result.max_patients_per_day ||
                 *tmpl.max_patients_per_day < *result.max_patients_per_day)) {
                result.max_patients_per_day = tmpl.max_patients_per_day;
            }
        }

        for (int t = *start; t + duration <= *end; t += duration) {
            slot s;
            s.start_time = format_time_of_day(t);
            s.end_time = format_time_of_day(t + duration);
            s.template_id = tmpl.id;
            s.department_id = tmpl.department_id;

            bool taken = std::any_of(bookings->begin(), bookings->end(),
                                     [t, duration](const booking_entry& b) {
                                         return b.minutes >= t && b.minutes < t + duration;
                                     });

            if (!department_matches) {
                s.blocked_by = slot_block_reason::department_mismatch;
            } else if (practitioner_unavailable) {
                s.blocked_by = slot_block_reason::practitioner_unavailable;
            } else if (taken) {
                s.blocked_by = slot_block_reason::booked;
            }
            s.available = !s.blocked_by.has_value();

            if (department_matches) {
                ++result.total_capacity;
                if (s.available) {
                    ++result.available_count;
                }
            }
            result.slots.push_back(std::move(s));
        }
    }

    for (const auto& booking : *bookings) {
        if (!department_id || booking.department_id == *department_id) {
            ++result.booked_count;
        }
    }

    if (result.max_patients_per_day) {
        int remaining = std::max(0, *result.max_patients_per_day - result.booked_count);
        result.available_count = std::min(result.available_count, remaining);
        result.is_day_full = result.booked_count >= *result.max_patients_per_day;
    } else {
        result.is_day_full = result.available_count == 0;
    }

    return result;
}

// =============================================================================
// Template Management
// =============================================================================

scheduling_result<availability_template> availability_service::create_template(
    const security::session_context& session,
    std::string_view practitioner_id,
    std::string_view department_id,
    day_of_week day,
    const availability_window& window) {
    auto created = bulk_create_availability(session, practitioner_id, department_id,
                                            {day}, window);
    if (!created) {
        return std::unexpected(created.error());
    }
    return std::move(created->front());
}

scheduling_result<std::vector<availability_template>>
availability_service::bulk_create_availability(const security::session_context& session,
                                               std::string_view practitioner_id,
                                               std::string_view department_id,
                                               const std::vector<day_of_week>& days,
                                               const availability_window& window) {
    if (auto allowed = guard(session, std::string(department_id),
                             security::permission::availability_manage);
        !allowed) {
        return std::unexpected(allowed.error());
    }
    if (days.empty()) {
        return fail(scheduling_error::validation_error, "At least one day is required");
    }

    auto normalized = normalize(window, booking_.default_slot_duration_minutes);
    if (!normalized) {
        return std::unexpected(normalized.error());
    }

    std::set<day_of_week> seen;
    for (auto day : days) {
        if (!seen.insert(day).second) {
            return fail(scheduling_error::availability_overlap,
                        std::format("{} {}-{} requested more than once", to_string(day),
                                    window.start_time, window.end_time));
        }
    }

    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(scheduling_failure::from(scope.error()));
    }
    auto& conn = scope->connection();

    if (auto member = require_practitioner_in_department(conn, session.tenant_id,
                                                         practitioner_id, department_id);
        !member) {
        return std::unexpected(member.error());
    }

    auto tx = integration::transaction_guard::begin(conn,
                                                    integration::transaction_mode::immediate);
    if (!tx) {
        return std::unexpected(scheduling_failure::from(tx.error()));
    }

    std::string now = storage::to_timestamp(clock_->now());
    std::vector<availability_template> created;
    for (auto day : days) {
        if (auto clear = check_overlap(conn, session.tenant_id, practitioner_id, day,
                                       *normalized, std::nullopt);
            !clear) {
            return std::unexpected(clear.error());
        }
        auto tmpl = insert_template(conn, session.tenant_id, practitioner_id,
                                    department_id, day, *normalized, now);
        if (!tmpl) {
            return std::unexpected(tmpl.error());
        }
        created.push_back(std::move(*tmpl));
    }

    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(scheduling_failure::from(committed.error()));
    }

    for (const auto& tmpl : created) {
        audit_template(session, security::audit_action::availability_created, tmpl);
    }
    availability_logger().info(std::format("Created {} availability template(s) for {}",
                                           created.size(), practitioner_id));
    return created;
}

scheduling_result<availability_template> availability_service::update_template(
    const security::session_context& session,
    std::string_view template_id,
    const template_changes& changes,
    int64_t expected_version) {
    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(scheduling_failure::from(scope.error()));
    }
    auto& conn = scope->connection();

    auto loaded = load_template(conn, template_id);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }
    if (!*loaded) {
        return fail(scheduling_error::not_found, "Availability template not found");
    }
    auto current = std::move(**loaded);

    if (auto allowed = guard_record(session, current,
                                    security::permission::availability_manage);
        !allowed) {
        return std::unexpected(allowed.error());
    }
    if (current.version != expected_version) {
        return fail(scheduling_error::version_conflict,
                    std::format("Template is at version {}, expected {}",
                                current.version, expected_version));
    }

    availability_window window;
    window.start_time = changes.start_time.value_or(current.start_time);
    window.end_time = changes.end_time.value_or(current.end_time);
    window.slot_duration_minutes =
        changes.slot_duration_minutes.value_or(current.slot_duration_minutes);
    window.max_patients_per_day = changes.reset_daily_cap
                                      ? std::nullopt
                                      : (changes.max_patients_per_day
                                             ? changes.max_patients_per_day
                                             : current.max_patients_per_day);
    window.allow_walk_in = changes.allow_walk_in.value_or(current.allow_walk_in);
    window.walk_in_slots = changes.walk_in_slots.value_or(current.walk_in_slots);
    window.effective_from =
        changes.effective_from ? changes.effective_from : current.effective_from;
    window.effective_to = changes.effective_to ? changes.effective_to : current.effective_to;
    auto status = changes.status.value_or(current.status);

    auto normalized = normalize(window, booking_.default_slot_duration_minutes);
    if (!normalized) {
        return std::unexpected(normalized.error());
    }

    auto tx = integration::transaction_guard::begin(conn,
                                                    integration::transaction_mode::immediate);
    if (!tx) {
        return std::unexpected(scheduling_failure::from(tx.error()));
    }

    if (status == template_status::active) {
        if (auto clear = check_overlap(conn, current.tenant_id, current.practitioner_id,
                                       current.day, *normalized, current.id);
            !clear) {
            return std::unexpected(clear.error());
        }
    }

    std::string now = storage::to_timestamp(clock_->now());
    database_value cap;
    if (window.max_patients_per_day) {
        cap = static_cast<int64_t>(*window.max_patients_per_day);
    }

    auto result = conn.query(
        "UPDATE availability_templates SET start_time = ?, end_time = ?, "
        "slot_duration_minutes = ?, max_patients_per_day = ?, allow_walk_in = ?, "
        "walk_in_slots = ?, effective_from = ?, effective_to = ?, status = ?, "
        "version = version + 1, updated_at = ? WHERE id = ? AND version = ?",
        {format_time_of_day(normalized->start), format_time_of_day(normalized->end),
         static_cast<int64_t>(normalized->duration), cap,
         static_cast<int64_t>(window.allow_walk_in),
         static_cast<int64_t>(window.walk_in_slots),
         integration::nullable(window.effective_from),
         integration::nullable(window.effective_to), std::string(to_string(status)), now,
         current.id, expected_version});
    if (!result) {
        return std::unexpected(scheduling_failure::from(result.error()));
    }
    if ((*result)->affected_rows() == 0) {
        return fail(scheduling_error::version_conflict,
                    "Template was modified concurrently");
    }
    result->reset();

    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(scheduling_failure::from(committed.error()));
    }

    current.start_time = format_time_of_day(normalized->start);
    current.end_time = format_time_of_day(normalized->end);
    current.slot_duration_minutes = normalized->duration;
    current.max_patients_per_day = window.max_patients_per_day;
    current.allow_walk_in = window.allow_walk_in;
    current.walk_in_slots = window.walk_in_slots;
    current.effective_from = window.effective_from;
    current.effective_to = window.effective_to;
    current.status = status;
    current.version = expected_version + 1;
    current.updated_at = now;

    audit_template(session,
                   status == template_status::active
                       ? security::audit_action::availability_updated
                       : security::audit_action::availability_disabled,
                   current);
    return current;
}

scheduling_result<std::vector<availability_template>> availability_service::copy_to_days(
    const security::session_context& session,
    std::string_view template_id,
    const std::vector<day_of_week>& days) {
    availability_template source;
    {
        auto scope = integration::connection_scope::acquire(*adapter_);
        if (!scope) {
            return std::unexpected(scheduling_failure::from(scope.error()));
        }
        auto loaded = load_template(scope->connection(), template_id);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        if (!*loaded) {
            return fail(scheduling_error::not_found, "Availability template not found");
        }
        source = std::move(**loaded);
    }

    if (auto allowed = guard_record(session, source,
                                    security::permission::availability_manage);
        !allowed) {
        return std::unexpected(allowed.error());
    }
    if (std::find(days.begin(), days.end(), source.day) != days.end()) {
        return fail(scheduling_error::validation_error,
                    "Target days must differ from the source day");
    }

    availability_window window;
    window.start_time = source.start_time;
    window.end_time = source.end_time;
    window.slot_duration_minutes = source.slot_duration_minutes;
    window.max_patients_per_day = source.max_patients_per_day;
    window.allow_walk_in = source.allow_walk_in;
    window.walk_in_slots = source.walk_in_slots;
    window.effective_from = source.effective_from;
    window.effective_to = source.effective_to;

    return bulk_create_availability(session, source.practitioner_id,
                                    source.department_id, days, window);
}

scheduling_result<std::size_t> availability_service::disable_day(
    const security::session_context& session,
    std::string_view practitioner_id,
    std::string_view department_id,
    day_of_week day) {
    if (auto allowed = guard(session, std::string(department_id),
                             security::permission::availability_manage);
        !allowed) {
        return std::unexpected(allowed.error());
    }

    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(scheduling_failure::from(scope.error()));
    }

    auto result = scope->connection().query(
        "UPDATE availability_templates SET status = 'INACTIVE', "
        "version = version + 1, updated_at = ? "
        "WHERE tenant_id = ? AND practitioner_id = ? AND department_id = ? "
        "AND day_of_week = ? AND status = 'ACTIVE'",
        {storage::to_timestamp(clock_->now()), session.tenant_id,
         std::string(practitioner_id), std::string(department_id),
         std::string(to_string(day))});
    if (!result) {
        return std::unexpected(scheduling_failure::from(result.error()));
    }

    auto disabled = (*result)->affected_rows();
    if (audit_ && disabled > 0) {
        audit_->log_event(security::audit_action::availability_disabled,
                          "availability_template",
                          std::format("{}:{}:{}", practitioner_id, department_id,
                                      to_string(day)))
            .session(session)
            .property("disabled_count", static_cast<int64_t>(disabled))
            .commit();
    }
    return disabled;
}

scheduling_result<std::vector<availability_template>> availability_service::list_templates(
    const security::session_context& session,
    const template_filter& filter) {
    if (auto allowed = guard(session, filter.department_id,
                             security::permission::slots_view);
        !allowed) {
        return std::unexpected(allowed.error());
    }

    auto departments = security::build_filter(session, "department_id");
    std::string sql = std::format(
        "SELECT {} FROM availability_templates WHERE tenant_id = ? AND {}",
        template_columns, departments.to_sql());
    std::vector<database_value> params = {session.tenant_id};
    for (auto& value : departments.bindings()) {
        params.push_back(std::move(value));
    }

    if (filter.practitioner_id) {
        sql += " AND practitioner_id = ?";
        params.emplace_back(*filter.practitioner_id);
    }
    if (filter.department_id) {
        sql += " AND department_id = ?";
        params.emplace_back(*filter.department_id);
    }
    if (filter.day) {
        sql += " AND day_of_week = ?";
        params.emplace_back(std::string(to_string(*filter.day)));
    }
    if (!filter.include_inactive) {
        sql += " AND status = 'ACTIVE'";
    }

    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(scheduling_failure::from(scope.error()));
    }
    auto templates = query_templates(scope->connection(), sql, params);
    if (!templates) {
        return std::unexpected(templates.error());
    }

    std::sort(templates->begin(), templates->end(),
              [](const availability_template& a, const availability_template& b) {
                  if (a.day != b.day) {
                      return a.day < b.day;
                  }
                  if (a.start_time != b.start_time) {
                      return a.start_time < b.start_time;
                  }
                  return a.id < b.id;
              });
    return templates;
}

// =============================================================================
// Booking Validation
// =============================================================================

scheduling_result<slot_reservation> availability_service::validate_slot_booking(
    const security::session_context& session,
    const slot_request& request) {
    if (auto allowed = guard(session, request.department_id,
                             security::permission::slots_view);
        !allowed) {
        return std::unexpected(allowed.error());
    }

    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(scheduling_failure::from(scope.error()));
    }
    return check_slot(scope->connection(), session.tenant_id, request);
}

scheduling_result<slot_reservation> availability_service::check_slot(
    integration::database_connection& conn,
    std::string_view tenant_id,
    const slot_request& request) {
    auto date = parse_date(request.date);
    auto time = parse_time_of_day(request.time);
    if (!date) {
        return fail(scheduling_error::validation_error, "Date must be YYYY-MM-DD");
    }
    if (!time) {
        return fail(scheduling_error::validation_error, "Time must be HH:MM");
    }

    auto practitioner = directory::find_practitioner(conn, tenant_id,
                                                     request.practitioner_id);
    if (!practitioner) {
        return std::unexpected(scheduling_failure::from(practitioner.error()));
    }
    if (!*practitioner) {
        return fail(scheduling_error::not_found, "Practitioner not found");
    }

    auto day = weekday_of(*date);
    auto templates = templates_in_effect(conn, tenant_id, request.practitioner_id, day,
                                         request.date);
    if (!templates) {
        return std::unexpected(templates.error());
    }

    // 1. A template of the department covers the requested slot start
    const availability_template* window = nullptr;
    int window_start = 0;
    int window_end = 0;
    for (const auto& tmpl : *templates) {
        if (tmpl.department_id != request.department_id) {
            continue;
        }
        auto start = parse_time_of_day(tmpl.start_time);
        auto end = parse_time_of_day(tmpl.end_time);
        int duration = tmpl.slot_duration_minutes;
        if (!start || !end || duration <= 0) {
            continue;
        }
        if (*time >= *start && *time + duration <= *end &&
            (*time - *start) % duration == 0) {
            window = &tmpl;
            window_start = *start;
            window_end = *end;
            break;
        }
    }
    if (window == nullptr) {
        return fail(scheduling_error::validation_error,
                    std::format("{} on {} is outside the practitioner's availability",
                                request.time, to_string(day)));
    }

    // 2. Practitioner can take bookings
    if ((*practitioner)->status != practitioner_status::active) {
        return fail(scheduling_error::validation_error,
                    std::format("Practitioner is {}", to_string((*practitioner)->status)));
    }

    // 3. Walk-ins allowed
    if (request.walk_in && !window->allow_walk_in) {
        return fail(scheduling_error::validation_error,
                    "Walk-ins are not allowed for this window");
    }

    auto bookings = bookings_on(conn, tenant_id, request.practitioner_id, request.date);
    if (!bookings) {
        return std::unexpected(bookings.error());
    }

    // 4. Slot free
    int duration = window->slot_duration_minutes;
    for (const auto& booking : *bookings) {
        if (booking.minutes >= *time && booking.minutes < *time + duration) {
            return fail(scheduling_error::slot_conflict,
                        std::format("{} {} is already booked", request.date,
                                    request.time),
                        booking.id);
        }
    }

    // 5. Daily cap and walk-in reservation
    if (window->max_patients_per_day) {
        auto in_department = std::count_if(
            bookings->begin(), bookings->end(), [&](const booking_entry& b) {
                return b.department_id == request.department_id;
            });
        if (in_department >= *window->max_patients_per_day) {
            return fail(scheduling_error::validation_error,
                        "Practitioner's daily limit reached");
        }
    }
    if (!request.walk_in && window->walk_in_slots > 0) {
        int slots_in_window = (window_end - window_start) / duration;
        auto advance_bookings = std::count_if(
            bookings->begin(), bookings->end(), [&](const booking_entry& b) {
                return !b.is_walk_in && b.minutes >= window_start &&
                       b.minutes < window_end;
            });
        if (advance_bookings >= slots_in_window - window->walk_in_slots) {
            return fail(scheduling_error::validation_error,
                        "Remaining slots are reserved for walk-ins");
        }
    }

    return slot_reservation{window->id, format_time_of_day(*time + duration)};
}

scheduling_result<std::optional<slot>> availability_service::next_available_slot(
    const security::session_context& session,
    std::string_view practitioner_id,
    std::string_view department_id,
    std::string_view date,
    std::string_view not_before) {
    if (auto allowed = guard(session, std::string(department_id),
                             security::permission::slots_view);
        !allowed) {
        return std::unexpected(allowed.error());
    }

    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(scheduling_failure::from(scope.error()));
    }
    return find_next_slot(scope->connection(), session.tenant_id, practitioner_id,
                          department_id, date, not_before);
}

scheduling_result<std::optional<slot>> availability_service::find_next_slot(
    integration::database_connection& conn,
    std::string_view tenant_id,
    std::string_view practitioner_id,
    std::string_view department_id,
    std::string_view date,
    std::string_view not_before) {
    auto threshold = parse_time_of_day(not_before);
    if (!threshold) {
        return fail(scheduling_error::validation_error, "Time must be HH:MM");
    }

    auto day = project_day(conn, tenant_id, practitioner_id, date,
                           std::string(department_id));
    if (!day) {
        return std::unexpected(day.error());
    }
    if (day->is_day_full) {
        return std::optional<slot>{};
    }

    for (auto& candidate : day->slots) {
        auto start = parse_time_of_day(candidate.start_time);
        if (candidate.available && start && *start >= *threshold) {
            return std::optional<slot>{std::move(candidate)};
        }
    }
    return std::optional<slot>{};
}

}  // namespace clinic::opd::scheduling
