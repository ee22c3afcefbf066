/**
 * @file appointment_service.cpp
 * @brief Appointment booking state machine and visit transitions
 */

#include "clinic/opd/scheduling/appointment_service.h"

#include "clinic/opd/integration/logger_adapter.h"
#include "clinic/opd/scheduling/calendar.h"
#include "clinic/opd/scheduling/directory.h"
#include "clinic/opd/storage/counter_store.h"

#include <algorithm>
#include <format>

namespace clinic::opd::scheduling {

namespace {

using integration::database_value;

constexpr std::string_view appointment_columns =
    "id, tenant_id, patient_id, practitioner_id, department_id, appointment_date, "
    "appointment_time, end_time, status, booking_source, priority, token_number, "
    "is_walk_in, chief_complaint, notes, cancellation_reason, cancelled_at, "
    "checked_in_at, completed_at, rescheduled_from_id, rescheduled_to_id, created_by, "
    "created_at, updated_at";

constexpr std::string_view visit_columns =
    "id, tenant_id, patient_id, practitioner_id, department_id, appointment_id, "
    "visit_number, visit_type, status, priority, token_number, check_in_time, "
    "start_time, end_time, created_at, updated_at";

integration::logger_adapter& booking_logger() {
    static auto logger = integration::create_logger("appointments");
    return *logger;
}

appointment read_appointment(const integration::database_row& row) {
    appointment appt;
    appt.id = row.get_string(0);
    appt.tenant_id = row.get_string(1);
    appt.patient_id = row.get_string(2);
    appt.practitioner_id = row.get_string(3);
    appt.department_id = row.get_string(4);
    appt.appointment_date = row.get_string(5);
    appt.appointment_time = row.get_string(6);
    appt.end_time = row.get_optional_string(7);
    // Unknown statuses are treated as terminal
    appt.status = parse_appointment_status(row.get_string(8))
                      .value_or(appointment_status::cancelled);
    appt.source = parse_booking_source(row.get_string(9)).value_or(booking_source::reception);
    appt.priority = parse_priority(row.get_string(10)).value_or(priority::normal);
    appt.token_number = row.get_int64(11);
    appt.is_walk_in = row.get_int64(12) != 0;
    appt.chief_complaint = row.get_optional_string(13);
    appt.notes = row.get_optional_string(14);
    appt.cancellation_reason = row.get_optional_string(15);
    appt.cancelled_at = row.get_optional_string(16);
    appt.checked_in_at = row.get_optional_string(17);
    appt.completed_at = row.get_optional_string(18);
    appt.rescheduled_from_id = row.get_optional_string(19);
    appt.rescheduled_to_id = row.get_optional_string(20);
    appt.created_by = row.get_optional_string(21);
    appt.created_at = row.get_string(22);
    appt.updated_at = row.get_string(23);
    return appt;
}

visit read_visit(const integration::database_row& row) {
    visit v;
    v.id = row.get_string(0);
    v.tenant_id = row.get_string(1);
    v.patient_id = row.get_string(2);
    v.practitioner_id = row.get_string(3);
    v.department_id = row.get_string(4);
    v.appointment_id = row.get_optional_string(5);
    v.visit_number = row.get_int64(6);
    v.type = parse_visit_type(row.get_string(7)).value_or(visit_type::opd);
    v.status = parse_visit_status(row.get_string(8)).value_or(visit_status::cancelled);
    v.priority = parse_priority(row.get_string(9)).value_or(priority::normal);
    v.token_number = row.get_optional_int64(10);
    v.check_in_time = row.get_string(11);
    v.start_time = row.get_optional_string(12);
    v.end_time = row.get_optional_string(13);
    v.created_at = row.get_string(14);
    v.updated_at = row.get_string(15);
    return v;
}

scheduling_result<appointment> load_appointment(integration::database_connection& conn,
                                                std::string_view appointment_id) {
    auto result = conn.query(
        std::format("SELECT {} FROM appointments WHERE id = ?", appointment_columns),
        {std::string(appointment_id)});
    if (!result) {
        return std::unexpected(scheduling_failure::from(result.error()));
    }
    if (!(*result)->next()) {
        return fail(scheduling_error::not_found,
                    std::format("Appointment {} not found", appointment_id));
    }
    return read_appointment((*result)->current_row());
}

scheduling_result<visit> load_visit(integration::database_connection& conn,
                                    std::string_view visit_id) {
    auto result = conn.query(std::format("SELECT {} FROM visits WHERE id = ?", visit_columns),
                             {std::string(visit_id)});
    if (!result) {
        return std::unexpected(scheduling_failure::from(result.error()));
    }
    if (!(*result)->next()) {
        return fail(scheduling_error::not_found, std::format("Visit {} not found", visit_id));
    }
    return read_visit((*result)->current_row());
}

/**
 * @brief Run a write and return the rows it changed
 *
 * The result (and its statement) is released before returning so that a
 * following COMMIT is not blocked.
 */
std::expected<std::size_t, integration::database_error> execute(
    integration::database_connection& conn,
    std::string_view sql,
    const std::vector<database_value>& params) {
    auto result = conn.query(sql, params);
    if (!result) {
        return std::unexpected(result.error());
    }
    return (*result)->affected_rows();
}

scheduling_result<void> guard(const security::session_context& session,
                              std::string tenant_id,
                              std::optional<std::string> department_id,
                              security::permission action) {
    auto allowed = security::authorize(session, {std::move(tenant_id), std::move(department_id)},
                                       action);
    if (!allowed) {
        return std::unexpected(scheduling_failure::from(allowed.error()));
    }
    return {};
}

std::string status_list(std::initializer_list<appointment_status> statuses) {
    std::string out;
    for (auto status : statuses) {
        if (!out.empty()) {
            out += ", ";
        }
        out += std::format("'{}'", to_string(status));
    }
    return out;
}

std::expected<void, integration::database_error> insert_appointment(
    integration::database_connection& conn, const appointment& appt) {
    auto result = conn.query(
        "INSERT INTO appointments (id, tenant_id, patient_id, practitioner_id, "
        "department_id, appointment_date, appointment_time, end_time, status, "
        "booking_source, priority, token_number, is_walk_in, chief_complaint, notes, "
        "rescheduled_from_id, created_by, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
        {appt.id, appt.tenant_id, appt.patient_id, appt.practitioner_id,
         appt.department_id, appt.appointment_date, appt.appointment_time,
         integration::nullable(appt.end_time), std::string(to_string(appt.status)),
         std::string(to_string(appt.source)), std::string(to_string(appt.priority)),
         appt.token_number, static_cast<int64_t>(appt.is_walk_in),
         integration::nullable(appt.chief_complaint), integration::nullable(appt.notes),
         integration::nullable(appt.rescheduled_from_id),
         integration::nullable(appt.created_by), appt.created_at, appt.updated_at});
    if (!result) {
        return std::unexpected(result.error());
    }
    return {};
}

/**
 * @brief Id of the appointment holding a slot, if any
 */
std::optional<std::string> slot_holder(integration::database_connection& conn,
                                       const appointment& appt) {
    auto result = conn.query(
        "SELECT id FROM appointments WHERE tenant_id = ? AND practitioner_id = ? "
        "AND appointment_date = ? AND appointment_time = ? "
        "AND status NOT IN ('CANCELLED', 'NO_SHOW', 'RESCHEDULED')",
        {appt.tenant_id, appt.practitioner_id, appt.appointment_date,
         appt.appointment_time});
    if (!result || !(*result)->next()) {
        return std::nullopt;
    }
    return (*result)->current_row().get_string(0);
}

/**
 * @brief Fail if the patient already holds a booking with the practitioner
 *        on @p date
 */
scheduling_result<void> check_patient_free(integration::database_connection& conn,
                                           std::string_view tenant_id,
                                           std::string_view patient_id,
                                           std::string_view practitioner_id,
                                           std::string_view date,
                                           std::string_view exclude_id) {
    auto result = conn.query(
        std::format("SELECT id FROM appointments WHERE tenant_id = ? AND patient_id = ? "
                    "AND practitioner_id = ? AND appointment_date = ? AND id != ? "
                    "AND status IN ({})",
                    status_list({appointment_status::booked, appointment_status::confirmed,
                                 appointment_status::checked_in,
                                 appointment_status::in_progress})),
        {std::string(tenant_id), std::string(patient_id), std::string(practitioner_id),
         std::string(date), std::string(exclude_id)});
    if (!result) {
        return std::unexpected(scheduling_failure::from(result.error()));
    }
    if ((*result)->next()) {
        return fail(scheduling_error::validation_error,
                    std::format("Patient already has an appointment with this "
                                "practitioner on {}",
                                date));
    }
    return {};
}

constexpr int max_reschedule_hops = 32;

struct opened_visit {
    std::string id;
    int64_t visit_number = 0;
};

/**
 * @brief Insert the WAITING OPD visit for @p appt
 *
 * Must run inside the caller's transaction. Visit numbers count per patient.
 */
scheduling_result<opened_visit> open_visit(integration::database_connection& conn,
                                           const appointment& appt,
                                           const std::string& stamp) {
    opened_visit opened{storage::generate_record_id(), 1};
    {
        auto last = conn.query(
            "SELECT COALESCE(MAX(visit_number), 0) + 1 FROM visits "
            "WHERE tenant_id = ? AND patient_id = ?",
            {appt.tenant_id, appt.patient_id});
        if (!last) {
            return std::unexpected(scheduling_failure::from(last.error()));
        }
        if ((*last)->next()) {
            opened.visit_number = (*last)->current_row().get_int64(0);
        }
    }

    auto inserted = execute(
        conn,
        "INSERT INTO visits (id, tenant_id, patient_id, practitioner_id, department_id, "
        "appointment_id, visit_number, visit_type, status, priority, token_number, "
        "check_in_time, created_at, updated_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?, 'OPD', 'WAITING', ?, ?, ?, ?, ?)",
        {opened.id, appt.tenant_id, appt.patient_id, appt.practitioner_id,
         appt.department_id, appt.id, opened.visit_number,
         std::string(to_string(appt.priority)), appt.token_number, stamp, stamp, stamp});
    if (!inserted) {
        booking_logger().error(std::format("Visit insert failed: {}", conn.last_error()));
        return fail(scheduling_error::internal, "Failed to create visit");
    }
    return opened;
}

/**
 * @brief The WAITING or IN_PROGRESS visit of an appointment, if any
 */
scheduling_result<std::optional<opened_visit>> active_visit_of(
    integration::database_connection& conn,
    std::string_view appointment_id) {
    auto result = conn.query(
        "SELECT id, visit_number FROM visits WHERE appointment_id = ? "
        "AND status IN ('WAITING', 'IN_PROGRESS') LIMIT 1",
        {std::string(appointment_id)});
    if (!result) {
        return std::unexpected(scheduling_failure::from(result.error()));
    }
    if (!(*result)->next()) {
        return std::optional<opened_visit>{};
    }
    const auto& row = (*result)->current_row();
    return std::optional<opened_visit>{opened_visit{row.get_string(0), row.get_int64(1)}};
}

/**
 * @brief Cancel the active visits of an appointment and return their ids
 */
scheduling_result<std::vector<std::string>> close_visits(
    integration::database_connection& conn,
    std::string_view appointment_id,
    const std::string& stamp) {
    std::vector<std::string> visit_ids;
    {
        auto linked = conn.query(
            "SELECT id FROM visits WHERE appointment_id = ? "
            "AND status IN ('WAITING', 'IN_PROGRESS')",
            {std::string(appointment_id)});
        if (!linked) {
            return std::unexpected(scheduling_failure::from(linked.error()));
        }
        while ((*linked)->next()) {
            visit_ids.push_back((*linked)->current_row().get_string(0));
        }
    }
    if (!visit_ids.empty()) {
        auto closed = execute(conn,
                              "UPDATE visits SET status = 'CANCELLED', end_time = ?, "
                              "updated_at = ? WHERE appointment_id = ? "
                              "AND status IN ('WAITING', 'IN_PROGRESS')",
                              {stamp, stamp, std::string(appointment_id)});
        if (!closed) {
            return std::unexpected(scheduling_failure::from(closed.error()));
        }
    }
    return visit_ids;
}

/**
 * @brief Practitioner exists, is ACTIVE and belongs to the department
 */
scheduling_result<void> check_practitioner(integration::database_connection& conn,
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
    if ((*practitioner)->status != practitioner_status::active) {
        return fail(scheduling_error::validation_error,
                    std::format("Practitioner is {}", to_string((*practitioner)->status)));
    }
    return {};
}

scheduling_result<int64_t> next_token(integration::database_connection& conn,
                                      std::string_view tenant_id,
                                      std::string_view department_id,
                                      std::string_view date,
                                      std::chrono::system_clock::time_point now) {
    auto token = storage::increment_counter(
        conn, storage::token_counter_key(tenant_id, department_id, date), std::nullopt, now);
    if (!token) {
        booking_logger().error(std::format("Token assignment failed: {}",
                                           storage::to_string(token.error())));
        return fail(scheduling_error::internal, "Failed to assign token number");
    }
    return *token;
}

/**
 * @brief Map a failed appointment insert to the caller-facing failure
 */
scheduling_failure insert_failure(integration::database_connection& conn,
                                  integration::transaction_guard& tx,
                                  const appointment& appt,
                                  integration::database_error error) {
    if (error != integration::database_error::constraint_violation) {
        booking_logger().error(std::format("Appointment insert failed: {}",
                                           conn.last_error()));
        return scheduling_failure::make(scheduling_error::internal,
                                        "Failed to store appointment");
    }

    if (auto rolled_back = tx.rollback(); !rolled_back) {
        booking_logger().warning("Rollback after slot conflict failed");
    }
    return scheduling_failure::make(
        scheduling_error::slot_conflict,
        std::format("{} {} was booked concurrently", appt.appointment_date,
                    appt.appointment_time),
        slot_holder(conn, appt));
}

booking_confirmation confirmation_of(const appointment& appt) {
    return booking_confirmation{appt.id,
                                appt.token_number,
                                appt.status,
                                appt.appointment_date,
                                appt.appointment_time,
                                appt.end_time.value_or("")};
}

}  // namespace

appointment_service::appointment_service(
    std::shared_ptr<integration::database_adapter> adapter,
    std::shared_ptr<availability_service> availability,
    std::shared_ptr<queue::queue_synchronizer> queue,
    std::shared_ptr<security::audit_logger> audit,
    std::shared_ptr<security::rate_limiter> limiter,
    config::pagination_config pagination,
    std::shared_ptr<const storage::clock> time_source)
    : adapter_(std::move(adapter)),
      availability_(std::move(availability)),
      queue_(std::move(queue)),
      audit_(std::move(audit)),
      limiter_(std::move(limiter)),
      pagination_(pagination),
      clock_(std::move(time_source)) {}

// =============================================================================
// Helpers
// =============================================================================

scheduling_result<void> appointment_service::check_booking_date(std::string_view date,
                                                                std::string_view time) const {
    auto day = parse_date(date);
    if (!day) {
        return fail(scheduling_error::validation_error, "Date must be YYYY-MM-DD");
    }
    auto minutes = parse_time_of_day(time);
    if (!minutes) {
        return fail(scheduling_error::validation_error, "Time must be HH:MM");
    }

    const auto& rules = availability_->booking_rules();
    auto now = to_local(clock_->now(), rules.utc_offset);
    auto today = std::chrono::sys_days{now.date};
    auto requested = std::chrono::sys_days{*day};

    if (requested < today || (requested == today && *minutes < now.minutes)) {
        return fail(scheduling_error::validation_error,
                    std::format("{} {} is in the past", date, time));
    }
    if (requested > today + std::chrono::days{rules.max_advance_days}) {
        return fail(scheduling_error::validation_error,
                    std::format("Appointments can be booked at most {} days ahead",
                                rules.max_advance_days));
    }
    return {};
}

scheduling_result<void> appointment_service::throttle(
    const security::session_context& session) {
    if (!limiter_) {
        return {};
    }
    auto allowed = limiter_->enforce(security::rate_limit_tier::booking, session.tenant_id,
                                     session.user_id);
    if (!allowed) {
        return std::unexpected(scheduling_failure::from(allowed.error()));
    }
    return {};
}

void appointment_service::audit(const security::session_context& session,
                                security::audit_action action,
                                std::string_view entity_type,
                                std::string_view entity_id,
                                std::vector<std::pair<std::string, std::string>> properties) {
    if (!audit_) {
        return;
    }
    auto event = audit_->log_event(action, entity_type, entity_id);
    event.session(session);
    for (const auto& [key, value] : properties) {
        event.property(key, value);
    }
    event.commit();
}

// =============================================================================
// Booking
// =============================================================================

scheduling_result<booking_confirmation> appointment_service::create(
    const security::session_context& session,
    const booking_request& request) {
    if (request.source == booking_source::walk_in) {
        return fail(scheduling_error::validation_error,
                    "Walk-in bookings are made through walk_in()");
    }
    return book(session, request, false);
}

scheduling_result<booking_confirmation> appointment_service::walk_in(
    const security::session_context& session,
    const walk_in_request& request) {
    if (auto allowed = guard(session, session.tenant_id, request.department_id,
                             security::permission::appointment_create);
        !allowed) {
        return std::unexpected(allowed.error());
    }

    auto now = to_local(clock_->now(), availability_->booking_rules().utc_offset);
    std::string today = format_date(now.date);

    std::optional<slot> next;
    {
        auto scope = integration::connection_scope::acquire(*adapter_);
        if (!scope) {
            return std::unexpected(scheduling_failure::from(scope.error()));
        }
        auto found = availability_->find_next_slot(scope->connection(), session.tenant_id,
                                                   request.practitioner_id,
                                                   request.department_id, today,
                                                   format_time_of_day(now.minutes));
        if (!found) {
            return std::unexpected(found.error());
        }
        next = std::move(*found);
    }
    if (!next) {
        return fail(scheduling_error::validation_error,
                    "No walk-in slots available for this practitioner today");
    }

    booking_request booking;
    booking.patient_id = request.patient_id;
    booking.practitioner_id = request.practitioner_id;
    booking.department_id = request.department_id;
    booking.date = today;
    booking.time = next->start_time;
    booking.priority = request.priority;
    booking.source = booking_source::walk_in;
    booking.chief_complaint = request.chief_complaint;
    booking.notes = request.notes;
    return book(session, booking, true);
}

scheduling_result<booking_confirmation> appointment_service::book(
    const security::session_context& session,
    const booking_request& request,
    bool walk_in) {
    if (auto allowed = guard(session, session.tenant_id, request.department_id,
                             security::permission::appointment_create);
        !allowed) {
        return std::unexpected(allowed.error());
    }
    if (auto valid = check_booking_date(request.date, request.time); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto throttled = throttle(session); !throttled) {
        return std::unexpected(throttled.error());
    }

    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(scheduling_failure::from(scope.error()));
    }
    auto& conn = scope->connection();

    auto patient = directory::find_patient(conn, session.tenant_id, request.patient_id);
    if (!patient) {
        return std::unexpected(scheduling_failure::from(patient.error()));
    }
    if (!*patient) {
        return fail(scheduling_error::not_found, "Patient not found");
    }
    if (auto ok = check_practitioner(conn, session.tenant_id, request.practitioner_id,
                                     request.department_id);
        !ok) {
        return std::unexpected(ok.error());
    }

    auto tx = integration::transaction_guard::begin(conn,
                                                    integration::transaction_mode::immediate);
    if (!tx) {
        return std::unexpected(scheduling_failure::from(tx.error()));
    }

    auto reservation = availability_->check_slot(
        conn, session.tenant_id,
        slot_request{request.practitioner_id, request.department_id, request.date,
                     request.time, walk_in});
    if (!reservation) {
        return std::unexpected(reservation.error());
    }
    if (auto free = check_patient_free(conn, session.tenant_id, request.patient_id,
                                       request.practitioner_id, request.date, "");
        !free) {
        return std::unexpected(free.error());
    }

    auto now = clock_->now();
    auto token = next_token(conn, session.tenant_id, request.department_id, request.date,
                            now);
    if (!token) {
        return std::unexpected(token.error());
    }

    appointment appt;
    appt.id = storage::generate_record_id();
    appt.tenant_id = session.tenant_id;
    appt.patient_id = request.patient_id;
    appt.practitioner_id = request.practitioner_id;
    appt.department_id = request.department_id;
    appt.appointment_date = request.date;
    appt.appointment_time = request.time;
    appt.end_time = reservation->end_time;
    appt.status = appointment_status::booked;
    appt.source = request.source;
    appt.priority = request.priority;
    appt.token_number = *token;
    appt.is_walk_in = walk_in;
    appt.chief_complaint = request.chief_complaint;
    appt.notes = request.notes;
    appt.created_by = session.user_id;
    appt.created_at = storage::to_timestamp(now);
    appt.updated_at = appt.created_at;

    if (auto inserted = insert_appointment(conn, appt); !inserted) {
        return std::unexpected(insert_failure(conn, *tx, appt, inserted.error()));
    }

    // Walk-ins join the queue at booking time
    std::optional<opened_visit> queued;
    if (walk_in) {
        auto opened = open_visit(conn, appt, appt.created_at);
        if (!opened) {
            return std::unexpected(opened.error());
        }
        queued = std::move(*opened);
    }

    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(scheduling_failure::from(committed.error()));
    }
    if (queued) {
        queue_->sync_after_commit(queued->id);
    }

    std::vector<std::pair<std::string, std::string>> details = {
        {"patient_id", appt.patient_id},
        {"practitioner_id", appt.practitioner_id},
        {"department_id", appt.department_id},
        {"slot", std::format("{} {}", appt.appointment_date, appt.appointment_time)},
        {"token_number", std::to_string(appt.token_number)}};
    if (queued) {
        details.emplace_back("visit_id", queued->id);
    }
    audit(session,
          walk_in ? security::audit_action::appointment_walk_in
                  : security::audit_action::appointment_created,
          "appointment", appt.id, std::move(details));
    booking_logger().info(std::format("Booked {} {} for practitioner {} (token {})",
                                      appt.appointment_date, appt.appointment_time,
                                      appt.practitioner_id, appt.token_number));

    auto confirmation = confirmation_of(appt);
    if (queued) {
        confirmation.visit_id = queued->id;
    }
    return confirmation;
}

scheduling_result<booking_confirmation> appointment_service::reschedule(
    const security::session_context& session,
    const reschedule_request& request) {
    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(scheduling_failure::from(scope.error()));
    }
    auto& conn = scope->connection();

    auto existing = load_appointment(conn, request.appointment_id);
    if (!existing) {
        return std::unexpected(existing.error());
    }
    if (auto allowed = guard(session, existing->tenant_id, existing->department_id,
                             security::permission::appointment_reschedule);
        !allowed) {
        return std::unexpected(allowed.error());
    }
    if (existing->status != appointment_status::booked &&
        existing->status != appointment_status::confirmed) {
        return fail(scheduling_error::validation_error,
                    std::format("A {} appointment cannot be rescheduled",
                                to_string(existing->status)));
    }
    if (existing->is_walk_in) {
        auto waiting = active_visit_of(conn, existing->id);
        if (!waiting) {
            return std::unexpected(waiting.error());
        }
        if (*waiting) {
            return fail(scheduling_error::validation_error,
                        "A walk-in already in the queue cannot be rescheduled",
                        (*waiting)->id);
        }
    }

    std::string practitioner_id =
        request.new_practitioner_id.value_or(existing->practitioner_id);
    if (practitioner_id == existing->practitioner_id &&
        request.new_date == existing->appointment_date &&
        request.new_time == existing->appointment_time) {
        return fail(scheduling_error::validation_error,
                    "The appointment is already in that slot");
    }
    if (auto valid = check_booking_date(request.new_date, request.new_time); !valid) {
        return std::unexpected(valid.error());
    }
    if (auto ok = check_practitioner(conn, existing->tenant_id, practitioner_id,
                                     existing->department_id);
        !ok) {
        return std::unexpected(ok.error());
    }

    auto tx = integration::transaction_guard::begin(conn,
                                                    integration::transaction_mode::immediate);
    if (!tx) {
        return std::unexpected(scheduling_failure::from(tx.error()));
    }

    auto now = clock_->now();
    std::string stamp = storage::to_timestamp(now);
    std::string successor_id = storage::generate_record_id();

    // Release the old slot first so that moves within the same window work
    auto released = execute(
        conn,
        "UPDATE appointments SET status = 'RESCHEDULED', rescheduled_to_id = ?, "
        "updated_at = ? WHERE id = ? AND status IN ('BOOKED', 'CONFIRMED')",
        {successor_id, stamp, existing->id});
    if (!released) {
        return std::unexpected(scheduling_failure::from(released.error()));
    }
    if (*released == 0) {
        return fail(scheduling_error::validation_error,
                    "Appointment changed while rescheduling");
    }

    auto reservation = availability_->check_slot(
        conn, existing->tenant_id,
        slot_request{practitioner_id, existing->department_id, request.new_date,
                     request.new_time, existing->is_walk_in});
    if (!reservation) {
        return std::unexpected(reservation.error());
    }
    if (auto free = check_patient_free(conn, existing->tenant_id, existing->patient_id,
                                       practitioner_id, request.new_date, existing->id);
        !free) {
        return std::unexpected(free.error());
    }

    int64_t token = existing->token_number;
    if (request.new_date != existing->appointment_date) {
        auto fresh = next_token(conn, existing->tenant_id, existing->department_id,
                                request.new_date, now);
        if (!fresh) {
            return std::unexpected(fresh.error());
        }
        token = *fresh;
    }

    appointment successor = *existing;
    successor.id = successor_id;
    successor.practitioner_id = practitioner_id;
    successor.appointment_date = request.new_date;
    successor.appointment_time = request.new_time;
    successor.end_time = reservation->end_time;
    successor.status = appointment_status::booked;
    successor.token_number = token;
    successor.rescheduled_from_id = existing->id;
    successor.rescheduled_to_id.reset();
    successor.created_by = session.user_id;
    successor.created_at = stamp;
    successor.updated_at = stamp;
    if (request.reason) {
        successor.notes = existing->notes
                              ? std::format("{}\nRescheduled: {}", *existing->notes,
                                            *request.reason)
                              : std::format("Rescheduled: {}", *request.reason);
    }

    if (auto inserted = insert_appointment(conn, successor); !inserted) {
        return std::unexpected(insert_failure(conn, *tx, successor, inserted.error()));
    }
    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(scheduling_failure::from(committed.error()));
    }

    audit(session, security::audit_action::appointment_rescheduled, "appointment",
          existing->id,
          {{"rescheduled_to_id", successor.id},
           {"from", std::format("{} {}", existing->appointment_date,
                                existing->appointment_time)},
           {"to", std::format("{} {}", successor.appointment_date,
                              successor.appointment_time)},
           {"reason", request.reason.value_or("")}});
    return confirmation_of(successor);
}

// =============================================================================
// Simple Transitions
// =============================================================================

scheduling_result<appointment> appointment_service::cancel(
    const security::session_context& session,
    std::string_view appointment_id,
    std::string_view reason) {
    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(scheduling_failure::from(scope.error()));
    }
    auto& conn = scope->connection();

    auto existing = load_appointment(conn, appointment_id);
    if (!existing) {
        return std::unexpected(existing.error());
    }
    if (auto allowed = guard(session, existing->tenant_id, existing->department_id,
                             security::permission::appointment_cancel);
        !allowed) {
        return std::unexpected(allowed.error());
    }

    const auto& rules = availability_->booking_rules();
    if (reason.find_first_not_of(" \t\r\n") == std::string_view::npos) {
        return fail(scheduling_error::validation_error, "Cancellation reason is required");
    }
    if (reason.size() > rules.max_cancel_reason_length) {
        return fail(scheduling_error::validation_error,
                    std::format("Cancellation reason exceeds {} characters",
                                rules.max_cancel_reason_length));
    }
    if (is_terminal(existing->status)) {
        return fail(scheduling_error::validation_error,
                    std::format("A {} appointment cannot be cancelled",
                                to_string(existing->status)));
    }

    auto tx = integration::transaction_guard::begin(conn,
                                                    integration::transaction_mode::immediate);
    if (!tx) {
        return std::unexpected(scheduling_failure::from(tx.error()));
    }

    std::string stamp = storage::to_timestamp(clock_->now());
    auto updated = execute(
        conn,
        "UPDATE appointments SET status = 'CANCELLED', cancellation_reason = ?, "
        "cancelled_at = ?, updated_at = ? WHERE id = ? "
        "AND status NOT IN ('COMPLETED', 'CANCELLED', 'NO_SHOW', 'RESCHEDULED')",
        {std::string(reason), stamp, stamp, existing->id});
    if (!updated) {
        return std::unexpected(scheduling_failure::from(updated.error()));
    }
    if (*updated == 0) {
        return fail(scheduling_error::validation_error,
                    "Appointment changed while cancelling");
    }

    auto visit_ids = close_visits(conn, existing->id, stamp);
    if (!visit_ids) {
        return std::unexpected(visit_ids.error());
    }

    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(scheduling_failure::from(committed.error()));
    }

    for (const auto& id : *visit_ids) {
        queue_->sync_after_commit(id);
    }

    existing->status = appointment_status::cancelled;
    existing->cancellation_reason = std::string(reason);
    existing->cancelled_at = stamp;
    existing->updated_at = stamp;

    audit(session, security::audit_action::appointment_cancelled, "appointment",
          existing->id,
          {{"reason", std::string(reason)},
           {"visits_cancelled", std::to_string(visit_ids->size())}});
    return std::move(*existing);
}

scheduling_result<appointment> appointment_service::confirm(
    const security::session_context& session,
    std::string_view appointment_id) {
    return transition(session, appointment_id, security::permission::appointment_update,
                      appointment_status::confirmed);
}

scheduling_result<appointment> appointment_service::mark_no_show(
    const security::session_context& session,
    std::string_view appointment_id) {
    return transition(session, appointment_id, security::permission::appointment_update,
                      appointment_status::no_show);
}

scheduling_result<appointment> appointment_service::transition(
    const security::session_context& session,
    std::string_view appointment_id,
    security::permission action,
    appointment_status target) {
    std::vector<appointment_status> sources = {appointment_status::booked};
    if (target == appointment_status::no_show) {
        sources.push_back(appointment_status::confirmed);
    }

    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(scheduling_failure::from(scope.error()));
    }
    auto& conn = scope->connection();

    auto existing = load_appointment(conn, appointment_id);
    if (!existing) {
        return std::unexpected(existing.error());
    }
    if (auto allowed = guard(session, existing->tenant_id, existing->department_id, action);
        !allowed) {
        return std::unexpected(allowed.error());
    }
    if (std::find(sources.begin(), sources.end(), existing->status) == sources.end()) {
        return fail(scheduling_error::validation_error,
                    std::format("Cannot move a {} appointment to {}",
                                to_string(existing->status), to_string(target)));
    }

    auto tx = integration::transaction_guard::begin(conn,
                                                    integration::transaction_mode::immediate);
    if (!tx) {
        return std::unexpected(scheduling_failure::from(tx.error()));
    }

    std::string stamp = storage::to_timestamp(clock_->now());
    std::string from_sql;
    std::vector<database_value> params = {std::string(to_string(target)), stamp,
                                          existing->id};
    for (auto source : sources) {
        from_sql += from_sql.empty() ? "?" : ", ?";
        params.emplace_back(std::string(to_string(source)));
    }

    auto updated = execute(
        conn,
        std::format("UPDATE appointments SET status = ?, updated_at = ? "
                    "WHERE id = ? AND status IN ({})",
                    from_sql),
        params);
    if (!updated) {
        return std::unexpected(scheduling_failure::from(updated.error()));
    }
    if (*updated == 0) {
        return fail(scheduling_error::validation_error,
                    "Appointment changed concurrently");
    }

    // A walk-in who never turned up leaves the queue
    std::vector<std::string> closed;
    if (target == appointment_status::no_show) {
        auto visit_ids = close_visits(conn, existing->id, stamp);
        if (!visit_ids) {
            return std::unexpected(visit_ids.error());
        }
        closed = std::move(*visit_ids);
    }

    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(scheduling_failure::from(committed.error()));
    }
    for (const auto& id : closed) {
        queue_->sync_after_commit(id);
    }

    existing->status = target;
    existing->updated_at = stamp;
    audit(session,
          target == appointment_status::confirmed ? security::audit_action::appointment_confirmed
                                                  : security::audit_action::appointment_no_show,
          "appointment", existing->id);
    return std::move(*existing);
}

// =============================================================================
// Visit Lifecycle
// =============================================================================

scheduling_result<check_in_result> appointment_service::check_in(
    const security::session_context& session,
    std::string_view appointment_id) {
    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(scheduling_failure::from(scope.error()));
    }
    auto& conn = scope->connection();

    auto existing = load_appointment(conn, appointment_id);
    if (!existing) {
        return std::unexpected(existing.error());
    }
    if (auto allowed = guard(session, existing->tenant_id, existing->department_id,
                             security::permission::appointment_checkin);
        !allowed) {
        return std::unexpected(allowed.error());
    }

    // A rescheduled appointment checks in the booking that replaced it
    for (int hops = 0; existing->status == appointment_status::rescheduled; ++hops) {
        if (!existing->rescheduled_to_id || hops >= max_reschedule_hops) {
            return fail(scheduling_error::validation_error,
                        std::format("Rescheduled appointment {} has no live successor",
                                    existing->id));
        }
        existing = load_appointment(conn, *existing->rescheduled_to_id);
        if (!existing) {
            return std::unexpected(existing.error());
        }
    }
    if (existing->status != appointment_status::booked &&
        existing->status != appointment_status::confirmed) {
        return fail(scheduling_error::validation_error,
                    std::format("A {} appointment cannot be checked in",
                                to_string(existing->status)));
    }

    auto tx = integration::transaction_guard::begin(conn,
                                                    integration::transaction_mode::immediate);
    if (!tx) {
        return std::unexpected(scheduling_failure::from(tx.error()));
    }

    std::string stamp = storage::to_timestamp(clock_->now());
    auto updated = execute(
        conn,
        "UPDATE appointments SET status = 'CHECKED_IN', checked_in_at = ?, updated_at = ? "
        "WHERE id = ? AND status IN ('BOOKED', 'CONFIRMED')",
        {stamp, stamp, existing->id});
    if (!updated) {
        return std::unexpected(scheduling_failure::from(updated.error()));
    }
    if (*updated == 0) {
        return fail(scheduling_error::validation_error,
                    "Appointment changed while checking in");
    }

    // Walk-ins already wait in the queue from booking
    auto waiting = active_visit_of(conn, existing->id);
    if (!waiting) {
        return std::unexpected(waiting.error());
    }
    bool opened_now = !*waiting;
    opened_visit queued;
    if (*waiting) {
        queued = std::move(**waiting);
    } else {
        auto opened = open_visit(conn, *existing, stamp);
        if (!opened) {
            return std::unexpected(opened.error());
        }
        queued = std::move(*opened);
    }

    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(scheduling_failure::from(committed.error()));
    }

    if (opened_now) {
        queue_->sync_after_commit(queued.id);
    }

    audit(session, security::audit_action::appointment_checked_in, "appointment",
          existing->id,
          {{"visit_id", queued.id},
           {"visit_number", std::to_string(queued.visit_number)},
           {"token_number", std::to_string(existing->token_number)}});
    return check_in_result{existing->id, queued.id, queued.visit_number,
                           existing->token_number};
}

scheduling_result<visit> appointment_service::start_consultation(
    const security::session_context& session,
    std::string_view visit_id,
    bool force) {
    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(scheduling_failure::from(scope.error()));
    }
    auto& conn = scope->connection();

    auto current = load_visit(conn, visit_id);
    if (!current) {
        return std::unexpected(current.error());
    }
    if (auto allowed = guard(session, current->tenant_id, current->department_id,
                             security::permission::consultation_start);
        !allowed) {
        return std::unexpected(allowed.error());
    }
    if (current->status == visit_status::in_progress) {
        return std::move(*current);
    }
    if (current->status != visit_status::waiting) {
        return fail(scheduling_error::validation_error,
                    std::format("A {} visit cannot be started", to_string(current->status)));
    }

    auto tx = integration::transaction_guard::begin(conn,
                                                    integration::transaction_mode::immediate);
    if (!tx) {
        return std::unexpected(scheduling_failure::from(tx.error()));
    }

    if (!force) {
        auto busy = conn.query(
            "SELECT id FROM visits WHERE tenant_id = ? AND practitioner_id = ? "
            "AND status = 'IN_PROGRESS' AND id != ? ORDER BY start_time LIMIT 1",
            {current->tenant_id, current->practitioner_id, current->id});
        if (!busy) {
            return std::unexpected(scheduling_failure::from(busy.error()));
        }
        if ((*busy)->next()) {
            std::string other = (*busy)->current_row().get_string(0);
            return fail(scheduling_error::has_in_progress,
                        "Practitioner already has a consultation in progress", other);
        }
    }

    std::string stamp = storage::to_timestamp(clock_->now());
    auto started = execute(conn,
                           "UPDATE visits SET status = 'IN_PROGRESS', start_time = ?, "
                           "updated_at = ? WHERE id = ? AND status = 'WAITING'",
                           {stamp, stamp, current->id});
    if (!started) {
        return std::unexpected(scheduling_failure::from(started.error()));
    }
    if (*started == 0) {
        return fail(scheduling_error::validation_error, "Visit changed while starting");
    }

    if (current->appointment_id) {
        auto linked = execute(
            conn,
            "UPDATE appointments SET status = 'IN_PROGRESS', updated_at = ? WHERE id = ? "
            "AND (status = 'CHECKED_IN' OR (status = 'BOOKED' AND is_walk_in = 1))",
            {stamp, *current->appointment_id});
        if (!linked) {
            return std::unexpected(scheduling_failure::from(linked.error()));
        }
    }

    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(scheduling_failure::from(committed.error()));
    }

    queue_->sync_after_commit(current->id);

    current->status = visit_status::in_progress;
    current->start_time = stamp;
    current->updated_at = stamp;
    audit(session, security::audit_action::consultation_started, "visit", current->id,
          {{"practitioner_id", current->practitioner_id},
           {"forced", force ? "true" : "false"}});
    return std::move(*current);
}

scheduling_result<visit> appointment_service::complete(
    const security::session_context& session,
    std::string_view visit_id) {
    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(scheduling_failure::from(scope.error()));
    }
    auto& conn = scope->connection();

    auto current = load_visit(conn, visit_id);
    if (!current) {
        return std::unexpected(current.error());
    }
    if (auto allowed = guard(session, current->tenant_id, current->department_id,
                             security::permission::consultation_complete);
        !allowed) {
        return std::unexpected(allowed.error());
    }
    if (current->status != visit_status::in_progress) {
        return fail(scheduling_error::validation_error,
                    std::format("A {} visit cannot be completed", to_string(current->status)));
    }

    auto tx = integration::transaction_guard::begin(conn,
                                                    integration::transaction_mode::immediate);
    if (!tx) {
        return std::unexpected(scheduling_failure::from(tx.error()));
    }

    std::string stamp = storage::to_timestamp(clock_->now());
    auto finished = execute(conn,
                            "UPDATE visits SET status = 'COMPLETED', end_time = ?, "
                            "updated_at = ? WHERE id = ? AND status = 'IN_PROGRESS'",
                            {stamp, stamp, current->id});
    if (!finished) {
        return std::unexpected(scheduling_failure::from(finished.error()));
    }
    if (*finished == 0) {
        return fail(scheduling_error::validation_error, "Visit changed while completing");
    }

    if (current->appointment_id) {
        auto linked = execute(conn,
                              "UPDATE appointments SET status = 'COMPLETED', "
                              "completed_at = ?, updated_at = ? WHERE id = ? "
                              "AND status IN ('CHECKED_IN', 'IN_PROGRESS')",
                              {stamp, stamp, *current->appointment_id});
        if (!linked) {
            return std::unexpected(scheduling_failure::from(linked.error()));
        }
    }

    if (auto committed = tx->commit(); !committed) {
        return std::unexpected(scheduling_failure::from(committed.error()));
    }

    queue_->sync_after_commit(current->id);

    current->status = visit_status::completed;
    current->end_time = stamp;
    current->updated_at = stamp;
    audit(session, security::audit_action::consultation_completed, "visit", current->id,
          {{"practitioner_id", current->practitioner_id}});
    return std::move(*current);
}

// =============================================================================
// Reads
// =============================================================================

scheduling_result<appointment> appointment_service::get(
    const security::session_context& session,
    std::string_view appointment_id) {
    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(scheduling_failure::from(scope.error()));
    }

    auto found = load_appointment(scope->connection(), appointment_id);
    if (!found) {
        return std::unexpected(found.error());
    }
    if (auto allowed = guard(session, found->tenant_id, found->department_id,
                             security::permission::appointment_view);
        !allowed) {
        return std::unexpected(allowed.error());
    }
    return found;
}

scheduling_result<pagination::page<appointment>> appointment_service::list(
    const security::session_context& session,
    const appointment_filter& filter,
    const std::optional<std::string>& cursor,
    std::optional<std::size_t> limit) {
    if (auto allowed = guard(session, session.tenant_id, filter.department_id,
                             security::permission::appointment_view);
        !allowed) {
        return std::unexpected(allowed.error());
    }

    for (const auto* date : {&filter.date, &filter.date_from, &filter.date_to}) {
        if (*date && !parse_date(**date)) {
            return fail(scheduling_error::validation_error, "Dates must be YYYY-MM-DD");
        }
    }

    auto departments = security::build_filter(session, "department_id");
    std::string where = std::format("tenant_id = ? AND {}", departments.to_sql());
    std::vector<database_value> params = {session.tenant_id};
    for (auto& value : departments.bindings()) {
        params.push_back(std::move(value));
    }

    auto add = [&](std::string_view clause, const std::optional<std::string>& value) {
        if (value) {
            where += std::format(" AND {}", clause);
            params.emplace_back(*value);
        }
    };
    add("appointment_date = ?", filter.date);
    add("appointment_date >= ?", filter.date_from);
    add("appointment_date <= ?", filter.date_to);
    add("patient_id = ?", filter.patient_id);
    add("practitioner_id = ?", filter.practitioner_id);
    add("department_id = ?", filter.department_id);

    if (!filter.statuses.empty()) {
        std::string in;
        for (auto status : filter.statuses) {
            in += in.empty() ? "?" : ", ?";
            params.emplace_back(std::string(to_string(status)));
        }
        where += std::format(" AND status IN ({})", in);
    }
    if (filter.walk_in) {
        where += " AND is_walk_in = ?";
        params.emplace_back(static_cast<int64_t>(*filter.walk_in));
    }

    static const std::vector<pagination::sort_column> order = {
        {"appointment_date", pagination::sort_direction::ascending,
         pagination::column_type::text},
        {"appointment_time", pagination::sort_direction::ascending,
         pagination::column_type::text},
        {"id", pagination::sort_direction::ascending, pagination::column_type::text}};

    if (cursor) {
        auto position = pagination::decode(*cursor);
        if (!position) {
            return fail(scheduling_error::validation_error,
                        pagination::to_string(position.error()));
        }
        auto predicate = pagination::build_keyset_predicate(order, *position);
        if (!predicate) {
            return fail(scheduling_error::validation_error,
                        pagination::to_string(predicate.error()));
        }
        where += " AND " + predicate->sql;
        for (auto& value : predicate->bindings) {
            params.push_back(std::move(value));
        }
    }

    std::size_t page_size =
        pagination::sanitize_limit(limit, pagination_.default_limit, pagination_.max_limit);
    params.emplace_back(static_cast<int64_t>(page_size + 1));

    auto scope = integration::connection_scope::acquire(*adapter_);
    if (!scope) {
        return std::unexpected(scheduling_failure::from(scope.error()));
    }
    auto result = scope->connection().query(
        std::format("SELECT {} FROM appointments WHERE {} ORDER BY {} LIMIT ?",
                    appointment_columns, where, pagination::order_by_clause(order)),
        params);
    if (!result) {
        return std::unexpected(scheduling_failure::from(result.error()));
    }

    std::vector<appointment> rows;
    while ((*result)->next()) {
        rows.push_back(read_appointment((*result)->current_row()));
    }
    return pagination::make_page(std::move(rows), page_size, [](const appointment& a) {
        return pagination::cursor_position{{a.appointment_date, a.appointment_time}, a.id};
    });
}

}  // namespace clinic::opd::scheduling
