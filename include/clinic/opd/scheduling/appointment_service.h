#ifndef CLINIC_OPD_SCHEDULING_APPOINTMENT_SERVICE_H
#define CLINIC_OPD_SCHEDULING_APPOINTMENT_SERVICE_H

/**
 * @file appointment_service.h
 * @brief Appointment lifecycle and OPD visit transitions
 *
 * Appointment states:
 *
 *   BOOKED -> CONFIRMED -> CHECKED_IN -> IN_PROGRESS -> COMPLETED
 *
 * with side exits CANCELLED, NO_SHOW and RESCHEDULED (the old
 * appointment ends, a new BOOKED one takes its place).
 *
 * Check-in creates the OPD visit that the queue shows (walk-ins get theirs
 * when booked); consultation start
 * and completion move the visit and its appointment together. Every
 * visit-changing operation commits first and then re-syncs the queue
 * snapshot outside the transaction.
 *
 * Slot ownership is decided by storage: the partial UNIQUE index on
 * (tenant, practitioner, date, time) admits one slot-holding appointment,
 * and a lost race surfaces as SLOT_CONFLICT. Nothing is retried.
 */

#include "clinic/opd/config/scheduler_config.h"
#include "clinic/opd/integration/database_adapter.h"
#include "clinic/opd/pagination/cursor.h"
#include "clinic/opd/queue/queue_synchronizer.h"
#include "clinic/opd/scheduling/availability_service.h"
#include "clinic/opd/scheduling/scheduling_error.h"
#include "clinic/opd/scheduling/scheduling_types.h"
#include "clinic/opd/security/access_guard.h"
#include "clinic/opd/security/audit_logger.h"
#include "clinic/opd/security/rate_limiter.h"
#include "clinic/opd/storage/timestamps.h"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace clinic::opd::scheduling {

// =============================================================================
// Requests and Results
// =============================================================================

struct booking_request {
    std::string patient_id;
    std::string practitioner_id;
    std::string department_id;

    /** "YYYY-MM-DD" */
    std::string date;

    /** "HH:MM", a slot start of the practitioner's availability */
    std::string time;

    scheduling::priority priority = scheduling::priority::normal;
    booking_source source = booking_source::reception;
    std::optional<std::string> chief_complaint;
    std::optional<std::string> notes;
};

/**
 * @brief Walk-in for today; the next free slot is assigned
 */
struct walk_in_request {
    std::string patient_id;
    std::string practitioner_id;
    std::string department_id;
    scheduling::priority priority = scheduling::priority::normal;
    std::optional<std::string> chief_complaint;
    std::optional<std::string> notes;
};

struct reschedule_request {
    std::string appointment_id;
    std::string new_date;
    std::string new_time;
    std::optional<std::string> new_practitioner_id;
    std::optional<std::string> reason;
};

struct booking_confirmation {
    std::string appointment_id;
    int64_t token_number = 0;
    appointment_status status = appointment_status::booked;
    std::string appointment_date;
    std::string appointment_time;
    std::string end_time;
    /** Queue visit opened by a walk-in booking */
    std::optional<std::string> visit_id;
};

struct check_in_result {
    std::string appointment_id;
    std::string visit_id;
    int64_t visit_number = 0;
    int64_t token_number = 0;
};

/**
 * @brief Appointment listing filters; unset fields do not filter
 */
struct appointment_filter {
    std::optional<std::string> date;
    std::optional<std::string> date_from;
    std::optional<std::string> date_to;
    std::optional<std::string> patient_id;
    std::optional<std::string> practitioner_id;
    std::optional<std::string> department_id;
    std::vector<appointment_status> statuses;
    std::optional<bool> walk_in;
};

// =============================================================================
// Appointment Service
// =============================================================================

class appointment_service {
public:
    /**
     * @param queue Snapshot synchronizer notified after visit changes
     * @param limiter Booking-tier limiter for create and walk_in; nullptr
     *        disables limiting
     */
    appointment_service(std::shared_ptr<integration::database_adapter> adapter,
                        std::shared_ptr<availability_service> availability,
                        std::shared_ptr<queue::queue_synchronizer> queue,
                        std::shared_ptr<security::audit_logger> audit = nullptr,
                        std::shared_ptr<security::rate_limiter> limiter = nullptr,
                        config::pagination_config pagination = {},
                        std::shared_ptr<const storage::clock> time_source =
                            storage::default_clock());

    /**
     * @brief Book a slot
     *
     * Validates the date (not past, within the advance window), the
     * practitioner's department and status, the slot against availability
     * and the patient's other bookings that day, then assigns the
     * department's next token and inserts the appointment in one
     * IMMEDIATE transaction.
     */
    [[nodiscard]] scheduling_result<booking_confirmation> create(
        const security::session_context& session,
        const booking_request& request);

    /**
     * @brief Book the next free slot from now on today, source WALKIN
     *
     * The WAITING visit is opened in the same transaction, so the patient
     * is queued and can be seen without a check-in step.
     */
    [[nodiscard]] scheduling_result<booking_confirmation> walk_in(
        const security::session_context& session,
        const walk_in_request& request);

    /**
     * @brief Move a BOOKED or CONFIRMED appointment to another slot
     *
     * The old appointment becomes RESCHEDULED and a new BOOKED one is
     * created in the same transaction; if the target slot is held nothing
     * changes. The token is kept unless the date changes.
     *
     * @return The successor appointment
     */
    [[nodiscard]] scheduling_result<booking_confirmation> reschedule(
        const security::session_context& session,
        const reschedule_request& request);

    /**
     * @brief Cancel a non-terminal appointment
     *
     * A linked WAITING or IN_PROGRESS visit is cancelled with it and leaves
     * the queue.
     */
    [[nodiscard]] scheduling_result<appointment> cancel(
        const security::session_context& session,
        std::string_view appointment_id,
        std::string_view reason);

    /** BOOKED -> CONFIRMED */
    [[nodiscard]] scheduling_result<appointment> confirm(
        const security::session_context& session,
        std::string_view appointment_id);

    /** BOOKED/CONFIRMED -> NO_SHOW; a queued walk-in visit is cancelled */
    [[nodiscard]] scheduling_result<appointment> mark_no_show(
        const security::session_context& session,
        std::string_view appointment_id);

    /**
     * @brief Create the WAITING OPD visit and set the appointment CHECKED_IN
     *
     * A RESCHEDULED id checks in its live successor, which the result names.
     * A walk-in keeps the visit opened at booking.
     */
    [[nodiscard]] scheduling_result<check_in_result> check_in(
        const security::session_context& session,
        std::string_view appointment_id);

    /**
     * @brief WAITING -> IN_PROGRESS
     *
     * Unless @p force is set, fails with HAS_IN_PROGRESS (carrying the
     * other visit's id) when the practitioner already has a consultation
     * in progress. Starting a visit that is already IN_PROGRESS returns it
     * unchanged.
     */
    [[nodiscard]] scheduling_result<visit> start_consultation(
        const security::session_context& session,
        std::string_view visit_id,
        bool force = false);

    /**
     * @brief IN_PROGRESS -> COMPLETED; the visit leaves the queue
     */
    [[nodiscard]] scheduling_result<visit> complete(
        const security::session_context& session,
        std::string_view visit_id);

    [[nodiscard]] scheduling_result<appointment> get(
        const security::session_context& session,
        std::string_view appointment_id);

    /**
     * @brief Appointments of the caller's departments by date, time and id
     */
    [[nodiscard]] scheduling_result<pagination::page<appointment>> list(
        const security::session_context& session,
        const appointment_filter& filter,
        const std::optional<std::string>& cursor = std::nullopt,
        std::optional<std::size_t> limit = std::nullopt);

private:
    scheduling_result<appointment> transition(const security::session_context& session,
                                              std::string_view appointment_id,
                                              security::permission action,
                                              appointment_status target);

    scheduling_result<booking_confirmation> book(const security::session_context& session,
                                                 const booking_request& request,
                                                 bool walk_in);

    scheduling_result<void> check_booking_date(std::string_view date,
                                               std::string_view time) const;

    scheduling_result<void> throttle(const security::session_context& session);

    void audit(const security::session_context& session,
               security::audit_action action,
               std::string_view entity_type,
               std::string_view entity_id,
               std::vector<std::pair<std::string, std::string>> properties = {});

    std::shared_ptr<integration::database_adapter> adapter_;
    std::shared_ptr<availability_service> availability_;
    std::shared_ptr<queue::queue_synchronizer> queue_;
    std::shared_ptr<security::audit_logger> audit_;
    std::shared_ptr<security::rate_limiter> limiter_;
    config::pagination_config pagination_;
    std::shared_ptr<const storage::clock> clock_;
};

}  // namespace clinic::opd::scheduling

#endif  // CLINIC_OPD_SCHEDULING_APPOINTMENT_SERVICE_H
