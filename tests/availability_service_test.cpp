/**
 * @file availability_service_test.cpp
 * @brief Unit tests for availability templates and slot projection
 *
 * @see include/clinic/opd/scheduling/availability_service.h
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "clinic/opd/scheduling/availability_service.h"
#include "utils/scheduling_fixture.h"

namespace clinic::opd::scheduling {
namespace {

using namespace ::testing;

class AvailabilityServiceTest : public test::scheduling_test {
protected:
    availability_window window(std::string start, std::string end, int minutes = 15) {
        availability_window w;
        w.start_time = std::move(start);
        w.end_time = std::move(end);
        w.slot_duration_minutes = minutes;
        return w;
    }

    void book(std::string_view practitioner, std::string patient, std::string time) {
        auto request = rao_booking(std::move(patient), std::move(time));
        request.practitioner_id = std::string(practitioner);
        auto booked = appointments_->create(test::cardiology_staff(), request);
        ASSERT_TRUE(booked.has_value()) << booked.error().to_string();
    }

    std::vector<std::string> start_times(const day_slots& day) {
        std::vector<std::string> times;
        for (const auto& s : day.slots) times.push_back(s.start_time);
        return times;
    }
};

// =============================================================================
// Slot Projection
// =============================================================================

TEST_F(AvailabilityServiceTest, WindowIsSubdividedIntoSlots) {
    auto day = availability_->get_doctor_day_slots(test::cardiology_staff(), test::dr_rao,
                                                   test::today,
                                                   std::string(test::cardiology));
    ASSERT_TRUE(day.has_value()) << day.error().to_string();

    EXPECT_EQ(day->day, day_of_week::monday);
    EXPECT_EQ(day->practitioner_name, "Dr. Rao");
    ASSERT_EQ(day->slots.size(), 12u);
    EXPECT_EQ(day->slots.front().start_time, "09:00");
    EXPECT_EQ(day->slots.front().end_time, "09:15");
    EXPECT_EQ(day->slots.back().start_time, "11:45");
    EXPECT_EQ(day->slots.back().end_time, "12:00");
    EXPECT_EQ(day->total_capacity, 12);
    EXPECT_EQ(day->available_count, 12);
    EXPECT_FALSE(day->is_day_full);
    EXPECT_TRUE(day->allow_walk_in);
}

TEST_F(AvailabilityServiceTest, LastSlotMustEndInsideWindow) {
    ASSERT_TRUE(availability_->create_template(test::cardiology_staff(), test::dr_mehta,
                                               test::cardiology, day_of_week::monday,
                                               window("14:00", "14:50", 20)));

    auto day = availability_->get_doctor_day_slots(test::cardiology_staff(), test::dr_mehta,
                                                   test::today);
    ASSERT_TRUE(day.has_value());
    EXPECT_THAT(start_times(*day), ElementsAre("14:00", "14:20"));
}

TEST_F(AvailabilityServiceTest, BookedSlotIsFlagged) {
    book(test::dr_rao, "pat-1", "09:15");

    auto day = availability_->get_doctor_day_slots(test::cardiology_staff(), test::dr_rao,
                                                   test::today);
    ASSERT_TRUE(day.has_value());
    EXPECT_TRUE(day->slots[0].available);
    EXPECT_FALSE(day->slots[1].available);
    EXPECT_EQ(day->slots[1].blocked_by, slot_block_reason::booked);
    EXPECT_EQ(day->booked_count, 1);
    EXPECT_EQ(day->available_count, 11);
}

TEST_F(AvailabilityServiceTest, OtherDepartmentSlotsAreMismatched) {
    auto day = availability_->get_doctor_day_slots(test::tenant_admin(), test::dr_rao,
                                                   test::today,
                                                   std::string(test::neurology));
    ASSERT_TRUE(day.has_value());
    ASSERT_EQ(day->slots.size(), 12u);
    for (const auto& s : day->slots) {
        EXPECT_FALSE(s.available);
        EXPECT_EQ(s.blocked_by, slot_block_reason::department_mismatch);
    }
    EXPECT_EQ(day->total_capacity, 0);
    EXPECT_TRUE(day->is_day_full);
}

TEST_F(AvailabilityServiceTest, PractitionerOnLeaveHasNoAvailableSlots) {
    ASSERT_TRUE(availability_->create_template(test::cardiology_staff(), test::dr_iyer,
                                               test::cardiology, day_of_week::monday,
                                               window("09:00", "10:00")));

    auto day = availability_->get_doctor_day_slots(test::cardiology_staff(), test::dr_iyer,
                                                   test::today);
    ASSERT_TRUE(day.has_value());
    EXPECT_EQ(day->status, practitioner_status::on_leave);
    ASSERT_EQ(day->slots.size(), 4u);
    EXPECT_EQ(day->slots[0].blocked_by, slot_block_reason::practitioner_unavailable);
    EXPECT_EQ(day->available_count, 0);
}

TEST_F(AvailabilityServiceTest, DailyCapFillsTheDay) {
    auto capped = window("09:00", "10:00");
    capped.max_patients_per_day = 2;
    ASSERT_TRUE(availability_->create_template(test::cardiology_staff(), test::dr_mehta,
                                               test::cardiology, day_of_week::monday,
                                               capped));
    book(test::dr_mehta, "pat-1", "09:00");
    book(test::dr_mehta, "pat-2", "09:30");

    auto day = availability_->get_doctor_day_slots(test::cardiology_staff(), test::dr_mehta,
                                                   test::today);
    ASSERT_TRUE(day.has_value());
    EXPECT_EQ(day->max_patients_per_day, 2);
    EXPECT_TRUE(day->is_day_full);
    EXPECT_EQ(day->available_count, 0);

    auto request = rao_booking("pat-3", "09:45");
    request.practitioner_id = std::string(test::dr_mehta);
    auto third = appointments_->create(test::cardiology_staff(), request);
    ASSERT_FALSE(third.has_value());
    EXPECT_EQ(third.error().code, scheduling_error::validation_error);
    EXPECT_THAT(third.error().message, HasSubstr("daily limit"));
}

TEST_F(AvailabilityServiceTest, NoTemplatesMeansEmptyFullDay) {
    auto day = availability_->get_doctor_day_slots(test::neurology_staff(), test::dr_sen,
                                                   test::today);
    ASSERT_TRUE(day.has_value());
    EXPECT_TRUE(day->slots.empty());
    EXPECT_TRUE(day->is_day_full);
}

TEST_F(AvailabilityServiceTest, InvalidDateAndUnknownPractitioner) {
    auto bad_date = availability_->get_doctor_day_slots(test::cardiology_staff(),
                                                        test::dr_rao, "2025-02-30");
    ASSERT_FALSE(bad_date.has_value());
    EXPECT_EQ(bad_date.error().code, scheduling_error::validation_error);

    auto missing = availability_->get_doctor_day_slots(test::cardiology_staff(),
                                                       "pr-nobody", test::today);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, scheduling_error::not_found);
}

TEST_F(AvailabilityServiceTest, RequestedDepartmentOutsideSessionIsDenied) {
    auto day = availability_->get_doctor_day_slots(test::cardiology_staff(), test::dr_rao,
                                                   test::today,
                                                   std::string(test::neurology));
    ASSERT_FALSE(day.has_value());
    EXPECT_EQ(day.error().code, scheduling_error::department_access_denied);
}

// =============================================================================
// Template Management
// =============================================================================

TEST_F(AvailabilityServiceTest, OverlapNamesTheExistingWindow) {
    auto result = availability_->create_template(test::cardiology_staff(), test::dr_rao,
                                                 test::cardiology, day_of_week::monday,
                                                 window("11:30", "13:00"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, scheduling_error::availability_overlap);
    EXPECT_EQ(result.error().conflicting_id, rao_monday_);

    EXPECT_TRUE(availability_->create_template(test::cardiology_staff(), test::dr_rao,
                                               test::cardiology, day_of_week::monday,
                                               window("12:00", "13:00")));
}

TEST_F(AvailabilityServiceTest, OverlapSpansDepartments) {
    test::exec_sql(*adapter_,
                   "INSERT INTO practitioner_departments (practitioner_id, department_id, "
                   "is_primary) VALUES (?, ?, 0)",
                   {std::string(test::dr_rao), std::string(test::neurology)});

    auto result = availability_->create_template(test::tenant_admin(), test::dr_rao,
                                                 test::neurology, day_of_week::monday,
                                                 window("10:00", "11:00"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, scheduling_error::availability_overlap);
}

TEST_F(AvailabilityServiceTest, DisjointEffectiveRangesDoNotOverlap) {
    auto january = window("09:00", "10:00");
    january.effective_to = "2025-01-31";
    auto february = window("09:00", "10:00");
    february.effective_from = "2025-02-01";

    ASSERT_TRUE(availability_->create_template(test::cardiology_staff(), test::dr_mehta,
                                               test::cardiology, day_of_week::tuesday,
                                               january));
    EXPECT_TRUE(availability_->create_template(test::cardiology_staff(), test::dr_mehta,
                                               test::cardiology, day_of_week::tuesday,
                                               february));
}

TEST_F(AvailabilityServiceTest, WindowRulesAreValidated) {
    auto create = [&](availability_window w) {
        return availability_->create_template(test::cardiology_staff(), test::dr_mehta,
                                              test::cardiology, day_of_week::friday, w);
    };

    EXPECT_EQ(create(window("10:00", "09:00")).error().code,
              scheduling_error::validation_error);
    EXPECT_EQ(create(window("09:00", "10:00", 3)).error().code,
              scheduling_error::validation_error);
    EXPECT_EQ(create(window("09:00", "09:10", 15)).error().code,
              scheduling_error::validation_error);
    EXPECT_EQ(create(window("9am", "10:00")).error().code,
              scheduling_error::validation_error);

    auto reserved = window("09:00", "10:00");
    reserved.walk_in_slots = 5;
    EXPECT_EQ(create(reserved).error().code, scheduling_error::validation_error);

    auto capped = window("09:00", "10:00");
    capped.max_patients_per_day = 0;
    EXPECT_EQ(create(capped).error().code, scheduling_error::validation_error);
}

TEST_F(AvailabilityServiceTest, PractitionerMustBelongToDepartment) {
    auto outsider = availability_->create_template(test::tenant_admin(), test::dr_sen,
                                                   test::cardiology, day_of_week::monday,
                                                   window("09:00", "10:00"));
    ASSERT_FALSE(outsider.has_value());
    EXPECT_EQ(outsider.error().code, scheduling_error::validation_error);

    auto unknown = availability_->create_template(test::cardiology_staff(), "pr-nobody",
                                                  test::cardiology, day_of_week::monday,
                                                  window("09:00", "10:00"));
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().code, scheduling_error::not_found);
}

TEST_F(AvailabilityServiceTest, BulkCreateIsAllOrNothing) {
    auto repeated = availability_->bulk_create_availability(
        test::cardiology_staff(), test::dr_mehta, test::cardiology,
        {day_of_week::tuesday, day_of_week::wednesday, day_of_week::tuesday},
        window("09:00", "12:00"));
    ASSERT_FALSE(repeated.has_value());
    EXPECT_EQ(repeated.error().code, scheduling_error::availability_overlap);

    // Thursday collides after Tuesday and Wednesday were inserted
    ASSERT_TRUE(availability_->create_template(test::cardiology_staff(), test::dr_mehta,
                                               test::cardiology, day_of_week::thursday,
                                               window("11:00", "13:00")));
    auto collides = availability_->bulk_create_availability(
        test::cardiology_staff(), test::dr_mehta, test::cardiology,
        {day_of_week::tuesday, day_of_week::wednesday, day_of_week::thursday},
        window("09:00", "12:00"));
    ASSERT_FALSE(collides.has_value());
    EXPECT_EQ(collides.error().code, scheduling_error::availability_overlap);

    auto listed = availability_->list_templates(test::cardiology_staff(),
                                                {std::string(test::dr_mehta)});
    ASSERT_TRUE(listed.has_value());
    EXPECT_EQ(listed->size(), 1u);
}

TEST_F(AvailabilityServiceTest, BulkCreateOneTemplatePerDay) {
    auto created = availability_->bulk_create_availability(
        test::cardiology_staff(), test::dr_mehta, test::cardiology,
        {day_of_week::wednesday, day_of_week::tuesday}, window("09:00", "12:00"));
    ASSERT_TRUE(created.has_value()) << created.error().to_string();
    ASSERT_EQ(created->size(), 2u);
    EXPECT_EQ((*created)[0].day, day_of_week::wednesday);
    EXPECT_EQ((*created)[0].version, 1);

    EXPECT_EQ(test::query_int(*adapter_,
                              "SELECT COUNT(*) FROM audit_log WHERE action = "
                              "'AVAILABILITY_CREATED'"),
              3);
}

TEST_F(AvailabilityServiceTest, UpdateChecksVersion) {
    template_changes changes;
    changes.end_time = "13:00";

    auto stale = availability_->update_template(test::cardiology_staff(), rao_monday_,
                                                changes, 2);
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error().code, scheduling_error::version_conflict);

    auto updated = availability_->update_template(test::cardiology_staff(), rao_monday_,
                                                  changes, 1);
    ASSERT_TRUE(updated.has_value()) << updated.error().to_string();
    EXPECT_EQ(updated->version, 2);
    EXPECT_EQ(updated->end_time, "13:00");

    auto again = availability_->update_template(test::cardiology_staff(), rao_monday_,
                                                changes, 1);
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, scheduling_error::version_conflict);

    auto day = availability_->get_doctor_day_slots(test::cardiology_staff(), test::dr_rao,
                                                   test::today);
    ASSERT_TRUE(day.has_value());
    EXPECT_EQ(day->slots.size(), 16u);
}

TEST_F(AvailabilityServiceTest, DeactivatingTemplateIsAudited) {
    template_changes changes;
    changes.status = template_status::inactive;
    ASSERT_TRUE(availability_->update_template(test::cardiology_staff(), rao_monday_,
                                               changes, 1));

    EXPECT_EQ(test::query_int(*adapter_,
                              "SELECT COUNT(*) FROM audit_log WHERE action = "
                              "'AVAILABILITY_DISABLED'"),
              1);

    template_filter all;
    all.include_inactive = true;
    EXPECT_EQ(availability_->list_templates(test::cardiology_staff(), all)->size(), 1u);
    EXPECT_TRUE(availability_->list_templates(test::cardiology_staff(), {})->empty());
}

TEST_F(AvailabilityServiceTest, CopyToOtherDays) {
    auto same_day = availability_->copy_to_days(test::cardiology_staff(), rao_monday_,
                                                {day_of_week::monday});
    ASSERT_FALSE(same_day.has_value());
    EXPECT_EQ(same_day.error().code, scheduling_error::validation_error);

    auto copied = availability_->copy_to_days(test::cardiology_staff(), rao_monday_,
                                              {day_of_week::thursday, day_of_week::friday});
    ASSERT_TRUE(copied.has_value()) << copied.error().to_string();
    ASSERT_EQ(copied->size(), 2u);
    EXPECT_EQ((*copied)[1].start_time, "09:00");
    EXPECT_EQ((*copied)[1].end_time, "12:00");

    auto day = availability_->get_doctor_day_slots(test::cardiology_staff(), test::dr_rao,
                                                   "2025-01-10");
    ASSERT_TRUE(day.has_value());
    EXPECT_EQ(day->day, day_of_week::friday);
    EXPECT_EQ(day->slots.size(), 12u);
}

TEST_F(AvailabilityServiceTest, DisableDay) {
    auto disabled = availability_->disable_day(test::cardiology_staff(), test::dr_rao,
                                               test::cardiology, day_of_week::monday);
    ASSERT_TRUE(disabled.has_value());
    EXPECT_EQ(*disabled, 1u);
    EXPECT_EQ(availability_->disable_day(test::cardiology_staff(), test::dr_rao,
                                         test::cardiology, day_of_week::monday)
                  .value(),
              0u);

    auto day = availability_->get_doctor_day_slots(test::cardiology_staff(), test::dr_rao,
                                                   test::today);
    ASSERT_TRUE(day.has_value());
    EXPECT_TRUE(day->slots.empty());
    EXPECT_TRUE(day->is_day_full);
}

TEST_F(AvailabilityServiceTest, ListTemplatesIsScopedToSessionDepartments) {
    ASSERT_TRUE(availability_->create_template(test::neurology_staff(), test::dr_sen,
                                               test::neurology, day_of_week::monday,
                                               window("09:00", "10:00")));
    ASSERT_TRUE(availability_->create_template(test::cardiology_staff(), test::dr_rao,
                                               test::cardiology, day_of_week::monday,
                                               window("07:00", "08:00")));

    auto cardiology = availability_->list_templates(test::cardiology_staff(), {});
    ASSERT_TRUE(cardiology.has_value());
    ASSERT_EQ(cardiology->size(), 2u);
    EXPECT_EQ((*cardiology)[0].start_time, "07:00");
    EXPECT_EQ((*cardiology)[1].id, rao_monday_);

    EXPECT_EQ(availability_->list_templates(test::tenant_admin(), {})->size(), 3u);

    template_filter foreign;
    foreign.department_id = std::string(test::neurology);
    auto denied = availability_->list_templates(test::cardiology_staff(), foreign);
    ASSERT_FALSE(denied.has_value());
    EXPECT_EQ(denied.error().code, scheduling_error::department_access_denied);
}

// =============================================================================
// Booking Validation
// =============================================================================

TEST_F(AvailabilityServiceTest, SlotMustStartOnTheGrid) {
    slot_request request{std::string(test::dr_rao), std::string(test::cardiology),
                         std::string(test::today), "09:07"};
    auto result = availability_->validate_slot_booking(test::cardiology_staff(), request);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, scheduling_error::validation_error);

    request.time = "09:15";
    auto ok = availability_->validate_slot_booking(test::cardiology_staff(), request);
    ASSERT_TRUE(ok.has_value()) << ok.error().to_string();
    EXPECT_EQ(ok->template_id, rao_monday_);
    EXPECT_EQ(ok->end_time, "09:30");
}

TEST_F(AvailabilityServiceTest, HeldSlotIsConflictNamingTheHolder) {
    auto held = appointments_->create(test::cardiology_staff(), rao_booking("pat-1", "10:00"));
    ASSERT_TRUE(held.has_value());

    slot_request request{std::string(test::dr_rao), std::string(test::cardiology),
                         std::string(test::today), "10:00"};
    auto result = availability_->validate_slot_booking(test::cardiology_staff(), request);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, scheduling_error::slot_conflict);
    EXPECT_EQ(result.error().conflicting_id, held->appointment_id);
}

TEST_F(AvailabilityServiceTest, PractitionerStatusIsCheckedAfterCoverage) {
    ASSERT_TRUE(availability_->create_template(test::cardiology_staff(), test::dr_iyer,
                                               test::cardiology, day_of_week::monday,
                                               window("09:00", "10:00")));

    slot_request request{std::string(test::dr_iyer), std::string(test::cardiology),
                         std::string(test::today), "09:00"};
    auto result = availability_->validate_slot_booking(test::cardiology_staff(), request);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, scheduling_error::validation_error);
    EXPECT_THAT(result.error().message, HasSubstr("ON_LEAVE"));
}

TEST_F(AvailabilityServiceTest, WalkInsCanBeDisallowed) {
    auto no_walk_ins = window("14:00", "15:00");
    no_walk_ins.allow_walk_in = false;
    ASSERT_TRUE(availability_->create_template(test::cardiology_staff(), test::dr_mehta,
                                               test::cardiology, day_of_week::monday,
                                               no_walk_ins));

    slot_request request{std::string(test::dr_mehta), std::string(test::cardiology),
                         std::string(test::today), "14:00", true};
    auto result = availability_->validate_slot_booking(test::cardiology_staff(), request);
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().message, HasSubstr("Walk-ins are not allowed"));
}

TEST_F(AvailabilityServiceTest, ReservedSlotsAreKeptForWalkIns) {
    auto reserved = window("09:00", "10:00");
    reserved.walk_in_slots = 1;
    ASSERT_TRUE(availability_->create_template(test::cardiology_staff(), test::dr_mehta,
                                               test::cardiology, day_of_week::monday,
                                               reserved));
    book(test::dr_mehta, "pat-1", "09:00");
    book(test::dr_mehta, "pat-2", "09:15");
    book(test::dr_mehta, "pat-3", "09:30");

    slot_request advance{std::string(test::dr_mehta), std::string(test::cardiology),
                         std::string(test::today), "09:45"};
    auto result = availability_->validate_slot_booking(test::cardiology_staff(), advance);
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().message, HasSubstr("reserved for walk-ins"));

    advance.walk_in = true;
    EXPECT_TRUE(availability_->validate_slot_booking(test::cardiology_staff(), advance));
}

TEST_F(AvailabilityServiceTest, NextAvailableSlot) {
    book(test::dr_rao, "pat-1", "09:00");
    book(test::dr_rao, "pat-2", "09:15");

    auto next = availability_->next_available_slot(test::cardiology_staff(), test::dr_rao,
                                                   test::cardiology, test::today, "08:00");
    ASSERT_TRUE(next.has_value());
    ASSERT_TRUE(next->has_value());
    EXPECT_EQ((*next)->start_time, "09:30");

    auto late = availability_->next_available_slot(test::cardiology_staff(), test::dr_rao,
                                                   test::cardiology, test::today, "10:40");
    ASSERT_TRUE(late.has_value());
    ASSERT_TRUE(late->has_value());
    EXPECT_EQ((*late)->start_time, "10:45");

    auto closed = availability_->next_available_slot(test::cardiology_staff(), test::dr_rao,
                                                     test::cardiology, test::today, "11:50");
    ASSERT_TRUE(closed.has_value());
    EXPECT_FALSE(closed->has_value());
}

}  // namespace
}  // namespace clinic::opd::scheduling
