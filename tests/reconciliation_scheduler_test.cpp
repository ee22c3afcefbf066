/**
 * @file reconciliation_scheduler_test.cpp
 * @brief Unit tests for periodic queue repair
 *
 * @see include/clinic/opd/queue/reconciliation_scheduler.h
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "clinic/opd/queue/reconciliation_scheduler.h"
#include "utils/scheduling_fixture.h"

#include <thread>

namespace clinic::opd::queue {
namespace {

using namespace ::testing;
using namespace std::chrono_literals;

class ReconciliationSchedulerTest : public test::scheduling_test {
protected:
    config::reconciliation_config config_{true, std::chrono::seconds{1},
                                          std::chrono::seconds{3600}};
};

TEST_F(ReconciliationSchedulerTest, RunOnceRepairsEveryTenant) {
    std::string visit_id = checked_in_visit("pat-1", "09:00");
    test::exec_sql(*adapter_, "DELETE FROM opd_queue_snapshots");

    reconciliation_scheduler scheduler(queue_, config_);
    auto report = scheduler.run_once();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->tenants, 1u);
    EXPECT_EQ(report->tenants_failed, 0u);
    EXPECT_EQ(report->synced, 1u);
    EXPECT_EQ(scheduler.passes(), 1u);

    EXPECT_EQ(test::query_int(*adapter_,
                              "SELECT COUNT(*) FROM opd_queue_snapshots WHERE visit_id = ?",
                              {visit_id}),
              1);
}

TEST_F(ReconciliationSchedulerTest, RunOnceCleansExpiredRows) {
    std::string visit_id = checked_in_visit("pat-1", "09:00");
    ASSERT_TRUE(appointments_->start_consultation(test::cardiology_staff(), visit_id));
    ASSERT_TRUE(appointments_->complete(test::cardiology_staff(), visit_id));

    // A terminal row the completion sync never removed
    test::exec_sql(*adapter_,
                   "INSERT INTO opd_queue_snapshots (visit_id, tenant_id, patient_id, "
                   "patient_uhid, patient_name, practitioner_id, practitioner_name, "
                   "department_id, department_name, visit_number, priority, priority_rank, "
                   "status, visit_type, check_in_time, visit_updated_at) "
                   "VALUES ('visit-orphan', 'tenant-a', 'pat-2', 'UHID-002', 'Patient 2', "
                   "'pr-rao', 'Dr. Rao', 'dept-cardiology', 'Cardiology', 1, 'NORMAL', 2, "
                   "'WAITING', 'OPD', '2025-01-06 07:00:00.000', '2025-01-06 07:00:00.000')");

    clock_->advance(2h);
    reconciliation_scheduler scheduler(queue_, config_);
    auto report = scheduler.run_once();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->stale_removed, 1u);
    EXPECT_EQ(test::query_int(*adapter_, "SELECT COUNT(*) FROM opd_queue_snapshots"), 0);
}

TEST_F(ReconciliationSchedulerTest, NothingToDo) {
    reconciliation_scheduler scheduler(queue_, config_);
    auto report = scheduler.run_once();
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ(report->tenants, 0u);
    EXPECT_EQ(scheduler.passes(), 1u);
}

TEST_F(ReconciliationSchedulerTest, StartAndStopAreIdempotent) {
    reconciliation_scheduler scheduler(queue_, config_);
    EXPECT_FALSE(scheduler.is_running());

    scheduler.start();
    scheduler.start();
    EXPECT_TRUE(scheduler.is_running());

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (scheduler.passes() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(20ms);
    }
    EXPECT_GE(scheduler.passes(), 1u);

    scheduler.stop();
    scheduler.stop();
    EXPECT_FALSE(scheduler.is_running());
}

TEST_F(ReconciliationSchedulerTest, DestructorStopsWorker) {
    auto scheduler = std::make_unique<reconciliation_scheduler>(queue_, config_);
    scheduler->start();
    EXPECT_NO_FATAL_FAILURE(scheduler.reset());
}

}  // namespace
}  // namespace clinic::opd::queue
