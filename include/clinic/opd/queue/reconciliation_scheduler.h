#ifndef CLINIC_OPD_QUEUE_RECONCILIATION_SCHEDULER_H
#define CLINIC_OPD_QUEUE_RECONCILIATION_SCHEDULER_H

/**
 * @file reconciliation_scheduler.h
 * @brief Periodic queue snapshot repair
 *
 * Every interval, each tenant known to the synchronizer is rebuilt and its
 * expired snapshot rows are cleaned up. A failing tenant is logged and does
 * not stop the pass.
 */

#include "clinic/opd/config/scheduler_config.h"
#include "clinic/opd/queue/queue_synchronizer.h"

#include <cstddef>
#include <expected>
#include <memory>

namespace clinic::opd::queue {

/**
 * @brief Totals of one reconciliation pass
 */
struct reconciliation_report {
    std::size_t tenants = 0;
    std::size_t tenants_failed = 0;
    std::size_t synced = 0;
    std::size_t stale_removed = 0;
    std::size_t failures_drained = 0;
    std::size_t rows_cleaned = 0;
};

class reconciliation_scheduler {
public:
    reconciliation_scheduler(std::shared_ptr<queue_synchronizer> synchronizer,
                             config::reconciliation_config config);

    ~reconciliation_scheduler();

    reconciliation_scheduler(const reconciliation_scheduler&) = delete;
    reconciliation_scheduler& operator=(const reconciliation_scheduler&) = delete;

    /**
     * @brief Start the worker thread; no-op when already running
     */
    void start();

    /**
     * @brief Stop and join the worker; no-op when not running
     */
    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Run one pass on the calling thread
     *
     * Fails only when the tenant list cannot be read.
     */
    [[nodiscard]] std::expected<reconciliation_report, queue_error> run_once();

    /** Completed passes since construction */
    [[nodiscard]] std::size_t passes() const noexcept;

private:
    class impl;
    std::unique_ptr<impl> pimpl_;
};

}  // namespace clinic::opd::queue

#endif  // CLINIC_OPD_QUEUE_RECONCILIATION_SCHEDULER_H
