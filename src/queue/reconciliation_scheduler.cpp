/**
 * @file reconciliation_scheduler.cpp
 * @brief Worker thread driving rebuild_for_tenant() and cleanup()
 */

#include "clinic/opd/queue/reconciliation_scheduler.h"

#include "clinic/opd/integration/logger_adapter.h"

#include <atomic>
#include <condition_variable>
#include <format>
#include <mutex>
#include <thread>

namespace clinic::opd::queue {

class reconciliation_scheduler::impl {
public:
    impl(std::shared_ptr<queue_synchronizer> synchronizer,
         config::reconciliation_config config)
        : synchronizer_(std::move(synchronizer)),
          config_(config),
          logger_(integration::create_logger("reconciliation")) {}

    ~impl() { stop(); }

    void start() {
        std::lock_guard<std::mutex> control(control_mutex_);
        if (running_) {
            return;
        }
        running_ = true;
        worker_ = std::thread([this]() { run_loop(); });
        logger_->info(std::format("Reconciliation started (interval {}s)",
                                  config_.interval.count()));
    }

    void stop() {
        std::lock_guard<std::mutex> control(control_mutex_);
        if (!running_) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            running_ = false;
        }
        wait_cv_.notify_all();

        if (worker_.joinable()) {
            worker_.join();
        }
        logger_->info("Reconciliation stopped");
    }

    std::expected<reconciliation_report, queue_error> run_once() {
        std::lock_guard<std::mutex> pass(pass_mutex_);

        auto tenants = synchronizer_->list_tenants();
        if (!tenants) {
            logger_->error(std::format("Reconciliation could not list tenants: {}",
                                       to_string(tenants.error())));
            return std::unexpected(tenants.error());
        }

        reconciliation_report report;
        for (const auto& tenant : *tenants) {
            ++report.tenants;

            auto rebuilt = synchronizer_->rebuild_for_tenant(tenant);
            if (!rebuilt) {
                ++report.tenants_failed;
                logger_->error(std::format("Rebuild of tenant {} failed: {}", tenant,
                                           to_string(rebuilt.error())));
                continue;
            }
            report.synced += rebuilt->synced;
            report.stale_removed += rebuilt->stale_removed;
            report.failures_drained += rebuilt->failures_drained;

            auto cleaned = synchronizer_->cleanup(tenant, config_.snapshot_retention);
            if (!cleaned) {
                ++report.tenants_failed;
                logger_->error(std::format("Cleanup of tenant {} failed: {}", tenant,
                                           to_string(cleaned.error())));
                continue;
            }
            report.rows_cleaned += *cleaned;
        }

        ++passes_;
        logger_->debug(std::format(
            "Reconciliation pass: {} tenants, {} synced, {} stale, {} drained, {} cleaned",
            report.tenants, report.synced, report.stale_removed, report.failures_drained,
            report.rows_cleaned));
        return report;
    }

    bool is_running() const noexcept { return running_.load(); }

    std::size_t passes() const noexcept { return passes_.load(); }

private:
    void run_loop() {
        while (running_) {
            std::unique_lock<std::mutex> lock(wait_mutex_);
            wait_cv_.wait_for(lock, config_.interval,
                              [this]() { return !running_.load(); });
            if (!running_) {
                break;
            }
            lock.unlock();

            if (auto report = run_once(); !report) {
                logger_->warning("Reconciliation pass skipped");
            }
        }
    }

    std::shared_ptr<queue_synchronizer> synchronizer_;
    config::reconciliation_config config_;
    std::unique_ptr<integration::logger_adapter> logger_;

    std::atomic<bool> running_{false};
    std::atomic<std::size_t> passes_{0};
    std::thread worker_;

    std::mutex control_mutex_;
    std::mutex pass_mutex_;
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

reconciliation_scheduler::reconciliation_scheduler(
    std::shared_ptr<queue_synchronizer> synchronizer,
    config::reconciliation_config config)
    : pimpl_(std::make_unique<impl>(std::move(synchronizer), config)) {}

reconciliation_scheduler::~reconciliation_scheduler() = default;

void reconciliation_scheduler::start() {
    pimpl_->start();
}

void reconciliation_scheduler::stop() {
    pimpl_->stop();
}

bool reconciliation_scheduler::is_running() const noexcept {
    return pimpl_->is_running();
}

std::expected<reconciliation_report, queue_error> reconciliation_scheduler::run_once() {
    return pimpl_->run_once();
}

std::size_t reconciliation_scheduler::passes() const noexcept {
    return pimpl_->passes();
}

}  // namespace clinic::opd::queue
