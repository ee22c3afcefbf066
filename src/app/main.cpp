/**
 * @file main.cpp
 * @brief OPD scheduler CLI executable entrypoint
 *
 * Opens the scheduler database, applies the schema and runs the queue
 * reconciliation loop until a shutdown signal arrives.
 *
 * Usage:
 *   opd_scheduler --config <path>             Run with configuration file
 *   opd_scheduler --config <path> --once      Run one reconciliation pass
 *   opd_scheduler --config <path> --rebuild <tenant>
 *   opd_scheduler --init-schema               Create tables and exit
 *   opd_scheduler --help | --version
 */

#include "clinic/opd/config/config_loader.h"
#include "clinic/opd/integration/database_adapter.h"
#include "clinic/opd/integration/logger_adapter.h"
#include "clinic/opd/queue/queue_synchronizer.h"
#include "clinic/opd/queue/reconciliation_scheduler.h"
#include "clinic/opd/security/rate_limiter.h"
#include "clinic/opd/storage/counter_store.h"
#include "clinic/opd/storage/schema.h"

#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>

namespace {

constexpr std::string_view VERSION = "0.1.0";
constexpr std::string_view PROGRAM_NAME = "opd_scheduler";

std::atomic<bool> g_shutdown_requested{false};
std::mutex g_shutdown_mutex;
std::condition_variable g_shutdown_cv;

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdown_requested.store(true, std::memory_order_release);
        g_shutdown_cv.notify_all();
    }
}

void print_version() {
    std::cout << PROGRAM_NAME << " version " << VERSION << "\n";
    std::cout << "OPD Scheduler - appointment booking and queue core\n";
}

void print_usage() {
    std::cout << "Usage: " << PROGRAM_NAME << " [OPTIONS]\n\n";
    std::cout << "OPD Scheduler - appointment booking and queue reconciliation\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config <path>    Path to configuration file (YAML/JSON)\n";
    std::cout << "      --init-schema      Create missing tables and exit\n";
    std::cout << "      --once             Run one reconciliation pass and exit\n";
    std::cout << "      --rebuild <tenant> Rebuild one tenant's queue snapshot and exit\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "  -v, --version          Show version information\n";
    std::cout << "\n";
    std::cout << "Without --config the built-in defaults are used.\n";
    std::cout << "\n";
    std::cout << "Signals:\n";
    std::cout << "  SIGINT  (Ctrl+C)    Graceful shutdown\n";
    std::cout << "  SIGTERM             Graceful shutdown\n";
}

struct cli_options {
    std::filesystem::path config_path;
    bool init_schema = false;
    bool once = false;
    std::string rebuild_tenant;
    bool show_help = false;
    bool show_version = false;
    bool valid = true;
    std::string error_message;
};

cli_options parse_args(int argc, char* argv[]) {
    cli_options opts;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
            return opts;
        }

        if (arg == "-v" || arg == "--version") {
            opts.show_version = true;
            return opts;
        }

        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                opts.valid = false;
                opts.error_message = "Missing argument for --config";
                return opts;
            }
            opts.config_path = argv[++i];
            continue;
        }

        if (arg == "--rebuild") {
            if (i + 1 >= argc) {
                opts.valid = false;
                opts.error_message = "Missing argument for --rebuild";
                return opts;
            }
            opts.rebuild_tenant = argv[++i];
            continue;
        }

        if (arg == "--init-schema") {
            opts.init_schema = true;
            continue;
        }

        if (arg == "--once") {
            opts.once = true;
            continue;
        }

        opts.valid = false;
        opts.error_message = "Unknown argument: " + std::string(arg);
        return opts;
    }

    return opts;
}

clinic::opd::integration::log_format parse_format(std::string_view format) {
    return format == "json" ? clinic::opd::integration::log_format::json
                            : clinic::opd::integration::log_format::text;
}

}  // namespace

int main(int argc, char* argv[]) {
    namespace opd = clinic::opd;

    auto opts = parse_args(argc, argv);

    if (!opts.valid) {
        std::cerr << "Error: " << opts.error_message << "\n\n";
        print_usage();
        return EXIT_FAILURE;
    }

    if (opts.show_version) {
        print_version();
        return EXIT_SUCCESS;
    }

    if (opts.show_help) {
        print_usage();
        return EXIT_SUCCESS;
    }

    opd::config::scheduler_config config = opd::config::config_loader::get_default_config();
    if (!opts.config_path.empty()) {
        if (!std::filesystem::exists(opts.config_path)) {
            std::cerr << "Error: Configuration file not found: " << opts.config_path << "\n";
            return EXIT_FAILURE;
        }
        auto loaded = opd::config::config_loader::load(opts.config_path);
        if (!loaded) {
            std::cerr << "Error: " << loaded.error().to_string() << "\n";
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    }

    opd::integration::configure_logging(config.logging.level,
                                        parse_format(config.logging.format));
    auto logger = opd::integration::create_logger(config.name);

    auto adapter = opd::integration::create_database_adapter(config.database);
    if (!adapter->is_healthy()) {
        std::cerr << "Error: Cannot open database " << config.database.database_path << "\n";
        return EXIT_FAILURE;
    }

    if (auto applied = opd::storage::apply_schema(*adapter); !applied) {
        std::cerr << "Error: Schema setup failed: "
                  << opd::integration::to_string(applied.error()) << "\n";
        return EXIT_FAILURE;
    }

    if (opts.init_schema) {
        std::cout << "Schema ready at " << config.database.database_path << "\n";
        return EXIT_SUCCESS;
    }

    auto counters = std::make_shared<opd::storage::counter_store>(adapter);
    auto limiter = std::make_shared<opd::security::rate_limiter>(config.rate_limits, counters);
    auto synchronizer = std::make_shared<opd::queue::queue_synchronizer>(
        adapter, config.pagination, limiter);

    if (!opts.rebuild_tenant.empty()) {
        auto report = synchronizer->rebuild_for_tenant(opts.rebuild_tenant);
        if (!report) {
            std::cerr << "Error: Rebuild failed: " << opd::queue::to_string(report.error())
                      << "\n";
            return EXIT_FAILURE;
        }
        std::cout << "Rebuilt queue of tenant " << opts.rebuild_tenant << ":\n";
        std::cout << "  Synced:           " << report->synced << "\n";
        std::cout << "  Stale removed:    " << report->stale_removed << "\n";
        std::cout << "  Failures drained: " << report->failures_drained << "\n";
        std::cout << "  Failed:           " << report->failed << "\n";
        return report->failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    opd::queue::reconciliation_scheduler scheduler(synchronizer, config.reconciliation);

    if (opts.once) {
        auto report = scheduler.run_once();
        if (!report) {
            std::cerr << "Error: Reconciliation failed: "
                      << opd::queue::to_string(report.error()) << "\n";
            return EXIT_FAILURE;
        }
        std::cout << "Reconciled " << report->tenants << " tenant(s), "
                  << report->synced << " synced, " << report->rows_cleaned
                  << " cleaned\n";
        return report->tenants_failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (config.reconciliation.enabled) {
        scheduler.start();
    } else {
        logger->warning("Queue reconciliation is disabled");
    }

    logger->info(std::string("OPD scheduler '") + config.name + "' started");
    std::cout << "Press Ctrl+C to shutdown...\n";

    {
        std::unique_lock<std::mutex> lock(g_shutdown_mutex);
        g_shutdown_cv.wait(lock, [] {
            return g_shutdown_requested.load(std::memory_order_acquire);
        });
    }

    std::cout << "\nShutdown signal received, stopping...\n";
    scheduler.stop();

    auto stats = synchronizer->get_statistics();
    std::cout << "Final statistics:\n";
    std::cout << "  Reconciliation passes: " << scheduler.passes() << "\n";
    std::cout << "  Snapshot syncs:        " << stats.syncs << "\n";
    std::cout << "  Sync failures:         " << stats.sync_failures << "\n";
    std::cout << "  Rows cleaned:          " << stats.rows_cleaned << "\n";

    logger->info("OPD scheduler stopped");
    return EXIT_SUCCESS;
}
