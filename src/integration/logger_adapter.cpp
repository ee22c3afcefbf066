/**
 * @file logger_adapter.cpp
 * @brief Console and ILogger-backed logger adapters
 *
 * @see include/clinic/opd/integration/logger_adapter.h
 */

#include "clinic/opd/integration/logger_adapter.h"

#ifdef CLINIC_OPD_HAS_COMMON_SYSTEM
#include <kcenon/common/interfaces/logger_interface.h>
#endif

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <format>
#include <iostream>
#include <mutex>

namespace clinic::opd::integration {

std::string_view to_string(log_level level) noexcept {
    switch (level) {
        case log_level::trace:
            return "TRACE";
        case log_level::debug:
            return "DEBUG";
        case log_level::info:
            return "INFO";
        case log_level::warning:
            return "WARN";
        case log_level::error:
            return "ERROR";
        case log_level::critical:
            return "CRIT";
    }
    return "UNKNOWN";
}

std::optional<log_level> parse_log_level(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return log_level::trace;
    if (lower == "debug") return log_level::debug;
    if (lower == "info") return log_level::info;
    if (lower == "warn" || lower == "warning") return log_level::warning;
    if (lower == "error") return log_level::error;
    if (lower == "critical" || lower == "fatal") return log_level::critical;
    return std::nullopt;
}

namespace {

/**
 * @brief "YYYY-MM-DD HH:MM:SS.mmm" in local time
 */
std::string format_now() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()) % 1000;

    std::tm tm_val{};
    localtime_r(&time, &tm_val);

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_val);
    return std::format("{}.{:03}", buffer, ms.count());
}

// Output serialization shared by every console logger
std::mutex g_console_mutex;

#ifdef CLINIC_OPD_HAS_COMMON_SYSTEM

namespace ci = kcenon::common::interfaces;

ci::log_level to_kcenon_level(log_level level) {
    switch (level) {
        case log_level::trace:
            return ci::log_level::trace;
        case log_level::debug:
            return ci::log_level::debug;
        case log_level::info:
            return ci::log_level::info;
        case log_level::warning:
            return ci::log_level::warning;
        case log_level::error:
            return ci::log_level::error;
        case log_level::critical:
            return ci::log_level::critical;
    }
    return ci::log_level::info;
}

log_level from_kcenon_level(ci::log_level level) {
    switch (level) {
        case ci::log_level::trace:
            return log_level::trace;
        case ci::log_level::debug:
            return log_level::debug;
        case ci::log_level::info:
            return log_level::info;
        case ci::log_level::warning:
            return log_level::warning;
        case ci::log_level::error:
            return log_level::error;
        case ci::log_level::critical:
        case ci::log_level::off:
            return log_level::critical;
        default:
            return log_level::info;
    }
}

#endif  // CLINIC_OPD_HAS_COMMON_SYSTEM

}  // namespace

// =============================================================================
// console_logger_adapter
// =============================================================================

/**
 * @class console_logger_adapter
 * @brief Thread-safe console logger; error and above go to stderr
 */
class console_logger_adapter : public logger_adapter {
public:
    console_logger_adapter(std::string_view name, log_level level, log_format format)
        : name_(name), current_level_(level), format_(format) {}

    void log(log_level level, std::string_view message) override {
        if (!is_enabled(level)) {
            return;
        }

        std::string line;
        if (format_ == log_format::json) {
            nlohmann::json entry = {
                {"timestamp", format_now()},
                {"level", std::string(to_string(level))},
                {"logger", name_},
                {"message", std::string(message)}};
            line = entry.dump();
        } else if (name_.empty()) {
            line = std::format("{} [{}] {}", format_now(), to_string(level),
                               message);
        } else {
            line = std::format("{} [{}] [{}] {}", format_now(),
                               to_string(level), name_, message);
        }

        std::lock_guard<std::mutex> lock(g_console_mutex);
        auto& stream = (level >= log_level::error) ? std::cerr : std::cout;
        stream << line << '\n';
    }

    void set_level(log_level level) override { current_level_ = level; }

    [[nodiscard]] log_level get_level() const noexcept override {
        return current_level_;
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(g_console_mutex);
        std::cout.flush();
        std::cerr.flush();
    }

private:
    std::string name_;
    log_level current_level_;
    log_format format_;
};

#ifdef CLINIC_OPD_HAS_COMMON_SYSTEM

// =============================================================================
// ilogger_adapter
// =============================================================================

/**
 * @class ilogger_adapter
 * @brief Forwards to a common_system ILogger, prefixing the logger name
 */
class ilogger_adapter : public logger_adapter {
public:
    ilogger_adapter(std::shared_ptr<ci::ILogger> logger, std::string_view name)
        : logger_(std::move(logger)), name_(name) {
        if (logger_) {
            current_level_ = from_kcenon_level(logger_->get_level());
        }
    }

    void log(log_level level, std::string_view message) override {
        if (!logger_ || !is_enabled(level)) {
            return;
        }

        std::string text = name_.empty()
                               ? std::string(message)
                               : std::format("[{}] {}", name_, message);
        (void)logger_->log(to_kcenon_level(level), text);
    }

    void set_level(log_level level) override {
        current_level_ = level;
        if (logger_) {
            (void)logger_->set_level(to_kcenon_level(level));
        }
    }

    [[nodiscard]] log_level get_level() const noexcept override {
        return current_level_;
    }

    void flush() override {
        if (logger_) {
            (void)logger_->flush();
        }
    }

private:
    std::shared_ptr<ci::ILogger> logger_;
    std::string name_;
    log_level current_level_{log_level::info};
};

#endif  // CLINIC_OPD_HAS_COMMON_SYSTEM

// =============================================================================
// Global Logger State
// =============================================================================

namespace {

constexpr std::string_view default_logger_name = "opd_scheduler";

std::mutex g_logger_mutex;
std::unique_ptr<logger_adapter> g_default_logger;
log_level g_level = log_level::info;
log_format g_format = log_format::text;

#ifdef CLINIC_OPD_HAS_COMMON_SYSTEM
std::shared_ptr<ci::ILogger> g_ilogger;
#endif

/** Must be called under g_logger_mutex */
std::unique_ptr<logger_adapter> make_logger_locked(std::string_view name) {
#ifdef CLINIC_OPD_HAS_COMMON_SYSTEM
    if (g_ilogger) {
        return std::make_unique<ilogger_adapter>(g_ilogger, name);
    }
#endif
    return std::make_unique<console_logger_adapter>(name, g_level, g_format);
}

}  // namespace

logger_adapter& get_logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);

    if (!g_default_logger) {
        g_default_logger = make_logger_locked(default_logger_name);
    }

    return *g_default_logger;
}

std::unique_ptr<logger_adapter> create_logger(std::string_view name) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    return make_logger_locked(name);
}

void configure_logging(log_level level, log_format format) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_level = level;
    g_format = format;
    if (g_default_logger) {
        g_default_logger->set_level(level);
    }
}

#ifdef CLINIC_OPD_HAS_COMMON_SYSTEM

std::unique_ptr<logger_adapter> create_logger(std::shared_ptr<ci::ILogger> logger) {
    return std::make_unique<ilogger_adapter>(std::move(logger), "");
}

void set_default_logger(std::shared_ptr<ci::ILogger> logger) {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_ilogger = std::move(logger);
    g_default_logger = make_logger_locked(default_logger_name);
}

void reset_default_logger() {
    std::lock_guard<std::mutex> lock(g_logger_mutex);
    g_ilogger.reset();
    g_default_logger.reset();
}

#endif  // CLINIC_OPD_HAS_COMMON_SYSTEM

}  // namespace clinic::opd::integration
