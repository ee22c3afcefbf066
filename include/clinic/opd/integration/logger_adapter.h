#ifndef CLINIC_OPD_INTEGRATION_LOGGER_ADAPTER_H
#define CLINIC_OPD_INTEGRATION_LOGGER_ADAPTER_H

/**
 * @file logger_adapter.h
 * @brief Integration Module - Logger adapter
 *
 * Named, level-filtered logging for scheduler components. Output goes to
 * the console by default; when built with common_system, a process-wide
 * ILogger can be installed and every named logger forwards to it.
 */

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#ifdef CLINIC_OPD_HAS_COMMON_SYSTEM
namespace kcenon::common::interfaces {
class ILogger;
}
#endif

namespace clinic::opd::integration {

/**
 * @brief Log levels
 */
enum class log_level {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

[[nodiscard]] std::string_view to_string(log_level level) noexcept;

/**
 * @brief Parse "trace", "debug", "info", "warn"/"warning", "error",
 *        "critical"/"fatal" (case-insensitive)
 */
[[nodiscard]] std::optional<log_level> parse_log_level(std::string_view str);

/**
 * @brief Console line format
 */
enum class log_format {
    /** "2024-05-01 09:00:00.000 [INFO] [name] message" */
    text,

    /** One JSON object per line */
    json
};

/**
 * @brief Logger adapter interface
 */
class logger_adapter {
public:
    virtual ~logger_adapter() = default;

    virtual void log(log_level level, std::string_view message) = 0;

    void trace(std::string_view message) { log(log_level::trace, message); }
    void debug(std::string_view message) { log(log_level::debug, message); }
    void info(std::string_view message) { log(log_level::info, message); }
    void warning(std::string_view message) { log(log_level::warning, message); }
    void error(std::string_view message) { log(log_level::error, message); }
    void critical(std::string_view message) {
        log(log_level::critical, message);
    }

    virtual void set_level(log_level level) = 0;

    [[nodiscard]] virtual log_level get_level() const noexcept = 0;

    /**
     * @brief Check whether a message at @p level would be emitted
     */
    [[nodiscard]] bool is_enabled(log_level level) const noexcept {
        return static_cast<int>(level) >= static_cast<int>(get_level());
    }

    virtual void flush() = 0;
};

/**
 * @brief Get the process-wide default logger ("opd_scheduler")
 */
[[nodiscard]] logger_adapter& get_logger();

/**
 * @brief Create a named logger
 *
 * Uses the level and format set by configure_logging(). Forwards to the
 * installed ILogger when one is set.
 *
 * @param name Logger name/category shown in every line
 */
[[nodiscard]] std::unique_ptr<logger_adapter> create_logger(
    std::string_view name);

/**
 * @brief Set level and format for loggers created afterwards
 *
 * The default logger keeps its format once created; only its level follows.
 */
void configure_logging(log_level level, log_format format);

#ifdef CLINIC_OPD_HAS_COMMON_SYSTEM
/**
 * @brief Wrap an ILogger directly
 */
[[nodiscard]] std::unique_ptr<logger_adapter> create_logger(
    std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

/**
 * @brief Route the default logger and new named loggers to @p logger
 */
void set_default_logger(std::shared_ptr<kcenon::common::interfaces::ILogger> logger);

/**
 * @brief Restore console output
 */
void reset_default_logger();
#endif

}  // namespace clinic::opd::integration

#endif  // CLINIC_OPD_INTEGRATION_LOGGER_ADAPTER_H
