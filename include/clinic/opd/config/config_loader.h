#ifndef CLINIC_OPD_CONFIG_CONFIG_LOADER_H
#define CLINIC_OPD_CONFIG_CONFIG_LOADER_H

/**
 * @file config_loader.h
 * @brief Configuration file loader with YAML and JSON support
 *
 * Features:
 *   - Format detection by file extension (.yaml, .yml, .json)
 *   - Environment variable substitution
 *   - Validation with per-field error details
 *
 * Supported environment variable syntax:
 *   - ${VAR} - Required variable (error if not set)
 *   - ${VAR:-default} - Optional with default value
 *
 * Durations accept plain seconds or a unit suffix: "30s", "5m", "1h", "1d".
 *
 * @example
 * ```cpp
 * auto result = config_loader::load("/etc/opd/scheduler.yaml");
 * if (!result) {
 *     std::cerr << result.error().to_string() << std::endl;
 *     return 1;
 * }
 * ```
 */

#include "scheduler_config.h"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace clinic::opd::config {

/**
 * @brief Detailed error information from configuration loading
 */
struct config_load_error {
    config_error code;

    std::string message;

    std::optional<std::filesystem::path> file_path;

    std::optional<size_t> line_number;

    /** Populated when code is validation_error */
    std::vector<validation_error_info> validation_errors;

    /**
     * @brief Formatted message with location and validation details
     */
    [[nodiscard]] std::string to_string() const;
};

using config_result = std::expected<scheduler_config, config_load_error>;

/**
 * @brief Configuration file loader
 */
class config_loader {
public:
    /**
     * @brief Load configuration, detecting the format from the extension
     */
    [[nodiscard]] static config_result load(const std::filesystem::path& path);

    [[nodiscard]] static config_result load_yaml(const std::filesystem::path& path);

    [[nodiscard]] static config_result load_json(const std::filesystem::path& path);

    [[nodiscard]] static config_result load_yaml_string(std::string_view yaml_content);

    [[nodiscard]] static config_result load_json_string(std::string_view json_content);

    [[nodiscard]] static std::vector<validation_error_info> validate(
        const scheduler_config& config);

    /**
     * @brief Expand ${VAR} and ${VAR:-default} references
     */
    [[nodiscard]] static std::expected<std::string, config_load_error>
    expand_env_vars(std::string_view value);

    [[nodiscard]] static scheduler_config get_default_config();

    config_loader() = delete;
};

}  // namespace clinic::opd::config

#endif  // CLINIC_OPD_CONFIG_CONFIG_LOADER_H
