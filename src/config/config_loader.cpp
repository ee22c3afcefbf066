/**
 * @file config_loader.cpp
 * @brief Configuration file loading and parsing
 *
 * YAML is read with a small parser for the indentation-based mapping
 * subset used by scheduler configuration files. JSON goes through
 * nlohmann::json and is flattened to the same dotted key paths.
 *
 * @see include/clinic/opd/config/config_loader.h
 */

#include "clinic/opd/config/config_loader.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <format>
#include <fstream>
#include <functional>
#include <map>
#include <sstream>

namespace clinic::opd::config {

namespace {

// =============================================================================
// Helper Functions
// =============================================================================

[[nodiscard]] config_load_error make_error(config_error code, std::string message) {
    return config_load_error{.code = code,
                             .message = std::move(message),
                             .file_path = std::nullopt,
                             .line_number = std::nullopt,
                             .validation_errors = {}};
}

[[nodiscard]] std::expected<std::string, config_load_error> read_file(
    const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        auto error = make_error(
            config_error::file_not_found,
            std::format("Configuration file not found: {}", path.string()));
        error.file_path = path;
        return std::unexpected(error);
    }

    std::ifstream file(path);
    if (!file) {
        auto error = make_error(config_error::io_error,
                                std::format("Failed to open file: {}", path.string()));
        error.file_path = path;
        return std::unexpected(error);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    if (file.bad()) {
        auto error = make_error(config_error::io_error,
                                std::format("Error reading file: {}", path.string()));
        error.file_path = path;
        return std::unexpected(error);
    }

    return buffer.str();
}

[[nodiscard]] std::string trim(std::string_view str) {
    auto start = str.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) return "";
    auto end = str.find_last_not_of(" \t\r\n");
    return std::string(str.substr(start, end - start + 1));
}

[[nodiscard]] std::string to_lower(std::string_view str) {
    std::string lower(str);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

[[nodiscard]] std::string unquote(std::string_view str) {
    if (str.length() >= 2) {
        if ((str.front() == '"' && str.back() == '"') ||
            (str.front() == '\'' && str.back() == '\'')) {
            return std::string(str.substr(1, str.length() - 2));
        }
    }
    return std::string(str);
}

/**
 * @brief Drop a trailing "# comment" outside quotes
 */
[[nodiscard]] std::string strip_comment(std::string_view str) {
    char quote = 0;
    for (size_t i = 0; i < str.size(); ++i) {
        char c = str[i];
        if (quote != 0) {
            if (c == quote) quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#' && (i == 0 || std::isspace(static_cast<unsigned char>(str[i - 1])))) {
            return trim(str.substr(0, i));
        }
    }
    return std::string(str);
}

[[nodiscard]] std::optional<bool> parse_bool(std::string_view str) {
    auto lower = to_lower(str);
    if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
        return true;
    }
    if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
        return false;
    }
    return std::nullopt;
}

[[nodiscard]] std::optional<int64_t> parse_int(std::string_view str) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc() || ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Parse duration value (e.g., "30s", "5m", "1h", "-330m")
 */
[[nodiscard]] std::optional<std::chrono::seconds> parse_duration(
    std::string_view str) {
    if (str.empty()) return std::nullopt;

    if (auto val = parse_int(str)) {
        return std::chrono::seconds(*val);
    }

    char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(str.back())));
    auto value = parse_int(str.substr(0, str.size() - 1));
    if (!value) return std::nullopt;

    switch (unit) {
        case 's':
            return std::chrono::seconds(*value);
        case 'm':
            return std::chrono::seconds(*value * 60);
        case 'h':
            return std::chrono::seconds(*value * 3600);
        case 'd':
            return std::chrono::seconds(*value * 86400);
        default:
            return std::nullopt;
    }
}

// =============================================================================
// Simple YAML Parser (subset)
// =============================================================================

/**
 * @brief Indentation-based mapping parser
 *
 * Flattens nested mappings into dotted key paths ("a.b.c" -> value).
 * Sequences, anchors and multi-line scalars are not part of the
 * configuration format and are rejected.
 */
class simple_yaml_parser {
public:
    struct parse_result {
        std::map<std::string, std::string> flat_values;
        size_t error_line = 0;
        std::string error_message;
        bool success = true;
    };

    [[nodiscard]] static parse_result parse(std::string_view content) {
        parse_result result;
        // (indent, key) of each open section
        std::vector<std::pair<int, std::string>> path_stack;
        size_t line_number = 0;

        std::istringstream stream{std::string{content}};
        std::string line;

        while (std::getline(stream, line)) {
            ++line_number;

            auto trimmed = strip_comment(trim(line));
            if (trimmed.empty()) {
                continue;
            }

            int indent = 0;
            for (char c : line) {
                if (c == ' ')
                    indent++;
                else if (c == '\t')
                    indent += 2;
                else
                    break;
            }

            while (!path_stack.empty() && indent <= path_stack.back().first) {
                path_stack.pop_back();
            }

            if (trimmed.starts_with("- ") || trimmed == "-") {
                return fail(result, line_number, "Sequences are not supported");
            }

            auto colon_pos = trimmed.find(':');
            if (colon_pos == std::string::npos) {
                return fail(result, line_number, "Invalid YAML syntax: missing colon");
            }

            auto key = unquote(trim(trimmed.substr(0, colon_pos)));
            auto value = trim(trimmed.substr(colon_pos + 1));
            if (key.empty()) {
                return fail(result, line_number, "Invalid YAML syntax: empty key");
            }

            if (value.empty()) {
                path_stack.emplace_back(indent, key);
            } else {
                auto full_path = build_path(path_stack);
                if (!full_path.empty()) full_path += ".";
                full_path += key;
                result.flat_values[full_path] = unquote(value);
            }
        }

        return result;
    }

private:
    [[nodiscard]] static parse_result fail(parse_result& result, size_t line,
                                           std::string message) {
        result.success = false;
        result.error_line = line;
        result.error_message = std::move(message);
        return result;
    }

    [[nodiscard]] static std::string build_path(
        const std::vector<std::pair<int, std::string>>& stack) {
        std::string path;
        for (const auto& [indent, part] : stack) {
            if (!path.empty()) path += ".";
            path += part;
        }
        return path;
    }
};

// =============================================================================
// Value Application
// =============================================================================

using value_setter =
    std::function<bool(scheduler_config&, const std::string&)>;

template <typename T>
value_setter size_setter(T scheduler_config::*section, size_t T::*field) {
    return [section, field](scheduler_config& config, const std::string& val) {
        auto v = parse_int(val);
        if (!v || *v < 0) return false;
        (config.*section).*field = static_cast<size_t>(*v);
        return true;
    };
}

template <typename T>
value_setter seconds_setter(T scheduler_config::*section,
                            std::chrono::seconds T::*field) {
    return [section, field](scheduler_config& config, const std::string& val) {
        auto v = parse_duration(val);
        if (!v) return false;
        (config.*section).*field = *v;
        return true;
    };
}

template <typename T>
value_setter bool_setter(T scheduler_config::*section, bool T::*field) {
    return [section, field](scheduler_config& config, const std::string& val) {
        auto v = parse_bool(val);
        if (!v) return false;
        (config.*section).*field = *v;
        return true;
    };
}

value_setter rule_setter(rate_limit_rule rate_limit_config::*rule, bool window) {
    return [rule, window](scheduler_config& config, const std::string& val) {
        auto& target = config.rate_limits.*rule;
        if (window) {
            auto v = parse_duration(val);
            if (!v) return false;
            target.window = *v;
        } else {
            auto v = parse_int(val);
            if (!v || *v < 0) return false;
            target.max_requests = static_cast<size_t>(*v);
        }
        return true;
    };
}

[[nodiscard]] const std::map<std::string, value_setter>& setters() {
    static const std::map<std::string, value_setter> table = {
        {"name",
         [](scheduler_config& c, const std::string& v) {
             c.name = v;
             return true;
         }},
        {"database.path",
         [](scheduler_config& c, const std::string& v) {
             c.database.database_path = v;
             return true;
         }},
        {"database.pool_size",
         [](scheduler_config& c, const std::string& v) {
             auto n = parse_int(v);
             if (!n || *n <= 0) return false;
             c.database.pool_size = static_cast<size_t>(*n);
             return true;
         }},
        {"database.busy_timeout_ms",
         [](scheduler_config& c, const std::string& v) {
             auto n = parse_int(v);
             if (!n) return false;
             c.database.busy_timeout_ms = static_cast<int>(*n);
             return true;
         }},
        {"database.enable_wal",
         [](scheduler_config& c, const std::string& v) {
             auto b = parse_bool(v);
             if (!b) return false;
             c.database.enable_wal = *b;
             return true;
         }},
        {"pagination.default_limit",
         size_setter(&scheduler_config::pagination, &pagination_config::default_limit)},
        {"pagination.max_limit",
         size_setter(&scheduler_config::pagination, &pagination_config::max_limit)},
        {"booking.utc_offset",
         [](scheduler_config& c, const std::string& v) {
             auto d = parse_duration(v);
             if (!d) return false;
             c.booking.utc_offset =
                 std::chrono::duration_cast<std::chrono::minutes>(*d);
             return true;
         }},
        {"booking.max_advance_days",
         [](scheduler_config& c, const std::string& v) {
             auto n = parse_int(v);
             if (!n) return false;
             c.booking.max_advance_days = static_cast<int>(*n);
             return true;
         }},
        {"booking.default_slot_duration",
         [](scheduler_config& c, const std::string& v) {
             // Plain numbers are minutes here
             auto n = parse_int(v);
             if (n) {
                 c.booking.default_slot_duration_minutes = static_cast<int>(*n);
                 return true;
             }
             auto d = parse_duration(v);
             if (!d) return false;
             c.booking.default_slot_duration_minutes =
                 static_cast<int>(d->count() / 60);
             return true;
         }},
        {"booking.max_cancel_reason_length",
         size_setter(&scheduler_config::booking,
                     &booking_config::max_cancel_reason_length)},
        {"reconciliation.enabled",
         bool_setter(&scheduler_config::reconciliation,
                     &reconciliation_config::enabled)},
        {"reconciliation.interval",
         seconds_setter(&scheduler_config::reconciliation,
                        &reconciliation_config::interval)},
        {"reconciliation.snapshot_retention",
         seconds_setter(&scheduler_config::reconciliation,
                        &reconciliation_config::snapshot_retention)},
        {"rate_limits.enabled",
         bool_setter(&scheduler_config::rate_limits, &rate_limit_config::enabled)},
        {"rate_limits.booking.max_requests",
         rule_setter(&rate_limit_config::booking, false)},
        {"rate_limits.booking.window",
         rule_setter(&rate_limit_config::booking, true)},
        {"rate_limits.queue_read.max_requests",
         rule_setter(&rate_limit_config::queue_read, false)},
        {"rate_limits.queue_read.window",
         rule_setter(&rate_limit_config::queue_read, true)},
        {"logging.level",
         [](scheduler_config& c, const std::string& v) {
             auto level = integration::parse_log_level(v);
             if (!level) return false;
             c.logging.level = *level;
             return true;
         }},
        {"logging.format",
         [](scheduler_config& c, const std::string& v) {
             c.logging.format = to_lower(v);
             return true;
         }},
    };
    return table;
}

/**
 * @brief Apply flattened key paths, expand env vars, then validate
 */
[[nodiscard]] config_result apply_values(
    const std::map<std::string, std::string>& values) {
    scheduler_config config;
    const auto& table = setters();

    for (const auto& [key, value] : values) {
        auto it = table.find(key);
        if (it == table.end()) {
            // Unknown keys are tolerated for forward compatibility
            continue;
        }

        auto expanded = config_loader::expand_env_vars(value);
        if (!expanded) {
            return std::unexpected(expanded.error());
        }

        if (!it->second(config, *expanded)) {
            return std::unexpected(make_error(
                config_error::invalid_value,
                std::format("Invalid value for '{}': {}", key, *expanded)));
        }
    }

    auto errors = config.validate();
    if (!errors.empty()) {
        auto error = make_error(config_error::validation_error,
                                "Configuration validation failed");
        error.validation_errors = std::move(errors);
        return std::unexpected(error);
    }

    return config;
}

[[nodiscard]] config_result with_file_path(config_result result,
                                           const std::filesystem::path& path) {
    if (!result) {
        auto error = result.error();
        error.file_path = path;
        return std::unexpected(error);
    }
    return result;
}

}  // namespace

// =============================================================================
// config_load_error Implementation
// =============================================================================

std::string config_load_error::to_string() const {
    std::string result = message;

    if (file_path) {
        result += " (file: " + file_path->string() + ")";
    }
    if (line_number) {
        result += " at line " + std::to_string(*line_number);
    }

    if (!validation_errors.empty()) {
        result += "\nValidation errors:";
        for (const auto& err : validation_errors) {
            result += "\n  - " + err.field_path + ": " + err.message;
            if (err.actual_value) {
                result += " (got: " + *err.actual_value + ")";
            }
            if (err.expected) {
                result += " (expected: " + *err.expected + ")";
            }
        }
    }

    return result;
}

// =============================================================================
// config_loader Implementation
// =============================================================================

config_result config_loader::load(const std::filesystem::path& path) {
    auto ext = to_lower(path.extension().string());

    if (ext == ".yaml" || ext == ".yml") {
        return load_yaml(path);
    }
    if (ext == ".json") {
        return load_json(path);
    }

    auto error = make_error(
        config_error::invalid_format,
        std::format("Unknown configuration file format: {}. Use .yaml, .yml, or .json",
                    ext));
    error.file_path = path;
    return std::unexpected(error);
}

config_result config_loader::load_yaml(const std::filesystem::path& path) {
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }
    return with_file_path(load_yaml_string(*content), path);
}

config_result config_loader::load_json(const std::filesystem::path& path) {
    auto content = read_file(path);
    if (!content) {
        return std::unexpected(content.error());
    }
    return with_file_path(load_json_string(*content), path);
}

config_result config_loader::load_yaml_string(std::string_view yaml_content) {
    if (trim(yaml_content).empty()) {
        return std::unexpected(make_error(config_error::empty_config,
                                          "Configuration content is empty"));
    }

    auto parsed = simple_yaml_parser::parse(yaml_content);
    if (!parsed.success) {
        auto error = make_error(config_error::parse_error, parsed.error_message);
        error.line_number = parsed.error_line;
        return std::unexpected(error);
    }

    return apply_values(parsed.flat_values);
}

config_result config_loader::load_json_string(std::string_view json_content) {
    if (trim(json_content).empty()) {
        return std::unexpected(make_error(config_error::empty_config,
                                          "Configuration content is empty"));
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(json_content.begin(), json_content.end());
    } catch (const nlohmann::json::parse_error& e) {
        auto error = make_error(config_error::parse_error, e.what());
        error.line_number = std::nullopt;
        return std::unexpected(error);
    }

    if (!document.is_object()) {
        return std::unexpected(make_error(config_error::parse_error,
                                          "Top-level JSON value must be an object"));
    }

    // "/a/b" pointer paths become "a.b"
    std::map<std::string, std::string> values;
    for (const auto& [pointer, value] : document.flatten().items()) {
        std::string key = pointer.substr(1);
        std::replace(key.begin(), key.end(), '/', '.');
        values[key] = value.is_string() ? value.get<std::string>() : value.dump();
    }

    return apply_values(values);
}

std::vector<validation_error_info> config_loader::validate(
    const scheduler_config& config) {
    return config.validate();
}

std::expected<std::string, config_load_error> config_loader::expand_env_vars(
    std::string_view value) {
    std::string result;
    result.reserve(value.size());

    size_t pos = 0;
    while (pos < value.size()) {
        if (value[pos] == '$' && pos + 1 < value.size() &&
            value[pos + 1] == '{') {
            size_t end = value.find('}', pos + 2);
            if (end == std::string_view::npos) {
                return std::unexpected(make_error(
                    config_error::parse_error,
                    "Unclosed environment variable reference"));
            }

            std::string_view ref = value.substr(pos + 2, end - pos - 2);
            std::string var_name;
            std::optional<std::string> default_value;

            if (auto colon_pos = ref.find(":-"); colon_pos != std::string_view::npos) {
                var_name = std::string(ref.substr(0, colon_pos));
                default_value = std::string(ref.substr(colon_pos + 2));
            } else {
                var_name = std::string(ref);
            }

            const char* env_val = std::getenv(var_name.c_str());
            if (env_val != nullptr) {
                result += env_val;
            } else if (default_value) {
                result += *default_value;
            } else {
                return std::unexpected(make_error(
                    config_error::env_var_not_found,
                    std::format("Environment variable '{}' not found", var_name)));
            }

            pos = end + 1;
        } else {
            result += value[pos++];
        }
    }

    return result;
}

scheduler_config config_loader::get_default_config() {
    return scheduler_config{};
}

}  // namespace clinic::opd::config
