#ifndef CLINIC_OPD_STORAGE_TIMESTAMPS_H
#define CLINIC_OPD_STORAGE_TIMESTAMPS_H

/**
 * @file timestamps.h
 * @brief Time source, stored timestamp format and record ids
 *
 * Timestamps are stored as UTC text "YYYY-MM-DD HH:MM:SS.mmm", which
 * sorts lexicographically in time order.
 */

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace clinic::opd::storage {

/**
 * @brief Injectable time source
 */
class clock {
public:
    virtual ~clock() = default;

    [[nodiscard]] virtual std::chrono::system_clock::time_point now() const = 0;
};

/**
 * @brief Wall clock
 */
class system_clock_source : public clock {
public:
    [[nodiscard]] std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }
};

/**
 * @brief Shared wall clock instance
 */
[[nodiscard]] std::shared_ptr<const clock> default_clock();

/**
 * @brief Format as "YYYY-MM-DD HH:MM:SS.mmm" (UTC)
 */
[[nodiscard]] std::string to_timestamp(std::chrono::system_clock::time_point tp);

/**
 * @brief Parse a value produced by to_timestamp()
 *
 * Milliseconds are optional.
 */
[[nodiscard]] std::optional<std::chrono::system_clock::time_point>
parse_timestamp(std::string_view text);

/**
 * @brief Random 128-bit id in canonical UUID text form (version 4)
 */
[[nodiscard]] std::string generate_record_id();

}  // namespace clinic::opd::storage

#endif  // CLINIC_OPD_STORAGE_TIMESTAMPS_H
