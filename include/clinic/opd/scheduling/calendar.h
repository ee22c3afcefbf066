#ifndef CLINIC_OPD_SCHEDULING_CALENDAR_H
#define CLINIC_OPD_SCHEDULING_CALENDAR_H

/**
 * @file calendar.h
 * @brief Calendar dates, times of day and the hospital's local day
 */

#include "clinic/opd/scheduling/scheduling_types.h"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace clinic::opd::scheduling {

/**
 * @brief Parse a strict "YYYY-MM-DD" calendar date
 */
[[nodiscard]] std::optional<std::chrono::year_month_day> parse_date(std::string_view text);

[[nodiscard]] std::string format_date(std::chrono::year_month_day date);

/**
 * @brief Parse a strict "HH:MM" time of day
 * @return Minutes since midnight
 */
[[nodiscard]] std::optional<int> parse_time_of_day(std::string_view text);

/**
 * @brief Format minutes since midnight as "HH:MM"
 */
[[nodiscard]] std::string format_time_of_day(int minutes);

[[nodiscard]] day_of_week weekday_of(std::chrono::year_month_day date);

[[nodiscard]] std::chrono::year_month_day add_days(std::chrono::year_month_day date,
                                                   int days);

/**
 * @brief Wall-clock instant seen from a fixed UTC offset
 */
struct local_moment {
    std::chrono::year_month_day date;

    /** Minutes since local midnight */
    int minutes = 0;
};

[[nodiscard]] local_moment to_local(std::chrono::system_clock::time_point tp,
                                    std::chrono::minutes utc_offset);

}  // namespace clinic::opd::scheduling

#endif  // CLINIC_OPD_SCHEDULING_CALENDAR_H
