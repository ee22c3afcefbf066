/**
 * @file calendar.cpp
 * @brief Date and time-of-day helpers
 */

#include "clinic/opd/scheduling/calendar.h"

#include <charconv>
#include <format>

namespace clinic::opd::scheduling {

namespace {

bool parse_fixed(std::string_view text, std::size_t pos, std::size_t len, int& out) {
    if (pos + len > text.size()) {
        return false;
    }
    const char* first = text.data() + pos;
    const char* last = first + len;
    for (const char* p = first; p != last; ++p) {
        if (*p < '0' || *p > '9') {
            return false;
        }
    }
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

}  // namespace

std::optional<std::chrono::year_month_day> parse_date(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    int year = 0;
    int month = 0;
    int day = 0;
    if (!parse_fixed(text, 0, 4, year) || !parse_fixed(text, 5, 2, month) ||
        !parse_fixed(text, 8, 2, day)) {
        return std::nullopt;
    }

    std::chrono::year_month_day date{std::chrono::year{year},
                                     std::chrono::month{static_cast<unsigned>(month)},
                                     std::chrono::day{static_cast<unsigned>(day)}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

std::string format_date(std::chrono::year_month_day date) {
    return std::format("{:04}-{:02}-{:02}", static_cast<int>(date.year()),
                       static_cast<unsigned>(date.month()),
                       static_cast<unsigned>(date.day()));
}

std::optional<int> parse_time_of_day(std::string_view text) {
    if (text.size() != 5 || text[2] != ':') {
        return std::nullopt;
    }

    int hours = 0;
    int minutes = 0;
    if (!parse_fixed(text, 0, 2, hours) || !parse_fixed(text, 3, 2, minutes)) {
        return std::nullopt;
    }
    if (hours > 23 || minutes > 59) {
        return std::nullopt;
    }
    return hours * 60 + minutes;
}

std::string format_time_of_day(int minutes) {
    return std::format("{:02}:{:02}", minutes / 60, minutes % 60);
}

day_of_week weekday_of(std::chrono::year_month_day date) {
    // iso_encoding: Monday = 1 ... Sunday = 7
    std::chrono::weekday wd{std::chrono::sys_days{date}};
    return static_cast<day_of_week>(wd.iso_encoding() - 1);
}

std::chrono::year_month_day add_days(std::chrono::year_month_day date, int days) {
    return std::chrono::year_month_day{std::chrono::sys_days{date} +
                                       std::chrono::days{days}};
}

local_moment to_local(std::chrono::system_clock::time_point tp,
                      std::chrono::minutes utc_offset) {
    auto shifted = std::chrono::floor<std::chrono::minutes>(tp) + utc_offset;
    auto day = std::chrono::floor<std::chrono::days>(shifted);
    auto since_midnight =
        std::chrono::duration_cast<std::chrono::minutes>(shifted - day);

    return local_moment{std::chrono::year_month_day{day},
                        static_cast<int>(since_midnight.count())};
}

}  // namespace clinic::opd::scheduling
