/**
 * @file timestamps.cpp
 * @brief Timestamp formatting and record id generation
 */

#include "clinic/opd/storage/timestamps.h"

#include <ctime>
#include <format>
#include <iomanip>
#include <random>
#include <sstream>

namespace clinic::opd::storage {

std::shared_ptr<const clock> default_clock() {
    static const auto instance = std::make_shared<system_clock_source>();
    return instance;
}

std::string to_timestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch())
                      .count() %
                  1000;
    if (millis < 0) {
        millis += 1000;
        --time_t_val;
    }

    std::tm tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

std::optional<std::chrono::system_clock::time_point>
parse_timestamp(std::string_view text) {
    if (text.size() < 19) {
        return std::nullopt;
    }

    std::tm tm_val{};
    std::istringstream iss{std::string(text)};
    iss >> std::get_time(&tm_val, "%Y-%m-%d %H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }

    int millis = 0;
    if (iss.peek() == '.') {
        iss.ignore();
        iss >> millis;
        if (iss.fail() || millis < 0 || millis > 999) {
            return std::nullopt;
        }
    }

    auto time_t_val = timegm(&tm_val);
    return std::chrono::system_clock::from_time_t(time_t_val) +
           std::chrono::milliseconds(millis);
}

std::string generate_record_id() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t high = dis(gen);
    uint64_t low = dis(gen);

    // Version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       high >> 32, (high >> 16) & 0xFFFF, high & 0xFFFF,
                       low >> 48, low & 0xFFFFFFFFFFFFULL);
}

}  // namespace clinic::opd::storage
