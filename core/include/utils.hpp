#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Exchange local time used when none is configured (China A-share market, UTC+08:00)
    constexpr int kDefaultUtcOffsetMinutes = 8 * 60;

    // Tolerance used when comparing prices/ratios against thresholds
    constexpr double kEpsilon = 1e-9;

    // Convert Timestamp to ISO 8601 string rendered at the given UTC offset ("2024-01-02T15:00:00+08:00")
    std::string timestampToString(const Timestamp& ts, int utc_offset_minutes = kDefaultUtcOffsetMinutes);

    // Parse ISO 8601 string ("YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM)") to Timestamp
    Timestamp stringToTimestamp(const std::string& iso_string);

    // Parse "YYYY-MM-DD" as the start (or last second) of that local calendar day
    Timestamp dateToTimestamp(const std::string& date, int utc_offset_minutes, bool end_of_day = false);

    // Local calendar day number (days since epoch) of a timestamp; used for daily rollover
    long long dayIndex(const Timestamp& ts, int utc_offset_minutes);

    // Round a money amount to cents
    double roundMoney(double amount);

} // namespace utils
} // namespace core
