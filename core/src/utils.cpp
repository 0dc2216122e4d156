#include "utils.hpp"
#include "exceptions.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>
#include <string>
#include <cmath>
#include <cctype>
#include <ctime>

namespace core {
namespace utils {

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw DataException("Failed to parse timestamp (date/time part): " + iso_string);
        }

        // 2. Optional fractional seconds
        long long fraction_ns = 0;
        if (ss.peek() == '.') {
            ss.ignore();
            std::string digits;
            while (std::isdigit(ss.peek())) {
                char c = static_cast<char>(ss.get());
                if (digits.size() < 9) digits += c; // Nanosecond precision at most
            }
            if (!digits.empty()) {
                digits.append(9 - digits.size(), '0');
                fraction_ns = std::stoll(digits);
            }
        }

        // 3. Timezone offset (+HH:MM, -HH:MM, or Z)
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (!(ss >> sign_or_z)) {
            throw DataException("Timestamp missing timezone offset/indicator: " + iso_string);
        }
        if (sign_or_z == '+' || sign_or_z == '-') {
            int offset_h = 0;
            int offset_m = 0;
            char colon = ' ';
            if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                throw DataException("Failed to parse timestamp (timezone offset HH:MM): " + iso_string);
            }
            offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
            if (sign_or_z == '-') {
                offset_duration *= -1;
            }
        } else if (sign_or_z != 'Z') {
            throw DataException("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: " + iso_string);
        }

        // 4. timegm interprets struct tm as UTC; the offset is removed afterwards
        time_t tt = timegm(&tm);
        if (tt == static_cast<time_t>(-1)) {
            throw DataException("Failed to convert parsed date/time to UTC epoch seconds: " + iso_string);
        }

        Timestamp base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::nanoseconds(fraction_ns));

        // 2024-01-02T09:30:00+08:00 is 2024-01-02T01:30:00Z
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts, int utc_offset_minutes) {
        // Shift the UTC time point by the offset, then format the shifted fields as if they were UTC
        auto local_time_point = ts + std::chrono::minutes(utc_offset_minutes);
        auto tt_local = std::chrono::system_clock::to_time_t(local_time_point);

        std::tm time_tm;
        gmtime_r(&tt_local, &time_tm);

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S");

        int abs_offset = utc_offset_minutes < 0 ? -utc_offset_minutes : utc_offset_minutes;
        oss << (utc_offset_minutes < 0 ? '-' : '+')
            << std::setfill('0') << std::setw(2) << abs_offset / 60 << ':'
            << std::setfill('0') << std::setw(2) << abs_offset % 60;
        return oss.str();
    }

    Timestamp dateToTimestamp(const std::string& date, int utc_offset_minutes, bool end_of_day) {
        int abs_offset = utc_offset_minutes < 0 ? -utc_offset_minutes : utc_offset_minutes;
        std::ostringstream oss;
        oss << date << (end_of_day ? "T23:59:59" : "T00:00:00")
            << (utc_offset_minutes < 0 ? '-' : '+')
            << std::setfill('0') << std::setw(2) << abs_offset / 60 << ':'
            << std::setfill('0') << std::setw(2) << abs_offset % 60;
        return stringToTimestamp(oss.str());
    }

    long long dayIndex(const Timestamp& ts, int utc_offset_minutes) {
        auto local = ts.time_since_epoch() + std::chrono::minutes(utc_offset_minutes);
        auto minutes = std::chrono::duration_cast<std::chrono::minutes>(local).count();
        long long day = minutes / (24 * 60);
        if (minutes < 0 && minutes % (24 * 60) != 0) {
            --day; // Floor for pre-epoch times
        }
        return day;
    }

    double roundMoney(double amount) {
        return std::round(amount * 100.0) / 100.0;
    }

} // namespace utils
} // namespace core
