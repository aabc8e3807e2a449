#include "utils.hpp"
#include "exceptions.hpp"
#include <iomanip>    // For std::put_time, std::get_time
#include <sstream>    // For std::istringstream
#include <string>
#include <cctype>     // For std::isdigit
#include <cmath>      // For std::pow
#include <ctime>

namespace core {
namespace utils {

    namespace {

        std::time_t toUtcEpoch(std::tm& tm) {
        #ifdef _WIN32
            return _mkgmtime(&tm);
        #else
            return timegm(&tm);
        #endif
        }

        std::tm toUtcTm(const Timestamp& ts) {
            auto tt = std::chrono::system_clock::to_time_t(ts);
            std::tm time_tm;
            #ifdef _WIN32
                gmtime_s(&time_tm, &tt);
            #else
                gmtime_r(&tt, &time_tm);
            #endif
            return time_tm;
        }

    } // end anonymous namespace

    Timestamp stringToTimestamp(const std::string& iso_string) {
        std::tm tm = {};
        std::istringstream ss(iso_string);

        // 1. Parse main date/time part up to seconds
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            throw ValidationException("Failed to parse timestamp (date/time part): '" + iso_string + "'");
        }

        // 2. Optional fractional seconds
        double fractional_seconds = 0.0;
        if (ss.peek() == '.') {
            ss.ignore(); // consume '.'
            std::string digits;
            while (std::isdigit(ss.peek()) && digits.size() < 9) {
                digits += static_cast<char>(ss.get());
            }
            while (std::isdigit(ss.peek())) {
                ss.ignore();
            }
            if (!digits.empty()) {
                fractional_seconds = std::stod(digits) / std::pow(10.0, static_cast<double>(digits.length()));
            }
        }

        // 3. Timezone offset (+HH:MM, -HH:MM, or Z)
        std::chrono::seconds offset_duration(0);
        char sign_or_z = 0;
        if (!(ss >> sign_or_z)) {
            throw ValidationException("Timestamp missing timezone offset/indicator: '" + iso_string + "'");
        }
        if (sign_or_z == 'Z') {
            offset_duration = std::chrono::seconds(0);
        } else if (sign_or_z == '+' || sign_or_z == '-') {
            int offset_h = 0;
            int offset_m = 0;
            char colon = ' ';
            if (!(ss >> std::setw(2) >> offset_h >> colon >> std::setw(2) >> offset_m) || colon != ':') {
                throw ValidationException("Failed to parse timestamp (timezone offset HH:MM): '" + iso_string + "'");
            }
            offset_duration = std::chrono::hours(offset_h) + std::chrono::minutes(offset_m);
            if (sign_or_z == '-') {
                offset_duration *= -1;
            }
        } else {
            throw ValidationException("Invalid timezone indicator '" + std::string(1, sign_or_z) + "' in timestamp: '" + iso_string + "'");
        }

        std::time_t tt = toUtcEpoch(tm);
        if (tt == static_cast<std::time_t>(-1)) {
            throw ValidationException("Failed to convert parsed date/time to UTC epoch seconds: '" + iso_string + "'");
        }

        auto base_tp_utc = std::chrono::system_clock::from_time_t(tt);
        base_tp_utc += std::chrono::duration_cast<std::chrono::system_clock::duration>(
            std::chrono::duration<double>(fractional_seconds));

        // 2024-03-01T20:00:00+01:00 is 19:00 UTC
        return base_tp_utc - offset_duration;
    }

    std::string timestampToString(const Timestamp& ts) {
        const std::tm time_tm = toUtcTm(ts);

        std::ostringstream oss;
        oss << std::put_time(&time_tm, "%Y-%m-%dT%H:%M:%S") << 'Z';
        return oss.str();
    }

    Timestamp parseDate(const std::string& date_string) {
        std::tm tm = {};
        std::istringstream ss(date_string);
        ss >> std::get_time(&tm, "%Y-%m-%d");
        if (ss.fail() || ss.peek() != std::char_traits<char>::eof()) {
            throw ValidationException("Malformed date (expected YYYY-MM-DD): '" + date_string + "'");
        }
        std::time_t tt = toUtcEpoch(tm);
        if (tt == static_cast<std::time_t>(-1)) {
            throw ValidationException("Date out of range: '" + date_string + "'");
        }
        return std::chrono::system_clock::from_time_t(tt);
    }

    int monthOf(const Timestamp& ts) {
        return toUtcTm(ts).tm_mon + 1;
    }

    long long daysBetween(const Timestamp& a, const Timestamp& b) {
        return std::chrono::duration_cast<std::chrono::hours>(b - a).count() / 24;
    }

} // namespace utils
} // namespace core
