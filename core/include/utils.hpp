#pragma once

#include "datatypes.hpp"
#include <string>
#include <chrono>

namespace core {
namespace utils {

    // Timestamp -> ISO 8601 UTC string ("YYYY-MM-DDTHH:MM:SSZ"), sortable as text
    std::string timestampToString(const Timestamp& ts);

    // ISO 8601 string with 'Z' or +HH:MM offset -> Timestamp. Throws ValidationException.
    Timestamp stringToTimestamp(const std::string& iso_string);

    // "YYYY-MM-DD" -> midnight UTC. Throws ValidationException.
    Timestamp parseDate(const std::string& date_string);

    // Calendar month (1-12) in UTC
    int monthOf(const Timestamp& ts);

    // Whole days between two timestamps (b - a), negative if b is earlier
    long long daysBetween(const Timestamp& a, const Timestamp& b);

} // namespace utils
} // namespace core
