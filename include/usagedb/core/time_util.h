#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "usagedb/core/types.h"

namespace usagedb {
namespace core {

/**
 * @brief Proleptic Gregorian calendar date
 */
struct CivilDate {
    int64_t year;
    unsigned month;  // 1..12
    unsigned day;    // 1..31
};

// Calendar helpers. All of them work in UTC.
int64_t DaysFromCivil(int64_t year, unsigned month, unsigned day);
CivilDate CivilFromDays(int64_t days);
CivilDate CivilFromTimestamp(Timestamp ts);

// Day of week, 0 = Sunday
unsigned Weekday(Timestamp ts);

Timestamp StartOfHour(Timestamp ts);
Timestamp StartOfDay(Timestamp ts);
Timestamp StartOfWeek(Timestamp ts);  // Sunday 00:00
Timestamp StartOfMonth(Timestamp ts);
Timestamp AddMonths(Timestamp month_start, int months);

// "YYYY-MM-DD"
std::string FormatDate(Timestamp ts);
// "YYYY-MM"
std::string FormatMonth(Timestamp ts);
// "YYYY-MM-DDTHH:MM:SS.mmmZ"
std::string FormatIsoTimestamp(Timestamp ts);

// Strict parsers, std::nullopt on any deviation from the format
std::optional<Timestamp> ParseDate(const std::string& text);
std::optional<Timestamp> ParseMonth(const std::string& text);

} // namespace core
} // namespace usagedb
