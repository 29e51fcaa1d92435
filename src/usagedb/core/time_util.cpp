#include "usagedb/core/time_util.h"

#include <cctype>
#include <cstdio>

namespace usagedb {
namespace core {

namespace {

int64_t FloorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

bool IsLeap(int64_t year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned DaysInMonth(int64_t year, unsigned month) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && IsLeap(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool ParseDigits(const std::string& text, size_t pos, size_t count, int64_t& out) {
    if (pos + count > text.size()) {
        return false;
    }
    int64_t value = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

} // namespace

// Howard Hinnant's days_from_civil / civil_from_days
int64_t DaysFromCivil(int64_t year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

CivilDate CivilFromDays(int64_t days) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return CivilDate{m <= 2 ? y + 1 : y, m, d};
}

CivilDate CivilFromTimestamp(Timestamp ts) {
    return CivilFromDays(FloorDiv(ts, kMillisPerDay));
}

unsigned Weekday(Timestamp ts) {
    int64_t days = FloorDiv(ts, kMillisPerDay);
    // 1970-01-01 was a Thursday
    int64_t wd = (days + 4) % 7;
    if (wd < 0) {
        wd += 7;
    }
    return static_cast<unsigned>(wd);
}

Timestamp StartOfHour(Timestamp ts) {
    return FloorDiv(ts, kMillisPerHour) * kMillisPerHour;
}

Timestamp StartOfDay(Timestamp ts) {
    return FloorDiv(ts, kMillisPerDay) * kMillisPerDay;
}

Timestamp StartOfWeek(Timestamp ts) {
    return StartOfDay(ts) - static_cast<int64_t>(Weekday(ts)) * kMillisPerDay;
}

Timestamp StartOfMonth(Timestamp ts) {
    CivilDate date = CivilFromTimestamp(ts);
    return DaysFromCivil(date.year, date.month, 1) * kMillisPerDay;
}

Timestamp AddMonths(Timestamp month_start, int months) {
    CivilDate date = CivilFromTimestamp(month_start);
    int64_t index = date.year * 12 + static_cast<int64_t>(date.month) - 1 + months;
    int64_t year = FloorDiv(index, 12);
    unsigned month = static_cast<unsigned>(index - year * 12) + 1;
    unsigned day = date.day;
    if (day > DaysInMonth(year, month)) {
        day = DaysInMonth(year, month);
    }
    Timestamp time_of_day = month_start - StartOfDay(month_start);
    return DaysFromCivil(year, month, day) * kMillisPerDay + time_of_day;
}

std::string FormatDate(Timestamp ts) {
    CivilDate date = CivilFromTimestamp(ts);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u",
                  static_cast<long long>(date.year), date.month, date.day);
    return buf;
}

std::string FormatMonth(Timestamp ts) {
    CivilDate date = CivilFromTimestamp(ts);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u",
                  static_cast<long long>(date.year), date.month);
    return buf;
}

std::string FormatIsoTimestamp(Timestamp ts) {
    Timestamp day_start = StartOfDay(ts);
    int64_t ms_of_day = ts - day_start;
    char buf[48];
    std::snprintf(buf, sizeof(buf), "%sT%02lld:%02lld:%02lld.%03lldZ",
                  FormatDate(ts).c_str(),
                  static_cast<long long>(ms_of_day / kMillisPerHour),
                  static_cast<long long>((ms_of_day / kMillisPerMinute) % 60),
                  static_cast<long long>((ms_of_day / kMillisPerSecond) % 60),
                  static_cast<long long>(ms_of_day % 1000));
    return buf;
}

std::optional<Timestamp> ParseDate(const std::string& text) {
    int64_t year = 0, month = 0, day = 0;
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    if (!ParseDigits(text, 0, 4, year) || !ParseDigits(text, 5, 2, month) ||
        !ParseDigits(text, 8, 2, day)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 ||
        day > DaysInMonth(year, static_cast<unsigned>(month))) {
        return std::nullopt;
    }
    return DaysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day)) * kMillisPerDay;
}

std::optional<Timestamp> ParseMonth(const std::string& text) {
    int64_t year = 0, month = 0;
    if (text.size() != 7 || text[4] != '-') {
        return std::nullopt;
    }
    if (!ParseDigits(text, 0, 4, year) || !ParseDigits(text, 5, 2, month)) {
        return std::nullopt;
    }
    if (month < 1 || month > 12) {
        return std::nullopt;
    }
    return DaysFromCivil(year, static_cast<unsigned>(month), 1) * kMillisPerDay;
}

} // namespace core
} // namespace usagedb
