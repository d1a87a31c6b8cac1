#include "DateTimeUtils.h"

#include "CommonUtils.h"

namespace DateTimeUtils {
namespace {
bool parseFixedInt(const std::string& s, size_t pos, size_t len, int& out) {
    if (pos + len > s.size()) return false;
    int value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        const char c = s[i];
        if (c < '0' || c > '9') return false;
        value = value * 10 + (c - '0');
    }
    out = value;
    return true;
}

bool isLeapYear(int year) {
    if (year % 400 == 0) return true;
    if (year % 100 == 0) return false;
    return (year % 4 == 0);
}

int daysInMonth(int year, int month) {
    static const int kMonthDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) return isLeapYear(year) ? 29 : 28;
    return kMonthDays[month - 1];
}

int64_t daysFromCivil(int y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const int mp = static_cast<int>(m) + (m > 2 ? -3 : 9);
    const unsigned doy = (153 * static_cast<unsigned>(mp) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return static_cast<int64_t>(era) * 146097 + static_cast<int64_t>(doe) - 719468;
}
}

bool parseTimestamp(const std::string& text, CivilDateTime& out) {
    const std::string s = CommonUtils::trim(text);
    if (s.size() != 19) return false;
    if (s[4] != '-' || s[7] != '-' || s[10] != ' ' || s[13] != ':' || s[16] != ':') return false;

    CivilDateTime dt;
    if (!parseFixedInt(s, 0, 4, dt.year) ||
        !parseFixedInt(s, 5, 2, dt.month) ||
        !parseFixedInt(s, 8, 2, dt.day) ||
        !parseFixedInt(s, 11, 2, dt.hour) ||
        !parseFixedInt(s, 14, 2, dt.minute) ||
        !parseFixedInt(s, 17, 2, dt.second)) {
        return false;
    }

    if (dt.month < 1 || dt.month > 12) return false;
    if (dt.day < 1 || dt.day > daysInMonth(dt.year, dt.month)) return false;
    if (dt.hour > 23 || dt.minute > 59 || dt.second > 59) return false;

    out = dt;
    return true;
}

int64_t toUnixSeconds(const CivilDateTime& dt) {
    const int64_t days = daysFromCivil(dt.year, static_cast<unsigned>(dt.month), static_cast<unsigned>(dt.day));
    return days * 86400 + static_cast<int64_t>(dt.hour) * 3600 + static_cast<int64_t>(dt.minute) * 60 + dt.second;
}

int dayOfWeek(const CivilDateTime& dt) {
    const int64_t days = daysFromCivil(dt.year, static_cast<unsigned>(dt.month), static_cast<unsigned>(dt.day));
    // 1970-01-01 was a Thursday (index 3).
    const int64_t idx = (days % 7 + 7 + 3) % 7;
    return static_cast<int>(idx);
}

const char* dayName(int dayOfWeekIndex) {
    static const char* kNames[7] = {"Monday", "Tuesday", "Wednesday", "Thursday", "Friday", "Saturday", "Sunday"};
    if (dayOfWeekIndex < 0 || dayOfWeekIndex > 6) return "Unknown";
    return kNames[dayOfWeekIndex];
}

}
