#pragma once

#include <cstdint>
#include <string>

namespace DateTimeUtils {

struct CivilDateTime {
    int year = 1970;
    int month = 1;
    int day = 1;
    int hour = 0;
    int minute = 0;
    int second = 0;
};

/**
 * @brief Parses the fixed trip timestamp layout `YYYY-MM-DD HH:MM:SS`.
 * @post Returns false on any deviation from the layout or an impossible calendar date.
 */
bool parseTimestamp(const std::string& text, CivilDateTime& out);

int64_t toUnixSeconds(const CivilDateTime& dt);

// 0 = Monday ... 6 = Sunday
int dayOfWeek(const CivilDateTime& dt);
const char* dayName(int dayOfWeekIndex);

}
