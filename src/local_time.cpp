#include "local_time.h"

#include <stdlib.h>

void configureTimeZone(const char* posixTz) {
    setenv("TZ", posixTz, 1);
    tzset();
}

bool toLocalTime(time_t utc, struct tm& local) {
    return localtime_r(&utc, &local) != nullptr;
}

time_t fromLocalTime(int year, int month, int day, int hour, int minute, int second) {
    struct tm t = {};
    t.tm_year = year - 1900;
    t.tm_mon = month - 1;
    t.tm_mday = day;
    t.tm_hour = hour;
    t.tm_min = minute;
    t.tm_sec = second;
    t.tm_isdst = -1;  // Let the zone rules decide
    return mktime(&t);
}

uint32_t localDateKey(time_t utc) {
    struct tm local;
    if (!toLocalTime(utc, local)) {
        return 0;
    }
    return (uint32_t)(local.tm_year + 1900) * 10000UL +
           (uint32_t)(local.tm_mon + 1) * 100UL +
           (uint32_t)local.tm_mday;
}

time_t nextLocalOccurrence(time_t afterUtc, int hour, int minute) {
    struct tm local;
    if (!toLocalTime(afterUtc, local)) {
        return (time_t)-1;
    }

    int year = local.tm_year + 1900;
    int month = local.tm_mon + 1;
    int day = local.tm_mday;

    // Today first, then the following days. Two days cover a skipped DST hour.
    for (int offset = 0; offset < 3; offset++) {
        time_t candidate = fromLocalTime(year, month, day + offset, hour, minute, 0);
        if (candidate != (time_t)-1 && candidate > afterUtc) {
            return candidate;
        }
    }
    return (time_t)-1;
}

std::string formatUtcIso8601(time_t utc) {
    if (utc == 0) {
        return std::string();
    }
    struct tm t;
    if (gmtime_r(&utc, &t) == nullptr) {
        return std::string();
    }
    char buf[24];
    size_t len = strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &t);
    return std::string(buf, len);
}

std::string formatLocalClock(time_t utc) {
    struct tm local;
    if (utc == 0 || !toLocalTime(utc, local)) {
        return "--:--";
    }
    char buf[6];
    if (strftime(buf, sizeof(buf), "%H:%M", &local) == 0) {
        return "--:--";
    }
    return std::string(buf);
}
