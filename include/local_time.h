#ifndef LOCAL_TIME_H
#define LOCAL_TIME_H

#include <stdint.h>
#include <time.h>
#include <string>

// ============================================================================
// LOCAL TIME HELPERS
// Thin wrappers over localtime_r/mktime. The zone comes from the POSIX TZ
// rule installed with configureTimeZone(), same as configTzTime() on ESP32.
// ============================================================================

// Europe/Warsaw: CET, CEST from last Sunday of March 02:00 to last Sunday of October 03:00
#define ZTM_TIMEZONE_POSIX "CET-1CEST,M3.5.0,M10.5.0/3"

void configureTimeZone(const char* posixTz);

// Break a UTC instant into local calendar fields
bool toLocalTime(time_t utc, struct tm& local);

// Compose local calendar fields into a UTC instant. Out-of-range fields are
// normalized (mday + 1 rolls over months), DST is resolved by the zone rules.
// Returns (time_t)-1 when the fields cannot be represented.
time_t fromLocalTime(int year, int month, int day, int hour, int minute, int second);

// Local calendar date as YYYYMMDD, 0 if the instant cannot be converted
uint32_t localDateKey(time_t utc);

// Next UTC instant strictly after `afterUtc` whose local time is hour:minute:00
time_t nextLocalOccurrence(time_t afterUtc, int hour, int minute);

// "2025-03-30T01:10:00Z", empty for an unresolved (0) instant
std::string formatUtcIso8601(time_t utc);

// Local "HH:MM", "--:--" when the instant cannot be converted
std::string formatLocalClock(time_t utc);

#endif // LOCAL_TIME_H
