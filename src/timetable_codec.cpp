#include "timetable_codec.h"
#include "local_time.h"
#include "ztm_log.h"

#include <algorithm>

namespace {

bool isDigit(char c) {
    return c >= '0' && c <= '9';
}

int twoDigits(const std::string& s, size_t pos) {
    return (s[pos] - '0') * 10 + (s[pos + 1] - '0');
}

std::string fieldOr(const RawRow& row, const char* key, const char* fallback) {
    RawRow::const_iterator it = row.find(key);
    if (it == row.end()) {
        return std::string(fallback);
    }
    return it->second;
}

// Stringify a JSON scalar the way it was sent: strings verbatim, others as JSON text
bool scalarToString(JsonVariantConst value, std::string& out) {
    if (value.isNull()) {
        return false;
    }
    if (value.is<const char*>()) {
        out = value.as<const char*>();
        return true;
    }
    char buf[64];
    size_t len = serializeJson(value, buf, sizeof(buf));
    if (len == 0) {
        return false;
    }
    out.assign(buf, len);
    return true;
}

} // namespace

// ============================================================================
// ROW DECODING
// ============================================================================

bool TimetableCodec::flattenRow(JsonVariantConst entries, RawRow& out) {
    out.clear();
    if (!entries.is<JsonArrayConst>()) {
        return false;
    }

    for (JsonVariantConst item : entries.as<JsonArrayConst>()) {
        if (!item.is<JsonObjectConst>()) {
            continue;
        }
        JsonVariantConst key = item["key"];
        JsonVariantConst value = item["value"];
        if (!key.is<const char*>()) {
            continue;
        }
        std::string text;
        if (!scalarToString(value, text)) {
            continue;
        }
        out[key.as<const char*>()] = text;
    }
    return true;
}

bool TimetableCodec::decodeRow(const RawRow& row, DepartureReading& out) {
    DepartureReading reading;
    reading.headsign = fieldOr(row, "kierunek", "unknown");
    reading.scheduledClock = fieldOr(row, "czas", "00:00:00");
    reading.routeId = fieldOr(row, "trasa", "");
    reading.brigade = fieldOr(row, "brygada", "");
    reading.symbol1 = fieldOr(row, "symbol_1", "");
    reading.symbol2 = fieldOr(row, "symbol_2", "");

    if (!isClockFormat(reading.scheduledClock)) {
        ZTM_LOGD("Timetable: rejected clock '%s'", reading.scheduledClock.c_str());
        return false;
    }

    out = reading;
    return true;
}

// ============================================================================
// CLOCK RESOLUTION
// ============================================================================

bool TimetableCodec::isClockFormat(const std::string& clock) {
    if (clock.size() != 8) {
        return false;
    }
    return isDigit(clock[0]) && isDigit(clock[1]) && clock[2] == ':' &&
           isDigit(clock[3]) && isDigit(clock[4]) && clock[5] == ':' &&
           isDigit(clock[6]) && isDigit(clock[7]);
}

bool TimetableCodec::parseClock(const std::string& clock, int& hour, int& minute, int& second) {
    if (!isClockFormat(clock)) {
        return false;
    }
    int h = twoDigits(clock, 0);
    int m = twoDigits(clock, 3);
    int s = twoDigits(clock, 6);
    if (m > 59 || s > 59) {
        return false;
    }
    hour = h;
    minute = m;
    second = s;
    return true;
}

bool TimetableCodec::resolveDeparture(const std::string& clock, time_t nowUtc, time_t& departureUtc) {
    int hour, minute, second;
    if (!parseClock(clock, hour, minute, second)) {
        return false;
    }

    struct tm local;
    if (!toLocalTime(nowUtc, local)) {
        return false;
    }

    // Night courses: 24:10 is 00:10 of the following calendar day
    int dtHour = hour % 24;

    // Compare on hour:minute only; seconds are ignored on both sides
    bool stillAhead = (dtHour > local.tm_hour) ||
                      (dtHour == local.tm_hour && minute > local.tm_min);
    int dayOffset = stillAhead ? 0 : 1;

    time_t resolved = fromLocalTime(local.tm_year + 1900, local.tm_mon + 1,
                                    local.tm_mday + dayOffset, dtHour, minute, 0);
    if (resolved == (time_t)-1) {
        return false;
    }

    departureUtc = resolved;
    return true;
}

int TimetableCodec::minutesToDepart(time_t departureUtc, time_t nowUtc) {
    if (departureUtc == 0) {
        return -1;
    }
    long delta = (long)(departureUtc - nowUtc);
    if (delta <= 0) {
        return 0;
    }
    return (int)(delta / 60);
}

// ============================================================================
// ORDERING
// ============================================================================

std::vector<ScheduledDeparture> TimetableCodec::buildSchedule(const std::vector<DepartureReading>& readings,
                                                              time_t nowUtc,
                                                              UnresolvedPolicy policy) {
    std::vector<ScheduledDeparture> schedule;
    schedule.reserve(readings.size());

    for (size_t i = 0; i < readings.size(); i++) {
        ScheduledDeparture entry;
        entry.reading = readings[i];
        time_t resolved = 0;
        if (resolveDeparture(readings[i].scheduledClock, nowUtc, resolved)) {
            entry.departureUtc = resolved;
        } else if (policy == DROP_UNRESOLVED) {
            ZTM_LOGD("Timetable: dropped unresolvable clock '%s'",
                     readings[i].scheduledClock.c_str());
            continue;
        }
        schedule.push_back(entry);
    }

    sortByDeparture(schedule);
    return schedule;
}

bool TimetableCodec::departsBefore(const ScheduledDeparture& a, const ScheduledDeparture& b) {
    if (!a.isResolved()) {
        return false;
    }
    if (!b.isResolved()) {
        return true;
    }
    return a.departureUtc < b.departureUtc;
}

void TimetableCodec::sortByDeparture(std::vector<ScheduledDeparture>& departures) {
    std::stable_sort(departures.begin(), departures.end(), departsBefore);
}
