#ifndef TIMETABLE_CODEC_H
#define TIMETABLE_CODEC_H

#include <time.h>
#include <vector>
#include <ArduinoJson.h>
#include "departure_model.h"

// ============================================================================
// TIMETABLE CODEC
// Decodes dbtimetable_get rows and resolves "HH:MM:SS" service clocks
// into absolute instants relative to now (Europe/Warsaw local time).
// ============================================================================

class TimetableCodec {
public:
    enum UnresolvedPolicy {
        DROP_UNRESOLVED,      // production behaviour
        SORT_UNRESOLVED_LAST  // keep for diagnostics
    };

    // Flatten [{"key": k, "value": v}, ...] into a map. Items without both
    // fields are skipped, non-string values are stringified.
    // Returns false if `entries` is not an array.
    static bool flattenRow(JsonVariantConst entries, RawRow& out);

    // Build a reading from a flattened row. Returns false when the clock
    // does not look like DD:DD:DD.
    static bool decodeRow(const RawRow& row, DepartureReading& out);

    // Exactly two digits, colon, two digits, colon, two digits
    static bool isClockFormat(const std::string& clock);

    // Split a clock into fields. Rejects minutes/seconds above 59.
    static bool parseClock(const std::string& clock, int& hour, int& minute, int& second);

    // Resolve a service clock against nowUtc. Hours 24+ wrap to the small
    // hours; a time not strictly ahead of now (hour:minute) lands tomorrow.
    static bool resolveDeparture(const std::string& clock, time_t nowUtc, time_t& departureUtc);

    static int minutesToDepart(time_t departureUtc, time_t nowUtc);

    // Resolve every reading against nowUtc and return them sorted ascending
    static std::vector<ScheduledDeparture> buildSchedule(const std::vector<DepartureReading>& readings,
                                                         time_t nowUtc,
                                                         UnresolvedPolicy policy = DROP_UNRESOLVED);

    // Stable ascending sort, unresolved entries last
    static void sortByDeparture(std::vector<ScheduledDeparture>& departures);

    static bool departsBefore(const ScheduledDeparture& a, const ScheduledDeparture& b);
};

#endif // TIMETABLE_CODEC_H
