#ifndef DEPARTURE_MODEL_H
#define DEPARTURE_MODEL_H

#include <time.h>
#include <map>
#include <string>
#include <vector>

// ============================================================================
// DEPARTURE MODEL
// Typed departures for one stop / post / line subscription.
// Optional text fields are empty when the API did not send them.
// ============================================================================

// Flattened {key, value} pairs of one API row
typedef std::map<std::string, std::string> RawRow;

// Stop attributes (nazwa_zespolu, szer_geo, dlug_geo, id_ulicy, ...)
// plus the "stop_name" alias
typedef std::map<std::string, std::string> StopMetadata;

struct DepartureReading {
    std::string headsign;        // "kierunek"
    std::string scheduledClock;  // "czas", HH:MM:SS, HH may be 24..27
    std::string routeId;         // "trasa"
    std::string brigade;         // "brygada"
    std::string symbol1;         // "symbol_1"
    std::string symbol2;         // "symbol_2"

    DepartureReading();

    // Trip belongs to the previous service day (clock hour >= 24)
    bool isNightService() const;
};

struct ScheduledDeparture {
    DepartureReading reading;
    time_t departureUtc;  // 0 when the clock could not be resolved

    ScheduledDeparture() : departureUtc(0) {}

    bool isResolved() const { return departureUtc != 0; }

    // Whole minutes until departure, floored at 0. -1 when unresolved.
    int minutesToDepart(time_t nowUtc) const;
};

struct DepartureSnapshot {
    std::vector<ScheduledDeparture> departures;  // ascending by departureUtc
    StopMetadata stopInfo;
    bool hasStopInfo;
    time_t fetchedAtUtc;

    DepartureSnapshot() : hasStopInfo(false), fetchedAtUtc(0) {}

    bool isEmpty() const { return departures.empty(); }

    // stop_name attribute if known, empty otherwise
    std::string stopName() const;
};

#endif // DEPARTURE_MODEL_H
