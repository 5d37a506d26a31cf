#include "departure_model.h"
#include "timetable_codec.h"

DepartureReading::DepartureReading()
    : headsign("unknown"), scheduledClock("00:00:00") {
}

bool DepartureReading::isNightService() const {
    int hour, minute, second;
    if (!TimetableCodec::parseClock(scheduledClock, hour, minute, second)) {
        return false;
    }
    return hour >= 24;
}

int ScheduledDeparture::minutesToDepart(time_t nowUtc) const {
    return TimetableCodec::minutesToDepart(departureUtc, nowUtc);
}

std::string DepartureSnapshot::stopName() const {
    if (!hasStopInfo) {
        return std::string();
    }
    StopMetadata::const_iterator it = stopInfo.find("stop_name");
    if (it == stopInfo.end()) {
        return std::string();
    }
    return it->second;
}
