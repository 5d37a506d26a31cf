#include "ztm_subscription.h"
#include "timetable_codec.h"
#include "ztm_log.h"

std::unique_ptr<ZtmSubscription> ZtmSubscription::configure(const SubscriptionConfig& config,
                                                            HttpTransport& transport,
                                                            Clock& clock,
                                                            TimerService& timers) {
    ZTM_LOGI("Configuring %s", config.title().c_str());
    return std::unique_ptr<ZtmSubscription>(new ZtmSubscription(config, transport, clock, timers));
}

ZtmSubscription::ZtmSubscription(const SubscriptionConfig& config, HttpTransport& transport,
                                 Clock& clock, TimerService& timers)
    : cfg(config),
      requester(transport, clock, config.options.timeoutSeconds),
      stopInfoCache(requester, clock, config.apiKey, config.stopId, config.stopNr,
                    config.options.stopInfoTtlSeconds),
      transit(requester, stopInfoCache, clock, config.apiKey, config.stopId, config.stopNr, config.line),
      refreshScheduler("line_" + config.line + "_from_" + config.stopId + "_" + config.stopNr,
                       [this](DepartureSnapshot& snapshot) { return transit.fetchDepartures(snapshot); },
                       timers, clock, schedulerOptions(config.options)) {
    refreshScheduler.setUpdateListener([this]() {
        if (updateCallback) {
            updateCallback(*this);
        }
    });
}

ZtmSubscription::~ZtmSubscription() {
    shutdown();
}

RefreshScheduler::Options ZtmSubscription::schedulerOptions(const ClientOptions& options) {
    RefreshScheduler::Options schedule;
    schedule.intervalSeconds = options.refreshIntervalSeconds;
    schedule.retryDelaySeconds = options.retryDelaySeconds;
    schedule.jitterMaxSeconds = options.jitterMaxSeconds;
    return schedule;
}

void ZtmSubscription::start() {
    refreshScheduler.start();
}

DepartureSnapshot ZtmSubscription::fetch() {
    if (refreshScheduler.isShutdown()) {
        return DepartureSnapshot();
    }
    refreshScheduler.refresh();
    const DepartureSnapshot* served = refreshScheduler.snapshot();
    return served != nullptr ? *served : DepartureSnapshot();
}

void ZtmSubscription::requestRefresh() {
    refreshScheduler.requestRefresh();
}

void ZtmSubscription::reloadStopInfo() {
    stopInfoCache.reset();
    refreshScheduler.requestRefresh();
}

void ZtmSubscription::checkDayChange() {
    refreshScheduler.checkDayChange();
}

void ZtmSubscription::shutdown() {
    refreshScheduler.shutdown();
}

const DepartureSnapshot* ZtmSubscription::snapshot() const {
    return refreshScheduler.snapshot();
}

RefreshScheduler::Status ZtmSubscription::status() const {
    return refreshScheduler.status();
}

std::vector<ScheduledDeparture> ZtmSubscription::upcoming(time_t nowUtc) const {
    std::vector<ScheduledDeparture> result;
    const DepartureSnapshot* served = refreshScheduler.snapshot();
    if (served == nullptr) {
        return result;
    }

    std::vector<DepartureReading> readings;
    readings.reserve(served->departures.size());
    for (size_t i = 0; i < served->departures.size(); i++) {
        readings.push_back(served->departures[i].reading);
    }

    result = TimetableCodec::buildSchedule(readings, nowUtc, TimetableCodec::DROP_UNRESOLVED);
    size_t limit = (size_t)cfg.options.maxDepartures;
    if (result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

std::string ZtmSubscription::stopName() const {
    const DepartureSnapshot* served = refreshScheduler.snapshot();
    if (served != nullptr && served->hasStopInfo) {
        return served->stopName();
    }
    if (stopInfoCache.hasValue()) {
        StopMetadata::const_iterator it = stopInfoCache.current().find("stop_name");
        if (it != stopInfoCache.current().end()) {
            return it->second;
        }
    }
    return std::string();
}

const SubscriptionConfig& ZtmSubscription::config() const {
    return cfg;
}

void ZtmSubscription::setUpdateCallback(UpdateCallback callback) {
    updateCallback = callback;
}

void ZtmSubscription::setRandomSource(RefreshScheduler::RandomSource source) {
    refreshScheduler.setRandomSource(source);
}

TransitClient& ZtmSubscription::client() {
    return transit;
}

StopInfoCache& ZtmSubscription::stopInfo() {
    return stopInfoCache;
}

RefreshScheduler& ZtmSubscription::scheduler() {
    return refreshScheduler;
}
