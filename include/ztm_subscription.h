#ifndef ZTM_SUBSCRIPTION_H
#define ZTM_SUBSCRIPTION_H

#include <time.h>
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include "api_requester.h"
#include "clock.h"
#include "departure_model.h"
#include "http_transport.h"
#include "refresh_scheduler.h"
#include "stop_info_cache.h"
#include "subscription_config.h"
#include "timer_service.h"
#include "transit_client.h"

// ============================================================================
// ZTM SUBSCRIPTION
// Everything one stop / line subscription needs, owned in one place:
// requester, stop info cache, timetable client and refresh scheduler.
// The transport, clock and timer service are borrowed and must outlive it.
// ============================================================================

class ZtmSubscription {
public:
    typedef std::function<void(const ZtmSubscription&)> UpdateCallback;

    static std::unique_ptr<ZtmSubscription> configure(const SubscriptionConfig& config,
                                                      HttpTransport& transport,
                                                      Clock& clock,
                                                      TimerService& timers);
    ~ZtmSubscription();

    // Initial fetch and timers
    void start();

    // Synchronous refresh. Returns the snapshot now being served
    // (the previous one if this fetch failed, empty if there is none).
    DepartureSnapshot fetch();

    void requestRefresh();

    // Forget cached stop metadata and re-fetch it with the next refresh
    void reloadStopInfo();

    void checkDayChange();
    void shutdown();

    const DepartureSnapshot* snapshot() const;
    RefreshScheduler::Status status() const;

    // First maxDepartures departures of the served snapshot, re-resolved
    // against nowUtc so departures that already left roll over to tomorrow
    std::vector<ScheduledDeparture> upcoming(time_t nowUtc) const;

    std::string stopName() const;
    const SubscriptionConfig& config() const;

    void setUpdateCallback(UpdateCallback callback);
    void setRandomSource(RefreshScheduler::RandomSource source);

    TransitClient& client();
    StopInfoCache& stopInfo();
    RefreshScheduler& scheduler();

private:
    ZtmSubscription(const SubscriptionConfig& config, HttpTransport& transport,
                    Clock& clock, TimerService& timers);

    static RefreshScheduler::Options schedulerOptions(const ClientOptions& options);

    SubscriptionConfig cfg;
    ApiRequester requester;
    StopInfoCache stopInfoCache;
    TransitClient transit;
    RefreshScheduler refreshScheduler;
    UpdateCallback updateCallback;
};

#endif // ZTM_SUBSCRIPTION_H
