#ifndef REFRESH_SCHEDULER_H
#define REFRESH_SCHEDULER_H

#include <stddef.h>
#include <stdint.h>
#include <time.h>
#include <functional>
#include <memory>
#include <string>
#include "clock.h"
#include "departure_model.h"
#include "timer_service.h"

// ============================================================================
// REFRESH SCHEDULER
// Decides when one subscription re-polls the timetable:
//   - once on start()
//   - every intervalSeconds
//   - at fixed local times (ZTM publishes new timetables shortly after 02:10),
//     each delayed by a random 0..jitterMaxSeconds
//   - one retry retryDelaySeconds after a failed daily fetch
//   - soon after start() when the last good data is from another local day
// A failed fetch never replaces the snapshot already being served.
// ============================================================================

class RefreshScheduler {
public:
    // Fills the snapshot, returns false on failure
    typedef std::function<bool(DepartureSnapshot&)> FetchFunction;
    // Uniform integer in [0, upperInclusive]
    typedef std::function<uint32_t(uint32_t upperInclusive)> RandomSource;
    typedef std::function<void()> UpdateListener;

    enum Status {
        STATUS_NO_DATA,  // nothing fetched yet
        STATUS_FRESH,    // last fetch succeeded
        STATUS_STALE,    // last fetch failed, previous snapshot still served
        STATUS_FAILED    // last fetch failed and there is nothing to serve
    };

    enum Trigger {
        TRIGGER_INITIAL,
        TRIGGER_INTERVAL,
        TRIGGER_DAILY,
        TRIGGER_RETRY,
        TRIGGER_DAY_CHANGE,
        TRIGGER_MANUAL
    };

    static const size_t MAX_DAILY_TRIGGERS = 4;
    // Larger option values are capped on construction
    static const uint32_t MAX_INTERVAL_SECONDS = 7 * 24 * 3600;
    static const uint32_t MAX_RETRY_DELAY_SECONDS = 24 * 3600;
    static const uint32_t MAX_JITTER_SECONDS = 300;

    struct DailyTime {
        int hour;
        int minute;
    };

    struct Options {
        uint32_t intervalSeconds;     // 0 disables the interval timer
        DailyTime daily[MAX_DAILY_TRIGGERS];
        size_t dailyCount;
        uint32_t retryDelaySeconds;
        uint32_t jitterMaxSeconds;

        Options();

        // Returns false when the table is full or the time is out of range
        bool addDaily(int hour, int minute);
    };

    RefreshScheduler(const std::string& name, FetchFunction fetch,
                     TimerService& timers, Clock& clock,
                     const Options& options = Options());
    ~RefreshScheduler();

    void setRandomSource(RandomSource source);
    void setUpdateListener(UpdateListener listener);

    // Initial synchronous fetch, then arm every timer. Runs once.
    void start();

    // Fetch right now. Returns false if the fetch failed or was skipped.
    bool refresh();

    // Fetch on the next timer tick
    void requestRefresh();

    // Arm a jittered fetch if the last good data is from another local day.
    // Returns true when one was scheduled.
    bool checkDayChange();

    // Cancel every timer and drop the snapshot. Terminal.
    void shutdown();

    Status status() const;
    static const char* statusName(Status status);
    static const char* triggerName(Trigger trigger);

    bool hasSnapshot() const;
    // nullptr until the first successful fetch
    const DepartureSnapshot* snapshot() const;

    time_t lastSuccessUtc() const;
    uint32_t lastSuccessDate() const;  // local YYYYMMDD, 0 if never
    bool isRetryPending() const;
    bool isStarted() const;
    bool isShutdown() const;
    const std::string& name() const;
    const Options& options() const;

private:
    struct PendingTimers {
        TimerHandle interval;
        TimerHandle daily[MAX_DAILY_TRIGGERS];
        TimerHandle jittered[MAX_DAILY_TRIGGERS];
        TimerHandle retry;
        TimerHandle dayChange;
        TimerHandle manual;

        void cancelAll();
    };

    std::string schedulerName;
    FetchFunction fetchFn;
    TimerService& timers;
    Clock& clock;
    Options opts;
    RandomSource random;
    UpdateListener listener;

    std::unique_ptr<DepartureSnapshot> current;
    Status currentStatus;
    time_t lastSuccess;
    uint32_t lastSuccessDay;
    PendingTimers pending;
    bool started;
    bool stopped;
    bool inFlight;

    bool runFetch(Trigger trigger);
    void onDailyTrigger(size_t index);
    void onDailyFetch();
    void scheduleRetry();
    void cancelRetry();
    uint32_t jitterMs();
    void logChanges(const DepartureSnapshot& fresh) const;
};

#endif // REFRESH_SCHEDULER_H
