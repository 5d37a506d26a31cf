#include "refresh_scheduler.h"
#include "local_time.h"
#include "ztm_log.h"

#include <stdlib.h>
#include <exception>

const size_t RefreshScheduler::MAX_DAILY_TRIGGERS;
const uint32_t RefreshScheduler::MAX_INTERVAL_SECONDS;
const uint32_t RefreshScheduler::MAX_RETRY_DELAY_SECONDS;
const uint32_t RefreshScheduler::MAX_JITTER_SECONDS;

// ============================================================================
// OPTIONS
// ============================================================================

RefreshScheduler::Options::Options()
    : intervalSeconds(3600),
      dailyCount(0),
      retryDelaySeconds(120),
      jitterMaxSeconds(45) {
    for (size_t i = 0; i < MAX_DAILY_TRIGGERS; i++) {
        daily[i].hour = 0;
        daily[i].minute = 0;
    }
    addDaily(0, 3);
    addDaily(2, 30);  // buffer after the 02:10 timetable publication
}

bool RefreshScheduler::Options::addDaily(int hour, int minute) {
    if (dailyCount >= MAX_DAILY_TRIGGERS) {
        return false;
    }
    if (hour < 0 || hour > 23 || minute < 0 || minute > 59) {
        return false;
    }
    daily[dailyCount].hour = hour;
    daily[dailyCount].minute = minute;
    dailyCount++;
    return true;
}

void RefreshScheduler::PendingTimers::cancelAll() {
    interval.cancel();
    for (size_t i = 0; i < MAX_DAILY_TRIGGERS; i++) {
        daily[i].cancel();
        jittered[i].cancel();
    }
    retry.cancel();
    dayChange.cancel();
    manual.cancel();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

RefreshScheduler::RefreshScheduler(const std::string& name, FetchFunction fetch,
                                   TimerService& timers, Clock& clock,
                                   const Options& options)
    : schedulerName(name),
      fetchFn(fetch),
      timers(timers),
      clock(clock),
      opts(options),
      currentStatus(STATUS_NO_DATA),
      lastSuccess(0),
      lastSuccessDay(0),
      started(false),
      stopped(false),
      inFlight(false) {
    // Timer delays are 32-bit milliseconds
    if (opts.intervalSeconds > MAX_INTERVAL_SECONDS) {
        opts.intervalSeconds = MAX_INTERVAL_SECONDS;
    }
    if (opts.retryDelaySeconds > MAX_RETRY_DELAY_SECONDS) {
        opts.retryDelaySeconds = MAX_RETRY_DELAY_SECONDS;
    }
    if (opts.jitterMaxSeconds > MAX_JITTER_SECONDS) {
        opts.jitterMaxSeconds = MAX_JITTER_SECONDS;
    }
    random = [](uint32_t upper) -> uint32_t {
        return (uint32_t)((uint64_t)rand() % ((uint64_t)upper + 1));
    };
}

RefreshScheduler::~RefreshScheduler() {
    // Timer callbacks capture `this`
    pending.cancelAll();
}

void RefreshScheduler::setRandomSource(RandomSource source) {
    if (source) {
        random = source;
    }
}

void RefreshScheduler::setUpdateListener(UpdateListener callback) {
    listener = callback;
}

void RefreshScheduler::start() {
    if (started || stopped) {
        return;
    }
    started = true;

    ZTM_LOGD("Scheduler [%s]: performing initial refresh", schedulerName.c_str());
    runFetch(TRIGGER_INITIAL);
    if (stopped) {
        return;
    }

    // A failed first fetch still arms the schedule
    if (opts.intervalSeconds > 0) {
        pending.interval = timers.trackInterval(opts.intervalSeconds * 1000UL, [this]() {
            runFetch(TRIGGER_INTERVAL);
        });
    }

    for (size_t i = 0; i < opts.dailyCount && i < MAX_DAILY_TRIGGERS; i++) {
        pending.daily[i] = timers.trackDaily(opts.daily[i].hour, opts.daily[i].minute, [this, i]() {
            onDailyTrigger(i);
        });
        ZTM_LOGD("Scheduler [%s]: refresh scheduled daily at %02d:%02d",
                 schedulerName.c_str(), opts.daily[i].hour, opts.daily[i].minute);
    }

    checkDayChange();
}

void RefreshScheduler::shutdown() {
    if (stopped) {
        return;
    }
    stopped = true;
    pending.cancelAll();
    current.reset();
    currentStatus = STATUS_NO_DATA;
    ZTM_LOGI("Scheduler [%s]: shutdown complete", schedulerName.c_str());
}

// ============================================================================
// TRIGGERS
// ============================================================================

bool RefreshScheduler::refresh() {
    return runFetch(TRIGGER_MANUAL);
}

void RefreshScheduler::requestRefresh() {
    if (stopped) {
        return;
    }
    pending.manual.cancel();
    pending.manual = timers.callLater(0, [this]() {
        runFetch(TRIGGER_MANUAL);
    });
}

bool RefreshScheduler::checkDayChange() {
    if (stopped) {
        return false;
    }

    time_t now = clock.nowUtc();
    if (!isClockSynced(now)) {
        return false;
    }

    uint32_t today = localDateKey(now);
    if (today == 0 || today == lastSuccessDay) {
        return false;
    }

    uint32_t delay = jitterMs();
    pending.dayChange.cancel();
    pending.dayChange = timers.callLater(delay, [this]() {
        runFetch(TRIGGER_DAY_CHANGE);
    });
    ZTM_LOGI("Scheduler [%s]: last data from %lu, today is %lu; refreshing in %lums",
             schedulerName.c_str(), (unsigned long)lastSuccessDay,
             (unsigned long)today, (unsigned long)delay);
    return true;
}

void RefreshScheduler::onDailyTrigger(size_t index) {
    uint32_t delay = jitterMs();
    ZTM_LOGD("Scheduler [%s]: daily refresh triggered; applying jitter=%lums",
             schedulerName.c_str(), (unsigned long)delay);

    pending.jittered[index].cancel();
    pending.jittered[index] = timers.callLater(delay, [this]() {
        onDailyFetch();
    });
}

void RefreshScheduler::onDailyFetch() {
    bool ok = runFetch(TRIGGER_DAILY);
    if (stopped) {
        return;
    }
    if (!ok) {
        scheduleRetry();
    }
}

void RefreshScheduler::scheduleRetry() {
    cancelRetry();
    ZTM_LOGW("Scheduler [%s]: daily refresh failed; scheduling retry in %lus",
             schedulerName.c_str(), (unsigned long)opts.retryDelaySeconds);
    pending.retry = timers.callLater(opts.retryDelaySeconds * 1000UL, [this]() {
        runFetch(TRIGGER_RETRY);
    });
}

void RefreshScheduler::cancelRetry() {
    if (pending.retry.isActive()) {
        ZTM_LOGD("Scheduler [%s]: pending retry cancelled", schedulerName.c_str());
    }
    pending.retry.cancel();
}

uint32_t RefreshScheduler::jitterMs() {
    if (opts.jitterMaxSeconds == 0) {
        return 0;
    }
    uint32_t seconds = random(opts.jitterMaxSeconds);
    if (seconds > opts.jitterMaxSeconds) {
        seconds = opts.jitterMaxSeconds;
    }
    return seconds * 1000UL;
}

// ============================================================================
// FETCH
// ============================================================================

bool RefreshScheduler::runFetch(Trigger trigger) {
    if (stopped) {
        ZTM_LOGD("Scheduler [%s]: %s trigger ignored after shutdown",
                 schedulerName.c_str(), triggerName(trigger));
        return false;
    }
    if (inFlight) {
        ZTM_LOGD("Scheduler [%s]: fetch in flight, %s trigger skipped",
                 schedulerName.c_str(), triggerName(trigger));
        return false;
    }
    if (!fetchFn) {
        return false;
    }

    ZTM_LOGD("Scheduler [%s]: fetching schedule data (%s)",
             schedulerName.c_str(), triggerName(trigger));

    DepartureSnapshot fresh;
    bool ok = false;
    inFlight = true;
    try {
        ok = fetchFn(fresh);
    } catch (const std::exception& e) {
        ZTM_LOGE("Scheduler [%s]: %s fetch threw: %s",
                 schedulerName.c_str(), triggerName(trigger), e.what());
        ok = false;
    }
    inFlight = false;

    if (stopped) {
        ZTM_LOGD("Scheduler [%s]: result discarded, shut down during fetch", schedulerName.c_str());
        return false;
    }

    if (ok) {
        logChanges(fresh);
        time_t now = clock.nowUtc();
        current = std::unique_ptr<DepartureSnapshot>(new DepartureSnapshot(fresh));
        lastSuccess = now;
        lastSuccessDay = localDateKey(now);
        currentStatus = STATUS_FRESH;
        cancelRetry();
    } else if (current) {
        currentStatus = STATUS_STALE;
        ZTM_LOGW("Scheduler [%s]: %s fetch failed; serving data from %ld",
                 schedulerName.c_str(), triggerName(trigger), (long)lastSuccess);
    } else {
        currentStatus = STATUS_FAILED;
        ZTM_LOGE("Scheduler [%s]: %s fetch failed and no data is available",
                 schedulerName.c_str(), triggerName(trigger));
    }

    if (listener) {
        listener();
    }
    return ok;
}

void RefreshScheduler::logChanges(const DepartureSnapshot& fresh) const {
    size_t count = fresh.departures.size();

    if (!current) {
        ZTM_LOGI("Scheduler [%s]: first data load", schedulerName.c_str());
    } else if (current->departures.size() != count) {
        ZTM_LOGI("Scheduler [%s]: departure count changed: %u -> %u",
                 schedulerName.c_str(), (unsigned)current->departures.size(), (unsigned)count);
    } else {
        for (size_t i = 0; i < count; i++) {
            if (current->departures[i].reading.scheduledClock != fresh.departures[i].reading.scheduledClock) {
                ZTM_LOGI("Scheduler [%s]: departure times changed", schedulerName.c_str());
                break;
            }
        }
    }

    ZTM_LOGD("Scheduler [%s]: successfully fetched %u departures%s",
             schedulerName.c_str(), (unsigned)count, count == 0 ? " (empty set)" : "");
}

// ============================================================================
// STATE
// ============================================================================

RefreshScheduler::Status RefreshScheduler::status() const {
    return currentStatus;
}

const char* RefreshScheduler::statusName(Status value) {
    switch (value) {
        case STATUS_NO_DATA:
            return "no_data";
        case STATUS_FRESH:
            return "fresh";
        case STATUS_STALE:
            return "stale";
        case STATUS_FAILED:
            return "failed";
    }
    return "unknown";
}

const char* RefreshScheduler::triggerName(Trigger value) {
    switch (value) {
        case TRIGGER_INITIAL:
            return "initial";
        case TRIGGER_INTERVAL:
            return "interval";
        case TRIGGER_DAILY:
            return "daily";
        case TRIGGER_RETRY:
            return "retry";
        case TRIGGER_DAY_CHANGE:
            return "day-change";
        case TRIGGER_MANUAL:
            return "manual";
    }
    return "unknown";
}

bool RefreshScheduler::hasSnapshot() const {
    return current != nullptr;
}

const DepartureSnapshot* RefreshScheduler::snapshot() const {
    return current.get();
}

time_t RefreshScheduler::lastSuccessUtc() const {
    return lastSuccess;
}

uint32_t RefreshScheduler::lastSuccessDate() const {
    return lastSuccessDay;
}

bool RefreshScheduler::isRetryPending() const {
    return pending.retry.isActive();
}

bool RefreshScheduler::isStarted() const {
    return started;
}

bool RefreshScheduler::isShutdown() const {
    return stopped;
}

const std::string& RefreshScheduler::name() const {
    return schedulerName;
}

const RefreshScheduler::Options& RefreshScheduler::options() const {
    return opts;
}
