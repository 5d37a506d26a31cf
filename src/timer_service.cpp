#include "timer_service.h"
#include "local_time.h"
#include "ztm_log.h"

// ============================================================================
// TIMER HANDLE
// ============================================================================

TimerHandle::TimerHandle() : service(nullptr), id(0) {
}

TimerHandle::TimerHandle(TimerService* owner, uint32_t timerId)
    : service(owner), id(timerId) {
}

void TimerHandle::cancel() {
    if (service != nullptr && id != 0) {
        service->cancel(id);
    }
    service = nullptr;
    id = 0;
}

bool TimerHandle::isActive() const {
    return service != nullptr && id != 0 && service->isPending(id);
}

// ============================================================================
// TIMER SERVICE
// ============================================================================

TimerService::TimerService(Clock& clock) : clock(clock), nextId(1) {
}

TimerHandle TimerService::callLater(uint32_t delayMs, Callback callback) {
    Timer timer;
    timer.kind = TIMER_ONCE;
    timer.startMs = clock.monotonicMs();
    timer.periodMs = delayMs;
    timer.hour = 0;
    timer.minute = 0;
    timer.dueUtc = 0;
    timer.callback = callback;
    return add(timer);
}

TimerHandle TimerService::trackInterval(uint32_t intervalMs, Callback callback) {
    Timer timer;
    timer.kind = TIMER_INTERVAL;
    timer.startMs = clock.monotonicMs();
    timer.periodMs = intervalMs > 0 ? intervalMs : 1;
    timer.hour = 0;
    timer.minute = 0;
    timer.dueUtc = 0;
    timer.callback = callback;
    return add(timer);
}

TimerHandle TimerService::trackDaily(int hour, int minute, Callback callback) {
    Timer timer;
    timer.kind = TIMER_DAILY;
    timer.startMs = 0;
    timer.periodMs = 0;
    timer.hour = hour;
    timer.minute = minute;
    timer.dueUtc = 0;
    timer.callback = callback;

    time_t now = clock.nowUtc();
    if (isClockSynced(now)) {
        timer.dueUtc = nextLocalOccurrence(now, hour, minute);
    }
    return add(timer);
}

TimerHandle TimerService::add(const Timer& timer) {
    Timer entry = timer;
    entry.id = nextId++;
    if (nextId == 0) {
        nextId = 1;  // 0 is the "no timer" id
    }
    timers.push_back(entry);
    return TimerHandle(this, entry.id);
}

TimerService::Timer* TimerService::find(uint32_t timerId) {
    for (size_t i = 0; i < timers.size(); i++) {
        if (timers[i].id == timerId) {
            return &timers[i];
        }
    }
    return nullptr;
}

bool TimerService::isDue(Timer& timer, uint32_t nowMs, time_t nowUtc) {
    if (timer.kind != TIMER_DAILY) {
        return (uint32_t)(nowMs - timer.startMs) >= timer.periodMs;
    }

    if (!isClockSynced(nowUtc)) {
        return false;
    }
    if (timer.dueUtc == 0 || timer.dueUtc == (time_t)-1) {
        // Armed late: the clock was not synced when the timer was created
        timer.dueUtc = nextLocalOccurrence(nowUtc, timer.hour, timer.minute);
        return false;
    }
    return nowUtc >= timer.dueUtc;
}

void TimerService::tick() {
    uint32_t nowMs = clock.monotonicMs();
    time_t nowUtc = clock.nowUtc();

    std::vector<uint32_t> due;
    for (size_t i = 0; i < timers.size(); i++) {
        if (isDue(timers[i], nowMs, nowUtc)) {
            due.push_back(timers[i].id);
        }
    }

    for (size_t i = 0; i < due.size(); i++) {
        // An earlier callback may have cancelled this one
        Timer* timer = find(due[i]);
        if (timer == nullptr) {
            continue;
        }

        Callback callback = timer->callback;
        switch (timer->kind) {
            case TIMER_ONCE:
                cancel(timer->id);
                break;
            case TIMER_INTERVAL:
                timer->startMs = nowMs;
                break;
            case TIMER_DAILY:
                timer->dueUtc = nextLocalOccurrence(nowUtc, timer->hour, timer->minute);
                break;
        }

        if (callback) {
            callback();
        }
    }
}

bool TimerService::cancel(uint32_t timerId) {
    for (size_t i = 0; i < timers.size(); i++) {
        if (timers[i].id == timerId) {
            timers.erase(timers.begin() + i);
            return true;
        }
    }
    return false;
}

bool TimerService::isPending(uint32_t timerId) const {
    for (size_t i = 0; i < timers.size(); i++) {
        if (timers[i].id == timerId) {
            return true;
        }
    }
    return false;
}

size_t TimerService::pendingCount() const {
    return timers.size();
}

void TimerService::cancelAll() {
    if (!timers.empty()) {
        ZTM_LOGD("Timer service: cancelling %u pending timers", (unsigned)timers.size());
    }
    timers.clear();
}
