#ifndef TIMER_SERVICE_H
#define TIMER_SERVICE_H

#include <stdint.h>
#include <time.h>
#include <functional>
#include <vector>
#include "clock.h"

// ============================================================================
// TIMER SERVICE
// Cooperative timers polled from loop(). Nothing fires outside tick().
// ============================================================================

class TimerService;

// Cancel handle for one scheduled timer. Copies refer to the same timer.
// The TimerService must outlive every handle it returned.
class TimerHandle {
public:
    TimerHandle();

    void cancel();
    bool isActive() const;

private:
    friend class TimerService;
    TimerHandle(TimerService* owner, uint32_t timerId);

    TimerService* service;
    uint32_t id;
};

class TimerService {
public:
    typedef std::function<void()> Callback;

    explicit TimerService(Clock& clock);

    // Fire once after delayMs
    TimerHandle callLater(uint32_t delayMs, Callback callback);

    // Fire every intervalMs, first time intervalMs from now
    TimerHandle trackInterval(uint32_t intervalMs, Callback callback);

    // Fire every day at hour:minute local time. Waits for a synced clock.
    TimerHandle trackDaily(int hour, int minute, Callback callback);

    // Run every due callback. Callbacks may schedule or cancel timers.
    void tick();

    bool cancel(uint32_t timerId);
    bool isPending(uint32_t timerId) const;
    size_t pendingCount() const;
    void cancelAll();

private:
    enum TimerKind {
        TIMER_ONCE,
        TIMER_INTERVAL,
        TIMER_DAILY
    };

    struct Timer {
        uint32_t id;
        TimerKind kind;
        uint32_t startMs;    // ONCE / INTERVAL: period start (monotonic)
        uint32_t periodMs;   // ONCE / INTERVAL: delay from startMs
        int hour;            // DAILY: local wall-clock time
        int minute;
        time_t dueUtc;       // DAILY: next occurrence, 0 until the clock is synced
        Callback callback;
    };

    Clock& clock;
    std::vector<Timer> timers;
    uint32_t nextId;

    TimerHandle add(const Timer& timer);
    Timer* find(uint32_t timerId);
    bool isDue(Timer& timer, uint32_t nowMs, time_t nowUtc);
};

#endif // TIMER_SERVICE_H
