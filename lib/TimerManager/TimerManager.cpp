// =============================================
// TimerManager.cpp
// =============================================
#include "TimerManager.h"
#include "Globals.h"   // for logging macros

#ifndef LOG_TIMER_VERBOSE
#define LOG_TIMER_VERBOSE 0
#endif

#if LOG_TIMER_VERBOSE
#define TIMER_LOG_DEBUG(...) LOG_DEBUG(__VA_ARGS__)
#else
#define TIMER_LOG_DEBUG(...)
#endif

#define TIMER_LOG_WARN(...) LOG_WARN(__VA_ARGS__)

TimerManager& TimerManager::instance() {
    static TimerManager inst;
    return inst;
}

TimerManager::TimerManager() {
    for (uint8_t i = 0; i < MAX_TIMERS; i++) {
        slots[i].active = false;
    }
}

int TimerManager::findSlot(TimerCallback cb, void* context) const {
    for (uint8_t i = 0; i < MAX_TIMERS; i++) {
        if (slots[i].active && slots[i].cb == cb && slots[i].context == context) {
            return i;
        }
    }
    return -1;
}

bool TimerManager::create(uint32_t interval, int32_t repeat, TimerCallback cb, void* context) {
    if (!cb) return false;

    // enforce "one callback/context = one timer"
    if (findSlot(cb, context) >= 0) {
        TIMER_LOG_WARN("[TimerManager] creation failed - callback already in use\n");
        return false;
    }

    // find free slot
    for (uint8_t i = 0; i < MAX_TIMERS; i++) {
        if (!slots[i].active) {
            slots[i].active = true;
            slots[i].cb = cb;
            slots[i].context = context;
            slots[i].interval = interval;
            slots[i].nextFire = millis() + interval;
            slots[i].repeat = repeat;
            slots[i].serial = nextSerial_++;
            TIMER_LOG_DEBUG("[TimerManager] slot %u: interval=%lu ms repeat=%ld\n",
                            i, (unsigned long)interval, (long)repeat);
            showAvailableTimers(false);
            return true;
        }
    }

    TIMER_LOG_WARN("[TimerManager] no free slots\n");
    return false;
}

void TimerManager::cancel(TimerCallback cb, void* context) {
    if (!cb) return;
    int i = findSlot(cb, context);
    if (i < 0) return;
    slots[i].active = false;
    slots[i].cb = nullptr;
    slots[i].context = nullptr;
}

bool TimerManager::restart(uint32_t interval, int32_t repeat, TimerCallback cb, void* context) {
    if (cb) cancel(cb, context);
    return create(interval, repeat, cb, context);
}

bool TimerManager::isActive(TimerCallback cb, void* context) const {
    if (!cb) {
        return false;
    }
    return findSlot(cb, context) >= 0;
}

uint8_t TimerManager::activeCount() const {
    uint8_t count = 0;
    for (uint8_t i = 0; i < MAX_TIMERS; i++) {
        if (slots[i].active) count++;
    }
    return count;
}

void TimerManager::update() {
    uint32_t now = millis();
    for (uint8_t i = 0; i < MAX_TIMERS; i++) {
        if (!slots[i].active) continue;
        if ((int32_t)(now - slots[i].nextFire) >= 0) {
            // fire callback
            TimerCallback cb = slots[i].cb;
            void* context = slots[i].context;
            const uint32_t serial = slots[i].serial;
            cb(context);

            // the callback cancelled or restarted its own timer
            if (!slots[i].active || slots[i].serial != serial) continue;

            // reschedule or finish
            if (slots[i].repeat == 1) {
                slots[i].active = false;
                slots[i].cb = nullptr;
                slots[i].context = nullptr;
            } else {
                if (slots[i].repeat > 1) slots[i].repeat--;
                slots[i].nextFire += slots[i].interval;
            }
        }
    }
}

uint32_t TimerManager::periodFromHz(float hz) {
    if (!(hz > 0.0f)) {
        return 0;
    }
    const uint32_t periodMs = static_cast<uint32_t>(1000.0f / hz + 0.5f);
    return periodMs ? periodMs : 1;
}

// ===================================================
// Diagnostics
// ===================================================
void TimerManager::showAvailableTimers(bool showAlways) {
    const uint8_t freeCount = MAX_TIMERS - activeCount();

    if (freeCount < minFree_) {
        minFree_ = freeCount;
        if (freeCount < 4) {
            TIMER_LOG_WARN("[TimerManager] New minimum: only %d free timers available\n", freeCount);
        }
    }

    if (showAlways) {
        LOG_INFO("[TimerManager] Free timers now %d (historical min %d)\n", freeCount, minFree_);
    }
}
