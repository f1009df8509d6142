// =============================================
// TimerManager.h
// =============================================
#pragma once
#include <Arduino.h>

// Timer callbacks receive the context pointer they were created with, so one
// static trampoline can serve any number of object instances.
typedef void (*TimerCallback)(void* context);

#ifndef MAX_TIMERS
#define MAX_TIMERS 32
#endif

class TimerManager {
public:
    struct TimerSlot {
        bool active = false;
        TimerCallback cb = nullptr;
        void* context = nullptr;
        uint32_t interval = 0;   // ms
        uint32_t nextFire = 0;   // millis() when it should fire
        int32_t repeat = 0;      // 0 = infinite, >0 = remaining repeats
        uint32_t serial = 0;     // bumped on create(), detects a restart from inside the callback
    };

    static TimerManager& instance();

    // Create a timer
    // interval: ms
    // repeat: 0 = infinite, 1 = one-shot, N = N repeats
    // cb/context: callback and the pointer handed back to it; the pair identifies the timer
    // returns true if created, false if failed
    bool create(uint32_t interval, int32_t repeat, TimerCallback cb, void* context = nullptr);

    // Cancel a timer by callback/context
    void cancel(TimerCallback cb, void* context = nullptr);

    // Restart (or start) a timer by callback/context
    bool restart(uint32_t interval, int32_t repeat, TimerCallback cb, void* context = nullptr);

    // Update timers (call in loop)
    void update();

    bool isActive(TimerCallback cb, void* context = nullptr) const;
    uint8_t activeCount() const;

    // Diagnostics
    void showAvailableTimers(bool showAlways);

    // Converts a frequency to a timer period, never shorter than 1 ms.
    static uint32_t periodFromHz(float hz);

private:
    TimerManager();
    TimerManager(const TimerManager&) = delete;
    TimerManager& operator=(const TimerManager&) = delete;

    int findSlot(TimerCallback cb, void* context) const;

    TimerSlot slots[MAX_TIMERS];
    uint8_t minFree_ = MAX_TIMERS;
    uint32_t nextSerial_ = 1;
};
