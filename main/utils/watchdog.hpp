#ifndef WATCHDOG_HPP
#define WATCHDOG_HPP

#include <esp_task_wdt.h>

namespace Watchdog {
    // Reconfigure the TWDT with Config::Watchdog::timeout_ms (call once from app_main)
    bool init();
    // Subscribe the calling task; returns false if the TWDT rejected it
    bool subscribe();
    // Remove the calling task before it blocks for longer than the timeout
    void unsubscribe();
    // Reset the calling task's timer; no-op for tasks that never subscribed
    void feed();
}

#endif // WATCHDOG_HPP
