#ifndef RTOS_MUTEX_HPP
#define RTOS_MUTEX_HPP

#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

// Statically allocated FreeRTOS mutex
class RtosMutex {
public:
    RtosMutex() : handle(xSemaphoreCreateMutexStatic(&storage)) {}

    RtosMutex(const RtosMutex&) = delete;
    RtosMutex& operator=(const RtosMutex&) = delete;

    bool lock(TickType_t wait_ticks = portMAX_DELAY) {
        return xSemaphoreTake(handle, wait_ticks) == pdTRUE;
    }

    void unlock() {
        xSemaphoreGive(handle);
    }

private:
    StaticSemaphore_t storage;
    SemaphoreHandle_t handle;
};

// Scoped lock; check locked() when a finite wait was requested
class MutexLock {
public:
    explicit MutexLock(RtosMutex& mutex, TickType_t wait_ticks = portMAX_DELAY)
        : mutex(mutex), held(mutex.lock(wait_ticks)) {}

    ~MutexLock() {
        if (held) {
            mutex.unlock();
        }
    }

    MutexLock(const MutexLock&) = delete;
    MutexLock& operator=(const MutexLock&) = delete;

    bool locked() const { return held; }

private:
    RtosMutex& mutex;
    bool held;
};

#endif // RTOS_MUTEX_HPP
