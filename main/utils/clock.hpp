#ifndef CLOCK_HPP
#define CLOCK_HPP

#include <cstdint>
#include <esp_timer.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

// Monotonic millisecond time source plus cooperative sleep. Timestamps wrap
// after ~49 days, so compare them with unsigned subtraction only.
class Clock {
public:
    virtual ~Clock() = default;
    virtual uint32_t nowMs() const = 0;
    virtual void sleepMs(uint32_t duration_ms) = 0;
};

class SystemClock : public Clock {
public:
    uint32_t nowMs() const override {
        return static_cast<uint32_t>(esp_timer_get_time() / 1000);
    }

    void sleepMs(uint32_t duration_ms) override {
        if (duration_ms > 0) {
            vTaskDelay(pdMS_TO_TICKS(duration_ms));
        }
    }
};

#endif // CLOCK_HPP
