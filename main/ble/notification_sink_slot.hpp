#ifndef NOTIFICATION_SINK_SLOT_HPP
#define NOTIFICATION_SINK_SLOT_HPP

#include <cstddef>
#include <cstdint>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <main/ble/ble_transport.hpp>

// Sink callback plus its context, swapped as one unit. The owning task sets
// and clears it while the host task delivers notifications through it.
class NotificationSinkSlot {
public:
    NotificationSinkSlot() : sink(nullptr), context(nullptr) {}

    NotificationSinkSlot(const NotificationSinkSlot&) = delete;
    NotificationSinkSlot& operator=(const NotificationSinkSlot&) = delete;

    void set(NotificationSink new_sink, void* new_context) {
        taskENTER_CRITICAL(&mux);
        sink = new_sink;
        context = new_context;
        taskEXIT_CRITICAL(&mux);
    }

    void clear() { set(nullptr, nullptr); }

    bool isSet() {
        taskENTER_CRITICAL(&mux);
        const bool set_now = sink != nullptr;
        taskEXIT_CRITICAL(&mux);
        return set_now;
    }

    // The callback runs outside the critical section; returns false if no sink
    bool deliver(const uint8_t* data, size_t length) {
        taskENTER_CRITICAL(&mux);
        NotificationSink current = sink;
        void* current_context = context;
        taskEXIT_CRITICAL(&mux);
        if (current == nullptr) {
            return false;
        }
        current(current_context, data, length);
        return true;
    }

private:
    portMUX_TYPE mux = portMUX_INITIALIZER_UNLOCKED;
    NotificationSink sink;
    void* context;
};

#endif // NOTIFICATION_SINK_SLOT_HPP
