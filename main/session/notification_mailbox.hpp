#ifndef NOTIFICATION_MAILBOX_HPP
#define NOTIFICATION_MAILBOX_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <freertos/FreeRTOS.h>
#include <freertos/queue.h>
#include <main/config/config.hpp>
#include <main/models/notification_frame.hpp>

// Bounded hand-off of raw notification frames from the BLE host task to the
// task waiting on a response. Frames that do not fit are dropped and counted.
class NotificationMailbox {
public:
    static constexpr size_t DEPTH = Config::Ble::mailbox_depth;

    NotificationMailbox();

    NotificationMailbox(const NotificationMailbox&) = delete;
    NotificationMailbox& operator=(const NotificationMailbox&) = delete;

    // NotificationSink-compatible entry point; context is the mailbox
    static void sink(void* context, const uint8_t* data, size_t length);

    bool push(const uint8_t* data, size_t length);
    bool receive(NotificationFrame& out, TickType_t wait_ticks);
    // Discard queued frames; returns how many were dropped
    size_t drain();

    uint32_t droppedCount() const { return dropped.load(); }
    uint32_t truncatedCount() const { return truncated.load(); }

private:
    StaticQueue_t queue_buffer;
    uint8_t queue_storage[DEPTH * sizeof(NotificationFrame)];
    QueueHandle_t queue;
    std::atomic<uint32_t> dropped;
    std::atomic<uint32_t> truncated;
};

#endif // NOTIFICATION_MAILBOX_HPP
