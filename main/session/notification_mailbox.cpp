#include <main/session/notification_mailbox.hpp>
#include <cstring>

NotificationMailbox::NotificationMailbox()
    : queue(xQueueCreateStatic(DEPTH, sizeof(NotificationFrame), queue_storage, &queue_buffer)),
      dropped(0),
      truncated(0) {}

void NotificationMailbox::sink(void* context, const uint8_t* data, size_t length) {
    static_cast<NotificationMailbox*>(context)->push(data, length);
}

bool NotificationMailbox::push(const uint8_t* data, size_t length) {
    NotificationFrame frame;
    if (length > sizeof(frame.data)) {
        truncated.fetch_add(1);
        length = sizeof(frame.data);
    }
    frame.length = static_cast<uint8_t>(length);
    if (length > 0) {
        std::memcpy(frame.data, data, length);
    }
    if (xQueueSend(queue, &frame, 0) != pdTRUE) {
        dropped.fetch_add(1);
        return false;
    }
    return true;
}

bool NotificationMailbox::receive(NotificationFrame& out, TickType_t wait_ticks) {
    return xQueueReceive(queue, &out, wait_ticks) == pdTRUE;
}

size_t NotificationMailbox::drain() {
    NotificationFrame frame;
    size_t n = 0;
    while (xQueueReceive(queue, &frame, 0) == pdTRUE) {
        ++n;
    }
    return n;
}
