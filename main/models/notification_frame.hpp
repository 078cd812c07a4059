#ifndef NOTIFICATION_FRAME_HPP
#define NOTIFICATION_FRAME_HPP

#include <cstdint>
#include <main/config/config.hpp>

// Raw notification payload copied out of the BLE host task
struct NotificationFrame {
    uint8_t length;
    uint8_t data[Config::Ble::max_frame_len];
};

#endif // NOTIFICATION_FRAME_HPP
