#ifndef NIMBLE_TRANSPORT_HPP
#define NIMBLE_TRANSPORT_HPP

#include <cstddef>
#include <cstdint>
#include <freertos/FreeRTOS.h>
#include <freertos/event_groups.h>
#include <main/ble/ble_transport.hpp>
#include <main/ble/notification_sink_slot.hpp>
#include <main/config/config.hpp>

struct ble_gap_event;
struct ble_gatt_error;
struct ble_gatt_chr;
struct ble_gatt_dsc;
struct ble_gatt_attr;

// BleTransport on the ESP-IDF NimBLE host, acting as a central with a single
// connection slot. GATT callbacks run on the host task and report back through
// an event group; the calling task blocks with a timeout.
class NimbleTransport : public BleTransport {
public:
    NimbleTransport();

    NimbleTransport(const NimbleTransport&) = delete;
    NimbleTransport& operator=(const NimbleTransport&) = delete;

    // Start the host task and wait for controller sync
    bool init();

    bool findDevice(const char* address, BleDeviceHandle& out) override;
    BleConnection* connect(const BleDeviceHandle& device, uint32_t timeout_ms, TransportStatus& status) override;

private:
    class Link : public BleConnection {
    public:
        explicit Link(NimbleTransport& owner) : owner(owner) {}

        bool isConnected() const override;
        bool write(GattRole role, const uint8_t* data, size_t length) override;
        bool read(GattRole role, uint8_t* out, size_t out_size, size_t& out_length) override;
        bool subscribe(GattRole role, NotificationSink sink, void* context) override;
        void disconnect() override;

    private:
        NimbleTransport& owner;
    };

    static int onGapEvent(struct ble_gap_event* event, void* arg);
    static int onCharacteristic(uint16_t conn_handle, const struct ble_gatt_error* error,
                                const struct ble_gatt_chr* chr, void* arg);
    static int onDescriptor(uint16_t conn_handle, const struct ble_gatt_error* error,
                            uint16_t chr_val_handle, const struct ble_gatt_dsc* dsc, void* arg);
    static int onRead(uint16_t conn_handle, const struct ble_gatt_error* error,
                      struct ble_gatt_attr* attr, void* arg);
    static int onWrite(uint16_t conn_handle, const struct ble_gatt_error* error,
                       struct ble_gatt_attr* attr, void* arg);
    static void onSync();
    static void onReset(int reason);
    static void hostTask(void* param);

    bool discover();
    uint16_t handleFor(GattRole role) const;
    bool waitFor(EventBits_t bits, uint32_t timeout_ms, EventBits_t* which = nullptr);
    void resetLink();

    static TransportStatus classifyConnectStatus(int status);

    static NimbleTransport* s_instance;

    StaticEventGroup_t events_buffer;
    EventGroupHandle_t events;
    bool synced;
    uint8_t own_addr_type;

    Link link;
    volatile bool connected;
    volatile uint16_t conn_handle;
    volatile int connect_status;

    uint16_t write_handle;
    uint16_t notify_handle;
    uint16_t notify_end_handle;
    uint16_t cccd_handle;
    uint16_t name_handle;
    int discovery_status;

    // Set by the caller's task, read by the host task on NOTIFY_RX
    NotificationSinkSlot sink_slot;

    // Filled by onRead; valid once READ_DONE is set
    uint8_t* read_buffer;
    size_t read_capacity;
    size_t read_length;
    int gatt_status;
};

#endif // NIMBLE_TRANSPORT_HPP
