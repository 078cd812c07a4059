// Transport primitives the session engine needs from the BLE stack. The
// concrete implementation lives in nimble_transport; tests use a fake.
#ifndef BLE_TRANSPORT_HPP
#define BLE_TRANSPORT_HPP

#include <cstddef>
#include <cstdint>

enum class GattRole : uint8_t {
    WRITE = 0,        // request frames, write without response
    NOTIFY = 1,       // response frames
    DEVICE_NAME = 2   // 0x2A00, read once
};

enum class TransportStatus : uint8_t {
    OK = 0,
    ABORTED = 1,   // link dropped during establishment (slot exhaustion, interference)
    TIMEOUT = 2,
    FAILED = 3
};

struct BleDeviceHandle {
    uint8_t address[6];    // little-endian, as the controller expects it
    uint8_t address_type;
};

// Called from the BLE host task for every notification; must not block
using NotificationSink = void (*)(void* context, const uint8_t* data, size_t length);

class BleConnection {
public:
    virtual ~BleConnection() = default;

    virtual bool isConnected() const = 0;
    virtual bool write(GattRole role, const uint8_t* data, size_t length) = 0;
    virtual bool read(GattRole role, uint8_t* out, size_t out_size, size_t& out_length) = 0;
    virtual bool subscribe(GattRole role, NotificationSink sink, void* context) = 0;
    // Tears the link down; the object must not be used afterwards
    virtual void disconnect() = 0;
};

class BleTransport {
public:
    virtual ~BleTransport() = default;

    virtual bool findDevice(const char* address, BleDeviceHandle& out) = 0;
    // Single attempt. Returns nullptr on failure with status set accordingly.
    // The transport owns the returned connection.
    virtual BleConnection* connect(const BleDeviceHandle& device, uint32_t timeout_ms, TransportStatus& status) = 0;

    static const char* statusName(TransportStatus status) {
        switch (status) {
            case TransportStatus::OK:      return "OK";
            case TransportStatus::ABORTED: return "ABORTED";
            case TransportStatus::TIMEOUT: return "TIMEOUT";
            case TransportStatus::FAILED:  return "FAILED";
            default:                       return "UNKNOWN";
        }
    }
};

#endif // BLE_TRANSPORT_HPP
