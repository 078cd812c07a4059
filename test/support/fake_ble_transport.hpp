// In-memory EM1003. Responses are delivered synchronously from write()
// through the subscribed sink, the way the host task would deliver them.
#ifndef FAKE_BLE_TRANSPORT_HPP
#define FAKE_BLE_TRANSPORT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <main/ble/ble_transport.hpp>
#include <main/protocol/em1003_protocol.hpp>

class FakeTransport;

class FakeConnection : public BleConnection {
public:
    explicit FakeConnection(FakeTransport& owner) : owner(owner) {}

    bool isConnected() const override { return connected; }
    bool write(GattRole role, const uint8_t* data, size_t length) override;
    bool read(GattRole role, uint8_t* out, size_t out_size, size_t& out_length) override;
    bool subscribe(GattRole role, NotificationSink sink, void* context) override;
    void disconnect() override;

    void open() {
        connected = true;
        sink = nullptr;
        sink_context = nullptr;
        responses_sent = 0;
        held_len = 0;
    }

    bool connected = false;
    int responses_sent = 0;

private:
    void deliver(const uint8_t* frame, size_t length) {
        if (sink != nullptr) {
            sink(sink_context, frame, length);
        }
    }

    FakeTransport& owner;
    NotificationSink sink = nullptr;
    void* sink_context = nullptr;
    // Reply withheld from a silent target, sent ahead of the next one
    uint8_t held[5] = {};
    size_t held_len = 0;
};

class FakeTransport : public BleTransport {
public:
    FakeTransport() : link(*this) {
        raw_values.fill(0x0100);
        silent.fill(false);
        short_reply.fill(false);
    }

    bool findDevice(const char* address, BleDeviceHandle& out) override {
        (void)address;
        ++find_calls;
        std::memset(&out, 0, sizeof(out));
        return device_present;
    }

    BleConnection* connect(const BleDeviceHandle& device, uint32_t timeout_ms, TransportStatus& status) override {
        (void)device;
        (void)timeout_ms;
        ++connect_calls;
        status = connect_status;
        if (connect_status != TransportStatus::OK) {
            return nullptr;
        }
        link.open();
        return &link;
    }

    int transportCalls() const { return find_calls + connect_calls + writes; }

    void resetCounters() {
        find_calls = 0;
        connect_calls = 0;
        disconnect_calls = 0;
        writes = 0;
    }

    // Device behaviour
    bool device_present = true;
    TransportStatus connect_status = TransportStatus::OK;
    bool subscribe_ok = true;
    int drop_after_responses = -1;       // link drops on the write after this many responses
    bool buzzer_on = false;
    bool buzzer_ignores_set = false;
    bool garbage_before_reply = false;   // emit a 2-byte frame ahead of each reply
    bool write_error = false;            // write() fails but the link stays up
    bool name_read_fails = false;        // device name read fails, link stays up
    bool wrong_seq_reply = false;        // replies carry a sequence byte nobody asked for
    bool late_replies = false;           // silent targets answer on the next request instead
    const char* device_name = "EM1003-A1B2";
    std::array<uint16_t, 256> raw_values;
    std::array<bool, 256> silent;        // no reply for these targets
    std::array<bool, 256> short_reply;   // reply without a full value

    // Observations
    int find_calls = 0;
    int connect_calls = 0;
    int disconnect_calls = 0;
    int writes = 0;
    uint8_t last_request[Em1003Protocol::MAX_REQUEST_LEN] = {};
    size_t last_request_len = 0;

    FakeConnection link;
};

inline bool FakeConnection::write(GattRole role, const uint8_t* data, size_t length) {
    ++owner.writes;
    if (!connected || role != GattRole::WRITE || length < Em1003Protocol::HEADER_LEN) {
        return false;
    }
    if (owner.drop_after_responses >= 0 && responses_sent >= owner.drop_after_responses) {
        connected = false;
        return false;
    }
    if (owner.write_error) {
        return false;
    }
    std::memcpy(owner.last_request, data, length < sizeof(owner.last_request) ? length : sizeof(owner.last_request));
    owner.last_request_len = length;

    const uint8_t seq = data[0];
    const uint8_t command = data[1];
    const uint8_t target = data[2];
    if (held_len > 0) {
        deliver(held, held_len);
        held_len = 0;
    }

    uint8_t reply[5] = {owner.wrong_seq_reply ? static_cast<uint8_t>(seq ^ 0x80) : seq, command, target, 0, 0};
    size_t reply_len = 5;
    if (command == Em1003Protocol::CMD_BUZZER) {
        if (length > Em1003Protocol::HEADER_LEN && !owner.buzzer_ignores_set) {
            owner.buzzer_on = data[3] == Em1003Protocol::BUZZER_ON;
        }
        reply[3] = owner.buzzer_on ? Em1003Protocol::BUZZER_ON : Em1003Protocol::BUZZER_OFF;
        reply_len = 4;
    } else {
        const uint16_t raw = owner.raw_values[target];
        reply[3] = static_cast<uint8_t>(raw & 0xFF);
        reply[4] = static_cast<uint8_t>(raw >> 8);
        if (owner.short_reply[target]) {
            reply_len = 4;
        }
    }
    if (owner.silent[target]) {
        if (owner.late_replies) {
            std::memcpy(held, reply, reply_len);
            held_len = reply_len;
        }
        return true;
    }
    if (owner.garbage_before_reply) {
        const uint8_t garbage[2] = {seq, command};
        deliver(garbage, sizeof(garbage));
    }
    deliver(reply, reply_len);
    ++responses_sent;
    return true;
}

inline bool FakeConnection::read(GattRole role, uint8_t* out, size_t out_size, size_t& out_length) {
    out_length = 0;
    if (!connected || role != GattRole::DEVICE_NAME || owner.name_read_fails) {
        return false;
    }
    const size_t n = std::strlen(owner.device_name);
    out_length = n < out_size ? n : out_size;
    std::memcpy(out, owner.device_name, out_length);
    return true;
}

inline bool FakeConnection::subscribe(GattRole role, NotificationSink new_sink, void* context) {
    if (!owner.subscribe_ok || role != GattRole::NOTIFY) {
        return false;
    }
    sink = new_sink;
    sink_context = context;
    return true;
}

inline void FakeConnection::disconnect() {
    connected = false;
    ++owner.disconnect_calls;
}

#endif // FAKE_BLE_TRANSPORT_HPP
