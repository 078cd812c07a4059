#ifndef SENSOR_SESSION_HPP
#define SENSOR_SESSION_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <main/ble/ble_transport.hpp>
#include <main/config/config.hpp>
#include <main/models/sensor_snapshot.hpp>
#include <main/protocol/response_decoder.hpp>
#include <main/session/circuit_breaker.hpp>
#include <main/session/connection_session.hpp>
#include <main/session/notification_mailbox.hpp>
#include <main/session/pending_request_table.hpp>
#include <main/session/sequence_id_allocator.hpp>
#include <main/utils/clock.hpp>
#include <main/utils/rtos_mutex.hpp>

struct SessionOptions {
    uint32_t response_timeout_ms = Config::Session::response_timeout_ms;
    uint32_t pending_max_age_ms = Config::Session::pending_max_age_ms;
    uint32_t batch_pacing_ms = Config::Session::batch_pacing_ms;
    uint32_t lock_timeout_ms = Config::Session::lock_timeout_ms;
    DisconnectPolicy disconnect_policy = Config::Session::eager_disconnect ? DisconnectPolicy::EAGER
                                                                          : DisconnectPolicy::KEEP_ALIVE;
    ConnectionOptions connection;
    BreakerOptions breaker;
};

enum class ReadResult : uint8_t {
    COMPLETED = 0,          // batch ran; individual sensors may still be NO_DATA
    BLOCKED = 1,            // circuit breaker open, no I/O performed
    CONNECTION_FAILED = 2,
    BUSY = 3                // another operation held the session lock too long
};

// Protocol session with one EM1003. All public operations are serialized by
// the session lock, so tasks may share one instance.
class SensorSession {
public:
    SensorSession(BleTransport& transport,
                  const char* address,
                  Clock& clock,
                  const SessionOptions& options = SessionOptions(),
                  SequenceIdAllocator::RandomSource random_source = esp_random);

    SensorSession(const SensorSession&) = delete;
    SensorSession& operator=(const SensorSession&) = delete;

    bool readSensor(uint8_t sensor_id, float& out_value);
    // snapshot always carries one entry per table sensor
    ReadResult readAllSensors(SensorSnapshot& snapshot);

    bool readBuzzerState(bool& out_on);
    bool setBuzzerState(bool on);

    bool readDeviceName(char* out, size_t out_size);

    void disconnect();

    void setDisconnectPolicy(DisconnectPolicy policy);
    DisconnectPolicy disconnectPolicy() const { return policy.load(); }

    // Diagnostics; take the session lock, so not for use from inside an operation
    void describeBreaker(char* out, size_t out_size);
    // False if the session lock could not be taken in time
    bool breakerState(CircuitBreaker::State& out);

    // Direct access for tests and status reporting
    const CircuitBreaker& breaker() const { return circuit; }
    const PendingRequestTable& pendingRequests() const { return pending; }
    const SequenceIdAllocator& sequenceIds() const { return seq_ids; }
    const ConnectionSession& connection() const { return link; }
    uint32_t unmatchedFrames() const { return unmatched_frames; }
    uint32_t malformedFrames() const { return malformed_frames; }

    static const char* resultName(ReadResult result);

private:
    enum class Exchange : uint8_t {
        RESPONSE = 0,
        TIMEOUT = 1,
        CANCELLED = 2,
        WRITE_FAILED = 3,
        LINK_LOST = 4,
        NO_SLOT = 5
    };

    // Gate, sweep and connect. Anything but COMPLETED means the operation must
    // stop; a connection failure has already been recorded on the breaker.
    ReadResult beginOperation(const char* op, BleConnection*& conn);

    Exchange exchange(BleConnection* conn, uint8_t command, uint8_t target,
                      const uint8_t* payload, size_t payload_len, ParsedResponse& out);
    Exchange awaitResponse(BleConnection* conn, RequestKey key, ParsedResponse& out);
    void handleFrame(const NotificationFrame& frame);

    bool buzzerExchange(const char* op, const uint8_t* payload, size_t payload_len, bool& out_on);
    // Breaker bookkeeping for one exchange. A transport error drops the link
    // (conn is then dangling).
    void settleExchange(Exchange result, BleConnection* conn);

    void sweepExpired();
    void purgePending();
    void dropConnection();

    static bool isTransportError(Exchange result);
    static const char* exchangeName(Exchange result);

    Clock& clock;
    SessionOptions options;
    std::atomic<DisconnectPolicy> policy;

    NotificationMailbox mailbox;
    SequenceIdAllocator seq_ids;
    PendingRequestTable pending;
    CircuitBreaker circuit;
    ConnectionSession link;
    RtosMutex op_mutex;

    uint32_t unmatched_frames;
    uint32_t malformed_frames;
};

#endif // SENSOR_SESSION_HPP
