#ifndef CONNECTION_SESSION_HPP
#define CONNECTION_SESSION_HPP

#include <cstdint>
#include <main/ble/ble_transport.hpp>
#include <main/config/config.hpp>
#include <main/session/circuit_breaker.hpp>
#include <main/session/notification_mailbox.hpp>
#include <main/utils/clock.hpp>

enum class ConnectError : uint8_t {
    NONE = 0,
    FAST_FAIL = 1,
    DEVICE_NOT_FOUND = 2,
    CONNECT_ABORTED = 3,
    CONNECT_TIMEOUT = 4,
    CONNECT_FAILED = 5,
    SUBSCRIBE_FAILED = 6
};

// What happens to the link after a batch read
enum class DisconnectPolicy : uint8_t {
    EAGER = 0,       // free the adapter slot right away
    KEEP_ALIVE = 1   // keep the link for the next cycle
};

struct ConnectionOptions {
    uint32_t connect_timeout_ms = Config::Ble::connect_timeout_ms;
    uint32_t fast_fail_window_ms = Config::Session::fast_fail_window_ms;
    uint32_t base_delay_ms = Config::Session::base_reconnect_delay_ms;
    uint32_t abort_backoff_cap_ms = Config::Session::abort_backoff_cap_ms;
    uint32_t abort_decay_ms = Config::Session::abort_decay_ms;
};

// Zero-or-one live link to one device. Not thread-safe; SensorSession holds
// its lock around every call.
class ConnectionSession {
public:
    ConnectionSession(BleTransport& transport,
                      const char* address,
                      const CircuitBreaker& breaker,
                      Clock& clock,
                      NotificationMailbox& mailbox,
                      const ConnectionOptions& options = ConnectionOptions());

    ConnectionSession(const ConnectionSession&) = delete;
    ConnectionSession& operator=(const ConnectionSession&) = delete;

    // Reuse the cached link or establish a new one. On NONE, out is a live
    // connection; on any error, out is nullptr and no link is cached.
    ConnectError ensureConnected(BleConnection*& out);

    // Close and forget the link after a transport error
    void invalidate();
    // Close the link on purpose (eager policy, shutdown)
    void disconnect();

    bool isConnected() const;
    uint32_t abortCount() const { return abort_count; }
    const char* address() const { return device_address; }

    static const char* errorName(ConnectError error);

private:
    void waitBeforeConnect();
    ConnectError connectFresh(BleConnection*& out);
    void recordFailure(ConnectError error);
    void closeLink();
    void markDisconnected();

    BleTransport& transport;
    const char* device_address;
    const CircuitBreaker& breaker;
    Clock& clock;
    NotificationMailbox& mailbox;
    ConnectionOptions options;

    BleConnection* connection;

    bool has_last_failure;
    uint32_t last_failure_ms;
    bool has_last_disconnect;
    uint32_t last_disconnect_ms;
    uint32_t abort_count;
    uint32_t last_abort_ms;
};

#endif // CONNECTION_SESSION_HPP
