#include <main/session/connection_session.hpp>
#include <main/utils/logger.hpp>

namespace {
    static const char* TAG = "BLE_CONN";
    static constexpr uint32_t MAX_ABORT_SHIFT = 16;
}

ConnectionSession::ConnectionSession(BleTransport& transport,
                                     const char* address,
                                     const CircuitBreaker& breaker,
                                     Clock& clock,
                                     NotificationMailbox& mailbox,
                                     const ConnectionOptions& options)
    : transport(transport),
      device_address(address),
      breaker(breaker),
      clock(clock),
      mailbox(mailbox),
      options(options),
      connection(nullptr),
      has_last_failure(false),
      last_failure_ms(0),
      has_last_disconnect(false),
      last_disconnect_ms(0),
      abort_count(0),
      last_abort_ms(0) {}

ConnectError ConnectionSession::ensureConnected(BleConnection*& out) {
    out = nullptr;

    if (connection != nullptr) {
        if (connection->isConnected()) {
            out = connection;
            return ConnectError::NONE;
        }
        LOG_INFO(TAG, "Cached link to %s is gone, reconnecting", device_address);
        closeLink();
    }

    // A HALF_OPEN trial must reach the device to be meaningful
    if (has_last_failure && breaker.state() != CircuitBreaker::State::HALF_OPEN) {
        const uint32_t since = clock.nowMs() - last_failure_ms;
        if (since < options.fast_fail_window_ms) {
            LOG_WARN(TAG, "Fast-fail: last connect failure %lu s ago (window %lu s)",
                     static_cast<unsigned long>(since / 1000),
                     static_cast<unsigned long>(options.fast_fail_window_ms / 1000));
            return ConnectError::FAST_FAIL;
        }
    }

    waitBeforeConnect();
    return connectFresh(out);
}

void ConnectionSession::waitBeforeConnect() {
    const uint32_t now = clock.nowMs();

    if (abort_count > 0 && now - last_abort_ms >= options.abort_decay_ms) {
        LOG_INFO(TAG, "No abort for %lu s, resetting abort count (%lu)",
                 static_cast<unsigned long>(options.abort_decay_ms / 1000),
                 static_cast<unsigned long>(abort_count));
        abort_count = 0;
    }

    uint32_t abort_backoff = 0;
    if (abort_count > 0) {
        const uint32_t shift = abort_count < MAX_ABORT_SHIFT ? abort_count : MAX_ABORT_SHIFT;
        const uint64_t backoff = static_cast<uint64_t>(1000) << shift;
        abort_backoff = backoff > options.abort_backoff_cap_ms
                            ? options.abort_backoff_cap_ms
                            : static_cast<uint32_t>(backoff);
    }

    uint32_t wait_ms = 0;
    if (has_last_disconnect) {
        const uint32_t required = options.base_delay_ms + abort_backoff;
        const uint32_t since = now - last_disconnect_ms;
        if (since < required) {
            wait_ms = required - since;
        }
    } else {
        wait_ms = abort_backoff;
    }

    if (wait_ms > 0) {
        LOG_INFO(TAG, "Waiting %lu ms before connecting (abort count %lu)",
                 static_cast<unsigned long>(wait_ms), static_cast<unsigned long>(abort_count));
        clock.sleepMs(wait_ms);
    }
}

ConnectError ConnectionSession::connectFresh(BleConnection*& out) {
    BleDeviceHandle device;
    if (!transport.findDevice(device_address, device)) {
        LOG_ERROR(TAG, "Device %s not found", device_address);
        recordFailure(ConnectError::DEVICE_NOT_FOUND);
        return ConnectError::DEVICE_NOT_FOUND;
    }

    LOG_INFO(TAG, "Connecting to %s (timeout %lu s)", device_address,
             static_cast<unsigned long>(options.connect_timeout_ms / 1000));
    TransportStatus status = TransportStatus::FAILED;
    BleConnection* link = transport.connect(device, options.connect_timeout_ms, status);
    if (link == nullptr || status != TransportStatus::OK) {
        ConnectError error = ConnectError::CONNECT_FAILED;
        if (status == TransportStatus::ABORTED) {
            error = ConnectError::CONNECT_ABORTED;
        } else if (status == TransportStatus::TIMEOUT) {
            error = ConnectError::CONNECT_TIMEOUT;
        }
        if (link != nullptr) {
            link->disconnect();
            markDisconnected();
        }
        recordFailure(error);
        return error;
    }

    // Frames left over from a previous link cannot match anything new
    const size_t stale = mailbox.drain();
    if (stale > 0) {
        LOG_DEBUG(TAG, "Dropped %u stale notification(s)", static_cast<unsigned>(stale));
    }

    if (!link->subscribe(GattRole::NOTIFY, &NotificationMailbox::sink, &mailbox)) {
        LOG_ERROR(TAG, "Notification subscribe failed on %s, dropping link", device_address);
        link->disconnect();
        markDisconnected();
        recordFailure(ConnectError::SUBSCRIBE_FAILED);
        return ConnectError::SUBSCRIBE_FAILED;
    }

    connection = link;
    has_last_failure = false;
    abort_count = 0;
    LOG_INFO(TAG, "Connected to %s", device_address);
    out = connection;
    return ConnectError::NONE;
}

void ConnectionSession::recordFailure(ConnectError error) {
    const uint32_t now = clock.nowMs();
    has_last_failure = true;
    last_failure_ms = now;

    switch (error) {
        case ConnectError::CONNECT_ABORTED:
            ++abort_count;
            last_abort_ms = now;
            LOG_WARN(TAG, "Connection aborted (count %lu); adapter slots may be exhausted",
                     static_cast<unsigned long>(abort_count));
            break;
        case ConnectError::CONNECT_TIMEOUT:
            LOG_WARN(TAG, "Connection to %s timed out; device may be out of range or asleep", device_address);
            break;
        default:
            LOG_WARN(TAG, "Connection to %s failed: %s", device_address, errorName(error));
            break;
    }
}

void ConnectionSession::closeLink() {
    if (connection == nullptr) {
        return;
    }
    connection->disconnect();
    connection = nullptr;
    markDisconnected();
}

void ConnectionSession::markDisconnected() {
    has_last_disconnect = true;
    last_disconnect_ms = clock.nowMs();
}

void ConnectionSession::invalidate() {
    if (connection != nullptr) {
        LOG_WARN(TAG, "Invalidating link to %s", device_address);
    }
    closeLink();
}

void ConnectionSession::disconnect() {
    if (connection == nullptr) {
        return;
    }
    LOG_INFO(TAG, "Disconnecting from %s", device_address);
    closeLink();
}

bool ConnectionSession::isConnected() const {
    return connection != nullptr && connection->isConnected();
}

const char* ConnectionSession::errorName(ConnectError error) {
    switch (error) {
        case ConnectError::NONE:             return "NONE";
        case ConnectError::FAST_FAIL:        return "FAST_FAIL";
        case ConnectError::DEVICE_NOT_FOUND: return "DEVICE_NOT_FOUND";
        case ConnectError::CONNECT_ABORTED:  return "CONNECT_ABORTED";
        case ConnectError::CONNECT_TIMEOUT:  return "CONNECT_TIMEOUT";
        case ConnectError::CONNECT_FAILED:   return "CONNECT_FAILED";
        case ConnectError::SUBSCRIBE_FAILED: return "SUBSCRIBE_FAILED";
        default:                             return "UNKNOWN";
    }
}
