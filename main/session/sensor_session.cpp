#include <main/session/sensor_session.hpp>
#include <main/protocol/em1003_protocol.hpp>
#include <main/protocol/sensor_table.hpp>
#include <main/utils/logger.hpp>

namespace {
    static const char* TAG = "EM1003";

    // Upper bound for one mailbox wait, so a dropped link is noticed quickly
    static constexpr uint32_t RECEIVE_SLICE_MS = 100;

    void markFrom(SensorSnapshot& snapshot, size_t first, ReadingState state) {
        for (size_t i = first; i < snapshot.count; ++i) {
            snapshot.readings[i].state = state;
            snapshot.readings[i].value = 0.0f;
        }
    }
}

SensorSession::SensorSession(BleTransport& transport,
                             const char* address,
                             Clock& clock,
                             const SessionOptions& options,
                             SequenceIdAllocator::RandomSource random_source)
    : clock(clock),
      options(options),
      policy(options.disconnect_policy),
      mailbox(),
      seq_ids(random_source),
      pending(),
      circuit(options.breaker),
      link(transport, address, circuit, clock, mailbox, options.connection),
      op_mutex(),
      unmatched_frames(0),
      malformed_frames(0) {}

ReadResult SensorSession::beginOperation(const char* op, BleConnection*& conn) {
    conn = nullptr;
    uint32_t remaining_ms = 0;
    if (!circuit.canAttempt(clock.nowMs(), &remaining_ms)) {
        LOG_WARN(TAG, "%s blocked: circuit %s, retry in %lu s", op,
                 CircuitBreaker::stateName(circuit.state()),
                 static_cast<unsigned long>((remaining_ms + 999) / 1000));
        return ReadResult::BLOCKED;
    }

    sweepExpired();

    const ConnectError error = link.ensureConnected(conn);
    if (error != ConnectError::NONE) {
        LOG_ERROR(TAG, "%s: no connection (%s)", op, ConnectionSession::errorName(error));
        circuit.recordFailure(clock.nowMs());
        purgePending();
        conn = nullptr;
        return ReadResult::CONNECTION_FAILED;
    }
    return ReadResult::COMPLETED;
}

SensorSession::Exchange SensorSession::exchange(BleConnection* conn, uint8_t command, uint8_t target,
                                                const uint8_t* payload, size_t payload_len,
                                                ParsedResponse& out) {
    const uint8_t seq = seq_ids.allocate();
    const RequestKey key{seq, target};
    if (!pending.add(key, clock.nowMs())) {
        seq_ids.release(seq);
        LOG_ERROR(TAG, "No pending slot for seq=0x%02x target=0x%02x", seq, target);
        return Exchange::NO_SLOT;
    }

    uint8_t frame[Em1003Protocol::MAX_REQUEST_LEN];
    const size_t length = Em1003Protocol::encodeRequest(seq, command, target, payload, payload_len,
                                                        frame, sizeof(frame));
    LOG_HEX(TAG, "TX", frame, length);

    Exchange result;
    if (length == 0 || !conn->write(GattRole::WRITE, frame, length)) {
        pending.remove(key);
        result = conn->isConnected() ? Exchange::WRITE_FAILED : Exchange::LINK_LOST;
    } else {
        result = awaitResponse(conn, key, out);
    }

    seq_ids.release(seq);
    if (result != Exchange::RESPONSE) {
        LOG_WARN(TAG, "%s seq=0x%02x target=0x%02x: %s", Em1003Protocol::commandName(command),
                 seq, target, exchangeName(result));
    }
    return result;
}

SensorSession::Exchange SensorSession::awaitResponse(BleConnection* conn, RequestKey key, ParsedResponse& out) {
    // The deadline runs on the session clock; the tick bound only stops a
    // clock that never advances from stalling the task.
    const uint32_t started_ms = clock.nowMs();
    TimeOut_t backstop;
    vTaskSetTimeOutState(&backstop);
    TickType_t remaining = pdMS_TO_TICKS(options.response_timeout_ms);
    const TickType_t slice = pdMS_TO_TICKS(RECEIVE_SLICE_MS);
    NotificationFrame frame;

    for (;;) {
        while (mailbox.receive(frame, 0)) {
            handleFrame(frame);
        }

        const SlotState state = pending.state(key);
        if (state == SlotState::RESOLVED) {
            return pending.take(key, out) ? Exchange::RESPONSE : Exchange::CANCELLED;
        }
        if (state == SlotState::NONE) {
            return Exchange::CANCELLED;
        }

        if (!conn->isConnected()) {
            pending.remove(key);
            return Exchange::LINK_LOST;
        }
        const uint32_t elapsed_ms = clock.nowMs() - started_ms;
        if (elapsed_ms >= options.response_timeout_ms ||
            xTaskCheckForTimeOut(&backstop, &remaining) == pdTRUE) {
            pending.remove(key);
            return Exchange::TIMEOUT;
        }

        TickType_t wait = pdMS_TO_TICKS(options.response_timeout_ms - elapsed_ms);
        if (wait > remaining) {
            wait = remaining;
        }
        if (wait > slice) {
            wait = slice;
        }
        if (mailbox.receive(frame, wait)) {
            handleFrame(frame);
        }
    }
}

void SensorSession::handleFrame(const NotificationFrame& frame) {
    LOG_HEX(TAG, "RX", frame.data, frame.length);

    ParsedResponse response;
    const DecodeStatus status = ResponseDecoder::decode(frame.data, frame.length, response);
    if (status == DecodeStatus::FRAME_TOO_SHORT) {
        ++malformed_frames;
        LOG_WARN(TAG, "Discarding %u-byte notification: %s", static_cast<unsigned>(frame.length),
                 ResponseDecoder::statusName(status));
        return;
    }
    if (status == DecodeStatus::INSUFFICIENT_DATA) {
        LOG_WARN(TAG, "seq=0x%02x target=0x%02x carries no value", response.seq, response.target);
    }

    if (!pending.resolve(RequestKey{response.seq, response.target}, response)) {
        ++unmatched_frames;
        LOG_WARN(TAG, "Unmatched response seq=0x%02x cmd=0x%02x target=0x%02x",
                 response.seq, response.command, response.target);
    }
}

void SensorSession::settleExchange(Exchange result, BleConnection* conn) {
    if (result == Exchange::RESPONSE) {
        circuit.recordSuccess();
        return;
    }
    circuit.recordFailure(clock.nowMs());
    if (isTransportError(result) || !conn->isConnected()) {
        dropConnection();
    }
}

bool SensorSession::isTransportError(Exchange result) {
    return result == Exchange::WRITE_FAILED || result == Exchange::LINK_LOST;
}

bool SensorSession::readSensor(uint8_t sensor_id, float& out_value) {
    MutexLock lock(op_mutex, pdMS_TO_TICKS(options.lock_timeout_ms));
    if (!lock.locked()) {
        LOG_WARN(TAG, "read_sensor 0x%02x: session busy", sensor_id);
        return false;
    }

    BleConnection* conn = nullptr;
    if (beginOperation("read_sensor", conn) != ReadResult::COMPLETED) {
        return false;
    }

    ParsedResponse response;
    const Exchange result = exchange(conn, Em1003Protocol::CMD_READ_SENSOR, sensor_id, nullptr, 0, response);
    settleExchange(result, conn);
    if (result != Exchange::RESPONSE || !response.has_value) {
        return false;
    }
    out_value = response.value;
    LOG_DEBUG(TAG, "Sensor 0x%02x = %.3f (raw %u)", sensor_id, static_cast<double>(response.value),
              static_cast<unsigned>(response.raw));
    return true;
}

ReadResult SensorSession::readAllSensors(SensorSnapshot& snapshot) {
    snapshot.count = SensorTable::count();
    for (size_t i = 0; i < snapshot.count; ++i) {
        snapshot.readings[i].sensor_id = SensorTable::at(i).id;
        snapshot.readings[i].state = ReadingState::NOT_REQUESTED;
        snapshot.readings[i].value = 0.0f;
    }
    snapshot.ts_ms = clock.nowMs();

    MutexLock lock(op_mutex, pdMS_TO_TICKS(options.lock_timeout_ms));
    if (!lock.locked()) {
        LOG_WARN(TAG, "%s", "read_all: session busy");
        markFrom(snapshot, 0, ReadingState::NO_DATA);
        return ReadResult::BUSY;
    }

    BleConnection* conn = nullptr;
    const ReadResult begin = beginOperation("read_all", conn);
    if (begin != ReadResult::COMPLETED) {
        markFrom(snapshot, 0, ReadingState::NO_DATA);
        return begin;
    }

    size_t answered = 0;
    bool link_lost = false;
    for (size_t i = 0; i < snapshot.count; ++i) {
        SensorReading& reading = snapshot.readings[i];
        if (!conn->isConnected()) {
            LOG_WARN(TAG, "Link lost after %u of %u sensors, aborting batch",
                     static_cast<unsigned>(i), static_cast<unsigned>(snapshot.count));
            markFrom(snapshot, i, ReadingState::NO_DATA);
            link_lost = true;
            break;
        }

        ParsedResponse response;
        const Exchange result = exchange(conn, Em1003Protocol::CMD_READ_SENSOR, reading.sensor_id,
                                         nullptr, 0, response);
        if (result == Exchange::RESPONSE && response.has_value) {
            reading.state = ReadingState::VALUE;
            reading.value = response.value;
            ++answered;
        } else {
            reading.state = ReadingState::NO_DATA;
        }
        if (isTransportError(result)) {
            LOG_WARN(TAG, "Transport error on sensor 0x%02x, aborting batch", reading.sensor_id);
            markFrom(snapshot, i + 1, ReadingState::NO_DATA);
            link_lost = true;
            break;
        }

        if (i + 1 < snapshot.count) {
            clock.sleepMs(options.batch_pacing_ms);
        }
    }
    if (!link_lost && !conn->isConnected()) {
        link_lost = true;
    }

    // One failed sensor should not count against the device as a whole
    if (answered * 2 >= snapshot.count) {
        circuit.recordSuccess();
    } else {
        circuit.recordFailure(clock.nowMs());
    }
    LOG_INFO(TAG, "Batch read: %u/%u sensors answered", static_cast<unsigned>(answered),
             static_cast<unsigned>(snapshot.count));

    if (link_lost) {
        dropConnection();
    } else if (policy.load() == DisconnectPolicy::EAGER) {
        link.disconnect();
        purgePending();
    }

    snapshot.ts_ms = clock.nowMs();
    return ReadResult::COMPLETED;
}

bool SensorSession::buzzerExchange(const char* op, const uint8_t* payload, size_t payload_len, bool& out_on) {
    MutexLock lock(op_mutex, pdMS_TO_TICKS(options.lock_timeout_ms));
    if (!lock.locked()) {
        LOG_WARN(TAG, "%s: session busy", op);
        return false;
    }

    BleConnection* conn = nullptr;
    if (beginOperation(op, conn) != ReadResult::COMPLETED) {
        return false;
    }

    ParsedResponse response;
    const Exchange result = exchange(conn, Em1003Protocol::CMD_BUZZER, Em1003Protocol::BUZZER_TARGET,
                                     payload, payload_len, response);
    settleExchange(result, conn);
    if (result != Exchange::RESPONSE || !response.has_value) {
        return false;
    }
    out_on = response.buzzer_on;
    return true;
}

bool SensorSession::readBuzzerState(bool& out_on) {
    bool on = false;
    if (!buzzerExchange("read_buzzer", nullptr, 0, on)) {
        return false;
    }
    out_on = on;
    LOG_DEBUG(TAG, "Buzzer is %s", on ? "on" : "off");
    return true;
}

bool SensorSession::setBuzzerState(bool on) {
    const uint8_t state = on ? Em1003Protocol::BUZZER_ON : Em1003Protocol::BUZZER_OFF;
    bool reported = !on;
    if (!buzzerExchange("set_buzzer", &state, 1, reported)) {
        return false;
    }
    if (reported != on) {
        LOG_WARN(TAG, "Buzzer set to %s but device reports %s", on ? "on" : "off", reported ? "on" : "off");
        return false;
    }
    LOG_INFO(TAG, "Buzzer %s", on ? "on" : "off");
    return true;
}

bool SensorSession::readDeviceName(char* out, size_t out_size) {
    if (out == nullptr || out_size < 2) {
        return false;
    }
    out[0] = '\0';

    MutexLock lock(op_mutex, pdMS_TO_TICKS(options.lock_timeout_ms));
    if (!lock.locked()) {
        LOG_WARN(TAG, "%s", "read_device_name: session busy");
        return false;
    }

    BleConnection* conn = nullptr;
    if (beginOperation("read_device_name", conn) != ReadResult::COMPLETED) {
        return false;
    }

    size_t length = 0;
    if (!conn->read(GattRole::DEVICE_NAME, reinterpret_cast<uint8_t*>(out), out_size - 1, length)) {
        LOG_WARN(TAG, "%s", "Device name read failed");
        circuit.recordFailure(clock.nowMs());
        dropConnection();
        out[0] = '\0';
        return false;
    }
    circuit.recordSuccess();
    out[length < out_size ? length : out_size - 1] = '\0';
    LOG_INFO(TAG, "Device name: %s", out);
    return true;
}

void SensorSession::disconnect() {
    MutexLock lock(op_mutex, pdMS_TO_TICKS(options.lock_timeout_ms));
    if (!lock.locked()) {
        LOG_WARN(TAG, "%s", "disconnect: session busy");
        return;
    }
    link.disconnect();
    purgePending();
    mailbox.drain();
}

void SensorSession::setDisconnectPolicy(DisconnectPolicy value) {
    policy.store(value);
    LOG_INFO(TAG, "Disconnect policy: %s", value == DisconnectPolicy::EAGER ? "eager" : "keep-alive");
}

void SensorSession::describeBreaker(char* out, size_t out_size) {
    MutexLock lock(op_mutex, pdMS_TO_TICKS(options.lock_timeout_ms));
    if (!lock.locked()) {
        if (out != nullptr && out_size > 0) {
            out[0] = '\0';
        }
        return;
    }
    circuit.describe(clock.nowMs(), out, out_size);
}

bool SensorSession::breakerState(CircuitBreaker::State& out) {
    MutexLock lock(op_mutex, pdMS_TO_TICKS(options.lock_timeout_ms));
    if (!lock.locked()) {
        return false;
    }
    out = circuit.state();
    return true;
}

void SensorSession::sweepExpired() {
    RequestKey expired[PendingRequestTable::CAPACITY];
    const size_t n = pending.sweepExpired(clock.nowMs(), options.pending_max_age_ms,
                                          expired, PendingRequestTable::CAPACITY);
    for (size_t i = 0; i < n && i < PendingRequestTable::CAPACITY; ++i) {
        seq_ids.release(expired[i].seq);
    }
    if (n > 0) {
        LOG_WARN(TAG, "Expired %u stale pending request(s)", static_cast<unsigned>(n));
    }
}

void SensorSession::purgePending() {
    RequestKey cancelled[PendingRequestTable::CAPACITY];
    const size_t n = pending.invalidateAll(cancelled, PendingRequestTable::CAPACITY);
    for (size_t i = 0; i < n && i < PendingRequestTable::CAPACITY; ++i) {
        seq_ids.release(cancelled[i].seq);
    }
    if (n > 0) {
        LOG_DEBUG(TAG, "Cancelled %u pending request(s)", static_cast<unsigned>(n));
    }
}

void SensorSession::dropConnection() {
    link.invalidate();
    purgePending();
    mailbox.drain();
}

const char* SensorSession::resultName(ReadResult result) {
    switch (result) {
        case ReadResult::COMPLETED:         return "COMPLETED";
        case ReadResult::BLOCKED:           return "BLOCKED";
        case ReadResult::CONNECTION_FAILED: return "CONNECTION_FAILED";
        case ReadResult::BUSY:              return "BUSY";
        default:                            return "UNKNOWN";
    }
}

const char* SensorSession::exchangeName(Exchange result) {
    switch (result) {
        case Exchange::RESPONSE:     return "response";
        case Exchange::TIMEOUT:      return "timeout";
        case Exchange::CANCELLED:    return "cancelled";
        case Exchange::WRITE_FAILED: return "write failed";
        case Exchange::LINK_LOST:    return "link lost";
        case Exchange::NO_SLOT:      return "no pending slot";
        default:                     return "unknown";
    }
}
