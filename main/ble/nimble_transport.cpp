#include <main/ble/nimble_transport.hpp>
#include <main/utils/logger.hpp>

#include <cstdio>
#include <cstring>
#include <nimble/nimble_port.h>
#include <nimble/nimble_port_freertos.h>
#include <host/ble_hs.h>
#include <host/ble_gap.h>
#include <host/ble_gatt.h>
#include <host/util/util.h>

namespace {
    static const char* TAG = "NIMBLE";

    static constexpr EventBits_t BIT_SYNCED         = BIT0;
    static constexpr EventBits_t BIT_CONNECTED      = BIT1;
    static constexpr EventBits_t BIT_CONNECT_FAILED = BIT2;
    static constexpr EventBits_t BIT_DISCONNECTED   = BIT3;
    static constexpr EventBits_t BIT_DISC_DONE      = BIT4;
    static constexpr EventBits_t BIT_READ_DONE      = BIT5;
    static constexpr EventBits_t BIT_WRITE_DONE     = BIT6;
    static constexpr EventBits_t LINK_BITS = BIT_CONNECTED | BIT_CONNECT_FAILED | BIT_DISCONNECTED |
                                             BIT_DISC_DONE | BIT_READ_DONE | BIT_WRITE_DONE;

    // Slack on top of the controller-side connect timeout before we cancel ourselves
    static constexpr uint32_t CONNECT_GRACE_MS = 1000;

    bool parseAddress(const char* text, uint8_t out[6]) {
        unsigned int b[6];
        if (text == nullptr ||
            std::sscanf(text, "%2x:%2x:%2x:%2x:%2x:%2x", &b[0], &b[1], &b[2], &b[3], &b[4], &b[5]) != 6) {
            return false;
        }
        // Text is most-significant first, NimBLE wants little-endian
        for (int i = 0; i < 6; ++i) {
            out[5 - i] = static_cast<uint8_t>(b[i]);
        }
        return true;
    }
}

NimbleTransport* NimbleTransport::s_instance = nullptr;

NimbleTransport::NimbleTransport()
    : events(xEventGroupCreateStatic(&events_buffer)),
      synced(false),
      own_addr_type(BLE_OWN_ADDR_PUBLIC),
      link(*this),
      connected(false),
      conn_handle(BLE_HS_CONN_HANDLE_NONE),
      connect_status(0),
      write_handle(0),
      notify_handle(0),
      notify_end_handle(0),
      cccd_handle(0),
      name_handle(0),
      discovery_status(0),
      read_buffer(nullptr),
      read_capacity(0),
      read_length(0),
      gatt_status(0) {}

bool NimbleTransport::init() {
    s_instance = this;

    esp_err_t err = nimble_port_init();
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "nimble_port_init failed: %s", esp_err_to_name(err));
        return false;
    }
    ble_hs_cfg.sync_cb = onSync;
    ble_hs_cfg.reset_cb = onReset;
    nimble_port_freertos_init(hostTask);

    if (!waitFor(BIT_SYNCED, Config::Ble::sync_timeout_ms)) {
        LOG_ERROR(TAG, "Host did not sync within %lu ms", static_cast<unsigned long>(Config::Ble::sync_timeout_ms));
        return false;
    }
    LOG_INFO(TAG, "%s", "NimBLE host ready");
    return true;
}

void NimbleTransport::hostTask(void* param) {
    (void)param;
    LOG_INFO(TAG, "%s", "Host task started");
    nimble_port_run();
    nimble_port_freertos_deinit();
}

void NimbleTransport::onSync() {
    NimbleTransport* self = s_instance;
    if (self == nullptr) {
        return;
    }
    int rc = ble_hs_util_ensure_addr(0);
    if (rc != 0) {
        LOG_ERROR(TAG, "No usable identity address: %d", rc);
        return;
    }
    rc = ble_hs_id_infer_auto(0, &self->own_addr_type);
    if (rc != 0) {
        LOG_ERROR(TAG, "ble_hs_id_infer_auto failed: %d", rc);
        return;
    }
    self->synced = true;
    xEventGroupSetBits(self->events, BIT_SYNCED);
}

void NimbleTransport::onReset(int reason) {
    LOG_WARN(TAG, "Host reset, reason %d", reason);
    if (s_instance != nullptr) {
        s_instance->synced = false;
        s_instance->connected = false;
        xEventGroupSetBits(s_instance->events, BIT_DISCONNECTED);
    }
}

bool NimbleTransport::findDevice(const char* address, BleDeviceHandle& out) {
    // The device is addressed directly; no scan is performed
    if (!parseAddress(address, out.address)) {
        LOG_ERROR(TAG, "Invalid device address '%s'", address != nullptr ? address : "");
        return false;
    }
    out.address_type = Config::Ble::peer_address_type;
    return true;
}

TransportStatus NimbleTransport::classifyConnectStatus(int status) {
    if (status == 0) {
        return TransportStatus::OK;
    }
    if (status == BLE_HS_ETIMEOUT) {
        return TransportStatus::TIMEOUT;
    }
    if (status == BLE_HS_HCI_ERR(BLE_ERR_CONN_ESTABLISHMENT) ||
        status == BLE_HS_HCI_ERR(BLE_ERR_CONN_TERM_LOCAL) ||
        status == BLE_HS_ENOTCONN) {
        return TransportStatus::ABORTED;
    }
    return TransportStatus::FAILED;
}

BleConnection* NimbleTransport::connect(const BleDeviceHandle& device, uint32_t timeout_ms, TransportStatus& status) {
    status = TransportStatus::FAILED;
    if (!synced) {
        LOG_ERROR(TAG, "%s", "Connect requested before host sync");
        return nullptr;
    }
    if (connected) {
        LOG_WARN(TAG, "%s", "Single connection slot busy, dropping previous link");
        link.disconnect();
    }

    resetLink();
    xEventGroupClearBits(events, LINK_BITS);

    ble_addr_t peer;
    peer.type = device.address_type;
    std::memcpy(peer.val, device.address, sizeof(peer.val));

    int rc = ble_gap_connect(own_addr_type, &peer, static_cast<int32_t>(timeout_ms), nullptr, onGapEvent, this);
    if (rc != 0) {
        LOG_ERROR(TAG, "ble_gap_connect failed: %d", rc);
        status = classifyConnectStatus(rc);
        return nullptr;
    }

    EventBits_t which = 0;
    if (!waitFor(BIT_CONNECTED | BIT_CONNECT_FAILED, timeout_ms + CONNECT_GRACE_MS, &which)) {
        ble_gap_conn_cancel();
        LOG_WARN(TAG, "No connect event within %lu ms, cancelled", static_cast<unsigned long>(timeout_ms));
        status = TransportStatus::TIMEOUT;
        return nullptr;
    }
    if (which & BIT_CONNECT_FAILED) {
        status = classifyConnectStatus(connect_status);
        LOG_WARN(TAG, "Connect failed: status %d (%s)", connect_status, statusName(status));
        return nullptr;
    }

    if (!discover()) {
        if (connected) {
            link.disconnect();
            status = TransportStatus::FAILED;
        } else {
            // Link dropped while we were still setting it up
            status = classifyConnectStatus(connect_status);
            if (status == TransportStatus::FAILED) {
                status = TransportStatus::ABORTED;
            }
        }
        return nullptr;
    }

    status = TransportStatus::OK;
    return &link;
}

bool NimbleTransport::discover() {
    write_handle = 0;
    notify_handle = 0;
    notify_end_handle = 0;
    cccd_handle = 0;
    name_handle = 0;
    discovery_status = 0;

    int rc = ble_gattc_disc_all_chrs(conn_handle, 1, 0xFFFF, onCharacteristic, this);
    if (rc != 0) {
        LOG_ERROR(TAG, "Characteristic discovery failed to start: %d", rc);
        return false;
    }
    EventBits_t which = 0;
    if (!waitFor(BIT_DISC_DONE | BIT_DISCONNECTED, Config::Ble::discovery_timeout_ms, &which) ||
        (which & BIT_DISCONNECTED) || discovery_status != 0) {
        LOG_ERROR(TAG, "Characteristic discovery failed (status %d)", discovery_status);
        return false;
    }
    if (write_handle == 0 || notify_handle == 0) {
        LOG_ERROR(TAG, "Device lacks write (0x%04x) or notify (0x%04x) characteristic",
                  Config::Ble::write_char_uuid, Config::Ble::notify_char_uuid);
        return false;
    }
    if (notify_end_handle == 0) {
        notify_end_handle = 0xFFFF;
    }

    if (notify_end_handle > notify_handle) {
        rc = ble_gattc_disc_all_dscs(conn_handle, notify_handle, notify_end_handle, onDescriptor, this);
        if (rc == 0) {
            which = 0;
            if (!waitFor(BIT_DISC_DONE | BIT_DISCONNECTED, Config::Ble::discovery_timeout_ms, &which) ||
                (which & BIT_DISCONNECTED)) {
                return false;
            }
        }
    }
    if (cccd_handle == 0) {
        // CCCD normally directly follows the value handle
        cccd_handle = notify_handle + 1;
        LOG_WARN(TAG, "CCCD not discovered, assuming handle 0x%04x", cccd_handle);
    }

    LOG_DEBUG(TAG, "Handles: write=0x%04x notify=0x%04x cccd=0x%04x name=0x%04x",
              write_handle, notify_handle, cccd_handle, name_handle);
    return true;
}

int NimbleTransport::onCharacteristic(uint16_t conn_handle, const struct ble_gatt_error* error,
                                      const struct ble_gatt_chr* chr, void* arg) {
    (void)conn_handle;
    NimbleTransport* self = static_cast<NimbleTransport*>(arg);
    if (error->status == 0 && chr != nullptr) {
        // The first characteristic after the notify one bounds its descriptors
        if (self->notify_handle != 0 && self->notify_end_handle == 0) {
            self->notify_end_handle = chr->def_handle - 1;
        }
        const uint16_t uuid = ble_uuid_u16(&chr->uuid.u);
        if (uuid == Config::Ble::write_char_uuid) {
            self->write_handle = chr->val_handle;
        } else if (uuid == Config::Ble::notify_char_uuid) {
            self->notify_handle = chr->val_handle;
        } else if (uuid == Config::Ble::device_name_uuid) {
            self->name_handle = chr->val_handle;
        }
        return 0;
    }
    self->discovery_status = (error->status == BLE_HS_EDONE) ? 0 : error->status;
    xEventGroupSetBits(self->events, BIT_DISC_DONE);
    return 0;
}

int NimbleTransport::onDescriptor(uint16_t conn_handle, const struct ble_gatt_error* error,
                                  uint16_t chr_val_handle, const struct ble_gatt_dsc* dsc, void* arg) {
    (void)conn_handle;
    (void)chr_val_handle;
    NimbleTransport* self = static_cast<NimbleTransport*>(arg);
    if (error->status == 0 && dsc != nullptr) {
        if (ble_uuid_u16(&dsc->uuid.u) == Config::Ble::cccd_uuid) {
            self->cccd_handle = dsc->handle;
        }
        return 0;
    }
    xEventGroupSetBits(self->events, BIT_DISC_DONE);
    return 0;
}

int NimbleTransport::onRead(uint16_t conn_handle, const struct ble_gatt_error* error,
                            struct ble_gatt_attr* attr, void* arg) {
    (void)conn_handle;
    NimbleTransport* self = static_cast<NimbleTransport*>(arg);
    self->gatt_status = error->status;
    if (error->status == 0 && attr != nullptr && self->read_buffer != nullptr) {
        uint16_t copied = 0;
        // EMSGSIZE only means the value was truncated to the caller's buffer
        int rc = ble_hs_mbuf_to_flat(attr->om, self->read_buffer, static_cast<uint16_t>(self->read_capacity), &copied);
        if (rc != 0 && rc != BLE_HS_EMSGSIZE) {
            self->gatt_status = rc;
        }
        self->read_length = copied;
    }
    xEventGroupSetBits(self->events, BIT_READ_DONE);
    return 0;
}

int NimbleTransport::onWrite(uint16_t conn_handle, const struct ble_gatt_error* error,
                             struct ble_gatt_attr* attr, void* arg) {
    (void)conn_handle;
    (void)attr;
    NimbleTransport* self = static_cast<NimbleTransport*>(arg);
    self->gatt_status = error->status;
    xEventGroupSetBits(self->events, BIT_WRITE_DONE);
    return 0;
}

int NimbleTransport::onGapEvent(struct ble_gap_event* event, void* arg) {
    NimbleTransport* self = static_cast<NimbleTransport*>(arg);

    switch (event->type) {
        case BLE_GAP_EVENT_CONNECT:
            if (event->connect.status == 0) {
                self->conn_handle = event->connect.conn_handle;
                self->connected = true;
                LOG_INFO(TAG, "Link up, handle %d", event->connect.conn_handle);
                xEventGroupSetBits(self->events, BIT_CONNECTED);
            } else {
                self->connect_status = event->connect.status;
                xEventGroupSetBits(self->events, BIT_CONNECT_FAILED);
            }
            break;

        case BLE_GAP_EVENT_DISCONNECT:
            LOG_INFO(TAG, "Link down, reason 0x%03x", event->disconnect.reason);
            self->connected = false;
            self->conn_handle = BLE_HS_CONN_HANDLE_NONE;
            self->connect_status = event->disconnect.reason;
            xEventGroupSetBits(self->events, BIT_DISCONNECTED);
            break;

        case BLE_GAP_EVENT_NOTIFY_RX: {
            if (event->notify_rx.conn_handle != self->conn_handle ||
                event->notify_rx.attr_handle != self->notify_handle) {
                break;
            }
            if (!self->sink_slot.isSet()) {
                break;
            }
            uint8_t buf[Config::Ble::max_frame_len];
            uint16_t copied = 0;
            int rc = ble_hs_mbuf_to_flat(event->notify_rx.om, buf, sizeof(buf), &copied);
            if (rc == BLE_HS_EMSGSIZE) {
                LOG_WARN(TAG, "Notification of %u bytes truncated",
                         static_cast<unsigned>(OS_MBUF_PKTLEN(event->notify_rx.om)));
            }
            if (copied > 0) {
                (void)self->sink_slot.deliver(buf, copied);
            }
            break;
        }

        case BLE_GAP_EVENT_MTU:
            LOG_DEBUG(TAG, "MTU %d on handle %d", event->mtu.value, event->mtu.conn_handle);
            break;

        default:
            break;
    }
    return 0;
}

bool NimbleTransport::waitFor(EventBits_t bits, uint32_t timeout_ms, EventBits_t* which) {
    const EventBits_t got = xEventGroupWaitBits(events, bits, pdTRUE, pdFALSE, pdMS_TO_TICKS(timeout_ms)) & bits;
    if (which != nullptr) {
        *which = got;
    }
    return got != 0;
}

uint16_t NimbleTransport::handleFor(GattRole role) const {
    switch (role) {
        case GattRole::WRITE:       return write_handle;
        case GattRole::NOTIFY:      return notify_handle;
        case GattRole::DEVICE_NAME: return name_handle;
        default:                    return 0;
    }
}

void NimbleTransport::resetLink() {
    sink_slot.clear();
    read_buffer = nullptr;
    read_capacity = 0;
    read_length = 0;
}

bool NimbleTransport::Link::isConnected() const {
    return owner.connected;
}

bool NimbleTransport::Link::write(GattRole role, const uint8_t* data, size_t length) {
    const uint16_t handle = owner.handleFor(role);
    if (!owner.connected || handle == 0) {
        return false;
    }
    int rc = ble_gattc_write_no_rsp_flat(owner.conn_handle, handle, data, static_cast<uint16_t>(length));
    if (rc != 0) {
        LOG_WARN(TAG, "Write to 0x%04x failed: %d", handle, rc);
        return false;
    }
    return true;
}

bool NimbleTransport::Link::read(GattRole role, uint8_t* out, size_t out_size, size_t& out_length) {
    out_length = 0;
    const uint16_t handle = owner.handleFor(role);
    if (!owner.connected || handle == 0) {
        LOG_WARN(TAG, "No readable handle for role %d", static_cast<int>(role));
        return false;
    }

    owner.read_buffer = out;
    owner.read_capacity = out_size;
    owner.read_length = 0;
    owner.gatt_status = 0;
    xEventGroupClearBits(owner.events, BIT_READ_DONE);

    int rc = ble_gattc_read(owner.conn_handle, handle, onRead, &owner);
    if (rc != 0) {
        LOG_WARN(TAG, "Read of 0x%04x failed to start: %d", handle, rc);
        owner.read_buffer = nullptr;
        return false;
    }

    EventBits_t which = 0;
    const bool done = owner.waitFor(BIT_READ_DONE | BIT_DISCONNECTED, Config::Ble::gatt_op_timeout_ms, &which);
    owner.read_buffer = nullptr;
    if (!done || !(which & BIT_READ_DONE) || owner.gatt_status != 0) {
        LOG_WARN(TAG, "Read of 0x%04x failed (status %d)", handle, owner.gatt_status);
        return false;
    }
    out_length = owner.read_length;
    return true;
}

bool NimbleTransport::Link::subscribe(GattRole role, NotificationSink sink, void* context) {
    if (role != GattRole::NOTIFY || !owner.connected || owner.cccd_handle == 0) {
        return false;
    }
    owner.sink_slot.set(sink, context);

    static const uint8_t enable_notify[2] = { 0x01, 0x00 };
    owner.gatt_status = 0;
    xEventGroupClearBits(owner.events, BIT_WRITE_DONE);
    int rc = ble_gattc_write_flat(owner.conn_handle, owner.cccd_handle, enable_notify, sizeof(enable_notify),
                                  onWrite, &owner);
    EventBits_t which = 0;
    if (rc != 0 ||
        !owner.waitFor(BIT_WRITE_DONE | BIT_DISCONNECTED, Config::Ble::gatt_op_timeout_ms, &which) ||
        !(which & BIT_WRITE_DONE) || owner.gatt_status != 0) {
        LOG_WARN(TAG, "CCCD write failed (rc %d, status %d)", rc, owner.gatt_status);
        owner.sink_slot.clear();
        return false;
    }
    return true;
}

void NimbleTransport::Link::disconnect() {
    if (owner.connected) {
        xEventGroupClearBits(owner.events, BIT_DISCONNECTED);
        int rc = ble_gap_terminate(owner.conn_handle, BLE_ERR_REM_USER_CONN_TERM);
        if (rc == 0) {
            if (!owner.waitFor(BIT_DISCONNECTED, Config::Ble::disconnect_timeout_ms)) {
                LOG_WARN(TAG, "%s", "No disconnect event after terminate");
            }
        } else if (rc != BLE_HS_ENOTCONN) {
            LOG_WARN(TAG, "ble_gap_terminate failed: %d", rc);
        }
    }
    owner.resetLink();
}
