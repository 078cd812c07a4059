#ifndef RUNTIME_SETTINGS_HPP
#define RUNTIME_SETTINGS_HPP

#include <cstdint>
#include <main/session/connection_session.hpp>

// Settings changeable over MQTT, persisted in NVS
namespace RuntimeSettings {
    // Load from NVS or fall back to Config::Tasks::Poll / Config::Session defaults
    void init();

    uint32_t getPollIntervalMs();
    // Rejects values outside Config::Tasks::Poll::{min,max}_period_ms
    bool setPollIntervalMs(uint32_t value);

    DisconnectPolicy getDisconnectPolicy();
    bool setDisconnectPolicy(DisconnectPolicy value);
}

#endif // RUNTIME_SETTINGS_HPP
