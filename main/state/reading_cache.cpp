#include <main/state/reading_cache.hpp>

ReadingCache::ReadingCache(uint32_t stale_after_ms)
    : stale_after_ms(stale_after_ms), slots{}, used(0) {}

ReadingCache::Slot* ReadingCache::slotFor(uint8_t sensor_id) {
    for (size_t i = 0; i < used; ++i) {
        if (slots[i].sensor_id == sensor_id) {
            return &slots[i];
        }
    }
    if (used == MAX_SENSORS) {
        return nullptr;
    }
    Slot& slot = slots[used++];
    slot.sensor_id = sensor_id;
    slot.has_value = false;
    slot.value = 0.0f;
    slot.updated_ms = 0;
    return &slot;
}

void ReadingCache::apply(const SensorSnapshot& snapshot, uint32_t now_ms, TelemetryReport& report) {
    report.count = 0;
    report.valid_count = 0;

    for (size_t i = 0; i < snapshot.count && i < MAX_SENSORS; ++i) {
        const SensorReading& reading = snapshot.readings[i];
        TelemetryEntry& entry = report.entries[report.count++];
        entry.sensor_id = reading.sensor_id;
        entry.available = false;
        entry.fresh = false;
        entry.value = 0.0f;
        entry.age_ms = 0;

        Slot* slot = slotFor(reading.sensor_id);
        if (reading.state == ReadingState::VALUE) {
            if (slot != nullptr) {
                slot->has_value = true;
                slot->value = reading.value;
                slot->updated_ms = now_ms;
            }
            entry.available = true;
            entry.fresh = true;
            entry.value = reading.value;
            ++report.valid_count;
            continue;
        }

        if (slot != nullptr && slot->has_value) {
            const uint32_t age = now_ms - slot->updated_ms;
            if (age < stale_after_ms) {
                entry.available = true;
                entry.value = slot->value;
                entry.age_ms = age;
            }
        }
    }
    report.update_ok = report.valid_count > 0;
}

size_t ReadingCache::cachedCount() const {
    size_t n = 0;
    for (size_t i = 0; i < used; ++i) {
        if (slots[i].has_value) {
            ++n;
        }
    }
    return n;
}
