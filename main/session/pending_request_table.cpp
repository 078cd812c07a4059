#include <main/session/pending_request_table.hpp>

PendingRequestTable::PendingRequestTable() : entries{} {}

PendingRequestTable::Entry* PendingRequestTable::findLocked(RequestKey key) {
    for (Entry& e : entries) {
        if (e.used && e.key == key) {
            return &e;
        }
    }
    return nullptr;
}

const PendingRequestTable::Entry* PendingRequestTable::findLocked(RequestKey key) const {
    for (const Entry& e : entries) {
        if (e.used && e.key == key) {
            return &e;
        }
    }
    return nullptr;
}

bool PendingRequestTable::add(RequestKey key, uint32_t now_ms) {
    MutexLock lock(mutex);
    if (findLocked(key) != nullptr) {
        return false;
    }
    for (Entry& e : entries) {
        if (!e.used) {
            e.used = true;
            e.key = key;
            e.created_ms = now_ms;
            e.state = SlotState::PENDING;
            e.response = ParsedResponse{};
            return true;
        }
    }
    return false;
}

bool PendingRequestTable::resolve(RequestKey key, const ParsedResponse& response) {
    MutexLock lock(mutex);
    Entry* e = findLocked(key);
    if (e == nullptr || e->state != SlotState::PENDING) {
        return false;
    }
    e->response = response;
    e->state = SlotState::RESOLVED;
    return true;
}

SlotState PendingRequestTable::state(RequestKey key) const {
    MutexLock lock(mutex);
    const Entry* e = findLocked(key);
    return e != nullptr ? e->state : SlotState::NONE;
}

bool PendingRequestTable::take(RequestKey key, ParsedResponse& out) {
    MutexLock lock(mutex);
    Entry* e = findLocked(key);
    if (e == nullptr || e->state != SlotState::RESOLVED) {
        return false;
    }
    out = e->response;
    e->used = false;
    e->state = SlotState::NONE;
    return true;
}

bool PendingRequestTable::remove(RequestKey key) {
    MutexLock lock(mutex);
    Entry* e = findLocked(key);
    if (e == nullptr) {
        return false;
    }
    e->used = false;
    e->state = SlotState::NONE;
    return true;
}

size_t PendingRequestTable::sweepExpired(uint32_t now_ms, uint32_t max_age_ms, RequestKey* expired, size_t max_expired) {
    MutexLock lock(mutex);
    size_t removed = 0;
    for (Entry& e : entries) {
        if (!e.used) {
            continue;
        }
        // Unsigned subtraction stays correct across the 32-bit wrap
        const uint32_t age = now_ms - e.created_ms;
        if (age > max_age_ms) {
            if (expired != nullptr && removed < max_expired) {
                expired[removed] = e.key;
            }
            e.used = false;
            e.state = SlotState::NONE;
            ++removed;
        }
    }
    return removed;
}

size_t PendingRequestTable::invalidateAll(RequestKey* cancelled, size_t max_cancelled) {
    MutexLock lock(mutex);
    size_t removed = 0;
    for (Entry& e : entries) {
        if (!e.used) {
            continue;
        }
        if (cancelled != nullptr && removed < max_cancelled) {
            cancelled[removed] = e.key;
        }
        e.used = false;
        e.state = SlotState::NONE;
        ++removed;
    }
    return removed;
}

size_t PendingRequestTable::size() const {
    MutexLock lock(mutex);
    size_t n = 0;
    for (const Entry& e : entries) {
        if (e.used) {
            ++n;
        }
    }
    return n;
}
