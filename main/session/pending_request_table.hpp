#ifndef PENDING_REQUEST_TABLE_HPP
#define PENDING_REQUEST_TABLE_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <main/protocol/response_decoder.hpp>
#include <main/utils/rtos_mutex.hpp>

struct RequestKey {
    uint8_t seq;
    uint8_t target;
};

inline bool operator==(const RequestKey& a, const RequestKey& b) {
    return a.seq == b.seq && a.target == b.target;
}

// NONE covers both "never added" and "cancelled by sweep/invalidate"
enum class SlotState : uint8_t {
    NONE = 0,
    PENDING = 1,
    RESOLVED = 2
};

// In-flight requests keyed by (seq, target). Every method takes the table
// mutex, so a resolve racing a sweep for the same key sees exactly one winner.
class PendingRequestTable {
public:
    static constexpr size_t CAPACITY = 16;

    PendingRequestTable();

    PendingRequestTable(const PendingRequestTable&) = delete;
    PendingRequestTable& operator=(const PendingRequestTable&) = delete;

    // false if the key is already live or the table is full
    bool add(RequestKey key, uint32_t now_ms);

    // false if nothing is pending under key (late, duplicate or unknown frame)
    bool resolve(RequestKey key, const ParsedResponse& response);

    SlotState state(RequestKey key) const;

    // Move a RESOLVED result out and drop the entry
    bool take(RequestKey key, ParsedResponse& out);

    // Drop a PENDING or RESOLVED entry (timeout path)
    bool remove(RequestKey key);

    // Drop entries with age > max_age_ms; their keys go to expired[] (up to max_expired)
    size_t sweepExpired(uint32_t now_ms, uint32_t max_age_ms, RequestKey* expired, size_t max_expired);

    // Drop every entry (connection lost); keys go to cancelled[]
    size_t invalidateAll(RequestKey* cancelled, size_t max_cancelled);

    size_t size() const;

private:
    struct Entry {
        bool           used;
        RequestKey     key;
        uint32_t       created_ms;
        SlotState      state;
        ParsedResponse response;
    };

    Entry* findLocked(RequestKey key);
    const Entry* findLocked(RequestKey key) const;

    std::array<Entry, CAPACITY> entries;
    mutable RtosMutex mutex;
};

#endif // PENDING_REQUEST_TABLE_HPP
