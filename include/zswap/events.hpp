#ifndef ZSWAP_EVENTS_HPP
#define ZSWAP_EVENTS_HPP

#include <cstdint>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <variant>
#include <vector>

#include "types.hpp"

namespace zswap {

// =============================================================================
// Event Payloads
// =============================================================================

struct PairCreated {
    Asset low;
    Asset high;
};

struct LiquidityAdded {
    PairKey pair;
    Address depositor;
    Amount amount_low;
    Amount amount_high;
    Amount shares;
};

struct LiquidityRemoved {
    PairKey pair;
    Address depositor;
    Amount amount_low;
    Amount amount_high;
    Amount shares;
};

// One per hop of a swap path
struct SwapExecuted {
    Address sender;
    Address recipient;
    Asset asset_in;
    Asset asset_out;
    Amount amount_in;
    Amount amount_out;
};

struct FeeUpdated {
    uint32_t old_rate;
    uint32_t new_rate;
};

using EventPayload = std::variant<PairCreated, LiquidityAdded, LiquidityRemoved,
                                  SwapExecuted, FeeUpdated>;

// =============================================================================
// Event Record (immutable once appended)
// =============================================================================

struct Event {
    uint64_t sequence;      // 1-based, strictly increasing
    EventPayload payload;

    template <typename T>
    const T* as() const { return std::get_if<T>(&payload); }
};

// "PairCreated", "SwapExecuted", ...
const char* event_name(const EventPayload& payload);

// Callback interface for committed events
class EventListener {
public:
    virtual ~EventListener() = default;
    virtual void on_event(const Event& event) = 0;
};

// =============================================================================
// EventLog - append-only notification log
// =============================================================================

class EventLog {
public:
    EventLog() = default;

    // Non-copyable
    EventLog(const EventLog&) = delete;
    EventLog& operator=(const EventLog&) = delete;

    // Appends the payloads of one committed operation; returns the new records
    std::vector<Event> append(std::vector<EventPayload> payloads);

    // Delivers already-appended records to every subscriber. A listener that
    // throws is logged and skipped; the rest still receive the event.
    void notify(const std::vector<Event>& events);

    // Polling: every event with sequence > after_sequence
    std::vector<Event> events_since(uint64_t after_sequence) const;

    size_t size() const;
    uint64_t last_sequence() const;

    void subscribe(EventListener* listener);
    void unsubscribe(EventListener* listener);

private:
    std::vector<Event> events_;
    mutable std::shared_mutex events_mutex_;

    std::vector<EventListener*> listeners_;
    std::mutex listeners_mutex_;
};

} // namespace zswap

#endif // ZSWAP_EVENTS_HPP
