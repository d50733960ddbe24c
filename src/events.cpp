// =============================================================================
// events.cpp - Append-only notification log
// =============================================================================

#include "zswap/events.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace zswap {

namespace {

struct EventNameVisitor {
    const char* operator()(const PairCreated&) const { return "PairCreated"; }
    const char* operator()(const LiquidityAdded&) const { return "LiquidityAdded"; }
    const char* operator()(const LiquidityRemoved&) const { return "LiquidityRemoved"; }
    const char* operator()(const SwapExecuted&) const { return "SwapExecuted"; }
    const char* operator()(const FeeUpdated&) const { return "FeeUpdated"; }
};

} // anonymous namespace

const char* event_name(const EventPayload& payload) {
    return std::visit(EventNameVisitor{}, payload);
}

std::vector<Event> EventLog::append(std::vector<EventPayload> payloads) {
    std::vector<Event> appended;
    appended.reserve(payloads.size());

    std::unique_lock lock(events_mutex_);
    uint64_t next = events_.size() + 1;
    for (auto& payload : payloads) {
        events_.push_back(Event{next++, std::move(payload)});
        appended.push_back(events_.back());
    }
    return appended;
}

void EventLog::notify(const std::vector<Event>& events) {
    std::vector<EventListener*> listeners;
    {
        std::lock_guard lock(listeners_mutex_);
        listeners = listeners_;
    }
    for (const auto& event : events) {
        for (EventListener* listener : listeners) {
            // The operation has already committed; a failing listener must not undo that
            try {
                listener->on_event(event);
            } catch (const std::exception& e) {
                spdlog::error("listener failed on {} #{}: {}",
                              event_name(event.payload), event.sequence, e.what());
            }
        }
    }
}

std::vector<Event> EventLog::events_since(uint64_t after_sequence) const {
    std::shared_lock lock(events_mutex_);
    if (after_sequence >= events_.size()) return {};
    return std::vector<Event>(events_.begin() + static_cast<std::ptrdiff_t>(after_sequence),
                              events_.end());
}

size_t EventLog::size() const {
    std::shared_lock lock(events_mutex_);
    return events_.size();
}

uint64_t EventLog::last_sequence() const {
    std::shared_lock lock(events_mutex_);
    return events_.empty() ? 0 : events_.back().sequence;
}

void EventLog::subscribe(EventListener* listener) {
    if (!listener) return;
    std::lock_guard lock(listeners_mutex_);
    if (std::find(listeners_.begin(), listeners_.end(), listener) == listeners_.end()) {
        listeners_.push_back(listener);
    }
}

void EventLog::unsubscribe(EventListener* listener) {
    std::lock_guard lock(listeners_mutex_);
    listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                     listeners_.end());
}

} // namespace zswap
