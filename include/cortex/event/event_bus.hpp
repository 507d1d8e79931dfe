#pragma once

/// @file event_bus.hpp
/// @brief Bounded global bus for named events

#include "fwd.hpp"
#include "event.hpp"

#include <algorithm>
#include <deque>
#include <functional>
#include <iterator>
#include <mutex>
#include <tuple>
#include <vector>

namespace cortex_event {

/// Subscriber callback
using BusSubscriber = std::function<void(const Event&)>;

// =============================================================================
// GlobalEventBus
// =============================================================================

/// Bounded FIFO of events shared with external subscribers.
///
/// When full, publishing drops the oldest event. Unlike the rest of the event
/// system this class is internally synchronized.
class GlobalEventBus {
public:
    static constexpr std::size_t k_default_capacity = 10000;

    explicit GlobalEventBus(std::size_t capacity = k_default_capacity)
        : m_capacity(capacity == 0 ? 1 : capacity) {}

    // Non-copyable
    GlobalEventBus(const GlobalEventBus&) = delete;
    GlobalEventBus& operator=(const GlobalEventBus&) = delete;

    // =========================================================================
    // Publishing
    // =========================================================================

    /// Append an event, evicting the oldest one when at capacity
    void publish(Event event) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_events.size() >= m_capacity) {
            m_events.pop_front();
            ++m_dropped;
        }
        m_events.push_back(std::move(event));
    }

    /// Remove and return all pending events in publish order
    [[nodiscard]] std::vector<Event> drain() {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<Event> events(std::make_move_iterator(m_events.begin()),
                                  std::make_move_iterator(m_events.end()));
        m_events.clear();
        return events;
    }

    // =========================================================================
    // Subscribing
    // =========================================================================

    SubscriberId subscribe(BusSubscriber subscriber) {
        std::lock_guard<std::mutex> lock(m_mutex);
        SubscriberId id(m_next_subscriber_id++);
        m_subscribers.emplace_back(id, std::move(subscriber));
        return id;
    }

    bool unsubscribe(SubscriberId id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::remove_if(m_subscribers.begin(), m_subscribers.end(),
            [id](const auto& entry) {
                return std::get<0>(entry) == id;
            });
        bool removed = it != m_subscribers.end();
        m_subscribers.erase(it, m_subscribers.end());
        return removed;
    }

    // =========================================================================
    // Processing
    // =========================================================================

    /// Drain pending events and hand each to every subscriber.
    /// Callbacks run outside the lock so they may publish.
    /// @return Number of events dispatched
    std::size_t process() {
        std::vector<Event> events;
        std::vector<Entry> subscribers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            events.assign(std::make_move_iterator(m_events.begin()),
                          std::make_move_iterator(m_events.end()));
            m_events.clear();
            subscribers = m_subscribers;
        }

        for (const auto& event : events) {
            for (const auto& [id, subscriber] : subscribers) {
                subscriber(event);
            }
        }
        return events.size();
    }

    // =========================================================================
    // Queue Management
    // =========================================================================

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_events.clear();
    }

    [[nodiscard]] std::size_t pending_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_events.size();
    }

    /// Events evicted by overflow since construction
    [[nodiscard]] std::uint64_t dropped_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_dropped;
    }

    [[nodiscard]] std::size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_subscribers.size();
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return m_capacity; }

private:
    using Entry = std::tuple<SubscriberId, BusSubscriber>;

    mutable std::mutex m_mutex;
    std::deque<Event> m_events;
    std::vector<Entry> m_subscribers;
    std::size_t m_capacity;
    std::uint64_t m_dropped = 0;
    std::uint64_t m_next_subscriber_id = 1;
};

} // namespace cortex_event
