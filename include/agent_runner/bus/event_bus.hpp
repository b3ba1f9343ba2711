#pragma once

#include "agent_runner/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agent_runner::bus {

using Callback = std::function<void(const Event&)>;

/**
 * In-process publish/subscribe channel for task events of one run.
 *
 * publish() appends to the history under the bus lock, releases it, then runs
 * every subscriber of the event type concurrently and joins them before
 * returning. Events from one publisher therefore reach each subscriber in
 * publish order. Events from different tasks may be delivered concurrently,
 * so callbacks must be thread-safe.
 */
class EventBus {
public:
    explicit EventBus(std::size_t history_capacity = 10000);

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void subscribe(EventType type, Callback callback);
    void subscribe_all(const Callback& callback);

    // Stamps sequence (and timestamp when empty); returns the stored event.
    Event publish(Event event);

    std::vector<Event> history(const std::optional<std::string>& sender = std::nullopt,
                               const std::optional<EventType>& type = std::nullopt) const;

    std::size_t subscriber_count(EventType type) const;

private:
    void dispatch(const Event& event,
                  const std::vector<std::shared_ptr<const Callback>>& callbacks) const;

    mutable std::mutex mutex_;
    std::map<EventType, std::vector<std::shared_ptr<const Callback>>> subscribers_;
    std::deque<Event> history_;
    std::size_t capacity_;
    uint64_t next_sequence_ = 1;
};

} // namespace agent_runner::bus
