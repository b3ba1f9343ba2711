#include "agent_runner/bus/event_bus.hpp"
#include "agent_runner/core/logging.hpp"
#include "agent_runner/core/utils.hpp"

#include <system_error>
#include <thread>

namespace agent_runner::bus {

namespace {

void invoke_guarded(const Callback& callback, const Event& event) {
    try {
        callback(event);
    } catch (const std::exception& e) {
        core::Logger::warn("bus", "Callback error for " + event_type_to_string(event.type) +
                                      " from " + event.sender + ": " + e.what());
    } catch (...) {
        core::Logger::warn("bus", "Callback error for " + event_type_to_string(event.type) +
                                      " from " + event.sender + ": non-standard exception");
    }
}

} // namespace

EventBus::EventBus(std::size_t history_capacity)
    : capacity_(history_capacity > 0 ? history_capacity : 1) {}

void EventBus::subscribe(EventType type, Callback callback) {
    auto cb = std::make_shared<const Callback>(std::move(callback));
    std::lock_guard<std::mutex> lock(mutex_);
    subscribers_[type].push_back(std::move(cb));
}

void EventBus::subscribe_all(const Callback& callback) {
    for (EventType type : all_event_types()) {
        subscribe(type, callback);
    }
}

Event EventBus::publish(Event event) {
    std::vector<std::shared_ptr<const Callback>> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        event.sequence = next_sequence_++;
        if (event.timestamp.empty()) {
            event.timestamp = core::get_iso_timestamp();
        }
        history_.push_back(event);
        while (history_.size() > capacity_) {
            history_.pop_front();
        }
        auto it = subscribers_.find(event.type);
        if (it != subscribers_.end()) {
            callbacks = it->second;
        }
    }

    dispatch(event, callbacks);
    return event;
}

void EventBus::dispatch(const Event& event,
                        const std::vector<std::shared_ptr<const Callback>>& callbacks) const {
    if (callbacks.empty()) {
        return;
    }
    if (callbacks.size() == 1) {
        invoke_guarded(*callbacks.front(), event);
        return;
    }

    // fan out: first callback on the publishing thread, the rest on workers
    std::vector<std::thread> workers;
    workers.reserve(callbacks.size() - 1);
    for (std::size_t i = 1; i < callbacks.size(); ++i) {
        const Callback* cb = callbacks[i].get();
        try {
            workers.emplace_back([cb, &event] { invoke_guarded(*cb, event); });
        } catch (const std::system_error& e) {
            core::Logger::debug("bus", std::string("Thread spawn failed, delivering inline: ") + e.what());
            invoke_guarded(*cb, event);
        }
    }
    invoke_guarded(*callbacks.front(), event);
    for (auto& w : workers) {
        w.join();
    }
}

std::vector<Event> EventBus::history(const std::optional<std::string>& sender,
                                     const std::optional<EventType>& type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> out;
    for (const auto& e : history_) {
        if (sender && e.sender != *sender) continue;
        if (type && e.type != *type) continue;
        out.push_back(e);
    }
    return out;
}

std::size_t EventBus::subscriber_count(EventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(type);
    return it != subscribers_.end() ? it->second.size() : 0;
}

} // namespace agent_runner::bus
