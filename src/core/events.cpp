#include "agent_runner/core/events.hpp"
#include "agent_runner/core/utils.hpp"

namespace agent_runner::core {

EventEmitter::EventEmitter(std::ostream& out, std::string run_id)
    : out_(out), run_id_(std::move(run_id)) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    const std::string line = event.dump();
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << "\n";
    out_.flush();
}

void EventEmitter::run_start(const json& extra) {
    json event = base_event("run_start");
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::run_end(bool success, const std::string& status,
                           const json& extra) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::phase_start(int phase_index, const std::string& phase_name,
                               const json& extra) {
    json event = base_event("phase_start");
    event["phase"] = phase_index;
    event["phase_name"] = phase_name;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::phase_end(int phase_index, const std::string& phase_name,
                             const std::string& status, const json& extra) {
    json event = base_event("phase_end");
    event["phase"] = phase_index;
    event["phase_name"] = phase_name;
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::task_skipped(const std::string& phase_name, const std::string& task,
                                const std::string& reason) {
    json event = base_event("task_skipped");
    event["phase_name"] = phase_name;
    event["task"] = task;
    event["reason"] = reason;
    emit(event);
}

void EventEmitter::task_event(const Event& ev) {
    json event = base_event(event_type_to_string(ev.type));
    // keep the bus timestamp so journal and history agree
    if (!ev.timestamp.empty()) {
        event["ts"] = ev.timestamp;
    }
    event["task"] = ev.sender;
    event["seq"] = ev.sequence;
    event["data"] = ev.payload;
    emit(event);
}

void EventEmitter::warning(const std::string& message) {
    json event = base_event("warning");
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& message) {
    json event = base_event("error");
    event["message"] = message;
    emit(event);
}

} // namespace agent_runner::core
