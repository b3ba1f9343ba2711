#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agent_runner {

using json = nlohmann::json;

// Task lifecycle: PENDING -> RUNNING -> {COMPLETED | FAILED}
enum class TaskStatus {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED
};

inline std::string task_status_to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING: return "pending";
        case TaskStatus::RUNNING: return "running";
        case TaskStatus::COMPLETED: return "completed";
        case TaskStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

inline std::optional<TaskStatus> string_to_task_status(const std::string& s) {
    if (s == "pending") return TaskStatus::PENDING;
    if (s == "running") return TaskStatus::RUNNING;
    if (s == "completed") return TaskStatus::COMPLETED;
    if (s == "failed") return TaskStatus::FAILED;
    return std::nullopt;
}

inline bool is_terminal(TaskStatus status) {
    return status == TaskStatus::COMPLETED || status == TaskStatus::FAILED;
}

enum class EventType {
    PROGRESS,
    COMPLETED,
    FAILED
};

inline std::string event_type_to_string(EventType type) {
    switch (type) {
        case EventType::PROGRESS: return "progress_update";
        case EventType::COMPLETED: return "task_completed";
        case EventType::FAILED: return "task_failed";
        default: return "unknown";
    }
}

inline std::optional<EventType> string_to_event_type(const std::string& s) {
    if (s == "progress_update" || s == "progress") return EventType::PROGRESS;
    if (s == "task_completed" || s == "completed") return EventType::COMPLETED;
    if (s == "task_failed" || s == "failed") return EventType::FAILED;
    return std::nullopt;
}

inline const std::vector<EventType>& all_event_types() {
    static const std::vector<EventType> kTypes = {
        EventType::PROGRESS, EventType::COMPLETED, EventType::FAILED};
    return kTypes;
}

// Error details of tasks stopped by the run's stop token start with this.
inline constexpr const char* kCancelledPrefix = "cancelled";

// Per-task status + payload for one run
struct TaskRecord {
    std::string name;
    std::string display_name;
    TaskStatus status = TaskStatus::PENDING;
    int progress_percent = 0;          // 0..100, never decreases within a run
    std::string current_task_label;
    json result_payload;               // null until completed
    std::optional<std::string> error_detail;  // set only when failed
    int attempts = 0;
    std::string started_at;
    std::string finished_at;

    bool terminal() const { return is_terminal(status); }
    bool cancelled() const;
};

json task_record_to_json(const TaskRecord& record);
TaskRecord task_record_from_json(const json& j);

// Bus message; immutable once published
struct Event {
    std::string sender;
    EventType type = EventType::PROGRESS;
    json payload = json::object();
    std::string timestamp;
    uint64_t sequence = 0;
};

// Item contributed to the context store by collector tasks. Identity is (kind, key).
struct SharedArtifact {
    std::string kind;
    std::string key;
    std::string owner;
    json data = json::object();
};

} // namespace agent_runner
