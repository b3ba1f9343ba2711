#include "agent_runner/core/types.hpp"
#include "agent_runner/core/utils.hpp"

namespace agent_runner {

bool TaskRecord::cancelled() const {
    return status == TaskStatus::FAILED && error_detail &&
           core::starts_with(*error_detail, kCancelledPrefix);
}

json task_record_to_json(const TaskRecord& record) {
    json j;
    j["name"] = record.name;
    j["display_name"] = record.display_name;
    j["status"] = task_status_to_string(record.status);
    j["progress"] = record.progress_percent;
    j["current_task"] = record.current_task_label;
    j["result"] = record.result_payload;
    j["error"] = record.error_detail ? json(*record.error_detail) : json(nullptr);
    j["attempts"] = record.attempts;
    j["started_at"] = record.started_at.empty() ? json(nullptr) : json(record.started_at);
    j["finished_at"] = record.finished_at.empty() ? json(nullptr) : json(record.finished_at);
    return j;
}

TaskRecord task_record_from_json(const json& j) {
    TaskRecord r;
    r.name = j.value("name", "");
    r.display_name = j.value("display_name", "");
    auto status = string_to_task_status(j.value("status", "pending"));
    r.status = status.value_or(TaskStatus::PENDING);
    r.progress_percent = j.value("progress", 0);
    r.current_task_label = j.value("current_task", "");
    if (j.contains("result")) {
        r.result_payload = j["result"];
    }
    if (j.contains("error") && j["error"].is_string()) {
        r.error_detail = j["error"].get<std::string>();
    }
    r.attempts = j.value("attempts", 0);
    if (j.contains("started_at") && j["started_at"].is_string()) {
        r.started_at = j["started_at"].get<std::string>();
    }
    if (j.contains("finished_at") && j["finished_at"].is_string()) {
        r.finished_at = j["finished_at"].get<std::string>();
    }
    return r;
}

} // namespace agent_runner
