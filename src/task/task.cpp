#include "agent_runner/task/task.hpp"
#include "agent_runner/core/task_names.hpp"

#include <algorithm>

namespace agent_runner::task {

std::chrono::milliseconds RetryPolicy::backoff_for(int attempt) const {
    if (retry_delay <= std::chrono::milliseconds::zero()) {
        return std::chrono::milliseconds::zero();
    }
    // saturates at kMaxBackoff instead of overflowing the shift
    const int shift = std::clamp(attempt - 1, 0, 20);
    const int64_t factor = int64_t{1} << shift;
    if (retry_delay >= kMaxBackoff / factor) {
        return kMaxBackoff;
    }
    return retry_delay * factor;
}

WorkOutcome WorkOutcome::success(json payload) {
    WorkOutcome out;
    out.ok = true;
    out.payload = std::move(payload);
    return out;
}

WorkOutcome WorkOutcome::failure(std::string error) {
    WorkOutcome out;
    out.ok = false;
    out.payload = nullptr;
    out.error = std::move(error);
    return out;
}

TaskContext::TaskContext(std::string task_name, context::ContextStore& store,
                         const core::StopToken& stop, ProgressFn progress)
    : task_name_(std::move(task_name)),
      store_(store),
      stop_(stop),
      progress_(std::move(progress)) {}

void TaskContext::update_progress(int percent, const std::string& label) {
    if (progress_) {
        progress_(percent, label);
    }
}

json TaskContext::dependency_result(const std::string& name) const {
    auto record = store_.get_result(name);
    if (!record || record->status != TaskStatus::COMPLETED) {
        return nullptr;
    }
    return record->result_payload;
}

void TaskContext::publish_artifact(const std::string& kind, const std::string& key, json data) {
    SharedArtifact artifact;
    artifact.kind = kind;
    artifact.key = key;
    artifact.owner = task_name_;
    artifact.data = std::move(data);
    store_.set_artifact(std::move(artifact));
}

std::string Task::display_name() const {
    return task_names::display_name(name());
}

} // namespace agent_runner::task
