#pragma once

#include "agent_runner/context/context_store.hpp"
#include "agent_runner/core/stop_token.hpp"
#include "agent_runner/core/types.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace agent_runner::task {

struct RetryPolicy {
    static constexpr std::chrono::milliseconds kMaxBackoff = std::chrono::hours(24);

    int max_retries = 3;
    std::chrono::milliseconds retry_delay{2000};

    // Delay after failed attempt `attempt` (1-based): retry_delay * 2^(attempt-1)
    std::chrono::milliseconds backoff_for(int attempt) const;
};

// Result of one invocation of a task's work function
struct WorkOutcome {
    bool ok = false;
    json payload = json::object();
    std::string error;

    static WorkOutcome success(json payload = json::object());
    static WorkOutcome failure(std::string error);
};

/**
 * What a work function may touch: the run's context store, its own progress
 * reporter and the run's stop token.
 */
class TaskContext {
public:
    using ProgressFn = std::function<void(int, const std::string&)>;

    TaskContext(std::string task_name, context::ContextStore& store,
                const core::StopToken& stop, ProgressFn progress);

    const std::string& task_name() const { return task_name_; }
    context::ContextStore& store() { return store_; }
    const context::ContextStore& store() const { return store_; }
    const core::StopToken& stop_token() const { return stop_; }

    const std::string& target() const { return store_.target(); }
    const std::string& run_id() const { return store_.run_id(); }
    const std::string& run_mode() const { return store_.run_mode(); }

    void update_progress(int percent, const std::string& label);
    void throw_if_stopped() const { stop_.throw_if_stopped(); }

    // Result payload of a completed task, null otherwise
    json dependency_result(const std::string& name) const;

    // Stores an artifact owned by this task
    void publish_artifact(const std::string& kind, const std::string& key, json data);

private:
    std::string task_name_;
    context::ContextStore& store_;
    const core::StopToken& stop_;
    ProgressFn progress_;
};

// One unit of work. Retries, progress, persistence and events are added by TaskUnit.
class Task {
public:
    virtual ~Task() = default;

    virtual std::string name() const = 0;
    virtual std::string display_name() const;
    virtual std::vector<std::string> dependencies() const { return {}; }
    virtual RetryPolicy retry_policy() const { return {}; }

    // Must be safe to call again from scratch after a failed attempt.
    // May throw; StopRequested ends the task without further retries.
    virtual WorkOutcome do_work(TaskContext& ctx) = 0;
};

} // namespace agent_runner::task
