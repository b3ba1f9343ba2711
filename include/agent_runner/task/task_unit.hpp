#pragma once

#include "agent_runner/bus/event_bus.hpp"
#include "agent_runner/context/context_store.hpp"
#include "agent_runner/core/stop_token.hpp"
#include "agent_runner/core/types.hpp"
#include "agent_runner/persistence/persistence_sink.hpp"
#include "agent_runner/task/task.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agent_runner::task {

/**
 * Runs a Task with retries and exponential backoff, mirroring every state
 * change into the context store, the persistence sink and the event bus.
 *
 * Status only moves PENDING -> RUNNING -> {COMPLETED | FAILED}. This is the
 * single place where work-function errors (returned or thrown) turn into a
 * FAILED record; execute() never throws them.
 */
class TaskUnit {
public:
    TaskUnit(std::unique_ptr<Task> task, context::ContextStore& store,
             bus::EventBus& bus, persistence::PersistenceSink& sink);

    TaskUnit(const TaskUnit&) = delete;
    TaskUnit& operator=(const TaskUnit&) = delete;

    const std::string& name() const { return name_; }
    const std::string& display_name() const { return display_name_; }
    const std::vector<std::string>& dependencies() const { return dependencies_; }
    const RetryPolicy& retry_policy() const { return policy_; }

    // True iff every dependency has a COMPLETED record in the store
    bool can_run() const;
    std::vector<std::string> unmet_dependencies() const;

    // Returns the terminal record. A unit that is already terminal runs nothing.
    TaskRecord execute(const core::StopToken& stop);

    // Clamped to [0, 100]; lower values than the current one are ignored
    void update_progress(int percent, const std::string& label);

    TaskRecord record() const;

private:
    void start();
    WorkOutcome run_attempt(TaskContext& ctx, bool& cancelled);
    TaskRecord complete(const json& payload);
    TaskRecord fail(const std::string& error);

    void publish(EventType type, json payload);
    void commit(const TaskRecord& snapshot);

    template <typename Fn>
    void persist(const char* what, Fn&& fn);

    std::unique_ptr<Task> task_;
    std::string name_;
    std::string display_name_;
    std::vector<std::string> dependencies_;
    RetryPolicy policy_;

    context::ContextStore& store_;
    bus::EventBus& bus_;
    persistence::PersistenceSink& sink_;

    mutable std::mutex mutex_;
    // Serializes progress publication so observed progress never goes backwards
    std::mutex progress_mutex_;
    TaskRecord record_;
};

} // namespace agent_runner::task
