#pragma once

#include "agent_runner/config/configuration.hpp"
#include "agent_runner/task/task.hpp"

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agent_runner::task {

// Built-in wiring of a known task name
struct TaskDefinition {
    std::string name;
    std::vector<std::string> dependencies;
    std::optional<int> max_retries;  // unset = run-wide retry setting
};

// All known tasks in canonical order
const std::vector<TaskDefinition>& default_definitions();
const TaskDefinition* find_definition(const std::string& name);

using TaskFactory = std::function<std::unique_ptr<Task>()>;

// Name -> factory for every task implementation available to a run
class TaskCatalog {
public:
    void add(const std::string& name, TaskFactory factory);

    bool contains(const std::string& name) const;
    std::unique_ptr<Task> create(const std::string& name) const;
    std::vector<std::string> names() const;
    std::size_t size() const { return factories_.size(); }

    // One CommandTask per known task with an enabled, non-empty command
    static TaskCatalog from_config(const config::Config& cfg);

private:
    std::map<std::string, TaskFactory> factories_;
};

// Retry policy for `name` after applying run-wide and per-task settings
RetryPolicy resolve_retry_policy(const config::Config& cfg, const std::string& name);

} // namespace agent_runner::task
