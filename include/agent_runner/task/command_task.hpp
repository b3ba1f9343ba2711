#pragma once

#include "agent_runner/task/task.hpp"

#include <string>
#include <vector>

namespace agent_runner::task {

/**
 * Task whose work is an external program.
 *
 * Each attempt spawns `argv` and writes a JSON request to its stdin:
 *   {"target", "run_id", "run_mode", "task", "dependencies": {name: payload}}
 *
 * The child's stdout may interleave directive lines with its result:
 *   PROGRESS <percent> <label...>
 *   ARTIFACT <kind> <key> <json>
 * Everything else on stdout is the JSON result object. stderr is inherited.
 * The child is terminated when the run's stop token fires.
 */
class CommandTask : public Task {
public:
    CommandTask(std::string name, std::vector<std::string> argv,
                std::vector<std::string> dependencies = {},
                RetryPolicy policy = {});

    std::string name() const override { return name_; }
    std::vector<std::string> dependencies() const override { return dependencies_; }
    RetryPolicy retry_policy() const override { return policy_; }
    const std::vector<std::string>& argv() const { return argv_; }

    WorkOutcome do_work(TaskContext& ctx) override;

    json build_request(const TaskContext& ctx) const;

    // Applies a PROGRESS/ARTIFACT line; false if `line` is not a directive
    static bool apply_directive(const std::string& line, TaskContext& ctx);

    // Parses the non-directive stdout; an empty result is an empty object
    static WorkOutcome parse_result(const std::string& text);

private:
    std::string name_;
    std::vector<std::string> argv_;
    std::vector<std::string> dependencies_;
    RetryPolicy policy_;
};

} // namespace agent_runner::task
