#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace agent_runner::core {

enum class RunMode {
  Full,
  Quick,
};

std::string run_mode_to_string(RunMode mode);
std::optional<RunMode> parse_run_mode(const std::string &s);

using ModeOverrides = std::map<std::string, std::vector<std::string>>;

// Task names a run of `mode` requires, in canonical order. An entry in
// `overrides` keyed by the mode name replaces the built-in list.
std::vector<std::string> tasks_for_mode(RunMode mode,
                                        const ModeOverrides &overrides = {});

bool task_required_for_mode(const std::string &task, RunMode mode,
                            const ModeOverrides &overrides = {});

} // namespace agent_runner::core
