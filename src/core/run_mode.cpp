#include "agent_runner/core/run_mode.hpp"
#include "agent_runner/core/task_names.hpp"
#include "agent_runner/core/utils.hpp"

#include <algorithm>

namespace agent_runner::core {

std::string run_mode_to_string(RunMode mode) {
  switch (mode) {
  case RunMode::Full:
    return "full";
  case RunMode::Quick:
    return "quick";
  default:
    return "unknown";
  }
}

std::optional<RunMode> parse_run_mode(const std::string &s) {
  const std::string m = to_lower(trim(s));
  if (m == "full")
    return RunMode::Full;
  if (m == "quick")
    return RunMode::Quick;
  return std::nullopt;
}

std::vector<std::string> tasks_for_mode(RunMode mode,
                                        const ModeOverrides &overrides) {
  auto it = overrides.find(run_mode_to_string(mode));
  if (it != overrides.end()) {
    // keep canonical order regardless of how the override lists them
    std::vector<std::string> out;
    for (const auto &name : task_names::all()) {
      if (std::find(it->second.begin(), it->second.end(), name) !=
          it->second.end()) {
        out.push_back(name);
      }
    }
    return out;
  }

  if (mode == RunMode::Full) {
    return task_names::all();
  }

  using namespace task_names;
  return {kWebScraper, kScreenshot, kCompanyResearch, kCompetitor,
          kSeo,        kMessaging,  kReport};
}

bool task_required_for_mode(const std::string &task, RunMode mode,
                            const ModeOverrides &overrides) {
  const auto names = tasks_for_mode(mode, overrides);
  return std::find(names.begin(), names.end(), task) != names.end();
}

} // namespace agent_runner::core
