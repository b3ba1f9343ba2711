#include "agent_runner/core/run_mode.hpp"
#include "agent_runner/core/task_names.hpp"

#include <catch2/catch_test_macros.hpp>

using agent_runner::core::ModeOverrides;
using agent_runner::core::RunMode;
using agent_runner::core::parse_run_mode;
using agent_runner::core::run_mode_to_string;
using agent_runner::core::task_required_for_mode;
using agent_runner::core::tasks_for_mode;

TEST_CASE("run_mode_parse_accepts_known_names_case_insensitively") {
  REQUIRE(parse_run_mode("full") == RunMode::Full);
  REQUIRE(parse_run_mode(" Quick ") == RunMode::Quick);
  REQUIRE_FALSE(parse_run_mode("turbo"));
  REQUIRE(run_mode_to_string(RunMode::Quick) == "quick");
}

TEST_CASE("run_mode_full_requires_every_task") {
  REQUIRE(tasks_for_mode(RunMode::Full) == agent_runner::task_names::all());
}

TEST_CASE("run_mode_quick_is_the_fixed_subset") {
  const auto quick = tasks_for_mode(RunMode::Quick);
  REQUIRE(quick == std::vector<std::string>{"web_scraper", "screenshot", "company_research",
                                            "competitor", "seo", "messaging", "report"});
  REQUIRE(task_required_for_mode("seo", RunMode::Quick));
  REQUIRE_FALSE(task_required_for_mode("icp", RunMode::Quick));
  REQUIRE_FALSE(task_required_for_mode("social", RunMode::Quick));
}

TEST_CASE("run_mode_override_replaces_list_in_canonical_order") {
  ModeOverrides overrides{{"quick", {"report", "web_scraper", "seo"}}};
  REQUIRE(tasks_for_mode(RunMode::Quick, overrides) ==
          std::vector<std::string>{"web_scraper", "seo", "report"});
  // other modes are untouched
  REQUIRE(tasks_for_mode(RunMode::Full, overrides).size() ==
          agent_runner::task_names::all().size());
}
