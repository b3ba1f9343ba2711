#include "agent_runner/bus/event_bus.hpp"
#include "agent_runner/context/context_store.hpp"
#include "agent_runner/core/errors.hpp"
#include "agent_runner/core/events.hpp"
#include "agent_runner/core/stop_token.hpp"
#include "agent_runner/core/task_names.hpp"
#include "agent_runner/orchestrator/orchestrator.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <sstream>
#include <thread>

using namespace agent_runner;
using agent_runner::testing::FnTask;
using agent_runner::testing::RecordingSink;
using orchestrator::Orchestrator;
using orchestrator::PhaseSpec;
using orchestrator::RunOutcome;
using task::TaskContext;
using task::WorkOutcome;

namespace {

struct Fixture {
  context::ContextStore store{"https://example.com", "run-1", "full"};
  bus::EventBus bus;
  RecordingSink sink;
  core::StopToken stop;
};

std::vector<PhaseSpec> abc_phases() {
  return {{"first", {"A"}}, {"second", {"B", "C", "D"}}};
}

} // namespace

TEST_CASE("orchestrator_dependents_observe_predecessor_payload") {
  Fixture f;
  Orchestrator orch(f.store, f.bus, f.sink, f.stop, abc_phases());

  std::mutex mutex;
  std::map<std::string, json> observed;
  auto observer = [&](const std::string &self) {
    return [&, self](TaskContext &ctx) {
      std::lock_guard<std::mutex> lock(mutex);
      observed[self] = ctx.dependency_result("A");
      return WorkOutcome::success({{"from", self}});
    };
  };

  orch.register_task(std::make_unique<FnTask>(
      "A", [](TaskContext &) { return WorkOutcome::success({{"pages", 3}}); }));
  orch.register_task(std::make_unique<FnTask>("B", observer("B"),
                                              std::vector<std::string>{"A"}));
  orch.register_task(std::make_unique<FnTask>("C", observer("C"),
                                              std::vector<std::string>{"A"}));
  orch.run_all();

  REQUIRE(observed.size() == 2);
  REQUIRE(observed["B"]["pages"] == 3);
  REQUIRE(observed["C"]["pages"] == 3);

  auto summary = orch.summarize();
  REQUIRE(summary.completed == 3);
  REQUIRE(summary.outcome == RunOutcome::SUCCEEDED);
}

TEST_CASE("orchestrator_unknown_dependency_leaves_task_pending") {
  Fixture f;
  Orchestrator orch(f.store, f.bus, f.sink, f.stop, abc_phases());

  auto d = std::make_unique<FnTask>(
      "D", [](TaskContext &) { return WorkOutcome::success(); },
      std::vector<std::string>{"Z"});
  FnTask *d_raw = d.get();
  orch.register_task(std::make_unique<FnTask>(
      "A", [](TaskContext &) { return WorkOutcome::success(); }));
  orch.register_task(std::move(d));

  REQUIRE_FALSE(orch.unit("D")->can_run());
  REQUIRE_NOTHROW(orch.run_all());

  REQUIRE(d_raw->calls.load() == 0);
  REQUIRE(orch.unit("D")->record().status == TaskStatus::PENDING);
  REQUIRE(f.store.get_result("D")->status == TaskStatus::PENDING);

  auto summary = orch.summarize();
  REQUIRE(summary.skipped_tasks == std::vector<std::string>{"D"});
  REQUIRE(summary.failed == 0);
  REQUIRE(summary.outcome == RunOutcome::PARTIAL);
}

TEST_CASE("orchestrator_failed_task_skips_dependents_but_not_siblings") {
  Fixture f;
  std::vector<PhaseSpec> phases = {{"one", {"A", "X"}}, {"two", {"B", "C"}}};
  Orchestrator orch(f.store, f.bus, f.sink, f.stop, phases);

  orch.register_task(std::make_unique<FnTask>(
      "A", [](TaskContext &) { return WorkOutcome::failure("boom"); },
      std::vector<std::string>{}, FnTask::fast_policy(2, 1)));
  orch.register_task(std::make_unique<FnTask>(
      "X", [](TaskContext &) { return WorkOutcome::success(); }));
  orch.register_task(std::make_unique<FnTask>(
      "B", [](TaskContext &) { return WorkOutcome::success(); },
      std::vector<std::string>{"A"}));
  orch.register_task(std::make_unique<FnTask>(
      "C", [](TaskContext &) { return WorkOutcome::success(); },
      std::vector<std::string>{"X"}));
  orch.run_all();

  auto summary = orch.summarize();
  REQUIRE(summary.failed_tasks == std::vector<std::string>{"A"});
  REQUIRE(summary.skipped_tasks == std::vector<std::string>{"B"});
  REQUIRE(summary.completed == 2);
  REQUIRE(summary.outcome == RunOutcome::PARTIAL);
}

TEST_CASE("orchestrator_no_completed_task_is_no_usable_output") {
  Fixture f;
  Orchestrator orch(f.store, f.bus, f.sink, f.stop, abc_phases());
  orch.register_task(std::make_unique<FnTask>(
      "A", [](TaskContext &) { return WorkOutcome::failure("down"); },
      std::vector<std::string>{}, FnTask::fast_policy(1, 1)));
  orch.register_task(std::make_unique<FnTask>(
      "B", [](TaskContext &) { return WorkOutcome::success(); },
      std::vector<std::string>{"A"}));
  orch.run_all();

  auto summary = orch.summarize();
  REQUIRE(summary.completed == 0);
  REQUIRE(summary.outcome == RunOutcome::NO_USABLE_OUTPUT);
  REQUIRE(summary.to_json()["outcome"] == "no_usable_output");
}

TEST_CASE("orchestrator_runs_phase_tasks_concurrently_and_phases_in_order") {
  Fixture f;
  std::vector<PhaseSpec> phases = {{"p1", {"A", "B"}}, {"p2", {"C"}}};
  Orchestrator orch(f.store, f.bus, f.sink, f.stop, phases);

  std::atomic<int> running{0};
  std::atomic<int> peak{0};
  std::atomic<bool> c_saw_unsettled{false};
  auto overlapping = [&](TaskContext &) {
    const int now = ++running;
    int prev = peak.load();
    while (now > prev && !peak.compare_exchange_weak(prev, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    --running;
    return WorkOutcome::success();
  };

  orch.register_task(std::make_unique<FnTask>("A", overlapping));
  orch.register_task(std::make_unique<FnTask>("B", overlapping));
  orch.register_task(std::make_unique<FnTask>("C", [&](TaskContext &ctx) {
    if (!ctx.store().is_completed("A") || !ctx.store().is_completed("B")) {
      c_saw_unsettled = true;
    }
    return WorkOutcome::success();
  }));
  orch.run_all();

  REQUIRE(peak.load() == 2);
  REQUIRE_FALSE(c_saw_unsettled.load());
}

TEST_CASE("orchestrator_rejects_duplicate_registration") {
  Fixture f;
  Orchestrator orch(f.store, f.bus, f.sink, f.stop, abc_phases());
  orch.register_task(std::make_unique<FnTask>(
      "A", [](TaskContext &) { return WorkOutcome::success(); }));
  REQUIRE_THROWS_AS(orch.register_task(std::make_unique<FnTask>(
                        "A", [](TaskContext &) { return WorkOutcome::success(); })),
                    SchedulingError);
}

TEST_CASE("orchestrator_run_phases_rejects_dependency_in_unselected_phase") {
  Fixture f;
  Orchestrator orch(f.store, f.bus, f.sink, f.stop, abc_phases());
  orch.register_task(std::make_unique<FnTask>(
      "A", [](TaskContext &) { return WorkOutcome::success(); }));
  auto b = std::make_unique<FnTask>(
      "B", [](TaskContext &) { return WorkOutcome::success(); },
      std::vector<std::string>{"A"});
  FnTask *b_raw = b.get();
  orch.register_task(std::move(b));

  REQUIRE_THROWS_AS(orch.run_phases({"second"}), SchedulingError);
  REQUIRE(b_raw->calls.load() == 0);
  REQUIRE_THROWS_AS(orch.run_phases({"no-such-phase"}), SchedulingError);

  // once the dependency is done, the phase may run alone
  orch.run_phases({"first"});
  REQUIRE_NOTHROW(orch.run_phases({"second"}));
  REQUIRE(b_raw->calls.load() == 1);
}

TEST_CASE("orchestrator_run_phases_allows_unregistered_dependency") {
  Fixture f;
  Orchestrator orch(f.store, f.bus, f.sink, f.stop, abc_phases());
  orch.register_task(std::make_unique<FnTask>(
      "D", [](TaskContext &) { return WorkOutcome::success(); },
      std::vector<std::string>{"Z"}));
  REQUIRE_NOTHROW(orch.run_phases({"second"}));
  REQUIRE(orch.unit("D")->record().status == TaskStatus::PENDING);
}

TEST_CASE("orchestrator_cancelled_run_leaves_every_task_terminal_or_pending") {
  Fixture f;
  Orchestrator orch(f.store, f.bus, f.sink, f.stop, abc_phases());
  orch.register_task(std::make_unique<FnTask>("A", [&](TaskContext &ctx) {
    f.stop.request_stop("user abort");
    ctx.throw_if_stopped();
    return WorkOutcome::success();
  }));
  auto c = std::make_unique<FnTask>(
      "C", [](TaskContext &) { return WorkOutcome::success(); });
  FnTask *c_raw = c.get();
  orch.register_task(std::move(c));
  orch.register_task(std::make_unique<FnTask>(
      "B", [](TaskContext &) { return WorkOutcome::success(); },
      std::vector<std::string>{"A"}));

  orch.run_all();

  REQUIRE(orch.unit("A")->record().cancelled());
  REQUIRE(orch.unit("B")->record().status == TaskStatus::PENDING);
  REQUIRE(orch.unit("C")->record().cancelled());
  REQUIRE(c_raw->calls.load() == 0);
  REQUIRE(orch.summarize().outcome == RunOutcome::NO_USABLE_OUTPUT);
}

TEST_CASE("orchestrator_emits_phase_lifecycle_on_journal") {
  Fixture f;
  std::ostringstream out;
  core::EventEmitter emitter(out, "run-1");
  Orchestrator orch(f.store, f.bus, f.sink, f.stop, abc_phases());
  orch.set_emitter(&emitter);

  orch.register_task(std::make_unique<FnTask>(
      "A", [](TaskContext &) { return WorkOutcome::success(); }));
  orch.register_task(std::make_unique<FnTask>(
      "D", [](TaskContext &) { return WorkOutcome::success(); },
      std::vector<std::string>{"Z"}));
  orch.run_all();

  std::vector<json> events;
  std::istringstream in(out.str());
  std::string line;
  while (std::getline(in, line)) {
    events.push_back(json::parse(line));
  }

  REQUIRE(events.size() == 5);
  REQUIRE(events[0]["type"] == "phase_start");
  REQUIRE(events[0]["phase_name"] == "first");
  REQUIRE(events[1]["type"] == "phase_end");
  REQUIRE(events[1]["completed"] == 1);
  REQUIRE(events[2]["type"] == "phase_start");
  REQUIRE(events[2]["phase"] == 1);
  REQUIRE(events[3]["type"] == "task_skipped");
  REQUIRE(events[3]["task"] == "D");
  REQUIRE(events[4]["type"] == "phase_end");
  REQUIRE(events[4]["skipped"] == 1);
  REQUIRE(events[4]["scheduled"] == 0);
}

TEST_CASE("orchestrator_ad_hoc_phase_is_journaled_without_table_index") {
  Fixture f;
  std::ostringstream out;
  core::EventEmitter emitter(out, "run-1");
  Orchestrator orch(f.store, f.bus, f.sink, f.stop, abc_phases());
  orch.set_emitter(&emitter);

  orch.register_task(std::make_unique<FnTask>(
      "A", [](TaskContext &) { return WorkOutcome::success(); }));
  orch.run_phase("warmup", {"A"});

  std::istringstream in(out.str());
  std::string line;
  REQUIRE(std::getline(in, line));
  const json start = json::parse(line);
  REQUIRE(start["type"] == "phase_start");
  REQUIRE(start["phase_name"] == "warmup");
  REQUIRE(start["phase"] == -1);
  REQUIRE(f.store.get_result("A")->status == TaskStatus::COMPLETED);
}

TEST_CASE("orchestrator_register_all_honors_quick_mode") {
  Fixture f;
  Orchestrator orch(f.store, f.bus, f.sink, f.stop);

  task::TaskCatalog catalog;
  for (const auto &name : task_names::all()) {
    catalog.add(name, [name] {
      return std::make_unique<FnTask>(
          name, [](TaskContext &) { return WorkOutcome::success(); });
    });
  }

  auto registered = orch.register_all(catalog, core::RunMode::Quick);
  REQUIRE(registered == std::vector<std::string>{"web_scraper", "screenshot", "company_research",
                                                 "competitor", "seo", "messaging", "report"});
  REQUIRE_FALSE(orch.is_registered("icp"));
  REQUIRE(f.store.records().size() == task_names::all().size());
}

TEST_CASE("orchestrator_register_all_skips_tasks_missing_from_catalog") {
  Fixture f;
  Orchestrator orch(f.store, f.bus, f.sink, f.stop);

  task::TaskCatalog catalog;
  catalog.add("web_scraper", [] {
    return std::make_unique<FnTask>(
        "web_scraper", [](TaskContext &) { return WorkOutcome::success(); });
  });

  auto registered = orch.register_all(catalog, core::RunMode::Full);
  REQUIRE(registered == std::vector<std::string>{"web_scraper"});
  orch.run_all();
  REQUIRE(orch.summarize().outcome == RunOutcome::SUCCEEDED);
}

TEST_CASE("default_phases_cover_every_known_task_once") {
  std::map<std::string, int> seen;
  for (const auto &phase : orchestrator::default_phases()) {
    for (const auto &name : phase.tasks) {
      ++seen[name];
    }
  }
  REQUIRE(seen.size() == task_names::all().size());
  for (const auto &[name, count] : seen) {
    REQUIRE(count == 1);
  }
  REQUIRE(orchestrator::default_phases().front().name == "collection");
  REQUIRE(orchestrator::default_phases().back().name == "final-aggregation");
}
