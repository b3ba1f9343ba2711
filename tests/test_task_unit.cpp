#include "agent_runner/bus/event_bus.hpp"
#include "agent_runner/context/context_store.hpp"
#include "agent_runner/core/errors.hpp"
#include "agent_runner/core/stop_token.hpp"
#include "agent_runner/task/task_unit.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace agent_runner;
using agent_runner::testing::FnTask;
using agent_runner::testing::RecordingSink;
using agent_runner::testing::ThrowingSink;
using task::TaskContext;
using task::TaskUnit;
using task::WorkOutcome;

namespace {

struct Harness {
  context::ContextStore store{"https://example.com", "run-1", "full"};
  bus::EventBus bus;
  RecordingSink sink;
  core::StopToken stop;

  std::mutex mutex;
  std::vector<TaskStatus> statuses;  // record status seen at each event
  std::vector<int> progress;

  explicit Harness(const std::string &watch = "") {
    bus.subscribe_all([this, watch](const Event &e) {
      std::lock_guard<std::mutex> lock(mutex);
      if (e.type == EventType::PROGRESS) {
        progress.push_back(e.payload["progress"].get<int>());
      }
      if (!watch.empty()) {
        auto r = store.get_result(watch);
        if (r) statuses.push_back(r->status);
      }
    });
  }

  std::unique_ptr<TaskUnit> unit(std::unique_ptr<task::Task> t) {
    return std::make_unique<TaskUnit>(std::move(t), store, bus, sink);
  }
};

std::vector<TaskStatus> dedupe(const std::vector<TaskStatus> &in) {
  std::vector<TaskStatus> out;
  for (auto s : in) {
    if (out.empty() || out.back() != s) out.push_back(s);
  }
  return out;
}

} // namespace

TEST_CASE("task_unit_success_transitions_pending_running_completed") {
  Harness h("seo");
  auto task = std::make_unique<FnTask>("seo", [](TaskContext &ctx) {
    ctx.update_progress(40, "Crawling");
    ctx.update_progress(80, "Scoring");
    return WorkOutcome::success({{"score", 72}});
  });
  auto unit = h.unit(std::move(task));

  REQUIRE(unit->record().status == TaskStatus::PENDING);
  REQUIRE(h.store.get_result("seo")->status == TaskStatus::PENDING);

  TaskRecord r = unit->execute(h.stop);

  REQUIRE(r.status == TaskStatus::COMPLETED);
  REQUIRE(r.progress_percent == 100);
  REQUIRE(r.current_task_label == "Complete");
  REQUIRE(r.result_payload["score"] == 72);
  REQUIRE(r.result_payload["status"] == "completed");
  REQUIRE_FALSE(r.error_detail);
  REQUIRE(r.attempts == 1);

  auto stored = h.store.get_result("seo");
  REQUIRE(stored->status == TaskStatus::COMPLETED);
  REQUIRE(stored->result_payload["score"] == 72);

  REQUIRE(dedupe(h.statuses) ==
          std::vector<TaskStatus>{TaskStatus::RUNNING, TaskStatus::COMPLETED});

  auto completed = h.bus.history(std::string("seo"), EventType::COMPLETED);
  REQUIRE(completed.size() == 1);
  REQUIRE(completed[0].payload["score"] == 72);
}

TEST_CASE("task_unit_first_progress_event_is_starting_label_at_zero") {
  Harness h;
  auto unit = h.unit(std::make_unique<FnTask>(
      "seo", [](TaskContext &) { return WorkOutcome::success(); }));
  unit->execute(h.stop);

  auto progress = h.bus.history(std::string("seo"), EventType::PROGRESS);
  REQUIRE(progress.size() >= 2);
  REQUIRE(progress.front().payload["progress"] == 0);
  REQUIRE(progress.front().payload["task"] == "Starting SEO & Visibility");
  REQUIRE(progress.back().payload["progress"] == 100);
  REQUIRE(progress.back().payload["task"] == "Complete");

  auto calls = h.sink.calls();
  REQUIRE(calls.front().kind == "started");
}

TEST_CASE("task_unit_progress_is_clamped_and_never_regresses") {
  Harness h;
  auto unit = h.unit(std::make_unique<FnTask>("seo", [](TaskContext &ctx) {
    ctx.update_progress(50, "half");
    ctx.update_progress(30, "backwards");
    ctx.update_progress(-10, "negative");
    ctx.update_progress(150, "overshoot");
    return WorkOutcome::success();
  }));
  unit->execute(h.stop);

  REQUIRE_FALSE(h.progress.empty());
  for (size_t i = 1; i < h.progress.size(); ++i) {
    REQUIRE(h.progress[i] >= h.progress[i - 1]);
    REQUIRE(h.progress[i] <= 100);
  }
  REQUIRE(h.progress.back() == 100);
}

TEST_CASE("task_unit_succeeds_after_transient_failures") {
  Harness h;
  const int max_retries = 3;
  int attempts = 0;
  auto flaky = std::make_unique<FnTask>(
      "competitor",
      [&attempts, max_retries](TaskContext &) {
        ++attempts;
        if (attempts < max_retries) return WorkOutcome::failure("upstream timeout");
        return WorkOutcome::success({{"competitors", json::array({"a", "b"})}});
      },
      std::vector<std::string>{}, FnTask::fast_policy(max_retries, 1));

  auto unit = h.unit(std::move(flaky));
  TaskRecord r = unit->execute(h.stop);

  REQUIRE(r.status == TaskStatus::COMPLETED);
  REQUIRE(r.attempts == max_retries);
  REQUIRE(r.result_payload["competitors"].size() == 2);

  auto results = h.sink.results_for("competitor");
  REQUIRE(results.size() == 1);
  REQUIRE(results[0].status == TaskStatus::COMPLETED);
  REQUIRE(h.bus.history(std::string("competitor"), EventType::FAILED).empty());
}

TEST_CASE("task_unit_always_failing_runs_exactly_max_retries_with_backoff") {
  Harness h("social");
  auto task = std::make_unique<FnTask>(
      "social", [](TaskContext &) { return WorkOutcome::failure("rate limited"); },
      std::vector<std::string>{}, FnTask::fast_policy(3, 20));
  FnTask *raw = task.get();
  auto unit = h.unit(std::move(task));

  const auto t0 = std::chrono::steady_clock::now();
  TaskRecord r = unit->execute(h.stop);
  const auto elapsed = std::chrono::steady_clock::now() - t0;

  REQUIRE(raw->calls.load() == 3);
  REQUIRE(r.status == TaskStatus::FAILED);
  REQUIRE(r.error_detail);
  REQUIRE(*r.error_detail == "rate limited");
  REQUIRE(r.result_payload.is_null());
  // 20ms * (2^0 + 2^1)
  REQUIRE(elapsed >= std::chrono::milliseconds(60));

  auto failed = h.bus.history(std::string("social"), EventType::FAILED);
  REQUIRE(failed.size() == 1);
  REQUIRE(failed[0].payload["status"] == "failed");
  REQUIRE(failed[0].payload["error"] == "rate limited");

  auto results = h.sink.results_for("social");
  REQUIRE(results.size() == 1);
  REQUIRE(results[0].status == TaskStatus::FAILED);
  REQUIRE(results[0].error == std::optional<std::string>("rate limited"));

  REQUIRE(dedupe(h.statuses).back() == TaskStatus::FAILED);
}

TEST_CASE("task_unit_converts_thrown_exceptions_into_failures") {
  Harness h;
  auto throwing = h.unit(std::make_unique<FnTask>(
      "seo", [](TaskContext &) -> WorkOutcome { throw std::runtime_error("parse error"); },
      std::vector<std::string>{}, FnTask::fast_policy(2, 1)));
  TaskRecord r = throwing->execute(h.stop);
  REQUIRE(r.status == TaskStatus::FAILED);
  REQUIRE(*r.error_detail == "parse error");
  REQUIRE(r.attempts == 2);

  auto odd = h.unit(std::make_unique<FnTask>(
      "icp", [](TaskContext &) -> WorkOutcome { throw 7; },
      std::vector<std::string>{}, FnTask::fast_policy(1, 1)));
  TaskRecord r2 = odd->execute(h.stop);
  REQUIRE(r2.status == TaskStatus::FAILED);
  REQUIRE(*r2.error_detail == "unknown error");
}

TEST_CASE("task_unit_execute_on_terminal_unit_runs_nothing") {
  Harness h;
  auto task = std::make_unique<FnTask>(
      "seo", [](TaskContext &) { return WorkOutcome::success({{"v", 1}}); });
  FnTask *raw = task.get();
  auto unit = h.unit(std::move(task));

  TaskRecord first = unit->execute(h.stop);
  const auto events_after_first = h.bus.history().size();
  TaskRecord second = unit->execute(h.stop);

  REQUIRE(raw->calls.load() == 1);
  REQUIRE(second.status == first.status);
  REQUIRE(second.result_payload == first.result_payload);
  REQUIRE(h.bus.history().size() == events_after_first);
}

TEST_CASE("task_unit_can_run_reflects_completed_dependencies") {
  Harness h;
  auto unit = h.unit(std::make_unique<FnTask>(
      "icp", [](TaskContext &) { return WorkOutcome::success(); },
      std::vector<std::string>{"web_scraper", "company_research"}));

  REQUIRE_FALSE(unit->can_run());
  REQUIRE(unit->unmet_dependencies().size() == 2);

  TaskRecord scraper;
  scraper.name = "web_scraper";
  scraper.status = TaskStatus::COMPLETED;
  h.store.set_result(scraper);
  REQUIRE_FALSE(unit->can_run());

  TaskRecord research;
  research.name = "company_research";
  research.status = TaskStatus::FAILED;
  h.store.set_result(research);
  REQUIRE_FALSE(unit->can_run());
  REQUIRE(unit->unmet_dependencies() == std::vector<std::string>{"company_research"});

  research.status = TaskStatus::COMPLETED;
  h.store.set_result(research);
  REQUIRE(unit->can_run());
  REQUIRE(unit->record().status == TaskStatus::PENDING);
}

TEST_CASE("task_unit_cancel_during_backoff_fails_fast_with_cancelled_detail") {
  Harness h;
  auto unit = h.unit(std::make_unique<FnTask>(
      "review_sentiment", [](TaskContext &) { return WorkOutcome::failure("flaky"); },
      std::vector<std::string>{}, FnTask::fast_policy(3, 5000)));

  std::thread canceller([&] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    h.stop.request_stop("user abort");
  });

  const auto t0 = std::chrono::steady_clock::now();
  TaskRecord r = unit->execute(h.stop);
  const auto elapsed = std::chrono::steady_clock::now() - t0;
  canceller.join();

  REQUIRE(r.status == TaskStatus::FAILED);
  REQUIRE(r.cancelled());
  REQUIRE(*r.error_detail == "cancelled: user abort");
  REQUIRE(r.attempts == 1);
  REQUIRE(elapsed < std::chrono::milliseconds(3000));
}

TEST_CASE("task_unit_stop_requested_from_work_is_not_retried") {
  Harness h;
  auto task = std::make_unique<FnTask>(
      "seo", [](TaskContext &) -> WorkOutcome { throw StopRequested(); },
      std::vector<std::string>{}, FnTask::fast_policy(3, 1));
  FnTask *raw = task.get();
  auto unit = h.unit(std::move(task));

  TaskRecord r = unit->execute(h.stop);
  REQUIRE(raw->calls.load() == 1);
  REQUIRE(r.status == TaskStatus::FAILED);
  REQUIRE(r.cancelled());
}

TEST_CASE("task_unit_with_stopped_token_never_invokes_work") {
  Harness h;
  h.stop.request_stop("deadline");
  auto task = std::make_unique<FnTask>(
      "seo", [](TaskContext &) { return WorkOutcome::success(); });
  FnTask *raw = task.get();
  auto unit = h.unit(std::move(task));

  TaskRecord r = unit->execute(h.stop);
  REQUIRE(raw->calls.load() == 0);
  REQUIRE(r.status == TaskStatus::FAILED);
  REQUIRE(*r.error_detail == "cancelled: deadline");
}

TEST_CASE("task_unit_persistence_failures_do_not_fail_the_task") {
  context::ContextStore store("t", "r", "full");
  bus::EventBus bus;
  ThrowingSink sink;
  core::StopToken stop;

  TaskUnit unit(std::make_unique<FnTask>(
                    "seo", [](TaskContext &ctx) {
                      ctx.update_progress(50, "half");
                      return WorkOutcome::success({{"ok", true}});
                    }),
                store, bus, sink);

  TaskRecord r;
  REQUIRE_NOTHROW(r = unit.execute(stop));
  REQUIRE(r.status == TaskStatus::COMPLETED);
  REQUIRE(store.is_completed("seo"));
}

TEST_CASE("task_unit_non_object_payload_is_wrapped") {
  Harness h;
  auto unit = h.unit(std::make_unique<FnTask>(
      "report", [](TaskContext &) { return WorkOutcome::success(json::array({1, 2})); }));
  TaskRecord r = unit->execute(h.stop);
  REQUIRE(r.result_payload["result"] == json::array({1, 2}));
  REQUIRE(r.result_payload["status"] == "completed");
}
