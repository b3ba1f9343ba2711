#include "agent_runner/core/errors.hpp"
#include "agent_runner/persistence/persistence_sink.hpp"

#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

using agent_runner::IOError;
using agent_runner::TaskStatus;
using agent_runner::json;
using agent_runner::persistence::FilePersistenceSink;

TEST_CASE("file_sink_writes_one_document_per_task_last_write_wins") {
  agent_runner::testing::TempDir dir;
  FilePersistenceSink sink(dir.path() / "tasks");

  sink.save_started("seo", "2024-05-01T10:00:00Z");
  sink.save_progress("seo", 40, "Scoring", TaskStatus::RUNNING);

  auto doc = FilePersistenceSink::load(sink.dir(), "seo");
  REQUIRE(doc);
  REQUIRE((*doc)["status"] == "running");
  REQUIRE((*doc)["progress"] == 40);
  REQUIRE((*doc)["current_task"] == "Scoring");
  REQUIRE((*doc)["started_at"] == "2024-05-01T10:00:00Z");

  sink.save_result("seo", TaskStatus::COMPLETED, {{"score", 72}}, std::nullopt);
  doc = FilePersistenceSink::load(sink.dir(), "seo");
  REQUIRE((*doc)["status"] == "completed");
  REQUIRE((*doc)["progress"] == 100);
  REQUIRE((*doc)["result"]["score"] == 72);
  REQUIRE((*doc)["error"].is_null());
  REQUIRE((*doc)["completed_at"].is_string());
}

TEST_CASE("file_sink_records_failure_detail") {
  agent_runner::testing::TempDir dir;
  FilePersistenceSink sink(dir.path());
  sink.save_result("icp", TaskStatus::FAILED, nullptr, std::string("boom"));

  auto doc = FilePersistenceSink::load(dir.path(), "icp");
  REQUIRE(doc);
  REQUIRE((*doc)["status"] == "failed");
  REQUIRE((*doc)["error"] == "boom");
  REQUIRE((*doc)["result"].is_null());
}

TEST_CASE("file_sink_rejects_unsafe_names") {
  agent_runner::testing::TempDir dir;
  FilePersistenceSink sink(dir.path());
  REQUIRE_THROWS_AS(sink.save_progress("../escape", 1, "x", TaskStatus::RUNNING), IOError);
  REQUIRE_FALSE(FilePersistenceSink::load(dir.path(), "../escape"));
  REQUIRE_FALSE(FilePersistenceSink::load(dir.path(), "never_written"));
}
