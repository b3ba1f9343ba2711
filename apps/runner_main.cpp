#include "agent_runner/bus/event_bus.hpp"
#include "agent_runner/config/configuration.hpp"
#include "agent_runner/context/context_store.hpp"
#include "agent_runner/core/errors.hpp"
#include "agent_runner/core/events.hpp"
#include "agent_runner/core/logging.hpp"
#include "agent_runner/core/run_mode.hpp"
#include "agent_runner/core/stop_token.hpp"
#include "agent_runner/core/utils.hpp"
#include "agent_runner/orchestrator/orchestrator.hpp"
#include "agent_runner/persistence/persistence_sink.hpp"
#include "agent_runner/task/catalog.hpp"

#include "runner_shared.hpp"

#include <CLI/CLI.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

using namespace agent_runner;

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitNoOutput = 2;

struct RunOptions {
  std::string config_path;
  std::string runs_dir;
  std::string target;
  std::string mode;
  std::string run_id;
  std::vector<std::string> phases;
  bool dry_run = false;
};

int run_command(const RunOptions &opts) {
  fs::path cfg_path(opts.config_path);
  if (!fs::exists(cfg_path)) {
    std::cerr << "Error: Config file not found: " << opts.config_path
              << std::endl;
    return kExitError;
  }

  config::Config cfg;
  try {
    cfg = config::Config::load(cfg_path);
    if (!opts.target.empty())
      cfg.run.target = opts.target;
    if (!opts.mode.empty())
      cfg.run.mode = opts.mode;
    if (!opts.run_id.empty())
      cfg.run.run_id = opts.run_id;
    cfg.validate();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitError;
  }

  if (auto level = core::parse_log_level(cfg.logging.level)) {
    core::Logger::set_level(*level);
  }

  if (cfg.run.target.empty()) {
    std::cerr << "Error: no target given (run.target or --target)"
              << std::endl;
    return kExitError;
  }

  const core::RunMode mode =
      core::parse_run_mode(cfg.run.mode).value_or(core::RunMode::Full);
  const std::string run_id =
      cfg.run.run_id.empty() ? core::get_run_id() : cfg.run.run_id;
  cfg.run.run_id = run_id;

  runner::RunLayout layout;
  try {
    layout = runner::prepare_run_dir(fs::path(opts.runs_dir), run_id);
    cfg.save(layout.config_path);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitError;
  }

  std::ofstream event_log_file;
  std::unique_ptr<runner::TeeBuf> tee_buf;
  std::ostream journal(std::cout.rdbuf());
  if (cfg.logging.event_log) {
    event_log_file.open(layout.event_log_path);
    if (!event_log_file) {
      std::cerr << "Error: cannot open " << layout.event_log_path.string()
                << std::endl;
      return kExitError;
    }
    tee_buf = std::make_unique<runner::TeeBuf>(std::cout.rdbuf(),
                                               event_log_file.rdbuf());
    journal.rdbuf(tee_buf.get());
  }

  core::EventEmitter emitter(journal, run_id);
  context::ContextStore store(cfg.run.target, run_id,
                              core::run_mode_to_string(mode));
  bus::EventBus event_bus(static_cast<std::size_t>(cfg.bus.history_capacity));
  core::StopToken stop;
  if (cfg.run.timeout_minutes > 0) {
    stop.set_timeout(std::chrono::minutes(cfg.run.timeout_minutes));
  }

  std::unique_ptr<persistence::PersistenceSink> sink;
  try {
    sink = std::make_unique<persistence::FilePersistenceSink>(layout.tasks_dir);
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitError;
  }

  event_bus.subscribe_all([&emitter](const Event &e) { emitter.task_event(e); });

  const task::TaskCatalog catalog = task::TaskCatalog::from_config(cfg);
  orchestrator::Orchestrator orch(store, event_bus, *sink, stop);
  orch.set_emitter(&emitter);

  std::vector<std::string> registered;
  try {
    registered = orch.register_all(catalog, mode, cfg.modes);
  } catch (const SchedulingError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitError;
  }

  emitter.run_start({{"config_path", opts.config_path},
                     {"target", cfg.run.target},
                     {"run_mode", core::run_mode_to_string(mode)},
                     {"run_dir", layout.root.string()},
                     {"tasks", registered},
                     {"phases", opts.phases},
                     {"dry_run", opts.dry_run}});

  core::Logger::info("runner", "Run ID: " + run_id);
  core::Logger::info("runner", "Target: " + cfg.run.target);
  core::Logger::info("runner", "Output: " + layout.root.string());

  if (opts.dry_run) {
    for (const auto &phase : orch.phases()) {
      std::vector<std::string> tasks;
      for (const auto &name : phase.tasks) {
        if (orch.is_registered(name))
          tasks.push_back(name);
      }
      core::Logger::info("runner", "Phase " + phase.name + ": [" +
                                       core::join(tasks, ", ") + "]");
    }
    core::Logger::info("runner", "Dry run - no tasks executed");
    emitter.run_end(true, "ok", {{"dry_run", true}});
    return kExitOk;
  }

  try {
    runner::SignalWatcher watcher(stop);
    if (opts.phases.empty()) {
      orch.run_all();
    } else {
      orch.run_phases(opts.phases);
    }
  } catch (const SchedulingError &e) {
    emitter.error(e.what());
    emitter.run_end(false, "error", {{"error", e.what()}});
    std::cerr << "Error: " << e.what() << std::endl;
    return kExitError;
  } catch (const std::exception &e) {
    emitter.error(std::string("internal error: ") + e.what());
    emitter.run_end(false, "error", {{"error", e.what()}});
    std::cerr << "Error during run: " << e.what() << std::endl;
    return kExitError;
  }

  const orchestrator::RunSummary summary = orch.summarize();
  const json summary_json = summary.to_json();
  try {
    json summary_doc = summary_json;
    summary_doc["run_id"] = run_id;
    summary_doc["target"] = cfg.run.target;
    summary_doc["records"] = json::array();
    for (const auto &record : store.records()) {
      if (orch.is_registered(record.name))
        summary_doc["records"].push_back(task_record_to_json(record));
    }
    core::write_text_atomic(layout.summary_path, summary_doc.dump(2));
  } catch (const std::exception &e) {
    core::Logger::warn("runner", std::string("Cannot write summary: ") + e.what());
  }

  const bool usable = summary.outcome != orchestrator::RunOutcome::NO_USABLE_OUTPUT;
  if (stop.stop_requested()) {
    emitter.warning("run stopped: " + stop.reason());
  }
  emitter.run_end(usable, orchestrator::run_outcome_to_string(summary.outcome),
                  summary_json);

  core::Logger::info("runner",
                     "Outcome: " + orchestrator::run_outcome_to_string(summary.outcome) +
                         " (" + std::to_string(summary.completed) + " completed, " +
                         std::to_string(summary.failed) + " failed, " +
                         std::to_string(summary.pending) + " skipped)");
  if (!usable) {
    std::cerr << "Error: no task produced usable output" << std::endl;
    return kExitNoOutput;
  }
  return kExitOk;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Agent Runner"};
  app.require_subcommand(1);

  RunOptions opts;

  auto run_cmd = app.add_subcommand("run", "Run all task phases against a target");
  run_cmd->add_option("--config", opts.config_path, "Path to config.yaml")
      ->required();
  run_cmd->add_option("--runs-dir", opts.runs_dir, "Runs directory")->required();
  run_cmd->add_option("--target", opts.target, "Override run.target");
  run_cmd->add_option("--mode", opts.mode, "Override run.mode (full|quick)");
  run_cmd->add_option("--run-id", opts.run_id, "Override the generated run id");
  run_cmd->add_option("--phases", opts.phases,
                      "Run only these phases (comma separated)")
      ->delimiter(',');
  run_cmd->add_flag("--dry-run", opts.dry_run,
                    "Register tasks and print the plan without running it");

  CLI11_PARSE(app, argc, argv);

  if (run_cmd->parsed()) {
    return run_command(opts);
  }
  return kExitError;
}
