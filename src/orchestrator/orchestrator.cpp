#include "agent_runner/orchestrator/orchestrator.hpp"
#include "agent_runner/core/errors.hpp"
#include "agent_runner/core/logging.hpp"
#include "agent_runner/core/task_names.hpp"
#include "agent_runner/core/utils.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>

namespace agent_runner::orchestrator {

namespace tn = task_names;

namespace {
constexpr const char* kTag = "orchestrator";
}

const std::vector<PhaseSpec>& default_phases() {
    static const std::vector<PhaseSpec> kPhases = {
        {"collection", {tn::kWebScraper}},
        {"auxiliary-capture", {tn::kScreenshot}},
        {"enrichment", {tn::kCompanyResearch}},
        {"parallel-analysis",
         {tn::kCompetitor, tn::kReviewSentiment, tn::kSeo, tn::kMessaging,
          tn::kVisualDesign, tn::kConversion, tn::kSocial}},
        {"dependent-synthesis", {tn::kIcp}},
        {"final-aggregation", {tn::kReport}},
    };
    return kPhases;
}

std::string run_outcome_to_string(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::SUCCEEDED: return "succeeded";
        case RunOutcome::PARTIAL: return "partial";
        case RunOutcome::NO_USABLE_OUTPUT: return "no_usable_output";
        default: return "unknown";
    }
}

json RunSummary::to_json() const {
    return {
        {"outcome", run_outcome_to_string(outcome)},
        {"completed", completed},
        {"failed", failed},
        {"pending", pending},
        {"running", running},
        {"completed_tasks", completed_tasks},
        {"failed_tasks", failed_tasks},
        {"skipped_tasks", skipped_tasks}
    };
}

Orchestrator::Orchestrator(context::ContextStore& store, bus::EventBus& bus,
                           persistence::PersistenceSink& sink, const core::StopToken& stop,
                           std::vector<PhaseSpec> phases)
    : store_(store), bus_(bus), sink_(sink), stop_(stop), phases_(std::move(phases)) {}

void Orchestrator::register_task(std::unique_ptr<task::Task> task) {
    if (!task) {
        throw SchedulingError("cannot register a null task");
    }
    const std::string name = task->name();
    if (units_.count(name)) {
        throw SchedulingError("task '" + name + "' registered twice");
    }
    units_[name] = std::make_unique<task::TaskUnit>(std::move(task), store_, bus_, sink_);
    order_.push_back(name);
}

std::vector<std::string> Orchestrator::register_all(const task::TaskCatalog& catalog,
                                                    core::RunMode mode,
                                                    const core::ModeOverrides& overrides) {
    std::vector<std::string> registered;
    const auto required = core::tasks_for_mode(mode, overrides);
    for (const auto& name : required) {
        if (!catalog.contains(name)) {
            core::Logger::warn(kTag, "No implementation for " + name + "; it will not run");
            continue;
        }
        register_task(catalog.create(name));
        registered.push_back(name);
    }
    // everything the run knows about starts out pending
    store_.initialize_records(tn::all());
    core::Logger::info(kTag, "Registered " + std::to_string(registered.size()) + " task(s) for " +
                                 core::run_mode_to_string(mode) + " mode");
    return registered;
}

const task::TaskUnit* Orchestrator::unit(const std::string& name) const {
    auto it = units_.find(name);
    return it != units_.end() ? it->second.get() : nullptr;
}

void Orchestrator::run_phase(const std::string& phase_name,
                             const std::vector<std::string>& task_names) {
    int index = -1;  // ad hoc phase outside the phase table
    for (size_t i = 0; i < phases_.size(); ++i) {
        if (phases_[i].name == phase_name) {
            index = static_cast<int>(i);
            break;
        }
    }
    run_phase_at(index, phase_name, task_names);
}

void Orchestrator::run_phase_at(int index, const std::string& phase_name,
                                const std::vector<std::string>& task_names) {
    std::vector<task::TaskUnit*> present;
    for (const auto& name : task_names) {
        auto it = units_.find(name);
        if (it != units_.end() && it->second->record().status == TaskStatus::PENDING) {
            present.push_back(it->second.get());
        }
    }
    if (present.empty()) {
        core::Logger::debug(kTag, "Phase " + phase_name + " has no runnable tasks");
        return;
    }

    std::vector<task::TaskUnit*> ready;
    std::vector<std::pair<std::string, std::string>> skipped;  // name, reason
    for (auto* unit : present) {
        if (unit->can_run()) {
            ready.push_back(unit);
        } else {
            skipped.emplace_back(unit->name(), "dependencies not completed: " +
                                                   core::join(unit->unmet_dependencies(), ", "));
        }
    }

    std::vector<std::string> scheduled;
    for (auto* unit : ready) scheduled.push_back(unit->name());

    core::Logger::info(kTag, "Phase " + phase_name + ": running [" + core::join(scheduled, ", ") +
                                 "]");
    if (emitter_) {
        emitter_->phase_start(index, phase_name, {{"tasks", scheduled}});
    }
    for (const auto& [name, reason] : skipped) {
        core::Logger::warn(kTag, "Skipping " + name + " in " + phase_name + ": " + reason);
        if (emitter_) {
            emitter_->task_skipped(phase_name, name, reason);
        }
    }

    std::vector<std::exception_ptr> errors(ready.size());
    std::vector<std::thread> workers;
    workers.reserve(ready.size());
    for (size_t i = 0; i < ready.size(); ++i) {
        auto work = [this, &errors, &ready, i] {
            try {
                ready[i]->execute(stop_);
            } catch (...) {
                errors[i] = std::current_exception();
            }
        };
        try {
            workers.emplace_back(work);
        } catch (const std::system_error& e) {
            core::Logger::warn(kTag, std::string("Thread start failed, running ") +
                                         ready[i]->name() + " inline: " + e.what());
            work();
        }
    }
    for (auto& t : workers) {
        t.join();
    }

    int completed = 0;
    int failed = 0;
    for (auto* unit : ready) {
        const auto status = unit->record().status;
        if (status == TaskStatus::COMPLETED) ++completed;
        if (status == TaskStatus::FAILED) ++failed;
    }

    const std::string status = failed == 0 ? "ok" : (completed == 0 ? "error" : "partial");
    if (emitter_) {
        emitter_->phase_end(index, phase_name, status,
                            {{"scheduled", scheduled.size()},
                             {"skipped", skipped.size()},
                             {"completed", completed},
                             {"failed", failed}});
    }
    core::Logger::info(kTag, "Phase " + phase_name + " settled: " + std::to_string(completed) +
                                 " completed, " + std::to_string(failed) + " failed, " +
                                 std::to_string(skipped.size()) + " skipped");

    for (const auto& err : errors) {
        if (err) {
            std::rethrow_exception(err);
        }
    }
}

void Orchestrator::run_all() {
    for (size_t i = 0; i < phases_.size(); ++i) {
        run_phase_at(static_cast<int>(i), phases_[i].name, phases_[i].tasks);
    }
}

void Orchestrator::check_selection(const std::set<std::string>& selected_phases) const {
    std::set<std::string> selected_tasks;
    for (const auto& phase : phases_) {
        if (!selected_phases.count(phase.name)) continue;
        for (const auto& name : phase.tasks) {
            if (units_.count(name)) selected_tasks.insert(name);
        }
    }

    for (const auto& name : selected_tasks) {
        for (const auto& dep : units_.at(name)->dependencies()) {
            if (!units_.count(dep) || selected_tasks.count(dep) || store_.is_completed(dep)) {
                continue;
            }
            throw SchedulingError("task '" + name + "' depends on '" + dep +
                                  "', which belongs to a phase that is not selected");
        }
    }
}

void Orchestrator::run_phases(const std::vector<std::string>& selection) {
    std::set<std::string> selected(selection.begin(), selection.end());
    for (const auto& name : selected) {
        const bool known = std::any_of(phases_.begin(), phases_.end(),
                                       [&](const PhaseSpec& p) { return p.name == name; });
        if (!known) {
            throw SchedulingError("unknown phase '" + name + "'");
        }
    }
    check_selection(selected);

    for (size_t i = 0; i < phases_.size(); ++i) {
        if (selected.count(phases_[i].name)) {
            run_phase_at(static_cast<int>(i), phases_[i].name, phases_[i].tasks);
        }
    }
}

RunSummary Orchestrator::summarize() const {
    RunSummary summary;
    for (const auto& name : order_) {
        const TaskRecord record = units_.at(name)->record();
        switch (record.status) {
            case TaskStatus::COMPLETED:
                ++summary.completed;
                summary.completed_tasks.push_back(name);
                break;
            case TaskStatus::FAILED:
                ++summary.failed;
                summary.failed_tasks.push_back(name);
                break;
            case TaskStatus::PENDING:
                ++summary.pending;
                summary.skipped_tasks.push_back(name);
                break;
            case TaskStatus::RUNNING:
                ++summary.running;
                break;
        }
    }

    if (summary.completed == 0) {
        summary.outcome = RunOutcome::NO_USABLE_OUTPUT;
    } else if (summary.failed == 0 && summary.pending == 0 && summary.running == 0) {
        summary.outcome = RunOutcome::SUCCEEDED;
    } else {
        summary.outcome = RunOutcome::PARTIAL;
    }
    return summary;
}

} // namespace agent_runner::orchestrator
