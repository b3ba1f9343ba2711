#pragma once

#include "agent_runner/bus/event_bus.hpp"
#include "agent_runner/context/context_store.hpp"
#include "agent_runner/core/events.hpp"
#include "agent_runner/core/run_mode.hpp"
#include "agent_runner/core/stop_token.hpp"
#include "agent_runner/persistence/persistence_sink.hpp"
#include "agent_runner/task/catalog.hpp"
#include "agent_runner/task/task_unit.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace agent_runner::orchestrator {

struct PhaseSpec {
    std::string name;
    std::vector<std::string> tasks;
};

// collection -> auxiliary-capture -> enrichment -> parallel-analysis
// -> dependent-synthesis -> final-aggregation
const std::vector<PhaseSpec>& default_phases();

enum class RunOutcome {
    SUCCEEDED,
    PARTIAL,
    NO_USABLE_OUTPUT
};

std::string run_outcome_to_string(RunOutcome outcome);

struct RunSummary {
    int completed = 0;
    int failed = 0;
    int pending = 0;
    int running = 0;
    std::vector<std::string> completed_tasks;
    std::vector<std::string> failed_tasks;
    std::vector<std::string> skipped_tasks;  // still pending after the run
    RunOutcome outcome = RunOutcome::NO_USABLE_OUTPUT;

    json to_json() const;
};

/**
 * Runs registered task units phase by phase. Within a phase every ready unit
 * gets its own thread; the phase ends when all of them are terminal. Units
 * whose dependencies are not completed are skipped for the run.
 *
 * Task failures never abort the run. Only SchedulingError (bad registration or
 * phase selection) and wrapper bugs propagate.
 */
class Orchestrator {
public:
    Orchestrator(context::ContextStore& store, bus::EventBus& bus,
                 persistence::PersistenceSink& sink, const core::StopToken& stop,
                 std::vector<PhaseSpec> phases = default_phases());

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Phase lifecycle goes to the journal when set
    void set_emitter(core::EventEmitter* emitter) { emitter_ = emitter; }

    void register_task(std::unique_ptr<task::Task> task);

    // One unit per catalog entry the mode requires; returns the registered names
    std::vector<std::string> register_all(const task::TaskCatalog& catalog, core::RunMode mode,
                                          const core::ModeOverrides& overrides = {});

    // A name missing from the phase table is journaled with phase index -1
    void run_phase(const std::string& phase_name, const std::vector<std::string>& task_names);
    void run_all();
    void run_phases(const std::vector<std::string>& selection);

    RunSummary summarize() const;

    const std::vector<PhaseSpec>& phases() const { return phases_; }
    bool is_registered(const std::string& name) const { return units_.count(name) > 0; }
    const task::TaskUnit* unit(const std::string& name) const;

private:
    void run_phase_at(int index, const std::string& phase_name,
                      const std::vector<std::string>& task_names);
    void check_selection(const std::set<std::string>& selected_phases) const;

    context::ContextStore& store_;
    bus::EventBus& bus_;
    persistence::PersistenceSink& sink_;
    const core::StopToken& stop_;
    std::vector<PhaseSpec> phases_;
    core::EventEmitter* emitter_ = nullptr;

    std::map<std::string, std::unique_ptr<task::TaskUnit>> units_;
    std::vector<std::string> order_;
};

} // namespace agent_runner::orchestrator
