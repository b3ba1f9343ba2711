#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <ostream>
#include <string>

namespace agent_runner::core {

/**
 * JSONL event journal for one run.
 * One JSON object per line; safe to call from concurrent task threads.
 */
class EventEmitter {
public:
    EventEmitter(std::ostream& out, std::string run_id);

    EventEmitter(const EventEmitter&) = delete;
    EventEmitter& operator=(const EventEmitter&) = delete;

    const std::string& run_id() const { return run_id_; }

    void run_start(const json& extra);
    void run_end(bool success, const std::string& status,
                 const json& extra = json::object());

    void phase_start(int phase_index, const std::string& phase_name,
                     const json& extra = json::object());
    void phase_end(int phase_index, const std::string& phase_name,
                   const std::string& status, const json& extra = json::object());

    void task_skipped(const std::string& phase_name, const std::string& task,
                      const std::string& reason);

    // Mirrors a bus event (progress_update | task_completed | task_failed)
    void task_event(const Event& event);

    void warning(const std::string& message);
    void error(const std::string& message);

private:
    void emit(const json& event);
    json base_event(const std::string& type) const;

    std::ostream& out_;
    std::string run_id_;
    std::mutex mutex_;
};

} // namespace agent_runner::core
