#include "agent_runner/persistence/persistence_sink.hpp"
#include "agent_runner/core/errors.hpp"
#include "agent_runner/core/utils.hpp"

namespace agent_runner::persistence {

FilePersistenceSink::FilePersistenceSink(fs::path dir) : dir_(std::move(dir)) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw IOError("Cannot create " + dir_.string() + ": " + ec.message());
    }
}

fs::path FilePersistenceSink::path_for(const std::string& task) const {
    if (!core::is_safe_file_stem(task)) {
        throw IOError("Task name not usable as file name: '" + task + "'");
    }
    return dir_ / (task + ".json");
}

json& FilePersistenceSink::document_locked(const std::string& task) {
    auto it = documents_.find(task);
    if (it != documents_.end()) {
        return it->second;
    }
    json doc = {
        {"task", task},
        {"status", task_status_to_string(TaskStatus::PENDING)},
        {"progress", 0},
        {"current_task", ""},
        {"started_at", nullptr},
        {"completed_at", nullptr},
        {"result", nullptr},
        {"error", nullptr}
    };
    return documents_.emplace(task, std::move(doc)).first->second;
}

void FilePersistenceSink::flush_locked(const std::string& task, const json& doc) {
    json out = doc;
    out["updated_at"] = core::get_iso_timestamp();
    core::write_text_atomic(path_for(task), out.dump(2));
}

void FilePersistenceSink::save_started(const std::string& task, const std::string& started_at) {
    std::lock_guard<std::mutex> lock(mutex_);
    json& doc = document_locked(task);
    doc["started_at"] = started_at;
    doc["status"] = task_status_to_string(TaskStatus::RUNNING);
    flush_locked(task, doc);
}

void FilePersistenceSink::save_progress(const std::string& task, int percent,
                                        const std::string& label, TaskStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    json& doc = document_locked(task);
    doc["progress"] = percent;
    doc["current_task"] = label;
    doc["status"] = task_status_to_string(status);
    flush_locked(task, doc);
}

void FilePersistenceSink::save_result(const std::string& task, TaskStatus status,
                                      const json& payload,
                                      const std::optional<std::string>& error_detail) {
    std::lock_guard<std::mutex> lock(mutex_);
    json& doc = document_locked(task);
    doc["status"] = task_status_to_string(status);
    if (status == TaskStatus::COMPLETED) {
        doc["progress"] = 100;
    }
    doc["result"] = payload;
    doc["error"] = error_detail ? json(*error_detail) : json(nullptr);
    doc["completed_at"] = core::get_iso_timestamp();
    flush_locked(task, doc);
}

std::optional<json> FilePersistenceSink::load(const fs::path& dir, const std::string& task) {
    if (!core::is_safe_file_stem(task)) {
        return std::nullopt;
    }
    fs::path p = dir / (task + ".json");
    if (!fs::exists(p)) {
        return std::nullopt;
    }
    try {
        return json::parse(core::read_text(p));
    } catch (const json::parse_error&) {
        return std::nullopt;
    }
}

} // namespace agent_runner::persistence
