#pragma once

#include "agent_runner/core/types.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace agent_runner::persistence {

namespace fs = std::filesystem;

// Durable mirror of task records. Keyed by task name, last write wins.
// Implementations may throw; TaskUnit logs such failures and carries on.
class PersistenceSink {
public:
    virtual ~PersistenceSink() = default;

    virtual void save_started(const std::string& task, const std::string& started_at) = 0;
    virtual void save_progress(const std::string& task, int percent,
                               const std::string& label, TaskStatus status) = 0;
    virtual void save_result(const std::string& task, TaskStatus status,
                             const json& payload,
                             const std::optional<std::string>& error_detail) = 0;
};

class NullPersistenceSink final : public PersistenceSink {
public:
    void save_started(const std::string&, const std::string&) override {}
    void save_progress(const std::string&, int, const std::string&, TaskStatus) override {}
    void save_result(const std::string&, TaskStatus, const json&,
                     const std::optional<std::string>&) override {}
};

/**
 * One JSON document per task under `dir` (`<dir>/<task>.json`), replaced
 * atomically on every save.
 */
class FilePersistenceSink : public PersistenceSink {
public:
    explicit FilePersistenceSink(fs::path dir);

    void save_started(const std::string& task, const std::string& started_at) override;
    void save_progress(const std::string& task, int percent,
                       const std::string& label, TaskStatus status) override;
    void save_result(const std::string& task, TaskStatus status,
                     const json& payload,
                     const std::optional<std::string>& error_detail) override;

    const fs::path& dir() const { return dir_; }

    // Reads a previously written document back from disk
    static std::optional<json> load(const fs::path& dir, const std::string& task);

private:
    json& document_locked(const std::string& task);
    void flush_locked(const std::string& task, const json& doc);
    fs::path path_for(const std::string& task) const;

    fs::path dir_;
    std::mutex mutex_;
    std::map<std::string, json> documents_;
};

} // namespace agent_runner::persistence
