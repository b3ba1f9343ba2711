#pragma once

#include "agent_runner/core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace agent_runner::context {

/**
 * Shared state for all tasks of one run.
 *
 * Writers serialize on a single mutex and publish a new immutable snapshot;
 * readers load the current snapshot without locking, so a reader never sees a
 * half-applied write. A TaskRecord carries status and payload together, which
 * makes "completed" and its payload visible in the same write.
 */
class ContextStore {
public:
    ContextStore(std::string target, std::string run_id, std::string run_mode);

    ContextStore(const ContextStore&) = delete;
    ContextStore& operator=(const ContextStore&) = delete;

    const std::string& target() const { return target_; }
    const std::string& run_id() const { return run_id_; }
    const std::string& run_mode() const { return run_mode_; }

    // Pending records for every task the run knows about. Existing records are kept.
    void initialize_records(const std::vector<std::string>& names);

    void set_result(const TaskRecord& record);
    std::shared_ptr<const TaskRecord> get_result(const std::string& name) const;
    bool is_completed(const std::string& name) const;

    std::vector<TaskRecord> records() const;
    std::vector<TaskRecord> records_with_status(TaskStatus status) const;

    // Insert or overwrite by (kind, key); an overwrite keeps the original position.
    void set_artifact(SharedArtifact artifact);

    std::shared_ptr<const SharedArtifact> find_artifact(const std::string& kind,
                                                        const std::string& key) const;
    // In insertion order
    std::vector<SharedArtifact> artifacts_of_kind(const std::string& kind) const;
    std::vector<SharedArtifact> artifacts_where(const std::string& kind,
                                                const std::string& field,
                                                const json& value) const;
    std::vector<SharedArtifact> artifacts_with_key_prefix(const std::string& kind,
                                                          const std::string& prefix) const;
    // Artifact keyed by the run target (trailing '/' ignored), else the first of `kind`
    std::shared_ptr<const SharedArtifact> target_artifact(const std::string& kind) const;

    /**
     * Text of all artifacts of `kind`, one chunk per artifact, each chunk's
     * `text_field` cut to `per_item_limit` bytes. Stops before the first chunk
     * that would push the total past `max_bytes`.
     */
    std::string concatenated_text(const std::string& kind, const std::string& text_field,
                                  std::size_t max_bytes,
                                  std::size_t per_item_limit = 5000) const;

    std::size_t artifact_count() const;

private:
    struct ArtifactEntry {
        uint64_t order = 0;
        std::shared_ptr<const SharedArtifact> artifact;
    };

    using RecordMap = std::map<std::string, std::shared_ptr<const TaskRecord>>;
    using ArtifactMap = std::map<std::pair<std::string, std::string>, ArtifactEntry>;

    std::shared_ptr<const RecordMap> record_snapshot() const;
    std::shared_ptr<const ArtifactMap> artifact_snapshot() const;
    std::vector<std::shared_ptr<const SharedArtifact>> ordered_of_kind(const std::string& kind) const;

    std::string target_;
    std::string run_id_;
    std::string run_mode_;

    std::mutex write_mutex_;
    uint64_t next_order_ = 0;
    std::shared_ptr<const RecordMap> records_;
    std::shared_ptr<const ArtifactMap> artifacts_;
};

} // namespace agent_runner::context
