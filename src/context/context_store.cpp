#include "agent_runner/context/context_store.hpp"
#include "agent_runner/core/utils.hpp"

#include <algorithm>
#include <atomic>

namespace agent_runner::context {

namespace {

std::string strip_trailing_slashes(std::string s) {
    while (!s.empty() && s.back() == '/') {
        s.pop_back();
    }
    return s;
}

// At most `limit` bytes of `s`, never ending inside a UTF-8 sequence
std::string utf8_prefix(const std::string& s, std::size_t limit) {
    if (s.size() <= limit) {
        return s;
    }
    std::size_t end = limit;
    while (end > 0 && (static_cast<unsigned char>(s[end]) & 0xC0) == 0x80) {
        --end;
    }
    return s.substr(0, end);
}

} // namespace

ContextStore::ContextStore(std::string target, std::string run_id, std::string run_mode)
    : target_(std::move(target)),
      run_id_(std::move(run_id)),
      run_mode_(std::move(run_mode)),
      records_(std::make_shared<const RecordMap>()),
      artifacts_(std::make_shared<const ArtifactMap>()) {}

std::shared_ptr<const ContextStore::RecordMap> ContextStore::record_snapshot() const {
    return std::atomic_load(&records_);
}

std::shared_ptr<const ContextStore::ArtifactMap> ContextStore::artifact_snapshot() const {
    return std::atomic_load(&artifacts_);
}

void ContextStore::initialize_records(const std::vector<std::string>& names) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<RecordMap>(*records_);
    for (const auto& name : names) {
        if (next->count(name)) continue;
        TaskRecord r;
        r.name = name;
        (*next)[name] = std::make_shared<const TaskRecord>(std::move(r));
    }
    std::atomic_store(&records_, std::shared_ptr<const RecordMap>(std::move(next)));
}

void ContextStore::set_result(const TaskRecord& record) {
    auto stored = std::make_shared<const TaskRecord>(record);
    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<RecordMap>(*records_);
    (*next)[record.name] = std::move(stored);
    std::atomic_store(&records_, std::shared_ptr<const RecordMap>(std::move(next)));
}

std::shared_ptr<const TaskRecord> ContextStore::get_result(const std::string& name) const {
    auto snap = record_snapshot();
    auto it = snap->find(name);
    if (it == snap->end()) {
        return nullptr;
    }
    return it->second;
}

bool ContextStore::is_completed(const std::string& name) const {
    auto r = get_result(name);
    return r && r->status == TaskStatus::COMPLETED;
}

std::vector<TaskRecord> ContextStore::records() const {
    auto snap = record_snapshot();
    std::vector<TaskRecord> out;
    out.reserve(snap->size());
    for (const auto& [name, rec] : *snap) {
        out.push_back(*rec);
    }
    return out;
}

std::vector<TaskRecord> ContextStore::records_with_status(TaskStatus status) const {
    std::vector<TaskRecord> out;
    for (auto& r : records()) {
        if (r.status == status) {
            out.push_back(std::move(r));
        }
    }
    return out;
}

void ContextStore::set_artifact(SharedArtifact artifact) {
    auto key = std::make_pair(artifact.kind, artifact.key);
    auto stored = std::make_shared<const SharedArtifact>(std::move(artifact));

    std::lock_guard<std::mutex> lock(write_mutex_);
    auto next = std::make_shared<ArtifactMap>(*artifacts_);
    auto it = next->find(key);
    if (it != next->end()) {
        it->second.artifact = std::move(stored);
    } else {
        next->emplace(std::move(key), ArtifactEntry{next_order_++, std::move(stored)});
    }
    std::atomic_store(&artifacts_, std::shared_ptr<const ArtifactMap>(std::move(next)));
}

std::shared_ptr<const SharedArtifact> ContextStore::find_artifact(const std::string& kind,
                                                                  const std::string& key) const {
    auto snap = artifact_snapshot();
    auto it = snap->find(std::make_pair(kind, key));
    return it != snap->end() ? it->second.artifact : nullptr;
}

std::vector<std::shared_ptr<const SharedArtifact>>
ContextStore::ordered_of_kind(const std::string& kind) const {
    auto snap = artifact_snapshot();
    std::vector<const ArtifactEntry*> entries;
    // (kind, key) ordering puts all entries of one kind in a contiguous range
    for (auto it = snap->lower_bound(std::make_pair(kind, std::string()));
         it != snap->end() && it->first.first == kind; ++it) {
        entries.push_back(&it->second);
    }
    std::sort(entries.begin(), entries.end(),
              [](const ArtifactEntry* a, const ArtifactEntry* b) { return a->order < b->order; });

    std::vector<std::shared_ptr<const SharedArtifact>> out;
    out.reserve(entries.size());
    for (const auto* e : entries) {
        out.push_back(e->artifact);
    }
    return out;
}

std::vector<SharedArtifact> ContextStore::artifacts_of_kind(const std::string& kind) const {
    std::vector<SharedArtifact> out;
    for (const auto& a : ordered_of_kind(kind)) {
        out.push_back(*a);
    }
    return out;
}

std::vector<SharedArtifact> ContextStore::artifacts_where(const std::string& kind,
                                                          const std::string& field,
                                                          const json& value) const {
    std::vector<SharedArtifact> out;
    for (const auto& a : ordered_of_kind(kind)) {
        if (a->data.is_object() && a->data.contains(field) && a->data[field] == value) {
            out.push_back(*a);
        }
    }
    return out;
}

std::vector<SharedArtifact> ContextStore::artifacts_with_key_prefix(const std::string& kind,
                                                                    const std::string& prefix) const {
    std::vector<SharedArtifact> out;
    for (const auto& a : ordered_of_kind(kind)) {
        if (core::starts_with(a->key, prefix)) {
            out.push_back(*a);
        }
    }
    return out;
}

std::shared_ptr<const SharedArtifact> ContextStore::target_artifact(const std::string& kind) const {
    auto items = ordered_of_kind(kind);
    if (items.empty()) {
        return nullptr;
    }
    const std::string normalized = strip_trailing_slashes(target_);
    for (const auto& a : items) {
        if (strip_trailing_slashes(a->key) == normalized) {
            return a;
        }
    }
    return items.front();
}

std::string ContextStore::concatenated_text(const std::string& kind, const std::string& text_field,
                                            std::size_t max_bytes,
                                            std::size_t per_item_limit) const {
    std::vector<std::string> parts;
    std::size_t total = 0;
    for (const auto& a : ordered_of_kind(kind)) {
        std::string chunk = "\n--- " + kind + ": " + a->key + " ---\n";
        if (a->data.is_object()) {
            auto title = a->data.find("title");
            if (title != a->data.end() && title->is_string()) {
                chunk += "Title: " + title->get<std::string>() + "\n";
            }
            auto text = a->data.find(text_field);
            if (text != a->data.end() && text->is_string()) {
                chunk += "Content:\n" + utf8_prefix(text->get<std::string>(), per_item_limit) + "\n";
            }
        }
        const std::size_t added = chunk.size() + (parts.empty() ? 0 : 1);
        if (total + added > max_bytes) {
            break;
        }
        total += added;
        parts.push_back(std::move(chunk));
    }
    return core::join(parts, "\n");
}

std::size_t ContextStore::artifact_count() const {
    return artifact_snapshot()->size();
}

} // namespace agent_runner::context
