#include "agent_runner/task/catalog.hpp"
#include "agent_runner/core/errors.hpp"
#include "agent_runner/core/logging.hpp"
#include "agent_runner/core/task_names.hpp"
#include "agent_runner/task/command_task.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace agent_runner::task {

namespace tn = task_names;

const std::vector<TaskDefinition>& default_definitions() {
    static const std::vector<TaskDefinition> kDefinitions = {
        {tn::kWebScraper, {}, std::nullopt},
        {tn::kScreenshot, {tn::kWebScraper}, 2},
        {tn::kCompanyResearch, {tn::kWebScraper}, std::nullopt},
        {tn::kCompetitor, {tn::kWebScraper}, std::nullopt},
        {tn::kReviewSentiment, {tn::kWebScraper}, std::nullopt},
        {tn::kSeo, {tn::kWebScraper}, std::nullopt},
        {tn::kMessaging, {tn::kWebScraper, tn::kScreenshot}, std::nullopt},
        {tn::kVisualDesign, {tn::kWebScraper, tn::kScreenshot}, std::nullopt},
        {tn::kConversion, {tn::kWebScraper}, std::nullopt},
        {tn::kSocial, {tn::kWebScraper}, std::nullopt},
        {tn::kIcp, {tn::kWebScraper, tn::kCompanyResearch}, std::nullopt},
        // ordering comes from its phase
        {tn::kReport, {}, std::nullopt},
    };
    return kDefinitions;
}

const TaskDefinition* find_definition(const std::string& name) {
    for (const auto& def : default_definitions()) {
        if (def.name == name) {
            return &def;
        }
    }
    return nullptr;
}

void TaskCatalog::add(const std::string& name, TaskFactory factory) {
    if (!factory) {
        throw std::invalid_argument("null factory for task '" + name + "'");
    }
    factories_[name] = std::move(factory);
}

bool TaskCatalog::contains(const std::string& name) const {
    return factories_.count(name) > 0;
}

std::unique_ptr<Task> TaskCatalog::create(const std::string& name) const {
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        return nullptr;
    }
    return it->second();
}

std::vector<std::string> TaskCatalog::names() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        out.push_back(name);
    }
    return out;
}

RetryPolicy resolve_retry_policy(const config::Config& cfg, const std::string& name) {
    RetryPolicy policy;
    policy.max_retries = cfg.retry.max_retries;
    float delay_s = cfg.retry.retry_delay_s;

    if (const TaskDefinition* def = find_definition(name); def && def->max_retries) {
        policy.max_retries = *def->max_retries;
    }
    auto it = cfg.tasks.find(name);
    if (it != cfg.tasks.end()) {
        if (it->second.max_retries) policy.max_retries = *it->second.max_retries;
        if (it->second.retry_delay_s) delay_s = *it->second.retry_delay_s;
    }
    if (!std::isfinite(delay_s) || delay_s < 0.0f) {
        delay_s = 0.0f;
    }
    delay_s = std::min(delay_s, config::kMaxRetryDelaySeconds);
    policy.retry_delay = std::chrono::milliseconds(
        static_cast<int64_t>(std::llround(static_cast<double>(delay_s) * 1000.0)));
    return policy;
}

TaskCatalog TaskCatalog::from_config(const config::Config& cfg) {
    TaskCatalog catalog;
    for (const auto& def : default_definitions()) {
        auto it = cfg.tasks.find(def.name);
        if (it == cfg.tasks.end() || it->second.command.empty()) {
            core::Logger::warn("catalog", "No command configured for " + def.name +
                                              "; task not available");
            continue;
        }
        if (!it->second.enabled) {
            core::Logger::info("catalog", def.name + " disabled in config");
            continue;
        }

        const std::vector<std::string> argv = it->second.command;
        const std::vector<std::string> deps = def.dependencies;
        const RetryPolicy policy = resolve_retry_policy(cfg, def.name);
        const std::string name = def.name;
        catalog.add(name, [name, argv, deps, policy]() -> std::unique_ptr<Task> {
            return std::make_unique<CommandTask>(name, argv, deps, policy);
        });
    }
    return catalog;
}

} // namespace agent_runner::task
