#include "agent_runner/config/configuration.hpp"
#include "agent_runner/core/errors.hpp"
#include "agent_runner/core/logging.hpp"
#include "agent_runner/core/run_mode.hpp"
#include "agent_runner/core/task_names.hpp"
#include "agent_runner/core/utils.hpp"

#include <cmath>
#include <fstream>

namespace agent_runner::config {

static bool valid_retry_delay(float seconds) {
    return std::isfinite(seconds) && seconds >= 0.0f && seconds <= kMaxRetryDelaySeconds;
}

static std::vector<std::string> read_string_list(const YAML::Node& n, const std::string& what) {
    std::vector<std::string> out;
    if (!n) return out;
    if (!n.IsSequence()) {
        throw ConfigError(what + " must be a list");
    }
    for (const auto& item : n) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

static std::vector<std::string> read_command(const YAML::Node& n, const std::string& task) {
    if (!n) return {};
    if (n.IsScalar()) {
        return {"/bin/sh", "-c", n.as<std::string>()};
    }
    return read_string_list(n, "tasks." + task + ".command");
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw ConfigError("top level must be a mapping");
    }

    try {
        if (node["run"]) {
            auto r = node["run"];
            if (r["mode"]) cfg.run.mode = r["mode"].as<std::string>();
            if (r["target"]) cfg.run.target = r["target"].as<std::string>();
            if (r["run_id"]) cfg.run.run_id = r["run_id"].as<std::string>();
            if (r["timeout_minutes"]) cfg.run.timeout_minutes = r["timeout_minutes"].as<int>();
        }

        if (node["retry"]) {
            auto r = node["retry"];
            if (r["max_retries"]) cfg.retry.max_retries = r["max_retries"].as<int>();
            if (r["retry_delay_s"]) cfg.retry.retry_delay_s = r["retry_delay_s"].as<float>();
        }

        if (node["bus"]) {
            auto b = node["bus"];
            if (b["history_capacity"]) cfg.bus.history_capacity = b["history_capacity"].as<int>();
        }

        if (node["logging"]) {
            auto l = node["logging"];
            if (l["level"]) cfg.logging.level = l["level"].as<std::string>();
            if (l["event_log"]) cfg.logging.event_log = l["event_log"].as<bool>();
        }

        if (node["modes"]) {
            auto m = node["modes"];
            if (!m.IsMap()) {
                throw ConfigError("modes must be a mapping of mode -> task list");
            }
            for (const auto& kv : m) {
                // keys match run modes case-insensitively, like run.mode
                const std::string mode = core::to_lower(core::trim(kv.first.as<std::string>()));
                cfg.modes[mode] = read_string_list(kv.second, "modes." + mode);
            }
        }

        if (node["tasks"]) {
            auto t = node["tasks"];
            if (!t.IsMap()) {
                throw ConfigError("tasks must be a mapping of task name -> settings");
            }
            for (const auto& kv : t) {
                const std::string name = kv.first.as<std::string>();
                const YAML::Node& tn = kv.second;
                TaskConfig tc;
                if (tn.IsMap()) {
                    tc.command = read_command(tn["command"], name);
                    if (tn["enabled"]) tc.enabled = tn["enabled"].as<bool>();
                    if (tn["max_retries"]) tc.max_retries = tn["max_retries"].as<int>();
                    if (tn["retry_delay_s"]) tc.retry_delay_s = tn["retry_delay_s"].as<float>();
                } else if (tn.IsScalar() || tn.IsSequence()) {
                    // shorthand: `seo: ./bin/seo --fast`
                    tc.command = read_command(tn, name);
                }
                cfg.tasks[name] = tc;
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["run"]["mode"] = run.mode;
    node["run"]["target"] = run.target;
    node["run"]["run_id"] = run.run_id;
    node["run"]["timeout_minutes"] = run.timeout_minutes;

    node["retry"]["max_retries"] = retry.max_retries;
    node["retry"]["retry_delay_s"] = retry.retry_delay_s;

    node["bus"]["history_capacity"] = bus.history_capacity;

    node["logging"]["level"] = logging.level;
    node["logging"]["event_log"] = logging.event_log;

    for (const auto& [mode, names] : modes) {
        YAML::Node list(YAML::NodeType::Sequence);
        for (const auto& n : names) list.push_back(n);
        node["modes"][mode] = list;
    }

    for (const auto& [name, tc] : tasks) {
        YAML::Node t;
        YAML::Node cmd(YAML::NodeType::Sequence);
        for (const auto& arg : tc.command) cmd.push_back(arg);
        t["command"] = cmd;
        t["enabled"] = tc.enabled;
        if (tc.max_retries) t["max_retries"] = *tc.max_retries;
        if (tc.retry_delay_s) t["retry_delay_s"] = *tc.retry_delay_s;
        node["tasks"][name] = t;
    }

    return node;
}

void Config::validate() const {
    if (!core::parse_run_mode(run.mode)) {
        throw ValidationError("run.mode must be 'full' or 'quick'");
    }
    if (run.timeout_minutes < 0) {
        throw ValidationError("run.timeout_minutes must be >= 0");
    }
    if (!run.run_id.empty() && run.run_id.find('/') != std::string::npos) {
        throw ValidationError("run.run_id must not contain '/'");
    }

    if (retry.max_retries < 1 || retry.max_retries > 20) {
        throw ValidationError("retry.max_retries must be in [1,20]");
    }
    if (!valid_retry_delay(retry.retry_delay_s)) {
        throw ValidationError("retry.retry_delay_s must be in [0,3600]");
    }

    if (bus.history_capacity < 1) {
        throw ValidationError("bus.history_capacity must be >= 1");
    }

    if (!core::parse_log_level(logging.level)) {
        throw ValidationError("logging.level must be one of error|warn|info|debug");
    }

    for (const auto& [mode, names] : modes) {
        if (!core::parse_run_mode(mode)) {
            throw ValidationError("modes." + mode + ": unknown run mode");
        }
        for (const auto& n : names) {
            if (!task_names::is_known(n)) {
                throw ValidationError("modes." + mode + ": unknown task '" + n + "'");
            }
        }
    }

    for (const auto& [name, tc] : tasks) {
        if (!task_names::is_known(name)) {
            throw ValidationError("tasks." + name + ": unknown task");
        }
        if (tc.enabled && tc.command.empty()) {
            throw ValidationError("tasks." + name + ".command must not be empty");
        }
        if (tc.max_retries && (*tc.max_retries < 1 || *tc.max_retries > 20)) {
            throw ValidationError("tasks." + name + ".max_retries must be in [1,20]");
        }
        if (tc.retry_delay_s && !valid_retry_delay(*tc.retry_delay_s)) {
            throw ValidationError("tasks." + name + ".retry_delay_s must be in [0,3600]");
        }
    }
}

} // namespace agent_runner::config
