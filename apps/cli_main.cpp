#include "agent_runner/config/configuration.hpp"
#include "agent_runner/core/run_mode.hpp"
#include "agent_runner/core/task_names.hpp"
#include "agent_runner/core/types.hpp"
#include "agent_runner/core/utils.hpp"
#include "agent_runner/orchestrator/orchestrator.hpp"
#include "agent_runner/persistence/persistence_sink.hpp"
#include "agent_runner/task/catalog.hpp"

#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace ar = agent_runner;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

static std::string format_mtime(const fs::path& p) {
    std::error_code ec;
    auto ftime = fs::last_write_time(p, ec);
    if (ec) return "";
    auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    auto time_t_val = std::chrono::system_clock::to_time_t(sctp);
    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time_t_val), "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

static json read_json_file(const fs::path& p) {
    try {
        return json::parse(ar::core::read_text(p));
    } catch (const std::exception&) {
        return nullptr;
    }
}

// ============================================================================
// validate-config (--path P | --yaml Y | --stdin) [--strict-exit-codes]
// ============================================================================
int cmd_validate_config(const std::string& path, const std::string& yaml_arg, bool use_stdin, bool strict_exit) {
    json result;
    result["valid"] = false;
    result["errors"] = json::array();
    result["warnings"] = json::array();
    if (!path.empty()) result["path"] = path;

    try {
        std::string yaml_text;
        if (!path.empty()) {
            yaml_text = ar::core::read_text(path);
        } else if (use_stdin) {
            yaml_text = read_stdin();
        } else {
            yaml_text = yaml_arg;
        }

        YAML::Node node = YAML::Load(yaml_text);
        ar::config::Config cfg = ar::config::Config::from_yaml(node);
        cfg.validate();
        result["valid"] = true;

        if (cfg.run.target.empty()) {
            result["warnings"].push_back("run.target is empty; pass --target to the runner");
        }
        for (const auto& name : ar::task_names::all()) {
            auto it = cfg.tasks.find(name);
            if (it == cfg.tasks.end() || it->second.command.empty()) {
                result["warnings"].push_back("no command for task '" + name + "'");
            }
        }
    } catch (const std::exception& e) {
        result["errors"].push_back(e.what());
    }

    print_json(result);
    if (strict_exit) {
        return result["valid"].get<bool>() ? 0 : 1;
    }
    return 0;
}

// ============================================================================
// list-phases [--mode full|quick] [--path config.yaml]
// ============================================================================
int cmd_list_phases(const std::string& mode_arg, const std::string& config_path) {
    ar::core::ModeOverrides overrides;
    std::string mode_str = mode_arg;
    if (!config_path.empty()) {
        try {
            ar::config::Config cfg = ar::config::Config::load(config_path);
            cfg.validate();
            overrides = cfg.modes;
            if (mode_str.empty()) mode_str = cfg.run.mode;
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << std::endl;
            return 1;
        }
    }
    if (mode_str.empty()) mode_str = "full";

    auto mode = ar::core::parse_run_mode(mode_str);
    if (!mode) {
        std::cerr << "Error: unknown mode '" << mode_str << "'" << std::endl;
        return 1;
    }

    json result;
    result["mode"] = ar::core::run_mode_to_string(*mode);
    result["phases"] = json::array();
    for (const auto& phase : ar::orchestrator::default_phases()) {
        json p;
        p["name"] = phase.name;
        p["tasks"] = json::array();
        for (const auto& name : phase.tasks) {
            const ar::task::TaskDefinition* def = ar::task::find_definition(name);
            json t;
            t["name"] = name;
            t["display_name"] = ar::task_names::display_name(name);
            t["dependencies"] = def ? def->dependencies : std::vector<std::string>{};
            t["in_mode"] = ar::core::task_required_for_mode(name, *mode, overrides);
            p["tasks"].push_back(t);
        }
        result["phases"].push_back(p);
    }

    print_json(result);
    return 0;
}

// ============================================================================
// list-runs <runs_dir>
// ============================================================================
int cmd_list_runs(const std::string& runs_dir) {
    fs::path p(runs_dir);

    json result;
    result["runs_dir"] = runs_dir;
    result["runs"] = json::array();

    if (!fs::exists(p) || !fs::is_directory(p)) {
        print_json(result);
        return 0;
    }

    std::vector<fs::path> dirs;
    for (const auto& entry : fs::directory_iterator(p)) {
        // a run directory always has its event log or its task records
        if (entry.is_directory() &&
            (fs::exists(entry.path() / "logs" / "run_events.jsonl") ||
             fs::exists(entry.path() / "tasks"))) {
            dirs.push_back(entry.path());
        }
    }
    std::sort(dirs.begin(), dirs.end());

    for (const auto& dir : dirs) {
        json run;
        run["name"] = dir.filename().string();
        run["path"] = dir.string();
        run["modified"] = format_mtime(dir);
        json summary = read_json_file(dir / "summary.json");
        run["outcome"] = summary.is_object() && summary.contains("outcome")
                             ? summary["outcome"] : json(nullptr);
        result["runs"].push_back(run);
    }

    print_json(result);
    return 0;
}

// ============================================================================
// get-run-status <run_dir>
// ============================================================================
int cmd_get_run_status(const std::string& run_dir) {
    fs::path p(run_dir);

    json result;
    result["run_dir"] = run_dir;
    result["exists"] = fs::exists(p);
    result["status"] = "unknown";
    result["current_phase"] = nullptr;
    result["tasks"] = json::object();
    result["summary"] = nullptr;

    if (!fs::exists(p)) {
        print_json(result);
        return 0;
    }

    fs::path events_file = p / "logs" / "run_events.jsonl";
    if (fs::exists(events_file)) {
        std::ifstream ifs(events_file);
        std::string line;
        std::string last_phase;
        std::string last_status;

        while (std::getline(ifs, line)) {
            if (line.empty()) continue;
            json ev = json::parse(line, nullptr, false);
            if (ev.is_discarded() || !ev.is_object() || !ev.contains("type")) {
                continue;  // partially written line
            }

            const std::string type = ev.value("type", "");
            if (type == "run_start") {
                last_status = "running";
            } else if (type == "phase_start") {
                last_phase = ev.value("phase_name", "");
                last_status = "running";
            } else if (type == "run_end") {
                last_status = ev.value("status", ev.value("success", false) ? "ok" : "error");
            } else if (ev.contains("task")) {
                const std::string task = ev.value("task", "");
                json& t = result["tasks"][task];
                if (type == "task_skipped") {
                    t["status"] = "skipped";
                    t["reason"] = ev.value("reason", "");
                } else if (type == "progress_update" && ev.contains("data")) {
                    t["status"] = "running";
                    t["progress"] = ev["data"].value("progress", 0);
                    t["current_task"] = ev["data"].value("task", "");
                } else if (type == "task_completed") {
                    t["status"] = "completed";
                    t["progress"] = 100;
                } else if (type == "task_failed" && ev.contains("data")) {
                    t["status"] = "failed";
                    t["error"] = ev["data"].value("error", "");
                }
            }
        }

        result["current_phase"] = last_phase.empty() ? nullptr : json(last_phase);
        result["status"] = last_status.empty() ? "unknown" : last_status;
    }

    json summary = read_json_file(p / "summary.json");
    if (summary.is_object()) result["summary"] = summary;

    print_json(result);
    return 0;
}

// ============================================================================
// get-task-result <run_dir> <task>
// ============================================================================
int cmd_get_task_result(const std::string& run_dir, const std::string& task) {
    auto doc = ar::persistence::FilePersistenceSink::load(fs::path(run_dir) / "tasks", task);
    if (!doc) {
        json result;
        result["run_dir"] = run_dir;
        result["task"] = task;
        result["found"] = false;
        print_json(result);
        return 1;
    }
    print_json(*doc);
    return 0;
}

// ============================================================================
// Main
// ============================================================================
void print_usage() {
    std::cout << "Usage: agent_runner_cli <command> [options]\n"
              << "\nCommands:\n"
              << "  validate-config (--path P | --yaml Y | --stdin) [--strict-exit-codes]\n"
              << "                                  Validate a run config\n"
              << "  list-phases [--mode M] [--path P]  Print phases and the tasks a mode runs\n"
              << "  list-runs <runs_dir>            List runs\n"
              << "  get-run-status <run_dir>        Get status of a run\n"
              << "  get-task-result <run_dir> <task>  Print a task's persisted record\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    auto get_arg = [&](const char* name) -> std::string {
        for (int i = 2; i < argc - 1; ++i) {
            if (std::strcmp(argv[i], name) == 0) {
                return argv[i + 1];
            }
        }
        return "";
    };

    auto has_flag = [&](const char* name) -> bool {
        for (int i = 2; i < argc; ++i) {
            if (std::strcmp(argv[i], name) == 0) return true;
        }
        return false;
    };

    auto get_positional = [&](int pos) -> std::string {
        int count = 0;
        for (int i = 2; i < argc; ++i) {
            if (argv[i][0] != '-') {
                if (count == pos) return argv[i];
                ++count;
            } else if (i + 1 < argc && argv[i + 1][0] != '-') {
                ++i; // Skip argument value
            }
        }
        return "";
    };

    if (command == "validate-config") {
        std::string path = get_arg("--path");
        std::string yaml = get_arg("--yaml");
        bool use_stdin = has_flag("--stdin");
        bool strict = has_flag("--strict-exit-codes");

        if (path.empty() && yaml.empty() && !use_stdin) {
            std::cerr << "validate-config requires --path, --yaml, or --stdin\n";
            return 1;
        }
        return cmd_validate_config(path, yaml, use_stdin, strict);
    }

    if (command == "list-phases") {
        return cmd_list_phases(get_arg("--mode"), get_arg("--path"));
    }

    if (command == "list-runs") {
        std::string runs_dir = get_positional(0);
        if (runs_dir.empty()) {
            std::cerr << "list-runs requires a runs_dir argument\n";
            return 1;
        }
        return cmd_list_runs(runs_dir);
    }

    if (command == "get-run-status") {
        std::string run_dir = get_positional(0);
        if (run_dir.empty()) {
            std::cerr << "get-run-status requires a run_dir argument\n";
            return 1;
        }
        return cmd_get_run_status(run_dir);
    }

    if (command == "get-task-result") {
        std::string run_dir = get_positional(0);
        std::string task = get_positional(1);
        if (run_dir.empty() || task.empty()) {
            std::cerr << "get-task-result requires <run_dir> <task>\n";
            return 1;
        }
        return cmd_get_task_result(run_dir, task);
    }

    print_usage();
    return 1;
}
